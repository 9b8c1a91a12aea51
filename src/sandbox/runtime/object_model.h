//
// NLytics Object Model
//
// Attribute tables and item access for the runtime object types. Each
// type exposes a fixed method table; nothing outside these tables is
// reachable from a program.
//

#pragma once

#include "value.h"
#include <string>
#include <unordered_map>

namespace nlytics::sandbox
{
    using MethodTable = std::unordered_map<std::string, NativeMethod>;

    Value BindMethod(const Value& self, const std::string& name, NativeMethod fn);

    // Method from `table` bound to `self`, or nullopt
    std::optional<Value> LookupMethod(const MethodTable& table, const Value& self, const std::string& name);

    [[noreturn]] void ThrowNoAttribute(const Value& self, const std::string& name);

    // ---- DataFrame ----
    Value FrameAttribute(const Value& self, const std::string& name);
    Value FrameGetItem(const Value& self, const Value& key);
    void FrameSetItem(const Value& self, const Value& key, const Value& value);
    // Row as a Series labelled by column names
    Value FrameRow(const FrameData& frame, int64_t position);

    // ---- Series ----
    Value SeriesAttribute(const Value& self, const std::string& name);
    Value SeriesGetItem(const Value& self, const Value& key);

    // ---- GroupBy ----
    Value GroupByAttribute(const Value& self, const std::string& name);
    Value GroupByGetItem(const Value& self, const Value& key);

    // ---- loc / iloc ----
    Value IndexerGetItem(const Value& self, const Value& key);
    void IndexerSetItem(const Value& self, const Value& key, const Value& value);

    // ---- Builtin containers ----
    Value ListAttribute(const Value& self, const std::string& name);
    Value DictAttribute(const Value& self, const std::string& name);
    Value StringAttribute(const Value& self, const std::string& name);

} // namespace nlytics::sandbox
