//
// NLytics Module Operations
//
// The pandas and numpy surface reachable through the import hook. Only the
// attributes listed in the module tables exist.
//

#pragma once

#include "value.h"
#include <string>

namespace nlytics::sandbox
{
    // AttributeError for anything outside the module table
    Value ModuleAttribute(const ModuleObject& module, const std::string& name);

    // pandas.DataFrame / pandas.Series constructors, shared with the builtins
    Value ConstructFrame(const Value& data, const Value& columns, const Value& index);
    Value ConstructSeries(const Value& data, const Value& index, const Value& name);

} // namespace nlytics::sandbox
