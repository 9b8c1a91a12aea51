//
// NLytics Call Arguments
//

#pragma once

#include "value.h"
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nlytics::sandbox
{
    struct CallArgs
    {
        ValueList positional;
        std::vector<std::pair<std::string, Value>> keywords;

        // Argument given either at position `pos` or as `keyword`; null when absent
        const Value* Find(size_t pos, std::string_view keyword) const;

        Value Get(size_t pos, std::string_view keyword, Value fallback) const;

        // TypeError naming the function when the argument is missing
        const Value& Require(size_t pos, std::string_view keyword, std::string_view function) const;

        // TypeError on surplus positionals or unknown keywords
        void Expect(std::string_view function, size_t maxPositional,
                    std::initializer_list<std::string_view> allowedKeywords = {}) const;

        size_t Size() const { return positional.size() + keywords.size(); }
    };

    int64_t IntArg(const CallArgs& args, size_t pos, std::string_view keyword, int64_t fallback);
    bool BoolArg(const CallArgs& args, size_t pos, std::string_view keyword, bool fallback);
    std::string StringArg(const CallArgs& args, size_t pos, std::string_view keyword, std::string_view function);

    // A single name or a list/tuple of names
    std::vector<std::string> NameListArg(const Value& value, std::string_view function);

} // namespace nlytics::sandbox
