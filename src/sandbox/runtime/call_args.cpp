//
// NLytics Call Arguments Implementation
//

#include "call_args.h"
#include "sandbox_error.h"
#include <algorithm>
#include <format>

namespace nlytics::sandbox
{
    const Value* CallArgs::Find(size_t pos, std::string_view keyword) const
    {
        if (pos < positional.size())
        {
            return &positional[pos];
        }
        for (const auto& [name, value] : keywords)
        {
            if (name == keyword)
            {
                return &value;
            }
        }
        return nullptr;
    }

    Value CallArgs::Get(size_t pos, std::string_view keyword, Value fallback) const
    {
        const Value* found = Find(pos, keyword);
        return found ? *found : std::move(fallback);
    }

    const Value& CallArgs::Require(size_t pos, std::string_view keyword, std::string_view function) const
    {
        const Value* found = Find(pos, keyword);
        if (found == nullptr)
        {
            ThrowTypeError(std::format("{}() missing required argument: '{}'", function, keyword));
        }
        return *found;
    }

    void CallArgs::Expect(std::string_view function, size_t maxPositional,
                          std::initializer_list<std::string_view> allowedKeywords) const
    {
        if (positional.size() > maxPositional)
        {
            ThrowTypeError(std::format("{}() takes at most {} positional arguments but {} were given", function,
                                       maxPositional, positional.size()));
        }
        for (const auto& [name, value] : keywords)
        {
            if (std::ranges::find(allowedKeywords, std::string_view{name}) == allowedKeywords.end())
            {
                ThrowTypeError(std::format("{}() got an unexpected keyword argument '{}'", function, name));
            }
        }
    }

    int64_t IntArg(const CallArgs& args, size_t pos, std::string_view keyword, int64_t fallback)
    {
        const Value* found = args.Find(pos, keyword);
        if (found == nullptr || found->IsNone())
        {
            return fallback;
        }
        return ToInteger(*found);
    }

    bool BoolArg(const CallArgs& args, size_t pos, std::string_view keyword, bool fallback)
    {
        const Value* found = args.Find(pos, keyword);
        return found ? Truthy(*found) : fallback;
    }

    std::string StringArg(const CallArgs& args, size_t pos, std::string_view keyword, std::string_view function)
    {
        const Value& value = args.Require(pos, keyword, function);
        if (!value.IsString())
        {
            ThrowTypeError(std::format("{}() argument '{}' must be str, not {}", function, keyword, TypeName(value)));
        }
        return value.As<std::string>();
    }

    std::vector<std::string> NameListArg(const Value& value, std::string_view function)
    {
        if (value.IsString())
        {
            return {value.As<std::string>()};
        }
        if (value.Object<ListObject>() == nullptr && value.Object<TupleObject>() == nullptr)
        {
            ThrowTypeError(std::format("{}() expects a column name or a list of names, not {}", function,
                                       TypeName(value)));
        }
        std::vector<std::string> names;
        for (const auto& item : Materialize(value))
        {
            if (!item.IsString())
            {
                ThrowTypeError(std::format("{}() column names must be str, not {}", function, TypeName(item)));
            }
            names.push_back(item.As<std::string>());
        }
        return names;
    }

} // namespace nlytics::sandbox
