//
// NLytics Builtin Container Methods
//
// list, dict and str methods reachable from programs.
//

#include "call_args.h"
#include "execution_context.h"
#include "object_model.h"
#include "operators.h"
#include "sandbox_error.h"
#include <algorithm>
#include <cctype>
#include <format>

namespace nlytics::sandbox
{
    namespace
    {
        // ---- list ----

        ListObject& List(const Value& self)
        {
            return *self.Object<ListObject>();
        }

        Value Append(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("append", 1);
            CheckSequenceLength(uint64_t{List(self).items.size()} + 1);
            List(self).items.push_back(args.Require(0, "object", "append"));
            return Value::None();
        }

        Value Extend(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("extend", 1);
            ValueList more = Materialize(args.Require(0, "iterable", "extend"));
            auto& items = List(self).items;
            CheckSequenceLength(uint64_t{items.size()} + more.size());
            items.insert(items.end(), more.begin(), more.end());
            return Value::None();
        }

        Value ListIndex(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("index", 1);
            const Value& needle = args.Require(0, "value", "index");
            const auto& items = List(self).items;
            auto it = std::ranges::find_if(items, [&](const Value& v) { return ValuesEqual(v, needle); });
            if (it == items.end())
            {
                ThrowValueError(std::format("{} is not in list", Repr(needle)));
            }
            return Value{static_cast<int64_t>(std::distance(items.begin(), it))};
        }

        Value ListCount(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("count", 1);
            const Value& needle = args.Require(0, "value", "count");
            return Value{static_cast<int64_t>(
                std::ranges::count_if(List(self).items, [&](const Value& v) { return ValuesEqual(v, needle); }))};
        }

        Value Sort(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("sort", 0, {"reverse"});
            auto& items = List(self).items;
            std::ranges::stable_sort(items, [](const Value& a, const Value& b) { return LessThan(a, b); });
            if (BoolArg(args, 99, "reverse", false))
            {
                std::ranges::reverse(items);
            }
            return Value::None();
        }

        // ---- dict ----

        DictObject& Dict(const Value& self)
        {
            return *self.Object<DictObject>();
        }

        Value Keys(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("keys", 0);
            return MakeList(Materialize(self));
        }

        Value Values(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("values", 0);
            ValueList values;
            for (const auto& entry : Dict(self).entries)
            {
                values.push_back(entry.second);
            }
            return MakeList(std::move(values));
        }

        Value Items(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("items", 0);
            ValueList items;
            for (const auto& [key, value] : Dict(self).entries)
            {
                items.push_back(MakeTuple({key, value}));
            }
            return MakeList(std::move(items));
        }

        Value Get(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("get", 2);
            const Value* found = Dict(self).Find(args.Require(0, "key", "get"));
            return found ? *found : args.Get(1, "default", Value::None());
        }

        // ---- str ----

        const std::string& Text(const Value& self)
        {
            return self.As<std::string>();
        }

        template <typename Transform>
        Value MapChars(const Value& self, Transform transform)
        {
            std::string out = Text(self);
            std::ranges::transform(out, out.begin(),
                                   [&](char c) { return static_cast<char>(transform(static_cast<unsigned char>(c))); });
            return Value{out};
        }

        Value Upper(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("upper", 0);
            return MapChars(self, [](unsigned char c) { return std::toupper(c); });
        }

        Value Lower(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("lower", 0);
            return MapChars(self, [](unsigned char c) { return std::tolower(c); });
        }

        Value Strip(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("strip", 1);
            const Value charsArg = args.Get(0, "chars", Value::None());
            const std::string chars = charsArg.IsNone() ? std::string{" \t\n\r\f\v"} : Str(charsArg);
            const std::string& text = Text(self);
            const auto first = text.find_first_not_of(chars);
            if (first == std::string::npos)
            {
                return Value{std::string{}};
            }
            return Value{text.substr(first, text.find_last_not_of(chars) - first + 1)};
        }

        Value Replace(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("replace", 2);
            const std::string from = StringArg(args, 0, "old", "replace");
            const std::string to = StringArg(args, 1, "new", "replace");
            std::string text = Text(self);
            if (from.empty())
            {
                return Value{text};
            }
            size_t pos = 0;
            while ((pos = text.find(from, pos)) != std::string::npos)
            {
                CheckSequenceLength(uint64_t{text.size()} - from.size() + to.size());
                PollPreemption();
                text.replace(pos, from.size(), to);
                pos += to.size();
            }
            return Value{text};
        }

        Value Split(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("split", 1, {"sep"});
            const Value sepArg = args.Get(0, "sep", Value::None());
            const std::string& text = Text(self);
            ValueList parts;
            if (sepArg.IsNone())
            {
                size_t pos = 0;
                while (pos < text.size())
                {
                    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
                        ++pos;
                    size_t end = pos;
                    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end])))
                        ++end;
                    if (end > pos)
                        parts.emplace_back(text.substr(pos, end - pos));
                    pos = end;
                }
                return MakeList(std::move(parts));
            }
            const std::string sep = Str(sepArg);
            if (sep.empty())
            {
                ThrowValueError("empty separator");
            }
            size_t start = 0;
            size_t pos = 0;
            while ((pos = text.find(sep, start)) != std::string::npos)
            {
                parts.emplace_back(text.substr(start, pos - start));
                start = pos + sep.size();
            }
            parts.emplace_back(text.substr(start));
            return MakeList(std::move(parts));
        }

        Value StartsWith(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("startswith", 1);
            return Value{Text(self).starts_with(StringArg(args, 0, "prefix", "startswith"))};
        }

        Value EndsWith(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("endswith", 1);
            return Value{Text(self).ends_with(StringArg(args, 0, "suffix", "endswith"))};
        }

        Value Join(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("join", 1);
            std::string out;
            bool first = true;
            for (const auto& item : Materialize(args.Require(0, "iterable", "join")))
            {
                if (!item.IsString())
                {
                    ThrowTypeError(std::format("sequence item: expected str instance, {} found", TypeName(item)));
                }
                CheckSequenceLength(uint64_t{out.size()} + Text(self).size() + item.As<std::string>().size());
                out += (first ? "" : Text(self)) + item.As<std::string>();
                first = false;
            }
            return Value{out};
        }

        // str.format with {} / {0} / {name} fields and optional format specs
        Value Format(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            const std::string& text = Text(self);
            std::string out;
            size_t autoIndex = 0;
            for (size_t i = 0; i < text.size(); ++i)
            {
                const char c = text[i];
                if (c == '{' && i + 1 < text.size() && text[i + 1] == '{')
                {
                    out += '{';
                    ++i;
                    continue;
                }
                if (c == '}' && i + 1 < text.size() && text[i + 1] == '}')
                {
                    out += '}';
                    ++i;
                    continue;
                }
                if (c != '{')
                {
                    out += c;
                    continue;
                }
                const size_t close = text.find('}', i);
                if (close == std::string::npos)
                {
                    ThrowValueError("Single '{' encountered in format string");
                }
                std::string field = text.substr(i + 1, close - i - 1);
                std::string spec;
                if (auto colon = field.find(':'); colon != std::string::npos)
                {
                    spec = field.substr(colon + 1);
                    field = field.substr(0, colon);
                }
                char conversion = 0;
                if (auto bang = field.find('!'); bang != std::string::npos && bang + 1 < field.size())
                {
                    conversion = field[bang + 1];
                    field = field.substr(0, bang);
                }

                const Value* argument = nullptr;
                if (field.empty())
                {
                    argument = args.Find(autoIndex++, "");
                }
                else if (std::ranges::all_of(field, [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); }))
                {
                    argument = args.Find(std::stoul(field), "");
                }
                else
                {
                    argument = args.Find(args.positional.size(), field);
                }
                if (argument == nullptr)
                {
                    ThrowFault(field.empty() || std::isdigit(static_cast<unsigned char>(field[0])) ? "IndexError"
                                                                                                  : "KeyError",
                               std::format("Replacement index {} out of range", field.empty() ? "{}" : field));
                }
                out += FormatField(*argument, conversion, spec);
                i = close;
            }
            return Value{out};
        }

        const MethodTable& ListMethods()
        {
            static const MethodTable table{
                {"append", Append}, {"extend", Extend}, {"index", ListIndex}, {"count", ListCount}, {"sort", Sort},
            };
            return table;
        }

        const MethodTable& DictMethods()
        {
            static const MethodTable table{
                {"keys", Keys},
                {"values", Values},
                {"items", Items},
                {"get", Get},
            };
            return table;
        }

        const MethodTable& StringMethods()
        {
            static const MethodTable table{
                {"upper", Upper},         {"lower", Lower},     {"strip", Strip},   {"replace", Replace},
                {"split", Split},         {"startswith", StartsWith}, {"endswith", EndsWith}, {"join", Join},
                {"format", Format},
            };
            return table;
        }
    } // namespace

    Value ListAttribute(const Value& self, const std::string& name)
    {
        if (auto method = LookupMethod(ListMethods(), self, name))
        {
            return *method;
        }
        ThrowNoAttribute(self, name);
    }

    Value DictAttribute(const Value& self, const std::string& name)
    {
        if (auto method = LookupMethod(DictMethods(), self, name))
        {
            return *method;
        }
        ThrowNoAttribute(self, name);
    }

    Value StringAttribute(const Value& self, const std::string& name)
    {
        if (auto method = LookupMethod(StringMethods(), self, name))
        {
            return *method;
        }
        ThrowNoAttribute(self, name);
    }

} // namespace nlytics::sandbox
