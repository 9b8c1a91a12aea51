//
// NLytics Sandbox Builtins Implementation
//

#include "builtins.h"
#include "arrow_bridge.h"
#include "call_args.h"
#include "frame_ops.h"
#include "operators.h"
#include "sandbox_error.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>

namespace nlytics::sandbox
{
    namespace
    {
        constexpr size_t kKeywordOnly = 99;

        const char* const kDisallowedNames[] = {
            "eval",    "exec",  "compile", "open",       "__import__", "getattr", "setattr",
            "delattr", "hasattr", "globals", "locals",   "vars",       "dir",     "type",
            "input",   "breakpoint", "help", "exit",     "quit",       "memoryview",
        };

        std::string Trimmed(const std::string& text)
        {
            const auto first = text.find_first_not_of(" \t\n\r");
            if (first == std::string::npos)
            {
                return {};
            }
            return text.substr(first, text.find_last_not_of(" \t\n\r") - first + 1);
        }

        int64_t FloatToInteger(double value)
        {
            if (std::isnan(value))
            {
                ThrowValueError("cannot convert float NaN to integer");
            }
            if (std::isinf(value))
            {
                ThrowFault("OverflowError", "cannot convert float infinity to integer");
            }
            const double truncated = std::trunc(value);
            if (truncated < -9.2233720368547758e18 || truncated >= 9.2233720368547758e18)
            {
                ThrowFault("OverflowError", "integer result out of range");
            }
            return static_cast<int64_t>(truncated);
        }

        // ---- Numbers ----

        Value Abs(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("abs", 1);
            const Value& x = args.Require(0, "x", "abs");
            if (auto* series = x.Object<SeriesObject>())
            {
                SeriesData result = series->data;
                result.values = AbsArray(result.values);
                return MakeSeries(std::move(result));
            }
            if (x.Is<double>())
            {
                return Value{std::fabs(x.As<double>())};
            }
            const int64_t v = ToInteger(x);
            if (v == std::numeric_limits<int64_t>::min())
            {
                ThrowFault("OverflowError", "integer result out of range");
            }
            return Value{v < 0 ? -v : v};
        }

        Value Int(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("int", 1);
            const Value x = args.Get(0, "x", Value{int64_t{0}});
            if (x.Is<double>())
            {
                return Value{FloatToInteger(x.As<double>())};
            }
            if (x.IsString())
            {
                const std::string text = Trimmed(x.As<std::string>());
                int64_t parsed = 0;
                const char* begin = text.data() + (text.starts_with('+') ? 1 : 0);
                const char* end = text.data() + text.size();
                auto [ptr, ec] = std::from_chars(begin, end, parsed);
                if (text.empty() || ec != std::errc{} || ptr != end)
                {
                    ThrowValueError(std::format("invalid literal for int() with base 10: {}", Repr(x)));
                }
                return Value{parsed};
            }
            return Value{ToInteger(x)};
        }

        Value Float(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("float", 1);
            const Value x = args.Get(0, "x", Value{0.0});
            if (!x.IsString())
            {
                return Value{ToNumber(x)};
            }
            std::string text = Trimmed(x.As<std::string>());
            std::string lowered = text;
            std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            const std::string magnitude = lowered.starts_with('-') || lowered.starts_with('+') ? lowered.substr(1) : lowered;
            const double sign = lowered.starts_with('-') ? -1.0 : 1.0;
            if (magnitude == "nan")
            {
                return Value{std::numeric_limits<double>::quiet_NaN()};
            }
            if (magnitude == "inf" || magnitude == "infinity")
            {
                return Value{sign * std::numeric_limits<double>::infinity()};
            }
            double parsed = 0.0;
            const char* begin = text.data() + (text.starts_with('+') ? 1 : 0);
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, parsed);
            if (text.empty() || ec != std::errc{} || ptr != end)
            {
                ThrowValueError(std::format("could not convert string to float: {}", Repr(x)));
            }
            return Value{parsed};
        }

        Value Bool(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("bool", 1);
            return Value{Truthy(args.Get(0, "x", Value{false}))};
        }

        Value StrBuiltin(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("str", 1);
            return Value{Str(args.Get(0, "object", Value{std::string{}}))};
        }

        Value Pow(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("pow", 2);
            return BinaryOperation(BinOpType::Pow, args.Require(0, "base", "pow"), args.Require(1, "exp", "pow"));
        }

        // Correctly rounded decimal text, the way Python's round() behaves
        double RoundFloat(double value, int64_t digits)
        {
            if (!std::isfinite(value))
            {
                return value;
            }
            if (digits >= 0)
            {
                const std::string text = std::format("{:.{}f}", value, std::min<int64_t>(digits, 320));
                double parsed = value;
                if (auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed); ec != std::errc{})
                {
                    ThrowValueError(std::format("cannot round {}", FormatFloat(value)));
                }
                return parsed;
            }
            const double scale = std::pow(10.0, static_cast<double>(-digits));
            return std::nearbyint(value / scale) * scale;
        }

        Value Round(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("round", 2, {"ndigits"});
            const Value& number = args.Require(0, "number", "round");
            const Value digits = args.Get(1, "ndigits", Value::None());

            if (auto* series = number.Object<SeriesObject>())
            {
                SeriesData result = series->data;
                result.values = RoundArray(result.values, digits.IsNone() ? 0 : ToInteger(digits));
                return MakeSeries(std::move(result));
            }
            if (digits.IsNone())
            {
                if (number.Is<double>())
                {
                    return Value{FloatToInteger(std::nearbyint(number.As<double>()))};
                }
                return Value{ToInteger(number)};
            }
            if (number.Is<double>())
            {
                return Value{RoundFloat(number.As<double>(), ToInteger(digits))};
            }
            const int64_t n = ToInteger(number);
            const int64_t d = ToInteger(digits);
            if (d >= 0)
            {
                return Value{n};
            }
            return Value{FloatToInteger(RoundFloat(static_cast<double>(n), d))};
        }

        // ---- Iterables ----

        Value Len(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("len", 1);
            const Value& object = args.Require(0, "obj", "len");
            if (auto* frame = object.Object<FrameObject>())
            {
                return Value{frame->data.NumRows()};
            }
            if (auto* series = object.Object<SeriesObject>())
            {
                return Value{series->data.Size()};
            }
            if (auto* range = object.TryAs<RangeValue>())
            {
                return Value{range->Length()};
            }
            if (object.IsString() || object.Object<ListObject>() || object.Object<TupleObject>() ||
                object.Object<DictObject>())
            {
                return Value{static_cast<int64_t>(Materialize(object).size())};
            }
            ThrowTypeError(std::format("object of type '{}' has no len()", TypeName(object)));
        }

        Value ListBuiltin(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("list", 1);
            const Value* iterable = args.Find(0, "iterable");
            return MakeList(iterable ? Materialize(*iterable) : ValueList{});
        }

        Value TupleBuiltin(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("tuple", 1);
            const Value* iterable = args.Find(0, "iterable");
            return MakeTuple(iterable ? Materialize(*iterable) : ValueList{});
        }

        Value DictBuiltin(ExecutionContext&, const CallArgs& args)
        {
            if (args.positional.size() > 1)
            {
                ThrowTypeError(std::format("dict expected at most 1 argument, got {}", args.positional.size()));
            }
            Value result = MakeDict();
            auto* dict = result.Object<DictObject>();
            if (!args.positional.empty())
            {
                const Value& source = args.positional.front();
                if (auto* other = source.Object<DictObject>())
                {
                    dict->entries = other->entries;
                }
                else
                {
                    for (const auto& pair : Materialize(source))
                    {
                        const ValueList items = Materialize(pair);
                        if (items.size() != 2)
                        {
                            ThrowValueError(std::format(
                                "dictionary update sequence element has length {}; 2 is required", items.size()));
                        }
                        dict->Set(items[0], items[1]);
                    }
                }
            }
            for (const auto& [key, value] : args.keywords)
            {
                dict->Set(Value{key}, value);
            }
            return result;
        }

        Value Range(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("range", 3);
            if (args.positional.empty())
            {
                ThrowTypeError("range expected at least 1 argument, got 0");
            }
            RangeValue range;
            if (args.positional.size() == 1)
            {
                range.stop = ToInteger(args.positional[0]);
            }
            else
            {
                range.start = ToInteger(args.positional[0]);
                range.stop = ToInteger(args.positional[1]);
            }
            if (args.positional.size() == 3)
            {
                range.step = ToInteger(args.positional[2]);
                if (range.step == 0)
                {
                    ThrowValueError("range() arg 3 must not be zero");
                }
            }
            return Value{range};
        }

        Value Enumerate(ExecutionContext& context, const CallArgs& args)
        {
            args.Expect("enumerate", 2, {"start"});
            int64_t index = IntArg(args, 1, "start", 0);
            ValueList pairs;
            for (auto& item : Materialize(args.Require(0, "iterable", "enumerate")))
            {
                context.CheckPreempted();
                pairs.push_back(MakeTuple({Value{index++}, std::move(item)}));
            }
            return Value{std::make_shared<IteratorObject>(IteratorObject{std::move(pairs), 0})};
        }

        Value Zip(ExecutionContext& context, const CallArgs& args)
        {
            args.Expect("zip", args.positional.size());
            std::vector<ValueList> sources;
            size_t shortest = std::numeric_limits<size_t>::max();
            for (const auto& iterable : args.positional)
            {
                sources.push_back(Materialize(iterable));
                shortest = std::min(shortest, sources.back().size());
            }
            ValueList rows;
            for (size_t i = 0; !sources.empty() && i < shortest; ++i)
            {
                context.CheckPreempted();
                ValueList row;
                for (const auto& source : sources)
                {
                    row.push_back(source[i]);
                }
                rows.push_back(MakeTuple(std::move(row)));
            }
            return Value{std::make_shared<IteratorObject>(IteratorObject{std::move(rows), 0})};
        }

        Value Sorted(ExecutionContext& context, const CallArgs& args)
        {
            args.Expect("sorted", 1, {"reverse"});
            ValueList items = Materialize(args.Require(0, "iterable", "sorted"));
            std::ranges::stable_sort(items, [&context](const Value& a, const Value& b) {
                context.CheckPreempted();
                return LessThan(a, b);
            });
            if (BoolArg(args, kKeywordOnly, "reverse", false))
            {
                std::ranges::reverse(items);
            }
            return MakeList(std::move(items));
        }

        Value Sum(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("sum", 2, {"start"});
            const Value& iterable = args.Require(0, "iterable", "sum");
            if (auto* series = iterable.Object<SeriesObject>())
            {
                return ReduceArray(series->data.values, "sum");
            }
            Value total = args.Get(1, "start", Value{int64_t{0}});
            if (total.IsString())
            {
                ThrowTypeError("sum() can't sum strings [use ''.join(seq) instead]");
            }
            ForEachItem(iterable, [&total](const Value& item) {
                total = BinaryOperation(BinOpType::Add, total, item);
                return true;
            });
            return total;
        }

        Value Extreme(const CallArgs& args, const char* function, bool largest)
        {
            args.Expect(function, args.positional.size(), {"default"});
            if (args.positional.empty())
            {
                ThrowTypeError(std::format("{} expected at least 1 argument, got 0", function));
            }
            if (args.positional.size() == 1)
            {
                if (auto* series = args.positional.front().Object<SeriesObject>())
                {
                    return ReduceArray(series->data.values, largest ? "max" : "min");
                }
            }
            std::optional<Value> best;
            auto consider = [&best, largest](const Value& item) {
                if (!best || (largest ? LessThan(*best, item) : LessThan(item, *best)))
                {
                    best = item;
                }
                return true;
            };
            if (args.positional.size() == 1)
            {
                ForEachItem(args.positional.front(), consider);
            }
            else
            {
                std::ranges::for_each(args.positional, consider);
            }
            if (!best)
            {
                if (const Value* fallback = args.Find(kKeywordOnly, "default"))
                {
                    return *fallback;
                }
                ThrowValueError(std::format("{}() arg is an empty sequence", function));
            }
            return *best;
        }

        Value Min(ExecutionContext&, const CallArgs& args) { return Extreme(args, "min", false); }
        Value Max(ExecutionContext&, const CallArgs& args) { return Extreme(args, "max", true); }

        Value AnyBuiltin(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("any", 1);
            const Value& iterable = args.Require(0, "iterable", "any");
            if (auto* series = iterable.Object<SeriesObject>())
            {
                return ReduceArray(series->data.values, "any");
            }
            bool found = false;
            ForEachItem(iterable, [&found](const Value& item) {
                found = Truthy(item);
                return !found;
            });
            return Value{found};
        }

        Value AllBuiltin(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("all", 1);
            const Value& iterable = args.Require(0, "iterable", "all");
            if (auto* series = iterable.Object<SeriesObject>())
            {
                return ReduceArray(series->data.values, "all");
            }
            bool holds = true;
            ForEachItem(iterable, [&holds](const Value& item) {
                holds = Truthy(item);
                return holds;
            });
            return Value{holds};
        }

        // ---- Output ----

        Value Print(ExecutionContext& context, const CallArgs& args)
        {
            args.Expect("print", args.positional.size(), {"sep", "end"});
            const Value sepArg = args.Get(kKeywordOnly, "sep", Value::None());
            const Value endArg = args.Get(kKeywordOnly, "end", Value::None());
            const std::string sep = sepArg.IsNone() ? " " : Str(sepArg);
            const std::string end = endArg.IsNone() ? "\n" : Str(endArg);

            std::string line;
            for (size_t i = 0; i < args.positional.size(); ++i)
            {
                line += (i ? sep : "") + Str(args.positional[i]);
            }
            line += end;
            context.Output().Write(OutputStream::Stdout, line);
            return Value::None();
        }

        struct BuiltinEntry
        {
            const char* name;
            NativeFunction fn;
        };

        const BuiltinEntry kBuiltins[] = {
            {"abs", Abs},         {"all", AllBuiltin},     {"any", AnyBuiltin},   {"bool", Bool},
            {"dict", DictBuiltin}, {"enumerate", Enumerate}, {"float", Float},     {"int", Int},
            {"len", Len},         {"list", ListBuiltin},   {"max", Max},          {"min", Min},
            {"pow", Pow},         {"print", Print},        {"range", Range},      {"round", Round},
            {"sorted", Sorted},   {"str", StrBuiltin},     {"sum", Sum},          {"tuple", TupleBuiltin},
            {"zip", Zip},
        };
    } // namespace

    void InstallBuiltins(ExecutionContext& context)
    {
        for (const auto& entry : kBuiltins)
        {
            context.BindBuiltin(entry.name, Value{std::make_shared<BuiltinFunction>(BuiltinFunction{entry.name, entry.fn})});
        }
        for (const char* name : kDisallowedNames)
        {
            context.BindBuiltin(name, Value{std::make_shared<DisallowedStub>(DisallowedStub{name})});
        }

        context.BindBuiltin("true", Value{true});
        context.BindBuiltin("false", Value{false});
        context.BindBuiltin("null", Value::None());

        for (const auto& [alias, module] : context.Config().module_aliases)
        {
            context.BindBuiltin(alias, Value{std::make_shared<ModuleObject>(ModuleObject{module})});
        }
    }

} // namespace nlytics::sandbox
