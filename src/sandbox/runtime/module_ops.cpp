//
// NLytics Module Operations Implementation
//

#include "module_ops.h"
#include "arrow_bridge.h"
#include "call_args.h"
#include "frame_ops.h"
#include "sandbox_error.h"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <numbers>
#include <unordered_map>

namespace nlytics::sandbox
{
    namespace
    {
        using FunctionTable = std::unordered_map<std::string, NativeFunction>;

        bool IsSequence(const Value& v)
        {
            return v.Object<ListObject>() || v.Object<TupleObject>() || v.Is<RangeValue>();
        }

        bool IsMissingScalar(const Value& v)
        {
            if (v.IsNone())
            {
                return true;
            }
            auto* d = v.TryAs<double>();
            return d && std::isnan(*d);
        }

        ArrayPtr LabelsFromValue(const Value& index, int64_t length)
        {
            if (index.IsNone())
            {
                return RangeLabels(length);
            }
            ArrayPtr labels = ValuesToArray(Materialize(index));
            if (labels->length() != length)
            {
                ThrowValueError(std::format("Length of values ({}) does not match length of index ({})", length,
                                            labels->length()));
            }
            return labels;
        }

        // Column input: series, list/tuple/range or a numeric scalar
        ArrayPtr ArrayInput(const Value& value, const char* function)
        {
            if (auto* series = value.Object<SeriesObject>())
            {
                return series->data.values;
            }
            if (IsSequence(value))
            {
                return ValuesToArray(Materialize(value));
            }
            ThrowTypeError(std::format("{}() expects a Series or a list, not {}", function, TypeName(value)));
        }

        Value ElementwiseMath(const Value& input, const char* function, double (*scalarFn)(double),
                              const std::string& arrowFn)
        {
            if (input.IsNumber())
            {
                return Value{scalarFn(ToNumber(input))};
            }
            if (auto* series = input.Object<SeriesObject>())
            {
                SeriesData result = series->data;
                result.values = UnaryMath(arrowFn, result.values);
                return MakeSeries(std::move(result));
            }
            return MakeList(ArrayToValues(*UnaryMath(arrowFn, ArrayInput(input, function))));
        }

        Value NumpyReduce(const CallArgs& args, const char* function, const std::string& reduction)
        {
            args.Expect(function, 1, {"a"});
            const Value& input = args.Require(0, "a", function);
            if (input.IsNumber())
            {
                return input;
            }
            return ReduceArray(ArrayInput(input, function), reduction);
        }

        // ---- pandas ----

        Value PdDataFrame(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("DataFrame", 3, {"data", "columns", "index"});
            return ConstructFrame(args.Get(0, "data", Value::None()), args.Get(2, "columns", Value::None()),
                                  args.Get(1, "index", Value::None()));
        }

        Value PdSeries(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("Series", 3, {"data", "index", "name", "dtype"});
            Value series = ConstructSeries(args.Get(0, "data", Value::None()), args.Get(1, "index", Value::None()),
                                           args.Get(2, "name", Value::None()));
            if (const Value* dtype = args.Find(99, "dtype"); dtype && !dtype->IsNone())
            {
                SeriesData data = series.Object<SeriesObject>()->data;
                data.values = CastToDtype(data.values, *dtype);
                return MakeSeries(std::move(data));
            }
            return series;
        }

        std::optional<double> ParseNumber(const std::string& text)
        {
            const auto first = text.find_first_not_of(" \t");
            const auto last = text.find_last_not_of(" \t");
            if (first == std::string::npos)
            {
                return std::nullopt;
            }
            const char* begin = text.data() + first;
            const char* end = text.data() + last + 1;
            double parsed = 0.0;
            auto [ptr, ec] = std::from_chars(begin, end, parsed);
            if (ec != std::errc{} || ptr != end)
            {
                return std::nullopt;
            }
            return parsed;
        }

        Value ToNumericScalar(const Value& value, bool coerce)
        {
            if (value.IsNumber() || value.IsNone())
            {
                return value;
            }
            if (value.IsString())
            {
                if (auto parsed = ParseNumber(value.As<std::string>()))
                {
                    const double number = *parsed;
                    const bool integral = value.As<std::string>().find_first_of(".eE") == std::string::npos;
                    return integral ? Value{static_cast<int64_t>(number)} : Value{number};
                }
                if (coerce)
                {
                    return Value{std::numeric_limits<double>::quiet_NaN()};
                }
                ThrowValueError(std::format("Unable to parse string \"{}\"", value.As<std::string>()));
            }
            ThrowTypeError(std::format("Invalid object type {}", TypeName(value)));
        }

        Value PdToNumeric(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("to_numeric", 2, {"arg", "errors"});
            const Value& input = args.Require(0, "arg", "to_numeric");
            const Value errors = args.Get(1, "errors", Value{"raise"});
            const bool coerce = errors.IsString() && errors.As<std::string>() == "coerce";

            auto convert = [&](const ValueList& items) {
                ValueList out;
                bool anyFloat = false;
                for (const auto& item : items)
                {
                    out.push_back(ToNumericScalar(item, coerce));
                    anyFloat = anyFloat || out.back().Is<double>() || out.back().IsNone();
                }
                if (anyFloat)
                {
                    for (auto& v : out)
                    {
                        v = v.IsNone() ? Value{std::numeric_limits<double>::quiet_NaN()} : Value{ToNumber(v)};
                    }
                }
                return out;
            };

            if (auto* series = input.Object<SeriesObject>())
            {
                if (IsNumericType(*series->data.values->type()))
                {
                    return input;
                }
                SeriesData result = series->data;
                result.values = ValuesToArray(convert(ArrayToValues(*series->data.values)));
                return MakeSeries(std::move(result));
            }
            if (IsSequence(input))
            {
                return MakeList(convert(Materialize(input)));
            }
            return ToNumericScalar(input, coerce);
        }

        Value MissingCheck(const CallArgs& args, const char* function, bool wantMissing)
        {
            args.Expect(function, 1, {"obj"});
            const Value& input = args.Require(0, "obj", function);
            if (auto* series = input.Object<SeriesObject>())
            {
                SeriesData result = series->data;
                result.values = wantMissing ? MissingMask(result.values) : PresentMask(result.values);
                return MakeSeries(std::move(result));
            }
            if (auto* frame = input.Object<FrameObject>())
            {
                FrameData result = frame->data;
                for (auto& array : result.arrays)
                {
                    array = wantMissing ? MissingMask(array) : PresentMask(array);
                }
                return MakeFrame(std::move(result));
            }
            return Value{IsMissingScalar(input) == wantMissing};
        }

        Value PdIsNa(ExecutionContext&, const CallArgs& args) { return MissingCheck(args, "isna", true); }
        Value PdNotNa(ExecutionContext&, const CallArgs& args) { return MissingCheck(args, "notna", false); }

        // ---- numpy ----

        Value NpMean(ExecutionContext&, const CallArgs& args) { return NumpyReduce(args, "mean", "mean"); }
        Value NpSum(ExecutionContext&, const CallArgs& args) { return NumpyReduce(args, "sum", "sum"); }
        Value NpMedian(ExecutionContext&, const CallArgs& args) { return NumpyReduce(args, "median", "median"); }
        Value NpMin(ExecutionContext&, const CallArgs& args) { return NumpyReduce(args, "min", "min"); }
        Value NpMax(ExecutionContext&, const CallArgs& args) { return NumpyReduce(args, "max", "max"); }

        Value NpStd(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("std", 1, {"a", "ddof"});
            const Value& input = args.Require(0, "a", "std");
            arrow::compute::VarianceOptions options(static_cast<int>(IntArg(args, 99, "ddof", 0)));
            return CallComputeScalar("stddev", {DropMissing(ArrayInput(input, "std"))}, &options);
        }

        Value NpAbs(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("abs", 1);
            const Value& input = args.Require(0, "x", "abs");
            if (input.Is<int64_t>() || input.Is<bool>())
            {
                return Value{std::abs(ToInteger(input))};
            }
            if (input.IsNumber())
            {
                return Value{std::fabs(ToNumber(input))};
            }
            if (auto* series = input.Object<SeriesObject>())
            {
                SeriesData result = series->data;
                result.values = AbsArray(result.values);
                return MakeSeries(std::move(result));
            }
            return MakeList(ArrayToValues(*AbsArray(ArrayInput(input, "abs"))));
        }

        Value NpSqrt(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("sqrt", 1);
            return ElementwiseMath(args.Require(0, "x", "sqrt"), "sqrt", [](double x) { return std::sqrt(x); }, "sqrt");
        }

        Value NpLog(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("log", 1);
            return ElementwiseMath(args.Require(0, "x", "log"), "log", [](double x) { return std::log(x); }, "ln");
        }

        Value NpExp(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("exp", 1);
            return ElementwiseMath(args.Require(0, "x", "exp"), "exp", [](double x) { return std::exp(x); }, "exp");
        }

        Value NpRound(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("round", 2, {"a", "decimals"});
            const Value& input = args.Require(0, "a", "round");
            const int64_t decimals = IntArg(args, 1, "decimals", 0);
            if (input.IsNumber())
            {
                auto rounded = RoundArray(BroadcastScalar(Value{ToNumber(input)}, 1), decimals);
                return ArrayElement(*rounded, 0);
            }
            if (auto* series = input.Object<SeriesObject>())
            {
                SeriesData result = series->data;
                result.values = RoundArray(result.values, decimals);
                return MakeSeries(std::move(result));
            }
            return MakeList(ArrayToValues(*RoundArray(ArrayInput(input, "round"), decimals)));
        }

        Value NpWhere(ExecutionContext&, const CallArgs& args)
        {
            args.Expect("where", 3);
            const Value& condition = args.Require(0, "condition", "where");
            const Value& whenTrue = args.Require(1, "x", "where");
            const Value& whenFalse = args.Require(2, "y", "where");
            if (auto* series = condition.Object<SeriesObject>())
            {
                auto values = CallComputeArray("if_else", {series->data.values, ToDatum(whenTrue), ToDatum(whenFalse)});
                return MakeSeries(SeriesData{values, series->data.labels, std::nullopt, series->data.indexName});
            }
            if (IsSequence(condition))
            {
                auto mask = ValuesToArray(Materialize(condition));
                return MakeList(ArrayToValues(*CallComputeArray("if_else", {mask, ToDatum(whenTrue), ToDatum(whenFalse)})));
            }
            return Truthy(condition) ? whenTrue : whenFalse;
        }

        const FunctionTable& PandasFunctions()
        {
            static const FunctionTable table{
                {"DataFrame", PdDataFrame}, {"Series", PdSeries}, {"to_numeric", PdToNumeric},
                {"isna", PdIsNa},           {"isnull", PdIsNa},   {"notna", PdNotNa},
                {"notnull", PdNotNa},
            };
            return table;
        }

        const FunctionTable& NumpyFunctions()
        {
            static const FunctionTable table{
                {"mean", NpMean}, {"sum", NpSum},   {"median", NpMedian}, {"std", NpStd},
                {"min", NpMin},   {"max", NpMax},   {"abs", NpAbs},       {"sqrt", NpSqrt},
                {"log", NpLog},   {"exp", NpExp},   {"round", NpRound},   {"where", NpWhere},
            };
            return table;
        }
    } // namespace

    Value ConstructFrame(const Value& data, const Value& columns, const Value& index)
    {
        FrameData frame;
        if (data.IsNone())
        {
            frame.labels = RangeLabels(0);
            if (!columns.IsNone())
            {
                for (const auto& name : NameListArg(columns, "DataFrame"))
                {
                    frame.columns.push_back(name);
                    frame.arrays.push_back(MakeEmptyArray(arrow::float64()));
                }
            }
            return MakeFrame(std::move(frame));
        }

        if (auto* source = data.Object<FrameObject>())
        {
            frame = source->data;
            if (!columns.IsNone())
            {
                frame = SelectColumns(frame, NameListArg(columns, "DataFrame"));
            }
            return MakeFrame(std::move(frame));
        }

        if (auto* dict = data.Object<DictObject>())
        {
            int64_t rows = -1;
            for (const auto& [key, value] : dict->entries)
            {
                if (auto* series = value.Object<SeriesObject>())
                    rows = series->data.Size();
                else if (IsSequence(value))
                    rows = static_cast<int64_t>(Materialize(value).size());
            }
            if (rows < 0)
            {
                if (index.IsNone())
                {
                    ThrowValueError("If using all scalar values, you must pass an index");
                }
                rows = static_cast<int64_t>(Materialize(index).size());
            }
            frame.labels = LabelsFromValue(index, rows);
            for (const auto& [key, value] : dict->entries)
            {
                SetColumn(frame, Str(key), ColumnFromValue(frame, value));
            }
            if (!columns.IsNone())
            {
                frame = SelectColumns(frame, NameListArg(columns, "DataFrame"));
            }
            return MakeFrame(std::move(frame));
        }

        if (IsSequence(data))
        {
            const ValueList rows = Materialize(data);
            std::vector<std::string> names;
            std::vector<ValueList> cells;
            const bool records = !rows.empty() && rows.front().Object<DictObject>() != nullptr;

            if (records)
            {
                for (const auto& row : rows)
                {
                    auto* record = row.Object<DictObject>();
                    if (record == nullptr)
                    {
                        ThrowTypeError("DataFrame records must all be dicts");
                    }
                    for (const auto& [key, value] : record->entries)
                    {
                        const std::string name = Str(key);
                        if (std::ranges::find(names, name) == names.end())
                        {
                            names.push_back(name);
                        }
                    }
                }
                cells.resize(names.size());
                for (const auto& row : rows)
                {
                    auto* record = row.Object<DictObject>();
                    for (size_t c = 0; c < names.size(); ++c)
                    {
                        const Value* cell = record->Find(Value{names[c]});
                        cells[c].push_back(cell ? *cell : Value::None());
                    }
                }
                if (!columns.IsNone())
                {
                    frame.labels = LabelsFromValue(index, static_cast<int64_t>(rows.size()));
                    for (size_t c = 0; c < names.size(); ++c)
                    {
                        SetColumn(frame, names[c], ValuesToArray(cells[c]));
                    }
                    return MakeFrame(SelectColumns(frame, NameListArg(columns, "DataFrame")));
                }
            }
            else
            {
                size_t width = 0;
                for (const auto& row : rows)
                {
                    width = std::max(width, Materialize(row).size());
                }
                if (!columns.IsNone())
                {
                    names = NameListArg(columns, "DataFrame");
                    if (names.size() != width && !rows.empty())
                    {
                        ThrowValueError(std::format("{} columns passed, passed data had {} columns", names.size(), width));
                    }
                }
                else
                {
                    for (size_t c = 0; c < width; ++c)
                    {
                        names.push_back(std::to_string(c));
                    }
                }
                cells.resize(names.size());
                for (const auto& row : rows)
                {
                    ValueList items = Materialize(row);
                    for (size_t c = 0; c < names.size(); ++c)
                    {
                        cells[c].push_back(c < items.size() ? items[c] : Value::None());
                    }
                }
            }

            frame.labels = LabelsFromValue(index, static_cast<int64_t>(rows.size()));
            for (size_t c = 0; c < names.size(); ++c)
            {
                SetColumn(frame, names[c], ValuesToArray(cells[c]));
            }
            return MakeFrame(std::move(frame));
        }

        ThrowValueError(std::format("DataFrame constructor not properly called with {}", TypeName(data)));
    }

    Value ConstructSeries(const Value& data, const Value& index, const Value& name)
    {
        SeriesData series;
        if (!name.IsNone())
        {
            series.name = Str(name);
        }

        if (auto* source = data.Object<SeriesObject>())
        {
            series.values = source->data.values;
            series.labels = index.IsNone() ? source->data.labels : LabelsFromValue(index, source->data.Size());
            series.indexName = source->data.indexName;
            if (name.IsNone())
            {
                series.name = source->data.name;
            }
        }
        else if (auto* dict = data.Object<DictObject>())
        {
            ValueList keys;
            ValueList values;
            for (const auto& [key, value] : dict->entries)
            {
                keys.push_back(key);
                values.push_back(value);
            }
            series.values = values.empty() ? MakeEmptyArray(arrow::float64()) : ValuesToArray(values);
            series.labels = keys.empty() ? RangeLabels(0) : ValuesToArray(keys);
        }
        else if (data.IsNone())
        {
            series.values = MakeEmptyArray(arrow::float64());
            series.labels = RangeLabels(0);
        }
        else if (IsSequence(data))
        {
            const ValueList values = Materialize(data);
            series.values = ValuesToArray(values);
            series.labels = LabelsFromValue(index, static_cast<int64_t>(values.size()));
        }
        else
        {
            if (index.IsNone())
            {
                series.values = BroadcastScalar(data, 1);
                series.labels = RangeLabels(1);
            }
            else
            {
                const auto length = static_cast<int64_t>(Materialize(index).size());
                series.values = BroadcastScalar(data, length);
                series.labels = LabelsFromValue(index, length);
            }
        }
        return MakeSeries(std::move(series));
    }

    Value ModuleAttribute(const ModuleObject& module, const std::string& name)
    {
        if (module.name == "numpy")
        {
            if (name == "nan")
                return Value{std::numeric_limits<double>::quiet_NaN()};
            if (name == "inf")
                return Value{std::numeric_limits<double>::infinity()};
            if (name == "pi")
                return Value{std::numbers::pi};
        }

        const FunctionTable& table = module.name == "pandas" ? PandasFunctions() : NumpyFunctions();
        auto it = table.find(name);
        if (it == table.end())
        {
            ThrowFault("AttributeError", std::format("module '{}' has no attribute '{}'", module.name, name));
        }
        return Value{std::make_shared<BuiltinFunction>(BuiltinFunction{module.name + "." + name, it->second})};
    }

} // namespace nlytics::sandbox
