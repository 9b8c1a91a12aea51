//
// NLytics Frame Operations Implementation
//

#include "frame_ops.h"
#include "arrow_bridge.h"
#include "sandbox_error.h"
#include <algorithm>
#include <format>
#include <limits>

namespace nlytics::sandbox
{
    namespace
    {
        namespace cp = arrow::compute;

        bool DatumIsInteger(const arrow::Datum& datum)
        {
            return IsIntegerType(*datum.type());
        }

        bool DatumIsBoolean(const arrow::Datum& datum)
        {
            return datum.type()->id() == arrow::Type::BOOL;
        }

        arrow::Datum CastDatum(const arrow::Datum& datum, const std::shared_ptr<arrow::DataType>& type)
        {
            if (datum.type()->Equals(*type))
            {
                return datum;
            }
            cp::CastOptions options = cp::CastOptions::Safe(type);
            return CallCompute("cast", {datum}, &options);
        }

        // pandas treats booleans as integers in arithmetic
        arrow::Datum PromoteBoolean(const arrow::Datum& datum)
        {
            return DatumIsBoolean(datum) ? CastDatum(datum, arrow::int64()) : datum;
        }

        ArrayPtr AsArray(const arrow::Datum& datum)
        {
            if (datum.is_chunked_array())
            {
                return CombineChunks(*datum.chunked_array());
            }
            if (!datum.is_array())
            {
                ThrowFault("RuntimeError", "expected a column result");
            }
            return datum.make_array();
        }

        // floor(lhs / rhs) in float64, narrowed back to int64 when both sides are integers
        ArrayPtr FloorDivide(const arrow::Datum& lhs, const arrow::Datum& rhs, bool integral)
        {
            auto quotient = CallCompute("divide", {CastDatum(lhs, arrow::float64()), CastDatum(rhs, arrow::float64())});
            auto floored = CallCompute("floor", {quotient});
            if (integral)
            {
                auto narrowed = cp::Cast(floored, cp::CastOptions::Safe(arrow::int64()));
                if (narrowed.ok())
                {
                    return AsArray(*narrowed);
                }
            }
            return AsArray(floored);
        }

        ArrayPtr Modulo(const arrow::Datum& lhs, const arrow::Datum& rhs, bool integral)
        {
            auto l = CastDatum(lhs, arrow::float64());
            auto r = CastDatum(rhs, arrow::float64());
            auto floored = CallCompute("floor", {CallCompute("divide", {l, r})});
            auto remainder = CallCompute("subtract", {l, CallCompute("multiply", {floored, r})});
            if (integral)
            {
                auto narrowed = cp::Cast(remainder, cp::CastOptions::Safe(arrow::int64()));
                if (narrowed.ok())
                {
                    return AsArray(*narrowed);
                }
            }
            return AsArray(remainder);
        }

        std::shared_ptr<arrow::DataType> DtypeFromName(const std::string& name)
        {
            if (name == "int" || name == "int64" || name == "Int64")
                return arrow::int64();
            if (name == "int32")
                return arrow::int32();
            if (name == "float" || name == "float64" || name == "Float64")
                return arrow::float64();
            if (name == "float32")
                return arrow::float32();
            if (name == "str" || name == "string" || name == "object" || name == "category")
                return arrow::utf8();
            if (name == "bool" || name == "boolean")
                return arrow::boolean();
            ThrowTypeError(std::format("data type '{}' not understood", name));
        }

        std::shared_ptr<arrow::RecordBatch> ToRecordBatch(const FrameData& frame)
        {
            arrow::FieldVector fields;
            for (size_t i = 0; i < frame.columns.size(); ++i)
            {
                fields.push_back(arrow::field(frame.columns[i], frame.arrays[i]->type()));
            }
            return arrow::RecordBatch::Make(arrow::schema(fields), frame.NumRows(), frame.arrays);
        }
    } // namespace

    // ---- Slicing ----

    int64_t SliceBounds::Count() const
    {
        if (step > 0)
        {
            return stop > start ? (stop - start - 1) / step + 1 : 0;
        }
        return start > stop ? (start - stop - 1) / (-step) + 1 : 0;
    }

    std::vector<int64_t> SliceBounds::Indices() const
    {
        std::vector<int64_t> indices;
        const int64_t count = Count();
        indices.reserve(static_cast<size_t>(count));
        for (int64_t i = 0; i < count; ++i)
        {
            indices.push_back(start + i * step);
        }
        return indices;
    }

    SliceBounds ResolveSlice(const SliceValue& slice, int64_t length)
    {
        const int64_t step = slice.step.value_or(1);
        if (step == 0)
        {
            ThrowValueError("slice step cannot be zero");
        }

        auto adjust = [&](std::optional<int64_t> bound, int64_t fallback) {
            if (!bound)
            {
                return fallback;
            }
            int64_t value = *bound;
            if (value < 0)
            {
                value += length;
                if (value < 0)
                {
                    value = step < 0 ? -1 : 0;
                }
            }
            else if (value >= length)
            {
                value = step < 0 ? length - 1 : length;
            }
            return value;
        };

        if (step > 0)
        {
            return SliceBounds{adjust(slice.start, 0), adjust(slice.stop, length), step};
        }
        return SliceBounds{adjust(slice.start, length - 1), adjust(slice.stop, -1), step};
    }

    int64_t ResolveIndex(int64_t index, int64_t length, const char* what)
    {
        const int64_t resolved = index < 0 ? index + length : index;
        if (resolved < 0 || resolved >= length)
        {
            ThrowIndexError(std::format("{} index out of range", what));
        }
        return resolved;
    }

    // ---- Element-wise ----

    arrow::Datum ToDatum(const Value& value)
    {
        if (auto* series = value.Object<SeriesObject>())
        {
            return arrow::Datum(series->data.values);
        }
        return arrow::Datum(ValueToScalar(value));
    }

    ArrayPtr ArithmeticArrays(BinOpType op, const arrow::Datum& lhs, const arrow::Datum& rhs)
    {
        switch (op)
        {
        case BinOpType::BitAnd:
        case BinOpType::BitOr:
        case BinOpType::BitXor:
        {
            if (DatumIsBoolean(lhs) && DatumIsBoolean(rhs))
            {
                const char* fn = op == BinOpType::BitAnd ? "and_kleene" : op == BinOpType::BitOr ? "or_kleene" : "xor";
                return AsArray(CallCompute(fn, {lhs, rhs}));
            }
            const char* fn = op == BinOpType::BitAnd  ? "bit_wise_and"
                             : op == BinOpType::BitOr ? "bit_wise_or"
                                                      : "bit_wise_xor";
            return AsArray(CallCompute(fn, {lhs, rhs}));
        }
        default:
            break;
        }

        const bool strings = lhs.type()->id() == arrow::Type::STRING && rhs.type()->id() == arrow::Type::STRING;
        if (op == BinOpType::Add && strings)
        {
            arrow::Datum separator(std::make_shared<arrow::StringScalar>(""));
            return AsArray(CallCompute("binary_join_element_wise", {lhs, rhs, separator}));
        }

        const auto l = PromoteBoolean(lhs);
        const auto r = PromoteBoolean(rhs);
        const bool integral = DatumIsInteger(l) && DatumIsInteger(r);
        switch (op)
        {
        case BinOpType::Add:
            return AsArray(CallCompute("add", {l, r}));
        case BinOpType::Sub:
            return AsArray(CallCompute("subtract", {l, r}));
        case BinOpType::Mult:
            return AsArray(CallCompute("multiply", {l, r}));
        case BinOpType::Div:
            return AsArray(CallCompute("divide", {CastDatum(l, arrow::float64()), CastDatum(r, arrow::float64())}));
        case BinOpType::FloorDiv:
            return FloorDivide(l, r, integral);
        case BinOpType::Mod:
            return Modulo(l, r, integral);
        case BinOpType::Pow:
            if (integral)
            {
                return AsArray(CallCompute("power", {l, r}));
            }
            return AsArray(CallCompute("power", {CastDatum(l, arrow::float64()), CastDatum(r, arrow::float64())}));
        default:
            ThrowTypeError(std::format("unsupported operand for {}", BinOpSymbol(op)));
        }
    }

    ArrayPtr CompareArrays(CmpOpType op, const arrow::Datum& lhs, const arrow::Datum& rhs)
    {
        const char* fn = nullptr;
        switch (op)
        {
        case CmpOpType::Eq:
            fn = "equal";
            break;
        case CmpOpType::NotEq:
            fn = "not_equal";
            break;
        case CmpOpType::Lt:
            fn = "less";
            break;
        case CmpOpType::LtE:
            fn = "less_equal";
            break;
        case CmpOpType::Gt:
            fn = "greater";
            break;
        case CmpOpType::GtE:
            fn = "greater_equal";
            break;
        default:
            ThrowTypeError(std::format("'{}' is not supported between a Series and a value", CmpOpSymbol(op)));
        }
        auto result = AsArray(CallCompute(fn, {lhs, rhs}));
        // pandas comparisons against missing values are False, never missing
        if (result->null_count() > 0)
        {
            arrow::Datum fill(std::make_shared<arrow::BooleanScalar>(op == CmpOpType::NotEq));
            result = AsArray(CallCompute("coalesce", {result, fill}));
        }
        return result;
    }

    ArrayPtr NegateArray(const ArrayPtr& array)
    {
        return AsArray(CallCompute("negate", {PromoteBoolean(arrow::Datum(array))}));
    }

    ArrayPtr InvertArray(const ArrayPtr& array)
    {
        if (array->type_id() == arrow::Type::BOOL)
        {
            return AsArray(CallCompute("invert", {array}));
        }
        return AsArray(CallCompute("bit_wise_not", {array}));
    }

    ArrayPtr AbsArray(const ArrayPtr& array)
    {
        return AsArray(CallCompute("abs", {PromoteBoolean(arrow::Datum(array))}));
    }

    ArrayPtr RoundArray(const ArrayPtr& array, int64_t digits)
    {
        if (IsIntegerType(*array->type()) && digits >= 0)
        {
            return array;
        }
        cp::RoundOptions options(digits, cp::RoundMode::HALF_TO_EVEN);
        return AsArray(CallCompute("round", {CastArray(array, arrow::float64())}, &options));
    }

    ArrayPtr UnaryMath(const std::string& function, const ArrayPtr& array)
    {
        return AsArray(CallCompute(function, {CastArray(array, arrow::float64())}));
    }

    // ---- Missing values ----

    ArrayPtr MissingMask(const ArrayPtr& array)
    {
        cp::NullOptions options(/*nan_is_null=*/true);
        return AsArray(CallCompute("is_null", {array}, &options));
    }

    ArrayPtr PresentMask(const ArrayPtr& array)
    {
        return InvertArray(MissingMask(array));
    }

    ArrayPtr DropMissing(const ArrayPtr& array)
    {
        return FilterArray(array, PresentMask(array));
    }

    ArrayPtr FillMissing(const ArrayPtr& array, const Value& fill)
    {
        return AsArray(CallCompute("if_else", {MissingMask(array), ToDatum(fill), array}));
    }

    // ---- Reductions ----

    bool IsNumericReduction(const std::string& reduction)
    {
        return reduction == "sum" || reduction == "mean" || reduction == "median" || reduction == "std";
    }

    Value ReduceArray(const ArrayPtr& array, const std::string& reduction)
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        if (reduction == "size")
        {
            return Value{array->length()};
        }

        const ArrayPtr values = DropMissing(array);
        const bool empty = values->length() == 0;

        if (reduction == "count")
        {
            return Value{values->length()};
        }
        if (reduction == "sum")
        {
            cp::ScalarAggregateOptions options(/*skip_nulls=*/true, /*min_count=*/0);
            return CallComputeScalar("sum", {PromoteBoolean(arrow::Datum(values))}, &options);
        }
        if (reduction == "mean")
        {
            return empty ? Value{nan} : CallComputeScalar("mean", {PromoteBoolean(arrow::Datum(values))});
        }
        if (reduction == "min" || reduction == "max")
        {
            if (empty)
            {
                return Value{nan};
            }
            auto datum = CallCompute("min_max", {values});
            const auto& pair = static_cast<const arrow::StructScalar&>(*datum.scalar());
            return ScalarToValue(*pair.value[reduction == "min" ? 0 : 1]);
        }
        if (reduction == "median")
        {
            if (empty)
            {
                return Value{nan};
            }
            cp::QuantileOptions options(0.5, cp::QuantileOptions::LINEAR);
            auto quantile = CallComputeArray("quantile", {PromoteBoolean(arrow::Datum(values))}, &options);
            return ArrayElement(*quantile, 0);
        }
        if (reduction == "std")
        {
            cp::VarianceOptions options(/*ddof=*/1);
            return CallComputeScalar("stddev", {PromoteBoolean(arrow::Datum(values))}, &options);
        }
        if (reduction == "nunique")
        {
            cp::CountOptions options(cp::CountOptions::ONLY_VALID);
            return CallComputeScalar("count_distinct", {values}, &options);
        }
        if (reduction == "first" || reduction == "last")
        {
            if (empty)
            {
                return IsNumericType(*array->type()) ? Value{nan} : Value::None();
            }
            return ArrayElement(*values, reduction == "first" ? 0 : values->length() - 1);
        }
        if (reduction == "any" || reduction == "all")
        {
            auto booleans = CastArray(values, arrow::boolean());
            cp::ScalarAggregateOptions options(/*skip_nulls=*/true, /*min_count=*/0);
            Value result = CallComputeScalar(reduction, {booleans}, &options);
            return result.IsNone() ? Value{reduction == "all"} : result;
        }
        ThrowFault("AttributeError", std::format("unknown aggregation '{}'", reduction));
    }

    ArrayPtr SortIndices(const ArrayPtr& array, bool ascending)
    {
        cp::ArraySortOptions options(ascending ? cp::SortOrder::Ascending : cp::SortOrder::Descending,
                                     cp::NullPlacement::AtEnd);
        return CallComputeArray("array_sort_indices", {array}, &options);
    }

    ArrayPtr IsInArray(const ArrayPtr& array, const ValueList& candidates)
    {
        ArrayPtr valueSet = CastArray(ValuesToArray(candidates), array->type());
        cp::SetLookupOptions options(valueSet);
        return CallComputeArray("is_in", {array}, &options);
    }

    ArrayPtr CastToDtype(const ArrayPtr& array, const Value& dtype)
    {
        std::string name;
        if (dtype.IsString())
        {
            name = dtype.As<std::string>();
        }
        else if (auto* builtin = dtype.Object<BuiltinFunction>())
        {
            name = builtin->name;
        }
        else
        {
            ThrowTypeError(std::format("data type '{}' not understood", Str(dtype)));
        }

        auto type = DtypeFromName(name);
        if (array->type()->Equals(*type))
        {
            return array;
        }
        if (IsIntegerType(*type) && arrow::is_floating(array->type_id()))
        {
            if (Truthy(CallComputeScalar("any", {MissingMask(array)})))
            {
                ThrowValueError("Cannot convert non-finite values (NA or inf) to integer");
            }
        }
        cp::CastOptions options = cp::CastOptions::Safe(type);
        options.allow_float_truncate = true;
        return CallComputeArray("cast", {array}, &options);
    }

    // ---- Series ----

    SeriesData TakeSeries(const SeriesData& series, const ArrayPtr& indices)
    {
        return SeriesData{TakeIndices(series.values, indices), TakeIndices(series.labels, indices), series.name,
                          series.indexName};
    }

    SeriesData FilterSeries(const SeriesData& series, const ArrayPtr& mask)
    {
        return SeriesData{FilterArray(series.values, mask), FilterArray(series.labels, mask), series.name,
                          series.indexName};
    }

    SeriesData SliceSeries(const SeriesData& series, const SliceBounds& bounds)
    {
        if (bounds.step == 1)
        {
            const int64_t length = bounds.Count();
            return SeriesData{series.values->Slice(bounds.start, length), series.labels->Slice(bounds.start, length),
                              series.name, series.indexName};
        }
        return TakeSeries(series, TakeIndices(RangeLabels(series.Size()), bounds.Indices()));
    }

    SeriesData HeadSeries(const SeriesData& series, int64_t n)
    {
        return SliceSeries(series, ResolveSlice(SliceValue{std::nullopt, n, std::nullopt}, series.Size()));
    }

    SeriesData TailSeries(const SeriesData& series, int64_t n)
    {
        if (n == 0)
        {
            return HeadSeries(series, 0);
        }
        return SliceSeries(series, ResolveSlice(SliceValue{-n, std::nullopt, std::nullopt}, series.Size()));
    }

    SeriesData ValueCounts(const SeriesData& series)
    {
        auto counted = CallComputeArray("value_counts", {DropMissing(series.values)});
        const auto& pairs = static_cast<const arrow::StructArray&>(*counted);
        ArrayPtr values = pairs.field(0);
        ArrayPtr counts = pairs.field(1);

        auto order = SortIndices(counts, false);
        SeriesData result;
        result.values = TakeIndices(counts, order);
        result.labels = TakeIndices(values, order);
        result.name = "count";
        result.indexName = series.name.value_or("");
        return result;
    }

    int64_t LabelPosition(const ArrayPtr& labels, const Value& label)
    {
        for (int64_t i = 0; i < labels->length(); ++i)
        {
            if (!labels->IsNull(i) && ValuesEqual(ArrayElement(*labels, i), label))
            {
                return i;
            }
        }
        ThrowKeyError(Str(label));
    }

    // ---- Frames ----

    SeriesData ColumnSeries(const FrameData& frame, const std::string& column)
    {
        auto position = frame.FindColumn(column);
        if (!position)
        {
            ThrowKeyError(column);
        }
        return SeriesData{frame.arrays[*position], frame.labels, column, frame.indexName};
    }

    FrameData SelectColumns(const FrameData& frame, const std::vector<std::string>& columns)
    {
        FrameData result{{}, {}, frame.labels, frame.indexName};
        std::vector<std::string> missing;
        for (const auto& column : columns)
        {
            auto position = frame.FindColumn(column);
            if (!position)
            {
                missing.push_back("'" + column + "'");
                continue;
            }
            result.columns.push_back(column);
            result.arrays.push_back(frame.arrays[*position]);
        }
        if (!missing.empty())
        {
            std::string joined;
            for (size_t i = 0; i < missing.size(); ++i)
            {
                joined += (i ? ", " : "") + missing[i];
            }
            ThrowFault("KeyError", std::format("\"None of [{}] are in the columns\"", joined));
        }
        return result;
    }

    FrameData TakeRows(const FrameData& frame, const ArrayPtr& indices)
    {
        FrameData result{frame.columns, {}, TakeIndices(frame.labels, indices), frame.indexName};
        for (const auto& array : frame.arrays)
        {
            result.arrays.push_back(TakeIndices(array, indices));
        }
        return result;
    }

    FrameData FilterRows(const FrameData& frame, const ArrayPtr& mask)
    {
        FrameData result{frame.columns, {}, FilterArray(frame.labels, mask), frame.indexName};
        for (const auto& array : frame.arrays)
        {
            result.arrays.push_back(FilterArray(array, mask));
        }
        return result;
    }

    FrameData SliceRows(const FrameData& frame, const SliceBounds& bounds)
    {
        if (bounds.step != 1)
        {
            return TakeRows(frame, TakeIndices(RangeLabels(frame.NumRows()), bounds.Indices()));
        }
        const int64_t length = bounds.Count();
        FrameData result{frame.columns, {}, frame.labels->Slice(bounds.start, length), frame.indexName};
        for (const auto& array : frame.arrays)
        {
            result.arrays.push_back(array->Slice(bounds.start, length));
        }
        return result;
    }

    FrameData HeadRows(const FrameData& frame, int64_t n)
    {
        return SliceRows(frame, ResolveSlice(SliceValue{std::nullopt, n, std::nullopt}, frame.NumRows()));
    }

    FrameData TailRows(const FrameData& frame, int64_t n)
    {
        if (n == 0)
        {
            return HeadRows(frame, 0);
        }
        return SliceRows(frame, ResolveSlice(SliceValue{-n, std::nullopt, std::nullopt}, frame.NumRows()));
    }

    FrameData SortRows(const FrameData& frame, const std::vector<std::string>& by, const std::vector<bool>& ascending)
    {
        std::vector<cp::SortKey> keys;
        for (size_t i = 0; i < by.size(); ++i)
        {
            if (!frame.FindColumn(by[i]))
            {
                ThrowKeyError(by[i]);
            }
            const bool asc = ascending.size() == 1 ? ascending[0] : ascending.at(i);
            keys.emplace_back(arrow::FieldRef(by[i]), asc ? cp::SortOrder::Ascending : cp::SortOrder::Descending);
        }
        cp::SortOptions options(keys, cp::NullPlacement::AtEnd);
        auto indices = CallComputeArray("sort_indices", {arrow::Datum(ToRecordBatch(frame))}, &options);
        return TakeRows(frame, indices);
    }

    ArrayPtr ColumnFromValue(const FrameData& frame, const Value& value)
    {
        const int64_t rows = frame.NumRows();
        ArrayPtr array;
        if (auto* series = value.Object<SeriesObject>())
        {
            array = series->data.values;
        }
        else if (value.Object<ListObject>() || value.Object<TupleObject>() || value.Is<RangeValue>())
        {
            array = ValuesToArray(Materialize(value));
        }
        else
        {
            return BroadcastScalar(value, rows);
        }
        if (array->length() != rows)
        {
            ThrowValueError(std::format("Length of values ({}) does not match length of index ({})", array->length(),
                                        rows));
        }
        return array;
    }

    void SetColumn(FrameData& frame, const std::string& column, ArrayPtr values)
    {
        if (frame.columns.empty() && frame.NumRows() == 0)
        {
            frame.labels = RangeLabels(values->length());
        }
        if (auto position = frame.FindColumn(column))
        {
            frame.arrays[*position] = std::move(values);
            return;
        }
        frame.columns.push_back(column);
        frame.arrays.push_back(std::move(values));
    }

    ArrayPtr MaskFromValue(const Value& value, int64_t length)
    {
        ArrayPtr mask;
        if (auto* series = value.Object<SeriesObject>())
        {
            mask = series->data.values;
        }
        else
        {
            mask = ValuesToArray(Materialize(value));
        }
        if (mask->type_id() != arrow::Type::BOOL)
        {
            ThrowTypeError("boolean mask expected");
        }
        if (mask->length() != length)
        {
            ThrowValueError(std::format("Item wrong length {} instead of {}.", mask->length(), length));
        }
        return mask;
    }

    SeriesData ReduceColumns(const FrameData& frame, const std::string& reduction)
    {
        ValueList labels;
        ValueList results;
        for (size_t i = 0; i < frame.columns.size(); ++i)
        {
            const bool numeric = IsNumericType(*frame.arrays[i]->type()) || frame.arrays[i]->type_id() == arrow::Type::BOOL;
            if (!numeric && reduction != "count" && reduction != "nunique" && reduction != "size")
            {
                continue;
            }
            labels.emplace_back(frame.columns[i]);
            results.push_back(ReduceArray(frame.arrays[i], reduction));
        }
        SeriesData series;
        series.values = results.empty() ? MakeEmptyArray(arrow::float64()) : ValuesToArray(results);
        series.labels = labels.empty() ? MakeEmptyArray(arrow::utf8()) : ValuesToArray(labels);
        return series;
    }

    FrameData ResetIndex(const FrameData& frame, bool drop)
    {
        FrameData result{{}, {}, RangeLabels(frame.NumRows()), ""};
        if (!drop)
        {
            result.columns.push_back(frame.indexName.empty() ? "index" : frame.indexName);
            result.arrays.push_back(frame.labels);
        }
        result.columns.insert(result.columns.end(), frame.columns.begin(), frame.columns.end());
        result.arrays.insert(result.arrays.end(), frame.arrays.begin(), frame.arrays.end());
        return result;
    }

    // ---- Group by ----

    Groups GroupRows(const ArrayPtr& keys)
    {
        ArrayPtr distinct = DropMissing(CallComputeArray("unique", {keys}));
        Groups groups;
        groups.keys = TakeIndices(distinct, SortIndices(distinct, true));
        groups.rows.resize(static_cast<size_t>(groups.keys->length()));

        cp::SetLookupOptions options(groups.keys);
        auto positions = CastArray(CallComputeArray("index_in", {keys}, &options), arrow::int64());
        const auto& ids = static_cast<const arrow::Int64Array&>(*positions);
        for (int64_t row = 0; row < ids.length(); ++row)
        {
            if (ids.IsValid(row))
            {
                groups.rows[static_cast<size_t>(ids.Value(row))].push_back(row);
            }
        }
        return groups;
    }

    ArrayPtr AggregateGroups(const Groups& groups, const ArrayPtr& values, const std::string& reduction)
    {
        ValueList results;
        results.reserve(groups.rows.size());
        for (const auto& rows : groups.rows)
        {
            results.push_back(ReduceArray(TakeIndices(values, rows), reduction));
        }
        if (results.empty())
        {
            return MakeEmptyArray(reduction == "count" || reduction == "size" || reduction == "nunique"
                                      ? arrow::int64()
                                      : values->type());
        }
        return ValuesToArray(results);
    }

} // namespace nlytics::sandbox
