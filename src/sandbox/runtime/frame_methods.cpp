//
// NLytics DataFrame Methods
//

#include "arrow_bridge.h"
#include "call_args.h"
#include "frame_ops.h"
#include "object_model.h"
#include "sandbox_error.h"
#include <format>

namespace nlytics::sandbox
{
    namespace
    {
        const FrameData& Frame(const Value& self)
        {
            return self.Object<FrameObject>()->data;
        }

        std::vector<bool> AscendingArg(const CallArgs& args, size_t pos)
        {
            const Value ascending = args.Get(pos, "ascending", Value{true});
            if (ascending.Object<ListObject>() || ascending.Object<TupleObject>())
            {
                std::vector<bool> flags;
                for (const auto& flag : Materialize(ascending))
                {
                    flags.push_back(Truthy(flag));
                }
                return flags;
            }
            return {Truthy(ascending)};
        }

        Value Head(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("head", 1, {"n"});
            return MakeFrame(HeadRows(Frame(self), IntArg(args, 0, "n", 5)));
        }

        Value Tail(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("tail", 1, {"n"});
            return MakeFrame(TailRows(Frame(self), IntArg(args, 0, "n", 5)));
        }

        Value SortValues(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("sort_values", 2, {"by", "ascending"});
            const auto by = NameListArg(args.Require(0, "by", "sort_values"), "sort_values");
            const auto ascending = AscendingArg(args, 1);
            if (ascending.size() != 1 && ascending.size() != by.size())
            {
                ThrowValueError(std::format("Length of ascending ({}) != length of by ({})", ascending.size(), by.size()));
            }
            return MakeFrame(SortRows(Frame(self), by, ascending));
        }

        Value Extremes(const Value& self, const CallArgs& args, const char* function, bool largest)
        {
            args.Expect(function, 2, {"n", "columns"});
            const int64_t n = ToInteger(args.Require(0, "n", function));
            const auto columns = NameListArg(args.Require(1, "columns", function), function);
            return MakeFrame(HeadRows(SortRows(Frame(self), columns, {!largest}), n));
        }

        Value NLargest(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            return Extremes(self, args, "nlargest", true);
        }

        Value NSmallest(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            return Extremes(self, args, "nsmallest", false);
        }

        Value GroupBy(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("groupby", 1, {"by", "as_index", "sort", "dropna"});
            const auto keys = NameListArg(args.Require(0, "by", "groupby"), "groupby");
            if (keys.size() != 1)
            {
                ThrowValueError("grouping by more than one column is not supported");
            }
            if (!Frame(self).FindColumn(keys.front()))
            {
                ThrowKeyError(keys.front());
            }
            return Value{std::make_shared<GroupByObject>(GroupByObject{Frame(self), keys.front(), {}, false})};
        }

        Value Reduce(const Value& self, const CallArgs& args, const char* reduction)
        {
            args.Expect(reduction, 0, {"numeric_only", "skipna", "axis"});
            SeriesData result = ReduceColumns(Frame(self), reduction);
            return MakeSeries(std::move(result));
        }

        Value Sum(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "sum"); }
        Value Mean(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "mean"); }
        Value Min(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "min"); }
        Value Max(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "max"); }
        Value Count(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "count"); }
        Value Median(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "median"); }
        Value Std(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "std"); }
        Value NUnique(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "nunique"); }

        Value DropNa(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("dropna", 0, {"subset", "how"});
            const FrameData& frame = Frame(self);
            const Value subset = args.Get(99, "subset", Value::None());
            const std::vector<std::string> columns = subset.IsNone() ? frame.columns : NameListArg(subset, "dropna");
            const Value how = args.Get(99, "how", Value{"any"});
            const bool all = how.IsString() && how.As<std::string>() == "all";

            ArrayPtr keep = BroadcastScalar(Value{true}, frame.NumRows());
            if (all)
            {
                keep = BroadcastScalar(Value{false}, frame.NumRows());
            }
            for (const auto& column : columns)
            {
                const ArrayPtr present = PresentMask(ColumnSeries(frame, column).values);
                keep = CallComputeArray(all ? "or" : "and", {keep, present});
            }
            return MakeFrame(FilterRows(frame, keep));
        }

        Value FillNa(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("fillna", 1, {"value"});
            const Value& fill = args.Require(0, "value", "fillna");
            FrameData result = Frame(self);
            if (auto* perColumn = fill.Object<DictObject>())
            {
                for (const auto& [key, value] : perColumn->entries)
                {
                    if (auto position = result.FindColumn(Str(key)))
                    {
                        result.arrays[*position] = FillMissing(result.arrays[*position], value);
                    }
                }
                return MakeFrame(std::move(result));
            }
            for (auto& array : result.arrays)
            {
                // pandas leaves columns the fill value cannot be stored in untouched
                const bool textFill = fill.IsString();
                const bool textColumn = !IsNumericType(*array->type()) && array->type_id() != arrow::Type::BOOL;
                if (textFill == textColumn)
                {
                    array = FillMissing(array, fill);
                }
            }
            return MakeFrame(std::move(result));
        }

        Value Copy(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("copy", 1, {"deep"});
            return MakeFrame(Frame(self));
        }

        Value ResetIndexMethod(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("reset_index", 0, {"drop"});
            return MakeFrame(ResetIndex(Frame(self), BoolArg(args, 99, "drop", false)));
        }

        Value ToDict(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("to_dict", 1, {"orient"});
            const Value orientValue = args.Get(0, "orient", Value{"dict"});
            const std::string orient = orientValue.IsString() ? orientValue.As<std::string>() : "dict";
            const FrameData& frame = Frame(self);
            const ValueList labels = ArrayToValues(*frame.labels);

            std::vector<ValueList> columns;
            for (const auto& array : frame.arrays)
            {
                columns.push_back(ArrayToValues(*array));
            }

            if (orient == "records" || orient == "index")
            {
                ValueList records;
                Value byLabel = MakeDict();
                for (size_t row = 0; row < labels.size(); ++row)
                {
                    Value record = MakeDict();
                    for (size_t c = 0; c < frame.columns.size(); ++c)
                    {
                        record.Object<DictObject>()->Set(Value{frame.columns[c]}, columns[c][row]);
                    }
                    records.push_back(record);
                    byLabel.Object<DictObject>()->Set(labels[row], record);
                }
                return orient == "records" ? MakeList(std::move(records)) : byLabel;
            }

            Value result = MakeDict();
            for (size_t c = 0; c < frame.columns.size(); ++c)
            {
                if (orient == "list")
                {
                    result.Object<DictObject>()->Set(Value{frame.columns[c]}, MakeList(columns[c]));
                    continue;
                }
                if (orient != "dict")
                {
                    ThrowValueError(std::format("orient '{}' not understood", orient));
                }
                Value inner = MakeDict();
                for (size_t row = 0; row < labels.size(); ++row)
                {
                    inner.Object<DictObject>()->Set(labels[row], columns[c][row]);
                }
                result.Object<DictObject>()->Set(Value{frame.columns[c]}, inner);
            }
            return result;
        }

        const MethodTable& FrameMethods()
        {
            static const MethodTable table{
                {"head", Head},
                {"tail", Tail},
                {"sort_values", SortValues},
                {"nlargest", NLargest},
                {"nsmallest", NSmallest},
                {"groupby", GroupBy},
                {"sum", Sum},
                {"mean", Mean},
                {"min", Min},
                {"max", Max},
                {"count", Count},
                {"median", Median},
                {"std", Std},
                {"nunique", NUnique},
                {"dropna", DropNa},
                {"fillna", FillNa},
                {"copy", Copy},
                {"reset_index", ResetIndexMethod},
                {"to_dict", ToDict},
            };
            return table;
        }
    } // namespace

    Value FrameAttribute(const Value& self, const std::string& name)
    {
        const FrameData& frame = Frame(self);
        if (name == "columns")
        {
            return MakeList(ValueList(frame.columns.begin(), frame.columns.end()));
        }
        if (name == "shape")
        {
            return MakeTuple({Value{frame.NumRows()}, Value{static_cast<int64_t>(frame.columns.size())}});
        }
        if (name == "empty")
        {
            return Value{frame.NumRows() == 0 || frame.columns.empty()};
        }
        if (name == "index")
        {
            return MakeList(ArrayToValues(*frame.labels));
        }
        if (name == "loc" || name == "iloc")
        {
            return Value{std::make_shared<IndexerObject>(IndexerObject{name == "iloc", self})};
        }
        if (auto method = LookupMethod(FrameMethods(), self, name))
        {
            return *method;
        }
        // Column access by attribute, as pandas allows
        if (frame.FindColumn(name))
        {
            return MakeSeries(ColumnSeries(frame, name));
        }
        ThrowNoAttribute(self, name);
    }

    Value FrameGetItem(const Value& self, const Value& key)
    {
        const FrameData& frame = Frame(self);
        if (key.IsString())
        {
            return MakeSeries(ColumnSeries(frame, key.As<std::string>()));
        }
        if (auto* slice = key.TryAs<SliceValue>())
        {
            return MakeFrame(SliceRows(frame, ResolveSlice(*slice, frame.NumRows())));
        }
        if (key.Object<SeriesObject>())
        {
            return MakeFrame(FilterRows(frame, MaskFromValue(key, frame.NumRows())));
        }
        if (key.Object<ListObject>())
        {
            const ValueList items = Materialize(key);
            if (!items.empty() && items.front().Is<bool>())
            {
                return MakeFrame(FilterRows(frame, MaskFromValue(key, frame.NumRows())));
            }
            return MakeFrame(SelectColumns(frame, NameListArg(key, "__getitem__")));
        }
        ThrowKeyError(Str(key));
    }

    void FrameSetItem(const Value& self, const Value& key, const Value& value)
    {
        if (!key.IsString())
        {
            ThrowTypeError(std::format("column assignment expects a column name, not {}", TypeName(key)));
        }
        FrameData& frame = self.Object<FrameObject>()->data;
        SetColumn(frame, key.As<std::string>(), ColumnFromValue(frame, value));
    }

    Value FrameRow(const FrameData& frame, int64_t position)
    {
        ValueList cells;
        bool numeric = true;
        for (const auto& array : frame.arrays)
        {
            cells.push_back(ArrayElement(*array, position));
            numeric = numeric && (cells.back().IsNumber() || cells.back().IsNone());
        }
        if (!numeric)
        {
            for (auto& cell : cells)
            {
                cell = cell.IsNone() ? cell : Value{Str(cell)};
            }
        }
        SeriesData row;
        row.values = cells.empty() ? MakeEmptyArray(arrow::float64()) : ValuesToArray(cells);
        row.labels = frame.columns.empty() ? MakeEmptyArray(arrow::utf8())
                                           : ValuesToArray(ValueList(frame.columns.begin(), frame.columns.end()));
        row.name = CellText(*frame.labels, position);
        return MakeSeries(std::move(row));
    }

} // namespace nlytics::sandbox
