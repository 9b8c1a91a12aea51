//
// NLytics Series Methods
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
        const SeriesData& Series(const Value& self)
        {
            return self.Object<SeriesObject>()->data;
        }

        Value WithValues(const Value& self, ArrayPtr values)
        {
            SeriesData result = Series(self);
            result.values = std::move(values);
            return MakeSeries(std::move(result));
        }

        Value Reduce(const Value& self, const CallArgs& args, const char* reduction)
        {
            args.Expect(reduction, 0, {"skipna", "numeric_only", "axis"});
            return ReduceArray(Series(self).values, reduction);
        }

        Value Sum(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "sum"); }
        Value Mean(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "mean"); }
        Value Min(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "min"); }
        Value Max(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "max"); }
        Value Count(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "count"); }
        Value Median(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "median"); }
        Value Std(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "std"); }
        Value NUnique(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "nunique"); }
        Value Any(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "any"); }
        Value All(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "all"); }

        Value ExtremeLabel(const Value& self, const CallArgs& args, const char* function, bool largest)
        {
            args.Expect(function, 0, {"skipna"});
            const SeriesData& series = Series(self);
            if (DropMissing(series.values)->length() == 0)
            {
                ThrowValueError(std::format("attempt to get {} of an empty sequence", function));
            }
            auto order = SortIndices(series.values, !largest);
            return ArrayElement(*series.labels, ToInteger(ArrayElement(*order, 0)));
        }

        Value IdxMax(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            return ExtremeLabel(self, args, "idxmax", true);
        }

        Value IdxMin(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            return ExtremeLabel(self, args, "idxmin", false);
        }

        Value Unique(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("unique", 0);
            return MakeList(ArrayToValues(*CallComputeArray("unique", {Series(self).values})));
        }

        Value ValueCountsMethod(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("value_counts", 0, {"ascending", "normalize"});
            SeriesData counts = ValueCounts(Series(self));
            if (BoolArg(args, 99, "ascending", false))
            {
                counts = TakeSeries(counts, SortIndices(counts.values, true));
            }
            if (BoolArg(args, 99, "normalize", false))
            {
                const Value total = ReduceArray(counts.values, "sum");
                counts.values = ArithmeticArrays(BinOpType::Div, arrow::Datum(counts.values), ToDatum(total));
                counts.name = "proportion";
            }
            return MakeSeries(std::move(counts));
        }

        Value Abs(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("abs", 0);
            return WithValues(self, AbsArray(Series(self).values));
        }

        Value Round(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("round", 1, {"decimals"});
            return WithValues(self, RoundArray(Series(self).values, IntArg(args, 0, "decimals", 0)));
        }

        Value CumSum(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("cumsum", 0);
            const ArrayPtr values = Series(self).values;
            const ArrayPtr input = values->type_id() == arrow::Type::BOOL ? CastArray(values, arrow::int64()) : values;
            return WithValues(self, CallComputeArray("cumulative_sum", {input}));
        }

        Value Head(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("head", 1, {"n"});
            return MakeSeries(HeadSeries(Series(self), IntArg(args, 0, "n", 5)));
        }

        Value Tail(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("tail", 1, {"n"});
            return MakeSeries(TailSeries(Series(self), IntArg(args, 0, "n", 5)));
        }

        Value SortValuesMethod(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("sort_values", 0, {"ascending"});
            const bool ascending = BoolArg(args, 99, "ascending", true);
            return MakeSeries(TakeSeries(Series(self), SortIndices(Series(self).values, ascending)));
        }

        Value Extremes(const Value& self, const CallArgs& args, const char* function, bool largest)
        {
            args.Expect(function, 1, {"n"});
            const SeriesData present = FilterSeries(Series(self), PresentMask(Series(self).values));
            return MakeSeries(HeadSeries(TakeSeries(present, SortIndices(present.values, !largest)),
                                         IntArg(args, 0, "n", 5)));
        }

        Value NLargest(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            return Extremes(self, args, "nlargest", true);
        }

        Value NSmallest(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            return Extremes(self, args, "nsmallest", false);
        }

        Value IsIn(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("isin", 1, {"values"});
            const ValueList candidates = Materialize(args.Require(0, "values", "isin"));
            if (candidates.empty())
            {
                return WithValues(self, BroadcastScalar(Value{false}, Series(self).Size()));
            }
            return WithValues(self, IsInArray(Series(self).values, candidates));
        }

        Value Between(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("between", 3, {"left", "right", "inclusive"});
            const Value& left = args.Require(0, "left", "between");
            const Value& right = args.Require(1, "right", "between");
            const Value inclusiveValue = args.Get(2, "inclusive", Value{"both"});
            const std::string inclusive = inclusiveValue.IsString() ? inclusiveValue.As<std::string>() : "both";
            if (inclusive != "both" && inclusive != "neither" && inclusive != "left" && inclusive != "right")
            {
                ThrowValueError("Inclusive has to be either string of 'both', 'left', 'right', or 'neither'.");
            }
            const arrow::Datum values(Series(self).values);
            const bool leftClosed = inclusive == "both" || inclusive == "left";
            const bool rightClosed = inclusive == "both" || inclusive == "right";
            auto lower = CompareArrays(leftClosed ? CmpOpType::GtE : CmpOpType::Gt, values, ToDatum(left));
            auto upper = CompareArrays(rightClosed ? CmpOpType::LtE : CmpOpType::Lt, values, ToDatum(right));
            return WithValues(self, CallComputeArray("and", {lower, upper}));
        }

        Value IsNa(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("isna", 0);
            return WithValues(self, MissingMask(Series(self).values));
        }

        Value NotNa(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("notna", 0);
            return WithValues(self, PresentMask(Series(self).values));
        }

        Value DropNa(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("dropna", 0);
            return MakeSeries(FilterSeries(Series(self), PresentMask(Series(self).values)));
        }

        Value FillNa(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("fillna", 1, {"value"});
            return WithValues(self, FillMissing(Series(self).values, args.Require(0, "value", "fillna")));
        }

        Value AsType(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("astype", 1, {"dtype"});
            return WithValues(self, CastToDtype(Series(self).values, args.Require(0, "dtype", "astype")));
        }

        Value ToList(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("tolist", 0);
            return MakeList(ArrayToValues(*Series(self).values));
        }

        Value ToDict(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("to_dict", 0);
            const ValueList labels = ArrayToValues(*Series(self).labels);
            const ValueList values = ArrayToValues(*Series(self).values);
            Value result = MakeDict();
            for (size_t i = 0; i < labels.size(); ++i)
            {
                result.Object<DictObject>()->Set(labels[i], values[i]);
            }
            return result;
        }

        Value ResetIndexMethod(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("reset_index", 0, {"drop", "name"});
            const SeriesData& series = Series(self);
            if (BoolArg(args, 99, "drop", false))
            {
                return MakeSeries(SeriesData{series.values, RangeLabels(series.Size()), series.name, ""});
            }
            const Value nameArg = args.Get(99, "name", Value::None());
            FrameData frame{{}, {}, series.labels, series.indexName};
            frame.columns.push_back(nameArg.IsNone() ? series.name.value_or("0") : Str(nameArg));
            frame.arrays.push_back(series.values);
            return MakeFrame(ResetIndex(frame, false));
        }

        Value Copy(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("copy", 1, {"deep"});
            return MakeSeries(Series(self));
        }

        const MethodTable& SeriesMethods()
        {
            static const MethodTable table{
                {"sum", Sum},
                {"mean", Mean},
                {"min", Min},
                {"max", Max},
                {"count", Count},
                {"median", Median},
                {"std", Std},
                {"nunique", NUnique},
                {"any", Any},
                {"all", All},
                {"idxmax", IdxMax},
                {"idxmin", IdxMin},
                {"unique", Unique},
                {"value_counts", ValueCountsMethod},
                {"abs", Abs},
                {"round", Round},
                {"cumsum", CumSum},
                {"head", Head},
                {"tail", Tail},
                {"sort_values", SortValuesMethod},
                {"nlargest", NLargest},
                {"nsmallest", NSmallest},
                {"isin", IsIn},
                {"between", Between},
                {"isna", IsNa},
                {"isnull", IsNa},
                {"notna", NotNa},
                {"notnull", NotNa},
                {"dropna", DropNa},
                {"fillna", FillNa},
                {"astype", AsType},
                {"tolist", ToList},
                {"to_list", ToList},
                {"to_dict", ToDict},
                {"reset_index", ResetIndexMethod},
                {"copy", Copy},
            };
            return table;
        }
    } // namespace

    Value SeriesAttribute(const Value& self, const std::string& name)
    {
        const SeriesData& series = Series(self);
        if (name == "values")
        {
            return MakeList(ArrayToValues(*series.values));
        }
        if (name == "index")
        {
            return MakeList(ArrayToValues(*series.labels));
        }
        if (name == "shape")
        {
            return MakeTuple({Value{series.Size()}});
        }
        if (name == "size")
        {
            return Value{series.Size()};
        }
        if (name == "empty")
        {
            return Value{series.Size() == 0};
        }
        if (name == "name")
        {
            return series.name ? Value{*series.name} : Value::None();
        }
        if (name == "dtype")
        {
            return Value{DtypeName(*series.values->type())};
        }
        if (name == "loc" || name == "iloc")
        {
            return Value{std::make_shared<IndexerObject>(IndexerObject{name == "iloc", self})};
        }
        if (auto method = LookupMethod(SeriesMethods(), self, name))
        {
            return *method;
        }
        ThrowNoAttribute(self, name);
    }

    Value SeriesGetItem(const Value& self, const Value& key)
    {
        const SeriesData& series = Series(self);
        if (auto* slice = key.TryAs<SliceValue>())
        {
            return MakeSeries(SliceSeries(series, ResolveSlice(*slice, series.Size())));
        }
        if (key.Object<SeriesObject>())
        {
            return MakeSeries(FilterSeries(series, MaskFromValue(key, series.Size())));
        }
        if (key.Object<ListObject>())
        {
            const ValueList items = Materialize(key);
            if (!items.empty() && items.front().Is<bool>())
            {
                return MakeSeries(FilterSeries(series, MaskFromValue(key, series.Size())));
            }
            std::vector<int64_t> positions;
            for (const auto& label : items)
            {
                positions.push_back(LabelPosition(series.labels, label));
            }
            return MakeSeries(TakeSeries(series, TakeIndices(RangeLabels(series.Size()), positions)));
        }
        return ArrayElement(*series.values, LabelPosition(series.labels, key));
    }

} // namespace nlytics::sandbox
