//
// NLytics GroupBy Methods
//
// Single-key group-by. Groups are ordered by key and missing keys are
// dropped, matching pandas' defaults.
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
        const GroupByObject& Grouped(const Value& self)
        {
            return *self.Object<GroupByObject>();
        }

        std::vector<std::string> AggregatedColumns(const GroupByObject& grouped, const std::string& reduction)
        {
            if (!grouped.selection.empty())
            {
                return grouped.selection;
            }
            std::vector<std::string> columns;
            for (size_t i = 0; i < grouped.frame.columns.size(); ++i)
            {
                if (grouped.frame.columns[i] == grouped.key)
                {
                    continue;
                }
                const auto& type = *grouped.frame.arrays[i]->type();
                if (IsNumericReduction(reduction) && !IsNumericType(type) && type.id() != arrow::Type::BOOL)
                {
                    continue;
                }
                columns.push_back(grouped.frame.columns[i]);
            }
            return columns;
        }

        Value Aggregate(const GroupByObject& grouped, const std::string& reduction)
        {
            const FrameData& frame = grouped.frame;
            const Groups groups = GroupRows(ColumnSeries(frame, grouped.key).values);

            if (reduction == "size")
            {
                ValueList sizes;
                for (const auto& rows : groups.rows)
                {
                    sizes.emplace_back(static_cast<int64_t>(rows.size()));
                }
                SeriesData result;
                result.values = sizes.empty() ? MakeEmptyArray(arrow::int64()) : ValuesToArray(sizes);
                result.labels = groups.keys;
                result.indexName = grouped.key;
                if (grouped.selectsSeries)
                {
                    result.name = grouped.selection.front();
                }
                return MakeSeries(std::move(result));
            }

            if (grouped.selectsSeries)
            {
                const std::string& column = grouped.selection.front();
                SeriesData result;
                result.values = AggregateGroups(groups, ColumnSeries(frame, column).values, reduction);
                result.labels = groups.keys;
                result.name = column;
                result.indexName = grouped.key;
                return MakeSeries(std::move(result));
            }

            FrameData result{{}, {}, groups.keys, grouped.key};
            for (const auto& column : AggregatedColumns(grouped, reduction))
            {
                result.columns.push_back(column);
                result.arrays.push_back(AggregateGroups(groups, ColumnSeries(frame, column).values, reduction));
            }
            return MakeFrame(std::move(result));
        }

        std::string ReductionName(const Value& func)
        {
            if (func.IsString())
            {
                return func.As<std::string>();
            }
            if (auto* builtin = func.Object<BuiltinFunction>())
            {
                // sum, min, max, len and numpy reductions passed by reference
                const std::string& name = builtin->name;
                const std::string shortName = name.substr(name.rfind('.') == std::string::npos ? 0 : name.rfind('.') + 1);
                return shortName == "len" ? "size" : shortName;
            }
            ThrowTypeError(std::format("aggregation function must be a name, not {}", TypeName(func)));
        }

        bool KnownReduction(const std::string& name)
        {
            static const std::vector<std::string> known{"sum",   "mean",  "min",   "max",     "count",
                                                        "median", "std", "first", "last", "size", "nunique"};
            return std::ranges::find(known, name) != known.end();
        }

        Value AggregateByName(const GroupByObject& grouped, const std::string& reduction)
        {
            if (!KnownReduction(reduction))
            {
                ThrowFault("AttributeError", std::format("'{}' is not a valid function for 'DataFrameGroupBy' object",
                                                         reduction));
            }
            return Aggregate(grouped, reduction);
        }

        Value Agg(ExecutionContext&, const Value& self, const CallArgs& args)
        {
            args.Expect("agg", 1, {"func"});
            const GroupByObject& grouped = Grouped(self);
            const Value& func = args.Require(0, "func", "agg");

            if (auto* spec = func.Object<DictObject>())
            {
                const Groups groups = GroupRows(ColumnSeries(grouped.frame, grouped.key).values);
                FrameData result{{}, {}, groups.keys, grouped.key};
                for (const auto& [column, reduction] : spec->entries)
                {
                    const std::string name = ReductionName(reduction);
                    if (!KnownReduction(name))
                    {
                        ThrowFault("AttributeError", std::format("'{}' is not a valid aggregation", name));
                    }
                    result.columns.push_back(Str(column));
                    result.arrays.push_back(
                        AggregateGroups(groups, ColumnSeries(grouped.frame, Str(column)).values, name));
                }
                return MakeFrame(std::move(result));
            }

            if (func.Object<ListObject>() && grouped.selectsSeries)
            {
                const Groups groups = GroupRows(ColumnSeries(grouped.frame, grouped.key).values);
                const ArrayPtr values = ColumnSeries(grouped.frame, grouped.selection.front()).values;
                FrameData result{{}, {}, groups.keys, grouped.key};
                for (const auto& item : Materialize(func))
                {
                    const std::string name = ReductionName(item);
                    if (!KnownReduction(name))
                    {
                        ThrowFault("AttributeError", std::format("'{}' is not a valid aggregation", name));
                    }
                    result.columns.push_back(name);
                    result.arrays.push_back(AggregateGroups(groups, values, name));
                }
                return MakeFrame(std::move(result));
            }

            return AggregateByName(grouped, ReductionName(func));
        }

        Value Reduce(const Value& self, const CallArgs& args, const char* reduction)
        {
            args.Expect(reduction, 0, {"numeric_only"});
            return Aggregate(Grouped(self), reduction);
        }

        Value Sum(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "sum"); }
        Value Mean(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "mean"); }
        Value Min(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "min"); }
        Value Max(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "max"); }
        Value Count(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "count"); }
        Value Median(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "median"); }
        Value Std(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "std"); }
        Value NUnique(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "nunique"); }
        Value First(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "first"); }
        Value Last(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "last"); }
        Value Size(ExecutionContext&, const Value& self, const CallArgs& args) { return Reduce(self, args, "size"); }

        const MethodTable& GroupByMethods()
        {
            static const MethodTable table{
                {"sum", Sum},       {"mean", Mean},       {"min", Min},         {"max", Max},
                {"count", Count},   {"median", Median},   {"std", Std},         {"nunique", NUnique},
                {"first", First},   {"last", Last},       {"size", Size},       {"agg", Agg},
                {"aggregate", Agg},
            };
            return table;
        }
    } // namespace

    Value GroupByAttribute(const Value& self, const std::string& name)
    {
        if (auto method = LookupMethod(GroupByMethods(), self, name))
        {
            return *method;
        }
        const GroupByObject& grouped = Grouped(self);
        if (grouped.frame.FindColumn(name) && name != grouped.key)
        {
            return GroupByGetItem(self, Value{name});
        }
        ThrowNoAttribute(self, name);
    }

    Value GroupByGetItem(const Value& self, const Value& key)
    {
        const GroupByObject& grouped = Grouped(self);
        GroupByObject selected{grouped.frame, grouped.key, {}, key.IsString()};
        selected.selection = NameListArg(key, "__getitem__");
        for (const auto& column : selected.selection)
        {
            if (!grouped.frame.FindColumn(column))
            {
                ThrowFault("KeyError", std::format("'Column not found: {}'", column));
            }
        }
        return Value{std::make_shared<GroupByObject>(std::move(selected))};
    }

} // namespace nlytics::sandbox
