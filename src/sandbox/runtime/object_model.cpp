//
// NLytics Object Model
//
// Method binding plus the loc / iloc indexers. iloc addresses rows by
// position, loc by label; label slices include their stop label.
//

#include "object_model.h"
#include "arrow_bridge.h"
#include "frame_ops.h"
#include "sandbox_error.h"
#include <format>

namespace nlytics::sandbox
{
    Value BindMethod(const Value& self, const std::string& name, NativeMethod fn)
    {
        return Value{std::make_shared<BoundMethod>(BoundMethod{self, name, fn})};
    }

    std::optional<Value> LookupMethod(const MethodTable& table, const Value& self, const std::string& name)
    {
        auto it = table.find(name);
        if (it == table.end())
        {
            return std::nullopt;
        }
        return BindMethod(self, name, it->second);
    }

    void ThrowNoAttribute(const Value& self, const std::string& name)
    {
        ThrowFault("AttributeError", std::format("'{}' object has no attribute '{}'", TypeName(self), name));
    }

    namespace
    {
        const IndexerObject& Indexer(const Value& self)
        {
            return *self.Object<IndexerObject>();
        }

        bool IsBooleanList(const Value& key)
        {
            if (!key.Object<ListObject>())
            {
                return false;
            }
            const ValueList items = Materialize(key);
            return !items.empty() && items.front().Is<bool>();
        }

        // Row positions selected by a loc / iloc row key; nullopt for a scalar key
        struct RowSelection
        {
            std::optional<std::vector<int64_t>> positions;
            int64_t scalar{-1};
        };

        std::vector<int64_t> MaskPositions(const ArrayPtr& mask)
        {
            std::vector<int64_t> positions;
            const auto& booleans = static_cast<const arrow::BooleanArray&>(*mask);
            for (int64_t i = 0; i < booleans.length(); ++i)
            {
                if (booleans.IsValid(i) && booleans.Value(i))
                {
                    positions.push_back(i);
                }
            }
            return positions;
        }

        RowSelection SelectRows(const Value& key, const ArrayPtr& labels, bool positional)
        {
            const int64_t length = labels->length();
            if (auto* slice = key.TryAs<SliceValue>())
            {
                if (positional)
                {
                    return {ResolveSlice(*slice, length).Indices(), -1};
                }
                if (slice->step && *slice->step != 1)
                {
                    ThrowValueError("label slices support a step of 1 only");
                }
                // bounds are labels here, stored as integers by the slice builder
                const int64_t start = slice->start ? LabelPosition(labels, Value{*slice->start}) : 0;
                const int64_t stop = slice->stop ? LabelPosition(labels, Value{*slice->stop}) : length - 1;
                std::vector<int64_t> positions;
                for (int64_t i = start; i <= stop; ++i)
                {
                    positions.push_back(i);
                }
                return {positions, -1};
            }
            if (key.Object<SeriesObject>() || IsBooleanList(key))
            {
                return {MaskPositions(MaskFromValue(key, length)), -1};
            }
            if (key.Object<ListObject>() || key.Object<TupleObject>() || key.Is<RangeValue>())
            {
                std::vector<int64_t> positions;
                for (const auto& item : Materialize(key))
                {
                    positions.push_back(positional ? ResolveIndex(ToInteger(item), length, "positional")
                                                   : LabelPosition(labels, item));
                }
                return {positions, -1};
            }
            if (positional)
            {
                return {std::nullopt, ResolveIndex(ToInteger(key), length, "single positional")};
            }
            return {std::nullopt, LabelPosition(labels, key)};
        }

        std::vector<std::string> SelectColumnNames(const FrameData& frame, const Value& key, bool positional)
        {
            if (key.Is<SliceValue>())
            {
                const auto bounds = ResolveSlice(key.As<SliceValue>(), static_cast<int64_t>(frame.columns.size()));
                std::vector<std::string> names;
                for (auto i : bounds.Indices())
                {
                    names.push_back(frame.columns[i]);
                }
                return names;
            }
            if (!positional)
            {
                return NameListArg(key, "loc");
            }
            std::vector<std::string> names;
            const int64_t width = static_cast<int64_t>(frame.columns.size());
            if (key.Object<ListObject>() || key.Object<TupleObject>())
            {
                for (const auto& item : Materialize(key))
                {
                    names.push_back(frame.columns[ResolveIndex(ToInteger(item), width, "positional")]);
                }
                return names;
            }
            return {frame.columns[ResolveIndex(ToInteger(key), width, "single positional")]};
        }

        bool SelectsSingleColumn(const Value& key)
        {
            return key.IsString() || key.Is<int64_t>();
        }

        Value FrameIndexerGet(const FrameData& frame, const Value& key, bool positional)
        {
            Value rowKey = key;
            std::optional<Value> columnKey;
            if (auto* tuple = key.Object<TupleObject>())
            {
                if (tuple->items.size() != 2)
                {
                    ThrowFault("IndexError", "Too many indexers");
                }
                rowKey = tuple->items[0];
                columnKey = tuple->items[1];
            }

            const RowSelection rows = SelectRows(rowKey, frame.labels, positional);
            if (!columnKey)
            {
                if (!rows.positions)
                {
                    return FrameRow(frame, rows.scalar);
                }
                return MakeFrame(TakeRows(frame, TakeIndices(RangeLabels(frame.NumRows()), *rows.positions)));
            }

            const auto names = SelectColumnNames(frame, *columnKey, positional);
            if (SelectsSingleColumn(*columnKey))
            {
                const SeriesData column = ColumnSeries(frame, names.front());
                if (!rows.positions)
                {
                    return ArrayElement(*column.values, rows.scalar);
                }
                return MakeSeries(TakeSeries(column, TakeIndices(RangeLabels(frame.NumRows()), *rows.positions)));
            }

            const FrameData selected = SelectColumns(frame, names);
            if (!rows.positions)
            {
                return FrameRow(selected, rows.scalar);
            }
            return MakeFrame(TakeRows(selected, TakeIndices(RangeLabels(frame.NumRows()), *rows.positions)));
        }

        Value SeriesIndexerGet(const SeriesData& series, const Value& key, bool positional)
        {
            const RowSelection rows = SelectRows(key, series.labels, positional);
            if (!rows.positions)
            {
                return ArrayElement(*series.values, rows.scalar);
            }
            return MakeSeries(TakeSeries(series, TakeIndices(RangeLabels(series.Size()), *rows.positions)));
        }

        ArrayPtr PositionMask(const std::vector<int64_t>& positions, int64_t length)
        {
            std::vector<bool> flags(static_cast<size_t>(length), false);
            for (auto position : positions)
            {
                flags[static_cast<size_t>(position)] = true;
            }
            arrow::BooleanBuilder builder;
            CheckStatus(builder.AppendValues(flags), "loc assignment");
            return Unwrap(builder.Finish(), "loc assignment");
        }

        // Writes `replacement` into the rows flagged by `mask`, keeping other rows of `existing`
        ArrayPtr MergeRows(const ArrayPtr& mask, ArrayPtr replacement, ArrayPtr existing)
        {
            if (!existing)
            {
                existing = Unwrap(arrow::MakeArrayOfNull(replacement->type(), mask->length()), "loc assignment");
            }
            if (!replacement->type()->Equals(*existing->type()))
            {
                const bool numeric = (IsNumericType(*replacement->type()) || replacement->type_id() == arrow::Type::BOOL) &&
                                     (IsNumericType(*existing->type()) || existing->type_id() == arrow::Type::BOOL);
                const bool nullColumn = existing->null_count() == existing->length();
                if (nullColumn)
                {
                    existing = CastArray(existing, replacement->type());
                }
                else if (numeric)
                {
                    replacement = CastArray(replacement, arrow::float64());
                    existing = CastArray(existing, arrow::float64());
                }
                else
                {
                    ThrowTypeError(std::format("cannot assign {} values into a {} column",
                                               DtypeName(*replacement->type()), DtypeName(*existing->type())));
                }
            }
            return CallComputeArray("if_else", {mask, replacement, existing});
        }
    } // namespace

    Value IndexerGetItem(const Value& self, const Value& key)
    {
        const IndexerObject& indexer = Indexer(self);
        if (auto* frame = indexer.target.Object<FrameObject>())
        {
            return FrameIndexerGet(frame->data, key, indexer.positional);
        }
        return SeriesIndexerGet(indexer.target.Object<SeriesObject>()->data, key, indexer.positional);
    }

    void IndexerSetItem(const Value& self, const Value& key, const Value& value)
    {
        const IndexerObject& indexer = Indexer(self);
        if (auto* series = indexer.target.Object<SeriesObject>())
        {
            SeriesData& data = series->data;
            const RowSelection rows = SelectRows(key, data.labels, indexer.positional);
            const auto positions = rows.positions ? *rows.positions : std::vector<int64_t>{rows.scalar};
            const ArrayPtr mask = PositionMask(positions, data.Size());
            data.values = MergeRows(mask, BroadcastScalar(value, data.Size()), data.values);
            return;
        }

        FrameData& frame = indexer.target.Object<FrameObject>()->data;
        auto* tuple = key.Object<TupleObject>();
        if (!tuple || tuple->items.size() != 2)
        {
            ThrowTypeError("row assignment needs a column: use frame.loc[rows, 'column'] = value");
        }
        const RowSelection rows = SelectRows(tuple->items[0], frame.labels, indexer.positional);
        const auto positions = rows.positions ? *rows.positions : std::vector<int64_t>{rows.scalar};
        const ArrayPtr mask = PositionMask(positions, frame.NumRows());

        std::vector<std::string> names;
        if (!indexer.positional && tuple->items[1].IsString())
        {
            // loc may create a new column
            names.push_back(tuple->items[1].As<std::string>());
        }
        else
        {
            names = SelectColumnNames(frame, tuple->items[1], indexer.positional);
        }

        const ArrayPtr replacement = ColumnFromValue(frame, value);
        for (const auto& name : names)
        {
            auto position = frame.FindColumn(name);
            ArrayPtr existing = position ? frame.arrays[*position] : nullptr;
            SetColumn(frame, name, MergeRows(mask, replacement, existing));
        }
    }

} // namespace nlytics::sandbox
