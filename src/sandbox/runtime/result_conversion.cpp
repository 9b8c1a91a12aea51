//
// NLytics Result Conversion Implementation
//

#include "result_conversion.h"
#include "arrow_bridge.h"
#include "sandbox_error.h"
#include <algorithm>
#include <format>

namespace nlytics::sandbox
{
    namespace
    {
        // Column name for the row labels that collides with no data column
        std::string LabelColumnName(const std::string& indexName, const std::vector<std::string>& columns)
        {
            auto taken = [&](const std::string& name) { return std::ranges::find(columns, name) != columns.end(); };
            if (!indexName.empty() && !taken(indexName))
            {
                return indexName;
            }
            std::string candidate = "index";
            for (int level = 0; taken(candidate); ++level)
            {
                candidate = std::format("level_{}", level);
            }
            return candidate;
        }

        epoch_frame::DataFrame IndexedFrame(const ArrayPtr& labels, const std::string& indexName,
                                            const std::vector<std::string>& columns, const std::vector<ArrayPtr>& arrays)
        {
            const std::string labelColumn = LabelColumnName(indexName, columns);

            arrow::FieldVector fields{arrow::field(labelColumn, labels->type())};
            std::vector<ArrayPtr> data{labels};
            for (size_t i = 0; i < columns.size(); ++i)
            {
                fields.push_back(arrow::field(columns[i], arrays[i]->type()));
                data.push_back(arrays[i]);
            }
            auto table = arrow::Table::Make(arrow::schema(fields), data, labels->length());
            CheckStatus(table->Validate(), "result table");
            return epoch_frame::DataFrame(table).set_index(labelColumn);
        }
    } // namespace

    FrameData FrameFromDataFrame(const epoch_frame::DataFrame& frame)
    {
        FrameData data;
        const auto table = frame.table();
        data.columns = table->ColumnNames();
        data.arrays.reserve(data.columns.size());
        for (int i = 0; i < table->num_columns(); ++i)
        {
            data.arrays.push_back(CombineChunks(*table->column(i)));
        }
        data.labels = frame.index()->array().value();
        return data;
    }

    epoch_frame::DataFrame ToDataFrame(const FrameData& frame)
    {
        return IndexedFrame(frame.labels, frame.indexName, frame.columns, frame.arrays);
    }

    epoch_frame::Series ToSeries(const SeriesData& series)
    {
        const std::string name = series.name.value_or("values");
        return IndexedFrame(series.labels, series.indexName, {name}, {series.values})[name];
    }

    ResultValue ToResultValue(const Value& value)
    {
        if (value.IsNone())
        {
            return ResultValue{Empty{}};
        }
        if (auto* flag = value.TryAs<bool>())
        {
            return ResultValue{ScalarValue{*flag}};
        }
        if (auto* integer = value.TryAs<int64_t>())
        {
            return ResultValue{ScalarValue{*integer}};
        }
        if (auto* number = value.TryAs<double>())
        {
            return ResultValue{ScalarValue{*number}};
        }
        if (auto* text = value.TryAs<std::string>())
        {
            return ResultValue{ScalarValue{*text}};
        }
        if (auto* frame = value.Object<FrameObject>())
        {
            return ResultValue{TabularFrame{ToDataFrame(frame->data)}};
        }
        if (auto* series = value.Object<SeriesObject>())
        {
            return ResultValue{LabeledSequence{ToSeries(series->data), series->data.name.value_or("")}};
        }
        if (auto* dict = value.Object<DictObject>())
        {
            Mapping mapping;
            for (const auto& [key, item] : dict->entries)
            {
                mapping.entries.emplace_back(Str(key), ToResultValue(item));
            }
            return ResultValue{std::move(mapping)};
        }
        if (value.Object<ListObject>() || value.Object<TupleObject>() || value.Is<RangeValue>() ||
            value.Object<IteratorObject>())
        {
            Sequence sequence;
            for (const auto& item : Materialize(value))
            {
                sequence.items.push_back(ToResultValue(item));
            }
            return ResultValue{std::move(sequence)};
        }
        ThrowTypeError(std::format("a '{}' object cannot be returned as a result", TypeName(value)));
    }

} // namespace nlytics::sandbox
