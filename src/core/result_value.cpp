//
// NLytics Result Value
//
#include <nlytics/core/result_value.h>
#include <arrow/api.h>
#include <algorithm>
#include <format>
#include <stdexcept>
#include <type_traits>

namespace nlytics
{
    double ResultValue::AsNumber() const
    {
        if (!IsScalar())
        {
            throw std::runtime_error(std::format("ResultValue of type {} is not numeric", TypeName()));
        }
        return std::visit(
            [](const auto& v) -> double
            {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::string>)
                {
                    throw std::runtime_error(std::format("ResultValue '{}' is text, not a number", v));
                }
                else
                {
                    return static_cast<double>(v);
                }
            },
            GetScalar());
    }

    std::string ResultValue::TypeName() const
    {
        return std::visit(
            [](const auto& v) -> std::string
            {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, Empty>)
                    return "Empty";
                else if constexpr (std::is_same_v<T, ScalarValue>)
                    return "Scalar";
                else if constexpr (std::is_same_v<T, TabularFrame>)
                    return "TabularFrame";
                else if constexpr (std::is_same_v<T, LabeledSequence>)
                    return "LabeledSequence";
                else if constexpr (std::is_same_v<T, Mapping>)
                    return "Mapping";
                else
                    return "Sequence";
            },
            data);
    }

    std::string ScalarToString(const ScalarValue& scalar)
    {
        return std::visit(
            [](const auto& v) -> std::string
            {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::string>)
                    return v;
                else if constexpr (std::is_same_v<T, bool>)
                    return v ? "True" : "False";
                else if constexpr (std::is_same_v<T, double>)
                    return std::format("{}", v);
                else
                    return std::to_string(v);
            },
            scalar);
    }

    namespace
    {
        template <typename ArrowType>
        auto NumericAt(const arrow::Array& array, int64_t index)
        {
            return static_cast<const arrow::NumericArray<ArrowType>&>(array).Value(index);
        }

        PreviewCell CellAt(const arrow::Array& array, int64_t index)
        {
            if (array.IsNull(index))
            {
                return std::nullopt;
            }
            switch (array.type_id())
            {
            case arrow::Type::BOOL:
                return ScalarValue{static_cast<const arrow::BooleanArray&>(array).Value(index)};
            case arrow::Type::INT8: return ScalarValue{static_cast<int64_t>(NumericAt<arrow::Int8Type>(array, index))};
            case arrow::Type::INT16: return ScalarValue{static_cast<int64_t>(NumericAt<arrow::Int16Type>(array, index))};
            case arrow::Type::INT32: return ScalarValue{static_cast<int64_t>(NumericAt<arrow::Int32Type>(array, index))};
            case arrow::Type::INT64: return ScalarValue{NumericAt<arrow::Int64Type>(array, index)};
            case arrow::Type::UINT8: return ScalarValue{static_cast<int64_t>(NumericAt<arrow::UInt8Type>(array, index))};
            case arrow::Type::UINT16: return ScalarValue{static_cast<int64_t>(NumericAt<arrow::UInt16Type>(array, index))};
            case arrow::Type::UINT32: return ScalarValue{static_cast<int64_t>(NumericAt<arrow::UInt32Type>(array, index))};
            case arrow::Type::UINT64: return ScalarValue{static_cast<int64_t>(NumericAt<arrow::UInt64Type>(array, index))};
            case arrow::Type::FLOAT: return ScalarValue{static_cast<double>(NumericAt<arrow::FloatType>(array, index))};
            case arrow::Type::DOUBLE: return ScalarValue{NumericAt<arrow::DoubleType>(array, index)};
            case arrow::Type::STRING:
                return ScalarValue{static_cast<const arrow::StringArray&>(array).GetString(index)};
            case arrow::Type::LARGE_STRING:
                return ScalarValue{static_cast<const arrow::LargeStringArray&>(array).GetString(index)};
            default:
            {
                auto scalar = array.GetScalar(index);
                if (!scalar.ok())
                {
                    throw std::runtime_error(std::format("cannot read cell {}: {}", index, scalar.status().ToString()));
                }
                return ScalarValue{(*scalar)->ToString()};
            }
            }
        }
    } // namespace

    FramePreview PreviewFrame(const epoch_frame::DataFrame& frame, std::size_t maxRows)
    {
        FramePreview preview;
        const auto table = frame.table();
        preview.columns = table->ColumnNames();
        preview.total_rows = table->num_rows();

        const int64_t shown = std::min<int64_t>(preview.total_rows, static_cast<int64_t>(maxRows));
        if (shown == 0)
        {
            return preview;
        }
        const auto labels = frame.index()->array().value();
        std::vector<std::shared_ptr<arrow::Array>> columns;
        for (const auto& column : table->columns())
        {
            auto combined = arrow::Concatenate(column->chunks());
            if (!combined.ok())
            {
                throw std::runtime_error(std::format("cannot preview frame: {}", combined.status().ToString()));
            }
            columns.push_back(*combined);
        }

        for (int64_t row = 0; row < shown; ++row)
        {
            preview.labels.push_back(CellAt(*labels, row));
            std::vector<PreviewCell> cells;
            for (const auto& column : columns)
            {
                cells.push_back(CellAt(*column, row));
            }
            preview.rows.push_back(std::move(cells));
        }
        return preview;
    }

    SequencePreview PreviewSequence(const LabeledSequence& sequence, std::size_t maxItems)
    {
        SequencePreview preview;
        preview.name = sequence.name;
        const auto values = sequence.series.contiguous_array().value();
        const auto labels = sequence.series.index()->array().value();
        preview.total_items = values->length();

        const int64_t shown = std::min<int64_t>(preview.total_items, static_cast<int64_t>(maxItems));
        for (int64_t i = 0; i < shown; ++i)
        {
            preview.labels.push_back(CellAt(*labels, i));
            preview.values.push_back(CellAt(*values, i));
        }
        return preview;
    }

} // namespace nlytics
