//
// NLytics Dataset Source Implementation
//
#include <nlytics/core/dataset.h>
#include <epoch_frame/serialization.h>
#include <arrow/api.h>
#include <spdlog/spdlog.h>
#include <format>
#include <stdexcept>

namespace nlytics
{
    namespace
    {
        std::string ClassifyArrowType(const arrow::DataType& type)
        {
            switch (type.id())
            {
            case arrow::Type::INT8:
            case arrow::Type::INT16:
            case arrow::Type::INT32:
            case arrow::Type::INT64:
            case arrow::Type::UINT8:
            case arrow::Type::UINT16:
            case arrow::Type::UINT32:
            case arrow::Type::UINT64:
                return "integer";
            case arrow::Type::HALF_FLOAT:
            case arrow::Type::FLOAT:
            case arrow::Type::DOUBLE:
                return "float";
            case arrow::Type::BOOL:
                return "boolean";
            case arrow::Type::STRING:
            case arrow::Type::LARGE_STRING:
                return "text";
            case arrow::Type::TIMESTAMP:
            case arrow::Type::DATE32:
            case arrow::Type::DATE64:
                return "datetime";
            default:
                return "other";
            }
        }
    } // namespace

    epoch_frame::DataFrame LoadDatasetFromCsv(const std::string& path)
    {
        auto result = epoch_frame::read_csv_file(path, epoch_frame::CSVReadOptions{});
        if (!result.ok())
        {
            throw std::runtime_error(std::format("Failed to read dataset '{}': {}", path,
                                                 result.status().ToString()));
        }
        auto frame = result.ValueOrDie();
        SPDLOG_INFO("Loaded dataset '{}' ({} rows x {} columns)", path, frame.num_rows(), frame.num_cols());
        return frame;
    }

    ColumnManifest DescribeColumns(const epoch_frame::DataFrame& frame)
    {
        ColumnManifest manifest;
        auto schema = frame.table()->schema();
        manifest.reserve(schema->num_fields());
        for (int i = 0; i < schema->num_fields(); ++i)
        {
            const auto& field = schema->field(i);
            manifest.push_back(ColumnInfo{field->name(), ClassifyArrowType(*field->type())});
        }
        return manifest;
    }

    std::vector<std::string> ColumnNames(const ColumnManifest& manifest)
    {
        std::vector<std::string> names;
        names.reserve(manifest.size());
        for (const auto& column : manifest)
        {
            names.push_back(column.name);
        }
        return names;
    }

} // namespace nlytics
