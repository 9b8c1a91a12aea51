#pragma once
//
// NLytics Dataset Source
//
// Loads a tabular dataset and describes its columns for the validator's
// column audit and the code producer's request.
//

#include <epoch_frame/dataframe.h>
#include <string>
#include <vector>

namespace nlytics
{
    struct ColumnInfo
    {
        std::string name;
        std::string type; // integer, float, boolean, text, datetime, other
    };

    using ColumnManifest = std::vector<ColumnInfo>;

    // Reads a CSV file with a header row; throws std::runtime_error on failure
    epoch_frame::DataFrame LoadDatasetFromCsv(const std::string& path);

    ColumnManifest DescribeColumns(const epoch_frame::DataFrame& frame);

    std::vector<std::string> ColumnNames(const ColumnManifest& manifest);

} // namespace nlytics
