//
// Tests for dataset loading and column manifests
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlytics/core/dataset.h>
#include <nlytics/core/result_value.h>
#include "integration/common/test_datasets.h"
#include <filesystem>
#include <fstream>

using namespace nlytics;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("DescribeColumns classifies column types", "[core][dataset]")
{
    const auto manifest = DescribeColumns(test::MakeSalesDataset());
    REQUIRE(manifest.size() == 4);
    REQUIRE(manifest[0].name == "region");
    REQUIRE(manifest[0].type == "text");
    REQUIRE(manifest[2].name == "price");
    REQUIRE(manifest[2].type == "float");
    REQUIRE(manifest[3].type == "integer");

    REQUIRE(ColumnNames(manifest) == std::vector<std::string>{"region", "product", "price", "units"});
}

TEST_CASE("LoadDatasetFromCsv reads a header and typed columns", "[core][dataset]")
{
    const auto path = std::filesystem::temp_directory_path() / "nlytics_dataset_test.csv";
    {
        std::ofstream file(path);
        file << "city,visits,rate\nparis,10,0.5\nrome,7,0.25\n";
    }

    const auto frame = LoadDatasetFromCsv(path.string());
    REQUIRE(frame.num_rows() == 2);

    const auto manifest = DescribeColumns(frame);
    REQUIRE(ColumnNames(manifest) == std::vector<std::string>{"city", "visits", "rate"});
    REQUIRE(manifest[1].type == "integer");
    REQUIRE(manifest[2].type == "float");

    std::filesystem::remove(path);
}

TEST_CASE("LoadDatasetFromCsv reports unreadable files", "[core][dataset]")
{
    REQUIRE_THROWS_WITH(LoadDatasetFromCsv("/nonexistent/data.csv"), ContainsSubstring("Failed to read dataset"));
}

TEST_CASE("PreviewFrame limits rows", "[core][result]")
{
    const auto preview = PreviewFrame(test::MakeSalesDataset(), 2);
    REQUIRE(preview.total_rows == 6);
    REQUIRE(preview.rows.size() == 2);
    REQUIRE(preview.labels.size() == 2);
    REQUIRE(preview.rows[0][0] == PreviewCell{ScalarValue{std::string{"north"}}});
    REQUIRE(preview.rows[1][2] == PreviewCell{ScalarValue{30.0}});
}

TEST_CASE("ResultValue reports its shape", "[core][result]")
{
    REQUIRE(ResultValue{}.TypeName() == "Empty");
    REQUIRE(ResultValue{ScalarValue{int64_t{3}}}.TypeName() == "Scalar");
    REQUIRE(ResultValue{ScalarValue{true}}.AsNumber() == 1.0);
    REQUIRE(ResultValue{Sequence{}}.TypeName() == "Sequence");
    REQUIRE_THROWS(ResultValue{ScalarValue{std::string{"x"}}}.AsNumber());
    REQUIRE(ScalarToString(ScalarValue{false}) == "False");
}
