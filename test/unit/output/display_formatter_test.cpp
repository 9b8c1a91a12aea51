//
// Tests for markdown renderings of reports, outcomes and retry notices
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlytics/reporting/display_formatter.h>
#include <nlytics/sandbox/sandbox_executor.h>
#include "integration/common/test_datasets.h"
#include <epoch_frame/factory/array_factory.h>
#include <epoch_frame/factory/dataframe_factory.h>
#include <epoch_frame/factory/index_factory.h>
#include <numeric>

using namespace nlytics;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using epoch_core::ValidationErrorKind;

namespace {

ExecutionOutcome Run(const std::string& code, const epoch_frame::DataFrame& dataset) {
    return SandboxExecutor(test::ShippedConfig().sandbox).Execute(code, dataset);
}

epoch_frame::DataFrame MakeLongDataset(size_t rows) {
    std::vector<int64_t> values(rows);
    std::iota(values.begin(), values.end(), 0);
    std::vector<arrow::ChunkedArrayPtr> arrays{epoch_frame::factory::array::make_array(values)};
    return epoch_frame::make_dataframe(epoch_frame::factory::index::from_range(rows), arrays, {"value"});
}

size_t CountLines(const std::string& text, const std::string& prefix) {
    size_t count = 0;
    size_t pos = 0;
    while ((pos = text.find("\n" + prefix, pos)) != std::string::npos) {
        ++count;
        ++pos;
    }
    return count;
}

} // namespace

TEST_CASE("FormatValidationForDisplay", "[output][display]")
{
    SECTION("passing report shows the score") {
        ValidationReport report;
        report.valid = true;
        report.score = 95;
        REQUIRE(FormatValidationForDisplay(report) == "**Code Validation Passed** (Score: 95/100)");
    }

    SECTION("failing report lists errors and warnings") {
        ValidationReport report;
        report.valid = false;
        report.errors = {{ValidationErrorKind::UnauthorizedImport, "Unauthorized import: socket", 1}};
        report.warnings = {{"Column \"revenue\" not found in dataset", 2}};
        report.score = 70;

        const auto text = FormatValidationForDisplay(report);
        REQUIRE_THAT(text, StartsWith("### Code Validation Failed (Score: 70/100)"));
        REQUIRE_THAT(text, ContainsSubstring("**Errors:**\n- Line 1: Unauthorized import: socket (UnauthorizedImport)"));
        REQUIRE_THAT(text, ContainsSubstring("**Warnings:**\n- Line 2: Column \"revenue\" not found in dataset"));
    }
}

TEST_CASE("FormatOutcomeForDisplay", "[output][display]")
{
    SECTION("scalar result") {
        const auto text = FormatOutcomeForDisplay(Run("result = dataset['price'].sum()", test::MakePriceDataset()));
        REQUIRE_THAT(text, StartsWith("### Execution Successful"));
        REQUIRE_THAT(text, ContainsSubstring("**Result Type**: Scalar"));
        REQUIRE_THAT(text, ContainsSubstring("**Value**: 60"));
    }

    SECTION("frame result renders a bounded markdown table") {
        const auto text = FormatOutcomeForDisplay(Run("result = dataset", MakeLongDataset(25)));
        REQUIRE_THAT(text, ContainsSubstring("**Shape**: 25 rows x 1 columns"));
        REQUIRE_THAT(text, ContainsSubstring("|  | value |"));
        REQUIRE_THAT(text, ContainsSubstring("| --- | --- |"));
        REQUIRE(CountLines(text, "| ") == 12);
        REQUIRE_THAT(text, ContainsSubstring("_... 15 more rows_"));
    }

    SECTION("empty frame") {
        const auto text = FormatOutcomeForDisplay(Run("result = dataset[dataset['price'] > 100]",
                                                      test::MakePriceDataset()));
        REQUIRE_THAT(text, ContainsSubstring("_Empty DataFrame_"));
    }

    SECTION("sequence result renders bullets") {
        const auto text = FormatOutcomeForDisplay(
            Run("result = dataset.groupby('region')['units'].sum()", test::MakeSalesDataset()));
        REQUIRE_THAT(text, ContainsSubstring("**Length**: 3"));
        REQUIRE_THAT(text, ContainsSubstring("- **east**: 2"));
        REQUIRE_THAT(text, ContainsSubstring("- **north**: 17"));
    }

    SECTION("console output is shown") {
        const auto text = FormatOutcomeForDisplay(Run("print('checked')\nresult = 1", test::MakePriceDataset()));
        REQUIRE_THAT(text, ContainsSubstring("**Console Output:**\n```\nchecked\n"));
    }

    SECTION("failure shows error and traceback") {
        const auto text = FormatOutcomeForDisplay(Run("result = dataset['missing']", test::MakePriceDataset()));
        REQUIRE_THAT(text, StartsWith("### Execution Failed"));
        REQUIRE_THAT(text, ContainsSubstring("**Error**: KeyError: 'missing'"));
        REQUIRE_THAT(text, ContainsSubstring("**Traceback:**\n```\nTraceback (most recent call last):"));
    }
}

TEST_CASE("FormatRetryInfo", "[output][display]")
{
    REQUIRE(FormatRetryInfo(2, 3, "fix the import") == "**Retrying** (Attempt 2/3)\n\nfix the import");
}
