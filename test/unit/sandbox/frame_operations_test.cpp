//
// Tests for the data-analysis surface available to sandboxed programs
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <nlytics/sandbox/sandbox_executor.h>
#include "integration/common/test_datasets.h"

using namespace nlytics;
using Catch::Approx;

namespace {

ExecutionOutcome RunOnSales(const std::string& code) {
    auto outcome = SandboxExecutor(test::ShippedConfig().sandbox).Execute(code, test::MakeSalesDataset());
    INFO(code);
    INFO((outcome.error ? outcome.error->message : std::string{}));
    REQUIRE(outcome.success);
    return outcome;
}

std::vector<int64_t> IntItems(const ResultValue& value) {
    std::vector<int64_t> items;
    for (const auto& item : value.GetSequence().items) {
        items.push_back(std::get<int64_t>(item.GetScalar()));
    }
    return items;
}

} // namespace

TEST_CASE("Frame operations", "[sandbox][frame]")
{
    SECTION("sort_values then head keeps the top row") {
        auto outcome = RunOnSales("result = dataset.sort_values('price', ascending=False).head(1)");
        REQUIRE(outcome.result.IsFrame());
        const auto preview = PreviewFrame(outcome.result.GetFrame().frame, 5);
        REQUIRE(preview.total_rows == 1);
        REQUIRE(preview.rows[0][1] == PreviewCell{ScalarValue{std::string{"gadget"}}});
        REQUIRE(preview.rows[0][2] == PreviewCell{ScalarValue{30.0}});
    }

    SECTION("column projection") {
        auto outcome = RunOnSales("result = dataset[['product', 'units']]");
        REQUIRE(outcome.result.GetFrame().frame.num_cols() == 2);
        REQUIRE(outcome.result.GetFrame().frame.num_rows() == 6);
    }

    SECTION("iloc addresses rows by position") {
        auto outcome = RunOnSales("result = dataset['units'].iloc[2]");
        REQUIRE(outcome.result.AsNumber() == Approx(10.0));
    }

    SECTION("len of a frame counts rows") {
        auto outcome = RunOnSales("result = len(dataset)");
        REQUIRE(outcome.result.AsNumber() == Approx(6.0));
    }
}

TEST_CASE("Series operations", "[sandbox][series]")
{
    SECTION("value_counts orders by frequency") {
        auto outcome = RunOnSales("result = dataset['region'].value_counts()");
        REQUIRE(outcome.result.IsLabeledSequence());
        const auto preview = PreviewSequence(outcome.result.GetLabeledSequence(), 10);
        REQUIRE(preview.total_items == 3);
        REQUIRE(preview.labels[0] == PreviewCell{ScalarValue{std::string{"north"}}});
        REQUIRE(preview.values[0] == PreviewCell{ScalarValue{int64_t{3}}});
        REQUIRE(preview.labels[2] == PreviewCell{ScalarValue{std::string{"east"}}});
    }

    SECTION("mean of a float column") {
        auto outcome = RunOnSales("result = dataset['price'].mean()");
        REQUIRE(outcome.result.AsNumber() == Approx(101.25 / 6.0));
    }

    SECTION("tolist materializes values") {
        auto outcome = RunOnSales("result = dataset['units'].tolist()");
        REQUIRE(IntItems(outcome.result) == std::vector<int64_t>{4, 1, 10, 2, 6, 3});
    }

    SECTION("boolean masks combine with &") {
        auto outcome = RunOnSales("result = dataset[(dataset['region'] == 'north') & (dataset['units'] > 3)]");
        REQUIRE(outcome.result.GetFrame().frame.num_rows() == 2);
    }
}

TEST_CASE("Language features", "[sandbox][builtins]")
{
    SECTION("list comprehension with a filter") {
        auto outcome = RunOnSales("result = [u * 2 for u in dataset['units'].tolist() if u > 3]");
        REQUIRE(IntItems(outcome.result) == std::vector<int64_t>{8, 20, 12});
    }

    SECTION("f-string") {
        auto outcome = RunOnSales("n = len(dataset)\nresult = f'{n} rows'");
        REQUIRE(std::get<std::string>(outcome.result.GetScalar()) == "6 rows");
    }

    SECTION("str.format") {
        auto outcome = RunOnSales("result = '{} units'.format(3)");
        REQUIRE(std::get<std::string>(outcome.result.GetScalar()) == "3 units");
    }

    SECTION("round builtin") {
        auto outcome = RunOnSales("result = round(2.567, 2)");
        REQUIRE(outcome.result.AsNumber() == Approx(2.57));
    }

    SECTION("dict becomes a mapping in insertion order") {
        auto outcome = RunOnSales("result = {'b': 1, 'a': 2}");
        const auto& entries = outcome.result.GetMapping().entries;
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].first == "b");
        REQUIRE(entries[1].first == "a");
    }
}
