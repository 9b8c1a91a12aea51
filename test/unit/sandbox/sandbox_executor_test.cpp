//
// Tests for SandboxExecutor: results, fault classification, isolation and limits
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlytics/sandbox/sandbox_executor.h>
#include "integration/common/test_datasets.h"

using namespace nlytics;
using Catch::Approx;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using epoch_core::ExecutionFaultKind;

namespace {

SandboxExecutor MakeExecutor() {
    return SandboxExecutor(test::ShippedConfig().sandbox);
}

void RequireFault(const ExecutionOutcome& outcome, const std::string& prefix) {
    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.error.has_value());
    REQUIRE(outcome.error->kind == ExecutionFaultKind::RuntimeFault);
    REQUIRE_THAT(outcome.error->message, StartsWith(prefix));
    REQUIRE(outcome.result.IsEmpty());
}

} // namespace

TEST_CASE("SandboxExecutor returns the bound result", "[sandbox][executor]")
{
    const auto executor = MakeExecutor();
    const auto prices = test::MakePriceDataset();

    SECTION("column sum") {
        auto outcome = executor.Execute("result = dataset['price'].sum()", prices);
        REQUIRE(outcome.success);
        REQUIRE_FALSE(outcome.error.has_value());
        REQUIRE(outcome.result.IsScalar());
        REQUIRE(outcome.result.AsNumber() == Approx(60.0));
        REQUIRE(outcome.ResultType() == "Scalar");
    }

    SECTION("absent result is empty, not an error") {
        auto outcome = executor.Execute("total = 1 + 1", prices);
        REQUIRE(outcome.success);
        REQUIRE(outcome.result.IsEmpty());
    }

    SECTION("filtered frame") {
        auto outcome = executor.Execute("result = dataset[dataset['price'] > 12]", test::MakeSalesDataset());
        REQUIRE(outcome.success);
        REQUIRE(outcome.result.IsFrame());
        REQUIRE(outcome.result.GetFrame().frame.num_rows() == 4);
        REQUIRE(outcome.result.GetFrame().frame.num_cols() == 4);
    }

    SECTION("group-by aggregate is a labeled sequence") {
        auto outcome = executor.Execute("result = dataset.groupby('region')['units'].sum()", test::MakeSalesDataset());
        REQUIRE(outcome.success);
        REQUIRE(outcome.result.IsLabeledSequence());

        const auto preview = PreviewSequence(outcome.result.GetLabeledSequence(), 10);
        REQUIRE(preview.total_items == 3);
        REQUIRE(preview.labels[0] == PreviewCell{ScalarValue{std::string{"east"}}});
        REQUIRE(preview.values[0] == PreviewCell{ScalarValue{int64_t{2}}});
        REQUIRE(preview.values[1] == PreviewCell{ScalarValue{int64_t{17}}});
    }

    SECTION("top rows by a column") {
        auto outcome = executor.Execute("result = dataset.nlargest(2, 'price')[['product', 'price']]",
                                        test::MakeSalesDataset());
        REQUIRE(outcome.success);
        const auto preview = PreviewFrame(outcome.result.GetFrame().frame, 10);
        REQUIRE(preview.columns == std::vector<std::string>{"product", "price"});
        REQUIRE(preview.rows[0][1] == PreviewCell{ScalarValue{30.0}});
        REQUIRE(preview.rows[1][1] == PreviewCell{ScalarValue{28.0}});
    }

    SECTION("containers become mappings and sequences") {
        auto outcome = executor.Execute(R"(
totals = {}
for region in ['north', 'south']:
    totals[region] = dataset[dataset['region'] == region]['units'].sum()
result = {'totals': totals, 'regions': sorted(totals.keys())}
)",
                                        test::MakeSalesDataset());
        REQUIRE(outcome.success);
        REQUIRE(outcome.result.IsMapping());

        const auto& entries = outcome.result.GetMapping().entries;
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].first == "totals");
        REQUIRE(entries[0].second.GetMapping().entries[0].second.AsNumber() == Approx(17.0));
        REQUIRE(entries[1].second.IsSequence());
        REQUIRE(entries[1].second.GetSequence().items.size() == 2);
    }

    SECTION("allow-listed modules are importable and pre-bound") {
        auto outcome = executor.Execute("import numpy as np\nresult = np.mean([1, 2, 3]) + pd.Series([1, 2]).sum()",
                                        prices);
        REQUIRE(outcome.success);
        REQUIRE(outcome.result.AsNumber() == Approx(5.0));
    }

    SECTION("lower-case boolean constants are bound") {
        auto outcome = executor.Execute("result = true and not false", prices);
        REQUIRE(outcome.success);
        REQUIRE(std::get<bool>(outcome.result.GetScalar()));
    }
}

TEST_CASE("SandboxExecutor captures program output", "[sandbox][executor]")
{
    const auto prices = test::MakePriceDataset();

    SECTION("print writes to the call's stdout") {
        auto outcome = MakeExecutor().Execute("print('total', dataset['price'].sum())\nresult = 1", prices);
        REQUIRE(outcome.success);
        REQUIRE(outcome.stdout_text == "total 60\n");
        REQUIRE(outcome.stderr_text.empty());
        REQUIRE_FALSE(outcome.output_truncated);
    }

    SECTION("output beyond the limit is truncated with a notice") {
        auto config = test::ShippedConfig().sandbox;
        config.max_output_bytes = 32;
        SandboxExecutor executor(config);

        auto outcome = executor.Execute("for i in range(100):\n    print('line', i)\nresult = 1", prices);
        REQUIRE(outcome.success);
        REQUIRE(outcome.output_truncated);
        REQUIRE(outcome.stdout_text.size() <= 32);
        REQUIRE_THAT(outcome.stderr_text, ContainsSubstring("output truncated"));
    }
}

TEST_CASE("SandboxExecutor classifies runtime faults", "[sandbox][executor]")
{
    const auto executor = MakeExecutor();
    const auto prices = test::MakePriceDataset();

    SECTION("missing column") {
        auto outcome = executor.Execute("result = dataset['nonexistent_column']", prices);
        RequireFault(outcome, "KeyError: 'nonexistent_column'");
    }

    SECTION("division by zero") {
        RequireFault(executor.Execute("result = 1 // 0", prices), "ZeroDivisionError: ");
    }

    SECTION("undefined name") {
        RequireFault(executor.Execute("result = x + 1", prices), "NameError: name 'x' is not defined");
    }

    SECTION("import outside the allow-list") {
        RequireFault(executor.Execute("import os\nresult = 1", prices), "ImportError: ");
    }

    SECTION("double-underscore attributes") {
        RequireFault(executor.Execute("result = dataset.__class__", prices), "DisallowedOperation: ");
    }

    SECTION("unparseable program reports SyntaxError") {
        auto outcome = executor.Execute("result = (1 +", prices);
        RequireFault(outcome, "SyntaxError: ");
    }

    SECTION("trace names the failing line") {
        auto outcome = executor.Execute("a = 1\nb = 2\nresult = dataset['missing']\n", prices);
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error->line == 3);
        REQUIRE_THAT(outcome.error->trace, StartsWith("Traceback (most recent call last):"));
        REQUIRE_THAT(outcome.error->trace, ContainsSubstring("line 3"));
        REQUIRE_THAT(outcome.error->trace, ContainsSubstring("result = dataset['missing']"));
        REQUIRE_THAT(outcome.error->trace, ContainsSubstring(outcome.error->message));
    }
}

TEST_CASE("Aliased dynamic primitives fail at execution", "[sandbox][executor][regression]")
{
    const auto executor = MakeExecutor();
    const auto prices = test::MakePriceDataset();

    SECTION("eval alias") {
        auto outcome = executor.Execute("e = eval\nresult = e('1 + 1')", prices);
        RequireFault(outcome, "DisallowedOperation: 'eval' is not available in the sandbox");
        REQUIRE(outcome.error->line == 2);
    }

    SECTION("getattr alias") {
        auto outcome = executor.Execute("g = getattr\nresult = g(dataset, 'shape')", prices);
        RequireFault(outcome, "DisallowedOperation: 'getattr'");
    }

    SECTION("direct open") {
        RequireFault(executor.Execute("result = open('/etc/passwd')", prices), "DisallowedOperation: 'open'");
    }
}

TEST_CASE("SandboxExecutor never mutates the caller's dataset", "[sandbox][executor]")
{
    const auto executor = MakeExecutor();
    const auto prices = test::MakePriceDataset();

    auto mutated = executor.Execute("dataset['price'] = 0\ndataset['extra'] = 1\nresult = dataset['price'].sum()",
                                    prices);
    REQUIRE(mutated.success);
    REQUIRE(mutated.result.AsNumber() == Approx(0.0));

    REQUIRE(prices.num_cols() == 1);
    auto fresh = executor.Execute("result = dataset['price'].sum()", prices);
    REQUIRE(fresh.result.AsNumber() == Approx(60.0));
}

TEST_CASE("SandboxExecutor preempts programs that exceed the timeout", "[sandbox][executor][timeout]")
{
    const auto executor = MakeExecutor();

    auto outcome = executor.Execute("while true:\n    pass\nresult = 1", test::MakePriceDataset(), 2000);
    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.error->kind == ExecutionFaultKind::TimeoutFault);
    REQUIRE_THAT(outcome.error->message, StartsWith("TimeoutError: "));
    REQUIRE(outcome.duration_ms >= 2000);
    REQUIRE(outcome.duration_ms < 4000);
}

TEST_CASE("SandboxExecutor keeps integer arithmetic in range", "[sandbox][executor][regression]")
{
    const auto executor = MakeExecutor();
    const auto prices = test::MakePriceDataset();

    SECTION("INT64_MIN floor-divided by -1 overflows") {
        auto outcome = executor.Execute("result = (-9223372036854775807 - 1) // -1", prices);
        RequireFault(outcome, "OverflowError");
    }

    SECTION("INT64_MIN modulo -1 is zero") {
        auto outcome = executor.Execute("result = (-9223372036854775807 - 1) % -1", prices);
        REQUIRE(outcome.success);
        REQUIRE(outcome.result.AsNumber() == Approx(0.0));
    }

    SECTION("ordinary floor division by -1") {
        auto outcome = executor.Execute("result = 7 // -1", prices);
        REQUIRE(outcome.result.AsNumber() == Approx(-7.0));
    }

    SECTION("range spanning the full int64 domain") {
        auto outcome = executor.Execute("result = len(range(-9223372036854775807 - 1, 9223372036854775807))", prices);
        RequireFault(outcome, "OverflowError");
    }

    SECTION("large stepped range still has a length") {
        auto outcome =
            executor.Execute("result = len(range(-9223372036854775807 - 1, 9223372036854775807, 2**62))", prices);
        REQUIRE(outcome.success);
        REQUIRE(outcome.result.AsNumber() == Approx(4.0));
    }
}

TEST_CASE("SandboxExecutor bounds sequence growth", "[sandbox][executor][regression]")
{
    const auto executor = MakeExecutor();
    const auto prices = test::MakePriceDataset();

    SECTION("repeating an empty string is immediate") {
        auto outcome = executor.Execute("result = '' * 10**18", prices);
        REQUIRE(outcome.success);
        REQUIRE(std::get<std::string>(outcome.result.GetScalar()).empty());
    }

    SECTION("repeating an empty list is immediate") {
        auto outcome = executor.Execute("result = [] * 10**18", prices);
        REQUIRE(outcome.success);
        REQUIRE(outcome.result.GetSequence().items.empty());
    }

    SECTION("non-positive repeat counts give empty results") {
        auto outcome = executor.Execute("result = 'ab' * -3", prices);
        REQUIRE(std::get<std::string>(outcome.result.GetScalar()).empty());
    }

    SECTION("huge string repeat raises MemoryError") {
        auto outcome = executor.Execute("result = 'ab' * 10**18", prices);
        RequireFault(outcome, "MemoryError");
        REQUIRE(outcome.duration_ms < 2000);
    }

    SECTION("huge list repeat raises MemoryError") {
        auto outcome = executor.Execute("result = [0] * 10**12", prices);
        RequireFault(outcome, "MemoryError");
    }

    SECTION("materializing a huge range raises MemoryError") {
        auto outcome = executor.Execute("result = list(range(10**12))", prices);
        RequireFault(outcome, "MemoryError");
    }

    SECTION("format width is bounded") {
        auto outcome = executor.Execute("result = f'{1:>999999999999}'", prices);
        RequireFault(outcome, "MemoryError");
    }

    SECTION("sequences up to the cap are fine") {
        auto outcome = executor.Execute("result = len([0] * 1000 + list(range(1000)))", prices);
        REQUIRE(outcome.result.AsNumber() == Approx(2000.0));
    }
}

TEST_CASE("SandboxExecutor applies the configured sequence cap", "[sandbox][executor][regression]")
{
    auto config = test::ShippedConfig().sandbox;
    config.max_sequence_items = 100;
    const SandboxExecutor executor(config);
    const auto prices = test::MakePriceDataset();

    SECTION("append past the cap") {
        RequireFault(executor.Execute("x = [0] * 100\nx.append(1)\nresult = x", prices), "MemoryError");
    }

    SECTION("extend past the cap") {
        RequireFault(executor.Execute("x = [0] * 60\nx.extend([1] * 60)\nresult = x", prices), "MemoryError");
    }

    SECTION("join past the cap") {
        RequireFault(executor.Execute("result = ','.join(['ab'] * 60)", prices), "MemoryError");
    }

    SECTION("comprehension past the cap") {
        RequireFault(executor.Execute("result = [i for i in range(200)]", prices), "MemoryError");
    }

    SECTION("concatenation past the cap") {
        RequireFault(executor.Execute("result = [0] * 60 + [1] * 60", prices), "MemoryError");
    }

    SECTION("sizes at the cap succeed") {
        auto outcome = executor.Execute("result = len([0] * 100)", prices);
        REQUIRE(outcome.result.AsNumber() == Approx(100.0));
    }
}

TEST_CASE("SandboxExecutor preempts long builtin loops", "[sandbox][executor][timeout][regression]")
{
    const auto executor = MakeExecutor();
    const auto prices = test::MakePriceDataset();

    SECTION("sum over a huge range") {
        auto outcome = executor.Execute("result = sum(range(10**12))", prices, 500);
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error->kind == ExecutionFaultKind::TimeoutFault);
        REQUIRE(outcome.duration_ms >= 500);
        REQUIRE(outcome.duration_ms < 2500);
    }

    SECTION("max over a huge range") {
        auto outcome = executor.Execute("result = max(range(10**12))", prices, 500);
        REQUIRE(outcome.error->kind == ExecutionFaultKind::TimeoutFault);
        REQUIRE(outcome.duration_ms < 2500);
    }

    SECTION("any stops at the first truthy item of a huge range") {
        auto outcome = executor.Execute("result = any(range(0, -10**12, -1))", prices, 500);
        REQUIRE(outcome.success);
        REQUIRE(outcome.result.AsNumber() == Approx(1.0));
    }
}

TEST_CASE("SandboxExecutor reports deeply nested programs as SyntaxError", "[sandbox][executor][regression]")
{
    const auto executor = MakeExecutor();
    auto outcome = executor.Execute("result = " + std::string(200000, '-') + "1", test::MakePriceDataset());
    RequireFault(outcome, "SyntaxError");
}

TEST_CASE("SandboxExecutor rejects non-positive timeouts", "[sandbox][executor]")
{
    auto config = test::ShippedConfig().sandbox;
    config.timeout_ms = 0;
    REQUIRE_THROWS_AS(SandboxExecutor(config), ConfigError);
}

TEST_CASE("SandboxExecutor rejects a zero sequence cap", "[sandbox][executor]")
{
    auto config = test::ShippedConfig().sandbox;
    config.max_sequence_items = 0;
    REQUIRE_THROWS_AS(SandboxExecutor(config), ConfigError);
}
