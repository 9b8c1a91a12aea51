//
// Tests for retry feedback text and generated-code normalization
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlytics/pipeline/feedback.h>

using namespace nlytics;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;
using Catch::Matchers::StartsWith;
using epoch_core::ValidationErrorKind;

TEST_CASE("BuildValidationFeedback lists every error", "[pipeline][feedback]")
{
    ValidationReport report;
    report.errors = {
        {ValidationErrorKind::UnauthorizedImport, "Unauthorized import: socket", 1},
        {ValidationErrorKind::ShapeError, "Must assign final result to variable \"result\"", 0},
    };
    report.warnings = {{"Column \"revenue\" not found in dataset", 2}};

    const auto feedback = BuildValidationFeedback(report, 2);
    REQUIRE(feedback == "The code generated on attempt 2 has issues:\n"
                        "\n- UnauthorizedImport (line 1): Unauthorized import: socket"
                        "\n- ShapeError (line 0): Must assign final result to variable \"result\""
                        "\n\nPlease regenerate the code addressing these issues.");
    REQUIRE_THAT(feedback, !ContainsSubstring("revenue"));
}

TEST_CASE("BuildExecutionFeedback joins message and trace", "[pipeline][feedback]")
{
    ExecutionOutcome outcome;
    outcome.error = ExecutionError{epoch_core::ExecutionFaultKind::RuntimeFault, "KeyError: 'nonexistent_column'",
                                   "Traceback (most recent call last):\nKeyError: 'nonexistent_column'", 1};

    const auto feedback = BuildExecutionFeedback(outcome);
    REQUIRE_THAT(feedback, StartsWith("KeyError: 'nonexistent_column'\n\nTraceback"));

    SECTION("successful outcomes produce no feedback") {
        REQUIRE(BuildExecutionFeedback(ExecutionOutcome{}).empty());
    }
}

TEST_CASE("BuildProducerFeedback names the failure", "[pipeline][feedback]")
{
    const auto feedback = BuildProducerFeedback("service unavailable");
    REQUIRE_THAT(feedback, StartsWith("ProducerError: service unavailable"));
    REQUIRE_THAT(feedback, EndsWith("Please generate the code again."));
}

TEST_CASE("NormalizeGeneratedCode strips shared indentation", "[pipeline][feedback]")
{
    SECTION("indented block with surrounding blank lines") {
        const std::string code = "\n\n    x = 1\n    if x:\n        result = x\n\n";
        REQUIRE(NormalizeGeneratedCode(code) == "x = 1\nif x:\n    result = x");
    }

    SECTION("windows line endings") {
        REQUIRE(NormalizeGeneratedCode("a = 1\r\nresult = a\r\n") == "a = 1\nresult = a");
    }

    SECTION("interior blank lines are kept empty") {
        REQUIRE(NormalizeGeneratedCode("  a = 1\n   \n  result = a") == "a = 1\n\nresult = a");
    }

    SECTION("already normalized code is unchanged") {
        REQUIRE(NormalizeGeneratedCode("result = 1") == "result = 1");
    }

    SECTION("blank input") {
        REQUIRE(NormalizeGeneratedCode("  \n\n").empty());
    }
}
