/**
 * @file retry_orchestrator_test.cpp
 * @brief RetryOrchestrator state machine against a mocked code producer
 *
 * Covers first-attempt success, validation and execution retries with
 * feedback, producer exceptions and attempt exhaustion.
 */

#include <nlytics/pipeline/retry_orchestrator.h>
#include "integration/common/test_datasets.h"
#include "integration/mocks/mock_code_producer.h"
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <trompeloeil.hpp>
#include <stdexcept>

using namespace nlytics;
using namespace nlytics::test;
using Catch::Approx;
using Catch::Matchers::ContainsSubstring;
using trompeloeil::_;

namespace {

bool FeedbackMentions(const GenerationRequest& request, const std::string& text) {
    return request.retry_feedback.has_value() && request.retry_feedback->find(text) != std::string::npos;
}

} // namespace

TEST_CASE("RetryOrchestrator - success paths", "[pipeline][orchestrator]")
{
    const auto dataset = MakePriceDataset();
    const PipelineQuery query{"total price", "sum of price", "sum the price column"};
    auto producer = std::make_shared<MockCodeProducer>();
    const RetryOrchestrator orchestrator(ShippedConfig(), producer);

    SECTION("first attempt succeeds") {
        REQUIRE_CALL(*producer, Generate(_))
            .WITH(_1.attempt == 1 && !_1.retry_feedback.has_value())
            .WITH(_1.query_text == "total price" && _1.execution_plan == "sum the price column")
            .WITH(_1.columns.size() == 1 && _1.columns[0].name == "price" && _1.columns[0].type == "integer")
            .RETURN(MakeProgram("result = dataset['price'].sum()"));

        auto result = orchestrator.Run(query, dataset);
        REQUIRE(result.Succeeded());
        REQUIRE(result.stage == epoch_core::PipelineStage::Succeeded);
        REQUIRE(result.attempts == 1);
        REQUIRE(result.history.size() == 1);
        REQUIRE(result.query == "total price");
        REQUIRE(result.outcome.has_value());
        REQUIRE(result.outcome->result.AsNumber() == Approx(60.0));
        REQUIRE(result.last_report->valid);
        REQUIRE_FALSE(result.last_feedback.has_value());
    }

    SECTION("generated code is normalized before validation") {
        REQUIRE_CALL(*producer, Generate(_)).RETURN(MakeProgram("\n    total = 1\n    result = total + 1\n"));

        auto result = orchestrator.Run(query, dataset);
        REQUIRE(result.Succeeded());
        REQUIRE(result.history[0].program->code == "total = 1\nresult = total + 1");
    }

    SECTION("execution failure feeds the error into the next attempt") {
        trompeloeil::sequence seq;
        REQUIRE_CALL(*producer, Generate(_))
            .WITH(_1.attempt == 1)
            .IN_SEQUENCE(seq)
            .RETURN(MakeProgram("result = dataset['nonexistent_column'].sum()"));
        REQUIRE_CALL(*producer, Generate(_))
            .WITH(_1.attempt == 2 && FeedbackMentions(_1, "KeyError: 'nonexistent_column'"))
            .WITH(FeedbackMentions(_1, "Traceback"))
            .IN_SEQUENCE(seq)
            .RETURN(MakeProgram("result = dataset['price'].sum()"));

        auto result = orchestrator.Run(query, dataset);
        REQUIRE(result.Succeeded());
        REQUIRE(result.attempts == 2);
        REQUIRE(result.history[0].outcome.has_value());
        REQUIRE_FALSE(result.history[0].outcome->success);
        REQUIRE_THAT(*result.last_feedback, ContainsSubstring("KeyError"));
    }

    SECTION("producer exception consumes an attempt") {
        trompeloeil::sequence seq;
        REQUIRE_CALL(*producer, Generate(_))
            .IN_SEQUENCE(seq)
            .THROW(std::runtime_error("service unavailable"));
        REQUIRE_CALL(*producer, Generate(_))
            .WITH(FeedbackMentions(_1, "ProducerError: service unavailable"))
            .IN_SEQUENCE(seq)
            .RETURN(MakeProgram("result = 1"));

        auto result = orchestrator.Run(query, dataset);
        REQUIRE(result.Succeeded());
        REQUIRE(result.attempts == 2);
        REQUIRE(result.history[0].producer_error == "service unavailable");
        REQUIRE_FALSE(result.history[0].program.has_value());
    }
}

TEST_CASE("RetryOrchestrator - exhaustion", "[pipeline][orchestrator]")
{
    const auto dataset = MakePriceDataset();
    const PipelineQuery query{"connect somewhere", "", ""};
    auto producer = std::make_shared<MockCodeProducer>();

    SECTION("always-invalid program uses exactly max attempts") {
        const RetryOrchestrator orchestrator(ShippedConfig(), producer);

        trompeloeil::sequence seq;
        REQUIRE_CALL(*producer, Generate(_))
            .WITH(_1.attempt == 1 && !_1.retry_feedback.has_value())
            .IN_SEQUENCE(seq)
            .RETURN(MakeProgram("import socket\nresult = 1"));
        REQUIRE_CALL(*producer, Generate(_))
            .WITH(_1.attempt > 1 && FeedbackMentions(_1, "UnauthorizedImport"))
            .TIMES(2)
            .IN_SEQUENCE(seq)
            .RETURN(MakeProgram("import socket\nresult = 1"));

        auto result = orchestrator.Run(query, dataset);
        REQUIRE_FALSE(result.Succeeded());
        REQUIRE(result.stage == epoch_core::PipelineStage::Failed);
        REQUIRE(result.attempts == 3);
        REQUIRE(result.history.size() == 3);
        REQUIRE_FALSE(result.outcome.has_value());
        REQUIRE(result.last_report.has_value());
        REQUIRE(result.last_report->HasError(epoch_core::ValidationErrorKind::UnauthorizedImport));
        for (const auto& record : result.history) {
            REQUIRE_FALSE(record.outcome.has_value());
            REQUIRE(record.feedback.has_value());
        }
        REQUIRE(*result.history[0].feedback != *result.history[1].feedback);
        REQUIRE(*result.history[1].feedback != *result.history[2].feedback);
    }

    SECTION("each attempt's feedback names that attempt's errors") {
        const RetryOrchestrator orchestrator(ShippedConfig(), producer);

        trompeloeil::sequence seq;
        REQUIRE_CALL(*producer, Generate(_))
            .WITH(_1.attempt == 1 && !_1.retry_feedback.has_value())
            .IN_SEQUENCE(seq)
            .RETURN(MakeProgram("import socket\nresult = 1"));
        REQUIRE_CALL(*producer, Generate(_))
            .WITH(_1.attempt == 2 && FeedbackMentions(_1, "Unauthorized import: socket"))
            .IN_SEQUENCE(seq)
            .RETURN(MakeProgram("top = 1"));
        REQUIRE_CALL(*producer, Generate(_))
            .WITH(_1.attempt == 3 && FeedbackMentions(_1, "ShapeError") && !FeedbackMentions(_1, "socket"))
            .IN_SEQUENCE(seq)
            .RETURN(MakeProgram("import os\nresult = 1"));

        auto result = orchestrator.Run(query, dataset);
        REQUIRE_FALSE(result.Succeeded());
        REQUIRE(result.history.size() == 3);

        const auto& first = *result.history[0].feedback;
        REQUIRE_THAT(first, ContainsSubstring("attempt 1"));
        REQUIRE_THAT(first, ContainsSubstring("Unauthorized import: socket"));
        REQUIRE_THAT(first, !ContainsSubstring("ShapeError"));

        const auto& second = *result.history[1].feedback;
        REQUIRE_THAT(second, ContainsSubstring("attempt 2"));
        REQUIRE_THAT(second, ContainsSubstring("ShapeError"));
        REQUIRE_THAT(second, !ContainsSubstring("UnauthorizedImport"));

        const auto& third = *result.history[2].feedback;
        REQUIRE_THAT(third, ContainsSubstring("attempt 3"));
        REQUIRE_THAT(third, ContainsSubstring("Unauthorized import: os"));
        REQUIRE_THAT(third, !ContainsSubstring("ShapeError"));

        REQUIRE(result.last_report->HasError(epoch_core::ValidationErrorKind::UnauthorizedImport));
        REQUIRE_FALSE(result.last_report->HasError(epoch_core::ValidationErrorKind::ShapeError));
    }

    SECTION("single attempt configuration stops after one failure") {
        auto config = ShippedConfig();
        config.retry.max_attempts = 1;
        const RetryOrchestrator orchestrator(config, producer);

        REQUIRE_CALL(*producer, Generate(_)).TIMES(1).RETURN(MakeProgram("result = 1 / 0"));

        auto result = orchestrator.Run(query, dataset);
        REQUIRE_FALSE(result.Succeeded());
        REQUIRE(result.attempts == 1);
        REQUIRE(result.outcome.has_value());
        REQUIRE_THAT(result.outcome->error->message, ContainsSubstring("ZeroDivisionError"));
    }
}

TEST_CASE("RetryOrchestrator - construction", "[pipeline][orchestrator]")
{
    SECTION("null producer") {
        REQUIRE_THROWS_AS(RetryOrchestrator(ShippedConfig(), nullptr), std::invalid_argument);
    }

    SECTION("invalid retry configuration") {
        auto config = ShippedConfig();
        config.retry.max_attempts = 0;
        REQUIRE_THROWS_AS(RetryOrchestrator(config, std::make_shared<MockCodeProducer>()), ConfigError);
    }
}
