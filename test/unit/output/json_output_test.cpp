//
// Tests for glaze JSON output of reports, outcomes and pipeline results
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlytics/serialization/json.h>
#include "integration/common/test_datasets.h"
#include "integration/mocks/mock_code_producer.h"
#include <glaze/glaze.hpp>
#include <trompeloeil.hpp>

using namespace nlytics;
using Catch::Matchers::ContainsSubstring;
using trompeloeil::_;

namespace {

glz::generic Parse(const std::string& json) {
    glz::generic parsed;
    auto ec = glz::read_json(parsed, json);
    REQUIRE_FALSE(ec);
    return parsed;
}

ExecutionOutcome Run(const std::string& code, const epoch_frame::DataFrame& dataset) {
    return SandboxExecutor(test::ShippedConfig().sandbox).Execute(code, dataset);
}

} // namespace

TEST_CASE("ToJson(ValidationReport)", "[output][json]")
{
    ValidationReport report;
    report.valid = false;
    report.score = 75;
    report.errors = {{epoch_core::ValidationErrorKind::ShapeError, "Must assign final result", 0}};

    auto json = Parse(ToJson(report));
    REQUIRE(json["valid"].get<bool>() == false);
    REQUIRE(json["score"].get<double>() == 75.0);
    REQUIRE(json["errors"][0]["kind"].get<std::string>() == "ShapeError");
    REQUIRE(json["warnings"].get<glz::generic::array_t>().empty());
}

TEST_CASE("ToJson(ExecutionOutcome)", "[output][json]")
{
    SECTION("frame result is written as a preview") {
        auto outcome = Run("result = dataset[['region', 'units']].head(2)", test::MakeSalesDataset());
        REQUIRE(outcome.success);

        auto json = Parse(ToJson(outcome));
        REQUIRE(json["success"].get<bool>());
        REQUIRE(json["result_type"].get<std::string>() == "TabularFrame");

        auto& result = json["result"];
        REQUIRE(result["rows"].get<double>() == 2.0);
        REQUIRE(result["columns"][0].get<std::string>() == "region");
        REQUIRE(result["data"][0][0].get<std::string>() == "north");
        REQUIRE(result["data"][1][1].get<double>() == 1.0);
    }

    SECTION("missing values become null") {
        auto outcome = Run("import numpy as np\nresult = [1.5, np.nan]", test::MakePriceDataset());
        REQUIRE(outcome.success);
        const auto text = ToJson(outcome);
        REQUIRE_THAT(text, ContainsSubstring("\"result\":[1.5,null]"));
    }

    SECTION("failure carries the error") {
        auto outcome = Run("result = 1 / 0", test::MakePriceDataset());
        auto json = Parse(ToJson(outcome));
        REQUIRE_FALSE(json["success"].get<bool>());
        REQUIRE(json["error"]["kind"].get<std::string>() == "RuntimeFault");
        REQUIRE_THAT(json["error"]["message"].get<std::string>(), ContainsSubstring("ZeroDivisionError"));
    }
}

TEST_CASE("ToJson(PipelineResult)", "[output][json]")
{
    auto producer = std::make_shared<test::MockCodeProducer>();
    trompeloeil::sequence seq;
    REQUIRE_CALL(*producer, Generate(_)).IN_SEQUENCE(seq).RETURN(test::MakeProgram("import socket\nresult = 1"));
    REQUIRE_CALL(*producer, Generate(_)).IN_SEQUENCE(seq).RETURN(test::MakeProgram("result = dataset['price'].max()"));

    const RetryOrchestrator orchestrator(test::ShippedConfig(), producer);
    auto result = orchestrator.Run(PipelineQuery{"highest price", "", ""}, test::MakePriceDataset());

    auto json = Parse(ToJson(result));
    REQUIRE(json["stage"].get<std::string>() == "Succeeded");
    REQUIRE(json["success"].get<bool>());
    REQUIRE(json["attempts"].get<double>() == 2.0);
    REQUIRE(json["query"].get<std::string>() == "highest price");
    REQUIRE(json["outcome"]["result"].get<double>() == 30.0);

    auto& history = json["history"].get<glz::generic::array_t>();
    REQUIRE(history.size() == 2);
    REQUIRE(history[0]["report"]["valid"].get<bool>() == false);
    REQUIRE_THAT(history[0]["feedback"].get<std::string>(), ContainsSubstring("UnauthorizedImport"));
    REQUIRE(history[1]["code"].get<std::string>() == "result = dataset['price'].max()");
}
