//
// Tests for YAML pipeline configuration loading and validation
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlytics/config/pipeline_config.h>
#include "integration/common/test_datasets.h"
#include <algorithm>
#include <string>

using namespace nlytics;
using Catch::Matchers::ContainsSubstring;

namespace {

constexpr const char* kMinimalConfig = R"(
result_name: answer
allowed_modules: [pandas]
retry:
  max_attempts: 2
validator:
  column_literal_min_length: 4
  max_code_bytes: 2048
  max_line_length: 200
  deny_patterns:
    - { pattern: '\beval\s*\(', description: dynamic evaluation }
sandbox:
  timeout_ms: 500
  dataset_binding: df
  max_output_bytes: 128
  max_sequence_items: 1000
  module_aliases:
    pd: pandas
)";

std::string ReplaceLine(std::string text, const std::string& from, const std::string& to) {
    const auto pos = text.find(from);
    REQUIRE(pos != std::string::npos);
    return text.replace(pos, from.size(), to);
}

} // namespace

TEST_CASE("Shipped configuration loads with the documented defaults", "[config]")
{
    const auto config = test::ShippedConfig();

    REQUIRE(config.retry.max_attempts == 3);
    REQUIRE(config.validator.result_name == "result");
    REQUIRE(config.sandbox.result_name == "result");
    REQUIRE(config.sandbox.dataset_binding == "dataset");
    REQUIRE(config.sandbox.timeout_ms == 30000);
    REQUIRE(config.validator.allowed_modules == std::vector<std::string>{"pandas", "numpy", "pd", "np"});
    REQUIRE(config.sandbox.module_aliases.at("pd") == "pandas");
    REQUIRE(config.sandbox.module_aliases.at("np") == "numpy");
    REQUIRE(config.sandbox.max_sequence_items == 2000000);
    REQUIRE(config.validator.max_code_bytes == 65536);
    REQUIRE(config.validator.max_line_length == 1000);

    const auto& deny = config.validator.deny_patterns;
    REQUIRE(std::ranges::any_of(deny, [](const DenyPattern& p) { return p.pattern.find("eval") != std::string::npos; }));
}

TEST_CASE("ParsePipelineConfig decodes every section", "[config]")
{
    const auto config = ParsePipelineConfig(kMinimalConfig);

    REQUIRE(config.retry.max_attempts == 2);
    REQUIRE(config.validator.result_name == "answer");
    REQUIRE(config.validator.column_literal_min_length == 4);
    REQUIRE(config.validator.deny_patterns.size() == 1);
    REQUIRE(config.validator.deny_patterns[0].description == "dynamic evaluation");
    REQUIRE(config.sandbox.result_name == "answer");
    REQUIRE(config.sandbox.timeout_ms == 500);
    REQUIRE(config.sandbox.dataset_binding == "df");
    REQUIRE(config.sandbox.max_output_bytes == 128);
    REQUIRE(config.sandbox.max_sequence_items == 1000);
    REQUIRE(config.validator.max_code_bytes == 2048);
    REQUIRE(config.validator.max_line_length == 200);
    REQUIRE(config.sandbox.allowed_modules == std::vector<std::string>{"pandas"});
}

TEST_CASE("ParsePipelineConfig rejects invalid configuration", "[config]")
{
    SECTION("max_attempts below one") {
        auto text = ReplaceLine(kMinimalConfig, "max_attempts: 2", "max_attempts: 0");
        REQUIRE_THROWS_WITH(ParsePipelineConfig(text), ContainsSubstring("max_attempts"));
    }

    SECTION("timeout below one") {
        auto text = ReplaceLine(kMinimalConfig, "timeout_ms: 500", "timeout_ms: 0");
        REQUIRE_THROWS_AS(ParsePipelineConfig(text), ConfigError);
    }

    SECTION("missing required key names the key") {
        auto text = ReplaceLine(kMinimalConfig, "  dataset_binding: df\n", "");
        REQUIRE_THROWS_WITH(ParsePipelineConfig(text), ContainsSubstring("sandbox.dataset_binding"));
    }

    SECTION("missing module_aliases is rejected") {
        auto text = ReplaceLine(kMinimalConfig, "  module_aliases:\n    pd: pandas\n", "");
        REQUIRE_THROWS_WITH(ParsePipelineConfig(text), ContainsSubstring("sandbox.module_aliases"));
    }

    SECTION("missing sequence cap is rejected") {
        auto text = ReplaceLine(kMinimalConfig, "  max_sequence_items: 1000\n", "");
        REQUIRE_THROWS_WITH(ParsePipelineConfig(text), ContainsSubstring("sandbox.max_sequence_items"));
    }

    SECTION("missing code size limit is rejected") {
        auto text = ReplaceLine(kMinimalConfig, "  max_code_bytes: 2048\n", "");
        REQUIRE_THROWS_WITH(ParsePipelineConfig(text), ContainsSubstring("validator.max_code_bytes"));
    }

    SECTION("line length above the scannable bound") {
        auto text = ReplaceLine(kMinimalConfig, "max_line_length: 200", "max_line_length: 100000");
        REQUIRE_THROWS_WITH(ParsePipelineConfig(text), ContainsSubstring("max_line_length"));
    }

    SECTION("zero sequence cap") {
        auto text = ReplaceLine(kMinimalConfig, "max_sequence_items: 1000", "max_sequence_items: 0");
        REQUIRE_THROWS_AS(ParsePipelineConfig(text), ConfigError);
    }

    SECTION("malformed deny regex") {
        auto text = ReplaceLine(kMinimalConfig, R"('\beval\s*\(')", R"('(unclosed')");
        REQUIRE_THROWS_WITH(ParsePipelineConfig(text), ContainsSubstring("deny pattern"));
    }

    SECTION("alias to an unsupported module") {
        auto text = ReplaceLine(kMinimalConfig, "pd: pandas", "pd: requests");
        REQUIRE_THROWS_AS(ParsePipelineConfig(text), ConfigError);
    }

    SECTION("wrong value type") {
        auto text = ReplaceLine(kMinimalConfig, "max_attempts: 2", "max_attempts: many");
        REQUIRE_THROWS_AS(ParsePipelineConfig(text), ConfigError);
    }

    SECTION("malformed YAML") {
        REQUIRE_THROWS_AS(ParsePipelineConfig("retry: [unterminated"), ConfigError);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(LoadPipelineConfig("/nonexistent/nlytics.yaml"), ConfigError);
    }
}
