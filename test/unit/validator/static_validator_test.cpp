//
// Tests for the static validator: deny-list, syntax, result shape, imports and column audit
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlytics/validator/static_validator.h>
#include "integration/common/test_datasets.h"

using namespace nlytics;
using Catch::Matchers::ContainsSubstring;
using epoch_core::ValidationErrorKind;

namespace {

const std::vector<std::string> kSalesColumns{"region", "product", "price", "units"};

StaticValidator MakeValidator() {
    return StaticValidator(test::ShippedConfig().validator);
}

} // namespace

TEST_CASE("StaticValidator accepts well-formed programs", "[validator]")
{
    const auto validator = MakeValidator();

    SECTION("plain aggregation") {
        auto report = validator.Validate("result = dataset['price'].sum()", kSalesColumns);
        REQUIRE(report.valid);
        REQUIRE(report.errors.empty());
        REQUIRE(report.warnings.empty());
        REQUIRE(report.score == 100);
    }

    SECTION("allow-listed imports") {
        auto report = validator.Validate("import pandas as pd\nimport numpy as np\nresult = np.mean([1, 2])",
                                         kSalesColumns);
        REQUIRE(report.valid);
    }

    SECTION("result bound inside a loop counts as assigned") {
        auto report = validator.Validate("for result in range(3):\n    pass\n", kSalesColumns);
        REQUIRE(report.valid);
    }

    SECTION("result bound through tuple unpacking") {
        auto report = validator.Validate("count, result = 1, 2", kSalesColumns);
        REQUIRE(report.valid);
    }
}

TEST_CASE("StaticValidator rejects unsafe or malformed programs", "[validator]")
{
    const auto validator = MakeValidator();

    SECTION("unauthorized import") {
        auto report = validator.Validate("import socket\nresult = 1", kSalesColumns);
        REQUIRE_FALSE(report.valid);
        REQUIRE(report.HasError(ValidationErrorKind::UnauthorizedImport));
        REQUIRE(report.errors.size() == 1);
        REQUIRE(report.errors[0].line == 1);
        REQUIRE_THAT(report.errors[0].message, ContainsSubstring("socket"));
        REQUIRE(report.score == 75);
    }

    SECTION("unauthorized from-import") {
        auto report = validator.Validate("from os import path\nresult = 1", kSalesColumns);
        REQUIRE(report.HasError(ValidationErrorKind::UnauthorizedImport));
    }

    SECTION("result never assigned") {
        auto report = validator.Validate("top = dataset.nlargest(3, 'price')", kSalesColumns);
        REQUIRE_FALSE(report.valid);
        REQUIRE(report.HasError(ValidationErrorKind::ShapeError));
        REQUIRE_THAT(report.errors[0].message, ContainsSubstring("result"));
    }

    SECTION("comparison against result is not an assignment") {
        auto report = validator.Validate("flag = result == 3", kSalesColumns);
        REQUIRE(report.HasError(ValidationErrorKind::ShapeError));
    }

    SECTION("deny-list hit reports the line") {
        auto report = validator.Validate("x = 1\nresult = eval('1 + 1')", kSalesColumns);
        REQUIRE_FALSE(report.valid);
        REQUIRE(report.HasError(ValidationErrorKind::SecurityViolation));

        const auto& issue = report.errors.front();
        REQUIRE(issue.kind == ValidationErrorKind::SecurityViolation);
        REQUIRE(issue.line == 2);
        REQUIRE_THAT(issue.message, ContainsSubstring("eval"));
    }

    SECTION("deny-list matches case-insensitively") {
        auto report = validator.Validate("result = OPEN('data.csv')", kSalesColumns);
        REQUIRE(report.HasError(ValidationErrorKind::SecurityViolation));
    }

    SECTION("persistence calls are denied") {
        auto report = validator.Validate("dataset.to_csv('out.csv')\nresult = 1", kSalesColumns);
        REQUIRE(report.HasError(ValidationErrorKind::SecurityViolation));
    }

    SECTION("syntax errors still check the result by text") {
        auto report = validator.Validate("result = (1 +", kSalesColumns);
        REQUIRE(report.HasError(ValidationErrorKind::SyntaxError));
        REQUIRE_FALSE(report.HasError(ValidationErrorKind::ShapeError));
    }

    SECTION("errors accumulate and floor the score") {
        auto report = validator.Validate("import socket\nimport subprocess\nx = eval('1')\ny = exec('2')\nz = 3",
                                         kSalesColumns);
        REQUIRE(report.errors.size() >= 4);
        REQUIRE(report.score == 0);
    }
}

TEST_CASE("StaticValidator column audit only warns", "[validator]")
{
    const auto validator = MakeValidator();

    auto report = validator.Validate("result = dataset['revenue'].sum()", kSalesColumns);
    REQUIRE(report.valid);
    REQUIRE(report.warnings.size() == 1);
    REQUIRE_THAT(report.warnings[0].message, ContainsSubstring("revenue"));
    REQUIRE(report.score == 95);

    SECTION("known columns produce no warning") {
        auto known = validator.Validate("result = dataset.groupby('region')['units'].sum()", kSalesColumns);
        REQUIRE(known.warnings.empty());
    }

    SECTION("short literals are ignored") {
        auto shortLiteral = validator.Validate("result = dataset['id']", kSalesColumns);
        REQUIRE(shortLiteral.warnings.empty());
    }
}

TEST_CASE("Known deny-list bypass forms pass validation", "[validator][regression]")
{
    // The executor rejects these; see the sandbox executor tests
    const auto validator = MakeValidator();
    REQUIRE(validator.Validate("e = eval\nresult = e('1 + 1')", kSalesColumns).valid);
    REQUIRE(validator.Validate("g = getattr\nresult = g(dataset, 'shape')", kSalesColumns).valid);
}

TEST_CASE("StaticValidator bounds the text it scans", "[validator][regression]")
{
    const auto validator = MakeValidator();

    SECTION("program above max_code_bytes is rejected before scanning") {
        std::string code = "result = 1\n";
        while (code.size() < (1U << 20)) {
            code += "x = 'padding padding padding padding padding padding padding'\n";
        }
        auto report = validator.Validate(code, kSalesColumns);
        REQUIRE_FALSE(report.valid);
        REQUIRE(report.errors.size() == 1);
        REQUIRE(report.errors[0].kind == ValidationErrorKind::SecurityViolation);
        REQUIRE(report.errors[0].line == 0);
        REQUIRE_THAT(report.errors[0].message, ContainsSubstring("exceeds the limit"));
        REQUIRE(report.warnings.empty());
    }

    SECTION("overlong identifier is rejected without running the deny-list") {
        const std::string code = "x = 1\nresult = read_" + std::string(50000, 'a') + "()";
        auto report = validator.Validate(code, kSalesColumns);
        REQUIRE_FALSE(report.valid);
        REQUIRE(report.errors.size() == 1);
        REQUIRE(report.errors[0].kind == ValidationErrorKind::SecurityViolation);
        REQUIRE(report.errors[0].line == 2);
        REQUIRE_THAT(report.errors[0].message, ContainsSubstring("Line of"));
    }

    SECTION("overlong quoted literal is rejected") {
        auto report = validator.Validate("result = dataset['" + std::string(50000, 'c') + "']", kSalesColumns);
        REQUIRE_FALSE(report.valid);
        REQUIRE(report.HasError(ValidationErrorKind::SecurityViolation));
    }

    SECTION("lines within the limit are still scanned per line") {
        const std::string code = "x = '" + std::string(900, 'a') + "'\nresult = read_csv('f')";
        auto report = validator.Validate(code, kSalesColumns);
        REQUIRE(report.HasError(ValidationErrorKind::SecurityViolation));
        REQUIRE(report.errors.front().line == 2);
    }

    SECTION("deep nesting is a syntax error") {
        auto report = validator.Validate("result = " + std::string(300, '-') + "1", kSalesColumns);
        REQUIRE_FALSE(report.valid);
        REQUIRE(report.HasError(ValidationErrorKind::SyntaxError));
        REQUIRE_FALSE(report.HasError(ValidationErrorKind::ShapeError));
    }
}

TEST_CASE("ComputeValidationScore deducts per issue", "[validator]")
{
    REQUIRE(ComputeValidationScore(0, 0) == 100);
    REQUIRE(ComputeValidationScore(1, 0) == 75);
    REQUIRE(ComputeValidationScore(0, 3) == 85);
    REQUIRE(ComputeValidationScore(2, 2) == 40);
    REQUIRE(ComputeValidationScore(5, 0) == 0);
}
