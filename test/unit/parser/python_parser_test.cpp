//
// Tests for the tree-sitter front end: accepted subset, line numbers and rejections
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "parser/python_parser.h"
#include <string>

using namespace nlytics;
using Catch::Matchers::ContainsSubstring;

namespace {

template <typename T>
const T* As(const StmtPtr& stmt) {
    return dynamic_cast<const T*>(stmt.get());
}

} // namespace

TEST_CASE("PythonParser builds statements for the supported subset", "[parser]")
{
    PythonParser parser;

    SECTION("simple assignment keeps target and line") {
        auto module = parser.parse("x = 1\nresult = x + 2\n");
        REQUIRE(module->body.size() == 2);

        const auto* second = As<Assign>(module->body[1]);
        REQUIRE(second != nullptr);
        REQUIRE(second->lineno == 2);
        REQUIRE(second->targets.size() == 1);

        const auto* target = dynamic_cast<const Name*>(second->targets[0].get());
        REQUIRE(target != nullptr);
        REQUIRE(target->id == "result");
        REQUIRE(dynamic_cast<const BinOp*>(second->value.get()) != nullptr);
    }

    SECTION("chained assignment keeps every target") {
        auto module = parser.parse("a = b = 3");
        const auto* assign = As<Assign>(module->body[0]);
        REQUIRE(assign != nullptr);
        REQUIRE(assign->targets.size() == 2);
    }

    SECTION("imports with aliases") {
        auto module = parser.parse("import pandas as pd\nfrom numpy import mean, std as sd\n");
        REQUIRE(module->body.size() == 2);

        const auto* import = As<Import>(module->body[0]);
        REQUIRE(import != nullptr);
        REQUIRE(import->names.size() == 1);
        REQUIRE(import->names[0].name == "pandas");
        REQUIRE(import->names[0].asname == "pd");

        const auto* importFrom = As<ImportFrom>(module->body[1]);
        REQUIRE(importFrom != nullptr);
        REQUIRE(importFrom->module == "numpy");
        REQUIRE(importFrom->names.size() == 2);
        REQUIRE(importFrom->names[1].asname == "sd");
    }

    SECTION("control flow bodies are nested") {
        auto module = parser.parse(R"(
total = 0
for value in [1, 2, 3]:
    if value > 1:
        total += value
    else:
        continue
while total > 10:
    total -= 1
)");
        REQUIRE(module->body.size() == 3);
        const auto* loop = As<For>(module->body[1]);
        REQUIRE(loop != nullptr);
        REQUIRE(loop->body.size() == 1);

        const auto* branch = As<If>(loop->body[0]);
        REQUIRE(branch != nullptr);
        REQUIRE(branch->orelse.size() == 1);
        REQUIRE(As<Continue>(branch->orelse[0]) != nullptr);
        REQUIRE(As<While>(module->body[2]) != nullptr);
    }

    SECTION("comparison chains stay in one node") {
        auto module = parser.parse("flag = 1 < 2 <= 3");
        const auto* assign = As<Assign>(module->body[0]);
        const auto* compare = dynamic_cast<const Compare*>(assign->value.get());
        REQUIRE(compare != nullptr);
        REQUIRE(compare->ops.size() == 2);
        REQUIRE(compare->ops[0] == CmpOpType::Lt);
        REQUIRE(compare->ops[1] == CmpOpType::LtE);
    }

    SECTION("f-strings become joined parts") {
        auto module = parser.parse("label = f\"total={value:.2f}\"");
        const auto* assign = As<Assign>(module->body[0]);
        const auto* joined = dynamic_cast<const JoinedStr*>(assign->value.get());
        REQUIRE(joined != nullptr);
        REQUIRE(joined->values.size() == 2);

        const auto* field = dynamic_cast<const FormattedValue*>(joined->values[1].get());
        REQUIRE(field != nullptr);
        REQUIRE(field->format_spec == ".2f");
    }

    SECTION("keyword arguments on calls") {
        auto module = parser.parse("top = dataset.sort_values('price', ascending=False)");
        const auto* assign = As<Assign>(module->body[0]);
        const auto* call = dynamic_cast<const Call*>(assign->value.get());
        REQUIRE(call != nullptr);
        REQUIRE(call->args.size() == 1);
        REQUIRE(call->keywords.size() == 1);
        REQUIRE(call->keywords[0].first == "ascending");
    }

    SECTION("list comprehension with a filter") {
        auto module = parser.parse("evens = [x * 2 for x in range(10) if x % 2 == 0]");
        const auto* assign = As<Assign>(module->body[0]);
        const auto* comp = dynamic_cast<const ListComp*>(assign->value.get());
        REQUIRE(comp != nullptr);
        REQUIRE(comp->generators.size() == 1);
        REQUIRE(comp->generators[0].ifs.size() == 1);
    }
}

TEST_CASE("PythonParser rejects invalid and unsupported programs", "[parser]")
{
    PythonParser parser;

    SECTION("syntax error reports its line") {
        try {
            (void)parser.parse("x = 1\ny = (2 +\n");
            FAIL("Expected PythonParseError");
        } catch (const PythonParseError& e) {
            REQUIRE(e.line() >= 2);
        }
    }

    SECTION("function definitions are outside the subset") {
        REQUIRE_THROWS_WITH(parser.parse("def f():\n    pass\n"), ContainsSubstring("function definition"));
    }

    SECTION("class definitions are outside the subset") {
        REQUIRE_THROWS_WITH(parser.parse("class A:\n    pass\n"), ContainsSubstring("class definition"));
    }

    SECTION("attribute assignment is rejected") {
        REQUIRE_THROWS_AS(parser.parse("dataset.price = 1"), PythonParseError);
    }

    SECTION("lambda is rejected") {
        REQUIRE_THROWS_AS(parser.parse("f = lambda x: x"), PythonParseError);
    }
}

TEST_CASE("PythonParser bounds nesting depth", "[parser][regression]")
{
    PythonParser parser;

    SECTION("moderate nesting parses") {
        auto module = parser.parse("result = " + std::string(100, '-') + "1");
        REQUIRE(module->body.size() == 1);
    }

    SECTION("deep unary chain is rejected") {
        REQUIRE_THROWS_WITH(parser.parse("result = " + std::string(200000, '-') + "1"),
                            ContainsSubstring("nested too deeply"));
    }

    SECTION("deep parentheses are rejected") {
        const std::string code = "result = " + std::string(1000, '(') + "1" + std::string(1000, ')');
        REQUIRE_THROWS_WITH(parser.parse(code), ContainsSubstring("nested too deeply"));
    }

    SECTION("depth resets between parses") {
        REQUIRE_THROWS_AS(parser.parse("result = " + std::string(1000, '-') + "1"), PythonParseError);
        auto module = parser.parse("result = " + std::string(100, '-') + "1");
        REQUIRE(module->body.size() == 1);
    }
}
