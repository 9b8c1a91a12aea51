//
// Tests for lowering the script AST into sandbox instructions
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "parser/python_parser.h"
#include "sandbox/compiler/program_compiler.h"
#include <algorithm>
#include <string>
#include <vector>

using namespace nlytics;
using namespace nlytics::sandbox;
using Catch::Matchers::ContainsSubstring;

namespace {

CodeObject CompileSource(const std::string& source) {
    PythonParser parser;
    auto module = parser.parse(source);
    return ProgramCompiler{}.Compile(*module);
}

std::vector<OpCode> OpCodes(const CodeObject& code) {
    std::vector<OpCode> ops;
    for (const auto& instruction : code.instructions) {
        ops.push_back(instruction.op);
    }
    return ops;
}

bool Contains(const std::vector<OpCode>& ops, OpCode op) {
    return std::ranges::find(ops, op) != ops.end();
}

} // namespace

TEST_CASE("ProgramCompiler lowers statements", "[compiler]")
{
    SECTION("assignment loads then stores") {
        auto code = CompileSource("result = 42");
        REQUIRE(OpCodes(code) == std::vector<OpCode>{OpCode::LoadConst, OpCode::StoreName});
        REQUIRE(code.names == std::vector<std::string>{"result"});
        REQUIRE(std::get<int64_t>(code.constants.at(0)) == 42);
    }

    SECTION("every instruction carries its source line") {
        auto code = CompileSource("a = 1\n\nb = a * 2\n");
        REQUIRE(code.instructions.front().line == 1);
        REQUIRE(code.instructions.back().line == 3);
    }

    SECTION("import binds the top-level package name") {
        auto code = CompileSource("import numpy as np");
        REQUIRE(OpCodes(code) == std::vector<OpCode>{OpCode::ImportModule, OpCode::StoreName});
        REQUIRE(code.names == std::vector<std::string>{"numpy", "np"});
    }

    SECTION("from-import keeps the module until the last name") {
        auto code = CompileSource("from numpy import mean, median");
        REQUIRE(OpCodes(code) == std::vector<OpCode>{OpCode::ImportModule, OpCode::ImportFrom, OpCode::StoreName,
                                                     OpCode::ImportFrom, OpCode::StoreName, OpCode::Pop});
    }

    SECTION("for loops iterate and jump back") {
        auto ops = OpCodes(CompileSource("total = 0\nfor v in [1, 2]:\n    total += v\n"));
        REQUIRE(Contains(ops, OpCode::GetIter));
        REQUIRE(Contains(ops, OpCode::ForIter));
        REQUIRE(Contains(ops, OpCode::Jump));
        REQUIRE(Contains(ops, OpCode::BinaryOp));
    }

    SECTION("jump targets stay inside the program") {
        auto code = CompileSource("x = 0\nwhile x < 5:\n    if x == 3:\n        break\n    x += 1\n");
        for (const auto& instruction : code.instructions) {
            if (instruction.op == OpCode::Jump || instruction.op == OpCode::JumpIfFalse ||
                instruction.op == OpCode::JumpIfTrue || instruction.op == OpCode::ForIter) {
                REQUIRE(instruction.arg >= 0);
                REQUIRE(static_cast<size_t>(instruction.arg) <= code.instructions.size());
            }
        }
    }

    SECTION("chained comparisons short-circuit") {
        auto ops = OpCodes(CompileSource("ok = 1 < 2 < 3"));
        REQUIRE(Contains(ops, OpCode::DupTop));
        REQUIRE(Contains(ops, OpCode::RotThree));
        REQUIRE(Contains(ops, OpCode::JumpIfFalseOrPop));
    }

    SECTION("keyword calls record their shape") {
        auto code = CompileSource("top = dataset.nlargest(3, columns='price')");
        REQUIRE(code.callShapes.size() == 1);
        REQUIRE(code.callShapes[0].positional == 1);
        REQUIRE(code.callShapes[0].keywords == std::vector<std::string>{"columns"});
    }

    SECTION("f-string fields record conversion and spec") {
        auto code = CompileSource("s = f\"{total!r} {share:.1%}\"");
        REQUIRE(code.formats.size() == 2);
        REQUIRE(code.formats[0].conversion == 'r');
        REQUIRE(code.formats[1].spec == ".1%");
        REQUIRE(Contains(OpCodes(code), OpCode::BuildString));
    }

    SECTION("subscript assignment stores through the container") {
        auto ops = OpCodes(CompileSource("dataset['total'] = dataset['price'] * 2"));
        REQUIRE(ops.back() == OpCode::StoreSubscript);
    }
}

TEST_CASE("ProgramCompiler rejects misplaced statements", "[compiler]")
{
    SECTION("break outside loop") {
        try {
            (void)CompileSource("x = 1\nbreak\n");
            FAIL("Expected CompileError");
        } catch (const CompileError& e) {
            REQUIRE_THAT(e.what(), ContainsSubstring("'break' outside loop"));
            REQUIRE(e.Line() == 2);
        }
    }

    SECTION("continue outside loop") {
        REQUIRE_THROWS_AS(CompileSource("continue"), CompileError);
    }

    SECTION("wildcard import") {
        REQUIRE_THROWS_WITH(CompileSource("from pandas import *"), ContainsSubstring("wildcard"));
    }
}

TEST_CASE("OpCodeName names every instruction", "[compiler]")
{
    REQUIRE(std::string{OpCodeName(OpCode::LoadConst)} == "LoadConst");
    REQUIRE(std::string{OpCodeName(OpCode::ImportFrom)} == "ImportFrom");
    REQUIRE(std::string{OpCodeName(OpCode::RotThree)} == "RotThree");
}
