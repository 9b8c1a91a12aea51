//
// NLytics Python Parser
//
// Parses the supported Python subset with tree-sitter and converts the
// concrete syntax tree into the AST in ast_nodes.h. Anything outside the
// subset is rejected with a PythonParseError.
//

#pragma once

#include "ast_nodes.h"
#include <cpp-tree-sitter.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace nlytics {

// Recursion limit for nested expressions and blocks
constexpr int kMaxNestingDepth = 256;

class PythonParseError : public std::runtime_error {
public:
    PythonParseError(const std::string& msg, int line, int col)
        : std::runtime_error(msg), line_(line), col_(col) {}

    int line() const { return line_; }
    int column() const { return col_; }

private:
    int line_;
    int col_;
};

class PythonParser {
public:
    PythonParser();

    ModulePtr parse(const std::string& source);

private:
    std::optional<ts::Parser> parser_;
    int depth_ = 0;

    // Counts one level of recursive descent; throws past kMaxNestingDepth
    class NestingGuard {
    public:
        NestingGuard(PythonParser& parser, const ts::Node& node);
        ~NestingGuard() { --parser_.depth_; }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

    private:
        PythonParser& parser_;
    };

    static std::string getNodeText(const ts::Node& node, std::string_view source);
    [[noreturn]] static void throwError(const std::string& msg, const ts::Node& node);
    [[noreturn]] static void throwUnsupported(const std::string& what, const ts::Node& node);
    [[noreturn]] static void throwSyntaxError(const ts::Node& root);
    static void validateTarget(const Expr& target, const ts::Node& node);

    // Statements
    ModulePtr parseModule(const ts::Node& node, std::string_view source);
    void parseStatementInto(const ts::Node& node, std::string_view source, StmtList& out);
    StmtList parseBlock(const ts::Node& node, std::string_view source);
    StmtPtr parseExprStmt(const ts::Node& node, std::string_view source);
    StmtPtr parseAssignment(const ts::Node& node, std::string_view source);
    StmtPtr parseAugAssignment(const ts::Node& node, std::string_view source);
    StmtPtr parseImport(const ts::Node& node, std::string_view source);
    StmtPtr parseImportFrom(const ts::Node& node, std::string_view source);
    StmtPtr parseIf(const ts::Node& node, std::string_view source);
    StmtList parseElseChain(const std::vector<ts::Node>& clauses, size_t index, std::string_view source);
    StmtPtr parseFor(const ts::Node& node, std::string_view source);
    StmtPtr parseWhile(const ts::Node& node, std::string_view source);

    // Expressions
    ExprPtr parseExpression(const ts::Node& node, std::string_view source);
    ExprPtr parseName(const ts::Node& node, std::string_view source);
    ExprPtr parseConstant(const ts::Node& node, std::string_view source);
    ExprPtr parseString(const ts::Node& node, std::string_view source);
    ExprPtr parseConcatenatedString(const ts::Node& node, std::string_view source);
    ExprPtr parseAttribute(const ts::Node& node, std::string_view source);
    ExprPtr parseCall(const ts::Node& node, std::string_view source);
    ExprPtr parseBinaryOp(const ts::Node& node, std::string_view source);
    ExprPtr parseCompare(const ts::Node& node, std::string_view source);
    ExprPtr parseBoolOp(const ts::Node& node, std::string_view source);
    ExprPtr parseUnaryOp(const ts::Node& node, std::string_view source);
    ExprPtr parseIfExp(const ts::Node& node, std::string_view source);
    ExprPtr parseSubscript(const ts::Node& node, std::string_view source);
    ExprPtr parseSlice(const ts::Node& node, std::string_view source);
    ExprPtr parseTuple(const ts::Node& node, std::string_view source);
    ExprPtr parseList(const ts::Node& node, std::string_view source);
    ExprPtr parseDict(const ts::Node& node, std::string_view source);
    ExprPtr parseListComp(const ts::Node& node, std::string_view source);

    static std::optional<BinOpType> parseBinOpType(const std::string& opText);
    static std::optional<UnaryOpType> parseUnaryOpType(const std::string& opText);
    static std::optional<CmpOpType> parseCmpOpType(const std::string& opText);
};

} // namespace nlytics
