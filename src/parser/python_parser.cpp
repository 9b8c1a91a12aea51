//
// NLytics Python Parser Implementation
//

#include "python_parser.h"
#include <tree_sitter/api.h>
#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_map>

// Declare the tree-sitter-python language function
extern "C" {
    const TSLanguage *tree_sitter_python();
}

namespace nlytics {

namespace {

const std::unordered_map<std::string, std::string>& unsupportedNodeNames() {
    static const std::unordered_map<std::string, std::string> names = {
        {"function_definition", "function definition"},
        {"decorated_definition", "decorator"},
        {"class_definition", "class definition"},
        {"with_statement", "with statement"},
        {"try_statement", "try statement"},
        {"return_statement", "return statement"},
        {"global_statement", "global statement"},
        {"nonlocal_statement", "nonlocal statement"},
        {"delete_statement", "del statement"},
        {"raise_statement", "raise statement"},
        {"assert_statement", "assert statement"},
        {"print_statement", "print statement"},
        {"exec_statement", "exec statement"},
        {"match_statement", "match statement"},
        {"type_alias_statement", "type alias"},
        {"future_import_statement", "__future__ import"},
        {"lambda", "lambda"},
        {"generator_expression", "generator expression"},
        {"set", "set literal"},
        {"set_comprehension", "set comprehension"},
        {"dictionary_comprehension", "dict comprehension"},
        {"named_expression", "assignment expression"},
        {"await", "await"},
        {"yield", "yield"},
        {"list_splat", "star expression"},
        {"list_splat_pattern", "star expression"},
        {"dictionary_splat", "dict unpacking"},
        {"ellipsis", "ellipsis"},
    };
    return names;
}

bool isDelimiter(const std::string& type) {
    return type == "(" || type == ")" || type == "[" || type == "]" || type == "{" || type == "}" ||
           type == "," || type == "comment";
}

int lineOf(const ts::Node& node) {
    return static_cast<int>(node.getPointRange().start.row) + 1;
}

int columnOf(const ts::Node& node) {
    return static_cast<int>(node.getPointRange().start.column) + 1;
}

template <typename T>
void locate(T& astNode, const ts::Node& node) {
    if (astNode.lineno == 0) {
        astNode.lineno = lineOf(node);
        astNode.col_offset = columnOf(node);
    }
}

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

bool readHex(std::string_view text, size_t pos, size_t digits, uint32_t& value) {
    if (pos + digits > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = 0; i < digits; ++i) {
        char c = text[pos + i];
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 16 + static_cast<uint32_t>(std::isdigit(static_cast<unsigned char>(c))
                                                       ? c - '0'
                                                       : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
    }
    return true;
}

// Python escape processing; unknown escapes keep their backslash
std::string unescape(std::string_view text, bool raw) {
    if (raw) {
        return std::string{text};
    }
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c != '\\' || i + 1 >= text.size()) {
            out += c;
            continue;
        }
        char next = text[++i];
        uint32_t codepoint = 0;
        switch (next) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case '0': out += '\0'; break;
        case 'a': out += '\a'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'v': out += '\v'; break;
        case '\\': out += '\\'; break;
        case '\'': out += '\''; break;
        case '"': out += '"'; break;
        case '\n': break;
        case 'x':
            if (readHex(text, i + 1, 2, codepoint)) {
                appendUtf8(out, codepoint);
                i += 2;
            } else {
                out += "\\x";
            }
            break;
        case 'u':
            if (readHex(text, i + 1, 4, codepoint)) {
                appendUtf8(out, codepoint);
                i += 4;
            } else {
                out += "\\u";
            }
            break;
        case 'U':
            if (readHex(text, i + 1, 8, codepoint)) {
                appendUtf8(out, codepoint);
                i += 8;
            } else {
                out += "\\U";
            }
            break;
        default:
            out += '\\';
            out += next;
            break;
        }
    }
    return out;
}

// {{ and }} in the literal part of an f-string
std::string collapseBraces(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        out += text[i];
        if ((text[i] == '{' || text[i] == '}') && i + 1 < text.size() && text[i + 1] == text[i]) {
            ++i;
        }
    }
    return out;
}

struct StringLayout {
    std::string prefix;
    size_t contentBegin = 0;
    size_t contentEnd = 0;
};

StringLayout splitStringLiteral(std::string_view text) {
    StringLayout layout;
    size_t pos = 0;
    while (pos < text.size() && text[pos] != '"' && text[pos] != '\'') {
        layout.prefix += static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos])));
        ++pos;
    }
    size_t quoteLen = 1;
    if (pos + 3 <= text.size() && text[pos] == text[pos + 1] && text[pos] == text[pos + 2] &&
        text.size() >= pos + 6) {
        quoteLen = 3;
    }
    layout.contentBegin = std::min(text.size(), pos + quoteLen);
    layout.contentEnd = text.size() >= quoteLen ? std::max(layout.contentBegin, text.size() - quoteLen)
                                                : layout.contentBegin;
    return layout;
}

} // namespace

PythonParser::PythonParser() {
    parser_.emplace(ts::Language{tree_sitter_python()});
}

PythonParser::NestingGuard::NestingGuard(PythonParser& parser, const ts::Node& node) : parser_(parser) {
    if (parser_.depth_ >= kMaxNestingDepth) {
        throwError("expression nested too deeply", node);
    }
    ++parser_.depth_;
}

ModulePtr PythonParser::parse(const std::string& source) {
    depth_ = 0;
    ts::Tree tree = parser_->parseString(source);

    ts::Node root = tree.getRootNode();

    if (root.hasError()) {
        throwSyntaxError(root);
    }

    return parseModule(root, source);
}

// Helper functions
std::string PythonParser::getNodeText(const ts::Node& node, std::string_view source) {
    return std::string{node.getSourceRange(source)};
}

void PythonParser::throwError(const std::string& msg, const ts::Node& node) {
    throw PythonParseError(msg, lineOf(node), columnOf(node));
}

void PythonParser::throwUnsupported(const std::string& what, const ts::Node& node) {
    throwError("Unsupported construct: " + what, node);
}

// Descends along the first erroneous child to the innermost ERROR or missing node
void PythonParser::throwSyntaxError(const ts::Node& root) {
    ts::Node current = root;
    for (int depth = 0;; ++depth) {
        std::string type{current.getType()};
        if (type == "ERROR") {
            throwError("invalid syntax", current);
        }
        bool descended = false;
        uint32_t childCount = current.getNumChildren();
        for (uint32_t i = 0; i < childCount; ++i) {
            ts::Node child = current.getChild(i);
            if (!child.isNull() && child.hasError()) {
                current = child;
                descended = true;
                break;
            }
        }
        if (!descended) {
            if (childCount == 0 && depth > 0) {
                throwError(std::format("expected '{}'", type), current);
            }
            throwError("invalid syntax", current);
        }
    }
}

void PythonParser::validateTarget(const Expr& target, const ts::Node& node) {
    if (dynamic_cast<const Name*>(&target) || dynamic_cast<const Subscript*>(&target)) {
        return;
    }
    if (auto* tuple = dynamic_cast<const Tuple*>(&target)) {
        for (const auto& elt : tuple->elts) {
            validateTarget(*elt, node);
        }
        return;
    }
    if (auto* list = dynamic_cast<const List*>(&target)) {
        for (const auto& elt : list->elts) {
            validateTarget(*elt, node);
        }
        return;
    }
    if (dynamic_cast<const Attribute*>(&target)) {
        throwUnsupported("attribute assignment", node);
    }
    throwError("cannot assign to expression", node);
}

// Module parsing
ModulePtr PythonParser::parseModule(const ts::Node& node, std::string_view source) {
    auto module = std::make_unique<Module>();

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        parseStatementInto(node.getChild(i), source, module->body);
    }

    return module;
}

void PythonParser::parseStatementInto(const ts::Node& node, std::string_view source, StmtList& out) {
    const NestingGuard guard(*this, node);
    std::string type{node.getType()};

    if (type == "comment" || type == ";" || type == "\n") {
        return;
    }

    StmtPtr stmt;
    if (type == "expression_statement") {
        stmt = parseExprStmt(node, source);
    } else if (type == "assignment") {
        stmt = parseAssignment(node, source);
    } else if (type == "augmented_assignment") {
        stmt = parseAugAssignment(node, source);
    } else if (type == "import_statement") {
        stmt = parseImport(node, source);
    } else if (type == "import_from_statement") {
        stmt = parseImportFrom(node, source);
    } else if (type == "if_statement") {
        stmt = parseIf(node, source);
    } else if (type == "for_statement") {
        stmt = parseFor(node, source);
    } else if (type == "while_statement") {
        stmt = parseWhile(node, source);
    } else if (type == "pass_statement") {
        stmt = std::make_unique<Pass>();
    } else if (type == "break_statement") {
        stmt = std::make_unique<Break>();
    } else if (type == "continue_statement") {
        stmt = std::make_unique<Continue>();
    } else if (auto it = unsupportedNodeNames().find(type); it != unsupportedNodeNames().end()) {
        throwUnsupported(it->second, node);
    } else {
        throwUnsupported("statement '" + type + "'", node);
    }

    locate(*stmt, node);
    out.push_back(std::move(stmt));
}

StmtList PythonParser::parseBlock(const ts::Node& node, std::string_view source) {
    StmtList body;
    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        parseStatementInto(node.getChild(i), source, body);
    }
    return body;
}

StmtPtr PythonParser::parseExprStmt(const ts::Node& node, std::string_view source) {
    std::vector<ts::Node> parts;
    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        if (!isDelimiter(std::string{child.getType()})) {
            parts.push_back(child);
        }
    }

    if (parts.empty()) {
        throwError("invalid syntax", node);
    }

    if (parts.size() == 1) {
        std::string childType{parts[0].getType()};
        if (childType == "assignment") {
            return parseAssignment(parts[0], source);
        }
        if (childType == "augmented_assignment") {
            return parseAugAssignment(parts[0], source);
        }
        return std::make_unique<ExprStmt>(parseExpression(parts[0], source));
    }

    auto tuple = std::make_unique<Tuple>();
    for (const auto& part : parts) {
        tuple->elts.push_back(parseExpression(part, source));
    }
    locate(*tuple, node);
    return std::make_unique<ExprStmt>(std::move(tuple));
}

StmtPtr PythonParser::parseAssignment(const ts::Node& node, std::string_view source) {
    if (!node.getChildByFieldName("type").isNull()) {
        throwUnsupported("annotated assignment", node);
    }

    ts::Node leftNode = node.getChildByFieldName("left");
    ts::Node rightNode = node.getChildByFieldName("right");

    if (leftNode.isNull() || rightNode.isNull()) {
        throwError("invalid assignment", node);
    }

    // a = b = value nests the second assignment in the right field
    std::vector<ts::Node> targetNodes{leftNode};
    while (std::string{rightNode.getType()} == "assignment") {
        ts::Node nextLeft = rightNode.getChildByFieldName("left");
        ts::Node nextRight = rightNode.getChildByFieldName("right");
        if (nextLeft.isNull() || nextRight.isNull() || !rightNode.getChildByFieldName("type").isNull()) {
            throwError("invalid assignment", rightNode);
        }
        targetNodes.push_back(nextLeft);
        rightNode = nextRight;
    }
    if (std::string{rightNode.getType()} == "augmented_assignment") {
        throwError("invalid syntax", rightNode);
    }

    auto stmt = std::make_unique<Assign>(parseExpression(rightNode, source));
    for (const auto& targetNode : targetNodes) {
        auto target = parseExpression(targetNode, source);
        validateTarget(*target, targetNode);
        stmt->targets.push_back(std::move(target));
    }

    locate(*stmt, node);
    return stmt;
}

StmtPtr PythonParser::parseAugAssignment(const ts::Node& node, std::string_view source) {
    ts::Node leftNode = node.getChildByFieldName("left");
    ts::Node opNode = node.getChildByFieldName("operator");
    ts::Node rightNode = node.getChildByFieldName("right");

    if (leftNode.isNull() || opNode.isNull() || rightNode.isNull()) {
        throwError("invalid augmented assignment", node);
    }

    std::string opText = getNodeText(opNode, source);
    if (opText.empty() || opText.back() != '=') {
        throwError("invalid augmented assignment operator '" + opText + "'", opNode);
    }
    opText.pop_back();
    auto op = parseBinOpType(opText);
    if (!op) {
        throwUnsupported("operator '" + opText + "='", opNode);
    }

    auto target = parseExpression(leftNode, source);
    if (!dynamic_cast<Name*>(target.get()) && !dynamic_cast<Subscript*>(target.get())) {
        throwError("illegal expression for augmented assignment", leftNode);
    }

    auto stmt = std::make_unique<AugAssign>(std::move(target), *op, parseExpression(rightNode, source));
    locate(*stmt, node);
    return stmt;
}

StmtPtr PythonParser::parseImport(const ts::Node& node, std::string_view source) {
    auto stmt = std::make_unique<Import>();
    locate(*stmt, node);

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};

        if (childType == "dotted_name") {
            stmt->names.push_back(ImportAlias{getNodeText(child, source), std::nullopt, lineOf(child)});
        } else if (childType == "aliased_import") {
            ts::Node nameNode = child.getChildByFieldName("name");
            ts::Node aliasNode = child.getChildByFieldName("alias");
            if (nameNode.isNull() || aliasNode.isNull()) {
                throwError("invalid import alias", child);
            }
            stmt->names.push_back(
                ImportAlias{getNodeText(nameNode, source), getNodeText(aliasNode, source), lineOf(child)});
        }
    }

    if (stmt->names.empty()) {
        throwError("invalid import statement", node);
    }
    return stmt;
}

StmtPtr PythonParser::parseImportFrom(const ts::Node& node, std::string_view source) {
    auto stmt = std::make_unique<ImportFrom>();
    locate(*stmt, node);

    ts::Node moduleNode = node.getChildByFieldName("module_name");
    if (moduleNode.isNull()) {
        throwError("invalid from-import: missing module", node);
    }

    if (std::string{moduleNode.getType()} == "relative_import") {
        std::string text = getNodeText(moduleNode, source);
        size_t dots = text.find_first_not_of('.');
        stmt->level = static_cast<int>(dots == std::string::npos ? text.size() : dots);
        stmt->module = dots == std::string::npos ? "" : text.substr(dots);
    } else {
        stmt->module = getNodeText(moduleNode, source);
    }

    bool afterImportKeyword = false;
    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};

        if (childType == "import") {
            afterImportKeyword = true;
            continue;
        }
        if (!afterImportKeyword || isDelimiter(childType)) {
            continue;
        }

        if (childType == "dotted_name") {
            stmt->names.push_back(ImportAlias{getNodeText(child, source), std::nullopt, lineOf(child)});
        } else if (childType == "aliased_import") {
            ts::Node nameNode = child.getChildByFieldName("name");
            ts::Node aliasNode = child.getChildByFieldName("alias");
            if (nameNode.isNull() || aliasNode.isNull()) {
                throwError("invalid import alias", child);
            }
            stmt->names.push_back(
                ImportAlias{getNodeText(nameNode, source), getNodeText(aliasNode, source), lineOf(child)});
        } else if (childType == "wildcard_import") {
            stmt->names.push_back(ImportAlias{"*", std::nullopt, lineOf(child)});
        }
    }

    if (stmt->names.empty()) {
        throwError("invalid from-import: missing names", node);
    }
    return stmt;
}

StmtPtr PythonParser::parseIf(const ts::Node& node, std::string_view source) {
    ts::Node conditionNode = node.getChildByFieldName("condition");
    ts::Node consequenceNode = node.getChildByFieldName("consequence");

    if (conditionNode.isNull() || consequenceNode.isNull()) {
        throwError("invalid if statement", node);
    }

    auto stmt = std::make_unique<If>(parseExpression(conditionNode, source));
    stmt->body = parseBlock(consequenceNode, source);

    std::vector<ts::Node> clauses;
    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};
        if (childType == "elif_clause" || childType == "else_clause") {
            clauses.push_back(child);
        }
    }
    stmt->orelse = parseElseChain(clauses, 0, source);

    locate(*stmt, node);
    return stmt;
}

// elif clauses become nested If statements in the orelse branch
StmtList PythonParser::parseElseChain(const std::vector<ts::Node>& clauses, size_t index, std::string_view source) {
    StmtList orelse;
    if (index >= clauses.size()) {
        return orelse;
    }

    const ts::Node& clause = clauses[index];
    const NestingGuard guard(*this, clause);
    if (std::string{clause.getType()} == "else_clause") {
        ts::Node bodyNode = clause.getChildByFieldName("body");
        if (bodyNode.isNull()) {
            throwError("invalid else clause", clause);
        }
        return parseBlock(bodyNode, source);
    }

    ts::Node conditionNode = clause.getChildByFieldName("condition");
    ts::Node consequenceNode = clause.getChildByFieldName("consequence");
    if (conditionNode.isNull() || consequenceNode.isNull()) {
        throwError("invalid elif clause", clause);
    }

    auto elif = std::make_unique<If>(parseExpression(conditionNode, source));
    elif->body = parseBlock(consequenceNode, source);
    elif->orelse = parseElseChain(clauses, index + 1, source);
    locate(*elif, clause);
    orelse.push_back(std::move(elif));
    return orelse;
}

StmtPtr PythonParser::parseFor(const ts::Node& node, std::string_view source) {
    if (std::string{node.getChild(0).getType()} == "async") {
        throwUnsupported("async for", node);
    }
    if (!node.getChildByFieldName("alternative").isNull()) {
        throwUnsupported("for-else", node);
    }

    ts::Node leftNode = node.getChildByFieldName("left");
    ts::Node rightNode = node.getChildByFieldName("right");
    ts::Node bodyNode = node.getChildByFieldName("body");

    if (leftNode.isNull() || rightNode.isNull() || bodyNode.isNull()) {
        throwError("invalid for statement", node);
    }

    auto target = parseExpression(leftNode, source);
    validateTarget(*target, leftNode);

    auto stmt = std::make_unique<For>(std::move(target), parseExpression(rightNode, source));
    stmt->body = parseBlock(bodyNode, source);

    locate(*stmt, node);
    return stmt;
}

StmtPtr PythonParser::parseWhile(const ts::Node& node, std::string_view source) {
    if (!node.getChildByFieldName("alternative").isNull()) {
        throwUnsupported("while-else", node);
    }

    ts::Node conditionNode = node.getChildByFieldName("condition");
    ts::Node bodyNode = node.getChildByFieldName("body");

    if (conditionNode.isNull() || bodyNode.isNull()) {
        throwError("invalid while statement", node);
    }

    auto stmt = std::make_unique<While>(parseExpression(conditionNode, source));
    stmt->body = parseBlock(bodyNode, source);

    locate(*stmt, node);
    return stmt;
}

// Expression parsing
ExprPtr PythonParser::parseExpression(const ts::Node& node, std::string_view source) {
    const NestingGuard guard(*this, node);
    std::string type{node.getType()};
    ExprPtr expr;

    if (type == "call") {
        expr = parseCall(node, source);
    } else if (type == "attribute") {
        expr = parseAttribute(node, source);
    } else if (type == "identifier") {
        expr = parseName(node, source);
    } else if (type == "integer" || type == "float" || type == "true" || type == "false" || type == "none") {
        expr = parseConstant(node, source);
    } else if (type == "string") {
        expr = parseString(node, source);
    } else if (type == "concatenated_string") {
        expr = parseConcatenatedString(node, source);
    } else if (type == "binary_operator") {
        expr = parseBinaryOp(node, source);
    } else if (type == "comparison_operator") {
        expr = parseCompare(node, source);
    } else if (type == "boolean_operator") {
        expr = parseBoolOp(node, source);
    } else if (type == "unary_operator" || type == "not_operator") {
        expr = parseUnaryOp(node, source);
    } else if (type == "conditional_expression") {
        expr = parseIfExp(node, source);
    } else if (type == "subscript") {
        expr = parseSubscript(node, source);
    } else if (type == "slice") {
        expr = parseSlice(node, source);
    } else if (type == "tuple" || type == "pattern_list" || type == "expression_list" || type == "tuple_pattern") {
        expr = parseTuple(node, source);
    } else if (type == "list" || type == "list_pattern") {
        expr = parseList(node, source);
    } else if (type == "dictionary") {
        expr = parseDict(node, source);
    } else if (type == "list_comprehension") {
        expr = parseListComp(node, source);
    } else if (type == "parenthesized_expression") {
        uint32_t childCount = node.getNumChildren();
        for (uint32_t i = 0; i < childCount && !expr; ++i) {
            ts::Node child = node.getChild(i);
            if (!isDelimiter(std::string{child.getType()})) {
                expr = parseExpression(child, source);
            }
        }
        if (!expr) {
            throwError("invalid syntax", node);
        }
    } else if (type == "keyword_argument") {
        throwError("keyword argument outside of a call", node);
    } else if (auto it = unsupportedNodeNames().find(type); it != unsupportedNodeNames().end()) {
        throwUnsupported(it->second, node);
    } else {
        throwUnsupported("expression '" + type + "'", node);
    }

    locate(*expr, node);
    return expr;
}

ExprPtr PythonParser::parseName(const ts::Node& node, std::string_view source) {
    return std::make_unique<Name>(getNodeText(node, source));
}

ExprPtr PythonParser::parseConstant(const ts::Node& node, std::string_view source) {
    std::string type{node.getType()};

    if (type == "true") {
        return std::make_unique<Constant>(true);
    } else if (type == "false") {
        return std::make_unique<Constant>(false);
    } else if (type == "none") {
        return std::make_unique<Constant>(std::monostate{});
    }

    std::string text = getNodeText(node, source);
    std::erase(text, '_');
    if (!text.empty() && (text.back() == 'j' || text.back() == 'J')) {
        throwUnsupported("complex literal", node);
    }

    try {
        if (type == "integer") {
            int base = 10;
            std::string digits = text;
            if (text.size() > 2 && text[0] == '0') {
                char marker = static_cast<char>(std::tolower(static_cast<unsigned char>(text[1])));
                if (marker == 'x') base = 16;
                if (marker == 'o') base = 8;
                if (marker == 'b') base = 2;
                if (base != 10) digits = text.substr(2);
            }
            return std::make_unique<Constant>(static_cast<int64_t>(std::stoll(digits, nullptr, base)));
        }
        return std::make_unique<Constant>(std::stod(text));
    } catch (const std::out_of_range&) {
        throwError("numeric literal out of range: " + text, node);
    } catch (const std::invalid_argument&) {
        throwError("invalid numeric literal: " + text, node);
    }
}

ExprPtr PythonParser::parseString(const ts::Node& node, std::string_view source) {
    std::string_view text = node.getSourceRange(source);
    StringLayout layout = splitStringLiteral(text);

    if (layout.prefix.find('b') != std::string::npos) {
        throwUnsupported("bytes literal", node);
    }
    bool raw = layout.prefix.find('r') != std::string::npos;
    bool formatted = layout.prefix.find('f') != std::string::npos;

    if (!formatted) {
        return std::make_unique<Constant>(
            unescape(text.substr(layout.contentBegin, layout.contentEnd - layout.contentBegin), raw));
    }

    auto joined = std::make_unique<JoinedStr>();
    const size_t nodeOffset = static_cast<size_t>(text.data() - source.data());
    size_t cursor = layout.contentBegin;

    auto flushLiteral = [&](size_t end) {
        if (end > cursor) {
            std::string literal = collapseBraces(unescape(text.substr(cursor, end - cursor), raw));
            if (!literal.empty()) {
                joined->values.push_back(std::make_unique<Constant>(std::move(literal)));
            }
        }
    };

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        if (std::string{child.getType()} != "interpolation") {
            continue;
        }

        std::string_view childText = child.getSourceRange(source);
        size_t begin = static_cast<size_t>(childText.data() - source.data()) - nodeOffset;
        flushLiteral(begin);
        cursor = begin + childText.size();

        ts::Node exprNode = child.getChildByFieldName("expression");
        if (exprNode.isNull()) {
            throwError("f-string: empty expression", child);
        }
        auto field = std::make_unique<FormattedValue>(parseExpression(exprNode, source));

        ts::Node conversionNode = child.getChildByFieldName("type_conversion");
        if (!conversionNode.isNull()) {
            std::string conversion = getNodeText(conversionNode, source);
            field->conversion = conversion.empty() ? 0 : conversion.back();
        }

        ts::Node specNode = child.getChildByFieldName("format_specifier");
        if (!specNode.isNull()) {
            std::string spec = getNodeText(specNode, source);
            if (!spec.empty() && spec.front() == ':') {
                spec.erase(0, 1);
            }
            if (spec.find('{') != std::string::npos) {
                throwUnsupported("nested f-string format specifier", specNode);
            }
            field->format_spec = std::move(spec);
        }

        locate(*field, child);
        joined->values.push_back(std::move(field));
    }
    flushLiteral(layout.contentEnd);

    return joined;
}

ExprPtr PythonParser::parseConcatenatedString(const ts::Node& node, std::string_view source) {
    std::vector<ExprPtr> parts;
    bool allConstant = true;

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        if (std::string{child.getType()} != "string") {
            continue;
        }
        auto part = parseString(child, source);
        if (auto* joined = dynamic_cast<JoinedStr*>(part.get())) {
            allConstant = false;
            for (auto& value : joined->values) {
                parts.push_back(std::move(value));
            }
        } else {
            parts.push_back(std::move(part));
        }
    }

    if (allConstant) {
        std::string text;
        for (const auto& part : parts) {
            text += std::get<std::string>(static_cast<const Constant&>(*part).value);
        }
        return std::make_unique<Constant>(std::move(text));
    }

    auto joined = std::make_unique<JoinedStr>();
    joined->values = std::move(parts);
    return joined;
}

ExprPtr PythonParser::parseAttribute(const ts::Node& node, std::string_view source) {
    ts::Node objectNode = node.getChildByFieldName("object");
    ts::Node attributeNode = node.getChildByFieldName("attribute");

    if (objectNode.isNull() || attributeNode.isNull()) {
        throwError("invalid attribute access", node);
    }

    auto object = parseExpression(objectNode, source);
    std::string attr = getNodeText(attributeNode, source);

    return std::make_unique<Attribute>(std::move(object), attr);
}

ExprPtr PythonParser::parseCall(const ts::Node& node, std::string_view source) {
    ts::Node funcNode = node.getChildByFieldName("function");
    ts::Node argsNode = node.getChildByFieldName("arguments");

    if (funcNode.isNull()) {
        throwError("invalid call: missing function", node);
    }

    auto func = parseExpression(funcNode, source);
    auto call = std::make_unique<Call>(std::move(func));

    if (argsNode.isNull()) {
        return call;
    }
    if (std::string{argsNode.getType()} == "generator_expression") {
        throwUnsupported("generator expression", argsNode);
    }

    uint32_t childCount = argsNode.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = argsNode.getChild(i);
        std::string childType{child.getType()};

        if (isDelimiter(childType)) {
            continue;
        }

        if (childType == "keyword_argument") {
            ts::Node nameNode = child.getChildByFieldName("name");
            ts::Node valueNode = child.getChildByFieldName("value");
            if (nameNode.isNull() || valueNode.isNull()) {
                throwError("invalid keyword argument", child);
            }

            std::string name = getNodeText(nameNode, source);
            for (const auto& [existing, _] : call->keywords) {
                if (existing == name) {
                    throwError("keyword argument repeated: " + name, child);
                }
            }
            call->keywords.emplace_back(name, parseExpression(valueNode, source));
        } else {
            if (!call->keywords.empty()) {
                throwError("positional argument follows keyword argument", child);
            }
            call->args.push_back(parseExpression(child, source));
        }
    }

    return call;
}

std::optional<BinOpType> PythonParser::parseBinOpType(const std::string& opText) {
    if (opText == "+") return BinOpType::Add;
    if (opText == "-") return BinOpType::Sub;
    if (opText == "*") return BinOpType::Mult;
    if (opText == "/") return BinOpType::Div;
    if (opText == "//") return BinOpType::FloorDiv;
    if (opText == "%") return BinOpType::Mod;
    if (opText == "**") return BinOpType::Pow;
    if (opText == "&") return BinOpType::BitAnd;
    if (opText == "|") return BinOpType::BitOr;
    if (opText == "^") return BinOpType::BitXor;
    return std::nullopt;
}

std::optional<UnaryOpType> PythonParser::parseUnaryOpType(const std::string& opText) {
    if (opText == "not") return UnaryOpType::Not;
    if (opText == "-") return UnaryOpType::USub;
    if (opText == "+") return UnaryOpType::UAdd;
    if (opText == "~") return UnaryOpType::Invert;
    return std::nullopt;
}

std::optional<CmpOpType> PythonParser::parseCmpOpType(const std::string& opText) {
    if (opText == "==") return CmpOpType::Eq;
    if (opText == "!=") return CmpOpType::NotEq;
    if (opText == "<") return CmpOpType::Lt;
    if (opText == "<=") return CmpOpType::LtE;
    if (opText == ">") return CmpOpType::Gt;
    if (opText == ">=") return CmpOpType::GtE;
    if (opText == "in") return CmpOpType::In;
    if (opText == "not in") return CmpOpType::NotIn;
    if (opText == "is") return CmpOpType::Is;
    if (opText == "is not") return CmpOpType::IsNot;
    return std::nullopt;
}

ExprPtr PythonParser::parseBinaryOp(const ts::Node& node, std::string_view source) {
    ts::Node leftNode = node.getChildByFieldName("left");
    ts::Node opNode = node.getChildByFieldName("operator");
    ts::Node rightNode = node.getChildByFieldName("right");

    if (leftNode.isNull() || opNode.isNull() || rightNode.isNull()) {
        throwError("invalid binary operation", node);
    }

    std::string opText = getNodeText(opNode, source);
    auto op = parseBinOpType(opText);
    if (!op) {
        throwUnsupported("operator '" + opText + "'", opNode);
    }

    auto left = parseExpression(leftNode, source);
    auto right = parseExpression(rightNode, source);
    return std::make_unique<BinOp>(*op, std::move(left), std::move(right));
}

ExprPtr PythonParser::parseCompare(const ts::Node& node, std::string_view source) {
    // Children alternate operands and operator tokens; "not in" and "is not"
    // may arrive either as one aliased token or as two keywords
    std::unique_ptr<Compare> compare;
    std::vector<CmpOpType> ops;
    std::vector<ExprPtr> operands;

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        if (child.isNull()) continue;

        std::string childType{child.getType()};
        if (childType == "comment") {
            continue;
        }

        if (childType == "not" && i + 1 < childCount && std::string{node.getChild(i + 1).getType()} == "in") {
            ops.push_back(CmpOpType::NotIn);
            ++i;
            continue;
        }
        if (childType == "is" && i + 1 < childCount && std::string{node.getChild(i + 1).getType()} == "not") {
            ops.push_back(CmpOpType::IsNot);
            ++i;
            continue;
        }
        if (childType == "<>") {
            throwError("invalid syntax", child);
        }
        if (auto op = parseCmpOpType(childType)) {
            ops.push_back(*op);
            continue;
        }
        operands.push_back(parseExpression(child, source));
    }

    if (ops.empty() || operands.size() != ops.size() + 1) {
        throwError("invalid comparison", node);
    }

    compare = std::make_unique<Compare>(std::move(operands.front()));
    compare->ops = std::move(ops);
    for (size_t i = 1; i < operands.size(); ++i) {
        compare->comparators.push_back(std::move(operands[i]));
    }
    return compare;
}

ExprPtr PythonParser::parseBoolOp(const ts::Node& node, std::string_view source) {
    ts::Node leftNode = node.getChildByFieldName("left");
    ts::Node opNode = node.getChildByFieldName("operator");
    ts::Node rightNode = node.getChildByFieldName("right");

    if (leftNode.isNull() || opNode.isNull() || rightNode.isNull()) {
        throwError("invalid boolean operation", node);
    }

    std::string opText = getNodeText(opNode, source);
    BoolOpType op = opText == "and" ? BoolOpType::And : BoolOpType::Or;

    auto boolOp = std::make_unique<BoolOp>(op);

    // "a and b and c" becomes BoolOp([a, b, c]) like Python's ast module
    auto absorb = [&](ExprPtr operand) {
        if (auto* nested = dynamic_cast<BoolOp*>(operand.get()); nested && nested->op == op) {
            for (auto& value : nested->values) {
                boolOp->values.push_back(std::move(value));
            }
        } else {
            boolOp->values.push_back(std::move(operand));
        }
    };
    absorb(parseExpression(leftNode, source));
    absorb(parseExpression(rightNode, source));

    return boolOp;
}

ExprPtr PythonParser::parseUnaryOp(const ts::Node& node, std::string_view source) {
    std::string nodeType{node.getType()};

    if (nodeType == "not_operator") {
        ts::Node operandNode = node.getChildByFieldName("argument");
        if (operandNode.isNull() && node.getNumChildren() >= 2) {
            operandNode = node.getChild(1);
        }
        if (operandNode.isNull()) {
            throwError("invalid not expression", node);
        }
        return std::make_unique<UnaryOp>(UnaryOpType::Not, parseExpression(operandNode, source));
    }

    ts::Node opNode = node.getChildByFieldName("operator");
    ts::Node operandNode = node.getChildByFieldName("argument");

    if (opNode.isNull() || operandNode.isNull()) {
        throwError("invalid unary operation", node);
    }

    std::string opText = getNodeText(opNode, source);
    auto op = parseUnaryOpType(opText);
    if (!op) {
        throwUnsupported("unary operator '" + opText + "'", opNode);
    }

    return std::make_unique<UnaryOp>(*op, parseExpression(operandNode, source));
}

ExprPtr PythonParser::parseIfExp(const ts::Node& node, std::string_view source) {
    // conditional_expression has no named fields: body "if" test "else" orelse
    if (node.getNumChildren() < 5) {
        throwError("invalid conditional expression", node);
    }

    auto body = parseExpression(node.getChild(0), source);
    auto test = parseExpression(node.getChild(2), source);
    auto orelse = parseExpression(node.getChild(4), source);

    return std::make_unique<IfExp>(std::move(test), std::move(body), std::move(orelse));
}

ExprPtr PythonParser::parseSubscript(const ts::Node& node, std::string_view source) {
    ts::Node valueNode = node.getChildByFieldName("value");
    if (valueNode.isNull()) {
        throwError("invalid subscript: missing value", node);
    }

    // df.loc[mask, 'col'] carries several subscript children
    std::vector<ts::Node> indexNodes;
    bool insideBrackets = false;
    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};
        if (childType == "[") {
            insideBrackets = true;
            continue;
        }
        if (!insideBrackets || isDelimiter(childType)) {
            continue;
        }
        indexNodes.push_back(child);
    }

    if (indexNodes.empty()) {
        throwError("invalid subscript: missing index", node);
    }

    auto value = parseExpression(valueNode, source);
    if (indexNodes.size() == 1) {
        return std::make_unique<Subscript>(std::move(value), parseExpression(indexNodes[0], source));
    }

    auto tuple = std::make_unique<Tuple>();
    for (const auto& indexNode : indexNodes) {
        tuple->elts.push_back(parseExpression(indexNode, source));
    }
    locate(*tuple, indexNodes[0]);
    return std::make_unique<Subscript>(std::move(value), std::move(tuple));
}

ExprPtr PythonParser::parseSlice(const ts::Node& node, std::string_view source) {
    auto slice = std::make_unique<Slice>();
    int part = 0;

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};
        if (childType == ":") {
            ++part;
            continue;
        }
        if (childType == "comment") {
            continue;
        }

        auto bound = parseExpression(child, source);
        if (part == 0) {
            slice->lower = std::move(bound);
        } else if (part == 1) {
            slice->upper = std::move(bound);
        } else {
            slice->step = std::move(bound);
        }
    }

    return slice;
}

ExprPtr PythonParser::parseTuple(const ts::Node& node, std::string_view source) {
    auto tuple = std::make_unique<Tuple>();

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        if (isDelimiter(std::string{child.getType()})) {
            continue;
        }
        tuple->elts.push_back(parseExpression(child, source));
    }

    return tuple;
}

ExprPtr PythonParser::parseList(const ts::Node& node, std::string_view source) {
    auto list = std::make_unique<List>();

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        if (isDelimiter(std::string{child.getType()})) {
            continue;
        }
        list->elts.push_back(parseExpression(child, source));
    }

    return list;
}

ExprPtr PythonParser::parseDict(const ts::Node& node, std::string_view source) {
    auto dict = std::make_unique<Dict>();

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};

        if (isDelimiter(childType)) {
            continue;
        }

        if (childType != "pair") {
            auto it = unsupportedNodeNames().find(childType);
            throwUnsupported(it != unsupportedNodeNames().end() ? it->second : "dict entry '" + childType + "'",
                             child);
        }

        ts::Node keyNode = child.getChildByFieldName("key");
        ts::Node valueNode = child.getChildByFieldName("value");
        if (keyNode.isNull() || valueNode.isNull()) {
            throwError("invalid dict entry", child);
        }

        dict->keys.push_back(parseExpression(keyNode, source));
        dict->values.push_back(parseExpression(valueNode, source));
    }

    return dict;
}

ExprPtr PythonParser::parseListComp(const ts::Node& node, std::string_view source) {
    ts::Node bodyNode = node.getChildByFieldName("body");
    if (bodyNode.isNull()) {
        throwError("invalid list comprehension", node);
    }

    auto comp = std::make_unique<ListComp>(parseExpression(bodyNode, source));

    uint32_t childCount = node.getNumChildren();
    for (uint32_t i = 0; i < childCount; ++i) {
        ts::Node child = node.getChild(i);
        std::string childType{child.getType()};

        if (childType == "for_in_clause") {
            if (std::string{child.getChild(0).getType()} == "async") {
                throwUnsupported("async comprehension", child);
            }
            ts::Node leftNode = child.getChildByFieldName("left");
            ts::Node rightNode = child.getChildByFieldName("right");
            if (leftNode.isNull() || rightNode.isNull()) {
                throwError("invalid comprehension clause", child);
            }
            Comprehension generator;
            generator.target = parseExpression(leftNode, source);
            validateTarget(*generator.target, leftNode);
            generator.iter = parseExpression(rightNode, source);
            comp->generators.push_back(std::move(generator));
        } else if (childType == "if_clause") {
            if (comp->generators.empty() || child.getNumChildren() < 2) {
                throwError("invalid comprehension condition", child);
            }
            comp->generators.back().ifs.push_back(parseExpression(child.getChild(1), source));
        }
    }

    if (comp->generators.empty()) {
        throwError("list comprehension without a for clause", node);
    }
    return comp;
}

} // namespace nlytics
