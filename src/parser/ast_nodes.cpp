//
// NLytics Script AST helpers
//

#include "ast_nodes.h"

namespace nlytics {

void WalkStatements(const StmtList& body, const std::function<void(const Stmt&)>& visit) {
    for (const auto& stmt : body) {
        visit(*stmt);
        if (auto* ifStmt = dynamic_cast<const If*>(stmt.get())) {
            WalkStatements(ifStmt->body, visit);
            WalkStatements(ifStmt->orelse, visit);
        } else if (auto* forStmt = dynamic_cast<const For*>(stmt.get())) {
            WalkStatements(forStmt->body, visit);
        } else if (auto* whileStmt = dynamic_cast<const While*>(stmt.get())) {
            WalkStatements(whileStmt->body, visit);
        }
    }
}

const char* BinOpSymbol(BinOpType op) {
    switch (op) {
    case BinOpType::Add: return "+";
    case BinOpType::Sub: return "-";
    case BinOpType::Mult: return "*";
    case BinOpType::Div: return "/";
    case BinOpType::FloorDiv: return "//";
    case BinOpType::Mod: return "%";
    case BinOpType::Pow: return "**";
    case BinOpType::BitAnd: return "&";
    case BinOpType::BitOr: return "|";
    case BinOpType::BitXor: return "^";
    }
    return "?";
}

const char* CmpOpSymbol(CmpOpType op) {
    switch (op) {
    case CmpOpType::Eq: return "==";
    case CmpOpType::NotEq: return "!=";
    case CmpOpType::Lt: return "<";
    case CmpOpType::LtE: return "<=";
    case CmpOpType::Gt: return ">";
    case CmpOpType::GtE: return ">=";
    case CmpOpType::In: return "in";
    case CmpOpType::NotIn: return "not in";
    case CmpOpType::Is: return "is";
    case CmpOpType::IsNot: return "is not";
    }
    return "?";
}

} // namespace nlytics
