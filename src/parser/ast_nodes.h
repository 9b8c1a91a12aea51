//
// NLytics Script AST
//
// Structural representation of the supported Python subset. Nodes mirror
// Python's ast module closely enough that validator passes and the program
// compiler can walk them with dynamic_cast dispatch.
//

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace nlytics {

struct ASTNode {
    int lineno = 0;
    int col_offset = 0;
    virtual ~ASTNode() = default;
};

struct Expr : ASTNode {};
struct Stmt : ASTNode {};

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using StmtList = std::vector<StmtPtr>;

enum class BinOpType {
    Add,
    Sub,
    Mult,
    Div,
    FloorDiv,
    Mod,
    Pow,
    BitAnd,
    BitOr,
    BitXor
};

enum class UnaryOpType { Not, USub, UAdd, Invert };

enum class CmpOpType { Eq, NotEq, Lt, LtE, Gt, GtE, In, NotIn, Is, IsNot };

enum class BoolOpType { And, Or };

using ConstantValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

// ---- Expressions ----

struct Name : Expr {
    std::string id;
    explicit Name(std::string id_) : id(std::move(id_)) {}
};

struct Constant : Expr {
    ConstantValue value;
    explicit Constant(ConstantValue v) : value(std::move(v)) {}
};

struct Attribute : Expr {
    ExprPtr value;
    std::string attr;
    Attribute(ExprPtr v, std::string a) : value(std::move(v)), attr(std::move(a)) {}
};

struct Call : Expr {
    ExprPtr func;
    std::vector<ExprPtr> args;
    std::vector<std::pair<std::string, ExprPtr>> keywords;
    explicit Call(ExprPtr f) : func(std::move(f)) {}
};

struct BinOp : Expr {
    BinOpType op;
    ExprPtr left;
    ExprPtr right;
    BinOp(BinOpType o, ExprPtr l, ExprPtr r) : op(o), left(std::move(l)), right(std::move(r)) {}
};

struct UnaryOp : Expr {
    UnaryOpType op;
    ExprPtr operand;
    UnaryOp(UnaryOpType o, ExprPtr e) : op(o), operand(std::move(e)) {}
};

// a < b <= c is one Compare with ops [Lt, LtE] and comparators [b, c]
struct Compare : Expr {
    ExprPtr left;
    std::vector<CmpOpType> ops;
    std::vector<ExprPtr> comparators;
    explicit Compare(ExprPtr l) : left(std::move(l)) {}
};

struct BoolOp : Expr {
    BoolOpType op;
    std::vector<ExprPtr> values;
    explicit BoolOp(BoolOpType o) : op(o) {}
};

struct IfExp : Expr {
    ExprPtr test;
    ExprPtr body;
    ExprPtr orelse;
    IfExp(ExprPtr t, ExprPtr b, ExprPtr o) : test(std::move(t)), body(std::move(b)), orelse(std::move(o)) {}
};

struct Subscript : Expr {
    ExprPtr value;
    ExprPtr slice;
    Subscript(ExprPtr v, ExprPtr s) : value(std::move(v)), slice(std::move(s)) {}
};

// Missing bounds are null
struct Slice : Expr {
    ExprPtr lower;
    ExprPtr upper;
    ExprPtr step;
};

struct Tuple : Expr {
    std::vector<ExprPtr> elts;
};

struct List : Expr {
    std::vector<ExprPtr> elts;
};

struct Dict : Expr {
    std::vector<ExprPtr> keys;
    std::vector<ExprPtr> values;
};

struct Comprehension {
    ExprPtr target;
    ExprPtr iter;
    std::vector<ExprPtr> ifs;
};

struct ListComp : Expr {
    ExprPtr elt;
    std::vector<Comprehension> generators;
    explicit ListComp(ExprPtr e) : elt(std::move(e)) {}
};

// One {expr!conv:spec} field of an f-string
struct FormattedValue : Expr {
    ExprPtr value;
    char conversion = 0; // 0, 'r', 's' or 'a'
    std::string format_spec;
    explicit FormattedValue(ExprPtr v) : value(std::move(v)) {}
};

// f-string: Constant and FormattedValue parts in source order
struct JoinedStr : Expr {
    std::vector<ExprPtr> values;
};

// ---- Statements ----

struct ExprStmt : Stmt {
    ExprPtr value;
    explicit ExprStmt(ExprPtr v) : value(std::move(v)) {}
};

// a = b = value keeps both targets, leftmost first
struct Assign : Stmt {
    std::vector<ExprPtr> targets;
    ExprPtr value;
    explicit Assign(ExprPtr v) : value(std::move(v)) {}
};

struct AugAssign : Stmt {
    ExprPtr target;
    BinOpType op;
    ExprPtr value;
    AugAssign(ExprPtr t, BinOpType o, ExprPtr v) : target(std::move(t)), op(o), value(std::move(v)) {}
};

struct ImportAlias {
    std::string name;
    std::optional<std::string> asname;
    int lineno = 0;
};

struct Import : Stmt {
    std::vector<ImportAlias> names;
};

struct ImportFrom : Stmt {
    std::string module; // empty for relative imports without a module
    int level = 0;      // number of leading dots
    std::vector<ImportAlias> names;
};

struct If : Stmt {
    ExprPtr test;
    StmtList body;
    StmtList orelse;
    explicit If(ExprPtr t) : test(std::move(t)) {}
};

struct For : Stmt {
    ExprPtr target;
    ExprPtr iter;
    StmtList body;
    For(ExprPtr t, ExprPtr i) : target(std::move(t)), iter(std::move(i)) {}
};

struct While : Stmt {
    ExprPtr test;
    StmtList body;
    explicit While(ExprPtr t) : test(std::move(t)) {}
};

struct Pass : Stmt {};
struct Break : Stmt {};
struct Continue : Stmt {};

struct Module {
    StmtList body;
};

using ModulePtr = std::unique_ptr<Module>;

// Visits every statement, descending into if/for/while bodies
void WalkStatements(const StmtList& body, const std::function<void(const Stmt&)>& visit);

const char* BinOpSymbol(BinOpType op);
const char* CmpOpSymbol(CmpOpType op);

} // namespace nlytics
