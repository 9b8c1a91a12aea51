//
// NLytics Program Compiler
//
// Lowers the script AST into the sandbox instruction set. Every construct
// the parser accepts has a lowering here; anything else is a CompileError.
//

#pragma once

#include "instruction.h"
#include "parser/ast_nodes.h"
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace nlytics::sandbox
{
    class CompileError : public std::runtime_error
    {
    public:
        CompileError(const std::string& msg, int line) : std::runtime_error(msg), m_line(line) {}
        int Line() const { return m_line; }

    private:
        int m_line;
    };

    class ProgramCompiler
    {
    public:
        CodeObject Compile(const Module& module);

    private:
        struct LoopFrame
        {
            size_t continueTarget;
            std::vector<size_t> breakJumps;
            bool isFor;
        };

        CodeObject code_;
        std::vector<LoopFrame> loops_;
        std::unordered_map<std::string, int32_t> nameIndex_;
        int line_ = 0;

        // Statements
        void VisitBody(const StmtList& body);
        void VisitStmt(const Stmt& stmt);
        void VisitAssign(const Assign& assign);
        void VisitAugAssign(const AugAssign& augAssign);
        void VisitImport(const Import& importStmt);
        void VisitImportFrom(const ImportFrom& importFrom);
        void VisitIf(const If& ifStmt);
        void VisitWhile(const While& whileStmt);
        void VisitFor(const For& forStmt);
        void VisitBreak(const Break& breakStmt);
        void VisitContinue(const Continue& continueStmt);

        // Assignment targets
        void StoreTarget(const Expr& target);

        // Expressions
        void VisitExpr(const Expr& expr);
        void VisitCall(const Call& call);
        void VisitBoolOp(const BoolOp& boolOp);
        void VisitCompare(const Compare& compare);
        void VisitIfExp(const IfExp& ifExp);
        void VisitSlice(const Slice& slice);
        void VisitListComp(const ListComp& listComp);
        void VisitJoinedStr(const JoinedStr& joined);

        // Emission helpers
        size_t Emit(OpCode op, int32_t arg = 0);
        void PatchJump(size_t at, size_t target);
        size_t Here() const { return code_.instructions.size(); }
        int32_t AddConstant(ConstantValue value);
        int32_t AddName(const std::string& name);
        [[noreturn]] void ThrowError(const std::string& msg, int line) const;
    };

} // namespace nlytics::sandbox
