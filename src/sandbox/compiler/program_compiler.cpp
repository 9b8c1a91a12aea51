//
// NLytics Program Compiler Implementation
//

#include "program_compiler.h"
#include <spdlog/spdlog.h>
#include <format>

namespace nlytics::sandbox
{
    const char* OpCodeName(OpCode op)
    {
        switch (op)
        {
        case OpCode::LoadConst: return "LoadConst";
        case OpCode::LoadName: return "LoadName";
        case OpCode::StoreName: return "StoreName";
        case OpCode::LoadAttr: return "LoadAttr";
        case OpCode::LoadSubscript: return "LoadSubscript";
        case OpCode::StoreSubscript: return "StoreSubscript";
        case OpCode::BuildList: return "BuildList";
        case OpCode::BuildTuple: return "BuildTuple";
        case OpCode::BuildDict: return "BuildDict";
        case OpCode::BuildSlice: return "BuildSlice";
        case OpCode::BuildString: return "BuildString";
        case OpCode::FormatValue: return "FormatValue";
        case OpCode::BinaryOp: return "BinaryOp";
        case OpCode::UnaryOp: return "UnaryOp";
        case OpCode::Compare: return "Compare";
        case OpCode::Call: return "Call";
        case OpCode::Pop: return "Pop";
        case OpCode::DupTop: return "DupTop";
        case OpCode::RotTwo: return "RotTwo";
        case OpCode::RotThree: return "RotThree";
        case OpCode::Jump: return "Jump";
        case OpCode::JumpIfFalse: return "JumpIfFalse";
        case OpCode::JumpIfTrue: return "JumpIfTrue";
        case OpCode::JumpIfFalseOrPop: return "JumpIfFalseOrPop";
        case OpCode::JumpIfTrueOrPop: return "JumpIfTrueOrPop";
        case OpCode::GetIter: return "GetIter";
        case OpCode::ForIter: return "ForIter";
        case OpCode::UnpackSequence: return "UnpackSequence";
        case OpCode::ListAppend: return "ListAppend";
        case OpCode::ImportModule: return "ImportModule";
        case OpCode::ImportFrom: return "ImportFrom";
        }
        return "Unknown";
    }

    CodeObject ProgramCompiler::Compile(const Module& module)
    {
        code_ = CodeObject{};
        loops_.clear();
        nameIndex_.clear();
        line_ = 0;

        VisitBody(module.body);

        SPDLOG_DEBUG("Compiled program: {} instructions, {} constants, {} names", code_.instructions.size(),
                     code_.constants.size(), code_.names.size());
        return std::move(code_);
    }

    void ProgramCompiler::ThrowError(const std::string& msg, int line) const
    {
        throw CompileError(msg, line);
    }

    size_t ProgramCompiler::Emit(OpCode op, int32_t arg)
    {
        code_.instructions.push_back(Instruction{op, arg, line_});
        return code_.instructions.size() - 1;
    }

    void ProgramCompiler::PatchJump(size_t at, size_t target)
    {
        code_.instructions[at].arg = static_cast<int32_t>(target);
    }

    int32_t ProgramCompiler::AddConstant(ConstantValue value)
    {
        code_.constants.push_back(std::move(value));
        return static_cast<int32_t>(code_.constants.size() - 1);
    }

    int32_t ProgramCompiler::AddName(const std::string& name)
    {
        auto it = nameIndex_.find(name);
        if (it != nameIndex_.end())
        {
            return it->second;
        }
        code_.names.push_back(name);
        auto index = static_cast<int32_t>(code_.names.size() - 1);
        nameIndex_.emplace(name, index);
        return index;
    }

    // ---- Statements ----

    void ProgramCompiler::VisitBody(const StmtList& body)
    {
        for (const auto& stmt : body)
        {
            VisitStmt(*stmt);
        }
    }

    void ProgramCompiler::VisitStmt(const Stmt& stmt)
    {
        line_ = stmt.lineno;

        if (auto* exprStmt = dynamic_cast<const ExprStmt*>(&stmt))
        {
            VisitExpr(*exprStmt->value);
            Emit(OpCode::Pop);
        }
        else if (auto* assign = dynamic_cast<const Assign*>(&stmt))
        {
            VisitAssign(*assign);
        }
        else if (auto* augAssign = dynamic_cast<const AugAssign*>(&stmt))
        {
            VisitAugAssign(*augAssign);
        }
        else if (auto* importStmt = dynamic_cast<const Import*>(&stmt))
        {
            VisitImport(*importStmt);
        }
        else if (auto* importFrom = dynamic_cast<const ImportFrom*>(&stmt))
        {
            VisitImportFrom(*importFrom);
        }
        else if (auto* ifStmt = dynamic_cast<const If*>(&stmt))
        {
            VisitIf(*ifStmt);
        }
        else if (auto* whileStmt = dynamic_cast<const While*>(&stmt))
        {
            VisitWhile(*whileStmt);
        }
        else if (auto* forStmt = dynamic_cast<const For*>(&stmt))
        {
            VisitFor(*forStmt);
        }
        else if (auto* breakStmt = dynamic_cast<const Break*>(&stmt))
        {
            VisitBreak(*breakStmt);
        }
        else if (auto* continueStmt = dynamic_cast<const Continue*>(&stmt))
        {
            VisitContinue(*continueStmt);
        }
        else if (dynamic_cast<const Pass*>(&stmt) == nullptr)
        {
            ThrowError("Unsupported statement", stmt.lineno);
        }
    }

    void ProgramCompiler::VisitAssign(const Assign& assign)
    {
        VisitExpr(*assign.value);
        for (size_t i = 0; i < assign.targets.size(); ++i)
        {
            if (i + 1 < assign.targets.size())
            {
                Emit(OpCode::DupTop);
            }
            StoreTarget(*assign.targets[i]);
        }
    }

    void ProgramCompiler::VisitAugAssign(const AugAssign& augAssign)
    {
        const auto op = static_cast<int32_t>(augAssign.op);

        if (auto* name = dynamic_cast<const Name*>(augAssign.target.get()))
        {
            Emit(OpCode::LoadName, AddName(name->id));
            VisitExpr(*augAssign.value);
            line_ = augAssign.lineno;
            Emit(OpCode::BinaryOp, op);
            Emit(OpCode::StoreName, AddName(name->id));
            return;
        }

        auto* subscript = dynamic_cast<const Subscript*>(augAssign.target.get());
        if (subscript == nullptr)
        {
            ThrowError("Illegal target for augmented assignment", augAssign.lineno);
        }

        // container, key evaluated once: [c, k] -> [c, k, c, k] -> [c, k, v] -> [n, c, k]
        VisitExpr(*subscript->value);
        Emit(OpCode::DupTop);
        VisitExpr(*subscript->slice);
        Emit(OpCode::DupTop);
        Emit(OpCode::RotThree);
        Emit(OpCode::LoadSubscript);
        VisitExpr(*augAssign.value);
        line_ = augAssign.lineno;
        Emit(OpCode::BinaryOp, op);
        Emit(OpCode::RotThree);
        Emit(OpCode::StoreSubscript);
    }

    void ProgramCompiler::VisitImport(const Import& importStmt)
    {
        for (const auto& alias : importStmt.names)
        {
            Emit(OpCode::ImportModule, AddName(alias.name));
            // "import a.b" binds "a"
            std::string bound = alias.asname.value_or(alias.name.substr(0, alias.name.find('.')));
            Emit(OpCode::StoreName, AddName(bound));
        }
    }

    void ProgramCompiler::VisitImportFrom(const ImportFrom& importFrom)
    {
        std::string module = std::string(static_cast<size_t>(importFrom.level), '.') + importFrom.module;
        Emit(OpCode::ImportModule, AddName(module));
        for (const auto& alias : importFrom.names)
        {
            if (alias.name == "*")
            {
                ThrowError("Unsupported construct: wildcard import", importFrom.lineno);
            }
            Emit(OpCode::ImportFrom, AddName(alias.name));
            Emit(OpCode::StoreName, AddName(alias.asname.value_or(alias.name)));
        }
        Emit(OpCode::Pop);
    }

    void ProgramCompiler::VisitIf(const If& ifStmt)
    {
        VisitExpr(*ifStmt.test);
        size_t jumpToElse = Emit(OpCode::JumpIfFalse);
        VisitBody(ifStmt.body);

        if (ifStmt.orelse.empty())
        {
            PatchJump(jumpToElse, Here());
            return;
        }

        line_ = ifStmt.lineno;
        size_t jumpToEnd = Emit(OpCode::Jump);
        PatchJump(jumpToElse, Here());
        VisitBody(ifStmt.orelse);
        PatchJump(jumpToEnd, Here());
    }

    void ProgramCompiler::VisitWhile(const While& whileStmt)
    {
        size_t loopStart = Here();
        VisitExpr(*whileStmt.test);
        size_t exitJump = Emit(OpCode::JumpIfFalse);

        loops_.push_back(LoopFrame{loopStart, {}, false});
        VisitBody(whileStmt.body);
        line_ = whileStmt.lineno;
        Emit(OpCode::Jump, static_cast<int32_t>(loopStart));

        size_t loopEnd = Here();
        PatchJump(exitJump, loopEnd);
        for (size_t jump : loops_.back().breakJumps)
        {
            PatchJump(jump, loopEnd);
        }
        loops_.pop_back();
    }

    void ProgramCompiler::VisitFor(const For& forStmt)
    {
        VisitExpr(*forStmt.iter);
        line_ = forStmt.lineno;
        Emit(OpCode::GetIter);

        size_t loopStart = Here();
        size_t forIter = Emit(OpCode::ForIter);
        StoreTarget(*forStmt.target);

        loops_.push_back(LoopFrame{loopStart, {}, true});
        VisitBody(forStmt.body);
        line_ = forStmt.lineno;
        Emit(OpCode::Jump, static_cast<int32_t>(loopStart));

        // ForIter pops the exhausted iterator; break pops it explicitly
        size_t loopEnd = Here();
        PatchJump(forIter, loopEnd);
        for (size_t jump : loops_.back().breakJumps)
        {
            PatchJump(jump, loopEnd);
        }
        loops_.pop_back();
    }

    void ProgramCompiler::VisitBreak(const Break& breakStmt)
    {
        if (loops_.empty())
        {
            ThrowError("'break' outside loop", breakStmt.lineno);
        }
        if (loops_.back().isFor)
        {
            Emit(OpCode::Pop);
        }
        loops_.back().breakJumps.push_back(Emit(OpCode::Jump));
    }

    void ProgramCompiler::VisitContinue(const Continue& continueStmt)
    {
        if (loops_.empty())
        {
            ThrowError("'continue' not properly in loop", continueStmt.lineno);
        }
        Emit(OpCode::Jump, static_cast<int32_t>(loops_.back().continueTarget));
    }

    void ProgramCompiler::StoreTarget(const Expr& target)
    {
        if (auto* name = dynamic_cast<const Name*>(&target))
        {
            Emit(OpCode::StoreName, AddName(name->id));
            return;
        }
        if (auto* subscript = dynamic_cast<const Subscript*>(&target))
        {
            VisitExpr(*subscript->value);
            VisitExpr(*subscript->slice);
            Emit(OpCode::StoreSubscript);
            return;
        }

        const std::vector<ExprPtr>* elements = nullptr;
        if (auto* tuple = dynamic_cast<const Tuple*>(&target))
        {
            elements = &tuple->elts;
        }
        else if (auto* list = dynamic_cast<const List*>(&target))
        {
            elements = &list->elts;
        }
        if (elements == nullptr)
        {
            ThrowError("Cannot assign to expression", target.lineno);
        }

        Emit(OpCode::UnpackSequence, static_cast<int32_t>(elements->size()));
        for (const auto& element : *elements)
        {
            StoreTarget(*element);
        }
    }

    // ---- Expressions ----

    void ProgramCompiler::VisitExpr(const Expr& expr)
    {
        if (expr.lineno != 0)
        {
            line_ = expr.lineno;
        }

        if (auto* constant = dynamic_cast<const Constant*>(&expr))
        {
            Emit(OpCode::LoadConst, AddConstant(constant->value));
        }
        else if (auto* name = dynamic_cast<const Name*>(&expr))
        {
            Emit(OpCode::LoadName, AddName(name->id));
        }
        else if (auto* attr = dynamic_cast<const Attribute*>(&expr))
        {
            VisitExpr(*attr->value);
            line_ = attr->lineno;
            Emit(OpCode::LoadAttr, AddName(attr->attr));
        }
        else if (auto* call = dynamic_cast<const Call*>(&expr))
        {
            VisitCall(*call);
        }
        else if (auto* binOp = dynamic_cast<const BinOp*>(&expr))
        {
            VisitExpr(*binOp->left);
            VisitExpr(*binOp->right);
            line_ = binOp->lineno;
            Emit(OpCode::BinaryOp, static_cast<int32_t>(binOp->op));
        }
        else if (auto* unaryOp = dynamic_cast<const UnaryOp*>(&expr))
        {
            VisitExpr(*unaryOp->operand);
            line_ = unaryOp->lineno;
            Emit(OpCode::UnaryOp, static_cast<int32_t>(unaryOp->op));
        }
        else if (auto* boolOp = dynamic_cast<const BoolOp*>(&expr))
        {
            VisitBoolOp(*boolOp);
        }
        else if (auto* compare = dynamic_cast<const Compare*>(&expr))
        {
            VisitCompare(*compare);
        }
        else if (auto* ifExp = dynamic_cast<const IfExp*>(&expr))
        {
            VisitIfExp(*ifExp);
        }
        else if (auto* subscript = dynamic_cast<const Subscript*>(&expr))
        {
            VisitExpr(*subscript->value);
            VisitExpr(*subscript->slice);
            line_ = subscript->lineno;
            Emit(OpCode::LoadSubscript);
        }
        else if (auto* slice = dynamic_cast<const Slice*>(&expr))
        {
            VisitSlice(*slice);
        }
        else if (auto* tuple = dynamic_cast<const Tuple*>(&expr))
        {
            for (const auto& elt : tuple->elts)
            {
                VisitExpr(*elt);
            }
            Emit(OpCode::BuildTuple, static_cast<int32_t>(tuple->elts.size()));
        }
        else if (auto* list = dynamic_cast<const List*>(&expr))
        {
            for (const auto& elt : list->elts)
            {
                VisitExpr(*elt);
            }
            Emit(OpCode::BuildList, static_cast<int32_t>(list->elts.size()));
        }
        else if (auto* dict = dynamic_cast<const Dict*>(&expr))
        {
            for (size_t i = 0; i < dict->keys.size(); ++i)
            {
                VisitExpr(*dict->keys[i]);
                VisitExpr(*dict->values[i]);
            }
            Emit(OpCode::BuildDict, static_cast<int32_t>(dict->keys.size()));
        }
        else if (auto* listComp = dynamic_cast<const ListComp*>(&expr))
        {
            VisitListComp(*listComp);
        }
        else if (auto* joined = dynamic_cast<const JoinedStr*>(&expr))
        {
            VisitJoinedStr(*joined);
        }
        else
        {
            ThrowError("Unsupported expression", expr.lineno);
        }
    }

    void ProgramCompiler::VisitCall(const Call& call)
    {
        VisitExpr(*call.func);
        for (const auto& arg : call.args)
        {
            VisitExpr(*arg);
        }

        CallShape shape;
        shape.positional = static_cast<uint32_t>(call.args.size());
        for (const auto& [keyword, value] : call.keywords)
        {
            VisitExpr(*value);
            shape.keywords.push_back(keyword);
        }

        code_.callShapes.push_back(std::move(shape));
        line_ = call.lineno;
        Emit(OpCode::Call, static_cast<int32_t>(code_.callShapes.size() - 1));
    }

    void ProgramCompiler::VisitBoolOp(const BoolOp& boolOp)
    {
        const OpCode shortCircuit =
            boolOp.op == BoolOpType::And ? OpCode::JumpIfFalseOrPop : OpCode::JumpIfTrueOrPop;

        std::vector<size_t> jumps;
        for (size_t i = 0; i < boolOp.values.size(); ++i)
        {
            VisitExpr(*boolOp.values[i]);
            if (i + 1 < boolOp.values.size())
            {
                jumps.push_back(Emit(shortCircuit));
            }
        }
        for (size_t jump : jumps)
        {
            PatchJump(jump, Here());
        }
    }

    void ProgramCompiler::VisitCompare(const Compare& compare)
    {
        VisitExpr(*compare.left);

        const size_t count = compare.ops.size();
        std::vector<size_t> cleanupJumps;
        for (size_t i = 0; i + 1 < count; ++i)
        {
            VisitExpr(*compare.comparators[i]);
            line_ = compare.lineno;
            Emit(OpCode::DupTop);
            Emit(OpCode::RotThree);
            Emit(OpCode::Compare, static_cast<int32_t>(compare.ops[i]));
            cleanupJumps.push_back(Emit(OpCode::JumpIfFalseOrPop));
        }

        VisitExpr(*compare.comparators[count - 1]);
        line_ = compare.lineno;
        Emit(OpCode::Compare, static_cast<int32_t>(compare.ops[count - 1]));

        if (cleanupJumps.empty())
        {
            return;
        }

        size_t jumpToEnd = Emit(OpCode::Jump);
        for (size_t jump : cleanupJumps)
        {
            PatchJump(jump, Here());
        }
        // drop the duplicated middle operand under the False result
        Emit(OpCode::RotTwo);
        Emit(OpCode::Pop);
        PatchJump(jumpToEnd, Here());
    }

    void ProgramCompiler::VisitIfExp(const IfExp& ifExp)
    {
        VisitExpr(*ifExp.test);
        size_t jumpToElse = Emit(OpCode::JumpIfFalse);
        VisitExpr(*ifExp.body);
        size_t jumpToEnd = Emit(OpCode::Jump);
        PatchJump(jumpToElse, Here());
        VisitExpr(*ifExp.orelse);
        PatchJump(jumpToEnd, Here());
    }

    void ProgramCompiler::VisitSlice(const Slice& slice)
    {
        for (const ExprPtr* bound : {&slice.lower, &slice.upper, &slice.step})
        {
            if (*bound)
            {
                VisitExpr(**bound);
            }
            else
            {
                Emit(OpCode::LoadConst, AddConstant(std::monostate{}));
            }
        }
        Emit(OpCode::BuildSlice, 3);
    }

    void ProgramCompiler::VisitListComp(const ListComp& listComp)
    {
        const int line = listComp.lineno;
        Emit(OpCode::BuildList, 0);

        std::vector<std::pair<size_t, size_t>> loops; // (loop start, ForIter position)
        for (const auto& generator : listComp.generators)
        {
            VisitExpr(*generator.iter);
            line_ = line;
            Emit(OpCode::GetIter);
            size_t loopStart = Here();
            size_t forIter = Emit(OpCode::ForIter);
            StoreTarget(*generator.target);
            for (const auto& condition : generator.ifs)
            {
                VisitExpr(*condition);
                Emit(OpCode::JumpIfFalse, static_cast<int32_t>(loopStart));
            }
            loops.emplace_back(loopStart, forIter);
        }

        VisitExpr(*listComp.elt);
        line_ = line;
        Emit(OpCode::ListAppend, static_cast<int32_t>(listComp.generators.size() + 1));

        for (auto it = loops.rbegin(); it != loops.rend(); ++it)
        {
            Emit(OpCode::Jump, static_cast<int32_t>(it->first));
            PatchJump(it->second, Here());
        }
    }

    void ProgramCompiler::VisitJoinedStr(const JoinedStr& joined)
    {
        for (const auto& part : joined.values)
        {
            if (auto* field = dynamic_cast<const FormattedValue*>(part.get()))
            {
                VisitExpr(*field->value);
                code_.formats.push_back(FormatSpec{field->conversion, field->format_spec});
                line_ = field->lineno;
                Emit(OpCode::FormatValue, static_cast<int32_t>(code_.formats.size() - 1));
            }
            else
            {
                VisitExpr(*part);
            }
        }
        Emit(OpCode::BuildString, static_cast<int32_t>(joined.values.size()));
    }

} // namespace nlytics::sandbox
