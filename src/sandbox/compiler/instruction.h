//
// NLytics Sandbox Instruction Set
//
// Closed instruction set executed by the sandbox virtual machine. The
// program compiler is the only producer of these instructions.
//

#pragma once

#include "parser/ast_nodes.h"
#include <cstdint>
#include <string>
#include <vector>

namespace nlytics::sandbox
{
    enum class OpCode : uint8_t
    {
        LoadConst,        // arg: constant index
        LoadName,         // arg: name index
        StoreName,        // arg: name index
        LoadAttr,         // arg: name index
        LoadSubscript,    // TOS1[TOS]
        StoreSubscript,   // TOS1[TOS] = TOS2
        BuildList,        // arg: element count
        BuildTuple,       // arg: element count
        BuildDict,        // arg: pair count, keys and values interleaved
        BuildSlice,       // start, stop, step (None for omitted)
        BuildString,      // arg: part count
        FormatValue,      // arg: format index
        BinaryOp,         // arg: BinOpType
        UnaryOp,          // arg: UnaryOpType
        Compare,          // arg: CmpOpType
        Call,             // arg: call shape index
        Pop,
        DupTop,
        RotTwo,
        RotThree,
        Jump,             // arg: target
        JumpIfFalse,      // pops
        JumpIfTrue,       // pops
        JumpIfFalseOrPop, // keeps TOS when jumping
        JumpIfTrueOrPop,  // keeps TOS when jumping
        GetIter,
        ForIter,          // arg: target once exhausted (iterator popped)
        UnpackSequence,   // arg: element count
        ListAppend,       // arg: distance of the list below TOS
        ImportModule,     // arg: name index
        ImportFrom        // arg: name index, module stays on the stack
    };

    struct Instruction
    {
        OpCode op;
        int32_t arg{0};
        int line{0};
    };

    struct CallShape
    {
        uint32_t positional{0};
        std::vector<std::string> keywords; // values follow the positional arguments
    };

    struct FormatSpec
    {
        char conversion{0};
        std::string spec;
    };

    struct CodeObject
    {
        std::vector<Instruction> instructions;
        std::vector<ConstantValue> constants;
        std::vector<std::string> names;
        std::vector<CallShape> callShapes;
        std::vector<FormatSpec> formats;
    };

    const char* OpCodeName(OpCode op);

} // namespace nlytics::sandbox
