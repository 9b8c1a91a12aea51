//
// NLytics Operators
//
// Python operator semantics over sandbox values: arithmetic, comparison,
// membership, item and attribute access, calls and f-string formatting.
//

#pragma once

#include "call_args.h"
#include "execution_context.h"
#include "parser/ast_nodes.h"
#include "value.h"
#include <string>

namespace nlytics::sandbox
{
    Value BinaryOperation(BinOpType op, const Value& lhs, const Value& rhs);
    Value UnaryOperation(UnaryOpType op, const Value& operand);
    Value CompareValues(CmpOpType op, const Value& lhs, const Value& rhs);

    // `item in container`
    bool Contains(const Value& container, const Value& item);

    Value GetItem(const Value& object, const Value& key);
    void SetItem(const Value& object, const Value& key, const Value& value);

    // Double-underscore names are never reachable
    Value GetAttribute(const Value& object, const std::string& name);

    Value CallValue(ExecutionContext& context, const Value& callee, const CallArgs& args);

    // f-string field: conversion ('r', 's', 'a' or 0) then format spec
    std::string FormatField(const Value& value, char conversion, const std::string& spec);

    // Python ordering used by sorted(), min() and max()
    bool LessThan(const Value& lhs, const Value& rhs);

} // namespace nlytics::sandbox
