//
// NLytics Sandbox Virtual Machine Implementation
//

#include "virtual_machine.h"
#include "call_args.h"
#include "operators.h"
#include "sandbox_error.h"
#include <format>
#include <type_traits>
#include <variant>
#include <spdlog/spdlog.h>

namespace nlytics::sandbox
{
    namespace
    {
        std::optional<int64_t> SliceBound(const Value& bound)
        {
            if (bound.IsNone())
            {
                return std::nullopt;
            }
            if (bound.Is<int64_t>() || bound.Is<bool>())
            {
                return ToInteger(bound);
            }
            ThrowTypeError("slice indices must be integers or None");
        }

        Value MakeIterator(const Value& iterable)
        {
            if (iterable.Object<IteratorObject>())
            {
                return iterable;
            }
            if (auto* range = iterable.TryAs<RangeValue>())
            {
                return Value{std::make_shared<IteratorObject>(IteratorObject{*range, 0})};
            }
            return Value{std::make_shared<IteratorObject>(IteratorObject{Materialize(iterable), 0})};
        }
    } // namespace

    VirtualMachine::VirtualMachine(const CodeObject& code, ExecutionContext& context)
        : m_code(code), m_context(context)
    {
    }

    void VirtualMachine::Run()
    {
        const ActiveRunScope scope(m_context);
        size_t pc = 0;
        while (pc < m_code.instructions.size())
        {
            m_context.CheckPreempted();
            const Instruction& instruction = m_code.instructions[pc];
            try
            {
                Execute(instruction, pc);
            }
            catch (SandboxFault& fault)
            {
                fault.SetLine(instruction.line);
                throw;
            }
            catch (const std::bad_variant_access&)
            {
                RuntimeFaultError fault("TypeError",
                                        std::format("unsupported operand for {}", OpCodeName(instruction.op)));
                fault.SetLine(instruction.line);
                throw fault;
            }
            ++m_steps;
        }
        SPDLOG_DEBUG("Program finished after {} instructions", m_steps);
    }

    Value VirtualMachine::Pop()
    {
        if (m_stack.empty())
        {
            throw std::runtime_error("sandbox stack underflow");
        }
        Value value = std::move(m_stack.back());
        m_stack.pop_back();
        return value;
    }

    const Value& VirtualMachine::Top() const
    {
        if (m_stack.empty())
        {
            throw std::runtime_error("sandbox stack underflow");
        }
        return m_stack.back();
    }

    ValueList VirtualMachine::PopN(size_t count)
    {
        if (m_stack.size() < count)
        {
            throw std::runtime_error("sandbox stack underflow");
        }
        ValueList values(std::make_move_iterator(m_stack.end() - static_cast<std::ptrdiff_t>(count)),
                         std::make_move_iterator(m_stack.end()));
        m_stack.resize(m_stack.size() - count);
        return values;
    }

    Value VirtualMachine::Constant(int32_t index) const
    {
        return std::visit(
            [](const auto& constant) -> Value
            {
                using T = std::decay_t<decltype(constant)>;
                if constexpr (std::is_same_v<T, std::monostate>)
                {
                    return Value::None();
                }
                else
                {
                    return Value{constant};
                }
            },
            m_code.constants.at(static_cast<size_t>(index)));
    }

    const std::string& VirtualMachine::Name(int32_t index) const
    {
        return m_code.names.at(static_cast<size_t>(index));
    }

    void VirtualMachine::Execute(const Instruction& instruction, size_t& pc)
    {
        const int32_t arg = instruction.arg;
        size_t next = pc + 1;

        switch (instruction.op)
        {
        case OpCode::LoadConst:
            Push(Constant(arg));
            break;

        case OpCode::LoadName:
            Push(m_context.Lookup(Name(arg)));
            break;

        case OpCode::StoreName:
            m_context.Bind(Name(arg), Pop());
            break;

        case OpCode::LoadAttr:
        {
            Value object = Pop();
            Push(GetAttribute(object, Name(arg)));
            break;
        }

        case OpCode::LoadSubscript:
        {
            Value key = Pop();
            Value object = Pop();
            Push(GetItem(object, key));
            break;
        }

        case OpCode::StoreSubscript:
        {
            Value key = Pop();
            Value object = Pop();
            Value value = Pop();
            SetItem(object, key, value);
            break;
        }

        case OpCode::BuildList:
            Push(MakeList(PopN(static_cast<size_t>(arg))));
            break;

        case OpCode::BuildTuple:
            Push(MakeTuple(PopN(static_cast<size_t>(arg))));
            break;

        case OpCode::BuildDict:
        {
            ValueList flat = PopN(static_cast<size_t>(arg) * 2);
            Value dict = MakeDict();
            for (size_t i = 0; i + 1 < flat.size(); i += 2)
            {
                dict.Object<DictObject>()->Set(flat[i], flat[i + 1]);
            }
            Push(std::move(dict));
            break;
        }

        case OpCode::BuildSlice:
        {
            ValueList bounds = PopN(3);
            Push(Value{SliceValue{SliceBound(bounds[0]), SliceBound(bounds[1]), SliceBound(bounds[2])}});
            break;
        }

        case OpCode::BuildString:
        {
            std::string text;
            for (const auto& part : PopN(static_cast<size_t>(arg)))
            {
                text += Str(part);
                m_context.CheckSequenceLength(text.size());
            }
            Push(Value{std::move(text)});
            break;
        }

        case OpCode::FormatValue:
        {
            const FormatSpec& format = m_code.formats.at(static_cast<size_t>(arg));
            Value value = Pop();
            Push(Value{FormatField(value, format.conversion, format.spec)});
            break;
        }

        case OpCode::BinaryOp:
        {
            Value rhs = Pop();
            Value lhs = Pop();
            Push(BinaryOperation(static_cast<BinOpType>(arg), lhs, rhs));
            break;
        }

        case OpCode::UnaryOp:
            Push(UnaryOperation(static_cast<UnaryOpType>(arg), Pop()));
            break;

        case OpCode::Compare:
        {
            Value rhs = Pop();
            Value lhs = Pop();
            Push(CompareValues(static_cast<CmpOpType>(arg), lhs, rhs));
            break;
        }

        case OpCode::Call:
        {
            const CallShape& shape = m_code.callShapes.at(static_cast<size_t>(arg));
            CallArgs args;
            ValueList keywordValues = PopN(shape.keywords.size());
            args.positional = PopN(shape.positional);
            for (size_t i = 0; i < shape.keywords.size(); ++i)
            {
                args.keywords.emplace_back(shape.keywords[i], std::move(keywordValues[i]));
            }
            Value callee = Pop();
            Push(CallValue(m_context, callee, args));
            break;
        }

        case OpCode::Pop:
            Pop();
            break;

        case OpCode::DupTop:
            Push(Top());
            break;

        case OpCode::RotTwo:
        {
            Value first = Pop();
            Value second = Pop();
            Push(std::move(first));
            Push(std::move(second));
            break;
        }

        case OpCode::RotThree:
        {
            // [a, b, c] -> [c, a, b]
            Value c = Pop();
            Value b = Pop();
            Value a = Pop();
            Push(std::move(c));
            Push(std::move(a));
            Push(std::move(b));
            break;
        }

        case OpCode::Jump:
            next = static_cast<size_t>(arg);
            break;

        case OpCode::JumpIfFalse:
            if (!Truthy(Pop()))
            {
                next = static_cast<size_t>(arg);
            }
            break;

        case OpCode::JumpIfTrue:
            if (Truthy(Pop()))
            {
                next = static_cast<size_t>(arg);
            }
            break;

        case OpCode::JumpIfFalseOrPop:
            if (!Truthy(Top()))
            {
                next = static_cast<size_t>(arg);
            }
            else
            {
                Pop();
            }
            break;

        case OpCode::JumpIfTrueOrPop:
            if (Truthy(Top()))
            {
                next = static_cast<size_t>(arg);
            }
            else
            {
                Pop();
            }
            break;

        case OpCode::GetIter:
            Push(MakeIterator(Pop()));
            break;

        case OpCode::ForIter:
        {
            auto* iterator = Top().Object<IteratorObject>();
            if (iterator == nullptr)
            {
                throw std::runtime_error("ForIter without an iterator on the stack");
            }
            if (auto item = iterator->Next())
            {
                Push(std::move(*item));
            }
            else
            {
                Pop();
                next = static_cast<size_t>(arg);
            }
            break;
        }

        case OpCode::UnpackSequence:
        {
            ValueList items = Materialize(Pop());
            const size_t expected = static_cast<size_t>(arg);
            if (items.size() > expected)
            {
                ThrowValueError(std::format("too many values to unpack (expected {})", expected));
            }
            if (items.size() < expected)
            {
                ThrowValueError(std::format("not enough values to unpack (expected {}, got {})", expected, items.size()));
            }
            for (auto it = items.rbegin(); it != items.rend(); ++it)
            {
                Push(std::move(*it));
            }
            break;
        }

        case OpCode::ListAppend:
        {
            Value item = Pop();
            const size_t distance = static_cast<size_t>(arg);
            if (m_stack.size() < distance)
            {
                throw std::runtime_error("sandbox stack underflow");
            }
            auto* list = m_stack[m_stack.size() - distance].Object<ListObject>();
            if (list == nullptr)
            {
                throw std::runtime_error("ListAppend target is not a list");
            }
            m_context.CheckSequenceLength(uint64_t{list->items.size()} + 1);
            list->items.push_back(std::move(item));
            break;
        }

        case OpCode::ImportModule:
            Push(m_context.ImportModule(Name(arg)));
            break;

        case OpCode::ImportFrom:
        {
            const Value module = Top();
            const std::string& name = Name(arg);
            try
            {
                Push(GetAttribute(module, name));
            }
            catch (const RuntimeFaultError& fault)
            {
                if (fault.FaultName() != "AttributeError")
                {
                    throw;
                }
                ThrowFault("ImportError",
                           std::format("cannot import name '{}' from '{}'", name, module.Object<ModuleObject>()->name));
            }
            break;
        }
        }

        pc = next;
    }

} // namespace nlytics::sandbox
