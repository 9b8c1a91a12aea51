//
// NLytics Sandbox Virtual Machine
//
// Stack machine over a compiled CodeObject. The preemption token is polled
// before every instruction, so a program that never returns still stops
// once the timer fires. Faults leave the machine with the failing source
// line attached.
//

#pragma once

#include "sandbox/compiler/instruction.h"
#include "execution_context.h"
#include "value.h"
#include <vector>

namespace nlytics::sandbox
{
    class VirtualMachine
    {
    public:
        VirtualMachine(const CodeObject& code, ExecutionContext& context);

        void Run();

        // Instructions executed so far, for debug logging
        size_t StepCount() const { return m_steps; }

    private:
        void Execute(const Instruction& instruction, size_t& pc);

        void Push(Value value) { m_stack.push_back(std::move(value)); }
        Value Pop();
        const Value& Top() const;
        ValueList PopN(size_t count);

        Value Constant(int32_t index) const;
        const std::string& Name(int32_t index) const;

        const CodeObject& m_code;
        ExecutionContext& m_context;
        std::vector<Value> m_stack;
        size_t m_steps{0};
    };

} // namespace nlytics::sandbox
