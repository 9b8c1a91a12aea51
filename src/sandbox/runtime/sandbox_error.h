//
// NLytics Sandbox Faults
//
// Exceptions raised while a program runs inside the sandbox. The executor
// converts them into an ExecutionOutcome; they never leave the component.
//

#pragma once

#include <stdexcept>
#include <string>

namespace nlytics::sandbox
{
    class SandboxFault : public std::runtime_error
    {
    public:
        SandboxFault(std::string faultName, std::string detail)
            : std::runtime_error(faultName + ": " + detail),
              m_faultName(std::move(faultName)),
              m_detail(std::move(detail))
        {
        }

        // Python-style exception name, e.g. KeyError
        const std::string& FaultName() const { return m_faultName; }
        const std::string& Detail() const { return m_detail; }

        // Source line of the failing instruction, 0 until the VM attaches it
        int Line() const { return m_line; }
        void SetLine(int line)
        {
            if (m_line == 0)
            {
                m_line = line;
            }
        }

    private:
        std::string m_faultName;
        std::string m_detail;
        int m_line{0};
    };

    class RuntimeFaultError : public SandboxFault
    {
    public:
        using SandboxFault::SandboxFault;
    };

    class TimeoutFaultError : public SandboxFault
    {
    public:
        explicit TimeoutFaultError(const std::string& detail) : SandboxFault("TimeoutError", detail) {}
    };

    [[noreturn]] inline void ThrowFault(const std::string& faultName, const std::string& detail)
    {
        throw RuntimeFaultError(faultName, detail);
    }

    [[noreturn]] inline void ThrowTypeError(const std::string& detail) { ThrowFault("TypeError", detail); }
    [[noreturn]] inline void ThrowValueError(const std::string& detail) { ThrowFault("ValueError", detail); }
    [[noreturn]] inline void ThrowKeyError(const std::string& key) { ThrowFault("KeyError", "'" + key + "'"); }
    [[noreturn]] inline void ThrowIndexError(const std::string& detail) { ThrowFault("IndexError", detail); }

    [[noreturn]] inline void ThrowDisallowed(const std::string& name)
    {
        ThrowFault("DisallowedOperation", "'" + name + "' is not available in the sandbox");
    }

} // namespace nlytics::sandbox
