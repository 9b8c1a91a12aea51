//
// NLytics Execution Context
//
// Namespace of one sandboxed run: program globals, the restricted builtin
// table, module handles and the output buffers. A context is created per
// execute() call and never shared.
//

#pragma once

#include "output_capture.h"
#include "value.h"
#include <nlytics/config/pipeline_config.h>
#include <atomic>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace nlytics::sandbox
{
    class ExecutionContext
    {
    public:
        ExecutionContext(const SandboxConfig& config, OutputCapture& output, const std::atomic<bool>& preempted,
                         int64_t timeoutMs);

        ExecutionContext(const ExecutionContext&) = delete;
        ExecutionContext& operator=(const ExecutionContext&) = delete;

        // Globals first, then builtins; NameError when neither binds the name
        const Value& Lookup(const std::string& name) const;
        const Value* TryLookup(const std::string& name) const;

        // Program globals only; used to read back the result binding
        const Value* FindGlobal(const std::string& name) const;

        void Bind(const std::string& name, Value value);
        void BindBuiltin(const std::string& name, Value value);

        // Import hook: only allow-listed modules resolve
        Value ImportModule(const std::string& name) const;

        OutputCapture& Output() { return m_output; }
        const SandboxConfig& Config() const { return m_config; }

        bool Preempted() const { return m_preempted.load(std::memory_order_relaxed); }

        // Throws TimeoutFaultError once the preemption timer fired
        void CheckPreempted() const;

        // Throws MemoryError when a container of `items` elements exceeds sandbox.max_sequence_items
        void CheckSequenceLength(uint64_t items) const;

    private:
        const SandboxConfig& m_config;
        OutputCapture& m_output;
        const std::atomic<bool>& m_preempted;
        int64_t m_timeoutMs;
        std::unordered_map<std::string, Value> m_globals;
        std::unordered_map<std::string, Value> m_builtins;
    };

    // Makes a context reachable from runtime helpers that take no context
    // parameter (Materialize, operators, container methods) for the lifetime
    // of one run on the current thread.
    class ActiveRunScope
    {
    public:
        explicit ActiveRunScope(const ExecutionContext& context);
        ~ActiveRunScope();

        ActiveRunScope(const ActiveRunScope&) = delete;
        ActiveRunScope& operator=(const ActiveRunScope&) = delete;

    private:
        const ExecutionContext* m_previous;
    };

    // Both forward to the active run's context and do nothing outside a run
    void PollPreemption();
    void CheckSequenceLength(uint64_t items);

    // size * times, saturating at UINT64_MAX
    uint64_t RepeatedLength(uint64_t size, int64_t times);

} // namespace nlytics::sandbox
