#pragma once
//
// NLytics Sandbox Executor
//
// Runs one program against a private copy of the dataset inside a
// restricted execution context with a preemption timer. Each call owns its
// context, buffers and timer, so one executor may serve concurrent calls.
//

#include <nlytics/config/pipeline_config.h>
#include <nlytics/sandbox/execution_outcome.h>
#include <epoch_frame/dataframe.h>
#include <cstdint>
#include <string>

namespace nlytics
{
    class SandboxExecutor
    {
    public:
        explicit SandboxExecutor(SandboxConfig config);

        // timeoutMs overrides the configured timeout for this call when positive
        ExecutionOutcome Execute(const std::string& code, const epoch_frame::DataFrame& dataset,
                                 int64_t timeoutMs = 0) const;

        const SandboxConfig& GetConfig() const { return m_config; }

    private:
        SandboxConfig m_config;
    };

} // namespace nlytics
