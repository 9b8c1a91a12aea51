#pragma once
//
// NLytics Retry Orchestrator
//
// Drives generate -> validate -> execute for up to max_attempts attempts.
// Attempts run strictly in sequence; the only state carried from one
// attempt to the next is the attempt number and the last feedback.
//

#include <nlytics/config/pipeline_config.h>
#include <nlytics/core/constants.h>
#include <nlytics/pipeline/code_producer.h>
#include <nlytics/sandbox/sandbox_executor.h>
#include <nlytics/validator/static_validator.h>
#include <epoch_frame/dataframe.h>
#include <optional>
#include <string>
#include <vector>

namespace nlytics
{
    struct PipelineQuery
    {
        std::string query_text;
        std::string structured_intent;
        std::string execution_plan;
    };

    // Everything one attempt produced; report and outcome are absent when the
    // attempt ended before reaching that stage
    struct AttemptRecord
    {
        int attempt{0};
        std::optional<GeneratedProgram> program;
        std::optional<ValidationReport> report;
        std::optional<ExecutionOutcome> outcome;
        std::optional<std::string> producer_error;
        std::optional<std::string> feedback; // sent to the next attempt
    };

    struct PipelineResult
    {
        epoch_core::PipelineStage stage{epoch_core::PipelineStage::Failed}; // Succeeded or Failed
        int attempts{0};
        std::string query;

        // Terminal success carries the outcome; terminal failure carries the last
        // report or outcome produced
        std::optional<ExecutionOutcome> outcome;
        std::optional<ValidationReport> last_report;
        std::optional<std::string> last_feedback;

        std::vector<AttemptRecord> history;

        bool Succeeded() const { return stage == epoch_core::PipelineStage::Succeeded; }
        int64_t DurationMs() const { return outcome ? outcome->duration_ms : 0; }
    };

    class RetryOrchestrator
    {
    public:
        // Throws ConfigError when the configuration is out of range
        RetryOrchestrator(PipelineConfig config, ICodeProducerPtr producer);

        PipelineResult Run(const PipelineQuery& query, const epoch_frame::DataFrame& dataset) const;

        const PipelineConfig& GetConfig() const { return m_config; }

    private:
        PipelineConfig m_config;
        ICodeProducerPtr m_producer;
        StaticValidator m_validator;
        SandboxExecutor m_executor;
    };

} // namespace nlytics
