//
// NLytics Retry Orchestrator Implementation
//

#include <nlytics/pipeline/retry_orchestrator.h>
#include <nlytics/pipeline/feedback.h>
#include <spdlog/spdlog.h>
#include <format>
#include <stdexcept>

namespace nlytics
{
    namespace
    {
        const char* StageName(epoch_core::PipelineStage stage)
        {
            switch (stage)
            {
            case epoch_core::PipelineStage::Generating: return "GENERATING";
            case epoch_core::PipelineStage::Validating: return "VALIDATING";
            case epoch_core::PipelineStage::Executing: return "EXECUTING";
            case epoch_core::PipelineStage::Succeeded: return "TERMINAL(success)";
            case epoch_core::PipelineStage::Failed: return "TERMINAL(failed)";
            default: return "UNKNOWN";
            }
        }

        PipelineConfig Validated(PipelineConfig config)
        {
            ValidatePipelineConfig(config);
            return config;
        }
    } // namespace

    RetryOrchestrator::RetryOrchestrator(PipelineConfig config, ICodeProducerPtr producer)
        : m_config(Validated(std::move(config))),
          m_producer(std::move(producer)),
          m_validator(m_config.validator),
          m_executor(m_config.sandbox)
    {
        if (!m_producer)
        {
            throw std::invalid_argument("RetryOrchestrator requires a code producer");
        }
    }

    PipelineResult RetryOrchestrator::Run(const PipelineQuery& query, const epoch_frame::DataFrame& dataset) const
    {
        const ColumnManifest manifest = DescribeColumns(dataset);
        const std::vector<std::string> knownColumns = ColumnNames(manifest);
        const int maxAttempts = m_config.retry.max_attempts;

        PipelineResult result;
        result.query = query.query_text;
        std::optional<std::string> lastFeedback;

        SPDLOG_INFO("Pipeline started for query '{}' (max {} attempts)", query.query_text, maxAttempts);

        for (int attempt = 1; attempt <= maxAttempts; ++attempt)
        {
            AttemptRecord record;
            record.attempt = attempt;
            result.attempts = attempt;
            SPDLOG_DEBUG("Attempt {}/{}: {}", attempt, maxAttempts, StageName(epoch_core::PipelineStage::Generating));

            GenerationRequest request{query.query_text, query.structured_intent, query.execution_plan,
                                      manifest,         lastFeedback,            attempt};
            try
            {
                record.program = m_producer->Generate(request);
            }
            catch (const std::exception& e)
            {
                SPDLOG_WARN("Code producer failed on attempt {}: {}", attempt, e.what());
                record.producer_error = e.what();
                record.feedback = BuildProducerFeedback(e.what());
                lastFeedback = record.feedback;
                result.history.push_back(std::move(record));
                continue;
            }

            GeneratedProgram& program = *record.program;
            program.code = NormalizeGeneratedCode(program.code);
            if (!program.declared_result_name.empty() && program.declared_result_name != m_config.validator.result_name)
            {
                SPDLOG_WARN("Producer declared result '{}' but the pipeline reads '{}'", program.declared_result_name,
                            m_config.validator.result_name);
            }

            SPDLOG_DEBUG("Attempt {}/{}: {}", attempt, maxAttempts, StageName(epoch_core::PipelineStage::Validating));
            ValidationReport report = m_validator.Validate(program.code, knownColumns);
            record.report = report;
            result.last_report = report;
            result.outcome.reset();

            if (!report.valid)
            {
                SPDLOG_INFO("Attempt {}/{} rejected by validation ({} errors)", attempt, maxAttempts,
                            report.errors.size());
                record.feedback = BuildValidationFeedback(report, attempt);
                lastFeedback = record.feedback;
                result.history.push_back(std::move(record));
                continue;
            }

            SPDLOG_DEBUG("Attempt {}/{}: {}", attempt, maxAttempts, StageName(epoch_core::PipelineStage::Executing));
            ExecutionOutcome outcome = m_executor.Execute(program.code, dataset);
            record.outcome = outcome;
            result.outcome = outcome;

            if (outcome.success)
            {
                result.history.push_back(std::move(record));
                result.stage = epoch_core::PipelineStage::Succeeded;
                result.last_feedback = lastFeedback;
                SPDLOG_INFO("Pipeline succeeded on attempt {}/{} in {} ms", attempt, maxAttempts, outcome.duration_ms);
                return result;
            }

            SPDLOG_INFO("Attempt {}/{} failed during execution: {}", attempt, maxAttempts, outcome.error->message);
            record.feedback = BuildExecutionFeedback(outcome);
            lastFeedback = record.feedback;
            result.history.push_back(std::move(record));
        }

        result.stage = epoch_core::PipelineStage::Failed;
        result.last_feedback = lastFeedback;
        spdlog::error("Pipeline failed after {} attempts", result.attempts);
        return result;
    }

} // namespace nlytics
