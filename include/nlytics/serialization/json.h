#pragma once
//
// NLytics JSON Output
//
// glaze renderings of reports, outcomes and pipeline results. Frames and
// sequences are written as bounded previews.
//

#include <nlytics/pipeline/retry_orchestrator.h>
#include <nlytics/sandbox/execution_outcome.h>
#include <nlytics/validator/validation_report.h>
#include <string>

namespace nlytics
{
    // Rows of a frame (or items of a sequence) written per result
    constexpr std::size_t kJsonPreviewRows = 100;

    // Each throws std::runtime_error if glaze fails to write
    std::string ToJson(const ValidationReport& report);
    std::string ToJson(const ExecutionOutcome& outcome);
    std::string ToJson(const PipelineResult& result);

} // namespace nlytics
