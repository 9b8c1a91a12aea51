#pragma once
//
// NLytics Display Formatter
//
// Markdown renderings of validation reports, execution outcomes and retry
// notices for chat-style front ends.
//

#include <nlytics/sandbox/execution_outcome.h>
#include <nlytics/validator/validation_report.h>
#include <string>

namespace nlytics
{
    std::string FormatValidationForDisplay(const ValidationReport& report);

    // Frames become markdown tables and sequences bullet lists, both capped at
    // kDisplayPreviewRows entries
    std::string FormatOutcomeForDisplay(const ExecutionOutcome& outcome);

    std::string FormatRetryInfo(int attempt, int maxAttempts, const std::string& feedback);

} // namespace nlytics
