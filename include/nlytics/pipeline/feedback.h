#pragma once
//
// NLytics Retry Feedback
//
// Text handed back to the code producer after a failed attempt, plus the
// normalization applied to generated code before validation.
//

#include <nlytics/sandbox/execution_outcome.h>
#include <nlytics/validator/validation_report.h>
#include <string>

namespace nlytics
{
    // Header line, one "- <Kind> (line <n>): <message>" line per error, closing instruction
    std::string BuildValidationFeedback(const ValidationReport& report, int attempt);

    // The executor's error message followed by its trace
    std::string BuildExecutionFeedback(const ExecutionOutcome& outcome);

    std::string BuildProducerFeedback(const std::string& detail);

    // Removes the common leading indentation and surrounding blank lines
    std::string NormalizeGeneratedCode(const std::string& code);

} // namespace nlytics
