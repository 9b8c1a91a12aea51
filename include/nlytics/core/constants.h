#pragma once
//
// NLytics shared enums and scoring constants
//
#include <epoch_core/enum_wrapper.h>
#include <cstddef>

// Validator-originated failures. None of these ever reaches the executor.
CREATE_ENUM(ValidationErrorKind,
            SecurityViolation,   // deny-list pattern matched
            SyntaxError,         // parser rejected the program
            ShapeError,          // result variable never assigned
            UnauthorizedImport); // module outside the allow-list

// Executor-originated failures
CREATE_ENUM(ExecutionFaultKind,
            RuntimeFault,  // any fault raised while interpreting
            TimeoutFault); // preemption timer fired

// Retry orchestrator states
CREATE_ENUM(PipelineStage,
            Generating,
            Validating,
            Executing,
            Succeeded,
            Failed);

namespace nlytics
{
    // Validation score deductions
    constexpr int kMaxValidationScore = 100;
    constexpr int kErrorScorePenalty = 25;
    constexpr int kWarningScorePenalty = 5;

    // Display previews (frames and sequences)
    constexpr std::size_t kDisplayPreviewRows = 10;
    constexpr std::size_t kDisplayCellWidth = 50;

    // Upper bound for validator.max_line_length; the deny-list regexes
    // recurse per character, so longer lines are never handed to them
    constexpr std::size_t kMaxScannableLineLength = 4096;
} // namespace nlytics
