#pragma once
//
// NLytics Execution Outcome
//
// What one sandboxed run produced. Failures are values here; nothing the
// program does escapes the executor as an exception.
//

#include <nlytics/core/constants.h>
#include <nlytics/core/result_value.h>
#include <cstdint>
#include <optional>
#include <string>

namespace nlytics
{
    struct ExecutionError
    {
        epoch_core::ExecutionFaultKind kind;
        std::string message; // "<FaultName>: <detail>"
        std::string trace;   // traceback naming the failing source line
        int line{0};
    };

    struct ExecutionOutcome
    {
        bool success{false};
        ResultValue result;
        std::string stdout_text;
        std::string stderr_text;
        int64_t duration_ms{0};
        std::optional<ExecutionError> error;
        bool output_truncated{false};

        // ResultValue::TypeName() of the result, "Empty" on failure
        std::string ResultType() const { return result.TypeName(); }
    };

} // namespace nlytics
