#pragma once
//
// NLytics Validation Report
//
// Structured result of static analysis over one generated program.
//

#include <nlytics/core/constants.h>
#include <string>
#include <vector>

namespace nlytics
{
    struct ValidationIssue
    {
        epoch_core::ValidationErrorKind kind;
        std::string message;
        int line{0}; // 0 when the check is not tied to a line
    };

    struct ValidationWarning
    {
        std::string message;
        int line{0};
    };

    struct ValidationReport
    {
        bool valid{false};
        std::vector<ValidationIssue> errors;   // security, syntax, shape, import order
        std::vector<ValidationWarning> warnings;
        int score{0};                          // 0..100

        bool HasError(epoch_core::ValidationErrorKind kind) const
        {
            for (const auto& error : errors)
            {
                if (error.kind == kind)
                {
                    return true;
                }
            }
            return false;
        }
    };

    // 100 - 25 per error - 5 per warning, floored at 0
    int ComputeValidationScore(std::size_t errorCount, std::size_t warningCount);

} // namespace nlytics
