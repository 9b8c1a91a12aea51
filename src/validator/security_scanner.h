//
// NLytics Security Scanner
//
// Case-insensitive deny-list scan over raw program text. Pattern scanning is
// defense-in-depth only; the sandbox context is the enforcing boundary.
//

#pragma once

#include <nlytics/config/pipeline_config.h>
#include <nlytics/validator/validation_report.h>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace nlytics
{
    class SecurityScanner
    {
    public:
        // Throws ConfigError for a pattern that does not compile
        explicit SecurityScanner(const std::vector<DenyPattern>& patterns);

        // One SecurityViolation per match, grouped by pattern in configuration order
        std::vector<ValidationIssue> Scan(const std::string& code) const;

    private:
        struct CompiledPattern
        {
            std::string source;
            std::regex regex;
        };

        std::vector<CompiledPattern> m_patterns;
    };

    // Program text split on '\n'; line N of the program is element N-1.
    // Patterns run one line at a time so a match never spans lines.
    std::vector<std::string_view> SplitLines(std::string_view text);

} // namespace nlytics
