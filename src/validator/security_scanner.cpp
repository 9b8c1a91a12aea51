//
// NLytics Security Scanner Implementation
//

#include "security_scanner.h"
#include <format>

namespace nlytics
{
    SecurityScanner::SecurityScanner(const std::vector<DenyPattern>& patterns)
    {
        m_patterns.reserve(patterns.size());
        for (const auto& pattern : patterns)
        {
            try
            {
                m_patterns.push_back(CompiledPattern{
                    pattern.pattern, std::regex(pattern.pattern, std::regex::ECMAScript | std::regex::icase)});
            }
            catch (const std::regex_error& e)
            {
                throw ConfigError(std::format("invalid deny pattern '{}': {}", pattern.pattern, e.what()));
            }
        }
    }

    std::vector<ValidationIssue> SecurityScanner::Scan(const std::string& code) const
    {
        std::vector<ValidationIssue> issues;
        const auto lines = SplitLines(code);
        for (const auto& pattern : m_patterns)
        {
            for (std::size_t index = 0; index < lines.size(); ++index)
            {
                using Iterator = std::regex_iterator<std::string_view::const_iterator>;
                const auto& line = lines[index];
                for (Iterator it(line.begin(), line.end(), pattern.regex); it != Iterator(); ++it)
                {
                    issues.push_back(ValidationIssue{epoch_core::ValidationErrorKind::SecurityViolation,
                                                     std::format("Dangerous operation detected: {}", it->str()),
                                                     static_cast<int>(index) + 1});
                }
            }
        }
        return issues;
    }

    std::vector<std::string_view> SplitLines(std::string_view text)
    {
        std::vector<std::string_view> lines;
        std::size_t start = 0;
        while (true)
        {
            const auto end = text.find('\n', start);
            if (end == std::string_view::npos)
            {
                lines.push_back(text.substr(start));
                return lines;
            }
            lines.push_back(text.substr(start, end - start));
            start = end + 1;
        }
    }

} // namespace nlytics
