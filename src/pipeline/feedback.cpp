//
// NLytics Retry Feedback Implementation
//

#include <nlytics/pipeline/feedback.h>
#include <algorithm>
#include <format>
#include <limits>
#include <sstream>
#include <vector>

namespace nlytics
{
    std::string BuildValidationFeedback(const ValidationReport& report, int attempt)
    {
        std::string feedback = std::format("The code generated on attempt {} has issues:\n", attempt);
        for (const auto& error : report.errors)
        {
            feedback += std::format("\n- {} (line {}): {}", epoch_core::ValidationErrorKindWrapper::ToString(error.kind),
                                    error.line, error.message);
        }
        feedback += "\n\nPlease regenerate the code addressing these issues.";
        return feedback;
    }

    std::string BuildExecutionFeedback(const ExecutionOutcome& outcome)
    {
        if (!outcome.error)
        {
            return {};
        }
        return std::format("{}\n\n{}", outcome.error->message, outcome.error->trace);
    }

    std::string BuildProducerFeedback(const std::string& detail)
    {
        return std::format("ProducerError: {}\n\nPlease generate the code again.", detail);
    }

    std::string NormalizeGeneratedCode(const std::string& code)
    {
        std::vector<std::string> lines;
        std::istringstream stream(code);
        for (std::string line; std::getline(stream, line);)
        {
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            lines.push_back(std::move(line));
        }

        auto blank = [](const std::string& line) { return line.find_first_not_of(" \t") == std::string::npos; };
        while (!lines.empty() && blank(lines.front()))
        {
            lines.erase(lines.begin());
        }
        while (!lines.empty() && blank(lines.back()))
        {
            lines.pop_back();
        }

        size_t indent = std::numeric_limits<size_t>::max();
        for (const auto& line : lines)
        {
            if (!blank(line))
            {
                indent = std::min(indent, line.find_first_not_of(" \t"));
            }
        }

        std::string normalized;
        for (size_t i = 0; i < lines.size(); ++i)
        {
            const std::string& line = lines[i];
            normalized += blank(line) ? std::string{} : line.substr(indent);
            if (i + 1 < lines.size())
            {
                normalized += '\n';
            }
        }
        return normalized;
    }

} // namespace nlytics
