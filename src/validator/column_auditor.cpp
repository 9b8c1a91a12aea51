//
// NLytics Column Auditor Implementation
//

#include "column_auditor.h"
#include "security_scanner.h"
#include <format>
#include <unordered_set>

namespace nlytics
{
    ColumnAuditor::ColumnAuditor(std::size_t minLiteralLength)
        : m_minLength(minLiteralLength), m_literalPattern(R"(['"]([a-zA-Z_][a-zA-Z0-9_]*)['"])")
    {
    }

    std::vector<ValidationWarning> ColumnAuditor::Audit(const std::string& code,
                                                        const std::vector<std::string>& knownColumns) const
    {
        const std::unordered_set<std::string> known(knownColumns.begin(), knownColumns.end());

        std::vector<ValidationWarning> warnings;
        const auto lines = SplitLines(code);
        for (std::size_t index = 0; index < lines.size(); ++index)
        {
            using Iterator = std::regex_iterator<std::string_view::const_iterator>;
            const auto& line = lines[index];
            for (Iterator it(line.begin(), line.end(), m_literalPattern); it != Iterator(); ++it)
            {
                const std::string literal = (*it)[1].str();
                if (literal.size() < m_minLength || known.contains(literal))
                {
                    continue;
                }
                warnings.push_back(ValidationWarning{std::format("Column \"{}\" not found in dataset", literal),
                                                     static_cast<int>(index) + 1});
            }
        }
        return warnings;
    }

} // namespace nlytics
