//
// NLytics Column Auditor
//
// Heuristic: quoted identifier-like literals that are not dataset columns
// produce warnings. It misses computed references and flags unrelated
// literals, so it never produces errors.
//

#pragma once

#include <nlytics/validator/validation_report.h>
#include <regex>
#include <string>
#include <vector>

namespace nlytics
{
    class ColumnAuditor
    {
    public:
        explicit ColumnAuditor(std::size_t minLiteralLength);

        std::vector<ValidationWarning> Audit(const std::string& code,
                                             const std::vector<std::string>& knownColumns) const;

    private:
        std::size_t m_minLength;
        std::regex m_literalPattern;
    };

} // namespace nlytics
