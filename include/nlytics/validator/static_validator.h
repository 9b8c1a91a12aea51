#pragma once
//
// NLytics Static Validator
//
// Pure analysis of program text: size limits, deny-list scan, syntax check, result
// shape check, import audit and a non-blocking column audit. The program
// is never executed.
//

#include <nlytics/config/pipeline_config.h>
#include <nlytics/validator/validation_report.h>
#include <memory>
#include <string>
#include <vector>

namespace nlytics
{
    class SecurityScanner;
    class ImportAuditor;
    class ColumnAuditor;

    class StaticValidator
    {
    public:
        // Throws ConfigError if a deny pattern does not compile
        explicit StaticValidator(ValidatorConfig config);
        ~StaticValidator();

        StaticValidator(StaticValidator&&) noexcept;
        StaticValidator& operator=(StaticValidator&&) noexcept;

        ValidationReport Validate(const std::string& code, const std::vector<std::string>& knownColumns) const;

        const ValidatorConfig& GetConfig() const { return m_config; }

    private:
        // Oversized programs and overlong lines; empty when the program may be scanned
        std::vector<ValidationIssue> CheckCodeSize(const std::string& code) const;

        ValidatorConfig m_config;
        std::unique_ptr<SecurityScanner> m_securityScanner;
        std::unique_ptr<ImportAuditor> m_importAuditor;
        std::unique_ptr<ColumnAuditor> m_columnAuditor;
    };

} // namespace nlytics
