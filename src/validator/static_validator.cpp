//
// NLytics Static Validator Implementation
//

#include <nlytics/validator/static_validator.h>
#include "column_auditor.h"
#include "import_auditor.h"
#include "parser/python_parser.h"
#include "security_scanner.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <regex>

namespace nlytics
{
    namespace
    {
        bool TargetBindsName(const Expr& target, const std::string& name)
        {
            if (auto* nameExpr = dynamic_cast<const Name*>(&target))
            {
                return nameExpr->id == name;
            }
            const std::vector<ExprPtr>* elements = nullptr;
            if (auto* tuple = dynamic_cast<const Tuple*>(&target))
            {
                elements = &tuple->elts;
            }
            else if (auto* list = dynamic_cast<const List*>(&target))
            {
                elements = &list->elts;
            }
            if (elements == nullptr)
            {
                return false;
            }
            return std::ranges::any_of(*elements, [&](const ExprPtr& elt) { return TargetBindsName(*elt, name); });
        }

        bool ModuleAssigns(const Module& module, const std::string& name)
        {
            bool found = false;
            WalkStatements(module.body, [&](const Stmt& stmt) {
                if (found)
                {
                    return;
                }
                if (auto* assign = dynamic_cast<const Assign*>(&stmt))
                {
                    found = std::ranges::any_of(assign->targets,
                                                [&](const ExprPtr& target) { return TargetBindsName(*target, name); });
                }
                else if (auto* augAssign = dynamic_cast<const AugAssign*>(&stmt))
                {
                    found = TargetBindsName(*augAssign->target, name);
                }
                else if (auto* forStmt = dynamic_cast<const For*>(&stmt))
                {
                    found = TargetBindsName(*forStmt->target, name);
                }
            });
            return found;
        }

        // Used only when the program does not parse
        bool TextAssigns(const std::string& code, const std::string& name)
        {
            static const std::regex special(R"([.^$|()\[\]{}*+?\\])");
            const std::string escaped = std::regex_replace(name, special, R"(\$&)");
            const std::regex assignment("\\b" + escaped + "\\s*=(?!=)");
            return std::ranges::any_of(SplitLines(code), [&](std::string_view line) {
                return std::regex_search(line.begin(), line.end(), assignment);
            });
        }
    } // namespace

    int ComputeValidationScore(std::size_t errorCount, std::size_t warningCount)
    {
        const auto penalty = static_cast<long long>(errorCount) * kErrorScorePenalty +
                             static_cast<long long>(warningCount) * kWarningScorePenalty;
        return static_cast<int>(std::max(0LL, kMaxValidationScore - penalty));
    }

    StaticValidator::StaticValidator(ValidatorConfig config)
        : m_config(std::move(config)),
          m_securityScanner(std::make_unique<SecurityScanner>(m_config.deny_patterns)),
          m_importAuditor(std::make_unique<ImportAuditor>(m_config.allowed_modules)),
          m_columnAuditor(std::make_unique<ColumnAuditor>(m_config.column_literal_min_length))
    {
        if (m_config.result_name.empty())
        {
            throw ConfigError("validator result_name must not be empty");
        }
        if (m_config.max_line_length < 1 || m_config.max_line_length > kMaxScannableLineLength)
        {
            throw ConfigError(std::format("validator max_line_length must be in [1, {}]", kMaxScannableLineLength));
        }
    }

    std::vector<ValidationIssue> StaticValidator::CheckCodeSize(const std::string& code) const
    {
        if (code.size() > m_config.max_code_bytes)
        {
            return {ValidationIssue{epoch_core::ValidationErrorKind::SecurityViolation,
                                    std::format("Program of {} bytes exceeds the limit of {} bytes", code.size(),
                                                m_config.max_code_bytes),
                                    0}};
        }
        std::vector<ValidationIssue> issues;
        const auto lines = SplitLines(code);
        for (std::size_t index = 0; index < lines.size(); ++index)
        {
            if (lines[index].size() > m_config.max_line_length)
            {
                issues.push_back(ValidationIssue{
                    epoch_core::ValidationErrorKind::SecurityViolation,
                    std::format("Line of {} characters exceeds the limit of {}", lines[index].size(),
                                m_config.max_line_length),
                    static_cast<int>(index) + 1});
            }
        }
        return issues;
    }

    StaticValidator::~StaticValidator() = default;
    StaticValidator::StaticValidator(StaticValidator&&) noexcept = default;
    StaticValidator& StaticValidator::operator=(StaticValidator&&) noexcept = default;

    ValidationReport StaticValidator::Validate(const std::string& code,
                                               const std::vector<std::string>& knownColumns) const
    {
        ValidationReport report;

        // 0. Size limits; nothing else runs over an oversized program
        report.errors = CheckCodeSize(code);
        if (!report.errors.empty())
        {
            report.valid = false;
            report.score = ComputeValidationScore(report.errors.size(), 0);
            SPDLOG_DEBUG("Validation rejected an oversized program ({} bytes)", code.size());
            return report;
        }

        // 1. Security
        report.errors = m_securityScanner->Scan(code);

        // 2. Syntax
        ModulePtr module;
        try
        {
            PythonParser parser;
            module = parser.parse(code);
        }
        catch (const PythonParseError& e)
        {
            report.errors.push_back(ValidationIssue{epoch_core::ValidationErrorKind::SyntaxError,
                                                    std::format("Syntax error: {}", e.what()), e.line()});
        }

        // 3. Result shape
        const bool assigned = module ? ModuleAssigns(*module, m_config.result_name)
                                     : TextAssigns(code, m_config.result_name);
        if (!assigned)
        {
            report.errors.push_back(
                ValidationIssue{epoch_core::ValidationErrorKind::ShapeError,
                                std::format("Must assign final result to variable \"{}\"", m_config.result_name), 0});
        }

        // 4. Imports (a parse failure was already reported)
        if (module)
        {
            auto importIssues = m_importAuditor->Audit(*module);
            report.errors.insert(report.errors.end(), std::make_move_iterator(importIssues.begin()),
                                 std::make_move_iterator(importIssues.end()));
        }

        // 5. Column references never fail validation
        report.warnings = m_columnAuditor->Audit(code, knownColumns);

        report.valid = report.errors.empty();
        report.score = ComputeValidationScore(report.errors.size(), report.warnings.size());

        SPDLOG_DEBUG("Validation finished: valid={} errors={} warnings={} score={}", report.valid,
                     report.errors.size(), report.warnings.size(), report.score);
        return report;
    }

} // namespace nlytics
