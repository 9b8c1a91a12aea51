//
// NLytics Import Auditor Implementation
//

#include "import_auditor.h"
#include <format>

namespace nlytics
{
    ImportAuditor::ImportAuditor(const std::vector<std::string>& allowedModules)
        : m_allowed(allowedModules.begin(), allowedModules.end())
    {
    }

    std::vector<ValidationIssue> ImportAuditor::Audit(const Module& module) const
    {
        std::vector<ValidationIssue> issues;
        WalkStatements(module.body, [&](const Stmt& stmt) {
            if (auto* importStmt = dynamic_cast<const Import*>(&stmt))
            {
                for (const auto& alias : importStmt->names)
                {
                    if (!IsAllowed(alias.name))
                    {
                        issues.push_back(ValidationIssue{epoch_core::ValidationErrorKind::UnauthorizedImport,
                                                         std::format("Unauthorized import: {}", alias.name),
                                                         importStmt->lineno});
                    }
                }
            }
            else if (auto* fromStmt = dynamic_cast<const ImportFrom*>(&stmt))
            {
                // relative imports never name an allow-listed top-level module
                if (fromStmt->level > 0 || !IsAllowed(fromStmt->module))
                {
                    std::string name = std::string(static_cast<std::size_t>(fromStmt->level), '.') + fromStmt->module;
                    issues.push_back(ValidationIssue{epoch_core::ValidationErrorKind::UnauthorizedImport,
                                                     std::format("Unauthorized import from: {}", name),
                                                     fromStmt->lineno});
                }
            }
        });
        return issues;
    }

} // namespace nlytics
