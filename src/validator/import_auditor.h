//
// NLytics Import Auditor
//
// Walks import statements and rejects any module outside the allow-list.
// Module names are compared in full: "pandas.io" is not "pandas".
//

#pragma once

#include "parser/ast_nodes.h"
#include <nlytics/validator/validation_report.h>
#include <string>
#include <unordered_set>
#include <vector>

namespace nlytics
{
    class ImportAuditor
    {
    public:
        explicit ImportAuditor(const std::vector<std::string>& allowedModules);

        std::vector<ValidationIssue> Audit(const Module& module) const;

        bool IsAllowed(const std::string& moduleName) const { return m_allowed.contains(moduleName); }

    private:
        std::unordered_set<std::string> m_allowed;
    };

} // namespace nlytics
