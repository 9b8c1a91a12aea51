//
// NLytics Display Formatter Implementation
//

#include <nlytics/reporting/display_formatter.h>
#include <format>
#include <vector>

namespace nlytics
{
    namespace
    {
        constexpr std::size_t kOutputPreviewChars = 500;
        constexpr std::size_t kTracePreviewChars = 1000;

        std::string Clip(const std::string& text, std::size_t limit)
        {
            return text.size() <= limit ? text : text.substr(0, limit);
        }

        std::string CellText(const PreviewCell& cell)
        {
            return cell ? Clip(ScalarToString(*cell), kDisplayCellWidth) : std::string{"NaN"};
        }

        std::string Join(const std::vector<std::string>& parts, const std::string& separator)
        {
            std::string joined;
            for (std::size_t i = 0; i < parts.size(); ++i)
            {
                joined += (i ? separator : "") + parts[i];
            }
            return joined;
        }

        std::string FormatFrame(const epoch_frame::DataFrame& frame)
        {
            const FramePreview preview = PreviewFrame(frame, kDisplayPreviewRows);
            std::vector<std::string> lines;
            lines.push_back(std::format("**Shape**: {} rows x {} columns", preview.total_rows, preview.columns.size()));
            lines.emplace_back();
            if (preview.total_rows == 0)
            {
                lines.emplace_back("_Empty DataFrame_");
                return Join(lines, "\n");
            }

            std::vector<std::string> header{""};
            header.insert(header.end(), preview.columns.begin(), preview.columns.end());
            lines.push_back("| " + Join(header, " | ") + " |");
            lines.push_back("| " + Join(std::vector<std::string>(header.size(), "---"), " | ") + " |");

            for (std::size_t row = 0; row < preview.rows.size(); ++row)
            {
                std::vector<std::string> cells{CellText(preview.labels[row])};
                for (const auto& cell : preview.rows[row])
                {
                    cells.push_back(CellText(cell));
                }
                lines.push_back("| " + Join(cells, " | ") + " |");
            }
            if (preview.total_rows > static_cast<int64_t>(kDisplayPreviewRows))
            {
                lines.push_back(std::format("\n_... {} more rows_", preview.total_rows - kDisplayPreviewRows));
            }
            return Join(lines, "\n");
        }

        std::string FormatSequence(const LabeledSequence& sequence)
        {
            const SequencePreview preview = PreviewSequence(sequence, kDisplayPreviewRows);
            std::vector<std::string> lines;
            lines.push_back(std::format("**Length**: {}", preview.total_items));
            lines.emplace_back();
            if (preview.total_items == 0)
            {
                lines.emplace_back("_Empty Series_");
                return Join(lines, "\n");
            }
            for (std::size_t i = 0; i < preview.values.size(); ++i)
            {
                lines.push_back(std::format("- **{}**: {}", CellText(preview.labels[i]), CellText(preview.values[i])));
            }
            if (preview.total_items > static_cast<int64_t>(kDisplayPreviewRows))
            {
                lines.push_back(std::format("_... {} more items_", preview.total_items - kDisplayPreviewRows));
            }
            return Join(lines, "\n");
        }

        // Short inline rendering for mappings and sequences
        std::string Inline(const ResultValue& value)
        {
            if (value.IsEmpty())
            {
                return "None";
            }
            if (value.IsScalar())
            {
                return ScalarToString(value.GetScalar());
            }
            if (value.IsMapping())
            {
                std::vector<std::string> parts;
                for (const auto& [key, item] : value.GetMapping().entries)
                {
                    parts.push_back(std::format("{}: {}", key, Inline(item)));
                }
                return "{" + Join(parts, ", ") + "}";
            }
            if (value.IsSequence())
            {
                std::vector<std::string> parts;
                for (const auto& item : value.GetSequence().items)
                {
                    parts.push_back(Inline(item));
                }
                return "[" + Join(parts, ", ") + "]";
            }
            return std::format("<{}>", value.TypeName());
        }
    } // namespace

    std::string FormatValidationForDisplay(const ValidationReport& report)
    {
        if (report.valid)
        {
            return std::format("**Code Validation Passed** (Score: {}/100)", report.score);
        }

        std::vector<std::string> lines{std::format("### Code Validation Failed (Score: {}/100)", report.score), ""};
        if (!report.errors.empty())
        {
            lines.emplace_back("**Errors:**");
            for (const auto& error : report.errors)
            {
                lines.push_back(std::format("- Line {}: {} ({})", error.line, error.message,
                                            epoch_core::ValidationErrorKindWrapper::ToString(error.kind)));
            }
            lines.emplace_back();
        }
        if (!report.warnings.empty())
        {
            lines.emplace_back("**Warnings:**");
            for (const auto& warning : report.warnings)
            {
                lines.push_back(std::format("- Line {}: {}", warning.line, warning.message));
            }
        }
        return Join(lines, "\n");
    }

    std::string FormatOutcomeForDisplay(const ExecutionOutcome& outcome)
    {
        std::vector<std::string> lines;
        const double seconds = static_cast<double>(outcome.duration_ms) / 1000.0;

        if (!outcome.success)
        {
            lines.emplace_back("### Execution Failed");
            lines.push_back(std::format("**Time**: {:.2f}s", seconds));
            if (outcome.error)
            {
                lines.push_back(std::format("\n**Error**: {}", outcome.error->message));
                lines.emplace_back("\n**Traceback:**");
                lines.push_back(std::format("```\n{}\n```", Clip(outcome.error->trace, kTracePreviewChars)));
            }
            return Join(lines, "\n");
        }

        lines.emplace_back("### Execution Successful");
        lines.push_back(std::format("**Time**: {:.2f}s\n", seconds));

        const ResultValue& result = outcome.result;
        if (!result.IsEmpty())
        {
            lines.push_back(std::format("**Result Type**: {}\n", result.TypeName()));
            if (result.IsFrame())
            {
                lines.push_back(FormatFrame(result.GetFrame().frame));
            }
            else if (result.IsLabeledSequence())
            {
                lines.push_back(FormatSequence(result.GetLabeledSequence()));
            }
            else if (result.IsScalar())
            {
                lines.push_back(std::format("**Value**: {}", ScalarToString(result.GetScalar())));
            }
            else
            {
                lines.push_back(std::format("```\n{}\n```", Clip(Inline(result), kOutputPreviewChars)));
            }
        }

        if (!outcome.stdout_text.empty())
        {
            lines.emplace_back("\n**Console Output:**");
            lines.push_back(std::format("```\n{}\n```", Clip(outcome.stdout_text, kOutputPreviewChars)));
        }
        return Join(lines, "\n");
    }

    std::string FormatRetryInfo(int attempt, int maxAttempts, const std::string& feedback)
    {
        return std::format("**Retrying** (Attempt {}/{})\n\n{}", attempt, maxAttempts, feedback);
    }

} // namespace nlytics
