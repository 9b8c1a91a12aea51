//
// NLytics JSON Output Implementation
//

#include <nlytics/serialization/json.h>
#include <glaze/glaze.hpp>
#include <cmath>
#include <format>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace nlytics
{
    namespace
    {
        struct IssueJson
        {
            std::string kind;
            std::string message;
            int line{};
        };

        struct WarningJson
        {
            std::string message;
            int line{};
        };

        struct ReportJson
        {
            bool valid{};
            int score{};
            std::vector<IssueJson> errors;
            std::vector<WarningJson> warnings;
        };

        struct ErrorJson
        {
            std::string kind;
            std::string message;
            std::string trace;
            int line{};
        };

        struct OutcomeJson
        {
            bool success{};
            std::string result_type;
            glz::generic result;
            std::string stdout_text;
            std::string stderr_text;
            int64_t duration_ms{};
            bool output_truncated{};
            std::optional<ErrorJson> error;
        };

        struct AttemptJson
        {
            int attempt{};
            std::optional<std::string> code;
            std::optional<ReportJson> report;
            std::optional<OutcomeJson> outcome;
            std::optional<std::string> producer_error;
            std::optional<std::string> feedback;
        };

        struct PipelineJson
        {
            std::string stage;
            bool success{};
            int attempts{};
            std::string query;
            int64_t duration_ms{};
            std::optional<OutcomeJson> outcome;
            std::optional<ReportJson> last_report;
            std::optional<std::string> last_feedback;
            std::vector<AttemptJson> history;
        };

        glz::generic CellJson(const PreviewCell& cell)
        {
            if (!cell)
            {
                return glz::generic{nullptr};
            }
            return std::visit(
                [](const auto& v) -> glz::generic
                {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, double>)
                    {
                        // JSON has no NaN or infinity
                        return std::isfinite(v) ? glz::generic{v} : glz::generic{nullptr};
                    }
                    else if constexpr (std::is_same_v<T, int64_t>)
                    {
                        return glz::generic{static_cast<double>(v)};
                    }
                    else
                    {
                        return glz::generic{v};
                    }
                },
                *cell);
        }

        glz::generic CellsJson(const std::vector<PreviewCell>& cells)
        {
            glz::generic::array_t array;
            for (const auto& cell : cells)
            {
                array.push_back(CellJson(cell));
            }
            return glz::generic{std::move(array)};
        }

        glz::generic ResultJson(const ResultValue& value)
        {
            if (value.IsEmpty())
            {
                return glz::generic{nullptr};
            }
            if (value.IsScalar())
            {
                return CellJson(value.GetScalar());
            }
            if (value.IsFrame())
            {
                const FramePreview preview = PreviewFrame(value.GetFrame().frame, kJsonPreviewRows);
                glz::generic::array_t columns;
                for (const auto& column : preview.columns)
                {
                    columns.emplace_back(column);
                }
                glz::generic::array_t data;
                for (const auto& row : preview.rows)
                {
                    data.push_back(CellsJson(row));
                }
                glz::generic::object_t object;
                object["columns"] = glz::generic{std::move(columns)};
                object["rows"] = glz::generic{static_cast<double>(preview.total_rows)};
                object["index"] = CellsJson(preview.labels);
                object["data"] = glz::generic{std::move(data)};
                return glz::generic{std::move(object)};
            }
            if (value.IsLabeledSequence())
            {
                const SequencePreview preview = PreviewSequence(value.GetLabeledSequence(), kJsonPreviewRows);
                glz::generic::object_t object;
                object["name"] = glz::generic{preview.name};
                object["length"] = glz::generic{static_cast<double>(preview.total_items)};
                object["labels"] = CellsJson(preview.labels);
                object["values"] = CellsJson(preview.values);
                return glz::generic{std::move(object)};
            }
            if (value.IsMapping())
            {
                glz::generic::object_t object;
                for (const auto& [key, item] : value.GetMapping().entries)
                {
                    object[key] = ResultJson(item);
                }
                return glz::generic{std::move(object)};
            }
            glz::generic::array_t items;
            for (const auto& item : value.GetSequence().items)
            {
                items.push_back(ResultJson(item));
            }
            return glz::generic{std::move(items)};
        }

        ReportJson MakeReportJson(const ValidationReport& report)
        {
            ReportJson json{report.valid, report.score, {}, {}};
            for (const auto& error : report.errors)
            {
                json.errors.push_back(
                    {epoch_core::ValidationErrorKindWrapper::ToString(error.kind), error.message, error.line});
            }
            for (const auto& warning : report.warnings)
            {
                json.warnings.push_back({warning.message, warning.line});
            }
            return json;
        }

        OutcomeJson MakeOutcomeJson(const ExecutionOutcome& outcome)
        {
            OutcomeJson json;
            json.success = outcome.success;
            json.result_type = outcome.ResultType();
            json.result = ResultJson(outcome.result);
            json.stdout_text = outcome.stdout_text;
            json.stderr_text = outcome.stderr_text;
            json.duration_ms = outcome.duration_ms;
            json.output_truncated = outcome.output_truncated;
            if (outcome.error)
            {
                json.error = ErrorJson{epoch_core::ExecutionFaultKindWrapper::ToString(outcome.error->kind),
                                       outcome.error->message, outcome.error->trace, outcome.error->line};
            }
            return json;
        }

        template <typename T>
        std::string Write(const T& value, const char* what)
        {
            auto written = glz::write_json(value);
            if (!written)
            {
                throw std::runtime_error(std::format("Failed to serialize {}", what));
            }
            return written.value();
        }
    } // namespace

    std::string ToJson(const ValidationReport& report)
    {
        return Write(MakeReportJson(report), "validation report");
    }

    std::string ToJson(const ExecutionOutcome& outcome)
    {
        return Write(MakeOutcomeJson(outcome), "execution outcome");
    }

    std::string ToJson(const PipelineResult& result)
    {
        PipelineJson json;
        json.stage = epoch_core::PipelineStageWrapper::ToString(result.stage);
        json.success = result.Succeeded();
        json.attempts = result.attempts;
        json.query = result.query;
        json.duration_ms = result.DurationMs();
        if (result.outcome)
        {
            json.outcome = MakeOutcomeJson(*result.outcome);
        }
        if (result.last_report)
        {
            json.last_report = MakeReportJson(*result.last_report);
        }
        json.last_feedback = result.last_feedback;
        for (const auto& record : result.history)
        {
            AttemptJson attempt;
            attempt.attempt = record.attempt;
            if (record.program)
            {
                attempt.code = record.program->code;
            }
            if (record.report)
            {
                attempt.report = MakeReportJson(*record.report);
            }
            if (record.outcome)
            {
                attempt.outcome = MakeOutcomeJson(*record.outcome);
            }
            attempt.producer_error = record.producer_error;
            attempt.feedback = record.feedback;
            json.history.push_back(std::move(attempt));
        }
        return Write(json, "pipeline result");
    }

} // namespace nlytics
