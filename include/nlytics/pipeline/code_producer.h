#pragma once
//
// NLytics Code Producer
//
// External program source (a text generation service in production, a
// scripted list of files in the runner tool). Its output is never trusted:
// every program goes through the validator before it is executed.
//

#include <nlytics/core/dataset.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nlytics
{
    struct GenerationRequest
    {
        std::string query_text;
        std::string structured_intent;
        std::string execution_plan;
        ColumnManifest columns;
        std::optional<std::string> retry_feedback; // set from the second attempt on
        int attempt{1};
    };

    struct GeneratedProgram
    {
        std::string code;
        std::string explanation;
        std::vector<std::string> declared_variables;
        std::string declared_result_name;
    };

    class ICodeProducer
    {
    public:
        virtual ~ICodeProducer() = default;

        // May throw; the orchestrator records the failure as a ProducerError attempt
        [[nodiscard]] virtual GeneratedProgram Generate(const GenerationRequest& request) = 0;
    };

    using ICodeProducerPtr = std::shared_ptr<ICodeProducer>;

} // namespace nlytics
