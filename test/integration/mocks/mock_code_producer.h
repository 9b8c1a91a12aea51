#pragma once

#include <nlytics/pipeline/code_producer.h>
#include <trompeloeil.hpp>
#include <memory>
#include <string>

namespace nlytics::test
{
    /**
     * @brief Mockable code producer for RetryOrchestrator tests
     *
     * @code
     * auto producer = std::make_shared<MockCodeProducer>();
     * REQUIRE_CALL(*producer, Generate(trompeloeil::_))
     *     .WITH(_1.attempt == 1)
     *     .RETURN(MakeProgram("result = 1"));
     * @endcode
     */
    class MockCodeProducer : public ICodeProducer
    {
    public:
        MAKE_MOCK1(Generate, GeneratedProgram(const GenerationRequest&), override);
    };

    inline GeneratedProgram MakeProgram(std::string code)
    {
        GeneratedProgram program;
        program.code = std::move(code);
        program.explanation = "test program";
        program.declared_result_name = "result";
        return program;
    }

} // namespace nlytics::test
