//
// NLytics Sandbox Executor Implementation
//

#include <nlytics/sandbox/sandbox_executor.h>
#include "parser/python_parser.h"
#include "preemption_timer.h"
#include "runtime/builtins.h"
#include "runtime/execution_context.h"
#include "runtime/output_capture.h"
#include "runtime/result_conversion.h"
#include "runtime/sandbox_error.h"
#include "runtime/virtual_machine.h"
#include "sandbox/compiler/program_compiler.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <format>
#include <sstream>

namespace nlytics
{
    namespace
    {
        std::string SourceLine(const std::string& code, int line)
        {
            std::istringstream stream(code);
            std::string text;
            for (int i = 1; std::getline(stream, text); ++i)
            {
                if (i == line)
                {
                    const auto first = text.find_first_not_of(" \t");
                    return first == std::string::npos ? std::string{} : text.substr(first);
                }
            }
            return {};
        }

        std::string Traceback(const std::string& code, int line, const std::string& message)
        {
            std::string trace = "Traceback (most recent call last):\n";
            if (line > 0)
            {
                trace += std::format("  File \"<generated>\", line {}, in <module>\n", line);
                const std::string source = SourceLine(code, line);
                if (!source.empty())
                {
                    trace += std::format("    {}\n", source);
                }
            }
            return trace + message;
        }

        ExecutionError MakeError(epoch_core::ExecutionFaultKind kind, const std::string& code, std::string message,
                                 int line)
        {
            ExecutionError error{kind, std::move(message), {}, line};
            error.trace = Traceback(code, line, error.message);
            return error;
        }

        int64_t ElapsedMs(std::chrono::steady_clock::time_point start)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
                .count();
        }
    } // namespace

    SandboxExecutor::SandboxExecutor(SandboxConfig config) : m_config(std::move(config))
    {
        if (m_config.timeout_ms < 1)
        {
            throw ConfigError(std::format("sandbox.timeout_ms must be positive, got {}", m_config.timeout_ms));
        }
        if (m_config.max_sequence_items < 1)
        {
            throw ConfigError("sandbox.max_sequence_items must be positive");
        }
    }

    ExecutionOutcome SandboxExecutor::Execute(const std::string& code, const epoch_frame::DataFrame& dataset,
                                              int64_t timeoutMs) const
    {
        const int64_t timeout = timeoutMs > 0 ? timeoutMs : m_config.timeout_ms;
        const auto start = std::chrono::steady_clock::now();
        ExecutionOutcome outcome;
        sandbox::OutputCapture output(m_config.max_output_bytes);

        try
        {
            sandbox::CodeObject program;
            try
            {
                PythonParser parser;
                auto module = parser.parse(code);
                program = sandbox::ProgramCompiler{}.Compile(*module);
            }
            catch (const PythonParseError& e)
            {
                sandbox::RuntimeFaultError fault("SyntaxError", e.what());
                fault.SetLine(e.line());
                throw fault;
            }
            catch (const sandbox::CompileError& e)
            {
                sandbox::RuntimeFaultError fault("SyntaxError", e.what());
                fault.SetLine(e.Line());
                throw fault;
            }
            SPDLOG_DEBUG("Compiled program into {} instructions", program.instructions.size());

            sandbox::PreemptionTimer timer{std::chrono::milliseconds(timeout)};
            sandbox::ExecutionContext context(m_config, output, timer.Token(), timeout);
            sandbox::InstallBuiltins(context);
            context.Bind(m_config.dataset_binding, sandbox::MakeFrame(sandbox::FrameFromDataFrame(dataset)));

            sandbox::VirtualMachine machine(program, context);
            machine.Run();
            timer.Disarm();

            if (const auto* bound = context.FindGlobal(m_config.result_name))
            {
                outcome.result = sandbox::ToResultValue(*bound);
            }
            outcome.success = true;
        }
        catch (const sandbox::TimeoutFaultError& fault)
        {
            outcome.error = MakeError(epoch_core::ExecutionFaultKind::TimeoutFault, code, fault.what(), fault.Line());
        }
        catch (const sandbox::SandboxFault& fault)
        {
            outcome.error = MakeError(epoch_core::ExecutionFaultKind::RuntimeFault, code, fault.what(), fault.Line());
        }
        catch (const std::exception& e)
        {
            outcome.error = MakeError(epoch_core::ExecutionFaultKind::RuntimeFault, code,
                                      std::format("RuntimeError: {}", e.what()), 0);
        }

        output.Finish();
        if (output.Truncated())
        {
            SPDLOG_WARN("Program output truncated at {} bytes", m_config.max_output_bytes);
        }
        outcome.stdout_text = output.Stdout();
        outcome.stderr_text = output.Stderr();
        outcome.output_truncated = output.Truncated();
        outcome.duration_ms = ElapsedMs(start);
        if (!outcome.success)
        {
            outcome.result = ResultValue{Empty{}};
            SPDLOG_DEBUG("Execution failed after {} ms: {}", outcome.duration_ms, outcome.error->message);
        }
        return outcome;
    }

} // namespace nlytics
