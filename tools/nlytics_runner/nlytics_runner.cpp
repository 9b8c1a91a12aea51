//
// NLytics Runner
//
// Drives the validate / execute / retry pipeline over a CSV dataset. Programs
// come from --code files served one per attempt (the last one repeats), so the
// retry loop can be exercised without a text-generation service.
//

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <arrow/compute/initialize.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <nlytics/common/env_loader.h>
#include <nlytics/config/pipeline_config.h>
#include <nlytics/core/dataset.h>
#include <nlytics/pipeline/retry_orchestrator.h>
#include <nlytics/serialization/json.h>
#include <nlytics/validator/static_validator.h>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitPipelineFailed = 1;
constexpr int kExitUsage = 2;

struct RunnerOptions {
    std::string data_path;
    std::vector<std::string> code_paths;
    std::string config_path;
    std::string query = "ad-hoc query";
    std::string log_level;
    bool validate_only = false;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Serves pre-written programs in order, repeating the last one
class ScriptedCodeProducer : public nlytics::ICodeProducer {
public:
    explicit ScriptedCodeProducer(std::vector<std::string> programs) : m_programs(std::move(programs)) {}

    nlytics::GeneratedProgram Generate(const nlytics::GenerationRequest& request) override {
        const auto index = std::min<std::size_t>(static_cast<std::size_t>(request.attempt - 1), m_programs.size() - 1);
        if (request.retry_feedback) {
            SPDLOG_DEBUG("Attempt {} received feedback:\n{}", request.attempt, *request.retry_feedback);
        }
        nlytics::GeneratedProgram program;
        program.code = m_programs[index];
        program.explanation = "scripted program " + std::to_string(index + 1);
        return program;
    }

private:
    std::vector<std::string> m_programs;
};

void PrintUsage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " --data <csv> --code <file> [--code <file> ...] [options]\n"
              << "Options:\n"
              << "  --data PATH        CSV dataset bound to the program\n"
              << "  --code PATH        Program file, served one per attempt (repeatable)\n"
              << "  --config PATH      Pipeline YAML (default: $NLYTICS_CONFIG or the shipped config)\n"
              << "  --query TEXT       Query text recorded in the result\n"
              << "  --validate-only    Validate the first program and print the report\n"
              << "  --log-level LEVEL  trace, debug, info, warn, error, off (default: $NLYTICS_LOG_LEVEL or warn)\n"
              << "  --help             Show this help\n"
              << "Environment:\n"
              << "  NLYTICS_TIMEOUT_MS overrides sandbox.timeout_ms when positive\n";
}

std::string NextValue(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw UsageError(std::string("Missing value for ") + argv[i]);
    }
    return argv[++i];
}

std::optional<RunnerOptions> ParseArgs(int argc, char* argv[]) {
    RunnerOptions options;
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--data") {
            options.data_path = NextValue(argc, argv, i);
        } else if (arg == "--code") {
            options.code_paths.push_back(NextValue(argc, argv, i));
        } else if (arg == "--config") {
            options.config_path = NextValue(argc, argv, i);
        } else if (arg == "--query") {
            options.query = NextValue(argc, argv, i);
        } else if (arg == "--log-level") {
            options.log_level = NextValue(argc, argv, i);
        } else if (arg == "--validate-only") {
            options.validate_only = true;
        } else {
            throw UsageError("Unknown argument: " + arg);
        }
    }

    if (options.code_paths.empty()) {
        throw UsageError("At least one --code file is required");
    }
    if (options.data_path.empty() && !options.validate_only) {
        throw UsageError("--data is required unless --validate-only is given");
    }
    if (options.config_path.empty()) {
        options.config_path = NLYTICS_ENV("NLYTICS_CONFIG");
    }
    if (options.config_path.empty()) {
        options.config_path = (std::filesystem::path{NLYTICS_CONFIG_DIR} / "nlytics.yaml").string();
    }
    if (options.log_level.empty()) {
        options.log_level = nlytics::EnvLoader::instance().get("NLYTICS_LOG_LEVEL", "warn");
    }
    return options;
}

std::string ReadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw UsageError("Failed to open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void InitializeRuntime(const std::string& log_level) {
    const auto level = spdlog::level::from_str(log_level);
    if (level == spdlog::level::off && log_level != "off") {
        throw UsageError("Unknown log level: " + log_level);
    }
    // Keep stdout for JSON
    spdlog::set_default_logger(spdlog::stderr_color_mt("nlytics"));
    spdlog::set_level(level);

    auto arrowComputeStatus = arrow::compute::Initialize();
    if (!arrowComputeStatus.ok()) {
        throw std::runtime_error("arrow compute initialized failed: " + arrowComputeStatus.ToString());
    }
}

int RunValidateOnly(const nlytics::PipelineConfig& config, const RunnerOptions& options) {
    std::vector<std::string> knownColumns;
    if (!options.data_path.empty()) {
        knownColumns = nlytics::ColumnNames(nlytics::DescribeColumns(nlytics::LoadDatasetFromCsv(options.data_path)));
    }
    const nlytics::StaticValidator validator(config.validator);
    const auto report = validator.Validate(ReadFile(options.code_paths.front()), knownColumns);
    std::cout << nlytics::ToJson(report) << "\n";
    return report.valid ? kExitSuccess : kExitPipelineFailed;
}

int RunPipeline(const nlytics::PipelineConfig& config, const RunnerOptions& options) {
    std::vector<std::string> programs;
    for (const auto& path : options.code_paths) {
        programs.push_back(ReadFile(path));
    }

    const auto dataset = nlytics::LoadDatasetFromCsv(options.data_path);

    const nlytics::RetryOrchestrator orchestrator(config, std::make_shared<ScriptedCodeProducer>(std::move(programs)));
    const auto result = orchestrator.Run(nlytics::PipelineQuery{options.query, "", ""}, dataset);
    std::cout << nlytics::ToJson(result) << "\n";
    return result.Succeeded() ? kExitSuccess : kExitPipelineFailed;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::optional<RunnerOptions> options;
    nlytics::PipelineConfig config;
    try {
        options = ParseArgs(argc, argv);
        if (!options) {
            PrintUsage(argv[0]);
            return kExitSuccess;
        }
        InitializeRuntime(options->log_level);
        config = nlytics::LoadPipelineConfig(options->config_path);
        if (const int timeout = NLYTICS_ENV_INT("NLYTICS_TIMEOUT_MS"); timeout > 0) {
            config.sandbox.timeout_ms = timeout;
        }
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        PrintUsage(argv[0]);
        return kExitUsage;
    } catch (const nlytics::ConfigError& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize: " << e.what() << "\n";
        return kExitPipelineFailed;
    }

    try {
        return options->validate_only ? RunValidateOnly(config, *options) : RunPipeline(config, *options);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    } catch (const std::exception& e) {
        spdlog::error("Runner failed: {}", e.what());
        return kExitPipelineFailed;
    }
}
