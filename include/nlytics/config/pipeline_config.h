#pragma once
//
// NLytics Pipeline Configuration
//
// Every pipeline instance is configured explicitly; nothing here is a
// process-wide default. Values come from YAML (see config/nlytics.yaml).
//

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace nlytics
{
    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string& msg) : std::runtime_error("Configuration error: " + msg) {}
    };

    struct DenyPattern
    {
        std::string pattern;     // ECMAScript regex, matched case-insensitively
        std::string description; // optional, for logs and documentation
    };

    struct ValidatorConfig
    {
        std::string result_name;
        std::vector<DenyPattern> deny_patterns;
        std::vector<std::string> allowed_modules;
        std::size_t column_literal_min_length{};
        // programs larger than this, or with a longer line, are rejected unscanned
        std::size_t max_code_bytes{};
        std::size_t max_line_length{};
    };

    struct SandboxConfig
    {
        int64_t timeout_ms{};
        std::string result_name;
        std::string dataset_binding;
        std::size_t max_output_bytes{};
        // largest list, tuple or string a program may build (MemoryError beyond)
        std::size_t max_sequence_items{};
        // alias -> module, pre-bound in every execution context (e.g. pd -> pandas)
        std::unordered_map<std::string, std::string> module_aliases;
        // modules the import instruction may bind
        std::vector<std::string> allowed_modules;
    };

    struct RetryConfig
    {
        int max_attempts{};
    };

    struct PipelineConfig
    {
        ValidatorConfig validator;
        SandboxConfig sandbox;
        RetryConfig retry;
    };

    // Throws ConfigError on missing keys or invalid values
    PipelineConfig LoadPipelineConfig(const std::string& path);
    PipelineConfig ParsePipelineConfig(const std::string& yaml_text);
    PipelineConfig DecodePipelineConfig(const YAML::Node& root);

    // Range and regex checks shared by every loader
    void ValidatePipelineConfig(const PipelineConfig& config);

} // namespace nlytics
