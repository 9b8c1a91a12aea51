//
// NLytics Pipeline Configuration Loader
//
#include <nlytics/config/pipeline_config.h>
#include <nlytics/core/constants.h>
#include <spdlog/spdlog.h>
#include <format>
#include <regex>

namespace YAML
{
    template <>
    struct convert<nlytics::DenyPattern>
    {
        static bool decode(const Node& node, nlytics::DenyPattern& rhs)
        {
            if (node.IsScalar())
            {
                rhs.pattern = node.as<std::string>();
                rhs.description.clear();
                return true;
            }
            if (!node.IsMap() || !node["pattern"])
            {
                return false;
            }
            rhs.pattern = node["pattern"].as<std::string>();
            rhs.description = node["description"].as<std::string>("");
            return true;
        }
    };
} // namespace YAML

namespace nlytics
{
    namespace
    {
        YAML::Node Require(const YAML::Node& parent, const std::string& key, const std::string& section)
        {
            auto node = parent[key];
            if (!node)
            {
                throw ConfigError(std::format("missing required key '{}{}'", section.empty() ? "" : section + ".", key));
            }
            return node;
        }

        template <typename T>
        T RequireAs(const YAML::Node& parent, const std::string& key, const std::string& section)
        {
            auto node = Require(parent, key, section);
            try
            {
                return node.as<T>();
            }
            catch (const YAML::Exception& e)
            {
                throw ConfigError(std::format("invalid value for '{}.{}': {}", section, key, e.what()));
            }
        }
    } // namespace

    PipelineConfig DecodePipelineConfig(const YAML::Node& root)
    {
        if (!root || !root.IsMap())
        {
            throw ConfigError("root must be a mapping");
        }

        PipelineConfig config;

        const auto result_name = RequireAs<std::string>(root, "result_name", "");
        const auto allowed_modules = RequireAs<std::vector<std::string>>(root, "allowed_modules", "");

        auto retry = Require(root, "retry", "");
        config.retry.max_attempts = RequireAs<int>(retry, "max_attempts", "retry");

        auto validator = Require(root, "validator", "");
        config.validator.result_name = result_name;
        config.validator.allowed_modules = allowed_modules;
        config.validator.deny_patterns = RequireAs<std::vector<DenyPattern>>(validator, "deny_patterns", "validator");
        config.validator.column_literal_min_length =
            RequireAs<std::size_t>(validator, "column_literal_min_length", "validator");
        config.validator.max_code_bytes = RequireAs<std::size_t>(validator, "max_code_bytes", "validator");
        config.validator.max_line_length = RequireAs<std::size_t>(validator, "max_line_length", "validator");

        auto sandbox = Require(root, "sandbox", "");
        config.sandbox.result_name = result_name;
        config.sandbox.allowed_modules = allowed_modules;
        config.sandbox.timeout_ms = RequireAs<int64_t>(sandbox, "timeout_ms", "sandbox");
        config.sandbox.dataset_binding = RequireAs<std::string>(sandbox, "dataset_binding", "sandbox");
        config.sandbox.max_output_bytes = RequireAs<std::size_t>(sandbox, "max_output_bytes", "sandbox");
        config.sandbox.max_sequence_items = RequireAs<std::size_t>(sandbox, "max_sequence_items", "sandbox");
        config.sandbox.module_aliases =
            RequireAs<std::unordered_map<std::string, std::string>>(sandbox, "module_aliases", "sandbox");

        ValidatePipelineConfig(config);
        return config;
    }

    void ValidatePipelineConfig(const PipelineConfig& config)
    {
        if (config.retry.max_attempts < 1)
        {
            throw ConfigError(std::format("retry.max_attempts must be >= 1, got {}", config.retry.max_attempts));
        }
        if (config.sandbox.timeout_ms < 1)
        {
            throw ConfigError(std::format("sandbox.timeout_ms must be >= 1, got {}", config.sandbox.timeout_ms));
        }
        if (config.validator.max_code_bytes < 1)
        {
            throw ConfigError("validator.max_code_bytes must be >= 1");
        }
        if (config.validator.max_line_length < 1 || config.validator.max_line_length > kMaxScannableLineLength)
        {
            throw ConfigError(std::format("validator.max_line_length must be in [1, {}], got {}",
                                          kMaxScannableLineLength, config.validator.max_line_length));
        }
        if (config.sandbox.max_sequence_items < 1)
        {
            throw ConfigError("sandbox.max_sequence_items must be >= 1");
        }
        if (config.validator.result_name.empty() || config.sandbox.result_name.empty())
        {
            throw ConfigError("result_name must not be empty");
        }
        if (config.sandbox.dataset_binding.empty())
        {
            throw ConfigError("sandbox.dataset_binding must not be empty");
        }
        for (const auto& deny : config.validator.deny_patterns)
        {
            try
            {
                std::regex compiled(deny.pattern, std::regex::ECMAScript | std::regex::icase);
            }
            catch (const std::regex_error& e)
            {
                throw ConfigError(std::format("invalid deny pattern '{}': {}", deny.pattern, e.what()));
            }
        }
        for (const auto& [alias, module] : config.sandbox.module_aliases)
        {
            if (module != "pandas" && module != "numpy")
            {
                throw ConfigError(std::format("module alias '{}' targets unsupported module '{}'", alias, module));
            }
        }
    }

    PipelineConfig ParsePipelineConfig(const std::string& yaml_text)
    {
        YAML::Node root;
        try
        {
            root = YAML::Load(yaml_text);
        }
        catch (const YAML::Exception& e)
        {
            throw ConfigError(std::format("malformed YAML: {}", e.what()));
        }
        return DecodePipelineConfig(root);
    }

    PipelineConfig LoadPipelineConfig(const std::string& path)
    {
        YAML::Node root;
        try
        {
            root = YAML::LoadFile(path);
        }
        catch (const YAML::Exception& e)
        {
            throw ConfigError(std::format("cannot load '{}': {}", path, e.what()));
        }
        auto config = DecodePipelineConfig(root);
        SPDLOG_DEBUG("Loaded pipeline config from '{}' (max_attempts={}, timeout_ms={}, {} deny patterns)",
                     path, config.retry.max_attempts, config.sandbox.timeout_ms,
                     config.validator.deny_patterns.size());
        return config;
    }

} // namespace nlytics
