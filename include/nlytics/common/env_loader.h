#pragma once
//
// NLytics Environment Loader
//
// Process environment with optional overrides from a .env.local file in the
// working directory.
//
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace nlytics
{
    class EnvLoader
    {
    public:
        static EnvLoader& instance()
        {
            static EnvLoader instance;
            return instance;
        }

        // Loaded variables take precedence over the process environment
        std::string get(const std::string& key, const std::string& defaultValue = "") const
        {
            auto it = m_variables.find(key);
            if (it != m_variables.end())
            {
                return it->second;
            }
            const char* value = std::getenv(key.c_str());
            return value ? value : defaultValue;
        }

        int getInt(const std::string& key, int defaultValue = 0) const
        {
            const std::string value = get(key);
            if (value.empty())
            {
                return defaultValue;
            }
            try
            {
                return std::stoi(value);
            }
            catch (const std::exception& exp)
            {
                SPDLOG_WARN("Failed to parse environment variable '{}' with value '{}' as integer: {}. Using default "
                            "value: {}",
                            key, value, exp.what(), defaultValue);
                return defaultValue;
            }
        }

    private:
        std::unordered_map<std::string, std::string> m_variables;

        EnvLoader()
        {
            const std::string file = ".env.local";
            if (std::filesystem::exists(file))
            {
                loadFile(file);
                SPDLOG_INFO("Loaded environment from {}.", file);
            }
        }

        void loadFile(const std::string& filename)
        {
            std::ifstream file(filename);
            std::string line;
            while (std::getline(file, line))
            {
                parseLine(line);
            }
        }

        void parseLine(const std::string& line)
        {
            if (line.empty() || line[0] == '#')
            {
                return;
            }
            const size_t pos = line.find('=');
            if (pos == std::string::npos)
            {
                return;
            }

            const std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            if (value.length() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            {
                value = value.substr(1, value.length() - 2);
            }
            if (!key.empty())
            {
                m_variables[key] = value;
            }
        }

        static std::string trim(const std::string& str)
        {
            const auto begin = str.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = str.find_last_not_of(" \t\r\n");
            return str.substr(begin, end - begin + 1);
        }
    };

#define NLYTICS_ENV(key) nlytics::EnvLoader::instance().get(key)
#define NLYTICS_ENV_INT(key) nlytics::EnvLoader::instance().getInt(key)

} // namespace nlytics
