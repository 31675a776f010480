#ifndef CONFIG_HPP
#define CONFIG_HPP

//internal
#include <string>
#include <fstream>
#include <filesystem>
#include <stdexcept>

//external
#include <boost/json.hpp>
#include <boost/log/trivial.hpp>
#include <magic_enum.hpp>

namespace json = boost::json;

namespace config
{
    // Path to the json config, all of its keys are optional
    inline const std::filesystem::path default_config_path{"config.json"};

    // Empty path disables the file log
    inline std::string log_file_path;
    inline bool console_log_enabled{false};
    inline boost::log::trivial::severity_level log_severity{boost::log::trivial::info};
    // Value checked by the command line tool when no argument is given
    inline std::string sample_cnpj{"04.252.011/0001-10"};

    // Restore the values used when there is no config file
    inline void reset()
    {
        log_file_path.clear();
        console_log_enabled = false;
        log_severity = boost::log::trivial::info;
        sample_cnpj = "04.252.011/0001-10";
    }

    inline std::string get_string(const json::value& value, std::string_view key)
    {
        if (!value.is_string())
        {
            throw std::invalid_argument{"Config field \"" + std::string{key} + "\" must be a string"};
        }

        return json::value_to<std::string>(value);
    }

    inline void init(const std::filesystem::path& config_path = default_config_path)
    {
        // Defaults are kept if there is no config at all
        if (!std::filesystem::exists(config_path))
        {
            return;
        }

        std::ifstream config_file{config_path};

        if (!config_file.is_open())
        {
            throw std::invalid_argument{
                "Config file can not be opened at the specified path: " + 
                std::filesystem::absolute(config_path).string()};
        }
        
        std::string config_data;
        size_t config_file_size = std::filesystem::file_size(config_path);
        config_data.resize(config_file_size);

        config_file.read(config_data.data(), config_file_size);

        boost::system::error_code error_code;
        json::value config_value = json::parse(config_data, error_code);

        if (error_code || !config_value.is_object())
        {
            throw std::invalid_argument{
                "Config file is not a valid json object: " + 
                std::filesystem::absolute(config_path).string()};
        }

        const json::object& config_json = config_value.get_object();
        
        // Initialize config variables with values from json
        if (const json::value* value = config_json.if_contains("log_file_path"))
        {
            log_file_path = get_string(*value, "log_file_path");
        }
        if (const json::value* value = config_json.if_contains("console_log_enabled"))
        {
            if (!value->is_bool())
            {
                throw std::invalid_argument{"Config field \"console_log_enabled\" must be a boolean"};
            }
            console_log_enabled = value->get_bool();
        }
        if (const json::value* value = config_json.if_contains("log_severity"))
        {
            const std::string severity_name{get_string(*value, "log_severity")};
            const auto severity = magic_enum::enum_cast<boost::log::trivial::severity_level>(severity_name);

            if (!severity.has_value())
            {
                throw std::invalid_argument{"Config field \"log_severity\" has unknown value: " + severity_name};
            }
            log_severity = *severity;
        }
        if (const json::value* value = config_json.if_contains("sample_cnpj"))
        {
            sample_cnpj = get_string(*value, "sample_cnpj");
        }
    }
}

#endif
