#include "atlas/server/config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>

#include <nlohmann/json.hpp>

namespace atlas::server
{

    namespace
    {

        // Canonical option names; environment variables are ATLAS_ + upper-case
        // with '-' turned into '_', config file keys use '_' as well.
        constexpr std::array<std::string_view, 8> kSettings{
            "address", "port", "data-dir", "config-dir", "quota", "upstream", "realm", "log",
        };

        std::string_view trim(std::string_view value)
        {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, last - first + 1);
        }

        bool is_setting(std::string_view name)
        {
            return std::find(kSettings.begin(), kSettings.end(), name) != kSettings.end();
        }

        std::string environment_name(std::string_view setting)
        {
            std::string name = "ATLAS_";
            for (const char ch : setting)
            {
                name.push_back(ch == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
            }
            return name;
        }

        void apply_setting(ServerConfig &config, std::string_view name, const std::string &value)
        {
            if (name == "address")
            {
                config.address = value;
            }
            else if (name == "port")
            {
                config.port = parse_port(value);
            }
            else if (name == "data-dir")
            {
                config.data_dir = value;
            }
            else if (name == "config-dir")
            {
                config.config_dir = value;
            }
            else if (name == "quota")
            {
                config.quota_bytes = parse_quota_bytes(value);
            }
            else if (name == "upstream")
            {
                config.upstream = parse_endpoint(value);
            }
            else if (name == "realm")
            {
                config.realm = value;
            }
            else if (name == "log")
            {
                if (value.empty())
                {
                    config.log_file.reset();
                }
                else
                {
                    config.log_file = std::filesystem::path(value);
                }
            }
            else
            {
                throw ConfigError("Unknown setting: " + std::string(name));
            }
        }

    } // namespace

    std::uint64_t parse_quota_bytes(std::string_view text)
    {
        std::string value(trim(text));
        if (value.empty())
        {
            return 0;
        }
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });

        if (value.size() > 2 && value.back() == 'B' && std::string_view("KMG").find(value[value.size() - 2]) !=
                                                           std::string_view::npos)
        {
            value.pop_back();
        }

        std::uint64_t multiplier = 1;
        switch (value.back())
        {
        case 'G':
            multiplier = 1ull << 30;
            value.pop_back();
            break;
        case 'M':
            multiplier = 1ull << 20;
            value.pop_back();
            break;
        case 'K':
            multiplier = 1ull << 10;
            value.pop_back();
            break;
        default:
            break;
        }

        const auto digits = trim(value);
        std::uint64_t count = 0;
        const auto *end = digits.data() + digits.size();
        const auto [ptr, ec] = std::from_chars(digits.data(), end, count);
        if (digits.empty() || ec != std::errc{} || ptr != end)
        {
            throw ConfigError("Invalid quota: " + std::string(text));
        }
        if (count > std::numeric_limits<std::uint64_t>::max() / multiplier)
        {
            throw ConfigError("Quota too large: " + std::string(text));
        }
        return count * multiplier;
    }

    std::uint16_t parse_port(std::string_view text)
    {
        const auto digits = trim(text);
        unsigned int port = 0;
        const auto *end = digits.data() + digits.size();
        const auto [ptr, ec] = std::from_chars(digits.data(), end, port);
        if (digits.empty() || ec != std::errc{} || ptr != end || port == 0 || port > 65535)
        {
            throw ConfigError("Invalid port: " + std::string(text));
        }
        return static_cast<std::uint16_t>(port);
    }

    Endpoint parse_endpoint(std::string_view text)
    {
        const auto value = trim(text);
        const auto colon = value.rfind(':');
        if (colon == std::string_view::npos)
        {
            throw ConfigError("Expected endpoint format host:port, got " + std::string(text));
        }
        Endpoint endpoint;
        endpoint.host = std::string(value.substr(0, colon));
        // Bracketed IPv6 literal.
        if (endpoint.host.size() >= 2 && endpoint.host.front() == '[' && endpoint.host.back() == ']')
        {
            endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);
        }
        if (endpoint.host.empty())
        {
            endpoint.host = "127.0.0.1";
        }
        endpoint.port = parse_port(value.substr(colon + 1));
        return endpoint;
    }

    CommandLine parse_command_line(int argc, const char *const argv[])
    {
        CommandLine command_line;
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                command_line.help = true;
                continue;
            }
            if (arg == "--version")
            {
                command_line.show_version = true;
                continue;
            }
            if (!arg.starts_with("-") || arg == "-")
            {
                command_line.positional.push_back(arg);
                continue;
            }

            std::string name;
            std::optional<std::string> value;
            if (arg == "-p")
            {
                name = "port";
            }
            else if (arg == "-d")
            {
                name = "data-dir";
            }
            else if (arg.starts_with("--"))
            {
                name = arg.substr(2);
                const auto equals = name.find('=');
                if (equals != std::string::npos)
                {
                    value = name.substr(equals + 1);
                    name.resize(equals);
                }
            }
            else
            {
                throw ConfigError("Unknown argument: " + arg);
            }

            if (name != "config" && !is_setting(name))
            {
                throw ConfigError("Unknown argument: " + arg);
            }
            if (!value)
            {
                if (i + 1 >= argc)
                {
                    throw ConfigError("Missing value for " + arg);
                }
                value = std::string(argv[++i]);
            }

            if (name == "config")
            {
                command_line.config_file = std::filesystem::path(*value);
            }
            else
            {
                command_line.options[name] = *value;
            }
        }
        return command_line;
    }

    EnvironmentLookup process_environment()
    {
        return [](const std::string &name) -> std::optional<std::string>
        {
            if (const char *value = std::getenv(name.c_str()))
            {
                return std::string(value);
            }
            return std::nullopt;
        };
    }

    void apply_config_file(ServerConfig &config, const nlohmann::json &document)
    {
        if (!document.is_object())
        {
            throw ConfigError("Config file must contain a JSON object");
        }
        for (const auto &[key, value] : document.items())
        {
            std::string name = key;
            std::replace(name.begin(), name.end(), '_', '-');
            if (!is_setting(name))
            {
                throw ConfigError("Unknown config key: " + key);
            }
            if (value.is_string())
            {
                apply_setting(config, name, value.get<std::string>());
            }
            else if (value.is_number_unsigned())
            {
                apply_setting(config, name, std::to_string(value.get<std::uint64_t>()));
            }
            else
            {
                throw ConfigError("Config key " + key + " must be a string or a non-negative number");
            }
        }
    }

    void apply_environment(ServerConfig &config, const EnvironmentLookup &environment)
    {
        for (const auto setting : kSettings)
        {
            if (const auto value = environment(environment_name(setting)))
            {
                apply_setting(config, setting, *value);
            }
        }
    }

    void apply_options(ServerConfig &config, const std::map<std::string, std::string> &options)
    {
        for (const auto &[name, value] : options)
        {
            apply_setting(config, name, value);
        }
    }

    std::optional<std::filesystem::path> locate_config_file(const CommandLine &command_line,
                                                            const EnvironmentLookup &environment)
    {
        if (command_line.config_file)
        {
            return command_line.config_file;
        }
        std::vector<std::filesystem::path> candidates;
        if (const auto home = environment("HOME"); home && !home->empty())
        {
            candidates.push_back(std::filesystem::path(*home) / ".atlas.json");
        }
        candidates.emplace_back(".atlas.json");
        for (const auto &candidate : candidates)
        {
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec))
            {
                return candidate;
            }
        }
        return std::nullopt;
    }

    ServerConfig resolve_config(const CommandLine &command_line, const EnvironmentLookup &environment)
    {
        ServerConfig config;

        if (const auto path = locate_config_file(command_line, environment))
        {
            std::ifstream in(*path);
            if (!in.is_open())
            {
                throw ConfigError("Failed to open config file " + path->string());
            }
            nlohmann::json document;
            try
            {
                document = nlohmann::json::parse(in);
            }
            catch (const nlohmann::json::parse_error &ex)
            {
                throw ConfigError("Malformed config file " + path->string() + ": " + ex.what());
            }
            apply_config_file(config, document);
        }

        apply_environment(config, environment);
        apply_options(config, command_line.options);
        return config;
    }

} // namespace atlas::server
