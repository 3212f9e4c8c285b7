#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "atlas/error_codes.hpp"

namespace atlas::server
{

    struct Endpoint
    {
        std::string host;
        std::uint16_t port{};
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8080};
        std::filesystem::path data_dir{"data"};
        std::filesystem::path config_dir{"."};
        std::uint64_t quota_bytes{0};
        Endpoint upstream{"127.0.0.1", 8081};
        std::string realm{"Atlas Storage"};
        std::uint64_t max_request_body{512ull * 1024 * 1024};
        std::optional<std::filesystem::path> log_file;

        std::filesystem::path users_file() const { return config_dir / "users.json"; }
    };

    class ConfigError : public atlas::Error
    {
    public:
        explicit ConfigError(std::string message)
            : atlas::Error(atlas::ErrorCode::InvalidArgument, std::move(message)) {}
    };

    /// "2G", "512M", "512MB", "1024", "" (= 0). Suffixes are binary multiples.
    std::uint64_t parse_quota_bytes(std::string_view text);

    std::uint16_t parse_port(std::string_view text);

    /// "host:port"; a bare ":port" means localhost.
    Endpoint parse_endpoint(std::string_view text);

    struct CommandLine
    {
        std::vector<std::string> positional; // subcommand words and their arguments
        std::map<std::string, std::string> options;
        std::optional<std::filesystem::path> config_file;
        bool help{false};
        bool show_version{false};
    };

    /// Accepts "--name value", "--name=value" and the -p/-d short forms.
    CommandLine parse_command_line(int argc, const char *const argv[]);

    using EnvironmentLookup = std::function<std::optional<std::string>(const std::string &)>;

    EnvironmentLookup process_environment();

    void apply_config_file(ServerConfig &config, const nlohmann::json &document);
    void apply_environment(ServerConfig &config, const EnvironmentLookup &environment);
    void apply_options(ServerConfig &config, const std::map<std::string, std::string> &options);

    /// --config, else $HOME/.atlas.json, else ./.atlas.json, if present.
    std::optional<std::filesystem::path> locate_config_file(const CommandLine &command_line,
                                                            const EnvironmentLookup &environment);

    /// Defaults, then config file, then environment, then flags.
    ServerConfig resolve_config(const CommandLine &command_line, const EnvironmentLookup &environment);

} // namespace atlas::server
