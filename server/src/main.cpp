#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "atlas/error_codes.hpp"
#include "atlas/server/config.hpp"
#include "atlas/server/credential_store.hpp"
#include "atlas/server/server.hpp"
#include "atlas/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    using atlas::server::CredentialStore;
    using atlas::server::ServerConfig;

    void print_usage(const char *program_name)
    {
        std::cout << "Atlas WebDAV front " << atlas::version() << "\n"
                  << "Usage:\n"
                  << "  " << program_name
                  << " server [--address A] [--port P] [--data-dir D] [--config-dir C] [--quota Q]\n"
                     "         [--upstream HOST:PORT] [--realm R] [--log FILE]\n"
                  << "  " << program_name << " user add <username> <password>\n"
                  << "  " << program_name << " user rm <username>\n"
                  << "  " << program_name << " user ls\n"
                  << "Global options: --config FILE, --help, --version\n"
                  << "Quota accepts byte counts with an optional K, M or G suffix (e.g. 2G, 512MB).\n";
    }

    void setup_logging(const ServerConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("atlas", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

    int run_server(ServerConfig config)
    {
        setup_logging(config);
        spdlog::info("Starting Atlas {}", atlas::version());

        std::filesystem::create_directories(config.data_dir);
        config.data_dir = std::filesystem::absolute(config.data_dir);

        CredentialStore store(config.users_file());
        store.load();

        atlas::server::Server server(std::move(config), store);
        server.run();
        spdlog::info("Server stopped");
        return EXIT_SUCCESS;
    }

    int run_user_command(const ServerConfig &config, const std::vector<std::string> &args, const char *program_name)
    {
        if (args.size() < 2)
        {
            print_usage(program_name);
            return EXIT_FAILURE;
        }

        CredentialStore store(config.users_file());
        store.load();

        const auto &action = args[1];
        if (action == "add" && args.size() == 4)
        {
            store.add(args[2], args[3]);
            store.save();
            std::cout << "User " << args[2] << " created successfully." << std::endl;
            return EXIT_SUCCESS;
        }
        if (action == "rm" && args.size() == 3)
        {
            store.remove(args[2]);
            store.save();
            std::cout << "User " << args[2] << " removed (if existed)." << std::endl;
            return EXIT_SUCCESS;
        }
        if (action == "ls" && args.size() == 2)
        {
            auto users = store.list();
            if (users.empty())
            {
                std::cout << "No users found." << std::endl;
                return EXIT_SUCCESS;
            }
            std::sort(users.begin(), users.end());
            std::cout << "Users:" << std::endl;
            for (const auto &user : users)
            {
                std::cout << "- " << user << std::endl;
            }
            return EXIT_SUCCESS;
        }

        print_usage(program_name);
        return EXIT_FAILURE;
    }

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        const auto command_line = atlas::server::parse_command_line(argc, argv);
        if (command_line.help)
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (command_line.show_version)
        {
            std::cout << "atlas " << atlas::version() << std::endl;
            return EXIT_SUCCESS;
        }
        if (command_line.positional.empty())
        {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        auto config = atlas::server::resolve_config(command_line, atlas::server::process_environment());
        const auto &command = command_line.positional.front();
        if (command == "server" && command_line.positional.size() == 1)
        {
            return run_server(std::move(config));
        }
        if (command == "user")
        {
            return run_user_command(config, command_line.positional, argv[0]);
        }

        std::cerr << "Unknown command: " << command << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    catch (const atlas::Error &ex)
    {
        std::cerr << "Error (" << atlas::to_string(ex.code()) << "): " << ex.what() << std::endl;
        spdlog::error("Fatal error ({}): {}", atlas::to_string(ex.code()), ex.what());
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Error: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
