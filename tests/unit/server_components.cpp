#include <algorithm>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "atlas/server/config.hpp"
#include "atlas/server/credential_store.hpp"
#include "atlas/server/usage.hpp"

using namespace atlas;
using namespace atlas::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void write_file(const std::filesystem::path &path, const std::string &contents)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << contents;
    }

    template <typename Function>
    std::optional<ErrorCode> error_code_of(Function &&function)
    {
        try
        {
            function();
        }
        catch (const atlas::Error &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    void test_credential_store_basic()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "atlas_credentials_test";
        cleanup_path(temp_root);

        CredentialStore store(temp_root / "users.json");
        assert(store.empty());
        store.add("alice", "password123");
        assert(!store.empty());

        assert(store.authenticate("alice", "password123"));
        assert(!store.authenticate("alice", "wrong"));
        assert(!store.authenticate("bob", "password123"));
        assert(!store.authenticate("", ""));

        assert(error_code_of([&]
                             { store.add("alice", "other"); }) == ErrorCode::AlreadyExists);
        // The failed add left the original password in place.
        assert(store.authenticate("alice", "password123"));

        assert(error_code_of([&]
                             { store.add("", "pw"); }) == ErrorCode::InvalidArgument);
        assert(error_code_of([&]
                             { store.add("a:b", "pw"); }) == ErrorCode::InvalidArgument);

        // Empty passwords are accepted and verify like any other.
        store.add("carol", "");
        assert(store.authenticate("carol", ""));
        assert(!store.authenticate("carol", "x"));

        auto users = store.list();
        std::sort(users.begin(), users.end());
        assert((users == std::vector<std::string>{"alice", "carol"}));

        store.remove("carol");
        store.remove("carol");
        store.remove("nobody");
        assert(store.list().size() == 1);
        assert(!store.authenticate("carol", ""));

        // Nothing is written until save().
        assert(!std::filesystem::exists(store.path()));

        cleanup_path(temp_root);
    }

    void test_credential_store_persistence()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "atlas_credentials_persist";
        cleanup_path(temp_root);
        const auto path = temp_root / "nested" / "users.json";

        {
            CredentialStore store(path);
            store.load(); // missing file: empty store, not an error
            assert(store.empty());
            store.add("alice", "password123");
            store.add("bob", "hunter2");
            store.save();
        }
        assert(std::filesystem::exists(path));

        {
            std::ifstream in(path);
            const auto json = nlohmann::json::parse(in);
            assert(json.is_object());
            assert(json.size() == 2);
            assert(json.at("alice").at("username") == "alice");
            const auto hash = json.at("alice").at("password_hash").get<std::string>();
            assert(!hash.empty());
            assert(hash.find("password123") == std::string::npos);
        }

        CredentialStore reloaded(path);
        reloaded.load();
        assert(reloaded.authenticate("alice", "password123"));
        assert(reloaded.authenticate("bob", "hunter2"));
        assert(!reloaded.authenticate("bob", "password123"));

        // load() replaces rather than merges.
        CredentialStore other(temp_root / "other.json");
        other.add("carol", "pw");
        other.save();
        std::filesystem::copy_file(temp_root / "other.json", path, std::filesystem::copy_options::overwrite_existing);
        reloaded.load();
        assert(reloaded.list() == std::vector<std::string>{"carol"});

        cleanup_path(temp_root);
    }

    void test_credential_store_malformed_file()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "atlas_credentials_malformed";
        cleanup_path(temp_root);
        const auto path = temp_root / "users.json";

        CredentialStore store(path);
        store.add("alice", "password123");

        write_file(path, "{ this is not json");
        assert(error_code_of([&]
                             { store.load(); }) == ErrorCode::InvalidPayload);
        // A failed load keeps the previous contents.
        assert(store.authenticate("alice", "password123"));

        write_file(path, "[1, 2, 3]");
        assert(error_code_of([&]
                             { store.load(); }) == ErrorCode::InvalidPayload);

        write_file(path, R"({"alice": {"username": "alice"}})");
        assert(error_code_of([&]
                             { store.load(); }) == ErrorCode::InvalidPayload);

        cleanup_path(temp_root);
    }

    void test_credential_store_concurrent_access()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "atlas_credentials_concurrent";
        cleanup_path(temp_root);

        CredentialStore store(temp_root / "users.json");
        store.add("alice", "password123");

        std::atomic<int> successes{0};
        std::atomic<bool> stray_result{false};
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i)
        {
            threads.emplace_back([&]
                                 {
                for (int attempt = 0; attempt < 3; ++attempt)
                {
                    if (store.authenticate("alice", "password123"))
                    {
                        ++successes;
                    }
                    if (store.authenticate("alice", "nope"))
                    {
                        stray_result = true;
                    }
                } });
        }
        threads.emplace_back([&]
                             {
            store.add("dave", "pw");
            store.remove("dave"); });

        for (auto &thread : threads)
        {
            thread.join();
        }
        assert(successes == 12);
        assert(!stray_result);
        assert(store.list() == std::vector<std::string>{"alice"});

        cleanup_path(temp_root);
    }

    void test_directory_usage()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "atlas_usage_test";
        cleanup_path(temp_root);

        write_file(temp_root / "a.bin", std::string(100, 'a'));
        write_file(temp_root / "docs" / "b.txt", std::string(250, 'b'));
        write_file(temp_root / "docs" / "deep" / "c.txt", std::string(50, 'c'));
        std::filesystem::create_directories(temp_root / "empty");

        assert(directory_used_bytes(temp_root) == 400);

        SystemUsageProvider provider;
        assert(provider.directory_used_bytes(temp_root) == 400);
        assert(provider.directory_used_bytes(temp_root / "empty") == 0);

        bool caught = false;
        try
        {
            (void)directory_used_bytes(temp_root / "missing");
        }
        catch (const std::filesystem::filesystem_error &)
        {
            caught = true;
        }
        assert(caught);

        const auto volume = provider.filesystem_usage(temp_root);
        assert(volume.free_bytes > 0);

        cleanup_path(temp_root);
    }

    void test_clamp_to_quota()
    {
        assert((clamp_to_quota(1000, 300) == DiskUsage{700, 300}));
        assert((clamp_to_quota(1000, 1000) == DiskUsage{0, 1000}));
        assert((clamp_to_quota(1000, 5000) == DiskUsage{0, 1000}));
        assert((clamp_to_quota(1000, 0) == DiskUsage{1000, 0}));
    }

    void test_quota_strings()
    {
        assert(parse_quota_bytes("") == 0);
        assert(parse_quota_bytes("  ") == 0);
        assert(parse_quota_bytes("1024") == 1024);
        assert(parse_quota_bytes("2G") == 2ull * 1024 * 1024 * 1024);
        assert(parse_quota_bytes("2g") == 2ull * 1024 * 1024 * 1024);
        assert(parse_quota_bytes("512M") == 512ull * 1024 * 1024);
        assert(parse_quota_bytes("512MB") == 512ull * 1024 * 1024);
        assert(parse_quota_bytes(" 10kb ") == 10ull * 1024);

        for (const std::string bad : {"abc", "G", "12X", "-5", "1.5G", "99999999999999999999"})
        {
            bool caught = false;
            try
            {
                (void)parse_quota_bytes(bad);
            }
            catch (const ConfigError &)
            {
                caught = true;
            }
            assert(caught);
        }
    }

    void test_endpoints_and_ports()
    {
        const auto endpoint = parse_endpoint("engine.local:9000");
        assert(endpoint.host == "engine.local");
        assert(endpoint.port == 9000);

        assert(parse_endpoint(":8081").host == "127.0.0.1");
        assert(parse_endpoint("[::1]:8081").host == "::1");

        assert(parse_port("65535") == 65535);
        for (const std::string bad : {"0", "65536", "http", ""})
        {
            bool caught = false;
            try
            {
                (void)parse_port(bad);
            }
            catch (const ConfigError &)
            {
                caught = true;
            }
            assert(caught);
        }
    }

    void test_command_line()
    {
        const char *argv[] = {"atlas", "server", "-p", "9090", "--quota=2G", "--data-dir", "/srv/data"};
        const auto command_line = parse_command_line(7, argv);
        assert(command_line.positional == std::vector<std::string>{"server"});
        assert(command_line.options.at("port") == "9090");
        assert(command_line.options.at("quota") == "2G");
        assert(command_line.options.at("data-dir") == "/srv/data");
        assert(!command_line.help);

        const char *user_argv[] = {"atlas", "user", "add", "alice", "pw", "--config", "atlas.json"};
        const auto user_command = parse_command_line(7, user_argv);
        assert((user_command.positional == std::vector<std::string>{"user", "add", "alice", "pw"}));
        assert(user_command.config_file == std::filesystem::path("atlas.json"));

        const char *bad_argv[] = {"atlas", "server", "--bogus", "1"};
        bool caught = false;
        try
        {
            (void)parse_command_line(4, bad_argv);
        }
        catch (const ConfigError &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_config_precedence()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "atlas_config_test";
        cleanup_path(temp_root);
        const auto config_path = temp_root / "atlas.json";
        write_file(config_path, R"({"port": 7000, "quota": "1G", "realm": "From File", "data_dir": "/file/data"})");

        std::map<std::string, std::string> environment{
            {"ATLAS_QUOTA", "2G"},
            {"ATLAS_DATA_DIR", "/env/data"},
        };
        const EnvironmentLookup lookup = [&environment](const std::string &name) -> std::optional<std::string>
        {
            const auto it = environment.find(name);
            if (it == environment.end())
            {
                return std::nullopt;
            }
            return it->second;
        };

        CommandLine command_line;
        command_line.config_file = config_path;
        command_line.options["data-dir"] = "/flag/data";

        const auto config = resolve_config(command_line, lookup);
        assert(config.port == 7000);                            // file
        assert(config.realm == "From File");                    // file
        assert(config.quota_bytes == 2ull * 1024 * 1024 * 1024); // env over file
        assert(config.data_dir == std::filesystem::path("/flag/data")); // flag over env
        assert(config.address == "0.0.0.0");                    // default
        assert(config.upstream.port == 8081);
        assert(config.users_file() == std::filesystem::path(".") / "users.json");

        ServerConfig rejected;
        bool caught = false;
        try
        {
            apply_config_file(rejected, nlohmann::json{{"colour", "blue"}});
        }
        catch (const ConfigError &)
        {
            caught = true;
        }
        assert(caught);

        write_file(config_path, R"({"quota": "lots"})");
        caught = false;
        try
        {
            (void)resolve_config(command_line, lookup);
        }
        catch (const ConfigError &)
        {
            caught = true;
        }
        assert(caught);

        cleanup_path(temp_root);
    }

} // namespace

void run_server_component_tests()
{
    test_credential_store_basic();
    test_credential_store_persistence();
    test_credential_store_malformed_file();
    test_credential_store_concurrent_access();
    test_directory_usage();
    test_clamp_to_quota();
    test_quota_strings();
    test_endpoints_and_ports();
    test_command_line();
    test_config_precedence();
}
