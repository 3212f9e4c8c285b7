#include "atlas/server/credential_store.hpp"

#include <fstream>
#include <mutex>
#include <system_error>

#include <nlohmann/json.hpp>

#include "atlas/crypto.hpp"

namespace atlas::server
{

    void to_json(nlohmann::json &json, const User &user)
    {
        json = nlohmann::json{
            {"username", user.username},
            {"password_hash", user.password_hash},
        };
    }

    void from_json(const nlohmann::json &json, User &user)
    {
        json.at("username").get_to(user.username);
        json.at("password_hash").get_to(user.password_hash);
    }

    namespace
    {

        void validate_username(const std::string &username)
        {
            if (username.empty())
            {
                throw CredentialStoreError(atlas::ErrorCode::InvalidArgument, "Username must not be empty");
            }
            // Basic credentials split on the first colon.
            if (username.find(':') != std::string::npos)
            {
                throw CredentialStoreError(atlas::ErrorCode::InvalidArgument, "Username must not contain ':'");
            }
        }

    } // namespace

    CredentialStore::CredentialStore(std::filesystem::path database_path)
        : database_path_(std::move(database_path))
    {
    }

    void CredentialStore::add(const std::string &username, const std::string &password)
    {
        validate_username(username);
        {
            std::shared_lock lock(mutex_);
            if (users_.contains(username))
            {
                throw CredentialStoreError(atlas::ErrorCode::AlreadyExists, "user " + username + " already exists");
            }
        }

        // Hashing is slow; keep it outside the exclusive section.
        User user{.username = username, .password_hash = crypto::hash_password(password)};

        std::unique_lock lock(mutex_);
        if (!users_.emplace(username, std::move(user)).second)
        {
            throw CredentialStoreError(atlas::ErrorCode::AlreadyExists, "user " + username + " already exists");
        }
    }

    void CredentialStore::remove(const std::string &username)
    {
        std::unique_lock lock(mutex_);
        users_.erase(username);
    }

    bool CredentialStore::authenticate(const std::string &username, const std::string &password) const
    {
        std::string password_hash;
        {
            std::shared_lock lock(mutex_);
            const auto it = users_.find(username);
            if (it == users_.end())
            {
                return false;
            }
            password_hash = it->second.password_hash;
        }
        return crypto::verify_password(password, password_hash);
    }

    std::vector<std::string> CredentialStore::list() const
    {
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(users_.size());
        for (const auto &[name, user] : users_)
        {
            names.push_back(name);
        }
        return names;
    }

    bool CredentialStore::empty() const
    {
        std::shared_lock lock(mutex_);
        return users_.empty();
    }

    void CredentialStore::load()
    {
        std::error_code ec;
        if (!std::filesystem::exists(database_path_, ec))
        {
            if (ec)
            {
                throw CredentialStoreError(atlas::ErrorCode::StorageFailure,
                                           "Cannot access " + database_path_.string() + ": " + ec.message());
            }
            std::unique_lock lock(mutex_);
            users_.clear();
            return;
        }

        std::ifstream in(database_path_);
        if (!in.is_open())
        {
            throw CredentialStoreError(atlas::ErrorCode::StorageFailure,
                                       "Failed to open " + database_path_.string());
        }

        std::unordered_map<std::string, User> loaded;
        try
        {
            const auto json = nlohmann::json::parse(in);
            if (!json.is_object())
            {
                throw CredentialStoreError(atlas::ErrorCode::InvalidPayload,
                                           database_path_.string() + " is not a JSON object");
            }
            for (const auto &[key, value] : json.items())
            {
                auto user = value.get<User>();
                // The key is authoritative for lookups.
                user.username = key;
                loaded.emplace(key, std::move(user));
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw CredentialStoreError(atlas::ErrorCode::InvalidPayload,
                                       "Malformed credential file " + database_path_.string() + ": " + ex.what());
        }

        std::unique_lock lock(mutex_);
        users_ = std::move(loaded);
    }

    void CredentialStore::save() const
    {
        std::string document;
        {
            std::shared_lock lock(mutex_);
            nlohmann::json json = nlohmann::json::object();
            for (const auto &[name, user] : users_)
            {
                json[name] = user;
            }
            document = json.dump(2);
        }

        const auto directory = database_path_.parent_path();
        if (!directory.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(directory, ec);
            if (ec)
            {
                throw CredentialStoreError(atlas::ErrorCode::StorageFailure,
                                           "Failed to create " + directory.string() + ": " + ec.message());
            }
        }

        std::ofstream out(database_path_, std::ios::trunc);
        out << document << '\n';
        out.close();
        if (!out)
        {
            throw CredentialStoreError(atlas::ErrorCode::StorageFailure,
                                       "Failed to write " + database_path_.string());
        }
    }

} // namespace atlas::server
