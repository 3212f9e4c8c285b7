#pragma once

#include <filesystem>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "atlas/error_codes.hpp"

namespace atlas::server
{

    struct User
    {
        std::string username;
        std::string password_hash;
    };

    class CredentialStoreError : public atlas::Error
    {
    public:
        using atlas::Error::Error;
    };

    /// Username -> salted password hash, mirrored to a JSON file.
    ///
    /// One reader/writer lock guards the mapping: authenticate(), list() and
    /// save() share it, add(), remove() and load() take it exclusively. Nothing
    /// is written back implicitly; callers persist with save().
    ///
    /// save() overwrites the file in place. Two processes saving at the same
    /// time can interleave their writes.
    class CredentialStore
    {
    public:
        explicit CredentialStore(std::filesystem::path database_path);

        /// Throws CredentialStoreError(AlreadyExists) for a taken username and
        /// propagates hashing failures; the mapping is unchanged in both cases.
        void add(const std::string &username, const std::string &password);

        /// Idempotent.
        void remove(const std::string &username);

        bool authenticate(const std::string &username, const std::string &password) const;

        /// Unordered.
        std::vector<std::string> list() const;

        bool empty() const;

        /// Replaces the mapping with the file contents. A missing file yields an
        /// empty store; unreadable or malformed files throw CredentialStoreError.
        void load();

        void save() const;

        const std::filesystem::path &path() const noexcept { return database_path_; }

    private:
        std::filesystem::path database_path_;

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, User> users_;
    };

} // namespace atlas::server
