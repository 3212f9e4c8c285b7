#include "atlas/crypto.hpp"

#include <cstring>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace atlas::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string hash_password(std::string_view password)
    {
        ensure_initialized_once();
        std::string hash;
        hash.resize(crypto_pwhash_STRBYTES);
        if (crypto_pwhash_str(hash.data(), password.data(), password.size(), crypto_pwhash_OPSLIMIT_INTERACTIVE,
                              crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0)
        {
            throw std::runtime_error("crypto_pwhash_str failed");
        }
        hash.resize(std::strlen(hash.c_str()));
        return hash;
    }

    bool verify_password(std::string_view password, std::string_view password_hash)
    {
        ensure_initialized_once();
        if (password_hash.empty() || password_hash.size() >= crypto_pwhash_STRBYTES)
        {
            return false;
        }
        const std::string hash_string(password_hash);
        return crypto_pwhash_str_verify(hash_string.c_str(), password.data(), password.size()) == 0;
    }

} // namespace atlas::crypto
