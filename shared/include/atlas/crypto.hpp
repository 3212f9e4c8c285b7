/**
 * Atlas - Password hashing built on libsodium.
 *
 * Hashes are self-describing crypto_pwhash strings (Argon2id with embedded salt
 * and cost parameters). The cost factor is fixed at the libsodium interactive
 * limits and is not configurable.
 */
#pragma once

#include <string>
#include <string_view>

namespace atlas::crypto
{

    void ensure_sodium_init();

    /// Throws std::runtime_error when libsodium cannot allocate the hashing memory.
    std::string hash_password(std::string_view password);

    /// Constant-time verification; malformed hashes simply fail to verify.
    bool verify_password(std::string_view password, std::string_view password_hash);

} // namespace atlas::crypto
