#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace atlas::encoding
{

    std::string encode_base64(std::string_view data);

    /// Strict RFC 4648 decoding (standard alphabet, padding required).
    /// Returns std::nullopt for any character outside the alphabet, misplaced
    /// padding or a length that is not a multiple of four.
    std::optional<std::string> decode_base64(std::string_view input);

} // namespace atlas::encoding
