#pragma once

#include "core/error.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace scale::core {

// Encode a byte span to a lowercase hexadecimal string.
std::string to_hex(std::span<const uint8_t> data);

// Encode a byte span to an uppercase hexadecimal string.
std::string to_hex_upper(std::span<const uint8_t> data);

// Lowercase hex with one space between bytes: "34 48 65".
std::string to_hex_spaced(std::span<const uint8_t> data);

// Decode a contiguous hexadecimal string.  Returns nullopt on odd length
// or non-hex characters.
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// Decode a byte dump as written in fixtures and logs.  An optional "0x"
// prefix is accepted and whitespace between bytes is ignored, but a byte
// may not be split by whitespace.
Result<std::vector<uint8_t>> parse_hex_dump(std::string_view dump);

// Even length, every character in [0-9a-fA-F].
bool is_hex(std::string_view str);

}  // namespace scale::core
