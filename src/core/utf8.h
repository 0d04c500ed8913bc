#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace scale::core {

// Returns the offset of the first byte that does not start or continue a
// well-formed UTF-8 sequence, or std::nullopt when the whole input is
// valid.  Overlong forms, surrogates (U+D800..U+DFFF) and code points
// above U+10FFFF are rejected.
std::optional<size_t> utf8_first_invalid(std::span<const uint8_t> data);

inline bool is_valid_utf8(std::span<const uint8_t> data) {
    return !utf8_first_invalid(data).has_value();
}

inline bool is_valid_utf8(std::string_view str) {
    return is_valid_utf8(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

}  // namespace scale::core
