#include "core/hex.h"

#include <array>
#include <cctype>

namespace scale::core {

// ---------------------------------------------------------------------------
// Lookup tables
// ---------------------------------------------------------------------------

// Each byte value maps to two ASCII hex characters.
static constexpr std::array<char, 512> make_encode_table(const char* digits) {
    std::array<char, 512> table{};
    for (int i = 0; i < 256; ++i) {
        table[static_cast<size_t>(i) * 2]     = digits[(i >> 4) & 0xF];
        table[static_cast<size_t>(i) * 2 + 1] = digits[i & 0xF];
    }
    return table;
}

// ASCII value -> nibble value, 0xFF means invalid.
static constexpr std::array<uint8_t, 256> make_decode_table() {
    std::array<uint8_t, 256> table{};
    for (auto& v : table) v = 0xFF;
    for (int i = 0; i <= 9; ++i) {
        table[static_cast<size_t>('0') + i] = static_cast<uint8_t>(i);
    }
    for (int i = 0; i < 6; ++i) {
        table[static_cast<size_t>('a') + i] = static_cast<uint8_t>(10 + i);
        table[static_cast<size_t>('A') + i] = static_cast<uint8_t>(10 + i);
    }
    return table;
}

static constexpr auto LOWER_TABLE  = make_encode_table("0123456789abcdef");
static constexpr auto UPPER_TABLE  = make_encode_table("0123456789ABCDEF");
static constexpr auto DECODE_TABLE = make_decode_table();

static std::string encode_with(const std::array<char, 512>& table,
                               std::span<const uint8_t> data) {
    std::string result;
    result.resize(data.size() * 2);
    char* out = result.data();
    for (uint8_t byte : data) {
        const size_t idx = static_cast<size_t>(byte) * 2;
        *out++ = table[idx];
        *out++ = table[idx + 1];
    }
    return result;
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

std::string to_hex(std::span<const uint8_t> data) {
    return encode_with(LOWER_TABLE, data);
}

std::string to_hex_upper(std::span<const uint8_t> data) {
    return encode_with(UPPER_TABLE, data);
}

std::string to_hex_spaced(std::span<const uint8_t> data) {
    std::string result;
    if (data.empty()) return result;
    result.reserve(data.size() * 3 - 1);
    for (size_t i = 0; i < data.size(); ++i) {
        if (i != 0) result += ' ';
        const size_t idx = static_cast<size_t>(data[i]) * 2;
        result += LOWER_TABLE[idx];
        result += LOWER_TABLE[idx + 1];
    }
    return result;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);

    for (size_t i = 0; i < hex.size(); i += 2) {
        const uint8_t hi = DECODE_TABLE[static_cast<uint8_t>(hex[i])];
        const uint8_t lo = DECODE_TABLE[static_cast<uint8_t>(hex[i + 1])];
        if (hi == 0xFF || lo == 0xFF) {
            return std::nullopt;
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    return result;
}

Result<std::vector<uint8_t>> parse_hex_dump(std::string_view dump) {
    if (dump.starts_with("0x") || dump.starts_with("0X")) {
        dump.remove_prefix(2);
    }

    std::vector<uint8_t> result;
    result.reserve(dump.size() / 2);

    size_t i = 0;
    while (i < dump.size()) {
        if (std::isspace(static_cast<unsigned char>(dump[i]))) {
            ++i;
            continue;
        }
        if (i + 1 >= dump.size()) {
            return make_error(ErrorCode::INVALID_VALUE,
                              "dangling hex digit at offset " +
                              std::to_string(i));
        }
        const uint8_t hi = DECODE_TABLE[static_cast<uint8_t>(dump[i])];
        const uint8_t lo = DECODE_TABLE[static_cast<uint8_t>(dump[i + 1])];
        if (hi == 0xFF || lo == 0xFF) {
            return make_error(ErrorCode::INVALID_VALUE,
                              "invalid hex byte at offset " +
                              std::to_string(i));
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
        i += 2;
    }

    return result;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

bool is_hex(std::string_view str) {
    if (str.size() % 2 != 0) {
        return false;
    }
    for (char ch : str) {
        if (DECODE_TABLE[static_cast<uint8_t>(ch)] == 0xFF) {
            return false;
        }
    }
    return true;
}

}  // namespace scale::core
