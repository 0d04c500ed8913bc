#include "core/utf8.h"

namespace scale::core {

std::optional<size_t> utf8_first_invalid(std::span<const uint8_t> data) {
    size_t i = 0;
    const size_t n = data.size();

    while (i < n) {
        const uint8_t b0 = data[i];
        if (b0 < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (b0 >= 0xC2 && b0 <= 0xDF) {
            len = 2;
        } else if (b0 >= 0xE0 && b0 <= 0xEF) {
            len = 3;
            if (b0 == 0xE0) lo = 0xA0;          // overlong
            if (b0 == 0xED) hi = 0x9F;          // surrogates
        } else if (b0 >= 0xF0 && b0 <= 0xF4) {
            len = 4;
            if (b0 == 0xF0) lo = 0x90;          // overlong
            if (b0 == 0xF4) hi = 0x8F;          // > U+10FFFF
        } else {
            return i;
        }

        if (n - i < len) return i;

        // The second byte carries the tightened range, the rest are plain
        // continuation bytes.
        const uint8_t b1 = data[i + 1];
        if (b1 < lo || b1 > hi) return i;
        for (size_t k = 2; k < len; ++k) {
            if ((data[i + k] & 0xC0) != 0x80) return i;
        }
        i += len;
    }

    return std::nullopt;
}

}  // namespace scale::core
