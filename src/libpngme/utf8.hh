//
// utf8.hh
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace pngme {

    /**
     * @brief Locate the first byte that breaks strict UTF-8
     *
     * Rejects overlong forms, UTF-16 surrogates and code points above
     * U+10FFFF. A sequence cut off by the end of the buffer is reported
     * at its lead byte.
     *
     * @return Index of the offending byte, nullopt if the buffer is valid
     */
    inline std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto c = static_cast<std::uint8_t>(data[i]);
            if (c < 0x80) {
                ++i;
                continue;
            }

            std::size_t len;
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;
            if (c >= 0xC2 && c <= 0xDF) {
                len = 2;
            } else if (c >= 0xE0 && c <= 0xEF) {
                len = 3;
                if (c == 0xE0) lo = 0xA0;       // overlong
                else if (c == 0xED) hi = 0x9F;  // surrogates
            } else if (c >= 0xF0 && c <= 0xF4) {
                len = 4;
                if (c == 0xF0) lo = 0x90;       // overlong
                else if (c == 0xF4) hi = 0x8F;  // above U+10FFFF
            } else {
                return i;
            }

            if (size - i < len) {
                return i;
            }

            // Only the second byte has a narrowed range
            auto c1 = static_cast<std::uint8_t>(data[i + 1]);
            if (c1 < lo || c1 > hi) {
                return i + 1;
            }
            for (std::size_t k = 2; k < len; ++k) {
                auto ck = static_cast<std::uint8_t>(data[i + k]);
                if ((ck & 0xC0) != 0x80) {
                    return i + k;
                }
            }
            i += len;
        }
        return std::nullopt;
    }

} // namespace pngme
