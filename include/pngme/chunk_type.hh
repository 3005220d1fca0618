//
// chunk_type.hh
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <ostream>
#include <pngme/export_pngme.h>

namespace pngme {
    /**
     * @class chunk_type
     * @brief Validated 4-byte PNG chunk type code
     *
     * Every byte is an ASCII letter. Bit 5 (the lowercase bit) of each
     * byte carries a property: ancillary, private, reserved and
     * safe-to-copy. Comparison is byte-exact, never case-folded.
     */
    class PNGME_EXPORT chunk_type {
    public:
        // Must be in ASCII A-Z or a-z
        static constexpr bool is_valid_byte(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        /**
         * @brief Create from 4 raw bytes
         * @throws invalid_chunk_type if any byte is not an ASCII letter
         */
        static chunk_type from_bytes(const std::array<std::uint8_t, 4>& bytes);

        // Raw pointer overload; offset is only used in error reports
        static chunk_type from_bytes(const std::byte* data, std::uint64_t offset = 0);

        /**
         * @brief Create from a 4 character string
         * @throws invalid_chunk_type if s is not exactly 4 ASCII letters
         */
        static chunk_type from_string(std::string_view s);

        [[nodiscard]] const std::array<std::uint8_t, 4>& bytes() const { return m_bytes; }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), 4);
        }

        // Ancillary bit (byte 0) is clear
        [[nodiscard]] bool is_critical() const { return !bit5(0); }
        // Private bit (byte 1) is clear
        [[nodiscard]] bool is_public() const { return !bit5(1); }
        // Reserved bit (byte 2) must be clear in conforming files
        [[nodiscard]] bool is_reserved_bit_valid() const { return !bit5(2); }
        // Safe-to-copy bit (byte 3) is set
        [[nodiscard]] bool is_safe_to_copy() const { return bit5(3); }

        /**
         * @brief Check conformance with the current PNG version
         *
         * Only the reserved bit can make a constructible type non-conformant.
         */
        [[nodiscard]] bool is_valid() const { return is_reserved_bit_valid(); }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), 4};
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os.write(reinterpret_cast<const char*>(t.m_bytes.data()), 4);
        }

    private:
        explicit chunk_type(const std::array<std::uint8_t, 4>& bytes) : m_bytes(bytes) {}

        [[nodiscard]] bool bit5(std::size_t i) const { return (m_bytes[i] & 0x20) != 0; }

        std::array<std::uint8_t, 4> m_bytes;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
