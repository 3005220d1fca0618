/**
 * @file chunk.hh
 * @brief A single length-prefixed, typed, checksummed PNG chunk
 */

#pragma once

#include <iosfwd>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>
#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>

namespace pngme {

    /**
     * @brief CRC-32 (IEEE 802.3) of a chunk type followed by its payload
     * @param type Chunk type, hashed first
     * @param data Payload bytes
     * @param size Payload size
     * @return Checksum as stored in the chunk trailer
     */
    PNGME_EXPORT std::uint32_t crc32(const chunk_type& type, const std::byte* data, std::size_t size);

    /**
     * @class chunk
     * @brief Immutable PNG chunk value
     *
     * Wire layout (big-endian):
     * @code
     * [4 length][4 type][length bytes payload][4 CRC over type + payload]
     * @endcode
     * The CRC is computed on construction and verified on parse, so a
     * chunk object always carries a checksum matching its contents.
     */
    class PNGME_EXPORT chunk {
    public:
        /// Largest payload a chunk may carry (2^31-1)
        static constexpr std::uint32_t max_length = 0x7FFFFFFFu;
        /// Bytes of length, type and CRC fields around the payload
        static constexpr std::size_t overhead = 12;

        struct parse_result;

        /**
         * @brief Build a chunk and compute its CRC
         * @throws chunk_too_large if the payload exceeds max_length bytes
         */
        chunk(chunk_type type, std::vector<std::byte> payload);

        /**
         * @brief Decode one chunk from the front of a buffer
         * @param data Buffer starting at the length field
         * @param size Bytes available in the buffer
         * @param offset Absolute offset of data, used in error reports
         * @param max_size Largest accepted declared length
         * @return The chunk and the number of bytes consumed (12 + length)
         * @throws unexpected_eof, chunk_too_large, invalid_chunk_type, crc_mismatch
         */
        static parse_result parse(const std::byte* data, std::size_t size,
                                  std::uint64_t offset = 0,
                                  std::uint32_t max_size = max_length);

        static parse_result parse(const std::vector<std::byte>& data);

        /**
         * @brief Encode to wire format
         * @return length, type, payload and CRC
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        // Append wire format to an existing buffer
        void serialize_to(std::vector<std::byte>& out) const;

        [[nodiscard]] std::uint32_t length() const { return static_cast<std::uint32_t>(m_payload.size()); }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& payload() const { return m_payload; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /**
         * @brief Interpret the payload as UTF-8 text
         * @throws encoding_error naming the first invalid byte
         */
        [[nodiscard]] std::string payload_as_text() const;

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_crc == o.m_crc && m_payload == o.m_payload;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(chunk_type type, std::vector<std::byte> payload, std::uint32_t crc);

        chunk_type m_type;
        std::vector<std::byte> m_payload;
        std::uint32_t m_crc;
    };

    struct chunk::parse_result {
        chunk value;
        std::size_t consumed;
    };

    // "len: 5, type: RuSt, data: hello"; binary payloads print as [invalid data]
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
