/**
 * @file png.hh
 * @brief PNG container: signature followed by an ordered chunk sequence
 */

#pragma once

#include <array>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class png
     * @brief In-memory PNG chunk stream
     *
     * Owns its chunks in file order. The last chunk is always IEND;
     * new chunks are inserted in front of it. Pixel data is never
     * decoded, IDAT is just another opaque payload.
     */
    class PNGME_EXPORT png {
    public:
        using signature_t = std::array<std::uint8_t, 8>;

        /// 89 50 4E 47 0D 0A 1A 0A
        static const signature_t& signature();
        /// IHDR
        static const chunk_type& header_type();
        /// IEND
        static const chunk_type& trailer_type();

        /**
         * @brief Build a stream from chunks
         * @throws missing_trailer if the last chunk is not IEND
         */
        static png from_chunks(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG byte stream
         * @param data Whole file contents
         * @param size Size of data
         * @param options Size limits, strictness and warning callback
         * @throws invalid_signature, missing_trailer, or any chunk::parse error
         *         with its offset relative to the start of data
         */
        static png parse(const std::byte* data, std::size_t size, const parse_options& options);
        static png parse(const std::byte* data, std::size_t size);
        static png parse(const std::vector<std::byte>& data, const parse_options& options);
        static png parse(const std::vector<std::byte>& data);

        /**
         * @brief Encode signature and all chunks
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        /**
         * @brief Insert a chunk right before IEND
         *
         * Chunks of the same type may coexist; nothing is replaced.
         * @throws missing_trailer if the stream was moved from
         */
        void append_chunk(chunk c);

        /**
         * @brief First chunk of the given type in file order
         * @return Pointer into the stream, nullptr if none matches
         */
        [[nodiscard]] const chunk* chunk_by_type(const chunk_type& type) const;

        /**
         * @brief Remove and return the first chunk of the given type
         * @throws protected_chunk for IHDR and IEND
         * @throws chunk_not_found if no chunk has that type
         */
        chunk remove_chunk_by_type(const chunk_type& type);

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        bool operator==(const png& o) const { return m_chunks == o.m_chunks; }
        bool operator!=(const png& o) const { return !(*this == o); }

    private:
        explicit png(std::vector<chunk> chunks) : m_chunks(std::move(chunks)) {}

        std::vector<chunk> m_chunks;
    };

} // namespace pngme
