/**
 * @file commands.hh
 * @brief Message embedding operations on a PNG chunk stream
 *
 * Each operation takes a parsed stream and returns a result; none of
 * them touch the file system. Callers serialize the returned stream
 * only after the operation succeeded.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <pngme/export_pngme.h>
#include <pngme/png.hh>

namespace pngme {

    /**
     * @struct chunk_summary
     * @brief Display fields of one chunk, as produced by list()
     */
    struct chunk_summary {
        chunk_type type;
        std::uint32_t length;
        std::uint32_t crc;
    };

    /**
     * @brief Append a message chunk before IEND
     * @param stream Stream to extend
     * @param type Chunk type text, e.g. "ruSt"
     * @param message Payload bytes
     * @return The extended stream
     * @throws invalid_chunk_type if type is not 4 ASCII letters
     */
    PNGME_EXPORT png encode(png stream, std::string_view type, std::vector<std::byte> message);

    // Same as above with the message taken from text
    PNGME_EXPORT png encode(png stream, std::string_view type, std::string_view message);

    /**
     * @brief Read the message stored in the first chunk of a type
     * @throws invalid_chunk_type, chunk_not_found, encoding_error
     */
    PNGME_EXPORT std::string decode(const png& stream, std::string_view type);

    /**
     * @brief Drop the first chunk of a type
     * @return The stream without that chunk
     * @throws invalid_chunk_type, chunk_not_found, protected_chunk
     */
    PNGME_EXPORT png remove(png stream, std::string_view type);

    /**
     * @brief Summaries of all chunks in file order
     */
    PNGME_EXPORT std::vector<chunk_summary> list(const png& stream);

} // namespace pngme
