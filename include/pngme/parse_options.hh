/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk streams
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG chunk streams
     *
     * Controls strictness, size limits, and warning handling.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a stream whose last chunk is not IEND is rejected.
         * When false, a warning is reported and IEND is appended.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk length in bytes
         *
         * Chunks declaring a larger length fail with chunk_too_large.
         * Default is the PNG limit of 2^31-1.
         */
        std::uint32_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Stream offset where warning occurred
         * @param category Warning category (e.g., "reserved_bit", "missing_header")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
