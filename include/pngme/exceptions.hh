/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngme library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the pngme library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <cstdint>
#include <cstddef>

namespace pngme {

    /**
     * @enum error_kind
     * @brief Machine readable classification of every pngme error
     */
    enum class error_kind {
        io,                 ///< File could not be read or written
        invalid_chunk_type, ///< Chunk type is not four ASCII letters
        crc_mismatch,       ///< Stored CRC differs from the computed one
        unexpected_eof,     ///< Stream ends before the declared data
        invalid_signature,  ///< Stream does not start with the PNG signature
        missing_trailer,    ///< Last chunk is not IEND
        chunk_too_large,    ///< Declared length exceeds the allowed maximum
        chunk_not_found,    ///< No chunk of the requested type
        protected_chunk,    ///< Attempt to remove IHDR or IEND
        encoding            ///< Payload is not valid UTF-8
    };

    /**
     * @brief Short name of an error kind
     * @param kind Error kind
     * @return Name such as "crc_mismatch"
     */
    inline const char* to_string(error_kind kind) {
        switch (kind) {
            case error_kind::io: return "io";
            case error_kind::invalid_chunk_type: return "invalid_chunk_type";
            case error_kind::crc_mismatch: return "crc_mismatch";
            case error_kind::unexpected_eof: return "unexpected_eof";
            case error_kind::invalid_signature: return "invalid_signature";
            case error_kind::missing_trailer: return "missing_trailer";
            case error_kind::chunk_too_large: return "chunk_too_large";
            case error_kind::chunk_not_found: return "chunk_not_found";
            case error_kind::protected_chunk: return "protected_chunk";
            case error_kind::encoding: return "encoding";
        }
        // make compiler happy
        return "unknown";
    }

    /**
     * @class pngme_error
     * @brief Base exception class for all pngme errors
     *
     * All pngme exceptions derive from this class, making it easy
     * to catch all pngme-specific errors with a single catch block.
     */
    class pngme_error : public std::runtime_error {
    public:
        pngme_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when a file cannot be opened, read or written.
     */
    class io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(error_kind::io, msg) {}
    };

    /**
     * @class parse_error
     * @brief Base class for errors found while decoding bytes
     *
     * Carries the byte offset in the parsed buffer where the problem
     * was detected.
     */
    class parse_error : public pngme_error {
    public:
        parse_error(error_kind kind, std::uint64_t offset, const std::string& msg)
            : pngme_error(kind, msg), m_offset(offset) {}

        [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }

    private:
        std::uint64_t m_offset;
    };

    /// Chunk type bytes are not ASCII letters, or a type string is not 4 characters
    class invalid_chunk_type : public parse_error {
    public:
        invalid_chunk_type(std::uint64_t offset, const std::string& msg)
            : parse_error(error_kind::invalid_chunk_type, offset, msg) {}
    };

    /// Stored CRC does not match type + payload
    class crc_mismatch : public parse_error {
    public:
        crc_mismatch(std::uint64_t offset, const std::string& msg)
            : parse_error(error_kind::crc_mismatch, offset, msg) {}
    };

    /// Fewer bytes remain than the chunk layout requires
    class unexpected_eof : public parse_error {
    public:
        unexpected_eof(std::uint64_t offset, const std::string& msg)
            : parse_error(error_kind::unexpected_eof, offset, msg) {}
    };

    /// Buffer does not start with the PNG signature
    class invalid_signature : public parse_error {
    public:
        invalid_signature(std::uint64_t offset, const std::string& msg)
            : parse_error(error_kind::invalid_signature, offset, msg) {}
    };

    /// Chunk sequence does not end with IEND
    class missing_trailer : public parse_error {
    public:
        missing_trailer(std::uint64_t offset, const std::string& msg)
            : parse_error(error_kind::missing_trailer, offset, msg) {}
    };

    /// Chunk length above 2^31-1 or above parse_options::max_chunk_size
    class chunk_too_large : public parse_error {
    public:
        chunk_too_large(std::uint64_t offset, const std::string& msg)
            : parse_error(error_kind::chunk_too_large, offset, msg) {}
    };

    /**
     * @class edit_error
     * @brief Base class for failed structural edits of a chunk stream
     */
    class edit_error : public pngme_error {
    public:
        edit_error(error_kind kind, const std::string& msg)
            : pngme_error(kind, msg) {}
    };

    /// No chunk of the requested type exists
    class chunk_not_found : public edit_error {
    public:
        explicit chunk_not_found(const std::string& msg)
            : edit_error(error_kind::chunk_not_found, msg) {}
    };

    /// The header or trailer chunk cannot be removed
    class protected_chunk : public edit_error {
    public:
        explicit protected_chunk(const std::string& msg)
            : edit_error(error_kind::protected_chunk, msg) {}
    };

    /**
     * @class encoding_error
     * @brief Payload is not valid UTF-8 text
     *
     * offset() is the index of the first invalid byte in the payload.
     */
    class encoding_error : public pngme_error {
    public:
        encoding_error(std::size_t offset, const std::string& msg)
            : pngme_error(error_kind::encoding, msg), m_offset(offset) {}

        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     * @param ... Variable arguments to format into error message
     */
    #define THROW_IO(...) \
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     * @param condition Condition to check
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error subclass at a byte offset
     * @param error_type One of the parse_error subclasses (e.g. crc_mismatch)
     * @param offset Byte offset where the problem was detected
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PARSE(error_type, offset, ...) \
        throw ::pngme::error_type((offset), ::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error subclass
     */
    #define THROW_PARSE_IF(condition, error_type, offset, ...) \
        do { if (condition) THROW_PARSE(error_type, offset, __VA_ARGS__); } while(0)

    /**
     * @def THROW_EDIT
     * @brief Throw an edit_error subclass with formatted message
     * @param error_type chunk_not_found or protected_chunk
     * @param ... Variable arguments to format into error message
     */
    #define THROW_EDIT(error_type, ...) \
        throw ::pngme::error_type(::pngme::build_error_msg(__VA_ARGS__))

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
