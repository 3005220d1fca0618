//
// chunk.cc
//

#include <pngme/chunk.hh>
#include <pngme/endian.hh>
#include <pngme/exceptions.hh>
#include "utf8.hh"

#include <ostream>
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <zlib.h>

namespace pngme {

    namespace {
        std::uint32_t checksum(const void* type, const std::byte* data, std::size_t size) {
            uLong crc = ::crc32(0L, Z_NULL, 0);
            crc = ::crc32(crc, static_cast<const Bytef*>(type), 4);
            if (size > 0) {
                // Payloads are capped at 2^31-1 bytes, which fits in uInt
                crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
            }
            return static_cast<std::uint32_t>(crc);
        }

        // Type bytes as printable text for messages, before they are validated
        std::string raw_type(const std::byte* p) {
            std::string out;
            for (int i = 0; i < 4; ++i) {
                auto c = static_cast<unsigned char>(p[i]);
                out += (c >= 32 && c <= 126) ? static_cast<char>(c) : '?';
            }
            return out;
        }
    }

    std::uint32_t crc32(const chunk_type& type, const std::byte* data, std::size_t size) {
        return checksum(type.bytes().data(), data, size);
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> payload)
        : m_type(type)
        , m_payload(std::move(payload))
        , m_crc(0) {
        THROW_PARSE_IF(m_payload.size() > max_length, chunk_too_large, 0,
                       "Chunk '", m_type, "' payload of ", m_payload.size(),
                       " bytes exceeds maximum of ", max_length, " bytes");
        m_crc = crc32(m_type, m_payload.data(), m_payload.size());
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> payload, std::uint32_t crc)
        : m_type(type)
        , m_payload(std::move(payload))
        , m_crc(crc) {
    }

    chunk::parse_result chunk::parse(const std::byte* data, std::size_t size,
                                     std::uint64_t offset, std::uint32_t max_size) {
        THROW_PARSE_IF(size < 8, unexpected_eof, offset,
                       "Unexpected EOF at offset ", offset, ": chunk header needs 8 bytes, only ",
                       size, " available");

        std::uint32_t length = load_be32(data);
        const std::byte* type_bytes = data + 4;

        if (length > max_length || length > max_size) {
            THROW_PARSE(chunk_too_large, offset,
                        "Chunk '", raw_type(type_bytes), "' at offset ", offset, " has size ", length,
                        " bytes, which exceeds maximum allowed size of ",
                        std::min(max_size, max_length), " bytes");
        }

        std::size_t total = overhead + length;
        THROW_PARSE_IF(size < total, unexpected_eof, offset,
                       "Unexpected EOF in chunk '", raw_type(type_bytes), "' at offset ", offset,
                       ": declared ", length, " data bytes need ", total, " bytes, only ",
                       size, " available");

        // The CRC covers the type bytes, so corruption there is reported as a
        // CRC mismatch even when it also produces a non-letter byte
        const std::byte* payload_begin = data + 8;
        std::uint32_t stored = load_be32(payload_begin + length);
        std::uint32_t computed = checksum(type_bytes, payload_begin, length);
        if (stored != computed) {
            THROW_PARSE(crc_mismatch, offset + 8 + length,
                        "CRC mismatch in chunk '", raw_type(type_bytes), "' at offset ", offset,
                        ": stored 0x", std::hex, std::setw(8), std::setfill('0'), stored,
                        ", computed 0x", std::setw(8), computed);
        }

        auto type = chunk_type::from_bytes(type_bytes, offset + 4);
        std::vector<std::byte> payload(payload_begin, payload_begin + length);

        return parse_result{chunk(type, std::move(payload), computed), total};
    }

    chunk::parse_result chunk::parse(const std::vector<std::byte>& data) {
        return parse(data.data(), data.size());
    }

    std::vector<std::byte> chunk::serialize() const {
        std::vector<std::byte> out;
        out.reserve(overhead + m_payload.size());
        serialize_to(out);
        return out;
    }

    void chunk::serialize_to(std::vector<std::byte>& out) const {
        std::size_t pos = out.size();
        out.resize(pos + overhead + m_payload.size());
        std::byte* dst = out.data() + pos;

        store_be32(dst, length());
        m_type.to_bytes(dst + 4);
        if (!m_payload.empty()) {
            std::memcpy(dst + 8, m_payload.data(), m_payload.size());
        }
        store_be32(dst + 8 + m_payload.size(), m_crc);
    }

    std::string chunk::payload_as_text() const {
        if (auto bad = find_invalid_utf8(m_payload.data(), m_payload.size())) {
            throw encoding_error(*bad, build_error_msg(
                "Chunk '", m_type, "' payload is not valid UTF-8: invalid byte at offset ", *bad));
        }
        return {reinterpret_cast<const char*>(m_payload.data()), m_payload.size()};
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "len: " << c.length() << ", type: " << c.type() << ", data: ";
        if (find_invalid_utf8(c.payload().data(), c.payload().size())) {
            os << "[invalid data]";
        } else {
            os.write(reinterpret_cast<const char*>(c.payload().data()),
                     static_cast<std::streamsize>(c.payload().size()));
        }
        return os;
    }

} // namespace pngme
