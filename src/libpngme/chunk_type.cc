//
// chunk_type.cc
//

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>
#include <iomanip>
#include <sstream>

namespace pngme {

    namespace {
        std::string describe_byte(std::uint8_t c) {
            std::ostringstream os;
            if (c >= 32 && c <= 126) {
                os << '\'' << static_cast<char>(c) << "' ";
            }
            os << "(0x" << std::hex << std::setfill('0') << std::setw(2)
               << static_cast<unsigned>(c) << ")";
            return os.str();
        }
    }

    chunk_type chunk_type::from_bytes(const std::array<std::uint8_t, 4>& bytes) {
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            THROW_PARSE_IF(!is_valid_byte(bytes[i]), invalid_chunk_type, i,
                           "Invalid chunk type: byte ", i, " is ", describe_byte(bytes[i]),
                           ", expected an ASCII letter");
        }
        return chunk_type(bytes);
    }

    chunk_type chunk_type::from_bytes(const std::byte* data, std::uint64_t offset) {
        std::array<std::uint8_t, 4> bytes{};
        std::memcpy(bytes.data(), data, 4);
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            THROW_PARSE_IF(!is_valid_byte(bytes[i]), invalid_chunk_type, offset + i,
                           "Invalid chunk type at offset ", offset, ": byte ", i, " is ",
                           describe_byte(bytes[i]), ", expected an ASCII letter");
        }
        return chunk_type(bytes);
    }

    chunk_type chunk_type::from_string(std::string_view s) {
        THROW_PARSE_IF(s.size() != 4, invalid_chunk_type, 0,
                       "Invalid chunk type '", s, "': expected 4 characters, got ", s.size());
        std::array<std::uint8_t, 4> bytes{};
        std::memcpy(bytes.data(), s.data(), 4);
        return from_bytes(bytes);
    }

} // namespace pngme
