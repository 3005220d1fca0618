//
// commands.cc
//

#include <pngme/commands.hh>
#include <pngme/exceptions.hh>

namespace pngme {

    png encode(png stream, std::string_view type, std::vector<std::byte> message) {
        auto ct = chunk_type::from_string(type);
        stream.append_chunk(chunk(ct, std::move(message)));
        return stream;
    }

    png encode(png stream, std::string_view type, std::string_view message) {
        const auto* first = reinterpret_cast<const std::byte*>(message.data());
        return encode(std::move(stream), type, std::vector<std::byte>(first, first + message.size()));
    }

    std::string decode(const png& stream, std::string_view type) {
        auto ct = chunk_type::from_string(type);
        const chunk* found = stream.chunk_by_type(ct);
        if (!found) {
            THROW_EDIT(chunk_not_found, "No chunk of type '", ct, "' in stream");
        }
        return found->payload_as_text();
    }

    png remove(png stream, std::string_view type) {
        auto ct = chunk_type::from_string(type);
        stream.remove_chunk_by_type(ct);
        return stream;
    }

    std::vector<chunk_summary> list(const png& stream) {
        std::vector<chunk_summary> result;
        result.reserve(stream.chunks().size());
        for (const auto& c : stream.chunks()) {
            result.push_back(chunk_summary{c.type(), c.length(), c.crc()});
        }
        return result;
    }

} // namespace pngme
