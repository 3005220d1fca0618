//
// png.cc
//

#include <pngme/png.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <cstring>

namespace pngme {

    const png::signature_t& png::signature() {
        static const signature_t sig{0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
        return sig;
    }

    const chunk_type& png::header_type() {
        static const chunk_type type = chunk_type::from_string("IHDR");
        return type;
    }

    const chunk_type& png::trailer_type() {
        static const chunk_type type = chunk_type::from_string("IEND");
        return type;
    }

    png png::from_chunks(std::vector<chunk> chunks) {
        if (chunks.empty() || chunks.back().type() != trailer_type()) {
            THROW_PARSE(missing_trailer, 0, "Chunk sequence does not end with '", trailer_type(), "'");
        }
        return png(std::move(chunks));
    }

    png png::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        const auto& sig = signature();
        if (size < sig.size() || std::memcmp(data, sig.data(), sig.size()) != 0) {
            THROW_PARSE(invalid_signature, 0, "Not a PNG stream: signature mismatch in the first ",
                        sig.size(), " bytes");
        }

        std::vector<chunk> chunks;
        std::size_t pos = sig.size();
        while (pos < size) {
            auto parsed = chunk::parse(data + pos, size - pos, pos, options.max_chunk_size);
            const auto& type = parsed.value.type();

            if (options.on_warning) {
                if (chunks.empty() && type != header_type()) {
                    options.on_warning(pos, "missing_header",
                        "First chunk is '" + type.to_string() + "', expected '" +
                        header_type().to_string() + "'");
                }
                if (!type.is_valid()) {
                    options.on_warning(pos, "reserved_bit",
                        "Chunk '" + type.to_string() + "' has the reserved bit set");
                }
            }

            chunks.push_back(std::move(parsed.value));
            pos += parsed.consumed;
        }

        if (chunks.empty() || chunks.back().type() != trailer_type()) {
            if (options.strict) {
                THROW_PARSE(missing_trailer, size, "PNG stream does not end with '", trailer_type(),
                            "' (", chunks.size(), " chunks parsed)");
            }
            if (options.on_warning) {
                options.on_warning(size, "missing_trailer",
                    "PNG stream does not end with '" + trailer_type().to_string() + "', appending it");
            }
            chunks.emplace_back(trailer_type(), std::vector<std::byte>{});
        }

        return png(std::move(chunks));
    }

    png png::parse(const std::byte* data, std::size_t size) {
        return parse(data, size, parse_options{});
    }

    png png::parse(const std::vector<std::byte>& data, const parse_options& options) {
        return parse(data.data(), data.size(), options);
    }

    png png::parse(const std::vector<std::byte>& data) {
        return parse(data.data(), data.size(), parse_options{});
    }

    std::vector<std::byte> png::serialize() const {
        std::size_t total = signature().size();
        for (const auto& c : m_chunks) {
            total += chunk::overhead + c.length();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        for (auto b : signature()) {
            out.push_back(static_cast<std::byte>(b));
        }
        for (const auto& c : m_chunks) {
            c.serialize_to(out);
        }
        return out;
    }

    void png::append_chunk(chunk c) {
        // Only a moved-from stream lacks its trailer
        if (m_chunks.empty() || m_chunks.back().type() != trailer_type()) {
            THROW_PARSE(missing_trailer, 0, "Cannot append '", c.type(), "': stream has no '",
                        trailer_type(), "' chunk");
        }
        // IEND stays last
        m_chunks.insert(m_chunks.end() - 1, std::move(c));
    }

    const chunk* png::chunk_by_type(const chunk_type& type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [&type](const chunk& c) { return c.type() == type; });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    chunk png::remove_chunk_by_type(const chunk_type& type) {
        if (type == header_type() || type == trailer_type()) {
            THROW_EDIT(protected_chunk, "Chunk '", type, "' is required and cannot be removed");
        }

        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [&type](const chunk& c) { return c.type() == type; });
        if (it == m_chunks.end()) {
            THROW_EDIT(chunk_not_found, "No chunk of type '", type, "' in stream");
        }

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

} // namespace pngme
