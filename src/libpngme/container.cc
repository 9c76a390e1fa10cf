//
// container parsing, mutation and serialization
//

#include <pngme/container.hh>
#include <pngme/chunk_types.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <iomanip>
#include <istream>
#include <iterator>
#include <ostream>

#include "chunk_reader.hh"

namespace pngme {

    container::container(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    container container::parse(const std::uint8_t* data, std::size_t size, const parse_options& options) {
        THROW_PARSE_IF(size < signature.size(), error_kind::invalid_signature,
                       "Invalid signature: need ", signature.size(), " bytes, got ", size);
        THROW_PARSE_UNLESS(std::equal(signature.begin(), signature.end(), data),
                           error_kind::invalid_signature,
                           "Invalid signature: stream does not start with the PNG signature");

        byte_reader in(data + signature.size(), size - signature.size(), signature.size());

        container result;
        bool seen_end = false;
        while (!in.at_end()) {
            const auto record_offset = in.offset();
            auto c = read_chunk(in, options);

            if (seen_end) {
                options.warn(record_offset, "order",
                             build_error_msg("chunk '", c.type(), "' follows the ", chunk_id::IEND, " chunk"));
            }
            if (c.type().to_string() == chunk_id::IEND) {
                seen_end = true;
            }

            result.m_chunks.push_back(std::move(c));
        }
        return result;
    }

    container container::parse(std::istream& stream, const parse_options& options) {
        THROW_IO_UNLESS(stream.good(), "Stream in bad state");

        byte_buffer buffer((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
        THROW_IO_IF(stream.bad(), "Stream read failed");

        return parse(buffer, options);
    }

    void container::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk container::remove_chunk(std::string_view type) {
        auto it = find(type);
        if (it == m_chunks.end()) {
            THROW_NOT_FOUND("Chunk '", type, "' not found");
        }
        const auto index = std::distance(m_chunks.cbegin(), it);
        chunk removed = std::move(m_chunks[static_cast<std::size_t>(index)]);
        m_chunks.erase(m_chunks.begin() + index);
        return removed;
    }

    const chunk* container::chunk_by_type(std::string_view type) const {
        auto it = find(type);
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::vector<chunk>::const_iterator container::find(std::string_view type) const {
        return std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type().to_string() == type;
        });
    }

    byte_buffer container::as_bytes() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += c.serialized_size();
        }

        byte_buffer out;
        out.reserve(total);
        out.insert(out.end(), signature.begin(), signature.end());
        for (const auto& c : m_chunks) {
            auto bytes = c.as_bytes();
            out.insert(out.end(), bytes.begin(), bytes.end());
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const container& c) {
        auto flags = os.flags();
        auto fill = os.fill();
        os << "PNG signature:";
        for (const auto b : signature) {
            os << ' ' << std::uppercase << std::hex << std::setfill('0') << std::setw(2)
               << static_cast<unsigned>(b);
        }
        os.flags(flags);
        os.fill(fill);
        os << ", " << c.chunks().size() << " chunk(s)\n";

        for (const auto& ch : c.chunks()) {
            os << ch;
        }
        return os;
    }

} // namespace pngme
