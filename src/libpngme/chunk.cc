//
// chunk construction, parsing and serialization
//

#include <pngme/chunk.hh>
#include <pngme/crc.hh>
#include <pngme/endian.hh>
#include <pngme/exceptions.hh>

#include <iomanip>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>

#include "chunk_reader.hh"

namespace pngme {

    namespace {
        std::uint32_t checked_length(const byte_buffer& data) {
            if (data.size() > std::numeric_limits<std::uint32_t>::max()) {
                throw std::length_error("chunk payload of " + std::to_string(data.size()) +
                                        " bytes does not fit a 32-bit length");
            }
            return static_cast<std::uint32_t>(data.size());
        }

        std::uint32_t compute_crc(const chunk_type& type, const byte_buffer& data) {
            return crc32()
                .update(type.bytes().data(), type.bytes().size())
                .update(data.data(), data.size())
                .value();
        }

        struct hex32 {
            std::uint32_t value;

            friend std::ostream& operator<<(std::ostream& os, const hex32& h) {
                auto flags = os.flags();
                auto fill = os.fill();
                os << "0x" << std::hex << std::setfill('0') << std::setw(8) << h.value;
                os.flags(flags);
                os.fill(fill);
                return os;
            }
        };
    }

    chunk::chunk(chunk_type type, byte_buffer data)
        : m_length(checked_length(data)),
          m_type(type),
          m_data(std::move(data)),
          m_crc(compute_crc(m_type, m_data)) {
    }

    chunk chunk::parse(const std::uint8_t* data, std::size_t size, const parse_options& options) {
        byte_reader in(data, size);
        return read_chunk(in, options);
    }

    chunk read_chunk(byte_reader& in, const parse_options& options) {
        const std::uint64_t record_offset = in.offset();

        const auto length = in.read_be<std::uint32_t>("chunk length");
        if (length > options.max_chunk_size) {
            THROW_PARSE_IF(options.strict, error_kind::chunk_too_large,
                           "Chunk at offset ", record_offset, " declares ", length,
                           " bytes, exceeding the maximum allowed size of ", options.max_chunk_size);
            options.warn(record_offset, "size_limit",
                         build_error_msg("chunk declares ", length, " bytes, exceeding the maximum of ",
                                         options.max_chunk_size));
        }

        // type, payload and CRC must all be present before anything is decoded
        in.require(std::uint64_t(4) + length + 4, "chunk type, data and CRC");

        const auto type_bytes = in.read_array<4>("chunk type");
        std::optional<chunk_type> type;
        try {
            type = chunk_type::parse(type_bytes);
        } catch (const parse_error& e) {
            THROW_PARSE(e.kind(), e.what(), " (chunk at offset ", record_offset, ")");
        }

        auto payload = in.read_exact(length, "chunk data");
        const auto stored_crc = in.read_be<std::uint32_t>("chunk CRC");

        chunk result(*type, std::move(payload));
        if (result.crc() != stored_crc) {
            THROW_PARSE_IF(options.strict, error_kind::invalid_crc,
                           "Invalid CRC for chunk '", *type, "' at offset ", record_offset,
                           ": stored ", hex32{stored_crc}, ", computed ", hex32{result.crc()});
            options.warn(record_offset, "crc",
                         build_error_msg("chunk '", *type, "' stored CRC ", hex32{stored_crc},
                                         " does not match computed ", hex32{result.crc()}));
        }

        if (!type->is_valid()) {
            options.warn(record_offset, "reserved_bit",
                         build_error_msg("chunk type '", *type, "' has the reserved bit set"));
        }

        return result;
    }

    std::string chunk::data_as_string() const {
        std::string out;
        out.reserve(m_data.size());
        for (const auto b : m_data) {
            if (b < 0x80) {
                out.push_back(static_cast<char>(b));
            } else {
                out.push_back(static_cast<char>(0xC0 | (b >> 6)));
                out.push_back(static_cast<char>(0x80 | (b & 0x3F)));
            }
        }
        return out;
    }

    byte_buffer chunk::as_bytes() const {
        byte_buffer out;
        out.reserve(serialized_size());
        append_big_endian(out, m_length);
        out.insert(out.end(), m_type.bytes().begin(), m_type.bytes().end());
        out.insert(out.end(), m_data.begin(), m_data.end());
        append_big_endian(out, m_crc);
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk:\n";
        os << "    length: " << c.length() << "\n";
        os << "    chunk_type: " << c.type() << "\n";
        os << "    chunk_data: [";
        for (std::size_t i = 0; i < c.data().size(); i++) {
            if (i > 0) {
                os << ", ";
            }
            os << static_cast<unsigned>(c.data()[i]);
        }
        os << "]\n";
        os << "    crc: " << c.crc() << "\n";
        return os;
    }

} // namespace pngme
