/**
 * @file chunk.hh
 * @brief A single length/type/data/CRC record
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>
#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    using byte_buffer = std::vector<std::uint8_t>;

    /**
     * @class chunk
     * @brief One chunk record: 4-byte length, type, payload and CRC-32
     *
     * The length and CRC are derived from the type and payload and can not be
     * set independently. The CRC covers the type bytes followed by the payload.
     *
     * Wire layout (all integers big-endian):
     * @code
     *   length (4) | type (4) | data (length) | crc (4)
     * @endcode
     */
    class PNGME_EXPORT chunk {
    public:
        /// Size of the length, type and CRC fields together
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Create a chunk, computing length and CRC
         * @throws std::length_error if data does not fit a 32-bit length
         */
        chunk(chunk_type type, byte_buffer data);

        /**
         * @brief Parse one chunk record from the start of a buffer
         *
         * Bytes after the record are ignored.
         *
         * @throws parse_error truncated_input, invalid_chunk_type, invalid_crc,
         *         or chunk_too_large (see parse_options)
         */
        static chunk parse(const std::uint8_t* data, std::size_t size,
                           const parse_options& options = parse_options{});

        static chunk parse(const byte_buffer& buffer,
                           const parse_options& options = parse_options{}) {
            return parse(buffer.data(), buffer.size(), options);
        }

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const byte_buffer& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /**
         * @brief Number of bytes as_bytes() produces
         */
        [[nodiscard]] std::size_t serialized_size() const { return overhead + m_data.size(); }

        /**
         * @brief Payload with every byte mapped to the code point of equal value
         *
         * Bytes are read as Latin-1 and returned UTF-8 encoded: 0x00-0x7F are
         * copied, 0x80-0xFF become two octets. The mapping never fails and is
         * reversible.
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Serialize to the wire layout
         */
        [[nodiscard]] byte_buffer as_bytes() const;

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        std::uint32_t m_length;
        chunk_type m_type;
        byte_buffer m_data;
        std::uint32_t m_crc;
    };

    /**
     * @brief Multi-line display form: length, type, payload bytes and CRC
     */
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
