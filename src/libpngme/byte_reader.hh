//
// Bounds-checked cursor over an in-memory byte buffer.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <array>
#include <vector>

#include <pngme/exceptions.hh>
#include <pngme/endian.hh>

namespace pngme {

    // Every read checks the remaining size first and throws
    // parse_error(truncated_input) on shortfall; nothing reads past the end.
    class byte_reader {
        public:
            byte_reader(const std::uint8_t* data, std::size_t size, std::uint64_t base_offset = 0)
                : m_data(data), m_size(size), m_position(0), m_base(base_offset) {}

            std::vector<std::uint8_t> read_exact(std::size_t size, const char* what) {
                require(size, what);
                std::vector<std::uint8_t> buffer(m_data + m_position, m_data + m_position + size);
                m_position += size;
                return buffer;
            }

            template<std::size_t N>
            std::array<std::uint8_t, N> read_array(const char* what) {
                require(N, what);
                std::array<std::uint8_t, N> out;
                std::memcpy(out.data(), m_data + m_position, N);
                m_position += N;
                return out;
            }

            template<typename T>
            T read_be(const char* what) {
                require(sizeof(T), what);
                T value;
                std::memcpy(&value, m_data + m_position, sizeof(T));
                m_position += sizeof(T);
                return from_big_endian(value);
            }

            // Throws unless at least size bytes remain
            void require(std::uint64_t size, const char* what) const {
                THROW_PARSE_IF(size > remaining(), error_kind::truncated_input,
                               "Truncated input at offset ", offset(), ": ", what,
                               " needs ", size, " bytes, only ", remaining(), " available");
            }

            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_size; }

            // Absolute offset of the cursor, counting base_offset
            [[nodiscard]] std::uint64_t offset() const { return m_base + m_position; }

        private:
            const std::uint8_t* m_data;
            std::size_t m_size;
            std::size_t m_position;
            std::uint64_t m_base;
    };
}
