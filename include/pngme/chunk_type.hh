/**
 * @file chunk_type.hh
 * @brief Four-byte chunk type code and its property bits
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>
#include <ostream>
#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @class chunk_type
     * @brief Validated 4-byte chunk type code (e.g. "IHDR", "RuSt")
     *
     * Each byte must be an ASCII letter. Bit 5 (0x20, the lowercase bit) of
     * each byte carries one property:
     *  - byte 0: ancillary bit   (clear = critical)
     *  - byte 1: private bit     (clear = public)
     *  - byte 2: reserved bit    (must be clear for a valid type)
     *  - byte 3: safe-to-copy bit (set = safe to copy)
     *
     * A type with the reserved bit set still constructs; is_valid() reports it.
     */
    class PNGME_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        /**
         * @brief Build a type from raw bytes
         * @throws parse_error (invalid_chunk_type) if any byte is not an ASCII letter
         */
        static chunk_type parse(const bytes_type& bytes);

        /**
         * @brief Build a type from its string form
         * @throws parse_error (invalid_chunk_type) unless s is exactly 4 ASCII letters
         */
        static chunk_type parse(std::string_view s);

        [[nodiscard]] const bytes_type& bytes() const { return m_bytes; }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), m_bytes.size()};
        }

        [[nodiscard]] bool is_critical() const { return !property_bit(0); }
        [[nodiscard]] bool is_public() const { return !property_bit(1); }
        [[nodiscard]] bool is_reserved_bit_valid() const { return !property_bit(2); }
        [[nodiscard]] bool is_safe_to_copy() const { return property_bit(3); }

        /**
         * @brief All bytes are ASCII letters and the reserved bit is clear
         */
        [[nodiscard]] bool is_valid() const;

        /**
         * @brief True if c is 'A'-'Z' or 'a'-'z'
         */
        static constexpr bool is_type_byte(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }
        bool operator<=(const chunk_type& o) const { return m_bytes <= o.m_bytes; }
        bool operator>(const chunk_type& o) const { return m_bytes > o.m_bytes; }
        bool operator>=(const chunk_type& o) const { return m_bytes >= o.m_bytes; }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os.write(reinterpret_cast<const char*>(t.m_bytes.data()),
                            static_cast<std::streamsize>(t.m_bytes.size()));
        }

    private:
        explicit chunk_type(const bytes_type& bytes) : m_bytes(bytes) {}

        [[nodiscard]] bool property_bit(std::size_t i) const {
            return (m_bytes[i] & 0x20u) != 0;
        }

        bytes_type m_bytes;
    };

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

} // namespace pngme

namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
