//
// Byte order helpers. PNG stores every multi-byte integer big-endian.
//

#pragma once

#include <cstdint>
#include <cstring>
#include <type_traits>
#include <vector>

#include <pngme/pngme_config.h>

namespace pngme {
    // Platform endianness detection using CMake-generated config
#if PNGME_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    constexpr std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    constexpr std::uint32_t swap32be(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    // Generic big-endian <-> native conversion for unsigned integers
    template<typename T>
    constexpr T from_big_endian(T x) noexcept {
        static_assert(std::is_unsigned_v<T> && (sizeof(T) == 1 || sizeof(T) == 4),
                      "from_big_endian only supports unsigned 8 and 32 bit integers");
        if constexpr (sizeof(T) == 1) {
            return x;
        } else {
            return swap32be(x);
        }
    }

    template<typename T>
    constexpr T to_big_endian(T x) noexcept {
        // the swap is its own inverse
        return from_big_endian(x);
    }

    // Append a value to a byte buffer in big-endian order
    template<typename T>
    void append_big_endian(std::vector<std::uint8_t>& out, T value) {
        const T be = to_big_endian(value);
        const auto offset = out.size();
        out.resize(offset + sizeof(T));
        std::memcpy(out.data() + offset, &be, sizeof(T));
    }
}
