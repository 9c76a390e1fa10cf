//
// CRC-32 backed by zlib's crc32(), which implements CRC-32/ISO-HDLC.
//

#include <pngme/crc.hh>

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngme {

    crc32::crc32()
        : m_value(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0))) {
    }

    crc32& crc32::update(const void* data, std::size_t size) {
        auto* bytes = static_cast<const Bytef*>(data);
        uLong value = m_value;
        // zlib takes a 32-bit length
        while (size > 0) {
            const auto block = static_cast<uInt>(
                std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            value = ::crc32(value, bytes, block);
            bytes += block;
            size -= block;
        }
        m_value = static_cast<std::uint32_t>(value);
        return *this;
    }

    std::uint32_t crc32::compute(const void* data, std::size_t size) {
        return crc32().update(data, size).value();
    }

} // namespace pngme
