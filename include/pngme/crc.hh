/**
 * @file crc.hh
 * @brief CRC-32/ISO-HDLC accumulator (the zlib/gzip/PNG variant)
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @class crc32
     * @brief Incremental CRC-32 over one or more byte ranges
     *
     * Reflected polynomial 0xEDB88320, initial value and final xor 0xFFFFFFFF.
     * Feeding ranges one after another gives the same value as feeding their
     * concatenation.
     */
    class PNGME_EXPORT crc32 {
    public:
        crc32();

        /**
         * @brief Feed a byte range into the checksum
         * @param data Bytes to process (may be null if size is 0)
         * @param size Number of bytes
         * @return *this, for chaining
         */
        crc32& update(const void* data, std::size_t size);

        /**
         * @brief Checksum of everything fed so far
         */
        [[nodiscard]] std::uint32_t value() const { return m_value; }

        /**
         * @brief One-shot checksum of a single range
         */
        [[nodiscard]] static std::uint32_t compute(const void* data, std::size_t size);

    private:
        std::uint32_t m_value;
    };

} // namespace pngme
