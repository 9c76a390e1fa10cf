/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk streams
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngme {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing chunks and containers
     *
     * The defaults reject every malformed record and report nothing;
     * lenient parsing and diagnostics are opt-in.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a CRC mismatch or an oversized chunk aborts the parse.
         * When false, both are reported through on_warning and parsing
         * continues; a chunk with a bad CRC is kept with its recomputed CRC.
         */
        bool strict = true;

        /**
         * @brief Maximum accepted payload length in bytes
         *
         * Defaults to the largest length the 4-byte field can hold.
         */
        std::uint32_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset of the chunk record the warning refers to
         * @param category Warning category ("crc", "size_limit", "reserved_bit", "order")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;

        void warn(std::uint64_t offset, std::string_view category, std::string_view message) const {
            if (on_warning) {
                on_warning(offset, category, message);
            }
        }
    };

} // namespace pngme
