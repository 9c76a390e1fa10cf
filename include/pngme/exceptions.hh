/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngme library
 *
 * Every failure raised by the library carries an error_kind so that callers
 * can dispatch on the kind of failure instead of parsing messages.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <sstream>

namespace pngme {

    /**
     * @enum error_kind
     * @brief Closed set of failure kinds reported by the library
     */
    enum class error_kind {
        invalid_chunk_type, ///< Type bytes are not 4 ASCII letters
        invalid_crc,        ///< Stored CRC does not match the recomputed one
        truncated_input,    ///< Buffer ends before the declared record does
        invalid_signature,  ///< Leading 8 bytes are not the PNG signature
        chunk_not_found,    ///< Lookup/removal by type found nothing
        chunk_too_large,    ///< Declared length exceeds parse_options::max_chunk_size
        io                  ///< File or stream access failed
    };

    /**
     * @brief Stable name of an error kind (e.g. "InvalidCrc")
     */
    constexpr std::string_view to_string(error_kind kind) noexcept {
        switch (kind) {
            case error_kind::invalid_chunk_type:
                return "InvalidChunkType";
            case error_kind::invalid_crc:
                return "InvalidCrc";
            case error_kind::truncated_input:
                return "TruncatedInput";
            case error_kind::invalid_signature:
                return "InvalidSignature";
            case error_kind::chunk_not_found:
                return "ChunkNotFound";
            case error_kind::chunk_too_large:
                return "ChunkTooLarge";
            case error_kind::io:
                return "Io";
        }
        return "Unknown";
    }

    /**
     * @class pngme_error
     * @brief Base exception class for all pngme errors
     */
    class pngme_error : public std::runtime_error {
    public:
        pngme_error(error_kind kind, const std::string& msg)
            : std::runtime_error(msg), m_kind(kind) {}

        [[nodiscard]] error_kind kind() const noexcept { return m_kind; }

    private:
        error_kind m_kind;
    };

    /**
     * @class parse_error
     * @brief Thrown when a byte buffer is not a well-formed chunk stream
     */
    class parse_error : public pngme_error {
    public:
        parse_error(error_kind kind, const std::string& msg)
            : pngme_error(kind, msg) {}
    };

    /**
     * @class lookup_error
     * @brief Thrown when a chunk requested by type is absent
     */
    class lookup_error : public pngme_error {
    public:
        explicit lookup_error(const std::string& msg)
            : pngme_error(error_kind::chunk_not_found, msg) {}
    };

    /**
     * @class io_error
     * @brief Thrown when reading or writing a file or stream fails
     */
    class io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(error_kind::io, msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_PARSE(kind, ...) \
        throw ::pngme::parse_error((kind), ::pngme::build_error_msg(__VA_ARGS__))

    #define THROW_PARSE_IF(condition, kind, ...) \
        do { if (condition) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    #define THROW_PARSE_UNLESS(condition, kind, ...) \
        do { if (!(condition)) THROW_PARSE(kind, __VA_ARGS__); } while(0)

    #define THROW_NOT_FOUND(...) \
        throw ::pngme::lookup_error(::pngme::build_error_msg(__VA_ARGS__))

    #define THROW_IO(...) \
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
