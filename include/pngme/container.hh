/**
 * @file container.hh
 * @brief PNG signature plus an ordered list of chunks
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <iosfwd>
#include <string_view>
#include <vector>
#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /// The 8 bytes every PNG stream starts with
    inline constexpr std::array<std::uint8_t, 8> signature{
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
    };

    /**
     * @class container
     * @brief In-memory PNG stream: signature followed by chunks in file order
     *
     * The container owns its chunks. It does not enforce any chunk ordering:
     * append_chunk() always adds at the end, even after an IEND chunk, and
     * keeping a terminator last is the caller's business.
     */
    class PNGME_EXPORT container {
    public:
        /**
         * @brief Empty container
         */
        container() = default;

        /**
         * @brief Container seeded with chunks, kept in the given order
         */
        explicit container(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG byte stream
         *
         * Checks the signature, then parses chunk records back to back until
         * the buffer is exhausted. The first failing record aborts the parse.
         *
         * @throws parse_error invalid_signature, or any error of chunk::parse
         */
        static container parse(const std::uint8_t* data, std::size_t size,
                               const parse_options& options = parse_options{});

        static container parse(const byte_buffer& buffer,
                               const parse_options& options = parse_options{}) {
            return parse(buffer.data(), buffer.size(), options);
        }

        /**
         * @brief Read a stream to its end and parse the bytes
         * @throws io_error if the stream can not be read
         */
        static container parse(std::istream& stream,
                               const parse_options& options = parse_options{});

        /**
         * @brief Add a chunk after the last one
         */
        void append_chunk(chunk c);

        /**
         * @brief Remove and return the first chunk whose type string equals type
         *
         * Later chunks of the same type are left in place.
         *
         * @throws lookup_error (chunk_not_found) if there is no such chunk
         */
        chunk remove_chunk(std::string_view type);

        /**
         * @brief First chunk whose type string equals type, or nullptr
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        /**
         * @brief Signature followed by every chunk's bytes, in list order
         */
        [[nodiscard]] byte_buffer as_bytes() const;

    private:
        std::vector<chunk>::const_iterator find(std::string_view type) const;

        std::vector<chunk> m_chunks;
    };

    /**
     * @brief Header line followed by each chunk's display form
     */
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const container& c);

} // namespace pngme
