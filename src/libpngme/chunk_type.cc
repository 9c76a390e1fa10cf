//
// chunk_type construction and validation
//

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace pngme {

    namespace {
        // Printable form of arbitrary type bytes for error messages
        std::string describe(const std::uint8_t* data, std::size_t size) {
            std::ostringstream oss;
            oss << '\'';
            for (std::size_t i = 0; i < size; i++) {
                const auto c = data[i];
                if (c >= 32 && c <= 126) {
                    oss << static_cast<char>(c);
                } else {
                    oss << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                        << static_cast<unsigned>(c) << std::dec;
                }
            }
            oss << '\'';
            return oss.str();
        }
    }

    chunk_type chunk_type::parse(const bytes_type& bytes) {
        THROW_PARSE_UNLESS(std::all_of(bytes.begin(), bytes.end(), is_type_byte),
                           error_kind::invalid_chunk_type,
                           "Invalid chunk type ", describe(bytes.data(), bytes.size()),
                           ": every byte must be an ASCII letter");
        return chunk_type(bytes);
    }

    chunk_type chunk_type::parse(std::string_view s) {
        const auto* data = reinterpret_cast<const std::uint8_t*>(s.data());
        THROW_PARSE_IF(s.size() != 4, error_kind::invalid_chunk_type,
                       "Invalid chunk type ", describe(data, s.size()),
                       ": expected 4 characters, got ", s.size());
        bytes_type bytes;
        std::copy_n(data, 4, bytes.begin());
        return parse(bytes);
    }

    bool chunk_type::is_valid() const {
        return std::all_of(m_bytes.begin(), m_bytes.end(), is_type_byte) &&
               is_reserved_bit_valid();
    }

} // namespace pngme
