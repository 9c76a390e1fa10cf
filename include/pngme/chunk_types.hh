//
// Well-known chunk type codes of the PNG format.
//

#pragma once

#include <string_view>

namespace pngme::chunk_id {
    // Critical chunks
    inline constexpr std::string_view IHDR = "IHDR";
    inline constexpr std::string_view IDAT = "IDAT";
    inline constexpr std::string_view IEND = "IEND";

    // Ancillary
    inline constexpr std::string_view tEXt = "tEXt";
} // namespace pngme::chunk_id
