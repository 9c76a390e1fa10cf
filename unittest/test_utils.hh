#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include <pngme/chunk.hh>
#include <pngme/chunk_type.hh>
#include <pngme/container.hh>
#include <pngme/endian.hh>
#include "unittest_config.h"

namespace test_utils {

    inline pngme::byte_buffer bytes_of(std::string_view s) {
        return pngme::byte_buffer(s.begin(), s.end());
    }

    // Hand-assembled chunk record; crc is written as given, not computed
    inline pngme::byte_buffer raw_chunk(std::uint32_t length, std::string_view type,
                                        std::string_view data, std::uint32_t crc) {
        pngme::byte_buffer out;
        pngme::append_big_endian(out, length);
        out.insert(out.end(), type.begin(), type.end());
        out.insert(out.end(), data.begin(), data.end());
        pngme::append_big_endian(out, crc);
        return out;
    }

    inline pngme::chunk make_chunk(std::string_view type, std::string_view data) {
        return pngme::chunk(pngme::chunk_type::parse(type), bytes_of(data));
    }

    // Signature followed by the given records
    inline pngme::byte_buffer png_bytes(std::initializer_list<pngme::byte_buffer> records) {
        pngme::byte_buffer out(pngme::signature.begin(), pngme::signature.end());
        for (const auto& r : records) {
            out.insert(out.end(), r.begin(), r.end());
        }
        return out;
    }

    // Small well-formed stream: IHDR, two tEXt, IDAT, IEND
    inline pngme::byte_buffer sample_png() {
        return png_bytes({
            make_chunk("IHDR", std::string("\x00\x00\x00\x01\x00\x00\x00\x01\x08\x02\x00\x00\x00", 13)).as_bytes(),
            make_chunk("tEXt", "first").as_bytes(),
            make_chunk("tEXt", "second").as_bytes(),
            make_chunk("IDAT", "pixels").as_bytes(),
            make_chunk("IEND", "").as_bytes()
        });
    }

    // Path inside the scratch directory; any previous file is removed
    inline std::filesystem::path scratch_file(const std::string& name) {
        static std::filesystem::path root(UNITTEST_SCRATCH_DIR);
        auto path = root / name;
        std::filesystem::remove(path);
        return path;
    }
}
