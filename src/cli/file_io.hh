//
// Whole-file reading and writing for the command-line tool.
//

#pragma once

#include <filesystem>
#include <pngme/chunk.hh>

namespace pngme::cli {

    // Reads the whole file; throws io_error if it can not be opened or read
    byte_buffer read_file(const std::filesystem::path& path);

    // Creates or truncates the file and writes all bytes; throws io_error on failure
    void write_file(const std::filesystem::path& path, const byte_buffer& bytes);

}
