//
// Whole-file reading and writing for the command-line tool.
//

#include "file_io.hh"

#include <fstream>
#include <pngme/exceptions.hh>

namespace pngme::cli {

    byte_buffer read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Cannot open file: ", path.string());

        file.seekg(0, std::ios::end);
        const auto size = file.tellg();
        THROW_IO_IF(size == std::streampos(-1), "Failed to get size of file: ", path.string());
        file.seekg(0, std::ios::beg);

        byte_buffer data(static_cast<std::size_t>(size));
        if (!data.empty()) {
            file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
            THROW_IO_IF(file.gcount() != static_cast<std::streamsize>(data.size()),
                        "Unexpected EOF in ", path.string(), ": requested ", data.size(),
                        " bytes, got ", file.gcount());
        }
        return data;
    }

    void write_file(const std::filesystem::path& path, const byte_buffer& bytes) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file, "Cannot create file: ", path.string());

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        THROW_IO_UNLESS(file, "Failed to write ", bytes.size(), " bytes to ", path.string());
    }

}
