/**
 * @file commands.hh
 * @brief Subcommands of the pngme tool: encode, decode, remove, print
 *
 * Each command reads the whole file, works on the parsed container and,
 * where it modifies it, writes the re-serialized bytes back. Library errors
 * propagate to run(), which turns them into a message and exit code.
 */

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme::cli {

    /**
     * @brief Append a chunk holding message to the file
     * @param output Destination; the input file is overwritten when empty
     */
    void encode(const std::filesystem::path& file,
                std::string_view type,
                std::string_view message,
                const std::optional<std::filesystem::path>& output,
                const parse_options& options = parse_options{});

    /**
     * @brief Payload of the first chunk of the given type, as text
     * @throws lookup_error if the file has no such chunk
     */
    std::string decode(const std::filesystem::path& file,
                       std::string_view type,
                       const parse_options& options = parse_options{});

    /**
     * @brief Remove the first chunk of the given type and rewrite the file
     * @return The removed chunk
     */
    chunk remove(const std::filesystem::path& file,
                 std::string_view type,
                 const parse_options& options = parse_options{});

    /**
     * @brief Write the display form of the file's container to out
     */
    void print(const std::filesystem::path& file,
               std::ostream& out,
               const parse_options& options = parse_options{});

    /**
     * @brief Parse the command line and run one command
     * @return Process exit code: 0 on success, 1 on usage or processing error
     */
    int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

}
