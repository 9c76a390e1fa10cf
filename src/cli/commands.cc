//
// pngme subcommands and argument dispatch
//

#include "commands.hh"
#include "file_io.hh"

#include <ostream>
#include <vector>

#include <pngme/chunk_type.hh>
#include <pngme/container.hh>
#include <pngme/exceptions.hh>

namespace pngme::cli {

    namespace {
        container load(const std::filesystem::path& file, const parse_options& options) {
            return container::parse(read_file(file), options);
        }

        void usage(std::ostream& err, const char* program) {
            err << "USAGE:\n"
                << "  " << program << " encode <file> <chunk_type> <message> [output_file]\n"
                << "      Hide a message in a new chunk\n"
                << "  " << program << " decode <file> <chunk_type>\n"
                << "      Print the message stored in a chunk\n"
                << "  " << program << " remove <file> <chunk_type>\n"
                << "      Remove a chunk from the file\n"
                << "  " << program << " print <file>\n"
                << "      Print the PNG signature and every chunk\n";
        }
    }

    void encode(const std::filesystem::path& file,
                std::string_view type,
                std::string_view message,
                const std::optional<std::filesystem::path>& output,
                const parse_options& options) {
        auto png = load(file, options);
        png.append_chunk(chunk(chunk_type::parse(type), byte_buffer(message.begin(), message.end())));
        write_file(output.value_or(file), png.as_bytes());
    }

    std::string decode(const std::filesystem::path& file,
                       std::string_view type,
                       const parse_options& options) {
        const auto png = load(file, options);
        const chunk* found = png.chunk_by_type(type);
        if (!found) {
            THROW_NOT_FOUND("Chunk '", type, "' not found in ", file.string());
        }
        return found->data_as_string();
    }

    chunk remove(const std::filesystem::path& file,
                 std::string_view type,
                 const parse_options& options) {
        auto png = load(file, options);
        chunk removed = png.remove_chunk(type);
        write_file(file, png.as_bytes());
        return removed;
    }

    void print(const std::filesystem::path& file,
               std::ostream& out,
               const parse_options& options) {
        out << load(file, options);
    }

    int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
        const char* program = argc > 0 ? argv[0] : "pngme";
        const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

        if (args.empty()) {
            usage(err, program);
            return 1;
        }

        parse_options options;
        options.on_warning = [&err](std::uint64_t offset, std::string_view category, std::string_view message) {
            err << "warning: [" << category << "] " << message << " (offset " << offset << ")\n";
        };

        const std::string& command = args[0];
        try {
            if (command == "encode" && (args.size() == 4 || args.size() == 5)) {
                std::optional<std::filesystem::path> output;
                if (args.size() == 5) {
                    output = args[4];
                }
                cli::encode(args[1], args[2], args[3], output, options);
            } else if (command == "decode" && args.size() == 3) {
                out << cli::decode(args[1], args[2], options) << "\n";
            } else if (command == "remove" && args.size() == 3) {
                cli::remove(args[1], args[2], options);
            } else if (command == "print" && args.size() == 2) {
                cli::print(args[1], out, options);
            } else {
                usage(err, program);
                return 1;
            }
        } catch (const std::exception& e) {
            err << "error: " << e.what() << "\n";
            return 1;
        }
        return 0;
    }

}
