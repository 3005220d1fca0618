//
// cli.cc
//

#include "cli.hh"

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string_view>

#include <pngme/commands.hh>
#include <pngme/png.hh>
#include <pngme/parse_options.hh>
#include <pngme/pngme_config.h>

namespace pngme {

    std::optional<cli_arguments> parse_command_line(int argc, const char* const argv[]) {
        if (argc < 3) {
            return std::nullopt;
        }

        std::string_view name = argv[1];
        cli_arguments args;
        args.input = argv[2];

        if (name == "encode") {
            if (argc != 5 && argc != 6) {
                return std::nullopt;
            }
            args.command = subcommand::encode;
            args.type = chunk_type::from_string(argv[3]);
            args.message = argv[4];
            if (argc == 6) {
                args.output = std::filesystem::path(argv[5]);
            }
        } else if (name == "decode" || name == "remove") {
            if (argc != 4) {
                return std::nullopt;
            }
            args.command = name == "decode" ? subcommand::decode : subcommand::remove;
            args.type = chunk_type::from_string(argv[3]);
        } else if (name == "print") {
            if (argc != 3) {
                return std::nullopt;
            }
            args.command = subcommand::print;
        } else {
            return std::nullopt;
        }
        return args;
    }

    void print_usage(std::ostream& os, const char* program) {
        os << "pngme " << PNGME_VERSION << "\n\n";
        os << "Usage:\n";
        os << "  " << program << " encode <file> <chunk_type> <message> [output_file]\n";
        os << "  " << program << " decode <file> <chunk_type>\n";
        os << "  " << program << " remove <file> <chunk_type>\n";
        os << "  " << program << " print <file>\n";
        os << "\nChunk types are 4 ASCII letters, e.g. ruSt\n";
        os << "\nExamples:\n";
        os << "  " << program << " encode dice.png ruSt \"This is a secret message!\"\n";
        os << "  " << program << " decode dice.png ruSt\n";
    }

    int exit_code(error_kind kind) {
        switch (kind) {
            case error_kind::io: return 2;
            case error_kind::invalid_chunk_type: return 3;
            case error_kind::crc_mismatch: return 4;
            case error_kind::unexpected_eof: return 5;
            case error_kind::invalid_signature: return 6;
            case error_kind::missing_trailer: return 7;
            case error_kind::chunk_too_large: return 8;
            case error_kind::chunk_not_found: return 9;
            case error_kind::protected_chunk: return 10;
            case error_kind::encoding: return 11;
        }
        // make compiler happy
        return exit_usage;
    }

    std::vector<std::byte> read_file(const std::filesystem::path& path) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        THROW_IO_IF(ec, "Failed to open file: ", path.string(), " (", ec.message(), ")");

        std::ifstream file(path, std::ios::binary);
        THROW_IO_IF(!file, "Failed to open file: ", path.string());

        std::vector<std::byte> data(static_cast<std::size_t>(size));
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        THROW_IO_IF(file.bad() || static_cast<std::uintmax_t>(file.gcount()) != size,
                    "Failed to read file: ", path.string(), " (", file.gcount(), " of ", size, " bytes)");
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::vector<std::byte>& data) {
        // Write a sibling, then rename it over the target
        auto temp = path;
        temp += ".pngme-tmp";
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            THROW_IO_IF(!file, "Failed to open file for writing: ", temp.string());

            file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            file.flush();
            if (!file) {
                file.close();
                std::error_code ignored;
                std::filesystem::remove(temp, ignored);
                THROW_IO("Failed to write file: ", temp.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            THROW_IO("Failed to replace file: ", path.string(), " (", ec.message(), ")");
        }
    }

    int run(const cli_arguments& args, std::ostream& out, std::ostream& err) {
        parse_options options;
        options.on_warning = [&err](std::uint64_t offset, std::string_view category, std::string_view message) {
            err << "warning: " << category << " at offset " << offset << ": " << message << "\n";
        };

        try {
            auto stream = png::parse(read_file(args.input), options);

            switch (args.command) {
                case subcommand::encode: {
                    auto result = encode(std::move(stream), args.type->to_string(), std::string_view(args.message));
                    write_file(args.output.value_or(args.input), result.serialize());
                    break;
                }
                case subcommand::decode:
                    out << decode(stream, args.type->to_string()) << "\n";
                    break;
                case subcommand::remove: {
                    const chunk* target = stream.chunk_by_type(*args.type);
                    std::optional<chunk> removed;
                    if (target) {
                        removed = *target;
                    }
                    auto result = remove(std::move(stream), args.type->to_string());
                    write_file(args.input, result.serialize());
                    out << "Removed chunk: " << *removed << "\n";
                    break;
                }
                case subcommand::print:
                    for (const auto& entry : list(stream)) {
                        out << entry.type << "  length=" << entry.length
                            << "  crc=0x" << std::hex << std::setw(8) << std::setfill('0') << entry.crc
                            << std::dec << std::setfill(' ') << "\n";
                    }
                    break;
            }
        } catch (const pngme_error& e) {
            err << "Error: " << e.what() << "\n";
            return exit_code(e.kind());
        }
        return exit_ok;
    }

} // namespace pngme
