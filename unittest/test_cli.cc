//
// Command line parsing and end-to-end runs against temporary files
//

#include <doctest/doctest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <pngme/png.hh>
#include <pngme/pngme_config.h>
#include "cli.hh"
#include "test_utils.hh"

using namespace pngme;

namespace {
    template<std::size_t N>
    std::optional<cli_arguments> parse_args(const char* const (&argv)[N]) {
        return parse_command_line(static_cast<int>(N), argv);
    }

    // Temporary file removed when the test case ends
    class temp_file {
    public:
        explicit temp_file(const std::string& name)
            : m_path(std::filesystem::temp_directory_path() / ("pngme_unittest_" + name)) {
            std::filesystem::remove(m_path);
        }
        ~temp_file() {
            std::error_code ec;
            std::filesystem::remove(m_path, ec);
        }

        temp_file(const temp_file&) = delete;
        temp_file& operator = (const temp_file&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

    struct run_output {
        int status;
        std::string out;
        std::string err;
    };

    run_output run_args(std::initializer_list<std::string> words) {
        std::vector<std::string> storage(words);
        std::vector<const char*> argv;
        argv.push_back("pngme");
        for (const auto& w : storage) {
            argv.push_back(w.c_str());
        }
        auto args = parse_command_line(static_cast<int>(argv.size()), argv.data());
        REQUIRE(args.has_value());

        std::ostringstream out;
        std::ostringstream err;
        int status = run(*args, out, err);
        return {status, out.str(), err.str()};
    }
}

TEST_SUITE("CLI") {
    TEST_CASE("command line parsing") {
        SUBCASE("encode") {
            const char* const argv[] = {"pngme", "encode", "/a/b/c", "RuSt", "Secret decoder ring"};
            auto args = parse_args(argv);
            REQUIRE(args.has_value());
            CHECK(args->command == subcommand::encode);
            CHECK(args->input == std::filesystem::path("/a/b/c"));
            REQUIRE(args->type.has_value());
            CHECK(args->type->to_string() == "RuSt");
            CHECK(args->message == "Secret decoder ring");
            CHECK_FALSE(args->output.has_value());
        }

        SUBCASE("encode with output file") {
            const char* const argv[] = {"pngme", "encode", "/a/b/c", "RuSt", "Secret decoder ring",
                                        "/output/file/path"};
            auto args = parse_args(argv);
            REQUIRE(args.has_value());
            REQUIRE(args->output.has_value());
            CHECK(*args->output == std::filesystem::path("/output/file/path"));
        }

        SUBCASE("decode") {
            const char* const argv[] = {"pngme", "decode", "/a/b/c", "PnGm"};
            auto args = parse_args(argv);
            REQUIRE(args.has_value());
            CHECK(args->command == subcommand::decode);
            CHECK(args->type->to_string() == "PnGm");
        }

        SUBCASE("remove") {
            const char* const argv[] = {"pngme", "remove", "/a/b/c", "imAG"};
            auto args = parse_args(argv);
            REQUIRE(args.has_value());
            CHECK(args->command == subcommand::remove);
            CHECK(args->type->to_string() == "imAG");
        }

        SUBCASE("print") {
            const char* const argv[] = {"pngme", "print", "/a/b/c"};
            auto args = parse_args(argv);
            REQUIRE(args.has_value());
            CHECK(args->command == subcommand::print);
            CHECK_FALSE(args->type.has_value());
        }

        SUBCASE("unknown subcommand") {
            const char* const argv[] = {"pngme", "blah-blah", "some-argument"};
            CHECK_FALSE(parse_args(argv).has_value());
        }

        SUBCASE("wrong argument counts") {
            const char* const too_few[] = {"pngme", "decode", "/a/b/c"};
            CHECK_FALSE(parse_args(too_few).has_value());
            const char* const too_many[] = {"pngme", "print", "/a/b/c", "RuSt"};
            CHECK_FALSE(parse_args(too_many).has_value());
            const char* const bare[] = {"pngme"};
            CHECK_FALSE(parse_args(bare).has_value());
        }

        SUBCASE("malformed chunk type") {
            const char* const argv[] = {"pngme", "decode", "/a/b/c", "Ru5T"};
            CHECK_THROWS_AS(parse_args(argv), invalid_chunk_type);
        }
    }

    TEST_CASE("exit codes are distinct") {
        std::vector<int> codes;
        for (auto kind : {error_kind::io, error_kind::invalid_chunk_type, error_kind::crc_mismatch,
                          error_kind::unexpected_eof, error_kind::invalid_signature,
                          error_kind::missing_trailer, error_kind::chunk_too_large,
                          error_kind::chunk_not_found, error_kind::protected_chunk,
                          error_kind::encoding}) {
            int code = exit_code(kind);
            CHECK(code != exit_ok);
            CHECK(code != exit_usage);
            CHECK(std::find(codes.begin(), codes.end(), code) == codes.end());
            codes.push_back(code);
        }
    }

    TEST_CASE("usage banner") {
        std::ostringstream os;
        print_usage(os, "pngme");
        CHECK(os.str().find(std::string("pngme ") + PNGME_VERSION) == 0);
        CHECK(os.str().find("encode <file> <chunk_type> <message> [output_file]") != std::string::npos);
    }

    TEST_CASE("file round trip") {
        temp_file input("input.png");
        write_file(input.path(), minimal_png());
        CHECK(read_file(input.path()) == minimal_png());
        CHECK_FALSE(std::filesystem::exists(input.path().string() + ".pngme-tmp"));

        SUBCASE("encode in place then decode") {
            auto encoded = run_args({"encode", input.path().string(), "ruSt", "This is a secret message!"});
            CHECK(encoded.status == exit_ok);

            auto decoded = run_args({"decode", input.path().string(), "ruSt"});
            CHECK(decoded.status == exit_ok);
            CHECK(decoded.out == "This is a secret message!\n");
        }

        SUBCASE("encode to a separate output file") {
            temp_file output("output.png");
            auto encoded = run_args({"encode", input.path().string(), "ruSt", "hidden",
                                     output.path().string()});
            CHECK(encoded.status == exit_ok);
            CHECK(read_file(input.path()) == minimal_png());

            auto stream = png::parse(read_file(output.path()));
            CHECK(stream.chunks().size() == 3);
        }

        SUBCASE("remove rewrites the input") {
            CHECK(run_args({"encode", input.path().string(), "ruSt", "gone soon"}).status == exit_ok);

            auto removed = run_args({"remove", input.path().string(), "ruSt"});
            CHECK(removed.status == exit_ok);
            CHECK(removed.out == "Removed chunk: len: 9, type: ruSt, data: gone soon\n");
            CHECK(read_file(input.path()) == minimal_png());

            auto decoded = run_args({"decode", input.path().string(), "ruSt"});
            CHECK(decoded.status == exit_code(error_kind::chunk_not_found));
            CHECK(decoded.err.find("ruSt") != std::string::npos);
        }

        SUBCASE("print lists every chunk") {
            auto printed = run_args({"print", input.path().string()});
            CHECK(printed.status == exit_ok);
            CHECK(printed.out == "IHDR  length=13  crc=0x1f15c489\n"
                                 "IEND  length=0  crc=0xae426082\n");
        }

        SUBCASE("failed remove leaves the file untouched") {
            auto removed = run_args({"remove", input.path().string(), "IHDR"});
            CHECK(removed.status == exit_code(error_kind::protected_chunk));
            CHECK(read_file(input.path()) == minimal_png());
        }

        SUBCASE("warnings go to the error stream") {
            std::vector<std::byte> data = png_signature();
            append(data, ihdr_chunk());
            append(data, raw_chunk(0, "Rust", "", reference_crc32("Rust")));
            append(data, iend_chunk());
            write_file(input.path(), data);

            auto printed = run_args({"print", input.path().string()});
            CHECK(printed.status == exit_ok);
            CHECK(printed.err.find("warning: reserved_bit at offset 33") != std::string::npos);
        }
    }

    TEST_CASE("error statuses") {
        SUBCASE("missing file") {
            auto result = run_args({"print", "/nonexistent/pngme/file.png"});
            CHECK(result.status == exit_code(error_kind::io));
            CHECK(result.err.find("Error:") == 0);
        }

        SUBCASE("directory instead of a file") {
            auto dir = std::filesystem::temp_directory_path();
            auto result = run_args({"print", dir.string()});
            CHECK(result.status == exit_code(error_kind::io));
            CHECK(result.err.find("Error:") == 0);
            CHECK_THROWS_AS(read_file(dir), io_error);
        }

        SUBCASE("unwritable destination keeps the input") {
            temp_file input("keep.png");
            write_file(input.path(), minimal_png());
            auto target = std::filesystem::temp_directory_path() / "pngme_unittest_missing_dir" / "out.png";
            auto result = run_args({"encode", input.path().string(), "ruSt", "hi", target.string()});
            CHECK(result.status == exit_code(error_kind::io));
            CHECK_FALSE(std::filesystem::exists(target));
            CHECK(read_file(input.path()) == minimal_png());
        }

        SUBCASE("not a png") {
            temp_file input("not_png.png");
            write_file(input.path(), bytes_of("plain text file"));
            auto result = run_args({"print", input.path().string()});
            CHECK(result.status == exit_code(error_kind::invalid_signature));
        }

        SUBCASE("corrupted png") {
            temp_file input("corrupt.png");
            auto data = minimal_png();
            data[20] ^= std::byte{0x40};
            write_file(input.path(), data);
            auto result = run_args({"decode", input.path().string(), "ruSt"});
            CHECK(result.status == exit_code(error_kind::crc_mismatch));
        }
    }
}
