//
// cli.hh
//

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include <cstddef>

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

namespace pngme {

    enum class subcommand {
        encode,
        decode,
        remove,
        print
    };

    /**
     * @struct cli_arguments
     * @brief One parsed pngme invocation
     *
     * type is set for encode, decode and remove; message and output
     * only for encode.
     */
    struct cli_arguments {
        subcommand command = subcommand::print;
        std::filesystem::path input;
        std::optional<chunk_type> type;
        std::string message;
        std::optional<std::filesystem::path> output;
    };

    /// Exit status for a successful run
    constexpr int exit_ok = 0;
    /// Exit status for a malformed command line
    constexpr int exit_usage = 1;

    /**
     * @brief Parse argv into a command
     * @return nullopt for an unknown subcommand or a wrong argument count
     * @throws invalid_chunk_type if the chunk type argument is malformed
     */
    std::optional<cli_arguments> parse_command_line(int argc, const char* const argv[]);

    void print_usage(std::ostream& os, const char* program);

    /**
     * @brief Process exit status for an error kind
     *
     * Every kind maps to its own non-zero status, starting at 2.
     */
    int exit_code(error_kind kind);

    // Whole-file helpers; both throw io_error
    std::vector<std::byte> read_file(const std::filesystem::path& path);
    void write_file(const std::filesystem::path& path, const std::vector<std::byte>& data);

    /**
     * @brief Execute a parsed command
     * @param args Command to run
     * @param out Destination for results
     * @param err Destination for warnings and error messages
     * @return Process exit status
     */
    int run(const cli_arguments& args, std::ostream& out, std::ostream& err);

} // namespace pngme
