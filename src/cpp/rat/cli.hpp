#pragma once

#include <string>
#include <vector>

#include "concat.hpp"

namespace rat {
    /** Exit status for a bad command line. */
    constexpr int kUsageReturnCode = 2;

    /** The parsed command line. */
    struct CliArgs {
        std::vector<InputSpec> inputs;
        std::string output_path;
        bool        append          = false;
        bool        show_help       = false;
        bool        show_version    = false;
        bool        no_copy_range   = false;
        /** 0 means the buffer size policy decides */
        std::size_t buffer_size     = 0;
        DirectoryPolicy directories = DirectoryPolicy::error;
        /** Empty when --log wasn't given */
        std::string log_level;
    };

    /** Parses the command line. args[0] is the program and is skipped.

        @throw UsageError on unknown options or missing option values.
    */
    CliArgs parse_args(const CommandLine& args);

    /** Parses a byte count with optional K, M or G suffix (powers of 1024).

        @throw UsageError if not a positive number of at most 1G.
    */
    std::size_t parse_size(const std::string& text);

    /** Last path component of argv[0] */
    std::string program_basename(const std::string& path);

    std::string usage(const std::string& program);

    /** Runs rat as from main().

        @param args     command line, args[0] is the program
        @param options  where standard input, output and diagnostics are.
                        Command line settings are applied on top.

        @return the process exit status. 0 if every input was copied, 1 if
                any failed, kUsageReturnCode for a bad command line.
    */
    int run_cli(const CommandLine& args, CatOptions options = {});
}
