#include "cli.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>

#include "environ.hpp"
#include "log.hpp"

namespace {
    const std::size_t kMaxBufferSize = std::size_t(1) << 30;

    /** Takes the value of an option given as "--name=value" or "--name value". */
    std::string option_value(const rat::CommandLine& args, std::size_t& index,
        const std::string& name) {
        const std::string& arg = args[index];
        if (arg.size() > name.size() && arg[name.size()] == '=')
            return arg.substr(name.size() + 1);
        if (index + 1 >= args.size())
            throw rat::UsageError("option '" + name + "' requires an argument");
        return args[++index];
    }

    bool has_option(const std::string& arg, const std::string& name) {
        if (arg.compare(0, name.size(), name) != 0)
            return false;
        return arg.size() == name.size() || arg[name.size()] == '=';
    }

    /** Removes the log handler installed by run_cli() when it returns. */
    struct LogHandlerGuard {
        bool installed = false;
        ~LogHandlerGuard() {
            if (installed)
                rat::clear_log_handler();
        }
    };

    bool write_text(rat::FileHandle handle, const std::string& text) {
        return rat::file_write_all(handle, text.data(), text.size()) >= 0;
    }
}

namespace rat {
    std::size_t parse_size(const std::string& text) {
        std::size_t pos = 0;
        std::size_t value = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            value = value * 10 + (text[pos] - '0');
            if (value > kMaxBufferSize)
                throw UsageError("invalid buffer size '" + text + "'");
            ++pos;
        }
        if (pos == 0)
            throw UsageError("invalid buffer size '" + text + "'");
        std::size_t multiplier = 1;
        if (pos < text.size()) {
            switch (text[pos]) {
            case 'k': case 'K': multiplier = 1024; break;
            case 'm': case 'M': multiplier = 1024 * 1024; break;
            case 'g': case 'G': multiplier = 1024 * 1024 * 1024; break;
            default:
                throw UsageError("invalid buffer size '" + text + "'");
            }
            ++pos;
        }
        if (pos != text.size() || value == 0 || value > kMaxBufferSize / multiplier)
            throw UsageError("invalid buffer size '" + text + "'");
        return value * multiplier;
    }

    CliArgs parse_args(const CommandLine& args) {
        CliArgs cli;
        bool options_done = false;
        for (std::size_t i = 1; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (options_done || arg.size() < 2 || arg[0] != '-') {
                cli.inputs.push_back(InputSpec::from_argument(arg));
                continue;
            }
            if (arg == "--") {
                options_done = true;
            } else if (arg[1] == '-') {
                if (arg == "--help") {
                    cli.show_help = true;
                } else if (arg == "--version") {
                    cli.show_version = true;
                } else if (arg == "--append") {
                    cli.append = true;
                } else if (arg == "--skip-directories") {
                    cli.directories = DirectoryPolicy::skip;
                } else if (arg == "--no-copy-range") {
                    cli.no_copy_range = true;
                } else if (has_option(arg, "--output")) {
                    cli.output_path = option_value(args, i, "--output");
                } else if (has_option(arg, "--buffer-size")) {
                    cli.buffer_size = parse_size(option_value(args, i, "--buffer-size"));
                } else if (has_option(arg, "--log")) {
                    cli.log_level = option_value(args, i, "--log");
                    parse_log_level(cli.log_level);
                } else {
                    throw UsageError("unrecognized option '" + arg + "'");
                }
            } else {
                // cluster of short flags, -o takes the rest or the next argument
                for (std::size_t j = 1; j < arg.size(); ++j) {
                    char flag = arg[j];
                    if (flag == 'u') {
                        // POSIX, output is never buffered anyway
                    } else if (flag == 'a') {
                        cli.append = true;
                    } else if (flag == 'h') {
                        cli.show_help = true;
                    } else if (flag == 'o') {
                        if (j + 1 < arg.size()) {
                            cli.output_path = arg.substr(j + 1);
                        } else if (i + 1 < args.size()) {
                            cli.output_path = args[++i];
                        } else {
                            throw UsageError("option requires an argument -- 'o'");
                        }
                        break;
                    } else {
                        throw UsageError(std::string("invalid option -- '") + flag + "'");
                    }
                }
            }
        }
        if (cli.output_path.empty() && cli.append && !cli.show_help && !cli.show_version)
            throw UsageError("--append requires --output");
        return cli;
    }

    std::string program_basename(const std::string& path) {
        std::size_t slash = path.find_last_of('/');
        if (slash == std::string::npos)
            return path.empty()? "rat" : path;
        std::string name = path.substr(slash + 1);
        return name.empty()? "rat" : name;
    }

    std::string usage(const std::string& program) {
        return "Usage: " + program + " [OPTION]... [FILE]...\n"
            "Concatenate FILE(s) to standard output.\n"
            "\n"
            "With no FILE, or when FILE is -, read standard input.\n"
            "\n"
            "  -o, --output=FILE      write to FILE instead of standard output\n"
            "  -a, --append           append to the --output file\n"
            "  -u                     (ignored)\n"
            "      --skip-directories warn about directory inputs instead of failing\n"
            "      --no-copy-range    never use copy_file_range\n"
            "      --buffer-size=SIZE read/write buffer size, K, M, G suffixes allowed\n"
            "      --log=LEVEL        log to standard error: error, warning, notice,\n"
            "                         info or debug\n"
            "  -h, --help             display this help and exit\n"
            "      --version          output version information and exit\n"
            "\n"
            "Environment: RAT_LOG=LEVEL as --log, RAT_NO_COPY_RANGE=1 as --no-copy-range.\n";
    }

    int run_cli(const CommandLine& args, CatOptions options) {
        std::string program = program_basename(args.empty()? "" : args[0]);
        options.program_name = program;
        std::ostream* cerr = options.cerr? options.cerr : &std::cerr;
        options.cerr = cerr;

        CliArgs cli;
        LogHandlerGuard log_guard;
        try {
            cli = parse_args(args);
            std::string level = cli.log_level;
            if (level.empty())
                level = cenv["RAT_LOG"].to_string();
            if (!level.empty()) {
                LogLevel max_level = parse_log_level(level);
                set_log_handler([cerr, program](LogLevel message_level, const std::string& message) {
                    *cerr << program << ": [" << log_level_name(message_level) << "] " << message << '\n';
                    cerr->flush();
                }, max_level);
                log_guard.installed = true;
            }
        } catch (UsageError& error) {
            *cerr << program << ": " << error.what() << '\n'
                << "Try '" << program << " --help' for more information.\n";
            cerr->flush();
            return kUsageReturnCode;
        }

        if (cli.show_help || cli.show_version) {
            std::string text = cli.show_help? usage(program)
                : program + " " + kVersion + "\n";
            if (write_text(options.cout, text))
                return 0;
            *cerr << program << ": write error: " << std::strerror(errno) << '\n';
            return 1;
        }

        options.output_path = cli.output_path;
        options.append      = cli.append;
        options.directories = cli.directories;
        if (cli.no_copy_range || cenv["RAT_NO_COPY_RANGE"])
            options.transfer.bulk_copy = false;
        if (cli.buffer_size != 0)
            options.transfer.buffer_size = cli.buffer_size;

        try {
            CatResult result = concatenate(cli.inputs, options);
            if (result.aborted)
                log_emit(LogLevel::warning, "output unusable, remaining inputs skipped");
            return result.returncode;
        } catch (OpenError& error) {
            *cerr << program << ": " << error.path << ": " << error.what() << '\n';
        } catch (OSError& error) {
            *cerr << program << ": " << error.what() << '\n';
        }
        cerr->flush();
        return 1;
    }
}
