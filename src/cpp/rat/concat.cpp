#include "concat.hpp"

#include <cerrno>
#include <cstring>

#include "log.hpp"

using namespace rat::details;

namespace {
    void set_failure(rat::TransferOutcome& outcome, rat::FailureKind kind,
        int errno_code, const char* message) {
        outcome.failure     = kind;
        outcome.errno_code  = errno_code;
        outcome.message     = message;
    }

    rat::StreamHandle open_input(const rat::InputSpec& input, const rat::CatOptions& options) {
        if (input.is_stdin())
            return rat::StreamHandle::borrow(options.cin, rat::kStdInName);
        return rat::StreamHandle::open(input.path(), "r");
    }
}

namespace rat {
    InputSpec InputSpec::from_argument(const std::string& argument) {
        if (argument == kStdInName)
            return standard_input();
        return file(argument);
    }
    InputSpec InputSpec::file(const std::string& path) {
        InputSpec spec;
        spec.mStdIn = false;
        spec.mPath = path;
        return spec;
    }
    std::string InputSpec::display_name() const {
        return mStdIn? kStdInName : mPath;
    }

    std::uint64_t CatResult::bytes() const {
        std::uint64_t total = 0;
        for (auto& outcome : outcomes)
            total += outcome.bytes;
        return total;
    }

    TransferOutcome transfer_input(const InputSpec& input, const StreamHandle& output,
        const CatOptions& options) {
        TransferOutcome outcome;
        outcome.name = input.display_name();
        try {
            StreamHandle stream = open_input(input, options);
            if (stream.info().directory) {
                if (options.directories == DirectoryPolicy::error)
                    throw make_read_error(outcome.name, EISDIR);
                outcome.skipped     = true;
                outcome.errno_code  = EISDIR;
                outcome.message     = std::strerror(EISDIR);
                return outcome;
            }
            TransferResult result = transfer(std::move(stream), output, options.transfer);
            outcome.bytes       = result.bytes;
            outcome.strategy    = result.strategy;
            outcome.buffer_size = result.buffer_size;
        } catch (OpenError& error) {
            set_failure(outcome, FailureKind::open, error.errno_code, error.what());
        } catch (SameFileError& error) {
            set_failure(outcome, FailureKind::same_file, 0, error.what());
        } catch (ReadError& error) {
            set_failure(outcome, FailureKind::read, error.errno_code, error.what());
        } catch (WriteError& error) {
            set_failure(outcome, FailureKind::write, error.errno_code, error.what());
        }
        return outcome;
    }

    std::string format_diagnostic(const std::string& program, const TransferOutcome& outcome) {
        if (outcome.failure == FailureKind::write)
            return program + ": write error: " + outcome.message;
        std::string line = program + ": " + outcome.name + ": " + outcome.message;
        if (outcome.skipped)
            line += " (skipped)";
        return line;
    }

    CatResult concatenate(const std::vector<InputSpec>& inputs, const CatOptions& options) {
        StreamHandle output;
        if (options.output_path.empty()) {
            output = StreamHandle::borrow(options.cout, "standard output");
        } else {
            output = StreamHandle::open(options.output_path, options.append? "a" : "w");
        }

        std::vector<InputSpec> list = inputs;
        if (list.empty())
            list.push_back(InputSpec::standard_input());

        CatResult result;
        for (const InputSpec& input : list) {
            TransferOutcome outcome = transfer_input(input, output, options);
            if (!outcome || outcome.skipped) {
                if (options.cerr) {
                    *options.cerr << format_diagnostic(options.program_name, outcome) << '\n';
                    options.cerr->flush();
                }
            } else if (log_enabled(LogLevel::info)) {
                log_emit(LogLevel::info, outcome.name + ": " + std::to_string(outcome.bytes)
                    + " bytes, " + strategy_name(outcome.strategy));
            }
            if (!outcome)
                result.returncode = 1;
            bool write_failed = outcome.failure == FailureKind::write;
            result.outcomes.push_back(std::move(outcome));
            if (write_failed) {
                // the output is shared, nothing after this can succeed
                result.aborted = true;
                break;
            }
        }

        // close(2) can report write errors the writes didn't
        bool closed = output.close();
        int errno_code = errno;
        if (!closed && !result.aborted) {
            TransferOutcome outcome;
            outcome.name = output.name();
            set_failure(outcome, FailureKind::write, errno_code, std::strerror(errno_code));
            if (options.cerr) {
                *options.cerr << format_diagnostic(options.program_name, outcome) << '\n';
                options.cerr->flush();
            }
            result.returncode = 1;
            result.outcomes.push_back(std::move(outcome));
        }
        return result;
    }
}
