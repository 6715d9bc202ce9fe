#pragma once

#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

#include "transfer.hpp"

namespace rat {

    /** One requested input: standard input or a path. */
    class InputSpec {
    public:
        /** Standard input */
        InputSpec(){}
        /** "-" is standard input, anything else a path */
        static InputSpec from_argument(const std::string& argument);
        static InputSpec standard_input() { return {}; }
        static InputSpec file(const std::string& path);

        bool is_stdin() const { return mStdIn; }
        /** Empty for standard input */
        const std::string& path() const { return mPath; }
        /** "-" for standard input, the path otherwise */
        std::string display_name() const;

        bool operator==(const InputSpec& other) const {
            return mStdIn == other.mStdIn && mPath == other.mPath;
        }
    private:
        bool        mStdIn = true;
        std::string mPath;
    };

    /** What to do with an input that is a directory. */
    enum class DirectoryPolicy {
        error,  ///< read error "Is a directory", exit status 1
        skip    ///< warn and go on, exit status unaffected
    };

    enum class FailureKind {
        none,
        open,
        same_file,
        read,
        write
    };

    /** Details about one processed input. */
    struct TransferOutcome {
        /** display name of the input */
        std::string     name;
        std::uint64_t   bytes       = 0;
        TransferStrategy strategy   = TransferStrategy::none;
        std::size_t     buffer_size = 0;
        FailureKind     failure     = FailureKind::none;
        /** errno of the failure, 0 if not from the system */
        int             errno_code  = 0;
        /** human readable cause, empty on success */
        std::string     message;
        /** directory skipped under DirectoryPolicy::skip */
        bool            skipped     = false;

        explicit operator bool() const {
            return failure == FailureKind::none;
        }
    };

    struct CatOptions {
        /** Handle read for standard input entries. Borrowed. */
        FileHandle  cin     = kStdInValue;
        /** Output handle when output_path is empty. Borrowed. */
        FileHandle  cout    = kStdOutValue;
        /** Diagnostics go here, one line per failed input. */
        std::ostream* cerr  = &std::cerr;

        /** If set, opened once and used instead of cout. */
        std::string output_path;
        /** Append to output_path instead of truncating it. */
        bool        append  = false;

        /** Prefix of every diagnostic line */
        std::string program_name = "rat";
        DirectoryPolicy directories = DirectoryPolicy::error;
        TransferOptions transfer;
    };

    /** Details about a whole run. */
    struct CatResult {
        /** One per processed input, in order. A failed close of the
            output file adds a last FailureKind::write outcome named after
            the output.
        */
        std::vector<TransferOutcome> outcomes;
        /** A write error ended the run. Inputs after it were not opened. */
        bool    aborted     = false;
        /** 0 if every input succeeded, 1 otherwise */
        int     returncode  = 0;

        std::uint64_t bytes() const;
        explicit operator bool() const {
            return returncode == 0;
        }
    };

    /** Copies one input to output, catching its errors into the outcome.

        Nothing is printed. WriteError is the only failure that stops a run,
        check outcome.failure for FailureKind::write.
    */
    TransferOutcome transfer_input(const InputSpec& input, const StreamHandle& output,
        const CatOptions& options);

    /** Formats the diagnostic line for a failed outcome, without newline. */
    std::string format_diagnostic(const std::string& program, const TransferOutcome& outcome);

    /** Concatenates inputs in order to the output described by options.

        An empty input list reads standard input. Diagnostics are written to
        options.cerr as soon as an input fails and processing goes on with
        the next input. A write error ends the run.

        @throw OpenError if options.output_path can't be opened. No input is
               touched in that case.
    */
    CatResult concatenate(const std::vector<InputSpec>& inputs, const CatOptions& options = {});

    /** Helper class to construct CatOptions with minimal typing. */
    struct CatBuilder {
        CatOptions options;
        std::vector<InputSpec> inputs;

        CatBuilder(){}
        /** Each argument as InputSpec::from_argument() */
        CatBuilder(std::initializer_list<std::string> arguments) {
            for (auto& argument : arguments)
                inputs.push_back(InputSpec::from_argument(argument));
        }
        CatBuilder& input(const InputSpec& spec) {inputs.push_back(spec); return *this;}
        CatBuilder& cin(FileHandle cin) {options.cin = cin; return *this;}
        CatBuilder& cout(FileHandle cout) {options.cout = cout; return *this;}
        CatBuilder& cerr(std::ostream* cerr) {options.cerr = cerr; return *this;}
        /** Write to path, truncating, or appending if append is true */
        CatBuilder& output(const std::string& path, bool append=false) {
            options.output_path = path;
            options.append = append;
            return *this;
        }
        CatBuilder& program_name(const std::string& name) {options.program_name = name; return *this;}
        CatBuilder& directories(DirectoryPolicy policy) {options.directories = policy; return *this;}
        CatBuilder& bulk_copy(bool enabled) {options.transfer.bulk_copy = enabled; return *this;}
        CatBuilder& buffer_size(std::size_t size) {options.transfer.buffer_size = size; return *this;}
        CatBuilder& write(WriteFunction write) {options.transfer.write = write; return *this;}
        operator CatOptions() const {return options;}

        CatResult run() {return concatenate(inputs, options);}
    };
}
