#pragma once
#include <unistd.h>
#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>


// stdin, stdout, stderr are macros. So instead of stdout,...
// we use cin, cout, cerr as variable names


namespace rat {
    constexpr const char* kVersion = "0.3.0";

    typedef int FileHandle;
    /** The value representing an invalid file handle */
    const FileHandle kBadFileValue = (FileHandle)-1;

    constexpr int kStdInValue   = 0;
    constexpr int kStdOutValue  = 1;
    constexpr int kStdErrValue  = 2;

    /** Display name used for standard input in diagnostics. */
    constexpr const char* kStdInName = "-";

    /** Linux pipes hold 16 pages by default. Larger writes into a pipe are
        split by the kernel anyway.
    */
    constexpr std::size_t kPipeBufferSize       = 64 * 1024;
    /** Buffer used when neither end is a pipe. */
    constexpr std::size_t kDefaultBufferSize    = 128 * 1024;

    typedef std::vector<std::string> CommandLine;

    struct RatError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    struct OSError : RatError {
        using RatError::RatError;
        /** errno value of the failed call, 0 if unknown */
        int errno_code = 0;
    };

    /** An input could not be opened. what() is the system message. */
    struct OpenError : OSError {
        using OSError::OSError;
        std::string path;
    };

    /** Reading an input failed part way. what() is the system message. */
    struct ReadError : OSError {
        using OSError::OSError;
        std::string path;
    };

    /** Writing to the shared output failed. The output is unusable after
        this, every remaining input is abandoned.
    */
    struct WriteError : OSError {
        using OSError::OSError;
    };

    /** Input and output are the same file. Raised before any byte moves. */
    struct SameFileError : RatError {
        using RatError::RatError;
        std::string path;
    };

    /** Bad command line. */
    struct UsageError : RatError {
        using RatError::RatError;
    };

    namespace details {
        OpenError make_open_error(const std::string& path, int errno_code);
        ReadError make_read_error(const std::string& path, int errno_code);
        WriteError make_write_error(int errno_code);
    }
}
