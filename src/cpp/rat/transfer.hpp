#pragma once

#include <cstdint>
#include <string>

#include "classify.hpp"
#include "file.hpp"

namespace rat {
    /** An open handle together with what it is and how to name it.

        A StreamHandle either owns its handle, when created with open(), or
        borrows it, when created with borrow(). Owned handles are closed by
        close() or on destruction. Borrowed handles are never closed.
    */
    class StreamHandle {
    public:
        /** Initialized as empty and invalid */
        StreamHandle(){}
        StreamHandle(StreamHandle&&);
        StreamHandle& operator=(StreamHandle&&);
        StreamHandle(const StreamHandle&)=delete;
        StreamHandle& operator=(const StreamHandle&)=delete;

        /** Opens path and classifies the result.

            @param path     file to open
            @param mode     as file_open()
            @param name     display name for diagnostics, path if empty

            @throw OpenError if the file cannot be opened.
        */
        static StreamHandle open(const std::string& path, const char* mode = "r",
            const std::string& name = "");

        /** Wraps a handle owned by someone else and classifies it. */
        static StreamHandle borrow(FileHandle handle, const std::string& name);

        FileHandle get() const { return mHandle; }
        const FileInfo& info() const { return mInfo; }
        FileKind kind() const { return mInfo.kind; }
        const std::string& name() const { return mName; }
        bool owned() const { return static_cast<bool>(mOwned); }

        /** Closes the handle if owned, forgets it otherwise.

            @returns false with errno set if close(2) reported an error, such
                     as a delayed write error on a network filesystem.
        */
        bool close();

        explicit operator bool() const noexcept {
            return mHandle != kBadFileValue;
        }
    private:
        UniqueFileHandle mOwned;
        FileHandle  mHandle = kBadFileValue;
        FileInfo    mInfo;
        std::string mName;
    };

    /** How a transfer moved its bytes. */
    enum class TransferStrategy {
        none,               ///< Nothing was attempted
        bulk,               ///< copy_file_range only
        buffered,           ///< read/write loop only
        bulk_then_buffered  ///< copy_file_range, then fallback to read/write
    };

    const char* strategy_name(TransferStrategy strategy);

    struct TransferOptions {
        /** Try copy_file_range when both ends are regular files */
        bool            bulk_copy   = true;
        /** Buffer size for the read/write loop. 0 means buffer_size_for() */
        std::size_t     buffer_size = 0;
        /** Primitive used to write to the output. */
        WriteFunction   write       = file_write;
    };

    struct TransferResult {
        std::uint64_t   bytes       = 0;
        TransferStrategy strategy   = TransferStrategy::none;
        /** Size of the read/write buffer, 0 if none was allocated */
        std::size_t     buffer_size = 0;
    };

    /** Buffer used when neither end is a pipe.

        kDefaultBufferSize, or 16 pages when that is not a whole number of
        pages.
    */
    std::size_t default_buffer_size();

    /** The buffer size policy. Pipe sized when either end is a FIFO,
        default_buffer_size() otherwise.
    */
    std::size_t buffer_size_for(FileKind input, FileKind output);

    enum class BulkStatus {
        complete,       ///< Input fully copied
        unsupported     ///< Use the read/write loop for whatever is left
    };

    struct BulkResult {
        BulkStatus      status  = BulkStatus::unsupported;
        std::uint64_t   copied  = 0;
    };

    /** @return true if errno_code from copy_file_range means the kernel or
                filesystem can't do it for these handles.
    */
    bool bulk_copy_unsupported(int errno_code);

    /** Copies from the current offset of input to the current offset of
        output with copy_file_range. Both offsets advance, so a read/write
        loop can resume where this left off.

        @throw ReadError, WriteError for real failures.
    */
    BulkResult copy_bulk(const StreamHandle& input, const StreamHandle& output);

    /** Read/write loop with one buffer of buffer_size allocated up front.

        @return bytes written
        @throw ReadError, WriteError. A buffer that can't be allocated is a
               ReadError with ENOMEM.
    */
    std::uint64_t copy_buffered(const StreamHandle& input, const StreamHandle& output,
        std::size_t buffer_size, WriteFunction write = file_write);

    /** Copies all of input to output.

        The input is consumed: it's closed, if owned, before this returns
        whatever the outcome. The output is only borrowed.

        @throw SameFileError    input and output are the same file. Nothing
                                is written.
        @throw ReadError        reading the input failed. Bytes copied before
                                the failure stay in the output.
        @throw WriteError       writing the output failed.
    */
    TransferResult transfer(StreamHandle input, const StreamHandle& output,
        const TransferOptions& options = {});
}
