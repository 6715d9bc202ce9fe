#pragma once

#include "basic_types.hpp"

namespace rat {
    /** Owns a file handle and closes it on destruction.

        The rest of this header mirrors the system calls one to one.
    */
    class UniqueFileHandle {
    public:
        UniqueFileHandle(){}
        explicit UniqueFileHandle(FileHandle handle): mHandle(handle){}
        ~UniqueFileHandle(){ reset(); }
        UniqueFileHandle(UniqueFileHandle&& other) noexcept {
            mHandle = other.release();
        }
        UniqueFileHandle& operator=(UniqueFileHandle&& other) noexcept {
            reset(other.release());
            return *this;
        }
        UniqueFileHandle(const UniqueFileHandle&)=delete;
        UniqueFileHandle& operator=(const UniqueFileHandle&)=delete;

        FileHandle get() const { return mHandle; }
        /** Gives up ownership without closing. */
        FileHandle release() {
            FileHandle handle = mHandle;
            mHandle = kBadFileValue;
            return handle;
        }
        /** Closes the current handle, if any, and takes ownership of handle. */
        void reset(FileHandle handle = kBadFileValue);
        explicit operator bool() const noexcept {
            return mHandle != kBadFileValue;
        }
    private:
        FileHandle mHandle = kBadFileValue;
    };

    /** Closes a file handle.
        @param handle   The handle to close.
        @returns true on success
    */
    bool file_close(FileHandle handle);

    /** Opens a file and returns the handle.

        You must call file_close() on the returned handle, or hand it to a
        UniqueFileHandle.

        @param filename
            The file path
        @param mode
            The mode as from fopen. Always binary mode.
            r - read only, will fail if file doesn't exist
            w - write only and will create or truncate the file
            a - write only, create if missing, every write appends
            + - allow read/write

        @returns the handle to the opened file, or kBadFileValue on error with
                 errno set.
    */
    FileHandle file_open(const char* filename, const char* mode);

    /** read(2) retried on EINTR.
        @returns    -1 on error, 0 at end of input.
    */
    ssize_t file_read(FileHandle, void* buffer, size_t size);
    /** write(2) retried on EINTR. May write less than size.
        @returns    -1 on error.
    */
    ssize_t file_write(FileHandle, const void* buffer, size_t size);

    /** Signature of the primitive used to push bytes to an output. */
    typedef ssize_t (*WriteFunction)(FileHandle, const void* buffer, size_t size);

    /** Writes all of buffer, looping over partial writes.

        A write that reports 0 bytes for a non-empty request sets errno to
        ENOSPC.

        @returns size on success, -1 on error with errno set.
    */
    ssize_t file_write_all(FileHandle, const void* buffer, size_t size,
        WriteFunction write = file_write);

    /** Tells the kernel the handle will be read sequentially.
        @returns true if the advice was accepted.
    */
    bool file_advise_sequential(FileHandle handle);

    /** @return the system page size in bytes. */
    std::size_t page_size();
}
