#include "file.hpp"

#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace rat {
    namespace details {
        OpenError make_open_error(const std::string& path, int errno_code) {
            OpenError error(std::strerror(errno_code));
            error.errno_code = errno_code;
            error.path = path;
            return error;
        }
        ReadError make_read_error(const std::string& path, int errno_code) {
            ReadError error(std::strerror(errno_code));
            error.errno_code = errno_code;
            error.path = path;
            return error;
        }
        WriteError make_write_error(int errno_code) {
            WriteError error(std::strerror(errno_code));
            error.errno_code = errno_code;
            return error;
        }
    }

    void UniqueFileHandle::reset(FileHandle handle) {
        if (mHandle != kBadFileValue && mHandle != handle)
            file_close(mHandle);
        mHandle = handle;
    }

    bool file_close(FileHandle handle) {
        if (handle == kBadFileValue)
            return false;
        // on linux the handle is released even when close reports EINTR
        return ::close(handle) == 0;
    }

    FileHandle file_open(const char* filename, const char* mode) {
        if (filename == nullptr || mode == nullptr) {
            errno = EINVAL;
            return kBadFileValue;
        }
        bool plus = std::strchr(mode, '+') != nullptr;
        int flags = O_CLOEXEC;
        switch (mode[0]) {
        case 'r':
            flags |= plus? O_RDWR : O_RDONLY;
            break;
        case 'w':
            flags |= (plus? O_RDWR : O_WRONLY) | O_CREAT | O_TRUNC;
            break;
        case 'a':
            flags |= (plus? O_RDWR : O_WRONLY) | O_CREAT | O_APPEND;
            break;
        default:
            errno = EINVAL;
            return kBadFileValue;
        }
        FileHandle handle;
        do {
            handle = ::open(filename, flags, 0666);
        } while (handle == kBadFileValue && errno == EINTR);
        return handle;
    }

    ssize_t file_read(FileHandle handle, void* buffer, size_t size) {
        while (true) {
            ssize_t transferred = ::read(handle, buffer, size);
            if (transferred < 0 && errno == EINTR)
                continue;
            return transferred;
        }
    }

    ssize_t file_write(FileHandle handle, const void* buffer, size_t size) {
        while (true) {
            ssize_t transferred = ::write(handle, buffer, size);
            if (transferred < 0 && errno == EINTR)
                continue;
            return transferred;
        }
    }

    ssize_t file_write_all(FileHandle handle, const void* buffer, size_t size,
        WriteFunction write) {
        const char* data = static_cast<const char*>(buffer);
        std::size_t pos = 0;
        while (pos < size) {
            ssize_t transferred = write(handle, data + pos, size - pos);
            if (transferred < 0)
                return -1;
            if (transferred == 0) {
                errno = ENOSPC;
                return -1;
            }
            pos += transferred;
        }
        return static_cast<ssize_t>(size);
    }

    bool file_advise_sequential(FileHandle handle) {
        return ::posix_fadvise(handle, 0, 0, POSIX_FADV_SEQUENTIAL) == 0;
    }

    std::size_t page_size() {
        long size = ::sysconf(_SC_PAGESIZE);
        if (size <= 0)
            return 4096;
        return static_cast<std::size_t>(size);
    }
}
