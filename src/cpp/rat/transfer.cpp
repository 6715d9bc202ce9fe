#include "transfer.hpp"

#include <cerrno>
#include <algorithm>
#include <new>
#include <vector>

#include "log.hpp"

using namespace rat::details;

namespace {
    /*  copy_file_range caps a single call well below this anyway. Used when
        the input doesn't report a size, e.g. a growing file.
    */
    constexpr std::uint64_t kBulkCopySentinel = std::uint64_t(1) << 30;

    bool is_write_errno(int errno_code) {
        return errno_code == ENOSPC || errno_code == EFBIG
            || errno_code == EDQUOT || errno_code == EPIPE;
    }

    void log_debug(const std::string& message) {
        rat::log_emit(rat::LogLevel::debug, message);
    }
}

namespace rat {
    StreamHandle::StreamHandle(StreamHandle&& other) {
        *this = std::move(other);
    }

    StreamHandle& StreamHandle::operator=(StreamHandle&& other) {
        // the move closes a handle this one owned
        mOwned  = std::move(other.mOwned);
        mHandle = other.mHandle;
        mInfo   = other.mInfo;
        mName   = std::move(other.mName);
        other.mHandle = kBadFileValue;
        other.mInfo = FileInfo();
        return *this;
    }

    StreamHandle StreamHandle::open(const std::string& path, const char* mode,
        const std::string& name) {
        const std::string& display = name.empty()? path : name;
        FileHandle handle = file_open(path.c_str(), mode);
        if (handle == kBadFileValue)
            throw make_open_error(display, errno);
        StreamHandle stream;
        stream.mOwned.reset(handle);
        stream.mHandle  = handle;
        stream.mInfo    = file_info(handle);
        stream.mName    = display;
        return stream;
    }

    StreamHandle StreamHandle::borrow(FileHandle handle, const std::string& name) {
        StreamHandle stream;
        stream.mHandle  = handle;
        stream.mInfo    = file_info(handle);
        stream.mName    = name;
        return stream;
    }

    bool StreamHandle::close() {
        mHandle = kBadFileValue;
        if (!mOwned)
            return true;
        return file_close(mOwned.release());
    }

    const char* strategy_name(TransferStrategy strategy) {
        switch (strategy) {
        case TransferStrategy::none:                return "none";
        case TransferStrategy::bulk:                return "bulk";
        case TransferStrategy::buffered:            return "buffered";
        case TransferStrategy::bulk_then_buffered:  return "bulk_then_buffered";
        }
        return "none";
    }

    std::size_t default_buffer_size() {
        std::size_t page = page_size();
        if (kDefaultBufferSize % page != 0)
            return 16 * page;
        return kDefaultBufferSize;
    }

    std::size_t buffer_size_for(FileKind input, FileKind output) {
        if (input == FileKind::fifo || output == FileKind::fifo)
            return kPipeBufferSize;
        return default_buffer_size();
    }

    bool bulk_copy_unsupported(int errno_code) {
        // ENOTSUP and EOPNOTSUPP are the same value on linux, not everywhere
        if (errno_code == ENOSYS || errno_code == EOPNOTSUPP || errno_code == ENOTSUP)
            return true;
        // EXDEV: cross filesystem before linux 5.3
        // EBADF: output opened with O_APPEND
        // EINVAL: filesystem or handle type can't do it
        return errno_code == EXDEV || errno_code == EBADF
            || errno_code == EINVAL || errno_code == ETXTBSY;
    }

    BulkResult copy_bulk(const StreamHandle& input, const StreamHandle& output) {
        BulkResult result;
#ifdef __linux__
        const std::uint64_t size = input.info().size;
        while (true) {
            std::uint64_t request = kBulkCopySentinel;
            if (size > result.copied)
                request = std::min(size - result.copied, kBulkCopySentinel);
            ssize_t copied = ::copy_file_range(input.get(), nullptr,
                output.get(), nullptr, request, 0);
            if (copied < 0) {
                int errno_code = errno;
                if (errno_code == EINTR)
                    continue;
                if (bulk_copy_unsupported(errno_code)) {
                    if (log_enabled(LogLevel::debug)) {
                        log_debug(input.name() + ": copy_file_range unsupported ("
                            + std::to_string(errno_code) + ") after "
                            + std::to_string(result.copied) + " bytes");
                    }
                    result.status = BulkStatus::unsupported;
                    return result;
                }
                if (is_write_errno(errno_code))
                    throw make_write_error(errno_code);
                throw make_read_error(input.name(), errno_code);
            }
            if (copied == 0) {
                // procfs and sysfs files report size 0 and copy nothing
                result.status = result.copied == 0?
                    BulkStatus::unsupported : BulkStatus::complete;
                return result;
            }
            result.copied += copied;
        }
#else
        return result;
#endif
    }

    std::uint64_t copy_buffered(const StreamHandle& input, const StreamHandle& output,
        std::size_t buffer_size, WriteFunction write) {
        if (buffer_size == 0)
            buffer_size = buffer_size_for(input.kind(), output.kind());
        // sized once, a growing buffer costs a reallocation on every doubling
        std::vector<char> buffer;
        if (buffer_size > buffer.max_size())
            throw make_read_error(input.name(), ENOMEM);
        try {
            buffer.resize(buffer_size);
        } catch (std::bad_alloc&) {
            throw make_read_error(input.name(), ENOMEM);
        }
        std::uint64_t total = 0;
        while (true) {
            ssize_t transferred = file_read(input.get(), &buffer[0], buffer.size());
            if (transferred < 0)
                throw make_read_error(input.name(), errno);
            if (transferred == 0)
                break;
            if (file_write_all(output.get(), &buffer[0], transferred, write) < 0)
                throw make_write_error(errno);
            total += transferred;
        }
        return total;
    }

    TransferResult transfer(StreamHandle input, const StreamHandle& output,
        const TransferOptions& options) {
        // closed when this returns or throws
        StreamHandle source = std::move(input);
        TransferResult result;

        if (is_same_file(source.info(), output.info())) {
            SameFileError error("input file is output file");
            error.path = source.name();
            throw error;
        }
        if (source.kind() == FileKind::regular)
            file_advise_sequential(source.get());

        bool bulk = options.bulk_copy
            && source.kind() == FileKind::regular
            && output.kind() == FileKind::regular;
        if (bulk) {
            BulkResult copied = copy_bulk(source, output);
            result.bytes = copied.copied;
            if (copied.status == BulkStatus::complete) {
                result.strategy = TransferStrategy::bulk;
                if (log_enabled(LogLevel::debug)) {
                    log_debug(source.name() + ": copy_file_range "
                        + std::to_string(result.bytes) + " bytes");
                }
                return result;
            }
            result.strategy = TransferStrategy::bulk_then_buffered;
        } else {
            result.strategy = TransferStrategy::buffered;
        }

        result.buffer_size = options.buffer_size != 0? options.buffer_size
            : buffer_size_for(source.kind(), output.kind());
        if (log_enabled(LogLevel::debug)) {
            log_debug(source.name() + ": " + kind_name(source.kind()) + " -> "
                + kind_name(output.kind()) + ", read/write with "
                + std::to_string(result.buffer_size) + " byte buffer");
        }
        result.bytes += copy_buffered(source, output, result.buffer_size, options.write);
        return result;
    }
}
