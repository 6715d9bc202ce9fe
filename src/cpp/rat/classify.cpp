#include "classify.hpp"

#include <sys/stat.h>

namespace {
    rat::FileKind kind_from_mode(mode_t mode) {
        if (S_ISREG(mode))
            return rat::FileKind::regular;
        if (S_ISFIFO(mode))
            return rat::FileKind::fifo;
        if (S_ISCHR(mode))
            return rat::FileKind::char_device;
        return rat::FileKind::other;
    }
}

namespace rat {
    FileInfo file_info(FileHandle handle) {
        FileInfo info;
        struct stat st = {};
        if (handle == kBadFileValue || ::fstat(handle, &st) != 0)
            return info;
        info.kind       = kind_from_mode(st.st_mode);
        info.directory  = S_ISDIR(st.st_mode);
        info.block_size = st.st_blksize > 0? st.st_blksize : 0;
        if (info.kind == FileKind::regular) {
            info.size = st.st_size > 0? st.st_size : 0;
            FileIdentity identity;
            identity.device = st.st_dev;
            identity.inode  = st.st_ino;
            info.identity = identity;
        }
        return info;
    }

    FileKind file_kind(FileHandle handle) {
        return file_info(handle).kind;
    }

    std::optional<FileIdentity> file_identity(FileHandle handle) {
        return file_info(handle).identity;
    }

    bool is_same_file(const FileInfo& input, const FileInfo& output) {
        if (!input.identity || !output.identity)
            return false;
        return *input.identity == *output.identity;
    }

    const char* kind_name(FileKind kind) {
        switch (kind) {
        case FileKind::regular:     return "regular";
        case FileKind::fifo:        return "fifo";
        case FileKind::char_device: return "char_device";
        case FileKind::other:       return "other";
        }
        return "other";
    }
}
