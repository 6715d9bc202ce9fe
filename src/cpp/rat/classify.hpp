#pragma once

#include <sys/types.h>

#include <cstdint>
#include <optional>

#include "basic_types.hpp"

namespace rat {
    /** What an open handle refers to, as far as copying is concerned. */
    enum class FileKind {
        regular,        ///< Regular file
        fifo,           ///< Pipe or named FIFO
        char_device,    ///< Terminal, /dev/null, /dev/zero, ...
        other           ///< Sockets, block devices, directories, unknown
    };

    /** Device and inode of a filesystem object. */
    struct FileIdentity {
        dev_t   device  = 0;
        ino_t   inode   = 0;

        bool operator==(const FileIdentity& other) const {
            return device == other.device && inode == other.inode;
        }
        bool operator!=(const FileIdentity& other) const {
            return !(*this == other);
        }
    };

    /** Everything the transfer engine wants to know about a handle.

        Filled from a single fstat(2). When fstat fails the defaults stand:
        kind other, no identity, size 0.
    */
    struct FileInfo {
        FileKind    kind        = FileKind::other;
        /** Only set for regular files. */
        std::optional<FileIdentity> identity;
        /** st_size. Meaningful for regular files only. */
        std::uint64_t size      = 0;
        /** st_blksize, 0 if unknown */
        std::size_t block_size  = 0;
        bool        directory   = false;
    };

    FileKind file_kind(FileHandle handle);

    /** Identity usable to detect copying a file onto itself.

        Pipes, sockets and character devices have none. A terminal can be
        both input and output of a copy, so devices never compare equal.
    */
    std::optional<FileIdentity> file_identity(FileHandle handle);

    FileInfo file_info(FileHandle handle);

    /** @return true when both infos carry an identity and they are equal */
    bool is_same_file(const FileInfo& input, const FileInfo& output);

    /** Short lower case name, for log messages. */
    const char* kind_name(FileKind kind);
}
