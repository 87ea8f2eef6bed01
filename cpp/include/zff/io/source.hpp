#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "zff/codec/buffer.hpp"
#include "zff/core/algorithms.hpp"
#include "zff/core/errors.hpp"

namespace zff::io {
    using zff::codec::BufferMut;
    using zff::codec::BufferView;
    using zff::core::u64;
    using zff::core::u8;

    // Pull interface over object or file content. read() fills up to out.len
    // bytes and reports the count; 0 means end of stream.
    class ByteSource {
    public:
        virtual ~ByteSource() = default;
        [[nodiscard]] virtual zff::core::Status read(BufferMut out, u64* got) noexcept = 0;
    };

    // Caller-owned memory; the view must outlive the source.
    class MemorySource final : public ByteSource {
    public:
        explicit MemorySource(BufferView data) noexcept : data_(data) {}
        [[nodiscard]] zff::core::Status read(BufferMut out, u64* got) noexcept override;

    private:
        BufferView data_;
        u64 pos_{0};
    };

    // Reads from a descriptor the caller owns (stdin, a pipe, an open file).
    class FdSource final : public ByteSource {
    public:
        explicit FdSource(int fd) noexcept : fd_(fd) {}
        [[nodiscard]] zff::core::Status read(BufferMut out, u64* got) noexcept override;

    private:
        int fd_;
    };

    class PathSource final : public ByteSource {
    public:
        PathSource() = default;
        ~PathSource() override;

        PathSource(const PathSource&) = delete;
        PathSource& operator=(const PathSource&) = delete;

        [[nodiscard]] zff::core::Status open(const std::string& path) noexcept;
        [[nodiscard]] zff::core::Status read(BufferMut out, u64* got) noexcept override;

    private:
        int fd_{-1};
    };

    // Metadata of one file of a logical object. parent refers to a file
    // number handed out earlier in the same object (0 for roots). Symlink
    // content is the target path, hardlink content the decimal file number
    // of the target.
    struct FileEntry {
        zff::core::FileType type{zff::core::FileType::File};
        u64 parent{0};
        std::string name;
        std::map<std::string, std::string> metadata;
    };

    // Pull iterator over the files of a logical object. Entries come in file
    // number order starting at 1; *done is set when the iterator is exhausted.
    class FileSource {
    public:
        virtual ~FileSource() = default;
        [[nodiscard]] virtual zff::core::Status next(FileEntry* entry,
            std::unique_ptr<ByteSource>* content,
            bool* done) noexcept = 0;
    };

    // Fixed list of (entry, content) pairs held in memory.
    class MemoryFileSource final : public FileSource {
    public:
        void add(const FileEntry& entry, std::string content);

        [[nodiscard]] zff::core::Status next(FileEntry* entry,
            std::unique_ptr<ByteSource>* content,
            bool* done) noexcept override;

    private:
        std::vector<std::pair<FileEntry, std::string>> files_;
        std::size_t pos_{0};
    };

    // Walks the given paths depth first (directories before their children,
    // entries sorted by name) without following symlinks. Regular files with
    // more than one link become hardlinks to the first occurrence. Metadata
    // keys: mode, uid, gid, size, inode, atime, mtime, ctime.
    class PathListFileSource final : public FileSource {
    public:
        explicit PathListFileSource(std::vector<std::string> roots);

        [[nodiscard]] zff::core::Status next(FileEntry* entry,
            std::unique_ptr<ByteSource>* content,
            bool* done) noexcept override;

    private:
        struct Pending {
            std::string path;
            u64 parent{0};
        };

        [[nodiscard]] zff::core::Status expand(const std::string& dir, u64 number) noexcept;

        std::vector<Pending> stack_;
        std::map<std::pair<u64, u64>, u64> inodes_; // (dev, ino) -> file number
        u64 next_number_{1};
    };

} // namespace zff::io
