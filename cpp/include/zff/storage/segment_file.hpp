#pragma once

#include <mutex>
#include <string>

#include "zff/codec/buffer.hpp"
#include "zff/core/errors.hpp"

namespace zff::storage {
    using zff::codec::BufferMut;
    using zff::codec::BufferView;

    // One segment file descriptor. Writers append; readers use positional
    // reads. In shared mode reads are serialized on the handle's mutex.
    class SegmentFile {
    public:
        SegmentFile() = default;
        ~SegmentFile();

        SegmentFile(const SegmentFile&) = delete;
        SegmentFile& operator=(const SegmentFile&) = delete;

        // Fails Io with errno EEXIST if the file is already there.
        [[nodiscard]] zff::core::Status create(const std::string& path) noexcept;
        [[nodiscard]] zff::core::Status open_read(const std::string& path) noexcept;

        [[nodiscard]] zff::core::Status write_all(BufferView data) noexcept;

        // Malformed("truncated") if the file ends before out.len bytes.
        [[nodiscard]] zff::core::Status read_at(zff::core::u64 offset, BufferMut out) const noexcept;

        [[nodiscard]] zff::core::Status size(zff::core::u64* out) const noexcept;
        [[nodiscard]] zff::core::Status sync() noexcept;
        [[nodiscard]] zff::core::Status close() noexcept;

        void set_shared(bool shared) noexcept { shared_ = shared; }

        [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
        [[nodiscard]] const std::string& path() const noexcept { return path_; }
        [[nodiscard]] zff::core::u64 written() const noexcept { return written_; }

    private:
        [[nodiscard]] zff::core::Status read_locked(zff::core::u64 offset, BufferMut out) const noexcept;

        int fd_{-1};
        std::string path_;
        zff::core::u64 written_{0};
        bool shared_{false};
        mutable std::mutex mu_;
    };

    // "<base>.z01", "<base>.z02", ... (at least two digits).
    [[nodiscard]] std::string segment_path(const std::string& base, zff::core::u64 segment_number);

    // Final path component, used as the file name hint in segment tables.
    [[nodiscard]] std::string path_file_name(const std::string& path);

} // namespace zff::storage
