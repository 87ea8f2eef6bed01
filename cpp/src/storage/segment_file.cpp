#include "zff/storage/segment_file.hpp"

#include <cstdio>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace zff::storage {

using zff::core::Status;
using zff::core::StatusCode;
using zff::core::StatusDomain;
using zff::core::u64;

static Status io_error(int err, const char* what) noexcept {
    return zff::core::make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u64>(err), what);
}

SegmentFile::~SegmentFile() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Status SegmentFile::create(const std::string& path) noexcept {
    if (fd_ >= 0) {
        return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, 0, "already open");
    }
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        return io_error(errno, "create");
    }
    fd_ = fd;
    path_ = path;
    written_ = 0;
    return zff::core::ok_status();
}

Status SegmentFile::open_read(const std::string& path) noexcept {
    if (fd_ >= 0) {
        return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, 0, "already open");
    }
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        if (errno == ENOENT) {
            return zff::core::make_status(StatusDomain::Storage, StatusCode::NotFound, static_cast<u64>(errno));
        }
        return io_error(errno, "open");
    }
    fd_ = fd;
    path_ = path;
    written_ = 0;
    return zff::core::ok_status();
}

Status SegmentFile::write_all(BufferView data) noexcept {
    if (fd_ < 0) {
        return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, 0, "not open");
    }
    u64 done = 0;
    while (done < data.len) {
        const ssize_t n = ::write(fd_, data.data + done, static_cast<size_t>(data.len - done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error(errno, "write");
        }
        done += static_cast<u64>(n);
    }
    written_ += done;
    return zff::core::ok_status();
}

Status SegmentFile::read_locked(u64 offset, BufferMut out) const noexcept {
    u64 done = 0;
    while (done < out.len) {
        const ssize_t n = ::pread(fd_, out.data + done, static_cast<size_t>(out.len - done),
            static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error(errno, "read");
        }
        if (n == 0) break; // EOF
        done += static_cast<u64>(n);
    }
    if (done != out.len) {
        return zff::core::make_status(StatusDomain::Storage, StatusCode::Malformed, offset, "truncated");
    }
    return zff::core::ok_status();
}

Status SegmentFile::read_at(u64 offset, BufferMut out) const noexcept {
    if (fd_ < 0) {
        return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, 0, "not open");
    }
    if (out.len > 0 && out.data == nullptr) {
        return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (shared_) {
        std::lock_guard<std::mutex> lock(mu_);
        return read_locked(offset, out);
    }
    return read_locked(offset, out);
}

Status SegmentFile::size(u64* out) const noexcept {
    if (fd_ < 0 || out == nullptr) {
        return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    struct stat st;
    if (fstat(fd_, &st) != 0) {
        return io_error(errno, "stat");
    }
    *out = static_cast<u64>(st.st_size);
    return zff::core::ok_status();
}

Status SegmentFile::sync() noexcept {
    if (fd_ < 0) {
        return zff::core::make_status(StatusDomain::Storage, StatusCode::Invalid, 0, "not open");
    }
    if (fsync(fd_) != 0) {
        return io_error(errno, "fsync");
    }
    return zff::core::ok_status();
}

Status SegmentFile::close() noexcept {
    if (fd_ < 0) {
        return zff::core::ok_status();
    }
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        return io_error(errno, "close");
    }
    return zff::core::ok_status();
}

std::string segment_path(const std::string& base, u64 segment_number) {
    char ext[32];
    std::snprintf(ext, sizeof(ext), ".z%02llu", static_cast<unsigned long long>(segment_number));
    return base + ext;
}

std::string path_file_name(const std::string& path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

} // namespace zff::storage
