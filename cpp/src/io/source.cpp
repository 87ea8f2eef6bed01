#include "zff/io/source.hpp"

#include <algorithm>
#include <cstring>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace zff::io {

using zff::core::Status;
using zff::core::StatusCode;
using zff::core::StatusDomain;

static Status io_error(int err, const char* what) noexcept {
    return zff::core::make_status(StatusDomain::External, StatusCode::Io, static_cast<u64>(err), what);
}

static Status read_fd(int fd, BufferMut out, u64* got) noexcept {
    if (got == nullptr || (out.len > 0 && out.data == nullptr)) {
        return zff::core::make_status(StatusDomain::External, StatusCode::Invalid);
    }
    *got = 0;
    while (*got < out.len) {
        const ssize_t n = ::read(fd, out.data + *got, static_cast<size_t>(out.len - *got));
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error(errno, "read");
        }
        if (n == 0) break; // EOF
        *got += static_cast<u64>(n);
    }
    return zff::core::ok_status();
}

// ============================================================================
// Byte sources
// ============================================================================

Status MemorySource::read(BufferMut out, u64* got) noexcept {
    if (got == nullptr) {
        return zff::core::make_status(StatusDomain::External, StatusCode::Invalid);
    }
    const u64 n = std::min<u64>(out.len, data_.len - pos_);
    if (n > 0) {
        std::memcpy(out.data, data_.data + pos_, static_cast<size_t>(n));
    }
    pos_ += n;
    *got = n;
    return zff::core::ok_status();
}

Status FdSource::read(BufferMut out, u64* got) noexcept {
    return read_fd(fd_, out, got);
}

PathSource::~PathSource() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

Status PathSource::open(const std::string& path) noexcept {
    if (fd_ >= 0) {
        return zff::core::make_status(StatusDomain::External, StatusCode::Invalid, 0, "already open");
    }
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        if (errno == ENOENT) {
            return zff::core::make_status(StatusDomain::External, StatusCode::NotFound, static_cast<u64>(errno));
        }
        return io_error(errno, "open");
    }
    fd_ = fd;
    return zff::core::ok_status();
}

Status PathSource::read(BufferMut out, u64* got) noexcept {
    if (fd_ < 0) {
        return zff::core::make_status(StatusDomain::External, StatusCode::Invalid, 0, "not open");
    }
    return read_fd(fd_, out, got);
}

// ============================================================================
// File sources
// ============================================================================

namespace {
    // Content owned by the source so the string can leave the file list.
    class OwnedStringSource final : public ByteSource {
    public:
        explicit OwnedStringSource(std::string data) : data_(std::move(data)) {}

        Status read(BufferMut out, u64* got) noexcept override {
            if (got == nullptr) {
                return zff::core::make_status(StatusDomain::External, StatusCode::Invalid);
            }
            const u64 n = std::min<u64>(out.len, data_.size() - pos_);
            if (n > 0) {
                std::memcpy(out.data, data_.data() + pos_, static_cast<size_t>(n));
            }
            pos_ += n;
            *got = n;
            return zff::core::ok_status();
        }

    private:
        std::string data_;
        u64 pos_{0};
    };

    std::string base_name(const std::string& path) {
        std::string p = path;
        while (p.size() > 1 && p.back() == '/') {
            p.pop_back();
        }
        const auto pos = p.find_last_of('/');
        return pos == std::string::npos ? p : p.substr(pos + 1);
    }
} // namespace

void MemoryFileSource::add(const FileEntry& entry, std::string content) {
    files_.emplace_back(entry, std::move(content));
}

Status MemoryFileSource::next(FileEntry* entry, std::unique_ptr<ByteSource>* content, bool* done) noexcept {
    if (entry == nullptr || content == nullptr || done == nullptr) {
        return zff::core::make_status(StatusDomain::External, StatusCode::Invalid);
    }
    if (pos_ >= files_.size()) {
        *done = true;
        return zff::core::ok_status();
    }
    *done = false;
    *entry = files_[pos_].first;
    *content = std::make_unique<OwnedStringSource>(files_[pos_].second);
    ++pos_;
    return zff::core::ok_status();
}

PathListFileSource::PathListFileSource(std::vector<std::string> roots) {
    // Stack pops from the back; push in reverse to keep caller order.
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
        stack_.push_back(Pending{*it, 0});
    }
}

Status PathListFileSource::expand(const std::string& dir, u64 number) noexcept {
    DIR* d = opendir(dir.c_str());
    if (d == nullptr) {
        return io_error(errno, "opendir");
    }
    std::vector<std::string> names;
    errno = 0;
    while (struct dirent* e = readdir(d)) {
        if (std::strcmp(e->d_name, ".") == 0 || std::strcmp(e->d_name, "..") == 0) {
            continue;
        }
        names.emplace_back(e->d_name);
    }
    const int err = errno;
    closedir(d);
    if (err != 0) {
        return io_error(err, "readdir");
    }
    std::sort(names.begin(), names.end());
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        stack_.push_back(Pending{dir + "/" + *it, number});
    }
    return zff::core::ok_status();
}

Status PathListFileSource::next(FileEntry* entry, std::unique_ptr<ByteSource>* content, bool* done) noexcept {
    if (entry == nullptr || content == nullptr || done == nullptr) {
        return zff::core::make_status(StatusDomain::External, StatusCode::Invalid);
    }
    if (stack_.empty()) {
        *done = true;
        return zff::core::ok_status();
    }
    *done = false;
    const Pending p = stack_.back();
    stack_.pop_back();

    struct stat st;
    if (lstat(p.path.c_str(), &st) != 0) {
        return io_error(errno, "lstat");
    }

    const u64 number = next_number_++;
    FileEntry e{};
    e.parent = p.parent;
    e.name = base_name(p.path);
    e.metadata["mode"] = std::to_string(static_cast<unsigned long long>(st.st_mode));
    e.metadata["uid"] = std::to_string(static_cast<unsigned long long>(st.st_uid));
    e.metadata["gid"] = std::to_string(static_cast<unsigned long long>(st.st_gid));
    e.metadata["size"] = std::to_string(static_cast<long long>(st.st_size));
    e.metadata["inode"] = std::to_string(static_cast<unsigned long long>(st.st_ino));
    e.metadata["atime"] = std::to_string(static_cast<long long>(st.st_atime));
    e.metadata["mtime"] = std::to_string(static_cast<long long>(st.st_mtime));
    e.metadata["ctime"] = std::to_string(static_cast<long long>(st.st_ctime));

    if (S_ISDIR(st.st_mode)) {
        e.type = zff::core::FileType::Directory;
        *content = std::make_unique<OwnedStringSource>(std::string());
        const Status s = expand(p.path, number);
        if (!zff::core::is_ok(s)) return s;
    } else if (S_ISLNK(st.st_mode)) {
        e.type = zff::core::FileType::Symlink;
        std::string target(4096, '\0');
        const ssize_t n = readlink(p.path.c_str(), target.data(), target.size());
        if (n < 0) {
            return io_error(errno, "readlink");
        }
        target.resize(static_cast<size_t>(n));
        *content = std::make_unique<OwnedStringSource>(std::move(target));
    } else if (S_ISREG(st.st_mode)) {
        const std::pair<u64, u64> key{static_cast<u64>(st.st_dev), static_cast<u64>(st.st_ino)};
        const auto it = st.st_nlink > 1 ? inodes_.find(key) : inodes_.end();
        if (it != inodes_.end()) {
            e.type = zff::core::FileType::Hardlink;
            *content = std::make_unique<OwnedStringSource>(std::to_string(static_cast<unsigned long long>(it->second)));
        } else {
            if (st.st_nlink > 1) {
                inodes_[key] = number;
            }
            e.type = zff::core::FileType::File;
            auto src = std::make_unique<PathSource>();
            const Status s = src->open(p.path);
            if (!zff::core::is_ok(s)) return s;
            *content = std::move(src);
        }
    } else {
        e.type = zff::core::FileType::Special;
        *content = std::make_unique<OwnedStringSource>(std::string());
    }

    *entry = std::move(e);
    return zff::core::ok_status();
}

} // namespace zff::io
