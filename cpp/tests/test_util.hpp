#pragma once

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include "zff/core/types.hpp"

namespace zff::test {

    // mkdtemp directory removed (one level deep) on destruction.
    class TempDir {
    public:
        TempDir() {
            char tmpl[] = "/tmp/zff_test_XXXXXX";
            const char* p = ::mkdtemp(tmpl);
            path_ = p != nullptr ? p : "";
        }

        ~TempDir() { remove_tree(path_); }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        [[nodiscard]] const std::string& path() const noexcept { return path_; }
        [[nodiscard]] std::string file(const std::string& name) const { return path_ + "/" + name; }

    private:
        static void remove_tree(const std::string& dir) {
            if (dir.empty()) {
                return;
            }
            if (DIR* d = ::opendir(dir.c_str())) {
                while (struct dirent* e = ::readdir(d)) {
                    const std::string name = e->d_name;
                    if (name == "." || name == "..") {
                        continue;
                    }
                    const std::string child = dir + "/" + name;
                    struct stat st{};
                    if (::lstat(child.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
                        remove_tree(child);
                    } else {
                        ::unlink(child.c_str());
                    }
                }
                ::closedir(d);
            }
            ::rmdir(dir.c_str());
        }

        std::string path_;
    };

    // Deterministic, effectively incompressible bytes.
    inline std::vector<zff::core::u8> pattern_bytes(std::size_t n, zff::core::u64 seed = 1) {
        std::vector<zff::core::u8> out(n);
        zff::core::u64 x = seed * 0x9E3779B97F4A7C15ull + 1;
        for (std::size_t i = 0; i < n; ++i) {
            x ^= x << 13;
            x ^= x >> 7;
            x ^= x << 17;
            out[i] = static_cast<zff::core::u8>(x >> 24);
        }
        return out;
    }

    inline std::string hex(const std::vector<zff::core::u8>& v) {
        static const char digits[] = "0123456789abcdef";
        std::string s;
        for (zff::core::u8 b : v) {
            s.push_back(digits[b >> 4]);
            s.push_back(digits[b & 0xF]);
        }
        return s;
    }

    inline void write_file(const std::string& path, const std::string& content) {
        if (FILE* f = std::fopen(path.c_str(), "wb")) {
            std::fwrite(content.data(), 1, content.size(), f);
            std::fclose(f);
        }
    }

    inline std::vector<zff::core::u8> read_file(const std::string& path) {
        std::vector<zff::core::u8> out;
        if (FILE* f = std::fopen(path.c_str(), "rb")) {
            zff::core::u8 buf[4096];
            std::size_t n = 0;
            while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
                out.insert(out.end(), buf, buf + n);
            }
            std::fclose(f);
        }
        return out;
    }

    inline void overwrite_file(const std::string& path, const std::vector<zff::core::u8>& data) {
        if (FILE* f = std::fopen(path.c_str(), "wb")) {
            std::fwrite(data.data(), 1, data.size(), f);
            std::fclose(f);
        }
    }

} // namespace zff::test
