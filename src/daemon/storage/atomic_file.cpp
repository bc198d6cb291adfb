#include "atomic_file.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <unistd.h>

namespace fs = std::filesystem;

std::expected<void, std::string> atomic_write(const std::string& path,
                                              std::span<const uint8_t> data) {
    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    std::string tmp = path + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        return std::unexpected(std::format("open {}: {}", tmp, std::strerror(errno)));
    }

    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = std::format("write {}: {}", tmp, std::strerror(errno));
            ::close(fd);
            ::unlink(tmp.c_str());
            return std::unexpected(err);
        }
        off += static_cast<size_t>(n);
    }

    if (::fsync(fd) < 0) {
        auto err = std::format("fsync {}: {}", tmp, std::strerror(errno));
        ::close(fd);
        ::unlink(tmp.c_str());
        return std::unexpected(err);
    }
    ::close(fd);

    if (std::rename(tmp.c_str(), path.c_str()) < 0) {
        auto err = std::format("rename {} -> {}: {}", tmp, path, std::strerror(errno));
        ::unlink(tmp.c_str());
        return std::unexpected(err);
    }
    return {};
}

std::expected<void, std::string> atomic_write(const std::string& path, std::string_view data) {
    return atomic_write(path, std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}
