/**
 * @file staged_payload.cpp
 * @brief StagedPayload implementation over mkstemp/write/fsync/fchmod.
 */

#include "staging/staged_payload.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace sandbox_harness {

namespace {

HarnessError staging_error(const std::string& what, const std::filesystem::path& path, int err) {
    return HarnessError{ErrorKind::Staging,
                        what + " " + path.string() + ": " + std::strerror(err)};
}

/// Write the whole buffer, retrying short writes and EINTR. Returns 0 or errno.
int write_all(int fd, const char* data, size_t len) {
    size_t written = 0;
    while (written < len) {
        ssize_t n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        written += static_cast<size_t>(n);
    }
    return 0;
}

}  // anonymous namespace

Result<StagedPayload> StagedPayload::create(std::string_view payload,
                                            const std::filesystem::path& dir) {
    std::filesystem::path base = dir;
    if (base.empty()) {
        std::error_code ec;
        base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return HarnessError{ErrorKind::Staging,
                                "No temporary directory available: " + ec.message()};
        }
    }

    std::string pattern = (base / (std::string{FILE_PREFIX} + "XXXXXX")).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = ::mkostemp(name.data(), O_CLOEXEC);
    if (fd < 0) {
        return staging_error("Failed to create payload file in", base, errno);
    }

    std::filesystem::path path{name.data()};
    // From here on the file exists; every failure must unlink it.
    StagedPayload staged(path, payload.size());

    if (int err = write_all(fd, payload.data(), payload.size()); err != 0) {
        ::close(fd);
        return staging_error("Failed to write payload", path, err);
    }

    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return staging_error("Failed to sync payload", path, err);
    }

    if (::fchmod(fd, 0755) != 0) {
        int err = errno;
        ::close(fd);
        return staging_error("Failed to mark payload executable", path, err);
    }

    if (::close(fd) != 0) {
        return staging_error("Failed to close payload", path, errno);
    }

    return Result<StagedPayload>{std::move(staged)};
}

StagedPayload::StagedPayload(std::filesystem::path path, uint64_t size)
    : path_(std::move(path)), size_(size) {}

StagedPayload::StagedPayload(StagedPayload&& other) noexcept
    : path_(std::move(other.path_)), size_(other.size_) {
    other.path_.clear();
    other.size_ = 0;
}

StagedPayload& StagedPayload::operator=(StagedPayload&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        size_ = other.size_;
        other.path_.clear();
        other.size_ = 0;
    }
    return *this;
}

StagedPayload::~StagedPayload() {
    release();
}

void StagedPayload::release() noexcept {
    if (path_.empty()) return;
    ::unlink(path_.c_str());
    path_.clear();
}

}  // namespace sandbox_harness
