#include "fs.hpp"

#include <cerrno>
#include <cstring>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace parcp::adapters::fs {

FileHandle::FileHandle(int fd, std::filesystem::path path)
    : fd_(fd), path_(std::move(path)) {}

FileHandle::~FileHandle() {
    close_();
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_))
{
    other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        close_();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

void FileHandle::close_() {
    if (fd_ >= 0) {
        if (::close(fd_) != 0) {
            const int err = errno;
            spdlog::warn("close({}) failed: {}", path_.string(), std::strerror(err));
        }
        fd_ = -1;
    }
}

auto open_source(const std::filesystem::path& path)
    -> std::expected<FileHandle, infra::Error>
{
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        const int err = errno;
        const auto code = err == ENOENT ? infra::ErrorCode::InputNotFound : infra::ErrorCode::IOError;
        return std::unexpected(infra::make_errno_error(code,
                               fmt::format("Cannot open source {}", path.string()), err));
    }
    return FileHandle{fd, path};
}

auto create_destination(const std::filesystem::path& path, mode_t mode)
    -> std::expected<FileHandle, infra::Error>
{
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd == -1) {
        const int err = errno;
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::OutputCreateFailed,
                               fmt::format("Cannot create destination {}", path.string()), err));
    }
    return FileHandle{fd, path};
}

auto identify(const FileHandle& file) -> std::expected<FileIdentity, infra::Error> {
    struct stat sb;
    if (::fstat(file.fd(), &sb) == -1) {
        const int err = errno;
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::IOError,
                               fmt::format("fstat failed for {}", file.path().string()), err));
    }
    return FileIdentity{
        .device = sb.st_dev,
        .inode = sb.st_ino,
        .size = static_cast<std::uint64_t>(sb.st_size),
        .mode = sb.st_mode
    };
}

auto set_length(const FileHandle& file, std::uint64_t size, bool reserve)
    -> std::expected<void, infra::Error>
{
    if (::ftruncate(file.fd(), static_cast<off_t>(size)) == -1) {
        const int err = errno;
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::OutputCreateFailed,
                               fmt::format("Cannot set length of {} to {}", file.path().string(), size),
                               err));
    }
    if (reserve && size > 0) {
        // posix_fallocate возвращает код ошибки, errno не трогает
        const int rc = ::posix_fallocate(file.fd(), 0, static_cast<off_t>(size));
        if (rc != 0) {
            return std::unexpected(infra::make_errno_error(infra::ErrorCode::OutputCreateFailed,
                                   fmt::format("Cannot reserve {} bytes for {}", size, file.path().string()),
                                   rc));
        }
    }
    return {};
}

auto read_at(const FileHandle& file, std::span<std::byte> buffer, std::uint64_t offset)
    -> std::expected<std::size_t, infra::Error>
{
    for (;;) {
        const ssize_t n = ::pread(file.fd(), buffer.data(), buffer.size(), static_cast<off_t>(offset));
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        const int err = errno;
        if (err != EINTR) {
            return std::unexpected(infra::make_errno_error(infra::ErrorCode::IOError,
                                   fmt::format("pread {} at offset {}", file.path().string(), offset),
                                   err));
        }
    }
}

auto write_all_at(const FileHandle& file, std::span<const std::byte> data, std::uint64_t offset)
    -> std::expected<void, infra::Error>
{
    while (!data.empty()) {
        const ssize_t n = ::pwrite(file.fd(), data.data(), data.size(), static_cast<off_t>(offset));
        if (n < 0) {
            const int err = errno;
            if (err == EINTR) continue;
            return std::unexpected(infra::make_errno_error(infra::ErrorCode::IOError,
                                   fmt::format("pwrite {} at offset {}", file.path().string(), offset),
                                   err));
        }
        if (n == 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::IOError,
                                   fmt::format("pwrite {} at offset {} wrote nothing",
                                               file.path().string(), offset)));
        }
        data = data.subspan(static_cast<std::size_t>(n));
        offset += static_cast<std::uint64_t>(n);
    }
    return {};
}

auto copy_metadata(const FileHandle& src, const FileHandle& dst)
    -> std::expected<void, infra::Error>
{
    struct stat sb;
    if (::fstat(src.fd(), &sb) == -1) {
        const int err = errno;
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::IOError,
                               fmt::format("fstat failed for {}", src.path().string()), err));
    }

    if (::fchmod(dst.fd(), sb.st_mode & 07777) == -1) {
        const int err = errno;
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::IOError,
                               fmt::format("Metadata copy failed (mode) for {}", dst.path().string()),
                               err));
    }

    // atime и mtime источника
    const timespec times[2] = {sb.st_atim, sb.st_mtim};
    if (::futimens(dst.fd(), times) == -1) {
        const int err = errno;
        return std::unexpected(infra::make_errno_error(infra::ErrorCode::IOError,
                               fmt::format("Metadata copy failed (times) for {}", dst.path().string()),
                               err));
    }
    return {};
}

} // namespace parcp::adapters::fs
