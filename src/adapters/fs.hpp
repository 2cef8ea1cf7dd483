#pragma once

#include <filesystem>
#include <expected>
#include <cstddef>
#include <cstdint>
#include <span>
#include <sys/types.h>
#include "infra/error_handler/error.hpp"

namespace parcp::adapters::fs {

// RAII-владелец POSIX дескриптора. Только перемещение.
class FileHandle {
public:
    FileHandle() = default;
    FileHandle(int fd, std::filesystem::path path);
    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    [[nodiscard]] auto fd() const -> int { return fd_; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto is_open() const -> bool { return fd_ >= 0; }

private:
    void close_();

    int fd_ = -1;
    std::filesystem::path path_;
};

struct FileIdentity {
    dev_t device = 0;
    ino_t inode = 0;
    std::uint64_t size = 0;
    mode_t mode = 0;
};

// Открытие источника только на чтение. ENOENT -> InputNotFound
[[nodiscard]] auto open_source(const std::filesystem::path& path)
    -> std::expected<FileHandle, infra::Error>;

// Создание/усечение файла назначения только на запись. Ошибка -> OutputCreateFailed
[[nodiscard]] auto create_destination(const std::filesystem::path& path, mode_t mode = 0644)
    -> std::expected<FileHandle, infra::Error>;

[[nodiscard]] auto identify(const FileHandle& file)
    -> std::expected<FileIdentity, infra::Error>;

// Ставит длину файла ровно в size (ftruncate); reserve - дополнительно posix_fallocate
[[nodiscard]] auto set_length(const FileHandle& file, std::uint64_t size, bool reserve = false)
    -> std::expected<void, infra::Error>;

// Один pread по смещению; EINTR повторяется. Возвращает число прочитанных байт (0 = EOF)
[[nodiscard]] auto read_at(const FileHandle& file, std::span<std::byte> buffer, std::uint64_t offset)
    -> std::expected<std::size_t, infra::Error>;

// pwrite по смещению до полной записи блока
[[nodiscard]] auto write_all_at(const FileHandle& file, std::span<const std::byte> data, std::uint64_t offset)
    -> std::expected<void, infra::Error>;

// Права и время модификации источника -> назначение
[[nodiscard]] auto copy_metadata(const FileHandle& src, const FileHandle& dst)
    -> std::expected<void, infra::Error>;

} // namespace parcp::adapters::fs
