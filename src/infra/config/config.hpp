#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>
#include <expected>
#include <filesystem>

namespace parcp::args_parser {
    struct CLIArgs;
}

namespace parcp::infra {

inline constexpr std::uint32_t DEFAULT_THREADS = 12;
inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 1024 * 1024;             // 1 MiB на воркер
inline constexpr std::size_t DEFAULT_VERIFY_CHUNK_SIZE = 10 * 1024 * 1024;  // 10 MiB
inline constexpr std::uint64_t DEFAULT_SMALL_FILE_THRESHOLD = 1024 * 1024;  // ниже - один воркер
inline constexpr std::chrono::milliseconds DEFAULT_PROGRESS_INTERVAL{50};

struct Config {
    // I/O
    std::optional<std::uint32_t> threads;
    std::optional<std::size_t> buffer_size;          // bytes
    std::optional<std::size_t> verify_chunk_size;    // bytes
    std::optional<std::uint64_t> small_file_threshold;
    std::optional<std::uint32_t> progress_interval_ms;
    std::optional<std::uint32_t> io_timeout_ms;      // 0 = без лимита

    // Behavior
    bool recursive = false;
    bool follow_symlinks = false;
    bool verify = false;
    bool progress = true;
    bool quiet = false;
    bool fail_fast = false;
    bool continue_on_error = true;
    bool preserve_metadata = true;
    bool reserve_blocks = false;

    std::optional<std::string> log_level;

    // Paths
    std::vector<std::string> exclude_patterns;
    std::vector<std::string> include_patterns;

    // Слияние с другим Config (например, из CLI); other имеет приоритет
    void merge_with(const Config& other);

    // Текст ошибки, если значения вне допустимых границ
    [[nodiscard]] auto validate() const -> std::expected<void, std::string>;

    [[nodiscard]] auto worker_count() const -> std::uint32_t {
        return threads.value_or(DEFAULT_THREADS);
    }
    [[nodiscard]] auto transfer_buffer_size() const -> std::size_t {
        return buffer_size.value_or(DEFAULT_BUFFER_SIZE);
    }
    [[nodiscard]] auto verify_chunk() const -> std::size_t {
        return verify_chunk_size.value_or(DEFAULT_VERIFY_CHUNK_SIZE);
    }
    [[nodiscard]] auto small_file_limit() const -> std::uint64_t {
        return small_file_threshold.value_or(DEFAULT_SMALL_FILE_THRESHOLD);
    }
    [[nodiscard]] auto progress_interval() const -> std::chrono::milliseconds {
        return progress_interval_ms ? std::chrono::milliseconds(*progress_interval_ms)
                                    : DEFAULT_PROGRESS_INTERVAL;
    }
    [[nodiscard]] auto io_timeout() const -> std::chrono::milliseconds {
        return std::chrono::milliseconds(io_timeout_ms.value_or(0));
    }
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.parcp.yaml
///   2. $XDG_CONFIG_HOME/parcp/config.yaml
///   3. ~/.config/parcp/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Загружает конкретный файл; отсутствие файла здесь - ошибка.
[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const parcp::args_parser::CLIArgs& args) -> Config;

} // namespace parcp::infra
