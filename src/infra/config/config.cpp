#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "cli/args_parser/args_parser.hpp"

namespace parcp::infra {
    void Config::merge_with(const Config& other) {
        if (other.threads) threads = other.threads;
        if (other.buffer_size) buffer_size = other.buffer_size;
        if (other.verify_chunk_size) verify_chunk_size = other.verify_chunk_size;
        if (other.small_file_threshold) small_file_threshold = other.small_file_threshold;
        if (other.progress_interval_ms) progress_interval_ms = other.progress_interval_ms;
        if (other.io_timeout_ms) io_timeout_ms = other.io_timeout_ms;
        if (other.log_level) log_level = other.log_level;

        if (other.recursive) recursive = true;
        if (other.follow_symlinks) follow_symlinks = true;
        if (other.verify) verify = true;
        if (other.fail_fast) fail_fast = true;
        if (other.reserve_blocks) reserve_blocks = true;
        if (other.quiet) quiet = true;
        // Эти флаги CLI может только выключить
        if (!other.progress) progress = false;
        if (!other.continue_on_error) continue_on_error = false;
        if (!other.preserve_metadata) preserve_metadata = false;

        if (!other.exclude_patterns.empty()) exclude_patterns = other.exclude_patterns;
        if (!other.include_patterns.empty()) include_patterns = other.include_patterns;
    }

    auto Config::validate() const -> std::expected<void, std::string> {
        if (threads && *threads == 0) {
            return std::unexpected(std::string("threads must be at least 1"));
        }
        if (buffer_size && *buffer_size == 0) {
            return std::unexpected(std::string("buffer_size must be positive"));
        }
        if (verify_chunk_size && *verify_chunk_size == 0) {
            return std::unexpected(std::string("verify_chunk_size must be positive"));
        }
        if (progress_interval_ms && *progress_interval_ms == 0) {
            return std::unexpected(std::string("progress_interval_ms must be positive"));
        }
        if (log_level && spdlog::level::from_str(*log_level) == spdlog::level::off
            && *log_level != "off") {
            return std::unexpected(fmt::format("unknown log_level '{}'", *log_level));
        }
        return {};
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".parcp.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "parcp" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "parcp" / "config.yaml");
            }
        }

        return paths;
    }

    static auto parse_config(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["threads"]) cfg.threads = config["threads"].as<std::uint32_t>();
            if (config["buffer_size"]) cfg.buffer_size = config["buffer_size"].as<std::size_t>();
            if (config["verify_chunk_size"]) cfg.verify_chunk_size = config["verify_chunk_size"].as<std::size_t>();
            if (config["small_file_threshold"]) cfg.small_file_threshold = config["small_file_threshold"].as<std::uint64_t>();
            if (config["progress_interval_ms"]) cfg.progress_interval_ms = config["progress_interval_ms"].as<std::uint32_t>();
            if (config["io_timeout_ms"]) cfg.io_timeout_ms = config["io_timeout_ms"].as<std::uint32_t>();

            if (config["recursive"]) cfg.recursive = config["recursive"].as<bool>();
            if (config["follow_symlinks"]) cfg.follow_symlinks = config["follow_symlinks"].as<bool>();
            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["fail_fast"]) cfg.fail_fast = config["fail_fast"].as<bool>();
            if (config["continue_on_error"]) cfg.continue_on_error = config["continue_on_error"].as<bool>();
            if (config["preserve_metadata"]) cfg.preserve_metadata = config["preserve_metadata"].as<bool>();
            if (config["reserve_blocks"]) cfg.reserve_blocks = config["reserve_blocks"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            if (config["exclude"]) {
                for (const auto& pat : config["exclude"]) {
                    cfg.exclude_patterns.push_back(pat.as<std::string>());
                }
            }
            if (config["include"]) {
                for (const auto& pat : config["include"]) {
                    cfg.include_patterns.push_back(pat.as<std::string>());
                }
            }

            if (auto valid = cfg.validate(); !valid) {
                return std::unexpected(fmt::format("Invalid config {}: {}", path.string(), valid.error()));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return parse_config(path);
        }

        // Файл не найден - возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    auto load_config_from_file(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return std::unexpected(fmt::format("Config file not found: {}", path.string()));
        }
        return parse_config(path);
    }

    auto config_from_cli(const parcp::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.threads = args.threads;
        cfg.buffer_size = args.buffer_size;
        cfg.verify_chunk_size = args.verify_chunk_size;
        cfg.small_file_threshold = args.small_file_threshold;
        cfg.io_timeout_ms = args.io_timeout_ms;
        cfg.recursive = args.recursive;
        cfg.follow_symlinks = args.follow_symlinks;
        cfg.verify = args.verify;
        cfg.progress = !args.no_progress;
        cfg.quiet = args.quiet;
        cfg.fail_fast = args.fail_fast;
        cfg.continue_on_error = !args.stop_on_error;
        cfg.preserve_metadata = !args.no_preserve;
        cfg.reserve_blocks = args.reserve;
        if (args.verbose) cfg.log_level = "debug";
        return cfg;
    }

} // namespace parcp::infra
