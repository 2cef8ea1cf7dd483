#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/timing/stopwatch.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/copy_engine/copy_engine.hpp"
#include "core/tree_walker/tree_walker.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>

using GIT = parcp::build_info::GitInfo;

constexpr auto git = parcp::build_info::get_git_info();

static auto
out_git_verse(const GIT& git)
-> void {
    fmt::print("parcp {}\n", git.commit_short);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
load_config(const parcp::args_parser::CLIArgs& args)
-> std::expected<parcp::infra::Config, std::string> {
    // 1. Загрузить из файла
    auto config_res = args.config_file
        ? parcp::infra::load_config_from_file(*args.config_file)
        : parcp::infra::load_config_from_file();
    if (!config_res) {
        return config_res;
    }
    auto config = *config_res;

    // 2. Переопределить из CLI (CLI имеет приоритет)
    config.merge_with(parcp::infra::config_from_cli(args));
    if (args.no_verify) config.verify = false;

    if (auto valid = config.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        parcp::infra::install_signal_handler();

        auto args_res = parcp::args_parser::parse_args(argc, argv);
        if (!args_res) {
            return args_res.error(); // --help или ошибка разбора
        }
        const auto& args = *args_res;

        if (args.version) {
            out_git_verse(git);
            return 0;
        }

        auto config_res = load_config(args);
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        const auto config = std::move(*config_res);

        if (config.log_level) {
            spdlog::set_level(spdlog::level::from_str(*config.log_level));
        }
        if (config.quiet) {
            spdlog::set_level(spdlog::level::warn);
        }
        spdlog::debug("parcp {} ({}), workers {}, buffer {} bytes, verify {}",
                      git.commit_short, git.branch, config.worker_count(),
                      config.transfer_buffer_size(), config.verify ? "yes" : "no");

        std::vector<std::filesystem::path> source_paths(args.sources.begin(), args.sources.end());
        std::filesystem::path destination_path(args.destination);

        parcp::core::CopyEngine engine(config);
        parcp::core::TreeWalker walker(config, engine);

        parcp::infra::Stopwatch stopwatch;
        auto result = walker.run(source_paths, destination_path);

        if (!result) {
            if (parcp::infra::is_interrupted()) {
                spdlog::warn("Interrupted by signal {}; partial copies were left in place",
                             parcp::infra::interrupt_signal());
            }
            spdlog::error("Copy operation failed: {}", result.error().message);
            return result.error().to_exit_code();
        }

        const auto& stats = *result;
        if (source_paths.size() > 1 || config.recursive) {
            spdlog::info("Files copied: {}", stats.files_copied);
            spdlog::info("Bytes copied: {} ({:.2f} MB)",
                         stats.bytes_copied,
                         stats.bytes_copied / 1024.0 / 1024.0);
            spdlog::info("Files skipped: {}", stats.files_skipped);
            spdlog::info("Errors: {}", stats.errors);
            if (auto elapsed = stopwatch.elapsed_seconds()) {
                spdlog::info("Time elapsed: {:.2f} seconds", *elapsed);
            }
        }

        return stats.errors > 0 ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
