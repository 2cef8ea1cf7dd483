#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fmt/core.h>

namespace parcp::args_parser {

namespace {

// "parcp in out 8": последний позиционный аргумент из цифр, которого нет на диске, - число воркеров
auto take_trailing_threads(std::vector<std::string>& paths) -> std::optional<std::uint32_t> {
    if (paths.size() < 3) return std::nullopt;

    const auto& last = paths.back();
    if (last.empty() || !std::all_of(last.begin(), last.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    std::error_code ec;
    if (std::filesystem::exists(last, ec)) return std::nullopt;

    std::uint32_t value = 0;
    auto [ptr, err] = std::from_chars(last.data(), last.data() + last.size(), value);
    if (err != std::errc{} || ptr != last.data() + last.size()) return std::nullopt;

    paths.pop_back();
    return value;
}

} // namespace

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int> {
    CLIArgs args;
    std::vector<std::string> paths;

    CLI::App app{"parcp - copy large files with concurrent positional I/O"};

    app.add_option("paths", paths, "SOURCE... DEST [THREADS]");
    app.add_option("-c,--config", args.config_file, "YAML config file");
    app.add_option("-t,--threads", args.threads, "Number of copy workers")
        ->check(CLI::Range(1u, 4096u));
    app.add_option("--buffer-size", args.buffer_size, "Per-worker transfer buffer, bytes")
        ->check(CLI::PositiveNumber);
    app.add_option("--verify-chunk", args.verify_chunk_size, "Verification chunk, bytes")
        ->check(CLI::PositiveNumber);
    app.add_option("--small-file", args.small_file_threshold,
                   "Files below this size are copied by one worker, bytes");
    app.add_option("--io-timeout", args.io_timeout_ms,
                   "Limit for a single positional read/write, ms (0 = none)");

    app.add_flag("-r,--recursive", args.recursive, "Copy directories recursively");
    app.add_flag("--follow-symlinks", args.follow_symlinks, "Copy symlink targets while recursing");
    auto* verify = app.add_flag("--verify", args.verify, "Compare source and destination after copy");
    app.add_flag("--no-verify", args.no_verify, "Skip verification")->excludes(verify);
    app.add_flag("--no-progress", args.no_progress, "Do not render progress");
    app.add_flag("-q,--quiet", args.quiet, "Only report warnings and errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("--fail-fast", args.fail_fast, "Cancel remaining workers after the first failure");
    app.add_flag("--stop-on-error", args.stop_on_error, "Stop a batch after the first failed file");
    app.add_flag("--no-preserve", args.no_preserve, "Do not copy permissions and modification time");
    app.add_flag("--reserve", args.reserve, "Reserve destination blocks before copying");
    app.add_flag("--version", args.version, "Print build information");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }

    if (args.version) {
        return args;
    }

    if (auto threads = take_trailing_threads(paths)) {
        if (*threads == 0) {
            fmt::print(stderr, "THREADS must be at least 1\n");
            return std::unexpected(1);
        }
        if (!args.threads) args.threads = threads;
    }
    if (paths.size() < 2) {
        fmt::print(stderr, "Usage: {} [OPTIONS] SOURCE... DEST [THREADS]\n", argv[0]);
        return std::unexpected(1);
    }

    args.destination = paths.back();
    paths.pop_back();
    args.sources = std::move(paths);
    return args;
}

} // namespace parcp::args_parser
