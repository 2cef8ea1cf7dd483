#include "tree_walker.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "infra/interrupt.hpp"

namespace parcp::core {

namespace {

auto compile_patterns(const std::vector<std::string>& patterns, std::string_view kind)
    -> std::vector<std::regex>
{
    std::vector<std::regex> compiled;
    for (const auto& pattern : patterns) {
        try {
            compiled.emplace_back(pattern);
        } catch (const std::regex_error& e) {
            spdlog::warn("Invalid {} pattern '{}': {}", kind, pattern, e.what());
        }
    }
    return compiled;
}

auto matches_any(const std::vector<std::regex>& patterns, const std::filesystem::path& path) -> bool {
    const auto name = path.filename().string();
    for (const auto& re : patterns) {
        if (std::regex_match(name, re)) return true;
    }
    return false;
}

} // namespace

TreeWalker::TreeWalker(const infra::Config& config, CopyEngine& engine)
    : config_(config)
    , engine_(engine)
    , exclude_(compile_patterns(config.exclude_patterns, "exclude"))
    , include_(compile_patterns(config.include_patterns, "include"))
{}

auto TreeWalker::run(const std::vector<std::filesystem::path>& sources,
                     const std::filesystem::path& destination)
    -> std::expected<BatchStats, infra::Error>
{
    BatchStats stats;
    std::error_code ec;
    const bool dest_is_dir = std::filesystem::is_directory(destination, ec);

    if (sources.size() > 1 && !dest_is_dir) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                               fmt::format("Target {} is not a directory", destination.string())));
    }

    for (const auto& src : sources) {
        if (infra::is_interrupted()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Cancelled, "User interrupted"));
        }

        if (!std::filesystem::exists(src, ec)) {
            auto res = record_failure_(infra::make_error(infra::ErrorCode::InputNotFound,
                                       fmt::format("Source does not exist: {}", src.string())), stats);
            if (!res) return std::unexpected(std::move(res.error()));
            continue;
        }

        if (std::filesystem::is_directory(src, ec)) {
            if (!config_.recursive) {
                spdlog::warn("Omitting directory {} (use -r)", src.string());
                ++stats.files_skipped;
                continue;
            }
            // cp -r: в существующий каталог кладём подкаталог с именем источника
            auto root = dest_is_dir ? destination / src.filename() : destination;
            if (auto res = copy_tree_(src, root, stats); !res) {
                return std::unexpected(std::move(res.error()));
            }
            continue;
        }

        if (auto res = copy_one_(src, destination, stats); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }

    return stats;
}

auto TreeWalker::copy_tree(const std::filesystem::path& src_root,
                           const std::filesystem::path& dst_root)
    -> std::expected<BatchStats, infra::Error>
{
    BatchStats stats;
    if (auto res = copy_tree_(src_root, dst_root, stats); !res) {
        return std::unexpected(std::move(res.error()));
    }
    return stats;
}

auto TreeWalker::copy_tree_(const std::filesystem::path& src_root,
                            const std::filesystem::path& dst_root,
                            BatchStats& stats) -> infra::VoidResult
{
    std::error_code ec;
    std::filesystem::create_directories(dst_root, ec);
    if (ec) {
        return record_failure_(infra::make_error(infra::ErrorCode::OutputCreateFailed,
                               fmt::format("Failed to create dir {}: {}", dst_root.string(), ec.message())),
                               stats);
    }

    auto options = std::filesystem::directory_options::none;
    if (config_.follow_symlinks) {
        options |= std::filesystem::directory_options::follow_directory_symlink;
    }

    std::error_code walk_ec;
    std::filesystem::recursive_directory_iterator it(src_root, options, walk_ec);
    if (walk_ec) {
        return record_failure_(infra::make_error(infra::ErrorCode::InputNotFound,
                               fmt::format("Cannot read directory {}: {}", src_root.string(), walk_ec.message())),
                               stats);
    }

    const std::filesystem::recursive_directory_iterator end{};
    for (; it != end; it.increment(walk_ec)) {
        if (walk_ec) break;
        if (infra::is_interrupted()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Cancelled, "User interrupted"));
        }

        const auto& entry = *it;
        // Лексически: ссылки не разворачиваем, путь назначения повторяет путь обхода
        const auto dst = dst_root / entry.path().lexically_relative(src_root);

        if (should_exclude(entry.path())) {
            if (entry.is_directory(ec)) it.disable_recursion_pending();
            ++stats.files_skipped;
            continue;
        }

        if (entry.is_symlink(ec) && !config_.follow_symlinks) {
            spdlog::debug("Skipping symlink {}", entry.path().string());
            ++stats.files_skipped;
            continue;
        }

        if (entry.is_directory(ec)) {
            std::filesystem::create_directories(dst, ec);
            if (ec) {
                it.disable_recursion_pending();
                auto res = record_failure_(infra::make_error(infra::ErrorCode::OutputCreateFailed,
                                           fmt::format("Failed to create dir {}: {}", dst.string(), ec.message())),
                                           stats);
                if (!res) return res;
            }
            continue;
        }

        if (!entry.is_regular_file(ec)) {
            spdlog::warn("Skipping non-file: {}", entry.path().string());
            ++stats.files_skipped;
            continue;
        }

        if (!should_include(entry.path())) {
            ++stats.files_skipped;
            continue;
        }

        if (auto res = copy_one_(entry.path(), dst, stats); !res) {
            return res;
        }
    }

    if (walk_ec) {
        return record_failure_(infra::make_error(infra::ErrorCode::IOError,
                               fmt::format("Directory walk failed under {}: {}",
                                           src_root.string(), walk_ec.message())),
                               stats);
    }
    return {};
}

auto TreeWalker::copy_one_(const std::filesystem::path& src,
                           const std::filesystem::path& dst,
                           BatchStats& stats) -> infra::VoidResult
{
    auto res = engine_.copy_file(src, dst);
    if (!res) {
        return record_failure_(std::move(res.error()), stats);
    }
    ++stats.files_copied;
    stats.bytes_copied += res->bytes_copied;
    return {};
}

auto TreeWalker::record_failure_(infra::Error&& err, BatchStats& stats) -> infra::VoidResult {
    ++stats.errors;
    auto logged = infra::log_and_return(std::move(err));
    if (logged.code == infra::ErrorCode::Cancelled || !config_.continue_on_error) {
        return std::unexpected(std::move(logged));
    }
    return {};
}

bool TreeWalker::should_exclude(const std::filesystem::path& path) const {
    return matches_any(exclude_, path);
}

bool TreeWalker::should_include(const std::filesystem::path& path) const {
    if (include_.empty()) return true;
    return matches_any(include_, path);
}

} // namespace parcp::core
