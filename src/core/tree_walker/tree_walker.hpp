#pragma once

#include <filesystem>
#include <regex>
#include <vector>
#include <expected>
#include "core/copy_engine/copy_engine.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"

namespace parcp::core {

struct BatchStats {
    std::uint64_t files_copied = 0;
    std::uint64_t bytes_copied = 0;
    std::uint64_t files_skipped = 0;
    std::uint64_t errors = 0;
};

// Рекурсивный/пакетный обход: CopyEngine::copy_file один раз на каждый обычный файл.
// Каталоги назначения создаются раньше файлов внутри них.
class TreeWalker {
public:
    TreeWalker(const infra::Config& config, CopyEngine& engine);

    /// Несколько источников -> destination должен быть каталогом.
    /// Каталоги-источники копируются только при recursive.
    [[nodiscard]] auto run(const std::vector<std::filesystem::path>& sources,
                           const std::filesystem::path& destination)
        -> std::expected<BatchStats, infra::Error>;

    /// Содержимое src_root -> dst_root с сохранением относительных путей
    [[nodiscard]] auto copy_tree(const std::filesystem::path& src_root,
                                 const std::filesystem::path& dst_root)
        -> std::expected<BatchStats, infra::Error>;

private:
    [[nodiscard]] auto copy_one_(const std::filesystem::path& src,
                                 const std::filesystem::path& dst,
                                 BatchStats& stats) -> infra::VoidResult;
    [[nodiscard]] auto copy_tree_(const std::filesystem::path& src_root,
                                  const std::filesystem::path& dst_root,
                                  BatchStats& stats) -> infra::VoidResult;
    // Учитывает ошибку; возвращает её дальше, если пакет надо остановить
    [[nodiscard]] auto record_failure_(infra::Error&& err, BatchStats& stats) -> infra::VoidResult;

    bool should_exclude(const std::filesystem::path& path) const;
    bool should_include(const std::filesystem::path& path) const;

    const infra::Config& config_;
    CopyEngine& engine_;
    std::vector<std::regex> exclude_;
    std::vector<std::regex> include_;
};

} // namespace parcp::core
