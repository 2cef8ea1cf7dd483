#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include "infra/config/config.hpp"

namespace parcp::test {

// Временный каталог на время теста
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "parcp-test-XXXXXX").string();
        if (!::mkdtemp(pattern.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto operator/(const std::string& name) const -> std::filesystem::path { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline auto random_bytes(std::size_t size, std::uint64_t seed = 42) -> std::vector<char> {
    std::mt19937_64 rng(seed);
    std::vector<char> data(size);
    std::size_t i = 0;
    while (i + 8 <= size) {
        const auto word = rng();
        for (int b = 0; b < 8; ++b) data[i++] = static_cast<char>((word >> (b * 8)) & 0xff);
    }
    while (i < size) data[i++] = static_cast<char>(rng() & 0xff);
    return data;
}

inline void write_file(const std::filesystem::path& path, const std::vector<char>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) throw std::runtime_error("write_file failed: " + path.string());
}

inline void write_text(const std::filesystem::path& path, const std::string& text) {
    write_file(path, std::vector<char>(text.begin(), text.end()));
}

inline auto read_file(const std::filesystem::path& path) -> std::vector<char> {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("read_file failed: " + path.string());
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Конфиг для тестов: без прогресса в терминал
inline auto quiet_config(std::uint32_t threads) -> infra::Config {
    infra::Config cfg;
    cfg.threads = threads;
    cfg.progress = false;
    return cfg;
}

} // namespace parcp::test
