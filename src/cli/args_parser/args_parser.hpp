#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <expected>

namespace parcp::args_parser {

struct CLIArgs
{
    std::vector<std::string> sources;               // позиционные аргументы
    std::string destination;                        // последний путь
    std::optional<std::string> config_file;         // -c, --config
    bool recursive{false};                          // -r, --recursive
    bool follow_symlinks{false};                    // --follow-symlinks
    bool verify{false};                             // --verify
    bool no_verify{false};                          // --no-verify
    bool no_progress{false};                        // --no-progress
    bool quiet{false};                              // -q, --quiet
    bool verbose{false};                            // -v, --verbose
    bool fail_fast{false};                          // --fail-fast
    bool stop_on_error{false};                      // --stop-on-error
    bool no_preserve{false};                        // --no-preserve
    bool reserve{false};                            // --reserve
    bool version{false};                            // --version
    std::optional<std::uint32_t> threads;           // -t, --threads=N или последний позиционный
    std::optional<std::size_t> buffer_size;         // --buffer-size=BYTES
    std::optional<std::size_t> verify_chunk_size;   // --verify-chunk=BYTES
    std::optional<std::uint64_t> small_file_threshold; // --small-file=BYTES
    std::optional<std::uint32_t> io_timeout_ms;     // --io-timeout=MS
};

/// Разбирает аргументы командной строки (CLI11).
/// При --help или ошибке разбора возвращает код выхода процесса.
[[nodiscard]] auto parse_args(int argc, char const* const* argv)
    -> std::expected<CLIArgs, int>;

} // namespace parcp::args_parser
