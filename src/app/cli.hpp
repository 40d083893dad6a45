/**
 * @file cli.hpp
 * @brief Command-line parsing for sandbox_run.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_harness {

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<uint64_t> instruction_limit;
    std::optional<uint32_t> memory_limit_mb;
    std::optional<double> timeout_sec;
    std::optional<std::filesystem::path> stdin_file;
    std::string image;
    std::string engine;
    std::string log_level;
    bool json = false;
    bool check = false;
    bool help = false;
    std::vector<std::filesystem::path> binaries;
};

void print_usage(std::ostream& out);

/**
 * @brief Parse arguments (without the program name).
 *
 * Numeric options must be plain decimal numbers that fit their field; a
 * sign, trailing characters or an out-of-range value rejects the whole
 * command line. Problems are described on @p errors.
 */
std::optional<CLIArgs> parse_args(const std::vector<std::string>& args, std::ostream& errors);

/// Unsigned decimal that fits in [0, max]; nullopt otherwise.
[[nodiscard]] std::optional<uint64_t> parse_unsigned(std::string_view text, uint64_t max);

/// Decimal or scientific number consuming all of @p text.
[[nodiscard]] std::optional<double> parse_seconds(std::string_view text);

}  // namespace sandbox_harness
