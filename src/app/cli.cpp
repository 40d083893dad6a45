/**
 * @file cli.cpp
 * @brief sandbox_run argument parsing.
 */

#include "app/cli.hpp"

#include <charconv>
#include <limits>

namespace sandbox_harness {

void print_usage(std::ostream& out) {
    out << "Usage: sandbox_run [OPTIONS] <binary> [<binary>...]\n"
        << "  --config <path>      Configuration file (TOML)\n"
        << "  --limit <n>          Instruction limit (default 10000000)\n"
        << "  --memory <mb>        Memory limit in MB (default 256)\n"
        << "  --timeout <sec>      Wall-clock timeout in seconds (default 30)\n"
        << "  --stdin-file <path>  Bytes fed to every binary's stdin\n"
        << "  --image <name>       Executor image\n"
        << "  --engine <cmd>       Container engine CLI\n"
        << "  --log-level <lvl>    debug, info, warn or error\n"
        << "  --json               One JSON report per binary\n"
        << "  --check              Check the container engine is reachable and exit\n"
        << "  --help, -h           Show this help message\n";
}

std::optional<uint64_t> parse_unsigned(std::string_view text, uint64_t max) {
    uint64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end || value > max) return std::nullopt;
    return value;
}

std::optional<double> parse_seconds(std::string_view text) {
    double value = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

std::optional<CLIArgs> parse_args(const std::vector<std::string>& args, std::ostream& errors) {
    CLIArgs out;
    auto invalid = [&errors](const std::string& option, const std::string& value) {
        errors << "Invalid value for " << option << ": " << value << "\n";
        return std::nullopt;
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();
        if (arg == "--config" && has_value) {
            out.config_path = args[++i];
        } else if (arg == "--limit" && has_value) {
            out.instruction_limit = parse_unsigned(args[++i], std::numeric_limits<uint64_t>::max());
            if (!out.instruction_limit) return invalid(arg, args[i]);
        } else if (arg == "--memory" && has_value) {
            auto mb = parse_unsigned(args[++i], std::numeric_limits<uint32_t>::max());
            if (!mb) return invalid(arg, args[i]);
            out.memory_limit_mb = static_cast<uint32_t>(*mb);
        } else if (arg == "--timeout" && has_value) {
            out.timeout_sec = parse_seconds(args[++i]);
            if (!out.timeout_sec) return invalid(arg, args[i]);
        } else if (arg == "--stdin-file" && has_value) {
            out.stdin_file = args[++i];
        } else if (arg == "--image" && has_value) {
            out.image = args[++i];
        } else if (arg == "--engine" && has_value) {
            out.engine = args[++i];
        } else if (arg == "--log-level" && has_value) {
            out.log_level = args[++i];
        } else if (arg == "--json") {
            out.json = true;
        } else if (arg == "--check") {
            out.check = true;
        } else if (arg == "--help" || arg == "-h") {
            out.help = true;
        } else if (arg.starts_with("--")) {
            errors << "Unknown or incomplete option: " << arg << "\n";
            return std::nullopt;
        } else {
            out.binaries.emplace_back(arg);
        }
    }
    return out;
}

}  // namespace sandbox_harness
