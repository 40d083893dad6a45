/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <cmath>
#include <limits>
#include <optional>

#include <toml++/toml.hpp>

namespace sandbox_harness {

namespace {

enum class Bound : uint8_t { NonNegative, Positive };

/**
 * @brief Reads typed keys out of one [section], remembering the first bad value.
 *
 * Absent keys leave the target untouched so it keeps its default. A key
 * that is present with the wrong type or out of range is an error; nothing
 * is truncated or wrapped.
 */
class SectionReader {
public:
    SectionReader(toml::node_view<toml::node> section, std::string_view name,
                  std::optional<std::string>& error)
        : section_(section), name_(name), error_(error) {}

    template <typename T>
    void unsigned_int(std::string_view key, T& out, Bound bound,
                      uint64_t max = std::numeric_limits<T>::max()) {
        auto node = section_[key];
        if (!node || error_) return;
        auto value = node.value<int64_t>();
        if (!value || !node.is_integer()) {
            fail(key, "must be an integer");
            return;
        }
        if (*value < 0 || (bound == Bound::Positive && *value == 0)
            || static_cast<uint64_t>(*value) > max) {
            fail(key, "out of range (" + std::to_string(*value) + ", expected "
                      + (bound == Bound::Positive ? "1" : "0") + ".." + std::to_string(max) + ")");
            return;
        }
        out = static_cast<T>(*value);
    }

    void positive_real(std::string_view key, double& out) {
        auto node = section_[key];
        if (!node || error_) return;
        auto value = node.value<double>();
        if (!value) {
            fail(key, "must be a number");
            return;
        }
        if (!std::isfinite(*value) || *value <= 0.0) {
            fail(key, "must be a positive finite number");
            return;
        }
        out = *value;
    }

    void string(std::string_view key, std::string& out) {
        auto node = section_[key];
        if (!node || error_) return;
        auto value = node.value<std::string>();
        if (!value || !node.is_string()) {
            fail(key, "must be a string");
            return;
        }
        out = std::move(*value);
    }

    void path(std::string_view key, std::filesystem::path& out) {
        std::string text = out.string();
        string(key, text);
        out = text;
    }

private:
    void fail(std::string_view key, const std::string& what) {
        error_ = "[" + std::string{name_} + "] " + std::string{key} + " " + what;
    }

    toml::node_view<toml::node> section_;
    std::string_view name_;
    std::optional<std::string>& error_;
};

}  // anonymous namespace

ExecutionLimits Config::default_limits() const {
    ExecutionLimits out;
    out.instruction_limit = limits.instruction_limit;
    out.memory_limit_mb = limits.memory_limit_mb;
    out.timeout_seconds = limits.timeout_sec;
    return out;
}

Result<Config> load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return HarnessError{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;
        std::optional<std::string> error;

        for (const char* name : {"executor", "limits", "isolation", "staging", "batch", "logging"}) {
            if (auto section = tbl[name]; section && !section.is_table()) {
                return HarnessError{ErrorKind::Config, "[" + std::string{name} + "] must be a table"};
            }
        }

        // [executor]
        SectionReader executor(tbl["executor"], "executor", error);
        executor.string("engine", config.executor.engine);
        executor.string("image", config.executor.image);
        executor.string("binary_mount", config.executor.binary_mount);
        executor.string("container_prefix", config.executor.container_prefix);

        // [limits]
        SectionReader limits(tbl["limits"], "limits", error);
        limits.unsigned_int("instruction_limit", config.limits.instruction_limit, Bound::Positive);
        limits.unsigned_int("memory_limit_mb", config.limits.memory_limit_mb, Bound::Positive);
        limits.positive_real("timeout_sec", config.limits.timeout_sec);
        limits.unsigned_int("max_instruction_limit", config.limits.max_instruction_limit,
                            Bound::Positive);
        limits.unsigned_int("max_binary_size", config.limits.max_binary_size, Bound::Positive);
        limits.positive_real("max_timeout_sec", config.limits.max_timeout_sec);

        // [isolation]
        SectionReader isolation(tbl["isolation"], "isolation", error);
        isolation.unsigned_int("tmp_size_mb", config.isolation.tmp_size_mb, Bound::Positive);
        isolation.unsigned_int("var_size_mb", config.isolation.var_size_mb, Bound::Positive);

        // [staging]
        SectionReader staging(tbl["staging"], "staging", error);
        staging.path("dir", config.staging.dir);

        // [batch]
        SectionReader batch(tbl["batch"], "batch", error);
        batch.unsigned_int("max_concurrent", config.batch.max_concurrent, Bound::Positive,
                           BatchSettings::MAX_CONCURRENT);

        // [logging]
        SectionReader logging(tbl["logging"], "logging", error);
        logging.path("log_dir", config.logging.log_dir);
        logging.string("log_level", config.logging.log_level);

        if (error) return HarnessError{ErrorKind::Config, *error};

        if (config.limits.instruction_limit > config.limits.max_instruction_limit) {
            return HarnessError{ErrorKind::Config,
                                "[limits] instruction_limit exceeds max_instruction_limit"};
        }
        if (config.limits.timeout_sec > config.limits.max_timeout_sec) {
            return HarnessError{ErrorKind::Config, "[limits] timeout_sec exceeds max_timeout_sec"};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return HarnessError{ErrorKind::Config,
                            std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace sandbox_harness
