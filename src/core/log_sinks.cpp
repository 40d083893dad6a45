/**
 * @file log_sinks.cpp
 * @brief Log sink implementations.
 */

#include "core/log_sinks.hpp"

#include <iostream>
#include <system_error>

namespace sandbox_harness {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                           const std::string& prefix,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    auto path = file_path(0);
    auto existing = std::filesystem::file_size(path, ec);
    current_size_ = ec ? 0 : existing;
    current_file_.open(path, std::ios::app);
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::file_path(uint32_t index) const {
    if (index == 0) return log_dir_ / (prefix_ + ".ndjson");
    return log_dir_ / (prefix_ + "." + std::to_string(index) + ".ndjson");
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed();
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed() {
    if (current_size_ < max_file_size_bytes_) return;

    current_file_.close();

    // Shift <prefix>.(N-1) -> <prefix>.N, dropping the oldest.
    std::error_code ec;
    if (max_files_ > 0) {
        std::filesystem::remove(file_path(max_files_), ec);
        for (uint32_t i = max_files_; i > 1; --i) {
            std::filesystem::rename(file_path(i - 1), file_path(i), ec);
        }
        std::filesystem::rename(file_path(0), file_path(1), ec);
    } else {
        std::filesystem::remove(file_path(0), ec);
    }

    current_file_.open(file_path(0), std::ios::trunc);
    current_size_ = 0;
}

// ── StderrSink ───────────────────────────────

void StderrSink::write(std::string_view json_line) {
    std::cerr << json_line << '\n';
}

void StderrSink::flush() {
    std::cerr.flush();
}

// ── MemorySink ───────────────────────────────

void MemorySink::write(std::string_view json_line) {
    std::lock_guard lock(mutex_);
    lines_.emplace_back(json_line);
}

std::vector<std::string> MemorySink::lines() const {
    std::lock_guard lock(mutex_);
    return lines_;
}

}  // namespace sandbox_harness
