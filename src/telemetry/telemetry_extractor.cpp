/**
 * @file telemetry_extractor.cpp
 * @brief Epilogue location, strict JSON decoding and stderr demultiplexing.
 */

#include "telemetry/telemetry_extractor.hpp"

namespace sandbox_harness {

namespace {

using json = nlohmann::json;

/// Field reader that remembers the first violation.
class FieldReader {
public:
    explicit FieldReader(const json& object) : object_(object) {}

    void required_u64(const char* key, uint64_t& out) { read_u64(key, out, true); }
    void optional_u64(const char* key, uint64_t& out) { read_u64(key, out, false); }

    void required_bool(const char* key, bool& out) {
        auto it = object_.find(key);
        if (it == object_.end() || !it->is_boolean()) {
            ok_ = false;
            return;
        }
        out = it->get<bool>();
    }

    void optional_breakdown(const char* key, std::optional<SyscallBreakdown>& out) {
        auto it = object_.find(key);
        if (it == object_.end() || it->is_null()) return;
        if (!it->is_object()) {
            ok_ = false;
            return;
        }
        SyscallBreakdown breakdown;
        for (const auto& entry : it->items()) {
            if (!entry.value().is_number_unsigned()) {
                ok_ = false;
                return;
            }
            breakdown.emplace(entry.key(), entry.value().get<uint64_t>());
        }
        out = std::move(breakdown);
    }

    [[nodiscard]] bool ok() const noexcept { return ok_; }

private:
    void read_u64(const char* key, uint64_t& out, bool required) {
        auto it = object_.find(key);
        if (it == object_.end() || it->is_null()) {
            if (required) ok_ = false;
            return;
        }
        if (!it->is_number_unsigned()) {
            ok_ = false;
            return;
        }
        out = it->get<uint64_t>();
    }

    const json& object_;
    bool ok_{true};
};

}  // anonymous namespace

std::optional<EpilogueSpan> locate_epilogue(std::string_view stream) noexcept {
    size_t end = stream.size();
    if (end > 0 && stream[end - 1] == '\n') --end;
    if (end == 0 || stream[end - 1] != '}') return std::nullopt;

    // The record line must be introduced by a line boundary.
    size_t boundary = stream.rfind('\n', end - 1);
    if (boundary == std::string_view::npos) return std::nullopt;

    size_t begin = boundary + 1;
    if (begin >= end - 1 || stream[begin] != '{') return std::nullopt;

    return EpilogueSpan{.boundary = boundary, .json_begin = begin, .json_end = end};
}

std::optional<TelemetryRecord> parse_telemetry(std::string_view json_text) {
    json parsed = json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

    TelemetryRecord record;
    FieldReader reader(parsed);

    reader.required_u64("instructions", record.instructions);
    reader.required_u64("memory_peak_kb", record.memory_peak_kb);
    reader.required_bool("limit_reached", record.limit_reached);

    reader.optional_u64("syscalls", record.syscalls);
    reader.optional_u64("syscall_cost", record.syscall_cost);
    reader.optional_breakdown("syscall_breakdown", record.syscall_breakdown);

    reader.optional_u64("memory_rss_kb", record.memory_rss_kb);
    reader.optional_u64("memory_hwm_kb", record.memory_hwm_kb);
    reader.optional_u64("memory_data_kb", record.memory_data_kb);
    reader.optional_u64("memory_stack_kb", record.memory_stack_kb);

    reader.optional_u64("io_read_bytes", record.io_read_bytes);
    reader.optional_u64("io_write_bytes", record.io_write_bytes);

    reader.optional_u64("guest_mmap_bytes", record.guest_mmap_bytes);
    reader.optional_u64("guest_mmap_peak", record.guest_mmap_peak);
    reader.optional_u64("guest_heap_bytes", record.guest_heap_bytes);

    if (!reader.ok()) return std::nullopt;
    return record;
}

Extraction extract_telemetry(std::string_view raw_stderr) {
    Extraction out;

    auto span = locate_epilogue(raw_stderr);
    if (span) {
        auto record = parse_telemetry(
            raw_stderr.substr(span->json_begin, span->json_end - span->json_begin));
        if (record) {
            out.stderr_bytes.assign(raw_stderr.data(), span->boundary);
            out.record = std::move(*record);
            out.found = true;
            return out;
        }
    }

    out.stderr_bytes.assign(raw_stderr.data(), raw_stderr.size());
    return out;
}

nlohmann::json to_json(const TelemetryRecord& record) {
    json j = {
        {"instructions", record.instructions},
        {"memory_peak_kb", record.memory_peak_kb},
        {"limit_reached", record.limit_reached},
        {"syscalls", record.syscalls},
        {"syscall_cost", record.syscall_cost},
        {"memory_rss_kb", record.memory_rss_kb},
        {"memory_hwm_kb", record.memory_hwm_kb},
        {"memory_data_kb", record.memory_data_kb},
        {"memory_stack_kb", record.memory_stack_kb},
        {"io_read_bytes", record.io_read_bytes},
        {"io_write_bytes", record.io_write_bytes},
        {"guest_mmap_bytes", record.guest_mmap_bytes},
        {"guest_mmap_peak", record.guest_mmap_peak},
        {"guest_heap_bytes", record.guest_heap_bytes},
    };
    if (record.syscall_breakdown) {
        j["syscall_breakdown"] = *record.syscall_breakdown;
    }
    return j;
}

}  // namespace sandbox_harness
