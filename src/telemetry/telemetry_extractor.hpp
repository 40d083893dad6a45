/**
 * @file telemetry_extractor.hpp
 * @brief Split the executor's trailing telemetry record off a raw stderr stream.
 *
 * Wire contract: the executor appends
 *
 *     "\n" + <single-line JSON object> + optional "\n"
 *
 * to the guest's own stderr. Only that final line is ever considered, so
 * JSON-looking guest output earlier in the stream is left alone.
 */

#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace sandbox_harness {

/**
 * @brief Byte offsets of a located epilogue inside a stream.
 */
struct EpilogueSpan {
    size_t boundary{0};     ///< index of the '\n' that precedes the record
    size_t json_begin{0};   ///< index of the opening '{'
    size_t json_end{0};     ///< one past the closing '}'
};

/**
 * @brief Result of running a stream through the extractor.
 *
 * When found is false, record is TelemetryRecord{} and stderr_bytes is the
 * input verbatim.
 */
struct Extraction {
    Bytes stderr_bytes;
    TelemetryRecord record;
    bool found{false};
};

/**
 * @brief Find a candidate epilogue: a '\n', then a line starting with '{' and
 *        ending with '}', then at most one '\n', then end of stream.
 */
[[nodiscard]] std::optional<EpilogueSpan> locate_epilogue(std::string_view stream) noexcept;

/**
 * @brief Parse one JSON object into a TelemetryRecord.
 *
 * instructions, memory_peak_kb (unsigned integers) and limit_reached
 * (boolean) are required. Optional fields may be absent or null; when
 * present they must be unsigned integers (syscall_breakdown: an object of
 * unsigned integers). Unknown keys are ignored. nullopt on any violation.
 */
[[nodiscard]] std::optional<TelemetryRecord> parse_telemetry(std::string_view json_text);

/**
 * @brief Locate, parse and strip the epilogue from @p raw_stderr.
 *
 * A located but unparseable record counts as absent: the stream is returned
 * unmodified and the record is all-default.
 */
[[nodiscard]] Extraction extract_telemetry(std::string_view raw_stderr);

/**
 * @brief Render a record with the executor's wire field names.
 *
 * syscall_breakdown is emitted only when present.
 */
[[nodiscard]] nlohmann::json to_json(const TelemetryRecord& record);

}  // namespace sandbox_harness
