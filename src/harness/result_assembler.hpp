/**
 * @file result_assembler.hpp
 * @brief Merge raw process output and extracted telemetry into an ExecutionResult.
 */

#pragma once

#include "core/types.hpp"
#include "telemetry/telemetry_extractor.hpp"

namespace sandbox_harness {

/**
 * @brief Pure merge; no I/O and no failure modes.
 *
 * The telemetry record is taken as-is from @p extraction, which is already
 * all-default when the executor emitted nothing usable.
 */
[[nodiscard]] ExecutionResult assemble_result(int exit_code,
                                              Bytes stdout_bytes,
                                              Extraction extraction,
                                              WallTime wall_time);

}  // namespace sandbox_harness
