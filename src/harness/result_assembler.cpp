/**
 * @file result_assembler.cpp
 * @brief assemble_result() implementation.
 */

#include "harness/result_assembler.hpp"

namespace sandbox_harness {

ExecutionResult assemble_result(int exit_code,
                                Bytes stdout_bytes,
                                Extraction extraction,
                                WallTime wall_time) {
    return ExecutionResult{
        .exit_code = exit_code,
        .stdout_bytes = std::move(stdout_bytes),
        .stderr_bytes = std::move(extraction.stderr_bytes),
        .telemetry = std::move(extraction.record),
        .telemetry_present = extraction.found,
        .wall_time = wall_time,
    };
}

}  // namespace sandbox_harness
