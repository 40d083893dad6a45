/**
 * @file staged_payload.hpp
 * @brief Scoped temporary file holding the binary under test.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string_view>

namespace sandbox_harness {

/**
 * @brief Owns a uniquely named, owner-executable copy of a payload.
 *
 * The file is created with mkstemp (mode 0600, so private until the final
 * chmod to 0755), which keeps concurrent stagings in the same directory from
 * colliding. Move-only; the destructor unlinks the file, so a StagedPayload
 * held across a run guarantees cleanup on every exit path.
 */
class StagedPayload {
public:
    static constexpr std::string_view FILE_PREFIX = "sbx-payload-";

    /**
     * @brief Write @p payload into a fresh file under @p dir.
     *
     * An empty @p dir selects std::filesystem::temp_directory_path().
     * Fails with ErrorKind::Staging; no file is left behind on failure.
     */
    static Result<StagedPayload> create(std::string_view payload,
                                        const std::filesystem::path& dir = {});

    StagedPayload(StagedPayload&& other) noexcept;
    StagedPayload& operator=(StagedPayload&& other) noexcept;
    ~StagedPayload();

    StagedPayload(const StagedPayload&) = delete;
    StagedPayload& operator=(const StagedPayload&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] uint64_t size() const noexcept { return size_; }

    /// Remove the file now. Safe to call more than once.
    void release() noexcept;

private:
    StagedPayload(std::filesystem::path path, uint64_t size);

    std::filesystem::path path_;
    uint64_t size_{0};
};

}  // namespace sandbox_harness
