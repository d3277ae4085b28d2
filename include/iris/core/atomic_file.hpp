#pragma once

/** \file atomic_file.hpp
 *  \brief Whole-file read and atomic, durable whole-file replace.
 *
 * write_file_atomic (platform-correct):
 * - Write contents to a temporary sibling file (<name>.tmp.<unique>) in the same directory
 * - Flush stream buffers and ensure file-level durability:
 *     POSIX: fsync(tmp)
 *     Windows: FlushFileBuffers(tmp)
 * - Atomically replace the destination:
 *     POSIX: rename(2), replaces if exists
 *     Windows: MoveFileExW(tmp, dst, MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)
 * - Best-effort directory durability (fsync of the parent directory on POSIX)
 * - On failure the temporary file is removed and io_failed is returned. The
 *   destination is never truncated or written in place, so a reader sees either
 *   the complete prior contents or the complete new contents.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

#include "iris/error.hpp"

namespace iris::core {

auto write_file_atomic(const std::filesystem::path& dst, std::span<const std::uint8_t> bytes)
    -> std::expected<void, error>;

auto write_file_atomic(const std::filesystem::path& dst, std::string_view text)
    -> std::expected<void, error>;

/** \brief Read an entire file; not_found if it does not exist. */
auto read_file(const std::filesystem::path& p) -> std::expected<std::vector<std::uint8_t>, error>;

} // namespace iris::core
