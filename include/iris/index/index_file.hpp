#pragma once

/** \file index_file.hpp
 *  \brief Binary on-disk format of the vector index (embeddings.idx, format v1).
 *
 * Layout (all integers little-endian):
 * \code
 *   magic        "IRIS-IDX"                8 bytes
 *   format       u32  = 1
 *   flags        u32  (reserved, 0)
 *   version      u64  index version
 *   dimension    u32
 *   count        u32  number of records
 *   created_at   i64  unix milliseconds
 *   model_len    u32, model name bytes
 *   header_crc   u32  CRC-32C of every byte above
 *   section x2:  type u32 | unc u64 | comp u64 | crc u32 | payload[comp]
 *     type 1 = metadata: per record 4 x (u32 len + bytes): id, name, category, image_ref
 *     type 2 = vectors:  count * dimension float32
 * \endcode
 * A section is zstd-compressed when comp != unc. The CRC covers the
 * uncompressed contents. Trailing bytes are rejected.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "iris/error.hpp"
#include "iris/index/index.hpp"

namespace iris::index {

inline constexpr std::uint32_t kIndexFormatVersion = 1;

struct IndexFileOptions {
  int zstd_level{0};   /**< 0 = store uncompressed; 1..19 when built with zstd */
};

/** \brief Serialize an index. */
auto encode_index(const Index& index, const IndexFileOptions& options = {})
    -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief Parse and validate serialized bytes.
 *
 * Errors: corrupt_index for any magic, format, length, checksum or
 * decompression inconsistency, or a record violating Index invariants.
 */
auto decode_index(std::span<const std::uint8_t> bytes) -> std::expected<Index, core::error>;

/** \brief Version stored in an intact header, even when a section is damaged. */
auto peek_index_version(std::span<const std::uint8_t> bytes) -> std::optional<std::uint64_t>;

/** \brief encode_index + core::write_file_atomic. */
auto write_index_file(const std::filesystem::path& path, const Index& index,
                      const IndexFileOptions& options = {}) -> std::expected<void, core::error>;

/** \brief Read and decode; not_found when the file does not exist. */
auto read_index_file(const std::filesystem::path& path) -> std::expected<Index, core::error>;

} // namespace iris::index
