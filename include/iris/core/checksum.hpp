#pragma once

/** \file checksum.hpp
 *  \brief CRC-32C for on-disk section integrity and FNV-1a for cache file names.
 */

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace iris::core {

/** \brief Reflected CRC-32C (Castagnoli, polynomial 0x82F63B78). */
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

/** \brief 64-bit FNV-1a over a string. Not cryptographic. */
auto fnv1a64(std::string_view text) noexcept -> std::uint64_t;

/** \brief Lowercase, zero-padded 16-digit hex form of a 64-bit value. */
auto to_hex64(std::uint64_t v) -> std::string;

} // namespace iris::core
