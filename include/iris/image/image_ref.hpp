#pragma once

/** \file image_ref.hpp
 *  \brief Image references: a local file or a remote http(s) URL.
 *
 * A raw reference string is resolved once, at the boundary, into an ImageRef.
 * Everything downstream dispatches on the variant alternative.
 *
 * canonical_key() is the identity used by the image cache:
 * - local: "file:" + absolute, lexically normalized path (symlinks resolved when the file exists)
 * - remote: "url:" + URL with lowercase scheme/host, default port removed,
 *   empty path replaced by "/", fragment dropped
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

#include "iris/error.hpp"

namespace iris::image {

struct LocalRef {
  std::filesystem::path path;
};

struct RemoteRef {
  std::string url;      /**< normalized URL */
  std::string scheme;   /**< "http" | "https" */
  std::string host;     /**< lowercase host, no port */
};

using ImageRef = std::variant<LocalRef, RemoteRef>;

/** \brief Resolve a raw reference string.
 *
 * Strings starting with http:// or https:// (case-insensitive) are remote;
 * "file://" prefixes are stripped; anything else is a filesystem path.
 * Empty input, other URL schemes, and URLs without a host are invalid_parameter.
 */
auto parse_image_ref(std::string_view raw) -> std::expected<ImageRef, core::error>;

/** \brief Stable cache identity of a resolved reference. */
auto canonical_key(const ImageRef& ref) -> std::string;

/** \brief Human-readable form for logs and error messages. */
auto describe(const ImageRef& ref) -> std::string;

[[nodiscard]] inline auto is_remote(const ImageRef& ref) noexcept -> bool {
  return std::holds_alternative<RemoteRef>(ref);
}

} // namespace iris::image
