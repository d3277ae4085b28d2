#pragma once

/** \file image_acquirer.hpp
 *  \brief Resolve an image reference to decoded pixels, through the cache.
 *
 * Lookup order:
 *   1. memory tier (local entries are reused only while the file's mtime/size
 *      are unchanged)
 *   2. disk tier, remote references only (no network access)
 *   3. source: filesystem read or HTTP fetch; bytes must decode before anything
 *      is cached
 *
 * Thread-safety: acquire() is safe for concurrent calls. The acquirer holds no
 * lock while reading or fetching.
 */

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string_view>

#include "iris/error.hpp"
#include "iris/image/decoded_image.hpp"
#include "iris/image/http_fetcher.hpp"
#include "iris/image/image_cache.hpp"
#include "iris/image/image_ref.hpp"

namespace iris::image {

class ImageAcquirer {
public:
  /** \param max_local_bytes local files larger than this fail with invalid_image,
   *  the same bound FetchOptions::max_bytes puts on remote bodies. */
  ImageAcquirer(std::shared_ptr<HttpFetcher> fetcher, CacheOptions cache_options,
                std::size_t max_local_bytes = FetchOptions{}.max_bytes);

  /** \brief Parse and acquire a raw reference string. */
  auto acquire(std::string_view raw_ref,
               std::chrono::milliseconds budget = std::chrono::milliseconds::max())
      -> std::expected<DecodedImagePtr, core::error>;

  /** \brief Acquire an already resolved reference.
   *
   * \param budget time available for a network fetch; ignored for local files
   * Errors: not_found, network_error, invalid_image, io_failed.
   */
  auto acquire(const ImageRef& ref,
               std::chrono::milliseconds budget = std::chrono::milliseconds::max())
      -> std::expected<DecodedImagePtr, core::error>;

  [[nodiscard]] auto cache() noexcept -> ImageCache& { return cache_; }
  [[nodiscard]] auto cache() const noexcept -> const ImageCache& { return cache_; }

private:
  auto acquire_local(const LocalRef& ref, const std::string& key)
      -> std::expected<DecodedImagePtr, core::error>;
  auto acquire_remote(const RemoteRef& ref, const std::string& key, std::chrono::milliseconds budget)
      -> std::expected<DecodedImagePtr, core::error>;

  std::shared_ptr<HttpFetcher> fetcher_;
  ImageCache cache_;
  std::size_t max_local_bytes_;
};

} // namespace iris::image
