#pragma once

/** \file http_fetcher.hpp
 *  \brief Remote image download.
 *
 * HttpFetcher is the seam the acquirer uses for network access; tests inject a
 * scripted implementation. CurlFetcher is the libcurl implementation.
 *
 * Error mapping (CurlFetcher):
 * - HTTP 4xx except 408, 425, 429    -> not_found
 * - HTTP 408, 425, 429, 5xx,
 *   DNS/connect failure, transfer
 *   timeout, TLS errors              -> network_error (retryable by the caller)
 * - body larger than max_bytes       -> invalid_image
 * No retries are performed internally.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "iris/error.hpp"
#include "iris/image/image_ref.hpp"

namespace iris::image {

/** \brief Transfer limits for untrusted remote sources. */
struct FetchOptions {
  std::chrono::milliseconds timeout{15000};          /**< whole-transfer bound */
  std::chrono::milliseconds connect_timeout{5000};
  std::size_t max_bytes{20u * 1024u * 1024u};        /**< reject larger bodies */
  long max_redirects{5};
  std::string user_agent{"iris-image-fetcher/1.0"};
};

/** \brief True for HTTP statuses that mean the image is not there (permanent 4xx). */
auto http_status_is_missing(long status) noexcept -> bool;

class HttpFetcher {
public:
  virtual ~HttpFetcher() = default;

  /** \brief Download the body of a remote reference.
   *  \param timeout upper bound for this call; implementations use
   *         min(timeout, their configured timeout)
   */
  virtual auto fetch(const RemoteRef& ref, std::chrono::milliseconds timeout)
      -> std::expected<std::vector<std::uint8_t>, core::error> = 0;
};

class CurlFetcher final : public HttpFetcher {
public:
  explicit CurlFetcher(FetchOptions options = {});

  auto fetch(const RemoteRef& ref, std::chrono::milliseconds timeout)
      -> std::expected<std::vector<std::uint8_t>, core::error> override;

private:
  FetchOptions options_;
};

} // namespace iris::image
