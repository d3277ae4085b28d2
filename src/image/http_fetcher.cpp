#include "iris/image/http_fetcher.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include "iris/core/log.hpp"

namespace iris::image {

namespace {

constexpr const char* kComponent = "image.fetch";

struct Body {
  std::vector<std::uint8_t> data;
  std::size_t max_bytes{0};
  bool overflow{false};
};

std::size_t write_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
  auto* body = static_cast<Body*>(userdata);
  const std::size_t n = size * nmemb;
  if (body->data.size() + n > body->max_bytes) {
    body->overflow = true;
    return 0; // aborts the transfer with CURLE_WRITE_ERROR
  }
  body->data.insert(body->data.end(), reinterpret_cast<std::uint8_t*>(ptr),
                    reinterpret_cast<std::uint8_t*>(ptr) + n);
  return n;
}

void global_init_once() {
  static std::once_flag flag;
  std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct EasyDeleter {
  void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};

} // namespace

auto http_status_is_missing(long status) noexcept -> bool {
  if (status < 400 || status >= 500) return false;
  // Request timeout, too early, rate limited: the server may answer later.
  return status != 408 && status != 425 && status != 429;
}

CurlFetcher::CurlFetcher(FetchOptions options) : options_(std::move(options)) {
  global_init_once();
}

auto CurlFetcher::fetch(const RemoteRef& ref, std::chrono::milliseconds timeout)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  std::unique_ptr<CURL, EasyDeleter> h(curl_easy_init());
  if (!h) {
    return core::make_unexpected(core::error_code::internal, "curl_easy_init failed", kComponent);
  }

  const auto effective = std::min(timeout, options_.timeout);
  if (effective.count() <= 0) {
    return core::make_unexpected(core::error_code::network_error,
                                 "no time left to fetch " + ref.url, kComponent);
  }

  Body body;
  body.max_bytes = options_.max_bytes;

  curl_easy_setopt(h.get(), CURLOPT_URL, ref.url.c_str());
  curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(h.get(), CURLOPT_MAXREDIRS, options_.max_redirects);
#if LIBCURL_VERSION_NUM >= 0x075500
  curl_easy_setopt(h.get(), CURLOPT_PROTOCOLS_STR, "http,https");
  curl_easy_setopt(h.get(), CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
  curl_easy_setopt(h.get(), CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
  curl_easy_setopt(h.get(), CURLOPT_REDIR_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
#endif
  curl_easy_setopt(h.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(effective.count()));
  curl_easy_setopt(h.get(), CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(std::min(effective, options_.connect_timeout).count()));
  curl_easy_setopt(h.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(h.get(), CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(options_.max_bytes));

  const CURLcode rc = curl_easy_perform(h.get());
  if (body.overflow || rc == CURLE_FILESIZE_EXCEEDED) {
    return core::make_unexpected(core::error_code::invalid_image,
                                 ref.url + " exceeds " + std::to_string(options_.max_bytes) + " bytes",
                                 kComponent);
  }
  if (rc != CURLE_OK) {
    core::logger()->debug("[fetch] {} failed: {}", ref.url, curl_easy_strerror(rc));
    return core::make_unexpected(core::error_code::network_error,
                                 ref.url + ": " + curl_easy_strerror(rc), kComponent);
  }

  long status = 0;
  curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &status);
  if (http_status_is_missing(status)) {
    return core::make_unexpected(core::error_code::not_found,
                                 ref.url + ": HTTP " + std::to_string(status), kComponent);
  }
  if (status >= 500 || status < 200 || status >= 300) {
    return core::make_unexpected(core::error_code::network_error,
                                 ref.url + ": HTTP " + std::to_string(status), kComponent);
  }
  return std::move(body.data);
}

} // namespace iris::image
