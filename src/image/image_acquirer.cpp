#include "iris/image/image_acquirer.hpp"

#include <string>

#include "iris/core/atomic_file.hpp"
#include "iris/core/log.hpp"

namespace iris::image {

namespace {

constexpr const char* kComponent = "image.acquire";

auto local_stamp(const std::filesystem::path& p) -> std::expected<std::string, core::error> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) {
    return core::make_unexpected(core::error_code::not_found, "no such image file: " + p.string(),
                                 kComponent);
  }
  const auto size = std::filesystem::file_size(p, ec);
  if (ec) {
    return core::make_unexpected(core::error_code::io_failed,
                                 "stat failed for " + p.string() + ": " + ec.message(), kComponent);
  }
  const auto mtime = std::filesystem::last_write_time(p, ec);
  if (ec) {
    return core::make_unexpected(core::error_code::io_failed,
                                 "stat failed for " + p.string() + ": " + ec.message(), kComponent);
  }
  return std::to_string(mtime.time_since_epoch().count()) + ":" + std::to_string(size);
}

} // namespace

ImageAcquirer::ImageAcquirer(std::shared_ptr<HttpFetcher> fetcher, CacheOptions cache_options,
                             std::size_t max_local_bytes)
    : fetcher_(std::move(fetcher)), cache_(std::move(cache_options)), max_local_bytes_(max_local_bytes) {}

auto ImageAcquirer::acquire(std::string_view raw_ref, std::chrono::milliseconds budget)
    -> std::expected<DecodedImagePtr, core::error> {
  auto ref = parse_image_ref(raw_ref);
  if (!ref) return std::unexpected(ref.error());
  return acquire(*ref, budget);
}

auto ImageAcquirer::acquire(const ImageRef& ref, std::chrono::milliseconds budget)
    -> std::expected<DecodedImagePtr, core::error> {
  const auto key = canonical_key(ref);
  if (const auto* local = std::get_if<LocalRef>(&ref)) {
    return acquire_local(*local, key);
  }
  return acquire_remote(std::get<RemoteRef>(ref), key, budget);
}

auto ImageAcquirer::acquire_local(const LocalRef& ref, const std::string& key)
    -> std::expected<DecodedImagePtr, core::error> {
  auto stamp = local_stamp(ref.path);
  if (!stamp) return std::unexpected(stamp.error());

  if (auto hit = cache_.get(key); hit && hit->source_stamp == *stamp) {
    return hit->image;
  }

  std::error_code ec;
  if (const auto size = std::filesystem::file_size(ref.path, ec); !ec && size > max_local_bytes_) {
    return core::make_unexpected(core::error_code::invalid_image,
                                 ref.path.string() + " exceeds " + std::to_string(max_local_bytes_) + " bytes",
                                 kComponent);
  }
  auto bytes = core::read_file(ref.path);
  if (!bytes) {
    auto err = bytes.error();
    err.component = kComponent;
    return std::unexpected(std::move(err));
  }
  auto decoded = decode_image(*bytes);
  if (!decoded) {
    auto err = decoded.error();
    err.message = ref.path.string() + ": " + err.message;
    return std::unexpected(std::move(err));
  }

  auto image = std::make_shared<const DecodedImage>(std::move(*decoded));
  cache_.put(key, CacheEntry{image, std::chrono::system_clock::now(), std::move(*stamp)});
  return image;
}

auto ImageAcquirer::acquire_remote(const RemoteRef& ref, const std::string& key,
                                   std::chrono::milliseconds budget)
    -> std::expected<DecodedImagePtr, core::error> {
  if (auto hit = cache_.get(key)) {
    return hit->image;
  }

  if (auto stored = cache_.load_encoded(key)) {
    if (auto decoded = decode_image(stored->first)) {
      auto image = std::make_shared<const DecodedImage>(std::move(*decoded));
      cache_.put(key, CacheEntry{image, stored->second, {}});
      return image;
    }
    core::logger()->warn("[acquire] cached bytes for {} no longer decode; refetching", ref.url);
  }

  if (!fetcher_) {
    return core::make_unexpected(core::error_code::unsupported,
                                 "remote images are disabled (no fetcher): " + ref.url, kComponent);
  }
  auto bytes = fetcher_->fetch(ref, budget);
  if (!bytes) return std::unexpected(bytes.error());

  auto decoded = decode_image(*bytes);
  if (!decoded) {
    auto err = decoded.error();
    err.message = ref.url + ": " + err.message;
    return std::unexpected(std::move(err));
  }

  if (auto stored = cache_.store_encoded(key, *bytes); !stored) {
    core::logger()->warn("[acquire] disk cache write for {} failed: {}", ref.url,
                         stored.error().message);
  }
  auto image = std::make_shared<const DecodedImage>(std::move(*decoded));
  cache_.put(key, CacheEntry{image, std::chrono::system_clock::now(), {}});
  core::logger()->debug("[acquire] fetched {} ({} bytes, {}x{})", ref.url, bytes->size(),
                        image->width, image->height);
  return image;
}

} // namespace iris::image
