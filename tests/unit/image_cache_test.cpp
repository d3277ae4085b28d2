#include <catch2/catch_all.hpp>

#include <memory>
#include <thread>
#include <vector>

#include <iris/image/decoded_image.hpp>
#include <iris/image/image_cache.hpp>

#include "tests/support/iris_fakes.hpp"

using namespace iris;
using namespace std::chrono_literals;

namespace {

auto make_image(std::uint32_t side, std::uint8_t fill) -> image::DecodedImagePtr {
  image::DecodedImage img;
  img.width = side;
  img.height = side;
  img.pixels.assign(static_cast<std::size_t>(side) * side * 3, fill);
  return std::make_shared<const image::DecodedImage>(std::move(img));
}

} // namespace

TEST_CASE("decode_image accepts PNG and rejects garbage", "[image][decode]") {
  auto png = test_support::solid_png(10, 20, 30, 4, 3);
  auto ok = image::decode_image(png);
  REQUIRE(ok.has_value());
  REQUIRE(ok->width == 4);
  REQUIRE(ok->height == 3);
  REQUIRE(ok->pixels.size() == 4u * 3u * 3u);
  REQUIRE(ok->pixels[0] == 10);   // RGB order
  REQUIRE(ok->pixels[2] == 30);

  std::vector<std::uint8_t> garbage{'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'};
  auto bad = image::decode_image(garbage);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == core::error_code::invalid_image);

  auto empty = image::decode_image({});
  REQUIRE(empty.error().code == core::error_code::invalid_image);

  std::vector<std::uint8_t> truncated(png.begin(), png.begin() + static_cast<std::ptrdiff_t>(png.size() / 3));
  REQUIRE(image::decode_image(truncated).error().code == core::error_code::invalid_image);
}

TEST_CASE("cache put is idempotent and last write wins", "[image][cache]") {
  image::ImageCache cache;
  auto first = make_image(2, 1);
  auto second = make_image(2, 2);

  cache.put("url:http://a/", {first, std::chrono::system_clock::now(), {}});
  cache.put("url:http://a/", {first, std::chrono::system_clock::now(), {}});
  REQUIRE(cache.size() == 1);
  REQUIRE(cache.get("url:http://a/")->image == first);

  cache.put("url:http://a/", {second, std::chrono::system_clock::now(), {}});
  REQUIRE(cache.size() == 1);
  REQUIRE(cache.get("url:http://a/")->image == second);

  const auto s = cache.stats();
  REQUIRE(s.inserts == 1);
  REQUIRE(s.updates == 2);
  REQUIRE(s.hits == 2);
}

TEST_CASE("memory budget evicts least recently used entries", "[image][cache]") {
  // Each 4x4 RGB image is 48 bytes.
  image::ImageCache cache({.max_memory_bytes = 100});
  cache.put("a", {make_image(4, 1), {}, {}});
  cache.put("b", {make_image(4, 2), {}, {}});
  REQUIRE(cache.get("a").has_value());   // a is now most recent
  cache.put("c", {make_image(4, 3), {}, {}});

  REQUIRE(cache.get("a").has_value());
  REQUIRE_FALSE(cache.get("b").has_value());
  REQUIRE(cache.get("c").has_value());
  REQUIRE(cache.stats().evictions == 1);
  REQUIRE(cache.stats().bytes_used <= 100);
}

TEST_CASE("entries older than the ttl are refreshed", "[image][cache]") {
  image::ImageCache cache({.ttl = std::chrono::seconds(60)});
  cache.put("old", {make_image(1, 1), std::chrono::system_clock::now() - 2min, {}});
  cache.put("new", {make_image(1, 1), std::chrono::system_clock::now(), {}});
  REQUIRE_FALSE(cache.get("old").has_value());
  REQUIRE(cache.get("new").has_value());
}

TEST_CASE("disk tier round-trips encoded bytes under the key", "[image][cache]") {
  test_support::TempDir dir("cache_disk");
  image::ImageCache cache({.disk_dir = dir / "images"});
  REQUIRE(cache.has_disk_tier());

  const std::vector<std::uint8_t> bytes{1, 2, 3, 4, 5};
  REQUIRE(cache.store_encoded("url:http://x/1.png", bytes).has_value());
  REQUIRE(std::filesystem::exists(cache.encoded_path("url:http://x/1.png")));

  auto back = cache.load_encoded("url:http://x/1.png");
  REQUIRE(back.has_value());
  REQUIRE(back->first == bytes);
  REQUIRE(cache.stats().disk_hits == 1);

  REQUIRE_FALSE(cache.load_encoded("url:http://x/2.png").has_value());
}

TEST_CASE("concurrent fills of one key leave a single entry", "[image][cache]") {
  image::ImageCache cache;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&cache, t] {
      for (int i = 0; i < 200; ++i) {
        cache.put("shared", {make_image(2, static_cast<std::uint8_t>(t)), {}, {}});
        (void)cache.get("shared");
      }
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(cache.size() == 1);
  REQUIRE(cache.stats().bytes_used == 12);
}
