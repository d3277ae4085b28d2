#include <catch2/catch_all.hpp>

#include <cmath>
#include <vector>

#include <iris/core/atomic_file.hpp>
#include <iris/index/index.hpp>
#include <iris/index/index_file.hpp>

#include "tests/support/iris_fakes.hpp"

using namespace iris;

namespace {

auto entry(const std::string& id, std::vector<float> v) -> index::IndexEntry {
  return {{id, "name " + id, "cat", "/img/" + id + ".png"}, std::move(v)};
}

auto sample_index(std::uint64_t version = 3) -> index::Index {
  index::IndexMeta meta{version, "stub-rgb-v1", 2, 1'700'000'000'000};
  std::vector<index::IndexEntry> entries;
  entries.push_back(entry("p1", {1.0f, 0.0f}));
  entries.push_back(entry("p2", {0.0f, 1.0f}));
  entries.push_back(entry("p3", {0.70710678f, 0.70710678f}));
  auto built = index::Index::build(meta, std::move(entries));
  REQUIRE(built.has_value());
  return std::move(*built);
}

} // namespace

TEST_CASE("build freezes entries in order", "[index]") {
  auto idx = sample_index();
  REQUIRE(idx.size() == 3);
  REQUIRE(idx.version() == 3);
  REQUIRE(idx.dimension() == 2);
  REQUIRE(idx.product(2).id == "p3");
  REQUIRE(idx.position("p2") == 1u);
  REQUIRE_FALSE(idx.contains("p9"));
  REQUIRE(idx.vector(1)[1] == 1.0f);
  REQUIRE(idx.entry(0).vector == std::vector<float>{1.0f, 0.0f});

  index::Index empty;
  REQUIRE(empty.empty());
  REQUIRE(empty.version() == 0);
}

TEST_CASE("build rejects entries violating invariants", "[index]") {
  index::IndexMeta meta{1, "m", 2, 0};
  auto fails = [&](std::vector<index::IndexEntry> entries) {
    auto r = index::Index::build(meta, std::move(entries));
    return !r.has_value() && r.error().code == core::error_code::corrupt_index;
  };
  REQUIRE(fails({entry("a", {1.0f, 0.0f, 0.0f})}));                      // wrong length
  REQUIRE(fails({entry("a", {2.0f, 0.0f})}));                            // not unit
  REQUIRE(fails({entry("a", {NAN, 0.0f})}));                             // non-finite
  REQUIRE(fails({entry("", {1.0f, 0.0f})}));                             // empty id
  REQUIRE(fails({entry("a", {1.0f, 0.0f}), entry("a", {0.0f, 1.0f})}));  // duplicate

  index::IndexMeta zero{1, "m", 0, 0};
  REQUIRE_FALSE(index::Index::build(zero, {entry("a", {})}).has_value());
  REQUIRE(index::Index::build(zero, {}).has_value());
}

TEST_CASE("index file round-trips metadata and vectors", "[index][file]") {
  test_support::TempDir dir("index_file");
  const auto path = dir / "embeddings.idx";
  auto idx = sample_index(7);

  REQUIRE(index::write_index_file(path, idx).has_value());
  auto back = index::read_index_file(path);
  REQUIRE(back.has_value());
  REQUIRE(back->meta().version == 7);
  REQUIRE(back->model_name() == "stub-rgb-v1");
  REQUIRE(back->meta().created_at_ms == 1'700'000'000'000);
  REQUIRE(back->size() == 3);
  for (std::size_t i = 0; i < idx.size(); ++i) {
    REQUIRE(back->product(i) == idx.product(i));
    REQUIRE(back->entry(i).vector == idx.entry(i).vector);
  }
}

TEST_CASE("an empty index is a valid file", "[index][file]") {
  auto bytes = index::encode_index(index::Index{});
  REQUIRE(bytes.has_value());
  auto back = index::decode_index(*bytes);
  REQUIRE(back.has_value());
  REQUIRE(back->empty());
}

TEST_CASE("damaged index bytes are corrupt_index", "[index][file]") {
  auto bytes = index::encode_index(sample_index());
  REQUIRE(bytes.has_value());
  auto is_corrupt = [](const std::vector<std::uint8_t>& b) {
    auto r = index::decode_index(b);
    return !r.has_value() && r.error().code == core::error_code::corrupt_index;
  };

  SECTION("bad magic") {
    auto b = *bytes;
    b[0] = 'X';
    REQUIRE(is_corrupt(b));
  }
  SECTION("flipped header byte") {
    auto b = *bytes;
    b[17] ^= 0x01;   // inside the version field
    REQUIRE(is_corrupt(b));
  }
  SECTION("flipped payload byte") {
    auto b = *bytes;
    b[b.size() - 3] ^= 0x40;   // inside the last vector
    REQUIRE(is_corrupt(b));
  }
  SECTION("truncated") {
    auto b = *bytes;
    b.resize(b.size() - 5);
    REQUIRE(is_corrupt(b));
    b.resize(10);
    REQUIRE(is_corrupt(b));
  }
  SECTION("trailing garbage") {
    auto b = *bytes;
    b.push_back(0);
    REQUIRE(is_corrupt(b));
  }
}

TEST_CASE("reading a missing index file is not_found", "[index][file]") {
  test_support::TempDir dir("index_missing");
  auto r = index::read_index_file(dir / "embeddings.idx");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::not_found);
}

#ifdef IRIS_HAS_ZSTD
TEST_CASE("zstd-compressed sections round-trip", "[index][file][zstd]") {
  index::IndexMeta meta{1, "m", 64, 0};
  std::vector<index::IndexEntry> entries;
  for (int i = 0; i < 50; ++i) {
    std::vector<float> v(64, 0.0f);
    v[static_cast<std::size_t>(i % 64)] = 1.0f;
    entries.push_back(entry("id-" + std::to_string(i), std::move(v)));
  }
  auto idx = index::Index::build(meta, std::move(entries));
  REQUIRE(idx.has_value());

  auto plain = index::encode_index(*idx);
  auto packed = index::encode_index(*idx, {.zstd_level = 3});
  REQUIRE(packed.has_value());
  REQUIRE(packed->size() < plain->size());
  auto back = index::decode_index(*packed);
  REQUIRE(back.has_value());
  REQUIRE(back->entry(49).vector == idx->entry(49).vector);
}
#endif
