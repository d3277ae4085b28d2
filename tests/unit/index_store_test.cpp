#include <catch2/catch_all.hpp>

#include <atomic>
#include <optional>
#include <thread>
#include <vector>

#include <iris/core/atomic_file.hpp>
#include <iris/index/index_store.hpp>

#include "tests/support/iris_fakes.hpp"

using namespace iris;

namespace {

auto make_index(std::uint64_t version, std::size_t records) -> index::IndexPtr {
  std::vector<index::IndexEntry> entries;
  for (std::size_t i = 0; i < records; ++i) {
    const auto id = "p" + std::to_string(i);
    entries.push_back({{id, id, "cat", "/img/" + id}, i % 2 == 0 ? std::vector<float>{1.0f, 0.0f}
                                                                   : std::vector<float>{0.0f, 1.0f}});
  }
  auto built = index::Index::build({version, "stub", 2, 0}, std::move(entries));
  REQUIRE(built.has_value());
  return std::make_shared<const index::Index>(std::move(*built));
}

} // namespace

TEST_CASE("snapshot starts empty and never null", "[index][store]") {
  test_support::TempDir dir("store_empty");
  index::IndexStore store(dir / "embeddings.idx");
  REQUIRE(store.snapshot() != nullptr);
  REQUIRE(store.snapshot()->empty());
  REQUIRE(store.version() == 0);

  auto missing = store.load();
  REQUIRE(missing.error().code == core::error_code::not_found);
  REQUIRE(store.snapshot()->empty());
}

TEST_CASE("a held snapshot survives later publishes", "[index][store]") {
  test_support::TempDir dir("store_publish");
  index::IndexStore store(dir / "embeddings.idx");

  REQUIRE(store.publish(make_index(1, 2)).has_value());
  auto held = store.snapshot();
  REQUIRE(store.publish(make_index(2, 5)).has_value());

  REQUIRE(held->version() == 1);
  REQUIRE(held->size() == 2);
  REQUIRE(store.snapshot()->version() == 2);
  REQUIRE(store.snapshot()->size() == 5);
}

TEST_CASE("publish rejects stale versions and null", "[index][store]") {
  test_support::TempDir dir("store_stale");
  index::IndexStore store(dir / "embeddings.idx");
  REQUIRE(store.publish(make_index(4, 1)).has_value());

  REQUIRE(store.publish(make_index(4, 1)).error().code == core::error_code::invalid_parameter);
  REQUIRE(store.publish(make_index(3, 1)).error().code == core::error_code::invalid_parameter);
  REQUIRE(store.publish(nullptr).error().code == core::error_code::invalid_parameter);
  REQUIRE(store.version() == 4);
}

TEST_CASE("published index is reloaded by a new store", "[index][store]") {
  test_support::TempDir dir("store_reload");
  {
    index::IndexStore store(dir / "embeddings.idx");
    REQUIRE(store.publish(make_index(9, 3)).has_value());
  }
  index::IndexStore reopened(dir / "embeddings.idx");
  auto loaded = reopened.load();
  REQUIRE(loaded.has_value());
  REQUIRE((*loaded)->version() == 9);
  REQUIRE(reopened.snapshot()->size() == 3);
}

TEST_CASE("corrupt file keeps the prior snapshot", "[index][store]") {
  test_support::TempDir dir("store_corrupt");
  const auto path = dir / "embeddings.idx";
  index::IndexStore store(path);
  REQUIRE(store.publish(make_index(2, 2)).has_value());

  REQUIRE(core::write_file_atomic(path, std::string_view("IRIS-IDX but not really")).has_value());
  auto r = store.load();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::corrupt_index);
  REQUIRE(store.version() == 2);
  REQUIRE(store.snapshot()->size() == 2);
}

TEST_CASE("a damaged section keeps version numbering monotonic", "[index][store]") {
  test_support::TempDir dir("store_floor");
  const auto path = dir / "embeddings.idx";
  {
    index::IndexStore writer(path);
    REQUIRE(writer.publish(make_index(5, 2)).has_value());
  }
  auto bytes = core::read_file(path);
  REQUIRE(bytes.has_value());
  bytes->back() ^= 0xFFu;   // last vector byte; header stays intact
  REQUIRE(core::write_file_atomic(path, *bytes).has_value());
  REQUIRE(index::peek_index_version(*bytes) == std::optional<std::uint64_t>{5});

  index::IndexStore store(path);
  auto r = store.load();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::corrupt_index);
  REQUIRE(store.version() == 5);
  REQUIRE(store.snapshot()->empty());
  REQUIRE_FALSE(store.publish(make_index(5, 1)).has_value());
  REQUIRE(store.publish(make_index(6, 1)).has_value());
}

TEST_CASE("failed write leaves snapshot and version unchanged", "[index][store]") {
  test_support::TempDir dir("store_io");
  index::IndexStore store(dir / "no_such_dir" / "embeddings.idx");
  auto r = store.publish(make_index(1, 1));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::io_failed);
  REQUIRE(store.version() == 0);
}

TEST_CASE("readers see whole snapshots during publishes", "[index][store][concurrency]") {
  test_support::TempDir dir("store_race");
  index::IndexStore store(dir / "embeddings.idx");
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&] {
      std::uint64_t last = 0;
      while (!done.load()) {
        auto snap = store.snapshot();
        // Version v always carries v records.
        if (snap->size() != snap->version() || snap->version() < last) torn.fetch_add(1);
        last = snap->version();
      }
    });
  }
  for (std::uint64_t v = 1; v <= 20; ++v) REQUIRE(store.publish(make_index(v, v)).has_value());
  done = true;
  for (auto& th : readers) th.join();
  REQUIRE(torn.load() == 0);
}
