#include <catch2/catch_all.hpp>

#include <atomic>
#include <limits>
#include <set>
#include <thread>
#include <vector>

#include <iris/core/atomic_file.hpp>
#include <iris/engine.hpp>

#include "tests/support/iris_fakes.hpp"

using namespace iris;
using rebuild::RebuildStatus;
using namespace std::chrono_literals;

namespace {

auto test_config(const test_support::TempDir& dir) -> EngineConfig {
  EngineConfig cfg;
  cfg.data_dir = dir / "data";
  cfg.log_level = "warn";
  cfg.rebuild.workers = 2;
  return cfg;
}

struct Fixture {
  test_support::TempDir dir{"engine"};
  std::shared_ptr<test_support::FakeFetcher> fetcher = std::make_shared<test_support::FakeFetcher>();
  std::shared_ptr<test_support::StubEncoder> stub = std::make_shared<test_support::StubEncoder>();

  auto open(std::shared_ptr<test_support::StubEncoder> encoder = nullptr) -> std::unique_ptr<Engine> {
    auto e = Engine::open(test_config(dir), {encoder ? encoder : stub, fetcher});
    REQUIRE(e.has_value());
    return std::move(*e);
  }

  auto image(const std::string& name, std::uint8_t r, std::uint8_t g, std::uint8_t b) -> std::string {
    return test_support::write_solid_png(dir / (name + ".png"), r, g, b);
  }
};

} // namespace

TEST_CASE("add products then search by image", "[engine]") {
  Fixture f;
  auto engine = f.open();

  auto red = engine->add_product({"Red Sneaker", "Shoes", f.image("red", 255, 0, 0)});
  REQUIRE(red.has_value());
  REQUIRE(red->rebuild.status == RebuildStatus::published);
  REQUIRE(engine->add_product({"Green Tote", "Bags", f.image("green", 0, 255, 0)}).has_value());
  REQUIRE(engine->add_product({"Yellow Cap", "Hats", f.image("yellow", 180, 180, 0)}).has_value());

  auto results = engine->search(f.image("query", 250, 5, 5));
  REQUIRE(results.has_value());
  REQUIRE(results->size() == 3);   // default min_score 0 keeps orthogonal matches
  REQUIRE((*results)[0].product_id == red->product.id);
  REQUIRE((*results)[0].name == "Red Sneaker");
  REQUIRE((*results)[0].score > 0.99f);
  REQUIRE((*results)[1].product_id != (*results)[2].product_id);

  auto top1 = engine->search(f.image("query2", 0, 250, 5), 1, 0.9f);
  REQUIRE(top1.has_value());
  REQUIRE(top1->size() == 1);
  REQUIRE((*top1)[0].category == "Bags");

  auto s = engine->stats();
  REQUIRE(s.catalog_size == 3);
  REQUIRE(s.index_records == 3);
  REQUIRE(s.dimension == 3);
  REQUIRE(s.model_name == "stub-rgb-v1");
}

TEST_CASE("search argument and image errors", "[engine]") {
  Fixture f;
  auto engine = f.open();

  REQUIRE(engine->search("").error().code == core::error_code::invalid_parameter);
  REQUIRE(engine->search((f.dir / "missing.png").string()).error().code == core::error_code::not_found);
  REQUIRE(engine->search("http://img.test/none.png").error().code == core::error_code::not_found);
  REQUIRE(engine->search(f.image("q", 1, 2, 3), 0).error().code == core::error_code::invalid_parameter);
  REQUIRE(engine->search(f.image("q", 1, 2, 3), 5, std::numeric_limits<float>::quiet_NaN()).error().code ==
          core::error_code::invalid_parameter);
  REQUIRE(engine->search(f.image("q", 1, 2, 3), 5, std::numeric_limits<float>::infinity()).error().code ==
          core::error_code::invalid_parameter);

  REQUIRE(core::write_file_atomic(f.dir / "text.png", std::string_view("not an image")).has_value());
  REQUIRE(engine->search((f.dir / "text.png").string()).error().code == core::error_code::invalid_image);

  // Empty catalog and empty index: a valid query returns no results.
  auto none = engine->search(f.image("q2", 9, 9, 9));
  REQUIRE(none.has_value());
  REQUIRE(none->empty());
}

TEST_CASE("an unreachable product image keeps the product but not its record", "[engine]") {
  Fixture f;
  auto engine = f.open();
  REQUIRE(engine->add_product({"Red", "Shoes", f.image("red", 255, 0, 0)}).has_value());
  REQUIRE(engine->add_product({"Green", "Shoes", f.image("green", 0, 255, 0)}).has_value());

  auto ghost = engine->add_product({"Ghost", "Shoes", "http://img.test/ghost.png"});
  REQUIRE(ghost.has_value());
  REQUIRE(ghost->rebuild.status == RebuildStatus::partial);
  REQUIRE(ghost->rebuild.excluded.size() == 1);
  REQUIRE(engine->find_product(ghost->product.id).has_value());
  REQUIRE_FALSE(engine->snapshot()->contains(ghost->product.id));
  REQUIRE(engine->list_products().size() == 3);

  // Once the image is reachable, the next rebuild picks it up.
  f.fetcher->set("http://img.test/ghost.png", test_support::solid_png(0, 0, 255));
  auto full = engine->full_rebuild();
  REQUIRE(full.status == RebuildStatus::published);
  REQUIRE(engine->snapshot()->contains(ghost->product.id));
}

TEST_CASE("search fails when no catalog product made it into the index", "[engine]") {
  Fixture f;
  auto engine = f.open();
  auto ghost = engine->add_product({"Ghost", "Shoes", "http://img.test/ghost.png"});
  REQUIRE(ghost.has_value());
  REQUIRE(ghost->rebuild.status == RebuildStatus::failed);
  REQUIRE(engine->snapshot()->empty());

  auto r = engine->search(f.image("q", 255, 0, 0));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::not_found);
}

TEST_CASE("invalid products are rejected before any rebuild", "[engine]") {
  Fixture f;
  auto engine = f.open();
  const auto version = engine->snapshot()->version();
  auto bad = engine->add_product({"", "Shoes", f.image("red", 255, 0, 0)});
  REQUIRE(bad.error().code == core::error_code::invalid_parameter);
  REQUIRE(engine->list_products().empty());
  REQUIRE(engine->snapshot()->version() == version);
  REQUIRE(engine->find_product("nope").error().code == core::error_code::not_found);
}

TEST_CASE("racing adds both end up searchable", "[engine][concurrency]") {
  Fixture f;
  auto engine = f.open();
  const auto red = f.image("red", 255, 0, 0);
  const auto blue = f.image("blue", 0, 0, 255);

  std::expected<AddProductResult, core::error> a, b;
  std::thread ta([&] { a = engine->add_product({"A", "Shoes", red}); });
  std::thread tb([&] { b = engine->add_product({"B", "Bags", blue}); });
  ta.join();
  tb.join();

  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a->product.id != b->product.id);
  REQUIRE(a->rebuild.ok());
  REQUIRE(b->rebuild.ok());
  auto snap = engine->snapshot();
  REQUIRE(snap->contains(a->product.id));
  REQUIRE(snap->contains(b->product.id));
}

TEST_CASE("searches run while products are added", "[engine][concurrency]") {
  Fixture f;
  auto engine = f.open();
  REQUIRE(engine->add_product({"Seed", "Shoes", f.image("seed", 255, 0, 0)}).has_value());
  const auto query = f.image("query", 200, 30, 30);

  std::atomic<bool> done{false};
  std::atomic<int> failures{0};
  std::vector<std::thread> searchers;
  for (int t = 0; t < 4; ++t) {
    searchers.emplace_back([&] {
      std::uint64_t last = 0;
      while (!done.load()) {
        auto snap = engine->snapshot();
        if (snap->version() < last) failures.fetch_add(1);
        last = snap->version();
        auto r = engine->search(query, 50);
        if (!r || r->empty()) failures.fetch_add(1);
      }
    });
  }

  for (int i = 0; i < 6; ++i) {
    auto added = engine->add_product(
        {"P" + std::to_string(i), "Shoes", f.image("p" + std::to_string(i), 40, static_cast<std::uint8_t>(40 * i + 1), 40)});
    REQUIRE(added.has_value());
    REQUIRE(added->rebuild.ok());
  }
  done = true;
  for (auto& th : searchers) th.join();

  REQUIRE(failures.load() == 0);
  REQUIRE(engine->snapshot()->size() == 7);
}

TEST_CASE("reopening loads the index without re-encoding", "[engine][restart]") {
  Fixture f;
  std::uint64_t version = 0;
  {
    auto engine = f.open();
    REQUIRE(engine->add_product({"Red", "Shoes", f.image("red", 255, 0, 0)}).has_value());
    REQUIRE(engine->add_product({"Blue", "Bags", f.image("blue", 0, 0, 255)}).has_value());
    version = engine->snapshot()->version();
  }

  auto fresh = std::make_shared<test_support::StubEncoder>();
  auto engine = f.open(fresh);
  REQUIRE(fresh->calls() == 0);
  REQUIRE(engine->snapshot()->version() == version);
  REQUIRE(engine->snapshot()->size() == 2);
  REQUIRE_FALSE(engine->ensure_index().has_value());
}

TEST_CASE("a corrupt index file triggers a full rebuild on open", "[engine][restart]") {
  Fixture f;
  {
    auto engine = f.open();
    REQUIRE(engine->add_product({"Red", "Shoes", f.image("red", 255, 0, 0)}).has_value());
    REQUIRE(engine->add_product({"Blue", "Bags", f.image("blue", 0, 0, 255)}).has_value());
  }
  const auto idx = test_config(f.dir).index_path();
  REQUIRE(core::write_file_atomic(idx, std::string_view("garbage")).has_value());

  auto fresh = std::make_shared<test_support::StubEncoder>();
  auto engine = f.open(fresh);
  REQUIRE(fresh->calls() == 2);
  REQUIRE(engine->snapshot()->size() == 2);
  REQUIRE(index::read_index_file(idx).has_value());
}

TEST_CASE("a different encoder model triggers a full rebuild on open", "[engine][restart]") {
  Fixture f;
  std::uint64_t version = 0;
  {
    auto engine = f.open();
    REQUIRE(engine->add_product({"Red", "Shoes", f.image("red", 255, 0, 0)}).has_value());
    version = engine->snapshot()->version();
  }

  auto v2 = std::make_shared<test_support::StubEncoder>("stub-rgb-v2");
  auto engine = f.open(v2);
  REQUIRE(v2->calls() == 1);
  REQUIRE(engine->snapshot()->model_name() == "stub-rgb-v2");
  REQUIRE(engine->snapshot()->version() == version + 1);
}

TEST_CASE("products added while the engine was down are indexed on open", "[engine][restart]") {
  Fixture f;
  {
    auto engine = f.open();
    REQUIRE(engine->add_product({"Red", "Shoes", f.image("red", 255, 0, 0)}).has_value());
  }
  {
    auto store = catalog::CatalogStore::open(test_config(f.dir).catalog_path());
    REQUIRE(store.has_value());
    REQUIRE((*store)->append({"Blue", "Bags", f.image("blue", 0, 0, 255)}).has_value());
  }

  auto fresh = std::make_shared<test_support::StubEncoder>();
  auto engine = f.open(fresh);
  REQUIRE(fresh->calls() == 1);   // only the new product
  REQUIRE(engine->snapshot()->size() == 2);
}

TEST_CASE("search honours its deadline", "[engine][timeout]") {
  Fixture f;
  auto cfg = test_config(f.dir);
  cfg.search.deadline = 100ms;
  f.fetcher->set("http://img.test/slow.png", test_support::solid_png(255, 0, 0));
  f.fetcher->set_delay(2s);
  auto engine = Engine::open(cfg, {f.stub, f.fetcher});
  REQUIRE(engine.has_value());

  const auto start = std::chrono::steady_clock::now();
  auto r = (*engine)->search("http://img.test/slow.png");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::timeout);
  REQUIRE(std::chrono::steady_clock::now() - start < 1500ms);
}

TEST_CASE("a model call that hangs is abandoned at the deadline", "[engine][timeout]") {
  Fixture f;
  auto cfg = test_config(f.dir);
  cfg.search.deadline = 100ms;
  auto engine = Engine::open(cfg, {f.stub, f.fetcher});
  REQUIRE(engine.has_value());
  const auto query = f.image("query", 255, 0, 0);

  f.stub->close_gate();
  const auto start = std::chrono::steady_clock::now();
  auto r = (*engine)->search(query);
  const auto took = std::chrono::steady_clock::now() - start;
  REQUIRE(f.stub->wait_for_waiters(1));
  f.stub->open_gate();

  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::timeout);
  REQUIRE(took < 1500ms);
}

TEST_CASE("classify suggests the nearest category", "[engine][classify]") {
  Fixture f;
  auto engine = f.open();
  REQUIRE(engine->classify(f.image("q0", 255, 0, 0)).error().code == core::error_code::not_found);

  REQUIRE(engine->add_product({"Red 1", "Shoes", f.image("r1", 255, 0, 0)}).has_value());
  REQUIRE(engine->add_product({"Red 2", "Shoes", f.image("r2", 230, 40, 0)}).has_value());
  REQUIRE(engine->add_product({"Blue 1", "Bags", f.image("b1", 0, 0, 255)}).has_value());

  auto c = engine->classify(f.image("q1", 240, 20, 10));
  REQUIRE(c.has_value());
  REQUIRE(c->category == "Shoes");
  REQUIRE(c->suggested_name == "Uploaded Shoes");
}

TEST_CASE("try_full_rebuild runs when idle", "[engine][rebuild]") {
  Fixture f;
  auto engine = f.open();
  REQUIRE(engine->add_product({"Red", "Shoes", f.image("red", 255, 0, 0)}).has_value());
  const auto before = engine->snapshot()->version();
  auto out = engine->try_full_rebuild();
  REQUIRE(out.has_value());
  REQUIRE(out->index_version == before + 1);
  REQUIRE(engine->stats().rebuild.completed >= 2);
}

TEST_CASE("engine refuses an invalid configuration", "[engine][config]") {
  test_support::TempDir dir("engine_cfg");
  auto cfg = test_config(dir);
  cfg.search.default_top_k = -1;
  REQUIRE(Engine::open(cfg).error().code == core::error_code::config_invalid);

  cfg = test_config(dir);
  cfg.encoder.kind = "onnx-clip";
  cfg.encoder.onnx_model = dir / "model.onnx";
  REQUIRE(Engine::open(cfg).error().code == core::error_code::unsupported);
}
