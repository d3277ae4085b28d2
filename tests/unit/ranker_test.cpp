#include <catch2/catch_all.hpp>

#include <random>
#include <vector>

#include <iris/kernels/distance.hpp>
#include <iris/search/classifier.hpp>
#include <iris/search/ranker.hpp>

using namespace iris;

namespace {

auto build(std::vector<std::pair<std::string, std::vector<float>>> rows, std::uint32_t dim,
           const std::vector<std::string>& categories = {}) -> index::Index {
  std::vector<index::IndexEntry> entries;
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const auto& category = categories.empty() ? std::string("cat") : categories[i];
    entries.push_back({{rows[i].first, "name-" + rows[i].first, category, "/img/" + rows[i].first},
                       std::move(rows[i].second)});
  }
  auto idx = index::Index::build({1, "test", dim, 0}, std::move(entries));
  REQUIRE(idx.has_value());
  return std::move(*idx);
}

auto random_unit(std::mt19937& rng, std::size_t dim) -> std::vector<float> {
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<float> v(dim);
  for (auto& x : v) x = dist(rng);
  kernels::normalize_inplace(v);
  return v;
}

} // namespace

TEST_CASE("threshold filters and ties break by position", "[search][rank]") {
  const float h = 0.70710678f;
  auto idx = build({{"product1", {1.0f, 0.0f}}, {"product2", {0.0f, 1.0f}}, {"product3", {h, h}}}, 2);
  const std::vector<float> query{h, h};

  auto r = search::rank(query, idx, 2, 0.5f);
  REQUIRE(r.has_value());
  REQUIRE(r->size() == 2);
  REQUIRE((*r)[0].product_id == "product3");
  REQUIRE((*r)[0].score == Catch::Approx(1.0f).margin(1e-5));
  // product1 and product2 both score ~0.7071; the earlier position wins.
  REQUIRE((*r)[1].product_id == "product1");
  REQUIRE((*r)[1].score == Catch::Approx(h).margin(1e-5));
  REQUIRE((*r)[1].name == "name-product1");
  REQUIRE((*r)[1].image_ref == "/img/product1");
}

TEST_CASE("nothing above the threshold is an empty result", "[search][rank]") {
  auto idx = build({{"a", {1.0f, 0.0f}}}, 2);
  const std::vector<float> query{0.0f, 1.0f};
  auto r = search::rank(query, idx, 5, 0.5f);
  REQUIRE(r.has_value());
  REQUIRE(r->empty());
}

TEST_CASE("ranking returns min(k, n) results in non-increasing order", "[search][rank]") {
  std::mt19937 rng(1234);
  std::vector<std::pair<std::string, std::vector<float>>> rows;
  for (int i = 0; i < 200; ++i) rows.emplace_back("id" + std::to_string(i), random_unit(rng, 16));
  auto idx = build(std::move(rows), 16);
  const auto query = random_unit(rng, 16);

  for (int k : {1, 7, 200, 500}) {
    auto r = search::rank(query, idx, k, -1.0f);
    REQUIRE(r.has_value());
    REQUIRE(r->size() == static_cast<std::size_t>(std::min(k, 200)));
    for (std::size_t i = 1; i < r->size(); ++i) {
      REQUIRE((*r)[i - 1].score >= (*r)[i].score);
    }
  }

  // Self-similarity of a stored vector.
  auto self = search::rank(idx.vector(42), idx, 1, 0.0f);
  REQUIRE((*self)[0].product_id == "id42");
  REQUIRE((*self)[0].score == Catch::Approx(1.0f).margin(1e-5));
}

TEST_CASE("rank rejects bad arguments", "[search][rank]") {
  auto idx = build({{"a", {1.0f, 0.0f}}}, 2);
  const std::vector<float> q2{1.0f, 0.0f};
  const std::vector<float> q3{1.0f, 0.0f, 0.0f};

  REQUIRE(search::rank(q2, idx, 0, 0.0f).error().code == core::error_code::invalid_parameter);
  REQUIRE(search::rank(q2, idx, -3, 0.0f).error().code == core::error_code::invalid_parameter);
  REQUIRE(search::rank(q3, idx, 1, 0.0f).error().code == core::error_code::corrupt_index);

  index::Index empty;
  auto none = search::rank(q3, empty, 5, 0.0f);
  REQUIRE(none.has_value());
  REQUIRE(none->empty());
}

TEST_CASE("classify picks the nearest category centroid", "[search][classify]") {
  auto idx = build({{"s1", {1.0f, 0.0f}}, {"b1", {0.0f, 1.0f}}, {"s2", {0.8f, 0.6f}}, {"b2", {0.6f, 0.8f}}}, 2,
                   {"shoes", "bags", "shoes", "bags"});

  auto centroids = search::category_centroids(idx);
  REQUIRE(centroids.size() == 2);
  REQUIRE(centroids[0].category == "shoes");
  REQUIRE(centroids[0].members == 2);
  REQUIRE(kernels::l2_norm(centroids[1].centroid) == Catch::Approx(1.0).margin(1e-5));

  const std::vector<float> query{0.95f, 0.3122499f};
  auto c = search::classify(query, idx);
  REQUIRE(c.has_value());
  REQUIRE(c->category == "shoes");
  REQUIRE(c->suggested_name == "Uploaded shoes");
  REQUIRE(c->score > 0.9f);
}

TEST_CASE("classify errors", "[search][classify]") {
  const std::vector<float> q{1.0f, 0.0f};
  REQUIRE(search::classify(q, index::Index{}).error().code == core::error_code::not_found);

  auto idx = build({{"a", {1.0f, 0.0f}}}, 2);
  const std::vector<float> q3{1.0f, 0.0f, 0.0f};
  REQUIRE(search::classify(q3, idx).error().code == core::error_code::corrupt_index);

  // Opposite members cancel to a zero mean: no usable centroid.
  auto cancel = build({{"x", {1.0f, 0.0f}}, {"y", {-1.0f, 0.0f}}}, 2);
  REQUIRE(search::classify(q, cancel).error().code == core::error_code::not_found);
}
