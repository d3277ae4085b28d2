#include <iris/core/platform_utils.hpp>
#include <iris/engine.hpp>
#include <iris/error.hpp>

#ifdef IRIS_HAS_ONNX
#include <iris/embed/onnx_clip_encoder.hpp>
#endif

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

struct Args {
  std::string command;
  std::optional<std::string> data_dir;
  std::optional<std::string> image;
  std::optional<std::string> name;
  std::optional<std::string> category;
  std::optional<std::string> id;
  std::optional<std::string> top_k;
  std::optional<std::string> min_score;
};

void print_usage() {
  std::cout << "Usage: iris_cli <command> [--data_dir=DIR] [options]\n"
               "  products                                   list the catalog\n"
               "  product --id=ID                            show one product\n"
               "  add --name=N --category=C --image=REF      add a product and rebuild\n"
               "  search --image=REF [--top_k=K] [--min_score=S]\n"
               "  classify --image=REF                       suggest a category\n"
               "  rebuild                                    full re-encode of the catalog\n"
               "  stats                                      index, cache and rebuild counters\n"
               "REF is a local path or an http(s) URL. Environment: IRIS_* (see config.hpp).\n";
}

int fail(std::string_view kind, std::string_view detail) {
  std::cout << json{{"error", kind}, {"detail", detail}}.dump(2) << "\n";
  return 1;
}

int fail(const iris::core::error& e) {
  return fail(iris::core::to_string(e.code), e.message);
}

json to_json(const iris::catalog::Product& p) {
  return {{"id", p.id}, {"name", p.name}, {"category", p.category}, {"image_url", p.image_ref}};
}

json to_json(const iris::rebuild::RebuildOutcome& o) {
  json excluded = json::array();
  for (const auto& x : o.excluded) {
    excluded.push_back({{"product_id", x.product_id},
                        {"error", iris::core::to_string(x.error.code)},
                        {"detail", x.error.message}});
  }
  json j{{"status", iris::rebuild::status_name(o.status)},
         {"index_version", o.index_version},
         {"included", o.included},
         {"encoded", o.encoded},
         {"excluded", excluded},
         {"elapsed_ms", o.elapsed.count()}};
  if (o.error) j["error"] = {{"kind", iris::core::to_string(o.error->code)}, {"detail", o.error->message}};
  return j;
}

bool missing(const std::optional<std::string>& v) { return !v || v->empty(); }

} // namespace

int main(int argc, char** argv) {
  Args args;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](std::string k) { return a.rfind(k, 0) == 0 ? std::optional<std::string>(a.substr(k.size())) : std::nullopt; };
    if (a == "--help" || a == "-h") { print_usage(); return 0; }
    else if (auto v = eat("--data_dir=")) args.data_dir = *v;
    else if (auto v = eat("--image=")) args.image = *v;
    else if (auto v = eat("--name=")) args.name = *v;
    else if (auto v = eat("--category=")) args.category = *v;
    else if (auto v = eat("--id=")) args.id = *v;
    else if (auto v = eat("--top_k=")) args.top_k = *v;
    else if (auto v = eat("--min_score=")) args.min_score = *v;
    else if (a.rfind("--", 0) == 0) return fail("invalid_parameter", "unknown flag " + a);
    else if (args.command.empty()) args.command = a;
    else return fail("invalid_parameter", "unexpected argument " + a);
  }
  if (args.command.empty()) { print_usage(); return 1; }

  auto cfg = iris::load_config_from_env();
  if (!cfg) return fail(cfg.error());
  if (args.data_dir) cfg->data_dir = *args.data_dir;

  iris::EngineDeps deps;
#ifdef IRIS_HAS_ONNX
  if (cfg->encoder.kind == "onnx-clip") {
    auto enc = iris::embed::OnnxClipEncoder::open(iris::embed::OnnxClipOptions{cfg->encoder.onnx_model});
    if (!enc) return fail(enc.error());
    deps.encoder = std::move(*enc);
  }
#endif

  auto engine = iris::Engine::open(*cfg, deps);
  if (!engine) return fail(engine.error());
  auto& e = **engine;

  if (args.command == "products") {
    json out = json::array();
    for (const auto& p : e.list_products()) out.push_back(to_json(p));
    std::cout << out.dump(2) << "\n";
    return 0;
  }
  if (args.command == "product") {
    if (missing(args.id)) return fail("invalid_parameter", "--id is required");
    auto p = e.find_product(*args.id);
    if (!p) return fail(p.error());
    std::cout << to_json(*p).dump(2) << "\n";
    return 0;
  }
  if (args.command == "add") {
    auto added = e.add_product({args.name.value_or(""), args.category.value_or(""), args.image.value_or("")});
    if (!added) return fail(added.error());
    std::cout << json{{"product", to_json(added->product)}, {"rebuild", to_json(added->rebuild)}}.dump(2) << "\n";
    return 0;
  }
  if (args.command == "search" || args.command == "classify") {
    if (missing(args.image)) return fail("invalid_parameter", "--image is required");
    const auto& image = args.image;
    if (args.command == "classify") {
      auto c = e.classify(*image);
      if (!c) return fail(c.error());
      std::cout << json{{"category", c->category}, {"score", c->score}, {"suggested_name", c->suggested_name}}.dump(2)
                << "\n";
      return 0;
    }
    std::optional<int> top_k;
    std::optional<float> min_score;
    if (args.top_k) {
      auto v = iris::core::parse_number<int>(*args.top_k);
      if (!v) return fail("invalid_parameter", "--top_k must be an integer");
      top_k = *v;
    }
    if (args.min_score) {
      auto v = iris::core::parse_number<float>(*args.min_score);
      if (!v) return fail("invalid_parameter", "--min_score must be a number");
      min_score = *v;
    }
    auto results = e.search(*image, top_k, min_score);
    if (!results) return fail(results.error());
    json arr = json::array();
    for (const auto& r : *results) {
      arr.push_back({{"id", r.product_id}, {"name", r.name}, {"category", r.category},
                     {"image_url", r.image_ref}, {"score", r.score}});
    }
    std::cout << json{{"index_version", e.snapshot()->version()}, {"results", arr}}.dump(2) << "\n";
    return 0;
  }
  if (args.command == "rebuild") {
    auto outcome = e.full_rebuild();
    std::cout << to_json(outcome).dump(2) << "\n";
    return outcome.ok() ? 0 : 1;
  }
  if (args.command == "stats") {
    const auto s = e.stats();
    json rebuild{{"requests", s.rebuild.requests}, {"completed", s.rebuild.completed},
                 {"failed", s.rebuild.failed}, {"cancelled", s.rebuild.cancelled},
                 {"pending", s.rebuild.pending}, {"running", s.rebuild.running}};
    std::cout << json{{"index_version", s.index_version},
                      {"index_records", s.index_records},
                      {"dimension", s.dimension},
                      {"model", s.model_name},
                      {"catalog_size", s.catalog_size},
                      {"cache", {{"hits", s.cache.hits}, {"misses", s.cache.misses},
                                 {"entries", s.cache.entries}, {"bytes", s.cache.bytes_used},
                                 {"disk_hits", s.cache.disk_hits}}},
                      {"rebuild", rebuild}}
                     .dump(2)
              << "\n";
    return 0;
  }
  return fail("invalid_parameter", "unknown command '" + args.command + "'");
}
