#include "iris/image/image_ref.hpp"

#include <algorithm>
#include <cctype>
#include <type_traits>

namespace iris::image {

namespace {

constexpr std::string_view kComponent = "image.ref";

auto to_lower(std::string_view s) -> std::string {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto starts_with_ci(std::string_view s, std::string_view prefix) -> bool {
  if (s.size() < prefix.size()) return false;
  return to_lower(s.substr(0, prefix.size())) == prefix;
}

auto trim(std::string_view s) -> std::string_view {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

auto parse_remote(std::string_view raw) -> std::expected<ImageRef, core::error> {
  const auto sep = raw.find("://");
  const std::string scheme = to_lower(raw.substr(0, sep));
  std::string_view rest = raw.substr(sep + 3);

  // Fragment never reaches the server.
  if (auto hash = rest.find('#'); hash != std::string_view::npos) rest = rest.substr(0, hash);

  const auto path_pos = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, path_pos);
  std::string path_and_query =
      path_pos == std::string_view::npos ? std::string("/") : std::string(rest.substr(path_pos));
  if (!path_and_query.empty() && path_and_query.front() == '?') path_and_query.insert(0, "/");

  std::string userinfo;
  if (auto at = authority.rfind('@'); at != std::string_view::npos) {
    userinfo = std::string(authority.substr(0, at + 1));
    authority = authority.substr(at + 1);
  }

  std::string host;
  std::string port;
  if (!authority.empty() && authority.front() == '[') {
    // IPv6 literal
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return core::make_unexpected(core::error_code::invalid_parameter,
                                   "malformed IPv6 host in '" + std::string(raw) + "'",
                                   std::string(kComponent));
    }
    host = to_lower(authority.substr(0, close + 1));
    if (close + 1 < authority.size() && authority[close + 1] == ':') {
      port = std::string(authority.substr(close + 2));
    }
  } else {
    const auto colon = authority.rfind(':');
    host = to_lower(authority.substr(0, colon));
    if (colon != std::string_view::npos) port = std::string(authority.substr(colon + 1));
  }

  if (host.empty()) {
    return core::make_unexpected(core::error_code::invalid_parameter,
                                 "URL without host: '" + std::string(raw) + "'",
                                 std::string(kComponent));
  }
  if (!port.empty() && !std::all_of(port.begin(), port.end(),
                                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return core::make_unexpected(core::error_code::invalid_parameter,
                                 "malformed port in '" + std::string(raw) + "'",
                                 std::string(kComponent));
  }
  if ((scheme == "http" && port == "80") || (scheme == "https" && port == "443")) port.clear();

  RemoteRef r;
  r.scheme = scheme;
  r.host = host;
  r.url = scheme + "://" + userinfo + host + (port.empty() ? "" : ":" + port) + path_and_query;
  return ImageRef{std::move(r)};
}

auto parse_local(std::string_view raw) -> ImageRef {
  std::filesystem::path p{std::string(raw)};
  std::error_code ec;
  auto abs = std::filesystem::absolute(p, ec);
  if (ec) abs = p;
  // weakly_canonical resolves the existing prefix and normalizes the rest.
  auto canon = std::filesystem::weakly_canonical(abs, ec);
  if (ec) canon = abs.lexically_normal();
  return ImageRef{LocalRef{std::move(canon)}};
}

} // namespace

auto parse_image_ref(std::string_view raw) -> std::expected<ImageRef, core::error> {
  raw = trim(raw);
  if (raw.empty()) {
    return core::make_unexpected(core::error_code::invalid_parameter, "empty image reference",
                                 std::string(kComponent));
  }
  if (starts_with_ci(raw, "http://") || starts_with_ci(raw, "https://")) {
    return parse_remote(raw);
  }
  if (starts_with_ci(raw, "file://")) {
    auto rest = raw.substr(7);
    if (rest.empty()) {
      return core::make_unexpected(core::error_code::invalid_parameter, "empty file:// reference",
                                   std::string(kComponent));
    }
    return parse_local(rest);
  }
  if (auto sep = raw.find("://"); sep != std::string_view::npos) {
    return core::make_unexpected(core::error_code::invalid_parameter,
                                 "unsupported URL scheme '" + std::string(raw.substr(0, sep)) + "'",
                                 std::string(kComponent));
  }
  return parse_local(raw);
}

auto canonical_key(const ImageRef& ref) -> std::string {
  return std::visit([](const auto& r) -> std::string {
    using T = std::decay_t<decltype(r)>;
    if constexpr (std::is_same_v<T, LocalRef>) {
      return "file:" + r.path.generic_string();
    } else {
      return "url:" + r.url;
    }
  }, ref);
}

auto describe(const ImageRef& ref) -> std::string {
  return std::visit([](const auto& r) -> std::string {
    using T = std::decay_t<decltype(r)>;
    if constexpr (std::is_same_v<T, LocalRef>) {
      return r.path.string();
    } else {
      return r.url;
    }
  }, ref);
}

} // namespace iris::image
