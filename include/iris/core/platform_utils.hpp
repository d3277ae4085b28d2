#pragma once

#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace iris::core {

/** \brief Value of an IRIS_* environment variable, or nullopt when unset or empty.
 *
 * MSVC deprecates std::getenv; there the value is copied out with _dupenv_s.
 */
inline std::optional<std::string> getenv_nonempty(const char* name) noexcept {
  if (name == nullptr || *name == '\0') return std::nullopt;
  std::string value;
#if defined(_WIN32)
  char* raw = nullptr;
  std::size_t raw_len = 0;
  if (_dupenv_s(&raw, &raw_len, name) == 0 && raw != nullptr) value = raw;
  std::free(raw);
#else
  if (const char* raw = std::getenv(name)) value = raw;
#endif
  if (value.empty()) return std::nullopt;
  return value;
}

// Strict numeric parse of the whole string; nullopt on trailing garbage or overflow.
template <typename T>
inline std::optional<T> parse_number(std::string_view s) noexcept {
  T out{};
  const auto* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, out);
  if (res.ec != std::errc{} || res.ptr != end) return std::nullopt;
  return out;
}

} // namespace iris::core
