#include "iris/core/atomic_file.hpp"

#include <atomic>
#include <fstream>
#include <string>
#include <thread>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif
#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace iris::core {

namespace {

// Concurrent writers of the same destination each get their own temporary file;
// the last rename wins.
auto temp_sibling(const std::filesystem::path& dst) -> std::filesystem::path {
  static std::atomic<std::uint64_t> counter{0};
  const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
  auto name = dst.filename().string();
  name += ".tmp.";
  name += std::to_string(tid & 0xFFFFFFu);
  name += '.';
  name += std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
  return dst.parent_path() / name;
}

} // namespace

auto write_file_atomic(const std::filesystem::path& dst, std::span<const std::uint8_t> bytes)
    -> std::expected<void, error> {
  const std::string component = "core.atomic_file";
  const auto p_tmp = temp_sibling(dst);
  std::error_code rec;

  // 1) Write tmp
  {
    std::ofstream out(p_tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      return make_unexpected(error_code::io_failed, "tmp open failed: " + p_tmp.string(), component);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out.good()) {
      out.close();
      (void)std::filesystem::remove(p_tmp, rec);
      return make_unexpected(error_code::io_failed, "tmp write failed: " + p_tmp.string(), component);
    }
  }
  // 2) Ensure tmp contents durable
#if defined(__linux__) || defined(__APPLE__)
  {
    int fd = ::open(p_tmp.string().c_str(), O_RDONLY);
    if (fd < 0) {
      (void)std::filesystem::remove(p_tmp, rec);
      return make_unexpected(error_code::io_failed, "tmp fsync open failed", component);
    }
    (void)::fsync(fd);
    (void)::close(fd);
  }
#elif defined(_WIN32)
  {
    HANDLE h = ::CreateFileW(p_tmp.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                             FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                             nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h != INVALID_HANDLE_VALUE) {
      (void)::FlushFileBuffers(h);
      ::CloseHandle(h);
    }
  }
#endif
  // 3) Atomic replace
#if defined(_WIN32)
  {
    BOOL ok = ::MoveFileExW(p_tmp.wstring().c_str(), dst.wstring().c_str(),
                            MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH);
    if (!ok) {
      (void)std::filesystem::remove(p_tmp, rec);
      return make_unexpected(error_code::io_failed, "replace failed: " + dst.string(), component);
    }
  }
#else
  {
    std::error_code ec;
    std::filesystem::rename(p_tmp, dst, ec);
    if (ec) {
      (void)std::filesystem::remove(p_tmp, rec);
      return make_unexpected(error_code::io_failed,
                             "rename failed: " + dst.string() + ": " + ec.message(), component);
    }
    const auto dir = dst.has_parent_path() ? dst.parent_path() : std::filesystem::path(".");
    int dfd = ::open(dir.string().c_str(), O_RDONLY);
    if (dfd >= 0) { (void)::fsync(dfd); (void)::close(dfd); }
  }
#endif
  return {};
}

auto write_file_atomic(const std::filesystem::path& dst, std::string_view text)
    -> std::expected<void, error> {
  return write_file_atomic(dst, std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

auto read_file(const std::filesystem::path& p) -> std::expected<std::vector<std::uint8_t>, error> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) {
    return make_unexpected(error_code::not_found, "no such file: " + p.string(), "core.atomic_file");
  }
  std::ifstream in(p, std::ios::binary);
  if (!in.good()) {
    return make_unexpected(error_code::io_failed, "open failed: " + p.string(), "core.atomic_file");
  }
  in.seekg(0, std::ios::end);
  const auto size = in.tellg();
  if (size < 0) {
    return make_unexpected(error_code::io_failed, "size query failed: " + p.string(), "core.atomic_file");
  }
  in.seekg(0, std::ios::beg);
  std::vector<std::uint8_t> buf(static_cast<std::size_t>(size));
  if (!buf.empty()) {
    in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (in.gcount() != static_cast<std::streamsize>(buf.size())) {
      return make_unexpected(error_code::io_failed, "short read: " + p.string(), "core.atomic_file");
    }
  }
  return buf;
}

} // namespace iris::core
