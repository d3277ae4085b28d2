#include "iris/index/index_file.hpp"

#include <bit>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

#ifdef IRIS_HAS_ZSTD
#include <zstd.h>
#endif

#include "iris/core/atomic_file.hpp"
#include "iris/core/checksum.hpp"

namespace iris::index {

namespace {

constexpr const char* kComponent = "index.file";
constexpr char kMagic[8] = {'I', 'R', 'I', 'S', '-', 'I', 'D', 'X'};
constexpr std::uint32_t kSecMetadata = 1;
constexpr std::uint32_t kSecVectors = 2;
// Guards against absurd allocations from a damaged header.
constexpr std::uint64_t kMaxSectionBytes = std::uint64_t{1} << 34;

auto corrupt(std::string message) -> std::unexpected<core::error> {
  return core::make_unexpected(core::error_code::corrupt_index, std::move(message), kComponent);
}

class ByteWriter {
public:
  void u32(std::uint32_t v) { put_le(v, 4); }
  void u64(std::uint64_t v) { put_le(v, 8); }
  void i64(std::int64_t v) { put_le(static_cast<std::uint64_t>(v), 8); }
  void f32(float v) { u32(std::bit_cast<std::uint32_t>(v)); }
  void bytes(const void* p, std::size_t n) {
    const auto* b = static_cast<const std::uint8_t*>(p);
    buf_.insert(buf_.end(), b, b + n);
  }
  void str(std::string_view s) {
    u32(static_cast<std::uint32_t>(s.size()));
    bytes(s.data(), s.size());
  }
  auto data() -> std::vector<std::uint8_t>& { return buf_; }

private:
  void put_le(std::uint64_t v, int n) {
    for (int i = 0; i < n; ++i) buf_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
  }
  std::vector<std::uint8_t> buf_;
};

class ByteReader {
public:
  explicit ByteReader(std::span<const std::uint8_t> b) : b_(b) {}

  bool u32(std::uint32_t& v) { std::uint64_t t; if (!get_le(t, 4)) return false; v = static_cast<std::uint32_t>(t); return true; }
  bool u64(std::uint64_t& v) { return get_le(v, 8); }
  bool i64(std::int64_t& v) { std::uint64_t t; if (!get_le(t, 8)) return false; v = static_cast<std::int64_t>(t); return true; }
  bool take(std::size_t n, std::span<const std::uint8_t>& out) {
    if (remaining() < n) return false;
    out = b_.subspan(pos_, n);
    pos_ += n;
    return true;
  }
  bool str(std::string& s) {
    std::uint32_t n = 0;
    std::span<const std::uint8_t> raw;
    if (!u32(n) || !take(n, raw)) return false;
    s.assign(reinterpret_cast<const char*>(raw.data()), raw.size());
    return true;
  }
  [[nodiscard]] auto remaining() const -> std::size_t { return b_.size() - pos_; }
  [[nodiscard]] auto offset() const -> std::size_t { return pos_; }

private:
  bool get_le(std::uint64_t& v, int n) {
    if (remaining() < static_cast<std::size_t>(n)) return false;
    v = 0;
    for (int i = 0; i < n; ++i) v |= static_cast<std::uint64_t>(b_[pos_ + i]) << (8 * i);
    pos_ += static_cast<std::size_t>(n);
    return true;
  }
  std::span<const std::uint8_t> b_;
  std::size_t pos_{0};
};

void write_section(ByteWriter& w, std::uint32_t type, const std::vector<std::uint8_t>& raw,
                   int zstd_level) {
  const std::uint8_t* payload = raw.data();
  std::size_t payload_size = raw.size();
  std::vector<std::uint8_t> packed;
#ifdef IRIS_HAS_ZSTD
  if (zstd_level > 0 && !raw.empty()) {
    packed.resize(ZSTD_compressBound(raw.size()));
    const std::size_t got = ZSTD_compress(packed.data(), packed.size(), raw.data(), raw.size(), zstd_level);
    if (!ZSTD_isError(got) && got < raw.size()) {
      payload = packed.data();
      payload_size = got;
    }
  }
#else
  (void)zstd_level;
#endif
  w.u32(type);
  w.u64(raw.size());
  w.u64(payload_size);
  w.u32(core::crc32c(raw));
  w.bytes(payload, payload_size);
}

auto read_section(ByteReader& r, std::uint32_t expected_type)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  std::uint32_t type = 0, crc = 0;
  std::uint64_t unc = 0, comp = 0;
  if (!r.u32(type) || !r.u64(unc) || !r.u64(comp) || !r.u32(crc)) return corrupt("section header truncated");
  if (type != expected_type) return corrupt("unexpected section type " + std::to_string(type));
  if (unc > kMaxSectionBytes || comp > kMaxSectionBytes) return corrupt("section size out of range");
  std::span<const std::uint8_t> payload;
  if (!r.take(static_cast<std::size_t>(comp), payload)) return corrupt("section payload truncated");

  std::vector<std::uint8_t> raw;
  if (comp == unc) {
    raw.assign(payload.begin(), payload.end());
  } else {
#ifdef IRIS_HAS_ZSTD
    raw.resize(static_cast<std::size_t>(unc));
    const std::size_t got = ZSTD_decompress(raw.data(), raw.size(), payload.data(), payload.size());
    if (ZSTD_isError(got) || got != raw.size()) return corrupt("section decompression failed");
#else
    return core::make_unexpected(core::error_code::unsupported,
                                 "index section is zstd-compressed but zstd support is not built in",
                                 kComponent);
#endif
  }
  if (core::crc32c(raw) != crc) return corrupt("section checksum mismatch (type " + std::to_string(type) + ")");
  return raw;
}

} // namespace

auto encode_index(const Index& index, const IndexFileOptions& options)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  if (index.size() > UINT32_MAX) {
    return core::make_unexpected(core::error_code::invalid_parameter, "too many records for format v1",
                                 kComponent);
  }
  const auto& meta = index.meta();

  ByteWriter w;
  w.bytes(kMagic, sizeof(kMagic));
  w.u32(kIndexFormatVersion);
  w.u32(0);
  w.u64(meta.version);
  w.u32(meta.dimension);
  w.u32(static_cast<std::uint32_t>(index.size()));
  w.i64(meta.created_at_ms);
  w.str(meta.model_name);
  w.u32(core::crc32c(w.data()));

  ByteWriter md;
  for (std::size_t i = 0; i < index.size(); ++i) {
    const auto& p = index.product(i);
    md.str(p.id);
    md.str(p.name);
    md.str(p.category);
    md.str(p.image_ref);
  }
  ByteWriter vec;
  for (std::size_t i = 0; i < index.size(); ++i) {
    for (float f : index.vector(i)) vec.f32(f);
  }

  write_section(w, kSecMetadata, md.data(), options.zstd_level);
  write_section(w, kSecVectors, vec.data(), options.zstd_level);
  return std::move(w.data());
}

namespace {

struct FileHeader {
  IndexMeta meta;
  std::uint32_t count{0};
};

auto read_header(ByteReader& r, std::span<const std::uint8_t> bytes) -> std::expected<FileHeader, core::error> {
  std::span<const std::uint8_t> magic;
  if (!r.take(sizeof(kMagic), magic) || std::memcmp(magic.data(), kMagic, sizeof(kMagic)) != 0) {
    return corrupt("bad magic");
  }

  std::uint32_t format = 0, flags = 0, header_crc = 0;
  FileHeader h;
  if (!r.u32(format) || !r.u32(flags) || !r.u64(h.meta.version) || !r.u32(h.meta.dimension) ||
      !r.u32(h.count) || !r.i64(h.meta.created_at_ms) || !r.str(h.meta.model_name)) {
    return corrupt("header truncated");
  }
  const std::size_t header_end = r.offset();
  if (!r.u32(header_crc)) return corrupt("header truncated");
  if (core::crc32c(bytes.first(header_end)) != header_crc) return corrupt("header checksum mismatch");
  if (format != kIndexFormatVersion) return corrupt("unsupported format version " + std::to_string(format));
  if (flags != 0) return corrupt("unknown header flags " + std::to_string(flags));
  return h;
}

} // namespace

auto peek_index_version(std::span<const std::uint8_t> bytes) -> std::optional<std::uint64_t> {
  ByteReader r(bytes);
  auto h = read_header(r, bytes);
  if (!h) return std::nullopt;
  return h->meta.version;
}

auto decode_index(std::span<const std::uint8_t> bytes) -> std::expected<Index, core::error> {
  ByteReader r(bytes);
  auto header = read_header(r, bytes);
  if (!header) return std::unexpected(header.error());
  IndexMeta meta = std::move(header->meta);
  const std::uint32_t dim = meta.dimension;
  const std::uint32_t count = header->count;

  auto md = read_section(r, kSecMetadata);
  if (!md) return std::unexpected(md.error());
  auto vec = read_section(r, kSecVectors);
  if (!vec) return std::unexpected(vec.error());
  if (r.remaining() != 0) return corrupt("trailing bytes after vector section");

  if (vec->size() != static_cast<std::size_t>(count) * dim * sizeof(float)) {
    return corrupt("vector section holds " + std::to_string(vec->size()) + " bytes, header implies " +
                   std::to_string(static_cast<std::size_t>(count) * dim * sizeof(float)));
  }

  if (count > 0 && (dim == 0 || md->size() < static_cast<std::size_t>(count) * 16)) {
    return corrupt("header record count does not match section contents");
  }

  std::vector<IndexEntry> entries(count);
  ByteReader mr(*md);
  ByteReader vr(*vec);
  for (auto& e : entries) {
    if (!mr.str(e.product.id) || !mr.str(e.product.name) || !mr.str(e.product.category) ||
        !mr.str(e.product.image_ref)) {
      return corrupt("metadata section truncated");
    }
    e.vector.resize(dim);
    for (auto& f : e.vector) {
      std::uint32_t bits = 0;
      if (!vr.u32(bits)) return corrupt("vector section truncated");
      f = std::bit_cast<float>(bits);
    }
  }
  if (mr.remaining() != 0) return corrupt("metadata section has trailing bytes");

  return Index::build(std::move(meta), std::move(entries));
}

auto write_index_file(const std::filesystem::path& path, const Index& index,
                      const IndexFileOptions& options) -> std::expected<void, core::error> {
  auto bytes = encode_index(index, options);
  if (!bytes) return std::unexpected(bytes.error());
  return core::write_file_atomic(path, *bytes);
}

auto read_index_file(const std::filesystem::path& path) -> std::expected<Index, core::error> {
  auto bytes = core::read_file(path);
  if (!bytes) return std::unexpected(bytes.error());
  return decode_index(*bytes);
}

} // namespace iris::index
