#include "vellum/snapshot_store.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>

#if defined(VELLUM_WITH_ZSTD)
#include <zstd.h>
#endif

#include "vellum/hash.hpp"
#include "vellum/observability.hpp"
#include "vellum/version.hpp"

namespace fs = std::filesystem;

namespace vellum {

namespace {

constexpr const char* kExtension = ".vsnap";

// Encoded names longer than this keep a prefix and a digest of the full id.
constexpr std::size_t kMaxStemBytes = 160;

#if defined(VELLUM_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

// The frame must declare its content size and it must match the header.
// Nothing is allocated before both agree.
std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  const unsigned long long declared = ZSTD_getFrameContentSize(data.data(), data.size());
  if (declared == ZSTD_CONTENTSIZE_ERROR || declared == ZSTD_CONTENTSIZE_UNKNOWN) {
    return std::nullopt;
  }
  if (declared != original_size || declared > kMaxSnapshotBytes) return std::nullopt;
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return std::nullopt;
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Write to a temp file, then rename into place. rename() is atomic within
// one filesystem on POSIX.
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

bool read_header_line(const fs::path& path, jsonlite::Object* header) {
  std::ifstream ifs(path, std::ios::binary);
  std::string line;
  if (!ifs || !std::getline(ifs, line)) return false;
  std::optional<jsonlite::JsonError> err;
  *header = jsonlite::parse(line, &err);
  return !err;
}

SnapshotLoad load_error(ErrorCode code, std::string detail) {
  SnapshotLoad r;
  r.error_code = code;
  r.detail = std::move(detail);
  return r;
}

}  // namespace

FileSnapshotStore::FileSnapshotStore(std::string root, SnapshotCompression compression)
    : root_(std::move(root)), compression_(compression) {
#if !defined(VELLUM_WITH_ZSTD)
  if (compression_ == SnapshotCompression::zstd) {
    log_event(LogLevel::warn, "snapshot_store", "zstd_unavailable", "writing identity encoding");
    compression_ = SnapshotCompression::off;
  }
#endif
}

std::string FileSnapshotStore::encode_doc_id(const std::string& doc_id) {
  static constexpr char kHex[] = "0123456789abcdef";
  if (doc_id.empty()) return "~";
  std::string out;
  out.reserve(doc_id.size());
  std::size_t consumed = 0;
  for (const char ch : doc_id) {
    const auto c = static_cast<unsigned char>(ch);
    const bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                      (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (safe) {
      out += ch;
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0f];
    }
    if (out.size() > kMaxStemBytes) break;
    ++consumed;
  }
  if (consumed == doc_id.size()) return out;
  // '~' is always escaped above, so this form cannot collide with a short name.
  out.resize(kMaxStemBytes / 2);
  while (!out.empty() && (out.back() == '%' || (out.size() >= 2 && out[out.size() - 2] == '%'))) {
    out.pop_back();
  }
  return out + "~" + blake3_hex(doc_id).substr(0, 32);
}

std::string FileSnapshotStore::path_for(const std::string& doc_id) const {
  return (fs::path(root_) / (encode_doc_id(doc_id) + kExtension)).string();
}

bool FileSnapshotStore::exists(const std::string& doc_id) const {
  std::error_code ec;
  return fs::exists(path_for(doc_id), ec);
}

bool FileSnapshotStore::remove(const std::string& doc_id) {
  std::error_code ec;
  return fs::remove(path_for(doc_id), ec);
}

std::vector<std::string> FileSnapshotStore::list() const {
  std::vector<std::string> out;
  std::error_code ec;
  if (!fs::is_directory(root_, ec)) return out;
  for (const auto& entry : fs::directory_iterator(root_, ec)) {
    if (!entry.is_regular_file()) continue;
    const auto& p = entry.path();
    if (p.extension() != kExtension) continue;
    jsonlite::Object header;
    if (!read_header_line(p, &header)) continue;
    const std::string id = jsonlite::get_string(header, "doc_id");
    if (!id.empty() || jsonlite::get_u64(header, "format", 0) >= 2) {
      out.push_back(id);
    } else {
      out.push_back(p.stem().string());
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

bool FileSnapshotStore::save_snapshot(const std::string& doc_id,
                                      const std::vector<Block>& blocks) {
  const std::string body = blocks_to_json(blocks);
  std::string encoded = body;
  std::string encoding = "identity";
#if defined(VELLUM_WITH_ZSTD)
  if (compression_ == SnapshotCompression::zstd) {
    std::string compressed = compress_zstd(body);
    if (!compressed.empty()) {
      encoded = std::move(compressed);
      encoding = "zstd";
    }
  }
#endif

  jsonlite::Object header;
  header["doc_id"] = jsonlite::Value{doc_id};
  header["format"] = jsonlite::Value{static_cast<std::uint64_t>(version::SNAPSHOT_FORMAT_VERSION)};
  header["encoding"] = jsonlite::Value{encoding};
  header["original_size"] = jsonlite::Value{static_cast<std::uint64_t>(body.size())};
  header["digest"] = jsonlite::Value{snapshot_body_hash(body)};

  const std::string data = jsonlite::to_json(jsonlite::Value{std::move(header)}) + "\n" + encoded;
  if (!atomic_write(path_for(doc_id), data)) {
    log_event(LogLevel::error, "snapshot_store", "write_failed", path_for(doc_id));
    return false;
  }
  return true;
}

SnapshotLoad FileSnapshotStore::load_detailed(const std::string& doc_id) const {
  const std::string path = path_for(doc_id);
  std::error_code ec;
  if (!fs::exists(path, ec)) return load_error(ErrorCode::not_found, path);

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return load_error(ErrorCode::io_error, path);
  const std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

  const auto nl = data.find('\n');
  if (nl == std::string::npos) return load_error(ErrorCode::snapshot_corrupt, "missing header");

  std::optional<jsonlite::JsonError> err;
  const auto header = jsonlite::parse(data.substr(0, nl), &err);
  if (err) return load_error(ErrorCode::snapshot_corrupt, "bad header: " + err->message);

  const uint64_t format = jsonlite::get_u64(header, "format", 0);
  if (format == 0 || format > version::SNAPSHOT_FORMAT_VERSION) {
    return load_error(ErrorCode::snapshot_corrupt, "unsupported format " + std::to_string(format));
  }

  // Format 1 predates the doc_id field; from format 2 on it must name this document.
  if (format >= 2 && jsonlite::get_string(header, "doc_id") != doc_id) {
    log_event(LogLevel::error, "snapshot_store", "doc_id_mismatch", path);
    return load_error(ErrorCode::snapshot_corrupt, "snapshot belongs to another document");
  }

  const std::string encoding = jsonlite::get_string(header, "encoding", "identity");
  const uint64_t original_size = jsonlite::get_u64(header, "original_size", 0);
  if (original_size > kMaxSnapshotBytes) {
    return load_error(ErrorCode::snapshot_corrupt,
                      "original_size " + std::to_string(original_size) + " exceeds limit");
  }
  const std::string expected = jsonlite::get_string(header, "digest");
  std::string body = data.substr(nl + 1);

  if (encoding == "zstd") {
#if defined(VELLUM_WITH_ZSTD)
    auto decoded = decompress_zstd(body, static_cast<std::size_t>(original_size));
    if (!decoded) return load_error(ErrorCode::snapshot_corrupt, "zstd decode failed");
    body = std::move(*decoded);
#else
    return load_error(ErrorCode::snapshot_corrupt, "zstd snapshot but built without zstd");
#endif
  } else if (encoding != "identity") {
    return load_error(ErrorCode::snapshot_corrupt, "unknown encoding " + encoding);
  }

  if (body.size() != original_size || !digest_equal(snapshot_body_hash(body), expected)) {
    log_event(LogLevel::error, "snapshot_store", "digest_mismatch", path);
    return load_error(ErrorCode::snapshot_corrupt, "body digest mismatch");
  }

  auto blocks = blocks_from_json(body, &err);
  if (!blocks) return load_error(ErrorCode::snapshot_corrupt, "bad body: " + err->message);

  SnapshotLoad r;
  r.ok = true;
  r.blocks = std::move(*blocks);
  return r;
}

std::optional<std::vector<Block>> FileSnapshotStore::load_snapshot(const std::string& doc_id) {
  SnapshotLoad r = load_detailed(doc_id);
  if (!r.ok) return std::nullopt;
  return std::move(r.blocks);
}

}  // namespace vellum
