#pragma once

// vellum/snapshot_store.hpp: Persistence boundary for document snapshots.
//
// ON-DISK FORMAT (version::SNAPSHOT_FORMAT_VERSION = 2):
//   line 1: {"digest":"<snap: digest of body>","doc_id":"<id>",
//            "encoding":"identity|zstd","format":2,"original_size":N}
//   rest:   canonical JSON array of blocks, zstd-compressed when encoding says so.
//
// INVARIANTS:
//   - Writes are atomic (temp file + rename in the same directory). A reader
//     sees the old snapshot or the new one, never a mix.
//   - The body digest is checked on every load. A mismatch returns nothing;
//     corrupt content is never handed to the caller.
//   - File names are an injective encoding of the document id, and the header
//     repeats the id. Loading a file whose header names another document
//     fails with snapshot_corrupt.
//   - original_size is capped at kMaxSnapshotBytes and must agree with the
//     zstd frame before anything is allocated.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "vellum/config.hpp"
#include "vellum/types.hpp"

namespace vellum {

constexpr std::uint64_t kMaxSnapshotBytes = 256ull * 1024 * 1024;

class ISnapshotStore {
 public:
  virtual ~ISnapshotStore() = default;
  virtual std::optional<std::vector<Block>> load_snapshot(const std::string& doc_id) = 0;
  virtual bool save_snapshot(const std::string& doc_id, const std::vector<Block>& blocks) = 0;
};

struct SnapshotLoad {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};  // not_found | snapshot_corrupt | io_error
  std::vector<Block> blocks;
  std::string detail;
};

class FileSnapshotStore : public ISnapshotStore {
 public:
  explicit FileSnapshotStore(std::string root,
                             SnapshotCompression compression = SnapshotCompression::off);

  std::optional<std::vector<Block>> load_snapshot(const std::string& doc_id) override;
  bool save_snapshot(const std::string& doc_id, const std::vector<Block>& blocks) override;

  SnapshotLoad load_detailed(const std::string& doc_id) const;

  bool exists(const std::string& doc_id) const;
  bool remove(const std::string& doc_id);
  std::vector<std::string> list() const;

  std::string path_for(const std::string& doc_id) const;
  const std::string& root() const { return root_; }

  // [A-Za-z0-9_-] pass through, every other byte becomes %xx, "" becomes "~".
  // Long ids keep an encoded prefix followed by "~" and a BLAKE3 digest.
  static std::string encode_doc_id(const std::string& doc_id);

 private:
  std::string root_;
  SnapshotCompression compression_;
};

}  // namespace vellum
