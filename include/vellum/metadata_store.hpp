#pragma once

// vellum/metadata_store.hpp: Shadow store of per-block security metadata.
//
// DESIGN:
//   Security attributes are keyed by stable block id and live apart from the
//   document content, so structural edits (moves, undo, re-parenting) never
//   lose or duplicate them and exported markup never embeds them.
//   Two further maps hold ephemeral state keyed the same way: verification
//   status and capability tokens. Neither is ever persisted.
//
// CONCURRENCY:
//   One mutex guards all maps. Listeners are invoked after the lock is
//   released, in registration order, on the mutating thread.
//
// INVARIANTS:
//   - get() on an unknown id returns nullopt ("no metadata"), never an error.
//   - load_from_snapshot() replaces the whole map in one critical section;
//     no reader ever observes a mix of the old and new document.
//   - Metadata for an id with no matching block grants nothing by itself;
//     the filter only consults ids present in the content snapshot.

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "vellum/types.hpp"

namespace vellum {

// (block_id, new metadata). nullopt means the entry was removed.
using MetadataListener =
    std::function<void(const std::string&, const std::optional<BlockMetadata>&)>;

class MetadataStore {
 public:
  std::optional<BlockMetadata> get(const std::string& block_id) const;
  bool contains(const std::string& block_id) const;
  void set(const std::string& block_id, const BlockMetadata& metadata);
  bool remove(const std::string& block_id);
  void clear();
  void set_many(const std::vector<std::pair<std::string, BlockMetadata>>& entries);

  // Atomically clear then repopulate from the blocks' embedded metadata.
  void load_from_snapshot(const std::vector<Block>& blocks);
  std::map<std::string, BlockMetadata> export_snapshot() const;

  // Copy of `blocks` with shadow metadata merged in by id. Blocks without a
  // shadow entry keep what they carry.
  std::vector<Block> apply_to(std::vector<Block> blocks) const;

  size_t size() const;
  // Incremented on every metadata mutation.
  uint64_t revision() const;

  uint64_t subscribe(MetadataListener listener);
  void unsubscribe(uint64_t id);

  // --- Verification status (ephemeral) ---
  VerificationStatus verification_status(const std::string& block_id) const;
  void set_verification_status(const std::string& block_id, VerificationStatus status);
  std::map<std::string, VerificationStatus> verification_snapshot() const;

  // --- Capability tokens (ephemeral, per (subject snapshot, doc, block) scope) ---
  void put_token(const CapabilityToken& token);
  // Only a token issued to this exact subject snapshot matches.
  std::optional<CapabilityToken> find_token(const Subject& subject, const std::string& doc_id,
                                            const std::string& block_id) const;
  bool remove_token(const std::string& token_id);
  std::vector<CapabilityToken> tokens() const;
  size_t token_count() const;
  // Returns how many tokens were dropped.
  size_t clear_all_tokens();

 private:
  using Change = std::pair<std::string, std::optional<BlockMetadata>>;
  void notify(const std::vector<Change>& changes) const;

  static std::string scope_key(const std::string& subject_id, const std::string& subject_digest,
                               const std::string& doc_id, const std::string& block_id);

  mutable std::mutex mu_;
  std::map<std::string, BlockMetadata> metadata_;
  std::map<std::string, VerificationStatus> verification_;
  std::map<std::string, CapabilityToken> tokens_;  // keyed by scope_key
  uint64_t revision_{0};

  mutable std::mutex listeners_mu_;
  std::vector<std::pair<uint64_t, MetadataListener>> listeners_;
  uint64_t next_listener_id_{1};
};

}  // namespace vellum
