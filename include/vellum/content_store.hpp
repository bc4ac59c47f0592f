#pragma once

// vellum/content_store.hpp: Boundary to the replicated document content.
//
// The merge algorithm lives outside this library. The core only consumes
// ordered block snapshots and "something changed" notifications, so any CRDT
// binding that can produce those plugs in behind IContentStore.

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "vellum/types.hpp"

namespace vellum {

// Receives the store version after a committed transaction.
using ContentListener = std::function<void(uint64_t)>;

class IContentStore {
 public:
  virtual ~IContentStore() = default;

  // Ordered copy of the current blocks. Never a live reference.
  virtual std::vector<Block> snapshot() const = 0;
  virtual uint64_t version() const = 0;

  virtual uint64_t subscribe(ContentListener listener) = 0;
  virtual void unsubscribe(uint64_t id) = 0;

  // Replace the whole document state in one transaction (state apply).
  virtual void apply_snapshot(std::vector<Block> blocks) = 0;
};

// ---------------------------------------------------------------------------
// InMemoryContentStore: single-process stand-in for the replicated document
// ---------------------------------------------------------------------------
// Each mutation is a transaction: it runs against a private copy which is
// swapped in only if the mutation returns normally, then observers are
// notified once, outside the lock.
class InMemoryContentStore : public IContentStore {
 public:
  InMemoryContentStore() = default;
  explicit InMemoryContentStore(std::vector<Block> initial);

  std::vector<Block> snapshot() const override;
  uint64_t version() const override;
  uint64_t subscribe(ContentListener listener) override;
  void unsubscribe(uint64_t id) override;
  void apply_snapshot(std::vector<Block> blocks) override;

  // Exceptions thrown by `fn` propagate and leave the store unchanged.
  void transact(const std::function<void(std::vector<Block>&)>& fn);

  // index past the end appends. Fails on empty or duplicate ids.
  bool insert(Block block, size_t index);
  bool append(Block block);
  bool update_payload(const std::string& block_id, const std::string& payload);
  bool remove(const std::string& block_id);
  bool move(const std::string& block_id, size_t new_index);
  void replace_all(std::vector<Block> blocks);

 private:
  void notify(uint64_t version) const;

  mutable std::mutex mu_;
  std::vector<Block> blocks_;
  uint64_t version_{0};

  mutable std::mutex listeners_mu_;
  std::vector<std::pair<uint64_t, ContentListener>> listeners_;
  uint64_t next_listener_id_{1};
};

}  // namespace vellum
