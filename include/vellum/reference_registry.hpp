#pragma once

// vellum/reference_registry.hpp: Registry of cross-document (transclusion)
// pointers.
//
// A reference is a pointer and nothing more. The registry never stores block
// content; resolving a reference always goes through the owning document's
// authority, which re-runs authorization.

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

using ReferenceListener = std::function<void(const ExternalReference&)>;

class ExternalReferenceRegistry {
 public:
  // Inserts or replaces by id. Returns false for an empty id or target.
  bool add(const ExternalReference& ref);
  std::optional<ExternalReference> get(const std::string& id) const;
  bool remove(const std::string& id);
  void clear();

  std::vector<ExternalReference> list() const;
  size_t size() const;

  // Records the outcome of a resolution attempt and stamps last_verified.
  bool update_status(const std::string& id, ReferenceStatus status);

  // Registers one reference per imported block (provenance.origin_doc_id set
  // and not `local_doc_id`). The reference id is the importing block's id;
  // the target block is provenance.source_id. Returns how many were added.
  size_t register_from_blocks(const std::vector<Block>& blocks, const std::string& local_doc_id);

  uint64_t subscribe(ReferenceListener listener);
  void unsubscribe(uint64_t id);

 private:
  void notify(const ExternalReference& ref) const;

  mutable std::mutex mu_;
  std::map<std::string, ExternalReference> refs_;

  mutable std::mutex listeners_mu_;
  std::vector<std::pair<uint64_t, ReferenceListener>> listeners_;
  uint64_t next_listener_id_{1};
};

}  // namespace vellum
