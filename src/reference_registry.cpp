#include "vellum/reference_registry.hpp"

#include <algorithm>
#include <exception>

#include "vellum/observability.hpp"

namespace vellum {

bool ExternalReferenceRegistry::add(const ExternalReference& ref) {
  if (ref.id.empty() || ref.target_doc_id.empty() || ref.target_block_id.empty()) return false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    refs_[ref.id] = ref;
  }
  notify(ref);
  return true;
}

std::optional<ExternalReference> ExternalReferenceRegistry::get(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = refs_.find(id);
  if (it == refs_.end()) return std::nullopt;
  return it->second;
}

bool ExternalReferenceRegistry::remove(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  return refs_.erase(id) != 0;
}

void ExternalReferenceRegistry::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  refs_.clear();
}

std::vector<ExternalReference> ExternalReferenceRegistry::list() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<ExternalReference> out;
  out.reserve(refs_.size());
  for (const auto& kv : refs_) out.push_back(kv.second);
  return out;
}

size_t ExternalReferenceRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return refs_.size();
}

bool ExternalReferenceRegistry::update_status(const std::string& id, ReferenceStatus status) {
  ExternalReference updated;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = refs_.find(id);
    if (it == refs_.end()) return false;
    it->second.status = status;
    it->second.last_verified_unix_ms = now_unix_ms();
    updated = it->second;
  }
  notify(updated);
  return true;
}

size_t ExternalReferenceRegistry::register_from_blocks(const std::vector<Block>& blocks,
                                                       const std::string& local_doc_id) {
  size_t added = 0;
  for (const auto& b : blocks) {
    const auto& prov = b.metadata.provenance;
    if (!prov.origin_doc_id || prov.origin_doc_id->empty() || *prov.origin_doc_id == local_doc_id) {
      continue;
    }
    ExternalReference ref;
    ref.id = b.id;
    ref.target_doc_id = *prov.origin_doc_id;
    ref.target_block_id = prov.source_id.empty() ? b.id : prov.source_id;
    ref.origin_url = prov.origin_url.value_or("");
    if (add(ref)) ++added;
  }
  return added;
}

uint64_t ExternalReferenceRegistry::subscribe(ReferenceListener listener) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  const uint64_t id = next_listener_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void ExternalReferenceRegistry::unsubscribe(uint64_t id) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const auto& l) { return l.first == id; }),
                   listeners_.end());
}

void ExternalReferenceRegistry::notify(const ExternalReference& ref) const {
  std::vector<ReferenceListener> targets;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    for (const auto& l : listeners_) targets.push_back(l.second);
  }
  for (const auto& fn : targets) {
    try {
      fn(ref);
    } catch (const std::exception& e) {
      log_event(LogLevel::error, "references", "listener_failed", e.what());
    }
  }
}

}  // namespace vellum
