#include "vellum/metadata_store.hpp"

#include <algorithm>
#include <exception>

#include "vellum/observability.hpp"

namespace vellum {

std::optional<BlockMetadata> MetadataStore::get(const std::string& block_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = metadata_.find(block_id);
  if (it == metadata_.end()) return std::nullopt;
  return it->second;
}

bool MetadataStore::contains(const std::string& block_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return metadata_.count(block_id) != 0;
}

void MetadataStore::set(const std::string& block_id, const BlockMetadata& metadata) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    metadata_[block_id] = metadata;
    ++revision_;
  }
  notify({{block_id, metadata}});
}

bool MetadataStore::remove(const std::string& block_id) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (metadata_.erase(block_id) == 0) return false;
    verification_.erase(block_id);
    ++revision_;
  }
  notify({{block_id, std::nullopt}});
  return true;
}

void MetadataStore::clear() {
  std::vector<Change> changes;
  {
    std::lock_guard<std::mutex> lk(mu_);
    changes.reserve(metadata_.size());
    for (const auto& kv : metadata_) changes.emplace_back(kv.first, std::nullopt);
    metadata_.clear();
    verification_.clear();
    ++revision_;
  }
  notify(changes);
}

void MetadataStore::set_many(const std::vector<std::pair<std::string, BlockMetadata>>& entries) {
  std::vector<Change> changes;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, meta] : entries) {
      metadata_[id] = meta;
      changes.emplace_back(id, meta);
    }
    ++revision_;
  }
  notify(changes);
}

void MetadataStore::load_from_snapshot(const std::vector<Block>& blocks) {
  std::map<std::string, BlockMetadata> next;
  for (const auto& b : blocks) next[b.id] = b.metadata;

  std::vector<Change> changes;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : metadata_) {
      if (next.count(kv.first) == 0) changes.emplace_back(kv.first, std::nullopt);
    }
    for (const auto& kv : next) changes.emplace_back(kv.first, kv.second);
    metadata_.swap(next);
    // Status from the previous document must not bleed into this one.
    verification_.clear();
    ++revision_;
  }
  notify(changes);
}

std::map<std::string, BlockMetadata> MetadataStore::export_snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return metadata_;
}

std::vector<Block> MetadataStore::apply_to(std::vector<Block> blocks) const {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& b : blocks) {
    auto it = metadata_.find(b.id);
    if (it != metadata_.end()) b.metadata = it->second;
  }
  return blocks;
}

size_t MetadataStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return metadata_.size();
}

uint64_t MetadataStore::revision() const {
  std::lock_guard<std::mutex> lk(mu_);
  return revision_;
}

uint64_t MetadataStore::subscribe(MetadataListener listener) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  const uint64_t id = next_listener_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void MetadataStore::unsubscribe(uint64_t id) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const auto& l) { return l.first == id; }),
                   listeners_.end());
}

void MetadataStore::notify(const std::vector<Change>& changes) const {
  if (changes.empty()) return;
  std::vector<MetadataListener> targets;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    targets.reserve(listeners_.size());
    for (const auto& l : listeners_) targets.push_back(l.second);
  }
  for (const auto& fn : targets) {
    for (const auto& [id, meta] : changes) {
      try {
        fn(id, meta);
      } catch (const std::exception& e) {
        log_event(LogLevel::error, "metadata_store", "listener_failed", e.what());
      }
    }
  }
}

// ---------------------------------------------------------------------------
// Verification status
// ---------------------------------------------------------------------------

VerificationStatus MetadataStore::verification_status(const std::string& block_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = verification_.find(block_id);
  return it == verification_.end() ? VerificationStatus::unknown : it->second;
}

void MetadataStore::set_verification_status(const std::string& block_id,
                                            VerificationStatus status) {
  std::lock_guard<std::mutex> lk(mu_);
  verification_[block_id] = status;
}

std::map<std::string, VerificationStatus> MetadataStore::verification_snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return verification_;
}

// ---------------------------------------------------------------------------
// Tokens
// ---------------------------------------------------------------------------

std::string MetadataStore::scope_key(const std::string& subject_id,
                                     const std::string& subject_digest,
                                     const std::string& doc_id, const std::string& block_id) {
  return encode_key({subject_id, subject_digest, doc_id, block_id});
}

void MetadataStore::put_token(const CapabilityToken& token) {
  const auto key =
      scope_key(token.subject_id, token.subject_digest, token.target_doc_id, token.target_block_id);
  std::lock_guard<std::mutex> lk(mu_);
  tokens_[key] = token;
}

std::optional<CapabilityToken> MetadataStore::find_token(const Subject& subject,
                                                         const std::string& doc_id,
                                                         const std::string& block_id) const {
  const auto key = scope_key(subject.id, subject_fingerprint(subject), doc_id, block_id);
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tokens_.find(key);
  if (it == tokens_.end()) return std::nullopt;
  return it->second;
}

bool MetadataStore::remove_token(const std::string& token_id) {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto it = tokens_.begin(); it != tokens_.end(); ++it) {
    if (it->second.token_id == token_id) {
      tokens_.erase(it);
      return true;
    }
  }
  return false;
}

std::vector<CapabilityToken> MetadataStore::tokens() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<CapabilityToken> out;
  out.reserve(tokens_.size());
  for (const auto& kv : tokens_) out.push_back(kv.second);
  return out;
}

size_t MetadataStore::token_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tokens_.size();
}

size_t MetadataStore::clear_all_tokens() {
  std::lock_guard<std::mutex> lk(mu_);
  const size_t n = tokens_.size();
  tokens_.clear();
  return n;
}

}  // namespace vellum
