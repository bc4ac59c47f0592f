#pragma once

// vellum/capability_broker.hpp: Short-lived capability tokens for
// cross-document transclusion.
//
// DESIGN:
//   A token is an optimization, never a trust anchor. The owning authority
//   accepts a presented token only if its MAC, scope, expiry and revocation
//   state all check out; anything else falls back to a full ABAC evaluation
//   against the authority's own copy of the block metadata.
//
//   Token scope is (subject snapshot, target_doc_id, target_block_id). The
//   subject snapshot is subject_fingerprint(): a token issued before a role or
//   clearance change never takes the fast path afterwards. A token for one
//   block never authorizes a sibling block in the same document.
//
// INVARIANTS:
//   - Tokens live in memory only (MetadataStore token map) and are dropped en
//     masse on any subject change.
//   - A failed handshake caches nothing.
//   - Prefetch requests tokens only; it never resolves or stores content.
//   - A handshake superseded by a newer request for the same scope, or by a
//     subject change, is discarded on arrival.

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "vellum/abac.hpp"
#include "vellum/audit.hpp"
#include "vellum/hash.hpp"
#include "vellum/metadata_store.hpp"
#include "vellum/reference_registry.hpp"
#include "vellum/types.hpp"

namespace vellum {

// Thrown by authority implementations when the transport fails. Components
// catch it (and any std::exception) at their boundary.
class AuthorityUnavailable : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

using ClockFn = std::function<uint64_t()>;

struct ResolveResult {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};  // authorization_denied | not_found |
                                          // authority_unavailable
  std::optional<Block> block;
  bool via_token{false};                  // authority took the fast path
  std::string detail;

  std::string to_json() const;
};

class ITargetAuthority {
 public:
  virtual ~ITargetAuthority() = default;

  // Full handshake. nullopt = denied (or unknown block).
  virtual std::optional<CapabilityToken> issue_token(const Subject& subject,
                                                     const std::string& doc_id,
                                                     const std::string& block_id) = 0;

  // `token` may be null. Never trusts the token without checking it.
  virtual ResolveResult resolve(const Subject& subject, const std::string& doc_id,
                                const std::string& block_id, const CapabilityToken* token) = 0;
};

// ---------------------------------------------------------------------------
// LocalDocumentAuthority: in-process owning authority
// ---------------------------------------------------------------------------
class LocalDocumentAuthority : public ITargetAuthority {
 public:
  LocalDocumentAuthority(std::string origin_url, const KeyBytes& key,
                         uint64_t token_ttl_s = 300, IAuditSink* audit = nullptr);

  void host_document(const std::string& doc_id, std::vector<Block> blocks);
  // Replaces one hosted block. Outstanding tokens for it are revoked, so a
  // tightened label takes effect on the next resolve.
  bool update_block(const std::string& doc_id, const Block& block);

  std::optional<CapabilityToken> issue_token(const Subject& subject, const std::string& doc_id,
                                             const std::string& block_id) override;
  ResolveResult resolve(const Subject& subject, const std::string& doc_id,
                        const std::string& block_id, const CapabilityToken* token) override;

  // Revocations are kept until the token would have expired anyway.
  bool revoke(const std::string& token_id);
  bool is_revoked(const std::string& token_id) const;
  size_t revoked_count() const;

  // Signature, scope, expiry and revocation.
  bool verify_token(const CapabilityToken& token, const Subject& subject,
                    const std::string& doc_id, const std::string& block_id) const;

  void set_available(bool available) { available_.store(available); }
  void set_clock(ClockFn clock);

  uint64_t handshakes() const { return handshakes_.load(); }
  uint64_t fast_path_hits() const { return fast_path_.load(); }
  uint64_t full_checks() const { return full_checks_.load(); }

  const std::string& origin_url() const { return origin_url_; }
  std::string key_fingerprint() const;

 private:
  std::optional<Block> find_block(const std::string& doc_id, const std::string& block_id) const;
  abac::EvaluatorConfig config_for(const std::string& doc_id) const;
  std::string sign(const CapabilityToken& token) const;
  uint64_t now() const;
  void require_available() const;
  void prune_expired_locked(uint64_t now_ms);

  std::string origin_url_;
  KeyBytes key_;
  uint64_t token_ttl_s_;
  IAuditSink* audit_;
  NullAuditSink null_audit_;

  mutable std::mutex mu_;
  std::map<std::string, std::vector<Block>> documents_;
  std::map<std::string, uint64_t> revoked_;  // token id -> expires_at
  std::map<std::string, uint64_t> expiry_;   // issued token id -> expires_at
  // (doc, block) -> token ids issued for it
  std::map<std::string, std::vector<std::string>> issued_;
  ClockFn clock_;

  std::atomic<bool> available_{true};
  std::atomic<uint64_t> handshakes_{0};
  std::atomic<uint64_t> fast_path_{0};
  std::atomic<uint64_t> full_checks_{0};
};

// ---------------------------------------------------------------------------
// CapabilityBroker: client side: token cache, prefetch, resolution
// ---------------------------------------------------------------------------
class CapabilityBroker {
 public:
  CapabilityBroker(ITargetAuthority& authority, MetadataStore& store,
                   ExternalReferenceRegistry& references, IAuditSink& audit);

  // Full handshake with the owning authority. On success the token is cached
  // for its scope. Returns nullopt on denial, unavailability, or when the
  // response arrived after a newer request or a subject change.
  std::optional<CapabilityToken> request_token(const Subject& subject, const std::string& doc_id,
                                               const std::string& block_id);
  std::future<std::optional<CapabilityToken>> request_token_async(Subject subject,
                                                                  std::string doc_id,
                                                                  std::string block_id);

  // Resolve content through the authority. Uses a cached, unexpired token if
  // one exists for the scope, else performs a fresh handshake first. Content
  // is returned to the caller and never cached. Updates the reference status.
  ResolveResult resolve(const Subject& subject, const ExternalReference& ref);
  ResolveResult resolve_reference(const Subject& subject, const std::string& ref_id);
  std::future<ResolveResult> resolve_async(Subject subject, ExternalReference ref);

  // Requests tokens for every registered reference without a usable cached
  // token. Returns how many tokens were obtained.
  size_t prefetch(const Subject& subject);

  // Drops every cached token and bumps the epoch so in-flight handshakes are
  // discarded. Returns how many tokens were dropped.
  size_t invalidate_all(const std::string& subject_id, const std::string& reason);

  uint64_t epoch() const;
  uint64_t handshakes() const { return handshakes_.load(); }
  uint64_t discarded_responses() const { return discarded_.load(); }

  void set_clock(ClockFn clock);

 private:
  std::optional<CapabilityToken> cached_token(const Subject& subject, const std::string& doc_id,
                                              const std::string& block_id);
  static std::string scope_key(const Subject& subject, const std::string& doc_id,
                               const std::string& block_id);
  uint64_t now() const;

  ITargetAuthority& authority_;
  MetadataStore& store_;
  ExternalReferenceRegistry& references_;
  IAuditSink& audit_;

  mutable std::mutex mu_;
  uint64_t epoch_{0};
  std::map<std::string, uint64_t> request_seq_;  // scope -> latest request
  ClockFn clock_;

  std::atomic<uint64_t> handshakes_{0};
  std::atomic<uint64_t> discarded_{0};
};

}  // namespace vellum
