#include "vellum/capability_broker.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <sstream>

#include "vellum/observability.hpp"

namespace vellum {

namespace {

constexpr const char* kTokenDomain = "tok:";

std::string new_token_id() {
  const KeyBytes nonce = random_key();
  const std::string_view raw(reinterpret_cast<const char*>(nonce.data()), nonce.size());
  return "cap-" + blake3_hex(raw).substr(0, 32);
}

std::string block_key(const std::string& doc_id, const std::string& block_id) {
  return encode_key({doc_id, block_id});
}

std::string resource_name(const std::string& doc_id, const std::string& block_id) {
  return doc_id + "/" + block_id;
}

ResolveResult failure(ErrorCode code, std::string detail) {
  ResolveResult r;
  r.ok = false;
  r.error_code = code;
  r.detail = std::move(detail);
  return r;
}

}  // namespace

std::string ResolveResult::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false")
    << ",\"error_code\":\"" << to_string(error_code) << "\""
    << ",\"via_token\":" << (via_token ? "true" : "false");
  if (block) o << ",\"block\":" << jsonlite::to_json(block_to_value(*block));
  if (!detail.empty()) o << ",\"detail\":" << jsonlite::to_json(jsonlite::Value{detail});
  o << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// LocalDocumentAuthority
// ---------------------------------------------------------------------------

LocalDocumentAuthority::LocalDocumentAuthority(std::string origin_url, const KeyBytes& key,
                                               uint64_t token_ttl_s, IAuditSink* audit)
    : origin_url_(std::move(origin_url)),
      key_(key),
      token_ttl_s_(token_ttl_s),
      audit_(audit ? audit : &null_audit_) {}

void LocalDocumentAuthority::host_document(const std::string& doc_id, std::vector<Block> blocks) {
  std::lock_guard<std::mutex> lk(mu_);
  documents_[doc_id] = std::move(blocks);
}

bool LocalDocumentAuthority::update_block(const std::string& doc_id, const Block& block) {
  std::vector<std::string> to_revoke;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto doc = documents_.find(doc_id);
    if (doc == documents_.end()) return false;
    auto it = std::find_if(doc->second.begin(), doc->second.end(),
                           [&](const Block& b) { return b.id == block.id; });
    if (it == doc->second.end()) return false;
    *it = block;
    auto issued = issued_.find(block_key(doc_id, block.id));
    if (issued != issued_.end()) {
      to_revoke = std::move(issued->second);
      issued_.erase(issued);
    }
  }
  for (const auto& id : to_revoke) revoke(id);
  return true;
}

void LocalDocumentAuthority::set_clock(ClockFn clock) {
  std::lock_guard<std::mutex> lk(mu_);
  clock_ = std::move(clock);
}

uint64_t LocalDocumentAuthority::now() const {
  ClockFn clock;
  {
    std::lock_guard<std::mutex> lk(mu_);
    clock = clock_;
  }
  return clock ? clock() : now_unix_ms();
}

std::string LocalDocumentAuthority::key_fingerprint() const {
  return vellum::key_fingerprint(key_);
}

void LocalDocumentAuthority::require_available() const {
  if (!available_.load()) throw AuthorityUnavailable("authority unreachable: " + origin_url_);
}

std::optional<Block> LocalDocumentAuthority::find_block(const std::string& doc_id,
                                                        const std::string& block_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto doc = documents_.find(doc_id);
  if (doc == documents_.end()) return std::nullopt;
  for (const auto& b : doc->second) {
    if (b.id == block_id) return b;
  }
  return std::nullopt;
}

abac::EvaluatorConfig LocalDocumentAuthority::config_for(const std::string& doc_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  // Blocks hosted here are local to their own document.
  return abac::EvaluatorConfig{doc_id, FailurePolicy::fail_closed};
}

std::string LocalDocumentAuthority::sign(const CapabilityToken& token) const {
  return keyed_hash_domain(key_, kTokenDomain, token_scope_string(token));
}

std::optional<CapabilityToken> LocalDocumentAuthority::issue_token(const Subject& subject,
                                                                   const std::string& doc_id,
                                                                   const std::string& block_id) {
  require_available();
  handshakes_.fetch_add(1);

  const auto block = find_block(doc_id, block_id);
  if (!block) return std::nullopt;
  if (!abac::evaluate(&subject, &block->metadata, config_for(doc_id)).allowed) {
    return std::nullopt;
  }

  CapabilityToken t;
  t.token_id = new_token_id();
  t.subject_id = subject.id;
  t.subject_digest = subject_fingerprint(subject);
  t.target_doc_id = doc_id;
  t.target_block_id = block_id;
  t.issued_at_unix_ms = now();
  t.expires_at_unix_ms = t.issued_at_unix_ms + token_ttl_s_ * 1000;
  t.signature = sign(t);
  {
    std::lock_guard<std::mutex> lk(mu_);
    prune_expired_locked(t.issued_at_unix_ms);
    issued_[block_key(doc_id, block_id)].push_back(t.token_id);
    expiry_[t.token_id] = t.expires_at_unix_ms;
  }
  return t;
}

bool LocalDocumentAuthority::verify_token(const CapabilityToken& token, const Subject& subject,
                                          const std::string& doc_id,
                                          const std::string& block_id) const {
  if (token.subject_id != subject.id) return false;
  if (!digest_equal(token.subject_digest, subject_fingerprint(subject))) return false;
  if (token.target_doc_id != doc_id || token.target_block_id != block_id) return false;
  if (token.expired(now())) return false;
  if (is_revoked(token.token_id)) return false;
  return digest_equal(sign(token), token.signature);
}

ResolveResult LocalDocumentAuthority::resolve(const Subject& subject, const std::string& doc_id,
                                              const std::string& block_id,
                                              const CapabilityToken* token) {
  require_available();
  auto& stats = global_security_stats();
  const std::string resource = resource_name(doc_id, block_id);

  auto block = find_block(doc_id, block_id);
  if (!block) {
    return failure(ErrorCode::not_found, "block not found in " + doc_id);
  }

  ResolveResult r;
  if (token && verify_token(*token, subject, doc_id, block_id)) {
    fast_path_.fetch_add(1);
    bump(stats.token_fast_path);
    r.via_token = true;
  } else {
    if (token) {
      bump(stats.tokens_rejected);
      log_event(LogLevel::info, "authority", "token_rejected", token->token_id);
    }
    full_checks_.fetch_add(1);
    bump(stats.token_full_checks);
    const auto decision = abac::evaluate(&subject, &block->metadata, config_for(doc_id));
    if (!decision.allowed) {
      audit_->emit(make_audit_event(subject.id, audit_actions::kRemoteResolveDenied, resource,
                                    "gate=" + abac::to_string(decision.gate)));
      return failure(ErrorCode::authorization_denied, "origin denied access");
    }
  }

  // Enrich so the receiver treats the block as imported content.
  block->metadata.provenance.origin_doc_id = doc_id;
  block->metadata.provenance.origin_url = origin_url_;
  audit_->emit(make_audit_event(subject.id, audit_actions::kRemoteResolveGranted, resource,
                                r.via_token ? "token" : "full_check"));
  r.ok = true;
  r.block = std::move(block);
  return r;
}

void LocalDocumentAuthority::prune_expired_locked(uint64_t now_ms) {
  for (auto it = revoked_.begin(); it != revoked_.end();) {
    it = it->second <= now_ms ? revoked_.erase(it) : std::next(it);
  }
  for (auto it = expiry_.begin(); it != expiry_.end();) {
    it = it->second <= now_ms ? expiry_.erase(it) : std::next(it);
  }
  for (auto it = issued_.begin(); it != issued_.end();) {
    auto& ids = it->second;
    ids.erase(std::remove_if(ids.begin(), ids.end(),
                             [this](const std::string& id) { return expiry_.count(id) == 0; }),
              ids.end());
    it = ids.empty() ? issued_.erase(it) : std::next(it);
  }
}

bool LocalDocumentAuthority::revoke(const std::string& token_id) {
  const uint64_t now_ms = now();
  {
    std::lock_guard<std::mutex> lk(mu_);
    prune_expired_locked(now_ms);
    // An id this authority never issued (or one already expired) is held for
    // one full TTL, which outlives any token that could carry it.
    auto known = expiry_.find(token_id);
    const uint64_t until = known != expiry_.end() ? known->second : now_ms + token_ttl_s_ * 1000;
    if (!revoked_.emplace(token_id, until).second) return false;
  }
  audit_->emit(make_audit_event("", audit_actions::kTokenRevoked, token_id));
  log_event(LogLevel::info, "authority", "token_revoked", token_id);
  return true;
}

bool LocalDocumentAuthority::is_revoked(const std::string& token_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return revoked_.count(token_id) != 0;
}

size_t LocalDocumentAuthority::revoked_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return revoked_.size();
}

// ---------------------------------------------------------------------------
// CapabilityBroker
// ---------------------------------------------------------------------------

CapabilityBroker::CapabilityBroker(ITargetAuthority& authority, MetadataStore& store,
                                   ExternalReferenceRegistry& references, IAuditSink& audit)
    : authority_(authority), store_(store), references_(references), audit_(audit) {}

std::string CapabilityBroker::scope_key(const Subject& subject, const std::string& doc_id,
                                        const std::string& block_id) {
  return encode_key({subject.id, subject_fingerprint(subject), doc_id, block_id});
}

void CapabilityBroker::set_clock(ClockFn clock) {
  std::lock_guard<std::mutex> lk(mu_);
  clock_ = std::move(clock);
}

uint64_t CapabilityBroker::now() const {
  ClockFn clock;
  {
    std::lock_guard<std::mutex> lk(mu_);
    clock = clock_;
  }
  return clock ? clock() : now_unix_ms();
}

uint64_t CapabilityBroker::epoch() const {
  std::lock_guard<std::mutex> lk(mu_);
  return epoch_;
}

std::optional<CapabilityToken> CapabilityBroker::request_token(const Subject& subject,
                                                               const std::string& doc_id,
                                                               const std::string& block_id) {
  auto& stats = global_security_stats();
  const std::string key = scope_key(subject, doc_id, block_id);
  const std::string resource = resource_name(doc_id, block_id);

  uint64_t seq = 0;
  uint64_t epoch = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    seq = ++request_seq_[key];
    epoch = epoch_;
  }

  handshakes_.fetch_add(1);
  std::optional<CapabilityToken> token;
  try {
    ScopeTimer timer(stats.handshake_latency);
    token = authority_.issue_token(subject, doc_id, block_id);
  } catch (const std::exception& e) {
    bump(stats.authority_errors);
    log_event(LogLevel::error, "broker", "handshake_failed", resource + ": " + e.what());
    return std::nullopt;
  }

  if (!token) {
    audit_.emit(make_audit_event(subject.id, audit_actions::kTokenDenied, resource));
    log_event(LogLevel::info, "broker", "token_denied", resource);
    return std::nullopt;
  }

  // Scope must be exactly what was asked for.
  if (token->subject_id != subject.id || token->subject_digest != subject_fingerprint(subject) ||
      token->target_doc_id != doc_id || token->target_block_id != block_id) {
    log_event(LogLevel::warn, "broker", "token_scope_mismatch", resource);
    return std::nullopt;
  }

  {
    // Checked and stored under one lock so invalidate_all() cannot slip in
    // between and leave a pre-invalidation token cached.
    std::lock_guard<std::mutex> lk(mu_);
    if (epoch != epoch_ || request_seq_[key] != seq) {
      discarded_.fetch_add(1);
      log_event(LogLevel::debug, "broker", "stale_token_discarded", resource);
      return std::nullopt;
    }
    store_.put_token(*token);
  }
  bump(stats.tokens_issued);
  audit_.emit(make_audit_event(subject.id, audit_actions::kTokenIssued, resource, token->token_id));
  return token;
}

std::future<std::optional<CapabilityToken>> CapabilityBroker::request_token_async(
    Subject subject, std::string doc_id, std::string block_id) {
  return std::async(std::launch::async,
                    [this, subject = std::move(subject), doc_id = std::move(doc_id),
                     block_id = std::move(block_id)] {
                      return request_token(subject, doc_id, block_id);
                    });
}

std::optional<CapabilityToken> CapabilityBroker::cached_token(const Subject& subject,
                                                              const std::string& doc_id,
                                                              const std::string& block_id) {
  auto token = store_.find_token(subject, doc_id, block_id);
  if (!token) return std::nullopt;
  if (token->expired(now())) {
    store_.remove_token(token->token_id);
    return std::nullopt;
  }
  return token;
}

ResolveResult CapabilityBroker::resolve(const Subject& subject, const ExternalReference& ref) {
  auto& stats = global_security_stats();
  std::optional<CapabilityToken> token =
      cached_token(subject, ref.target_doc_id, ref.target_block_id);
  if (!token) token = request_token(subject, ref.target_doc_id, ref.target_block_id);

  ResolveResult r;
  try {
    r = authority_.resolve(subject, ref.target_doc_id, ref.target_block_id,
                           token ? &*token : nullptr);
  } catch (const std::exception& e) {
    bump(stats.authority_errors);
    log_event(LogLevel::error, "broker", "resolve_failed", ref.id + ": " + e.what());
    // Status stays as it was: "could not check" is not "denied".
    return failure(ErrorCode::authority_unavailable, e.what());
  }

  if (token && !r.via_token) {
    // The authority no longer honours it; do not present it again.
    store_.remove_token(token->token_id);
  }

  switch (r.error_code) {
    case ErrorCode::none:
      references_.update_status(ref.id, ReferenceStatus::active);
      break;
    case ErrorCode::authorization_denied:
      references_.update_status(ref.id, ReferenceStatus::denied);
      break;
    case ErrorCode::not_found:
      references_.update_status(ref.id, ReferenceStatus::broken);
      break;
    default:
      break;
  }
  return r;
}

ResolveResult CapabilityBroker::resolve_reference(const Subject& subject,
                                                  const std::string& ref_id) {
  auto ref = references_.get(ref_id);
  if (!ref) return failure(ErrorCode::not_found, "unknown reference " + ref_id);
  return resolve(subject, *ref);
}

std::future<ResolveResult> CapabilityBroker::resolve_async(Subject subject, ExternalReference ref) {
  return std::async(std::launch::async,
                    [this, subject = std::move(subject), ref = std::move(ref)] {
                      return resolve(subject, ref);
                    });
}

size_t CapabilityBroker::prefetch(const Subject& subject) {
  size_t obtained = 0;
  for (const auto& ref : references_.list()) {
    if (cached_token(subject, ref.target_doc_id, ref.target_block_id)) continue;
    if (request_token(subject, ref.target_doc_id, ref.target_block_id)) ++obtained;
  }
  log_event(LogLevel::debug, "broker", "prefetch", std::to_string(obtained) + " tokens");
  return obtained;
}

size_t CapabilityBroker::invalidate_all(const std::string& subject_id, const std::string& reason) {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++epoch_;
    request_seq_.clear();
    dropped = store_.clear_all_tokens();
  }
  bump(global_security_stats().tokens_invalidated, dropped);
  audit_.emit(make_audit_event(subject_id, audit_actions::kTokensInvalidated, "",
                               std::to_string(dropped) + " tokens; " + reason));
  log_event(LogLevel::info, "broker", "tokens_invalidated", std::to_string(dropped));
  return dropped;
}

}  // namespace vellum
