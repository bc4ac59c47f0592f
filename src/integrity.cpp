#include "vellum/integrity.hpp"

#include <exception>

#include "vellum/observability.hpp"

namespace vellum {

namespace {

constexpr const char* kSignatureDomain = "sig:";
constexpr const char* kAlgorithm = "blake3-keyed";

}  // namespace

// ---------------------------------------------------------------------------
// LocalSigningAuthority
// ---------------------------------------------------------------------------

LocalSigningAuthority::LocalSigningAuthority(const KeyBytes& key)
    : key_(key), signer_id_(key_fingerprint(key)) {}

std::string LocalSigningAuthority::mac(const std::string& block_id,
                                       const std::string& content_hash,
                                       const std::string& subject_id) const {
  return keyed_hash_domain(key_, kSignatureDomain,
                           block_id + ":" + content_hash + ":" + subject_id);
}

SignResult LocalSigningAuthority::sign(const std::string& block_id,
                                       const std::string& content_hash,
                                       const Subject& subject) {
  SignResult r;
  if (!available_.load()) {
    r.error_code = ErrorCode::authority_unavailable;
    r.detail = "signing authority unreachable";
    return r;
  }
  if (subject.role == roles::kViewer || subject.role == roles::kAuditor) {
    r.error_code = ErrorCode::signing_rejected;
    r.detail = "read-only role '" + subject.role + "' cannot sign blocks";
    return r;
  }
  if (subject.id.empty() || !is_hex_digest(content_hash)) {
    r.error_code = ErrorCode::invalid_argument;
    r.detail = "subject id and a 64-char content hash are required";
    return r;
  }
  r.ok = true;
  r.signature = subject.id + "." + mac(block_id, content_hash, subject.id);
  r.signer_id = signer_id_;
  r.timestamp_unix_ms = now_unix_ms();
  r.algorithm = kAlgorithm;
  return r;
}

VerifyResult LocalSigningAuthority::verify(const std::string& block_id,
                                           const std::string& content_hash,
                                           const std::string& signature) {
  VerifyResult r;
  if (!available_.load()) {
    r.detail = "signing authority unreachable";
    return r;
  }
  r.ok = true;
  // The MAC is hex, so the last '.' separates it from the subject id.
  const auto dot = signature.rfind('.');
  if (dot == std::string::npos || dot == 0) {
    r.valid = false;
    r.detail = "malformed signature";
    return r;
  }
  const std::string subject_id = signature.substr(0, dot);
  const std::string presented = signature.substr(dot + 1);
  r.valid = digest_equal(mac(block_id, content_hash, subject_id), presented);
  return r;
}

// ---------------------------------------------------------------------------
// BlockIntegrityVerifier
// ---------------------------------------------------------------------------

BlockIntegrityVerifier::BlockIntegrityVerifier(ISigningAuthority& authority, MetadataStore& store,
                                               IAuditSink& audit)
    : authority_(authority), store_(store), audit_(audit) {}

uint64_t BlockIntegrityVerifier::begin(const std::string& block_id) {
  uint64_t seq = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    seq = ++seq_[block_id];
  }
  store_.set_verification_status(block_id, VerificationStatus::verifying);
  return seq;
}

bool BlockIntegrityVerifier::finish(const std::string& block_id, uint64_t seq,
                                    VerificationStatus status) {
  std::lock_guard<std::mutex> lk(mu_);
  if (seq_[block_id] != seq) {
    log_event(LogLevel::debug, "integrity", "stale_result_dropped", block_id);
    return false;
  }
  store_.set_verification_status(block_id, status);
  return true;
}

VerificationStatus BlockIntegrityVerifier::check(const std::string& block_id,
                                                 const std::string& content,
                                                 const std::string& signature) {
  auto& stats = global_security_stats();
  bump(stats.verifications);
  const std::string digest = block_content_hash(content);

  VerifyResult vr;
  try {
    vr = authority_.verify(block_id, digest, signature);
  } catch (const std::exception& e) {
    vr.ok = false;
    vr.detail = e.what();
  }
  if (!vr.ok) {
    bump(stats.authority_errors);
    log_event(LogLevel::error, "integrity", "authority_unavailable", block_id + ": " + vr.detail);
    return VerificationStatus::unknown;
  }
  if (!vr.valid) {
    bump(stats.tamper_detections);
    log_event(LogLevel::warn, "integrity", "tamper_detected", block_id + " digest=" + digest);
    audit_.emit(make_audit_event("", audit_actions::kIntegrityMismatch, block_id,
                                 "digest=" + digest, "critical"));
    return VerificationStatus::tampered;
  }
  return VerificationStatus::verified;
}

VerificationStatus BlockIntegrityVerifier::verify(const std::string& block_id,
                                                  const std::string& content,
                                                  const std::optional<std::string>& signature) {
  if (!signature || signature->empty()) {
    std::lock_guard<std::mutex> lk(mu_);
    ++seq_[block_id];
    store_.set_verification_status(block_id, VerificationStatus::unsigned_);
    return VerificationStatus::unsigned_;
  }
  const uint64_t seq = begin(block_id);
  const VerificationStatus status = check(block_id, content, *signature);
  finish(block_id, seq, status);
  return status;
}

std::future<VerificationStatus> BlockIntegrityVerifier::verify_async(
    std::string block_id, std::string content, std::optional<std::string> signature) {
  return std::async(std::launch::async, [this, block_id = std::move(block_id),
                                         content = std::move(content),
                                         signature = std::move(signature)] {
    return verify(block_id, content, signature);
  });
}

std::map<std::string, VerificationStatus> BlockIntegrityVerifier::verify_all(
    const std::vector<Block>& blocks) {
  std::map<std::string, VerificationStatus> out;
  for (const auto& b : blocks) {
    std::optional<std::string> signature = b.metadata.provenance.signature;
    if (auto shadow = store_.get(b.id)) signature = shadow->provenance.signature;
    out[b.id] = verify(b.id, b.payload, signature);
  }
  return out;
}

SignOutcome BlockIntegrityVerifier::sign(const Block& block, const Subject& subject) {
  auto& stats = global_security_stats();
  SignOutcome out;
  const std::string digest = block_content_hash(block.payload);
  const uint64_t seq = begin(block.id);

  SignResult sr;
  try {
    sr = authority_.sign(block.id, digest, subject);
  } catch (const std::exception& e) {
    sr.ok = false;
    sr.error_code = ErrorCode::authority_unavailable;
    sr.detail = e.what();
  }

  const std::optional<BlockMetadata> previous = store_.get(block.id);
  if (!sr.ok) {
    out.error_code = sr.error_code == ErrorCode::none ? ErrorCode::signing_rejected : sr.error_code;
    out.detail = sr.detail;
    if (out.error_code == ErrorCode::authority_unavailable) bump(stats.authority_errors);
    audit_.emit(make_audit_event(subject.id, audit_actions::kSigningRejected, block.id, sr.detail,
                                 "warn"));
    log_event(LogLevel::warn, "integrity", "signing_rejected", block.id + ": " + sr.detail);
    // Back to whatever the stored state says.
    const bool was_signed = previous && previous->provenance.signature;
    finish(block.id, seq,
           was_signed ? VerificationStatus::unknown : VerificationStatus::unsigned_);
    out.status = store_.verification_status(block.id);
    return out;
  }

  BlockMetadata updated = previous ? *previous : block.metadata;
  updated.provenance.signature = sr.signature;
  updated.provenance.signer_id = sr.signer_id;
  updated.provenance.timestamp_unix_ms = sr.timestamp_unix_ms;
  if (updated.provenance.author_id.empty()) updated.provenance.author_id = subject.id;
  store_.set(block.id, updated);

  // Re-verify from what was stored, not from what the signer said.
  const auto stored = store_.get(block.id);
  const std::string stored_sig =
      stored && stored->provenance.signature ? *stored->provenance.signature : std::string();
  const VerificationStatus status = check(block.id, block.payload, stored_sig);
  finish(block.id, seq, status);

  if (status != VerificationStatus::verified) {
    if (previous) {
      store_.set(block.id, *previous);
    } else {
      store_.remove(block.id);
    }
    store_.set_verification_status(block.id, status);
    out.error_code = status == VerificationStatus::unknown ? ErrorCode::authority_unavailable
                                                           : ErrorCode::integrity_mismatch;
    out.status = status;
    out.detail = "signature did not verify after signing";
    audit_.emit(make_audit_event(subject.id, audit_actions::kSigningRejected, block.id,
                                 out.detail, "critical"));
    log_event(LogLevel::error, "integrity", "post_sign_verify_failed", block.id);
    return out;
  }

  bump(stats.signatures);
  audit_.emit(make_audit_event(subject.id, audit_actions::kBlockSigned, block.id,
                               "signer=" + sr.signer_id + " alg=" + sr.algorithm));
  out.ok = true;
  out.status = status;
  out.provenance = updated.provenance;
  return out;
}

}  // namespace vellum
