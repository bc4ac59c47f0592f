#pragma once

// vellum/audit.hpp: Audit sink boundary and the hash-chained NDJSON log.
//
// DESIGN INVARIANTS (must not be broken):
//   1. FIRE-AND-FORGET: emit() never throws and never reports failure to the
//      caller. The security decision is authoritative; audit failures are
//      counted on the sink.
//   2. APPEND-ONLY: ImmutableAuditLog entries are never modified or deleted.
//   3. SEQUENTIAL: sequence numbers are monotonic per log and are never reused,
//      including across process restarts on the same file.
//   4. CHAINED: each entry carries the "aud:" BLAKE3 digest of the previous
//      entry's line. The genesis link is 64 zeros.
//   5. NO PAYLOADS: events name blocks and documents by id. Block content,
//      ACL contents and token signatures never reach the log.

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vellum {

namespace audit_actions {
inline constexpr const char* kAccessDenied         = "ACCESS_DENIED";
inline constexpr const char* kBlockSigned          = "BLOCK_SIGNED";
inline constexpr const char* kSigningRejected      = "SIGNING_REJECTED";
inline constexpr const char* kIntegrityMismatch    = "INTEGRITY_MISMATCH";
inline constexpr const char* kTokenIssued          = "TOKEN_ISSUED";
inline constexpr const char* kTokenDenied          = "TOKEN_DENIED";
inline constexpr const char* kTokensInvalidated    = "TOKENS_INVALIDATED";
inline constexpr const char* kTokenRevoked         = "TOKEN_REVOKED";
inline constexpr const char* kRemoteResolveGranted = "REMOTE_RESOLVE_GRANTED";
inline constexpr const char* kRemoteResolveDenied  = "REMOTE_RESOLVE_DENIED";
inline constexpr const char* kSnapshotSaved        = "SNAPSHOT_SAVED";
inline constexpr const char* kSaveRejected         = "SAVE_REJECTED";
}  // namespace audit_actions

constexpr const char* kGenesisDigest =
    "0000000000000000000000000000000000000000000000000000000000000000";

struct AuditEvent {
  uint64_t    sequence{0};         // assigned by the sink
  std::string previous_digest;     // assigned by chaining sinks
  uint64_t    timestamp_unix_ms{0};
  std::string subject_id;
  std::string action;              // one of audit_actions
  std::string resource_id;         // block id, "doc/block", or token id
  std::string detail;
  std::string severity{"info"};    // info | warn | critical
};

AuditEvent make_audit_event(const std::string& subject_id, const std::string& action,
                            const std::string& resource_id, const std::string& detail = "",
                            const std::string& severity = "info");

// Canonical single-line JSON (suitable for NDJSON append).
std::string audit_event_to_json(const AuditEvent& e);

class IAuditSink {
 public:
  virtual ~IAuditSink() = default;
  virtual void emit(const AuditEvent& event) = 0;
};

class NullAuditSink : public IAuditSink {
 public:
  void emit(const AuditEvent&) override {}
};

// Forwards every event to each target in order.
class FanoutAuditSink : public IAuditSink {
 public:
  void add(IAuditSink* sink) {
    if (sink) sinks_.push_back(sink);
  }
  void emit(const AuditEvent& event) override {
    for (auto* s : sinks_) s->emit(event);
  }

 private:
  std::vector<IAuditSink*> sinks_;
};

// ---------------------------------------------------------------------------
// MemoryAuditSink: thread-safe in-memory sink for tests and diagnostics
// ---------------------------------------------------------------------------
class MemoryAuditSink : public IAuditSink {
 public:
  void emit(const AuditEvent& event) override;

  std::vector<AuditEvent> snapshot() const;
  size_t count(const std::string& action) const;
  size_t size() const;
  void clear();

 private:
  mutable std::mutex mu_;
  std::vector<AuditEvent> events_;
  uint64_t seq_{0};
};

// ---------------------------------------------------------------------------
// ImmutableAuditLog: append-only, hash-chained NDJSON writer
// ---------------------------------------------------------------------------
// Thread-safe. Each write is followed by fflush(). Opening an existing file
// resumes its sequence and chain from the last entry.
class ImmutableAuditLog : public IAuditSink {
 public:
  explicit ImmutableAuditLog(const std::string& path);
  ~ImmutableAuditLog() override;

  ImmutableAuditLog(const ImmutableAuditLog&) = delete;
  ImmutableAuditLog& operator=(const ImmutableAuditLog&) = delete;

  void emit(const AuditEvent& event) override;

  // Returns false if the entry was not written.
  bool append(AuditEvent& event);  // assigns sequence and chain link in-place

  uint64_t entry_count() const;
  uint64_t failure_count() const;
  std::string last_digest() const;
  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

// ---------------------------------------------------------------------------
// Chain verification
// ---------------------------------------------------------------------------
struct AuditChainReport {
  bool ok{true};
  uint64_t entries{0};
  uint64_t first_broken_sequence{0};  // 0 when ok
  std::string error;                  // "", "io_error", "json_parse_error",
                                      // "sequence_gap", "chain_broken"
  std::string head_digest;            // digest of the last line
};

AuditChainReport verify_audit_chain(const std::string& path);

std::string audit_chain_report_to_json(const AuditChainReport& r);

}  // namespace vellum
