#pragma once

// vellum/session.hpp: One document opened by one subject.
//
// DocumentSession is the composition root. It owns the metadata store,
// reference registry, evaluator, sync filter, broker and verifier for one
// (document, subject) pair; the content store, persistence, authorities and
// audit sink are injected and outlive it. Nothing here is a process-wide
// singleton, so any number of sessions can coexist.
//
// WIRING:
//   content change  -> debounced recompute
//   metadata change -> debounced recompute
//   set_subject()   -> drop all tokens, bump subject epoch, recompute now

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "vellum/abac.hpp"
#include "vellum/audit.hpp"
#include "vellum/capability_broker.hpp"
#include "vellum/config.hpp"
#include "vellum/content_store.hpp"
#include "vellum/integrity.hpp"
#include "vellum/metadata_store.hpp"
#include "vellum/reference_registry.hpp"
#include "vellum/secure_sync.hpp"
#include "vellum/snapshot_store.hpp"
#include "vellum/types.hpp"

namespace vellum {

struct SessionCollaborators {
  IContentStore& content;
  ISnapshotStore& snapshots;
  ITargetAuthority& target_authority;
  ISigningAuthority& signing_authority;
  IAuditSink& audit;
};

struct OpenResult {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  size_t blocks{0};
  size_t references{0};
  std::string detail;
};

struct SaveResult {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::vector<std::string> rejected_blocks;
  size_t changed_blocks{0};
  std::string detail;
};

class DocumentSession {
 public:
  DocumentSession(std::string doc_id, Subject subject, SessionConfig config,
                  SessionCollaborators collaborators);
  ~DocumentSession();

  DocumentSession(const DocumentSession&) = delete;
  DocumentSession& operator=(const DocumentSession&) = delete;

  // Load the persisted snapshot, reload metadata atomically, register
  // references, verify every block and publish a first view.
  OpenResult open();

  void set_subject(const Subject& subject);
  std::optional<Subject> subject() const;
  uint64_t subject_epoch() const;

  // Rejects unless every block changed or deleted since the stored snapshot
  // passes evaluate_edit() against its stored metadata.
  SaveResult save();

  std::shared_ptr<const FilteredView> filtered_view() const;
  std::vector<RedactionMarker> redactions() const;
  VerificationStatus verification_status(const std::string& block_id) const;

  ResolveResult resolve_reference(const std::string& ref_id);
  size_t prefetch_tokens();
  SignOutcome sign_block(const std::string& block_id);

  // Synchronous recompute, bypassing the debouncer.
  RecomputeResult recompute_now();
  // Wait for any debounced recompute to finish.
  void flush();

  const std::string& doc_id() const { return doc_id_; }
  const SessionConfig& config() const { return config_; }
  MetadataStore& metadata() { return metadata_; }
  ExternalReferenceRegistry& references() { return references_; }
  CapabilityBroker& broker() { return broker_; }
  BlockIntegrityVerifier& verifier() { return verifier_; }
  SecureSyncFilter& filter() { return filter_; }
  const RecomputeDebouncer& debouncer() const { return debouncer_; }

  std::string status_json() const;

 private:
  RecomputeInputs snapshot_inputs() const;
  const abac::EvaluatorConfig& evaluator_config() const { return evaluator_.config(); }

  std::string doc_id_;
  SessionConfig config_;
  SessionCollaborators io_;

  mutable std::mutex subject_mu_;
  std::optional<Subject> subject_;
  uint64_t subject_epoch_{1};

  std::unique_ptr<ImmutableAuditLog> file_audit_;
  FanoutAuditSink audit_;

  MetadataStore metadata_;
  ExternalReferenceRegistry references_;
  abac::AccessEvaluator evaluator_;
  SecureSyncFilter filter_;
  CapabilityBroker broker_;
  BlockIntegrityVerifier verifier_;
  // Declared last: destroyed first, before anything its task touches.
  RecomputeDebouncer debouncer_;

  uint64_t content_sub_{0};
  uint64_t metadata_sub_{0};
};

}  // namespace vellum
