#include "vellum/session.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

#include "vellum/observability.hpp"

namespace vellum {

namespace {

abac::EvaluatorConfig make_evaluator_config(const std::string& doc_id, const SessionConfig& c) {
  abac::EvaluatorConfig cfg;
  cfg.local_doc_id = c.local_doc_id.empty() ? doc_id : c.local_doc_id;
  cfg.failure_policy = c.failure_policy;
  return cfg;
}

const Block* find_by_id(const std::vector<Block>& blocks, const std::string& id) {
  auto it = std::find_if(blocks.begin(), blocks.end(), [&](const Block& b) { return b.id == id; });
  return it == blocks.end() ? nullptr : &*it;
}

}  // namespace

DocumentSession::DocumentSession(std::string doc_id, Subject subject, SessionConfig config,
                                 SessionCollaborators collaborators)
    : doc_id_(std::move(doc_id)),
      config_(std::move(config)),
      io_(collaborators),
      subject_(std::move(subject)),
      file_audit_(config_.audit_log_path.empty()
                      ? nullptr
                      : std::make_unique<ImmutableAuditLog>(config_.audit_log_path)),
      evaluator_(make_evaluator_config(doc_id_, config_)),
      filter_(doc_id_, evaluator_, metadata_, audit_),
      broker_(io_.target_authority, metadata_, references_, audit_),
      verifier_(io_.signing_authority, metadata_, audit_),
      debouncer_(std::chrono::milliseconds(config_.recompute_debounce_ms),
                 [this] { filter_.recompute([this] { return snapshot_inputs(); }); }) {
  audit_.add(&io_.audit);
  audit_.add(file_audit_.get());
  if (!config_.event_log_path.empty()) set_event_log_path(config_.event_log_path);

  content_sub_ = io_.content.subscribe([this](uint64_t) { debouncer_.trigger(); });
  metadata_sub_ = metadata_.subscribe(
      [this](const std::string&, const std::optional<BlockMetadata>&) { debouncer_.trigger(); });
  log_event(LogLevel::debug, "session", "created", doc_id_);
}

DocumentSession::~DocumentSession() {
  io_.content.unsubscribe(content_sub_);
  metadata_.unsubscribe(metadata_sub_);
  debouncer_.stop();
}

RecomputeInputs DocumentSession::snapshot_inputs() const {
  RecomputeInputs in;
  // Version first: if an edit lands between the two reads, the blocks are
  // newer than the version says, which only makes the next run look fresher.
  in.content_version = io_.content.version();
  in.blocks = io_.content.snapshot();
  std::lock_guard<std::mutex> lk(subject_mu_);
  in.subject = subject_;
  in.subject_epoch = subject_epoch_;
  return in;
}

OpenResult DocumentSession::open() {
  OpenResult r;
  auto loaded = io_.snapshots.load_snapshot(doc_id_);
  if (!loaded) {
    r.error_code = ErrorCode::not_found;
    r.detail = "no readable snapshot for " + doc_id_;
    log_event(LogLevel::warn, "session", "open_failed", doc_id_);
    return r;
  }

  // Metadata goes in before content so the first recompute never sees new
  // blocks against the previous document's labels.
  metadata_.load_from_snapshot(*loaded);
  references_.clear();
  r.references = references_.register_from_blocks(*loaded, evaluator_config().local_doc_id);
  io_.content.apply_snapshot(*loaded);
  verifier_.verify_all(*loaded);
  recompute_now();

  r.ok = true;
  r.blocks = loaded->size();
  log_event(LogLevel::info, "session", "opened",
            doc_id_ + " blocks=" + std::to_string(r.blocks) +
                " refs=" + std::to_string(r.references));
  return r;
}

void DocumentSession::set_subject(const Subject& subject) {
  {
    // Tokens go before the new subject becomes visible to resolve_reference().
    std::lock_guard<std::mutex> lk(subject_mu_);
    broker_.invalidate_all(subject.id, "subject changed");
    subject_ = subject;
    ++subject_epoch_;
  }
  recompute_now();
}

std::optional<Subject> DocumentSession::subject() const {
  std::lock_guard<std::mutex> lk(subject_mu_);
  return subject_;
}

uint64_t DocumentSession::subject_epoch() const {
  std::lock_guard<std::mutex> lk(subject_mu_);
  return subject_epoch_;
}

RecomputeResult DocumentSession::recompute_now() {
  return filter_.recompute([this] { return snapshot_inputs(); });
}

void DocumentSession::flush() { debouncer_.flush(); }

SaveResult DocumentSession::save() {
  SaveResult r;
  const auto subject = this->subject();
  const std::string subject_id = subject ? subject->id : std::string();

  const std::vector<Block> stored = io_.snapshots.load_snapshot(doc_id_).value_or(std::vector<Block>{});
  const std::vector<Block> current = metadata_.apply_to(io_.content.snapshot());

  auto check_edit = [&](const Block& reference) {
    const auto decision = evaluator_.evaluate_edit(subject ? &*subject : nullptr,
                                                   &reference.metadata);
    if (!decision.allowed) r.rejected_blocks.push_back(reference.id);
  };

  for (const auto& b : current) {
    const Block* before = find_by_id(stored, b.id);
    if (before && *before == b) continue;
    ++r.changed_blocks;
    // Judge against what was stored; a new block against its own labels.
    check_edit(before ? *before : b);
  }
  for (const auto& b : stored) {
    if (find_by_id(current, b.id)) continue;
    ++r.changed_blocks;
    check_edit(b);
  }

  if (!r.rejected_blocks.empty()) {
    r.error_code = ErrorCode::authorization_denied;
    r.detail = std::to_string(r.rejected_blocks.size()) + " block(s) not editable";
    audit_.emit(make_audit_event(subject_id, audit_actions::kSaveRejected, doc_id_, r.detail,
                                 "warn"));
    log_event(LogLevel::info, "session", "save_rejected", doc_id_ + ": " + r.detail);
    return r;
  }

  if (!io_.snapshots.save_snapshot(doc_id_, current)) {
    r.error_code = ErrorCode::io_error;
    r.detail = "snapshot write failed";
    log_event(LogLevel::error, "session", "save_failed", doc_id_);
    return r;
  }
  r.ok = true;
  audit_.emit(make_audit_event(subject_id, audit_actions::kSnapshotSaved, doc_id_,
                               std::to_string(r.changed_blocks) + " changed"));
  return r;
}

std::shared_ptr<const FilteredView> DocumentSession::filtered_view() const {
  return filter_.view();
}

std::vector<RedactionMarker> DocumentSession::redactions() const {
  return filter_.view()->redactions;
}

VerificationStatus DocumentSession::verification_status(const std::string& block_id) const {
  return metadata_.verification_status(block_id);
}

ResolveResult DocumentSession::resolve_reference(const std::string& ref_id) {
  const auto subject = this->subject();
  if (!subject) {
    ResolveResult r;
    r.error_code = ErrorCode::authorization_denied;
    r.detail = "no subject";
    return r;
  }
  return broker_.resolve_reference(*subject, ref_id);
}

size_t DocumentSession::prefetch_tokens() {
  const auto subject = this->subject();
  if (!subject) return 0;
  return broker_.prefetch(*subject);
}

SignOutcome DocumentSession::sign_block(const std::string& block_id) {
  SignOutcome out;
  const auto subject = this->subject();
  const auto blocks = io_.content.snapshot();
  const Block* block = find_by_id(blocks, block_id);
  if (!block) {
    out.error_code = ErrorCode::not_found;
    out.detail = "unknown block " + block_id;
    return out;
  }
  if (!subject) {
    out.error_code = ErrorCode::signing_rejected;
    out.detail = "no subject";
    return out;
  }

  // Signing rewrites provenance, so it needs edit rights on the block.
  const auto meta = metadata_.get(block_id);
  const auto decision =
      evaluator_.evaluate_edit(&*subject, meta ? &*meta : &block->metadata);
  if (!decision.allowed) {
    out.error_code = ErrorCode::authorization_denied;
    out.detail = "gate=" + abac::to_string(decision.gate);
    audit_.emit(make_audit_event(subject->id, audit_actions::kSigningRejected, block_id,
                                 out.detail, "warn"));
    return out;
  }
  return verifier_.sign(*block, *subject);
}

std::string DocumentSession::status_json() const {
  const auto view = filter_.view();
  std::ostringstream o;
  o << "{\"doc_id\":" << jsonlite::to_json(jsonlite::Value{doc_id_})
    << ",\"subject_epoch\":" << subject_epoch()
    << ",\"view_generation\":" << view->generation
    << ",\"visible_blocks\":" << view->blocks.size()
    << ",\"redactions\":" << view->redactions.size()
    << ",\"metadata_entries\":" << metadata_.size()
    << ",\"cached_tokens\":" << metadata_.token_count()
    << ",\"references\":" << references_.size()
    << ",\"token_epoch\":" << broker_.epoch()
    << ",\"config\":" << session_config_to_json(config_)
    << "}";
  return o.str();
}

}  // namespace vellum
