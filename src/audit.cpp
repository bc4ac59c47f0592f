#include "vellum/audit.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "vellum/hash.hpp"
#include "vellum/jsonlite.hpp"
#include "vellum/types.hpp"
#include "vellum/version.hpp"

namespace vellum {

using jsonlite::Object;
using jsonlite::Value;

AuditEvent make_audit_event(const std::string& subject_id, const std::string& action,
                            const std::string& resource_id, const std::string& detail,
                            const std::string& severity) {
  AuditEvent e;
  e.timestamp_unix_ms = now_unix_ms();
  e.subject_id = subject_id;
  e.action = action;
  e.resource_id = resource_id;
  e.detail = detail;
  e.severity = severity;
  return e;
}

std::string audit_event_to_json(const AuditEvent& e) {
  Object o;
  o["v"] = Value{static_cast<std::uint64_t>(version::AUDIT_LOG_VERSION)};
  o["seq"] = Value{static_cast<std::uint64_t>(e.sequence)};
  o["prev"] = Value{e.previous_digest};
  o["ts_ms"] = Value{static_cast<std::uint64_t>(e.timestamp_unix_ms)};
  o["subject_id"] = Value{e.subject_id};
  o["action"] = Value{e.action};
  o["resource_id"] = Value{e.resource_id};
  o["detail"] = Value{e.detail};
  o["severity"] = Value{e.severity};
  return jsonlite::to_json(Value{std::move(o)});
}

// ---------------------------------------------------------------------------
// MemoryAuditSink
// ---------------------------------------------------------------------------

void MemoryAuditSink::emit(const AuditEvent& event) {
  std::lock_guard<std::mutex> lk(mu_);
  AuditEvent copy = event;
  copy.sequence = ++seq_;
  events_.push_back(std::move(copy));
}

std::vector<AuditEvent> MemoryAuditSink::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return events_;
}

size_t MemoryAuditSink::count(const std::string& action) const {
  std::lock_guard<std::mutex> lk(mu_);
  size_t n = 0;
  for (const auto& e : events_) {
    if (e.action == action) ++n;
  }
  return n;
}

size_t MemoryAuditSink::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return events_.size();
}

void MemoryAuditSink::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  events_.clear();
}

// ---------------------------------------------------------------------------
// ImmutableAuditLog
// ---------------------------------------------------------------------------

struct ImmutableAuditLog::Impl {
  std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t entry_count{0};
  uint64_t failure_count{0};
  std::string last_digest{kGenesisDigest};
};

namespace {

// Recover {seq, digest} from the last line of an existing log.
void resume_chain(const std::string& path, uint64_t& seq, std::string& digest) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return;
  std::string line, last;
  while (std::getline(in, line)) {
    if (!line.empty()) last = line;
  }
  if (last.empty()) return;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(last, &err);
  if (err) return;
  seq = jsonlite::get_u64(obj, "seq", 0);
  digest = audit_chain_hash(last);
}

}  // namespace

ImmutableAuditLog::ImmutableAuditLog(const std::string& path)
    : path_(path), impl_(std::make_unique<Impl>()) {
  if (path_.empty()) return;
  resume_chain(path_, impl_->seq, impl_->last_digest);
  impl_->file = std::fopen(path_.c_str(), "a");
}

ImmutableAuditLog::~ImmutableAuditLog() {
  if (impl_ && impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

void ImmutableAuditLog::emit(const AuditEvent& event) {
  AuditEvent copy = event;
  append(copy);
}

bool ImmutableAuditLog::append(AuditEvent& event) {
  std::lock_guard<std::mutex> lk(impl_->mu);

  if (!impl_->file) {
    ++impl_->failure_count;
    return false;
  }

  // Append-only: always write at the end, whatever the stream position.
  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  event.sequence = impl_->seq + 1;
  event.previous_digest = impl_->last_digest;
  if (event.timestamp_unix_ms == 0) event.timestamp_unix_ms = now_unix_ms();

  const std::string line = audit_event_to_json(event);
  const std::string final_line = line + "\n";
  const bool written =
      std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size();
  std::fflush(impl_->file);

  if (!written) {
    ++impl_->failure_count;
    return false;
  }
  const long post_write_pos = std::ftell(impl_->file);
  if (post_write_pos >= 0 &&
      post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
    ++impl_->failure_count;
    return false;
  }

  // The chain only advances once the line is durable in the file.
  impl_->seq = event.sequence;
  impl_->last_digest = audit_chain_hash(line);
  ++impl_->entry_count;
  return true;
}

uint64_t ImmutableAuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

uint64_t ImmutableAuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

std::string ImmutableAuditLog::last_digest() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->last_digest;
}

// ---------------------------------------------------------------------------
// verify_audit_chain
// ---------------------------------------------------------------------------

AuditChainReport verify_audit_chain(const std::string& path) {
  AuditChainReport r;
  r.head_digest = kGenesisDigest;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    r.ok = false;
    r.error = "io_error";
    return r;
  }

  std::string expected_prev = kGenesisDigest;
  uint64_t expected_seq = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(line, &err);
    const uint64_t seq = err ? 0 : jsonlite::get_u64(obj, "seq", 0);
    if (err) {
      r.ok = false;
      r.error = "json_parse_error";
      r.first_broken_sequence = expected_seq + 1;
      return r;
    }
    if (seq != expected_seq + 1) {
      r.ok = false;
      r.error = "sequence_gap";
      r.first_broken_sequence = seq;
      return r;
    }
    if (!digest_equal(jsonlite::get_string(obj, "prev"), expected_prev)) {
      r.ok = false;
      r.error = "chain_broken";
      r.first_broken_sequence = seq;
      return r;
    }
    expected_prev = audit_chain_hash(line);
    expected_seq = seq;
    ++r.entries;
  }
  r.head_digest = expected_prev;
  return r;
}

std::string audit_chain_report_to_json(const AuditChainReport& r) {
  std::ostringstream o;
  o << "{\"ok\":" << (r.ok ? "true" : "false")
    << ",\"entries\":" << r.entries
    << ",\"first_broken_sequence\":" << r.first_broken_sequence
    << ",\"error\":\"" << r.error << "\""
    << ",\"head_digest\":\"" << r.head_digest << "\""
    << "}";
  return o.str();
}

}  // namespace vellum
