#pragma once

// vellum/secure_sync.hpp: Per-subject filtered view of an authoritative document.
//
// DESIGN:
//   recompute() snapshots the authoritative blocks and the subject, runs every
//   block through the access evaluator (metadata from the shadow store), keeps
//   allowed blocks in their original relative order and publishes the result
//   as one immutable FilteredView. Views are always rebuilt from scratch and
//   swapped in whole; nothing is patched incrementally, so a block whose
//   permission was revoked cannot linger through a race.
//
// CONCURRENCY:
//   - recompute() calls on one filter are serialized. Inputs are pulled from
//     the InputSource after the serialization lock is taken, so every run
//     works on the newest snapshot and runs publish in snapshot order.
//   - A recompute() reached re-entrantly from a view listener on the same
//     thread does not recurse; it schedules one more pass of the outer call.
//   - RecomputeDebouncer collapses bursts of triggers into one trailing-edge
//     run on a worker thread.
//
// FAILURE POLICY:
//   An evaluator that throws denies the block and flags the redaction as a
//   fault ("could not check") regardless of the configured FailurePolicy.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "vellum/abac.hpp"
#include "vellum/audit.hpp"
#include "vellum/metadata_store.hpp"
#include "vellum/types.hpp"

namespace vellum {

// Rendered in place of a denied block. Carries the minimum classification
// needed to see it and nothing else about its metadata.
struct RedactionMarker {
  std::string block_id;
  size_t position{0};  // index in the authoritative order
  Classification required{Classification::public_};
  bool fault{false};

  bool operator==(const RedactionMarker& other) const = default;
  std::string to_json() const;
};

struct FilteredView {
  std::vector<Block> blocks;
  std::vector<RedactionMarker> redactions;
  uint64_t generation{0};       // bumped on every publish
  uint64_t subject_epoch{0};
  uint64_t content_version{0};

  std::vector<std::string> ids() const;
  std::string to_json() const;
};

struct RecomputeInputs {
  std::vector<Block> blocks;
  std::optional<Subject> subject;
  uint64_t subject_epoch{0};
  uint64_t content_version{0};
};

using InputSource = std::function<RecomputeInputs()>;
using ViewListener = std::function<void(const std::shared_ptr<const FilteredView>&)>;

struct RecomputeResult {
  bool published{false};   // a new view was swapped in
  bool unchanged{false};   // same blocks and redactions as the current view
  bool deferred{false};    // re-entrant call folded into the outer pass
  bool stale{false};       // inputs older than the current view; dropped
  size_t visible{0};
  size_t denied{0};
  size_t faults{0};
};

class SecureSyncFilter {
 public:
  SecureSyncFilter(std::string doc_id, const abac::IAccessEvaluator& evaluator,
                   const MetadataStore& metadata, IAuditSink& audit);

  SecureSyncFilter(const SecureSyncFilter&) = delete;
  SecureSyncFilter& operator=(const SecureSyncFilter&) = delete;

  // Stateless: evaluate `blocks` for `subject` without publishing.
  FilteredView compute(const std::vector<Block>& blocks, const Subject* subject) const;

  RecomputeResult recompute(const InputSource& source);
  RecomputeResult recompute(RecomputeInputs inputs);

  // Currently published view. Never null.
  std::shared_ptr<const FilteredView> view() const;

  uint64_t subscribe(ViewListener listener);
  void unsubscribe(uint64_t id);

  const std::string& doc_id() const { return doc_id_; }

 private:
  // Effective metadata for a block: shadow store entry, else what the block
  // carries. nullopt when neither says anything.
  std::optional<BlockMetadata> metadata_for(const Block& block) const;

  RecomputeResult run_once(const InputSource& source);
  void notify(const std::shared_ptr<const FilteredView>& view) const;

  std::string doc_id_;
  const abac::IAccessEvaluator& evaluator_;
  const MetadataStore& metadata_;
  IAuditSink& audit_;

  std::mutex recompute_mu_;
  std::atomic<std::thread::id> owner_{};
  bool rerun_requested_{false};  // guarded by recompute_mu_ (set by owner thread)

  mutable std::mutex view_mu_;
  std::shared_ptr<const FilteredView> view_;

  mutable std::mutex listeners_mu_;
  std::vector<std::pair<uint64_t, ViewListener>> listeners_;
  uint64_t next_listener_id_{1};
};

// ---------------------------------------------------------------------------
// RecomputeDebouncer: trailing-edge coalescing worker
// ---------------------------------------------------------------------------
// trigger() records a request and returns immediately. The task runs on the
// worker thread once `delay` has passed without a further trigger. Triggers
// that arrive while the task runs schedule exactly one more run.
class RecomputeDebouncer {
 public:
  RecomputeDebouncer(std::chrono::milliseconds delay, std::function<void()> task);
  ~RecomputeDebouncer();

  RecomputeDebouncer(const RecomputeDebouncer&) = delete;
  RecomputeDebouncer& operator=(const RecomputeDebouncer&) = delete;

  void start();
  void stop();  // pending work is dropped

  void trigger();
  // Runs any pending work now and waits for the worker to go idle.
  // Must not be called from inside the task.
  void flush();

  uint64_t triggers() const { return triggers_.load(std::memory_order_relaxed); }
  uint64_t runs() const { return runs_.load(std::memory_order_relaxed); }

 private:
  using Clock = std::chrono::steady_clock;
  void worker_loop();

  std::chrono::milliseconds delay_;
  std::function<void()> task_;
  std::thread worker_;
  std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  bool pending_{false};
  bool running_{false};
  int flush_waiters_{0};  // pending work skips the delay while this is non-zero
  bool stopping_{false};
  Clock::time_point last_trigger_{};
  std::atomic<uint64_t> triggers_{0};
  std::atomic<uint64_t> runs_{0};
};

}  // namespace vellum
