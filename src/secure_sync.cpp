#include "vellum/secure_sync.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <sstream>
#include <tuple>

#include "vellum/observability.hpp"

namespace vellum {

namespace {

// Upper bound on passes a single recompute() makes when listeners keep
// re-triggering it. Unchanged views do not notify, so this only trips on a
// listener that mutates inputs on every publish.
constexpr int kMaxPasses = 4;

struct OwnerGuard {
  std::atomic<std::thread::id>& owner;
  explicit OwnerGuard(std::atomic<std::thread::id>& o) : owner(o) {
    owner.store(std::this_thread::get_id());
  }
  ~OwnerGuard() { owner.store(std::thread::id{}); }
};

struct Evaluated {
  FilteredView view;
  std::vector<abac::Gate> gates;  // parallel to view.redactions
};

}  // namespace

std::string RedactionMarker::to_json() const {
  std::ostringstream o;
  o << "{\"block_id\":" << jsonlite::to_json(jsonlite::Value{block_id})
    << ",\"position\":" << position
    << ",\"required\":\"" << to_string(required) << "\""
    << ",\"fault\":" << (fault ? "true" : "false") << "}";
  return o.str();
}

std::vector<std::string> FilteredView::ids() const {
  std::vector<std::string> out;
  out.reserve(blocks.size());
  for (const auto& b : blocks) out.push_back(b.id);
  return out;
}

std::string FilteredView::to_json() const {
  std::string out = "{\"generation\":" + std::to_string(generation);
  out += ",\"subject_epoch\":" + std::to_string(subject_epoch);
  out += ",\"content_version\":" + std::to_string(content_version);
  out += ",\"blocks\":" + blocks_to_json(blocks);
  out += ",\"redactions\":[";
  for (size_t i = 0; i < redactions.size(); ++i) {
    if (i) out += ',';
    out += redactions[i].to_json();
  }
  out += "]}";
  return out;
}

// ---------------------------------------------------------------------------
// SecureSyncFilter
// ---------------------------------------------------------------------------

SecureSyncFilter::SecureSyncFilter(std::string doc_id, const abac::IAccessEvaluator& evaluator,
                                   const MetadataStore& metadata, IAuditSink& audit)
    : doc_id_(std::move(doc_id)),
      evaluator_(evaluator),
      metadata_(metadata),
      audit_(audit),
      view_(std::make_shared<const FilteredView>()) {}

std::optional<BlockMetadata> SecureSyncFilter::metadata_for(const Block& block) const {
  if (auto shadow = metadata_.get(block.id)) return shadow;
  if (!(block.metadata == BlockMetadata{})) return block.metadata;
  return std::nullopt;
}

namespace {

Evaluated evaluate_all(const std::vector<Block>& blocks, const Subject* subject,
                       const abac::IAccessEvaluator& evaluator,
                       const std::function<std::optional<BlockMetadata>(const Block&)>& lookup) {
  Evaluated out;
  out.view.blocks.reserve(blocks.size());
  for (size_t i = 0; i < blocks.size(); ++i) {
    const Block& block = blocks[i];
    const std::optional<BlockMetadata> meta = lookup(block);

    abac::AccessDecision decision;
    try {
      decision = evaluator.evaluate(subject, meta ? &*meta : nullptr);
    } catch (const std::exception& e) {
      // Could not check: deny, but say so.
      decision = abac::AccessDecision{};
      decision.allowed = false;
      decision.fault = true;
      decision.gate = abac::Gate::fault;
      decision.required = Classification::restricted;
      decision.reason = e.what();
      log_event(LogLevel::error, "secure_sync", "evaluator_fault", block.id + ": " + e.what());
    }

    if (decision.allowed) {
      Block visible = block;
      if (meta) visible.metadata = *meta;
      out.view.blocks.push_back(std::move(visible));
    } else {
      RedactionMarker marker;
      marker.block_id = block.id;
      marker.position = i;
      marker.required = decision.required;
      marker.fault = decision.fault;
      out.view.redactions.push_back(std::move(marker));
      out.gates.push_back(decision.gate);
    }
  }
  return out;
}

}  // namespace

FilteredView SecureSyncFilter::compute(const std::vector<Block>& blocks,
                                       const Subject* subject) const {
  return evaluate_all(blocks, subject, evaluator_,
                      [this](const Block& b) { return metadata_for(b); })
      .view;
}

RecomputeResult SecureSyncFilter::recompute(RecomputeInputs inputs) {
  auto shared = std::make_shared<RecomputeInputs>(std::move(inputs));
  return recompute(InputSource([shared] { return *shared; }));
}

RecomputeResult SecureSyncFilter::recompute(const InputSource& source) {
  if (owner_.load() == std::this_thread::get_id()) {
    // Reached from one of our own listeners. The outer call holds
    // recompute_mu_ and will make one more pass with fresh inputs.
    rerun_requested_ = true;
    RecomputeResult r;
    r.deferred = true;
    return r;
  }

  std::lock_guard<std::mutex> lk(recompute_mu_);
  OwnerGuard guard(owner_);
  RecomputeResult result;
  int passes = 0;
  do {
    rerun_requested_ = false;
    result = run_once(source);
  } while (rerun_requested_ && ++passes < kMaxPasses);
  if (rerun_requested_) {
    log_event(LogLevel::warn, "secure_sync", "rerun_limit", doc_id_);
  }
  return result;
}

RecomputeResult SecureSyncFilter::run_once(const InputSource& source) {
  auto& stats = global_security_stats();
  ScopeTimer timer(stats.recompute_latency);

  RecomputeInputs in = source();
  const std::shared_ptr<const FilteredView> current = view();

  RecomputeResult result;
  if (std::tie(in.subject_epoch, in.content_version) <
      std::tie(current->subject_epoch, current->content_version)) {
    result.stale = true;
    log_event(LogLevel::debug, "secure_sync", "stale_inputs_dropped", doc_id_);
    return result;
  }

  const Subject* subject = in.subject ? &*in.subject : nullptr;
  Evaluated ev = evaluate_all(in.blocks, subject, evaluator_,
                              [this](const Block& b) { return metadata_for(b); });
  bump(stats.recomputes);

  result.visible = ev.view.blocks.size();
  result.denied = ev.view.redactions.size();
  result.faults = static_cast<size_t>(
      std::count_if(ev.view.redactions.begin(), ev.view.redactions.end(),
                    [](const RedactionMarker& m) { return m.fault; }));
  bump(stats.blocks_denied, result.denied);
  bump(stats.evaluator_faults, result.faults);

  // Audit only denials this subject has not already been told about.
  const bool same_subject = in.subject_epoch == current->subject_epoch;
  std::set<std::string> already;
  if (same_subject) {
    for (const auto& m : current->redactions) already.insert(m.block_id);
  }
  const std::string subject_id = subject ? subject->id : std::string();
  for (size_t i = 0; i < ev.view.redactions.size(); ++i) {
    const auto& m = ev.view.redactions[i];
    if (already.count(m.block_id)) continue;
    const std::string gate = abac::to_string(ev.gates[i]);
    log_event(m.fault ? LogLevel::error : LogLevel::info, "secure_sync", "block_denied",
              doc_id_ + "/" + m.block_id + " gate=" + gate);
    audit_.emit(make_audit_event(subject_id, audit_actions::kAccessDenied,
                                 doc_id_ + "/" + m.block_id, "gate=" + gate,
                                 m.fault ? "warn" : "info"));
  }

  ev.view.subject_epoch = in.subject_epoch;
  ev.view.content_version = in.content_version;

  if (ev.view.blocks == current->blocks && ev.view.redactions == current->redactions) {
    result.unchanged = true;
    bump(stats.recomputes_skipped_unchanged);
    if (ev.view.subject_epoch != current->subject_epoch ||
        ev.view.content_version != current->content_version) {
      // Same content, newer inputs: advance the watermark without notifying.
      auto advanced = std::make_shared<FilteredView>(*current);
      advanced->subject_epoch = ev.view.subject_epoch;
      advanced->content_version = ev.view.content_version;
      std::lock_guard<std::mutex> lk(view_mu_);
      view_ = std::move(advanced);
    }
    return result;
  }

  ev.view.generation = current->generation + 1;
  auto next = std::make_shared<const FilteredView>(std::move(ev.view));
  {
    std::lock_guard<std::mutex> lk(view_mu_);
    view_ = next;
  }
  result.published = true;
  notify(next);
  return result;
}

std::shared_ptr<const FilteredView> SecureSyncFilter::view() const {
  std::lock_guard<std::mutex> lk(view_mu_);
  return view_;
}

uint64_t SecureSyncFilter::subscribe(ViewListener listener) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  const uint64_t id = next_listener_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void SecureSyncFilter::unsubscribe(uint64_t id) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const auto& l) { return l.first == id; }),
                   listeners_.end());
}

void SecureSyncFilter::notify(const std::shared_ptr<const FilteredView>& view) const {
  std::vector<ViewListener> targets;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    for (const auto& l : listeners_) targets.push_back(l.second);
  }
  for (const auto& fn : targets) {
    try {
      fn(view);
    } catch (const std::exception& e) {
      log_event(LogLevel::error, "secure_sync", "listener_failed", e.what());
    }
  }
}

// ---------------------------------------------------------------------------
// RecomputeDebouncer
// ---------------------------------------------------------------------------

RecomputeDebouncer::RecomputeDebouncer(std::chrono::milliseconds delay,
                                       std::function<void()> task)
    : delay_(delay), task_(std::move(task)) {
  start();
}

RecomputeDebouncer::~RecomputeDebouncer() { stop(); }

void RecomputeDebouncer::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable()) return;
  stopping_ = false;
  worker_ = std::thread([this] { worker_loop(); });
}

void RecomputeDebouncer::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
    pending_ = false;
  }
  cv_.notify_all();
  idle_cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void RecomputeDebouncer::trigger() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_) return;
    pending_ = true;
    last_trigger_ = Clock::now();
  }
  triggers_.fetch_add(1, std::memory_order_relaxed);
  cv_.notify_all();
}

void RecomputeDebouncer::flush() {
  std::unique_lock<std::mutex> lock(mu_);
  if (!pending_ && !running_) return;
  ++flush_waiters_;
  cv_.notify_all();
  idle_cv_.wait(lock, [this] { return stopping_ || (!pending_ && !running_); });
  --flush_waiters_;
}

void RecomputeDebouncer::worker_loop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (true) {
    cv_.wait(lock, [this] { return stopping_ || pending_; });
    if (stopping_) return;

    // Trailing edge: wait until `delay_` has passed since the last trigger.
    while (!stopping_ && flush_waiters_ == 0) {
      const auto deadline = last_trigger_ + delay_;
      if (Clock::now() >= deadline) break;
      cv_.wait_until(lock, deadline);
    }
    if (stopping_) return;

    pending_ = false;
    running_ = true;
    lock.unlock();
    try {
      task_();
    } catch (const std::exception& e) {
      log_event(LogLevel::error, "secure_sync", "debounced_task_failed", e.what());
    }
    lock.lock();
    running_ = false;
    runs_.fetch_add(1, std::memory_order_relaxed);
    // A trigger that landed mid-run leaves pending_ set; loop again.
    if (!pending_) idle_cv_.notify_all();
  }
}

}  // namespace vellum
