#pragma once

// vellum/observability.hpp: Structured security event stream and counters.
//
// DESIGN:
//   LogEvent is the canonical observable unit. Components emit one per
//   security-relevant decision (denial, tamper detection, authority failure,
//   token lifecycle). Events go to a registered hook if there is one, else are
//   JSONL-appended to the event log path, else discarded.
//
// INVARIANT:
//   Emission never throws and never blocks on anything but a file append.
//   Events carry ids, digests and classifications only, never block payloads
//   or token signatures.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "vellum/jsonlite.hpp"

namespace vellum {

enum class LogLevel { debug, info, warn, error };

std::string to_string(LogLevel level);

struct LogEvent {
  uint64_t ts_ms{0};
  LogLevel level{LogLevel::info};
  std::string component;
  std::string event;
  std::string detail;
};

std::string log_event_to_json(const LogEvent& ev);

using LogHook = void (*)(const LogEvent&);
void set_log_hook(LogHook hook);

// Overrides VELLUM_EVENT_LOG for this process. Empty restores the env lookup.
void set_event_log_path(const std::string& path);

void log_event(LogLevel level, const std::string& component, const std::string& event,
               const std::string& detail = "");

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two microsecond buckets
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 with no samples.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;
  jsonlite::Object summary() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// SecurityStats: process-wide counters
// ---------------------------------------------------------------------------
// All counters are relaxed atomics; to_json() is a best-effort snapshot
// grouped as {"filter":{..},"tokens":{..},"integrity":{..}}.
class SecurityStats {
 public:
  std::string to_json() const;
  void reset();

  std::atomic<uint64_t> recomputes{0};
  std::atomic<uint64_t> recomputes_skipped_unchanged{0};
  std::atomic<uint64_t> blocks_denied{0};
  std::atomic<uint64_t> evaluator_faults{0};

  std::atomic<uint64_t> tokens_issued{0};
  std::atomic<uint64_t> tokens_rejected{0};
  std::atomic<uint64_t> token_fast_path{0};
  std::atomic<uint64_t> token_full_checks{0};
  std::atomic<uint64_t> tokens_invalidated{0};

  std::atomic<uint64_t> verifications{0};
  std::atomic<uint64_t> tamper_detections{0};
  std::atomic<uint64_t> authority_errors{0};
  std::atomic<uint64_t> signatures{0};

  LatencyHistogram recompute_latency;
  LatencyHistogram handshake_latency;

 private:
  // (group, name, counter) triples in serialization order.
  template <typename Self>
  static auto counters(Self& s);
};

SecurityStats& global_security_stats();

inline void bump(std::atomic<uint64_t>& counter, uint64_t n = 1) {
  counter.fetch_add(n, std::memory_order_relaxed);
}

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture into a histogram
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  LatencyHistogram& out;
  explicit ScopeTimer(LatencyHistogram& h) : out(h) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out.record(static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count()));
  }
};

}  // namespace vellum
