#include "vellum/observability.hpp"

#include <bit>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <map>
#include <mutex>
#include <type_traits>
#include <vector>

#include "vellum/types.hpp"

namespace vellum {

namespace {

size_t bucket_index(uint64_t us) {
  const auto width = static_cast<size_t>(std::bit_width(us));
  return width < LatencyHistogram::kBuckets ? width : LatencyHistogram::kBuckets - 1;
}

std::atomic<LogHook> g_log_hook{nullptr};

std::mutex g_path_mu;
std::string g_event_log_path;

std::string resolve_event_log_path() {
  {
    std::lock_guard<std::mutex> lk(g_path_mu);
    if (!g_event_log_path.empty()) return g_event_log_path;
  }
  const char* env = std::getenv("VELLUM_EVENT_LOG");
  return (env && env[0]) ? std::string(env) : std::string();
}

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info:  return "info";
    case LogLevel::warn:  return "warn";
    case LogLevel::error: return "error";
  }
  return "info";
}

std::string log_event_to_json(const LogEvent& ev) {
  jsonlite::Object o;
  o["ts_ms"] = jsonlite::Value{static_cast<std::uint64_t>(ev.ts_ms)};
  o["level"] = jsonlite::Value{to_string(ev.level)};
  o["component"] = jsonlite::Value{ev.component};
  o["event"] = jsonlite::Value{ev.event};
  o["detail"] = jsonlite::Value{ev.detail};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

void set_log_hook(LogHook hook) {
  g_log_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_path_mu);
  g_event_log_path = path;
}

void log_event(LogLevel level, const std::string& component, const std::string& event,
               const std::string& detail) {
  const LogEvent ev{now_unix_ms(), level, component, event, detail};
  if (LogHook hook = g_log_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }

  const std::string path = resolve_event_log_path();
  if (path.empty()) return;

  std::ofstream out(path, std::ios::app | std::ios::binary);
  if (out) out << log_event_to_json(ev) << '\n';
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_index(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count();
  return n == 0 ? 0.0
                : static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count();
  if (n == 0) return 0.0;

  // Midpoint of the first bucket whose cumulative count reaches p * n.
  const auto rank = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t seen = 0;
  size_t i = 0;
  for (; i + 1 < kBuckets; ++i) {
    seen += buckets_[i].load(std::memory_order_relaxed);
    if (seen >= rank) break;
  }
  const double upper = static_cast<double>(1ULL << i);
  return i == 0 ? 0.5 : upper * 0.75;
}

std::string LatencyHistogram::to_json() const {
  return jsonlite::to_json(jsonlite::Value{summary()});
}

jsonlite::Object LatencyHistogram::summary() const {
  auto round2 = [](double v) { return jsonlite::Value{static_cast<double>(std::llround(v * 100.0)) / 100.0}; };
  jsonlite::Object o;
  o["count"] = jsonlite::Value{count()};
  o["mean_us"] = round2(mean_us());
  o["p50_us"] = round2(percentile(0.50));
  o["p99_us"] = round2(percentile(0.99));
  return o;
}

// ---------------------------------------------------------------------------
// SecurityStats
// ---------------------------------------------------------------------------

template <typename Self>
auto SecurityStats::counters(Self& s) {
  using Atomic = std::remove_reference_t<decltype((s.recomputes))>;
  struct Counter {
    const char* group;
    const char* name;
    Atomic* value;
  };
  return std::vector<Counter>{
      {"filter", "recomputes", &s.recomputes},
      {"filter", "recomputes_skipped_unchanged", &s.recomputes_skipped_unchanged},
      {"filter", "blocks_denied", &s.blocks_denied},
      {"filter", "evaluator_faults", &s.evaluator_faults},
      {"tokens", "issued", &s.tokens_issued},
      {"tokens", "rejected", &s.tokens_rejected},
      {"tokens", "fast_path", &s.token_fast_path},
      {"tokens", "full_checks", &s.token_full_checks},
      {"tokens", "invalidated", &s.tokens_invalidated},
      {"integrity", "verifications", &s.verifications},
      {"integrity", "tamper_detections", &s.tamper_detections},
      {"integrity", "authority_errors", &s.authority_errors},
      {"integrity", "signatures", &s.signatures},
  };
}

void SecurityStats::reset() {
  for (const auto& c : counters(*this)) c.value->store(0, std::memory_order_relaxed);
}

std::string SecurityStats::to_json() const {
  std::map<std::string, jsonlite::Object> groups;
  for (const auto& c : counters(*this)) {
    groups[c.group][c.name] = jsonlite::Value{c.value->load(std::memory_order_relaxed)};
  }
  groups["filter"]["latency"] = jsonlite::Value{recompute_latency.summary()};
  groups["tokens"]["handshake_latency"] = jsonlite::Value{handshake_latency.summary()};

  jsonlite::Object root;
  for (auto& [group, fields] : groups) root[group] = jsonlite::Value{std::move(fields)};
  return jsonlite::to_json(jsonlite::Value{std::move(root)});
}

SecurityStats& global_security_stats() {
  static SecurityStats inst;
  return inst;
}

}  // namespace vellum
