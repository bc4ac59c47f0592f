#include "vellum/config.hpp"

#include <cstdlib>

#include "vellum/jsonlite.hpp"
#include "vellum/observability.hpp"

namespace vellum {

std::string to_string(FailurePolicy p) {
  return p == FailurePolicy::fail_open ? "fail_open" : "fail_closed";
}

std::optional<FailurePolicy> failure_policy_from_string(const std::string& s) {
  if (s == "fail_closed") return FailurePolicy::fail_closed;
  if (s == "fail_open") return FailurePolicy::fail_open;
  return std::nullopt;
}

std::string to_string(SnapshotCompression c) {
  return c == SnapshotCompression::zstd ? "zstd" : "off";
}

namespace {

std::string env_or(const char* name, const std::string& def) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : def;
}

uint64_t env_u64_or(const char* name, uint64_t def) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return def;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(e, &end, 10);
  if (end == e || *end != '\0') {
    log_event(LogLevel::warn, "config", "invalid_env_value", name);
    return def;
  }
  return static_cast<uint64_t>(v);
}

}  // namespace

SessionConfig session_config_from_env() {
  SessionConfig c;
  c.local_doc_id = env_or("VELLUM_LOCAL_DOC_ID", c.local_doc_id);

  const std::string policy = env_or("VELLUM_FAILURE_POLICY", "");
  if (!policy.empty()) {
    if (auto p = failure_policy_from_string(policy)) {
      c.failure_policy = *p;
    } else {
      // Unknown policy strings never weaken the default.
      log_event(LogLevel::warn, "config", "invalid_failure_policy", policy);
    }
  }

  c.token_ttl_s = env_u64_or("VELLUM_TOKEN_TTL_S", c.token_ttl_s);
  c.recompute_debounce_ms = env_u64_or("VELLUM_RECOMPUTE_DEBOUNCE_MS", c.recompute_debounce_ms);
  c.audit_log_path = env_or("VELLUM_AUDIT_LOG", c.audit_log_path);
  c.event_log_path = env_or("VELLUM_EVENT_LOG", c.event_log_path);
  c.snapshot_dir = env_or("VELLUM_SNAPSHOT_DIR", c.snapshot_dir);

  const std::string comp = env_or("VELLUM_SNAPSHOT_COMPRESSION", "off");
  if (comp == "zstd") {
    c.snapshot_compression = SnapshotCompression::zstd;
  } else if (comp != "off") {
    log_event(LogLevel::warn, "config", "invalid_snapshot_compression", comp);
  }
  return c;
}

std::string session_config_to_json(const SessionConfig& c) {
  jsonlite::Object o;
  o["local_doc_id"] = jsonlite::Value{c.local_doc_id};
  o["failure_policy"] = jsonlite::Value{to_string(c.failure_policy)};
  o["token_ttl_s"] = jsonlite::Value{static_cast<std::uint64_t>(c.token_ttl_s)};
  o["recompute_debounce_ms"] = jsonlite::Value{static_cast<std::uint64_t>(c.recompute_debounce_ms)};
  o["audit_log_path"] = jsonlite::Value{c.audit_log_path};
  o["event_log_path"] = jsonlite::Value{c.event_log_path};
  o["snapshot_dir"] = jsonlite::Value{c.snapshot_dir};
  o["snapshot_compression"] = jsonlite::Value{to_string(c.snapshot_compression)};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace vellum
