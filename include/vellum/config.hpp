#pragma once

// vellum/config.hpp: Session configuration with environment overrides.
//
// Precedence: explicit field assignment > VELLUM_* environment > defaults.
// session_config_from_env() reads the environment once; nothing re-reads it
// behind the session's back afterwards.

#include <cstdint>
#include <optional>
#include <string>

namespace vellum {

// One governing policy for missing inputs. Evaluator faults inside the filter
// are denied under both.
enum class FailurePolicy {
  fail_closed,
  fail_open,
};

std::string to_string(FailurePolicy p);
std::optional<FailurePolicy> failure_policy_from_string(const std::string& s);

enum class SnapshotCompression {
  off,
  zstd,
};

std::string to_string(SnapshotCompression c);

struct SessionConfig {
  // Document id treated as local by the cross-origin gate. Blocks whose
  // provenance names a different origin are imported content.
  std::string local_doc_id;
  FailurePolicy failure_policy{FailurePolicy::fail_closed};
  uint64_t token_ttl_s{300};
  uint64_t recompute_debounce_ms{25};
  std::string audit_log_path;  // empty = no file audit log
  std::string event_log_path;  // empty = VELLUM_EVENT_LOG lookup at emit time
  std::string snapshot_dir{".vellum/docs"};
  SnapshotCompression snapshot_compression{SnapshotCompression::off};
};

SessionConfig session_config_from_env();

std::string session_config_to_json(const SessionConfig& c);

}  // namespace vellum
