#pragma once

// vellum/version.hpp: Explicit version manifest for every persisted surface.
//
// PURPOSE:
//   Prevent silent format drift across snapshots, audit logs, capability
//   tokens and content digests. Every component that reads or writes a
//   versioned format checks its constant here before processing data.
//
// INVARIANT:
//   Never silently accept data from a newer format version than the library
//   was compiled against.

#include <cstdint>
#include <string>

namespace vellum {
namespace version {

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3 (32 bytes, hex-encoded to 64 chars), prefix domains.
// Stored block signatures are bound to the digest, so a bump means re-signing.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// SNAPSHOT_FORMAT_VERSION
// Version 1 = one header line {format, encoding, original_size, digest}
// followed by the (optionally zstd-compressed) canonical block array.
// Version 2 adds doc_id to the header. Version 1 files still load.
// ---------------------------------------------------------------------------
constexpr uint32_t SNAPSHOT_FORMAT_VERSION = 2;

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// Version 1 = NDJSON, each line chained to the previous via "aud:" digest.
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

// ---------------------------------------------------------------------------
// TOKEN_FORMAT_VERSION
// Version 1 = "v1|" scope string, keyed BLAKE3 MAC under the "tok:" domain.
// Version 2 = canonical JSON scope object including the subject digest.
// ---------------------------------------------------------------------------
constexpr uint32_t TOKEN_FORMAT_VERSION = 2;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t snapshot_format{SNAPSHOT_FORMAT_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  uint32_t token_format{TOKEN_FORMAT_VERSION};
  std::string semver;           // e.g. "0.3.0" from CMake project version
  std::string hash_primitive;   // "blake3"
  std::string hash_runtime;     // version string reported by the linked library
  bool zstd_enabled{false};
  std::string build_timestamp;  // from __DATE__/__TIME__
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace vellum
