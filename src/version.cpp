#include "vellum/version.hpp"

#include <sstream>

#include "vellum/hash.hpp"

#ifndef VELLUM_VERSION
#define VELLUM_VERSION "0.3.0"
#endif

namespace vellum {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver = semver.empty() ? VELLUM_VERSION : semver;
  const auto info = hash_runtime_info();
  m.hash_primitive = info.primitive;
  m.hash_runtime = info.version;
#if defined(VELLUM_WITH_ZSTD)
  m.zstd_enabled = true;
#endif
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"hash_algorithm\":" << m.hash_algorithm
    << ",\"snapshot_format\":" << m.snapshot_format
    << ",\"audit_log\":" << m.audit_log
    << ",\"token_format\":" << m.token_format
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_runtime\":\"" << m.hash_runtime << "\""
    << ",\"zstd_enabled\":" << (m.zstd_enabled ? "true" : "false")
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace vellum
