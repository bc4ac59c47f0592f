#pragma once

// vellum/hash.hpp: BLAKE3 hash authority for block content, snapshots,
// audit chaining and keyed authenticators.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. All digests are 64 lowercase hex chars.
//   2. Domain separation by prefix: "blk:", "snap:", "aud:", "tok:", "sig:",
//      "sub:".
//      The prefixes are part of the on-disk and on-wire contract.
//   3. Keyed digests use BLAKE3 keyed mode with a 32-byte key. Keys never leave
//      the process and are never logged; only fingerprints are.

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace vellum {

constexpr std::size_t kKeyBytes = 32;
using KeyBytes = std::array<uint8_t, kKeyBytes>;

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  bool blake3_available{false};
};

HashRuntimeInfo hash_runtime_info();

std::string blake3_hex(std::string_view payload);

std::string hash_domain(std::string_view domain, std::string_view payload);

// Keyed (MAC) digest with domain prefix.
std::string keyed_hash_domain(const KeyBytes& key, std::string_view domain,
                              std::string_view payload);

// Content-addressed digest of a block's payload ("blk:" domain).
std::string block_content_hash(std::string_view content);
std::string snapshot_body_hash(std::string_view body);
std::string audit_chain_hash(std::string_view line);

// First 16 hex chars of BLAKE3(key). Safe to log and persist.
std::string key_fingerprint(const KeyBytes& key);

// Derive a 32-byte key from a passphrase/seed (BLAKE3 derive_key mode).
KeyBytes derive_key(std::string_view context, std::string_view material);

// Fresh random key from the OS random device.
KeyBytes random_key();

// Constant-time comparison for digests and signatures.
bool digest_equal(std::string_view a, std::string_view b);

bool is_hex_digest(std::string_view s);

}  // namespace vellum
