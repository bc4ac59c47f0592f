#include "vellum/hash.hpp"

// Hash authority.
//
// EXTENSION_POINT: hash_algorithm_upgrade
//   Current: BLAKE3-256, domain separation via prefix.
//   Upgrade path: bump version::HASH_ALGORITHM_VERSION, dual-verify during the
//   migration window, then drop version 1. Stored provenance signatures are
//   bound to the "blk:" digest, so a migration must re-sign or keep v1 verify.

#include <random>

extern "C" {
#include <blake3.h>
}

namespace vellum {
namespace {

// One-shot BLAKE3 state in plain, keyed or derive-key mode.
class Digest {
 public:
  Digest() { blake3_hasher_init(&h_); }
  explicit Digest(const KeyBytes& key) { blake3_hasher_init_keyed(&h_, key.data()); }
  // `context` must be NUL-terminated.
  explicit Digest(const char* context) { blake3_hasher_init_derive_key(&h_, context); }

  Digest& add(std::string_view part) {
    blake3_hasher_update(&h_, part.data(), part.size());
    return *this;
  }

  KeyBytes raw() {
    KeyBytes out{};
    blake3_hasher_finalize(&h_, out.data(), out.size());
    return out;
  }

  std::string hex() {
    static constexpr char kDigits[] = "0123456789abcdef";
    const KeyBytes bytes = raw();
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const uint8_t b : bytes) {
      out += kDigits[b >> 4];
      out += kDigits[b & 0x0f];
    }
    return out;
  }

 private:
  blake3_hasher h_;
};

static_assert(BLAKE3_OUT_LEN == kKeyBytes, "digest width must match key width");

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  return HashRuntimeInfo{"blake3", blake3_version(), true};
}

std::string blake3_hex(std::string_view payload) {
  return Digest().add(payload).hex();
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return Digest().add(domain).add(payload).hex();
}

std::string keyed_hash_domain(const KeyBytes& key, std::string_view domain,
                              std::string_view payload) {
  return Digest(key).add(domain).add(payload).hex();
}

std::string block_content_hash(std::string_view content) { return hash_domain("blk:", content); }
std::string snapshot_body_hash(std::string_view body) { return hash_domain("snap:", body); }
std::string audit_chain_hash(std::string_view line) { return hash_domain("aud:", line); }

std::string key_fingerprint(const KeyBytes& key) {
  return blake3_hex({reinterpret_cast<const char*>(key.data()), key.size()}).substr(0, 16);
}

KeyBytes derive_key(std::string_view context, std::string_view material) {
  const std::string ctx(context);
  return Digest(ctx.c_str()).add(material).raw();
}

KeyBytes random_key() {
  std::random_device rd;
  std::uniform_int_distribution<unsigned> byte(0, 255);
  KeyBytes out{};
  for (auto& b : out) b = static_cast<uint8_t>(byte(rd));
  return out;
}

bool digest_equal(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  unsigned char acc = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    acc |= static_cast<unsigned char>(a[i] ^ b[i]);
  }
  return acc == 0;
}

bool is_hex_digest(std::string_view s) {
  if (s.size() != 64) return false;
  for (const char c : s) {
    const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex) return false;
  }
  return true;
}

}  // namespace vellum
