#pragma once

// vellum/types.hpp: Core data model for the secure collaborative document core.
//
// IDENTITY:
//   Block::id is assigned once and never derived from position. Metadata,
//   signatures, verification state and capability tokens are keyed by it and
//   survive reordering, structural edits and undo.
//
// OWNERSHIP:
//   All types are value types with value-owned strings. Every component works
//   on copies (snapshots) taken at invocation start; nothing here holds a
//   reference into live, mutable document state.
//
// SERIALIZATION:
//   *_to_json() emits canonical JSON (sorted keys). *_from_json() never throws;
//   unparseable security labels are flagged as malformed rather than dropped.

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vellum/jsonlite.hpp"

namespace vellum {

enum class ErrorCode {
  none,
  authorization_denied,
  integrity_mismatch,
  authority_unavailable,
  malformed_metadata,
  signing_rejected,
  not_found,
  token_invalid,
  snapshot_corrupt,
  io_error,
  json_parse_error,
  invalid_argument,
};

std::string to_string(ErrorCode code);

// ---------------------------------------------------------------------------
// Classification: ordinal sensitivity label
// ---------------------------------------------------------------------------
enum class Classification : uint8_t {
  public_    = 0,  // trailing underscore avoids the keyword
  internal   = 1,
  confidential = 2,
  restricted = 3,
};

std::optional<Classification> classification_from_string(const std::string& s);
std::string to_string(Classification c);
constexpr int ordinal(Classification c) { return static_cast<int>(c); }

// Role names with built-in meaning. Any other role string is allowed and only
// matters through ACL entries.
namespace roles {
inline constexpr const char* kAdmin   = "admin";
inline constexpr const char* kEditor  = "editor";
inline constexpr const char* kAuditor = "auditor";
inline constexpr const char* kViewer  = "viewer";
}  // namespace roles

// ---------------------------------------------------------------------------
// Subject: immutable snapshot of the acting user at evaluation time
// ---------------------------------------------------------------------------
struct Subject {
  std::string id;
  std::string role{roles::kViewer};
  int clearance_level{0};
  std::optional<std::string> department;
  std::map<std::string, std::string> attributes;  // extension attributes

  bool is_admin() const { return role == roles::kAdmin; }
  bool operator==(const Subject& other) const = default;
};

// ---------------------------------------------------------------------------
// Provenance / BlockMetadata
// ---------------------------------------------------------------------------
struct Provenance {
  std::string source_id;
  std::string author_id;
  uint64_t timestamp_unix_ms{0};
  std::optional<std::string> signature;
  std::optional<std::string> signer_id;
  std::optional<std::string> origin_doc_id;
  std::optional<std::string> origin_url;

  bool operator==(const Provenance& other) const = default;
};

struct BlockMetadata {
  Classification classification{Classification::public_};
  std::vector<std::string> acl;  // subject ids or role names; empty = public
  bool locked{false};            // edit restriction only
  Provenance provenance;
  // Set by the parser when a security label could not be understood. The
  // evaluator then treats the block as restricted.
  bool malformed{false};

  bool operator==(const BlockMetadata& other) const = default;
};

struct Block {
  std::string id;
  std::string type{"paragraph"};
  std::string payload;
  BlockMetadata metadata;

  bool operator==(const Block& other) const = default;
};

// ---------------------------------------------------------------------------
// Ephemeral state
// ---------------------------------------------------------------------------
enum class VerificationStatus {
  unknown,
  verifying,
  verified,
  tampered,
  unsigned_,
};

std::string to_string(VerificationStatus s);

struct CapabilityToken {
  std::string token_id;
  std::string subject_id;
  // subject_fingerprint() of the subject the token was issued to. A subject
  // whose attributes changed since issue no longer matches.
  std::string subject_digest;
  std::string target_doc_id;
  std::string target_block_id;
  std::string signature;
  uint64_t issued_at_unix_ms{0};
  uint64_t expires_at_unix_ms{0};

  bool expired(uint64_t now_ms) const { return now_ms >= expires_at_unix_ms; }
};

enum class ReferenceStatus {
  active,
  broken,
  denied,
};

std::string to_string(ReferenceStatus s);

struct ExternalReference {
  std::string id;
  std::string target_doc_id;
  std::string target_block_id;
  std::string origin_url;
  ReferenceStatus status{ReferenceStatus::active};
  uint64_t last_verified_unix_ms{0};
};

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------
jsonlite::Value metadata_to_value(const BlockMetadata& m);
BlockMetadata metadata_from_value(const jsonlite::Object& obj);

jsonlite::Value block_to_value(const Block& b);
// Returns nullopt when the object has no usable id.
std::optional<Block> block_from_value(const jsonlite::Object& obj);

std::string blocks_to_json(const std::vector<Block>& blocks);
std::optional<std::vector<Block>> blocks_from_json(const std::string& text,
                                                   std::optional<jsonlite::JsonError>* error = nullptr);

std::string subject_to_json(const Subject& s);
std::optional<Subject> subject_from_json(const std::string& text);

std::string metadata_to_json(const BlockMetadata& m);
std::optional<BlockMetadata> metadata_from_json(const std::string& text);

std::string token_to_json(const CapabilityToken& t);
std::string reference_to_json(const ExternalReference& r);

// Canonical scope string a capability token signature is computed over.
// Canonical JSON, so no two distinct scopes share an encoding.
std::string token_scope_string(const CapabilityToken& t);

// "sub:" digest of the canonical subject snapshot (id, role, clearance,
// department, attributes).
std::string subject_fingerprint(const Subject& s);

// Length-prefixed join ("<len>:<part>" per part). Injective for any input.
std::string encode_key(std::initializer_list<std::string_view> parts);

uint64_t now_unix_ms();

}  // namespace vellum
