#include "vellum/types.hpp"

#include <chrono>
#include <climits>
#include <cmath>

#include "vellum/hash.hpp"
#include "vellum/version.hpp"

namespace vellum {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::authorization_denied: return "authorization_denied";
    case ErrorCode::integrity_mismatch: return "integrity_mismatch";
    case ErrorCode::authority_unavailable: return "authority_unavailable";
    case ErrorCode::malformed_metadata: return "malformed_metadata";
    case ErrorCode::signing_rejected: return "signing_rejected";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::token_invalid: return "token_invalid";
    case ErrorCode::snapshot_corrupt: return "snapshot_corrupt";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::invalid_argument: return "invalid_argument";
  }
  return "";
}

std::optional<Classification> classification_from_string(const std::string& s) {
  if (s == "public")       return Classification::public_;
  if (s == "internal")     return Classification::internal;
  if (s == "confidential") return Classification::confidential;
  if (s == "restricted")   return Classification::restricted;
  return std::nullopt;
}

std::string to_string(Classification c) {
  switch (c) {
    case Classification::public_:      return "public";
    case Classification::internal:     return "internal";
    case Classification::confidential: return "confidential";
    case Classification::restricted:   return "restricted";
  }
  return "restricted";
}

std::string to_string(VerificationStatus s) {
  switch (s) {
    case VerificationStatus::unknown:   return "unknown";
    case VerificationStatus::verifying: return "verifying";
    case VerificationStatus::verified:  return "verified";
    case VerificationStatus::tampered:  return "tampered";
    case VerificationStatus::unsigned_: return "unsigned";
  }
  return "unknown";
}

std::string to_string(ReferenceStatus s) {
  switch (s) {
    case ReferenceStatus::active: return "active";
    case ReferenceStatus::broken: return "broken";
    case ReferenceStatus::denied: return "denied";
  }
  return "broken";
}

uint64_t now_unix_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// ---------------------------------------------------------------------------
// Metadata
// ---------------------------------------------------------------------------

namespace {

void put_optional(Object& o, const char* key, const std::optional<std::string>& v) {
  if (v.has_value()) o[key] = Value{*v};
}

std::optional<std::string> read_optional(const Object& o, const std::string& key) {
  auto it = o.find(key);
  if (it == o.end() || !it->second.is_string()) return std::nullopt;
  return std::get<std::string>(it->second.v);
}

Value provenance_to_value(const Provenance& p) {
  Object o;
  o["source_id"] = Value{p.source_id};
  o["author_id"] = Value{p.author_id};
  o["timestamp_unix_ms"] = Value{static_cast<std::uint64_t>(p.timestamp_unix_ms)};
  put_optional(o, "signature", p.signature);
  put_optional(o, "signer_id", p.signer_id);
  put_optional(o, "origin_doc_id", p.origin_doc_id);
  put_optional(o, "origin_url", p.origin_url);
  return Value{std::move(o)};
}

Provenance provenance_from_value(const Object& o) {
  Provenance p;
  p.source_id = jsonlite::get_string(o, "source_id");
  p.author_id = jsonlite::get_string(o, "author_id");
  p.timestamp_unix_ms = jsonlite::get_u64(o, "timestamp_unix_ms", 0);
  p.signature = read_optional(o, "signature");
  p.signer_id = read_optional(o, "signer_id");
  p.origin_doc_id = read_optional(o, "origin_doc_id");
  p.origin_url = read_optional(o, "origin_url");
  return p;
}

}  // namespace

Value metadata_to_value(const BlockMetadata& m) {
  Object o;
  // A malformed label is persisted as the value the evaluator acted on.
  o["classification"] = Value{to_string(m.malformed ? Classification::restricted : m.classification)};
  Array acl;
  for (const auto& a : m.acl) acl.push_back(Value{a});
  o["acl"] = Value{std::move(acl)};
  o["locked"] = Value{m.locked};
  o["provenance"] = provenance_to_value(m.provenance);
  return Value{std::move(o)};
}

BlockMetadata metadata_from_value(const Object& obj) {
  BlockMetadata m;

  auto cls = obj.find("classification");
  if (cls != obj.end() && !cls->second.is_null()) {
    std::optional<Classification> parsed;
    if (cls->second.is_string()) {
      parsed = classification_from_string(std::get<std::string>(cls->second.v));
    }
    if (parsed) {
      m.classification = *parsed;
    } else {
      m.classification = Classification::restricted;
      m.malformed = true;
    }
  }

  auto acl = obj.find("acl");
  if (acl != obj.end() && !acl->second.is_null()) {
    if (!acl->second.is_array()) {
      m.malformed = true;
      m.classification = Classification::restricted;
    } else {
      for (const auto& entry : std::get<Array>(acl->second.v)) {
        if (!entry.is_string()) {
          m.malformed = true;
          m.classification = Classification::restricted;
          continue;
        }
        m.acl.push_back(std::get<std::string>(entry.v));
      }
    }
  }

  m.locked = jsonlite::get_bool(obj, "locked", false);
  if (const Object* prov = jsonlite::get_object(obj, "provenance")) {
    m.provenance = provenance_from_value(*prov);
  }
  return m;
}

std::string metadata_to_json(const BlockMetadata& m) {
  return jsonlite::to_json(metadata_to_value(m));
}

std::optional<BlockMetadata> metadata_from_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(text, &err);
  if (err) return std::nullopt;
  return metadata_from_value(obj);
}

// ---------------------------------------------------------------------------
// Blocks
// ---------------------------------------------------------------------------

Value block_to_value(const Block& b) {
  Object o;
  o["id"] = Value{b.id};
  o["type"] = Value{b.type};
  o["payload"] = Value{b.payload};
  o["metadata"] = metadata_to_value(b.metadata);
  return Value{std::move(o)};
}

std::optional<Block> block_from_value(const Object& obj) {
  Block b;
  b.id = jsonlite::get_string(obj, "id");
  if (b.id.empty()) return std::nullopt;
  b.type = jsonlite::get_string(obj, "type", "paragraph");
  b.payload = jsonlite::get_string(obj, "payload");
  if (const Object* meta = jsonlite::get_object(obj, "metadata")) {
    b.metadata = metadata_from_value(*meta);
  }
  return b;
}

std::string blocks_to_json(const std::vector<Block>& blocks) {
  Array arr;
  arr.reserve(blocks.size());
  for (const auto& b : blocks) arr.push_back(block_to_value(b));
  return jsonlite::to_json(Value{std::move(arr)});
}

std::optional<std::vector<Block>> blocks_from_json(const std::string& text,
                                                   std::optional<jsonlite::JsonError>* error) {
  std::optional<jsonlite::JsonError> err;
  auto v = jsonlite::parse_value(text, &err);
  if (!err && !v.is_array()) err = jsonlite::JsonError{"json_parse_error", "expected array of blocks"};
  if (error) *error = err;
  if (err) return std::nullopt;

  std::vector<Block> out;
  for (const auto& item : std::get<Array>(v.v)) {
    if (!item.is_object()) continue;
    if (auto b = block_from_value(std::get<Object>(item.v))) out.push_back(std::move(*b));
  }
  return out;
}

// ---------------------------------------------------------------------------
// Subject
// ---------------------------------------------------------------------------

std::string subject_to_json(const Subject& s) {
  Object o;
  o["id"] = Value{s.id};
  o["role"] = Value{s.role};
  o["clearance_level"] = Value{static_cast<double>(s.clearance_level)};
  put_optional(o, "department", s.department);
  Object attrs;
  for (const auto& [k, v] : s.attributes) attrs[k] = Value{v};
  o["attributes"] = Value{std::move(attrs)};
  return jsonlite::to_json(Value{std::move(o)});
}

namespace {

// Absent means 0. Anything but a non-negative integer that fits in int is
// rejected; "3.0" is accepted because subject_to_json writes doubles.
std::optional<int> parse_clearance(const Object& obj) {
  auto it = obj.find("clearance_level");
  if (it == obj.end()) return 0;
  if (const auto* n = std::get_if<std::uint64_t>(&it->second.v)) {
    if (*n > static_cast<std::uint64_t>(INT_MAX)) return std::nullopt;
    return static_cast<int>(*n);
  }
  if (const auto* d = std::get_if<double>(&it->second.v)) {
    if (!std::isfinite(*d) || *d < 0.0 || *d > static_cast<double>(INT_MAX)) return std::nullopt;
    if (std::floor(*d) != *d) return std::nullopt;
    return static_cast<int>(*d);
  }
  return std::nullopt;
}

}  // namespace

std::optional<Subject> subject_from_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(text, &err);
  if (err) return std::nullopt;
  Subject s;
  s.id = jsonlite::get_string(obj, "id");
  if (s.id.empty()) return std::nullopt;
  s.role = jsonlite::get_string(obj, "role", roles::kViewer);
  auto level = parse_clearance(obj);
  if (!level) return std::nullopt;
  s.clearance_level = *level;
  s.department = read_optional(obj, "department");
  s.attributes = jsonlite::get_string_map(obj, "attributes");
  return s;
}

// ---------------------------------------------------------------------------
// Tokens / references
// ---------------------------------------------------------------------------

std::string token_scope_string(const CapabilityToken& t) {
  Object o;
  o["v"] = Value{static_cast<std::uint64_t>(version::TOKEN_FORMAT_VERSION)};
  o["token_id"] = Value{t.token_id};
  o["subject_id"] = Value{t.subject_id};
  o["subject_digest"] = Value{t.subject_digest};
  o["target_doc_id"] = Value{t.target_doc_id};
  o["target_block_id"] = Value{t.target_block_id};
  o["issued_at_unix_ms"] = Value{static_cast<std::uint64_t>(t.issued_at_unix_ms)};
  o["expires_at_unix_ms"] = Value{static_cast<std::uint64_t>(t.expires_at_unix_ms)};
  return jsonlite::to_json(Value{std::move(o)});
}

std::string subject_fingerprint(const Subject& s) {
  return hash_domain("sub:", subject_to_json(s));
}

std::string encode_key(std::initializer_list<std::string_view> parts) {
  std::string out;
  for (const auto part : parts) {
    out += std::to_string(part.size());
    out += ':';
    out += part;
  }
  return out;
}

std::string token_to_json(const CapabilityToken& t) {
  Object o;
  o["token_id"] = Value{t.token_id};
  o["subject_id"] = Value{t.subject_id};
  o["subject_digest"] = Value{t.subject_digest};
  o["target_doc_id"] = Value{t.target_doc_id};
  o["target_block_id"] = Value{t.target_block_id};
  o["issued_at_unix_ms"] = Value{static_cast<std::uint64_t>(t.issued_at_unix_ms)};
  o["expires_at_unix_ms"] = Value{static_cast<std::uint64_t>(t.expires_at_unix_ms)};
  // Bearer material is never serialized.
  o["signed"] = Value{!t.signature.empty()};
  return jsonlite::to_json(Value{std::move(o)});
}

std::string reference_to_json(const ExternalReference& r) {
  Object o;
  o["id"] = Value{r.id};
  o["target_doc_id"] = Value{r.target_doc_id};
  o["target_block_id"] = Value{r.target_block_id};
  o["origin_url"] = Value{r.origin_url};
  o["status"] = Value{to_string(r.status)};
  o["last_verified_unix_ms"] = Value{static_cast<std::uint64_t>(r.last_verified_unix_ms)};
  return jsonlite::to_json(Value{std::move(o)});
}

}  // namespace vellum
