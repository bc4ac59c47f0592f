#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "vellum/abac.hpp"
#include "vellum/audit.hpp"
#include "vellum/capability_broker.hpp"
#include "vellum/config.hpp"
#include "vellum/content_store.hpp"
#include "vellum/hash.hpp"
#include "vellum/integrity.hpp"
#include "vellum/jsonlite.hpp"
#include "vellum/metadata_store.hpp"
#include "vellum/observability.hpp"
#include "vellum/reference_registry.hpp"
#include "vellum/secure_sync.hpp"
#include "vellum/session.hpp"
#include "vellum/snapshot_store.hpp"
#include "vellum/types.hpp"
#include "vellum/version.hpp"

namespace fs = std::filesystem;

using vellum::Block;
using vellum::Classification;
using vellum::Subject;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

Block make_block(const std::string& id, const std::string& payload,
                 Classification cls = Classification::public_,
                 std::vector<std::string> acl = {}, bool locked = false) {
  Block b;
  b.id = id;
  b.payload = payload;
  b.metadata.classification = cls;
  b.metadata.acl = std::move(acl);
  b.metadata.locked = locked;
  return b;
}

Block imported_block(const std::string& id, const std::string& origin_doc,
                     const std::string& source_id) {
  Block b = make_block(id, "");
  b.type = "transclusion";
  b.metadata.provenance.origin_doc_id = origin_doc;
  b.metadata.provenance.origin_url = "local://" + origin_doc;
  b.metadata.provenance.source_id = source_id;
  return b;
}

Subject make_subject(const std::string& id, const std::string& role, int clearance) {
  Subject s;
  s.id = id;
  s.role = role;
  s.clearance_level = clearance;
  return s;
}

std::string temp_dir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / ("vellum_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir.string();
}

std::string read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void write_file(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << data;
}

vellum::KeyBytes test_key(const std::string& label) {
  return vellum::derive_key("vellum tests 2024", label);
}

vellum::RecomputeInputs inputs(std::vector<Block> blocks, const Subject& s, uint64_t epoch,
                               uint64_t version) {
  vellum::RecomputeInputs in;
  in.blocks = std::move(blocks);
  in.subject = s;
  in.subject_epoch = epoch;
  in.content_version = version;
  return in;
}

// Fails evaluation for any block whose provenance names "boom".
class ThrowingEvaluator : public vellum::abac::IAccessEvaluator {
 public:
  vellum::abac::AccessDecision evaluate(const Subject* subject,
                                        const vellum::BlockMetadata* metadata) const override {
    if (metadata && metadata->provenance.source_id == "boom") {
      throw std::runtime_error("policy backend offline");
    }
    return vellum::abac::evaluate(subject, metadata, {});
  }
  vellum::abac::AccessDecision evaluate_edit(const Subject* subject,
                                             const vellum::BlockMetadata* metadata) const override {
    return evaluate(subject, metadata);
  }
};

// Wraps a real authority; can hold one handshake open and counts resolves.
class GatedAuthority : public vellum::ITargetAuthority {
 public:
  explicit GatedAuthority(vellum::ITargetAuthority& inner) : inner_(inner) {}

  std::optional<vellum::CapabilityToken> issue_token(const Subject& subject,
                                                     const std::string& doc_id,
                                                     const std::string& block_id) override {
    if (gated.exchange(false)) {
      entered.set_value();
      released.wait();
    }
    return inner_.issue_token(subject, doc_id, block_id);
  }

  vellum::ResolveResult resolve(const Subject& subject, const std::string& doc_id,
                                const std::string& block_id,
                                const vellum::CapabilityToken* token) override {
    resolves.fetch_add(1);
    return inner_.resolve(subject, doc_id, block_id, token);
  }

  std::atomic<bool> gated{false};
  std::promise<void> entered;
  std::promise<void> release;
  std::shared_future<void> released{release.get_future().share()};
  std::atomic<int> resolves{0};

 private:
  vellum::ITargetAuthority& inner_;
};

std::mutex g_log_mu;
std::vector<vellum::LogEvent> g_logged;

void capture_log(const vellum::LogEvent& ev) {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_logged.push_back(ev);
}

// ============================================================================
// Phase 1: Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(vellum::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(vellum::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "same bytes";
  const auto blk = vellum::block_content_hash(payload);
  const auto snap = vellum::snapshot_body_hash(payload);
  const auto aud = vellum::audit_chain_hash(payload);
  expect(blk != snap && snap != aud && blk != aud, "domains must not collide");
  expect(vellum::is_hex_digest(blk), "block hash is 64 lowercase hex");
  expect(blk == vellum::hash_domain("blk:", payload), "blk prefix");
}

void test_keyed_hash_depends_on_key() {
  const auto a = vellum::keyed_hash_domain(test_key("a"), "tok:", "scope");
  const auto b = vellum::keyed_hash_domain(test_key("b"), "tok:", "scope");
  expect(a != b, "different keys give different MACs");
  expect(a == vellum::keyed_hash_domain(test_key("a"), "tok:", "scope"), "keyed MAC deterministic");
  expect(vellum::key_fingerprint(test_key("a")).size() == 16, "fingerprint is 16 hex chars");
  expect(vellum::digest_equal(a, a) && !vellum::digest_equal(a, b), "digest_equal");
}

// ============================================================================
// Phase 2: Serialization
// ============================================================================

void test_json_strictness() {
  expect(vellum::jsonlite::validate_strict("{\"a\":1,\"a\":2}").has_value(),
         "duplicate keys rejected");
  expect(vellum::jsonlite::validate_strict("{\"a\":1} x").has_value(), "trailing data rejected");
  expect(!vellum::jsonlite::validate_strict("{\"a\":[1,2,{\"b\":null}]}").has_value(),
         "valid JSON accepted");
  std::optional<vellum::jsonlite::JsonError> err;
  expect(vellum::jsonlite::canonicalize_json("{\"b\":1,\"a\":2}", &err) == "{\"a\":2,\"b\":1}",
         "canonical output sorts keys");
}

void test_metadata_round_trip() {
  vellum::BlockMetadata m;
  m.classification = Classification::confidential;
  m.acl = {"editor", "u-7"};
  m.locked = true;
  m.provenance.source_id = "src";
  m.provenance.author_id = "u-7";
  m.provenance.signature = "u-7.abc";
  m.provenance.origin_doc_id = "other";
  const auto json = vellum::metadata_to_json(m);
  const auto back = vellum::metadata_from_json(json);
  expect(back.has_value(), "metadata parses");
  expect(*back == m, "metadata survives round trip");
  expect(vellum::metadata_to_json(*back) == json, "serialization is byte-stable");
}

void test_malformed_metadata_flagged() {
  auto bad_label = vellum::metadata_from_json("{\"classification\":\"top-secret\"}");
  expect(bad_label && bad_label->malformed, "unknown label flagged");
  expect(bad_label->classification == Classification::restricted, "unknown label -> restricted");

  auto bad_acl = vellum::metadata_from_json("{\"classification\":\"public\",\"acl\":[\"a\",7]}");
  expect(bad_acl && bad_acl->malformed, "non-string ACL entry flagged");

  auto absent = vellum::metadata_from_json("{}");
  expect(absent && !absent->malformed && absent->classification == Classification::public_,
         "absent fields are public defaults");
}

void test_blocks_without_id_dropped() {
  auto blocks = vellum::blocks_from_json(
      "[{\"id\":\"a\",\"payload\":\"x\"},{\"payload\":\"no id\"},{\"id\":\"b\"}]");
  expect(blocks && blocks->size() == 2, "blocks without id are dropped");
  expect((*blocks)[1].type == "paragraph", "type defaults to paragraph");
  expect(!vellum::blocks_from_json("{\"id\":\"a\"}").has_value(), "non-array rejected");
}

void test_token_json_hides_signature() {
  vellum::CapabilityToken t;
  t.token_id = "cap-1";
  t.signature = "deadbeef";
  const auto json = vellum::token_to_json(t);
  expect(json.find("deadbeef") == std::string::npos, "signature never serialized");
  expect(json.find("\"signed\":true") != std::string::npos, "signed flag present");
}

// ============================================================================
// Phase 3: ABAC evaluator
// ============================================================================

void test_subject_clearance_validated() {
  const auto level = [](const std::string& v) {
    return vellum::subject_from_json("{\"id\":\"u\",\"clearance_level\":" + v + "}");
  };
  expect(level("3") && level("3")->clearance_level == 3, "integer clearance");
  expect(level("3.0") && level("3.0")->clearance_level == 3, "integral double clearance");
  expect(!level("2.5"), "fractional clearance rejected");
  expect(!level("-1"), "negative clearance rejected");
  expect(!level("1e300"), "out of range clearance rejected");
  expect(!level("4294967296"), "clearance wider than int rejected");
  expect(!level("\"3\""), "string clearance rejected");
  const auto absent = vellum::subject_from_json("{\"id\":\"u\"}");
  expect(absent && absent->clearance_level == 0, "absent clearance is 0");
}

void test_scenario_a_clearance_gate() {
  vellum::BlockMetadata m;
  m.classification = Classification::restricted;
  const auto subject = make_subject("u", "editor", 2);
  const auto d = vellum::abac::evaluate(&subject, &m, {});
  expect(!d.allowed, "restricted denied at clearance 2 even with empty ACL");
  expect(d.gate == vellum::abac::Gate::classification, "denied by classification gate");
}

void test_scenario_b_acl_role_match() {
  vellum::BlockMetadata m;
  m.classification = Classification::confidential;
  m.acl = {"editor"};
  expect(vellum::abac::can_view(make_subject("u", "editor", 2), m), "editor at clearance 2 allowed");
}

void test_scenario_c_acl_independent_of_clearance() {
  vellum::BlockMetadata m;
  m.classification = Classification::confidential;
  m.acl = {"editor"};
  const auto subject = make_subject("root", "admin", 5);
  const auto d = vellum::abac::evaluate(&subject, &m, {});
  expect(!d.allowed, "admin not on ACL denied");
  expect(d.gate == vellum::abac::Gate::acl, "denied by ACL gate");
}

void test_acl_matches_subject_id() {
  vellum::BlockMetadata m;
  m.acl = {"u-42"};
  expect(vellum::abac::can_view(make_subject("u-42", "viewer", 0), m), "id on ACL allowed");
  expect(!vellum::abac::can_view(make_subject("u-43", "viewer", 0), m), "other id denied");
}

void test_evaluator_deterministic() {
  vellum::BlockMetadata m;
  m.classification = Classification::internal;
  m.acl = {"viewer"};
  const auto s = make_subject("u", "viewer", 1);
  const auto first = vellum::abac::evaluate(&s, &m, {}).to_json();
  for (int i = 0; i < 50; ++i) {
    expect(vellum::abac::evaluate(&s, &m, {}).to_json() == first, "evaluate is deterministic");
  }
}

void test_failure_policy() {
  vellum::abac::EvaluatorConfig closed;
  vellum::abac::EvaluatorConfig open;
  open.failure_policy = vellum::FailurePolicy::fail_open;
  vellum::BlockMetadata m;

  const auto denied = vellum::abac::evaluate(nullptr, &m, closed);
  expect(!denied.allowed && denied.gate == vellum::abac::Gate::subject_missing,
         "fail_closed denies without subject");
  expect(vellum::abac::evaluate(nullptr, &m, open).allowed, "fail_open allows without subject");

  // Absent metadata means public defaults under both policies.
  const auto s = make_subject("u", "viewer", 0);
  expect(vellum::abac::evaluate(&s, nullptr, closed).allowed, "absent metadata is public");

  vellum::BlockMetadata malformed;
  malformed.malformed = true;
  const auto editor = make_subject("u", "editor", 2);
  expect(!vellum::abac::evaluate(&editor, &malformed, open).allowed,
         "malformed metadata is restricted even under fail_open");
}

void test_locked_requires_admin_for_edit() {
  vellum::BlockMetadata m;
  m.locked = true;
  const auto editor = make_subject("e", "editor", 3);
  expect(vellum::abac::can_view(editor, m), "locked blocks stay visible");
  const auto d = vellum::abac::evaluate_edit(&editor, &m, {});
  expect(!d.allowed && d.gate == vellum::abac::Gate::locked, "locked edit denied for editor");
  expect(vellum::abac::can_edit(make_subject("a", "admin", 0), m), "admin may edit locked");
}

void test_imported_restricted_content() {
  vellum::BlockMetadata m;
  m.classification = Classification::restricted;
  m.provenance.origin_doc_id = "elsewhere";
  vellum::abac::EvaluatorConfig cfg;
  cfg.local_doc_id = "here";
  expect(!vellum::abac::can_view(make_subject("u", "editor", 2), m, cfg),
         "imported restricted denied below clearance 3");
  expect(vellum::abac::can_view(make_subject("u", "editor", 3), m, cfg),
         "imported restricted allowed at clearance 3");
}

// ============================================================================
// Phase 4: Stores
// ============================================================================

void test_metadata_store_snapshot_reload() {
  vellum::MetadataStore store;
  std::vector<std::string> seen;
  store.subscribe([&](const std::string& id, const std::optional<vellum::BlockMetadata>&) {
    seen.push_back(id);
  });
  store.set("old", vellum::BlockMetadata{});
  store.set_verification_status("old", vellum::VerificationStatus::verified);

  store.load_from_snapshot({make_block("a", "x", Classification::internal), make_block("b", "y")});
  expect(!store.contains("old"), "previous document's metadata cleared");
  expect(store.verification_status("old") == vellum::VerificationStatus::unknown,
         "previous verification cleared");
  expect(store.get("a")->classification == Classification::internal, "new metadata loaded");
  expect(!store.get("missing").has_value(), "unknown id has no metadata");
  expect(std::find(seen.begin(), seen.end(), "old") != seen.end(), "removal notified");
}

void test_metadata_store_tokens_scoped() {
  vellum::MetadataStore store;
  const auto u = make_subject("u", "editor", 2);
  vellum::CapabilityToken t;
  t.token_id = "cap-a";
  t.subject_id = "u";
  t.subject_digest = vellum::subject_fingerprint(u);
  t.target_doc_id = "d";
  t.target_block_id = "b1";
  store.put_token(t);
  expect(store.find_token(u, "d", "b1").has_value(), "token found for its scope");
  expect(!store.find_token(u, "d", "b2").has_value(), "sibling block not covered");
  expect(!store.find_token(make_subject("v", "editor", 2), "d", "b1").has_value(),
         "other subject not covered");
  expect(!store.find_token(make_subject("u", "viewer", 2), "d", "b1").has_value(),
         "same id with changed role not covered");
  expect(!store.find_token(u, "d|b", "1").has_value() && !store.find_token(u, "", "db1"),
         "scope key has no separator collisions");
  expect(store.clear_all_tokens() == 1 && store.token_count() == 0, "clear drops all tokens");
}

void test_content_store_ids_survive_moves() {
  vellum::InMemoryContentStore store;
  store.append(make_block("a", "1"));
  store.append(make_block("b", "2"));
  store.append(make_block("c", "3"));
  expect(!store.append(make_block("a", "dup")), "duplicate id rejected");
  expect(store.move("c", 0), "move succeeds");
  const auto snap = store.snapshot();
  expect(snap[0].id == "c" && snap[0].payload == "3", "moved block keeps id and payload");

  const uint64_t before = store.version();
  bool threw = false;
  try {
    store.transact([](std::vector<Block>& blocks) {
      blocks.clear();
      throw std::runtime_error("abort");
    });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  expect(threw, "transaction exception propagates");
  expect(store.snapshot().size() == 3 && store.version() == before,
         "failed transaction leaves store unchanged");
}

void test_reference_registry_from_blocks() {
  vellum::ExternalReferenceRegistry refs;
  std::vector<Block> blocks = {make_block("local", "x"), imported_block("r1", "ext", "x1"),
                               imported_block("self", "main", "s")};
  expect(refs.register_from_blocks(blocks, "main") == 1, "only foreign origins registered");
  const auto r = refs.get("r1");
  expect(r && r->target_doc_id == "ext" && r->target_block_id == "x1", "reference target");
  expect(refs.update_status("r1", vellum::ReferenceStatus::broken), "status update");
  expect(refs.get("r1")->last_verified_unix_ms > 0, "last verified stamped");
  expect(!refs.add(vellum::ExternalReference{}), "empty reference rejected");
}

// ============================================================================
// Phase 5: Secure sync filter
// ============================================================================

std::vector<Block> mixed_document() {
  return {
      make_block("p0", "public"),
      make_block("i1", "internal", Classification::internal),
      make_block("c2", "confidential", Classification::confidential, {"editor"}),
      make_block("r3", "restricted", Classification::restricted),
      make_block("p4", "tail"),
  };
}

void test_filter_keeps_only_allowed_in_order() {
  vellum::abac::AccessEvaluator evaluator;
  vellum::MetadataStore metadata;
  vellum::NullAuditSink audit;
  vellum::SecureSyncFilter filter("doc", evaluator, metadata, audit);

  const auto s = make_subject("u", "editor", 2);
  const auto view = filter.compute(mixed_document(), &s);
  const std::vector<std::string> expected = {"p0", "i1", "c2", "p4"};
  expect(view.ids() == expected, "allowed blocks in document order");
  expect(view.redactions.size() == 1, "one redaction");
  expect(view.redactions[0].block_id == "r3" && view.redactions[0].position == 3,
         "marker carries id and original position");
  expect(view.redactions[0].required == Classification::restricted, "marker reveals label only");
  expect(view.to_json().find("\"required\":\"restricted\"") != std::string::npos,
         "marker serialized");
  expect(view.to_json().find("\"payload\":\"restricted\"") == std::string::npos,
         "denied payload never serialized");
}

void test_filter_idempotent() {
  vellum::abac::AccessEvaluator evaluator;
  vellum::MetadataStore metadata;
  vellum::NullAuditSink audit;
  vellum::SecureSyncFilter filter("doc", evaluator, metadata, audit);
  const auto s = make_subject("u", "viewer", 1);

  const auto first = filter.recompute(inputs(mixed_document(), s, 1, 1));
  expect(first.published, "first recompute publishes");
  const auto gen = filter.view()->generation;
  const auto ids = filter.view()->ids();
  const auto second = filter.recompute(inputs(mixed_document(), s, 1, 1));
  expect(second.unchanged && !second.published, "second recompute is a no-op");
  expect(filter.view()->generation == gen && filter.view()->ids() == ids, "identical view");
}

void test_filter_monotonic_in_clearance() {
  vellum::abac::AccessEvaluator evaluator;
  vellum::MetadataStore metadata;
  vellum::NullAuditSink audit;
  vellum::SecureSyncFilter filter("doc", evaluator, metadata, audit);
  auto doc = mixed_document();
  doc.push_back(make_block("r5", "x", Classification::restricted, {"viewer", "editor"}));

  for (const char* role : {"viewer", "editor", "admin"}) {
    std::set<std::string> previous;
    for (int level = 0; level <= 4; ++level) {
      const auto s = make_subject("u", role, level);
      const auto ids = filter.compute(doc, &s).ids();
      const std::set<std::string> now(ids.begin(), ids.end());
      for (const auto& id : previous) {
        expect(now.count(id) == 1, "raising clearance never hides " + id);
      }
      previous = now;
    }
  }
}

void test_filter_prefers_shadow_metadata() {
  vellum::abac::AccessEvaluator evaluator;
  vellum::MetadataStore metadata;
  vellum::NullAuditSink audit;
  vellum::SecureSyncFilter filter("doc", evaluator, metadata, audit);
  const auto s = make_subject("u", "viewer", 0);

  std::vector<Block> doc = {make_block("a", "x")};
  expect(filter.compute(doc, &s).ids().size() == 1, "public block visible");
  vellum::BlockMetadata tightened;
  tightened.classification = Classification::confidential;
  metadata.set("a", tightened);
  expect(filter.compute(doc, &s).ids().empty(), "shadow label wins over block's own");
}

void test_filter_evaluator_fault_denies() {
  ThrowingEvaluator evaluator;
  vellum::MetadataStore metadata;
  vellum::MemoryAuditSink audit;
  vellum::SecureSyncFilter filter("doc", evaluator, metadata, audit);

  Block boom = make_block("b", "secret");
  boom.metadata.provenance.source_id = "boom";
  const auto r = filter.recompute(
      inputs({make_block("a", "fine"), boom}, make_subject("u", "admin", 9), 1, 1));
  expect(r.published && r.faults == 1 && r.visible == 1, "faulting block denied, others kept");
  const auto view = filter.view();
  expect(view->redactions.size() == 1 && view->redactions[0].fault, "marker flags the fault");
  expect(view->redactions[0].required == Classification::restricted, "fault reported restricted");
  expect(audit.count(vellum::audit_actions::kAccessDenied) == 1, "fault denial audited");
}

void test_filter_audits_only_new_denials() {
  vellum::abac::AccessEvaluator evaluator;
  vellum::MetadataStore metadata;
  vellum::MemoryAuditSink audit;
  vellum::SecureSyncFilter filter("doc", evaluator, metadata, audit);
  const auto s = make_subject("u", "viewer", 0);

  auto doc = mixed_document();
  filter.recompute(inputs(doc, s, 1, 1));
  const size_t denied = audit.count(vellum::audit_actions::kAccessDenied);
  expect(denied == 3, "three denials audited on first view");

  doc[0].payload = "edited";
  const auto r = filter.recompute(inputs(doc, s, 1, 2));
  expect(r.published, "payload edit republishes");
  expect(filter.view()->blocks[0].payload == "edited", "edit visible in view");
  expect(audit.count(vellum::audit_actions::kAccessDenied) == denied,
         "repeat denials not re-audited");
}

void test_filter_drops_stale_inputs() {
  vellum::abac::AccessEvaluator evaluator;
  vellum::MetadataStore metadata;
  vellum::NullAuditSink audit;
  vellum::SecureSyncFilter filter("doc", evaluator, metadata, audit);

  filter.recompute(inputs(mixed_document(), make_subject("u", "editor", 2), 2, 5));
  const auto gen = filter.view()->generation;
  const auto r = filter.recompute(inputs({}, make_subject("u", "admin", 9), 1, 9));
  expect(r.stale && !r.published, "older subject epoch dropped");
  expect(filter.view()->generation == gen, "published view untouched");
}

void test_filter_reentrant_recompute() {
  vellum::abac::AccessEvaluator evaluator;
  vellum::MetadataStore metadata;
  vellum::NullAuditSink audit;
  vellum::SecureSyncFilter filter("doc", evaluator, metadata, audit);
  const auto s = make_subject("u", "viewer", 0);

  std::mutex mu;
  std::vector<Block> doc = {make_block("a", "1"), make_block("b", "2")};
  uint64_t version = 1;
  vellum::InputSource source = [&] {
    std::lock_guard<std::mutex> lk(mu);
    return inputs(doc, s, 1, version);
  };

  bool mutated = false;
  vellum::RecomputeResult inner;
  int notifications = 0;
  filter.subscribe([&](const std::shared_ptr<const vellum::FilteredView>&) {
    ++notifications;
    if (mutated) return;
    mutated = true;
    {
      std::lock_guard<std::mutex> lk(mu);
      doc.push_back(make_block("late", "3"));
      ++version;
    }
    inner = filter.recompute(source);
  });

  const auto outer = filter.recompute(source);
  expect(inner.deferred, "nested recompute folded into the running one");
  expect(outer.published, "outer recompute published");
  expect(filter.view()->ids().size() == 3, "rerun picked up the listener's edit");
  expect(notifications == 2, "one notification per published view");
}

void test_debouncer_coalesces() {
  std::atomic<int> runs{0};
  vellum::RecomputeDebouncer debouncer(std::chrono::milliseconds(200), [&] { runs.fetch_add(1); });
  for (int i = 0; i < 10; ++i) debouncer.trigger();
  debouncer.flush();
  expect(runs.load() == 1, "burst of triggers runs once");
  expect(debouncer.triggers() == 10 && debouncer.runs() == 1, "counters");
  debouncer.stop();
  debouncer.trigger();
  expect(debouncer.runs() == 1, "no runs after stop");
}

void test_debouncer_flush_while_running_keeps_delay() {
  std::atomic<int> runs{0};
  std::atomic<bool> gated{true};
  std::promise<void> entered;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  vellum::RecomputeDebouncer debouncer(std::chrono::milliseconds(300), [&] {
    if (gated.exchange(false)) {
      entered.set_value();
      released.wait();
    }
    runs.fetch_add(1);
  });

  debouncer.trigger();
  std::thread first([&] { debouncer.flush(); });
  entered.get_future().wait();
  // Running with nothing pending.
  std::thread second([&] { debouncer.flush(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  release.set_value();
  first.join();
  second.join();
  expect(runs.load() == 1, "one run");

  debouncer.trigger();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  expect(runs.load() == 1, "a later trigger still waits out the delay");
  debouncer.flush();
  expect(runs.load() == 2, "flush runs it");
}

// ============================================================================
// Phase 6: Capability tokens and transclusion
// ============================================================================

struct TransclusionFixture {
  vellum::MemoryAuditSink audit;
  vellum::LocalDocumentAuthority authority{"local://ext", test_key("authority"), 300, &audit};
  vellum::MetadataStore store;
  vellum::ExternalReferenceRegistry refs;
  vellum::CapabilityBroker broker{authority, store, refs, audit};
  uint64_t clock_ms{1'000'000};

  TransclusionFixture() {
    authority.host_document("ext", {make_block("x1", "one"), make_block("x2", "two"),
                                    make_block("x3", "three"),
                                    make_block("secret", "s", Classification::restricted)});
    refs.register_from_blocks({imported_block("r1", "ext", "x1"), imported_block("r2", "ext", "x2"),
                               imported_block("r3", "ext", "x3"),
                               imported_block("rs", "ext", "secret"),
                               imported_block("gone", "ext", "missing")},
                              "main");
    authority.set_clock([this] { return clock_ms; });
    broker.set_clock([this] { return clock_ms; });
  }
};

void test_token_scope_is_per_block() {
  TransclusionFixture f;
  const auto s = make_subject("u", "editor", 1);
  const auto token = f.broker.request_token(s, "ext", "x1");
  expect(token.has_value(), "token issued for public block");
  expect(token->token_id.rfind("cap-", 0) == 0 && token->token_id.size() == 36, "token id shape");
  expect(f.authority.verify_token(*token, s, "ext", "x1"), "token valid for its block");
  expect(!f.authority.verify_token(*token, s, "ext", "x2"), "token invalid for sibling block");
  expect(!f.authority.verify_token(*token, make_subject("v", "editor", 1), "ext", "x1"),
         "token invalid for another subject");

  auto forged = *token;
  forged.expires_at_unix_ms += 1'000'000;
  expect(!f.authority.verify_token(forged, s, "ext", "x1"), "tampered scope fails signature");

  const auto r = f.authority.resolve(s, "ext", "x2", &*token);
  expect(r.ok && !r.via_token, "sibling resolve takes the full check");
}

void test_token_cannot_be_retargeted_across_separator() {
  TransclusionFixture f;
  f.authority.host_document("d|x", {make_block("y", "public")});
  f.authority.host_document("d", {make_block("x|y", "hidden", Classification::restricted)});
  const auto viewer = make_subject("u", "viewer", 0);
  const auto token = f.authority.issue_token(viewer, "d|x", "y");
  expect(token.has_value(), "token for the public block");

  auto moved = *token;
  moved.target_doc_id = "d";
  moved.target_block_id = "x|y";
  expect(!f.authority.verify_token(moved, viewer, "d", "x|y"), "retargeted token rejected");
  const auto r = f.authority.resolve(viewer, "d", "x|y", &moved);
  expect(!r.ok && !r.via_token && r.error_code == vellum::ErrorCode::authorization_denied,
         "retargeted token does not reach restricted content");
}

void test_token_bound_to_subject_attributes() {
  TransclusionFixture f;
  const auto alice = make_subject("alice", "editor", 3);
  const auto demoted = make_subject("alice", "viewer", 1);
  const auto token = f.authority.issue_token(alice, "ext", "secret");
  expect(token.has_value(), "cleared subject gets a token");
  expect(!f.authority.verify_token(*token, demoted, "ext", "secret"),
         "token does not survive a clearance drop");
  const auto direct = f.authority.resolve(demoted, "ext", "secret", &*token);
  expect(!direct.ok && !direct.via_token &&
             direct.error_code == vellum::ErrorCode::authorization_denied,
         "demoted subject takes the full check and is denied");

  expect(f.broker.resolve_reference(alice, "rs").via_token, "cleared subject cached a token");
  const auto cached = f.broker.resolve_reference(demoted, "rs");
  expect(!cached.ok && !cached.via_token &&
             cached.error_code == vellum::ErrorCode::authorization_denied,
         "broker cache does not hand the old token to the demoted subject");
}

void test_revocations_pruned_after_expiry() {
  TransclusionFixture f;
  const auto s = make_subject("u", "editor", 1);
  const auto token = f.authority.issue_token(s, "ext", "x1");
  expect(f.authority.revoke(token->token_id), "revoke issued token");
  expect(f.authority.revoke("cap-never-issued"), "revoke unknown id");
  expect(f.authority.revoked_count() == 2, "both held");
  f.clock_ms += 301 * 1000;
  expect(f.authority.issue_token(s, "ext", "x2").has_value(), "issue after expiry");
  expect(f.authority.revoked_count() == 0, "expired revocations dropped");
}

void test_resolve_uses_cached_token() {
  TransclusionFixture f;
  const auto s = make_subject("u", "editor", 1);
  const auto first = f.broker.resolve_reference(s, "r1");
  expect(first.ok && first.via_token, "first resolve handshakes then uses the token");
  expect(f.broker.handshakes() == 1, "one handshake");
  const auto second = f.broker.resolve_reference(s, "r1");
  expect(second.ok && second.via_token && f.broker.handshakes() == 1, "second resolve hits cache");
  expect(second.block && second.block->payload == "one", "content returned");
  expect(second.block->metadata.provenance.origin_doc_id == std::string("ext"),
         "resolved block marked as imported");
  expect(f.refs.get("r1")->status == vellum::ReferenceStatus::active, "reference active");
}

void test_token_expiry() {
  TransclusionFixture f;
  const auto s = make_subject("u", "editor", 1);
  expect(f.broker.resolve_reference(s, "r1").ok, "initial resolve");
  f.clock_ms += 301 * 1000;
  const auto r = f.broker.resolve_reference(s, "r1");
  expect(r.ok, "resolve after expiry succeeds");
  expect(f.broker.handshakes() == 2, "expired token triggers a fresh handshake");
}

void test_token_revocation() {
  TransclusionFixture f;
  const auto s = make_subject("u", "editor", 1);
  const auto token = f.broker.request_token(s, "ext", "x1");
  expect(f.authority.revoke(token->token_id), "revoke succeeds");
  expect(!f.authority.revoke(token->token_id), "second revoke is a no-op");
  const auto r = f.authority.resolve(s, "ext", "x1", &*token);
  expect(r.ok && !r.via_token, "revoked token never takes the fast path");
  expect(f.audit.count(vellum::audit_actions::kTokenRevoked) == 1, "revocation audited");
}

void test_update_block_revokes_outstanding_tokens() {
  TransclusionFixture f;
  const auto s = make_subject("u", "editor", 1);
  expect(f.broker.resolve_reference(s, "r1").ok, "resolve before tightening");
  f.authority.update_block("ext", make_block("x1", "one", Classification::confidential));
  const auto r = f.broker.resolve_reference(s, "r1");
  expect(!r.ok && r.error_code == vellum::ErrorCode::authorization_denied,
         "tightened label takes effect despite cached token");
  expect(f.refs.get("r1")->status == vellum::ReferenceStatus::denied, "reference denied");
}

void test_reference_status_mapping() {
  TransclusionFixture f;
  const auto s = make_subject("u", "editor", 1);
  const auto denied = f.broker.resolve_reference(s, "rs");
  expect(!denied.ok && denied.error_code == vellum::ErrorCode::authorization_denied, "denied");
  expect(f.audit.count(vellum::audit_actions::kTokenDenied) == 1, "token denial audited");
  const auto broken = f.broker.resolve_reference(s, "gone");
  expect(broken.error_code == vellum::ErrorCode::not_found, "unknown target");
  expect(f.refs.get("gone")->status == vellum::ReferenceStatus::broken, "reference broken");
}

void test_authority_unavailable_leaves_status() {
  TransclusionFixture f;
  const auto s = make_subject("u", "editor", 1);
  f.authority.set_available(false);
  const auto r = f.broker.resolve_reference(s, "r2");
  expect(!r.ok && r.error_code == vellum::ErrorCode::authority_unavailable, "unavailable");
  expect(f.refs.get("r2")->status == vellum::ReferenceStatus::active, "status untouched");
  f.authority.set_available(true);
  expect(f.broker.resolve_reference(s, "r2").ok, "recovers once reachable");
}

void test_stale_handshake_discarded() {
  TransclusionFixture f;
  GatedAuthority gated(f.authority);
  vellum::CapabilityBroker broker(gated, f.store, f.refs, f.audit);
  const auto s = make_subject("u", "editor", 1);

  gated.gated = true;
  auto pending = broker.request_token_async(s, "ext", "x1");
  gated.entered.get_future().wait();
  broker.invalidate_all("u", "role changed");
  gated.release.set_value();

  expect(!pending.get().has_value(), "response from before invalidation discarded");
  expect(broker.discarded_responses() == 1, "discard counted");
  expect(f.store.token_count() == 0, "nothing cached");
}

void test_prefetch_fetches_no_content() {
  TransclusionFixture f;
  GatedAuthority counting(f.authority);
  vellum::CapabilityBroker broker(counting, f.store, f.refs, f.audit);
  const auto s = make_subject("u", "editor", 1);
  expect(broker.prefetch(s) == 3, "tokens for the three permitted references");
  expect(counting.resolves.load() == 0, "prefetch never resolves content");
  expect(broker.prefetch(s) == 0, "cached tokens are not re-requested");
}

void test_resolve_async() {
  TransclusionFixture f;
  const auto s = make_subject("u", "editor", 1);
  auto ok = f.broker.resolve_async(s, *f.refs.get("r3"));
  auto denied = f.broker.resolve_async(s, *f.refs.get("rs"));
  const auto r = ok.get();
  expect(r.ok && r.block && r.block->payload == "three", "async resolve returns content");
  expect(denied.get().error_code == vellum::ErrorCode::authorization_denied, "async denial");
}

void test_invalidate_all_drops_tokens() {
  TransclusionFixture f;
  const auto s = make_subject("u", "editor", 1);
  f.broker.prefetch(s);
  const uint64_t epoch = f.broker.epoch();
  expect(f.broker.invalidate_all("u", "test") == 3, "three tokens dropped");
  expect(f.broker.epoch() == epoch + 1 && f.store.token_count() == 0, "epoch bumped");
  expect(f.audit.count(vellum::audit_actions::kTokensInvalidated) == 1, "invalidation audited");
}

// ============================================================================
// Phase 7: Integrity
// ============================================================================

void test_scenario_d_tamper_and_restore() {
  vellum::LocalSigningAuthority signer(test_key("signing"));
  vellum::MetadataStore store;
  vellum::MemoryAuditSink audit;
  vellum::BlockIntegrityVerifier verifier(signer, store, audit);

  const Block block = make_block("b1", "original text");
  const auto outcome = verifier.sign(block, make_subject("alice", "editor", 1));
  expect(outcome.ok && outcome.status == vellum::VerificationStatus::verified, "signed");
  const auto sig = outcome.provenance.signature;
  expect(sig && sig->rfind("alice.", 0) == 0, "signature names the signer");
  expect(store.get("b1")->provenance.signature == sig, "signature persisted");
  expect(outcome.provenance.signer_id == signer.signer_id(), "signer id recorded");

  expect(verifier.verify("b1", "original text!", sig) == vellum::VerificationStatus::tampered,
         "edited content detected");
  expect(audit.count(vellum::audit_actions::kIntegrityMismatch) == 1, "mismatch audited");
  expect(verifier.verify("b1", "original text", sig) == vellum::VerificationStatus::verified,
         "restored content verifies");
  expect(verifier.verify("b2", "original text", sig) == vellum::VerificationStatus::tampered,
         "signature bound to block id");
}

void test_unsigned_and_foreign_signatures() {
  vellum::LocalSigningAuthority signer(test_key("signing"));
  vellum::LocalSigningAuthority other(test_key("someone else"));
  vellum::MetadataStore store;
  vellum::NullAuditSink audit;
  vellum::BlockIntegrityVerifier verifier(signer, store, audit);

  expect(verifier.verify("b", "x", std::nullopt) == vellum::VerificationStatus::unsigned_,
         "no signature -> unsigned");
  const auto foreign =
      other.sign("b", vellum::block_content_hash("x"), make_subject("u", "editor", 0));
  expect(verifier.verify("b", "x", foreign.signature) == vellum::VerificationStatus::tampered,
         "signature from another key rejected");
}

void test_signing_rejected_for_read_only_roles() {
  vellum::LocalSigningAuthority signer(test_key("signing"));
  vellum::MetadataStore store;
  vellum::MemoryAuditSink audit;
  vellum::BlockIntegrityVerifier verifier(signer, store, audit);

  for (const char* role : {"viewer", "auditor"}) {
    const auto out = verifier.sign(make_block("b", "x"), make_subject("u", role, 3));
    expect(!out.ok && out.error_code == vellum::ErrorCode::signing_rejected,
           std::string(role) + " cannot sign");
  }
  expect(!store.contains("b"), "nothing persisted on rejection");
  expect(store.verification_status("b") == vellum::VerificationStatus::unsigned_,
         "status back to unsigned");
  expect(audit.count(vellum::audit_actions::kSigningRejected) == 2, "rejections audited");
}

void test_authority_unavailable_is_unknown() {
  vellum::LocalSigningAuthority signer(test_key("signing"));
  vellum::MetadataStore store;
  vellum::NullAuditSink audit;
  vellum::BlockIntegrityVerifier verifier(signer, store, audit);
  const auto out = verifier.sign(make_block("b", "x"), make_subject("u", "editor", 0));
  expect(out.ok, "signed while available");

  signer.set_available(false);
  expect(verifier.verify("b", "x", out.provenance.signature) == vellum::VerificationStatus::unknown,
         "unreachable authority -> unknown, never verified");
  const auto rejected = verifier.sign(make_block("b", "y"), make_subject("u", "editor", 0));
  expect(!rejected.ok && rejected.error_code == vellum::ErrorCode::authority_unavailable,
         "signing fails while unreachable");
  expect(store.get("b")->provenance.signature == out.provenance.signature,
         "stored signature untouched");
}

void test_verify_async_and_all() {
  vellum::LocalSigningAuthority signer(test_key("signing"));
  vellum::MetadataStore store;
  vellum::NullAuditSink audit;
  vellum::BlockIntegrityVerifier verifier(signer, store, audit);
  const auto signed_block = make_block("s", "body");
  const auto sig = verifier.sign(signed_block, make_subject("u", "editor", 0)).provenance.signature;

  auto fut = verifier.verify_async("s", "body", sig);
  expect(fut.get() == vellum::VerificationStatus::verified, "async verify");

  const auto all = verifier.verify_all({signed_block, make_block("plain", "p")});
  expect(all.at("s") == vellum::VerificationStatus::verified, "shadow signature used");
  expect(all.at("plain") == vellum::VerificationStatus::unsigned_, "unsigned block");
}

// ============================================================================
// Phase 8: Persistence and audit log
// ============================================================================

void test_snapshot_round_trip() {
  vellum::FileSnapshotStore store(temp_dir("snap_rt"));
  auto blocks = mixed_document();
  blocks[1].metadata.provenance.signature = "u.abc";
  expect(store.save_snapshot("doc-1", blocks), "save");
  expect(store.exists("doc-1"), "exists");
  const auto loaded = store.load_snapshot("doc-1");
  expect(loaded && *loaded == blocks, "blocks round trip");
  expect(store.list() == std::vector<std::string>{"doc-1"}, "listed");
  expect(!store.load_snapshot("nope").has_value(), "missing document");
  expect(store.load_detailed("nope").error_code == vellum::ErrorCode::not_found, "not_found");
}

void test_snapshot_corruption_detected() {
  vellum::FileSnapshotStore store(temp_dir("snap_corrupt"));
  expect(store.save_snapshot("doc", {make_block("a", "hello world")}), "save");
  const auto path = store.path_for("doc");
  auto data = read_file(path);
  const auto pos = data.find("hello");
  expect(pos != std::string::npos, "payload present in identity encoding");
  data[pos] = 'j';
  write_file(path, data);
  const auto r = store.load_detailed("doc");
  expect(!r.ok && r.error_code == vellum::ErrorCode::snapshot_corrupt, "digest mismatch detected");
  expect(r.blocks.empty(), "nothing returned from a corrupt snapshot");
}

void test_snapshot_doc_id_encoding() {
  using Store = vellum::FileSnapshotStore;
  const auto name = Store::encode_doc_id("../../etc/passwd");
  expect(name.find('/') == std::string::npos && name.find('.') == std::string::npos,
         "path traversal escaped");
  expect(Store::encode_doc_id("") == "~", "never empty");
  expect(Store::encode_doc_id("a/b") != Store::encode_doc_id("a_b"), "separator kept distinct");
  expect(Store::encode_doc_id("a%2fb") != Store::encode_doc_id("a/b"), "escape char escaped");
  const std::string long_id(500, 'x');
  expect(Store::encode_doc_id(long_id).size() < 200, "long ids are shortened");
  expect(Store::encode_doc_id(long_id) != Store::encode_doc_id(long_id + "y"),
         "shortened ids stay distinct");

  const auto root = temp_dir("snap_encode");
  Store store(root);
  expect(store.save_snapshot("a/b", {make_block("a", "slash")}), "save a/b");
  expect(store.save_snapshot("a_b", {make_block("a", "underscore")}), "save a_b");
  expect(store.save_snapshot("../escape", {make_block("a", "x")}), "save with hostile id");
  expect(fs::path(store.path_for("../escape")).parent_path() == fs::path(root),
         "file stays under root");
  const auto slash = store.load_snapshot("a/b");
  const auto under = store.load_snapshot("a_b");
  expect(slash && (*slash)[0].payload == "slash", "a/b keeps its content");
  expect(under && (*under)[0].payload == "underscore", "a_b keeps its content");
  expect(store.list() == std::vector<std::string>{"../escape", "a/b", "a_b"},
         "list reports document ids");

  // A file moved under another document's name is refused.
  write_file(store.path_for("a/b"), read_file(store.path_for("a_b")));
  const auto moved = store.load_detailed("a/b");
  expect(!moved.ok && moved.error_code == vellum::ErrorCode::snapshot_corrupt,
         "header doc_id checked on load");
}

void test_snapshot_size_header_bounded() {
  vellum::FileSnapshotStore store(temp_dir("snap_size"));
  write_file(store.path_for("big"),
             "{\"digest\":\"x\",\"doc_id\":\"big\",\"encoding\":\"zstd\",\"format\":2,"
             "\"original_size\":18446744073709551615}\n\x28\xb5\x2f\xfd garbage");
  const auto r = store.load_detailed("big");
  expect(!r.ok && r.error_code == vellum::ErrorCode::snapshot_corrupt,
         "oversized original_size is corrupt, not an allocation");

  write_file(store.path_for("lying"),
             "{\"digest\":\"x\",\"doc_id\":\"lying\",\"encoding\":\"zstd\",\"format\":2,"
             "\"original_size\":1024}\nnot a zstd frame");
  expect(store.load_detailed("lying").error_code == vellum::ErrorCode::snapshot_corrupt,
         "undecodable frame is corrupt");
}

void test_audit_chain_verifies_and_resumes() {
  const auto path = (fs::path(temp_dir("audit")) / "audit.ndjson").string();
  {
    vellum::ImmutableAuditLog log(path);
    for (int i = 0; i < 3; ++i) {
      log.emit(vellum::make_audit_event("u", vellum::audit_actions::kAccessDenied,
                                        "doc/b" + std::to_string(i)));
    }
    expect(log.entry_count() == 3 && log.failure_count() == 0, "three entries written");
  }
  auto report = vellum::verify_audit_chain(path);
  expect(report.ok && report.entries == 3, "chain verifies");

  {
    vellum::ImmutableAuditLog resumed(path);
    expect(resumed.last_digest() == report.head_digest, "resumes from the last line");
    resumed.emit(vellum::make_audit_event("u", vellum::audit_actions::kBlockSigned, "b"));
  }
  report = vellum::verify_audit_chain(path);
  expect(report.ok && report.entries == 4, "resumed chain still verifies");
}

void test_audit_chain_detects_tamper() {
  const auto path = (fs::path(temp_dir("audit_tamper")) / "audit.ndjson").string();
  {
    vellum::ImmutableAuditLog log(path);
    for (int i = 0; i < 3; ++i) {
      log.emit(vellum::make_audit_event("mallory", vellum::audit_actions::kAccessDenied, "r"));
    }
  }
  auto data = read_file(path);
  const auto first_nl = data.find('\n');
  const auto pos = data.find("mallory", first_nl);
  data.replace(pos, 7, "alice__");
  write_file(path, data);

  const auto report = vellum::verify_audit_chain(path);
  expect(!report.ok && report.error == "chain_broken", "edited entry breaks the chain");
  expect(report.first_broken_sequence == 3, "break reported at the next link");
}

void test_audit_log_without_file_counts_failures() {
  vellum::ImmutableAuditLog log("/nonexistent-dir/vellum/audit.ndjson");
  log.emit(vellum::make_audit_event("u", vellum::audit_actions::kAccessDenied, "r"));
  expect(log.entry_count() == 0 && log.failure_count() == 1, "write failure counted");
}

// ============================================================================
// Phase 9: Configuration and observability
// ============================================================================

void test_config_from_env() {
  ::setenv("VELLUM_FAILURE_POLICY", "fail_open", 1);
  ::setenv("VELLUM_TOKEN_TTL_S", "60", 1);
  ::setenv("VELLUM_RECOMPUTE_DEBOUNCE_MS", "soon", 1);
  ::setenv("VELLUM_LOCAL_DOC_ID", "main", 1);
  auto c = vellum::session_config_from_env();
  expect(c.failure_policy == vellum::FailurePolicy::fail_open, "policy from env");
  expect(c.token_ttl_s == 60, "ttl from env");
  expect(c.recompute_debounce_ms == 25, "invalid number keeps default");
  expect(c.local_doc_id == "main", "local doc id from env");

  ::setenv("VELLUM_FAILURE_POLICY", "maybe", 1);
  c = vellum::session_config_from_env();
  expect(c.failure_policy == vellum::FailurePolicy::fail_closed, "unknown policy stays closed");

  for (const char* name : {"VELLUM_FAILURE_POLICY", "VELLUM_TOKEN_TTL_S",
                           "VELLUM_RECOMPUTE_DEBOUNCE_MS", "VELLUM_LOCAL_DOC_ID"}) {
    ::unsetenv(name);
  }
  expect(vellum::session_config_to_json(c).find("\"failure_policy\":\"fail_closed\"") !=
             std::string::npos,
         "config serialized");
}

void test_log_hook_receives_denials() {
  {
    std::lock_guard<std::mutex> lk(g_log_mu);
    g_logged.clear();
  }
  vellum::set_log_hook(capture_log);
  vellum::abac::AccessEvaluator evaluator;
  vellum::MetadataStore metadata;
  vellum::NullAuditSink audit;
  vellum::SecureSyncFilter filter("logdoc", evaluator, metadata, audit);
  filter.recompute(inputs(mixed_document(), make_subject("u", "viewer", 0), 1, 1));
  vellum::set_log_hook(nullptr);

  std::lock_guard<std::mutex> lk(g_log_mu);
  const bool found = std::any_of(g_logged.begin(), g_logged.end(), [](const vellum::LogEvent& e) {
    return e.component == "secure_sync" && e.event == "block_denied";
  });
  expect(found, "denial logged through the hook");
  expect(vellum::log_event_to_json(g_logged.front()).find("\"component\"") != std::string::npos,
         "event serializes");
}

void test_stats_and_manifest() {
  auto& stats = vellum::global_security_stats();
  const auto json = stats.to_json();
  expect(json.find("\"recomputes\"") != std::string::npos, "stats serialized");
  vellum::LatencyHistogram h;
  for (uint64_t i = 1; i <= 100; ++i) h.record(i * 1000);
  expect(h.count() == 100 && h.percentile(0.5) > 0.0, "histogram percentiles");

  const auto manifest = vellum::version::current_manifest("9.9.9");
  expect(manifest.semver == "9.9.9" && manifest.hash_primitive == "blake3", "manifest");
  expect(vellum::version::manifest_to_json(manifest).find("\"snapshot_format\":2") !=
             std::string::npos,
         "manifest serialized");
}

// ============================================================================
// Phase 10: Document session
// ============================================================================

struct SessionFixture {
  std::string root;
  vellum::FileSnapshotStore snapshots;
  vellum::InMemoryContentStore content;
  vellum::MemoryAuditSink audit;
  vellum::LocalDocumentAuthority authority{"local://ext", test_key("authority"), 300, &audit};
  vellum::LocalSigningAuthority signer{test_key("signing")};
  vellum::SessionConfig config;

  explicit SessionFixture(const std::string& name)
      : root(temp_dir(name)), snapshots(root) {
    config.recompute_debounce_ms = 5;
    authority.host_document("ext", {make_block("x1", "one"), make_block("x2", "two"),
                                    make_block("x3", "three")});
    std::vector<Block> doc = mixed_document();
    doc[4].metadata.locked = true;
    doc.push_back(imported_block("t1", "ext", "x1"));
    doc.push_back(imported_block("t2", "ext", "x2"));
    doc.push_back(imported_block("t3", "ext", "x3"));
    snapshots.save_snapshot("main", doc);
  }

  vellum::SessionCollaborators io() { return {content, snapshots, authority, signer, audit}; }
};

void test_session_open_and_view() {
  SessionFixture f("session_open");
  vellum::DocumentSession session("main", make_subject("u", "editor", 2), f.config, f.io());
  const auto opened = session.open();
  expect(opened.ok && opened.blocks == 8 && opened.references == 3, "document opened");
  const auto ids = session.filtered_view()->ids();
  expect(ids.size() == 7 && ids.back() == "t3", "imported blocks visible in order");
  expect(session.redactions().size() == 1 && session.redactions()[0].block_id == "r3",
         "restricted block redacted");
  expect(session.verification_status("p0") == vellum::VerificationStatus::unsigned_,
         "blocks verified on open");
  expect(session.status_json().find("\"doc_id\":\"main\"") != std::string::npos, "status json");

  vellum::DocumentSession missing("nope", make_subject("u", "editor", 2), f.config, f.io());
  expect(missing.open().error_code == vellum::ErrorCode::not_found, "missing snapshot");
}

void test_session_debounced_edit_propagates() {
  SessionFixture f("session_debounce");
  vellum::DocumentSession session("main", make_subject("u", "editor", 2), f.config, f.io());
  expect(session.open().ok, "open");
  f.content.update_payload("p0", "changed");
  session.flush();
  expect(session.filtered_view()->blocks[0].payload == "changed", "edit reaches the view");

  vellum::BlockMetadata tightened;
  tightened.classification = Classification::restricted;
  session.metadata().set("p0", tightened);
  session.flush();
  const auto ids = session.filtered_view()->ids();
  expect(std::find(ids.begin(), ids.end(), "p0") == ids.end(), "relabel hides the block");
}

void test_scenario_e_subject_change_invalidates_tokens() {
  SessionFixture f("session_tokens");
  vellum::DocumentSession session("main", make_subject("u", "editor", 2), f.config, f.io());
  expect(session.open().ok, "open");
  expect(session.prefetch_tokens() == 3, "three tokens cached");
  expect(session.metadata().token_count() == 3, "tokens in the shadow store");

  const uint64_t epoch = session.subject_epoch();
  session.set_subject(make_subject("u", "viewer", 2));
  expect(session.metadata().token_count() == 0, "every cached token dropped");
  expect(session.subject_epoch() == epoch + 1, "subject epoch bumped");

  const uint64_t handshakes = session.broker().handshakes();
  for (const char* ref : {"t1", "t2", "t3"}) {
    expect(session.resolve_reference(ref).ok, std::string("resolve ") + ref);
  }
  expect(session.broker().handshakes() == handshakes + 3, "each resolve re-handshakes");
}

void test_session_subject_change_reevaluates() {
  SessionFixture f("session_subject");
  vellum::DocumentSession session("main", make_subject("u", "editor", 2), f.config, f.io());
  expect(session.open().ok, "open");
  const auto before = session.filtered_view()->ids();
  expect(std::find(before.begin(), before.end(), "c2") != before.end(), "editor sees c2");
  session.set_subject(make_subject("u", "viewer", 2));
  const auto after = session.filtered_view()->ids();
  expect(std::find(after.begin(), after.end(), "c2") == after.end(), "viewer loses c2 at once");
}

void test_session_save_respects_locks() {
  SessionFixture f("session_save");
  vellum::DocumentSession session("main", make_subject("e", "editor", 2), f.config, f.io());
  expect(session.open().ok, "open");

  f.content.update_payload("p4", "rewritten");
  const auto rejected = session.save();
  expect(!rejected.ok && rejected.error_code == vellum::ErrorCode::authorization_denied,
         "editing a locked block rejected");
  expect(rejected.rejected_blocks == std::vector<std::string>{"p4"}, "locked block named");
  expect(f.audit.count(vellum::audit_actions::kSaveRejected) == 1, "rejection audited");
  expect(f.snapshots.load_snapshot("main")->at(4).payload == "tail", "snapshot untouched");

  session.set_subject(make_subject("a", "admin", 3));
  const auto saved = session.save();
  expect(saved.ok && saved.changed_blocks == 1, "admin saves the locked edit");
  expect(f.snapshots.load_snapshot("main")->at(4).payload == "rewritten", "snapshot updated");
  expect(f.audit.count(vellum::audit_actions::kSnapshotSaved) == 1, "save audited");
}

void test_session_sign_block() {
  SessionFixture f("session_sign");
  vellum::DocumentSession session("main", make_subject("e", "editor", 2), f.config, f.io());
  expect(session.open().ok, "open");
  const auto out = session.sign_block("p0");
  expect(out.ok && session.verification_status("p0") == vellum::VerificationStatus::verified,
         "block signed and verified");
  const auto locked = session.sign_block("p4");
  expect(!locked.ok && locked.error_code == vellum::ErrorCode::authorization_denied,
         "locked block needs admin to sign");
  expect(session.sign_block("ghost").error_code == vellum::ErrorCode::not_found, "unknown block");
}

void test_sessions_are_independent() {
  SessionFixture f("session_multi");
  vellum::InMemoryContentStore second_content;
  vellum::DocumentSession editor("main", make_subject("e", "editor", 2), f.config, f.io());
  vellum::DocumentSession viewer("main", make_subject("v", "viewer", 0), f.config,
                                 {second_content, f.snapshots, f.authority, f.signer, f.audit});
  expect(editor.open().ok && viewer.open().ok, "both open");
  expect(editor.filtered_view()->ids().size() > viewer.filtered_view()->ids().size(),
         "each session filters for its own subject");
  editor.prefetch_tokens();
  expect(viewer.metadata().token_count() == 0, "tokens are per session");
}

void test_session_file_audit_log() {
  SessionFixture f("session_audit_file");
  f.config.audit_log_path = (fs::path(f.root) / "audit.ndjson").string();
  {
    vellum::DocumentSession session("main", make_subject("v", "viewer", 0), f.config, f.io());
    expect(session.open().ok, "open");
  }
  const auto report = vellum::verify_audit_chain(f.config.audit_log_path);
  expect(report.ok && report.entries >= 1, "denials reach the hash-chained log");
}

}  // namespace

int main() {
  std::cout << "=== Vellum Secure Document Core Test Suite ===\n";

  std::cout << "\n[Phase 1] Hashing\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("keyed hash depends on key", test_keyed_hash_depends_on_key);

  std::cout << "\n[Phase 2] Serialization\n";
  run_test("JSON strictness", test_json_strictness);
  run_test("metadata round trip", test_metadata_round_trip);
  run_test("malformed metadata flagged", test_malformed_metadata_flagged);
  run_test("blocks without id dropped", test_blocks_without_id_dropped);
  run_test("token JSON hides signature", test_token_json_hides_signature);
  run_test("subject clearance validated", test_subject_clearance_validated);

  std::cout << "\n[Phase 3] ABAC evaluator\n";
  run_test("scenario A: clearance gate", test_scenario_a_clearance_gate);
  run_test("scenario B: ACL role match", test_scenario_b_acl_role_match);
  run_test("scenario C: ACL independent of clearance", test_scenario_c_acl_independent_of_clearance);
  run_test("ACL matches subject id", test_acl_matches_subject_id);
  run_test("evaluator deterministic", test_evaluator_deterministic);
  run_test("failure policy", test_failure_policy);
  run_test("locked requires admin for edit", test_locked_requires_admin_for_edit);
  run_test("imported restricted content", test_imported_restricted_content);

  std::cout << "\n[Phase 4] Stores\n";
  run_test("metadata snapshot reload", test_metadata_store_snapshot_reload);
  run_test("token cache scoped per block", test_metadata_store_tokens_scoped);
  run_test("content ids survive moves", test_content_store_ids_survive_moves);
  run_test("references from block provenance", test_reference_registry_from_blocks);

  std::cout << "\n[Phase 5] Secure sync filter\n";
  run_test("only allowed blocks, in order", test_filter_keeps_only_allowed_in_order);
  run_test("recompute idempotent", test_filter_idempotent);
  run_test("monotonic in clearance", test_filter_monotonic_in_clearance);
  run_test("shadow metadata preferred", test_filter_prefers_shadow_metadata);
  run_test("evaluator fault denies", test_filter_evaluator_fault_denies);
  run_test("only new denials audited", test_filter_audits_only_new_denials);
  run_test("stale inputs dropped", test_filter_drops_stale_inputs);
  run_test("re-entrant recompute", test_filter_reentrant_recompute);
  run_test("debouncer coalesces", test_debouncer_coalesces);
  run_test("flush while running keeps delay", test_debouncer_flush_while_running_keeps_delay);

  std::cout << "\n[Phase 6] Capability tokens\n";
  run_test("token scope per block", test_token_scope_is_per_block);
  run_test("token cannot be retargeted", test_token_cannot_be_retargeted_across_separator);
  run_test("token bound to subject attributes", test_token_bound_to_subject_attributes);
  run_test("revocations pruned after expiry", test_revocations_pruned_after_expiry);
  run_test("resolve uses cached token", test_resolve_uses_cached_token);
  run_test("token expiry", test_token_expiry);
  run_test("token revocation", test_token_revocation);
  run_test("update_block revokes tokens", test_update_block_revokes_outstanding_tokens);
  run_test("reference status mapping", test_reference_status_mapping);
  run_test("authority unavailable", test_authority_unavailable_leaves_status);
  run_test("stale handshake discarded", test_stale_handshake_discarded);
  run_test("prefetch fetches no content", test_prefetch_fetches_no_content);
  run_test("resolve async", test_resolve_async);
  run_test("invalidate_all drops tokens", test_invalidate_all_drops_tokens);

  std::cout << "\n[Phase 7] Integrity\n";
  run_test("scenario D: tamper and restore", test_scenario_d_tamper_and_restore);
  run_test("unsigned and foreign signatures", test_unsigned_and_foreign_signatures);
  run_test("read-only roles cannot sign", test_signing_rejected_for_read_only_roles);
  run_test("unavailable authority is unknown", test_authority_unavailable_is_unknown);
  run_test("verify async and all", test_verify_async_and_all);

  std::cout << "\n[Phase 8] Persistence and audit\n";
  run_test("snapshot round trip", test_snapshot_round_trip);
  run_test("snapshot corruption detected", test_snapshot_corruption_detected);
  run_test("snapshot doc id encoding", test_snapshot_doc_id_encoding);
  run_test("snapshot size header bounded", test_snapshot_size_header_bounded);
  run_test("audit chain verifies and resumes", test_audit_chain_verifies_and_resumes);
  run_test("audit chain detects tamper", test_audit_chain_detects_tamper);
  run_test("audit write failures counted", test_audit_log_without_file_counts_failures);

  std::cout << "\n[Phase 9] Configuration and observability\n";
  run_test("config from env", test_config_from_env);
  run_test("log hook receives denials", test_log_hook_receives_denials);
  run_test("stats and manifest", test_stats_and_manifest);

  std::cout << "\n[Phase 10] Document session\n";
  run_test("open and view", test_session_open_and_view);
  run_test("debounced edit propagates", test_session_debounced_edit_propagates);
  run_test("scenario E: subject change invalidates tokens",
           test_scenario_e_subject_change_invalidates_tokens);
  run_test("subject change re-evaluates", test_session_subject_change_reevaluates);
  run_test("save respects locks", test_session_save_respects_locks);
  run_test("sign block", test_session_sign_block);
  run_test("sessions are independent", test_sessions_are_independent);
  run_test("file audit log", test_session_file_audit_log);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
