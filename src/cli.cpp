#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "vellum/abac.hpp"
#include "vellum/audit.hpp"
#include "vellum/capability_broker.hpp"
#include "vellum/config.hpp"
#include "vellum/content_store.hpp"
#include "vellum/hash.hpp"
#include "vellum/integrity.hpp"
#include "vellum/jsonlite.hpp"
#include "vellum/observability.hpp"
#include "vellum/session.hpp"
#include "vellum/snapshot_store.hpp"
#include "vellum/types.hpp"
#include "vellum/version.hpp"

#ifndef VELLUM_VERSION
#define VELLUM_VERSION "0.3.0"
#endif

namespace {

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out->assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

// Value following `flag`, or `def`.
std::string arg_value(int argc, char** argv, int from, const std::string& flag,
                      const std::string& def = "") {
  for (int i = from; i < argc; ++i) {
    if (std::string(argv[i]) == flag && i + 1 < argc) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, int from, const std::string& flag) {
  for (int i = from; i < argc; ++i) {
    if (std::string(argv[i]) == flag) return true;
  }
  return false;
}

int fail(const std::string& code, const std::string& detail, int rc = 2) {
  std::cerr << "{\"error\":" << vellum::jsonlite::to_json(vellum::jsonlite::Value{code})
            << ",\"detail\":" << vellum::jsonlite::to_json(vellum::jsonlite::Value{detail})
            << "}\n";
  return rc;
}

bool load_subject(const std::string& path, vellum::Subject* out) {
  std::string text;
  if (path.empty() || !read_file(path, &text)) return false;
  auto s = vellum::subject_from_json(text);
  if (!s) return false;
  *out = *s;
  return true;
}

// Local keys come from VELLUM_SIGNING_SECRET when set so that signatures
// survive across invocations; otherwise a fresh key per process.
vellum::KeyBytes signing_key() {
  const char* secret = std::getenv("VELLUM_SIGNING_SECRET");
  if (secret && *secret) return vellum::derive_key("vellum 2024 block signing", secret);
  return vellum::random_key();
}

vellum::abac::EvaluatorConfig evaluator_config(int argc, char** argv,
                                               const vellum::SessionConfig& base) {
  vellum::abac::EvaluatorConfig cfg;
  cfg.local_doc_id = arg_value(argc, argv, 2, "--local-doc", base.local_doc_id);
  cfg.failure_policy = base.failure_policy;
  const auto policy = arg_value(argc, argv, 2, "--policy");
  if (!policy.empty()) {
    if (auto p = vellum::failure_policy_from_string(policy)) cfg.failure_policy = *p;
  }
  return cfg;
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (vellum::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    return false;
  }
  if (vellum::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f") {
    return false;
  }
  return true;
}

void usage() {
  std::cerr << "usage: vellum <command> [options]\n"
               "  health | version | config show | stats\n"
               "  hash --text S | --in FILE [--domain blk|snap|aud]\n"
               "  evaluate --subject FILE --metadata FILE [--edit] [--local-doc ID] [--policy P]\n"
               "  filter --subject FILE --blocks FILE [--local-doc ID] [--policy P]\n"
               "  snapshot save|load|verify|list --doc ID [--in FILE] [--dir DIR]\n"
               "  audit verify --log FILE\n"
               "  session open --doc ID --subject FILE [--dir DIR]\n"
               "  session save --doc ID --subject FILE --in FILE [--dir DIR]\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0) continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    usage();
    return 1;
  }
  const std::string sub = argc >= 3 ? argv[2] : "";
  const auto config = vellum::session_config_from_env();

  if (cmd == "health") {
    const auto h = vellum::hash_runtime_info();
    const bool vectors_ok = verify_hash_vectors();
    std::cout << "{\"ok\":" << (vectors_ok ? "true" : "false")
              << ",\"hash_primitive\":\"" << h.primitive << "\""
              << ",\"hash_version\":\"" << h.version << "\""
              << ",\"hash_available\":" << (h.blake3_available ? "true" : "false")
              << ",\"compression_capabilities\":[\"identity\"";
#if defined(VELLUM_WITH_ZSTD)
    std::cout << ",\"zstd\"";
#endif
    std::cout << "]}\n";
    return vectors_ok ? 0 : 2;
  }

  if (cmd == "version") {
    std::cout << vellum::version::manifest_to_json(vellum::version::current_manifest(VELLUM_VERSION))
              << "\n";
    return 0;
  }

  if (cmd == "config" && sub == "show") {
    std::cout << vellum::session_config_to_json(config) << "\n";
    return 0;
  }

  if (cmd == "stats") {
    std::cout << vellum::global_security_stats().to_json() << "\n";
    return 0;
  }

  if (cmd == "hash") {
    std::string payload = arg_value(argc, argv, 2, "--text");
    const auto in = arg_value(argc, argv, 2, "--in");
    if (!in.empty() && !read_file(in, &payload)) return fail("io_error", "cannot read " + in);
    const auto domain = arg_value(argc, argv, 2, "--domain", "blk");
    std::string digest;
    if (domain == "blk") {
      digest = vellum::block_content_hash(payload);
    } else if (domain == "snap") {
      digest = vellum::snapshot_body_hash(payload);
    } else if (domain == "aud") {
      digest = vellum::audit_chain_hash(payload);
    } else if (domain == "raw") {
      digest = vellum::blake3_hex(payload);
    } else {
      return fail("invalid_argument", "unknown domain " + domain);
    }
    std::cout << "{\"domain\":\"" << domain << "\",\"digest\":\"" << digest << "\"}\n";
    return 0;
  }

  if (cmd == "evaluate") {
    vellum::Subject subject;
    const auto subject_path = arg_value(argc, argv, 2, "--subject");
    const bool have_subject = load_subject(subject_path, &subject);
    if (!subject_path.empty() && !have_subject) {
      return fail("json_parse_error", "unreadable subject " + subject_path);
    }

    std::optional<vellum::BlockMetadata> meta;
    const auto meta_path = arg_value(argc, argv, 2, "--metadata");
    if (!meta_path.empty()) {
      std::string text;
      if (!read_file(meta_path, &text)) return fail("io_error", "cannot read " + meta_path);
      meta = vellum::metadata_from_json(text);
      if (!meta) return fail("json_parse_error", "unreadable metadata " + meta_path);
    }

    const auto cfg = evaluator_config(argc, argv, config);
    const auto* s = have_subject ? &subject : nullptr;
    const auto* m = meta ? &*meta : nullptr;
    const auto decision = has_flag(argc, argv, 2, "--edit") ? vellum::abac::evaluate_edit(s, m, cfg)
                                                            : vellum::abac::evaluate(s, m, cfg);
    std::cout << decision.to_json() << "\n";
    return decision.allowed ? 0 : 3;
  }

  if (cmd == "filter") {
    vellum::Subject subject;
    if (!load_subject(arg_value(argc, argv, 2, "--subject"), &subject)) {
      return fail("invalid_argument", "--subject FILE required");
    }
    const auto blocks_path = arg_value(argc, argv, 2, "--blocks");
    std::string text;
    if (!read_file(blocks_path, &text)) return fail("io_error", "cannot read " + blocks_path);
    std::optional<vellum::jsonlite::JsonError> err;
    auto blocks = vellum::blocks_from_json(text, &err);
    if (!blocks) return fail("json_parse_error", err ? err->message : "bad blocks");

    vellum::abac::AccessEvaluator evaluator(evaluator_config(argc, argv, config));
    vellum::MetadataStore metadata;
    vellum::NullAuditSink audit;
    vellum::SecureSyncFilter filter(config.local_doc_id, evaluator, metadata, audit);
    std::cout << filter.compute(*blocks, &subject).to_json() << "\n";
    return 0;
  }

  if (cmd == "snapshot") {
    const auto doc = arg_value(argc, argv, 3, "--doc");
    vellum::FileSnapshotStore store(arg_value(argc, argv, 3, "--dir", config.snapshot_dir),
                                    config.snapshot_compression);
    if (sub == "list") {
      std::cout << "{\"documents\":[";
      const auto docs = store.list();
      for (size_t i = 0; i < docs.size(); ++i) {
        if (i) std::cout << ",";
        std::cout << vellum::jsonlite::to_json(vellum::jsonlite::Value{docs[i]});
      }
      std::cout << "]}\n";
      return 0;
    }
    if (doc.empty()) return fail("invalid_argument", "--doc ID required");

    if (sub == "save") {
      const auto in = arg_value(argc, argv, 3, "--in");
      std::string text;
      if (!read_file(in, &text)) return fail("io_error", "cannot read " + in);
      std::optional<vellum::jsonlite::JsonError> err;
      auto blocks = vellum::blocks_from_json(text, &err);
      if (!blocks) return fail("json_parse_error", err ? err->message : "bad blocks");
      if (!store.save_snapshot(doc, *blocks)) return fail("io_error", "write failed");
      std::cout << "{\"ok\":true,\"blocks\":" << blocks->size() << ",\"path\":"
                << vellum::jsonlite::to_json(vellum::jsonlite::Value{store.path_for(doc)}) << "}\n";
      return 0;
    }
    if (sub == "load" || sub == "verify") {
      const auto r = store.load_detailed(doc);
      if (!r.ok) return fail(vellum::to_string(r.error_code), r.detail);
      if (sub == "load") {
        std::cout << vellum::blocks_to_json(r.blocks) << "\n";
      } else {
        std::cout << "{\"ok\":true,\"blocks\":" << r.blocks.size() << "}\n";
      }
      return 0;
    }
  }

  if (cmd == "audit" && sub == "verify") {
    const auto log = arg_value(argc, argv, 3, "--log", config.audit_log_path);
    if (log.empty()) return fail("invalid_argument", "--log FILE required");
    const auto report = vellum::verify_audit_chain(log);
    std::cout << vellum::audit_chain_report_to_json(report) << "\n";
    return report.ok ? 0 : 2;
  }

  if (cmd == "session" && (sub == "open" || sub == "save")) {
    const auto doc = arg_value(argc, argv, 3, "--doc");
    if (doc.empty()) return fail("invalid_argument", "--doc ID required");
    vellum::Subject subject;
    if (!load_subject(arg_value(argc, argv, 3, "--subject"), &subject)) {
      return fail("invalid_argument", "--subject FILE required");
    }

    vellum::FileSnapshotStore snapshots(arg_value(argc, argv, 3, "--dir", config.snapshot_dir),
                                        config.snapshot_compression);
    vellum::InMemoryContentStore content;
    vellum::MemoryAuditSink audit;
    vellum::LocalDocumentAuthority target("local://" + doc, vellum::random_key(),
                                          config.token_ttl_s, &audit);
    vellum::LocalSigningAuthority signer(signing_key());

    vellum::DocumentSession session(doc, subject, config,
                                    {content, snapshots, target, signer, audit});
    const auto opened = session.open();
    if (!opened.ok) return fail(vellum::to_string(opened.error_code), opened.detail);

    if (sub == "save") {
      const auto in = arg_value(argc, argv, 3, "--in");
      std::string text;
      if (!read_file(in, &text)) return fail("io_error", "cannot read " + in);
      std::optional<vellum::jsonlite::JsonError> err;
      auto blocks = vellum::blocks_from_json(text, &err);
      if (!blocks) return fail("json_parse_error", err ? err->message : "bad blocks");
      content.replace_all(std::move(*blocks));
      const auto saved = session.save();
      std::cout << "{\"ok\":" << (saved.ok ? "true" : "false")
                << ",\"changed_blocks\":" << saved.changed_blocks
                << ",\"rejected_blocks\":" << saved.rejected_blocks.size()
                << ",\"detail\":" << vellum::jsonlite::to_json(vellum::jsonlite::Value{saved.detail})
                << "}\n";
      return saved.ok ? 0 : 3;
    }

    std::cout << "{\"status\":" << session.status_json()
              << ",\"view\":" << session.filtered_view()->to_json() << ",\"verification\":{";
    bool first = true;
    for (const auto& [id, status] : session.metadata().verification_snapshot()) {
      if (!first) std::cout << ",";
      first = false;
      std::cout << vellum::jsonlite::to_json(vellum::jsonlite::Value{id}) << ":\""
                << vellum::to_string(status) << "\"";
    }
    std::cout << "}}\n";
    return 0;
  }

  usage();
  return 1;
}
