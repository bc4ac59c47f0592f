#pragma once

// vellum/integrity.hpp: Block content sealing and tamper detection.
//
// DESIGN:
//   Content is addressed by block_content_hash() ("blk:" BLAKE3). Signatures
//   are produced and checked by an external signing authority; this module
//   only shapes requests and maps responses.
//
// STATE MACHINE (per block, ephemeral, held in MetadataStore):
//   unknown  -> verifying -> verified | tampered | unknown
//   unsigned -> verifying -> verified            (signing)
//   Any authority or transport failure lands on `unknown`, never `verified`.
//   Blocks without a signature are `unsigned` without a round trip.
//
// STALENESS:
//   Every verification takes a per-block sequence number. A result that
//   arrives after a newer verification for the same block started is dropped
//   and does not overwrite the newer status.

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "vellum/audit.hpp"
#include "vellum/hash.hpp"
#include "vellum/metadata_store.hpp"
#include "vellum/types.hpp"

namespace vellum {

struct SignResult {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string signature;
  std::string signer_id;
  uint64_t timestamp_unix_ms{0};
  std::string algorithm;
  std::string detail;
};

struct VerifyResult {
  bool ok{false};     // the authority answered
  bool valid{false};  // meaningful only when ok
  std::string detail;
};

class ISigningAuthority {
 public:
  virtual ~ISigningAuthority() = default;
  virtual SignResult sign(const std::string& block_id, const std::string& content_hash,
                          const Subject& subject) = 0;
  virtual VerifyResult verify(const std::string& block_id, const std::string& content_hash,
                              const std::string& signature) = 0;
};

// ---------------------------------------------------------------------------
// LocalSigningAuthority: keyed BLAKE3 reference authority
// ---------------------------------------------------------------------------
// signature = "<subject_id>.<mac>", mac = keyed "sig:" digest over
// "block_id:content_hash:subject_id". Viewers and auditors may not sign.
class LocalSigningAuthority : public ISigningAuthority {
 public:
  explicit LocalSigningAuthority(const KeyBytes& key);

  SignResult sign(const std::string& block_id, const std::string& content_hash,
                  const Subject& subject) override;
  VerifyResult verify(const std::string& block_id, const std::string& content_hash,
                      const std::string& signature) override;

  void set_available(bool available) { available_.store(available); }
  const std::string& signer_id() const { return signer_id_; }

 private:
  std::string mac(const std::string& block_id, const std::string& content_hash,
                  const std::string& subject_id) const;

  KeyBytes key_;
  std::string signer_id_;
  std::atomic<bool> available_{true};
};

struct SignOutcome {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  VerificationStatus status{VerificationStatus::unknown};
  Provenance provenance;  // as persisted; meaningful only when ok
  std::string detail;
};

// ---------------------------------------------------------------------------
// BlockIntegrityVerifier
// ---------------------------------------------------------------------------
class BlockIntegrityVerifier {
 public:
  BlockIntegrityVerifier(ISigningAuthority& authority, MetadataStore& store, IAuditSink& audit);

  // Maps the authority's answer for (digest of content, signature) and
  // records the status unless a newer verification of the block superseded
  // this one.
  VerificationStatus verify(const std::string& block_id, const std::string& content,
                            const std::optional<std::string>& signature);
  std::future<VerificationStatus> verify_async(std::string block_id, std::string content,
                                               std::optional<std::string> signature);

  // Verifies every block using the signature from the shadow store (falling
  // back to the block's own provenance).
  std::map<std::string, VerificationStatus> verify_all(const std::vector<Block>& blocks);

  // Hash, request a signature bound to (block id, hash, subject id), persist
  // it into provenance, then re-verify from the stored state. A rejection or
  // failed re-verification leaves the stored metadata as it was.
  SignOutcome sign(const Block& block, const Subject& subject);

 private:
  uint64_t begin(const std::string& block_id);
  bool finish(const std::string& block_id, uint64_t seq, VerificationStatus status);
  VerificationStatus check(const std::string& block_id, const std::string& content,
                           const std::string& signature);

  ISigningAuthority& authority_;
  MetadataStore& store_;
  IAuditSink& audit_;

  std::mutex mu_;
  std::map<std::string, uint64_t> seq_;
};

}  // namespace vellum
