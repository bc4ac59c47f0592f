#pragma once

// vellum/abac.hpp: Attribute-based access evaluation for document blocks.
//
// DESIGN:
//   evaluate() is the conjunction of three gates, checked in order:
//     1. classification: deny if clearance_level < ordinal(classification).
//     2. acl:            non-empty ACL is an allow-list of subject ids and
//                        role names. Empty ACL passes.
//     3. cross_origin:   imported blocks (origin_doc_id set and not the local
//                        document) that are restricted additionally require
//                        clearance >= 3 unless the subject is admin.
//   evaluate_edit() adds: locked blocks are editable by admin only.
//
// INVARIANTS:
//   - Pure. No I/O, no logging, no global state. Same inputs, same decision.
//   - Denial is an outcome (allowed=false), never an exception.
//   - Malformed metadata is evaluated as restricted.
//   - Absent metadata means public defaults under every policy.
//   - Absent subject is denied under fail_closed, allowed under fail_open.
//   - Decisions never carry ACL contents; only the gate and the effective
//     classification leave this module.

#include <cstdint>
#include <string>

#include "vellum/config.hpp"
#include "vellum/types.hpp"

namespace vellum {
namespace abac {

enum class Gate : uint8_t {
  none,             // allowed
  subject_missing,
  classification,
  acl,
  cross_origin,
  locked,
  fault,            // the evaluator itself failed; set by callers that catch
};

std::string to_string(Gate g);

struct AccessDecision {
  bool allowed{false};
  bool fault{false};
  Gate gate{Gate::none};
  // Effective classification of the resource. This is the only attribute a
  // redaction marker may reveal.
  Classification required{Classification::public_};
  std::string reason;

  std::string to_json() const;
};

struct EvaluatorConfig {
  std::string local_doc_id;
  FailurePolicy failure_policy{FailurePolicy::fail_closed};
};

// Effective classification after malformed-label handling.
Classification effective_classification(const BlockMetadata& m);

// Free-function form. nullptr means "absent".
AccessDecision evaluate(const Subject* subject, const BlockMetadata* metadata,
                        const EvaluatorConfig& cfg);
AccessDecision evaluate_edit(const Subject* subject, const BlockMetadata* metadata,
                             const EvaluatorConfig& cfg);

// Boolean shorthands for the common present/present case.
bool can_view(const Subject& subject, const BlockMetadata& metadata,
              const EvaluatorConfig& cfg = {});
bool can_edit(const Subject& subject, const BlockMetadata& metadata,
              const EvaluatorConfig& cfg = {});

// ---------------------------------------------------------------------------
// IAccessEvaluator: seam used by the sync filter and authorities
// ---------------------------------------------------------------------------
// Implementations may throw; callers in this library catch std::exception at
// the component boundary and deny with fault=true.
class IAccessEvaluator {
 public:
  virtual ~IAccessEvaluator() = default;
  virtual AccessDecision evaluate(const Subject* subject, const BlockMetadata* metadata) const = 0;
  virtual AccessDecision evaluate_edit(const Subject* subject,
                                       const BlockMetadata* metadata) const = 0;
};

class AccessEvaluator : public IAccessEvaluator {
 public:
  AccessEvaluator() = default;
  explicit AccessEvaluator(EvaluatorConfig cfg) : cfg_(std::move(cfg)) {}

  AccessDecision evaluate(const Subject* subject, const BlockMetadata* metadata) const override;
  AccessDecision evaluate_edit(const Subject* subject,
                               const BlockMetadata* metadata) const override;

  const EvaluatorConfig& config() const { return cfg_; }

 private:
  EvaluatorConfig cfg_;
};

}  // namespace abac
}  // namespace vellum
