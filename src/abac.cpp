#include "vellum/abac.hpp"

#include <algorithm>
#include <sstream>

namespace vellum {
namespace abac {

std::string to_string(Gate g) {
  switch (g) {
    case Gate::none:            return "none";
    case Gate::subject_missing: return "subject_missing";
    case Gate::classification:  return "classification";
    case Gate::acl:             return "acl";
    case Gate::cross_origin:    return "cross_origin";
    case Gate::locked:          return "locked";
    case Gate::fault:           return "fault";
  }
  return "fault";
}

Classification effective_classification(const BlockMetadata& m) {
  return m.malformed ? Classification::restricted : m.classification;
}

namespace {

const BlockMetadata& public_defaults() {
  static const BlockMetadata kDefaults{};
  return kDefaults;
}

AccessDecision deny(Gate gate, Classification required, std::string reason) {
  AccessDecision d;
  d.allowed = false;
  d.gate = gate;
  d.required = required;
  d.reason = std::move(reason);
  return d;
}

bool is_imported(const BlockMetadata& m, const std::string& local_doc_id) {
  const auto& origin = m.provenance.origin_doc_id;
  return origin.has_value() && !origin->empty() && *origin != local_doc_id;
}

}  // namespace

AccessDecision evaluate(const Subject* subject, const BlockMetadata* metadata,
                        const EvaluatorConfig& cfg) {
  const BlockMetadata& m = metadata ? *metadata : public_defaults();
  const Classification cls = effective_classification(m);

  if (!subject) {
    if (cfg.failure_policy == FailurePolicy::fail_open) {
      AccessDecision d;
      d.allowed = true;
      d.required = cls;
      d.reason = "no subject; fail_open";
      return d;
    }
    return deny(Gate::subject_missing, cls, "no subject");
  }

  // Gate 1: classification
  if (subject->clearance_level < ordinal(cls)) {
    return deny(Gate::classification, cls,
                "clearance " + std::to_string(subject->clearance_level) + " below " +
                    to_string(cls));
  }

  // Gate 2: ACL allow-list
  if (!m.acl.empty()) {
    const bool listed = std::any_of(m.acl.begin(), m.acl.end(), [&](const std::string& entry) {
      return entry == subject->id || entry == subject->role;
    });
    if (!listed) {
      return deny(Gate::acl, cls, "subject not on access list");
    }
  }

  // Gate 3: imported restricted content
  if (is_imported(m, cfg.local_doc_id) && cls == Classification::restricted &&
      !subject->is_admin() && subject->clearance_level < 3) {
    return deny(Gate::cross_origin, cls, "imported restricted content requires clearance 3");
  }

  AccessDecision d;
  d.allowed = true;
  d.required = cls;
  return d;
}

AccessDecision evaluate_edit(const Subject* subject, const BlockMetadata* metadata,
                             const EvaluatorConfig& cfg) {
  AccessDecision d = evaluate(subject, metadata, cfg);
  if (!d.allowed) return d;
  if (metadata && metadata->locked && !(subject && subject->is_admin())) {
    return deny(Gate::locked, d.required, "block is locked");
  }
  return d;
}

bool can_view(const Subject& subject, const BlockMetadata& metadata, const EvaluatorConfig& cfg) {
  return evaluate(&subject, &metadata, cfg).allowed;
}

bool can_edit(const Subject& subject, const BlockMetadata& metadata, const EvaluatorConfig& cfg) {
  return evaluate_edit(&subject, &metadata, cfg).allowed;
}

AccessDecision AccessEvaluator::evaluate(const Subject* subject,
                                         const BlockMetadata* metadata) const {
  return abac::evaluate(subject, metadata, cfg_);
}

AccessDecision AccessEvaluator::evaluate_edit(const Subject* subject,
                                              const BlockMetadata* metadata) const {
  return abac::evaluate_edit(subject, metadata, cfg_);
}

std::string AccessDecision::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"allowed\":" << (allowed ? "true" : "false")
    << ",\"fault\":" << (fault ? "true" : "false")
    << ",\"gate\":\"" << to_string(gate) << "\""
    << ",\"required\":\"" << vellum::to_string(required) << "\"";
  if (!reason.empty()) {
    o << ",\"reason\":" << jsonlite::to_json(jsonlite::Value{reason});
  }
  o << "}";
  return o.str();
}

}  // namespace abac
}  // namespace vellum
