#pragma once

// dgate/requirement.hpp — Requirement trees over tri-state condition results.
//
// DESIGN INVARIANTS:
//   1. A RequirementNode is a pure value. Evaluation never mutates it.
//   2. Children are evaluated left to right. all() stops at the first False,
//      any() stops at the first True, at_least() stops as soon as the outcome
//      is fixed either way. Indeterminate never short-circuits.
//   3. Malformed trees are rejected by validate_requirement() before any
//      evaluation. evaluate() assumes a validated tree and cannot fail.
//   4. evaluate() is deterministic: identical tree and leaf results give an
//      identical TriState and an identical Plan.
//
// Tri-state algebra (Kleene):
//   all: any False -> False; else any Indeterminate -> Indeterminate; else True
//   any: any True  -> True;  else any Indeterminate -> Indeterminate; else False
//   not: swaps True/False, Indeterminate stays Indeterminate
//   at_least(k): True when >= k True; False when True + Indeterminate < k
//
// EXTENSION_POINT: leaf_resolver
//   ILeafResolver decouples the tree from how a leaf is decided. The gate
//   feeds condition results through MapLeafResolver; tests and tools can
//   supply any other producer.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "dgate/jsonlite.hpp"
#include "dgate/types.hpp"

namespace dgate {

TriState tri_and(TriState a, TriState b);
TriState tri_or(TriState a, TriState b);
TriState tri_not(TriState a);

enum class NodeKind { condition, all, any, negate, at_least };

std::string to_string(NodeKind kind);

struct RequirementNode {
  NodeKind kind{NodeKind::condition};
  std::string condition_id;  // condition nodes only
  std::uint32_t min{0};      // at_least only
  std::vector<RequirementNode> children;

  static RequirementNode leaf(std::string condition_id);
  static RequirementNode all(std::vector<RequirementNode> children);
  static RequirementNode any(std::vector<RequirementNode> children);
  static RequirementNode negate(RequirementNode child);
  static RequirementNode at_least(std::uint32_t min, std::vector<RequirementNode> children);

  bool is_leaf() const { return kind == NodeKind::condition; }
  bool operator==(const RequirementNode& o) const;
};

struct RequirementLimits {
  std::size_t max_depth{32};
  std::size_t max_nodes{1024};
};

// Depth of a single leaf is 1.
std::size_t requirement_depth(const RequirementNode& node);
std::size_t requirement_node_count(const RequirementNode& node);
// Distinct condition ids referenced by leaves.
std::set<std::string> referenced_conditions(const RequirementNode& node);

// Builder checks: structure (non-empty groups, one child for negate,
// 1 <= min <= children for at_least), depth and node limits, and that every
// leaf names a condition in known_conditions.
bool validate_requirement(const RequirementNode& node,
                          const std::set<std::string>& known_conditions,
                          const RequirementLimits& limits, GateError* err);

// JSON tree form: {"condition":id} {"all":[..]} {"any":[..]} {"not":node}
// {"at_least":{"min":n,"of":[..]}}. Structure only; ids are checked by
// validate_requirement().
std::optional<RequirementNode> requirement_from_json(const jsonlite::Value& json, GateError* err);
jsonlite::Value requirement_to_json(const RequirementNode& node);

// ---------------------------------------------------------------------------
// Leaf resolution
// ---------------------------------------------------------------------------
class ILeafResolver {
 public:
  virtual ~ILeafResolver() = default;
  virtual TriState resolve(const std::string& condition_id) const = 0;
};

// Unknown ids resolve to Indeterminate.
class MapLeafResolver : public ILeafResolver {
 public:
  MapLeafResolver() = default;
  explicit MapLeafResolver(std::map<std::string, TriState> results) : results_(std::move(results)) {}

  void set(const std::string& condition_id, TriState value) { results_[condition_id] = value; }
  TriState resolve(const std::string& condition_id) const override;

 private:
  std::map<std::string, TriState> results_;
};

// ---------------------------------------------------------------------------
// Plan — evaluation trace
// ---------------------------------------------------------------------------
// One entry per tree node in preorder. Nodes under a short-circuit are
// present with status skipped and result Indeterminate.
enum class PlanStatus { evaluated, skipped };

struct PlanEntry {
  static constexpr std::size_t kNoParent = static_cast<std::size_t>(-1);

  std::size_t id{0};
  std::size_t parent{kNoParent};
  std::size_t depth{0};
  NodeKind kind{NodeKind::condition};
  std::string condition_id;
  std::uint32_t min{0};
  PlanStatus status{PlanStatus::evaluated};
  TriState result{TriState::Indeterminate};

  bool operator==(const PlanEntry& o) const;
};

struct Plan {
  std::vector<PlanEntry> entries;

  std::size_t evaluated_count() const;
  std::size_t skipped_count() const;
  bool operator==(const Plan& o) const { return entries == o.entries; }
};

struct Evaluation {
  TriState result{TriState::Indeterminate};
  Plan plan;
};

// Total over any tree, validated or not. A negate node without exactly one
// child evaluates to Indeterminate.
Evaluation evaluate(const RequirementNode& tree, const ILeafResolver& resolver);

jsonlite::Value plan_to_json(const Plan& plan);
// Indented outline, one node per line, e.g.
//   all -> indeterminate
//     condition age_check -> indeterminate
//     condition region_ok (skipped)
std::string explain_plan(const Plan& plan);

}  // namespace dgate
