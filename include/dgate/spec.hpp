#pragma once

// dgate/spec.hpp — ScenarioSpec: the declarative decision.
//
// DESIGN INVARIANTS:
//   1. A ScenarioSpec is immutable once loaded. The gate, the orchestrator's
//      worker threads and the runpack all read it without synchronization.
//   2. Parsing is strict: unknown keys, duplicate keys, wrong types and
//      invalid identifiers are rejected. Nothing is silently dropped, so
//      spec_to_json(parse(x)) carries everything x meant.
//   3. spec_to_json() is canonical. Re-parsing its output and serializing
//      again is byte-identical. spec_hash() is taken over that form.
//
// Wire format:
//   { "scenario_id": id, "spec_version": "1",
//     "policy": { "on_indeterminate": "block"|"decide_false",
//                 "on_budget_exceeded": "proceed"|"fail" },
//     "limits": { ... optional, defaults from EngineConfig ... },
//     "evidence":   [ { "evidence_id", "provider_id", "params", "timeout_ms"?, "max_retries"? } ],
//     "conditions": [ { "condition_id", "evidence_id", "comparator", "expected", "required" } ],
//     "requirement": <tree object> | "<dsl text>" }

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dgate/comparator.hpp"
#include "dgate/config.hpp"
#include "dgate/jsonlite.hpp"
#include "dgate/requirement.hpp"
#include "dgate/types.hpp"

namespace dgate {

// No default: every spec states how a top-level Indeterminate is reported.
enum class IndeterminatePolicy { block, decide_false };
enum class BudgetPolicy { proceed, fail };

std::string to_string(IndeterminatePolicy p);
std::string to_string(BudgetPolicy p);

struct SpecLimits {
  std::uint32_t max_evidence{0};
  std::uint32_t max_conditions{0};
  std::uint32_t max_depth{0};
  std::uint64_t provider_timeout_ms{0};
  std::uint64_t global_budget_ms{0};
  std::uint32_t max_retries{0};
  std::uint32_t max_parallelism{0};

  static SpecLimits defaults_from(const EngineConfig& config);
};

struct EvidenceBinding {
  EvidenceId evidence_id;
  ProviderId provider_id;
  jsonlite::Object params;
  std::optional<std::uint64_t> timeout_ms;    // overrides limits.provider_timeout_ms
  std::optional<std::uint32_t> max_retries;   // overrides limits.max_retries
};

struct ConditionSpec {
  ConditionId condition_id;
  EvidenceId evidence_id;
  ComparatorOp comparator{ComparatorOp::equals};
  EvidenceValue expected;
  bool required{true};
};

struct ScenarioSpec {
  ScenarioId scenario_id;
  std::string spec_version;
  IndeterminatePolicy on_indeterminate{IndeterminatePolicy::block};
  BudgetPolicy on_budget_exceeded{BudgetPolicy::proceed};
  SpecLimits limits;
  std::vector<EvidenceBinding> evidence;
  std::vector<ConditionSpec> conditions;
  RequirementNode requirement;

  const EvidenceBinding* find_evidence(const std::string& evidence_id) const;
  const ConditionSpec* find_condition(const std::string& condition_id) const;
};

// Structural parse. Limits absent from the document take config defaults.
std::optional<ScenarioSpec> parse_scenario_spec(const std::string& json, const EngineConfig& config,
                                                GateError* err);

// Semantic checks: id uniqueness, references between evidence, conditions
// and the requirement tree, operator availability, and limits against the
// engine caps. Over-cap failures use spec_over_limit, the rest spec_invalid.
bool validate_scenario_spec(const ScenarioSpec& spec, const EngineConfig& config,
                            const OperatorTable& operators, GateError* err);

// parse + validate.
std::optional<ScenarioSpec> load_scenario_spec(const std::string& json, const EngineConfig& config,
                                               const OperatorTable& operators, GateError* err);

std::string spec_to_json(const ScenarioSpec& spec);
std::string compute_spec_hash(const ScenarioSpec& spec);

}  // namespace dgate
