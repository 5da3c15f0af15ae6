#include "dgate/spec.hpp"

#include <algorithm>
#include <initializer_list>
#include <set>
#include <utility>

#include "dgate/dsl.hpp"
#include "dgate/hash.hpp"

namespace dgate {

namespace {

constexpr std::size_t kMaxSpecVersionLength = 64;

std::uint32_t depth_cap(const EngineConfig& config) {
  return std::min(config.max_depth_cap, kMaxDepthCapCeiling);
}

std::size_t params_nesting(const jsonlite::Object& params) {
  std::size_t inner = 0;
  for (const auto& [key, value] : params) {
    (void)key;
    inner = std::max(inner, jsonlite::nesting_depth(value));
  }
  return inner + 1;
}

// Untrusted text echoed into error messages is clipped.
std::string clip(const std::string& s) { return s.size() > 64 ? s.substr(0, 64) + "..." : s; }

bool only_keys(const jsonlite::Object& obj, std::initializer_list<const char*> allowed,
               const std::string& where, GateError* err) {
  for (const auto& [key, unused] : obj) {
    (void)unused;
    bool known = false;
    for (const char* a : allowed) known = known || key == a;
    if (!known) {
      return fail(err, ErrorCode::spec_invalid, "unknown field '" + clip(key) + "' in " + where);
    }
  }
  return true;
}

const jsonlite::Object* object_field(const jsonlite::Object& obj, const char* key, bool required,
                                     const std::string& where, GateError* err, bool* ok) {
  const auto* v = jsonlite::find(obj, key);
  if (!v) {
    if (required) *ok = fail(err, ErrorCode::spec_invalid, where + " requires '" + key + "'");
    return nullptr;
  }
  const auto* o = std::get_if<jsonlite::Object>(&v->v);
  if (!o) *ok = fail(err, ErrorCode::spec_invalid, where + "." + key + " must be an object");
  return o;
}

bool string_field(const jsonlite::Object& obj, const char* key, const std::string& where,
                  std::string* out, GateError* err) {
  const auto* v = jsonlite::find(obj, key);
  const auto* s = v ? std::get_if<std::string>(&v->v) : nullptr;
  if (!s) return fail(err, ErrorCode::spec_invalid, where + "." + key + " must be a string");
  *out = *s;
  return true;
}

template <typename Id>
bool id_field(const jsonlite::Object& obj, const char* key, const std::string& where, Id* out,
              GateError* err) {
  std::string raw;
  if (!string_field(obj, key, where, &raw, err)) return false;
  auto id = Id::parse(raw);
  if (!id) {
    return fail(err, ErrorCode::spec_invalid, where + "." + key + " is not a valid identifier",
                {clip(raw)});
  }
  *out = std::move(*id);
  return true;
}

template <typename T>
bool uint_field(const jsonlite::Object& obj, const char* key, const std::string& where, T* out,
                GateError* err) {
  if (!jsonlite::find(obj, key)) return true;
  bool ok = true;
  const auto v = jsonlite::get_u64(obj, key, 0, &ok);
  if (!ok || v > static_cast<unsigned long long>(static_cast<T>(-1))) {
    return fail(err, ErrorCode::spec_invalid, where + "." + key + " must be a non-negative integer");
  }
  *out = static_cast<T>(v);
  return true;
}

const jsonlite::Array* array_field(const jsonlite::Object& obj, const char* key, GateError* err) {
  const auto* v = jsonlite::find(obj, key);
  const auto* a = v ? std::get_if<jsonlite::Array>(&v->v) : nullptr;
  if (!a) fail(err, ErrorCode::spec_invalid, std::string("spec.") + key + " must be an array");
  return a;
}

bool parse_policy(const jsonlite::Object& root, ScenarioSpec* spec, GateError* err) {
  bool ok = true;
  const auto* policy = object_field(root, "policy", true, "spec", err, &ok);
  if (!policy) return false;
  if (!only_keys(*policy, {"on_indeterminate", "on_budget_exceeded"}, "policy", err)) return false;

  std::string mode;
  if (!string_field(*policy, "on_indeterminate", "policy", &mode, err)) return false;
  if (mode == "block") {
    spec->on_indeterminate = IndeterminatePolicy::block;
  } else if (mode == "decide_false") {
    spec->on_indeterminate = IndeterminatePolicy::decide_false;
  } else {
    return fail(err, ErrorCode::spec_invalid, "policy.on_indeterminate must be block or decide_false");
  }

  if (jsonlite::find(*policy, "on_budget_exceeded")) {
    if (!string_field(*policy, "on_budget_exceeded", "policy", &mode, err)) return false;
    if (mode == "proceed") {
      spec->on_budget_exceeded = BudgetPolicy::proceed;
    } else if (mode == "fail") {
      spec->on_budget_exceeded = BudgetPolicy::fail;
    } else {
      return fail(err, ErrorCode::spec_invalid, "policy.on_budget_exceeded must be proceed or fail");
    }
  }
  return true;
}

bool parse_limits(const jsonlite::Object& root, ScenarioSpec* spec, GateError* err) {
  bool ok = true;
  const auto* limits = object_field(root, "limits", false, "spec", err, &ok);
  if (!ok) return false;
  if (!limits) return true;
  if (!only_keys(*limits,
                 {"max_evidence", "max_conditions", "max_depth", "provider_timeout_ms",
                  "global_budget_ms", "max_retries", "max_parallelism"},
                 "limits", err)) {
    return false;
  }
  auto& l = spec->limits;
  return uint_field(*limits, "max_evidence", "limits", &l.max_evidence, err) &&
         uint_field(*limits, "max_conditions", "limits", &l.max_conditions, err) &&
         uint_field(*limits, "max_depth", "limits", &l.max_depth, err) &&
         uint_field(*limits, "provider_timeout_ms", "limits", &l.provider_timeout_ms, err) &&
         uint_field(*limits, "global_budget_ms", "limits", &l.global_budget_ms, err) &&
         uint_field(*limits, "max_retries", "limits", &l.max_retries, err) &&
         uint_field(*limits, "max_parallelism", "limits", &l.max_parallelism, err);
}

bool parse_evidence(const jsonlite::Array& items, ScenarioSpec* spec, GateError* err) {
  for (std::size_t i = 0; i < items.size(); ++i) {
    const std::string where = "evidence[" + std::to_string(i) + "]";
    const auto* obj = std::get_if<jsonlite::Object>(&items[i].v);
    if (!obj) return fail(err, ErrorCode::spec_invalid, where + " must be an object");
    if (!only_keys(*obj, {"evidence_id", "provider_id", "params", "timeout_ms", "max_retries"},
                   where, err)) {
      return false;
    }
    EvidenceBinding b;
    if (!id_field(*obj, "evidence_id", where, &b.evidence_id, err)) return false;
    if (!id_field(*obj, "provider_id", where, &b.provider_id, err)) return false;
    if (const auto* params = jsonlite::find(*obj, "params")) {
      const auto* p = std::get_if<jsonlite::Object>(&params->v);
      if (!p) {
        return fail(err, ErrorCode::spec_invalid, where + ".params must be an object",
                    {b.evidence_id.str()});
      }
      b.params = *p;
    }
    if (jsonlite::find(*obj, "timeout_ms")) {
      std::uint64_t t = 0;
      if (!uint_field(*obj, "timeout_ms", where, &t, err)) return false;
      b.timeout_ms = t;
    }
    if (jsonlite::find(*obj, "max_retries")) {
      std::uint32_t r = 0;
      if (!uint_field(*obj, "max_retries", where, &r, err)) return false;
      b.max_retries = r;
    }
    spec->evidence.push_back(std::move(b));
  }
  return true;
}

bool parse_conditions(const jsonlite::Array& items, ScenarioSpec* spec, GateError* err) {
  for (std::size_t i = 0; i < items.size(); ++i) {
    const std::string where = "conditions[" + std::to_string(i) + "]";
    const auto* obj = std::get_if<jsonlite::Object>(&items[i].v);
    if (!obj) return fail(err, ErrorCode::spec_invalid, where + " must be an object");
    if (!only_keys(*obj, {"condition_id", "evidence_id", "comparator", "expected", "required"},
                   where, err)) {
      return false;
    }
    ConditionSpec c;
    if (!id_field(*obj, "condition_id", where, &c.condition_id, err)) return false;
    if (!id_field(*obj, "evidence_id", where, &c.evidence_id, err)) return false;

    std::string op_name;
    if (!string_field(*obj, "comparator", where, &op_name, err)) return false;
    auto op = comparator_op_from_string(op_name);
    if (!op) {
      return fail(err, ErrorCode::spec_invalid, where + ".comparator '" + clip(op_name) + "' is unknown",
                  {c.condition_id.str()});
    }
    c.comparator = *op;

    const auto* expected = jsonlite::find(*obj, "expected");
    if (!expected) {
      return fail(err, ErrorCode::spec_invalid, where + " requires 'expected'", {c.condition_id.str()});
    }
    std::string value_error;
    auto value = evidence_from_json(*expected, &value_error);
    if (!value) {
      return fail(err, ErrorCode::spec_invalid, where + ".expected: " + value_error,
                  {c.condition_id.str()});
    }
    c.expected = std::move(*value);

    if (const auto* req = jsonlite::find(*obj, "required")) {
      const auto* b = std::get_if<bool>(&req->v);
      if (!b) {
        return fail(err, ErrorCode::spec_invalid, where + ".required must be a boolean",
                    {c.condition_id.str()});
      }
      c.required = *b;
    }
    spec->conditions.push_back(std::move(c));
  }
  return true;
}

bool check_cap(std::uint64_t value, std::uint64_t cap, const char* name, GateError* err) {
  if (value == 0) return fail(err, ErrorCode::spec_invalid, std::string("limits.") + name + " must be >= 1");
  if (value > cap) {
    return fail(err, ErrorCode::spec_over_limit,
                std::string("limits.") + name + " " + std::to_string(value) +
                    " exceeds engine cap " + std::to_string(cap));
  }
  return true;
}

}  // namespace

std::string to_string(IndeterminatePolicy p) {
  return p == IndeterminatePolicy::block ? "block" : "decide_false";
}

std::string to_string(BudgetPolicy p) { return p == BudgetPolicy::proceed ? "proceed" : "fail"; }

SpecLimits SpecLimits::defaults_from(const EngineConfig& config) {
  SpecLimits l;
  l.max_evidence = config.max_evidence_cap;
  l.max_conditions = config.max_conditions_cap;
  l.max_depth = depth_cap(config);
  l.provider_timeout_ms = config.default_provider_timeout_ms;
  l.global_budget_ms = config.default_global_budget_ms;
  l.max_retries = config.default_max_retries;
  l.max_parallelism = config.default_max_parallelism;
  return l;
}

const EvidenceBinding* ScenarioSpec::find_evidence(const std::string& evidence_id) const {
  for (const auto& e : evidence) {
    if (e.evidence_id.str() == evidence_id) return &e;
  }
  return nullptr;
}

const ConditionSpec* ScenarioSpec::find_condition(const std::string& condition_id) const {
  for (const auto& c : conditions) {
    if (c.condition_id.str() == condition_id) return &c;
  }
  return nullptr;
}

std::optional<ScenarioSpec> parse_scenario_spec(const std::string& json, const EngineConfig& config,
                                                GateError* err) {
  if (json.size() > config.max_spec_bytes) {
    fail(err, ErrorCode::spec_over_limit,
         "spec document larger than " + std::to_string(config.max_spec_bytes) + " bytes");
    return std::nullopt;
  }
  std::optional<jsonlite::JsonError> json_error;
  const jsonlite::Object root = jsonlite::parse(json, &json_error);
  if (json_error) {
    fail(err, ErrorCode::spec_invalid, json_error->code + ": " + json_error->message);
    return std::nullopt;
  }
  if (!only_keys(root,
                 {"scenario_id", "spec_version", "policy", "limits", "evidence", "conditions",
                  "requirement"},
                 "spec", err)) {
    return std::nullopt;
  }

  ScenarioSpec spec;
  spec.limits = SpecLimits::defaults_from(config);
  if (!id_field(root, "scenario_id", "spec", &spec.scenario_id, err)) return std::nullopt;
  if (!string_field(root, "spec_version", "spec", &spec.spec_version, err)) return std::nullopt;
  if (spec.spec_version.empty() || spec.spec_version.size() > kMaxSpecVersionLength) {
    fail(err, ErrorCode::spec_invalid, "spec.spec_version must be 1..64 characters");
    return std::nullopt;
  }
  if (!parse_policy(root, &spec, err) || !parse_limits(root, &spec, err)) return std::nullopt;

  const auto* evidence = array_field(root, "evidence", err);
  if (!evidence || !parse_evidence(*evidence, &spec, err)) return std::nullopt;
  const auto* conditions = array_field(root, "conditions", err);
  if (!conditions || !parse_conditions(*conditions, &spec, err)) return std::nullopt;

  const auto* requirement = jsonlite::find(root, "requirement");
  if (!requirement) {
    fail(err, ErrorCode::spec_invalid, "spec requires 'requirement'");
    return std::nullopt;
  }
  std::optional<RequirementNode> tree;
  if (const auto* text = std::get_if<std::string>(&requirement->v)) {
    DslLimits dsl_limits;
    dsl_limits.max_nesting = std::min<std::size_t>(spec.limits.max_depth, depth_cap(config));
    tree = parse_requirement_dsl(*text, err, dsl_limits);
  } else {
    tree = requirement_from_json(*requirement, err);
  }
  if (!tree) return std::nullopt;
  spec.requirement = std::move(*tree);
  return spec;
}

bool validate_scenario_spec(const ScenarioSpec& spec, const EngineConfig& config,
                            const OperatorTable& operators, GateError* err) {
  const SpecLimits& l = spec.limits;
  if (!check_cap(l.max_evidence, config.max_evidence_cap, "max_evidence", err) ||
      !check_cap(l.max_conditions, config.max_conditions_cap, "max_conditions", err) ||
      !check_cap(l.max_depth, depth_cap(config), "max_depth", err) ||
      !check_cap(l.provider_timeout_ms, config.max_provider_timeout_ms, "provider_timeout_ms", err) ||
      !check_cap(l.global_budget_ms, config.max_global_budget_ms, "global_budget_ms", err) ||
      !check_cap(l.max_parallelism, config.max_parallelism_cap, "max_parallelism", err)) {
    return false;
  }
  if (l.max_retries > config.max_retries_cap) {
    return fail(err, ErrorCode::spec_over_limit,
                "limits.max_retries exceeds engine cap " + std::to_string(config.max_retries_cap));
  }
  if (spec.evidence.size() > l.max_evidence) {
    return fail(err, ErrorCode::spec_over_limit,
                std::to_string(spec.evidence.size()) + " evidence entries exceed max_evidence " +
                    std::to_string(l.max_evidence));
  }
  if (spec.conditions.size() > l.max_conditions) {
    return fail(err, ErrorCode::spec_over_limit,
                std::to_string(spec.conditions.size()) + " conditions exceed max_conditions " +
                    std::to_string(l.max_conditions));
  }
  if (spec.conditions.empty()) return fail(err, ErrorCode::spec_invalid, "spec declares no conditions");

  std::set<std::string> evidence_ids;
  for (const auto& e : spec.evidence) {
    const std::string& id = e.evidence_id.str();
    if (!evidence_ids.insert(id).second) {
      return fail(err, ErrorCode::spec_invalid, "duplicate evidence id '" + id + "'", {id});
    }
    if (e.timeout_ms && (*e.timeout_ms == 0 || *e.timeout_ms > config.max_provider_timeout_ms)) {
      return fail(err, ErrorCode::spec_over_limit,
                  "evidence '" + id + "' timeout_ms outside 1.." +
                      std::to_string(config.max_provider_timeout_ms),
                  {id});
    }
    if (e.max_retries && *e.max_retries > config.max_retries_cap) {
      return fail(err, ErrorCode::spec_over_limit,
                  "evidence '" + id + "' max_retries exceeds engine cap", {id});
    }
    if (params_nesting(e.params) > kMaxValueNesting) {
      return fail(err, ErrorCode::spec_over_limit,
                  "evidence '" + id + "' params nest deeper than " + std::to_string(kMaxValueNesting) +
                      " levels",
                  {id});
    }
  }

  std::set<std::string> condition_ids;
  for (const auto& c : spec.conditions) {
    const std::string& id = c.condition_id.str();
    if (!condition_ids.insert(id).second) {
      return fail(err, ErrorCode::spec_invalid, "duplicate condition id '" + id + "'", {id});
    }
    if (!evidence_ids.count(c.evidence_id.str())) {
      return fail(err, ErrorCode::spec_invalid,
                  "condition '" + id + "' references undeclared evidence '" + c.evidence_id.str() + "'",
                  {id, c.evidence_id.str()});
    }
    if (!operators.allows(c.comparator)) {
      return fail(err, ErrorCode::spec_invalid,
                  "condition '" + id + "' uses disabled comparator " + to_string(c.comparator), {id});
    }
    if (c.expected.is_missing()) {
      return fail(err, ErrorCode::spec_invalid, "condition '" + id + "' has a null expected value",
                  {id});
    }
    if (c.comparator == ComparatorOp::in_set && c.expected.kind() != EvidenceValue::Kind::list) {
      return fail(err, ErrorCode::spec_invalid,
                  "condition '" + id + "' uses in_set with a non-list expected value", {id});
    }
    if (evidence_nesting(c.expected) > kMaxValueNesting) {
      return fail(err, ErrorCode::spec_over_limit,
                  "condition '" + id + "' expected value nests deeper than " +
                      std::to_string(kMaxValueNesting) + " levels",
                  {id});
    }
  }

  RequirementLimits tree_limits;
  tree_limits.max_depth = l.max_depth;
  tree_limits.max_nodes = config.max_nodes_cap;
  return validate_requirement(spec.requirement, condition_ids, tree_limits, err);
}

std::optional<ScenarioSpec> load_scenario_spec(const std::string& json, const EngineConfig& config,
                                               const OperatorTable& operators, GateError* err) {
  auto spec = parse_scenario_spec(json, config, err);
  if (!spec) return std::nullopt;
  if (!validate_scenario_spec(*spec, config, operators, err)) return std::nullopt;
  return spec;
}

std::string spec_to_json(const ScenarioSpec& spec) {
  jsonlite::Object root;
  root["scenario_id"] = spec.scenario_id.str();
  root["spec_version"] = spec.spec_version;

  jsonlite::Object policy;
  policy["on_indeterminate"] = to_string(spec.on_indeterminate);
  policy["on_budget_exceeded"] = to_string(spec.on_budget_exceeded);
  root["policy"] = std::move(policy);

  jsonlite::Object limits;
  limits["max_evidence"] = jsonlite::number(spec.limits.max_evidence);
  limits["max_conditions"] = jsonlite::number(spec.limits.max_conditions);
  limits["max_depth"] = jsonlite::number(spec.limits.max_depth);
  limits["provider_timeout_ms"] = jsonlite::number(spec.limits.provider_timeout_ms);
  limits["global_budget_ms"] = jsonlite::number(spec.limits.global_budget_ms);
  limits["max_retries"] = jsonlite::number(spec.limits.max_retries);
  limits["max_parallelism"] = jsonlite::number(spec.limits.max_parallelism);
  root["limits"] = std::move(limits);

  jsonlite::Array evidence;
  for (const auto& e : spec.evidence) {
    jsonlite::Object o;
    o["evidence_id"] = e.evidence_id.str();
    o["provider_id"] = e.provider_id.str();
    o["params"] = e.params;
    if (e.timeout_ms) o["timeout_ms"] = jsonlite::number(*e.timeout_ms);
    if (e.max_retries) o["max_retries"] = jsonlite::number(*e.max_retries);
    evidence.push_back(std::move(o));
  }
  root["evidence"] = std::move(evidence);

  jsonlite::Array conditions;
  for (const auto& c : spec.conditions) {
    jsonlite::Object o;
    o["condition_id"] = c.condition_id.str();
    o["evidence_id"] = c.evidence_id.str();
    o["comparator"] = to_string(c.comparator);
    o["expected"] = evidence_to_json(c.expected);
    o["required"] = c.required;
    conditions.push_back(std::move(o));
  }
  root["conditions"] = std::move(conditions);
  root["requirement"] = requirement_to_json(spec.requirement);
  return jsonlite::to_json(jsonlite::Value{std::move(root)});
}

std::string compute_spec_hash(const ScenarioSpec& spec) { return spec_hash(spec_to_json(spec)); }

}  // namespace dgate
