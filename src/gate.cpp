#include "dgate/gate.hpp"

#include <chrono>
#include <set>
#include <utility>

#include "dgate/hash.hpp"
#include "dgate/observability.hpp"

namespace dgate {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) out += sep;
    out += item;
  }
  return out;
}

jsonlite::Value string_array(const std::vector<std::string>& items) {
  jsonlite::Array arr;
  for (const auto& s : items) arr.push_back(jsonlite::Value{s});
  return jsonlite::Value{std::move(arr)};
}

// Leaves that were actually evaluated, first occurrence order.
std::vector<std::string> evaluated_leaves_with(const Plan& plan, TriState result) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  for (const auto& e : plan.entries) {
    if (e.kind == NodeKind::condition && e.status == PlanStatus::evaluated && e.result == result &&
        seen.insert(e.condition_id).second) {
      out.push_back(e.condition_id);
    }
  }
  return out;
}

}  // namespace

std::string to_string(GatePhase phase) {
  switch (phase) {
    case GatePhase::pending: return "pending";
    case GatePhase::evaluating: return "evaluating";
    case GatePhase::decided: return "decided";
    case GatePhase::blocked: return "blocked";
    case GatePhase::failed: return "failed";
  }
  return "pending";
}

std::string gate_state_to_json(const GateState& state) {
  jsonlite::Object o;
  o["phase"] = to_string(state.phase);
  if (state.phase == GatePhase::decided) o["outcome"] = to_string(state.outcome);
  o["reason"] = state.reason;
  if (state.error != ErrorCode::none) o["error"] = to_string(state.error);
  o["subjects"] = string_array(state.subjects);
  o["budget_exceeded"] = state.budget_exceeded;
  o["spec_hash"] = state.spec_hash;
  o["fingerprint"] = state.fingerprint;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

Gate::Gate(EngineConfig config, const ProviderRegistry& providers, OperatorTable operators)
    : config_(std::move(config)),
      providers_(providers),
      comparator_(operators),
      operators_(std::move(operators)) {}

GateState Gate::start(const std::string& spec_json) {
  GatePhase expected = GatePhase::pending;
  if (!phase_.compare_exchange_strong(expected, GatePhase::evaluating)) {
    GateState misuse;
    misuse.phase = GatePhase::failed;
    misuse.error = ErrorCode::lifecycle_violation;
    misuse.reason = "gate already started";
    return misuse;
  }
  started_at_ = std::chrono::steady_clock::now();
  GateError err;
  auto spec = load_scenario_spec(spec_json, config_, operators_, &err);
  if (!spec) return finish(GateState{GatePhase::failed, TriState::Indeterminate, err.message,
                                     err.code, err.subjects, false, "", ""},
                           0, 0);
  return run(*spec);
}

GateState Gate::start(const ScenarioSpec& spec) {
  GatePhase expected = GatePhase::pending;
  if (!phase_.compare_exchange_strong(expected, GatePhase::evaluating)) {
    GateState misuse;
    misuse.phase = GatePhase::failed;
    misuse.error = ErrorCode::lifecycle_violation;
    misuse.reason = "gate already started";
    return misuse;
  }
  started_at_ = std::chrono::steady_clock::now();
  GateError err;
  if (!validate_scenario_spec(spec, config_, operators_, &err)) {
    return finish(GateState{GatePhase::failed, TriState::Indeterminate, err.message, err.code,
                            err.subjects, false, "", ""},
                  0, 0);
  }
  return run(spec);
}

void Gate::cancel() { cancel_.cancel(); }

std::optional<Runpack> Gate::take_runpack() {
  if (!runpack_ || !runpack_->sealed()) return std::nullopt;
  std::optional<Runpack> out = std::move(runpack_);
  runpack_.reset();
  return out;
}

GateState Gate::run(const ScenarioSpec& spec) {
  spec_ = spec;
  const std::string canonical = spec_to_json(spec);
  const std::string digest = spec_hash(canonical);
  runpack_.emplace(spec.scenario_id.str(), digest);

  GateState cancelled;
  cancelled.phase = GatePhase::failed;
  cancelled.error = ErrorCode::cancelled;
  cancelled.reason = "evaluation cancelled";
  cancelled.spec_hash = digest;

  GateError err;
  jsonlite::Object loaded;
  loaded["scenario_id"] = spec.scenario_id.str();
  loaded["spec_version"] = spec.spec_version;
  loaded["spec_hash"] = digest;
  std::optional<jsonlite::JsonError> reparse_error;
  auto spec_value = jsonlite::parse_value(canonical, &reparse_error);
  loaded["spec"] = spec_value ? std::move(*spec_value) : jsonlite::Value{nullptr};
  if (!runpack_->append(StepKind::spec_loaded, jsonlite::Value{std::move(loaded)}, &err)) {
    return fail_run(err.code, err.message, err.subjects, 0);
  }

  if (cancel_.cancelled()) {
    runpack_.reset();
    return finish(cancelled, 0, 0);
  }

  std::uint64_t orchestration_ns = 0;
  {
    ScopeTimer timer(orchestration_ns);
    EvidenceOrchestrator orchestrator(providers_, OrchestrationOptions::from(spec.limits, config_));
    evidence_ = orchestrator.gather(spec.evidence, cancel_);
  }
  // Join point. Everything below runs on this thread only.
  if (evidence_.cancelled || cancel_.cancelled()) {
    runpack_.reset();
    return finish(cancelled, orchestration_ns, 0);
  }

  for (const auto& record : evidence_.records) {
    if (!runpack_->append(StepKind::evidence_fetched, evidence_record_to_json(record), &err)) {
      return fail_run(err.code, err.message, err.subjects, orchestration_ns);
    }
  }

  if (evidence_.budget_exceeded && spec.on_budget_exceeded == BudgetPolicy::fail) {
    std::vector<std::string> unresolved;
    for (const auto& record : evidence_.records) {
      if (record.status == EvidenceStatus::budget_exceeded) unresolved.push_back(record.evidence_id.str());
    }
    return fail_run(ErrorCode::budget_exceeded,
                    "global budget of " + std::to_string(spec.limits.global_budget_ms) +
                        " ms exceeded; unresolved evidence: " + join(unresolved, ", "),
                    unresolved, orchestration_ns);
  }

  GateState state;
  state.spec_hash = digest;
  state.budget_exceeded = evidence_.budget_exceeded;
  std::uint64_t evaluation_ns = 0;
  {
    ScopeTimer timer(evaluation_ns);
    resolve_conditions(spec);

    MapLeafResolver resolver;
    for (std::size_t i = 0; i < outcomes_.size(); ++i) {
      const ConditionOutcome& o = outcomes_[i];
      const ConditionSpec& c = spec.conditions[i];
      const EvidenceRecord* record = evidence_.find(o.evidence_id);
      jsonlite::Object payload;
      payload["condition_id"] = o.condition_id;
      payload["evidence_id"] = o.evidence_id;
      payload["comparator"] = to_string(c.comparator);
      payload["expected"] = evidence_to_json(c.expected);
      payload["actual"] = record ? evidence_to_json(record->value) : jsonlite::Value{nullptr};
      payload["required"] = o.required;
      payload["result"] = to_string(o.result);
      if (!o.note.empty()) payload["note"] = o.note;
      if (!runpack_->append(StepKind::condition_evaluated, jsonlite::Value{std::move(payload)}, &err)) {
        return fail_run(err.code, err.message, err.subjects, orchestration_ns);
      }
      resolver.set(o.condition_id, o.result);
    }

    evaluation_ = evaluate(spec.requirement, resolver);
    if (!spec.requirement.is_leaf()) {
      jsonlite::Object payload;
      payload["result"] = to_string(evaluation_.result);
      payload["plan"] = plan_to_json(evaluation_.plan);
      if (!runpack_->append(StepKind::tree_evaluated, jsonlite::Value{std::move(payload)}, &err)) {
        return fail_run(err.code, err.message, err.subjects, orchestration_ns);
      }
    }

    switch (evaluation_.result) {
      case TriState::True:
        state.phase = GatePhase::decided;
        state.outcome = TriState::True;
        state.reason = "requirement satisfied";
        break;
      case TriState::False:
        state.phase = GatePhase::decided;
        state.outcome = TriState::False;
        state.subjects = evaluated_leaves_with(evaluation_.plan, TriState::False);
        state.reason = "requirement not satisfied";
        if (!state.subjects.empty()) state.reason += ": " + join(state.subjects, ", ");
        break;
      case TriState::Indeterminate: {
        state.subjects = evaluated_leaves_with(evaluation_.plan, TriState::Indeterminate);
        std::vector<std::string> parts;
        for (const auto& id : state.subjects) {
          std::string note = "comparison indeterminate";
          for (const auto& o : outcomes_) {
            if (o.condition_id == id && !o.note.empty()) note = o.note;
          }
          parts.push_back(id + ": " + note);
        }
        const std::string unresolved = join(parts, "; ");
        if (spec.on_indeterminate == IndeterminatePolicy::block) {
          state.phase = GatePhase::blocked;
          state.reason = unresolved;
        } else {
          state.phase = GatePhase::decided;
          state.outcome = TriState::False;
          state.reason = "indeterminate outcome decided false: " + unresolved;
        }
        break;
      }
    }
  }

  jsonlite::Object terminal;
  terminal["phase"] = to_string(state.phase);
  if (state.phase == GatePhase::decided) terminal["outcome"] = to_string(state.outcome);
  terminal["reason"] = state.reason;
  terminal["subjects"] = string_array(state.subjects);
  terminal["budget_exceeded"] = state.budget_exceeded;
  const StepKind kind = state.phase == GatePhase::blocked ? StepKind::blocked : StepKind::decided;
  if (!runpack_->append(kind, jsonlite::Value{std::move(terminal)}, &err)) {
    return fail_run(err.code, err.message, err.subjects, orchestration_ns);
  }
  auto fingerprint = runpack_->seal(&err);
  if (!fingerprint) return fail_run(err.code, err.message, err.subjects, orchestration_ns);
  state.fingerprint = *fingerprint;
  return finish(std::move(state), orchestration_ns, evaluation_ns);
}

void Gate::resolve_conditions(const ScenarioSpec& spec) {
  outcomes_.clear();
  outcomes_.reserve(spec.conditions.size());
  for (const auto& c : spec.conditions) {
    ConditionOutcome o;
    o.condition_id = c.condition_id.str();
    o.evidence_id = c.evidence_id.str();
    o.required = c.required;
    const EvidenceRecord* record = evidence_.find(o.evidence_id);
    if (!record || !record->available()) {
      // Absent evidence cannot satisfy an optional condition and must not
      // block on it either.
      o.result = c.required ? TriState::Indeterminate : TriState::False;
      o.note = c.required ? "evidence unavailable" : "optional evidence unavailable";
    } else {
      o.result = comparator_.compare(c.comparator, record->value, c.expected);
      if (o.result == TriState::Indeterminate) o.note = "comparison indeterminate";
    }
    outcomes_.push_back(std::move(o));
  }
}

GateState Gate::fail_run(ErrorCode code, std::string reason, std::vector<std::string> subjects,
                         std::uint64_t orchestration_ns) {
  GateState state;
  state.phase = GatePhase::failed;
  state.error = code;
  state.reason = std::move(reason);
  state.subjects = std::move(subjects);
  state.budget_exceeded = evidence_.budget_exceeded;
  state.spec_hash = runpack_ ? runpack_->spec_hash() : "";

  // A recorder that refused an append is not trustworthy enough to seal.
  const bool recorder_fault = code == ErrorCode::post_seal_append ||
                              code == ErrorCode::lifecycle_violation;
  if (runpack_ && !recorder_fault) {
    jsonlite::Object payload;
    payload["phase"] = "failed";
    payload["error"] = to_string(code);
    payload["reason"] = state.reason;
    payload["subjects"] = string_array(state.subjects);
    payload["budget_exceeded"] = state.budget_exceeded;
    GateError err;
    std::optional<std::string> fingerprint;
    if (runpack_->append(StepKind::failed, jsonlite::Value{std::move(payload)}, &err)) {
      fingerprint = runpack_->seal(&err);
    }
    if (fingerprint) {
      state.fingerprint = *fingerprint;
    } else {
      runpack_.reset();
    }
  } else {
    runpack_.reset();
  }
  return finish(std::move(state), orchestration_ns, 0);
}

GateState Gate::finish(GateState state, std::uint64_t orchestration_ns, std::uint64_t evaluation_ns) {
  state_ = std::move(state);

  GateEvent ev;
  ev.scenario_id = spec_ ? spec_->scenario_id.str() : "";
  ev.spec_hash = state_.spec_hash;
  ev.fingerprint = state_.fingerprint;
  ev.phase = to_string(state_.phase);
  ev.outcome = to_string(state_.outcome);
  ev.error_code = to_string(state_.error);
  ev.duration_ns = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                                  std::chrono::steady_clock::now() - started_at_)
                                                  .count());
  ev.orchestration_ns = orchestration_ns;
  ev.evaluation_ns = evaluation_ns;
  ev.evidence_count = evidence_.records.size();
  for (const auto& r : evidence_.records) {
    if (!r.available()) ++ev.evidence_missing;
    if (r.status == EvidenceStatus::timeout) ++ev.provider_timeouts;
  }
  ev.provider_retries = evidence_.total_retries;
  ev.peak_inflight = evidence_.peak_inflight;
  ev.budget_exceeded = state_.budget_exceeded;
  ev.runpack_steps = runpack_ ? runpack_->steps().size() : 0;
  emit_gate_event(ev, config_.event_log_path);

  set_phase(state_.phase);
  return state_;
}

}  // namespace dgate
