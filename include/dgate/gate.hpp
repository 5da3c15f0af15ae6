#pragma once

// dgate/gate.hpp — Gate engine: the evaluation state machine.
//
//   Pending --start(spec)--> Evaluating --> Decided(true|false)
//      |                          |------> Blocked(reason)
//      |                          '------> Failed(error)
//      '--invalid spec--> Failed(spec_invalid | spec_over_limit)
//
// DESIGN INVARIANTS:
//   1. Only the gate drives transitions. The single external lever is
//      cancel(), which is cooperative: it is observed by in-flight provider
//      fetches and checked between orchestration and evaluation, and it ends
//      in Failed(cancelled).
//   2. Terminal states are final. A second start() is answered with
//      lifecycle_violation and leaves the gate untouched.
//   3. Provider failures never fail the gate. They become Missing evidence
//      and flow through the tri-state algebra.
//   4. Evaluation after the join point is sequential: conditions in
//      declaration order, then the requirement tree, then the runpack. The
//      same spec and the same evidence always give the same state, plan and
//      fingerprint.
//   5. Every run that reaches Evaluating and is not cancelled seals a
//      runpack whose last step is decided, blocked or failed. Cancelled runs
//      and invalid specs produce no runpack.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dgate/comparator.hpp"
#include "dgate/config.hpp"
#include "dgate/orchestrator.hpp"
#include "dgate/provider.hpp"
#include "dgate/requirement.hpp"
#include "dgate/runpack.hpp"
#include "dgate/spec.hpp"
#include "dgate/types.hpp"

namespace dgate {

enum class GatePhase { pending, evaluating, decided, blocked, failed };

std::string to_string(GatePhase phase);

struct GateState {
  GatePhase phase{GatePhase::pending};
  TriState outcome{TriState::Indeterminate};  // True/False once decided
  std::string reason;
  ErrorCode error{ErrorCode::none};
  std::vector<std::string> subjects;  // condition/evidence ids responsible
  bool budget_exceeded{false};
  std::string spec_hash;
  std::string fingerprint;  // empty when no runpack was sealed

  bool terminal() const {
    return phase == GatePhase::decided || phase == GatePhase::blocked || phase == GatePhase::failed;
  }
};

std::string gate_state_to_json(const GateState& state);

// Per-condition result, in declaration order.
struct ConditionOutcome {
  std::string condition_id;
  std::string evidence_id;
  bool required{true};
  TriState result{TriState::Indeterminate};
  std::string note;  // why the result is Indeterminate/False without a comparison
};

class Gate {
 public:
  Gate(EngineConfig config, const ProviderRegistry& providers,
       OperatorTable operators = OperatorTable::standard());

  Gate(const Gate&) = delete;
  Gate& operator=(const Gate&) = delete;

  GateState start(const std::string& spec_json);
  GateState start(const ScenarioSpec& spec);

  // Thread-safe. No effect once the gate is terminal.
  void cancel();

  // Safe to poll from other threads while start() runs.
  GatePhase phase() const { return phase_.load(std::memory_order_acquire); }

  // The accessors below are valid once start() has returned.
  const GateState& state() const { return state_; }
  const std::vector<ConditionOutcome>& conditions() const { return outcomes_; }
  const OrchestrationResult& evidence() const { return evidence_; }
  const Evaluation& evaluation() const { return evaluation_; }
  const std::optional<ScenarioSpec>& spec() const { return spec_; }

  // Sealed pack of a finished, non-cancelled run. Moves it out.
  std::optional<Runpack> take_runpack();

 private:
  GateState run(const ScenarioSpec& spec);
  GateState finish(GateState state, std::uint64_t orchestration_ns, std::uint64_t evaluation_ns);
  GateState fail_run(ErrorCode code, std::string reason, std::vector<std::string> subjects,
                     std::uint64_t orchestration_ns);
  void resolve_conditions(const ScenarioSpec& spec);
  void set_phase(GatePhase p) { phase_.store(p, std::memory_order_release); }

  EngineConfig config_;
  const ProviderRegistry& providers_;
  Comparator comparator_;
  OperatorTable operators_;
  CancellationToken cancel_;

  std::atomic<GatePhase> phase_{GatePhase::pending};
  std::chrono::steady_clock::time_point started_at_;
  GateState state_;
  std::optional<ScenarioSpec> spec_;
  OrchestrationResult evidence_;
  std::vector<ConditionOutcome> outcomes_;
  Evaluation evaluation_;
  std::optional<Runpack> runpack_;
};

}  // namespace dgate
