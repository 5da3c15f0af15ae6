#pragma once

// dgate/orchestrator.hpp — Concurrent evidence fan-out.
//
// CONCURRENCY MODEL:
//   One worker thread per declared evidence binding, dispatched in declaration
//   order, with at most max_parallelism in flight. The calling thread is the
//   coordinator: it dispatches, watches deadlines and joins results. Workers
//   share nothing mutable except a FanOutState slot they fill exactly once
//   under its mutex; the coordinator copies the slots into an owned result
//   after the join point.
//
// TIMEOUT SEMANTICS (both soft):
//   - Per evidence: a deadline covering every attempt of that binding. When
//     it passes the record becomes Missing/timeout and the slot is released,
//     even if the provider never returns. Late answers are discarded.
//   - Global budget: when the whole fan-out exceeds it, every pending and
//     undispatched binding becomes Missing/budget_exceeded, the remaining
//     workers are cancelled, and gather() returns with budget_exceeded set.
//
// Retries cover only transient errors (timeout, unreachable), back off
// linearly (attempt * retry_backoff_ms) and never start past the deadline.
//
// Answers whose value nests deeper than kMaxValueNesting are recorded as
// provider_error/malformed_value.
//
// Workers that ignore their deadline are detached rather than joined. They
// hold shared ownership of everything they touch, so detaching is safe.
//
// max_parallelism bounds live fetches, not threads. A timed-out fetch frees
// its slot while its abandoned worker may still be running, so the thread
// count can reach the number of bindings when providers hang.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "dgate/provider.hpp"
#include "dgate/spec.hpp"

namespace dgate {

enum class EvidenceStatus { ok, timeout, budget_exceeded, cancelled, provider_error, unconfigured };

std::string to_string(EvidenceStatus status);

struct EvidenceRecord {
  EvidenceId evidence_id;
  ProviderId provider_id;
  EvidenceValue value;  // Missing unless status == ok
  EvidenceStatus status{EvidenceStatus::ok};
  ProviderErrorKind error{ProviderErrorKind::none};
  std::string error_message;
  std::uint32_t attempts{0};
  std::uint64_t latency_ns{0};

  bool available() const { return status == EvidenceStatus::ok && !value.is_missing(); }
};

// Deterministic fields only: latency is left out so identical runs produce
// identical runpacks.
jsonlite::Value evidence_record_to_json(const EvidenceRecord& record);

struct OrchestrationOptions {
  std::uint32_t max_parallelism{8};
  std::uint64_t provider_timeout_ms{2000};
  std::uint64_t global_budget_ms{10000};
  std::uint32_t max_retries{0};
  std::uint64_t retry_backoff_ms{25};

  static OrchestrationOptions from(const SpecLimits& limits, const EngineConfig& config);
};

struct OrchestrationResult {
  std::vector<EvidenceRecord> records;       // sorted by evidence id
  std::vector<std::string> dispatch_order;   // evidence ids in invocation order
  bool budget_exceeded{false};
  bool cancelled{false};
  std::size_t peak_inflight{0};
  std::uint32_t total_retries{0};
  std::uint64_t duration_ns{0};

  const EvidenceRecord* find(const std::string& evidence_id) const;
};

class EvidenceOrchestrator {
 public:
  EvidenceOrchestrator(const ProviderRegistry& registry, OrchestrationOptions options);

  // Blocks until every binding has a record or the budget or cancellation
  // ends the fan-out. Always returns exactly one record per binding.
  OrchestrationResult gather(const std::vector<EvidenceBinding>& bindings,
                             const CancellationToken& cancel) const;

 private:
  const ProviderRegistry& registry_;
  OrchestrationOptions options_;
};

}  // namespace dgate
