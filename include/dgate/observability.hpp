#pragma once

// dgate/observability.hpp — Structured gate-run observability layer.
//
// DESIGN:
//   GateEvent is the canonical observable unit. Every Gate::start() that gets
//   past argument checks emits exactly one GateEvent, which is:
//     - recorded into EngineStats (always),
//     - passed to the registered hook if one is set, otherwise
//     - appended as one JSONL line to the event log (EngineConfig
//       event_log_path, else DGATE_EVENT_LOG), when configured.
//
// INVARIANT: events carry ids, digests, counts and timings only. Evidence
// values and provider params never reach the event stream.
//
// EXTENSION_POINT: exporter
//   Register a hook with set_gate_event_hook() to forward events to an
//   external collector. The hook runs on the gate's thread and must not block.

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "dgate/types.hpp"

namespace dgate {

// ---------------------------------------------------------------------------
// GateEvent — per-run observable unit
// ---------------------------------------------------------------------------
struct GateEvent {
  std::string scenario_id;
  std::string spec_hash;
  std::string fingerprint;  // empty when no runpack was sealed

  std::string phase;     // decided | blocked | failed
  std::string outcome;   // true | false | indeterminate
  std::string error_code;

  // Duration breakdown (nanoseconds)
  uint64_t duration_ns{0};
  uint64_t orchestration_ns{0};
  uint64_t evaluation_ns{0};

  // Evidence accounting
  size_t evidence_count{0};
  size_t evidence_missing{0};
  size_t provider_timeouts{0};
  uint32_t provider_retries{0};
  size_t peak_inflight{0};
  bool budget_exceeded{false};

  size_t runpack_steps{0};
};

std::string gate_event_to_json(const GateEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
// Bucket boundaries are fixed; readers may have serialized them.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0]. 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  // Separate cache lines: buckets are hit by every run, count_/sum_us_ too.
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats — process-wide aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the failure map and ring buffer use
// mutexes. Counters only grow, so tests compare before/after deltas.
class EngineStats {
 public:
  void record_run(const GateEvent& ev);
  void record_verification(bool ok);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> total_runs{0};
  alignas(64) std::atomic<uint64_t> decided_true{0};
  alignas(64) std::atomic<uint64_t> decided_false{0};
  alignas(64) std::atomic<uint64_t> blocked{0};
  alignas(64) std::atomic<uint64_t> failed{0};
  alignas(64) std::atomic<uint64_t> cancelled{0};

  alignas(64) std::atomic<uint64_t> evidence_fetched{0};
  alignas(64) std::atomic<uint64_t> evidence_missing{0};
  alignas(64) std::atomic<uint64_t> provider_timeouts{0};
  alignas(64) std::atomic<uint64_t> provider_retries{0};
  alignas(64) std::atomic<uint64_t> budget_overruns{0};

  alignas(64) std::atomic<uint64_t> runpacks_sealed{0};
  alignas(64) std::atomic<uint64_t> verifications{0};
  alignas(64) std::atomic<uint64_t> verification_failures{0};

  LatencyHistogram latency_histogram;

  uint64_t failures_for(const std::string& error_code) const;

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<GateEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, uint64_t> failure_categories_;

  mutable std::mutex ring_mu_;
  std::vector<GateEvent> ring_buffer_;
  size_t ring_head_{0};  // next slot to overwrite once full
};

EngineStats& global_engine_stats();

// Fire-and-forget. log_path overrides DGATE_EVENT_LOG when non-empty.
void emit_gate_event(const GateEvent& ev, const std::string& log_path = "");

using GateEventHook = void (*)(const GateEvent&);
void set_gate_event_hook(GateEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace dgate
