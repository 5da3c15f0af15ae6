#include "dgate/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "dgate/jsonlite.hpp"

namespace dgate {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string* out, const char* key, double value, const char* fmt) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), fmt, value);
  *out += key;
  *out += buf;
}

}  // namespace

// ---------------------------------------------------------------------------
// GateEvent
// ---------------------------------------------------------------------------

std::string gate_event_to_json(const GateEvent& ev) {
  jsonlite::Object o;
  o["scenario_id"] = ev.scenario_id;
  o["spec_hash"] = ev.spec_hash;
  o["fingerprint"] = ev.fingerprint;
  o["phase"] = ev.phase;
  o["outcome"] = ev.outcome;
  o["error_code"] = ev.error_code;
  o["duration_ns"] = jsonlite::number(ev.duration_ns);
  o["orchestration_ns"] = jsonlite::number(ev.orchestration_ns);
  o["evaluation_ns"] = jsonlite::number(ev.evaluation_ns);
  o["evidence_count"] = jsonlite::number(ev.evidence_count);
  o["evidence_missing"] = jsonlite::number(ev.evidence_missing);
  o["provider_timeouts"] = jsonlite::number(ev.provider_timeouts);
  o["provider_retries"] = jsonlite::number(ev.provider_retries);
  o["peak_inflight"] = jsonlite::number(ev.peak_inflight);
  o["budget_exceeded"] = ev.budget_exceeded;
  o["runpack_steps"] = jsonlite::number(ev.runpack_steps);
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) counts[i] = buckets_[i].load(std::memory_order_relaxed);

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      // Midpoint of [2^(i-1), 2^i) us; bucket 0 reports 0.5us.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  out += "{\"count\":";
  out += std::to_string(count());
  append_fixed(&out, ",\"mean_us\":", mean_us(), "%.2f");
  append_fixed(&out, ",\"p50_us\":", percentile(0.50), "%.2f");
  append_fixed(&out, ",\"p95_us\":", percentile(0.95), "%.2f");
  append_fixed(&out, ",\"p99_us\":", percentile(0.99), "%.2f");
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_run(const GateEvent& ev) {
  total_runs.fetch_add(1, std::memory_order_relaxed);
  if (ev.phase == "decided") {
    (ev.outcome == "true" ? decided_true : decided_false).fetch_add(1, std::memory_order_relaxed);
  } else if (ev.phase == "blocked") {
    blocked.fetch_add(1, std::memory_order_relaxed);
  } else {
    failed.fetch_add(1, std::memory_order_relaxed);
    if (ev.error_code == "cancelled") cancelled.fetch_add(1, std::memory_order_relaxed);
  }
  evidence_fetched.fetch_add(ev.evidence_count - ev.evidence_missing, std::memory_order_relaxed);
  evidence_missing.fetch_add(ev.evidence_missing, std::memory_order_relaxed);
  provider_timeouts.fetch_add(ev.provider_timeouts, std::memory_order_relaxed);
  provider_retries.fetch_add(ev.provider_retries, std::memory_order_relaxed);
  if (ev.budget_exceeded) budget_overruns.fetch_add(1, std::memory_order_relaxed);
  if (!ev.fingerprint.empty()) runpacks_sealed.fetch_add(1, std::memory_order_relaxed);

  latency_histogram.record(ev.duration_ns);

  if (!ev.error_code.empty()) {
    std::lock_guard<std::mutex> lk(failure_mu_);
    ++failure_categories_[ev.error_code];
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

void EngineStats::record_verification(bool ok) {
  verifications.fetch_add(1, std::memory_order_relaxed);
  if (!ok) verification_failures.fetch_add(1, std::memory_order_relaxed);
}

uint64_t EngineStats::failures_for(const std::string& error_code) const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  auto it = failure_categories_.find(error_code);
  return it == failure_categories_.end() ? 0 : it->second;
}

std::vector<GateEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  // Oldest first.
  std::vector<GateEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::string EngineStats::to_json() const {
  auto load = [](const std::atomic<uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };
  std::string out;
  out.reserve(768);
  out += "{\"runs\":{\"total\":" + load(total_runs);
  out += ",\"decided_true\":" + load(decided_true);
  out += ",\"decided_false\":" + load(decided_false);
  out += ",\"blocked\":" + load(blocked);
  out += ",\"failed\":" + load(failed);
  out += ",\"cancelled\":" + load(cancelled);
  out += "},\"evidence\":{\"fetched\":" + load(evidence_fetched);
  out += ",\"missing\":" + load(evidence_missing);
  out += ",\"provider_timeouts\":" + load(provider_timeouts);
  out += ",\"provider_retries\":" + load(provider_retries);
  out += ",\"budget_overruns\":" + load(budget_overruns);
  out += "},\"runpacks\":{\"sealed\":" + load(runpacks_sealed);
  out += ",\"verifications\":" + load(verifications);
  out += ",\"verification_failures\":" + load(verification_failures);
  out += "},\"latency\":" + latency_histogram.to_json();
  out += ",\"failure_categories\":{";
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    bool first = true;
    for (const auto& [code, count] : failure_categories_) {
      if (!first) out += ",";
      first = false;
      out += "\"" + jsonlite::escape(code) + "\":" + std::to_string(count);
    }
  }
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

namespace {
std::atomic<GateEventHook> g_event_hook{nullptr};
}

void set_gate_event_hook(GateEventHook hook) { g_event_hook.store(hook, std::memory_order_release); }

void emit_gate_event(const GateEvent& ev, const std::string& log_path) {
  global_engine_stats().record_run(ev);

  GateEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  std::string path = log_path;
  if (path.empty()) {
    const char* env = std::getenv("DGATE_EVENT_LOG");
    if (env) path = env;
  }
  if (path.empty()) return;

  const std::string line = gate_event_to_json(ev) + "\n";
  // O_APPEND writes below PIPE_BUF are atomic on POSIX.
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace dgate
