#include "dgate/orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace dgate {

namespace {

using Clock = std::chrono::steady_clock;

// Upper bound on how long the coordinator sleeps before re-checking the
// caller's cancellation token.
constexpr auto kPollInterval = std::chrono::milliseconds(2);

struct Slot {
  bool dispatched{false};
  bool finalized{false};
  bool worker_done{false};
  Clock::time_point started;
  Clock::time_point deadline;
  EvidenceRecord record;
};

struct FanOutState {
  std::mutex mu;
  std::condition_variable cv;
  std::vector<Slot> slots;
  std::size_t inflight{0};
  std::uint32_t retries{0};
};

std::uint64_t elapsed_ns(Clock::time_point from) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - from).count());
}

// Caller holds st.mu.
void finalize_missing(FanOutState& st, std::size_t i, EvidenceStatus status,
                      ProviderErrorKind error, std::string message) {
  Slot& s = st.slots[i];
  if (s.finalized) return;
  s.finalized = true;
  s.record.status = status;
  s.record.value = EvidenceValue::missing();
  s.record.error = error;
  s.record.error_message = std::move(message);
  if (s.dispatched) {
    s.record.latency_ns = elapsed_ns(s.started);
    --st.inflight;
  }
}

struct WorkerTask {
  std::shared_ptr<FanOutState> state;
  std::size_t index{0};
  std::shared_ptr<IEvidenceProvider> provider;
  EvidenceBinding binding;
  std::uint32_t max_retries{0};
  std::uint64_t backoff_ms{0};
  Clock::time_point deadline;        // per-evidence
  Clock::time_point fetch_deadline;  // min(per-evidence, global)
  CancellationToken abort;
};

ProviderResult invoke(const WorkerTask& task, std::uint32_t attempt) {
  FetchContext ctx{task.fetch_deadline, task.abort, attempt};
  try {
    ProviderResult r = task.provider->fetch(task.binding.evidence_id, task.binding.params, ctx);
    if (r.ok && evidence_nesting(r.value) > kMaxValueNesting) {
      return ProviderResult::failure(ProviderErrorKind::malformed_value,
                                     "value nests deeper than " + std::to_string(kMaxValueNesting) +
                                         " levels");
    }
    return r;
  } catch (const std::exception& e) {
    return ProviderResult::failure(ProviderErrorKind::unreachable,
                                   std::string("provider raised: ") + e.what());
  } catch (...) {
    return ProviderResult::failure(ProviderErrorKind::unreachable, "provider raised a non-standard exception");
  }
}

void run_worker(WorkerTask task) {
  ProviderResult result;
  std::uint32_t attempt = 0;
  for (;;) {
    ++attempt;
    {
      std::lock_guard<std::mutex> lock(task.state->mu);
      task.state->slots[task.index].record.attempts = attempt;
    }
    result = invoke(task, attempt);
    if (result.ok || !is_retryable(result.error) || attempt > task.max_retries) break;
    if (task.abort.cancelled()) break;
    const auto wait = std::chrono::milliseconds(task.backoff_ms * attempt);
    const auto resume_at = Clock::now() + wait;
    if (resume_at >= task.fetch_deadline) break;
    {
      std::lock_guard<std::mutex> lock(task.state->mu);
      ++task.state->retries;
    }
    while (Clock::now() < resume_at && !task.abort.cancelled()) {
      std::this_thread::sleep_for(std::min<Clock::duration>(kPollInterval, resume_at - Clock::now()));
    }
    if (task.abort.cancelled()) break;
  }

  FanOutState& st = *task.state;
  {
    std::lock_guard<std::mutex> lock(st.mu);
    Slot& s = st.slots[task.index];
    s.worker_done = true;
    if (!s.finalized) {
      if (Clock::now() > s.deadline) {
        finalize_missing(st, task.index, EvidenceStatus::timeout, ProviderErrorKind::timeout,
                         "provider answered after its deadline");
      } else if (result.ok) {
        s.finalized = true;
        s.record.status = EvidenceStatus::ok;
        s.record.value = std::move(result.value);
        s.record.latency_ns = elapsed_ns(s.started);
        --st.inflight;
      } else {
        finalize_missing(st, task.index,
                         result.error == ProviderErrorKind::timeout ? EvidenceStatus::timeout
                                                                    : EvidenceStatus::provider_error,
                         result.error, std::move(result.message));
      }
    }
  }
  st.cv.notify_all();
}

bool all_finalized(const FanOutState& st) {
  for (const auto& s : st.slots) {
    if (!s.finalized) return false;
  }
  return true;
}

}  // namespace

std::string to_string(EvidenceStatus status) {
  switch (status) {
    case EvidenceStatus::ok: return "ok";
    case EvidenceStatus::timeout: return "timeout";
    case EvidenceStatus::budget_exceeded: return "budget_exceeded";
    case EvidenceStatus::cancelled: return "cancelled";
    case EvidenceStatus::provider_error: return "provider_error";
    case EvidenceStatus::unconfigured: return "unconfigured";
  }
  return "provider_error";
}

jsonlite::Value evidence_record_to_json(const EvidenceRecord& record) {
  jsonlite::Object o;
  o["evidence_id"] = record.evidence_id.str();
  o["provider_id"] = record.provider_id.str();
  o["status"] = to_string(record.status);
  o["value"] = evidence_to_json(record.value);
  if (record.error != ProviderErrorKind::none) o["error"] = to_string(record.error);
  if (!record.error_message.empty()) o["message"] = record.error_message;
  // Attempt counts of abandoned fetches depend on timing.
  if (record.status == EvidenceStatus::ok || record.status == EvidenceStatus::provider_error) {
    o["attempts"] = jsonlite::number(record.attempts);
  }
  return jsonlite::Value{std::move(o)};
}

OrchestrationOptions OrchestrationOptions::from(const SpecLimits& limits, const EngineConfig& config) {
  OrchestrationOptions o;
  o.max_parallelism = limits.max_parallelism;
  o.provider_timeout_ms = limits.provider_timeout_ms;
  o.global_budget_ms = limits.global_budget_ms;
  o.max_retries = limits.max_retries;
  o.retry_backoff_ms = config.retry_backoff_ms;
  return o;
}

const EvidenceRecord* OrchestrationResult::find(const std::string& evidence_id) const {
  for (const auto& r : records) {
    if (r.evidence_id.str() == evidence_id) return &r;
  }
  return nullptr;
}

EvidenceOrchestrator::EvidenceOrchestrator(const ProviderRegistry& registry,
                                           OrchestrationOptions options)
    : registry_(registry), options_(options) {}

OrchestrationResult EvidenceOrchestrator::gather(const std::vector<EvidenceBinding>& bindings,
                                                 const CancellationToken& cancel) const {
  OrchestrationResult out;
  const auto start = Clock::now();
  const auto global_deadline = start + std::chrono::milliseconds(options_.global_budget_ms);
  const std::size_t max_inflight = options_.max_parallelism == 0 ? 1 : options_.max_parallelism;
  const std::size_t n = bindings.size();

  auto state = std::make_shared<FanOutState>();
  state->slots.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    state->slots[i].record.evidence_id = bindings[i].evidence_id;
    state->slots[i].record.provider_id = bindings[i].provider_id;
  }

  CancellationToken abort;
  std::vector<std::thread> workers(n);
  std::size_t next = 0;

  {
    std::unique_lock<std::mutex> lock(state->mu);
    for (;;) {
      if (cancel.cancelled()) {
        for (std::size_t i = 0; i < n; ++i) {
          finalize_missing(*state, i, EvidenceStatus::cancelled, ProviderErrorKind::none,
                           "evaluation cancelled");
        }
        out.cancelled = true;
        break;
      }

      const auto now = Clock::now();
      for (std::size_t i = 0; i < next; ++i) {
        Slot& s = state->slots[i];
        if (s.dispatched && !s.finalized && now >= s.deadline) {
          finalize_missing(*state, i, EvidenceStatus::timeout, ProviderErrorKind::timeout,
                           "no answer within " +
                               std::to_string(bindings[i].timeout_ms.value_or(options_.provider_timeout_ms)) +
                               " ms");
        }
      }
      if (next == n && all_finalized(*state)) break;

      if (now >= global_deadline) {
        for (std::size_t i = 0; i < n; ++i) {
          finalize_missing(*state, i, EvidenceStatus::budget_exceeded, ProviderErrorKind::none,
                           "global budget of " + std::to_string(options_.global_budget_ms) +
                               " ms exhausted");
        }
        out.budget_exceeded = true;
        break;
      }

      while (next < n && state->inflight < max_inflight) {
        const std::size_t i = next++;
        const EvidenceBinding& binding = bindings[i];
        auto provider = registry_.find(binding.provider_id);
        if (!provider) {
          finalize_missing(*state, i, EvidenceStatus::unconfigured, ProviderErrorKind::none,
                           "provider '" + binding.provider_id.str() + "' is not registered");
          continue;
        }
        Slot& s = state->slots[i];
        s.dispatched = true;
        s.started = Clock::now();
        s.deadline = s.started + std::chrono::milliseconds(
                                     binding.timeout_ms.value_or(options_.provider_timeout_ms));
        ++state->inflight;
        out.peak_inflight = std::max(out.peak_inflight, state->inflight);
        out.dispatch_order.push_back(binding.evidence_id.str());

        WorkerTask task;
        task.state = state;
        task.index = i;
        task.provider = std::move(provider);
        task.binding = binding;
        task.max_retries = binding.max_retries.value_or(options_.max_retries);
        task.backoff_ms = options_.retry_backoff_ms;
        task.deadline = s.deadline;
        task.fetch_deadline = std::min(s.deadline, global_deadline);
        task.abort = abort;
        workers[i] = std::thread(run_worker, std::move(task));
      }
      if (next == n && all_finalized(*state)) break;

      auto wake = std::min(global_deadline, Clock::now() + kPollInterval);
      for (std::size_t i = 0; i < next; ++i) {
        const Slot& s = state->slots[i];
        if (s.dispatched && !s.finalized) wake = std::min(wake, s.deadline);
      }
      state->cv.wait_until(lock, wake);
    }

    out.total_retries = state->retries;
    out.records.reserve(n);
    for (const auto& s : state->slots) out.records.push_back(s.record);
  }

  abort.cancel();
  for (std::size_t i = 0; i < n; ++i) {
    if (!workers[i].joinable()) continue;
    bool done = false;
    {
      std::lock_guard<std::mutex> lock(state->mu);
      done = state->slots[i].worker_done;
    }
    if (done) {
      workers[i].join();
    } else {
      workers[i].detach();
    }
  }

  std::sort(out.records.begin(), out.records.end(),
            [](const EvidenceRecord& a, const EvidenceRecord& b) { return a.evidence_id < b.evidence_id; });
  out.duration_ns = elapsed_ns(start);
  return out;
}

}  // namespace dgate
