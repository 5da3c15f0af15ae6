#pragma once

// dgate/provider.hpp — Evidence provider contract and registry.
//
// DESIGN INVARIANTS:
//   1. The engine depends only on IEvidenceProvider. Concrete transports
//      (HTTP, file path extraction, environment, clock) live outside the core.
//   2. fetch() may be invoked concurrently from several orchestration threads,
//      once per evidence id bound to the provider. Implementations must be
//      thread-safe and must never throw on malformed params: they answer
//      ProviderErrorKind::invalid_params instead.
//   3. ProviderRegistry is a value owned by whoever builds the Gate. There is
//      no global registry, so isolated evaluations never share providers
//      unless the caller hands the same instance to both.
//
// EXTENSION_POINT: provider_backends
//   Implement IEvidenceProvider and register it under a ProviderId. The
//   provider should honor FetchContext::deadline and FetchContext::cancel;
//   the orchestrator stops waiting at the deadline either way.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "dgate/jsonlite.hpp"
#include "dgate/types.hpp"

namespace dgate {

// Shared cancellation flag. Copies observe the same flag.
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true, std::memory_order_release); }
  bool cancelled() const { return flag_->load(std::memory_order_acquire); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

struct FetchContext {
  std::chrono::steady_clock::time_point deadline;
  CancellationToken cancel;
  std::uint32_t attempt{1};  // 1-based

  bool expired() const {
    return cancel.cancelled() || std::chrono::steady_clock::now() >= deadline;
  }
};

// malformed_value: the provider answered with a value nested deeper than
// kMaxValueNesting. Set by the orchestrator, never retried.
enum class ProviderErrorKind { none, timeout, unreachable, invalid_params, denied, malformed_value };

std::string to_string(ProviderErrorKind kind);

// Only timeout and unreachable are transient.
inline bool is_retryable(ProviderErrorKind kind) {
  return kind == ProviderErrorKind::timeout || kind == ProviderErrorKind::unreachable;
}

struct ProviderResult {
  bool ok{false};
  EvidenceValue value;
  ProviderErrorKind error{ProviderErrorKind::none};
  std::string message;

  static ProviderResult success(EvidenceValue v) {
    ProviderResult r;
    r.ok = true;
    r.value = std::move(v);
    return r;
  }
  static ProviderResult failure(ProviderErrorKind kind, std::string message) {
    ProviderResult r;
    r.error = kind;
    r.message = std::move(message);
    return r;
  }
};

class IEvidenceProvider {
 public:
  virtual ~IEvidenceProvider() = default;

  virtual ProviderResult fetch(const EvidenceId& evidence_id, const jsonlite::Object& params,
                               const FetchContext& ctx) = 0;
  virtual std::string provider_kind() const = 0;
};

class ProviderRegistry {
 public:
  // False when the id is already registered or the provider is null.
  bool register_provider(const ProviderId& id, std::shared_ptr<IEvidenceProvider> provider);
  std::shared_ptr<IEvidenceProvider> find(const ProviderId& id) const;
  bool contains(const ProviderId& id) const { return providers_.count(id.str()) != 0; }
  std::size_t size() const { return providers_.size(); }

 private:
  std::map<std::string, std::shared_ptr<IEvidenceProvider>> providers_;
};

// ---------------------------------------------------------------------------
// StaticEvidenceProvider — fixed values held in memory
// ---------------------------------------------------------------------------
// Looks up params["key"] when present (must be a string), else the evidence
// id. Unknown keys answer invalid_params.
class StaticEvidenceProvider : public IEvidenceProvider {
 public:
  StaticEvidenceProvider() = default;

  void set(const std::string& key, EvidenceValue value);
  std::size_t size() const;

  ProviderResult fetch(const EvidenceId& evidence_id, const jsonlite::Object& params,
                       const FetchContext& ctx) override;
  std::string provider_kind() const override { return "static"; }

 private:
  mutable std::mutex mu_;
  std::map<std::string, EvidenceValue> values_;
};

// Adapts a callable. Used for embedding hosts and tests.
class FunctionEvidenceProvider : public IEvidenceProvider {
 public:
  using Fn = std::function<ProviderResult(const EvidenceId&, const jsonlite::Object&,
                                          const FetchContext&)>;

  explicit FunctionEvidenceProvider(Fn fn, std::string kind = "function")
      : fn_(std::move(fn)), kind_(std::move(kind)) {}

  ProviderResult fetch(const EvidenceId& evidence_id, const jsonlite::Object& params,
                       const FetchContext& ctx) override {
    return fn_(evidence_id, params, ctx);
  }
  std::string provider_kind() const override { return kind_; }

 private:
  Fn fn_;
  std::string kind_;
};

}  // namespace dgate
