#include "dgate/provider.hpp"

#include <utility>

namespace dgate {

std::string to_string(ProviderErrorKind kind) {
  switch (kind) {
    case ProviderErrorKind::none: return "";
    case ProviderErrorKind::timeout: return "timeout";
    case ProviderErrorKind::unreachable: return "unreachable";
    case ProviderErrorKind::invalid_params: return "invalid_params";
    case ProviderErrorKind::denied: return "denied";
    case ProviderErrorKind::malformed_value: return "malformed_value";
  }
  return "";
}

bool ProviderRegistry::register_provider(const ProviderId& id,
                                         std::shared_ptr<IEvidenceProvider> provider) {
  if (!provider || id.empty()) return false;
  return providers_.emplace(id.str(), std::move(provider)).second;
}

std::shared_ptr<IEvidenceProvider> ProviderRegistry::find(const ProviderId& id) const {
  auto it = providers_.find(id.str());
  return it == providers_.end() ? nullptr : it->second;
}

void StaticEvidenceProvider::set(const std::string& key, EvidenceValue value) {
  std::lock_guard<std::mutex> lock(mu_);
  values_[key] = std::move(value);
}

std::size_t StaticEvidenceProvider::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return values_.size();
}

ProviderResult StaticEvidenceProvider::fetch(const EvidenceId& evidence_id,
                                             const jsonlite::Object& params,
                                             const FetchContext& ctx) {
  (void)ctx;
  std::string key = evidence_id.str();
  if (const auto* k = jsonlite::find(params, "key")) {
    const auto* s = std::get_if<std::string>(&k->v);
    if (!s) return ProviderResult::failure(ProviderErrorKind::invalid_params, "params.key must be a string");
    key = *s;
  }
  std::lock_guard<std::mutex> lock(mu_);
  auto it = values_.find(key);
  if (it == values_.end()) {
    return ProviderResult::failure(ProviderErrorKind::invalid_params, "no static value for key");
  }
  return ProviderResult::success(it->second);
}

}  // namespace dgate
