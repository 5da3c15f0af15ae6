#include "dgate/config.hpp"

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <map>
#include <optional>
#include <utility>

#include "dgate/jsonlite.hpp"

namespace dgate {

namespace {

bool parse_u64(const char* text, std::uint64_t* out) {
  if (!text || !*text) return false;
  std::uint64_t v = 0;
  for (const char* p = text; *p; ++p) {
    if (*p < '0' || *p > '9') return false;
    const std::uint64_t digit = static_cast<std::uint64_t>(*p - '0');
    if (v > (UINT64_MAX - digit) / 10) return false;
    v = v * 10 + digit;
  }
  *out = v;
  return true;
}

using Setter = std::function<bool(EngineConfig*, std::uint64_t)>;

template <typename Field>
Setter setter(Field EngineConfig::*member) {
  return [member](EngineConfig* c, std::uint64_t v) {
    if (v > static_cast<std::uint64_t>(static_cast<Field>(-1))) return false;
    c->*member = static_cast<Field>(v);
    return true;
  };
}

const std::map<std::string, Setter>& numeric_fields() {
  static const std::map<std::string, Setter> kFields = {
      {"default_max_parallelism", setter(&EngineConfig::default_max_parallelism)},
      {"default_provider_timeout_ms", setter(&EngineConfig::default_provider_timeout_ms)},
      {"default_global_budget_ms", setter(&EngineConfig::default_global_budget_ms)},
      {"default_max_retries", setter(&EngineConfig::default_max_retries)},
      {"retry_backoff_ms", setter(&EngineConfig::retry_backoff_ms)},
      {"max_evidence_cap", setter(&EngineConfig::max_evidence_cap)},
      {"max_conditions_cap", setter(&EngineConfig::max_conditions_cap)},
      {"max_depth_cap", setter(&EngineConfig::max_depth_cap)},
      {"max_nodes_cap", setter(&EngineConfig::max_nodes_cap)},
      {"max_retries_cap", setter(&EngineConfig::max_retries_cap)},
      {"max_parallelism_cap", setter(&EngineConfig::max_parallelism_cap)},
      {"max_provider_timeout_ms", setter(&EngineConfig::max_provider_timeout_ms)},
      {"max_global_budget_ms", setter(&EngineConfig::max_global_budget_ms)},
      {"max_spec_bytes", setter(&EngineConfig::max_spec_bytes)},
  };
  return kFields;
}

}  // namespace

std::vector<std::string> validate_engine_config(const EngineConfig& c) {
  std::vector<std::string> errors;
  if (c.default_max_parallelism == 0) errors.push_back("default_max_parallelism must be >= 1");
  if (c.default_max_parallelism > c.max_parallelism_cap) {
    errors.push_back("default_max_parallelism exceeds max_parallelism_cap");
  }
  if (c.default_provider_timeout_ms == 0) errors.push_back("default_provider_timeout_ms must be >= 1");
  if (c.default_provider_timeout_ms > c.max_provider_timeout_ms) {
    errors.push_back("default_provider_timeout_ms exceeds max_provider_timeout_ms");
  }
  if (c.default_global_budget_ms == 0) errors.push_back("default_global_budget_ms must be >= 1");
  if (c.default_global_budget_ms > c.max_global_budget_ms) {
    errors.push_back("default_global_budget_ms exceeds max_global_budget_ms");
  }
  if (c.default_max_retries > c.max_retries_cap) {
    errors.push_back("default_max_retries exceeds max_retries_cap");
  }
  if (c.max_evidence_cap == 0 || c.max_conditions_cap == 0 || c.max_depth_cap == 0 ||
      c.max_nodes_cap == 0) {
    errors.push_back("structural caps must be >= 1");
  }
  if (c.max_depth_cap > kMaxDepthCapCeiling) {
    errors.push_back("max_depth_cap exceeds " + std::to_string(kMaxDepthCapCeiling));
  }
  if (c.max_spec_bytes == 0) errors.push_back("max_spec_bytes must be >= 1");
  return errors;
}

ConfigValidationResult load_engine_config(const std::string& config_json) {
  ConfigValidationResult result;
  result.config_version = kEngineConfigVersion;
  if (config_json.empty()) {
    result.ok = true;
    return result;
  }

  std::optional<jsonlite::JsonError> parse_error;
  const jsonlite::Object obj = jsonlite::parse(config_json, &parse_error);
  if (parse_error) {
    result.errors.push_back(parse_error->code + ": " + parse_error->message);
    return result;
  }

  for (const auto& [key, value] : obj) {
    if (key == "config_version") {
      const auto* s = std::get_if<std::string>(&value.v);
      if (!s) {
        result.errors.push_back("config_version must be a string");
      } else {
        result.config_version = *s;
        if (*s != kEngineConfigVersion) {
          result.warnings.push_back("config_version " + *s + " is not " + kEngineConfigVersion);
        }
      }
      continue;
    }
    if (key == "event_log_path") {
      const auto* s = std::get_if<std::string>(&value.v);
      if (!s) {
        result.errors.push_back("event_log_path must be a string");
      } else {
        result.config.event_log_path = *s;
      }
      continue;
    }
    auto it = numeric_fields().find(key);
    if (it == numeric_fields().end()) {
      result.warnings.push_back("unknown config key: " + key);
      continue;
    }
    bool ok = true;
    const auto v = jsonlite::get_u64(obj, key, 0, &ok);
    if (!ok || !it->second(&result.config, v)) {
      result.errors.push_back(key + " must be a non-negative integer in range");
    }
  }

  for (auto& e : validate_engine_config(result.config)) result.errors.push_back(std::move(e));
  result.ok = result.errors.empty();
  return result;
}

void apply_env_overrides(EngineConfig* config, std::vector<std::string>* warnings) {
  static const std::pair<const char*, const char*> kEnv[] = {
      {"DGATE_MAX_PARALLELISM", "default_max_parallelism"},
      {"DGATE_PROVIDER_TIMEOUT_MS", "default_provider_timeout_ms"},
      {"DGATE_GLOBAL_BUDGET_MS", "default_global_budget_ms"},
      {"DGATE_MAX_RETRIES", "default_max_retries"},
      {"DGATE_RETRY_BACKOFF_MS", "retry_backoff_ms"},
  };
  for (const auto& [var, field] : kEnv) {
    const char* raw = std::getenv(var);
    if (!raw) continue;
    std::uint64_t v = 0;
    if (!parse_u64(raw, &v) || !numeric_fields().at(field)(config, v)) {
      if (warnings) warnings->push_back(std::string("ignoring malformed ") + var);
    }
  }
  if (const char* path = std::getenv("DGATE_EVENT_LOG")) config->event_log_path = path;
}

std::string engine_config_to_json(const EngineConfig& c) {
  jsonlite::Object o;
  o["config_version"] = kEngineConfigVersion;
  o["default_max_parallelism"] = jsonlite::number(c.default_max_parallelism);
  o["default_provider_timeout_ms"] = jsonlite::number(c.default_provider_timeout_ms);
  o["default_global_budget_ms"] = jsonlite::number(c.default_global_budget_ms);
  o["default_max_retries"] = jsonlite::number(c.default_max_retries);
  o["retry_backoff_ms"] = jsonlite::number(c.retry_backoff_ms);
  o["max_evidence_cap"] = jsonlite::number(c.max_evidence_cap);
  o["max_conditions_cap"] = jsonlite::number(c.max_conditions_cap);
  o["max_depth_cap"] = jsonlite::number(c.max_depth_cap);
  o["max_nodes_cap"] = jsonlite::number(c.max_nodes_cap);
  o["max_retries_cap"] = jsonlite::number(c.max_retries_cap);
  o["max_parallelism_cap"] = jsonlite::number(c.max_parallelism_cap);
  o["max_provider_timeout_ms"] = jsonlite::number(c.max_provider_timeout_ms);
  o["max_global_budget_ms"] = jsonlite::number(c.max_global_budget_ms);
  o["max_spec_bytes"] = jsonlite::number(c.max_spec_bytes);
  o["event_log_path"] = c.event_log_path;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace dgate
