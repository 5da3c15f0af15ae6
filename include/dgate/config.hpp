#pragma once

// dgate/config.hpp — Engine configuration.
//
// EngineConfig is an explicit value handed to the Gate at construction. There
// is no process-wide configuration singleton: two gates built from different
// configs never observe each other's settings.
//
// Load order: built-in defaults <- JSON document <- DGATE_* environment.
//
// Environment overrides:
//   DGATE_MAX_PARALLELISM        default fan-out width
//   DGATE_PROVIDER_TIMEOUT_MS    default per-evidence timeout
//   DGATE_GLOBAL_BUDGET_MS       default whole fan-out budget
//   DGATE_MAX_RETRIES            default retry count
//   DGATE_RETRY_BACKOFF_MS       linear backoff step between attempts
//   DGATE_EVENT_LOG              GateEvent JSONL sink path

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dgate {

constexpr const char* kEngineConfigVersion = "1";

// Upper bound for max_depth_cap. Runpacks embed the requirement tree at three
// JSON levels per tree level and must stay within the parser's nesting limit.
constexpr std::uint32_t kMaxDepthCapCeiling = 64;

struct EngineConfig {
  // Defaults applied to specs that omit "limits".
  std::uint32_t default_max_parallelism{8};
  std::uint64_t default_provider_timeout_ms{2000};
  std::uint64_t default_global_budget_ms{10000};
  std::uint32_t default_max_retries{0};
  std::uint64_t retry_backoff_ms{25};

  // Hard caps. A spec asking for more is rejected with spec_over_limit.
  // max_depth_cap may not exceed kMaxDepthCapCeiling.
  std::uint32_t max_evidence_cap{256};
  std::uint32_t max_conditions_cap{512};
  std::uint32_t max_depth_cap{64};
  std::uint32_t max_nodes_cap{4096};
  std::uint32_t max_retries_cap{5};
  std::uint32_t max_parallelism_cap{64};
  std::uint64_t max_provider_timeout_ms{60000};
  std::uint64_t max_global_budget_ms{300000};
  std::size_t max_spec_bytes{1024 * 1024};

  std::string event_log_path;
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  EngineConfig config;
};

// Parses a JSON object of EngineConfig fields (snake_case names as above plus
// "config_version"). Unknown keys are warnings, wrong types and inconsistent
// values (a default above its cap, zero parallelism) are errors. An empty
// string yields the defaults.
ConfigValidationResult load_engine_config(const std::string& config_json);

// Applies DGATE_* variables in place. Malformed values are skipped with a
// warning appended to *warnings when non-null.
void apply_env_overrides(EngineConfig* config, std::vector<std::string>* warnings = nullptr);

// Cross-field checks shared by load_engine_config() and callers that build
// configs in code.
std::vector<std::string> validate_engine_config(const EngineConfig& config);

std::string engine_config_to_json(const EngineConfig& config);

}  // namespace dgate
