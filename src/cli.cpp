#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "dgate/config.hpp"
#include "dgate/gate.hpp"
#include "dgate/hash.hpp"
#include "dgate/jsonlite.hpp"
#include "dgate/observability.hpp"
#include "dgate/provider.hpp"
#include "dgate/runpack.hpp"
#include "dgate/spec.hpp"
#include "dgate/version.hpp"

namespace {

// Exit codes
constexpr int kExitOk = 0;        // decided true, or a command that succeeded
constexpr int kExitFalse = 1;     // decided false, or verification failed
constexpr int kExitBlocked = 2;
constexpr int kExitFailed = 3;    // failed run, bad input or usage

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out->assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

bool write_file(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return false;
  ofs << data;
  return static_cast<bool>(ofs);
}

int print_error(const std::string& code, const std::string& message) {
  std::cerr << "{\"error\":\"" << dgate::jsonlite::escape(code) << "\",\"message\":\""
            << dgate::jsonlite::escape(message) << "\"}\n";
  return kExitFailed;
}

int usage() {
  std::cerr << "usage: dgate [--config <engine.json>] <command>\n"
               "  version\n"
               "  validate <spec.json>\n"
               "  run <spec.json> <evidence.json> [runpack_out.json] [--explain]\n"
               "  verify <runpack.json>\n";
  return kExitFailed;
}

// Engine config: optional JSON file, then DGATE_* environment overrides.
std::optional<dgate::EngineConfig> load_config(const std::string& path) {
  std::string text;
  if (!path.empty() && !read_file(path, &text)) {
    print_error("config_invalid", "cannot read " + path);
    return std::nullopt;
  }
  auto result = dgate::load_engine_config(text);
  for (const auto& w : result.warnings) std::cerr << "warning: " << w << "\n";
  if (!result.ok) {
    std::string joined;
    for (const auto& e : result.errors) joined += (joined.empty() ? "" : "; ") + e;
    print_error("config_invalid", joined);
    return std::nullopt;
  }
  std::vector<std::string> env_warnings;
  dgate::apply_env_overrides(&result.config, &env_warnings);
  for (const auto& w : env_warnings) std::cerr << "warning: " << w << "\n";
  const auto errors = dgate::validate_engine_config(result.config);
  if (!errors.empty()) {
    print_error("config_invalid", errors.front());
    return std::nullopt;
  }
  return result.config;
}

// Evidence fixture: {provider_id: {key: value}} served by static providers.
bool load_fixture(const std::string& text, dgate::ProviderRegistry* registry, std::string* error) {
  std::optional<dgate::jsonlite::JsonError> jerr;
  const auto root = dgate::jsonlite::parse(text, &jerr);
  if (jerr) {
    *error = jerr->code + ": " + jerr->message;
    return false;
  }
  for (const auto& [provider_name, entries] : root) {
    auto provider_id = dgate::ProviderId::parse(provider_name);
    if (!provider_id) {
      *error = "invalid provider id: " + provider_name;
      return false;
    }
    const auto* values = std::get_if<dgate::jsonlite::Object>(&entries.v);
    if (!values) {
      *error = "provider " + provider_name + " must map keys to values";
      return false;
    }
    auto provider = std::make_shared<dgate::StaticEvidenceProvider>();
    for (const auto& [key, raw] : *values) {
      std::string value_error;
      auto value = dgate::evidence_from_json(raw, &value_error);
      if (!value) {
        *error = provider_name + "." + key + ": " + value_error;
        return false;
      }
      provider->set(key, std::move(*value));
    }
    if (!registry->register_provider(*provider_id, provider)) {
      *error = "duplicate provider: " + provider_name;
      return false;
    }
  }
  return true;
}

int exit_code_for(const dgate::GateState& state) {
  switch (state.phase) {
    case dgate::GatePhase::decided:
      return state.outcome == dgate::TriState::True ? kExitOk : kExitFalse;
    case dgate::GatePhase::blocked:
      return kExitBlocked;
    default:
      return kExitFailed;
  }
}

int cmd_validate(const dgate::EngineConfig& config, const std::string& spec_path) {
  std::string text;
  if (!read_file(spec_path, &text)) return print_error("spec_invalid", "cannot read " + spec_path);
  dgate::GateError err;
  auto spec = dgate::load_scenario_spec(text, config, dgate::OperatorTable::standard(), &err);
  if (!spec) {
    std::cout << "{\"ok\":false,\"error\":\"" << dgate::to_string(err.code) << "\",\"message\":\""
              << dgate::jsonlite::escape(err.message) << "\"}\n";
    return kExitFalse;
  }
  std::cout << "{\"ok\":true,\"scenario_id\":\"" << spec->scenario_id.str()
            << "\",\"spec_hash\":\"" << dgate::compute_spec_hash(*spec) << "\"}\n";
  return kExitOk;
}

int cmd_run(const dgate::EngineConfig& config, const std::string& spec_path,
            const std::string& evidence_path, const std::string& out_path, bool explain) {
  std::string spec_text, fixture_text;
  if (!read_file(spec_path, &spec_text)) return print_error("spec_invalid", "cannot read " + spec_path);
  if (!read_file(evidence_path, &fixture_text)) {
    return print_error("provider_error", "cannot read " + evidence_path);
  }
  dgate::ProviderRegistry registry;
  std::string fixture_error;
  if (!load_fixture(fixture_text, &registry, &fixture_error)) {
    return print_error("provider_error", fixture_error);
  }

  dgate::Gate gate(config, registry);
  const auto state = gate.start(spec_text);
  std::cout << dgate::gate_state_to_json(state) << "\n";
  if (explain && state.phase != dgate::GatePhase::failed) {
    std::cerr << dgate::explain_plan(gate.evaluation().plan);
  }

  if (!out_path.empty()) {
    auto pack = gate.take_runpack();
    if (!pack) return print_error("lifecycle_violation", "run produced no runpack");
    if (!write_file(out_path, dgate::runpack_to_json(*pack))) {
      return print_error("store_io", "cannot write " + out_path);
    }
  }
  return exit_code_for(state);
}

int cmd_verify(const std::string& path) {
  std::string text;
  if (!read_file(path, &text)) return print_error("store_io", "cannot read " + path);
  dgate::GateError err;
  auto pack = dgate::runpack_from_json(text, &err);
  if (!pack) {
    std::cout << "{\"ok\":false,\"error\":\"" << dgate::to_string(err.code) << "\",\"message\":\""
              << dgate::jsonlite::escape(err.message) << "\"}\n";
    dgate::global_engine_stats().record_verification(false);
    return kExitFalse;
  }
  const auto result = dgate::verify_runpack(*pack);
  dgate::global_engine_stats().record_verification(result.ok);
  std::cout << "{\"ok\":" << (result.ok ? "true" : "false") << ",\"fingerprint\":\""
            << pack->fingerprint() << "\",\"steps\":" << pack->steps().size();
  if (!result.ok) {
    if (result.first_divergent_index) {
      std::cout << ",\"first_divergent_index\":" << *result.first_divergent_index;
    }
    std::cout << ",\"reason\":\""
              << dgate::jsonlite::escape(result.reason) << "\"";
  }
  std::cout << "}\n";
  return result.ok ? kExitOk : kExitFalse;
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool explain = false;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (a == "--explain") {
      explain = true;
    } else if (a.rfind("--", 0) == 0) {
      std::cerr << "unknown flag: " << a << "\n";
      return usage();
    } else {
      args.push_back(a);
    }
  }
  if (args.empty()) return usage();
  const std::string& cmd = args[0];

  if (cmd == "version") {
    std::cout << dgate::version::manifest_to_json(dgate::version::current_manifest()) << "\n";
    return kExitOk;
  }

  auto config = load_config(config_path);
  if (!config) return kExitFailed;

  if (cmd == "validate" && args.size() == 2) return cmd_validate(*config, args[1]);
  if (cmd == "run" && (args.size() == 3 || args.size() == 4)) {
    return cmd_run(*config, args[1], args[2], args.size() == 4 ? args[3] : "", explain);
  }
  if (cmd == "verify" && args.size() == 2) return cmd_verify(args[1]);
  return usage();
}
