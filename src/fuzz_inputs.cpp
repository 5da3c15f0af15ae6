// fuzz_inputs.cpp — Fuzz harness for every untrusted-input parser.
//
// Build with LLVM libFuzzer:
//   cmake -DDGATE_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++
//   cmake --build build --target dgate_fuzz
//
// Run:
//   ./build/dgate_fuzz corpus/ -max_len=65536 -timeout=5
//
// Targets:
//   1. load_scenario_spec():     spec parser + validator
//   2. parse_requirement_dsl():  requirement text DSL
//   3. canonicalize_json():      JSON canonicalization
//   4. runpack_from_json():      runpack reader + verifier

#include "dgate/config.hpp"
#include "dgate/dsl.hpp"
#include "dgate/jsonlite.hpp"
#include "dgate/requirement.hpp"
#include "dgate/runpack.hpp"
#include "dgate/spec.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Fuzz target 1: Scenario spec
// ---------------------------------------------------------------------------
// Invariants verified:
//   - load_scenario_spec() never crashes and never accepts a spec over its caps.
//   - An accepted spec re-serializes to a canonical form that loads back to
//     the same canonical form.
extern "C" int LLVMFuzzerTestOneInput_Spec(const uint8_t* data, size_t size) {
  static const dgate::EngineConfig config;
  const std::string input(reinterpret_cast<const char*>(data), size);
  dgate::GateError err;
  auto spec = dgate::load_scenario_spec(input, config, dgate::OperatorTable::standard(), &err);
  if (!spec) return 0;
  if (dgate::requirement_depth(spec->requirement) > config.max_depth_cap) {
    __builtin_trap();  // BUG: depth cap not enforced
  }
  const std::string c1 = dgate::spec_to_json(*spec);
  auto again = dgate::load_scenario_spec(c1, config, dgate::OperatorTable::standard(), &err);
  if (!again || dgate::spec_to_json(*again) != c1) {
    __builtin_trap();  // BUG: canonical spec does not reload to itself
  }
  return 0;
}

// ---------------------------------------------------------------------------
// Fuzz target 2: Requirement DSL
// ---------------------------------------------------------------------------
// Invariants verified:
//   - parse_requirement_dsl() never crashes, including on deep nesting.
//   - Accepted trees stay within two tree levels per nesting level, so the
//     builder never rejects them for depth. Group counts are the builder's
//     job and may still fail.
extern "C" int LLVMFuzzerTestOneInput_Dsl(const uint8_t* data, size_t size) {
  const std::string input(reinterpret_cast<const char*>(data), size);
  const dgate::DslLimits limits;
  dgate::GateError err;
  auto tree = dgate::parse_requirement_dsl(input, &err, limits);
  if (!tree) return 0;
  if (dgate::requirement_depth(*tree) > 2 * limits.max_nesting + 2) {
    __builtin_trap();  // BUG: nesting limit not enforced
  }
  const auto leaves = dgate::referenced_conditions(*tree);
  dgate::RequirementLimits rl;
  rl.max_depth = 2 * limits.max_nesting + 2;
  rl.max_nodes = static_cast<std::size_t>(-1);
  if (!dgate::validate_requirement(*tree, leaves, rl, &err) &&
      err.code == dgate::ErrorCode::spec_over_limit) {
    __builtin_trap();  // BUG: parser let an over-deep tree through
  }
  return 0;
}

// ---------------------------------------------------------------------------
// Fuzz target 3: JSON canonicalization
// ---------------------------------------------------------------------------
// Invariants verified:
//   - canonicalize_json() never crashes.
//   - canonicalize_json() is idempotent: canon(canon(x)) == canon(x).
extern "C" int LLVMFuzzerTestOneInput_Canon(const uint8_t* data, size_t size) {
  const std::string input(reinterpret_cast<const char*>(data), size);
  std::optional<dgate::jsonlite::JsonError> err1, err2;
  const std::string c1 = dgate::jsonlite::canonicalize_json(input, &err1);
  if (!err1 && !c1.empty()) {
    const std::string c2 = dgate::jsonlite::canonicalize_json(c1, &err2);
    if (!err2 && c1 != c2) {
      __builtin_trap();  // BUG: canonicalization not idempotent
    }
  }
  return 0;
}

// ---------------------------------------------------------------------------
// Fuzz target 4: Runpack reader
// ---------------------------------------------------------------------------
// Invariants verified:
//   - runpack_from_json() and verify_runpack() never crash.
//   - Serializing a loaded pack and loading it again preserves the
//     fingerprint and the verification verdict.
extern "C" int LLVMFuzzerTestOneInput_Runpack(const uint8_t* data, size_t size) {
  const std::string input(reinterpret_cast<const char*>(data), size);
  dgate::GateError err;
  auto pack = dgate::runpack_from_json(input, &err);
  if (!pack) return 0;
  const bool ok = dgate::verify_runpack(*pack).ok;
  auto again = dgate::runpack_from_json(dgate::runpack_to_json(*pack), &err);
  if (!again || again->fingerprint() != pack->fingerprint() ||
      dgate::verify_runpack(*again).ok != ok) {
    __builtin_trap();  // BUG: runpack serialization not stable
  }
  return 0;
}

// ---------------------------------------------------------------------------
// Default libFuzzer entry point: routes to all targets.
// ---------------------------------------------------------------------------
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (size == 0) return 0;
  const uint8_t target = data[0] % 4;
  const uint8_t* payload = data + 1;
  const size_t payload_size = size - 1;
  switch (target) {
    case 0: return LLVMFuzzerTestOneInput_Spec(payload, payload_size);
    case 1: return LLVMFuzzerTestOneInput_Dsl(payload, payload_size);
    case 2: return LLVMFuzzerTestOneInput_Canon(payload, payload_size);
    case 3: return LLVMFuzzerTestOneInput_Runpack(payload, payload_size);
    default: return 0;
  }
}
