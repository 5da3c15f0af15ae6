#pragma once

// dgate/hash.hpp — BLAKE3 hash authority for specs, runpack steps and packs.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive. No fallbacks.
//   2. Every digest that leaves the engine is domain separated. The prefixes
//      below are part of the runpack format contract; changing one requires a
//      RUNPACK_FORMAT_VERSION bump (see version.hpp).

#include <string>
#include <string_view>

namespace dgate {

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
};

// Chain anchor used as prev_hash of the first runpack step.
inline constexpr std::string_view kGenesisHash =
    "0000000000000000000000000000000000000000000000000000000000000000";

inline constexpr std::string_view kSpecDomain = "spec:";
inline constexpr std::string_view kStepDomain = "step:";
inline constexpr std::string_view kPackDomain = "pack:";

std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing for different contexts
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string spec_hash(std::string_view canonical_spec_json);
std::string step_hash(std::string_view canonical_step_preimage);
std::string pack_content_hash(std::string_view raw_bytes);

// True for a 64-char lowercase hex digest.
bool is_hex_digest(std::string_view digest);

}  // namespace dgate
