#pragma once

// dgate/version.hpp — Explicit version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift between the spec reader, the runpack writer
//   and verifier, and the hash domains. Every component that reads a
//   versioned format checks its constant here before processing data.
//
// INVARIANT:
//   All version constants are compile-time. A reader never accepts data
//   written under a newer format version than it was compiled against.

#include <cstdint>
#include <string>

namespace dgate {
namespace version {

// ---------------------------------------------------------------------------
// SPEC_FORMAT_VERSION
// Tracks the ScenarioSpec JSON schema (field names, tree node shapes, policy
// names). Renaming or removing a field, or changing a default, requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t SPEC_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// RUNPACK_FORMAT_VERSION
// Tracks the serialized runpack layout, the step kinds and the step preimage
// {"index","kind","payload","prev"}. Any change that alters a step hash for
// identical content requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t RUNPACK_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3, 32-byte output, lowercase hex, with "spec:", "step:"
// and "pack:" domain prefixes.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t spec_format{SPEC_FORMAT_VERSION};
  uint32_t runpack_format{RUNPACK_FORMAT_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string engine_semver;    // from the CMake project version
  std::string hash_primitive;   // "blake3"
  std::string hash_backend;
  bool zstd_enabled{false};
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;   // Empty if ok
  std::string description;
};

// Runpacks written by any format version up to RUNPACK_FORMAT_VERSION are
// readable; newer ones are not.
CompatibilityResult check_runpack_format(uint32_t format_version);

}  // namespace version
}  // namespace dgate
