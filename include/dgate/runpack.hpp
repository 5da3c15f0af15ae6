#pragma once

// dgate/runpack.hpp — Append-only, hash-chained audit record of one evaluation.
//
// DESIGN INVARIANTS:
//   1. Steps are only ever appended. Step i carries prev_hash = hash of step
//      i-1 (kGenesisHash for step 0) and
//        hash = BLAKE3("step:" || {"index":i,"kind":k,"payload":p,"prev":h})
//      over the canonical preimage, so changing any byte of any step breaks
//      every hash from that step on.
//   2. seal() freezes the pack and returns the fingerprint (hash of the last
//      step). Appending after seal is a caller bug and reports
//      post_seal_append. Sealing twice reports lifecycle_violation.
//   3. verify() recomputes the chain from scratch. It trusts nothing stored
//      in the pack except the step contents themselves.
//
// MEMORY OWNERSHIP:
//   A Runpack is owned by exactly one Gate until sealed, then moved to the
//   caller (and from there to an IRunpackStore). It holds payloads as
//   canonical JSON text, never references into evidence records.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dgate/hash.hpp"
#include "dgate/jsonlite.hpp"
#include "dgate/types.hpp"

namespace dgate {

enum class StepKind {
  spec_loaded,
  evidence_fetched,
  condition_evaluated,
  tree_evaluated,
  decided,
  blocked,
  failed,
};

std::string to_string(StepKind kind);
std::optional<StepKind> step_kind_from_string(const std::string& name);

struct RunpackStep {
  std::uint64_t index{0};
  StepKind kind{StepKind::spec_loaded};
  std::string payload;  // canonical JSON
  std::string prev_hash;
  std::string hash;
};

std::string step_preimage(std::uint64_t index, StepKind kind, const std::string& payload,
                          const std::string& prev_hash);

class Runpack {
 public:
  Runpack() = default;
  Runpack(std::string scenario_id, std::string spec_hash);

  bool append(StepKind kind, const jsonlite::Value& payload, GateError* err = nullptr);
  std::optional<std::string> seal(GateError* err = nullptr);

  bool sealed() const { return sealed_; }
  const std::vector<RunpackStep>& steps() const { return steps_; }
  const std::string& fingerprint() const { return fingerprint_; }
  const std::string& scenario_id() const { return scenario_id_; }
  const std::string& spec_hash() const { return spec_hash_; }
  // Hash the next step will chain to.
  const std::string& head_hash() const { return head_; }

  // Rebuilds a sealed pack from stored parts without recomputing anything.
  // Use verify_runpack() before trusting it.
  static Runpack from_parts(std::string scenario_id, std::string spec_hash,
                            std::vector<RunpackStep> steps, std::string fingerprint);

 private:
  std::string scenario_id_;
  std::string spec_hash_;
  std::vector<RunpackStep> steps_;
  std::string head_{kGenesisHash};
  std::string fingerprint_;
  bool sealed_{false};
};

struct VerifyResult {
  bool ok{false};
  std::optional<std::size_t> first_divergent_index;
  std::string reason;
};

VerifyResult verify_runpack(const Runpack& pack);

// {"format_version","scenario_id","spec_hash","fingerprint",
//  "steps":[{"index","kind","payload","prev_hash","hash"}]}
std::string runpack_to_json(const Runpack& pack);
// Structural decode only. Rejects unknown format versions with
// runpack_format_mismatch; integrity is left to verify_runpack().
std::optional<Runpack> runpack_from_json(const std::string& json, GateError* err);

}  // namespace dgate
