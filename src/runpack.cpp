#include "dgate/runpack.hpp"

#include <array>
#include <utility>

#include "dgate/version.hpp"

namespace dgate {

namespace {

struct KindName {
  StepKind kind;
  const char* name;
};

constexpr std::array<KindName, 7> kKindNames = {{
    {StepKind::spec_loaded, "spec_loaded"},
    {StepKind::evidence_fetched, "evidence_fetched"},
    {StepKind::condition_evaluated, "condition_evaluated"},
    {StepKind::tree_evaluated, "tree_evaluated"},
    {StepKind::decided, "decided"},
    {StepKind::blocked, "blocked"},
    {StepKind::failed, "failed"},
}};

bool is_terminal(StepKind kind) {
  return kind == StepKind::decided || kind == StepKind::blocked || kind == StepKind::failed;
}

std::optional<Runpack> reject(GateError* err, ErrorCode code, std::string message) {
  fail(err, code, std::move(message));
  return std::nullopt;
}

}  // namespace

std::string to_string(StepKind kind) {
  for (const auto& k : kKindNames) {
    if (k.kind == kind) return k.name;
  }
  return "";
}

std::optional<StepKind> step_kind_from_string(const std::string& name) {
  for (const auto& k : kKindNames) {
    if (name == k.name) return k.kind;
  }
  return std::nullopt;
}

std::string step_preimage(std::uint64_t index, StepKind kind, const std::string& payload,
                          const std::string& prev_hash) {
  // Keys in canonical (sorted) order. payload is embedded as raw JSON text.
  std::string out = "{\"index\":" + std::to_string(index) + ",\"kind\":\"" + to_string(kind) +
                    "\",\"payload\":";
  out += payload;
  out += ",\"prev\":\"" + jsonlite::escape(prev_hash) + "\"}";
  return out;
}

Runpack::Runpack(std::string scenario_id, std::string spec_hash)
    : scenario_id_(std::move(scenario_id)), spec_hash_(std::move(spec_hash)) {}

bool Runpack::append(StepKind kind, const jsonlite::Value& payload, GateError* err) {
  if (sealed_) {
    return fail(err, ErrorCode::post_seal_append,
                "append of " + to_string(kind) + " step to a sealed runpack");
  }
  if (!steps_.empty() && is_terminal(steps_.back().kind)) {
    return fail(err, ErrorCode::lifecycle_violation, "append after terminal step");
  }
  RunpackStep step;
  step.index = steps_.size();
  step.kind = kind;
  step.payload = jsonlite::to_json(payload);
  step.prev_hash = head_;
  step.hash = step_hash(step_preimage(step.index, step.kind, step.payload, step.prev_hash));
  head_ = step.hash;
  steps_.push_back(std::move(step));
  return true;
}

std::optional<std::string> Runpack::seal(GateError* err) {
  if (sealed_) {
    fail(err, ErrorCode::lifecycle_violation, "runpack already sealed");
    return std::nullopt;
  }
  sealed_ = true;
  fingerprint_ = head_;
  return fingerprint_;
}

Runpack Runpack::from_parts(std::string scenario_id, std::string spec_hash,
                            std::vector<RunpackStep> steps, std::string fingerprint) {
  Runpack pack(std::move(scenario_id), std::move(spec_hash));
  pack.steps_ = std::move(steps);
  if (!pack.steps_.empty()) pack.head_ = pack.steps_.back().hash;
  pack.fingerprint_ = std::move(fingerprint);
  pack.sealed_ = true;
  return pack;
}

VerifyResult verify_runpack(const Runpack& pack) {
  VerifyResult r;
  if (!pack.sealed()) {
    r.reason = "runpack is not sealed";
    return r;
  }
  std::string prev(kGenesisHash);
  const auto& steps = pack.steps();
  for (std::size_t i = 0; i < steps.size(); ++i) {
    const RunpackStep& s = steps[i];
    const char* problem = nullptr;
    if (s.index != i) {
      problem = "step index out of sequence";
    } else if (s.prev_hash != prev) {
      problem = "prev_hash does not chain to the previous step";
    } else if (s.hash != step_hash(step_preimage(s.index, s.kind, s.payload, s.prev_hash))) {
      problem = "step content does not match its hash";
    }
    if (problem) {
      r.first_divergent_index = i;
      r.reason = problem;
      return r;
    }
    prev = s.hash;
  }
  if (pack.fingerprint() != prev) {
    if (!steps.empty()) r.first_divergent_index = steps.size() - 1;
    r.reason = "fingerprint does not match the chain head";
    return r;
  }
  r.ok = true;
  return r;
}

std::string runpack_to_json(const Runpack& pack) {
  jsonlite::Object root;
  root["format_version"] = jsonlite::number(version::RUNPACK_FORMAT_VERSION);
  root["scenario_id"] = pack.scenario_id();
  root["spec_hash"] = pack.spec_hash();
  root["fingerprint"] = pack.fingerprint();
  jsonlite::Array steps;
  for (const auto& s : pack.steps()) {
    jsonlite::Object o;
    o["index"] = jsonlite::number(s.index);
    o["kind"] = to_string(s.kind);
    std::optional<jsonlite::JsonError> payload_error;
    auto payload = jsonlite::parse_value(s.payload, &payload_error);
    // A payload that is not JSON can only come from tampering; keep it as a
    // string so verification still reports the divergent index.
    o["payload"] = payload ? std::move(*payload) : jsonlite::Value{s.payload};
    o["prev_hash"] = s.prev_hash;
    o["hash"] = s.hash;
    steps.push_back(std::move(o));
  }
  root["steps"] = std::move(steps);
  return jsonlite::to_json(jsonlite::Value{std::move(root)});
}

std::optional<Runpack> runpack_from_json(const std::string& json, GateError* err) {
  std::optional<jsonlite::JsonError> json_error;
  const jsonlite::Object root = jsonlite::parse(json, &json_error);
  if (json_error) {
    return reject(err, ErrorCode::runpack_format_mismatch, json_error->code + ": " + json_error->message);
  }
  bool ok = true;
  const auto format = jsonlite::get_u64(root, "format_version", 0, &ok);
  if (!ok || format > 0xFFFFFFFFull) {
    return reject(err, ErrorCode::runpack_format_mismatch, "format_version must be an integer");
  }
  const auto compat = version::check_runpack_format(static_cast<uint32_t>(format));
  if (!compat.ok) return reject(err, ErrorCode::runpack_format_mismatch, compat.description);

  const std::string scenario_id = jsonlite::get_string(root, "scenario_id");
  const std::string spec_hash = jsonlite::get_string(root, "spec_hash");
  const std::string fingerprint = jsonlite::get_string(root, "fingerprint");
  if (!is_valid_identifier(scenario_id) || !is_hex_digest(spec_hash) || !is_hex_digest(fingerprint)) {
    return reject(err, ErrorCode::runpack_format_mismatch,
                  "runpack header needs scenario_id, spec_hash and fingerprint");
  }

  const auto* steps_value = jsonlite::find(root, "steps");
  const auto* steps_array = steps_value ? std::get_if<jsonlite::Array>(&steps_value->v) : nullptr;
  if (!steps_array) return reject(err, ErrorCode::runpack_format_mismatch, "steps must be an array");

  std::vector<RunpackStep> steps;
  steps.reserve(steps_array->size());
  for (const auto& item : *steps_array) {
    const auto* o = std::get_if<jsonlite::Object>(&item.v);
    if (!o) return reject(err, ErrorCode::runpack_format_mismatch, "step must be an object");
    RunpackStep s;
    bool index_ok = true;
    s.index = jsonlite::get_u64(*o, "index", 0, &index_ok);
    const auto kind = step_kind_from_string(jsonlite::get_string(*o, "kind"));
    const auto* payload = jsonlite::find(*o, "payload");
    if (!index_ok || !jsonlite::find(*o, "index") || !kind || !payload) {
      return reject(err, ErrorCode::runpack_format_mismatch,
                    "step " + std::to_string(steps.size()) + " is missing index, kind or payload");
    }
    s.kind = *kind;
    s.payload = jsonlite::to_json(*payload);
    s.prev_hash = jsonlite::get_string(*o, "prev_hash");
    s.hash = jsonlite::get_string(*o, "hash");
    steps.push_back(std::move(s));
  }
  return Runpack::from_parts(scenario_id, spec_hash, std::move(steps), fingerprint);
}

}  // namespace dgate
