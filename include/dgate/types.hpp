#pragma once

// dgate/types.hpp — Core value model shared by every engine module.
//
// DETERMINISM GUARANTEES:
//   - EvidenceValue carries numbers as exact Decimals. Nothing in the value
//     model, the comparator or the JSON codec uses binary floating point.
//   - Identifiers are validated once at construction; a constructed id is
//     always safe to embed in log lines, JSON and store keys.
//
// MEMORY OWNERSHIP:
//   - All types here are value types. No borrowed references, no raw pointers.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "dgate/decimal.hpp"
#include "dgate/jsonlite.hpp"

namespace dgate {

enum class ErrorCode {
  none,
  json_parse_error,
  json_duplicate_key,
  spec_invalid,
  spec_over_limit,
  provider_error,
  budget_exceeded,
  cancelled,
  post_seal_append,
  lifecycle_violation,
  runpack_integrity_failed,
  runpack_format_mismatch,
  store_not_found,
  store_io,
  config_invalid,
};

std::string to_string(ErrorCode code);

// Structured failure. subjects names the condition, evidence or provider ids
// responsible so callers never have to parse message.
struct GateError {
  ErrorCode code{ErrorCode::none};
  std::string message;
  std::vector<std::string> subjects;
};

// Fill *err when non-null. Always returns false so callers can
// `return fail(err, ...)`.
bool fail(GateError* err, ErrorCode code, std::string message,
          std::vector<std::string> subjects = {});

// ---------------------------------------------------------------------------
// TriState
// ---------------------------------------------------------------------------
// Indeterminate means "cannot decide yet" (evidence unavailable, type
// mismatch) and is distinct from a decided False.
enum class TriState { True, False, Indeterminate };

std::string to_string(TriState t);
inline TriState tri_from_bool(bool b) { return b ? TriState::True : TriState::False; }

// ---------------------------------------------------------------------------
// Identifiers
// ---------------------------------------------------------------------------
// 1..128 bytes of [A-Za-z0-9_.-], starting with an alphanumeric or '_'.
// Rules out path separators, whitespace, quotes and control bytes so ids can
// flow into paths, URLs and log lines unescaped.
constexpr std::size_t kMaxIdentifierLength = 128;

bool is_valid_identifier(std::string_view raw);

template <typename Tag>
class Identifier {
 public:
  Identifier() = default;

  static std::optional<Identifier> parse(std::string_view raw) {
    if (!is_valid_identifier(raw)) return std::nullopt;
    Identifier id;
    id.value_ = std::string(raw);
    return id;
  }

  const std::string& str() const { return value_; }
  bool empty() const { return value_.empty(); }

  bool operator==(const Identifier& o) const { return value_ == o.value_; }
  bool operator!=(const Identifier& o) const { return value_ != o.value_; }
  bool operator<(const Identifier& o) const { return value_ < o.value_; }

 private:
  std::string value_;
};

struct ScenarioTag {};
struct ConditionTag {};
struct EvidenceTag {};
struct ProviderTag {};

using ScenarioId = Identifier<ScenarioTag>;
using ConditionId = Identifier<ConditionTag>;
using EvidenceId = Identifier<EvidenceTag>;
using ProviderId = Identifier<ProviderTag>;

// ---------------------------------------------------------------------------
// EvidenceValue
// ---------------------------------------------------------------------------
struct EvidenceValue {
  enum class Kind { missing, boolean, number, text, list };

  std::variant<std::monostate, bool, Decimal, std::string, std::vector<EvidenceValue>> v;

  static EvidenceValue missing() { return EvidenceValue{}; }
  static EvidenceValue boolean(bool b) { EvidenceValue e; e.v = b; return e; }
  static EvidenceValue number(Decimal d) { EvidenceValue e; e.v = std::move(d); return e; }
  static EvidenceValue text(std::string s) { EvidenceValue e; e.v = std::move(s); return e; }
  static EvidenceValue list(std::vector<EvidenceValue> items) {
    EvidenceValue e;
    e.v = std::move(items);
    return e;
  }

  Kind kind() const { return static_cast<Kind>(v.index()); }
  bool is_missing() const { return kind() == Kind::missing; }
};

std::string to_string(EvidenceValue::Kind kind);

// Nesting bound for evidence values and provider params, enforced on specs
// and on provider answers. Runpacks embed these values up to 8 JSON levels
// deep next to requirement trees of up to kMaxDepthCapCeiling nodes, and the
// whole pack must stay within jsonlite::kMaxNestingDepth to reload.
constexpr std::size_t kMaxValueNesting = 32;

// List levels in value: 0 for a scalar, 1 for a flat list.
std::size_t evidence_nesting(const EvidenceValue& value);

// JSON mapping: null <-> Missing, bool, number (exact), string, array.
jsonlite::Value evidence_to_json(const EvidenceValue& value);
// Objects, and numbers outside Decimal limits, are rejected with *error set.
std::optional<EvidenceValue> evidence_from_json(const jsonlite::Value& json, std::string* error);

}  // namespace dgate
