#include "dgate/types.hpp"

#include <algorithm>

namespace dgate {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::spec_invalid: return "spec_invalid";
    case ErrorCode::spec_over_limit: return "spec_over_limit";
    case ErrorCode::provider_error: return "provider_error";
    case ErrorCode::budget_exceeded: return "budget_exceeded";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::post_seal_append: return "post_seal_append";
    case ErrorCode::lifecycle_violation: return "lifecycle_violation";
    case ErrorCode::runpack_integrity_failed: return "runpack_integrity_failed";
    case ErrorCode::runpack_format_mismatch: return "runpack_format_mismatch";
    case ErrorCode::store_not_found: return "store_not_found";
    case ErrorCode::store_io: return "store_io";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

bool fail(GateError* err, ErrorCode code, std::string message,
          std::vector<std::string> subjects) {
  if (err) {
    err->code = code;
    err->message = std::move(message);
    err->subjects = std::move(subjects);
  }
  return false;
}

std::string to_string(TriState t) {
  switch (t) {
    case TriState::True: return "true";
    case TriState::False: return "false";
    case TriState::Indeterminate: return "indeterminate";
  }
  return "indeterminate";
}

bool is_valid_identifier(std::string_view raw) {
  if (raw.empty() || raw.size() > kMaxIdentifierLength) return false;
  auto alnum = [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
  };
  if (!alnum(raw[0]) && raw[0] != '_') return false;
  for (char c : raw) {
    if (!alnum(c) && c != '_' && c != '.' && c != '-') return false;
  }
  return true;
}

std::string to_string(EvidenceValue::Kind kind) {
  switch (kind) {
    case EvidenceValue::Kind::missing: return "missing";
    case EvidenceValue::Kind::boolean: return "boolean";
    case EvidenceValue::Kind::number: return "number";
    case EvidenceValue::Kind::text: return "text";
    case EvidenceValue::Kind::list: return "list";
  }
  return "missing";
}

jsonlite::Value evidence_to_json(const EvidenceValue& value) {
  switch (value.kind()) {
    case EvidenceValue::Kind::missing:
      return jsonlite::Value{nullptr};
    case EvidenceValue::Kind::boolean:
      return jsonlite::Value{std::get<bool>(value.v)};
    case EvidenceValue::Kind::number:
      return jsonlite::Value{jsonlite::Number{std::get<Decimal>(value.v).to_string()}};
    case EvidenceValue::Kind::text:
      return jsonlite::Value{std::get<std::string>(value.v)};
    case EvidenceValue::Kind::list: {
      jsonlite::Array arr;
      for (const auto& item : std::get<std::vector<EvidenceValue>>(value.v)) {
        arr.push_back(evidence_to_json(item));
      }
      return jsonlite::Value{std::move(arr)};
    }
  }
  return jsonlite::Value{nullptr};
}

std::size_t evidence_nesting(const EvidenceValue& value) {
  const auto* items = std::get_if<std::vector<EvidenceValue>>(&value.v);
  if (!items) return 0;
  std::size_t inner = 0;
  for (const auto& item : *items) inner = std::max(inner, evidence_nesting(item));
  return inner + 1;
}

std::optional<EvidenceValue> evidence_from_json(const jsonlite::Value& json, std::string* error) {
  if (json.is_null()) return EvidenceValue::missing();
  if (const auto* b = std::get_if<bool>(&json.v)) return EvidenceValue::boolean(*b);
  if (const auto* s = std::get_if<std::string>(&json.v)) return EvidenceValue::text(*s);
  if (const auto* n = std::get_if<jsonlite::Number>(&json.v)) {
    auto d = Decimal::parse(n->text);
    if (!d) {
      if (error) *error = "number out of supported range: " + n->text.substr(0, 32);
      return std::nullopt;
    }
    return EvidenceValue::number(std::move(*d));
  }
  if (const auto* arr = std::get_if<jsonlite::Array>(&json.v)) {
    std::vector<EvidenceValue> items;
    items.reserve(arr->size());
    for (const auto& item : *arr) {
      auto converted = evidence_from_json(item, error);
      if (!converted) return std::nullopt;
      items.push_back(std::move(*converted));
    }
    return EvidenceValue::list(std::move(items));
  }
  if (error) *error = "objects are not evidence values";
  return std::nullopt;
}

}  // namespace dgate
