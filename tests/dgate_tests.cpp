#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "dgate/comparator.hpp"
#include "dgate/config.hpp"
#include "dgate/decimal.hpp"
#include "dgate/dsl.hpp"
#include "dgate/gate.hpp"
#include "dgate/hash.hpp"
#include "dgate/jsonlite.hpp"
#include "dgate/observability.hpp"
#include "dgate/orchestrator.hpp"
#include "dgate/provider.hpp"
#include "dgate/requirement.hpp"
#include "dgate/runpack.hpp"
#include "dgate/spec.hpp"
#include "dgate/store.hpp"
#include "dgate/types.hpp"
#include "dgate/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

using dgate::EvidenceValue;
using dgate::TriState;

dgate::Decimal dec(const std::string& text) {
  auto d = dgate::Decimal::parse(text);
  expect(d.has_value(), "decimal literal " + text);
  return *d;
}

EvidenceValue num(const std::string& text) { return EvidenceValue::number(dec(text)); }
EvidenceValue txt(const std::string& text) { return EvidenceValue::text(text); }

dgate::EvidenceId eid(const std::string& s) { return *dgate::EvidenceId::parse(s); }
dgate::ProviderId pid(const std::string& s) { return *dgate::ProviderId::parse(s); }

dgate::EvidenceBinding bind(const std::string& evidence, const std::string& provider) {
  dgate::EvidenceBinding b;
  b.evidence_id = eid(evidence);
  b.provider_id = pid(provider);
  return b;
}

// Answers after `ms`, or as soon as the fan-out is torn down. Ignores its
// per-fetch deadline on purpose.
std::shared_ptr<dgate::IEvidenceProvider> sleepy_provider(int ms, EvidenceValue value) {
  return std::make_shared<dgate::FunctionEvidenceProvider>(
      [ms, value](const dgate::EvidenceId&, const dgate::jsonlite::Object&,
                  const dgate::FetchContext& ctx) {
        const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
        while (std::chrono::steady_clock::now() < until && !ctx.cancel.cancelled()) {
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return dgate::ProviderResult::success(value);
      });
}

std::shared_ptr<dgate::StaticEvidenceProvider> static_provider(
    const std::vector<std::pair<std::string, EvidenceValue>>& values) {
  auto p = std::make_shared<dgate::StaticEvidenceProvider>();
  for (const auto& [k, v] : values) p->set(k, v);
  return p;
}

const char* kAgeSpec = R"JSON({
  "scenario_id": "adult-check",
  "spec_version": "1",
  "policy": {"on_indeterminate": "block"},
  "evidence": [{"evidence_id": "age", "provider_id": "kyc", "params": {}}],
  "conditions": [{"condition_id": "age_check", "evidence_id": "age",
                  "comparator": "greater_than_or_equal", "expected": 18}],
  "requirement": {"condition": "age_check"}
})JSON";

// Same scenario with a short per-evidence timeout and a chosen policy.
std::string age_spec_with(const std::string& on_indeterminate, int timeout_ms) {
  return std::string(R"JSON({"scenario_id":"adult-check","spec_version":"1",)JSON") +
         R"JSON("policy":{"on_indeterminate":")JSON" + on_indeterminate + R"JSON("},)JSON" +
         R"JSON("evidence":[{"evidence_id":"age","provider_id":"kyc","timeout_ms":)JSON" +
         std::to_string(timeout_ms) + "}]," +
         R"JSON("conditions":[{"condition_id":"age_check","evidence_id":"age",)JSON"
         R"JSON("comparator":"greater_than_or_equal","expected":18}],)JSON"
         R"JSON("requirement":{"condition":"age_check"}})JSON";
}

const char* kTwoConditionSpec = R"JSON({
  "scenario_id": "release-gate",
  "spec_version": "3",
  "policy": {"on_indeterminate": "block", "on_budget_exceeded": "proceed"},
  "limits": {"max_parallelism": 2, "provider_timeout_ms": 500, "global_budget_ms": 2000},
  "evidence": [
    {"evidence_id": "coverage", "provider_id": "ci"},
    {"evidence_id": "branch", "provider_id": "ci"}
  ],
  "conditions": [
    {"condition_id": "coverage_ok", "evidence_id": "coverage",
     "comparator": "greater_than", "expected": 0.8},
    {"condition_id": "on_main", "evidence_id": "branch",
     "comparator": "equals", "expected": "main"}
  ],
  "requirement": "coverage_ok && on_main"
})JSON";

dgate::ProviderRegistry kyc_registry(EvidenceValue age) {
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("kyc"), static_provider({{"age", std::move(age)}}));
  return registry;
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(dgate::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(dgate::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = R"({"a":1})";
  const auto spec = dgate::spec_hash(payload);
  const auto step = dgate::step_hash(payload);
  const auto pack = dgate::pack_content_hash(payload);
  expect(spec != step && step != pack && spec != pack, "domains must separate digests");
  expect(spec != dgate::blake3_hex(payload), "domain digest differs from plain digest");
  expect(spec == dgate::hash_domain(dgate::kSpecDomain, payload), "spec_hash uses spec: domain");
  expect(dgate::is_hex_digest(spec), "digest is 64 lowercase hex");
  expect(!dgate::is_hex_digest("ABC"), "short/uppercase digest rejected");
  expect(dgate::kGenesisHash == std::string(64, '0'), "genesis hash is 64 zeros");
}

void test_hash_runtime_info() {
  const auto info = dgate::hash_runtime_info();
  expect(info.primitive == "blake3", "primitive is blake3");
  expect(!info.backend.empty(), "backend reported");
}

// ============================================================================
// JSON
// ============================================================================

void test_json_canonicalization() {
  std::optional<dgate::jsonlite::JsonError> err;
  const auto c1 = dgate::jsonlite::canonicalize_json(R"({ "b": 1, "a": [true, null, "x"] })", &err);
  expect(!err, "canonicalize ok");
  expect(c1 == R"({"a":[true,null,"x"],"b":1})", "keys sorted, whitespace removed: " + c1);
  const auto c2 = dgate::jsonlite::canonicalize_json(c1, &err);
  expect(c1 == c2, "canonicalization idempotent");
}

void test_json_strictness() {
  std::optional<dgate::jsonlite::JsonError> err;
  dgate::jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");

  err.reset();
  dgate::jsonlite::parse(R"({"a":1} trailing)", &err);
  expect(err.has_value(), "trailing data rejected");

  err.reset();
  dgate::jsonlite::parse(R"({"a":NaN})", &err);
  expect(err.has_value(), "NaN rejected");

  err.reset();
  std::string deep(300, '[');
  deep += std::string(300, ']');
  dgate::jsonlite::parse_value(deep, &err);
  expect(err.has_value(), "nesting beyond limit rejected");
}

void test_json_numbers_stay_text() {
  std::optional<dgate::jsonlite::JsonError> err;
  auto v = dgate::jsonlite::parse_value("0.10000000000000000000001", &err);
  expect(v && !err, "long decimal parses");
  const auto* n = std::get_if<dgate::jsonlite::Number>(&v->v);
  expect(n && n->text == "0.10000000000000000000001", "number literal preserved exactly");

  auto s = dgate::jsonlite::parse_value(R"("caf\u00e9 \ud83d\ude00")", &err);
  expect(s && !err, "escaped string parses");
  expect(std::get<std::string>(s->v) == "caf\xc3\xa9 \xf0\x9f\x98\x80", "unicode escapes decoded to UTF-8");
}

// ============================================================================
// Exact decimals
// ============================================================================

void test_decimal_point_one_plus_point_two() {
  const auto sum = dec("0.1") + dec("0.2");
  expect(sum == dec("0.3"), "0.1 + 0.2 == 0.3 exactly");
  expect(sum.to_string() == "0.3", "canonical text 0.3");
  expect(dgate::compare(dgate::ComparatorOp::equals, EvidenceValue::number(sum), num("0.3")) ==
             TriState::True,
         "comparator sees 0.1 + 0.2 equal to 0.3");
}

void test_decimal_canonical_form() {
  expect(dec("1e3").to_string() == "1000", "exponent expanded");
  expect(dec("1.500").to_string() == "1.5", "trailing zeros stripped");
  expect(dec("-0").to_string() == "0", "negative zero normalized");
  expect(dec("-0.0") == dec("0"), "-0.0 equals 0");
  expect(dec("12.5e-3").to_string() == "0.0125", "negative exponent");
  expect(dec("18") == dec("18.0"), "18 == 18.0");
}

void test_decimal_ordering() {
  expect(dec("10") > dec("9.99"), "10 > 9.99");
  expect(dec("-1.5") < dec("-1.4"), "-1.5 < -1.4");
  expect(dec("12345678901234567890.000000000000000001") > dec("12345678901234567890"),
         "ordering beyond double precision");
  expect(dec("0.3") - dec("0.1") == dec("0.2"), "subtraction exact");
  expect(dec("5").negated() == dec("-5"), "negate");
}

void test_decimal_rejects_bad_input() {
  expect(!dgate::Decimal::parse("00"), "leading zero rejected");
  expect(!dgate::Decimal::parse("1."), "dangling point rejected");
  expect(!dgate::Decimal::parse(" 1"), "leading whitespace rejected");
  expect(!dgate::Decimal::parse("1e99999"), "exponent beyond digit bound rejected");
  expect(!dgate::Decimal::parse("NaN"), "NaN rejected");
}

// ============================================================================
// Identifiers and evidence values
// ============================================================================

void test_identifier_rules() {
  expect(dgate::is_valid_identifier("age_check"), "plain id");
  expect(dgate::is_valid_identifier("_x.y-1"), "underscore start with dot and dash");
  expect(!dgate::is_valid_identifier(""), "empty rejected");
  expect(!dgate::is_valid_identifier("-x"), "leading dash rejected");
  expect(!dgate::is_valid_identifier("a/b"), "path separator rejected");
  expect(!dgate::is_valid_identifier("a b"), "whitespace rejected");
  expect(dgate::is_valid_identifier(std::string(128, 'a')), "128 bytes accepted");
  expect(!dgate::is_valid_identifier(std::string(129, 'a')), "129 bytes rejected");
  expect(!dgate::ScenarioId::parse("bad id").has_value(), "typed parse rejects");
}

void test_evidence_json_mapping() {
  std::optional<dgate::jsonlite::JsonError> jerr;
  std::string err;
  auto null_v = dgate::evidence_from_json(*dgate::jsonlite::parse_value("null", &jerr), &err);
  expect(null_v && null_v->is_missing(), "null maps to Missing");
  auto list = dgate::evidence_from_json(*dgate::jsonlite::parse_value(R"([1,"a",[true]])", &jerr), &err);
  expect(list && list->kind() == EvidenceValue::Kind::list, "array maps to List");
  auto obj = dgate::evidence_from_json(*dgate::jsonlite::parse_value(R"({"a":1})", &jerr), &err);
  expect(!obj && !err.empty(), "objects are not evidence values");
  expect(dgate::jsonlite::to_json(dgate::evidence_to_json(num("2.50"))) == "2.5",
         "numbers serialize canonically");
}

// ============================================================================
// Comparator
// ============================================================================

const dgate::ComparatorOp kAllOps[] = {
    dgate::ComparatorOp::equals,
    dgate::ComparatorOp::not_equals,
    dgate::ComparatorOp::greater_than,
    dgate::ComparatorOp::greater_than_or_equal,
    dgate::ComparatorOp::less_than,
    dgate::ComparatorOp::less_than_or_equal,
    dgate::ComparatorOp::lex_greater_than,
    dgate::ComparatorOp::lex_greater_than_or_equal,
    dgate::ComparatorOp::lex_less_than,
    dgate::ComparatorOp::lex_less_than_or_equal,
    dgate::ComparatorOp::contains,
    dgate::ComparatorOp::in_set,
    dgate::ComparatorOp::deep_equals,
    dgate::ComparatorOp::deep_not_equals,
};

void test_comparator_missing_is_indeterminate() {
  for (auto op : kAllOps) {
    expect(dgate::compare(op, EvidenceValue::missing(), num("1")) == TriState::Indeterminate,
           "missing actual is indeterminate for " + dgate::to_string(op));
    expect(dgate::compare(op, num("1"), EvidenceValue::missing()) == TriState::Indeterminate,
           "missing expected is indeterminate for " + dgate::to_string(op));
  }
}

void test_comparator_numeric() {
  using dgate::ComparatorOp;
  expect(dgate::compare(ComparatorOp::greater_than_or_equal, num("18"), num("18")) == TriState::True, "18 >= 18");
  expect(dgate::compare(ComparatorOp::greater_than, num("18"), num("18")) == TriState::False, "18 > 18 false");
  expect(dgate::compare(ComparatorOp::less_than, num("17.999"), num("18")) == TriState::True, "17.999 < 18");
  expect(dgate::compare(ComparatorOp::equals, num("18"), num("18.00")) == TriState::True, "18 == 18.00");
  expect(dgate::compare(ComparatorOp::not_equals, num("1"), num("2")) == TriState::True, "1 != 2");
}

void test_comparator_type_mismatch() {
  using dgate::ComparatorOp;
  expect(dgate::compare(ComparatorOp::equals, txt("18"), num("18")) == TriState::Indeterminate,
         "text vs number equality indeterminate");
  expect(dgate::compare(ComparatorOp::greater_than, EvidenceValue::boolean(true), num("0")) ==
             TriState::Indeterminate,
         "bool ordering indeterminate");
  expect(dgate::compare(ComparatorOp::lex_less_than, num("1"), num("2")) == TriState::Indeterminate,
         "lex ordering on numbers indeterminate");
  expect(dgate::compare(ComparatorOp::equals, EvidenceValue::list({num("1")}),
                        EvidenceValue::list({num("1")})) == TriState::Indeterminate,
         "equals on lists indeterminate; deep_equals is for lists");
}

void test_comparator_temporal() {
  using dgate::ComparatorOp;
  expect(dgate::compare(ComparatorOp::greater_than, txt("2024-03-01T10:00:00Z"),
                        txt("2024-03-01T09:59:59.999Z")) == TriState::True,
         "fractional seconds ordered");
  expect(dgate::compare(ComparatorOp::less_than_or_equal, txt("2024-03-01T12:00:00+02:00"),
                        txt("2024-03-01T10:00:00Z")) == TriState::True &&
             dgate::compare(ComparatorOp::greater_than_or_equal, txt("2024-03-01T12:00:00+02:00"),
                            txt("2024-03-01T10:00:00Z")) == TriState::True,
         "offsets normalize to the same instant");
  expect(dgate::compare(ComparatorOp::greater_than, txt("2024-02-29"), txt("2024-02-28")) == TriState::True,
         "date-only ordering across leap day");
  expect(dgate::compare(ComparatorOp::greater_than, txt("2024-03-01"), txt("2024-03-01T00:00:00Z")) ==
             TriState::Indeterminate,
         "date vs date-time is indeterminate");
  expect(dgate::compare(ComparatorOp::greater_than, txt("banana"), txt("apple")) == TriState::Indeterminate,
         "non-temporal strings do not order numerically");
  expect(!dgate::parse_rfc3339("2023-02-29"), "invalid calendar date rejected");
  expect(!dgate::parse_rfc3339("2024-13-01"), "invalid month rejected");
  expect(dgate::parse_rfc3339("2016-12-31T23:59:60Z").has_value(), "leap second accepted");
}

void test_comparator_lexicographic() {
  using dgate::ComparatorOp;
  expect(dgate::compare(ComparatorOp::lex_greater_than, txt("b"), txt("a")) == TriState::True, "b > a");
  expect(dgate::compare(ComparatorOp::lex_less_than, txt("B"), txt("a")) == TriState::True, "bytewise order");
  expect(dgate::compare(ComparatorOp::lex_greater_than_or_equal, txt("x"), txt("x")) == TriState::True, "x >= x");
}

void test_comparator_contains_and_in_set() {
  using dgate::ComparatorOp;
  expect(dgate::compare(ComparatorOp::contains, txt("hello world"), txt("lo w")) == TriState::True,
         "substring");
  expect(dgate::compare(ComparatorOp::contains, txt("hello"), txt("xyz")) == TriState::False,
         "substring absent");
  const auto list = EvidenceValue::list({num("1"), num("2"), num("3")});
  expect(dgate::compare(ComparatorOp::contains, list, num("2.0")) == TriState::True, "list contains scalar");
  expect(dgate::compare(ComparatorOp::contains, list, EvidenceValue::list({num("1"), num("3")})) ==
             TriState::True,
         "list superset");
  expect(dgate::compare(ComparatorOp::contains, list, EvidenceValue::list({num("1"), num("4")})) ==
             TriState::False,
         "list not superset");
  const auto set = EvidenceValue::list({txt("eu"), txt("us")});
  expect(dgate::compare(ComparatorOp::in_set, txt("eu"), set) == TriState::True, "in set");
  expect(dgate::compare(ComparatorOp::in_set, txt("apac"), set) == TriState::False, "not in set");
  expect(dgate::compare(ComparatorOp::in_set, txt("eu"), txt("eu")) == TriState::Indeterminate,
         "in_set needs a list");
}

void test_comparator_deep_equality() {
  using dgate::ComparatorOp;
  const auto a = EvidenceValue::list({num("1"), EvidenceValue::list({num("2"), txt("x")})});
  const auto b = EvidenceValue::list({num("1.0"), EvidenceValue::list({num("2"), txt("x")})});
  const auto c = EvidenceValue::list({num("1"), EvidenceValue::list({num("2"), txt("y")})});
  expect(dgate::compare(ComparatorOp::deep_equals, a, b) == TriState::True, "structural equality");
  expect(dgate::compare(ComparatorOp::deep_not_equals, a, c) == TriState::True, "structural difference");
  expect(dgate::compare(ComparatorOp::deep_equals, a, txt("x")) == TriState::Indeterminate,
         "kind mismatch indeterminate");
}

void test_operator_table() {
  dgate::OperatorTable table;
  table.enabled.insert(dgate::ComparatorOp::equals);
  dgate::Comparator cmp(table);
  expect(cmp.compare(dgate::ComparatorOp::equals, num("1"), num("1")) == TriState::True, "enabled op works");
  expect(cmp.compare(dgate::ComparatorOp::greater_than, num("2"), num("1")) == TriState::Indeterminate,
         "disabled op indeterminate");
  for (auto op : kAllOps) {
    auto back = dgate::comparator_op_from_string(dgate::to_string(op));
    expect(back && *back == op, "operator name round trip " + dgate::to_string(op));
  }
  expect(!dgate::comparator_op_from_string("exists"), "unknown operator name");
}

// ============================================================================
// Tri-state algebra and requirement trees
// ============================================================================

void test_kleene_truth_tables() {
  const TriState T = TriState::True, F = TriState::False, I = TriState::Indeterminate;
  expect(dgate::tri_and(T, T) == T && dgate::tri_and(T, F) == F && dgate::tri_and(F, I) == F &&
             dgate::tri_and(T, I) == I && dgate::tri_and(I, I) == I,
         "AND table");
  expect(dgate::tri_or(F, F) == F && dgate::tri_or(T, F) == T && dgate::tri_or(T, I) == T &&
             dgate::tri_or(F, I) == I && dgate::tri_or(I, I) == I,
         "OR table");
  expect(dgate::tri_not(T) == F && dgate::tri_not(F) == T && dgate::tri_not(I) == I, "NOT table");
}

using dgate::RequirementNode;

RequirementNode L(const std::string& id) { return RequirementNode::leaf(id); }

void test_short_circuit_recorded_in_plan() {
  dgate::MapLeafResolver r({{"a", TriState::False}, {"b", TriState::True}});
  const auto e = dgate::evaluate(RequirementNode::all({L("a"), L("b")}), r);
  expect(e.result == TriState::False, "all(F, T) is False");
  expect(e.plan.entries.size() == 3, "every node present in the plan");
  expect(e.plan.skipped_count() == 1, "b skipped after a decided the group");
  expect(e.plan.entries[2].condition_id == "b" && e.plan.entries[2].status == dgate::PlanStatus::skipped,
         "skipped leaf recorded");

  const auto any = dgate::evaluate(RequirementNode::any({L("b"), L("a")}), r);
  expect(any.result == TriState::True && any.plan.skipped_count() == 1, "any short-circuits on True");
}

void test_indeterminate_does_not_short_circuit() {
  dgate::MapLeafResolver r({{"u", TriState::Indeterminate}, {"f", TriState::False}, {"t", TriState::True}});
  expect(dgate::evaluate(RequirementNode::all({L("u"), L("f")}), r).result == TriState::False,
         "all(I, F) is False");
  expect(dgate::evaluate(RequirementNode::all({L("u"), L("t")}), r).result == TriState::Indeterminate,
         "all(I, T) is Indeterminate");
  expect(dgate::evaluate(RequirementNode::any({L("u"), L("t")}), r).result == TriState::True,
         "any(I, T) is True");
  expect(dgate::evaluate(RequirementNode::negate(L("u")), r).result == TriState::Indeterminate,
         "not(I) is Indeterminate");
  expect(dgate::evaluate(L("unknown"), r).result == TriState::Indeterminate,
         "unresolved leaf is Indeterminate");
}

void test_at_least_group() {
  dgate::MapLeafResolver r({{"t1", TriState::True},
                            {"t2", TriState::True},
                            {"f1", TriState::False},
                            {"f2", TriState::False},
                            {"u", TriState::Indeterminate}});
  auto yes = dgate::evaluate(RequirementNode::at_least(2, {L("t1"), L("t2"), L("u")}), r);
  expect(yes.result == TriState::True && yes.plan.skipped_count() == 1, "2 of 3 reached early");
  auto no = dgate::evaluate(RequirementNode::at_least(2, {L("f1"), L("f2"), L("t1")}), r);
  expect(no.result == TriState::False && no.plan.skipped_count() == 1, "2 of 3 unreachable early");
  auto maybe = dgate::evaluate(RequirementNode::at_least(2, {L("t1"), L("u"), L("f1")}), r);
  expect(maybe.result == TriState::Indeterminate, "unknown member keeps the group open");
}

void test_malformed_negate_is_indeterminate() {
  dgate::MapLeafResolver r({{"t", TriState::True}, {"f", TriState::False}});
  RequirementNode bare;
  bare.kind = dgate::NodeKind::negate;
  auto e = dgate::evaluate(bare, r);
  expect(e.result == TriState::Indeterminate && e.plan.entries.size() == 1, "childless not() is indeterminate");

  bare.children = {L("t"), L("f")};
  e = dgate::evaluate(bare, r);
  expect(e.result == TriState::Indeterminate, "two-child not() is indeterminate");
  expect(e.plan.entries.size() == 3 && e.plan.skipped_count() == 2, "its children are recorded as skipped");

  auto wrapped = dgate::evaluate(RequirementNode::any({bare, L("t")}), r);
  expect(wrapped.result == TriState::True, "malformed branch absorbed by a true sibling");
}

void test_requirement_validation() {
  const std::set<std::string> known{"a", "b", "c"};
  dgate::RequirementLimits limits;
  dgate::GateError err;

  expect(!dgate::validate_requirement(RequirementNode::all({}), known, limits, &err) &&
             err.code == dgate::ErrorCode::spec_invalid,
         "empty all rejected");
  expect(!dgate::validate_requirement(RequirementNode::at_least(0, {L("a")}), known, limits, &err),
         "min 0 rejected");
  expect(!dgate::validate_requirement(RequirementNode::at_least(3, {L("a"), L("b")}), known, limits, &err),
         "min above member count rejected");

  err = {};
  expect(!dgate::validate_requirement(RequirementNode::any({L("a"), L("ghost")}), known, limits, &err) &&
             err.code == dgate::ErrorCode::spec_invalid &&
             std::find(err.subjects.begin(), err.subjects.end(), "ghost") != err.subjects.end(),
         "dangling leaf rejected and named");

  RequirementNode deep = L("a");
  for (int i = 0; i < 40; ++i) deep = RequirementNode::negate(std::move(deep));
  expect(!dgate::validate_requirement(deep, known, limits, &err) &&
             err.code == dgate::ErrorCode::spec_over_limit,
         "depth limit enforced");

  std::vector<RequirementNode> wide;
  for (int i = 0; i < 1100; ++i) wide.push_back(L("a"));
  expect(!dgate::validate_requirement(RequirementNode::any(std::move(wide)), known, limits, &err) &&
             err.code == dgate::ErrorCode::spec_over_limit,
         "node count limit enforced");

  expect(dgate::validate_requirement(RequirementNode::at_least(2, {L("a"), L("b"), L("c")}), known,
                                     limits, &err),
         "valid tree accepted");
}

void test_plan_determinism_and_rendering() {
  const auto tree = RequirementNode::any(
      {RequirementNode::all({L("a"), RequirementNode::negate(L("b"))}), L("c")});
  dgate::MapLeafResolver r({{"a", TriState::True}, {"b", TriState::False}, {"c", TriState::Indeterminate}});
  const auto e1 = dgate::evaluate(tree, r);
  const auto e2 = dgate::evaluate(tree, r);
  expect(e1.result == TriState::True, "any(all(T, not F), I) is True");
  expect(e1.plan == e2.plan, "same inputs give the same plan");
  expect(dgate::jsonlite::to_json(dgate::plan_to_json(e1.plan)) ==
             dgate::jsonlite::to_json(dgate::plan_to_json(e2.plan)),
         "plan JSON stable");
  const auto text = dgate::explain_plan(e1.plan);
  expect(text.find("condition c (skipped)") != std::string::npos, "explain marks skipped nodes: " + text);
  expect(text.find("    condition b -> false") != std::string::npos, "explain indents by depth: " + text);
}

void test_requirement_json_form() {
  std::optional<dgate::jsonlite::JsonError> jerr;
  auto json = dgate::jsonlite::parse_value(
      R"({"any":[{"condition":"a"},{"not":{"condition":"b"}},{"at_least":{"min":1,"of":[{"condition":"c"}]}}]})",
      &jerr);
  expect(json && !jerr, "tree JSON parses");
  dgate::GateError err;
  auto tree = dgate::requirement_from_json(*json, &err);
  expect(tree.has_value(), "tree decodes");
  expect(*tree == RequirementNode::any({L("a"), RequirementNode::negate(L("b")),
                                        RequirementNode::at_least(1, {L("c")})}),
         "decoded structure");
  expect(dgate::jsonlite::to_json(dgate::requirement_to_json(*tree)) == dgate::jsonlite::to_json(*json),
         "tree re-encodes to its canonical input");
  auto bad = dgate::jsonlite::parse_value(R"({"xor":[]})", &jerr);
  expect(!dgate::requirement_from_json(*bad, &err), "unknown node kind rejected");
}

// ============================================================================
// Requirement DSL
// ============================================================================

void test_dsl_precedence() {
  dgate::GateError err;
  auto t = dgate::parse_requirement_dsl("a || b && !c", &err);
  expect(t.has_value(), "parses");
  expect(*t == RequirementNode::any({L("a"), RequirementNode::all({L("b"), RequirementNode::negate(L("c"))})}),
         "! binds tighter than &&, && tighter than ||");
  auto p = dgate::parse_requirement_dsl("(a || b) && c", &err);
  expect(p && *p == RequirementNode::all({RequirementNode::any({L("a"), L("b")}), L("c")}),
         "parentheses group");
  auto k = dgate::parse_requirement_dsl("a and not b or c", &err);
  expect(k && *k == RequirementNode::any({RequirementNode::all({L("a"), RequirementNode::negate(L("b"))}), L("c")}),
         "keyword operators");
}

void test_dsl_function_form() {
  dgate::GateError err;
  auto t = dgate::parse_requirement_dsl("all(ci.tests-pass, any(review_ok, not(hotfix)), at_least(2, x, y, z))",
                                        &err);
  expect(t.has_value(), "function form parses: " + err.message);
  expect(*t == RequirementNode::all({L("ci.tests-pass"),
                                     RequirementNode::any({L("review_ok"), RequirementNode::negate(L("hotfix"))}),
                                     RequirementNode::at_least(2, {L("x"), L("y"), L("z")})}),
         "function form structure");
  auto g = dgate::parse_requirement_dsl("require_group(1, a, b)", &err);
  expect(g && g->kind == dgate::NodeKind::at_least && g->min == 1, "require_group alias");

  const auto rendered = dgate::requirement_to_dsl(*t);
  auto again = dgate::parse_requirement_dsl(rendered, &err);
  expect(again && *again == *t, "rendered DSL parses back: " + rendered);
}

void test_dsl_errors_are_positioned() {
  dgate::GateError err;
  expect(!dgate::parse_requirement_dsl("a &&", &err) && err.code == dgate::ErrorCode::spec_invalid &&
             err.message.find("offset 4") != std::string::npos,
         "missing operand reported at end: " + err.message);
  expect(!dgate::parse_requirement_dsl("a & b", &err) && err.message.find("offset 2") != std::string::npos,
         "single ampersand reported");
  expect(!dgate::parse_requirement_dsl("frobnicate(a)", &err) &&
             err.message.find("unknown function") != std::string::npos,
         "unknown function");
  expect(!dgate::parse_requirement_dsl("   ", &err), "empty expression");
  expect(!dgate::parse_requirement_dsl("(a", &err), "unbalanced parenthesis");
  expect(!dgate::parse_requirement_dsl("a b", &err), "trailing token");
  expect(!dgate::parse_requirement_dsl("at_least(x, a)", &err), "group count must be a number");
}

void test_dsl_limits() {
  dgate::GateError err;
  std::string deep = std::string(40, '(') + "a" + std::string(40, ')');
  expect(!dgate::parse_requirement_dsl(deep, &err) && err.code == dgate::ErrorCode::spec_over_limit,
         "nesting limit on parentheses");
  std::string nots(100000, '!');
  expect(!dgate::parse_requirement_dsl(nots + "a", &err) && err.code == dgate::ErrorCode::spec_over_limit,
         "input size limit");
  dgate::DslLimits small;
  small.max_nesting = 3;
  expect(!dgate::parse_requirement_dsl("!!!!a", &err, small) && err.code == dgate::ErrorCode::spec_over_limit,
         "nesting limit on negation");
  expect(dgate::parse_requirement_dsl("!!!a", &err, small).has_value(), "within nesting limit");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_defaults_and_warnings() {
  auto r = dgate::load_engine_config("");
  expect(r.ok && r.config.default_max_parallelism == 8, "empty input gives defaults");

  r = dgate::load_engine_config(R"({"config_version":"1","default_max_parallelism":4,"mystery":true})");
  expect(r.ok, "config with unknown key loads");
  expect(r.config.default_max_parallelism == 4, "field applied");
  expect(r.warnings.size() == 1 && r.warnings[0].find("mystery") != std::string::npos,
         "unknown key is a warning");
  expect(r.config_version == "1", "config version recorded");
}

void test_config_errors() {
  auto r = dgate::load_engine_config(R"({"default_max_parallelism":"four"})");
  expect(!r.ok && !r.errors.empty(), "wrong type is an error");
  r = dgate::load_engine_config(R"({"default_max_parallelism":100})");
  expect(!r.ok, "default above its cap is an error");
  r = dgate::load_engine_config(R"({"default_provider_timeout_ms":0})");
  expect(!r.ok, "zero timeout is an error");
  r = dgate::load_engine_config("{not json");
  expect(!r.ok, "malformed JSON is an error");
}

void test_config_env_overrides() {
  dgate::EngineConfig c;
  ::setenv("DGATE_MAX_PARALLELISM", "3", 1);
  ::setenv("DGATE_PROVIDER_TIMEOUT_MS", "soon", 1);
  std::vector<std::string> warnings;
  dgate::apply_env_overrides(&c, &warnings);
  ::unsetenv("DGATE_MAX_PARALLELISM");
  ::unsetenv("DGATE_PROVIDER_TIMEOUT_MS");
  expect(c.default_max_parallelism == 3, "env override applied");
  expect(c.default_provider_timeout_ms == 2000, "malformed override skipped");
  expect(warnings.size() == 1, "malformed override warned");

  auto reloaded = dgate::load_engine_config(dgate::engine_config_to_json(c));
  expect(reloaded.ok && reloaded.config.default_max_parallelism == 3, "config JSON round trip");
}

// ============================================================================
// Scenario specs
// ============================================================================

std::optional<dgate::ScenarioSpec> load(const std::string& json, dgate::GateError* err,
                                        const dgate::EngineConfig& config = dgate::EngineConfig{}) {
  return dgate::load_scenario_spec(json, config, dgate::OperatorTable::standard(), err);
}

void test_spec_load_and_hash() {
  dgate::GateError err;
  auto spec = load(kAgeSpec, &err);
  expect(spec.has_value(), "age spec loads: " + err.message);
  expect(spec->scenario_id.str() == "adult-check", "scenario id");
  expect(spec->on_indeterminate == dgate::IndeterminatePolicy::block, "policy");
  expect(spec->on_budget_exceeded == dgate::BudgetPolicy::proceed, "budget policy defaults to proceed");
  expect(spec->limits.provider_timeout_ms == 2000, "limits default from config");
  const auto h = dgate::compute_spec_hash(*spec);
  expect(dgate::is_hex_digest(h), "spec hash is a digest");

  const char* reordered = R"JSON({"requirement":{"condition":"age_check"},
    "conditions":[{"expected":18,"comparator":"greater_than_or_equal","evidence_id":"age","condition_id":"age_check"}],
    "evidence":[{"provider_id":"kyc","evidence_id":"age"}],
    "policy":{"on_indeterminate":"block"},"spec_version":"1","scenario_id":"adult-check"})JSON";
  auto other = load(reordered, &err);
  expect(other && dgate::compute_spec_hash(*other) == h, "key order does not change the spec hash");
}

void test_spec_dsl_and_tree_hash_alike() {
  dgate::GateError err;
  std::string dsl = kAgeSpec;
  const std::string tree_form = R"JSON({"condition": "age_check"})JSON";
  dsl.replace(dsl.find(tree_form), tree_form.size(), "\"age_check\"");
  auto a = load(kAgeSpec, &err);
  auto b = load(dsl, &err);
  expect(a && b, "both requirement forms load");
  expect(dgate::compute_spec_hash(*a) == dgate::compute_spec_hash(*b), "DSL and tree forms hash alike");
}

void test_spec_canonical_stable() {
  dgate::GateError err;
  auto spec = load(kTwoConditionSpec, &err);
  expect(spec.has_value(), "two-condition spec loads: " + err.message);
  const auto c1 = dgate::spec_to_json(*spec);
  auto again = load(c1, &err);
  expect(again.has_value(), "canonical form reloads: " + err.message);
  expect(dgate::spec_to_json(*again) == c1, "canonical re-serialization is byte-stable");
}

void expect_rejected(const std::string& json, dgate::ErrorCode code, const std::string& what,
                     const dgate::EngineConfig& config = dgate::EngineConfig{}) {
  dgate::GateError err;
  auto spec = load(json, &err, config);
  expect(!spec, what + " must be rejected");
  expect(err.code == code, what + ": expected " + dgate::to_string(code) + ", got " +
                               dgate::to_string(err.code) + " (" + err.message + ")");
}

std::string replace_once(std::string s, const std::string& from, const std::string& to) {
  const auto pos = s.find(from);
  expect(pos != std::string::npos, "fixture contains " + from);
  s.replace(pos, from.size(), to);
  return s;
}

void test_spec_rejections() {
  using dgate::ErrorCode;
  const std::string base = kAgeSpec;
  expect_rejected(replace_once(base, R"("policy": {"on_indeterminate": "block"},)", ""),
                  ErrorCode::spec_invalid, "missing policy");
  expect_rejected(replace_once(base, R"("on_indeterminate": "block")", R"("on_budget_exceeded": "fail")"),
                  ErrorCode::spec_invalid, "missing on_indeterminate");
  expect_rejected(replace_once(base, R"("spec_version": "1",)", R"("spec_version": "1", "extra": 1,)"),
                  ErrorCode::spec_invalid, "unknown top-level key");
  expect_rejected(replace_once(base, R"({"condition": "age_check"})", R"({"condition": "ghost"})"),
                  ErrorCode::spec_invalid, "dangling requirement leaf");
  expect_rejected(replace_once(base, R"("evidence_id": "age",)", R"("evidence_id": "dob",)"),
                  ErrorCode::spec_invalid, "condition referencing undeclared evidence");
  expect_rejected(replace_once(base, "greater_than_or_equal", "exists"), ErrorCode::spec_invalid,
                  "unknown comparator");
  expect_rejected(replace_once(base, R"("expected": 18)", R"("expected": null)"), ErrorCode::spec_invalid,
                  "null expected value");
  expect_rejected(replace_once(replace_once(base, "greater_than_or_equal", "in_set"), R"("expected": 18)",
                               R"("expected": "eu")"),
                  ErrorCode::spec_invalid, "in_set with a scalar expected value");
  expect_rejected(replace_once(base, R"("scenario_id": "adult-check")", R"("scenario_id": "adult check")"),
                  ErrorCode::spec_invalid, "invalid scenario id");
  expect_rejected(replace_once(base, R"("spec_version": "1",)",
                               R"("spec_version": "1", "limits": {"max_parallelism": 1000},)"),
                  ErrorCode::spec_over_limit, "limit above engine cap");
  expect_rejected(replace_once(base, R"("spec_version": "1",)",
                               R"("spec_version": "1", "limits": {"global_budget_ms": 0},)"),
                  ErrorCode::spec_invalid, "zero budget");
  expect_rejected(
      replace_once(base, R"([{"evidence_id": "age", "provider_id": "kyc", "params": {}}])",
                   R"([{"evidence_id": "age", "provider_id": "kyc"}, {"evidence_id": "age", "provider_id": "kyc"}])"),
      ErrorCode::spec_invalid, "duplicate evidence id");
  expect_rejected(
      replace_once(replace_once(base, R"("spec_version": "1",)", R"("spec_version": "1", "limits": {"max_evidence": 1},)"),
                   R"([{"evidence_id": "age", "provider_id": "kyc", "params": {}}])",
                   R"([{"evidence_id": "age", "provider_id": "kyc"}, {"evidence_id": "dob", "provider_id": "kyc"}])"),
      ErrorCode::spec_over_limit, "evidence count above max_evidence");

  dgate::EngineConfig tiny;
  tiny.max_spec_bytes = 64;
  expect_rejected(base, ErrorCode::spec_over_limit, "spec document above max_spec_bytes", tiny);
  expect_rejected("{\"scenario_id\":", ErrorCode::spec_invalid, "truncated JSON");

  dgate::OperatorTable equals_only;
  equals_only.enabled.insert(dgate::ComparatorOp::equals);
  dgate::GateError err;
  expect(!dgate::load_scenario_spec(base, dgate::EngineConfig{}, equals_only, &err) &&
             err.code == ErrorCode::spec_invalid && !err.subjects.empty() && err.subjects[0] == "age_check",
         "disabled comparator rejected and named");
}

void test_spec_duplicate_condition_named() {
  const std::string dup = replace_once(
      kAgeSpec, R"("expected": 18}])",
      R"("expected": 18}, {"condition_id": "age_check", "evidence_id": "age", "comparator": "equals", "expected": 1}])");
  dgate::GateError err;
  expect(!load(dup, &err) && err.code == dgate::ErrorCode::spec_invalid, "duplicate condition rejected");
  expect(err.subjects.size() == 1 && err.subjects[0] == "age_check", "duplicate condition named in subjects");
}

// "[[...[1]...]]" with `levels` brackets on each side.
std::string nested_list_json(std::size_t levels) {
  return std::string(levels, '[') + "1" + std::string(levels, ']');
}

EvidenceValue nested_list_value(std::size_t levels) {
  EvidenceValue v = num("1");
  for (std::size_t i = 0; i < levels; ++i) v = EvidenceValue::list({v});
  return v;
}

void test_spec_value_nesting_bounded() {
  using dgate::ErrorCode;
  const std::size_t cap = dgate::kMaxValueNesting;
  const std::string in_list = replace_once(kAgeSpec, "greater_than_or_equal", "deep_equals");

  dgate::GateError err;
  auto spec = load(replace_once(in_list, R"("expected": 18)", R"("expected": )" + nested_list_json(cap)), &err);
  expect(spec.has_value(), "expected value at the nesting bound loads: " + err.message);
  expect(dgate::evidence_nesting(spec->conditions[0].expected) == cap, "nesting measured in list levels");

  expect_rejected(replace_once(in_list, R"("expected": 18)", R"("expected": )" + nested_list_json(cap + 1)),
                  ErrorCode::spec_over_limit, "expected value nested past the bound");
  expect_rejected(replace_once(kAgeSpec, R"("params": {})", R"("params": {"shape": )" + nested_list_json(cap) + "}"),
                  ErrorCode::spec_over_limit, "params nested past the bound");
  spec = load(replace_once(kAgeSpec, R"("params": {})", R"("params": {"shape": )" + nested_list_json(cap - 1) + "}"),
              &err);
  expect(spec.has_value(), "params at the nesting bound load: " + err.message);
}

void test_spec_depth_cap_ceiling() {
  auto r = dgate::load_engine_config(R"({"max_depth_cap":)" + std::to_string(dgate::kMaxDepthCapCeiling + 1) + "}");
  expect(!r.ok, "max_depth_cap above the ceiling is a config error");
  r = dgate::load_engine_config(R"({"max_depth_cap":)" + std::to_string(dgate::kMaxDepthCapCeiling) + "}");
  expect(r.ok, "max_depth_cap at the ceiling is accepted");

  // An unvalidated config cannot lift the ceiling either.
  dgate::EngineConfig wide;
  wide.max_depth_cap = 1000;
  expect_rejected(replace_once(kAgeSpec, R"("spec_version": "1",)",
                               R"("spec_version": "1", "limits": {"max_depth": 100},)"),
                  dgate::ErrorCode::spec_over_limit, "max_depth above the ceiling", wide);
}

// ============================================================================
// Providers and orchestration
// ============================================================================

dgate::OrchestrationOptions fast_options() {
  dgate::OrchestrationOptions o;
  o.max_parallelism = 4;
  o.provider_timeout_ms = 1000;
  o.global_budget_ms = 5000;
  o.max_retries = 0;
  o.retry_backoff_ms = 1;
  return o;
}

void test_provider_registry() {
  dgate::ProviderRegistry registry;
  auto p = static_provider({{"a", num("1")}});
  expect(registry.register_provider(pid("static"), p), "first registration");
  expect(!registry.register_provider(pid("static"), p), "duplicate id refused");
  expect(!registry.register_provider(pid("other"), nullptr), "null provider refused");
  expect(registry.contains(pid("static")) && registry.size() == 1, "registry contents");
  expect(registry.find(pid("static"))->provider_kind() == "static", "provider kind");
}

void test_static_provider_lookup() {
  auto p = static_provider({{"age", num("21")}, {"alias", txt("x")}});
  dgate::FetchContext ctx{std::chrono::steady_clock::now() + std::chrono::seconds(1), {}, 1};
  auto by_id = p->fetch(eid("age"), {}, ctx);
  expect(by_id.ok && dgate::values_equal(by_id.value, num("21")), "lookup by evidence id");
  dgate::jsonlite::Object params;
  params["key"] = "alias";
  auto by_key = p->fetch(eid("age"), params, ctx);
  expect(by_key.ok && dgate::values_equal(by_key.value, txt("x")), "lookup by params.key");
  auto missing = p->fetch(eid("nope"), {}, ctx);
  expect(!missing.ok && missing.error == dgate::ProviderErrorKind::invalid_params, "unknown key");
}

void test_orchestration_unconfigured_provider() {
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("kyc"), static_provider({{"age", num("30")}}));
  dgate::EvidenceOrchestrator orch(registry, fast_options());
  auto r = orch.gather({bind("age", "kyc"), bind("region", "geo")}, dgate::CancellationToken{});
  expect(r.records.size() == 2, "one record per binding");
  const auto* region = r.find("region");
  expect(region && region->status == dgate::EvidenceStatus::unconfigured && region->value.is_missing(),
         "unregistered provider gives unconfigured Missing");
  expect(r.dispatch_order.size() == 1 && r.dispatch_order[0] == "age", "unconfigured never dispatched");
  expect(r.find("age")->available(), "configured evidence fetched");
}

void test_orchestration_timeout() {
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("slow"), sleepy_provider(2000, num("1")));
  registry.register_provider(pid("fast"), static_provider({{"quick", num("2")}}));
  auto slow = bind("late", "slow");
  slow.timeout_ms = 20;
  dgate::EvidenceOrchestrator orch(registry, fast_options());
  const auto t0 = std::chrono::steady_clock::now();
  auto r = orch.gather({slow, bind("quick", "fast")}, dgate::CancellationToken{});
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  expect(r.find("late")->status == dgate::EvidenceStatus::timeout, "slow provider times out");
  expect(r.find("late")->value.is_missing(), "timed out evidence is Missing");
  expect(r.find("quick")->available(), "fast sibling unaffected");
  expect(!r.budget_exceeded, "timeout is not a budget overrun");
  expect(elapsed < std::chrono::milliseconds(1500), "gather does not wait for the slow provider");
}

void test_orchestration_retries() {
  auto calls = std::make_shared<std::atomic<int>>(0);
  dgate::ProviderRegistry registry;
  registry.register_provider(
      pid("flaky"), std::make_shared<dgate::FunctionEvidenceProvider>(
                        [calls](const dgate::EvidenceId&, const dgate::jsonlite::Object&,
                                const dgate::FetchContext&) {
                          if (calls->fetch_add(1) < 2) {
                            return dgate::ProviderResult::failure(dgate::ProviderErrorKind::unreachable,
                                                                  "connection refused");
                          }
                          return dgate::ProviderResult::success(num("7"));
                        }));
  auto opts = fast_options();
  opts.max_retries = 2;
  dgate::EvidenceOrchestrator orch(registry, opts);
  auto r = orch.gather({bind("x", "flaky")}, dgate::CancellationToken{});
  expect(r.find("x")->available(), "succeeds on third attempt");
  expect(r.find("x")->attempts == 3 && r.total_retries == 2, "attempts and retries counted");
}

void test_orchestration_no_retry_for_permanent_errors() {
  auto calls = std::make_shared<std::atomic<int>>(0);
  dgate::ProviderRegistry registry;
  registry.register_provider(
      pid("strict"), std::make_shared<dgate::FunctionEvidenceProvider>(
                         [calls](const dgate::EvidenceId&, const dgate::jsonlite::Object&,
                                 const dgate::FetchContext&) {
                           calls->fetch_add(1);
                           return dgate::ProviderResult::failure(dgate::ProviderErrorKind::denied, "forbidden");
                         }));
  registry.register_provider(
      pid("broken"), std::make_shared<dgate::FunctionEvidenceProvider>(
                         [](const dgate::EvidenceId&, const dgate::jsonlite::Object&,
                            const dgate::FetchContext&) -> dgate::ProviderResult {
                           throw std::runtime_error("socket closed");
                         }));
  auto opts = fast_options();
  opts.max_retries = 3;
  dgate::EvidenceOrchestrator orch(registry, opts);
  auto r = orch.gather({bind("d", "strict"), bind("e", "broken")}, dgate::CancellationToken{});
  expect(calls->load() == 1, "denied is not retried");
  expect(r.find("d")->status == dgate::EvidenceStatus::provider_error, "denied becomes provider_error");
  expect(r.find("e")->status == dgate::EvidenceStatus::provider_error &&
             r.find("e")->error == dgate::ProviderErrorKind::unreachable &&
             r.find("e")->attempts == 4,
         "exceptions are unreachable and retried");
}

void test_orchestration_global_budget() {
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("slow"), sleepy_provider(3000, num("1")));
  auto opts = fast_options();
  opts.global_budget_ms = 40;
  dgate::EvidenceOrchestrator orch(registry, opts);
  auto r = orch.gather({bind("a", "slow"), bind("b", "slow")}, dgate::CancellationToken{});
  expect(r.budget_exceeded, "budget overrun flagged");
  for (const auto& rec : r.records) {
    expect(rec.status == dgate::EvidenceStatus::budget_exceeded && rec.value.is_missing(),
           "unfinished evidence marked budget_exceeded");
  }
}

void test_orchestration_cancellation() {
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("slow"), sleepy_provider(3000, num("1")));
  dgate::CancellationToken cancel;
  std::thread canceller([cancel] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    cancel.cancel();
  });
  dgate::EvidenceOrchestrator orch(registry, fast_options());
  auto r = orch.gather({bind("a", "slow"), bind("b", "slow")}, cancel);
  canceller.join();
  expect(r.cancelled, "cancellation observed");
  for (const auto& rec : r.records) {
    expect(rec.status == dgate::EvidenceStatus::cancelled, "in-flight evidence cancelled");
  }
}

void test_orchestration_parallelism_bound() {
  auto active = std::make_shared<std::atomic<int>>(0);
  auto peak = std::make_shared<std::atomic<int>>(0);
  dgate::ProviderRegistry registry;
  registry.register_provider(
      pid("counted"), std::make_shared<dgate::FunctionEvidenceProvider>(
                          [active, peak](const dgate::EvidenceId&, const dgate::jsonlite::Object&,
                                         const dgate::FetchContext&) {
                            const int now = active->fetch_add(1) + 1;
                            int seen = peak->load();
                            while (now > seen && !peak->compare_exchange_weak(seen, now)) {
                            }
                            std::this_thread::sleep_for(std::chrono::milliseconds(10));
                            active->fetch_sub(1);
                            return dgate::ProviderResult::success(EvidenceValue::boolean(true));
                          }));
  std::vector<dgate::EvidenceBinding> bindings;
  for (int i = 0; i < 10; ++i) bindings.push_back((bind)("e" + std::to_string(i), "counted"));
  auto opts = fast_options();
  opts.max_parallelism = 3;
  dgate::EvidenceOrchestrator orch(registry, opts);
  auto r = orch.gather(bindings, dgate::CancellationToken{});
  expect(peak->load() <= 3, "never more than 3 concurrent fetches");
  expect(r.peak_inflight <= 3 && r.peak_inflight >= 1, "peak inflight reported within bound");
  for (const auto& rec : r.records) expect(rec.available(), "all evidence fetched");
}

void test_timed_out_fetch_frees_its_slot() {
  auto hung_running = std::make_shared<std::atomic<bool>>(false);
  auto overlapped = std::make_shared<std::atomic<bool>>(false);
  dgate::ProviderRegistry registry;
  registry.register_provider(
      pid("hung"), std::make_shared<dgate::FunctionEvidenceProvider>(
                       [hung_running](const dgate::EvidenceId&, const dgate::jsonlite::Object&,
                                      const dgate::FetchContext&) {
                         hung_running->store(true);
                         std::this_thread::sleep_for(std::chrono::milliseconds(300));
                         hung_running->store(false);
                         return dgate::ProviderResult::success(num("1"));
                       }));
  registry.register_provider(
      pid("next"), std::make_shared<dgate::FunctionEvidenceProvider>(
                       [hung_running, overlapped](const dgate::EvidenceId&, const dgate::jsonlite::Object&,
                                                  const dgate::FetchContext&) {
                         overlapped->store(hung_running->load());
                         return dgate::ProviderResult::success(num("2"));
                       }));
  auto hung = bind("stuck", "hung");
  hung.timeout_ms = 20;
  auto opts = fast_options();
  opts.max_parallelism = 1;
  dgate::EvidenceOrchestrator orch(registry, opts);
  const auto t0 = std::chrono::steady_clock::now();
  auto r = orch.gather({hung, bind("after", "next")}, dgate::CancellationToken{});
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  expect(r.find("stuck")->status == dgate::EvidenceStatus::timeout, "hung fetch times out");
  expect(r.find("after")->available(), "next binding dispatched into the freed slot");
  expect(elapsed < std::chrono::milliseconds(250), "no wait for the abandoned worker");
  expect(overlapped->load(), "abandoned worker still running beside the live fetch");
  expect(r.peak_inflight == 1, "live fetches stay within the bound");
}

void test_orchestration_dispatch_order() {
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("s"), static_provider({{"z", num("1")}, {"a", num("2")}, {"m", num("3")}}));
  auto opts = fast_options();
  opts.max_parallelism = 1;
  dgate::EvidenceOrchestrator orch(registry, opts);
  auto r = orch.gather({bind("z", "s"), bind("a", "s"), bind("m", "s")}, dgate::CancellationToken{});
  expect((r.dispatch_order == std::vector<std::string>{"z", "a", "m"}), "dispatch follows declaration order");
  expect(r.records[0].evidence_id.str() == "a" && r.records[1].evidence_id.str() == "m" &&
             r.records[2].evidence_id.str() == "z",
         "records sorted by evidence id");
  expect(r.peak_inflight == 1, "parallelism 1 is sequential");
}

// ============================================================================
// Gate engine
// ============================================================================

void test_gate_end_to_end_adult() {
  auto registry = kyc_registry(num("21"));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  expect(gate.phase() == dgate::GatePhase::pending, "new gate is pending");
  const auto state = gate.start(kAgeSpec);
  expect(state.phase == dgate::GatePhase::decided && state.outcome == TriState::True,
         "age 21 >= 18 decides true: " + dgate::gate_state_to_json(state));
  expect(gate.phase() == dgate::GatePhase::decided, "phase published");
  expect(state.reason == "requirement satisfied", "reason");

  auto pack = gate.take_runpack();
  expect(pack.has_value(), "decided run yields a runpack");
  const auto& steps = pack->steps();
  expect(steps.size() == 4, "spec_loaded, evidence_fetched, condition_evaluated, decided");
  expect(steps[0].kind == dgate::StepKind::spec_loaded && steps[1].kind == dgate::StepKind::evidence_fetched &&
             steps[2].kind == dgate::StepKind::condition_evaluated && steps[3].kind == dgate::StepKind::decided,
         "step kinds in order");
  expect(pack->fingerprint() == state.fingerprint && pack->spec_hash() == state.spec_hash,
         "state carries the pack identity");
  expect(dgate::verify_runpack(*pack).ok, "runpack verifies");
  expect(steps[2].payload.find("\"result\":\"true\"") != std::string::npos, "condition step records result");
  expect(!gate.take_runpack().has_value(), "runpack moved out once");
}

void test_gate_provider_timeout_blocks() {
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("kyc"), sleepy_provider(2000, num("21")));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  const auto state = gate.start(age_spec_with("block", 20));
  expect(state.phase == dgate::GatePhase::blocked, "timeout blocks the gate");
  expect(state.reason == "age_check: evidence unavailable", "blocked reason: " + state.reason);
  expect(state.subjects == std::vector<std::string>{"age_check"}, "blocked subjects");
  auto pack = gate.take_runpack();
  expect(pack && pack->steps().back().kind == dgate::StepKind::blocked, "blocked step seals the pack");
  expect(pack->steps()[1].payload.find("\"status\":\"timeout\"") != std::string::npos,
         "evidence step records the timeout");
}

void test_gate_decide_false_policy() {
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("kyc"), sleepy_provider(2000, num("21")));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  const auto state = gate.start(age_spec_with("decide_false", 20));
  expect(state.phase == dgate::GatePhase::decided && state.outcome == TriState::False,
         "indeterminate decided false under decide_false");
  expect(state.reason.find("age_check: evidence unavailable") != std::string::npos, "reason names the gap");
}

void test_gate_decided_false() {
  auto registry = kyc_registry(num("17"));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  const auto state = gate.start(kAgeSpec);
  expect(state.phase == dgate::GatePhase::decided && state.outcome == TriState::False, "17 < 18");
  expect(state.reason == "requirement not satisfied: age_check", "false reason: " + state.reason);
}

void test_gate_type_mismatch_blocks() {
  auto registry = kyc_registry(txt("twenty-one"));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  const auto state = gate.start(kAgeSpec);
  expect(state.phase == dgate::GatePhase::blocked, "text vs number blocks");
  expect(state.reason == "age_check: comparison indeterminate", "reason: " + state.reason);
}

void test_gate_composite_tree_step() {
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("ci"), static_provider({{"coverage", num("0.85")}, {"branch", txt("main")}}));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  const auto state = gate.start(kTwoConditionSpec);
  expect(state.phase == dgate::GatePhase::decided && state.outcome == TriState::True, "release gate passes");
  auto pack = gate.take_runpack();
  expect(pack && pack->steps().size() == 7, "composite root adds a tree_evaluated step");
  expect(pack->steps()[5].kind == dgate::StepKind::tree_evaluated, "tree step before the terminal step");
  expect(gate.conditions().size() == 2 && gate.conditions()[0].condition_id == "coverage_ok",
         "condition outcomes in declaration order");
  expect(gate.evaluation().plan.entries.size() == 3, "plan kept on the gate");
}

void test_gate_optional_condition() {
  const char* spec = R"JSON({
    "scenario_id": "optional-check", "spec_version": "1",
    "policy": {"on_indeterminate": "block"},
    "evidence": [{"evidence_id": "signoff", "provider_id": "nowhere"},
                 {"evidence_id": "tests", "provider_id": "ci"}],
    "conditions": [
      {"condition_id": "signed", "evidence_id": "signoff", "comparator": "equals",
       "expected": true, "required": false},
      {"condition_id": "green", "evidence_id": "tests", "comparator": "equals", "expected": true}
    ],
    "requirement": "signed || green"
  })JSON";
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("ci"), static_provider({{"tests", EvidenceValue::boolean(true)}}));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  const auto state = gate.start(spec);
  expect(state.phase == dgate::GatePhase::decided && state.outcome == TriState::True,
         "optional missing evidence does not block: " + dgate::gate_state_to_json(state));
  expect(gate.conditions()[0].result == TriState::False, "optional missing resolves to False");

  const std::string only_optional = replace_once(spec, "\"signed || green\"", "\"signed\"");
  dgate::Gate second(dgate::EngineConfig{}, registry);
  const auto s2 = second.start(only_optional);
  expect(s2.phase == dgate::GatePhase::decided && s2.outcome == TriState::False,
         "optional-only requirement decides false rather than blocking");
}

const char* kBudgetSpecTemplate = R"JSON({
  "scenario_id": "budgeted", "spec_version": "1",
  "policy": {"on_indeterminate": "block", "on_budget_exceeded": "POLICY"},
  "limits": {"global_budget_ms": 40, "provider_timeout_ms": 5000},
  "evidence": [{"evidence_id": "slow_a", "provider_id": "slow"},
               {"evidence_id": "fast_b", "provider_id": "fast"}],
  "conditions": [
    {"condition_id": "a_ok", "evidence_id": "slow_a", "comparator": "equals", "expected": 1},
    {"condition_id": "b_ok", "evidence_id": "fast_b", "comparator": "equals", "expected": 2}
  ],
  "requirement": "a_ok && b_ok"
})JSON";

void test_gate_budget_fail_policy() {
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("slow"), sleepy_provider(3000, num("1")));
  registry.register_provider(pid("fast"), static_provider({{"fast_b", num("2")}}));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  const auto state = gate.start(replace_once(kBudgetSpecTemplate, "POLICY", "fail"));
  expect(state.phase == dgate::GatePhase::failed && state.error == dgate::ErrorCode::budget_exceeded,
         "budget overrun fails under fail policy: " + dgate::gate_state_to_json(state));
  expect(state.subjects == std::vector<std::string>{"slow_a"}, "unresolved evidence named");
  auto pack = gate.take_runpack();
  expect(pack && pack->steps().back().kind == dgate::StepKind::failed && dgate::verify_runpack(*pack).ok,
         "failed run still seals a verifiable pack");
}

void test_gate_budget_proceed_policy() {
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("slow"), sleepy_provider(3000, num("1")));
  registry.register_provider(pid("fast"), static_provider({{"fast_b", num("2")}}));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  const auto state = gate.start(replace_once(kBudgetSpecTemplate, "POLICY", "proceed"));
  expect(state.phase == dgate::GatePhase::blocked, "partial evidence evaluated and blocks");
  expect(state.budget_exceeded, "budget flag carried in the terminal state");
  expect(state.subjects == std::vector<std::string>{"a_ok"}, "only the starved condition is named");
}

void test_gate_cancellation() {
  dgate::ProviderRegistry registry;
  registry.register_provider(pid("kyc"), sleepy_provider(3000, num("21")));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  std::thread canceller([&gate] {
    while (gate.phase() != dgate::GatePhase::evaluating) std::this_thread::yield();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    gate.cancel();
  });
  const auto state = gate.start(kAgeSpec);
  canceller.join();
  expect(state.phase == dgate::GatePhase::failed && state.error == dgate::ErrorCode::cancelled,
         "cancel ends in Failed(cancelled)");
  expect(state.fingerprint.empty() && !gate.take_runpack().has_value(), "cancelled run has no runpack");
}

void test_gate_lifecycle() {
  auto registry = kyc_registry(num("40"));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  const auto first = gate.start(kAgeSpec);
  const auto second = gate.start(kAgeSpec);
  expect(second.phase == dgate::GatePhase::failed && second.error == dgate::ErrorCode::lifecycle_violation,
         "second start refused");
  expect(gate.state().phase == dgate::GatePhase::decided && gate.state().fingerprint == first.fingerprint,
         "terminal state untouched by misuse");
  gate.cancel();
  expect(gate.phase() == dgate::GatePhase::decided, "cancel after terminal has no effect");
}

void test_gate_invalid_spec() {
  const auto invalid_before = dgate::global_engine_stats().failures_for("spec_invalid");
  auto registry = kyc_registry(num("40"));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  const auto state = gate.start(replace_once(kAgeSpec, R"({"condition": "age_check"})", R"({"condition": "nope"})"));
  expect(state.phase == dgate::GatePhase::failed && state.error == dgate::ErrorCode::spec_invalid,
         "invalid spec fails");
  expect(state.subjects == std::vector<std::string>{"nope"}, "offending id named");
  expect(!gate.take_runpack().has_value(), "no runpack for an invalid spec");
  expect(dgate::global_engine_stats().failures_for("spec_invalid") == invalid_before + 1,
         "failure counted under its error code");
  expect(dgate::global_engine_stats().failures_for("no_such_code") == 0, "unknown code counts zero");
}

void test_gate_determinism() {
  std::string fingerprint;
  std::string plan;
  for (int i = 0; i < 5; ++i) {
    dgate::ProviderRegistry registry;
    registry.register_provider(pid("ci"), static_provider({{"coverage", num("0.5")}, {"branch", txt("main")}}));
    dgate::Gate gate(dgate::EngineConfig{}, registry);
    const auto state = gate.start(kTwoConditionSpec);
    expect(state.outcome == TriState::False, "coverage 0.5 fails");
    const auto this_plan = dgate::jsonlite::to_json(dgate::plan_to_json(gate.evaluation().plan));
    if (i == 0) {
      fingerprint = state.fingerprint;
      plan = this_plan;
    }
    expect(state.fingerprint == fingerprint, "same inputs give the same fingerprint");
    expect(this_plan == plan, "same inputs give the same plan");
  }
}

std::vector<dgate::GateEvent> g_captured_events;
void capture_event(const dgate::GateEvent& ev) { g_captured_events.push_back(ev); }

void test_gate_emits_one_event() {
  auto& stats = dgate::global_engine_stats();
  const auto runs_before = stats.total_runs.load();
  const auto true_before = stats.decided_true.load();
  g_captured_events.clear();
  dgate::set_gate_event_hook(capture_event);
  {
    auto registry = kyc_registry(num("21"));
    dgate::Gate gate(dgate::EngineConfig{}, registry);
    gate.start(kAgeSpec);
  }
  dgate::set_gate_event_hook(nullptr);
  expect(g_captured_events.size() == 1, "exactly one event per run");
  const auto& ev = g_captured_events[0];
  expect(ev.scenario_id == "adult-check" && ev.phase == "decided" && ev.outcome == "true", "event fields");
  expect(ev.evidence_count == 1 && ev.evidence_missing == 0 && ev.runpack_steps == 4, "event counts");
  expect(dgate::gate_event_to_json(ev).find("\"value\"") == std::string::npos,
         "events carry no evidence values");
  expect(stats.total_runs.load() == runs_before + 1 && stats.decided_true.load() == true_before + 1,
         "stats updated");
}

// ============================================================================
// Runpack
// ============================================================================

dgate::jsonlite::Value payload(const std::string& key, const std::string& value) {
  dgate::jsonlite::Object o;
  o[key] = value;
  return dgate::jsonlite::Value{std::move(o)};
}

dgate::Runpack sample_pack(const std::string& tag = "x") {
  dgate::Runpack pack("scenario-" + tag, dgate::spec_hash(tag));
  dgate::GateError err;
  expect(pack.append(dgate::StepKind::spec_loaded, payload("spec", tag), &err), "append spec_loaded");
  expect(pack.append(dgate::StepKind::evidence_fetched, payload("evidence_id", "e1"), &err), "append evidence");
  expect(pack.append(dgate::StepKind::condition_evaluated, payload("result", "true"), &err), "append condition");
  expect(pack.append(dgate::StepKind::decided, payload("outcome", "true"), &err), "append decided");
  expect(pack.seal(&err).has_value(), "seal");
  return pack;
}

void test_runpack_chain() {
  const auto pack = sample_pack();
  const auto& steps = pack.steps();
  expect(steps[0].prev_hash == dgate::kGenesisHash, "first step chains to genesis");
  for (std::size_t i = 1; i < steps.size(); ++i) {
    expect(steps[i].prev_hash == steps[i - 1].hash, "each step chains to its predecessor");
    expect(steps[i].index == i, "indices are sequential");
  }
  expect(pack.fingerprint() == steps.back().hash, "fingerprint is the chain head");
  expect(dgate::verify_runpack(pack).ok, "intact pack verifies");

  dgate::Runpack empty("s", dgate::spec_hash("s"));
  auto fp = empty.seal();
  expect(fp && *fp == dgate::kGenesisHash && dgate::verify_runpack(empty).ok, "empty pack seals to genesis");
}

void test_runpack_append_rules() {
  auto pack = sample_pack();
  dgate::GateError err;
  expect(!pack.append(dgate::StepKind::decided, payload("k", "v"), &err) &&
             err.code == dgate::ErrorCode::post_seal_append,
         "append after seal rejected");
  expect(!pack.seal(&err) && err.code == dgate::ErrorCode::lifecycle_violation, "double seal rejected");
  expect(pack.steps().size() == 4, "rejected append left the pack untouched");

  dgate::Runpack open("s", dgate::spec_hash("s"));
  expect(open.append(dgate::StepKind::blocked, payload("reason", "r"), &err), "terminal step accepted");
  expect(!open.append(dgate::StepKind::condition_evaluated, payload("k", "v"), &err) &&
             err.code == dgate::ErrorCode::lifecycle_violation,
         "nothing follows a terminal step");
  expect(!dgate::verify_runpack(open).ok, "unsealed pack does not verify");
}

void test_runpack_tamper_detection() {
  const auto pack = sample_pack();

  auto steps = pack.steps();
  steps[1].payload = R"({"evidence_id":"e2"})";
  auto edited = dgate::Runpack::from_parts(pack.scenario_id(), pack.spec_hash(), steps, pack.fingerprint());
  auto v = dgate::verify_runpack(edited);
  expect(!v.ok && v.first_divergent_index && *v.first_divergent_index == 1, "edited payload located");

  steps = pack.steps();
  steps.erase(steps.begin() + 2);
  auto dropped = dgate::Runpack::from_parts(pack.scenario_id(), pack.spec_hash(), steps, pack.fingerprint());
  v = dgate::verify_runpack(dropped);
  expect(!v.ok && v.first_divergent_index && *v.first_divergent_index == 2, "removed step located");

  steps = pack.steps();
  std::swap(steps[1], steps[2]);
  auto swapped = dgate::Runpack::from_parts(pack.scenario_id(), pack.spec_hash(), steps, pack.fingerprint());
  expect(!dgate::verify_runpack(swapped).ok, "reordered steps rejected");

  auto forged = dgate::Runpack::from_parts(pack.scenario_id(), pack.spec_hash(), pack.steps(),
                                           std::string(64, 'f'));
  v = dgate::verify_runpack(forged);
  expect(!v.ok && v.first_divergent_index && *v.first_divergent_index == 3, "forged fingerprint rejected");
}

void test_runpack_serialization() {
  const auto pack = sample_pack("ser");
  const auto json = dgate::runpack_to_json(pack);
  dgate::GateError err;
  auto back = dgate::runpack_from_json(json, &err);
  expect(back.has_value(), "serialized pack loads: " + err.message);
  expect(back->fingerprint() == pack.fingerprint() && back->steps().size() == pack.steps().size(),
         "identity preserved");
  expect(dgate::verify_runpack(*back).ok, "loaded pack verifies");
  expect(dgate::runpack_to_json(*back) == json, "serialization is stable");

  const std::string newer = replace_once(json, "\"format_version\":1", "\"format_version\":99");
  expect(!dgate::runpack_from_json(newer, &err) && err.code == dgate::ErrorCode::runpack_format_mismatch,
         "unknown format version rejected");

  const std::string edited = replace_once(json, "\"evidence_id\":\"e1\"", "\"evidence_id\":\"e9\"");
  auto tampered = dgate::runpack_from_json(edited, &err);
  expect(tampered && !dgate::verify_runpack(*tampered).ok, "tampering survives the round trip and fails verify");
}

void test_gate_runpack_round_trip() {
  auto registry = kyc_registry(num("21"));
  dgate::Gate gate(dgate::EngineConfig{}, registry);
  const auto state = gate.start(kAgeSpec);
  auto pack = gate.take_runpack();
  expect(pack.has_value(), "pack available");
  dgate::GateError err;
  auto back = dgate::runpack_from_json(dgate::runpack_to_json(*pack), &err);
  expect(back && dgate::verify_runpack(*back).ok && back->fingerprint() == state.fingerprint,
         "gate runpack survives serialization");
}

// Every nesting dimension at its bound: expected value, params, and an
// at_least chain (three JSON levels per tree level) down to the depth cap.
std::string deepest_spec() {
  const std::size_t cap = dgate::kMaxValueNesting;
  std::string tree = R"({"condition": "same"})";
  for (std::uint32_t i = 1; i < dgate::kMaxDepthCapCeiling; ++i) {
    tree = R"({"at_least": {"min": 1, "of": [)" + tree + "]}}";
  }
  return R"({"scenario_id": "deep", "spec_version": "1", "policy": {"on_indeterminate": "block"},)"
         R"("evidence": [{"evidence_id": "blob", "provider_id": "p", "params": {"shape": )" +
         nested_list_json(cap - 1) + R"(}}],)"
         R"("conditions": [{"condition_id": "same", "evidence_id": "blob", "comparator": "deep_equals",)"
         R"("expected": )" + nested_list_json(cap) + R"(}],)"
         R"("requirement": )" + tree + "}";
}

void expect_runpack_reloads(dgate::Gate& gate, const dgate::GateState& state) {
  auto pack = gate.take_runpack();
  expect(pack.has_value(), "runpack sealed");
  dgate::GateError err;
  auto back = dgate::runpack_from_json(dgate::runpack_to_json(*pack), &err);
  expect(back.has_value(), "runpack reloads: " + err.message);
  expect(dgate::verify_runpack(*back).ok && back->fingerprint() == state.fingerprint,
         "reloaded runpack verifies");
}

void test_gate_deepest_spec_runpack_reloads() {
  const std::string spec = deepest_spec();
  {
    dgate::ProviderRegistry registry;
    registry.register_provider(pid("p"), static_provider({{"blob", nested_list_value(dgate::kMaxValueNesting)}}));
    dgate::Gate gate(dgate::EngineConfig{}, registry);
    const auto state = gate.start(spec);
    expect(state.phase == dgate::GatePhase::decided && state.outcome == TriState::True,
           "deepest spec decides: " + state.reason);
    expect_runpack_reloads(gate, state);
  }
  {
    dgate::ProviderRegistry registry;
    registry.register_provider(pid("p"),
                               static_provider({{"blob", nested_list_value(dgate::kMaxValueNesting + 1)}}));
    dgate::Gate gate(dgate::EngineConfig{}, registry);
    const auto state = gate.start(spec);
    expect(state.phase == dgate::GatePhase::blocked, "over-nested provider value blocks");
    const auto* record = gate.evidence().find("blob");
    expect(record && record->status == dgate::EvidenceStatus::provider_error &&
               record->error == dgate::ProviderErrorKind::malformed_value,
           "over-nested value recorded as malformed");
    expect_runpack_reloads(gate, state);
  }
}

// ============================================================================
// Runpack store
// ============================================================================

void test_store_put_get() {
  dgate::InMemoryRunpackStore store;
  const auto pack = sample_pack("store");
  dgate::GateError err;
  expect(store.put_runpack(pack, &err), "put: " + err.message);
  expect(store.put_runpack(pack, &err), "put is idempotent");
  expect(store.size() == 1 && store.contains(pack.fingerprint()), "stored once");
  auto back = store.get_runpack(pack.fingerprint(), &err);
  expect(back && back->fingerprint() == pack.fingerprint(), "get returns the pack");
  auto info = store.info(pack.fingerprint());
  expect(info && info->scenario_id == "scenario-store" && info->encoding == "identity", "info");
  expect(store.backend_id() == "memory", "backend id");
}

void test_store_rejections() {
  dgate::InMemoryRunpackStore store;
  dgate::GateError err;
  dgate::Runpack open("s", dgate::spec_hash("s"));
  expect(open.append(dgate::StepKind::spec_loaded, payload("a", "b"), &err), "append");
  expect(!store.put_runpack(open, &err) && err.code == dgate::ErrorCode::lifecycle_violation,
         "unsealed pack refused");

  const auto pack = sample_pack();
  auto forged = dgate::Runpack::from_parts(pack.scenario_id(), pack.spec_hash(), pack.steps(),
                                           std::string(64, 'e'));
  expect(!store.put_runpack(forged, &err) && err.code == dgate::ErrorCode::runpack_integrity_failed,
         "unverifiable pack refused");

  expect(!store.get_runpack(std::string(64, 'a'), &err) && err.code == dgate::ErrorCode::store_not_found,
         "unknown fingerprint");
  expect(store.size() == 0, "nothing stored");
}

class FaultyRunpackStore : public dgate::InMemoryRunpackStore {
 public:
  using dgate::InMemoryRunpackStore::InMemoryRunpackStore;
  using dgate::InMemoryRunpackStore::overwrite_blob;
};

void test_store_corruption_detected() {
  FaultyRunpackStore store;
  const auto pack = sample_pack("corrupt");
  dgate::GateError err;
  expect(store.put_runpack(pack, &err), "put");
  expect(store.overwrite_blob(pack.fingerprint(), "{\"garbage\":true}"), "corrupt");
  expect(!store.overwrite_blob(std::string(64, 'b'), "x"), "unknown fingerprint not overwritten");
  expect(!store.get_runpack(pack.fingerprint(), &err) && err.code == dgate::ErrorCode::store_io,
         "corrupted blob detected on read");
}

void test_store_compression() {
  dgate::InMemoryRunpackStore store("zstd");
  const auto pack = sample_pack("zstd");
  dgate::GateError err;
  expect(store.put_runpack(pack, &err), "put with compression");
  auto info = store.info(pack.fingerprint());
#if defined(DGATE_WITH_ZSTD)
  expect(info && info->encoding == "zstd", "zstd encoding recorded");
#else
  expect(info && info->encoding == "identity", "identity without zstd support");
#endif
  auto back = store.get_runpack(pack.fingerprint(), &err);
  expect(back && dgate::runpack_to_json(*back) == dgate::runpack_to_json(pack), "compressed round trip");
}

// ============================================================================
// Version and observability
// ============================================================================

void test_version_manifest() {
  const auto m = dgate::version::current_manifest();
  expect(m.runpack_format == dgate::version::RUNPACK_FORMAT_VERSION, "manifest runpack format");
  expect(!m.engine_semver.empty() && m.hash_primitive == "blake3", "manifest engine and hash");
  const auto json = dgate::version::manifest_to_json(m);
  expect(json.find("\"runpack_format\":1") != std::string::npos, "manifest JSON: " + json);
  expect(dgate::version::check_runpack_format(1).ok, "current format readable");
  expect(!dgate::version::check_runpack_format(0).ok, "format 0 unreadable");
  expect(!dgate::version::check_runpack_format(2).ok, "future format unreadable");
}

void test_latency_histogram() {
  dgate::LatencyHistogram h;
  h.record(500);
  h.record(2'000'000);
  h.record(3'000'000'000ull);
  expect(h.count() == 3, "three samples");
  expect(h.to_json().find("\"count\":3") != std::string::npos, "histogram JSON: " + h.to_json());

  auto& stats = dgate::global_engine_stats();
  const auto verified = stats.verifications.load();
  const auto failed = stats.verification_failures.load();
  stats.record_verification(true);
  stats.record_verification(false);
  expect(stats.verifications.load() == verified + 2, "verifications counted");
  expect(stats.verification_failures.load() == failed + 1, "verification failures counted");
}

void test_event_log_sink() {
  const auto path = fs::temp_directory_path() / "dgate_events_test.jsonl";
  fs::remove(path);
  dgate::GateEvent ev;
  ev.scenario_id = "log-test";
  ev.phase = "blocked";
  ev.outcome = "indeterminate";
  dgate::emit_gate_event(ev, path.string());
  dgate::emit_gate_event(ev, path.string());
  std::ifstream in(path);
  std::string line;
  int lines = 0;
  while (std::getline(in, line)) {
    ++lines;
    expect(line.find("\"scenario_id\":\"log-test\"") != std::string::npos, "JSONL record: " + line);
  }
  expect(lines == 2, "one line per event");
  fs::remove(path);

  bool found = false;
  for (const auto& e : dgate::global_engine_stats().recent_events_snapshot()) {
    if (e.scenario_id == "log-test") found = true;
  }
  expect(found, "events kept in the recent ring");
}

// ============================================================================
// Adversarial inputs
// ============================================================================

std::string random_bytes(std::mt19937& rng, std::size_t max_len, const std::string& alphabet) {
  std::uniform_int_distribution<std::size_t> len(0, max_len);
  std::uniform_int_distribution<std::size_t> pick(0, alphabet.size() - 1);
  std::string out(len(rng), ' ');
  for (auto& c : out) c = alphabet[pick(rng)];
  return out;
}

void test_adversarial_parsers() {
  std::mt19937 rng(0xd6a7e);
  const std::string json_alphabet = "{}[]\":,0123456789.eE+-truefalsnl \\u\t";
  const std::string dsl_alphabet = "abc_.-()!&|, 0123456789allanyornot";
  dgate::GateError err;
  for (int i = 0; i < 2000; ++i) {
    const auto j = random_bytes(rng, 64, json_alphabet);
    std::optional<dgate::jsonlite::JsonError> jerr;
    dgate::jsonlite::parse_value(j, &jerr);
    load(j, &err);
    dgate::runpack_from_json(j, &err);
    const auto d = random_bytes(rng, 48, dsl_alphabet);
    auto tree = dgate::parse_requirement_dsl(d, &err);
    if (tree) expect(dgate::requirement_node_count(*tree) >= 1, "parsed tree is non-empty");
  }
}

void test_adversarial_spec_mutations() {
  std::mt19937 rng(1337);
  const std::string base = kTwoConditionSpec;
  std::uniform_int_distribution<std::size_t> pos(0, base.size() - 1);
  std::uniform_int_distribution<int> byte(32, 126);
  for (int i = 0; i < 1000; ++i) {
    std::string mutated = base;
    const int flips = 1 + i % 3;
    for (int f = 0; f < flips; ++f) mutated[pos(rng)] = static_cast<char>(byte(rng));
    dgate::GateError err;
    auto spec = load(mutated, &err);
    if (spec) {
      const auto canonical = dgate::spec_to_json(*spec);
      auto again = load(canonical, &err);
      expect(again && dgate::spec_to_json(*again) == canonical, "accepted mutation is canonical-stable");
    } else {
      expect(err.code == dgate::ErrorCode::spec_invalid || err.code == dgate::ErrorCode::spec_over_limit,
             "rejection uses a spec error code: " + dgate::to_string(err.code));
    }
  }
}

RequirementNode random_tree(std::mt19937& rng, int depth, const std::vector<std::string>& ids) {
  std::uniform_int_distribution<int> kind(0, depth <= 0 ? 0 : 4);
  std::uniform_int_distribution<std::size_t> leaf(0, ids.size() - 1);
  std::uniform_int_distribution<int> width(1, 4);
  const int k = kind(rng);
  if (k == 0) return L(ids[leaf(rng)]);
  if (k == 3) return RequirementNode::negate(random_tree(rng, depth - 1, ids));
  std::vector<RequirementNode> children;
  const int n = width(rng);
  for (int i = 0; i < n; ++i) children.push_back(random_tree(rng, depth - 1, ids));
  if (k == 1) return RequirementNode::all(std::move(children));
  if (k == 2) return RequirementNode::any(std::move(children));
  std::uniform_int_distribution<std::uint32_t> min(1, static_cast<std::uint32_t>(n));
  return RequirementNode::at_least(min(rng), std::move(children));
}

// Full evaluation without short-circuiting.
TriState reference_eval(const RequirementNode& node, const dgate::ILeafResolver& r) {
  switch (node.kind) {
    case dgate::NodeKind::condition:
      return r.resolve(node.condition_id);
    case dgate::NodeKind::negate:
      return dgate::tri_not(reference_eval(node.children.front(), r));
    case dgate::NodeKind::all: {
      TriState acc = TriState::True;
      for (const auto& c : node.children) acc = dgate::tri_and(acc, reference_eval(c, r));
      return acc;
    }
    case dgate::NodeKind::any: {
      TriState acc = TriState::False;
      for (const auto& c : node.children) acc = dgate::tri_or(acc, reference_eval(c, r));
      return acc;
    }
    case dgate::NodeKind::at_least: {
      std::size_t trues = 0, unknown = 0;
      for (const auto& c : node.children) {
        const auto t = reference_eval(c, r);
        if (t == TriState::True) ++trues;
        if (t == TriState::Indeterminate) ++unknown;
      }
      if (trues >= node.min) return TriState::True;
      if (trues + unknown < node.min) return TriState::False;
      return TriState::Indeterminate;
    }
  }
  return TriState::Indeterminate;
}

void test_short_circuit_matches_full_evaluation() {
  std::mt19937 rng(42);
  const std::vector<std::string> ids{"a", "b", "c", "d", "e"};
  const TriState values[] = {TriState::True, TriState::False, TriState::Indeterminate};
  std::uniform_int_distribution<int> pick(0, 2);
  for (int i = 0; i < 500; ++i) {
    const auto tree = random_tree(rng, 4, ids);
    dgate::MapLeafResolver r;
    for (const auto& id : ids) r.set(id, values[pick(rng)]);
    const auto e = dgate::evaluate(tree, r);
    expect(e.result == reference_eval(tree, r), "short-circuit result equals full evaluation");
    expect(e.plan.entries.size() == dgate::requirement_node_count(tree), "plan covers every node");
    expect(e.plan.entries.front().result == e.result, "root entry carries the result");
  }
}

void shuffle_groups(RequirementNode* node, std::mt19937& rng) {
  if (node->kind == dgate::NodeKind::all || node->kind == dgate::NodeKind::any ||
      node->kind == dgate::NodeKind::at_least) {
    std::shuffle(node->children.begin(), node->children.end(), rng);
  }
  for (auto& child : node->children) shuffle_groups(&child, rng);
}

void test_child_order_does_not_change_result() {
  std::mt19937 rng(7);
  const std::vector<std::string> ids{"a", "b", "c", "d"};
  const TriState values[] = {TriState::True, TriState::False, TriState::Indeterminate};
  std::uniform_int_distribution<int> pick(0, 2);
  for (int i = 0; i < 300; ++i) {
    const auto tree = random_tree(rng, 4, ids);
    dgate::MapLeafResolver r;
    for (const auto& id : ids) r.set(id, values[pick(rng)]);
    const auto expected = dgate::evaluate(tree, r).result;
    for (int k = 0; k < 5; ++k) {
      auto shuffled = tree;
      shuffle_groups(&shuffled, rng);
      const auto e = dgate::evaluate(shuffled, r);
      expect(e.result == expected, "result independent of child order");
      expect(e.plan.entries.size() == dgate::requirement_node_count(tree), "plan still covers every node");
    }
  }
}

}  // namespace

int main() {
  std::cout << "=== dgate Engine Test Suite ===\n";

  std::cout << "\n[Hashing]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("hash runtime info", test_hash_runtime_info);

  std::cout << "\n[JSON]\n";
  run_test("canonicalization", test_json_canonicalization);
  run_test("strict parsing", test_json_strictness);
  run_test("numbers stay text", test_json_numbers_stay_text);

  std::cout << "\n[Exact Decimals]\n";
  run_test("0.1 + 0.2 == 0.3", test_decimal_point_one_plus_point_two);
  run_test("canonical form", test_decimal_canonical_form);
  run_test("ordering", test_decimal_ordering);
  run_test("bad input rejected", test_decimal_rejects_bad_input);

  std::cout << "\n[Identifiers & Values]\n";
  run_test("identifier rules", test_identifier_rules);
  run_test("evidence JSON mapping", test_evidence_json_mapping);

  std::cout << "\n[Comparator]\n";
  run_test("missing is indeterminate", test_comparator_missing_is_indeterminate);
  run_test("numeric", test_comparator_numeric);
  run_test("type mismatch", test_comparator_type_mismatch);
  run_test("temporal", test_comparator_temporal);
  run_test("lexicographic", test_comparator_lexicographic);
  run_test("contains and in_set", test_comparator_contains_and_in_set);
  run_test("deep equality", test_comparator_deep_equality);
  run_test("operator table", test_operator_table);

  std::cout << "\n[Requirement Trees]\n";
  run_test("Kleene truth tables", test_kleene_truth_tables);
  run_test("short-circuit recorded in plan", test_short_circuit_recorded_in_plan);
  run_test("indeterminate does not short-circuit", test_indeterminate_does_not_short_circuit);
  run_test("at_least group", test_at_least_group);
  run_test("malformed not() is indeterminate", test_malformed_negate_is_indeterminate);
  run_test("child order does not change result (300x)", test_child_order_does_not_change_result);
  run_test("builder validation", test_requirement_validation);
  run_test("plan determinism and rendering", test_plan_determinism_and_rendering);
  run_test("JSON tree form", test_requirement_json_form);

  std::cout << "\n[Requirement DSL]\n";
  run_test("precedence", test_dsl_precedence);
  run_test("function form", test_dsl_function_form);
  run_test("positioned errors", test_dsl_errors_are_positioned);
  run_test("limits", test_dsl_limits);

  std::cout << "\n[Configuration]\n";
  run_test("defaults and warnings", test_config_defaults_and_warnings);
  run_test("errors", test_config_errors);
  run_test("environment overrides", test_config_env_overrides);

  std::cout << "\n[Scenario Specs]\n";
  run_test("load and hash", test_spec_load_and_hash);
  run_test("DSL and tree forms hash alike", test_spec_dsl_and_tree_hash_alike);
  run_test("canonical form stable", test_spec_canonical_stable);
  run_test("rejections", test_spec_rejections);
  run_test("duplicate condition named", test_spec_duplicate_condition_named);
  run_test("value nesting bounded", test_spec_value_nesting_bounded);
  run_test("depth cap ceiling", test_spec_depth_cap_ceiling);

  std::cout << "\n[Providers & Orchestration]\n";
  run_test("provider registry", test_provider_registry);
  run_test("static provider lookup", test_static_provider_lookup);
  run_test("unconfigured provider", test_orchestration_unconfigured_provider);
  run_test("per-evidence timeout", test_orchestration_timeout);
  run_test("retries with backoff", test_orchestration_retries);
  run_test("permanent errors not retried", test_orchestration_no_retry_for_permanent_errors);
  run_test("global budget", test_orchestration_global_budget);
  run_test("cancellation", test_orchestration_cancellation);
  run_test("parallelism bound", test_orchestration_parallelism_bound);
  run_test("dispatch order", test_orchestration_dispatch_order);
  run_test("timed-out fetch frees its slot", test_timed_out_fetch_frees_its_slot);

  std::cout << "\n[Gate Engine]\n";
  run_test("end to end: age >= 18", test_gate_end_to_end_adult);
  run_test("provider timeout blocks", test_gate_provider_timeout_blocks);
  run_test("decide_false policy", test_gate_decide_false_policy);
  run_test("decided false", test_gate_decided_false);
  run_test("type mismatch blocks", test_gate_type_mismatch_blocks);
  run_test("composite tree step", test_gate_composite_tree_step);
  run_test("optional conditions", test_gate_optional_condition);
  run_test("budget fail policy", test_gate_budget_fail_policy);
  run_test("budget proceed policy", test_gate_budget_proceed_policy);
  run_test("cancellation", test_gate_cancellation);
  run_test("lifecycle", test_gate_lifecycle);
  run_test("invalid spec", test_gate_invalid_spec);
  run_test("determinism (5x)", test_gate_determinism);
  run_test("one event per run", test_gate_emits_one_event);

  std::cout << "\n[Runpack]\n";
  run_test("hash chain", test_runpack_chain);
  run_test("append rules", test_runpack_append_rules);
  run_test("tamper detection", test_runpack_tamper_detection);
  run_test("serialization", test_runpack_serialization);
  run_test("gate runpack round trip", test_gate_runpack_round_trip);
  run_test("deepest spec runpack reloads", test_gate_deepest_spec_runpack_reloads);

  std::cout << "\n[Runpack Store]\n";
  run_test("put/get", test_store_put_get);
  run_test("rejections", test_store_rejections);
  run_test("corruption detected", test_store_corruption_detected);
  run_test("compression", test_store_compression);

  std::cout << "\n[Version & Observability]\n";
  run_test("version manifest", test_version_manifest);
  run_test("latency histogram", test_latency_histogram);
  run_test("event log sink", test_event_log_sink);

  std::cout << "\n[Adversarial Inputs]\n";
  run_test("random parser input (2000x)", test_adversarial_parsers);
  run_test("spec mutations (1000x)", test_adversarial_spec_mutations);
  run_test("short-circuit equals full evaluation (500x)", test_short_circuit_matches_full_evaluation);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
