#include "dgate/requirement.hpp"

#include <sstream>
#include <utility>

namespace dgate {

TriState tri_and(TriState a, TriState b) {
  if (a == TriState::False || b == TriState::False) return TriState::False;
  if (a == TriState::Indeterminate || b == TriState::Indeterminate) return TriState::Indeterminate;
  return TriState::True;
}

TriState tri_or(TriState a, TriState b) {
  if (a == TriState::True || b == TriState::True) return TriState::True;
  if (a == TriState::Indeterminate || b == TriState::Indeterminate) return TriState::Indeterminate;
  return TriState::False;
}

TriState tri_not(TriState a) {
  if (a == TriState::True) return TriState::False;
  if (a == TriState::False) return TriState::True;
  return TriState::Indeterminate;
}

std::string to_string(NodeKind kind) {
  switch (kind) {
    case NodeKind::condition: return "condition";
    case NodeKind::all: return "all";
    case NodeKind::any: return "any";
    case NodeKind::negate: return "not";
    case NodeKind::at_least: return "at_least";
  }
  return "condition";
}

RequirementNode RequirementNode::leaf(std::string condition_id) {
  RequirementNode n;
  n.kind = NodeKind::condition;
  n.condition_id = std::move(condition_id);
  return n;
}

RequirementNode RequirementNode::all(std::vector<RequirementNode> children) {
  RequirementNode n;
  n.kind = NodeKind::all;
  n.children = std::move(children);
  return n;
}

RequirementNode RequirementNode::any(std::vector<RequirementNode> children) {
  RequirementNode n;
  n.kind = NodeKind::any;
  n.children = std::move(children);
  return n;
}

RequirementNode RequirementNode::negate(RequirementNode child) {
  RequirementNode n;
  n.kind = NodeKind::negate;
  n.children.push_back(std::move(child));
  return n;
}

RequirementNode RequirementNode::at_least(std::uint32_t min, std::vector<RequirementNode> children) {
  RequirementNode n;
  n.kind = NodeKind::at_least;
  n.min = min;
  n.children = std::move(children);
  return n;
}

bool RequirementNode::operator==(const RequirementNode& o) const {
  return kind == o.kind && condition_id == o.condition_id && min == o.min && children == o.children;
}

std::size_t requirement_depth(const RequirementNode& node) {
  std::size_t deepest = 0;
  for (const auto& child : node.children) {
    const std::size_t d = requirement_depth(child);
    if (d > deepest) deepest = d;
  }
  return deepest + 1;
}

std::size_t requirement_node_count(const RequirementNode& node) {
  std::size_t count = 1;
  for (const auto& child : node.children) count += requirement_node_count(child);
  return count;
}

namespace {

void collect_conditions(const RequirementNode& node, std::set<std::string>* out) {
  if (node.is_leaf()) {
    out->insert(node.condition_id);
    return;
  }
  for (const auto& child : node.children) collect_conditions(child, out);
}

struct Validator {
  const std::set<std::string>& known;
  const RequirementLimits& limits;
  GateError* err;
  std::size_t nodes{0};

  bool walk(const RequirementNode& node, std::size_t depth) {
    if (depth > limits.max_depth) {
      return fail(err, ErrorCode::spec_over_limit,
                  "requirement tree deeper than " + std::to_string(limits.max_depth));
    }
    if (++nodes > limits.max_nodes) {
      return fail(err, ErrorCode::spec_over_limit,
                  "requirement tree has more than " + std::to_string(limits.max_nodes) + " nodes");
    }
    switch (node.kind) {
      case NodeKind::condition:
        if (!node.children.empty()) {
          return fail(err, ErrorCode::spec_invalid, "condition node cannot have children",
                      {node.condition_id});
        }
        if (!known.count(node.condition_id)) {
          return fail(err, ErrorCode::spec_invalid,
                      "requirement references unknown condition '" + node.condition_id + "'",
                      {node.condition_id});
        }
        return true;
      case NodeKind::all:
      case NodeKind::any:
        if (node.children.empty()) {
          return fail(err, ErrorCode::spec_invalid,
                      "requirement group '" + to_string(node.kind) + "' has no children");
        }
        break;
      case NodeKind::negate:
        if (node.children.size() != 1) {
          return fail(err, ErrorCode::spec_invalid, "not() takes exactly one child");
        }
        break;
      case NodeKind::at_least:
        if (node.min == 0 || node.min > node.children.size()) {
          return fail(err, ErrorCode::spec_invalid,
                      "at_least min " + std::to_string(node.min) + " outside 1.." +
                          std::to_string(node.children.size()));
        }
        break;
    }
    for (const auto& child : node.children) {
      if (!walk(child, depth + 1)) return false;
    }
    return true;
  }
};

// Bounds recursion on programmatically built values; parsed JSON is already
// limited by the parser.
constexpr std::size_t kMaxJsonTreeDepth = jsonlite::kMaxNestingDepth;

std::optional<std::vector<RequirementNode>> children_from_json(const jsonlite::Value& json,
                                                               std::size_t depth,
                                                               GateError* err);

std::optional<RequirementNode> node_from_json(const jsonlite::Value& json, std::size_t depth,
                                              GateError* err) {
  if (depth > kMaxJsonTreeDepth) {
    fail(err, ErrorCode::spec_over_limit, "requirement nesting too deep");
    return std::nullopt;
  }
  const auto* obj = std::get_if<jsonlite::Object>(&json.v);
  if (!obj || obj->size() != 1) {
    fail(err, ErrorCode::spec_invalid, "requirement node must be an object with exactly one key");
    return std::nullopt;
  }
  const auto& [key, body] = *obj->begin();
  if (key == "condition") {
    const auto* id = std::get_if<std::string>(&body.v);
    if (!id) {
      fail(err, ErrorCode::spec_invalid, "condition node must name a condition id");
      return std::nullopt;
    }
    return RequirementNode::leaf(*id);
  }
  if (key == "all" || key == "any") {
    auto children = children_from_json(body, depth, err);
    if (!children) return std::nullopt;
    return key == "all" ? RequirementNode::all(std::move(*children))
                        : RequirementNode::any(std::move(*children));
  }
  if (key == "not") {
    auto child = node_from_json(body, depth + 1, err);
    if (!child) return std::nullopt;
    return RequirementNode::negate(std::move(*child));
  }
  if (key == "at_least") {
    const auto* group = std::get_if<jsonlite::Object>(&body.v);
    if (!group) {
      fail(err, ErrorCode::spec_invalid, "at_least must be an object with min and of");
      return std::nullopt;
    }
    for (const auto& [field, unused] : *group) {
      (void)unused;
      if (field != "min" && field != "of") {
        fail(err, ErrorCode::spec_invalid, "unknown at_least field '" + field + "'");
        return std::nullopt;
      }
    }
    bool ok = true;
    const auto min = jsonlite::get_u64(*group, "min", 0, &ok);
    if (!ok || min > 0xFFFFFFFFull) {
      fail(err, ErrorCode::spec_invalid, "at_least min must be a non-negative integer");
      return std::nullopt;
    }
    const auto* of = jsonlite::find(*group, "of");
    if (!of) {
      fail(err, ErrorCode::spec_invalid, "at_least requires 'of'");
      return std::nullopt;
    }
    auto children = children_from_json(*of, depth, err);
    if (!children) return std::nullopt;
    return RequirementNode::at_least(static_cast<std::uint32_t>(min), std::move(*children));
  }
  fail(err, ErrorCode::spec_invalid, "unknown requirement node '" + key + "'");
  return std::nullopt;
}

std::optional<std::vector<RequirementNode>> children_from_json(const jsonlite::Value& json,
                                                               std::size_t depth,
                                                               GateError* err) {
  const auto* arr = std::get_if<jsonlite::Array>(&json.v);
  if (!arr) {
    fail(err, ErrorCode::spec_invalid, "requirement group must be an array");
    return std::nullopt;
  }
  std::vector<RequirementNode> children;
  children.reserve(arr->size());
  for (const auto& item : *arr) {
    auto child = node_from_json(item, depth + 1, err);
    if (!child) return std::nullopt;
    children.push_back(std::move(*child));
  }
  return children;
}

jsonlite::Value children_to_json(const std::vector<RequirementNode>& children) {
  jsonlite::Array arr;
  for (const auto& child : children) arr.push_back(requirement_to_json(child));
  return jsonlite::Value{std::move(arr)};
}

class PlanBuilder {
 public:
  PlanBuilder(Plan* plan, const ILeafResolver& resolver) : plan_(plan), resolver_(resolver) {}

  TriState eval(const RequirementNode& node, std::size_t parent, std::size_t depth) {
    const std::size_t id = add(node, parent, depth, PlanStatus::evaluated);
    TriState result = TriState::Indeterminate;
    switch (node.kind) {
      case NodeKind::condition:
        result = resolver_.resolve(node.condition_id);
        break;
      case NodeKind::negate:
        // Malformed hand-built negation: Indeterminate, children recorded as skipped.
        if (node.children.size() != 1) {
          for (const auto& child : node.children) skip(child, id, depth + 1);
          break;
        }
        result = tri_not(eval(node.children.front(), id, depth + 1));
        break;
      case NodeKind::all:
      case NodeKind::any: {
        const bool is_all = node.kind == NodeKind::all;
        const TriState stop_on = is_all ? TriState::False : TriState::True;
        result = is_all ? TriState::True : TriState::False;
        bool stopped = false;
        for (const auto& child : node.children) {
          if (stopped) {
            skip(child, id, depth + 1);
            continue;
          }
          const TriState t = eval(child, id, depth + 1);
          result = is_all ? tri_and(result, t) : tri_or(result, t);
          if (t == stop_on) stopped = true;
        }
        break;
      }
      case NodeKind::at_least: {
        std::size_t trues = 0;
        std::size_t unknown = 0;
        std::size_t remaining = node.children.size();
        bool stopped = false;
        for (const auto& child : node.children) {
          if (stopped) {
            skip(child, id, depth + 1);
            continue;
          }
          const TriState t = eval(child, id, depth + 1);
          --remaining;
          if (t == TriState::True) ++trues;
          if (t == TriState::Indeterminate) ++unknown;
          if (trues >= node.min || trues + unknown + remaining < node.min) stopped = true;
        }
        if (trues >= node.min) {
          result = TriState::True;
        } else if (trues + unknown + remaining < node.min) {
          result = TriState::False;
        } else {
          result = TriState::Indeterminate;
        }
        break;
      }
    }
    plan_->entries[id].result = result;
    return result;
  }

 private:
  std::size_t add(const RequirementNode& node, std::size_t parent, std::size_t depth,
                  PlanStatus status) {
    PlanEntry e;
    e.id = plan_->entries.size();
    e.parent = parent;
    e.depth = depth;
    e.kind = node.kind;
    e.condition_id = node.condition_id;
    e.min = node.min;
    e.status = status;
    plan_->entries.push_back(std::move(e));
    return plan_->entries.size() - 1;
  }

  void skip(const RequirementNode& node, std::size_t parent, std::size_t depth) {
    const std::size_t id = add(node, parent, depth, PlanStatus::skipped);
    for (const auto& child : node.children) skip(child, id, depth + 1);
  }

  Plan* plan_;
  const ILeafResolver& resolver_;
};

std::string node_label(const PlanEntry& e) {
  switch (e.kind) {
    case NodeKind::condition: return "condition " + e.condition_id;
    case NodeKind::at_least: return "at_least(" + std::to_string(e.min) + ")";
    default: return to_string(e.kind);
  }
}

}  // namespace

std::set<std::string> referenced_conditions(const RequirementNode& node) {
  std::set<std::string> out;
  collect_conditions(node, &out);
  return out;
}

bool validate_requirement(const RequirementNode& node,
                          const std::set<std::string>& known_conditions,
                          const RequirementLimits& limits, GateError* err) {
  Validator v{known_conditions, limits, err};
  return v.walk(node, 1);
}

std::optional<RequirementNode> requirement_from_json(const jsonlite::Value& json, GateError* err) {
  return node_from_json(json, 1, err);
}

jsonlite::Value requirement_to_json(const RequirementNode& node) {
  jsonlite::Object obj;
  switch (node.kind) {
    case NodeKind::condition:
      obj["condition"] = node.condition_id;
      break;
    case NodeKind::all:
      obj["all"] = children_to_json(node.children);
      break;
    case NodeKind::any:
      obj["any"] = children_to_json(node.children);
      break;
    case NodeKind::negate:
      obj["not"] = node.children.empty() ? jsonlite::Value{nullptr}
                                         : requirement_to_json(node.children.front());
      break;
    case NodeKind::at_least: {
      jsonlite::Object group;
      group["min"] = jsonlite::number(node.min);
      group["of"] = children_to_json(node.children);
      obj["at_least"] = std::move(group);
      break;
    }
  }
  return jsonlite::Value{std::move(obj)};
}

TriState MapLeafResolver::resolve(const std::string& condition_id) const {
  auto it = results_.find(condition_id);
  return it == results_.end() ? TriState::Indeterminate : it->second;
}

bool PlanEntry::operator==(const PlanEntry& o) const {
  return id == o.id && parent == o.parent && depth == o.depth && kind == o.kind &&
         condition_id == o.condition_id && min == o.min && status == o.status &&
         result == o.result;
}

std::size_t Plan::evaluated_count() const {
  std::size_t n = 0;
  for (const auto& e : entries) n += e.status == PlanStatus::evaluated ? 1 : 0;
  return n;
}

std::size_t Plan::skipped_count() const { return entries.size() - evaluated_count(); }

Evaluation evaluate(const RequirementNode& tree, const ILeafResolver& resolver) {
  Evaluation out;
  PlanBuilder builder(&out.plan, resolver);
  out.result = builder.eval(tree, PlanEntry::kNoParent, 0);
  return out;
}

jsonlite::Value plan_to_json(const Plan& plan) {
  jsonlite::Array nodes;
  for (const auto& e : plan.entries) {
    jsonlite::Object n;
    n["id"] = jsonlite::number(e.id);
    n["parent"] = e.parent == PlanEntry::kNoParent ? jsonlite::Value{nullptr}
                                                   : jsonlite::number(e.parent);
    n["depth"] = jsonlite::number(e.depth);
    n["kind"] = to_string(e.kind);
    if (e.kind == NodeKind::condition) n["condition"] = e.condition_id;
    if (e.kind == NodeKind::at_least) n["min"] = jsonlite::number(e.min);
    n["status"] = e.status == PlanStatus::evaluated ? "evaluated" : "skipped";
    n["result"] = e.status == PlanStatus::evaluated ? jsonlite::Value{to_string(e.result)}
                                                    : jsonlite::Value{nullptr};
    nodes.push_back(std::move(n));
  }
  jsonlite::Object out;
  out["nodes"] = std::move(nodes);
  out["evaluated"] = jsonlite::number(plan.evaluated_count());
  out["skipped"] = jsonlite::number(plan.skipped_count());
  return jsonlite::Value{std::move(out)};
}

std::string explain_plan(const Plan& plan) {
  std::ostringstream oss;
  for (const auto& e : plan.entries) {
    oss << std::string(e.depth * 2, ' ') << node_label(e);
    if (e.status == PlanStatus::skipped) {
      oss << " (skipped)";
    } else {
      oss << " -> " << to_string(e.result);
    }
    oss << '\n';
  }
  return oss.str();
}

}  // namespace dgate
