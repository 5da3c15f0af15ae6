#include "dgate/dsl.hpp"

#include <utility>
#include <vector>

namespace dgate {

namespace {

enum class Tok { lparen, rparen, comma, op_not, op_and, op_or, number, ident, eof };

struct Token {
  Tok kind{Tok::eof};
  std::string_view text;
  std::size_t pos{0};
};

bool ident_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '_' || c == '.' || c == '-';
}

std::string describe(const Token& t) {
  switch (t.kind) {
    case Tok::eof: return "end of input";
    case Tok::lparen: return "'('";
    case Tok::rparen: return "')'";
    case Tok::comma: return "','";
    default: return "'" + std::string(t.text) + "'";
  }
}

class Lexer {
 public:
  explicit Lexer(std::string_view input) : in_(input) {}

  bool run(std::vector<Token>* out, GateError* err) {
    while (pos_ < in_.size()) {
      const char c = in_[pos_];
      if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
        ++pos_;
      } else if (c == '(') {
        push(out, Tok::lparen, 1);
      } else if (c == ')') {
        push(out, Tok::rparen, 1);
      } else if (c == ',') {
        push(out, Tok::comma, 1);
      } else if (c == '!') {
        push(out, Tok::op_not, 1);
      } else if (c == '&' || c == '|') {
        if (pos_ + 1 >= in_.size() || in_[pos_ + 1] != c) {
          return fail(err, ErrorCode::spec_invalid,
                      std::string("expected '") + c + c + "' at offset " + std::to_string(pos_));
        }
        push(out, c == '&' ? Tok::op_and : Tok::op_or, 2);
      } else if (ident_char(c) && c != '.' && c != '-') {
        const std::size_t start = pos_;
        bool all_digits = true;
        while (pos_ < in_.size() && ident_char(in_[pos_])) {
          if (in_[pos_] < '0' || in_[pos_] > '9') all_digits = false;
          ++pos_;
        }
        const std::string_view word = in_.substr(start, pos_ - start);
        Tok kind = all_digits ? Tok::number : Tok::ident;
        if (word == "and") kind = Tok::op_and;
        if (word == "or") kind = Tok::op_or;
        if (word == "not") kind = Tok::op_not;
        out->push_back(Token{kind, word, start});
      } else {
        return fail(err, ErrorCode::spec_invalid,
                    "unexpected character at offset " + std::to_string(pos_));
      }
    }
    if (out->empty()) return fail(err, ErrorCode::spec_invalid, "empty requirement expression");
    out->push_back(Token{Tok::eof, {}, pos_});
    return true;
  }

 private:
  void push(std::vector<Token>* out, Tok kind, std::size_t len) {
    out->push_back(Token{kind, in_.substr(pos_, len), pos_});
    pos_ += len;
  }

  std::string_view in_;
  std::size_t pos_{0};
};

class Parser {
 public:
  Parser(std::vector<Token> tokens, const DslLimits& limits, GateError* err)
      : tokens_(std::move(tokens)), limits_(limits), err_(err) {}

  std::optional<RequirementNode> run() {
    auto node = parse_or();
    if (!node) return std::nullopt;
    if (cur().kind != Tok::eof) {
      error("unexpected trailing " + describe(cur()));
      return std::nullopt;
    }
    return node;
  }

 private:
  const Token& cur() const { return tokens_[index_]; }
  void advance() {
    if (index_ + 1 < tokens_.size()) ++index_;
  }
  bool accept(Tok kind) {
    if (cur().kind != kind) return false;
    advance();
    return true;
  }
  void error(const std::string& message) {
    fail(err_, ErrorCode::spec_invalid, message + " at offset " + std::to_string(cur().pos));
  }
  bool expect(Tok kind, const char* what) {
    if (accept(kind)) return true;
    error(std::string("expected ") + what + ", found " + describe(cur()));
    return false;
  }

  bool enter() {
    if (++nesting_ > limits_.max_nesting) {
      fail(err_, ErrorCode::spec_over_limit,
           "requirement expression nested deeper than " + std::to_string(limits_.max_nesting) +
               " at offset " + std::to_string(cur().pos));
      return false;
    }
    return true;
  }
  void leave() { --nesting_; }

  std::optional<RequirementNode> parse_or() {
    auto left = parse_and();
    if (!left) return std::nullopt;
    if (cur().kind != Tok::op_or) return left;
    std::vector<RequirementNode> terms;
    terms.push_back(std::move(*left));
    while (accept(Tok::op_or)) {
      auto next = parse_and();
      if (!next) return std::nullopt;
      terms.push_back(std::move(*next));
    }
    return RequirementNode::any(std::move(terms));
  }

  std::optional<RequirementNode> parse_and() {
    auto left = parse_unary();
    if (!left) return std::nullopt;
    if (cur().kind != Tok::op_and) return left;
    std::vector<RequirementNode> terms;
    terms.push_back(std::move(*left));
    while (accept(Tok::op_and)) {
      auto next = parse_unary();
      if (!next) return std::nullopt;
      terms.push_back(std::move(*next));
    }
    return RequirementNode::all(std::move(terms));
  }

  std::optional<RequirementNode> parse_unary() {
    if (accept(Tok::op_not)) {
      if (!enter()) return std::nullopt;
      auto operand = parse_unary();
      leave();
      if (!operand) return std::nullopt;
      return RequirementNode::negate(std::move(*operand));
    }
    return parse_primary();
  }

  std::optional<RequirementNode> parse_primary() {
    const Token tok = cur();
    if (accept(Tok::lparen)) {
      if (!enter()) return std::nullopt;
      auto inner = parse_or();
      leave();
      if (!inner || !expect(Tok::rparen, "')'")) return std::nullopt;
      return inner;
    }
    if (tok.kind == Tok::ident) {
      advance();
      if (!accept(Tok::lparen)) return RequirementNode::leaf(std::string(tok.text));
      if (!enter()) return std::nullopt;
      auto call = parse_call(tok);
      leave();
      return call;
    }
    error("expected condition, '(' or '!', found " + describe(tok));
    return std::nullopt;
  }

  // Called with the opening parenthesis already consumed.
  std::optional<RequirementNode> parse_call(const Token& name) {
    if (name.text == "at_least" || name.text == "require_group") return parse_group();
    if (name.text == "all" || name.text == "any") {
      auto args = parse_args();
      if (!args) return std::nullopt;
      if (args->empty()) {
        error(std::string(name.text) + "() needs at least one argument");
        return std::nullopt;
      }
      return name.text == "all" ? RequirementNode::all(std::move(*args))
                                : RequirementNode::any(std::move(*args));
    }
    if (accept(Tok::rparen)) return RequirementNode::leaf(std::string(name.text));
    fail(err_, ErrorCode::spec_invalid,
         "unknown function '" + std::string(name.text) + "' at offset " + std::to_string(name.pos));
    return std::nullopt;
  }

  std::optional<RequirementNode> parse_group() {
    const Token count = cur();
    if (count.kind != Tok::number) {
      error("expected group count, found " + describe(count));
      return std::nullopt;
    }
    advance();
    unsigned long long min = 0;
    for (char c : count.text) {
      min = min * 10 + static_cast<unsigned long long>(c - '0');
      if (min > 0xFFFFFFFFull) {
        fail(err_, ErrorCode::spec_invalid,
             "group count out of range at offset " + std::to_string(count.pos));
        return std::nullopt;
      }
    }
    if (!expect(Tok::comma, "',' after group count")) return std::nullopt;
    auto members = parse_args();
    if (!members) return std::nullopt;
    if (members->empty()) {
      error("at_least() needs at least one member");
      return std::nullopt;
    }
    return RequirementNode::at_least(static_cast<std::uint32_t>(min), std::move(*members));
  }

  // Comma separated expressions up to and including ')'.
  std::optional<std::vector<RequirementNode>> parse_args() {
    std::vector<RequirementNode> args;
    if (accept(Tok::rparen)) return args;
    for (;;) {
      auto arg = parse_or();
      if (!arg) return std::nullopt;
      args.push_back(std::move(*arg));
      if (accept(Tok::comma)) continue;
      if (!expect(Tok::rparen, "')' after arguments")) return std::nullopt;
      return args;
    }
  }

  std::vector<Token> tokens_;
  std::size_t index_{0};
  std::size_t nesting_{0};
  const DslLimits& limits_;
  GateError* err_;
};

void render(const RequirementNode& node, std::string* out) {
  switch (node.kind) {
    case NodeKind::condition:
      *out += node.condition_id;
      return;
    case NodeKind::negate:
      *out += "not(";
      if (!node.children.empty()) render(node.children.front(), out);
      *out += ")";
      return;
    case NodeKind::all:
    case NodeKind::any:
    case NodeKind::at_least:
      break;
  }
  *out += to_string(node.kind);
  *out += "(";
  bool first = true;
  if (node.kind == NodeKind::at_least) {
    *out += std::to_string(node.min);
    first = false;
  }
  for (const auto& child : node.children) {
    if (!first) *out += ", ";
    first = false;
    render(child, out);
  }
  *out += ")";
}

}  // namespace

std::optional<RequirementNode> parse_requirement_dsl(std::string_view text, GateError* err,
                                                     const DslLimits& limits) {
  if (text.size() > limits.max_input_bytes) {
    fail(err, ErrorCode::spec_over_limit,
         "requirement expression larger than " + std::to_string(limits.max_input_bytes) + " bytes");
    return std::nullopt;
  }
  std::vector<Token> tokens;
  Lexer lexer(text);
  if (!lexer.run(&tokens, err)) return std::nullopt;
  Parser parser(std::move(tokens), limits, err);
  return parser.run();
}

std::string requirement_to_dsl(const RequirementNode& node) {
  std::string out;
  render(node, &out);
  return out;
}

}  // namespace dgate
