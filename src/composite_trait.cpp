// composite_trait.cpp
// ------------------------------------------------------------------
// Composite features: formula tokenizer, recursive-descent parser and
// per-entry AST evaluation. Names are resolved as whole tokens, so a
// feature "A" never matches inside "AB".
// ------------------------------------------------------------------

#include "composite_trait.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <unordered_map>

namespace gbcore {

namespace expr {

static bool is_name_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

static std::invalid_argument syntax_error(const std::string& formula, size_t pos, const std::string& what) {
  return std::invalid_argument("Invalid formula '" + formula + "' at position " +
                               std::to_string(pos + 1) + ": " + what);
}

std::vector<Token> tokenize(const std::string& formula) {
  std::vector<Token> out;
  size_t i = 0;
  const size_t n = formula.size();
  while (i < n) {
    const char c = formula[i];
    if (std::isspace(static_cast<unsigned char>(c))) { ++i; continue; }

    Token t;
    t.pos = i;
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
      const char* begin = formula.c_str() + i;
      char* end = nullptr;
      t.number = std::strtod(begin, &end);
      if (end == begin) throw syntax_error(formula, i, "malformed number");
      t.kind = TokKind::number;
      t.text.assign(begin, static_cast<const char*>(end));
      i += static_cast<size_t>(end - begin);
    } else if (is_name_start(c)) {
      size_t j = i + 1;
      while (j < n && is_name_char(formula[j])) ++j;
      t.kind = TokKind::name;
      t.text = formula.substr(i, j - i);
      i = j;
    } else if (c == '`') {
      const size_t close = formula.find('`', i + 1);
      if (close == std::string::npos) throw syntax_error(formula, i, "unterminated `name`");
      if (close == i + 1) throw syntax_error(formula, i, "empty `name`");
      t.kind = TokKind::name;
      t.text = formula.substr(i + 1, close - i - 1);
      i = close + 1;
    } else if (c == '+' || c == '-' || c == '*' || c == '/' || c == '^' || c == '%') {
      t.kind = TokKind::op;
      t.text = std::string(1, c);
      ++i;
    } else if (c == '(') {
      t.kind = TokKind::lparen; t.text = "("; ++i;
    } else if (c == ')') {
      t.kind = TokKind::rparen; t.text = ")"; ++i;
    } else {
      throw syntax_error(formula, i, std::string("unexpected character '") + c + "'");
    }
    out.push_back(std::move(t));
  }
  Token end;
  end.kind = TokKind::end;
  end.pos = n;
  out.push_back(end);
  return out;
}

static bool is_function(const std::string& s) {
  return s == "abs" || s == "sqrt" || s == "log" || s == "log2" || s == "log10";
}

// ======= Parser =======
class Parser {
public:
  Parser(const std::string& formula, std::vector<std::string>& vars)
    : formula_(formula), toks_(tokenize(formula)), vars_(vars) {}

  std::unique_ptr<Node> parse() {
    if (peek_().kind == TokKind::end) throw syntax_error(formula_, 0, "empty formula");
    auto root = expr_();
    if (peek_().kind != TokKind::end)
      throw syntax_error(formula_, peek_().pos, "unexpected '" + peek_().text + "'");
    return root;
  }

private:
  const std::string& formula_;
  std::vector<Token> toks_;
  size_t at_{0};
  std::vector<std::string>& vars_;
  std::unordered_map<std::string, int> slots_;

  const Token& peek_() const { return toks_[at_]; }
  const Token& next_() { return toks_[at_++]; }
  bool at_op_(char op) const { return peek_().kind == TokKind::op && peek_().text[0] == op; }

  static std::unique_ptr<Node> binary_(char op, std::unique_ptr<Node> l, std::unique_ptr<Node> r) {
    auto nd = std::make_unique<Node>();
    nd->kind = Node::Kind::binary;
    nd->op = op;
    nd->lhs = std::move(l);
    nd->rhs = std::move(r);
    return nd;
  }

  std::unique_ptr<Node> expr_() {
    auto l = term_();
    while (at_op_('+') || at_op_('-')) {
      const char op = next_().text[0];
      l = binary_(op, std::move(l), term_());
    }
    return l;
  }

  std::unique_ptr<Node> term_() {
    auto l = unary_();
    while (at_op_('*') || at_op_('/') || at_op_('%')) {
      const char op = next_().text[0];
      l = binary_(op, std::move(l), unary_());
    }
    return l;
  }

  std::unique_ptr<Node> unary_() {
    if (at_op_('+')) { next_(); return unary_(); }
    if (at_op_('-')) {
      next_();
      auto nd = std::make_unique<Node>();
      nd->kind = Node::Kind::negate;
      nd->lhs = unary_();
      return nd;
    }
    return power_();
  }

  // right associative: a^b^c == a^(b^c); -a^2 == -(a^2)
  std::unique_ptr<Node> power_() {
    auto base = primary_();
    if (at_op_('^')) {
      next_();
      return binary_('^', std::move(base), unary_());
    }
    return base;
  }

  std::unique_ptr<Node> primary_() {
    const Token& t = next_();
    switch (t.kind) {
      case TokKind::number: {
        auto nd = std::make_unique<Node>();
        nd->kind = Node::Kind::number;
        nd->number = t.number;
        return nd;
      }
      case TokKind::name: {
        if (peek_().kind == TokKind::lparen) {
          if (!is_function(t.text))
            throw syntax_error(formula_, t.pos, "unknown function '" + t.text + "'");
          next_();
          auto nd = std::make_unique<Node>();
          nd->kind = Node::Kind::call;
          nd->func = t.text;
          nd->lhs = expr_();
          expect_rparen_();
          return nd;
        }
        auto nd = std::make_unique<Node>();
        nd->kind = Node::Kind::variable;
        auto it = slots_.find(t.text);
        if (it == slots_.end()) {
          it = slots_.emplace(t.text, static_cast<int>(vars_.size())).first;
          vars_.push_back(t.text);
        }
        nd->slot = it->second;
        return nd;
      }
      case TokKind::lparen: {
        auto inner = expr_();
        expect_rparen_();
        return inner;
      }
      case TokKind::end:
        throw syntax_error(formula_, t.pos, "unexpected end of formula");
      default:
        throw syntax_error(formula_, t.pos, "unexpected '" + t.text + "'");
    }
  }

  void expect_rparen_() {
    if (peek_().kind != TokKind::rparen)
      throw syntax_error(formula_, peek_().pos, "expected ')'");
    next_();
  }
};

static Cell eval_node(const Node& nd, const std::vector<Cell>& bindings) {
  switch (nd.kind) {
    case Node::Kind::number:
      return nd.number;
    case Node::Kind::variable:
      return bindings[nd.slot];
    case Node::Kind::negate: {
      const Cell x = eval_node(*nd.lhs, bindings);
      if (!x) return std::nullopt;
      return -*x;
    }
    case Node::Kind::call: {
      const Cell x = eval_node(*nd.lhs, bindings);
      if (!x) return std::nullopt;
      if (nd.func == "abs")   return std::abs(*x);
      if (nd.func == "sqrt")  return std::sqrt(*x);
      if (nd.func == "log")   return std::log(*x);
      if (nd.func == "log2")  return std::log2(*x);
      if (nd.func == "log10") return std::log10(*x);
      throw InternalError("unhandled function '" + nd.func + "'");
    }
    case Node::Kind::binary: {
      const Cell a = eval_node(*nd.lhs, bindings);
      const Cell b = eval_node(*nd.rhs, bindings);
      if (!a || !b) return std::nullopt;
      switch (nd.op) {
        case '+': return *a + *b;
        case '-': return *a - *b;
        case '*': return *a * *b;
        case '/': return *a / *b;
        case '^': return std::pow(*a, *b);
        case '%': return std::fmod(*a, *b);
      }
      throw InternalError(std::string("unhandled operator '") + nd.op + "'");
    }
  }
  throw InternalError("unhandled expression node");
}

} // namespace expr

CompositeFormula::CompositeFormula(const std::string& formula) : text_(formula) {
  expr::Parser parser(text_, vars_);
  root_ = parser.parse();
}

Cell CompositeFormula::evaluate(const std::vector<Cell>& bindings) const {
  if (bindings.size() != vars_.size())
    throw std::invalid_argument("Expected " + std::to_string(vars_.size()) +
                                " bound values for formula '" + text_ + "', got " +
                                std::to_string(bindings.size()));
  return expr::eval_node(*root_, bindings);
}

template <class Axis>
Container<Axis> add_composite_feature(const Container<Axis>& c,
                                      const std::string& new_name,
                                      const std::string& formula) {
  require_valid(c);
  if (new_name.empty())
    throw std::invalid_argument("The composite feature name must not be empty.");
  const CompositeFormula f(formula);
  const Table df = tabularise(c);

  std::vector<int> cols;
  cols.reserve(f.variables().size());
  for (const auto& v : f.variables()) {
    const int k = df.feature_column(v);
    if (k < 0)
      throw std::invalid_argument("Unknown " + std::string(Axis::feature_label) + " '" + v +
                                  "' in formula '" + formula + "'");
    cols.push_back(k);
  }

  std::vector<Cell> phi(df.n_rows());
  std::vector<Cell> bindings(cols.size());
  for (size_t i = 0; i < df.n_rows(); ++i) {
    for (size_t k = 0; k < cols.size(); ++k) bindings[k] = df.columns[cols[k]][i];
    phi[i] = f.evaluate(bindings);
  }

  std::vector<int> idx;
  for (int j = 0; j < c.p; ++j)
    if (c.features[j] == new_name) idx.push_back(j);

  Container<Axis> out;
  if (idx.empty()) {
    out = Container<Axis>(c.n, c.p + 1);
    out.entries = c.entries;
    out.populations = c.populations;
    out.features = c.features;
    out.features.push_back(new_name);
    for (int i = 0; i < c.n; ++i) {
      for (int j = 0; j < c.p; ++j) {
        out.value(i, j) = c.value(i, j);
        out.set_usable(i, j, c.usable(i, j));
      }
      out.value(i, c.p) = phi[i];
    }
  } else if (idx.size() == 1) {
    out = clone(c);
    for (int i = 0; i < c.n; ++i) out.value(i, idx[0]) = phi[i];
  } else {
    throw InternalError("Duplicate " + std::string(Axis::feature_label) + " in " + Axis::kind +
                        ", i.e. " + new_name);
  }

  if (!checkdims(out))
    throw InternalError("Error generating composite feature: `" + new_name + "`");
  return out;
}

template Genomes  add_composite_feature<GenomicAxis>(const Genomes&, const std::string&, const std::string&);
template Phenomes add_composite_feature<PhenomicAxis>(const Phenomes&, const std::string&, const std::string&);

} // namespace gbcore
