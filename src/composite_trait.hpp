#pragma once
#include "gbcore.hpp"
#include <memory>
#include <string>
#include <vector>

namespace gbcore {

namespace expr {

enum class TokKind { number, name, op, lparen, rparen, end };

struct Token {
  TokKind     kind{TokKind::end};
  std::string text;
  double      number{0.0};
  size_t      pos{0};        // offset into the formula, for error messages
};

// Operators: + - * / ^ %. Names: [A-Za-z_][A-Za-z0-9_.]* or `anything but backtick`.
std::vector<Token> tokenize(const std::string& formula);

struct Node {
  enum class Kind { number, variable, negate, binary, call };
  Kind kind{Kind::number};
  double number{0.0};
  int slot{-1};              // variable: index into CompositeFormula::variables()
  char op{0};                // binary operator
  std::string func;          // call: abs, sqrt, log, log2, log10
  std::unique_ptr<Node> lhs;
  std::unique_ptr<Node> rhs;
};

} // namespace expr

// A parsed arithmetic formula over feature names.
//   expr  := term (('+'|'-') term)*
//   term  := unary (('*'|'/'|'%') unary)*
//   unary := ('+'|'-') unary | power
//   power := primary ('^' unary)?
//   primary := number | name | func '(' expr ')' | '(' expr ')'
// Syntax errors are std::invalid_argument.
class CompositeFormula {
public:
  explicit CompositeFormula(const std::string& formula);

  const std::string& text() const { return text_; }
  // Distinct names in order of first appearance.
  const std::vector<std::string>& variables() const { return vars_; }

  // `bindings` is parallel to variables(). Any missing operand gives a missing result.
  Cell evaluate(const std::vector<Cell>& bindings) const;

private:
  std::string text_;
  std::vector<std::string> vars_;
  std::unique_ptr<expr::Node> root_;
};

// Evaluates `formula` per entry and appends it as `new_name` (mask usable), or
// overwrites the column in place (mask kept) when `new_name` already exists.
// Unknown names in the formula are std::invalid_argument.
template <class Axis>
Container<Axis> add_composite_feature(const Container<Axis>& c,
                                      const std::string& new_name,
                                      const std::string& formula);

} // namespace gbcore
