#ifndef PLX_EXPR_PARSER_H
#define PLX_EXPR_PARSER_H

#include "plx_expr_ast.h"
#include "plx_expr_lexer.h"

namespace plx::processors::expr {

// Recursive descent parser for both grammars. parse() throws
// plx_expression_error with the position of the first syntax error.
class plx_expr_parser {
public:
  plx_expr_parser(const plx_string& input, grammar_mode mode);

  node_ptr parse();

  // Shorthands
  static node_ptr parse_formula(const plx_string& input);
  static node_ptr parse_predicate(const plx_string& input);

private:
  // formula grammar
  bool parse_formula_expr(node_ptr& out);
  bool parse_formula_term(node_ptr& out);
  bool parse_formula_factor(node_ptr& out);
  bool parse_sum_path(std::vector<path_segment>& out);

  // predicate grammar
  bool parse_or(node_ptr& out);
  bool parse_and(node_ptr& out);
  bool parse_not(node_ptr& out);
  bool parse_comparison(node_ptr& out);
  bool parse_additive(node_ptr& out);
  bool parse_multiplicative(node_ptr& out);
  bool parse_unary(node_ptr& out);
  bool parse_postfix(node_ptr& out);
  bool parse_postfix_chain(node_ptr base, node_ptr& out);
  bool parse_primary(node_ptr& out);
  bool parse_arguments(std::vector<node_ptr>& out);

  bool parse_number(node_ptr& out);
  void advance();
  bool consume(token_type type, const char* message);
  bool set_error(const plx_string& message);
  node_ptr make_node(node::kind type) const;

  static bool is_helper(const plx_string& name);

  const plx_string input_;
  grammar_mode mode_;
  plx_expr_lexer lexer_;
  token current_;
  token lookahead_;
  bool has_lookahead_ = false;
  plx_string error_;
  size_t error_pos_ = 0;

  token peek();
};

} // namespace plx::processors::expr

#endif // PLX_EXPR_PARSER_H
