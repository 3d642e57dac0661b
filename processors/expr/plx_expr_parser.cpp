#include "plx_expr_parser.h"
#include "../plx_errors.h"

namespace plx::processors::expr {

plx_string path_to_string(const std::vector<path_segment>& path) {
  std::vector<plx_string> parts;
  for (const auto& segment : path) {
    parts.push_back(segment.is_array ? segment.name + "[]" : segment.name);
  }
  return plx_string(".").join(parts);
}

plx_expr_parser::plx_expr_parser(const plx_string& input, grammar_mode mode)
  : input_(input), mode_(mode), lexer_(input_) {
  advance();
}

node_ptr plx_expr_parser::parse_formula(const plx_string& input) {
  plx_expr_parser parser(input, grammar_mode::formula);
  return parser.parse();
}

node_ptr plx_expr_parser::parse_predicate(const plx_string& input) {
  plx_expr_parser parser(input, grammar_mode::predicate);
  return parser.parse();
}

node_ptr plx_expr_parser::parse() {
  node_ptr root;
  bool ok = mode_ == grammar_mode::formula ? parse_formula_expr(root) : parse_or(root);
  if (ok && current_.type != token_type::end) {
    ok = current_.type == token_type::error ? set_error(current_.text)
                                            : set_error(plx_string("Unexpected '") + current_.text + "'");
  }
  if (!ok) {
    throw plx_expression_error(plx_string("Syntax error at position ") +
                               plx_string(static_cast<long long>(error_pos_)) + ": " + error_,
                               input_);
  }
  return root;
}

void plx_expr_parser::advance() {
  if (has_lookahead_) {
    current_ = lookahead_;
    has_lookahead_ = false;
    return;
  }
  current_ = lexer_.next();
}

token plx_expr_parser::peek() {
  if (!has_lookahead_) {
    lookahead_ = lexer_.next();
    has_lookahead_ = true;
  }
  return lookahead_;
}

bool plx_expr_parser::consume(token_type type, const char* message) {
  if (current_.type != type) {
    return set_error(message);
  }
  advance();
  return true;
}

bool plx_expr_parser::set_error(const plx_string& message) {
  if (error_.empty()) {
    error_ = current_.type == token_type::error ? current_.text : message;
    error_pos_ = current_.pos;
  }
  return false;
}

node_ptr plx_expr_parser::make_node(node::kind type) const {
  auto n = std::make_shared<node>();
  n->type = type;
  n->position = current_.pos;
  return n;
}

bool plx_expr_parser::is_helper(const plx_string& name) {
  return name == "sum" || name == "len" || name == "min" || name == "max" ||
         name == "all" || name == "any" || name == "abs" || name == "round";
}

bool plx_expr_parser::parse_number(node_ptr& out) {
  auto n = make_node(node::kind::literal);
  long long int_value = 0;
  double double_value = 0.0;
  if (current_.text.parse_int(int_value)) {
    n->value = int_value;
  } else if (current_.text.parse_double(double_value)) {
    n->value = double_value;
  } else {
    return set_error(plx_string("Invalid number '") + current_.text + "'");
  }
  advance();
  out = n;
  return true;
}

// ---------------------------------------------------------------------------
// Formula grammar
// ---------------------------------------------------------------------------

bool plx_expr_parser::parse_formula_expr(node_ptr& out) {
  node_ptr left;
  if (!parse_formula_term(left)) return false;
  while (current_.type == token_type::plus || current_.type == token_type::minus) {
    auto n = make_node(node::kind::binary);
    n->text = current_.text;
    advance();
    node_ptr right;
    if (!parse_formula_term(right)) return false;
    n->children = {left, right};
    left = n;
  }
  out = left;
  return true;
}

bool plx_expr_parser::parse_formula_term(node_ptr& out) {
  node_ptr left;
  if (!parse_formula_factor(left)) return false;
  while (current_.type == token_type::star || current_.type == token_type::slash) {
    auto n = make_node(node::kind::binary);
    n->text = current_.text;
    advance();
    node_ptr right;
    if (!parse_formula_factor(right)) return false;
    n->children = {left, right};
    left = n;
  }
  out = left;
  return true;
}

bool plx_expr_parser::parse_formula_factor(node_ptr& out) {
  switch (current_.type) {
    case token_type::number:
      return parse_number(out);
    case token_type::minus: {
      auto n = make_node(node::kind::negate);
      advance();
      node_ptr operand;
      if (!parse_formula_factor(operand)) return false;
      n->children.push_back(operand);
      out = n;
      return true;
    }
    case token_type::lparen: {
      advance();
      node_ptr inner;
      if (!parse_formula_expr(inner)) return false;
      if (!consume(token_type::rparen, "Expected ) to close expression")) return false;
      out = inner;
      return true;
    }
    case token_type::identifier: {
      if (current_.text != "sum") {
        return set_error(plx_string("Only sum(path) is allowed in formulas, found '") + current_.text + "'");
      }
      auto n = make_node(node::kind::sum_path);
      advance();
      if (!consume(token_type::lparen, "Expected ( after sum")) return false;
      if (!parse_sum_path(n->path)) return false;
      if (!consume(token_type::rparen, "Expected ) to close sum(")) return false;
      out = n;
      return true;
    }
    default:
      return set_error("Expected number, sum(path) or (");
  }
}

bool plx_expr_parser::parse_sum_path(std::vector<path_segment>& out) {
  bool has_array = false;
  while (true) {
    if (current_.type != token_type::identifier) {
      return set_error("Expected field name in sum() path");
    }
    path_segment segment;
    segment.name = current_.text;
    advance();
    if (current_.type == token_type::lbracket) {
      advance();
      if (!consume(token_type::rbracket, "Expected [] in sum() path")) return false;
      segment.is_array = true;
      has_array = true;
    }
    out.push_back(segment);
    if (current_.type != token_type::dot) {
      break;
    }
    advance();
  }
  if (!has_array) {
    return set_error("sum() path needs an array segment such as players[]");
  }
  return true;
}

// ---------------------------------------------------------------------------
// Predicate grammar
// ---------------------------------------------------------------------------

bool plx_expr_parser::parse_or(node_ptr& out) {
  node_ptr left;
  if (!parse_and(left)) return false;
  while (current_.type == token_type::keyword_or) {
    auto n = make_node(node::kind::logical);
    n->text = "or";
    advance();
    node_ptr right;
    if (!parse_and(right)) return false;
    n->children = {left, right};
    left = n;
  }
  out = left;
  return true;
}

bool plx_expr_parser::parse_and(node_ptr& out) {
  node_ptr left;
  if (!parse_not(left)) return false;
  while (current_.type == token_type::keyword_and) {
    auto n = make_node(node::kind::logical);
    n->text = "and";
    advance();
    node_ptr right;
    if (!parse_not(right)) return false;
    n->children = {left, right};
    left = n;
  }
  out = left;
  return true;
}

bool plx_expr_parser::parse_not(node_ptr& out) {
  if (current_.type == token_type::keyword_not) {
    auto n = make_node(node::kind::logical_not);
    advance();
    node_ptr operand;
    if (!parse_not(operand)) return false;
    n->children.push_back(operand);
    out = n;
    return true;
  }
  return parse_comparison(out);
}

bool plx_expr_parser::parse_comparison(node_ptr& out) {
  node_ptr first;
  if (!parse_additive(first)) return false;

  node_ptr chain;
  while (true) {
    plx_string op;
    switch (current_.type) {
      case token_type::eq:
      case token_type::ne:
      case token_type::lt:
      case token_type::le:
      case token_type::gt:
      case token_type::ge:
      case token_type::keyword_in:
        op = current_.text;
        advance();
        break;
      case token_type::keyword_not:
        if (peek().type != token_type::keyword_in) {
          return set_error("Expected 'in' after 'not'");
        }
        advance();
        advance();
        op = "not in";
        break;
      default:
        break;
    }
    if (op.empty()) {
      break;
    }
    if (!chain) {
      chain = make_node(node::kind::compare);
      chain->children.push_back(first);
    }
    node_ptr operand;
    if (!parse_additive(operand)) return false;
    chain->ops.push_back(op);
    chain->children.push_back(operand);
  }

  out = chain ? chain : first;
  return true;
}

bool plx_expr_parser::parse_additive(node_ptr& out) {
  node_ptr left;
  if (!parse_multiplicative(left)) return false;
  while (current_.type == token_type::plus || current_.type == token_type::minus) {
    auto n = make_node(node::kind::binary);
    n->text = current_.text;
    advance();
    node_ptr right;
    if (!parse_multiplicative(right)) return false;
    n->children = {left, right};
    left = n;
  }
  out = left;
  return true;
}

bool plx_expr_parser::parse_multiplicative(node_ptr& out) {
  node_ptr left;
  if (!parse_unary(left)) return false;
  while (current_.type == token_type::star || current_.type == token_type::slash ||
         current_.type == token_type::percent) {
    auto n = make_node(node::kind::binary);
    n->text = current_.text;
    advance();
    node_ptr right;
    if (!parse_unary(right)) return false;
    n->children = {left, right};
    left = n;
  }
  out = left;
  return true;
}

bool plx_expr_parser::parse_unary(node_ptr& out) {
  if (current_.type == token_type::minus) {
    auto n = make_node(node::kind::negate);
    advance();
    node_ptr operand;
    if (!parse_unary(operand)) return false;
    n->children.push_back(operand);
    out = n;
    return true;
  }
  if (current_.type == token_type::plus) {
    advance();
    return parse_unary(out);
  }
  return parse_postfix(out);
}

bool plx_expr_parser::parse_postfix(node_ptr& out) {
  node_ptr base;
  if (!parse_primary(base)) return false;
  return parse_postfix_chain(base, out);
}

bool plx_expr_parser::parse_postfix_chain(node_ptr base, node_ptr& out) {
  while (true) {
    if (current_.type == token_type::dot) {
      advance();
      if (current_.type != token_type::identifier) {
        return set_error("Expected field name after .");
      }
      plx_string member_name = current_.text;
      size_t member_pos = current_.pos;
      advance();
      if (current_.type == token_type::lparen) {
        if (member_name != "get") {
          return set_error(plx_string("Unknown method '") + member_name + "'");
        }
        auto n = make_node(node::kind::method_get);
        n->position = member_pos;
        advance();
        std::vector<node_ptr> args;
        if (!parse_arguments(args)) return false;
        if (args.empty() || args.size() > 2) {
          return set_error("get() takes a key and an optional default");
        }
        n->children.push_back(base);
        n->children.insert(n->children.end(), args.begin(), args.end());
        base = n;
        continue;
      }
      auto n = make_node(node::kind::member);
      n->position = member_pos;
      n->text = member_name;
      n->children.push_back(base);
      base = n;
      continue;
    }
    if (current_.type == token_type::lbracket) {
      advance();
      if (current_.type == token_type::rbracket) {
        // Projection: the rest of the chain applies to every element
        advance();
        auto n = make_node(node::kind::projection);
        node_ptr rest;
        if (!parse_postfix_chain(make_node(node::kind::element), rest)) return false;
        n->children = {base, rest};
        out = n;
        return true;
      }
      auto n = make_node(node::kind::index);
      node_ptr key;
      if (!parse_or(key)) return false;
      if (!consume(token_type::rbracket, "Expected ] to close subscript")) return false;
      n->children = {base, key};
      base = n;
      continue;
    }
    break;
  }
  out = base;
  return true;
}

bool plx_expr_parser::parse_arguments(std::vector<node_ptr>& out) {
  // current_ is just past '('
  if (current_.type == token_type::rparen) {
    advance();
    return true;
  }
  while (true) {
    node_ptr arg;
    if (!parse_or(arg)) return false;
    out.push_back(arg);
    if (current_.type == token_type::comma) {
      advance();
      continue;
    }
    return consume(token_type::rparen, "Expected , or ) in argument list");
  }
}

bool plx_expr_parser::parse_primary(node_ptr& out) {
  switch (current_.type) {
    case token_type::number:
      return parse_number(out);
    case token_type::string: {
      auto n = make_node(node::kind::literal);
      n->value = current_.text;
      advance();
      out = n;
      return true;
    }
    case token_type::keyword_true:
    case token_type::keyword_false: {
      auto n = make_node(node::kind::literal);
      n->value = current_.type == token_type::keyword_true;
      advance();
      out = n;
      return true;
    }
    case token_type::keyword_none: {
      out = make_node(node::kind::literal);
      advance();
      return true;
    }
    case token_type::lparen: {
      advance();
      node_ptr inner;
      if (!parse_or(inner)) return false;
      if (!consume(token_type::rparen, "Expected ) to close expression")) return false;
      out = inner;
      return true;
    }
    case token_type::lbracket: {
      auto n = make_node(node::kind::list);
      advance();
      if (current_.type != token_type::rbracket) {
        while (true) {
          node_ptr item;
          if (!parse_or(item)) return false;
          n->children.push_back(item);
          if (current_.type == token_type::comma) {
            advance();
            if (current_.type == token_type::rbracket) break;
            continue;
          }
          break;
        }
      }
      if (!consume(token_type::rbracket, "Expected ] to close list")) return false;
      out = n;
      return true;
    }
    case token_type::lbrace: {
      auto n = make_node(node::kind::empty_map);
      advance();
      if (!consume(token_type::rbrace, "Only the empty map {} is supported")) return false;
      out = n;
      return true;
    }
    case token_type::identifier: {
      plx_string identifier = current_.text;
      size_t identifier_pos = current_.pos;
      advance();
      if (current_.type == token_type::lparen) {
        if (!is_helper(identifier)) {
          return set_error(plx_string("Unknown function '") + identifier + "'");
        }
        auto n = make_node(node::kind::call);
        n->position = identifier_pos;
        n->text = identifier;
        advance();
        if (!parse_arguments(n->children)) return false;
        out = n;
        return true;
      }
      auto n = make_node(identifier == "data" ? node::kind::root : node::kind::name);
      n->position = identifier_pos;
      n->text = identifier;
      out = n;
      return true;
    }
    default:
      return set_error(current_.type == token_type::end ? plx_string("Unexpected end of expression")
                                                         : plx_string("Unexpected '") + current_.text + "'");
  }
}

} // namespace plx::processors::expr
