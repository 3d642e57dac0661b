#ifndef PLX_EXPR_LEXER_H
#define PLX_EXPR_LEXER_H

#include "../../utils/plx_string.h"

namespace plx::processors::expr {

enum class token_type {
  end,
  number,
  string,
  identifier,
  keyword_and,
  keyword_or,
  keyword_not,
  keyword_in,
  keyword_true,
  keyword_false,
  keyword_none,
  lparen,
  rparen,
  lbracket,
  rbracket,
  lbrace,
  rbrace,
  comma,
  dot,
  plus,
  minus,
  star,
  slash,
  percent,
  eq,
  ne,
  lt,
  le,
  gt,
  ge,
  error
};

struct token {
  token_type type = token_type::end;
  plx_string text;
  size_t pos = 0;
};

// Splits formula and predicate text into tokens. An unexpected character
// produces an error token and stops the stream.
class plx_expr_lexer {
public:
  explicit plx_expr_lexer(const plx_string& input);

  token next();

private:
  token lex_number();
  token lex_string();
  token lex_identifier_or_keyword();
  void skip_whitespace();
  token make_token(token_type type, const plx_string& text, size_t start) const;

  static bool is_ident_start(char c);
  static bool is_ident_char(char c);

  const plx_string& input_;
  size_t pos_ = 0;
  bool failed_ = false;
};

} // namespace plx::processors::expr

#endif // PLX_EXPR_LEXER_H
