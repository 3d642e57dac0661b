#include "plx_expr_lexer.h"
#include <cctype>

namespace plx::processors::expr {

plx_expr_lexer::plx_expr_lexer(const plx_string& input) : input_(input) {}

bool plx_expr_lexer::is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool plx_expr_lexer::is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

void plx_expr_lexer::skip_whitespace() {
  while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
    ++pos_;
  }
}

token plx_expr_lexer::make_token(token_type type, const plx_string& text, size_t start) const {
  token t;
  t.type = type;
  t.text = text;
  t.pos = start;
  return t;
}

token plx_expr_lexer::next() {
  if (failed_) {
    return make_token(token_type::end, "", pos_);
  }
  skip_whitespace();
  if (pos_ >= input_.size()) {
    return make_token(token_type::end, "", pos_);
  }

  size_t start = pos_;
  char c = input_[pos_];

  if (std::isdigit(static_cast<unsigned char>(c)) != 0 ||
      (c == '.' && pos_ + 1 < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_ + 1])) != 0)) {
    return lex_number();
  }
  if (c == '\'' || c == '"') {
    return lex_string();
  }
  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }

  char n = pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';
  switch (c) {
    case '(': ++pos_; return make_token(token_type::lparen, "(", start);
    case ')': ++pos_; return make_token(token_type::rparen, ")", start);
    case '[': ++pos_; return make_token(token_type::lbracket, "[", start);
    case ']': ++pos_; return make_token(token_type::rbracket, "]", start);
    case '{': ++pos_; return make_token(token_type::lbrace, "{", start);
    case '}': ++pos_; return make_token(token_type::rbrace, "}", start);
    case ',': ++pos_; return make_token(token_type::comma, ",", start);
    case '.': ++pos_; return make_token(token_type::dot, ".", start);
    case '+': ++pos_; return make_token(token_type::plus, "+", start);
    case '-': ++pos_; return make_token(token_type::minus, "-", start);
    case '*': ++pos_; return make_token(token_type::star, "*", start);
    case '/': ++pos_; return make_token(token_type::slash, "/", start);
    case '%': ++pos_; return make_token(token_type::percent, "%", start);
    case '=':
      if (n == '=') {
        pos_ += 2;
        return make_token(token_type::eq, "==", start);
      }
      break;
    case '!':
      if (n == '=') {
        pos_ += 2;
        return make_token(token_type::ne, "!=", start);
      }
      break;
    case '<':
      if (n == '=') {
        pos_ += 2;
        return make_token(token_type::le, "<=", start);
      }
      ++pos_;
      return make_token(token_type::lt, "<", start);
    case '>':
      if (n == '=') {
        pos_ += 2;
        return make_token(token_type::ge, ">=", start);
      }
      ++pos_;
      return make_token(token_type::gt, ">", start);
    default:
      break;
  }

  failed_ = true;
  return make_token(token_type::error, plx_string("Unexpected character '") + plx_string(c) + "'", start);
}

token plx_expr_lexer::lex_number() {
  size_t start = pos_;
  while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
    ++pos_;
  }
  if (pos_ < input_.size() && input_[pos_] == '.') {
    ++pos_;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      ++pos_;
    }
  }
  if (pos_ < input_.size() && (input_[pos_] == 'e' || input_[pos_] == 'E')) {
    size_t exp = pos_ + 1;
    if (exp < input_.size() && (input_[exp] == '+' || input_[exp] == '-')) {
      ++exp;
    }
    if (exp < input_.size() && std::isdigit(static_cast<unsigned char>(input_[exp])) != 0) {
      pos_ = exp;
      while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
        ++pos_;
      }
    }
  }
  return make_token(token_type::number, input_.substr(start, pos_ - start), start);
}

token plx_expr_lexer::lex_string() {
  size_t start = pos_;
  char quote = input_[pos_++];
  plx_string value;
  while (pos_ < input_.size() && input_[pos_] != quote) {
    char c = input_[pos_++];
    if (c == '\\' && pos_ < input_.size()) {
      char e = input_[pos_++];
      switch (e) {
        case 'n': value += '\n'; break;
        case 't': value += '\t'; break;
        default: value += e; break;
      }
      continue;
    }
    value += c;
  }
  if (pos_ >= input_.size()) {
    failed_ = true;
    return make_token(token_type::error, "Unterminated string literal", start);
  }
  ++pos_;
  return make_token(token_type::string, value, start);
}

token plx_expr_lexer::lex_identifier_or_keyword() {
  size_t start = pos_;
  while (pos_ < input_.size() && is_ident_char(input_[pos_])) {
    ++pos_;
  }
  plx_string word = input_.substr(start, pos_ - start);
  if (word == "and") return make_token(token_type::keyword_and, word, start);
  if (word == "or") return make_token(token_type::keyword_or, word, start);
  if (word == "not") return make_token(token_type::keyword_not, word, start);
  if (word == "in") return make_token(token_type::keyword_in, word, start);
  if (word == "true" || word == "True") return make_token(token_type::keyword_true, word, start);
  if (word == "false" || word == "False") return make_token(token_type::keyword_false, word, start);
  if (word == "none" || word == "None") return make_token(token_type::keyword_none, word, start);
  return make_token(token_type::identifier, word, start);
}

} // namespace plx::processors::expr
