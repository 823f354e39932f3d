#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace repld::lines {

enum class token_type_e {
  INTEGER,
  IDENTIFIER,
  KW_VAL,
  PLUS,
  MINUS,
  STAR,
  SLASH,
  LPAREN,
  RPAREN,
  EQUALS,
  END,
};

struct token_s {
  token_type_e type{token_type_e::END};
  std::string text;
  std::int32_t column{0};
};

enum class node_kind_e {
  LITERAL,
  NAME,
  NEGATE,
  ADD,
  SUB,
  MUL,
  DIV,
};

struct node_s {
  node_kind_e kind{node_kind_e::LITERAL};
  std::int64_t value{0};
  std::string name;
  std::int32_t column{0};
  std::unique_ptr<node_s> lhs;
  std::unique_ptr<node_s> rhs;
};

using node_t = std::unique_ptr<node_s>;

//! \brief One input unit: optionally binds the value of expr to a name
struct statement_s {
  std::optional<std::string> binding;
  node_t expr;
};

enum class parse_status_e {
  OK,
  INCOMPLETE,
  ERROR,
};

struct parse_result_s {
  parse_status_e status{parse_status_e::ERROR};
  statement_s statement;
  std::string message;
  std::int32_t column{0};
};

/*
  Splits a line into tokens. Columns are 1-based. An unknown character
  or an integer literal that does not fit in 64 bits stops the scan and
  is returned as the error with its column.
*/
struct lex_result_s {
  bool success{false};
  std::vector<token_s> tokens;
  std::string message;
  std::int32_t column{0};
};

lex_result_s lex(const std::string &source);

//! \brief Parse one line. Running out of input where more is required
//!        yields INCOMPLETE rather than ERROR.
parse_result_s parse(const std::string &source);

//! \brief Names read by the expression, in order of first appearance
std::vector<std::string> collect_names(const node_s &node);

} // namespace repld::lines
