#include "lines/parser.hpp"
#include <cctype>
#include <charconv>
#include <fmt/core.h>

namespace repld::lines {

lex_result_s lex(const std::string &source) {
  lex_result_s result;
  std::size_t i = 0;

  auto push = [&](token_type_e type, std::string text, std::size_t start) {
    result.tokens.push_back(
        {type, std::move(text), static_cast<std::int32_t>(start + 1)});
  };

  while (i < source.size()) {
    const char c = source[i];

    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      ++i;
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
      const std::size_t start = i;
      while (i < source.size() &&
             std::isdigit(static_cast<unsigned char>(source[i])) != 0) {
        ++i;
      }
      std::int64_t value = 0;
      auto [ptr, ec] =
          std::from_chars(source.data() + start, source.data() + i, value);
      if (ec != std::errc()) {
        result.message = fmt::format("The value '{}' is out of range",
                                     source.substr(start, i - start));
        result.column = static_cast<std::int32_t>(start + 1);
        return result;
      }
      push(token_type_e::INTEGER, source.substr(start, i - start), start);
      continue;
    }

    if (std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_') {
      const std::size_t start = i;
      while (i < source.size() &&
             (std::isalnum(static_cast<unsigned char>(source[i])) != 0 ||
              source[i] == '_')) {
        ++i;
      }
      std::string word = source.substr(start, i - start);
      push(word == "val" ? token_type_e::KW_VAL : token_type_e::IDENTIFIER,
           std::move(word), start);
      continue;
    }

    token_type_e type;
    switch (c) {
    case '+':
      type = token_type_e::PLUS;
      break;
    case '-':
      type = token_type_e::MINUS;
      break;
    case '*':
      type = token_type_e::STAR;
      break;
    case '/':
      type = token_type_e::SLASH;
      break;
    case '(':
      type = token_type_e::LPAREN;
      break;
    case ')':
      type = token_type_e::RPAREN;
      break;
    case '=':
      type = token_type_e::EQUALS;
      break;
    default:
      result.message = fmt::format("Unexpected character '{}'", c);
      result.column = static_cast<std::int32_t>(i + 1);
      return result;
    }
    push(type, std::string(1, c), i);
    ++i;
  }

  push(token_type_e::END, "", source.size());
  result.success = true;
  return result;
}

namespace {

class parser_c {
public:
  explicit parser_c(std::vector<token_s> tokens) : tokens_(std::move(tokens)) {}

  parse_result_s run() {
    parse_result_s result;

    if (peek().type == token_type_e::END) {
      incomplete();
      return finish(std::move(result));
    }

    if (accept(token_type_e::KW_VAL)) {
      if (!expect(token_type_e::IDENTIFIER, "Expecting property name")) {
        return finish(std::move(result));
      }
      result.statement.binding = previous().text;
      if (!expect(token_type_e::EQUALS, "Expecting '='")) {
        return finish(std::move(result));
      }
    }

    result.statement.expr = expression();
    if (status_ == parse_status_e::OK && peek().type != token_type_e::END) {
      unexpected(peek());
    }
    return finish(std::move(result));
  }

private:
  std::vector<token_s> tokens_;
  std::size_t pos_{0};
  parse_status_e status_{parse_status_e::OK};
  std::string message_;
  std::int32_t column_{0};

  const token_s &peek() const { return tokens_[pos_]; }
  const token_s &previous() const { return tokens_[pos_ - 1]; }

  bool accept(token_type_e type) {
    if (peek().type == type) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool expect(token_type_e type, const char *message) {
    if (accept(type)) {
      return true;
    }
    if (peek().type == token_type_e::END) {
      incomplete();
    } else {
      fail(message, peek().column);
    }
    return false;
  }

  void incomplete() {
    if (status_ == parse_status_e::OK) {
      status_ = parse_status_e::INCOMPLETE;
    }
  }

  void fail(const std::string &message, std::int32_t column) {
    if (status_ == parse_status_e::OK) {
      status_ = parse_status_e::ERROR;
      message_ = message;
      column_ = column;
    }
  }

  void unexpected(const token_s &token) {
    fail(fmt::format("Unexpected token '{}'", token.text), token.column);
  }

  node_t binary(node_kind_e kind, node_t lhs, node_t rhs, std::int32_t col) {
    auto node = std::make_unique<node_s>();
    node->kind = kind;
    node->column = col;
    node->lhs = std::move(lhs);
    node->rhs = std::move(rhs);
    return node;
  }

  node_t expression() {
    node_t lhs = term();
    while (status_ == parse_status_e::OK &&
           (peek().type == token_type_e::PLUS ||
            peek().type == token_type_e::MINUS)) {
      const token_s op = peek();
      ++pos_;
      node_t rhs = term();
      lhs = binary(op.type == token_type_e::PLUS ? node_kind_e::ADD
                                                 : node_kind_e::SUB,
                   std::move(lhs), std::move(rhs), op.column);
    }
    return lhs;
  }

  node_t term() {
    node_t lhs = unary();
    while (status_ == parse_status_e::OK &&
           (peek().type == token_type_e::STAR ||
            peek().type == token_type_e::SLASH)) {
      const token_s op = peek();
      ++pos_;
      node_t rhs = unary();
      lhs = binary(op.type == token_type_e::STAR ? node_kind_e::MUL
                                                 : node_kind_e::DIV,
                   std::move(lhs), std::move(rhs), op.column);
    }
    return lhs;
  }

  node_t unary() {
    if (peek().type == token_type_e::MINUS) {
      const std::int32_t col = peek().column;
      ++pos_;
      auto node = std::make_unique<node_s>();
      node->kind = node_kind_e::NEGATE;
      node->column = col;
      node->lhs = unary();
      return node;
    }
    return primary();
  }

  node_t primary() {
    const token_s &token = peek();
    switch (token.type) {
    case token_type_e::INTEGER: {
      ++pos_;
      auto node = std::make_unique<node_s>();
      node->kind = node_kind_e::LITERAL;
      node->column = token.column;
      std::from_chars(token.text.data(), token.text.data() + token.text.size(),
                      node->value);
      return node;
    }
    case token_type_e::IDENTIFIER: {
      ++pos_;
      auto node = std::make_unique<node_s>();
      node->kind = node_kind_e::NAME;
      node->column = token.column;
      node->name = token.text;
      return node;
    }
    case token_type_e::LPAREN: {
      ++pos_;
      node_t inner = expression();
      if (status_ == parse_status_e::OK) {
        expect(token_type_e::RPAREN, "Expecting ')'");
      }
      return inner;
    }
    case token_type_e::END:
      incomplete();
      return nullptr;
    default:
      fail("Expecting an element", token.column);
      return nullptr;
    }
  }

  parse_result_s finish(parse_result_s result) {
    result.status = status_;
    result.message = message_;
    result.column = column_;
    if (status_ != parse_status_e::OK) {
      result.statement.expr.reset();
    }
    return result;
  }
};

void collect_names_into(const node_s &node, std::vector<std::string> &names) {
  if (node.kind == node_kind_e::NAME) {
    for (const auto &name : names) {
      if (name == node.name) {
        return;
      }
    }
    names.push_back(node.name);
    return;
  }
  if (node.lhs) {
    collect_names_into(*node.lhs, names);
  }
  if (node.rhs) {
    collect_names_into(*node.rhs, names);
  }
}

} // namespace

parse_result_s parse(const std::string &source) {
  auto lexed = lex(source);
  if (!lexed.success) {
    parse_result_s result;
    result.status = parse_status_e::ERROR;
    result.message = lexed.message;
    result.column = lexed.column;
    return result;
  }

  parser_c parser(std::move(lexed.tokens));
  return parser.run();
}

std::vector<std::string> collect_names(const node_s &node) {
  std::vector<std::string> names;
  collect_names_into(node, names);
  return names;
}

} // namespace repld::lines
