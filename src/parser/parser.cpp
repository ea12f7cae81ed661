// Copyright 2025 Oleg Maximenko
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "gdl/parser.h"

#include <algorithm>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include "common/formatted_error.h"
#include "gdl/log.h"
#include "parser/lexer.h"

namespace gdl {

namespace {

using detail::Token;
using detail::TokenType;

constexpr uint64_t kMaxInt64 =
    static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

struct Header {
  std::optional<std::string> variable;
  std::optional<std::string> label;
};

class Parser {
 public:
  Parser(std::vector<Token> tokens, ErrorStrategy& errorStrategy)
      : tokens_(std::move(tokens)), errorStrategy_(errorStrategy) {}

  Events Parse() {
    Events events;
    while (Peek().type != TokenType::End) {
      auto definitionStart = pos_;
      Events definition;
      try {
        ParseDefinition(definition);
        Accept(TokenType::Comma);
      } catch (const Error& error) {
        errorStrategy_.ReportSyntaxError(error);
        Synchronize(definitionStart);
        continue;
      }
      std::move(definition.begin(), definition.end(),
                std::back_inserter(events));
    }
    return events;
  }

 private:
  const Token& Peek() const { return tokens_[pos_]; }

  const Token& Next() {
    const auto& token = tokens_[pos_];
    if (token.type != TokenType::End) {
      ++pos_;
    }
    return token;
  }

  bool Accept(TokenType type) {
    if (Peek().type != type) {
      return false;
    }
    Next();
    return true;
  }

  const Token& Expect(TokenType type) {
    if (Peek().type != type) {
      throw UnexpectedToken(detail::TokenTypeToString(type));
    }
    return Next();
  }

  Error UnexpectedToken(const char* expected) const {
    const auto& token = Peek();
    if (token.type == TokenType::Invalid) {
      return Error(token.position, token.errorCode.value_or(ErrorCode::E0101),
                   token.text);
    }
    return FormattedError(token.position, ErrorCode::E0104,
                          "Expected {0} but found {1}", expected,
                          Describe(token));
  }

  static std::string Describe(const Token& token) {
    switch (token.type) {
      case TokenType::Identifier:
        return fmt::format("identifier \"{}\"", token.text);
      case TokenType::Integer:
      case TokenType::Float:
        return fmt::format("number {}", token.text);
      case TokenType::String:
        return "string literal";
      default:
        return detail::TokenTypeToString(token.type);
    }
  }

  // Drops the tokens of a broken definition: everything up to the next ','
  // or MATCH outside of brackets. A stray ',' is a definition of its own.
  void Synchronize(size_t definitionStart) {
    pos_ = definitionStart;
    if (Accept(TokenType::Comma)) {
      return;
    }
    int depth = 0;
    do {
      switch (Next().type) {
        case TokenType::LeftParen:
        case TokenType::LeftBracket:
        case TokenType::LeftBrace:
          ++depth;
          break;
        case TokenType::RightParen:
        case TokenType::RightBracket:
        case TokenType::RightBrace:
          depth = std::max(0, depth - 1);
          break;
        default:
          break;
      }
    } while (Peek().type != TokenType::End &&
             !(depth == 0 && (Peek().type == TokenType::Comma ||
                              Peek().type == TokenType::KeywordMatch)));
    Accept(TokenType::Comma);
  }

  void ParseDefinition(Events& events) {
    switch (Peek().type) {
      case TokenType::LeftParen:
        ParsePath(events);
        break;
      case TokenType::KeywordMatch:
        ParseQuery(events);
        break;
      case TokenType::Identifier:
      case TokenType::Colon:
      case TokenType::At:
      case TokenType::LeftBrace:
      case TokenType::LeftBracket:
        ParseGraph(events);
        break;
      default:
        throw UnexpectedToken("a graph, a path or MATCH");
    }
  }

  void ParseGraph(Events& events) {
    GraphStart graph;
    graph.position = Peek().position;
    auto header = ParseHeader();
    graph.variable = std::move(header.variable);
    graph.label = std::move(header.label);
    if (Accept(TokenType::At)) {
      graph.id = Expect(TokenType::Integer).integer;
    }
    if (Peek().type == TokenType::LeftBrace) {
      graph.properties = ParseProperties();
    }
    Expect(TokenType::LeftBracket);
    events.push_back(std::move(graph));
    while (Peek().type != TokenType::RightBracket) {
      if (Peek().type != TokenType::LeftParen) {
        throw UnexpectedToken("a path or ']'");
      }
      ParsePath(events);
      Accept(TokenType::Comma);
    }
    events.push_back(GraphEnd{Next().position});
  }

  void ParseQuery(Events& events) {
    auto pos = Expect(TokenType::KeywordMatch).position;
    events.push_back(QueryStart{pos});
    ParsePath(events);
    while (Peek().type == TokenType::Comma &&
           tokens_[pos_ + 1].type == TokenType::LeftParen) {
      Next();
      ParsePath(events);
    }
    if (Peek().type == TokenType::KeywordWhere) {
      auto wherePos = Next().position;
      events.push_back(PredicateExpression{ParseExpression(), wherePos});
    }
    events.push_back(QueryEnd{Peek().position});
  }

  void ParsePath(Events& events) {
    events.push_back(ParseVertex());
    while (Peek().type == TokenType::Minus || Peek().type == TokenType::Less) {
      events.push_back(ParseEdge());
      events.push_back(ParseVertex());
    }
    events.push_back(PathEnd{Peek().position});
  }

  VertexDeclaration ParseVertex() {
    VertexDeclaration vertex;
    vertex.position = Expect(TokenType::LeftParen).position;
    auto header = ParseHeader();
    vertex.variable = std::move(header.variable);
    vertex.label = std::move(header.label);
    if (Peek().type == TokenType::LeftBrace) {
      vertex.properties = ParseProperties();
    }
    Expect(TokenType::RightParen);
    return vertex;
  }

  EdgeDeclaration ParseEdge() {
    EdgeDeclaration edge;
    edge.position = Peek().position;
    if (Accept(TokenType::Less)) {
      edge.direction = EdgeDirection::Incoming;
    }
    Expect(TokenType::Minus);
    if (Accept(TokenType::LeftBracket)) {
      auto header = ParseHeader();
      edge.variable = std::move(header.variable);
      edge.label = std::move(header.label);
      if (Peek().type == TokenType::LeftBrace) {
        edge.properties = ParseProperties();
      }
      if (Peek().type == TokenType::Star) {
        edge.length = ParseLength();
      }
      Expect(TokenType::RightBracket);
    }
    Expect(TokenType::Minus);
    if (edge.direction == EdgeDirection::Outgoing) {
      Expect(TokenType::Greater);
    }
    return edge;
  }

  Header ParseHeader() {
    Header header;
    if (Peek().type == TokenType::Identifier) {
      header.variable = Next().text;
    }
    if (Accept(TokenType::Colon)) {
      header.label = Expect(TokenType::Identifier).text;
    }
    return header;
  }

  model::Properties ParseProperties() {
    model::Properties properties;
    Expect(TokenType::LeftBrace);
    if (Accept(TokenType::RightBrace)) {
      return properties;
    }
    do {
      const auto& key = Expect(TokenType::Identifier);
      Expect(TokenType::Colon);
      if (!properties.emplace(key.text, ParseLiteral()).second) {
        throw FormattedError(key.position, ErrorCode::E0104,
                             "Property \"{0}\" is declared twice", key.text);
      }
    } while (Accept(TokenType::Comma));
    Expect(TokenType::RightBrace);
    return properties;
  }

  model::EdgeLength ParseLength() {
    model::EdgeLength length;
    auto pos = Expect(TokenType::Star).position;
    if (Peek().type == TokenType::Integer) {
      length.lower = Next().integer;
      length.upper = length.lower;
    }
    if (Accept(TokenType::DotDot)) {
      length.upper = Expect(TokenType::Integer).integer;
    }
    if (length.upper && *length.upper < length.lower) {
      throw FormattedError(pos, ErrorCode::E0103,
                           "Edge length range {0}..{1} is empty",
                           length.lower, *length.upper);
    }
    return length;
  }

  model::PropertyValue ParseLiteral() {
    const auto& token = Peek();
    switch (token.type) {
      case TokenType::String:
        Next();
        return model::PropertyValue(std::in_place_type<std::string>,
                                    token.text);
      case TokenType::Integer:
        Next();
        return model::PropertyValue(std::in_place_type<int64_t>,
                                    ToInt64(token, false));
      case TokenType::Float:
        Next();
        return model::PropertyValue(std::in_place_type<double>,
                                    token.floating);
      case TokenType::Minus: {
        Next();
        const auto& number = Peek();
        if (number.type == TokenType::Integer) {
          Next();
          return model::PropertyValue(std::in_place_type<int64_t>,
                                      ToInt64(number, true));
        }
        if (number.type == TokenType::Float) {
          Next();
          return model::PropertyValue(std::in_place_type<double>,
                                      -number.floating);
        }
        throw UnexpectedToken("a number");
      }
      case TokenType::KeywordTrue:
        Next();
        return model::PropertyValue(std::in_place_type<bool>, true);
      case TokenType::KeywordFalse:
        Next();
        return model::PropertyValue(std::in_place_type<bool>, false);
      case TokenType::KeywordNull:
        Next();
        return model::PropertyValue();
      default:
        throw UnexpectedToken("a literal");
    }
  }

  static int64_t ToInt64(const Token& token, bool negative) {
    if (token.integer > kMaxInt64 + (negative ? 1 : 0)) {
      throw FormattedError(token.position, ErrorCode::E0103,
                           "Integer literal {0}{1} is out of range",
                           negative ? "-" : "", token.text);
    }
    if (!negative) {
      return static_cast<int64_t>(token.integer);
    }
    if (token.integer == kMaxInt64 + 1) {
      return std::numeric_limits<int64_t>::min();
    }
    return -static_cast<int64_t>(token.integer);
  }

  // XOR binds weakest, then OR, then AND, then NOT.
  model::Predicate ParseExpression() {
    auto left = ParseDisjunction();
    while (Accept(TokenType::KeywordXor)) {
      auto right = ParseDisjunction();
      // a XOR b == (a OR b) AND NOT (a AND b)
      auto both = model::MakeAnd({left, right});
      left = model::MakeAnd({model::MakeOr({std::move(left), std::move(right)}),
                             model::MakeNot(std::move(both))});
    }
    return left;
  }

  model::Predicate ParseDisjunction() {
    std::vector<model::Predicate> operands;
    operands.push_back(ParseConjunction());
    while (Accept(TokenType::KeywordOr)) {
      operands.push_back(ParseConjunction());
    }
    if (operands.size() == 1) {
      return std::move(operands.front());
    }
    return model::MakeOr(std::move(operands));
  }

  model::Predicate ParseConjunction() {
    std::vector<model::Predicate> operands;
    operands.push_back(ParseNegation());
    while (Accept(TokenType::KeywordAnd)) {
      operands.push_back(ParseNegation());
    }
    if (operands.size() == 1) {
      return std::move(operands.front());
    }
    return model::MakeAnd(std::move(operands));
  }

  model::Predicate ParseNegation() {
    if (Accept(TokenType::KeywordNot)) {
      return model::MakeNot(ParseNegation());
    }
    if (Accept(TokenType::LeftParen)) {
      auto predicate = ParseExpression();
      Expect(TokenType::RightParen);
      return predicate;
    }
    auto left = ParseOperand();
    auto op = ParseCompOp();
    auto right = ParseOperand();
    return model::MakeComparison(std::move(left), op, std::move(right));
  }

  model::Operand ParseOperand() {
    if (Peek().type != TokenType::Identifier) {
      return model::Literal{ParseLiteral()};
    }
    auto variable = Next().text;
    if (Accept(TokenType::Dot)) {
      return model::PropertyReference{std::move(variable),
                                      Expect(TokenType::Identifier).text};
    }
    return model::VariableReference{std::move(variable)};
  }

  model::CompOp ParseCompOp() {
    switch (Peek().type) {
      case TokenType::Equals:
        Next();
        return model::CompOp::Equals;
      case TokenType::NotEquals:
        Next();
        return model::CompOp::NotEquals;
      case TokenType::Less:
        Next();
        return model::CompOp::LessThan;
      case TokenType::LessEquals:
        Next();
        return model::CompOp::LessThanOrEquals;
      case TokenType::Greater:
        Next();
        return model::CompOp::GreaterThan;
      case TokenType::GreaterEquals:
        Next();
        return model::CompOp::GreaterThanOrEquals;
      default:
        throw UnexpectedToken("a comparison operator");
    }
  }

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  ErrorStrategy& errorStrategy_;
};

}  // namespace

Events ParseScript(std::string_view script, ErrorStrategy& errorStrategy) {
  auto events = Parser(detail::Tokenize(script), errorStrategy).Parse();
  log::Debug("Parsed {} syntax events", events.size());
  return events;
}

Events ParseScript(std::string_view script) {
  FailFastErrorStrategy errorStrategy;
  return ParseScript(script, errorStrategy);
}

}  // namespace gdl
