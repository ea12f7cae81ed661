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

#include "parser/lexer.h"

#include <assert.h>
#include <charconv>
#include <limits>
#include <optional>
#include <unordered_map>

#include <fmt/format.h>

namespace gdl::detail {

namespace {

bool IsIdentifierStart(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool IsIdentifierPart(char c) {
  return IsIdentifierStart(c) || IsDigit(c);
}

bool IsHexDigit(char c) {
  return IsDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

std::string ToUpper(std::string_view str) {
  std::string upper(str);
  for (auto& c : upper) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  return upper;
}

std::optional<TokenType> KeywordType(std::string_view word) {
  static const std::unordered_map<std::string, TokenType> keywords = {
      {"MATCH", TokenType::KeywordMatch}, {"WHERE", TokenType::KeywordWhere},
      {"AND", TokenType::KeywordAnd},     {"OR", TokenType::KeywordOr},
      {"XOR", TokenType::KeywordXor},     {"NOT", TokenType::KeywordNot},
      {"TRUE", TokenType::KeywordTrue},   {"FALSE", TokenType::KeywordFalse},
      {"NULL", TokenType::KeywordNull},
  };
  auto it = keywords.find(ToUpper(word));
  if (it == keywords.end()) {
    return {};
  }
  return it->second;
}

void AppendUtf8(std::string& str, uint32_t codePoint) {
  if (codePoint < 0x80) {
    str += static_cast<char>(codePoint);
  } else if (codePoint < 0x800) {
    str += static_cast<char>(0xC0 | (codePoint >> 6));
    str += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else if (codePoint < 0x10000) {
    str += static_cast<char>(0xE0 | (codePoint >> 12));
    str += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    str += static_cast<char>(0x80 | (codePoint & 0x3F));
  } else {
    str += static_cast<char>(0xF0 | (codePoint >> 18));
    str += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
    str += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    str += static_cast<char>(0x80 | (codePoint & 0x3F));
  }
}

bool IsHighSurrogate(uint32_t codePoint) {
  return codePoint >= 0xD800 && codePoint <= 0xDBFF;
}

bool IsLowSurrogate(uint32_t codePoint) {
  return codePoint >= 0xDC00 && codePoint <= 0xDFFF;
}

// Power of ten of the leading significant digit of a decimal literal:
// 2 for "123.4", -3 for "0.00123", -400 for "2e-400".
int64_t DecimalMagnitude(std::string_view literal) {
  auto exponentPos = literal.find_first_of("eE");
  int64_t exponent = 0;
  if (exponentPos != std::string_view::npos) {
    auto digits = literal.substr(exponentPos + 1);
    if (!digits.empty() && digits.front() == '+') {
      digits.remove_prefix(1);
    }
    auto result =
        std::from_chars(digits.data(), digits.data() + digits.size(), exponent);
    if (result.ec != std::errc()) {
      exponent = !digits.empty() && digits.front() == '-'
                     ? std::numeric_limits<int32_t>::min()
                     : std::numeric_limits<int32_t>::max();
    }
    literal = literal.substr(0, exponentPos);
  }
  auto point = literal.find('.');
  auto integerPart = literal.substr(0, point);
  auto significant = integerPart.find_first_not_of('0');
  if (significant != std::string_view::npos) {
    return exponent + static_cast<int64_t>(integerPart.size() - significant) -
           1;
  }
  if (point == std::string_view::npos) {
    return exponent;
  }
  auto fraction = literal.substr(point + 1);
  auto leadingZeros = fraction.find_first_not_of('0');
  if (leadingZeros == std::string_view::npos) {
    return exponent;
  }
  return exponent - static_cast<int64_t>(leadingZeros) - 1;
}

class Lexer {
 public:
  explicit Lexer(std::string_view text) : text_(text) {}

  std::vector<Token> Tokenize() {
    std::vector<Token> tokens;
    for (;;) {
      SkipWhitespaceAndComments(tokens);
      if (AtEnd()) {
        break;
      }
      tokens.push_back(NextToken());
    }
    Token end;
    end.type = TokenType::End;
    end.position = position_;
    tokens.push_back(std::move(end));
    return tokens;
  }

 private:
  bool AtEnd() const { return offset_ >= text_.size(); }

  char Peek(size_t ahead = 0) const {
    return offset_ + ahead < text_.size() ? text_[offset_ + ahead] : '\0';
  }

  char Advance() {
    char c = text_[offset_++];
    if (c == '\n') {
      ++position_.line;
      position_.column = 1;
    } else {
      ++position_.column;
    }
    return c;
  }

  static Token MakeInvalid(InputPosition pos,
                           ErrorCode errorCode,
                           std::string message) {
    Token token;
    token.type = TokenType::Invalid;
    token.text = std::move(message);
    token.errorCode = errorCode;
    token.position = pos;
    return token;
  }

  void SkipWhitespaceAndComments(std::vector<Token>& tokens) {
    while (!AtEnd()) {
      char c = Peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f') {
        Advance();
      } else if (c == '/' && Peek(1) == '/') {
        while (!AtEnd() && Peek() != '\n') {
          Advance();
        }
      } else if (c == '/' && Peek(1) == '*') {
        auto start = position_;
        Advance();
        Advance();
        while (!AtEnd() && !(Peek() == '*' && Peek(1) == '/')) {
          Advance();
        }
        if (AtEnd()) {
          tokens.push_back(MakeInvalid(start, ErrorCode::E0102,
                                       "Unterminated block comment"));
          return;
        }
        Advance();
        Advance();
      } else {
        return;
      }
    }
  }

  Token NextToken() {
    auto start = position_;
    char c = Peek();
    if (IsIdentifierStart(c)) {
      return LexWord(start);
    }
    if (IsDigit(c)) {
      return LexNumber(start);
    }
    if (c == '"' || c == '\'') {
      return LexString(start);
    }
    Advance();
    switch (c) {
      case '(':
        return Punctuation(TokenType::LeftParen, start);
      case ')':
        return Punctuation(TokenType::RightParen, start);
      case '[':
        return Punctuation(TokenType::LeftBracket, start);
      case ']':
        return Punctuation(TokenType::RightBracket, start);
      case '{':
        return Punctuation(TokenType::LeftBrace, start);
      case '}':
        return Punctuation(TokenType::RightBrace, start);
      case ':':
        return Punctuation(TokenType::Colon, start);
      case '@':
        return Punctuation(TokenType::At, start);
      case ',':
        return Punctuation(TokenType::Comma, start);
      case '*':
        return Punctuation(TokenType::Star, start);
      case '-':
        return Punctuation(TokenType::Minus, start);
      case '=':
        return Punctuation(TokenType::Equals, start);
      case '.':
        if (Peek() == '.') {
          Advance();
          return Punctuation(TokenType::DotDot, start);
        }
        return Punctuation(TokenType::Dot, start);
      case '<':
        if (Peek() == '=') {
          Advance();
          return Punctuation(TokenType::LessEquals, start);
        }
        if (Peek() == '>') {
          Advance();
          return Punctuation(TokenType::NotEquals, start);
        }
        return Punctuation(TokenType::Less, start);
      case '>':
        if (Peek() == '=') {
          Advance();
          return Punctuation(TokenType::GreaterEquals, start);
        }
        return Punctuation(TokenType::Greater, start);
      case '!':
        if (Peek() == '=') {
          Advance();
          return Punctuation(TokenType::NotEquals, start);
        }
        break;
      default:
        break;
    }
    return MakeInvalid(start, ErrorCode::E0101,
                       fmt::format("Unexpected character '{}'", c));
  }

  static Token Punctuation(TokenType type, InputPosition pos) {
    Token token;
    token.type = type;
    token.position = pos;
    return token;
  }

  Token LexWord(InputPosition start) {
    auto begin = offset_;
    while (IsIdentifierPart(Peek())) {
      Advance();
    }
    auto word = text_.substr(begin, offset_ - begin);
    Token token;
    token.type = KeywordType(word).value_or(TokenType::Identifier);
    token.text = std::string(word);
    token.position = start;
    return token;
  }

  Token LexNumber(InputPosition start) {
    auto begin = offset_;
    bool isFloat = false;
    while (IsDigit(Peek())) {
      Advance();
    }
    // "1..3" is a range, not a float.
    if (Peek() == '.' && IsDigit(Peek(1))) {
      isFloat = true;
      Advance();
      while (IsDigit(Peek())) {
        Advance();
      }
    }
    if ((Peek() == 'e' || Peek() == 'E') &&
        (IsDigit(Peek(1)) ||
         ((Peek(1) == '+' || Peek(1) == '-') && IsDigit(Peek(2))))) {
      isFloat = true;
      Advance();
      if (Peek() == '+' || Peek() == '-') {
        Advance();
      }
      while (IsDigit(Peek())) {
        Advance();
      }
    }
    if (IsIdentifierStart(Peek())) {
      return MakeInvalid(position_, ErrorCode::E0101,
                         fmt::format("Unexpected character '{}'", Peek()));
    }

    Token token;
    token.text = std::string(text_.substr(begin, offset_ - begin));
    token.position = start;
    if (isFloat) {
      token.type = TokenType::Float;
      auto result = std::from_chars(token.text.data(),
                                    token.text.data() + token.text.size(),
                                    token.floating);
      if (result.ec == std::errc::result_out_of_range &&
          DecimalMagnitude(token.text) < 0) {
        // Below the smallest double: zero.
        token.floating = 0.0;
      } else if (result.ec != std::errc()) {
        return MakeInvalid(
            start, ErrorCode::E0103,
            fmt::format("Float literal {} is out of range", token.text));
      }
      return token;
    }
    token.type = TokenType::Integer;
    auto result = std::from_chars(
        token.text.data(), token.text.data() + token.text.size(),
        token.integer);
    if (result.ec != std::errc()) {
      return MakeInvalid(
          start, ErrorCode::E0103,
          fmt::format("Integer literal {} is out of range", token.text));
    }
    return token;
  }

  Token LexString(InputPosition start) {
    char quote = Advance();
    std::string value;
    for (;;) {
      if (AtEnd()) {
        return MakeInvalid(start, ErrorCode::E0102,
                           "Unterminated string literal");
      }
      auto escapePos = position_;
      char c = Advance();
      if (c == quote) {
        break;
      }
      if (c != '\\') {
        value += c;
        continue;
      }
      if (AtEnd()) {
        return MakeInvalid(start, ErrorCode::E0102,
                           "Unterminated string literal");
      }
      char escaped = Advance();
      switch (escaped) {
        case 'n':
          value += '\n';
          break;
        case 't':
          value += '\t';
          break;
        case 'r':
          value += '\r';
          break;
        case 'b':
          value += '\b';
          break;
        case 'f':
          value += '\f';
          break;
        case '\\':
        case '\'':
        case '"':
          value += escaped;
          break;
        case 'u': {
          auto codePoint = LexHexQuad();
          if (codePoint && IsHighSurrogate(*codePoint)) {
            std::optional<uint32_t> low;
            if (Peek() == '\\' && Peek(1) == 'u') {
              Advance();
              Advance();
              low = LexHexQuad();
            }
            if (low && IsLowSurrogate(*low)) {
              codePoint =
                  0x10000 + ((*codePoint - 0xD800) << 10) + (*low - 0xDC00);
            } else {
              codePoint.reset();
            }
          } else if (codePoint && IsLowSurrogate(*codePoint)) {
            codePoint.reset();
          }
          if (!codePoint) {
            SkipRestOfString(quote);
            return MakeInvalid(escapePos, ErrorCode::E0105,
                               "Invalid unicode escape sequence");
          }
          AppendUtf8(value, *codePoint);
          break;
        }
        default:
          SkipRestOfString(quote);
          return MakeInvalid(
              escapePos, ErrorCode::E0105,
              fmt::format("Invalid escape sequence '\\{}'", escaped));
      }
    }
    Token token;
    token.type = TokenType::String;
    token.text = std::move(value);
    token.position = start;
    return token;
  }

  // The four hex digits of a \u escape.
  std::optional<uint32_t> LexHexQuad() {
    uint32_t codePoint = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd() || !IsHexDigit(Peek())) {
        return std::nullopt;
      }
      char digit = Advance();
      codePoint = codePoint * 16 +
                  (IsDigit(digit) ? digit - '0' : (digit | 0x20) - 'a' + 10);
    }
    return codePoint;
  }

  // Keeps the rest of a malformed literal from being lexed as code.
  void SkipRestOfString(char quote) {
    while (!AtEnd()) {
      char c = Advance();
      if (c == '\\' && !AtEnd()) {
        Advance();
      } else if (c == quote) {
        return;
      }
    }
  }

  std::string_view text_;
  size_t offset_ = 0;
  InputPosition position_{1, 1};
};

}  // namespace

const char* TokenTypeToString(TokenType type) {
  switch (type) {
    case TokenType::Identifier:
      return "identifier";
    case TokenType::Integer:
      return "integer";
    case TokenType::Float:
      return "float";
    case TokenType::String:
      return "string";
    case TokenType::KeywordMatch:
      return "MATCH";
    case TokenType::KeywordWhere:
      return "WHERE";
    case TokenType::KeywordAnd:
      return "AND";
    case TokenType::KeywordOr:
      return "OR";
    case TokenType::KeywordXor:
      return "XOR";
    case TokenType::KeywordNot:
      return "NOT";
    case TokenType::KeywordTrue:
      return "TRUE";
    case TokenType::KeywordFalse:
      return "FALSE";
    case TokenType::KeywordNull:
      return "NULL";
    case TokenType::LeftParen:
      return "'('";
    case TokenType::RightParen:
      return "')'";
    case TokenType::LeftBracket:
      return "'['";
    case TokenType::RightBracket:
      return "']'";
    case TokenType::LeftBrace:
      return "'{'";
    case TokenType::RightBrace:
      return "'}'";
    case TokenType::Colon:
      return "':'";
    case TokenType::At:
      return "'@'";
    case TokenType::Comma:
      return "','";
    case TokenType::Dot:
      return "'.'";
    case TokenType::DotDot:
      return "'..'";
    case TokenType::Star:
      return "'*'";
    case TokenType::Minus:
      return "'-'";
    case TokenType::Less:
      return "'<'";
    case TokenType::LessEquals:
      return "'<='";
    case TokenType::Greater:
      return "'>'";
    case TokenType::GreaterEquals:
      return "'>='";
    case TokenType::Equals:
      return "'='";
    case TokenType::NotEquals:
      return "'<>'";
    case TokenType::Invalid:
      return "invalid token";
    case TokenType::End:
      return "end of input";
  }
  assert(false);
  return "";
}

std::vector<Token> Tokenize(std::string_view text) {
  return Lexer(text).Tokenize();
}

}  // namespace gdl::detail
