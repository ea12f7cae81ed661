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

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gdl/error.h"

namespace gdl::detail {

enum class TokenType {
  Identifier,
  Integer,
  Float,
  String,

  KeywordMatch,
  KeywordWhere,
  KeywordAnd,
  KeywordOr,
  KeywordXor,
  KeywordNot,
  KeywordTrue,
  KeywordFalse,
  KeywordNull,

  LeftParen,
  RightParen,
  LeftBracket,
  RightBracket,
  LeftBrace,
  RightBrace,
  Colon,
  At,
  Comma,
  Dot,
  DotDot,
  Star,
  Minus,
  Less,
  LessEquals,
  Greater,
  GreaterEquals,
  Equals,
  NotEquals,

  // Malformed input; |text| holds the error message.
  Invalid,
  End,
};

const char* TokenTypeToString(TokenType);

struct Token {
  TokenType type = TokenType::End;
  // Identifier name, decoded string literal, source text of a number or
  // error message.
  std::string text;
  uint64_t integer = 0;
  double floating = 0;
  std::optional<ErrorCode> errorCode;
  InputPosition position;
};

// The result always ends with a TokenType::End token.
std::vector<Token> Tokenize(std::string_view text);

}  // namespace gdl::detail
