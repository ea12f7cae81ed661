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

#include <cstddef>
#include <stdexcept>
#include <string>

namespace gdl {

// 1-based position in the script text. Events built by hand have no position.
struct InputPosition {
  size_t line = 0;
  size_t column = 0;

  bool IsSet() const { return line != 0; }
  std::string ToString() const;
};

enum class ErrorKind {
  InvalidArgument,
  SyntaxError,
  SemanticConflict,
  DanglingReference,
};

// Stable error codes. The hundreds digit selects the kind:
// E00xx invalid argument, E01xx syntax, E02xx semantic conflict, E03xx
// dangling reference.
enum class ErrorCode {
  E0001,  // Empty script or event list
  E0002,  // Empty default label
  E0003,  // Missing identifier generator
  E0004,  // Missing error strategy
  E0005,  // Empty file name
  E0006,  // Unreadable input
  E0007,  // Identifier generator reissued an id
  E0008,  // Connective predicate without operands

  E0101,  // Unexpected character
  E0102,  // Unterminated string or comment
  E0103,  // Number out of range
  E0104,  // Unexpected token
  E0105,  // Invalid escape sequence

  E0201,  // Variable bound to another entity kind
  E0202,  // Contradicting label
  E0203,  // Contradicting property value
  E0204,  // Edge re-declared with other endpoints
  E0205,  // Graph id already in use
  E0206,  // Unbalanced graph end
  E0207,  // Reference to unknown variable
  E0208,  // Edge re-declared with other length
  E0209,  // Misplaced query

  E0301,  // Edge endpoint variable never declared
  E0302,  // Edge not followed by a vertex
  E0303,  // Edge not preceded by a vertex
};

const char* ErrorKindToString(ErrorKind);
const char* ErrorCodeToString(ErrorCode);
ErrorKind KindOfErrorCode(ErrorCode);

class Error : public std::runtime_error {
 public:
  Error(InputPosition pos, ErrorCode errorCode, const std::string& message);
  Error(ErrorCode errorCode, const std::string& message)
      : Error(InputPosition{}, errorCode, message) {}

  ErrorKind kind() const { return KindOfErrorCode(errorCode_); }
  ErrorCode errorCode() const { return errorCode_; }
  const InputPosition& inputPosition() const { return inputPosition_; }

  // Message without the position and code prefix that what() carries.
  const std::string& message() const { return message_; }

 private:
  InputPosition inputPosition_;
  ErrorCode errorCode_;
  std::string message_;
};

}  // namespace gdl
