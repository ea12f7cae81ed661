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

#include "gdl/error.h"

#include <assert.h>

#include <fmt/format.h>

namespace gdl {

namespace {

std::string FormatWhat(const InputPosition& pos,
                       ErrorCode errorCode,
                       const std::string& message) {
  if (pos.IsSet()) {
    return fmt::format("{}: {}: {}", pos.ToString(),
                       ErrorCodeToString(errorCode), message);
  }
  return fmt::format("{}: {}", ErrorCodeToString(errorCode), message);
}

}  // namespace

std::string InputPosition::ToString() const {
  return fmt::format("{}:{}", line, column);
}

const char* ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidArgument:
      return "InvalidArgument";
    case ErrorKind::SyntaxError:
      return "SyntaxError";
    case ErrorKind::SemanticConflict:
      return "SemanticConflict";
    case ErrorKind::DanglingReference:
      return "DanglingReference";
  }
  assert(false);
  return "";
}

const char* ErrorCodeToString(ErrorCode errorCode) {
  switch (errorCode) {
    case ErrorCode::E0001:
      return "E0001";
    case ErrorCode::E0002:
      return "E0002";
    case ErrorCode::E0003:
      return "E0003";
    case ErrorCode::E0004:
      return "E0004";
    case ErrorCode::E0005:
      return "E0005";
    case ErrorCode::E0006:
      return "E0006";
    case ErrorCode::E0007:
      return "E0007";
    case ErrorCode::E0008:
      return "E0008";
    case ErrorCode::E0101:
      return "E0101";
    case ErrorCode::E0102:
      return "E0102";
    case ErrorCode::E0103:
      return "E0103";
    case ErrorCode::E0104:
      return "E0104";
    case ErrorCode::E0105:
      return "E0105";
    case ErrorCode::E0201:
      return "E0201";
    case ErrorCode::E0202:
      return "E0202";
    case ErrorCode::E0203:
      return "E0203";
    case ErrorCode::E0204:
      return "E0204";
    case ErrorCode::E0205:
      return "E0205";
    case ErrorCode::E0206:
      return "E0206";
    case ErrorCode::E0207:
      return "E0207";
    case ErrorCode::E0208:
      return "E0208";
    case ErrorCode::E0209:
      return "E0209";
    case ErrorCode::E0301:
      return "E0301";
    case ErrorCode::E0302:
      return "E0302";
    case ErrorCode::E0303:
      return "E0303";
  }
  assert(false);
  return "";
}

ErrorKind KindOfErrorCode(ErrorCode errorCode) {
  auto value = static_cast<int>(errorCode);
  if (value >= static_cast<int>(ErrorCode::E0301)) {
    return ErrorKind::DanglingReference;
  }
  if (value >= static_cast<int>(ErrorCode::E0201)) {
    return ErrorKind::SemanticConflict;
  }
  if (value >= static_cast<int>(ErrorCode::E0101)) {
    return ErrorKind::SyntaxError;
  }
  return ErrorKind::InvalidArgument;
}

Error::Error(InputPosition pos, ErrorCode errorCode, const std::string& message)
    : std::runtime_error(FormatWhat(pos, errorCode, message)),
      inputPosition_(pos),
      errorCode_(errorCode),
      message_(message) {}

}  // namespace gdl
