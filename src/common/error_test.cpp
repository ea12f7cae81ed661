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

#include <gtest/gtest.h>

#include <string>

using namespace gdl;

struct ErrorCodeTestParam {
  ErrorCode errorCode;
  const char* name;
  ErrorKind kind;
};

class ErrorCodes : public testing::TestWithParam<ErrorCodeTestParam> {};

TEST_P(ErrorCodes, NameAndKind) {
  auto& param = GetParam();
  EXPECT_EQ(std::string(ErrorCodeToString(param.errorCode)), param.name);
  EXPECT_EQ(KindOfErrorCode(param.errorCode), param.kind) << param.name;
}

INSTANTIATE_TEST_SUITE_P(
    ,
    ErrorCodes,
    testing::Values(
        ErrorCodeTestParam{ErrorCode::E0001, "E0001",
                           ErrorKind::InvalidArgument},
        ErrorCodeTestParam{ErrorCode::E0008, "E0008",
                           ErrorKind::InvalidArgument},
        ErrorCodeTestParam{ErrorCode::E0101, "E0101", ErrorKind::SyntaxError},
        ErrorCodeTestParam{ErrorCode::E0105, "E0105", ErrorKind::SyntaxError},
        ErrorCodeTestParam{ErrorCode::E0201, "E0201",
                           ErrorKind::SemanticConflict},
        ErrorCodeTestParam{ErrorCode::E0209, "E0209",
                           ErrorKind::SemanticConflict},
        ErrorCodeTestParam{ErrorCode::E0301, "E0301",
                           ErrorKind::DanglingReference},
        ErrorCodeTestParam{ErrorCode::E0303, "E0303",
                           ErrorKind::DanglingReference}));

TEST(Error, What) {
  Error positioned(InputPosition{3, 7}, ErrorCode::E0104, "Expected ')'");
  EXPECT_STREQ(positioned.what(), "3:7: E0104: Expected ')'");
  EXPECT_EQ(positioned.message(), "Expected ')'");
  EXPECT_EQ(positioned.kind(), ErrorKind::SyntaxError);

  Error unpositioned(ErrorCode::E0005, "File name must not be empty");
  EXPECT_STREQ(unpositioned.what(), "E0005: File name must not be empty");
  EXPECT_FALSE(unpositioned.inputPosition().IsSet());
  EXPECT_EQ(std::string(ErrorKindToString(unpositioned.kind())),
            "InvalidArgument");
}
