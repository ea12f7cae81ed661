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

#include <fmt/format.h>

#include "gdl/error.h"

namespace gdl {

class FormattedError : public Error {
 public:
  template <typename... Args>
  FormattedError(InputPosition pos,
                 ErrorCode errorCode,
                 const char* formatString,
                 Args&&... args)
      : Error(pos,
              errorCode,
              fmt::format(fmt::runtime(formatString),
                          std::forward<Args>(args)...)) {}

  template <typename... Args>
  FormattedError(ErrorCode errorCode, const char* formatString, Args&&... args)
      : FormattedError(InputPosition{},
                       errorCode,
                       formatString,
                       std::forward<Args>(args)...) {}
};

}  // namespace gdl
