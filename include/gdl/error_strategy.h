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

#include <vector>

#include "gdl/error.h"

namespace gdl {

// Decides what happens on a syntax error. Throwing aborts parsing before any
// event reaches the loader. Returning makes the parser drop the definition
// containing the error and resume after the next top-level ',' or MATCH.
class ErrorStrategy {
 public:
  virtual ~ErrorStrategy() = default;

  virtual void ReportSyntaxError(const Error& error) = 0;
};

// Default strategy: rethrows the first error.
class FailFastErrorStrategy : public ErrorStrategy {
 public:
  void ReportSyntaxError(const Error& error) override;
};

// Records every error and lets the parser continue.
class RecoveringErrorStrategy : public ErrorStrategy {
 public:
  void ReportSyntaxError(const Error& error) override;

  const std::vector<Error>& errors() const { return errors_; }

 private:
  std::vector<Error> errors_;
};

}  // namespace gdl
