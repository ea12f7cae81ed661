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

#include "gdl/error_strategy.h"

#include "gdl/log.h"

namespace gdl {

void FailFastErrorStrategy::ReportSyntaxError(const Error& error) {
  throw error;
}

void RecoveringErrorStrategy::ReportSyntaxError(const Error& error) {
  log::Warn("Skipping malformed definition: {}", error.what());
  errors_.push_back(error);
}

}  // namespace gdl
