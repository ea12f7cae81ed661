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
#include <functional>

namespace gdl {

// Produces a new identifier on every call. Identifiers returned by one
// generator must be distinct; the loader keeps one generator per entity kind.
using IdGenerator = std::function<uint64_t()>;

// Returns first, first + 1, first + 2, ...
class ContinuousIdGenerator {
 public:
  explicit ContinuousIdGenerator(uint64_t first = 0) : nextId_(first) {}

  uint64_t operator()() { return nextId_++; }

 private:
  uint64_t nextId_;
};

}  // namespace gdl
