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

#include "gdl/model/elements.h"

#include <assert.h>

namespace gdl::model {

const char* EntityKindToString(EntityKind kind) {
  switch (kind) {
    case EntityKind::Graph:
      return "graph";
    case EntityKind::Vertex:
      return "vertex";
    case EntityKind::Edge:
      return "edge";
  }
  assert(false);
  return "";
}

bool operator==(const EdgeLength& a, const EdgeLength& b) {
  return a.lower == b.lower && a.upper == b.upper;
}

bool operator!=(const EdgeLength& a, const EdgeLength& b) {
  return !(a == b);
}

}  // namespace gdl::model
