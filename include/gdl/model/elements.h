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
#include <set>
#include <string>

#include "gdl/model/property_value.h"

namespace gdl::model {

enum class EntityKind {
  Graph,
  Vertex,
  Edge,
};

const char* EntityKindToString(EntityKind);

struct Element {
  uint64_t id = 0;
  std::optional<std::string> label;
  Properties properties;
};

struct Graph : Element {
  std::set<uint64_t> vertexIds;
  std::set<uint64_t> edgeIds;
};

struct Vertex : Element {};

// Declared path length of a variable length edge, e.g. [e*2..5]. Not
// interpreted by the loader.
struct EdgeLength {
  uint64_t lower = 1;
  std::optional<uint64_t> upper;
};

bool operator==(const EdgeLength&, const EdgeLength&);
bool operator!=(const EdgeLength&, const EdgeLength&);

struct Edge : Element {
  uint64_t sourceVertexId = 0;
  uint64_t targetVertexId = 0;
  std::optional<EdgeLength> length;
};

}  // namespace gdl::model
