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
#include <variant>
#include <vector>

#include "gdl/error.h"
#include "gdl/model/elements.h"
#include "gdl/model/predicate.h"

namespace gdl {

// Syntax events consumed by Loader in document order. The parser emits them
// for GDL text; they can also be built directly.

// Opens a graph. Vertices and edges declared until the matching GraphEnd
// become members of the graph (and of every enclosing open graph).
struct GraphStart {
  std::optional<std::string> variable;
  std::optional<std::string> label;
  model::Properties properties;
  // Literal graph id. Wins over the graph id generator.
  std::optional<uint64_t> id;
  InputPosition position;
};

struct GraphEnd {
  InputPosition position;
};

struct VertexDeclaration {
  std::optional<std::string> variable;
  std::optional<std::string> label;
  model::Properties properties;
  InputPosition position;
};

enum class EdgeDirection {
  Outgoing,  // (a)-[e]->(b)
  Incoming,  // (a)<-[e]-(b)
};

// Endpoints without an explicit variable are taken from the enclosing path:
// the vertex declared right before the edge and the one declared right after
// it. The direction decides which of them is the source.
struct EdgeDeclaration {
  std::optional<std::string> variable;
  std::optional<std::string> label;
  model::Properties properties;
  EdgeDirection direction = EdgeDirection::Outgoing;
  std::optional<std::string> source;
  std::optional<std::string> target;
  std::optional<model::EdgeLength> length;
  InputPosition position;
};

// Terminates the current path. The next edge starts without a preceding
// vertex.
struct PathEnd {
  InputPosition position;
};

struct PropertyAssignment {
  model::EntityKind kind = model::EntityKind::Vertex;
  std::string variable;
  std::string key;
  model::PropertyValue value;
  InputPosition position;
};

struct LabelDeclaration {
  model::EntityKind kind = model::EntityKind::Vertex;
  std::string variable;
  std::string label;
  InputPosition position;
};

// Filter expression, conjoined with all previously declared ones.
struct PredicateExpression {
  model::Predicate predicate;
  InputPosition position;
};

// Between QueryStart and QueryEnd element properties are turned into
// equality predicates instead of being stored.
struct QueryStart {
  InputPosition position;
};

struct QueryEnd {
  InputPosition position;
};

using Event = std::variant<GraphStart,
                           GraphEnd,
                           VertexDeclaration,
                           EdgeDeclaration,
                           PathEnd,
                           PropertyAssignment,
                           LabelDeclaration,
                           PredicateExpression,
                           QueryStart,
                           QueryEnd>;

using Events = std::vector<Event>;

}  // namespace gdl
