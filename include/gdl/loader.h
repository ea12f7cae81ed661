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

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "gdl/events.h"
#include "gdl/id_generator.h"
#include "gdl/model/elements.h"
#include "gdl/model/predicate.h"

namespace gdl {

namespace detail {
class VariableCache;
}  // namespace detail

struct LoaderOptions {
  std::string defaultGraphLabel = "__GRAPH";
  std::string defaultVertexLabel = "__VERTEX";
  std::string defaultEdgeLabel = "__EDGE";

  bool useDefaultGraphLabel = true;
  bool useDefaultVertexLabel = true;
  bool useDefaultEdgeLabel = true;

  IdGenerator nextGraphId = ContinuousIdGenerator();
  IdGenerator nextVertexId = ContinuousIdGenerator();
  IdGenerator nextEdgeId = ContinuousIdGenerator();
};

using GraphCache = std::unordered_map<std::string, model::Graph>;
using VertexCache = std::unordered_map<std::string, model::Vertex>;
using EdgeCache = std::unordered_map<std::string, model::Edge>;

// Builds graphs, vertices, edges and the CNF predicate from syntax events.
// State carries over between Process() calls, so successive script fragments
// extend the same model. After an exception the loader must be discarded.
//
// All accessors throw Error (DanglingReference) while an edge endpoint
// variable is not bound to a vertex or a path ended with an open edge.
class Loader {
 public:
  explicit Loader(LoaderOptions options = {});
  ~Loader();

  Loader(const Loader&) = delete;
  Loader& operator=(const Loader&) = delete;

  void Process(const Event& event);
  void Process(const Events& events);

  // In creation order.
  const std::vector<model::Graph>& graphs() const;
  const std::vector<model::Vertex>& vertices() const;
  const std::vector<model::Edge>& edges() const;

  // Conjunction of all filter expressions in CNF, empty if none was declared.
  const std::optional<model::Predicate>& predicates() const;

  // Snapshots of variable bindings. By default only user-defined variables
  // are included.
  GraphCache graphCache(bool includeUserDefined = true,
                        bool includeAutoGenerated = false) const;
  VertexCache vertexCache(bool includeUserDefined = true,
                          bool includeAutoGenerated = false) const;
  EdgeCache edgeCache(bool includeUserDefined = true,
                      bool includeAutoGenerated = false) const;

 private:
  template <typename ElementType>
  struct ElementStore {
    std::vector<ElementType> elements;
    std::unordered_map<uint64_t, size_t> index;

    ElementType& Add(uint64_t id);
    ElementType& Get(uint64_t id) { return elements[index.at(id)]; }
    const ElementType& Get(uint64_t id) const {
      return elements[index.at(id)];
    }
  };

  struct EndpointRef {
    uint64_t edgeId;
    bool isSource;
  };

  // Endpoint that is known by name only, or that waits for the vertex
  // following its edge in the path.
  struct PendingEndpoint {
    EndpointRef endpoint;
    bool isNewEdge;
    InputPosition position;
  };

  void Handle(const GraphStart&);
  void Handle(const GraphEnd&);
  void Handle(const VertexDeclaration&);
  void Handle(const EdgeDeclaration&);
  void Handle(const PathEnd&);
  void Handle(const PropertyAssignment&);
  void Handle(const LabelDeclaration&);
  void Handle(const PredicateExpression&);
  void Handle(const QueryStart&);
  void Handle(const QueryEnd&);

  model::Element& GetElement(model::EntityKind, uint64_t id);
  uint64_t ResolveReference(model::EntityKind,
                            const std::string& name,
                            const InputPosition&) const;
  std::optional<std::string> DefaultLabel(model::EntityKind) const;

  void MergeLabel(model::EntityKind,
                  model::Element&,
                  const std::optional<std::string>& label,
                  bool isNew,
                  const InputPosition&);
  // Stores the property, or adds an equality predicate inside a query.
  void ApplyProperty(model::EntityKind,
                     model::Element&,
                     const std::string& key,
                     const model::PropertyValue& value,
                     const InputPosition&);
  void ApplyProperties(model::EntityKind,
                       model::Element&,
                       const model::Properties&,
                       const InputPosition&);
  void AddPredicate(model::Predicate);

  void AddToOpenGraphs(model::EntityKind, uint64_t id);
  void ResolveEndpoints(const std::string& vertexName, uint64_t vertexId);
  void SetEndpoint(const EndpointRef&,
                   uint64_t vertexId,
                   bool isNewEdge,
                   const InputPosition&);
  void SetEndpoint(const EndpointRef&,
                   const std::string& vertexName,
                   bool isNewEdge,
                   const InputPosition&);
  bool IsUnresolved(const EndpointRef&) const;
  void CheckNotPendingEndpoint(model::EntityKind,
                               const std::optional<std::string>& name,
                               const InputPosition&) const;
  void CheckOpenEdge() const;
  void CheckDanglingReferences() const;

  template <typename ElementType>
  std::unordered_map<std::string, ElementType> BuildCache(
      model::EntityKind,
      const ElementStore<ElementType>&,
      bool includeUserDefined,
      bool includeAutoGenerated) const;

  const LoaderOptions options_;
  std::unique_ptr<detail::VariableCache> variables_;

  ElementStore<model::Graph> graphs_;
  ElementStore<model::Vertex> vertices_;
  ElementStore<model::Edge> edges_;
  std::optional<model::Predicate> predicates_;

  // Ids of elements whose label was written in the script, per entity kind.
  std::array<std::unordered_set<uint64_t>, 3> explicitLabels_;

  std::vector<uint64_t> openGraphs_;
  bool isInsideQuery_ = false;

  std::optional<uint64_t> lastVertex_;
  std::optional<PendingEndpoint> openEdge_;

  // Endpoints naming a vertex variable that is not bound yet. Ordered so that
  // the reported dangling reference does not depend on hashing.
  std::map<std::string, std::vector<PendingEndpoint>> unresolvedEndpoints_;
};

}  // namespace gdl
