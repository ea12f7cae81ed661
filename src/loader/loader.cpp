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

#include "gdl/loader.h"

#include <algorithm>

#include "common/formatted_error.h"
#include "gdl/common/variant_switch.h"
#include "gdl/log.h"
#include "variable_cache.h"

namespace gdl {

using model::EntityKind;
using model::EntityKindToString;

namespace {

size_t KindIndex(EntityKind kind) {
  return static_cast<size_t>(kind);
}

std::string FormatLabel(const std::optional<std::string>& label) {
  return label ? fmt::format("\"{}\"", *label) : "<none>";
}

void CheckOptions(const LoaderOptions& options) {
  std::pair<const std::string*, const char*> labels[] = {
      {&options.defaultGraphLabel, "graph"},
      {&options.defaultVertexLabel, "vertex"},
      {&options.defaultEdgeLabel, "edge"}};
  for (auto& [label, kind] : labels) {
    if (label->empty()) {
      throw FormattedError(ErrorCode::E0002,
                           "Default {0} label must not be empty", kind);
    }
  }
  std::pair<const IdGenerator*, const char*> generators[] = {
      {&options.nextGraphId, "graph"},
      {&options.nextVertexId, "vertex"},
      {&options.nextEdgeId, "edge"}};
  for (auto& [generator, kind] : generators) {
    if (!*generator) {
      throw FormattedError(ErrorCode::E0003,
                           "Identifier generator for {0}s must be set", kind);
    }
  }
}

}  // namespace

template <typename ElementType>
ElementType& Loader::ElementStore<ElementType>::Add(uint64_t id) {
  index[id] = elements.size();
  auto& element = elements.emplace_back();
  element.id = id;
  return element;
}

Loader::Loader(LoaderOptions options) : options_(std::move(options)) {
  CheckOptions(options_);
  variables_ = std::make_unique<detail::VariableCache>(
      options_.nextGraphId, options_.nextVertexId, options_.nextEdgeId);
}

Loader::~Loader() = default;

void Loader::Process(const Event& event) {
  // Only a vertex can close an edge that waits for its endpoint.
  if (!std::holds_alternative<VertexDeclaration>(event)) {
    CheckOpenEdge();
  }
  variant_switch(event, [this](const auto& value) { Handle(value); });
}

void Loader::Process(const Events& events) {
  for (auto& event : events) {
    Process(event);
  }
}

const std::vector<model::Graph>& Loader::graphs() const {
  CheckDanglingReferences();
  return graphs_.elements;
}

const std::vector<model::Vertex>& Loader::vertices() const {
  CheckDanglingReferences();
  return vertices_.elements;
}

const std::vector<model::Edge>& Loader::edges() const {
  CheckDanglingReferences();
  return edges_.elements;
}

const std::optional<model::Predicate>& Loader::predicates() const {
  CheckDanglingReferences();
  return predicates_;
}

GraphCache Loader::graphCache(bool includeUserDefined,
                              bool includeAutoGenerated) const {
  return BuildCache(EntityKind::Graph, graphs_, includeUserDefined,
                    includeAutoGenerated);
}

VertexCache Loader::vertexCache(bool includeUserDefined,
                                bool includeAutoGenerated) const {
  return BuildCache(EntityKind::Vertex, vertices_, includeUserDefined,
                    includeAutoGenerated);
}

EdgeCache Loader::edgeCache(bool includeUserDefined,
                            bool includeAutoGenerated) const {
  return BuildCache(EntityKind::Edge, edges_, includeUserDefined,
                    includeAutoGenerated);
}

template <typename ElementType>
std::unordered_map<std::string, ElementType> Loader::BuildCache(
    EntityKind kind,
    const ElementStore<ElementType>& store,
    bool includeUserDefined,
    bool includeAutoGenerated) const {
  CheckDanglingReferences();
  std::unordered_map<std::string, ElementType> result;
  for (auto& [name, id] :
       variables_->bindings(kind, includeUserDefined, includeAutoGenerated)) {
    result.emplace(name, store.Get(id));
  }
  return result;
}

void Loader::Handle(const GraphStart& event) {
  if (isInsideQuery_) {
    throw FormattedError(event.position, ErrorCode::E0209,
                         "Graph cannot be declared inside a query");
  }
  CheckNotPendingEndpoint(EntityKind::Graph, event.variable, event.position);
  auto [id, isNew] =
      event.id ? variables_->ResolveOrCreateWithId(
                     EntityKind::Graph, event.variable, *event.id,
                     event.position)
               : variables_->ResolveOrCreate(EntityKind::Graph, event.variable,
                                             event.position);
  auto& graph = isNew ? graphs_.Add(id) : graphs_.Get(id);
  MergeLabel(EntityKind::Graph, graph, event.label, isNew, event.position);
  ApplyProperties(EntityKind::Graph, graph, event.properties, event.position);
  if (isNew) {
    log::Debug("Created graph {} \"{}\" with label {}", id,
               variables_->NameOf(EntityKind::Graph, id),
               FormatLabel(graph.label));
  }

  openGraphs_.push_back(id);
  lastVertex_.reset();
}

void Loader::Handle(const GraphEnd& event) {
  if (openGraphs_.empty()) {
    throw FormattedError(event.position, ErrorCode::E0206,
                         "Graph end without a matching graph start");
  }
  openGraphs_.pop_back();
  lastVertex_.reset();
}

void Loader::Handle(const VertexDeclaration& event) {
  auto [id, isNew] = variables_->ResolveOrCreate(
      EntityKind::Vertex, event.variable, event.position);
  auto& vertex = isNew ? vertices_.Add(id) : vertices_.Get(id);
  MergeLabel(EntityKind::Vertex, vertex, event.label, isNew, event.position);
  ApplyProperties(EntityKind::Vertex, vertex, event.properties,
                  event.position);
  if (isNew) {
    log::Debug("Created vertex {} \"{}\" with label {}", id,
               variables_->NameOf(EntityKind::Vertex, id),
               FormatLabel(vertex.label));
    if (event.variable) {
      ResolveEndpoints(*event.variable, id);
    }
  }
  AddToOpenGraphs(EntityKind::Vertex, id);

  if (openEdge_) {
    auto openEdge = *openEdge_;
    openEdge_.reset();
    SetEndpoint(openEdge.endpoint, id, openEdge.isNewEdge, event.position);
  }
  lastVertex_ = id;
}

void Loader::Handle(const EdgeDeclaration& event) {
  CheckNotPendingEndpoint(EntityKind::Edge, event.variable, event.position);
  auto [id, isNew] = variables_->ResolveOrCreate(
      EntityKind::Edge, event.variable, event.position);
  auto& edge = isNew ? edges_.Add(id) : edges_.Get(id);
  MergeLabel(EntityKind::Edge, edge, event.label, isNew, event.position);
  ApplyProperties(EntityKind::Edge, edge, event.properties, event.position);
  if (event.length) {
    if (!isNew && edge.length && *edge.length != *event.length) {
      throw FormattedError(event.position, ErrorCode::E0208,
                           "Edge \"{0}\" was declared before with another "
                           "length",
                           variables_->NameOf(EntityKind::Edge, id));
    }
    edge.length = event.length;
  }

  bool isOutgoing = event.direction == EdgeDirection::Outgoing;
  for (bool isSource : {true, false}) {
    EndpointRef endpoint{id, isSource};
    auto& name = isSource ? event.source : event.target;
    if (name) {
      SetEndpoint(endpoint, *name, isNew, event.position);
      continue;
    }
    // (a)-[e]->(b): a is the source. (a)<-[e]-(b): a is the target.
    if (isSource == isOutgoing) {
      if (!lastVertex_) {
        throw FormattedError(event.position, ErrorCode::E0303,
                             "Edge \"{0}\" is not preceded by a vertex",
                             variables_->NameOf(EntityKind::Edge, id));
      }
      SetEndpoint(endpoint, *lastVertex_, isNew, event.position);
    } else {
      openEdge_ = PendingEndpoint{endpoint, isNew, event.position};
    }
  }
  AddToOpenGraphs(EntityKind::Edge, id);

  if (isNew) {
    log::Debug("Created edge {} \"{}\" with label {}", id,
               variables_->NameOf(EntityKind::Edge, id),
               FormatLabel(edges_.Get(id).label));
  }
}

void Loader::Handle(const PathEnd&) {
  lastVertex_.reset();
}

void Loader::Handle(const PropertyAssignment& event) {
  auto id = ResolveReference(event.kind, event.variable, event.position);
  ApplyProperty(event.kind, GetElement(event.kind, id), event.key, event.value,
                event.position);
}

void Loader::Handle(const LabelDeclaration& event) {
  auto id = ResolveReference(event.kind, event.variable, event.position);
  MergeLabel(event.kind, GetElement(event.kind, id), event.label, false,
             event.position);
}

void Loader::Handle(const PredicateExpression& event) {
  AddPredicate(event.predicate);
}

void Loader::Handle(const QueryStart& event) {
  if (isInsideQuery_) {
    throw FormattedError(event.position, ErrorCode::E0209,
                         "Queries cannot be nested");
  }
  if (!openGraphs_.empty()) {
    throw FormattedError(
        event.position, ErrorCode::E0209,
        "Query cannot be declared inside graph \"{0}\"",
        variables_->NameOf(EntityKind::Graph, openGraphs_.back()));
  }
  isInsideQuery_ = true;
  lastVertex_.reset();
}

void Loader::Handle(const QueryEnd& event) {
  if (!isInsideQuery_) {
    throw FormattedError(event.position, ErrorCode::E0209,
                         "Query end without a matching query start");
  }
  isInsideQuery_ = false;
  lastVertex_.reset();
}

model::Element& Loader::GetElement(EntityKind kind, uint64_t id) {
  switch (kind) {
    case EntityKind::Graph:
      return graphs_.Get(id);
    case EntityKind::Vertex:
      return vertices_.Get(id);
    case EntityKind::Edge:
      break;
  }
  return edges_.Get(id);
}

uint64_t Loader::ResolveReference(EntityKind kind,
                                  const std::string& name,
                                  const InputPosition& pos) const {
  variables_->CheckKind(kind, name, pos);
  auto id = variables_->Find(kind, name);
  if (!id) {
    throw FormattedError(pos, ErrorCode::E0207,
                         "Reference to undeclared {0} variable \"{1}\"",
                         EntityKindToString(kind), name);
  }
  return *id;
}

std::optional<std::string> Loader::DefaultLabel(EntityKind kind) const {
  switch (kind) {
    case EntityKind::Graph:
      if (options_.useDefaultGraphLabel) {
        return options_.defaultGraphLabel;
      }
      break;
    case EntityKind::Vertex:
      if (options_.useDefaultVertexLabel) {
        return options_.defaultVertexLabel;
      }
      break;
    case EntityKind::Edge:
      if (options_.useDefaultEdgeLabel) {
        return options_.defaultEdgeLabel;
      }
      break;
  }
  return {};
}

void Loader::MergeLabel(EntityKind kind,
                        model::Element& element,
                        const std::optional<std::string>& label,
                        bool isNew,
                        const InputPosition& pos) {
  auto& explicitLabels = explicitLabels_[KindIndex(kind)];
  if (isNew) {
    if (label) {
      element.label = label;
      explicitLabels.insert(element.id);
    } else {
      element.label = DefaultLabel(kind);
    }
    return;
  }

  // A re-reference may add a label to an element that had none or only the
  // default one, but may not change a label written before.
  if (!label) {
    return;
  }
  if (explicitLabels.count(element.id) && element.label != label) {
    throw FormattedError(pos, ErrorCode::E0202,
                         "{0} \"{1}\" was declared before with label \"{2}\"",
                         EntityKindToString(kind),
                         variables_->NameOf(kind, element.id), *element.label);
  }
  element.label = label;
  explicitLabels.insert(element.id);
}

void Loader::ApplyProperty(EntityKind kind,
                           model::Element& element,
                           const std::string& key,
                           const model::PropertyValue& value,
                           const InputPosition& pos) {
  auto& name = variables_->NameOf(kind, element.id);
  if (isInsideQuery_) {
    AddPredicate(model::MakeComparison(model::PropertyReference{name, key},
                                       model::CompOp::Equals,
                                       model::Literal{value}));
    return;
  }

  auto it = element.properties.find(key);
  if (it == element.properties.end()) {
    element.properties.emplace(key, value);
  } else if (it->second != value) {
    throw FormattedError(
        pos, ErrorCode::E0203,
        "Property \"{0}\" of {1} \"{2}\" was declared before with value {3}",
        key, EntityKindToString(kind), name, model::ToString(it->second));
  }
}

void Loader::ApplyProperties(EntityKind kind,
                             model::Element& element,
                             const model::Properties& properties,
                             const InputPosition& pos) {
  for (auto& [key, value] : properties) {
    ApplyProperty(kind, element, key, value, pos);
  }
}

void Loader::AddPredicate(model::Predicate predicate) {
  predicates_ = model::ToCnf(
      *model::Combine(std::move(predicates_), std::move(predicate)));
}

void Loader::AddToOpenGraphs(EntityKind kind, uint64_t id) {
  for (auto graphId : openGraphs_) {
    auto& graph = graphs_.Get(graphId);
    if (kind == EntityKind::Vertex) {
      graph.vertexIds.insert(id);
    } else {
      graph.edgeIds.insert(id);
    }
  }
}

void Loader::ResolveEndpoints(const std::string& vertexName,
                              uint64_t vertexId) {
  auto it = unresolvedEndpoints_.find(vertexName);
  if (it == unresolvedEndpoints_.end()) {
    return;
  }
  for (auto& pending : it->second) {
    auto& edge = edges_.Get(pending.endpoint.edgeId);
    if (pending.endpoint.isSource) {
      edge.sourceVertexId = vertexId;
    } else {
      edge.targetVertexId = vertexId;
    }
  }
  unresolvedEndpoints_.erase(it);
}

void Loader::SetEndpoint(const EndpointRef& endpoint,
                         uint64_t vertexId,
                         bool isNewEdge,
                         const InputPosition& pos) {
  auto& edge = edges_.Get(endpoint.edgeId);
  auto& current = endpoint.isSource ? edge.sourceVertexId : edge.targetVertexId;
  if (isNewEdge) {
    current = vertexId;
    return;
  }
  if (current != vertexId || IsUnresolved(endpoint)) {
    throw FormattedError(pos, ErrorCode::E0204,
                         "Edge \"{0}\" was declared before with another {1} "
                         "vertex",
                         variables_->NameOf(EntityKind::Edge, edge.id),
                         endpoint.isSource ? "source" : "target");
  }
}

void Loader::SetEndpoint(const EndpointRef& endpoint,
                         const std::string& vertexName,
                         bool isNewEdge,
                         const InputPosition& pos) {
  variables_->CheckKind(EntityKind::Vertex, vertexName, pos);
  if (auto vertexId = variables_->Find(EntityKind::Vertex, vertexName)) {
    SetEndpoint(endpoint, *vertexId, isNewEdge, pos);
    return;
  }
  if (isNewEdge) {
    unresolvedEndpoints_[vertexName].push_back({endpoint, isNewEdge, pos});
    return;
  }

  auto it = unresolvedEndpoints_.find(vertexName);
  bool isSameEndpoint =
      it != unresolvedEndpoints_.end() &&
      std::any_of(it->second.begin(), it->second.end(),
                  [&endpoint](const PendingEndpoint& pending) {
                    return pending.endpoint.edgeId == endpoint.edgeId &&
                           pending.endpoint.isSource == endpoint.isSource;
                  });
  if (!isSameEndpoint) {
    throw FormattedError(pos, ErrorCode::E0204,
                         "Edge \"{0}\" was declared before with another {1} "
                         "vertex",
                         variables_->NameOf(EntityKind::Edge, endpoint.edgeId),
                         endpoint.isSource ? "source" : "target");
  }
}

bool Loader::IsUnresolved(const EndpointRef& endpoint) const {
  for (auto& [name, pendingEndpoints] : unresolvedEndpoints_) {
    for (auto& pending : pendingEndpoints) {
      if (pending.endpoint.edgeId == endpoint.edgeId &&
          pending.endpoint.isSource == endpoint.isSource) {
        return true;
      }
    }
  }
  return false;
}

void Loader::CheckNotPendingEndpoint(EntityKind kind,
                                     const std::optional<std::string>& name,
                                     const InputPosition& pos) const {
  if (name && unresolvedEndpoints_.count(*name)) {
    throw FormattedError(
        pos, ErrorCode::E0201,
        "{0} variable \"{1}\" was declared before as a vertex variable",
        EntityKindToString(kind), *name);
  }
}

void Loader::CheckOpenEdge() const {
  if (openEdge_) {
    throw FormattedError(
        openEdge_->position, ErrorCode::E0302,
        "Edge \"{0}\" is not followed by a vertex",
        variables_->NameOf(EntityKind::Edge, openEdge_->endpoint.edgeId));
  }
}

void Loader::CheckDanglingReferences() const {
  CheckOpenEdge();
  if (unresolvedEndpoints_.empty()) {
    return;
  }
  auto& [name, pendingEndpoints] = *unresolvedEndpoints_.begin();
  auto& pending = pendingEndpoints.front();
  throw FormattedError(
      pending.position, ErrorCode::E0301,
      "{0} vertex \"{1}\" of edge \"{2}\" was never declared",
      pending.endpoint.isSource ? "Source" : "Target", name,
      variables_->NameOf(EntityKind::Edge, pending.endpoint.edgeId));
}

}  // namespace gdl
