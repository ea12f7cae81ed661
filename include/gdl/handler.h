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
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gdl/error_strategy.h"
#include "gdl/events.h"
#include "gdl/loader.h"

namespace gdl {

// Entry point for GDL text. Owns a Loader and feeds it the events parsed from
// every appended script, so variables declared in one script can be referenced
// in the next one.
//
//   auto handler = gdl::Handler::Builder().BuildFromString(
//       "g[(alice:Person)-[:knows]->(bob:Person)]");
//   auto vertices = handler.vertices();
class Handler {
 public:
  class Builder;

  Handler(Handler&&) = default;
  Handler& operator=(Handler&&) = default;

  // Parses |script| and adds its content to the model. A syntax error
  // reported by a fail fast strategy leaves the model unchanged.
  void Append(const std::string& script);
  // Adds events built by the caller, e.g. by another front end.
  void Append(const Events& events);

  const std::vector<model::Graph>& graphs() const { return loader_->graphs(); }
  const std::vector<model::Vertex>& vertices() const {
    return loader_->vertices();
  }
  const std::vector<model::Edge>& edges() const { return loader_->edges(); }
  const std::optional<model::Predicate>& predicates() const {
    return loader_->predicates();
  }

  GraphCache graphCache(bool includeUserDefined = true,
                        bool includeAutoGenerated = false) const {
    return loader_->graphCache(includeUserDefined, includeAutoGenerated);
  }
  VertexCache vertexCache(bool includeUserDefined = true,
                          bool includeAutoGenerated = false) const {
    return loader_->vertexCache(includeUserDefined, includeAutoGenerated);
  }
  EdgeCache edgeCache(bool includeUserDefined = true,
                      bool includeAutoGenerated = false) const {
    return loader_->edgeCache(includeUserDefined, includeAutoGenerated);
  }

 private:
  Handler(std::unique_ptr<Loader> loader,
          std::shared_ptr<ErrorStrategy> errorStrategy);

  std::unique_ptr<Loader> loader_;
  std::shared_ptr<ErrorStrategy> errorStrategy_;
};

class Handler::Builder {
 public:
  Builder();

  Builder& SetDefaultGraphLabel(const std::string& label);
  Builder& SetDefaultVertexLabel(const std::string& label);
  Builder& SetDefaultEdgeLabel(const std::string& label);

  Builder& EnableDefaultGraphLabel() { return SetUseDefaultGraphLabel(true); }
  Builder& DisableDefaultGraphLabel() {
    return SetUseDefaultGraphLabel(false);
  }
  Builder& EnableDefaultVertexLabel() {
    return SetUseDefaultVertexLabel(true);
  }
  Builder& DisableDefaultVertexLabel() {
    return SetUseDefaultVertexLabel(false);
  }
  Builder& EnableDefaultEdgeLabel() { return SetUseDefaultEdgeLabel(true); }
  Builder& DisableDefaultEdgeLabel() { return SetUseDefaultEdgeLabel(false); }

  Builder& SetUseDefaultGraphLabel(bool use);
  Builder& SetUseDefaultVertexLabel(bool use);
  Builder& SetUseDefaultEdgeLabel(bool use);

  Builder& SetNextGraphId(IdGenerator generator);
  Builder& SetNextVertexId(IdGenerator generator);
  Builder& SetNextEdgeId(IdGenerator generator);

  // Defaults to FailFastErrorStrategy. Every handler built afterwards reports
  // to this same instance, so a RecoveringErrorStrategy collects the errors
  // of all of them. Id generators, in contrast, are copied per handler.
  Builder& SetErrorStrategy(std::shared_ptr<ErrorStrategy> errorStrategy);

  // Handler without content. Use Handler::Append() to add scripts.
  Handler Build() const;

  Handler BuildFromString(const std::string& script) const;
  Handler BuildFromStream(std::istream& stream) const;
  Handler BuildFromFile(const std::string& fileName) const;

 private:
  LoaderOptions options_;
  std::shared_ptr<ErrorStrategy> errorStrategy_;
};

}  // namespace gdl
