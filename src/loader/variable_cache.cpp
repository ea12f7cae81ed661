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

#include "variable_cache.h"

#include <fmt/format.h>

#include "common/formatted_error.h"

namespace gdl::detail {

using model::EntityKind;
using model::EntityKindToString;

VariableCache::VariableCache(IdGenerator nextGraphId,
                             IdGenerator nextVertexId,
                             IdGenerator nextEdgeId) {
  ns(EntityKind::Graph).generator = std::move(nextGraphId);
  ns(EntityKind::Graph).autoNamePrefix = "__g";
  ns(EntityKind::Vertex).generator = std::move(nextVertexId);
  ns(EntityKind::Vertex).autoNamePrefix = "__v";
  ns(EntityKind::Edge).generator = std::move(nextEdgeId);
  ns(EntityKind::Edge).autoNamePrefix = "__e";
}

VariableCache::Resolution VariableCache::ResolveOrCreate(
    EntityKind kind,
    const std::optional<std::string>& name,
    const InputPosition& pos) {
  if (name) {
    if (auto id = Find(kind, *name)) {
      return {*id, false};
    }
    CheckKind(kind, *name, pos);
    auto id = NextId(kind);
    Bind(kind, *name, id, true);
    return {id, true};
  }
  auto id = NextId(kind);
  Bind(kind, NextAutoName(kind), id, false);
  return {id, true};
}

VariableCache::Resolution VariableCache::ResolveOrCreateWithId(
    EntityKind kind,
    const std::optional<std::string>& name,
    uint64_t literalId,
    const InputPosition& pos) {
  auto& space = ns(kind);
  if (name) {
    if (auto id = Find(kind, *name)) {
      if (*id != literalId) {
        throw FormattedError(pos, ErrorCode::E0205,
                             "{0} \"{1}\" was declared before with id {2}",
                             EntityKindToString(kind), *name, *id);
      }
      return {*id, false};
    }
    CheckKind(kind, *name, pos);
  }
  if (space.names.count(literalId)) {
    throw FormattedError(pos, ErrorCode::E0205,
                         "{0} id {1} is already used by \"{2}\"",
                         EntityKindToString(kind), literalId,
                         space.names[literalId]);
  }
  space.literalIds.insert(literalId);
  if (name) {
    Bind(kind, *name, literalId, true);
  } else {
    Bind(kind, NextAutoName(kind), literalId, false);
  }
  return {literalId, true};
}

std::optional<uint64_t> VariableCache::Find(EntityKind kind,
                                            const std::string& name) const {
  auto& space = ns(kind);
  auto it = space.userDefined.find(name);
  if (it != space.userDefined.end()) {
    return it->second;
  }
  it = space.autoGenerated.find(name);
  if (it != space.autoGenerated.end()) {
    return it->second;
  }
  return {};
}

const std::string& VariableCache::NameOf(EntityKind kind, uint64_t id) const {
  return ns(kind).names.at(id);
}

std::optional<EntityKind> VariableCache::KindOf(const std::string& name) const {
  auto it = kinds_.find(name);
  if (it == kinds_.end()) {
    return {};
  }
  return it->second;
}

void VariableCache::CheckKind(EntityKind kind,
                              const std::string& name,
                              const InputPosition& pos) const {
  auto boundKind = KindOf(name);
  if (boundKind && *boundKind != kind) {
    throw FormattedError(
        pos, ErrorCode::E0201,
        "{0} variable \"{1}\" was declared before as a {2} variable",
        EntityKindToString(kind), name, EntityKindToString(*boundKind));
  }
}

VariableCache::Bindings VariableCache::bindings(
    EntityKind kind,
    bool includeUserDefined,
    bool includeAutoGenerated) const {
  auto& space = ns(kind);
  Bindings result;
  if (includeUserDefined) {
    result.insert(space.userDefined.begin(), space.userDefined.end());
  }
  if (includeAutoGenerated) {
    result.insert(space.autoGenerated.begin(), space.autoGenerated.end());
  }
  return result;
}

uint64_t VariableCache::NextId(EntityKind kind) {
  auto& space = ns(kind);
  // Literal ids may be skipped; any other repetition is a broken generator.
  for (size_t attempt = 0; attempt <= space.literalIds.size(); ++attempt) {
    auto id = space.generator();
    if (!space.names.count(id)) {
      return id;
    }
    if (!space.literalIds.count(id)) {
      throw FormattedError(
          ErrorCode::E0007,
          "Identifier generator for {0}s returned id {1} more than once",
          EntityKindToString(kind), id);
    }
  }
  throw FormattedError(
      ErrorCode::E0007,
      "Identifier generator for {0}s keeps returning ids already in use",
      EntityKindToString(kind));
}

std::string VariableCache::NextAutoName(EntityKind kind) {
  auto& space = ns(kind);
  std::string name;
  do {
    name = fmt::format("{}{}", space.autoNamePrefix, space.lastAutoName++);
  } while (kinds_.count(name));
  return name;
}

void VariableCache::Bind(EntityKind kind,
                         const std::string& name,
                         uint64_t id,
                         bool isUserDefined) {
  auto& space = ns(kind);
  if (isUserDefined) {
    space.userDefined[name] = id;
  } else {
    space.autoGenerated[name] = id;
  }
  space.names[id] = name;
  kinds_[name] = kind;
}

}  // namespace gdl::detail
