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
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "gdl/error.h"
#include "gdl/id_generator.h"
#include "gdl/model/elements.h"

namespace gdl::detail {

// Binds variable names to entity ids. All entity kinds share one name space;
// ids are allocated per kind. Names written in the script are user-defined,
// names synthesized for anonymous elements (__g0, __v0, __e0, ...) are
// auto-generated.
class VariableCache {
 public:
  VariableCache(IdGenerator nextGraphId,
                IdGenerator nextVertexId,
                IdGenerator nextEdgeId);

  struct Resolution {
    uint64_t id;
    bool isNew;
  };

  // Returns the id bound to |name|, or allocates a new id and binds it.
  Resolution ResolveOrCreate(model::EntityKind,
                             const std::optional<std::string>& name,
                             const InputPosition&);

  // Same as ResolveOrCreate() but a new binding gets |literalId| instead of a
  // generated one. The id is never handed out by the generator afterwards.
  Resolution ResolveOrCreateWithId(model::EntityKind,
                                   const std::optional<std::string>& name,
                                   uint64_t literalId,
                                   const InputPosition&);

  std::optional<uint64_t> Find(model::EntityKind,
                               const std::string& name) const;
  const std::string& NameOf(model::EntityKind, uint64_t id) const;
  std::optional<model::EntityKind> KindOf(const std::string& name) const;

  // Throws if |name| is bound to another kind than |kind|.
  void CheckKind(model::EntityKind kind,
                 const std::string& name,
                 const InputPosition&) const;

  using Bindings = std::unordered_map<std::string, uint64_t>;
  Bindings bindings(model::EntityKind,
                    bool includeUserDefined,
                    bool includeAutoGenerated) const;

 private:
  struct Namespace {
    IdGenerator generator;
    const char* autoNamePrefix;
    Bindings userDefined;
    Bindings autoGenerated;
    std::unordered_map<uint64_t, std::string> names;
    std::unordered_set<uint64_t> literalIds;
    uint64_t lastAutoName = 0;
  };

  Namespace& ns(model::EntityKind kind) {
    return namespaces_[static_cast<size_t>(kind)];
  }
  const Namespace& ns(model::EntityKind kind) const {
    return namespaces_[static_cast<size_t>(kind)];
  }

  uint64_t NextId(model::EntityKind);
  std::string NextAutoName(model::EntityKind);
  void Bind(model::EntityKind,
            const std::string& name,
            uint64_t id,
            bool isUserDefined);

  std::array<Namespace, 3> namespaces_;
  std::unordered_map<std::string, model::EntityKind> kinds_;
};

}  // namespace gdl::detail
