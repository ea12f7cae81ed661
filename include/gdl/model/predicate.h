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

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "gdl/common/value_ptr.h"
#include "gdl/model/property_value.h"

namespace gdl::model {

enum class CompOp {
  Equals,
  NotEquals,
  LessThan,
  LessThanOrEquals,
  GreaterThan,
  GreaterThanOrEquals,
};

const char* CompOpToString(CompOp);

struct Literal {
  PropertyValue value;
};

// var.key
struct PropertyReference {
  std::string variable;
  std::string key;
};

struct VariableReference {
  std::string variable;
};

using Operand = std::variant<Literal, PropertyReference, VariableReference>;

struct Predicate {
  struct Comparison {
    Comparison() {}
    Operand left;
    CompOp op = CompOp::Equals;
    Operand right;
  };

  struct And {
    std::vector<Predicate> operands;
  };

  struct Or {
    std::vector<Predicate> operands;
  };

  struct Not {
    ValuePtr<Predicate> operand;
  };

  using Option = std::variant<Comparison, And, Or, Not>;
  Option option;
};

Predicate MakeComparison(Operand left, CompOp op, Operand right);
Predicate MakeAnd(std::vector<Predicate> operands);
Predicate MakeOr(std::vector<Predicate> operands);
Predicate MakeNot(Predicate operand);

// Structural equality; operand order matters.
bool operator==(const Literal&, const Literal&);
bool operator==(const PropertyReference&, const PropertyReference&);
bool operator==(const VariableReference&, const VariableReference&);
bool operator==(const Predicate&, const Predicate&);
bool operator!=(const Predicate&, const Predicate&);

// Renders the predicate in GDL expression syntax, e.g.
// (a.age > 23 OR NOT b.name = "Bob") AND a = b
std::string ToString(const Operand&);
std::string ToString(const Predicate&);

// Conjunction of both predicates; an absent side yields the other one.
std::optional<Predicate> Combine(std::optional<Predicate> existing,
                                 std::optional<Predicate> added);

// Rewrites the predicate into conjunctive normal form: negations are pushed
// down to the comparisons and disjunctions are distributed over
// conjunctions. The result is either a single clause (a comparison, a
// negated comparison or an Or of those) or an And of clauses. Clause and
// literal order follow the left-to-right order of the input. The number of
// clauses may grow exponentially with the nesting depth.
//
// Throws Error (E0008) if an And or Or has no operands.
Predicate ToCnf(const Predicate&);

}  // namespace gdl::model
