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

#include <utility>
#include <vector>

#include "common/formatted_error.h"
#include "gdl/common/variant_switch.h"
#include "gdl/model/predicate.h"

namespace gdl::model {

namespace {

// Disjunction of comparisons and negated comparisons.
using Clause = std::vector<Predicate>;
// Conjunction of clauses.
using Clauses = std::vector<Clause>;

template <typename Connective>
void ThrowIfEmpty(const Connective& connective, const char* name) {
  if (connective.operands.empty()) {
    throw FormattedError(ErrorCode::E0008,
                         "{0} predicate must have at least one operand", name);
  }
}

Clauses Normalize(const Predicate& predicate, bool negated);

Clauses Conjunction(const std::vector<Predicate>& operands, bool negated) {
  Clauses result;
  for (auto& operand : operands) {
    auto clauses = Normalize(operand, negated);
    for (auto& clause : clauses) {
      result.push_back(std::move(clause));
    }
  }
  return result;
}

// (A1 & A2) | (B1 & B2) = (A1 | B1) & (A1 | B2) & (A2 | B1) & (A2 | B2)
Clauses Disjunction(const std::vector<Predicate>& operands, bool negated) {
  Clauses result(1);
  for (auto& operand : operands) {
    auto clauses = Normalize(operand, negated);
    Clauses product;
    product.reserve(result.size() * clauses.size());
    for (auto& left : result) {
      for (auto& right : clauses) {
        auto& clause = product.emplace_back(left);
        clause.insert(clause.end(), right.begin(), right.end());
      }
    }
    result = std::move(product);
  }
  return result;
}

Clauses Normalize(const Predicate& predicate, bool negated) {
  return variant_switch(
      predicate.option,
      [&](const Predicate::Comparison&) {
        return Clauses{{negated ? MakeNot(predicate) : predicate}};
      },
      [&](const Predicate::And& value) {
        ThrowIfEmpty(value, "AND");
        // De Morgan: NOT (a AND b) = NOT a OR NOT b
        return negated ? Disjunction(value.operands, true)
                       : Conjunction(value.operands, false);
      },
      [&](const Predicate::Or& value) {
        ThrowIfEmpty(value, "OR");
        return negated ? Conjunction(value.operands, true)
                       : Disjunction(value.operands, false);
      },
      [&](const Predicate::Not& value) {
        return Normalize(*value.operand, !negated);
      });
}

Predicate BuildClause(Clause clause) {
  if (clause.size() == 1) {
    return std::move(clause.front());
  }
  return MakeOr(std::move(clause));
}

}  // namespace

Predicate ToCnf(const Predicate& predicate) {
  auto clauses = Normalize(predicate, false);
  if (clauses.size() == 1) {
    return BuildClause(std::move(clauses.front()));
  }
  std::vector<Predicate> operands;
  operands.reserve(clauses.size());
  for (auto& clause : clauses) {
    operands.push_back(BuildClause(std::move(clause)));
  }
  return MakeAnd(std::move(operands));
}

}  // namespace gdl::model
