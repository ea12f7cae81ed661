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

#include "gdl/model/predicate.h"

#include <assert.h>

#include <fmt/format.h>

#include "gdl/common/variant_switch.h"

namespace gdl::model {

namespace {

template <typename Connective>
std::string PrintConnective(const Connective& connective,
                            const char* separator,
                            bool nested);

std::string Print(const Predicate& predicate, bool nested) {
  return variant_switch(
      predicate.option,
      [](const Predicate::Comparison& value) {
        return fmt::format("{} {} {}", ToString(value.left),
                           CompOpToString(value.op), ToString(value.right));
      },
      [nested](const Predicate::And& value) {
        return PrintConnective(value, " AND ", nested);
      },
      [nested](const Predicate::Or& value) {
        return PrintConnective(value, " OR ", nested);
      },
      [](const Predicate::Not& value) {
        return "NOT " + Print(*value.operand, true);
      });
}

template <typename Connective>
std::string PrintConnective(const Connective& connective,
                            const char* separator,
                            bool nested) {
  std::string result;
  for (auto& operand : connective.operands) {
    if (!result.empty()) {
      result += separator;
    }
    result += Print(operand, true);
  }
  return nested ? "(" + result + ")" : result;
}

}  // namespace

const char* CompOpToString(CompOp op) {
  switch (op) {
    case CompOp::Equals:
      return "=";
    case CompOp::NotEquals:
      return "<>";
    case CompOp::LessThan:
      return "<";
    case CompOp::LessThanOrEquals:
      return "<=";
    case CompOp::GreaterThan:
      return ">";
    case CompOp::GreaterThanOrEquals:
      return ">=";
  }
  assert(false);
  return "";
}

Predicate MakeComparison(Operand left, CompOp op, Operand right) {
  Predicate result;
  auto& cmp = result.option.emplace<Predicate::Comparison>();
  cmp.left = std::move(left);
  cmp.op = op;
  cmp.right = std::move(right);
  return result;
}

Predicate MakeAnd(std::vector<Predicate> operands) {
  Predicate result;
  result.option.emplace<Predicate::And>().operands = std::move(operands);
  return result;
}

Predicate MakeOr(std::vector<Predicate> operands) {
  Predicate result;
  result.option.emplace<Predicate::Or>().operands = std::move(operands);
  return result;
}

Predicate MakeNot(Predicate operand) {
  Predicate result;
  result.option.emplace<Predicate::Not>().operand = std::move(operand);
  return result;
}

bool operator==(const Literal& a, const Literal& b) {
  return a.value == b.value;
}

bool operator==(const PropertyReference& a, const PropertyReference& b) {
  return a.variable == b.variable && a.key == b.key;
}

bool operator==(const VariableReference& a, const VariableReference& b) {
  return a.variable == b.variable;
}

bool operator==(const Predicate& a, const Predicate& b) {
  if (a.option.index() != b.option.index()) {
    return false;
  }
  return variant_switch(
      a.option,
      [&b](const Predicate::Comparison& value) {
        auto& other = std::get<Predicate::Comparison>(b.option);
        return value.op == other.op && value.left == other.left &&
               value.right == other.right;
      },
      [&b](const Predicate::And& value) {
        return value.operands == std::get<Predicate::And>(b.option).operands;
      },
      [&b](const Predicate::Or& value) {
        return value.operands == std::get<Predicate::Or>(b.option).operands;
      },
      [&b](const Predicate::Not& value) {
        return *value.operand == *std::get<Predicate::Not>(b.option).operand;
      });
}

bool operator!=(const Predicate& a, const Predicate& b) {
  return !(a == b);
}

std::string ToString(const Operand& operand) {
  return variant_switch(
      operand, [](const Literal& value) { return ToString(value.value); },
      [](const PropertyReference& value) {
        return fmt::format("{}.{}", value.variable, value.key);
      },
      [](const VariableReference& value) { return value.variable; });
}

std::string ToString(const Predicate& predicate) {
  return Print(predicate, false);
}

std::optional<Predicate> Combine(std::optional<Predicate> existing,
                                 std::optional<Predicate> added) {
  if (!existing) {
    return added;
  }
  if (!added) {
    return existing;
  }
  std::vector<Predicate> operands;
  operands.push_back(std::move(*existing));
  operands.push_back(std::move(*added));
  return MakeAnd(std::move(operands));
}

}  // namespace gdl::model
