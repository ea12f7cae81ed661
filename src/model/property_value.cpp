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

#include "gdl/model/property_value.h"

#include <fmt/format.h>

#include "gdl/common/variant_switch.h"

namespace gdl::model {

namespace {

std::string QuoteString(const std::string& str) {
  std::string escaped = "\"";
  for (char c : str) {
    switch (c) {
      case '"':
        escaped += "\\\"";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      case '\b':
        escaped += "\\b";
        break;
      case '\f':
        escaped += "\\f";
        break;
      case '\\':
        escaped += "\\\\";
        break;
      default:
        escaped += c;
        break;
    }
  }
  escaped += '"';
  return escaped;
}

std::string FormatDouble(double value) {
  auto str = fmt::format("{}", value);
  // Keep floating point literals distinguishable from integers.
  if (str.find_first_of(".eEn") == std::string::npos) {
    str += ".0";
  }
  return str;
}

}  // namespace

std::string ToString(const PropertyValue& value) {
  return variant_switch(
      value, [](std::monostate) -> std::string { return "NULL"; },
      [](bool value) -> std::string { return value ? "true" : "false"; },
      [](int64_t value) { return fmt::format("{}", value); },
      [](double value) { return FormatDouble(value); },
      [](const std::string& value) { return QuoteString(value); });
}

}  // namespace gdl::model
