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
#include <map>
#include <string>
#include <variant>

namespace gdl::model {

// std::monostate stands for NULL.
using PropertyValue =
    std::variant<std::monostate, bool, int64_t, double, std::string>;

// Ordered so that printing and iteration follow key order.
using Properties = std::map<std::string, PropertyValue>;

// Renders the value as a GDL literal: "text", 42, 4.2, true, NULL.
std::string ToString(const PropertyValue&);

}  // namespace gdl::model
