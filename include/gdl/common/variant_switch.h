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

#include <utility>
#include <variant>

namespace gdl {

namespace detail {

template <typename... Funcs>
struct Overloaded : Funcs... {
  using Funcs::operator()...;
};

template <typename... Funcs>
Overloaded(Funcs...) -> Overloaded<Funcs...>;

}  // namespace detail

template <typename Variant, typename... Funcs>
decltype(auto) variant_switch(Variant&& value, Funcs&&... funcs) {
  return std::visit(detail::Overloaded{std::forward<Funcs>(funcs)...},
                    std::forward<Variant>(value));
}

}  // namespace gdl
