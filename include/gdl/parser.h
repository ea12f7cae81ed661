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

#include <string_view>

#include "gdl/error_strategy.h"
#include "gdl/events.h"

namespace gdl {

// Translates GDL text into syntax events. The whole script is parsed before
// anything is returned, so a rethrown syntax error leaves no partial result.
Events ParseScript(std::string_view script, ErrorStrategy& errorStrategy);

// Fails on the first syntax error.
Events ParseScript(std::string_view script);

}  // namespace gdl
