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

#include <memory>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace gdl::log {

enum class Level {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

const char* LevelToString(Level);

class Sink {
 public:
  virtual ~Sink() = default;
  virtual void Write(Level level, std::string_view message) = 0;
};

// "[gdl] WARN: message" lines on stderr.
class StderrSink : public Sink {
 public:
  void Write(Level level, std::string_view message) override;
};

// Process-wide configuration. Defaults: StderrSink, Level::Warn. A null sink
// disables logging.
void SetSink(std::shared_ptr<Sink> sink);
void SetLevel(Level level);
bool IsEnabled(Level level);
void Write(Level level, std::string_view message);

template <typename... Args>
void Debug(fmt::format_string<Args...> format, Args&&... args) {
  if (IsEnabled(Level::Debug)) {
    Write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void Info(fmt::format_string<Args...> format, Args&&... args) {
  if (IsEnabled(Level::Info)) {
    Write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void Warn(fmt::format_string<Args...> format, Args&&... args) {
  if (IsEnabled(Level::Warn)) {
    Write(Level::Warn, fmt::format(format, std::forward<Args>(args)...));
  }
}

}  // namespace gdl::log
