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

#include "gdl/log.h"

#include <assert.h>

#include <cstdio>
#include <mutex>

namespace gdl::log {

namespace {

struct Logger {
  std::mutex mutex;
  std::shared_ptr<Sink> sink = std::make_shared<StderrSink>();
  Level level = Level::Warn;
};

Logger& GlobalLogger() {
  static Logger logger;
  return logger;
}

}  // namespace

const char* LevelToString(Level level) {
  switch (level) {
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warn:
      return "WARN";
    case Level::Error:
      return "ERROR";
  }
  assert(false);
  return "";
}

void StderrSink::Write(Level level, std::string_view message) {
  fmt::print(stderr, "[gdl] {}: {}\n", LevelToString(level), message);
}

void SetSink(std::shared_ptr<Sink> sink) {
  auto& logger = GlobalLogger();
  std::lock_guard<std::mutex> lock(logger.mutex);
  logger.sink = std::move(sink);
}

void SetLevel(Level level) {
  auto& logger = GlobalLogger();
  std::lock_guard<std::mutex> lock(logger.mutex);
  logger.level = level;
}

bool IsEnabled(Level level) {
  auto& logger = GlobalLogger();
  std::lock_guard<std::mutex> lock(logger.mutex);
  return logger.sink && level >= logger.level;
}

void Write(Level level, std::string_view message) {
  std::shared_ptr<Sink> sink;
  {
    auto& logger = GlobalLogger();
    std::lock_guard<std::mutex> lock(logger.mutex);
    if (level >= logger.level) {
      sink = logger.sink;
    }
  }
  // Unlocked: a sink may log or reconfigure the logger.
  if (sink) {
    sink->Write(level, message);
  }
}

}  // namespace gdl::log
