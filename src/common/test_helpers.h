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

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gdl/error.h"
#include "gdl/log.h"

namespace gdl::test {

// Runs |func| and returns the gdl::Error it threw, if any.
template <typename Func>
std::optional<Error> CatchError(Func&& func) {
  try {
    func();
  } catch (const Error& error) {
    return error;
  }
  return {};
}

template <typename Func>
testing::AssertionResult ThrowsError(Func&& func, ErrorCode expected) {
  auto error = CatchError(std::forward<Func>(func));
  if (!error) {
    return testing::AssertionFailure()
           << "no error thrown, expected " << ErrorCodeToString(expected);
  }
  if (error->errorCode() != expected) {
    return testing::AssertionFailure()
           << "expected " << ErrorCodeToString(expected) << ", got \""
           << error->what() << "\"";
  }
  return testing::AssertionSuccess();
}

// Collects log messages while in scope and restores the default sink on
// destruction.
class CapturingSink : public log::Sink {
 public:
  void Write(log::Level level, std::string_view message) override {
    messages.push_back({level, std::string(message)});
  }

  struct Message {
    log::Level level;
    std::string text;
  };
  std::vector<Message> messages;
};

class LogCapture {
 public:
  explicit LogCapture(log::Level level = log::Level::Debug)
      : sink_(std::make_shared<CapturingSink>()) {
    log::SetSink(sink_);
    log::SetLevel(level);
  }
  ~LogCapture() {
    log::SetSink(std::make_shared<log::StderrSink>());
    log::SetLevel(log::Level::Warn);
  }

  const std::vector<CapturingSink::Message>& messages() const {
    return sink_->messages;
  }

  bool Contains(log::Level level, const std::string& substr) const {
    for (auto& message : sink_->messages) {
      if (message.level == level &&
          message.text.find(substr) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

 private:
  std::shared_ptr<CapturingSink> sink_;
};

}  // namespace gdl::test
