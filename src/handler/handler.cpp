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

#include "gdl/handler.h"

#include <fstream>
#include <sstream>

#include "common/formatted_error.h"
#include "gdl/log.h"
#include "gdl/parser.h"

namespace gdl {

namespace {

void CheckLabel(const std::string& label, const char* kind) {
  if (label.empty()) {
    throw FormattedError(ErrorCode::E0002,
                         "Default {0} label must not be empty", kind);
  }
}

void CheckGenerator(const IdGenerator& generator, const char* kind) {
  if (!generator) {
    throw FormattedError(ErrorCode::E0003,
                         "Identifier generator for {0}s must be set", kind);
  }
}

}  // namespace

Handler::Handler(std::unique_ptr<Loader> loader,
                 std::shared_ptr<ErrorStrategy> errorStrategy)
    : loader_(std::move(loader)), errorStrategy_(std::move(errorStrategy)) {}

void Handler::Append(const std::string& script) {
  if (script.empty()) {
    throw Error(ErrorCode::E0001, "Script must not be empty");
  }
  auto events = ParseScript(script, *errorStrategy_);
  loader_->Process(events);
  log::Info("Appended script with {} syntax events", events.size());
}

void Handler::Append(const Events& events) {
  if (events.empty()) {
    throw Error(ErrorCode::E0001, "Event list must not be empty");
  }
  loader_->Process(events);
  log::Info("Appended {} syntax events", events.size());
}

Handler::Builder::Builder()
    : errorStrategy_(std::make_shared<FailFastErrorStrategy>()) {}

Handler::Builder& Handler::Builder::SetDefaultGraphLabel(
    const std::string& label) {
  CheckLabel(label, "graph");
  options_.defaultGraphLabel = label;
  return *this;
}

Handler::Builder& Handler::Builder::SetDefaultVertexLabel(
    const std::string& label) {
  CheckLabel(label, "vertex");
  options_.defaultVertexLabel = label;
  return *this;
}

Handler::Builder& Handler::Builder::SetDefaultEdgeLabel(
    const std::string& label) {
  CheckLabel(label, "edge");
  options_.defaultEdgeLabel = label;
  return *this;
}

Handler::Builder& Handler::Builder::SetUseDefaultGraphLabel(bool use) {
  options_.useDefaultGraphLabel = use;
  return *this;
}

Handler::Builder& Handler::Builder::SetUseDefaultVertexLabel(bool use) {
  options_.useDefaultVertexLabel = use;
  return *this;
}

Handler::Builder& Handler::Builder::SetUseDefaultEdgeLabel(bool use) {
  options_.useDefaultEdgeLabel = use;
  return *this;
}

Handler::Builder& Handler::Builder::SetNextGraphId(IdGenerator generator) {
  CheckGenerator(generator, "graph");
  options_.nextGraphId = std::move(generator);
  return *this;
}

Handler::Builder& Handler::Builder::SetNextVertexId(IdGenerator generator) {
  CheckGenerator(generator, "vertex");
  options_.nextVertexId = std::move(generator);
  return *this;
}

Handler::Builder& Handler::Builder::SetNextEdgeId(IdGenerator generator) {
  CheckGenerator(generator, "edge");
  options_.nextEdgeId = std::move(generator);
  return *this;
}

Handler::Builder& Handler::Builder::SetErrorStrategy(
    std::shared_ptr<ErrorStrategy> errorStrategy) {
  if (!errorStrategy) {
    throw Error(ErrorCode::E0004, "Error strategy must be set");
  }
  errorStrategy_ = std::move(errorStrategy);
  return *this;
}

Handler Handler::Builder::Build() const {
  // Every handler gets its own copy of the generators, so handlers built
  // from one builder do not share id sequences.
  return Handler(std::make_unique<Loader>(options_), errorStrategy_);
}

Handler Handler::Builder::BuildFromString(const std::string& script) const {
  auto handler = Build();
  handler.Append(script);
  return handler;
}

Handler Handler::Builder::BuildFromStream(std::istream& stream) const {
  std::ostringstream script;
  script << stream.rdbuf();
  if (stream.bad()) {
    throw Error(ErrorCode::E0006, "Failed to read script from stream");
  }
  return BuildFromString(script.str());
}

Handler Handler::Builder::BuildFromFile(const std::string& fileName) const {
  if (fileName.empty()) {
    throw Error(ErrorCode::E0005, "File name must not be empty");
  }
  std::ifstream file(fileName);
  if (!file) {
    throw FormattedError(ErrorCode::E0006, "Cannot open file \"{0}\"",
                         fileName);
  }
  log::Info("Loading script from \"{}\"", fileName);
  return BuildFromStream(file);
}

}  // namespace gdl
