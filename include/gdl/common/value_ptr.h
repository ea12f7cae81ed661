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
#include <utility>

namespace gdl {

// Owning pointer with value semantics: copying copies the pointee. Used for
// recursive members of variant-based trees. A default constructed ValuePtr
// holds a default constructed value.
template <typename T>
class ValuePtr {
 public:
  ValuePtr() : ptr_(std::make_unique<T>()) {}
  ValuePtr(T value) : ptr_(std::make_unique<T>(std::move(value))) {}
  ValuePtr(const ValuePtr& other) : ptr_(std::make_unique<T>(*other)) {}
  ValuePtr(ValuePtr&&) noexcept = default;

  ValuePtr& operator=(const ValuePtr& other) {
    if (this != &other) {
      ptr_ = std::make_unique<T>(*other);
    }
    return *this;
  }
  ValuePtr& operator=(ValuePtr&&) noexcept = default;

  T& operator*() { return *ptr_; }
  const T& operator*() const { return *ptr_; }
  T* operator->() { return ptr_.get(); }
  const T* operator->() const { return ptr_.get(); }

 private:
  std::unique_ptr<T> ptr_;
};

}  // namespace gdl
