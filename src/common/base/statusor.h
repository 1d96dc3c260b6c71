/*
 * Copyright 2018- The Pixie Authors.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

#include "src/common/base/macros.h"
#include "src/common/base/status.h"
#include "src/common/base/statuspb/status.pb.h"

namespace tessera {

// Holds either a value of type T or the error Status explaining why no value exists.
// Concept borrowed from tensorflow/stream_executor/lib/statusor.h.
template <typename T>
class StatusOr {
  template <typename U>
  friend class StatusOr;

 public:
  // Construct a new StatusOr with Status::UNKNOWN status.
  StatusOr()
      : status_(statuspb::UNKNOWN,
                "Default constructed StatusOr should not be used, "
                "did you mistakenly return {}?") {}

  StatusOr(const Status& status);  // NOLINT

  StatusOr(const T& value);  // NOLINT

  // Conversion copy constructor, T must be copy constructable from U.
  template <typename U>
  explicit StatusOr(const StatusOr<U>& other) : status_(other.status_), value_(other.value_) {}

  StatusOr(T&& value);  // NOLINT

  // Move conversion, T must be assignable from U. Left implicit so that
  // StatusOr<std::shared_ptr<const Derived>> converts to StatusOr<std::shared_ptr<const Base>>.
  template <typename U>
  StatusOr(StatusOr<U>&& other)  // NOLINT
      : status_(std::move(other.status_)) {
    if (status_.ok()) {
      value_ = std::move(other.value_);
    }
  }

  template <typename U>
  StatusOr& operator=(const StatusOr<U>& other) {
    status_ = other.status_;
    value_ = other.value_;
    return *this;
  }

  template <typename U>
  StatusOr& operator=(StatusOr<U>&& other) {
    status_ = std::move(other.status_);
    value_ = std::move(other.value_);
    return *this;
  }

  // Returns Status::OK when a value is held.
  const Status& status() const { return status_; }

  bool ok() const { return status_.ok(); }

  statuspb::Code code() const { return status_.code(); }

  std::string msg() const { return status_.msg(); }

  const T& ValueOrDie() const;
  T& ValueOrDie();

  // Moves the current value.
  T ConsumeValueOrDie();

  // Copies; returning a reference does not work because the argument may be an rvalue.
  T ValueOr(const T& val);

  T ConsumeValueOr(T&& val);

  std::string ToString() const { return status().ToString(); }

 private:
  Status status_;
  T value_;
};

template <typename T>
StatusOr<T>::StatusOr(const T& value) : value_(value) {}

template <typename T>
const T& StatusOr<T>::ValueOrDie() const {
  TESSERA_CHECK_OK(status_);
  return value_;
}

template <typename T>
T& StatusOr<T>::ValueOrDie() {
  TESSERA_CHECK_OK(status_);
  return value_;
}

template <typename T>
T StatusOr<T>::ConsumeValueOrDie() {
  TESSERA_CHECK_OK(status_);
  return std::move(value_);
}

template <typename T>
T StatusOr<T>::ValueOr(const T& val) {
  return status_.ok() ? value_ : val;
}

template <typename T>
T StatusOr<T>::ConsumeValueOr(T&& val) {
  return status_.ok() ? std::move(value_) : std::move(val);
}

template <typename T>
StatusOr<T>::StatusOr(const Status& status) : status_(status) {
  DCHECK(!status_.ok()) << "Should not pass OK status to constructor";
  if (status.ok()) {
    status_ = Status(statuspb::INTERNAL,
                     "Status::OK is not a valid constructor argument to StatusOr<T>");
  }
}

template <typename T>
StatusOr<T>::StatusOr(T&& value) {
  if constexpr (!std::is_pointer<T>::value) {
    value_ = std::move(value);
  } else {
    value_ = value;
  }
}

// Use '__s__' to access the StatusOr object in the 'or' branch.
#define TESSERA_ASSIGN_OR_IMPL(statusor, lhs, rexpr, ...) \
  auto statusor = (rexpr);                                \
  if (!statusor.ok()) {                                   \
    auto& __s__ = statusor;                               \
    TESSERA_UNUSED(__s__);                                \
    __VA_ARGS__;                                          \
  }                                                       \
  lhs = std::move(statusor.ValueOrDie())

#define TESSERA_ASSIGN_OR(lhs, rexpr, ...)                                                   \
  TESSERA_ASSIGN_OR_IMPL(TESSERA_CONCAT_NAME(__status_or_value__, __COUNTER__), lhs, rexpr, \
                         __VA_ARGS__)

#define TESSERA_ASSIGN_OR_RETURN(lhs, rexpr) \
  TESSERA_ASSIGN_OR(lhs, rexpr, return __s__.status())

template <typename T>
inline Status StatusAdapter(const StatusOr<T>& s) noexcept {
  return s.status();
}

// Lets GMock print the tested value.
template <typename T>
std::ostream& operator<<(std::ostream& os, const StatusOr<T>& status_or) {
  os << status_or.ToString();
  return os;
}

}  // namespace tessera
