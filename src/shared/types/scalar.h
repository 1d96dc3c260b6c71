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

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

#include "src/common/base/base.h"
#include "src/shared/types/types.h"

namespace tessera {
namespace types {

/**
 * @brief A single literal value: null, bool, int64, float64 or string.
 *
 * Scalars show up as operands (literals in arithmetic, comparison values in predicates),
 * as division boundaries and as fragment statistics.
 */
class Scalar {
 public:
  Scalar() = default;
  explicit Scalar(bool value) : value_(value) {}
  // Any non-bool integral type is stored as int64.
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  explicit Scalar(T value) : value_(static_cast<int64_t>(value)) {}
  explicit Scalar(double value) : value_(value) {}
  explicit Scalar(std::string value) : value_(std::move(value)) {}
  explicit Scalar(const char* value) : value_(std::string(value)) {}

  static Scalar Null() { return Scalar(); }

  DataType type() const;
  bool is_null() const { return std::holds_alternative<std::monostate>(value_); }
  bool is_bool() const { return std::holds_alternative<bool>(value_); }
  bool is_int() const { return std::holds_alternative<int64_t>(value_); }
  bool is_float() const { return std::holds_alternative<double>(value_); }
  bool is_string() const { return std::holds_alternative<std::string>(value_); }
  bool is_numeric() const { return is_int() || is_float(); }

  bool bool_value() const { return std::get<bool>(value_); }
  int64_t int_value() const { return std::get<int64_t>(value_); }
  double float_value() const { return std::get<double>(value_); }
  const std::string& string_value() const { return std::get<std::string>(value_); }
  // Numeric value widened to double. Only valid when is_numeric().
  double AsDouble() const;

  /**
   * @brief Orders two scalars.
   *
   * Ints and floats compare numerically with each other, strings lexicographically and
   * bools as bools. Nulls and mixed kinds are incomparable.
   *
   * @return negative, zero or positive, or nullopt when the values are incomparable.
   */
  std::optional<int> Compare(const Scalar& other) const;

  // Strict weak order over all scalars, for sorting: bools, then numbers, then NaN, then
  // strings, then nulls. Within a group values follow Compare.
  bool OrderedBefore(const Scalar& other) const;

  // Strict equality: the kinds must match as well as the values.
  bool operator==(const Scalar& other) const { return value_ == other.value_; }
  bool operator!=(const Scalar& other) const { return !(*this == other); }

  // Stable across processes; feeds content-addressed names.
  uint64_t Hash() const;

  std::string ToString() const;

  // int op int stays int, any float makes the result float.
  static StatusOr<Scalar> Add(const Scalar& lhs, const Scalar& rhs);
  static StatusOr<Scalar> Multiply(const Scalar& lhs, const Scalar& rhs);

 private:
  std::variant<std::monostate, bool, int64_t, double, std::string> value_;
};

inline std::ostream& operator<<(std::ostream& os, const Scalar& scalar) {
  return os << scalar.ToString();
}

}  // namespace types
}  // namespace tessera
