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


#include "src/shared/types/scalar.h"

#include <cmath>

#include <absl/strings/str_cat.h>

namespace tessera {
namespace types {

namespace {

template <typename T>
int ThreeWay(const T& lhs, const T& rhs) {
  if (lhs < rhs) {
    return -1;
  }
  return rhs < lhs ? 1 : 0;
}

template <typename IntOp, typename FloatOp>
StatusOr<Scalar> NumericOp(const Scalar& lhs, const Scalar& rhs, std::string_view op_name,
                           IntOp int_op, FloatOp float_op) {
  if (!lhs.is_numeric() || !rhs.is_numeric()) {
    return error::InvalidArgument("Cannot $0 non-numeric scalars $1 and $2", op_name,
                                  lhs.ToString(), rhs.ToString());
  }
  if (lhs.is_int() && rhs.is_int()) {
    int64_t out;
    if (int_op(lhs.int_value(), rhs.int_value(), &out)) {
      return error::InvalidArgument("Integer overflow in $0 of $1 and $2", op_name,
                                    lhs.ToString(), rhs.ToString());
    }
    return Scalar(out);
  }
  return Scalar(float_op(lhs.AsDouble(), rhs.AsDouble()));
}

}  // namespace

DataType Scalar::type() const {
  switch (value_.index()) {
    case 1:
      return BOOLEAN;
    case 2:
      return INT64;
    case 3:
      return FLOAT64;
    case 4:
      return STRING;
    default:
      return DATA_TYPE_UNKNOWN;
  }
}

double Scalar::AsDouble() const {
  DCHECK(is_numeric()) << ToString();
  return is_int() ? static_cast<double>(int_value()) : float_value();
}

std::optional<int> Scalar::Compare(const Scalar& other) const {
  if (is_numeric() && other.is_numeric()) {
    if (is_int() && other.is_int()) {
      return ThreeWay(int_value(), other.int_value());
    }
    return ThreeWay(AsDouble(), other.AsDouble());
  }
  if (is_string() && other.is_string()) {
    return ThreeWay(string_value(), other.string_value());
  }
  if (is_bool() && other.is_bool()) {
    return ThreeWay(bool_value(), other.bool_value());
  }
  return std::nullopt;
}

bool Scalar::OrderedBefore(const Scalar& other) const {
  auto group = [](const Scalar& s) {
    if (s.is_bool()) {
      return 0;
    }
    if (s.is_numeric()) {
      return std::isnan(s.AsDouble()) ? 2 : 1;
    }
    return s.is_string() ? 3 : 4;
  };
  int lhs = group(*this);
  int rhs = group(other);
  if (lhs != rhs) {
    return lhs < rhs;
  }
  if (lhs == 2 || lhs == 4) {
    return false;
  }
  return Compare(other).value_or(0) < 0;
}

uint64_t Scalar::Hash() const {
  uint64_t kind = FingerprintValue(static_cast<int64_t>(value_.index()));
  switch (value_.index()) {
    case 1:
      return HashCombine(kind, FingerprintValue(bool_value()));
    case 2:
      return HashCombine(kind, FingerprintValue(int_value()));
    case 3:
      return HashCombine(kind, FingerprintValue(float_value()));
    case 4:
      return HashCombine(kind, Fingerprint(string_value()));
    default:
      return kind;
  }
}

std::string Scalar::ToString() const {
  switch (value_.index()) {
    case 1:
      return bool_value() ? "True" : "False";
    case 2:
      return absl::StrCat(int_value());
    case 3:
      return absl::StrCat(float_value());
    case 4:
      return absl::StrCat("'", string_value(), "'");
    default:
      return "None";
  }
}

StatusOr<Scalar> Scalar::Add(const Scalar& lhs, const Scalar& rhs) {
  return NumericOp(
      lhs, rhs, "add",
      [](int64_t a, int64_t b, int64_t* out) { return __builtin_add_overflow(a, b, out); },
      [](double a, double b) { return a + b; });
}

StatusOr<Scalar> Scalar::Multiply(const Scalar& lhs, const Scalar& rhs) {
  return NumericOp(
      lhs, rhs, "multiply",
      [](int64_t a, int64_t b, int64_t* out) { return __builtin_mul_overflow(a, b, out); },
      [](double a, double b) { return a * b; });
}

}  // namespace types
}  // namespace tessera
