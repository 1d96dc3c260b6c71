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
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "src/common/base/base.h"
#include "src/planner/graph/taskgraphpb/task_graph.pb.h"
#include "src/planner/io/source_handle.h"
#include "src/planner/ir/predicate.h"
#include "src/planner/meta/divisions.h"
#include "src/planner/meta/meta.h"
#include "src/shared/types/scalar.h"

namespace tessera {
namespace planner {

class Expr;
using ExprPtr = std::shared_ptr<const Expr>;
using ExprList = std::vector<ExprPtr>;

using StringList = std::vector<std::string>;
using Int64List = std::vector<int64_t>;
using ScalarList = std::vector<Scalar>;
// Keyword arguments forwarded to the compute backend.
using KwargMap = std::map<std::string, Scalar>;
using LayerPtr = std::shared_ptr<const taskgraphpb::Layer>;

/**
 * @brief One operand slot of an expression: a child expression or a plain value.
 *
 * A default constructed Operand is None.
 */
class Operand {
 public:
  using Value = std::variant<std::monostate, Scalar, StringList, Int64List, ScalarList,
                             PredicateList, ExprPtr, ExprList, DTypeMap, KwargMap, SourcePtr,
                             Meta, Divisions, LayerPtr>;

  Operand() = default;
  Operand(Scalar value) : value_(std::move(value)) {}  // NOLINT
  Operand(bool value) : value_(Scalar(value)) {}       // NOLINT
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Operand(T value) : value_(Scalar(static_cast<int64_t>(value))) {}  // NOLINT
  Operand(double value) : value_(Scalar(value)) {}                   // NOLINT
  Operand(std::string value) : value_(Scalar(std::move(value))) {}   // NOLINT
  Operand(const char* value) : value_(Scalar(value)) {}              // NOLINT
  Operand(StringList value) : value_(std::move(value)) {}            // NOLINT
  Operand(Int64List value) : value_(std::move(value)) {}             // NOLINT
  Operand(ScalarList value) : value_(std::move(value)) {}            // NOLINT
  Operand(PredicateList value) : value_(std::move(value)) {}         // NOLINT
  Operand(ExprList value) : value_(std::move(value)) {}              // NOLINT
  Operand(DTypeMap value) : value_(std::move(value)) {}              // NOLINT
  Operand(KwargMap value) : value_(std::move(value)) {}              // NOLINT
  Operand(Meta value) : value_(std::move(value)) {}                  // NOLINT
  Operand(Divisions value) : value_(std::move(value)) {}             // NOLINT
  Operand(LayerPtr value) : value_(std::move(value)) {}              // NOLINT
  // Accepts pointers to any expression or source subclass.
  template <typename T, std::enable_if_t<std::is_convertible_v<std::shared_ptr<T>, ExprPtr>,
                                         int> = 0>
  Operand(std::shared_ptr<T> value) : value_(ExprPtr(std::move(value))) {}  // NOLINT
  template <typename T,
            std::enable_if_t<std::is_convertible_v<std::shared_ptr<T>, SourcePtr> &&
                                 !std::is_convertible_v<std::shared_ptr<T>, ExprPtr>,
                             int> = 0>
  Operand(std::shared_ptr<T> value) : value_(SourcePtr(std::move(value))) {}  // NOLINT

  static Operand None() { return Operand(); }

  template <typename T>
  bool Is() const {
    return std::holds_alternative<T>(value_);
  }
  template <typename T>
  const T& Get() const {
    DCHECK(Is<T>()) << "Operand holds " << DebugString();
    return std::get<T>(value_);
  }

  bool is_none() const { return Is<std::monostate>(); }
  bool is_expr() const { return Is<ExprPtr>(); }
  bool is_scalar() const { return Is<Scalar>(); }
  bool is_bool() const { return is_scalar() && scalar().is_bool(); }
  bool is_int() const { return is_scalar() && scalar().is_int(); }
  bool is_string() const { return is_scalar() && scalar().is_string(); }

  const ExprPtr& expr() const { return Get<ExprPtr>(); }
  const Scalar& scalar() const { return Get<Scalar>(); }
  bool bool_value() const { return scalar().bool_value(); }
  int64_t int_value() const { return scalar().int_value(); }
  const std::string& string_value() const { return scalar().string_value(); }

  const Value& value() const { return value_; }

  // Child expressions contribute their names, sources their tokens.
  uint64_t Hash() const;
  std::string DebugString() const;

 private:
  Value value_;
};

inline std::ostream& operator<<(std::ostream& os, const Operand& operand) {
  return os << operand.DebugString();
}

}  // namespace planner
}  // namespace tessera
