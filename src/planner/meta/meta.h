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

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "src/common/base/base.h"
#include "src/shared/types/scalar.h"
#include "src/shared/types/types.h"

namespace tessera {
namespace planner {

using types::DataType;

// Column name -> target type, as used by astype.
using DTypeMap = std::map<std::string, DataType>;

struct ColumnSchema {
  ColumnSchema() = default;
  ColumnSchema(std::string name, DataType dtype) : name(std::move(name)), dtype(dtype) {}
  ColumnSchema(std::string name, DataType dtype, std::optional<std::vector<std::string>> cats)
      : name(std::move(name)), dtype(dtype), categories(std::move(cats)) {}

  // Only meaningful for CATEGORICAL columns. nullopt means the categories are unknown.
  bool known_categories() const { return dtype != types::CATEGORICAL || categories.has_value(); }

  bool operator==(const ColumnSchema& other) const {
    return name == other.name && dtype == other.dtype && categories == other.categories;
  }
  bool operator!=(const ColumnSchema& other) const { return !(*this == other); }

  std::string name;
  DataType dtype = types::DATA_TYPE_UNKNOWN;
  std::optional<std::vector<std::string>> categories;
};

struct IndexSchema {
  bool operator==(const IndexSchema& other) const {
    return name == other.name && dtype == other.dtype;
  }

  std::string name;
  DataType dtype = types::INT64;
};

enum class MetaKind { kFrame, kSeries, kScalar, kIndex };

/**
 * @brief Zero-row description of what an expression produces.
 *
 * Every expression computes its Meta from the Meta of its operands when it is created, so
 * schema errors surface while the tree is built and no partition is ever read to infer
 * types.
 */
class Meta {
 public:
  // An unknown scalar.
  Meta() = default;

  static Meta MakeFrame(std::vector<ColumnSchema> columns, IndexSchema index = {});
  static Meta MakeSeries(ColumnSchema column, IndexSchema index = {});
  static Meta MakeScalar(DataType dtype);
  static Meta MakeIndex(IndexSchema index);

  MetaKind kind() const { return kind_; }
  bool is_frame() const { return kind_ == MetaKind::kFrame; }
  bool is_series() const { return kind_ == MetaKind::kSeries; }
  bool is_scalar() const { return kind_ == MetaKind::kScalar; }
  bool is_index() const { return kind_ == MetaKind::kIndex; }
  // frame 2, series and index 1, scalar 0.
  int64_t ndim() const;

  // Frames hold any number of columns, series exactly one, scalars and indexes none.
  const std::vector<ColumnSchema>& columns() const { return columns_; }
  const IndexSchema& index() const { return index_; }
  // The element type of a series, scalar or index.
  DataType dtype() const;
  // Name of a series or index.
  std::string series_name() const;

  std::vector<std::string> column_names() const;
  bool HasColumn(std::string_view name) const;
  StatusOr<ColumnSchema> GetColumn(std::string_view name) const;

  StatusOr<Meta> Select(const std::vector<std::string>& names) const;
  StatusOr<Meta> SelectSeries(const std::string& name) const;

  // Frames replace or append the column; a series is replaced.
  Meta WithColumn(ColumnSchema column) const;
  StatusOr<Meta> WithDTypes(const DTypeMap& dtypes) const;
  Meta WithIndex(IndexSchema index) const;
  // Turns every known categorical column into one with unknown categories.
  Meta ClearCategories() const;
  bool HasUnknownCategories() const;

  std::string DebugString() const;

  bool operator==(const Meta& other) const;
  bool operator!=(const Meta& other) const { return !(*this == other); }

 private:
  MetaKind kind_ = MetaKind::kScalar;
  std::vector<ColumnSchema> columns_;
  IndexSchema index_;
  DataType scalar_dtype_ = types::DATA_TYPE_UNKNOWN;
};

inline std::ostream& operator<<(std::ostream& os, const Meta& meta) {
  return os << meta.DebugString();
}

enum class BinaryOp { kAdd, kSub, kMul, kDiv, kLt, kLe, kGt, kGe, kEq, kNe };

inline bool IsComparison(BinaryOp op) {
  return op != BinaryOp::kAdd && op != BinaryOp::kSub && op != BinaryOp::kMul &&
         op != BinaryOp::kDiv;
}

std::string BinaryOpToString(BinaryOp op);

/**
 * @brief Infers the result of applying a binary operator to two operands.
 *
 * Literals are passed as scalar metas of the literal's type.
 */
StatusOr<Meta> BinaryOpMeta(BinaryOp op, const Meta& lhs, const Meta& rhs);

}  // namespace planner
}  // namespace tessera
