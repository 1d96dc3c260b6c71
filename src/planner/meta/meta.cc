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


#include "src/planner/meta/meta.h"

#include <algorithm>

#include <absl/container/flat_hash_set.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

namespace tessera {
namespace planner {

using types::BOOLEAN;
using types::CATEGORICAL;
using types::DATA_TYPE_UNKNOWN;
using types::FLOAT64;
using types::INT64;
using types::STRING;
using types::TIME64NS;

Meta Meta::MakeFrame(std::vector<ColumnSchema> columns, IndexSchema index) {
  Meta meta;
  meta.kind_ = MetaKind::kFrame;
  meta.columns_ = std::move(columns);
  meta.index_ = std::move(index);
  return meta;
}

Meta Meta::MakeSeries(ColumnSchema column, IndexSchema index) {
  Meta meta;
  meta.kind_ = MetaKind::kSeries;
  meta.columns_ = {std::move(column)};
  meta.index_ = std::move(index);
  return meta;
}

Meta Meta::MakeScalar(DataType dtype) {
  Meta meta;
  meta.kind_ = MetaKind::kScalar;
  meta.scalar_dtype_ = dtype;
  return meta;
}

Meta Meta::MakeIndex(IndexSchema index) {
  Meta meta;
  meta.kind_ = MetaKind::kIndex;
  meta.index_ = std::move(index);
  return meta;
}

int64_t Meta::ndim() const {
  switch (kind_) {
    case MetaKind::kFrame:
      return 2;
    case MetaKind::kSeries:
    case MetaKind::kIndex:
      return 1;
    case MetaKind::kScalar:
      return 0;
  }
  return 0;
}

DataType Meta::dtype() const {
  switch (kind_) {
    case MetaKind::kSeries:
      return columns_[0].dtype;
    case MetaKind::kIndex:
      return index_.dtype;
    case MetaKind::kScalar:
      return scalar_dtype_;
    case MetaKind::kFrame:
      break;
  }
  return DATA_TYPE_UNKNOWN;
}

std::string Meta::series_name() const {
  if (is_series()) {
    return columns_[0].name;
  }
  return is_index() ? index_.name : "";
}

std::vector<std::string> Meta::column_names() const {
  std::vector<std::string> names;
  names.reserve(columns_.size());
  for (const auto& col : columns_) {
    names.push_back(col.name);
  }
  return names;
}

bool Meta::HasColumn(std::string_view name) const {
  return std::any_of(columns_.begin(), columns_.end(),
                     [&name](const ColumnSchema& col) { return col.name == name; });
}

StatusOr<ColumnSchema> Meta::GetColumn(std::string_view name) const {
  for (const auto& col : columns_) {
    if (col.name == name) {
      return col;
    }
  }
  return error::InvalidArgument("Column '$0' not found, available columns: [$1]", name,
                                absl::StrJoin(column_names(), ", "));
}

StatusOr<Meta> Meta::Select(const std::vector<std::string>& names) const {
  if (!is_frame()) {
    return error::InvalidArgument("Cannot select a list of columns from a $0",
                                  is_series() ? "series" : "scalar");
  }
  std::vector<ColumnSchema> selected;
  absl::flat_hash_set<std::string> seen;
  for (const auto& name : names) {
    if (!seen.insert(name).second) {
      return error::InvalidArgument("Column '$0' selected more than once", name);
    }
    TESSERA_ASSIGN_OR_RETURN(ColumnSchema col, GetColumn(name));
    selected.push_back(std::move(col));
  }
  return MakeFrame(std::move(selected), index_);
}

StatusOr<Meta> Meta::SelectSeries(const std::string& name) const {
  if (!is_frame()) {
    return error::InvalidArgument("Cannot select column '$0' from a non-frame", name);
  }
  TESSERA_ASSIGN_OR_RETURN(ColumnSchema col, GetColumn(name));
  return MakeSeries(std::move(col), index_);
}

Meta Meta::WithColumn(ColumnSchema column) const {
  Meta out = *this;
  if (is_series()) {
    out.columns_[0] = std::move(column);
    return out;
  }
  for (auto& col : out.columns_) {
    if (col.name == column.name) {
      col = std::move(column);
      return out;
    }
  }
  out.columns_.push_back(std::move(column));
  return out;
}

StatusOr<Meta> Meta::WithDTypes(const DTypeMap& dtypes) const {
  if (!is_frame() && !is_series()) {
    return error::InvalidArgument("astype expects a frame or a series");
  }
  Meta out = *this;
  for (const auto& [name, dtype] : dtypes) {
    auto it = std::find_if(out.columns_.begin(), out.columns_.end(),
                           [&name = name](const ColumnSchema& col) { return col.name == name; });
    if (it == out.columns_.end()) {
      return error::InvalidArgument("Cannot cast unknown column '$0'", name);
    }
    if (it->dtype != dtype) {
      it->categories.reset();
    }
    it->dtype = dtype;
  }
  return out;
}

Meta Meta::WithIndex(IndexSchema index) const {
  Meta out = *this;
  out.index_ = std::move(index);
  return out;
}

Meta Meta::ClearCategories() const {
  Meta out = *this;
  for (auto& col : out.columns_) {
    col.categories.reset();
  }
  return out;
}

bool Meta::HasUnknownCategories() const {
  return std::any_of(columns_.begin(), columns_.end(),
                     [](const ColumnSchema& col) { return !col.known_categories(); });
}

std::string Meta::DebugString() const {
  auto column_formatter = [](std::string* out, const ColumnSchema& col) {
    absl::StrAppend(out, col.name, ":", types::DataTypeName(col.dtype));
  };
  std::string index_str =
      absl::StrCat("index=", index_.name, ":", types::DataTypeName(index_.dtype));
  switch (kind_) {
    case MetaKind::kFrame:
      return absl::StrCat("Frame[", absl::StrJoin(columns_, ", ", column_formatter), "; ",
                          index_str, "]");
    case MetaKind::kSeries:
      return absl::StrCat("Series[", absl::StrJoin(columns_, ", ", column_formatter), "; ",
                          index_str, "]");
    case MetaKind::kIndex:
      return absl::StrCat("Index[", index_.name, ":", types::DataTypeName(index_.dtype), "]");
    case MetaKind::kScalar:
      return absl::StrCat("Scalar[", types::DataTypeName(scalar_dtype_), "]");
  }
  return "";
}

bool Meta::operator==(const Meta& other) const {
  return kind_ == other.kind_ && columns_ == other.columns_ && index_ == other.index_ &&
         scalar_dtype_ == other.scalar_dtype_;
}

std::string BinaryOpToString(BinaryOp op) {
  switch (op) {
    case BinaryOp::kAdd:
      return "+";
    case BinaryOp::kSub:
      return "-";
    case BinaryOp::kMul:
      return "*";
    case BinaryOp::kDiv:
      return "/";
    case BinaryOp::kLt:
      return "<";
    case BinaryOp::kLe:
      return "<=";
    case BinaryOp::kGt:
      return ">";
    case BinaryOp::kGe:
      return ">=";
    case BinaryOp::kEq:
      return "==";
    case BinaryOp::kNe:
      return "!=";
  }
  return "?";
}

namespace {

StatusOr<DataType> ElementType(BinaryOp op, DataType lhs, DataType rhs) {
  auto unsupported = [&]() {
    return error::InvalidArgument("Unsupported operand types for $0: '$1' and '$2'",
                                  BinaryOpToString(op), types::DataTypeName(lhs),
                                  types::DataTypeName(rhs));
  };
  if (IsComparison(op)) {
    bool equality = op == BinaryOp::kEq || op == BinaryOp::kNe;
    if (lhs == DATA_TYPE_UNKNOWN || rhs == DATA_TYPE_UNKNOWN ||
        (types::IsArithmetic(lhs) && types::IsArithmetic(rhs)) ||
        (lhs == STRING && rhs == STRING) || (lhs == TIME64NS && rhs == TIME64NS)) {
      return BOOLEAN;
    }
    bool text_like =
        (lhs == CATEGORICAL || lhs == STRING) && (rhs == CATEGORICAL || rhs == STRING);
    if (equality && text_like) {
      return BOOLEAN;
    }
    return unsupported();
  }

  if (lhs == CATEGORICAL || rhs == CATEGORICAL) {
    return error::InvalidArgument("Categorical data does not support arithmetic ($0)",
                                  BinaryOpToString(op));
  }
  if (lhs == DATA_TYPE_UNKNOWN || rhs == DATA_TYPE_UNKNOWN) {
    return DATA_TYPE_UNKNOWN;
  }
  if (op == BinaryOp::kAdd && lhs == STRING && rhs == STRING) {
    return STRING;
  }
  if (lhs == TIME64NS || rhs == TIME64NS) {
    if (op == BinaryOp::kSub && lhs == TIME64NS && rhs == TIME64NS) {
      return INT64;
    }
    if (op == BinaryOp::kAdd && (lhs == INT64 || rhs == INT64)) {
      return TIME64NS;
    }
    if (op == BinaryOp::kSub && rhs == INT64) {
      return TIME64NS;
    }
    return unsupported();
  }
  if (!types::IsArithmetic(lhs) || !types::IsArithmetic(rhs)) {
    return unsupported();
  }
  if (op == BinaryOp::kDiv || lhs == FLOAT64 || rhs == FLOAT64) {
    return FLOAT64;
  }
  return INT64;
}

// Applies ElementType to every column of a frame against a single other dtype.
StatusOr<Meta> FrameWithElement(BinaryOp op, const Meta& frame, DataType other, bool frame_left) {
  std::vector<ColumnSchema> columns;
  for (const auto& col : frame.columns()) {
    TESSERA_ASSIGN_OR_RETURN(DataType dtype, frame_left ? ElementType(op, col.dtype, other)
                                                        : ElementType(op, other, col.dtype));
    columns.emplace_back(col.name, dtype);
  }
  return Meta::MakeFrame(std::move(columns), frame.index());
}

}  // namespace

StatusOr<Meta> BinaryOpMeta(BinaryOp op, const Meta& lhs, const Meta& rhs) {
  if (lhs.is_index() || rhs.is_index()) {
    return error::InvalidArgument("Binary operator $0 is not supported on an index",
                                  BinaryOpToString(op));
  }
  if (lhs.is_scalar() && rhs.is_scalar()) {
    TESSERA_ASSIGN_OR_RETURN(DataType dtype, ElementType(op, lhs.dtype(), rhs.dtype()));
    return Meta::MakeScalar(dtype);
  }
  if (lhs.is_frame() && rhs.is_frame()) {
    if (IsComparison(op)) {
      if (lhs.column_names() != rhs.column_names()) {
        return error::InvalidArgument("Can only compare identically-labeled frames");
      }
      std::vector<ColumnSchema> columns;
      for (size_t i = 0; i < lhs.columns().size(); ++i) {
        TESSERA_ASSIGN_OR_RETURN(DataType dtype, ElementType(op, lhs.columns()[i].dtype,
                                                             rhs.columns()[i].dtype));
        columns.emplace_back(lhs.columns()[i].name, dtype);
      }
      return Meta::MakeFrame(std::move(columns), lhs.index());
    }
    std::vector<ColumnSchema> columns;
    for (const auto& col : lhs.columns()) {
      if (!rhs.HasColumn(col.name)) {
        columns.emplace_back(col.name, FLOAT64);
        continue;
      }
      TESSERA_ASSIGN_OR_RETURN(ColumnSchema other, rhs.GetColumn(col.name));
      TESSERA_ASSIGN_OR_RETURN(DataType dtype, ElementType(op, col.dtype, other.dtype));
      columns.emplace_back(col.name, dtype);
    }
    for (const auto& col : rhs.columns()) {
      if (!lhs.HasColumn(col.name)) {
        columns.emplace_back(col.name, FLOAT64);
      }
    }
    return Meta::MakeFrame(std::move(columns), lhs.index());
  }
  if (lhs.is_frame()) {
    return FrameWithElement(op, lhs, rhs.dtype(), /* frame_left */ true);
  }
  if (rhs.is_frame()) {
    return FrameWithElement(op, rhs, lhs.dtype(), /* frame_left */ false);
  }
  // At least one series, no frames.
  TESSERA_ASSIGN_OR_RETURN(DataType dtype, ElementType(op, lhs.dtype(), rhs.dtype()));
  std::string name;
  if (lhs.is_series() && rhs.is_series()) {
    name = lhs.series_name() == rhs.series_name() ? lhs.series_name() : "";
  } else {
    name = lhs.is_series() ? lhs.series_name() : rhs.series_name();
  }
  const IndexSchema& index = lhs.is_series() ? lhs.index() : rhs.index();
  return Meta::MakeSeries(ColumnSchema(name, dtype), index);
}

}  // namespace planner
}  // namespace tessera
