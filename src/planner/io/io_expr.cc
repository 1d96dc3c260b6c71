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


#include "src/planner/io/io_expr.h"

#include <algorithm>
#include <set>

#include "src/planner/graph/task_utils.h"
#include "src/planner/ir/partitioning.h"
#include "src/planner/ir/pattern_match.h"

namespace tessera {
namespace planner {

namespace {

bool IsChildOf(const ExprPtr& parent, const Expr& child) {
  return !parent->operands().empty() && parent->operands()[0].is_expr() &&
         parent->operands()[0].expr()->name() == child.name();
}

std::optional<CompareOp> ComparisonOp(ExprType type) {
  switch (type) {
    case ExprType::kLt:
      return CompareOp::kLt;
    case ExprType::kLe:
      return CompareOp::kLe;
    case ExprType::kGt:
      return CompareOp::kGt;
    case ExprType::kGe:
      return CompareOp::kGe;
    case ExprType::kEq:
      return CompareOp::kEq;
    case ExprType::kNe:
      return CompareOp::kNe;
    default:
      return std::nullopt;
  }
}

template <typename TSource>
StatusOr<std::shared_ptr<const TSource>> SourceAs(const Expr& expr) {
  const Operand& source = expr.operand("source");
  std::shared_ptr<const TSource> typed;
  if (source.Is<SourcePtr>()) {
    typed = std::dynamic_pointer_cast<const TSource>(source.Get<SourcePtr>());
  }
  if (typed == nullptr) {
    return error::InvalidArgument("$0 got an unsupported source $1", expr.type_string(),
                                  source.DebugString());
  }
  return typed;
}

}  // namespace

/**
 * IOExpr
 */
Int64List IOExpr::selected_partitions() const {
  if (!reads_all_partitions()) {
    return operand("_partitions").Get<Int64List>();
  }
  Int64List all(source_divisions().npartitions());
  for (size_t i = 0; i < all.size(); ++i) {
    all[i] = i;
  }
  return all;
}

Divisions IOExpr::ComputeDivisions() const {
  if (reads_all_partitions()) {
    return source_divisions();
  }
  return source_divisions().Select(operand("_partitions").Get<Int64List>());
}

Status IOExpr::CheckPartitions() const {
  const Operand& partitions = operand("_partitions");
  if (partitions.is_none()) {
    return Status::OK();
  }
  if (!partitions.Is<Int64List>() || partitions.Get<Int64List>().empty()) {
    return error::InvalidArgument("$0 _partitions must be a non-empty list of partitions",
                                  type_string());
  }
  int64_t n = source_divisions().npartitions();
  int64_t prev = -1;
  for (int64_t p : partitions.Get<Int64List>()) {
    if (p <= prev || p >= n) {
      return error::InvalidArgument(
          "$0 _partitions must be ascending, unique and below $1, got $2", type_string(), n,
          partitions.DebugString());
    }
    prev = p;
  }
  return Status::OK();
}

StatusOr<Meta> IOExpr::ProjectedMeta(const Meta& full) const {
  const Operand& columns = operand("columns");
  const Operand& series = operand("_series");
  if (!series.is_bool()) {
    return error::InvalidArgument("$0 _series must be a bool", type_string());
  }
  if (columns.is_none()) {
    if (series.bool_value() && !full.is_series()) {
      return error::InvalidArgument("$0 reads a series but selects no column", type_string());
    }
    return full;
  }
  if (!columns.Is<StringList>()) {
    return error::InvalidArgument("$0 columns must be a list of names, got $1", type_string(),
                                  columns.DebugString());
  }
  if (!full.is_frame()) {
    return error::InvalidArgument("$0 cannot select columns from $1", type_string(),
                                  full.DebugString());
  }
  const StringList& names = columns.Get<StringList>();
  if (series.bool_value()) {
    if (names.size() != 1) {
      return error::InvalidArgument("$0 reads a series but selects $1 columns", type_string(),
                                    names.size());
    }
    return full.SelectSeries(names[0]);
  }
  return full.Select(names);
}

Status IOExpr::SetColumnsKwarg(taskgraphpb::Task* task) const {
  SetKwarg("series", Scalar(reads_series()), task);
  if (operand("columns").is_none()) {
    return Status::OK();
  }
  return SetOperandKwarg("columns", operand("columns"), task);
}

StatusOr<ExprPtr> IOExpr::SimplifyUp(const ExprPtr& parent) const {
  if (const Projection* projection = ProjectionOf(parent, *this)) {
    if (reads_series() || !meta().is_frame()) {
      return ExprPtr();
    }
    if (projection->selects_series()) {
      return SubstituteParameters(
          {{"columns", projection->selected_columns()}, {"_series", Operand(true)}});
    }
    return SubstituteParameters({{"columns", projection->selected_columns()}});
  }
  if (Match(parent, match::Partitions()) && IsChildOf(parent, *this)) {
    Int64List selected = selected_partitions();
    Int64List composed;
    for (int64_t p : parent->operand("partitions").Get<Int64List>()) {
      composed.push_back(selected[p]);
    }
    return SubstituteParameters({{"_partitions", composed}});
  }
  return ExprPtr();
}

bool IOExpr::IsSimilar(const IOExpr& other) const {
  if (other.type() != type() || other.name() == name() ||
      other.source()->token() != source()->token()) {
    return false;
  }
  int64_t columns_idx = ParamIndex("columns");
  int64_t series_idx = ParamIndex("_series");
  for (int64_t i = 0; i < static_cast<int64_t>(operands().size()); ++i) {
    if (i == columns_idx || i == series_idx) {
      continue;
    }
    if (operands()[i].Hash() != other.operands()[i].Hash()) {
      return false;
    }
  }
  return true;
}

StatusOr<ExprPtr> IOExpr::CombineSimilar(const ExprPtr& root) const {
  if (!meta().is_frame() && !reads_series()) {
    return ExprPtr();
  }
  bool read_all = operand("columns").is_none();
  std::set<std::string> columns;
  if (!read_all) {
    const StringList& own = operand("columns").Get<StringList>();
    columns.insert(own.begin(), own.end());
  }
  bool found = false;
  for (const auto& expr : TopologicalOrder(root)) {
    if (!expr->IsIO() || !IsSimilar(static_cast<const IOExpr&>(*expr))) {
      continue;
    }
    found = true;
    const Operand& other = expr->operand("columns");
    if (other.is_none()) {
      read_all = true;
    } else {
      const StringList& names = other.Get<StringList>();
      columns.insert(names.begin(), names.end());
    }
  }
  if (!found) {
    return ExprPtr();
  }
  Operand union_columns =
      read_all ? Operand::None() : Operand(StringList(columns.begin(), columns.end()));
  if (!reads_series() && union_columns.Hash() == operand("columns").Hash()) {
    return ExprPtr();
  }
  TESSERA_ASSIGN_OR_RETURN(
      ExprPtr combined,
      SubstituteParameters({{"columns", union_columns}, {"_series", Operand(false)}}));
  VLOG(1) << "Combining " << name() << " into " << combined->name();
  Operand selection = operand("columns");
  if (reads_series()) {
    selection = Operand(selection.Get<StringList>()[0]);
  } else if (selection.is_none()) {
    selection = Operand(meta().column_names());
  }
  return Expr::Create<Projection>({combined, selection});
}

/**
 * FromTable
 */
const Params& FromTable::params() {
  static const auto* params = new Params{{"source", std::nullopt},
                                         {"npartitions", Operand(1)},
                                         {"sort", Operand(true)},
                                         {"columns", Operand::None()},
                                         {"_partitions", Operand::None()},
                                         {"_series", Operand(false)}};
  return *params;
}

Status FromTable::Prepare() {
  TESSERA_ASSIGN_OR_RETURN(std::shared_ptr<const TableSource> table,
                           SourceAs<TableSource>(*this));
  const Operand& npartitions = operand("npartitions");
  if (!npartitions.is_int() || npartitions.int_value() < 1) {
    return error::InvalidArgument("FromTable npartitions must be a positive integer, got $0",
                                  npartitions.DebugString());
  }
  if (!operand("sort").is_bool()) {
    return error::InvalidArgument("FromTable sort must be a bool");
  }
  layout_ = table->Layout(npartitions.int_value(), operand("sort").bool_value());
  return CheckPartitions();
}

StatusOr<Meta> FromTable::ComputeMeta() const { return ProjectedMeta(table().meta()); }

Status FromTable::FillTask(int64_t partition, taskgraphpb::Task* task) const {
  int64_t p = selected_partitions()[partition];
  task->set_op(task_op());
  SetKwarg("token", Scalar(source()->token()), task);
  SetKwarg("start", Scalar(layout_->locations[p]), task);
  SetKwarg("stop", Scalar(layout_->locations[p + 1]), task);
  SetKwarg("sorted", Scalar(operand("sort").bool_value()), task);
  return SetColumnsKwarg(task);
}

StatusOr<ExprPtr> FromTable::SimplifyUp(const ExprPtr& parent) const {
  if (Match(parent, match::Len()) && IsChildOf(parent, *this)) {
    int64_t rows = 0;
    for (int64_t p : selected_partitions()) {
      rows += layout_->locations[p + 1] - layout_->locations[p];
    }
    return Expr::Create<Literal>({rows});
  }
  return IOExpr::SimplifyUp(parent);
}

/**
 * ReadDataset
 */
const Params& ReadDataset::params() {
  static const auto* params = new Params{{"source", std::nullopt},
                                         {"columns", Operand::None()},
                                         {"filters", PredicateList{}},
                                         {"index", Operand::None()},
                                         {"calculate_divisions", Operand(true)},
                                         {"_partitions", Operand::None()},
                                         {"_series", Operand(false)}};
  return *params;
}

std::optional<std::string> ReadDataset::index_column() const {
  const Operand& index = operand("index");
  if (index.is_none()) {
    return std::nullopt;
  }
  return index.string_value();
}

Status ReadDataset::Prepare() {
  TESSERA_ASSIGN_OR_RETURN(std::shared_ptr<const DatasetSource> dataset,
                           SourceAs<DatasetSource>(*this));
  if (!operand("filters").Is<PredicateList>()) {
    return error::InvalidArgument("ReadDataset filters must be a list of predicates, got $0",
                                  operand("filters").DebugString());
  }
  if (!operand("index").is_none() && !operand("index").is_string()) {
    return error::InvalidArgument("ReadDataset index must be a column name, got $0",
                                  operand("index").DebugString());
  }
  if (!operand("calculate_divisions").is_bool()) {
    return error::InvalidArgument("ReadDataset calculate_divisions must be a bool");
  }
  TESSERA_ASSIGN_OR_RETURN(plan_, dataset->Plan(filters(), index_column(),
                                                operand("calculate_divisions").bool_value()));
  return CheckPartitions();
}

StatusOr<Meta> ReadDataset::ComputeMeta() const {
  TESSERA_ASSIGN_OR_RETURN(Meta full, dataset().FrameMeta(index_column()));
  return ProjectedMeta(full);
}

Status ReadDataset::FillTask(int64_t partition, taskgraphpb::Task* task) const {
  if (plan_->fragments.empty()) {
    task->set_op("empty_partition");
    SetKwarg("series", Scalar(reads_series()), task);
    if (meta().is_series()) {
      SetKwarg("name", Scalar(meta().series_name()), task);
      return Status::OK();
    }
    return SetOperandKwarg("columns", Operand(meta().column_names()), task);
  }
  const FragmentInfo& fragment = plan_->fragments[selected_partitions()[partition]];
  task->set_op("read_fragment");
  SetKwarg("token", Scalar(source()->token()), task);
  SetKwarg("path", Scalar(fragment.path), task);
  if (!filters().empty()) {
    TESSERA_RETURN_IF_ERROR(SetOperandKwarg("filters", operand("filters"), task));
  }
  if (index_column().has_value()) {
    SetKwarg("index", Scalar(*index_column()), task);
  }
  return SetColumnsKwarg(task);
}

StatusOr<ExprPtr> ReadDataset::SimplifyUp(const ExprPtr& parent) const {
  if (Match(parent, match::Len()) && IsChildOf(parent, *this)) {
    if (!filters().empty()) {
      return ExprPtr();
    }
    int64_t rows = 0;
    if (!plan_->fragments.empty()) {
      for (int64_t p : selected_partitions()) {
        const auto& num_rows = plan_->fragments[p].num_rows;
        if (!num_rows.has_value()) {
          return ExprPtr();
        }
        rows += *num_rows;
      }
    }
    return Expr::Create<Literal>({rows});
  }
  if (Match(parent, match::Filter()) && IsChildOf(parent, *this)) {
    return AbsorbFilter(*parent);
  }
  return IOExpr::SimplifyUp(parent);
}

StatusOr<ExprPtr> ReadDataset::AbsorbFilter(const Expr& filter) const {
  const ExprPtr& predicate = filter.operand("predicate").expr();
  std::optional<CompareOp> op = ComparisonOp(predicate->type());
  if (!op.has_value()) {
    return ExprPtr();
  }
  const Operand& left = predicate->operands()[0];
  const Operand& right = predicate->operands()[1];
  ExprPtr column_read;
  Scalar value;
  if (left.is_expr() && right.is_scalar()) {
    column_read = left.expr();
    value = right.scalar();
  } else if (left.is_scalar() && right.is_expr()) {
    column_read = right.expr();
    value = left.scalar();
    op = Predicate::Flip(*op);
  } else {
    return ExprPtr();
  }
  if (value.is_null() || !Match(column_read, match::ReadDataset())) {
    return ExprPtr();
  }
  const auto* read = static_cast<const ReadDataset*>(column_read.get());
  if (!read->reads_series() || read->source()->token() != source()->token() ||
      !read->reads_all_partitions() || !reads_all_partitions() ||
      read->index_column() != index_column()) {
    return ExprPtr();
  }
  for (const auto& p : read->filters()) {
    if (std::find(filters().begin(), filters().end(), p) == filters().end()) {
      return ExprPtr();
    }
  }
  PredicateList absorbed = filters();
  absorbed.emplace_back(read->operand("columns").Get<StringList>()[0], *op, value);
  VLOG(1) << "Absorbing filter " << absorbed.back().ToString() << " into " << name();
  return SubstituteParameters({{"filters", absorbed}});
}

namespace build {

StatusOr<ExprPtr> FromTable(std::shared_ptr<const TableSource> source, int64_t npartitions,
                            bool sort) {
  return Expr::Create<planner::FromTable>({std::move(source), npartitions, sort});
}

StatusOr<ExprPtr> ReadDataset(std::shared_ptr<const DatasetSource> source,
                              const PredicateList& filters,
                              const std::optional<std::string>& index,
                              bool calculate_divisions) {
  Operand index_operand = index.has_value() ? Operand(*index) : Operand::None();
  return Expr::Create<planner::ReadDataset>({std::move(source)},
                                            {{"filters", filters},
                                             {"index", index_operand},
                                             {"calculate_divisions", calculate_divisions}});
}

}  // namespace build

}  // namespace planner
}  // namespace tessera
