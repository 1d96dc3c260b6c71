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


#include "src/planner/ir/partitioning.h"

#include <algorithm>

#include <absl/algorithm/container.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "src/planner/graph/task_utils.h"
#include "src/planner/ir/pattern_match.h"

namespace tessera {
namespace planner {

namespace {

// Boundaries into the input partitions when coalescing n partitions into m.
std::vector<int64_t> CoalesceBoundaries(int64_t n, int64_t m) {
  std::vector<int64_t> boundaries;
  boundaries.reserve(m + 1);
  for (int64_t j = 0; j <= m; ++j) {
    boundaries.push_back(j * n / m);
  }
  return boundaries;
}

}  // namespace

/**
 * Head
 */
const Params& Head::params() {
  static const auto* params = new Params{{"frame", std::nullopt}, {"n", Operand(5)}};
  return *params;
}

StatusOr<Meta> Head::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  if (!operand("n").is_int() || operand("n").int_value() < 0) {
    return error::InvalidArgument("Head expects a non-negative row count, got $0",
                                  operand("n").DebugString());
  }
  const Meta& input = operand("frame").expr()->meta();
  if (input.is_scalar()) {
    return error::InvalidArgument("Head expects a frame, series or index, got $0",
                                  input.DebugString());
  }
  return input;
}

Divisions Head::ComputeDivisions() const {
  return operand("frame").expr()->divisions().Prefix(1);
}

Status Head::BuildTasks(taskgraphpb::Layer* layer) const {
  taskgraphpb::Task* task = layer->add_tasks();
  *task->mutable_key() = MakeKey(name(), 0);
  task->set_op("head");
  AddRefArg(operand("frame").expr()->name(), 0, task);
  AddScalarArg(operand("n").scalar(), task);
  return Status::OK();
}

StatusOr<ExprPtr> Head::Simplify() const {
  const ExprPtr& df = operand("frame").expr();
  int64_t n = operand("n").int_value();
  if (Match(df, match::Head())) {
    return Expr::Create<Head>({df->operand("frame"), std::min(n, df->operand("n").int_value())});
  }
  if (df->IsElemwise()) {
    std::vector<Operand> operands = df->operands();
    bool changed = false;
    for (auto& op : operands) {
      if (op.is_expr() && !df->IsBroadcastDep(op.expr())) {
        TESSERA_ASSIGN_OR_RETURN(ExprPtr head, Expr::Create<Head>({op, n}));
        op = Operand(head);
        changed = true;
      }
    }
    if (!changed) {
      return ExprPtr();
    }
    return df->Rebuild(std::move(operands));
  }
  if (df->IsIO() && df->npartitions() > 1) {
    const Operand& selected = df->operand("_partitions");
    int64_t first = selected.is_none() ? 0 : selected.Get<Int64List>().front();
    TESSERA_ASSIGN_OR_RETURN(
        ExprPtr io, df->SubstituteParameters({{"_partitions", Operand(Int64List{first})}}));
    return Expr::Create<Head>({io, n});
  }
  return ExprPtr();
}

/**
 * Partitions
 */
const Params& Partitions::params() {
  static const auto* params = new Params{{"frame", std::nullopt}, {"partitions", std::nullopt}};
  return *params;
}

StatusOr<Meta> Partitions::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  if (!operand("partitions").Is<Int64List>() || partitions().empty()) {
    return error::InvalidArgument("Partitions expects a non-empty list of partition indices");
  }
  const ExprPtr& df = operand("frame").expr();
  int64_t previous = -1;
  for (int64_t p : partitions()) {
    if (p <= previous || p >= df->npartitions()) {
      return error::InvalidArgument(
          "Partition indices must be ascending, unique and below $0, got [$1]",
          df->npartitions(), absl::StrJoin(partitions(), ", "));
    }
    previous = p;
  }
  return df->meta();
}

Divisions Partitions::ComputeDivisions() const {
  return operand("frame").expr()->divisions().Select(partitions());
}

Status Partitions::BuildTasks(taskgraphpb::Layer* layer) const {
  const std::string& input = operand("frame").expr()->name();
  for (size_t j = 0; j < partitions().size(); ++j) {
    taskgraphpb::Task* task = layer->add_tasks();
    *task->mutable_key() = MakeKey(name(), j);
    task->set_op("alias");
    AddRefArg(input, partitions()[j], task);
  }
  return Status::OK();
}

StatusOr<ExprPtr> Partitions::Simplify() const {
  const ExprPtr& df = operand("frame").expr();
  if (Match(df, match::Partitions())) {
    const Int64List& inner = df->operand("partitions").Get<Int64List>();
    Int64List composed;
    composed.reserve(partitions().size());
    for (int64_t p : partitions()) {
      composed.push_back(inner[p]);
    }
    return Expr::Create<Partitions>({df->operand("frame"), composed});
  }
  // IO leaves absorb the subset themselves. Fused members must keep their inputs.
  if (!df->IsBlockwise() || df->IsIO() || Match(df, match::Fused())) {
    return ExprPtr();
  }
  std::vector<Operand> operands = df->operands();
  bool changed = false;
  for (size_t i = 0; i < operands.size(); ++i) {
    Operand& op = operands[i];
    if (df->IsOpaqueOperand(i) || !op.is_expr() || df->IsBroadcastDep(op.expr())) {
      continue;
    }
    TESSERA_ASSIGN_OR_RETURN(ExprPtr subset, Expr::Create<Partitions>({op, partitions()}));
    op = Operand(subset);
    changed = true;
  }
  if (!changed) {
    return ExprPtr();
  }
  return df->Rebuild(std::move(operands));
}

/**
 * Concat
 */
const Params& Concat::params() {
  static const auto* params = new Params{{"frames", std::nullopt}, {"join", Operand("outer")}};
  return *params;
}

StatusOr<Meta> Concat::ComputeMeta() const {
  if (!operand("frames").Is<ExprList>()) {
    return error::InvalidArgument("Concat expects a list of frames, got $0",
                                  operand("frames").DebugString());
  }
  if (frames().empty()) {
    return error::InvalidArgument("No objects to concatenate");
  }
  const Operand& join = operand("join");
  if (!join.is_string() || (join.string_value() != "inner" && join.string_value() != "outer")) {
    return error::InvalidArgument(
        "Only can inner (intersect) or outer (union) join the other axis, got $0",
        join.DebugString());
  }
  for (const auto& frame : frames()) {
    if (frame == nullptr) {
      return error::InvalidArgument("Concat got a null frame");
    }
  }

  const Meta& first = frames()[0]->meta();
  if (first.is_series()) {
    ColumnSchema column = first.columns()[0];
    for (const auto& frame : frames()) {
      const Meta& meta = frame->meta();
      if (!meta.is_series()) {
        return error::InvalidArgument("Concat expects all frames or all series, got $0",
                                      meta.DebugString());
      }
      const ColumnSchema& other = meta.columns()[0];
      column.dtype = types::CommonType(column.dtype, other.dtype);
      if (column.name != other.name) {
        column.name = "";
      }
      if (column.categories != other.categories) {
        column.categories.reset();
      }
    }
    return Meta::MakeSeries(std::move(column), first.index());
  }

  std::vector<ColumnSchema> columns;
  for (const auto& frame : frames()) {
    const Meta& meta = frame->meta();
    if (!meta.is_frame()) {
      return error::InvalidArgument("Concat expects all frames or all series, got $0",
                                    meta.DebugString());
    }
    for (const auto& column : meta.columns()) {
      auto it = absl::c_find_if(
          columns, [&column](const ColumnSchema& c) { return c.name == column.name; });
      if (it == columns.end()) {
        columns.push_back(column);
        continue;
      }
      it->dtype = types::CommonType(it->dtype, column.dtype);
      if (it->categories != column.categories) {
        it->categories.reset();
      }
    }
  }
  std::vector<ColumnSchema> out;
  for (auto& column : columns) {
    bool everywhere = absl::c_all_of(
        frames(), [&column](const ExprPtr& frame) { return frame->meta().HasColumn(column.name); });
    if (join.string_value() == "inner") {
      if (everywhere) {
        out.push_back(std::move(column));
      }
      continue;
    }
    // Missing values make integer columns floating point.
    if (!everywhere && (column.dtype == types::INT64 || column.dtype == types::BOOLEAN)) {
      column.dtype = types::FLOAT64;
    }
    out.push_back(std::move(column));
  }
  return Meta::MakeFrame(std::move(out), first.index());
}

Divisions Concat::ComputeDivisions() const {
  int64_t npartitions = 0;
  bool ordered = true;
  for (size_t i = 0; i < frames().size(); ++i) {
    const Divisions& divisions = frames()[i]->divisions();
    npartitions += divisions.npartitions();
    if (!divisions.known()) {
      ordered = false;
    } else if (i > 0 && ordered) {
      std::optional<int> cmp =
          frames()[i - 1]->divisions().values().back().Compare(divisions.values().front());
      ordered = cmp.has_value() && cmp.value() < 0;
    }
  }
  if (!ordered) {
    return Divisions::Unknown(npartitions);
  }
  std::vector<Scalar> values;
  for (const auto& frame : frames()) {
    const auto& frame_values = frame->divisions().values();
    values.insert(values.end(), frame_values.begin(), frame_values.end() - 1);
  }
  values.push_back(frames().back()->divisions().values().back());
  StatusOr<Divisions> divisions = Divisions::Known(std::move(values));
  if (!divisions.ok()) {
    return Divisions::Unknown(npartitions);
  }
  return divisions.ConsumeValueOrDie();
}

Status Concat::BuildTasks(taskgraphpb::Layer* layer) const {
  std::vector<std::string> columns = meta().column_names();
  int64_t index = 0;
  for (const auto& frame : frames()) {
    bool aligned = !meta().is_frame() || frame->columns() == columns;
    for (int64_t i = 0; i < frame->npartitions(); ++i) {
      taskgraphpb::Task* task = layer->add_tasks();
      *task->mutable_key() = MakeKey(name(), index++);
      AddRefArg(frame->name(), i, task);
      if (aligned) {
        task->set_op("alias");
        continue;
      }
      task->set_op("reindex_columns");
      TESSERA_RETURN_IF_ERROR(AddOperandArg(Operand(columns), task));
    }
  }
  return Status::OK();
}

StatusOr<ExprPtr> Concat::Simplify() const {
  if (frames().size() == 1) {
    return frames()[0];
  }
  return ExprPtr();
}

StatusOr<ExprPtr> Concat::SimplifyUp(const ExprPtr& parent) const {
  const Projection* projection = ProjectionOf(parent, *this);
  if (projection == nullptr || !meta().is_frame()) {
    return ExprPtr();
  }
  StringList wanted = projection->selected_columns();
  ExprList narrowed;
  bool changed = false;
  for (const auto& frame : frames()) {
    StringList share;
    for (const auto& column : wanted) {
      if (frame->meta().HasColumn(column)) {
        share.push_back(column);
      }
    }
    if (share == frame->columns()) {
      narrowed.push_back(frame);
      continue;
    }
    TESSERA_ASSIGN_OR_RETURN(ExprPtr projected, Expr::Create<Projection>({frame, share}));
    narrowed.push_back(projected);
    changed = true;
  }
  if (!changed) {
    return ExprPtr();
  }
  TESSERA_ASSIGN_OR_RETURN(ExprPtr concat, Expr::Create<Concat>({narrowed, operand("join")}));
  return Expr::Create<Projection>({concat, projection->operand("columns")});
}

/**
 * Repartition
 */
const Params& Repartition::params() {
  static const auto* params = new Params{{"frame", std::nullopt},
                                         {"npartitions", Operand::None()},
                                         {"new_divisions", Operand::None()}};
  return *params;
}

StatusOr<Meta> Repartition::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  const Operand& npartitions = operand("npartitions");
  const Operand& new_divisions = operand("new_divisions");
  if (npartitions.is_none() == new_divisions.is_none()) {
    return error::InvalidArgument("Repartition takes exactly one of npartitions or new_divisions");
  }
  if (!npartitions.is_none() && (!npartitions.is_int() || npartitions.int_value() < 1)) {
    return error::InvalidArgument("Repartition expects a positive partition count, got $0",
                                  npartitions.DebugString());
  }
  if (!new_divisions.is_none()) {
    if (!new_divisions.Is<ScalarList>()) {
      return error::InvalidArgument("Repartition expects a list of new divisions, got $0",
                                    new_divisions.DebugString());
    }
    TESSERA_RETURN_IF_ERROR(Divisions::Known(new_divisions.Get<ScalarList>()).status());
    if (!frame()->known_divisions()) {
      return error::InvalidArgument(
          "Cannot repartition on new divisions with unknown divisions; set the index first");
    }
  }
  return frame()->meta();
}

Divisions Repartition::ComputeDivisions() const {
  const Operand& new_divisions = operand("new_divisions");
  if (!new_divisions.is_none()) {
    // Validated by ComputeMeta.
    return Divisions::Known(new_divisions.Get<ScalarList>()).ConsumeValueOrDie();
  }
  const Divisions& input = frame()->divisions();
  int64_t n = input.npartitions();
  int64_t m = operand("npartitions").int_value();
  if (m == n) {
    return input;
  }
  if (m > n || !input.known()) {
    return Divisions::Unknown(m);
  }
  std::vector<Scalar> values;
  for (int64_t b : CoalesceBoundaries(n, m)) {
    values.push_back(input.values()[b]);
  }
  return Divisions::Known(std::move(values)).ConsumeValueOrDie();
}

Status Repartition::BuildTasks(taskgraphpb::Layer* layer) const {
  if (!operand("new_divisions").is_none()) {
    return BuildNewDivisions(layer);
  }
  int64_t n = frame()->npartitions();
  int64_t m = operand("npartitions").int_value();
  if (m > n) {
    return BuildSplit(layer);
  }
  return BuildCoalesce(layer);
}

Status Repartition::BuildCoalesce(taskgraphpb::Layer* layer) const {
  int64_t n = frame()->npartitions();
  int64_t m = operand("npartitions").int_value();
  std::vector<int64_t> boundaries = CoalesceBoundaries(n, m);
  for (int64_t j = 0; j < m; ++j) {
    taskgraphpb::Task* task = layer->add_tasks();
    *task->mutable_key() = MakeKey(name(), j);
    task->set_op(n == m ? "alias" : "concat");
    for (int64_t i = boundaries[j]; i < boundaries[j + 1]; ++i) {
      AddRefArg(frame()->name(), i, task);
    }
  }
  return Status::OK();
}

Status Repartition::BuildSplit(taskgraphpb::Layer* layer) const {
  int64_t n = frame()->npartitions();
  int64_t m = operand("npartitions").int_value();
  std::string split_name = absl::StrCat(name(), "-split");
  int64_t out = 0;
  for (int64_t i = 0; i < n; ++i) {
    int64_t pieces = m / n + (i < m % n ? 1 : 0);
    taskgraphpb::Task* split = layer->add_tasks();
    *split->mutable_key() = MakeKey(split_name, i);
    split->set_op("split");
    AddRefArg(frame()->name(), i, split);
    AddScalarArg(Scalar(pieces), split);
    for (int64_t p = 0; p < pieces; ++p) {
      taskgraphpb::Task* task = layer->add_tasks();
      *task->mutable_key() = MakeKey(name(), out++);
      task->set_op("getitem");
      AddRefArg(split_name, i, task);
      AddScalarArg(Scalar(p), task);
    }
  }
  return Status::OK();
}

Status Repartition::BuildNewDivisions(taskgraphpb::Layer* layer) const {
  const auto& input = frame()->divisions().values();
  const auto& output = divisions().values();
  int64_t n = frame()->npartitions();
  int64_t m = npartitions();
  for (int64_t j = 0; j < m; ++j) {
    const Scalar& lower = output[j];
    const Scalar& upper = output[j + 1];
    taskgraphpb::Task* task = layer->add_tasks();
    *task->mutable_key() = MakeKey(name(), j);
    task->set_op("concat_range");
    AddScalarArg(lower, task);
    AddScalarArg(upper, task);
    AddScalarArg(Scalar(j == m - 1), task);
    bool any = false;
    for (int64_t i = 0; i < n; ++i) {
      // Partition i covers [input[i], input[i + 1]].
      if (input[i + 1].Compare(lower).value_or(0) < 0 ||
          input[i].Compare(upper).value_or(0) > 0) {
        continue;
      }
      AddRefArg(frame()->name(), i, task);
      any = true;
    }
    if (!any) {
      // Still read one input so the empty output has the right columns.
      AddRefArg(frame()->name(), 0, task);
    }
  }
  return Status::OK();
}

StatusOr<ExprPtr> Repartition::Simplify() const {
  // The outer request wins, except that a partition count cannot stand in for explicit
  // boundaries underneath it.
  if (Match(frame(), match::Repartition())) {
    bool drops_divisions =
        operand("new_divisions").is_none() && !frame()->operand("new_divisions").is_none();
    if (!drops_divisions) {
      return SubstituteParameters({{"frame", frame()->operand("frame")}});
    }
  }
  const Operand& npartitions = operand("npartitions");
  if (!npartitions.is_none() && npartitions.int_value() == frame()->npartitions()) {
    return frame();
  }
  return ExprPtr();
}

StatusOr<ExprPtr> Repartition::SimplifyUp(const ExprPtr& parent) const {
  const Projection* projection = ProjectionOf(parent, *this);
  if (projection == nullptr) {
    return ExprPtr();
  }
  return ProjectFrameOperand(*this, *projection);
}

/**
 * Literal
 */
const Params& Literal::params() {
  static const auto* params = new Params{{"value", std::nullopt}};
  return *params;
}

StatusOr<Meta> Literal::ComputeMeta() const {
  if (!operand("value").is_scalar()) {
    return error::InvalidArgument("Literal expects a scalar value, got $0",
                                  operand("value").DebugString());
  }
  return Meta::MakeScalar(value().type());
}

Status Literal::BuildTasks(taskgraphpb::Layer* layer) const {
  taskgraphpb::Task* task = layer->add_tasks();
  *task->mutable_key() = MakeKey(name(), 0);
  task->set_op("alias");
  AddScalarArg(value(), task);
  return Status::OK();
}

/**
 * FromGraph
 */
const Params& FromGraph::params() {
  static const auto* params = new Params{{"layer", std::nullopt},
                                         {"meta", std::nullopt},
                                         {"divisions", std::nullopt},
                                         {"name", std::nullopt}};
  return *params;
}

StatusOr<Meta> FromGraph::ComputeMeta() const {
  if (!operand("layer").Is<LayerPtr>() || operand("layer").Get<LayerPtr>() == nullptr) {
    return error::InvalidArgument("FromGraph expects a layer");
  }
  if (!operand("meta").Is<Meta>() || !operand("divisions").Is<Divisions>() ||
      !operand("name").is_string()) {
    return error::InvalidArgument("FromGraph expects a meta, divisions and a name");
  }
  const std::string& layer_name = operand("name").string_value();
  const auto& layer = *operand("layer").Get<LayerPtr>();
  for (const auto& task : layer.tasks()) {
    if (task.key().name() != layer_name) {
      return error::InvalidArgument("FromGraph layer '$0' holds the foreign key $1", layer_name,
                                    KeyString(task.key()));
    }
  }
  if (layer.tasks_size() != operand("divisions").Get<Divisions>().npartitions()) {
    return error::InvalidArgument("FromGraph layer '$0' has $1 tasks for $2 partitions",
                                  layer_name, layer.tasks_size(),
                                  operand("divisions").Get<Divisions>().npartitions());
  }
  return operand("meta").Get<Meta>();
}

Divisions FromGraph::ComputeDivisions() const { return operand("divisions").Get<Divisions>(); }

std::string FromGraph::ComputeName() const { return operand("name").string_value(); }

Status FromGraph::BuildTasks(taskgraphpb::Layer* layer) const {
  for (const auto& task : operand("layer").Get<LayerPtr>()->tasks()) {
    *layer->add_tasks() = task;
  }
  return Status::OK();
}

}  // namespace planner
}  // namespace tessera
