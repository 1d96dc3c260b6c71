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


#include "src/planner/ir/reduction.h"

#include <algorithm>
#include <optional>

#include <absl/algorithm/container.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "src/planner/graph/task_utils.h"

DEFINE_int64(split_every, gflags::Int64FromEnv("TESSERA_SPLIT_EVERY", 8),
             "Largest number of intermediates combined by one task of a tree reduction.");

namespace tessera {
namespace planner {

/**
 * Reduction
 */
StatusOr<int64_t> Reduction::split_every() const {
  int64_t idx = ParamIndex("split_every");
  const Operand& op = idx < 0 ? Operand::None() : operands()[idx];
  if (op.is_none()) {
    if (FLAGS_split_every < 2) {
      return error::InvalidArgument("--split_every must be at least 2, got $0",
                                    FLAGS_split_every);
    }
    return FLAGS_split_every;
  }
  if (op.is_bool() && !op.bool_value()) {
    return 0;
  }
  if (op.is_int() && op.int_value() >= 2) {
    return op.int_value();
  }
  return error::InvalidArgument("split_every must be an integer of at least 2 or false, got $0",
                                op.DebugString());
}

int64_t Reduction::split_out() const {
  int64_t idx = ParamIndex("split_out");
  if (idx < 0) {
    return 1;
  }
  const Operand& op = operands()[idx];
  if (op.is_bool()) {
    return op.bool_value() ? frame()->npartitions() : 1;
  }
  return op.is_int() ? op.int_value() : 1;
}

Status Reduction::ValidateInput() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  const Meta& input = frame()->meta();
  if (!input.is_frame() && !input.is_series()) {
    return error::InvalidArgument("$0 expects a frame or a series, got $1", type_string(),
                                  input.DebugString());
  }
  TESSERA_RETURN_IF_ERROR(split_every().status());
  int64_t idx = ParamIndex("split_out");
  if (idx >= 0) {
    const Operand& op = operands()[idx];
    if (!op.is_bool() && !(op.is_int() && op.int_value() >= 1)) {
      return error::InvalidArgument("split_out must be a positive integer or true, got $0",
                                    op.DebugString());
    }
  }
  if (split_out() > 1 && !supports_split_out()) {
    return error::InvalidArgument("$0 does not support split_out > 1", type_string());
  }
  return Status::OK();
}

StatusOr<ExprPtr> Reduction::Lower() const {
  TESSERA_ASSIGN_OR_RETURN(int64_t every, split_every());
  ReductionSteps fns = steps();
  TESSERA_ASSIGN_OR_RETURN(
      ExprPtr chunk, Expr::Create<Chunk>({frame(), fns.chunk, step_kwargs(), frame()->meta()}));
  return Expr::Create<TreeReduce>({chunk, fns.combine, fns.aggregate, step_kwargs(), every,
                                   split_out(), shard_by(), meta(),
                                   absl::AsciiStrToLower(type_string())});
}

Status Reduction::BuildTasks(taskgraphpb::Layer*) const {
  return error::FailedPrecondition("$0 '$1' must be lowered before it is materialized",
                                   type_string(), name());
}

/**
 * Column-wise reductions
 */
namespace {

const Params& SplitParams() {
  static const auto* params = new Params{{"frame", std::nullopt},
                                         {"split_every", Operand::None()},
                                         {"split_out", Operand(1)}};
  return *params;
}

StatusOr<DataType> SumType(std::string_view op, const ColumnSchema& column) {
  switch (column.dtype) {
    case types::BOOLEAN:
    case types::INT64:
      return types::INT64;
    case types::FLOAT64:
      return types::FLOAT64;
    default:
      return error::InvalidArgument("Cannot $0 column '$1' of type $2", op, column.name,
                                    types::DataTypeName(column.dtype));
  }
}

}  // namespace

StatusOr<Meta> ColumnwiseReduction::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ValidateInput());
  const Meta& input = frame()->meta();
  if (input.is_series()) {
    TESSERA_ASSIGN_OR_RETURN(DataType dtype, ResultType(input.columns()[0]));
    return Meta::MakeScalar(dtype);
  }
  std::optional<DataType> common;
  for (const auto& column : input.columns()) {
    TESSERA_ASSIGN_OR_RETURN(DataType dtype, ResultType(column));
    common = common.has_value() ? types::CommonType(common.value(), dtype) : dtype;
  }
  return Meta::MakeSeries(ColumnSchema("", common.value_or(types::INT64)),
                          IndexSchema{"", types::STRING});
}

StatusOr<ExprPtr> ColumnwiseReduction::SimplifyUp(const ExprPtr& parent) const {
  const Projection* projection = ProjectionOf(parent, *this);
  if (projection == nullptr) {
    return ExprPtr();
  }
  return ProjectFrameOperand(*this, *projection);
}

#define TESSERA_COLUMNWISE_PARAMS(NAME) \
  const Params& NAME::params() { return SplitParams(); }
TESSERA_COLUMNWISE_PARAMS(Sum)
TESSERA_COLUMNWISE_PARAMS(Prod)
TESSERA_COLUMNWISE_PARAMS(Min)
TESSERA_COLUMNWISE_PARAMS(Max)
TESSERA_COLUMNWISE_PARAMS(Any)
TESSERA_COLUMNWISE_PARAMS(All)
TESSERA_COLUMNWISE_PARAMS(Count)
#undef TESSERA_COLUMNWISE_PARAMS

ReductionSteps Sum::steps() const { return {"sum", "sum", "sum"}; }
StatusOr<DataType> Sum::ResultType(const ColumnSchema& column) const {
  return SumType("sum", column);
}

ReductionSteps Prod::steps() const { return {"prod", "prod", "prod"}; }
StatusOr<DataType> Prod::ResultType(const ColumnSchema& column) const {
  return SumType("prod", column);
}

ReductionSteps Min::steps() const { return {"min", "min", "min"}; }
StatusOr<DataType> Min::ResultType(const ColumnSchema& column) const { return column.dtype; }

ReductionSteps Max::steps() const { return {"max", "max", "max"}; }
StatusOr<DataType> Max::ResultType(const ColumnSchema& column) const { return column.dtype; }

ReductionSteps Any::steps() const { return {"any", "any", "any"}; }
StatusOr<DataType> Any::ResultType(const ColumnSchema&) const { return types::BOOLEAN; }

ReductionSteps All::steps() const { return {"all", "all", "all"}; }
StatusOr<DataType> All::ResultType(const ColumnSchema&) const { return types::BOOLEAN; }

ReductionSteps Count::steps() const { return {"count", "sum", "sum"}; }
StatusOr<DataType> Count::ResultType(const ColumnSchema&) const { return types::INT64; }

/**
 * Size, Len, Mode
 */
const Params& Size::params() { return SplitParams(); }

StatusOr<Meta> Size::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ValidateInput());
  return Meta::MakeScalar(types::INT64);
}

const Params& Len::params() {
  static const auto* params = new Params{{"frame", std::nullopt}};
  return *params;
}

StatusOr<Meta> Len::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  if (frame()->meta().is_scalar()) {
    return error::InvalidArgument("Len expects a frame, series or index, got $0",
                                  frame()->meta().DebugString());
  }
  return Meta::MakeScalar(types::INT64);
}

StatusOr<ExprPtr> Len::Simplify() const {
  if (!frame()->IsElemwise()) {
    return ExprPtr();
  }
  // Row preserving: any aligned input has the same length.
  for (const auto& dep : frame()->dependencies()) {
    if (!frame()->IsBroadcastDep(dep)) {
      return Expr::Create<Len>({dep});
    }
  }
  return ExprPtr();
}

const Params& Mode::params() { return SplitParams(); }

StatusOr<Meta> Mode::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ValidateInput());
  return frame()->meta();
}

/**
 * DropDuplicates, Unique, ValueCounts
 */
const Params& DropDuplicates::params() {
  static const auto* params = new Params{{"frame", std::nullopt},
                                         {"subset", Operand::None()},
                                         {"split_every", Operand::None()},
                                         {"split_out", Operand(1)}};
  return *params;
}

KwargMap DropDuplicates::step_kwargs() const {
  KwargMap kwargs;
  if (operand("subset").is_string()) {
    kwargs["subset"] = operand("subset").scalar();
  }
  return kwargs;
}

StatusOr<Meta> DropDuplicates::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ValidateInput());
  const Operand& subset = operand("subset");
  if (!subset.is_none()) {
    if (!subset.is_string() || !frame()->meta().is_frame() ||
        !frame()->meta().HasColumn(subset.string_value())) {
      return error::InvalidArgument("DropDuplicates subset must be a column of the frame, got $0",
                                    subset.DebugString());
    }
  }
  return frame()->meta();
}

const Params& Unique::params() { return SplitParams(); }

StatusOr<Meta> Unique::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ValidateInput());
  if (!frame()->meta().is_series()) {
    return error::InvalidArgument("Unique expects a series, got $0",
                                  frame()->meta().DebugString());
  }
  return frame()->meta();
}

const Params& ValueCounts::params() { return SplitParams(); }

StatusOr<Meta> ValueCounts::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ValidateInput());
  const Meta& input = frame()->meta();
  if (!input.is_series()) {
    return error::InvalidArgument("ValueCounts expects a series, got $0", input.DebugString());
  }
  return Meta::MakeSeries(ColumnSchema("count", types::INT64),
                          IndexSchema{input.series_name(), input.dtype()});
}

/**
 * GroupByAgg
 */
const Params& GroupByAgg::params() {
  static const auto* params = new Params{{"frame", std::nullopt},
                                         {"by", std::nullopt},
                                         {"func", std::nullopt},
                                         {"split_every", Operand::None()},
                                         {"split_out", Operand(1)}};
  return *params;
}

ReductionSteps GroupByAgg::steps() const {
  const std::string& func = operand("func").string_value();
  std::string combine = absl::StrCat("groupby_", func == "count" ? "sum" : func);
  return {absl::StrCat("groupby_", func), combine, combine};
}

KwargMap GroupByAgg::step_kwargs() const { return {{"by", operand("by").scalar()}}; }

StatusOr<Meta> GroupByAgg::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ValidateInput());
  const Meta& input = frame()->meta();
  const Operand& by = operand("by");
  const Operand& func = operand("func");
  if (!input.is_frame()) {
    return error::InvalidArgument("GroupByAgg expects a frame, got $0", input.DebugString());
  }
  if (!by.is_string()) {
    return error::InvalidArgument("GroupByAgg expects a column to group by, got $0",
                                  by.DebugString());
  }
  TESSERA_ASSIGN_OR_RETURN(ColumnSchema key, input.GetColumn(by.string_value()));
  static const auto* kFuncs = new std::vector<std::string>{"sum", "count", "min", "max"};
  if (!func.is_string() || !absl::c_linear_search(*kFuncs, func.string_value())) {
    return error::InvalidArgument("GroupByAgg func must be one of sum, count, min or max, got $0",
                                  func.DebugString());
  }
  std::vector<ColumnSchema> columns;
  for (const auto& column : input.columns()) {
    if (column.name == key.name) {
      continue;
    }
    if (func.string_value() == "count") {
      columns.emplace_back(column.name, types::INT64);
    } else if (func.string_value() == "sum") {
      TESSERA_ASSIGN_OR_RETURN(DataType dtype, SumType("sum", column));
      columns.emplace_back(column.name, dtype);
    } else {
      columns.push_back(column);
    }
  }
  return Meta::MakeFrame(std::move(columns), IndexSchema{key.name, key.dtype});
}

StatusOr<ExprPtr> GroupByAgg::SimplifyUp(const ExprPtr& parent) const {
  const Projection* projection = ProjectionOf(parent, *this);
  if (projection == nullptr) {
    return ExprPtr();
  }
  StringList wanted = projection->selected_columns();
  const std::string& by = operand("by").string_value();
  StringList inner = {by};
  for (const auto& name : frame()->columns()) {
    if (name != by && absl::c_linear_search(wanted, name)) {
      inner.push_back(name);
    }
  }
  if (inner.size() >= frame()->columns().size()) {
    return ExprPtr();
  }
  TESSERA_ASSIGN_OR_RETURN(ExprPtr narrowed, Expr::Create<Projection>({frame(), inner}));
  TESSERA_ASSIGN_OR_RETURN(ExprPtr grouped, SubstituteParameters({{"frame", Operand(narrowed)}}));
  return Expr::Create<Projection>({grouped, projection->operand("columns")});
}

/**
 * Chunk
 */
const Params& Chunk::params() {
  static const auto* params = new Params{{"frame", std::nullopt},
                                         {"op", std::nullopt},
                                         {"kwargs", Operand(KwargMap{})},
                                         {"meta", std::nullopt}};
  return *params;
}

StatusOr<Meta> Chunk::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  if (!operand("op").is_string() || !operand("kwargs").Is<KwargMap>() ||
      !operand("meta").Is<Meta>()) {
    return error::InvalidArgument("Chunk expects a function name, kwargs and a meta");
  }
  return operand("meta").Get<Meta>();
}

Status Chunk::FillTask(int64_t partition, taskgraphpb::Task* task) const {
  task->set_op(task_op());
  AddDepArg(frame(), partition, task);
  SetKwarg("func", operand("op").scalar(), task);
  for (const auto& [key, value] : operand("kwargs").Get<KwargMap>()) {
    SetKwarg(key, value, task);
  }
  return Status::OK();
}

/**
 * TreeReduce
 */
const Params& TreeReduce::params() {
  static const auto* params = new Params{{"frame", std::nullopt},
                                         {"combine", std::nullopt},
                                         {"aggregate", std::nullopt},
                                         {"kwargs", Operand(KwargMap{})},
                                         {"split_every", Operand(0)},
                                         {"split_out", Operand(1)},
                                         {"shard_by", Operand::None()},
                                         {"meta", std::nullopt},
                                         {"prefix", Operand("tree-reduce")}};
  return *params;
}

StatusOr<Meta> TreeReduce::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  if (!operand("combine").is_string() || !operand("aggregate").is_string() ||
      !operand("kwargs").Is<KwargMap>() || !operand("prefix").is_string()) {
    return error::InvalidArgument("TreeReduce expects function names, kwargs and a prefix");
  }
  const Operand& every = operand("split_every");
  if (!every.is_int() || every.int_value() < 0 || every.int_value() == 1) {
    return error::InvalidArgument("TreeReduce split_every must be 0 or at least 2, got $0",
                                  every.DebugString());
  }
  if (!operand("split_out").is_int() || operand("split_out").int_value() < 1) {
    return error::InvalidArgument("TreeReduce split_out must be positive, got $0",
                                  operand("split_out").DebugString());
  }
  if (!operand("meta").Is<Meta>()) {
    return error::InvalidArgument("TreeReduce expects a meta");
  }
  return operand("meta").Get<Meta>();
}

Divisions TreeReduce::ComputeDivisions() const {
  return Divisions::Unknown(operand("split_out").int_value());
}

std::string TreeReduce::ComputeName() const {
  return DefaultName(operand("prefix").string_value());
}

void TreeReduce::BuildTree(std::vector<taskgraphpb::TaskArg> inputs, int64_t output,
                           taskgraphpb::Layer* layer) const {
  const auto every = static_cast<size_t>(operand("split_every").int_value());
  bool sharded = operand("split_out").int_value() > 1;
  auto add_step = [&](const taskgraphpb::TaskKey& key, std::string_view op,
                      const std::string& func) {
    taskgraphpb::Task* task = layer->add_tasks();
    *task->mutable_key() = key;
    task->set_op(std::string(op));
    SetKwarg("func", Scalar(func), task);
    for (const auto& [k, v] : operand("kwargs").Get<KwargMap>()) {
      SetKwarg(k, v, task);
    }
    return task;
  };

  for (int64_t depth = 0; every > 0 && inputs.size() > every; ++depth) {
    std::string level = sharded ? absl::StrCat(name(), "-combine-", depth, "-", output)
                                : absl::StrCat(name(), "-combine-", depth);
    std::vector<taskgraphpb::TaskArg> next;
    for (size_t start = 0, b = 0; start < inputs.size(); start += every, ++b) {
      taskgraphpb::Task* task =
          add_step(MakeKey(level, b), "reduction-combine", operand("combine").string_value());
      for (size_t k = start; k < std::min(start + every, inputs.size()); ++k) {
        *task->add_args() = std::move(inputs[k]);
      }
      taskgraphpb::TaskArg ref;
      *ref.mutable_ref() = task->key();
      next.push_back(std::move(ref));
    }
    VLOG(2) << name() << ": combine level " << depth << " has " << next.size() << " tasks";
    inputs = std::move(next);
  }
  taskgraphpb::Task* task = add_step(MakeKey(name(), output), "reduction-aggregate",
                                     operand("aggregate").string_value());
  for (auto& input : inputs) {
    *task->add_args() = std::move(input);
  }
}

Status TreeReduce::BuildTasks(taskgraphpb::Layer* layer) const {
  const ExprPtr& chunk = operand("frame").expr();
  int64_t split_out = operand("split_out").int_value();
  if (split_out == 1) {
    std::vector<taskgraphpb::TaskArg> inputs(chunk->npartitions());
    for (int64_t i = 0; i < chunk->npartitions(); ++i) {
      *inputs[i].mutable_ref() = MakeKey(chunk->name(), i);
    }
    BuildTree(std::move(inputs), 0, layer);
    return Status::OK();
  }

  std::string shard_name = absl::StrCat(name(), "-shard");
  for (int64_t i = 0; i < chunk->npartitions(); ++i) {
    taskgraphpb::Task* task = layer->add_tasks();
    *task->mutable_key() = MakeKey(shard_name, i);
    task->set_op("reduction-shard");
    AddRefArg(chunk->name(), i, task);
    SetKwarg("npartitions", Scalar(split_out), task);
    if (operand("shard_by").is_string()) {
      SetKwarg("by", operand("shard_by").scalar(), task);
    }
  }
  for (int64_t j = 0; j < split_out; ++j) {
    std::vector<taskgraphpb::TaskArg> inputs(chunk->npartitions());
    for (int64_t i = 0; i < chunk->npartitions(); ++i) {
      taskgraphpb::Task* getitem = inputs[i].mutable_inline_task();
      getitem->set_op("getitem");
      AddRefArg(shard_name, i, getitem);
      AddScalarArg(Scalar(j), getitem);
    }
    BuildTree(std::move(inputs), j, layer);
  }
  return Status::OK();
}

}  // namespace planner
}  // namespace tessera
