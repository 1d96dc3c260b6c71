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


#include "src/planner/ir/blockwise.h"

#include <algorithm>

#include <absl/algorithm/container.h>
#include <absl/container/flat_hash_map.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>

#include "src/planner/graph/task_utils.h"
#include "src/planner/ir/pattern_match.h"

namespace tessera {
namespace planner {

namespace {

Status ExpectFrameOrSeries(const Expr& expr, const Meta& meta) {
  if (!meta.is_frame() && !meta.is_series()) {
    return error::InvalidArgument("$0 expects a frame or a series, got $1", expr.type_string(),
                                  meta.DebugString());
  }
  return Status::OK();
}

bool HasCategorical(const Meta& meta) {
  return absl::c_any_of(meta.columns(), [](const ColumnSchema& col) {
    return col.dtype == types::CATEGORICAL;
  });
}

}  // namespace

Meta OperandMeta(const Operand& operand) {
  if (operand.is_expr()) {
    return operand.expr()->meta();
  }
  if (operand.is_scalar()) {
    return Meta::MakeScalar(operand.scalar().type());
  }
  return Meta::MakeScalar(types::DATA_TYPE_UNKNOWN);
}

std::optional<int64_t> FixedFrequencyNanos(std::string_view freq) {
  static const auto* kTickNanos = new absl::flat_hash_map<std::string_view, int64_t>{
      {"ns", 1LL},
      {"us", 1000LL},
      {"ms", 1000LL * 1000},
      {"s", 1000LL * 1000 * 1000},
      {"min", 60LL * 1000 * 1000 * 1000},
      {"T", 60LL * 1000 * 1000 * 1000},
      {"h", 3600LL * 1000 * 1000 * 1000},
      {"H", 3600LL * 1000 * 1000 * 1000},
      {"D", 24LL * 3600 * 1000 * 1000 * 1000},
  };
  size_t digits = 0;
  while (digits < freq.size() && absl::ascii_isdigit(freq[digits])) {
    ++digits;
  }
  int64_t multiple = 1;
  if (digits > 0 && !absl::SimpleAtoi(freq.substr(0, digits), &multiple)) {
    return std::nullopt;
  }
  if (multiple <= 0) {
    return std::nullopt;
  }
  auto it = kTickNanos->find(freq.substr(digits));
  if (it == kTickNanos->end()) {
    return std::nullopt;
  }
  int64_t nanos;
  if (__builtin_mul_overflow(multiple, it->second, &nanos)) {
    return std::nullopt;
  }
  return nanos;
}

bool AllNumeric(const Meta& meta) {
  if (meta.is_scalar()) {
    return types::IsNumeric(meta.dtype());
  }
  return absl::c_all_of(meta.columns(),
                        [](const ColumnSchema& col) { return types::IsNumeric(col.dtype); });
}

const Projection* ProjectionOf(const ExprPtr& parent, const Expr& child) {
  if (!Match(parent, match::Projection())) {
    return nullptr;
  }
  const auto* projection = static_cast<const Projection*>(parent.get());
  if (projection->operands()[0].expr()->name() != child.name()) {
    return nullptr;
  }
  return projection;
}

StatusOr<ExprPtr> ProjectFrameOperand(const Expr& child, const Projection& projection) {
  const ExprPtr& df = child.operand("frame").expr();
  if (!df->meta().is_frame()) {
    return ExprPtr();
  }
  TESSERA_ASSIGN_OR_RETURN(ExprPtr narrowed,
                           Expr::Create<Projection>({df, projection.operand("columns")}));
  return child.SubstituteParameters({{"frame", Operand(narrowed)}});
}

/**
 * Blockwise
 */
std::string Blockwise::task_op() const {
  std::string out;
  for (char c : type_string()) {
    if (absl::ascii_isupper(c) && !out.empty()) {
      out.push_back('_');
    }
    out.push_back(absl::ascii_tolower(c));
  }
  return out;
}

Divisions Blockwise::ComputeDivisions() const {
  ExprList deps = dependencies();
  for (const auto& dep : deps) {
    if (!IsBroadcastDep(dep)) {
      return dep->divisions();
    }
  }
  if (!deps.empty()) {
    return deps[0]->divisions();
  }
  return Divisions::Unknown(1);
}

Status Blockwise::CheckAligned() const {
  for (const auto& dep : dependencies()) {
    if (IsBroadcastDep(dep)) {
      continue;
    }
    if (dep->npartitions() != npartitions()) {
      return error::InvalidArgument(
          "$0 operands are not aligned: '$1' has $2 partitions, expected $3", type_string(),
          dep->name(), dep->npartitions(), npartitions());
    }
    if (known_divisions() && dep->known_divisions() && dep->divisions() != divisions()) {
      return error::InvalidArgument(
          "$0 operands are not aligned: '$1' has divisions $2, expected $3", type_string(),
          dep->name(), dep->divisions().DebugString(), divisions().DebugString());
    }
  }
  return Status::OK();
}

Status Blockwise::BuildTasks(taskgraphpb::Layer* layer) const {
  TESSERA_RETURN_IF_ERROR(CheckAligned());
  for (int64_t i = 0; i < npartitions(); ++i) {
    TESSERA_RETURN_IF_ERROR(BuildBlockwiseTask(i, layer->add_tasks()));
  }
  return Status::OK();
}

Status Blockwise::BuildBlockwiseTask(int64_t partition, taskgraphpb::Task* task) const {
  *task->mutable_key() = MakeKey(name(), partition);
  return FillTask(partition, task);
}

Status Blockwise::FillTask(int64_t partition, taskgraphpb::Task* task) const {
  task->set_op(task_op());
  for (size_t i = 0; i < operands().size(); ++i) {
    if (IsOpaqueOperand(i)) {
      continue;
    }
    TESSERA_RETURN_IF_ERROR(AddArg(operands()[i], partition, task));
  }
  return Status::OK();
}

void Blockwise::AddDepArg(const ExprPtr& dep, int64_t partition, taskgraphpb::Task* task) const {
  AddRefArg(dep->name(), IsBroadcastDep(dep) ? 0 : partition, task);
}

Status Blockwise::AddArg(const Operand& operand, int64_t partition,
                         taskgraphpb::Task* task) const {
  if (operand.is_expr()) {
    AddDepArg(operand.expr(), partition, task);
    return Status::OK();
  }
  return AddOperandArg(operand, task);
}

/**
 * Projection
 */
const Params& Projection::params() {
  static const auto* params = new Params{{"frame", std::nullopt}, {"columns", std::nullopt}};
  return *params;
}

StringList Projection::selected_columns() const {
  const Operand& columns = operand("columns");
  if (columns.is_string()) {
    return {columns.string_value()};
  }
  return columns.Get<StringList>();
}

StatusOr<Meta> Projection::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  const Operand& columns = operand("columns");
  if (!columns.is_string() && !columns.Is<StringList>()) {
    return error::InvalidArgument("Projection expects a column name or a list of names, got $0",
                                  columns.DebugString());
  }
  const Meta& input = frame()->meta();
  if (input.is_frame()) {
    if (columns.is_string()) {
      return input.SelectSeries(columns.string_value());
    }
    return input.Select(columns.Get<StringList>());
  }
  // Label lookups on a series, such as the per-column result of a reduction.
  if (input.is_series()) {
    if (columns.is_string()) {
      return Meta::MakeScalar(input.dtype());
    }
    return input;
  }
  return error::InvalidArgument("Cannot select columns from $0", input.DebugString());
}

StatusOr<ExprPtr> Projection::Simplify() const {
  const ExprPtr& df = frame();
  if (Match(df, match::Projection())) {
    const auto* inner = static_cast<const Projection*>(df.get());
    if (inner->selects_series()) {
      return ExprPtr();
    }
    return Expr::Create<Projection>({inner->frame(), operand("columns")});
  }
  if (!selects_series() && df->meta().is_frame() && selected_columns() == df->columns()) {
    return df;
  }
  return ExprPtr();
}

/**
 * ProjectIndex
 */
const Params& ProjectIndex::params() {
  static const auto* params = new Params{{"frame", std::nullopt}};
  return *params;
}

StatusOr<Meta> ProjectIndex::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  const Meta& input = frame()->meta();
  TESSERA_RETURN_IF_ERROR(ExpectFrameOrSeries(*this, input));
  return Meta::MakeIndex(input.index());
}

/**
 * Filter
 */
const Params& Filter::params() {
  static const auto* params = new Params{{"frame", std::nullopt}, {"predicate", std::nullopt}};
  return *params;
}

StatusOr<Meta> Filter::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("predicate"));
  const Meta& input = frame()->meta();
  TESSERA_RETURN_IF_ERROR(ExpectFrameOrSeries(*this, input));
  const Meta& predicate = operand("predicate").expr()->meta();
  if (!predicate.is_series() ||
      (predicate.dtype() != types::BOOLEAN && predicate.dtype() != types::DATA_TYPE_UNKNOWN)) {
    return error::InvalidArgument("Filter predicate must be a boolean series, got $0",
                                  predicate.DebugString());
  }
  return input;
}

StatusOr<ExprPtr> Filter::SimplifyUp(const ExprPtr& parent) const {
  const Projection* projection = ProjectionOf(parent, *this);
  if (projection == nullptr) {
    return ExprPtr();
  }
  return ProjectFrameOperand(*this, *projection);
}

/**
 * Assign
 */
const Params& Assign::params() {
  static const auto* params =
      new Params{{"frame", std::nullopt}, {"key", std::nullopt}, {"value", std::nullopt}};
  return *params;
}

StatusOr<Meta> Assign::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  const Meta& input = frame()->meta();
  if (!input.is_frame()) {
    return error::InvalidArgument("Assign expects a frame, got $0", input.DebugString());
  }
  const Operand& key = operand("key");
  if (!key.is_string()) {
    return error::InvalidArgument("Assign key must be a column name, got $0", key.DebugString());
  }
  const Operand& value = operand("value");
  ColumnSchema column(key.string_value(), types::DATA_TYPE_UNKNOWN);
  if (value.is_expr()) {
    const Meta& value_meta = value.expr()->meta();
    if (value_meta.is_series()) {
      column.dtype = value_meta.dtype();
      column.categories = value_meta.columns()[0].categories;
    } else if (value_meta.is_scalar()) {
      column.dtype = value_meta.dtype();
    } else {
      return error::InvalidArgument("Assign value must be a series or a scalar, got $0",
                                    value_meta.DebugString());
    }
  } else if (value.is_scalar()) {
    column.dtype = value.scalar().type();
  } else {
    return error::InvalidArgument("Assign value must be a series or a literal, got $0",
                                  value.DebugString());
  }
  return input.WithColumn(std::move(column));
}

StatusOr<ExprPtr> Assign::SimplifyUp(const ExprPtr& parent) const {
  const Projection* projection = ProjectionOf(parent, *this);
  if (projection == nullptr) {
    return ExprPtr();
  }
  StringList wanted = projection->selected_columns();
  const std::string& key = operand("key").string_value();
  if (!absl::c_linear_search(wanted, key)) {
    // The assigned column is never read.
    return Expr::Create<Projection>({frame(), projection->operand("columns")});
  }
  StringList inner;
  for (const auto& name : frame()->columns()) {
    if (name != key && absl::c_linear_search(wanted, name)) {
      inner.push_back(name);
    }
  }
  if (inner.size() >= frame()->columns().size()) {
    return ExprPtr();
  }
  TESSERA_ASSIGN_OR_RETURN(ExprPtr narrowed, Expr::Create<Projection>({frame(), inner}));
  TESSERA_ASSIGN_OR_RETURN(ExprPtr assign, SubstituteParameters({{"frame", Operand(narrowed)}}));
  return Expr::Create<Projection>({assign, projection->operand("columns")});
}

/**
 * AsType
 */
const Params& AsType::params() {
  static const auto* params = new Params{{"frame", std::nullopt}, {"dtypes", std::nullopt}};
  return *params;
}

StatusOr<Meta> AsType::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  const Operand& dtypes = operand("dtypes");
  if (!dtypes.Is<DTypeMap>()) {
    return error::InvalidArgument("AsType expects a column to type mapping, got $0",
                                  dtypes.DebugString());
  }
  return frame()->meta().WithDTypes(dtypes.Get<DTypeMap>());
}

Status AsType::FillTask(int64_t partition, taskgraphpb::Task* task) const {
  task->set_op(task_op());
  AddDepArg(frame(), partition, task);
  for (const auto& [column, dtype] : operand("dtypes").Get<DTypeMap>()) {
    SetKwarg(column, Scalar(types::DataTypeName(dtype)), task);
  }
  return Status::OK();
}

/**
 * Apply
 */
const Params& Apply::params() {
  static const auto* params = new Params{{"frame", std::nullopt},
                                         {"function", std::nullopt},
                                         {"meta", std::nullopt},
                                         {"args", Operand(ScalarList{})},
                                         {"kwargs", Operand(KwargMap{})}};
  return *params;
}

StatusOr<Meta> Apply::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  if (!operand("function").is_string()) {
    return error::InvalidArgument("Apply function must be a name, got $0",
                                  operand("function").DebugString());
  }
  if (!operand("args").Is<ScalarList>() || !operand("kwargs").Is<KwargMap>()) {
    return error::InvalidArgument("Apply arguments must be literals");
  }
  const Operand& meta = operand("meta");
  if (!meta.Is<Meta>()) {
    return error::InvalidArgument("Apply needs the output meta, got $0", meta.DebugString());
  }
  return meta.Get<Meta>();
}

Status Apply::FillTask(int64_t partition, taskgraphpb::Task* task) const {
  task->set_op(task_op());
  AddScalarArg(operand("function").scalar(), task);
  AddDepArg(frame(), partition, task);
  for (const auto& arg : operand("args").Get<ScalarList>()) {
    AddScalarArg(arg, task);
  }
  for (const auto& [key, value] : operand("kwargs").Get<KwargMap>()) {
    SetKwarg(key, value, task);
  }
  return Status::OK();
}

/**
 * Binop
 */
namespace {

const Params& BinopParams() {
  static const auto* params = new Params{{"left", std::nullopt}, {"right", std::nullopt}};
  return *params;
}

}  // namespace

#define TESSERA_BINOP_PARAMS(NAME) \
  const Params& NAME::params() { return BinopParams(); }
TESSERA_BINOP_PARAMS(Add)
TESSERA_BINOP_PARAMS(Sub)
TESSERA_BINOP_PARAMS(Mul)
TESSERA_BINOP_PARAMS(Div)
TESSERA_BINOP_PARAMS(Lt)
TESSERA_BINOP_PARAMS(Le)
TESSERA_BINOP_PARAMS(Gt)
TESSERA_BINOP_PARAMS(Ge)
TESSERA_BINOP_PARAMS(Eq)
TESSERA_BINOP_PARAMS(Ne)
#undef TESSERA_BINOP_PARAMS

StatusOr<Meta> Binop::ComputeMeta() const {
  for (const Operand* side : {&left(), &right()}) {
    if (!side->is_expr() && !side->is_scalar()) {
      return error::InvalidArgument("$0 operands must be expressions or literals, got $1",
                                    type_string(), side->DebugString());
    }
  }
  return BinaryOpMeta(op(), OperandMeta(left()), OperandMeta(right()));
}

StatusOr<ExprPtr> Binop::Simplify() const {
  // x + x => 2 * x, for numeric x only: strings concatenate.
  if (type() == ExprType::kAdd && left().is_expr() && right().is_expr() &&
      left().expr()->name() == right().expr()->name() && AllNumeric(left().expr()->meta())) {
    return Expr::Create<Mul>({2, left()});
  }
  // a * (b * x) => (a * b) * x
  if (type() == ExprType::kMul && left().is_scalar() && left().scalar().is_numeric() &&
      right().is_expr() && right().expr()->type() == ExprType::kMul) {
    const auto& inner = right().expr()->operands();
    if (inner[0].is_scalar() && inner[0].scalar().is_numeric()) {
      StatusOr<Scalar> factor = Scalar::Multiply(left().scalar(), inner[0].scalar());
      if (!factor.ok()) {
        VLOG(1) << "Not folding factors of " << name() << ": " << factor.msg();
        return ExprPtr();
      }
      return Expr::Create<Mul>({factor.ConsumeValueOrDie(), inner[1]});
    }
  }
  return ExprPtr();
}

StatusOr<ExprPtr> Binop::SimplifyUp(const ExprPtr& parent) const {
  const Projection* projection = ProjectionOf(parent, *this);
  if (projection == nullptr) {
    return ExprPtr();
  }
  StringList wanted = projection->selected_columns();
  bool narrows = false;
  for (const Operand* side : {&left(), &right()}) {
    if (!side->is_expr()) {
      continue;
    }
    const Meta& meta = side->expr()->meta();
    if (!meta.is_frame()) {
      return ExprPtr();
    }
    for (const auto& column : wanted) {
      if (!meta.HasColumn(column)) {
        return ExprPtr();
      }
    }
    narrows |= meta.columns().size() > wanted.size();
  }
  if (!narrows) {
    return ExprPtr();
  }
  std::vector<Operand> operands = this->operands();
  for (auto& op : operands) {
    if (op.is_expr()) {
      TESSERA_ASSIGN_OR_RETURN(
          ExprPtr narrowed, Expr::Create<Projection>({op, projection->operand("columns")}));
      op = Operand(narrowed);
    }
  }
  return Rebuild(std::move(operands));
}

/**
 * Categoricals
 */
const Params& AsUnknown::params() {
  static const auto* params = new Params{{"frame", std::nullopt}};
  return *params;
}

StatusOr<Meta> AsUnknown::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  const Meta& input = frame()->meta();
  TESSERA_RETURN_IF_ERROR(ExpectFrameOrSeries(*this, input));
  return input.ClearCategories();
}

StatusOr<ExprPtr> AsUnknown::SimplifyUp(const ExprPtr& parent) const {
  const Projection* projection = ProjectionOf(parent, *this);
  if (projection == nullptr) {
    return ExprPtr();
  }
  return ProjectFrameOperand(*this, *projection);
}

const Params& SetCategories::params() {
  static const auto* params = new Params{{"frame", std::nullopt}, {"categories", std::nullopt}};
  return *params;
}

StatusOr<Meta> SetCategories::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  const Operand& categories = operand("categories");
  if (!categories.Is<StringList>()) {
    return error::InvalidArgument("SetCategories expects a list of categories, got $0",
                                  categories.DebugString());
  }
  const Meta& input = frame()->meta();
  TESSERA_RETURN_IF_ERROR(ExpectFrameOrSeries(*this, input));
  if (!HasCategorical(input)) {
    return error::InvalidArgument("SetCategories needs categorical data, got $0",
                                  input.DebugString());
  }
  Meta out = input;
  for (const auto& column : input.columns()) {
    if (column.dtype == types::CATEGORICAL) {
      out = out.WithColumn(
          ColumnSchema(column.name, column.dtype, categories.Get<StringList>()));
    }
  }
  return out;
}

StatusOr<ExprPtr> SetCategories::SimplifyUp(const ExprPtr& parent) const {
  const Projection* projection = ProjectionOf(parent, *this);
  if (projection == nullptr || !frame()->meta().is_frame()) {
    return ExprPtr();
  }
  bool keeps_categorical = false;
  for (const auto& name : projection->selected_columns()) {
    TESSERA_ASSIGN_OR_RETURN(ColumnSchema column, frame()->meta().GetColumn(name));
    keeps_categorical |= column.dtype == types::CATEGORICAL;
  }
  if (!keeps_categorical) {
    return ExprPtr();
  }
  return ProjectFrameOperand(*this, *projection);
}

const Params& CategoricalCodes::params() {
  static const auto* params = new Params{{"frame", std::nullopt}};
  return *params;
}

StatusOr<Meta> CategoricalCodes::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  const Meta& input = frame()->meta();
  TESSERA_RETURN_IF_ERROR(ExpectFrameOrSeries(*this, input));
  if (!HasCategorical(input)) {
    return error::InvalidArgument("Categorical codes need categorical data, got $0",
                                  input.DebugString());
  }
  if (input.HasUnknownCategories()) {
    return error::FailedPrecondition(
        "Categories are unknown, the codes cannot be computed. Call as_known() or "
        "categorize() first.");
  }
  Meta out = input;
  for (const auto& column : input.columns()) {
    if (column.dtype == types::CATEGORICAL) {
      out = out.WithColumn(ColumnSchema(column.name, types::INT64));
    }
  }
  return out;
}

/**
 * Shift
 */
const Params& Shift::params() {
  static const auto* params =
      new Params{{"frame", std::nullopt}, {"periods", Operand(1)}, {"freq", Operand::None()}};
  return *params;
}

StatusOr<Meta> Shift::ComputeMeta() const {
  TESSERA_RETURN_IF_ERROR(ExpectExprOperand("frame"));
  const Meta& input = frame()->meta();
  TESSERA_RETURN_IF_ERROR(ExpectFrameOrSeries(*this, input));
  if (!operand("periods").is_int()) {
    return error::InvalidArgument("Shift periods must be an integer, got $0",
                                  operand("periods").DebugString());
  }
  const Operand& freq = operand("freq");
  if (!freq.is_none() && !freq.is_string()) {
    return error::InvalidArgument("Shift freq must be a frequency string, got $0",
                                  freq.DebugString());
  }
  return input;
}

Divisions Shift::ComputeDivisions() const {
  const Divisions& input = frame()->divisions();
  const Operand& freq = operand("freq");
  if (freq.is_none() || !input.known()) {
    return input;
  }
  // Frequencies move timestamps. Any other index has no defined offset.
  if (frame()->meta().index().dtype != types::TIME64NS) {
    return Divisions::Unknown(input.npartitions());
  }
  std::optional<int64_t> tick = FixedFrequencyNanos(freq.string_value());
  int64_t delta;
  if (!tick.has_value() ||
      __builtin_mul_overflow(operand("periods").int_value(), *tick, &delta)) {
    return Divisions::Unknown(input.npartitions());
  }
  StatusOr<Divisions> shifted = input.Shift(Scalar(delta));
  if (!shifted.ok()) {
    VLOG(1) << "Cannot shift divisions " << input << ": " << shifted.msg();
    return Divisions::Unknown(input.npartitions());
  }
  return shifted.ConsumeValueOrDie();
}

Status Shift::BuildTasks(taskgraphpb::Layer* layer) const {
  if (IsBlockwise()) {
    return Blockwise::BuildTasks(layer);
  }
  const ExprPtr& df = frame();
  int64_t periods = operand("periods").int_value();
  for (int64_t i = 0; i < df->npartitions(); ++i) {
    taskgraphpb::Task* task = layer->add_tasks();
    *task->mutable_key() = MakeKey(name(), i);
    task->set_op(task_op());
    // Rows shifted in across the partition boundary come from the neighbour.
    int64_t neighbour = periods > 0 ? i - 1 : i + 1;
    if (periods != 0 && neighbour >= 0 && neighbour < df->npartitions()) {
      AddRefArg(df->name(), neighbour, task);
    } else {
      AddScalarArg(Scalar::Null(), task);
    }
    AddRefArg(df->name(), i, task);
    AddScalarArg(Scalar(periods), task);
  }
  return Status::OK();
}

StatusOr<ExprPtr> Shift::SimplifyUp(const ExprPtr& parent) const {
  const Projection* projection = ProjectionOf(parent, *this);
  if (projection == nullptr) {
    return ExprPtr();
  }
  return ProjectFrameOperand(*this, *projection);
}

}  // namespace planner
}  // namespace tessera
