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


#include "src/planner/ir/expr.h"

#include <algorithm>

#include <absl/container/flat_hash_set.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

namespace tessera {
namespace planner {

StatusOr<std::vector<Operand>> Expr::BindOperands(ExprType type, const Params& params,
                                                  std::vector<Operand> positional,
                                                  NamedOperands named) {
  if (positional.size() > params.size()) {
    return error::InvalidArgument("$0 takes at most $1 operands, got $2", TypeString(type),
                                  params.size(), positional.size());
  }
  std::vector<std::optional<Operand>> bound(params.size());
  for (size_t i = 0; i < positional.size(); ++i) {
    bound[i] = std::move(positional[i]);
  }
  for (auto& [param, value] : named) {
    auto it = std::find_if(params.begin(), params.end(),
                           [&param = param](const ParamSpec& spec) { return spec.name == param; });
    if (it == params.end()) {
      return error::InvalidArgument("$0 got an unexpected operand '$1'", TypeString(type), param);
    }
    auto& slot = bound[it - params.begin()];
    if (slot.has_value()) {
      return error::InvalidArgument("$0 got multiple values for operand '$1'", TypeString(type),
                                    param);
    }
    slot = std::move(value);
  }

  std::vector<Operand> operands;
  operands.reserve(params.size());
  for (size_t i = 0; i < params.size(); ++i) {
    if (bound[i].has_value()) {
      operands.push_back(std::move(bound[i].value()));
    } else if (params[i].default_value.has_value()) {
      operands.push_back(params[i].default_value.value());
    } else {
      return error::InvalidArgument("$0 is missing required operand '$1'", TypeString(type),
                                    params[i].name);
    }
  }
  return operands;
}

Status Expr::Init() {
  for (size_t i = 0; i < operands_.size(); ++i) {
    if (operands_[i].is_expr() && operands_[i].expr() == nullptr) {
      return error::InvalidArgument("$0 operand '$1' is a null expression", type_string(),
                                    (*params_)[i].name);
    }
  }
  TESSERA_RETURN_IF_ERROR(Prepare());
  TESSERA_ASSIGN_OR_RETURN(meta_, ComputeMeta());
  return Status::OK();
}

int64_t Expr::ParamIndex(std::string_view param) const {
  for (size_t i = 0; i < params_->size(); ++i) {
    if ((*params_)[i].name == param) {
      return i;
    }
  }
  return -1;
}

const Operand& Expr::operand(std::string_view param) const {
  int64_t idx = ParamIndex(param);
  CHECK_GE(idx, 0) << type_string() << " has no parameter '" << param << "'";
  return operands_[idx];
}

Status Expr::ExpectExprOperand(std::string_view param) const {
  const Operand& op = operand(param);
  if (!op.is_expr()) {
    return error::InvalidArgument("$0 operand '$1' must be an expression, got $2", type_string(),
                                  param, op.DebugString());
  }
  return Status::OK();
}

const std::string& Expr::name() const {
  std::call_once(name_once_, [this]() { name_ = ComputeName(); });
  return name_;
}

const Divisions& Expr::divisions() const {
  std::call_once(divisions_once_, [this]() { divisions_ = ComputeDivisions(); });
  return divisions_;
}

std::string Expr::DefaultName(std::string_view prefix) const {
  uint64_t h = Fingerprint(type_string());
  for (const auto& op : operands_) {
    h = HashCombine(h, op.Hash());
  }
  return absl::StrCat(prefix, "-", absl::Hex(h, absl::kZeroPad16));
}

std::string Expr::ComputeName() const {
  return DefaultName(absl::AsciiStrToLower(type_string()));
}

Divisions Expr::ComputeDivisions() const {
  ExprList deps = dependencies();
  if (deps.empty()) {
    return Divisions::Unknown(1);
  }
  return deps[0]->divisions();
}

ExprList Expr::dependencies() const {
  ExprList deps;
  absl::flat_hash_set<std::string> seen;
  auto add = [&](const ExprPtr& dep) {
    if (seen.insert(dep->name()).second) {
      deps.push_back(dep);
    }
  };
  for (size_t i = 0; i < operands_.size(); ++i) {
    if (IsOpaqueOperand(i)) {
      continue;
    }
    if (operands_[i].is_expr()) {
      add(operands_[i].expr());
    } else if (operands_[i].Is<ExprList>()) {
      for (const auto& dep : operands_[i].Get<ExprList>()) {
        add(dep);
      }
    }
  }
  return deps;
}

StatusOr<Operand> Expr::Lookup(std::string_view attr) const {
  if (attr == "name") {
    return Operand(name());
  }
  if (attr == "npartitions") {
    return Operand(npartitions());
  }
  if (attr == "ndim") {
    return Operand(ndim());
  }
  if (attr == "columns") {
    return Operand(columns());
  }
  if (attr == "known_divisions") {
    return Operand(known_divisions());
  }
  if (attr == "divisions") {
    return Operand(divisions());
  }
  if (attr == "meta") {
    return Operand(meta());
  }
  int64_t idx = ParamIndex(attr);
  if (idx >= 0) {
    return operands_[idx];
  }
  return error::NotFound("'$0' object has no attribute '$1'", type_string(), attr);
}

StatusOr<ExprPtr> Expr::SubstituteParameters(const NamedOperands& changes) const {
  std::vector<Operand> operands = operands_;
  bool changed = false;
  for (const auto& [param, value] : changes) {
    int64_t idx = ParamIndex(param);
    if (idx < 0) {
      return error::InvalidArgument("$0 got an unexpected operand '$1'", type_string(), param);
    }
    if (operands[idx].Hash() != value.Hash()) {
      operands[idx] = value;
      changed = true;
    }
  }
  if (!changed) {
    return self();
  }
  return Rebuild(std::move(operands));
}

namespace {

StatusOr<ExprPtr> SubstituteImpl(const ExprPtr& expr, const ExprMap& replacements,
                                 ExprMap* memo) {
  auto replacement = replacements.find(expr->name());
  if (replacement != replacements.end()) {
    return replacement->second;
  }
  auto cached = memo->find(expr->name());
  if (cached != memo->end()) {
    return cached->second;
  }

  std::vector<Operand> operands = expr->operands();
  bool changed = false;
  for (auto& op : operands) {
    if (op.is_expr()) {
      TESSERA_ASSIGN_OR_RETURN(ExprPtr new_child, SubstituteImpl(op.expr(), replacements, memo));
      if (new_child->name() != op.expr()->name()) {
        op = Operand(new_child);
        changed = true;
      }
    } else if (op.Is<ExprList>()) {
      ExprList children = op.Get<ExprList>();
      bool list_changed = false;
      for (auto& child : children) {
        TESSERA_ASSIGN_OR_RETURN(ExprPtr new_child, SubstituteImpl(child, replacements, memo));
        if (new_child->name() != child->name()) {
          child = new_child;
          list_changed = true;
        }
      }
      if (list_changed) {
        op = Operand(std::move(children));
        changed = true;
      }
    }
  }
  ExprPtr out = expr;
  if (changed) {
    TESSERA_ASSIGN_OR_RETURN(out, expr->Rebuild(std::move(operands)));
  }
  (*memo)[expr->name()] = out;
  return out;
}

}  // namespace

StatusOr<ExprPtr> Expr::Substitute(const ExprMap& replacements) const {
  // Opaque operands are substituted as well so fused members keep referring to the
  // expressions that produce their inputs.
  ExprMap memo;
  return SubstituteImpl(self(), replacements, &memo);
}

StatusOr<ExprPtr> Expr::TransformChildren(
    const std::function<StatusOr<ExprPtr>(const ExprPtr&)>& fn) const {
  std::vector<Operand> operands = operands_;
  bool changed = false;
  for (size_t i = 0; i < operands.size(); ++i) {
    if (IsOpaqueOperand(i)) {
      continue;
    }
    auto& op = operands[i];
    if (op.is_expr()) {
      TESSERA_ASSIGN_OR_RETURN(ExprPtr new_child, fn(op.expr()));
      if (new_child->name() != op.expr()->name()) {
        op = Operand(new_child);
        changed = true;
      }
    } else if (op.Is<ExprList>()) {
      ExprList children = op.Get<ExprList>();
      bool list_changed = false;
      for (auto& child : children) {
        TESSERA_ASSIGN_OR_RETURN(ExprPtr new_child, fn(child));
        if (new_child->name() != child->name()) {
          child = new_child;
          list_changed = true;
        }
      }
      if (list_changed) {
        op = Operand(std::move(children));
        changed = true;
      }
    }
  }
  if (!changed) {
    return self();
  }
  return Rebuild(std::move(operands));
}

Status Expr::BuildLayer(taskgraphpb::Layer* layer) const {
  layer->set_name(name());
  for (const auto& dep : dependencies()) {
    layer->add_dependencies(dep->name());
  }
  return BuildTasks(layer);
}

void Expr::DebugStringImpl(int depth, std::string* out) const {
  std::vector<std::string> args;
  for (size_t i = 0; i < operands_.size(); ++i) {
    const Operand& op = operands_[i];
    if (op.is_expr() || (op.Is<ExprList>() && !IsOpaqueOperand(i))) {
      continue;
    }
    const auto& spec = (*params_)[i];
    if (spec.default_value.has_value() && spec.default_value->Hash() == op.Hash()) {
      continue;
    }
    args.push_back(absl::StrCat(spec.name, "=", op.DebugString()));
  }
  absl::StrAppend(out, Indent(depth), type_string(), "(", absl::StrJoin(args, ", "), ")\n");
  for (const auto& dep : dependencies()) {
    dep->DebugStringImpl(depth + 1, out);
  }
}

std::string Expr::DebugString() const {
  std::string out;
  DebugStringImpl(0, &out);
  return out;
}

ExprList TopologicalOrder(const ExprPtr& root) {
  ExprList order;
  absl::flat_hash_set<std::string> visited;
  // (expression, whether its dependencies were already pushed)
  std::vector<std::pair<ExprPtr, bool>> stack{{root, false}};
  while (!stack.empty()) {
    auto [expr, expanded] = stack.back();
    stack.pop_back();
    if (expanded) {
      order.push_back(expr);
      continue;
    }
    if (!visited.insert(expr->name()).second) {
      continue;
    }
    stack.emplace_back(expr, true);
    ExprList deps = expr->dependencies();
    for (auto it = deps.rbegin(); it != deps.rend(); ++it) {
      if (!visited.contains((*it)->name())) {
        stack.emplace_back(*it, false);
      }
    }
  }
  return order;
}

}  // namespace planner
}  // namespace tessera
