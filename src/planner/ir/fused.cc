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


#include "src/planner/ir/fused.h"

#include <functional>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "src/planner/graph/task_utils.h"

namespace tessera {
namespace planner {

const Params& Fused::params() {
  static const auto* params = new Params{{"exprs", std::nullopt}, {"dependencies", std::nullopt}};
  return *params;
}

ExprList Fused::dependencies() const { return operand("dependencies").Get<ExprList>(); }

StatusOr<Meta> Fused::ComputeMeta() const {
  if (!operand("exprs").Is<ExprList>() || exprs().empty()) {
    return error::InvalidArgument("Fused expects a non-empty list of expressions");
  }
  if (!operand("dependencies").Is<ExprList>()) {
    return error::InvalidArgument("Fused expects a list of dependencies");
  }
  for (const auto& member : exprs()) {
    if (member == nullptr || !member->IsBlockwise()) {
      return error::InvalidArgument("Fused members must be blockwise expressions");
    }
  }
  return root()->meta();
}

Divisions Fused::ComputeDivisions() const { return root()->divisions(); }

std::string Fused::ComputeName() const {
  return DefaultName(absl::StrCat("fused-", absl::AsciiStrToLower(root()->type_string())));
}

std::vector<const Blockwise*> Fused::SubtaskOrder() const {
  absl::flat_hash_map<std::string, const Blockwise*> members;
  for (const auto& member : exprs()) {
    members[member->name()] = static_cast<const Blockwise*>(member.get());
  }
  std::vector<const Blockwise*> order;
  absl::flat_hash_set<std::string> visited;
  std::function<void(const Blockwise*)> visit = [&](const Blockwise* expr) {
    if (!visited.insert(expr->name()).second) {
      return;
    }
    for (const auto& dep : expr->dependencies()) {
      auto it = members.find(dep->name());
      if (it != members.end()) {
        visit(it->second);
      }
    }
    order.push_back(expr);
  };
  visit(static_cast<const Blockwise*>(root().get()));
  return order;
}

Status Fused::BuildTasks(taskgraphpb::Layer* layer) const {
  std::vector<const Blockwise*> order = SubtaskOrder();
  if (order.size() != exprs().size()) {
    return error::Internal("Fused group '$0' has members unreachable from its root", name());
  }
  for (const Blockwise* member : order) {
    TESSERA_RETURN_IF_ERROR(member->CheckAligned());
  }
  for (int64_t i = 0; i < npartitions(); ++i) {
    taskgraphpb::Task* task = layer->add_tasks();
    *task->mutable_key() = MakeKey(name(), i);
    task->set_op("fused");
    for (const Blockwise* member : order) {
      TESSERA_RETURN_IF_ERROR(member->BuildBlockwiseTask(i, task->add_subtasks()));
    }
  }
  return Status::OK();
}

}  // namespace planner
}  // namespace tessera
