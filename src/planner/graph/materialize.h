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

#include <vector>

#include "src/common/base/base.h"
#include "src/planner/graph/taskgraphpb/task_graph.pb.h"
#include "src/planner/ir/expr.h"
#include "src/planner/rules/planner_state.h"

namespace tessera {
namespace planner {

struct MaterializedGraph {
  taskgraphpb::TaskGraph graph;
  // The partitions of the result. They belong to the lowered expression when expr itself
  // had to be lowered.
  std::vector<taskgraphpb::TaskKey> output_keys;
};

/**
 * @brief Builds the task graph computing expr.
 *
 * Expressions that still need lowering are lowered first. The graph has one layer per
 * distinct expression, dependencies before dependents, and only the tasks the output keys
 * need.
 */
StatusOr<MaterializedGraph> Materialize(const ExprPtr& expr, const PlannerOptions& options);

// The keys holding the partitions of expr's result, in partition order.
std::vector<taskgraphpb::TaskKey> OutputKeys(const Expr& expr);

// Keys a task reads from other tasks. Keys produced by its own subtasks do not count.
std::vector<taskgraphpb::TaskKey> ExternalRefs(const taskgraphpb::Task& task);

// Removes the tasks that none of keys depends on, and the layers left empty.
void Cull(const std::vector<taskgraphpb::TaskKey>& keys, taskgraphpb::TaskGraph* graph);

}  // namespace planner
}  // namespace tessera
