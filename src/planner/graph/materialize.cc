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


#include "src/planner/graph/materialize.h"

#include <string>
#include <utility>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

#include "src/planner/graph/task_utils.h"
#include "src/planner/rules/rules.h"

namespace tessera {
namespace planner {

namespace {

void CollectRefs(const taskgraphpb::Task& task, absl::flat_hash_set<std::string>* internal,
                 std::vector<taskgraphpb::TaskKey>* refs) {
  for (const auto& subtask : task.subtasks()) {
    internal->insert(KeyString(subtask.key()));
  }
  for (const auto& subtask : task.subtasks()) {
    CollectRefs(subtask, internal, refs);
  }
  for (const auto& arg : task.args()) {
    if (arg.has_ref()) {
      if (!internal->contains(KeyString(arg.ref()))) {
        refs->push_back(arg.ref());
      }
    } else if (arg.has_inline_task()) {
      CollectRefs(arg.inline_task(), internal, refs);
    }
  }
}

}  // namespace

std::vector<taskgraphpb::TaskKey> ExternalRefs(const taskgraphpb::Task& task) {
  absl::flat_hash_set<std::string> internal;
  std::vector<taskgraphpb::TaskKey> refs;
  CollectRefs(task, &internal, &refs);
  return refs;
}

std::vector<taskgraphpb::TaskKey> OutputKeys(const Expr& expr) {
  std::vector<taskgraphpb::TaskKey> keys;
  for (int64_t i = 0; i < expr.npartitions(); ++i) {
    keys.push_back(MakeKey(expr.name(), i));
  }
  return keys;
}

void Cull(const std::vector<taskgraphpb::TaskKey>& keys, taskgraphpb::TaskGraph* graph) {
  absl::flat_hash_map<std::string, const taskgraphpb::Task*> tasks;
  for (const auto& layer : graph->layers()) {
    for (const auto& task : layer.tasks()) {
      tasks[KeyString(task.key())] = &task;
    }
  }
  absl::flat_hash_set<std::string> needed;
  std::vector<std::string> stack;
  for (const auto& key : keys) {
    stack.push_back(KeyString(key));
  }
  while (!stack.empty()) {
    std::string key = std::move(stack.back());
    stack.pop_back();
    if (!needed.insert(key).second) {
      continue;
    }
    auto it = tasks.find(key);
    // Dangling references are left for the executor to report.
    if (it == tasks.end()) {
      continue;
    }
    for (const auto& ref : ExternalRefs(*it->second)) {
      stack.push_back(KeyString(ref));
    }
  }

  taskgraphpb::TaskGraph culled;
  absl::flat_hash_set<std::string> kept_layers;
  int64_t dropped = 0;
  for (auto& layer : *graph->mutable_layers()) {
    taskgraphpb::Layer kept;
    kept.set_name(layer.name());
    for (auto& task : *layer.mutable_tasks()) {
      if (needed.contains(KeyString(task.key()))) {
        *kept.add_tasks() = std::move(task);
      } else {
        ++dropped;
      }
    }
    if (kept.tasks_size() == 0) {
      continue;
    }
    for (const auto& dep : layer.dependencies()) {
      if (kept_layers.contains(dep)) {
        kept.add_dependencies(dep);
      }
    }
    kept_layers.insert(kept.name());
    *culled.add_layers() = std::move(kept);
  }
  VLOG(2) << "Culled " << dropped << " tasks";
  *graph = std::move(culled);
}

StatusOr<MaterializedGraph> Materialize(const ExprPtr& expr, const PlannerOptions& options) {
  ExprPlan plan{expr};
  LowerRule lower(&options);
  TESSERA_RETURN_IF_ERROR(lower.Execute(&plan).status());

  MaterializedGraph out;
  for (const auto& node : TopologicalOrder(plan.root)) {
    auto* layer = out.graph.add_layers();
    TESSERA_RETURN_IF_ERROR(node->BuildLayer(layer));
    VLOG(2) << "Layer " << layer->name() << ": " << layer->tasks_size() << " tasks";
  }
  out.output_keys = OutputKeys(*plan.root);
  Cull(out.output_keys, &out.graph);
  return out;
}

}  // namespace planner
}  // namespace tessera
