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


#include "src/planner/exec/local_executor.h"

#include <utility>

#include "src/planner/graph/materialize.h"
#include "src/planner/graph/task_utils.h"

namespace tessera {
namespace planner {

namespace {

enum class Mark { kVisiting, kDone };

}  // namespace

StatusOr<std::vector<StatusOr<DatumPtr>>> LocalExecutor::Run(
    const taskgraphpb::TaskGraph& graph, const std::vector<taskgraphpb::TaskKey>& keys) {
  tasks_run_ = 0;
  absl::flat_hash_map<std::string, const taskgraphpb::Task*> tasks;
  for (const auto& layer : graph.layers()) {
    for (const auto& task : layer.tasks()) {
      if (!tasks.emplace(KeyString(task.key()), &task).second) {
        return error::InvalidArgument("Task $0 appears twice in the graph",
                                      KeyString(task.key()));
      }
    }
  }

  // Orders the needed tasks so that every task follows the tasks it reads.
  std::vector<const taskgraphpb::Task*> order;
  absl::flat_hash_map<std::string, Mark> marks;
  std::vector<std::pair<std::string, bool>> stack;
  for (auto it = keys.rbegin(); it != keys.rend(); ++it) {
    std::string key = KeyString(*it);
    if (!tasks.contains(key)) {
      return error::InvalidArgument("Unknown key $0", key);
    }
    stack.emplace_back(std::move(key), false);
  }
  while (!stack.empty()) {
    auto [key, expanded] = std::move(stack.back());
    stack.pop_back();
    const taskgraphpb::Task* task = tasks[key];
    if (expanded) {
      marks[key] = Mark::kDone;
      order.push_back(task);
      continue;
    }
    auto mark = marks.find(key);
    if (mark != marks.end()) {
      if (mark->second == Mark::kVisiting) {
        return error::InvalidArgument("Cycle in the task graph at $0", key);
      }
      continue;
    }
    marks[key] = Mark::kVisiting;
    stack.emplace_back(key, true);
    for (const auto& ref : ExternalRefs(*task)) {
      std::string dep = KeyString(ref);
      if (!tasks.contains(dep)) {
        return error::InvalidArgument("Task $0 references unknown key $1", key, dep);
      }
      stack.emplace_back(std::move(dep), false);
    }
  }

  Results results;
  const Results no_locals;
  for (const auto* task : order) {
    StatusOr<DatumPtr> value = Evaluate(*task, results, no_locals);
    if (!value.ok()) {
      VLOG(1) << "Task " << KeyString(task->key()) << " failed: " << value.msg();
    }
    results.emplace(KeyString(task->key()), std::move(value));
  }

  std::vector<StatusOr<DatumPtr>> out;
  out.reserve(keys.size());
  for (const auto& key : keys) {
    out.push_back(results.at(KeyString(key)));
  }
  return out;
}

StatusOr<DatumPtr> LocalExecutor::Evaluate(const taskgraphpb::Task& task, const Results& results,
                                           const Results& locals) {
  ++tasks_run_;
  std::string key = KeyString(task.key());
  if (task.subtasks_size() > 0) {
    // Subtasks see the subtasks before them; the task's value is the last one's.
    Results scope = locals;
    DatumPtr last;
    for (const auto& subtask : task.subtasks()) {
      TESSERA_ASSIGN_OR_RETURN(last, Evaluate(subtask, results, scope));
      scope.insert_or_assign(KeyString(subtask.key()), last);
    }
    return last;
  }

  std::vector<DatumPtr> args;
  args.reserve(task.args_size());
  for (const auto& arg : task.args()) {
    TESSERA_ASSIGN_OR_RETURN(DatumPtr value, EvaluateArg(arg, key, results, locals));
    args.push_back(std::move(value));
  }
  if (task.op() == "alias") {
    if (args.size() != 1) {
      return error::InvalidArgument("Task $0: alias takes one argument, got $1", key,
                                    args.size());
    }
    return args[0];
  }
  return backend_->Call(task.op(), args, task.kwargs());
}

StatusOr<DatumPtr> LocalExecutor::EvaluateArg(const taskgraphpb::TaskArg& arg,
                                              const std::string& task_key,
                                              const Results& results, const Results& locals) {
  switch (arg.arg_case()) {
    case taskgraphpb::TaskArg::kRef: {
      std::string ref = KeyString(arg.ref());
      auto local = locals.find(ref);
      if (local != locals.end()) {
        return local->second;
      }
      auto it = results.find(ref);
      if (it == results.end()) {
        return error::Internal("Task $0 ran before its dependency $1", task_key, ref);
      }
      if (!it->second.ok()) {
        return error::FailedPrecondition("Dependency $0 of task $1 failed: $2", ref, task_key,
                                         it->second.msg());
      }
      return it->second;
    }
    case taskgraphpb::TaskArg::kLiteral:
      return backend_->FromLiteral(arg.literal());
    case taskgraphpb::TaskArg::kInlineTask:
      return Evaluate(arg.inline_task(), results, locals);
    default:
      return error::InvalidArgument("Task $0 has an empty argument", task_key);
  }
}

}  // namespace planner
}  // namespace tessera
