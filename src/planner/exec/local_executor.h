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

#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "src/planner/exec/backend.h"
#include "src/planner/exec/executor.h"

namespace tessera {
namespace planner {

/**
 * @brief Runs the tasks a set of keys needs on the calling thread, each after its
 * dependencies.
 *
 * The backend is not owned and must outlive the executor.
 */
class LocalExecutor : public Executor {
 public:
  explicit LocalExecutor(Backend* backend) : backend_(backend) {}

  StatusOr<std::vector<StatusOr<DatumPtr>>> Run(
      const taskgraphpb::TaskGraph& graph,
      const std::vector<taskgraphpb::TaskKey>& keys) override;

  // Tasks evaluated by the last Run, subtasks and inline tasks included.
  int64_t tasks_run() const { return tasks_run_; }

 private:
  using Results = absl::flat_hash_map<std::string, StatusOr<DatumPtr>>;

  StatusOr<DatumPtr> Evaluate(const taskgraphpb::Task& task, const Results& results,
                              const Results& locals);
  StatusOr<DatumPtr> EvaluateArg(const taskgraphpb::TaskArg& arg, const std::string& task_key,
                                 const Results& results, const Results& locals);

  Backend* backend_;
  int64_t tasks_run_ = 0;
};

}  // namespace planner
}  // namespace tessera
