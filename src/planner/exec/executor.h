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
#include "src/planner/exec/datum.h"
#include "src/planner/graph/taskgraphpb/task_graph.pb.h"

namespace tessera {
namespace planner {

/**
 * @brief Runs a task graph.
 *
 * Run fails as a whole when the graph itself is invalid: an unknown key, a reference to a
 * task that does not exist, or a cycle. Otherwise it returns one result per requested key,
 * in order, each holding the value or the error of that task. A task whose dependency
 * failed reports FAILED_PRECONDITION.
 */
class Executor {
 public:
  virtual ~Executor() = default;

  virtual StatusOr<std::vector<StatusOr<DatumPtr>>> Run(
      const taskgraphpb::TaskGraph& graph, const std::vector<taskgraphpb::TaskKey>& keys) = 0;
};

}  // namespace planner
}  // namespace tessera
