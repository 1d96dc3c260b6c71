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

#include "src/common/base/base.h"
#include "src/planner/exec/datum.h"
#include "src/planner/graph/taskgraphpb/task_graph.pb.h"

namespace tessera {
namespace planner {

using TaskKwargs = google::protobuf::Map<std::string, taskgraphpb::Literal>;

/**
 * @brief The compute library that evaluates task operations.
 *
 * Implementations return UNIMPLEMENTED for operations they do not support.
 */
class Backend {
 public:
  virtual ~Backend() = default;

  // Evaluates op on positional arguments that are already evaluated.
  virtual StatusOr<DatumPtr> Call(const std::string& op, const std::vector<DatumPtr>& args,
                                  const TaskKwargs& kwargs) = 0;
  // Wraps a literal argument.
  virtual StatusOr<DatumPtr> FromLiteral(const taskgraphpb::Literal& literal) = 0;
};

}  // namespace planner
}  // namespace tessera
