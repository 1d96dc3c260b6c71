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

#include "src/planner/ir/blockwise.h"

namespace tessera {
namespace planner {

/**
 * @brief A group of blockwise expressions computed by one task per partition.
 *
 * `exprs` holds the members, the group root first. They are opaque: the dependencies of
 * the group are only the expressions in `dependencies`, which are read by members but are
 * not members themselves. Every task of the group runs the member tasks of its partition
 * as subtasks, producers before consumers, and returns the root's value.
 */
class Fused : public Blockwise {
  TESSERA_DECLARE_EXPR(Fused, Blockwise)
  ExprList dependencies() const override;
  bool IsOpaqueOperand(size_t i) const override { return i == 0; }

  const ExprList& exprs() const { return operand("exprs").Get<ExprList>(); }
  const ExprPtr& root() const { return exprs()[0]; }

 protected:
  StatusOr<Meta> ComputeMeta() const override;
  Divisions ComputeDivisions() const override;
  std::string ComputeName() const override;
  Status BuildTasks(taskgraphpb::Layer* layer) const override;

 private:
  // Members ordered so that every member follows the members it reads.
  std::vector<const Blockwise*> SubtaskOrder() const;
};

}  // namespace planner
}  // namespace tessera
