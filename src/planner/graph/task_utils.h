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

#include <cstdint>
#include <string>
#include <vector>

#include "src/common/base/base.h"
#include "src/planner/graph/taskgraphpb/task_graph.pb.h"
#include "src/planner/ir/operand.h"
#include "src/shared/types/scalar.h"

namespace tessera {
namespace planner {

taskgraphpb::TaskKey MakeKey(std::string_view name, int64_t index);
// "(name, index)", also used as a map key.
std::string KeyString(const taskgraphpb::TaskKey& key);

void ScalarToLiteral(const types::Scalar& value, taskgraphpb::Literal* literal);
void StringsToLiteral(const std::vector<std::string>& values, taskgraphpb::Literal* literal);
// Scalars, lists of strings/ints/scalars and predicate lists have a literal form.
Status OperandToLiteral(const Operand& operand, taskgraphpb::Literal* literal);
// Only valid for non-list literals.
StatusOr<types::Scalar> LiteralToScalar(const taskgraphpb::Literal& literal);

void AddRefArg(std::string_view name, int64_t index, taskgraphpb::Task* task);
void AddScalarArg(const types::Scalar& value, taskgraphpb::Task* task);
Status AddOperandArg(const Operand& operand, taskgraphpb::Task* task);
void SetKwarg(std::string_view key, const types::Scalar& value, taskgraphpb::Task* task);
Status SetOperandKwarg(std::string_view key, const Operand& operand, taskgraphpb::Task* task);

}  // namespace planner
}  // namespace tessera
