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

#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "src/planner/exec/backend.h"

namespace tessera {
namespace planner {

class MockBackend : public Backend {
 public:
  MOCK_METHOD3(Call, StatusOr<DatumPtr>(const std::string& op, const std::vector<DatumPtr>& args,
                                        const TaskKwargs& kwargs));
  MOCK_METHOD1(FromLiteral, StatusOr<DatumPtr>(const taskgraphpb::Literal& literal));
};

}  // namespace planner
}  // namespace tessera
