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

#include <memory>
#include <string>

namespace tessera {
namespace planner {

/**
 * @brief A data source referenced by an IO expression.
 *
 * The token identifies the underlying data. Two handles with the same token read the same
 * data, and the token is what an expression's name depends on.
 */
class SourceHandle {
 public:
  virtual ~SourceHandle() = default;
  virtual std::string token() const = 0;
};

using SourcePtr = std::shared_ptr<const SourceHandle>;

}  // namespace planner
}  // namespace tessera
