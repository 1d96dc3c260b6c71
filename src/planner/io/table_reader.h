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

#include "src/planner/meta/meta.h"
#include "src/shared/types/scalar.h"

namespace tessera {
namespace planner {

/**
 * @brief Access to an in-memory table held by the compute backend.
 *
 * The planner only reads the schema and the index; the rows stay with the backend, which
 * finds the table again by its token.
 */
class TableReader {
 public:
  virtual ~TableReader() = default;

  virtual std::string token() const = 0;
  // A frame or a series.
  virtual const Meta& meta() const = 0;
  // The index value of every row, in row order.
  virtual std::vector<types::Scalar> IndexValues() const = 0;
};

}  // namespace planner
}  // namespace tessera
