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


#include "src/planner/planner.h"

#include <utility>

#include "src/planner/rules/optimizer.h"

namespace tessera {
namespace planner {

StatusOr<std::unique_ptr<Planner>> Planner::Create(const PlannerOptions& options) {
  if (options.max_iterations < 1) {
    return error::InvalidArgument("max_iterations must be positive, got $0",
                                  options.max_iterations);
  }
  return std::unique_ptr<Planner>(new Planner(options));
}

StatusOr<ExprPtr> Planner::Simplify(const ExprPtr& expr) const {
  TESSERA_ASSIGN_OR_RETURN(std::unique_ptr<Simplifier> simplifier, Simplifier::Create(&options_));
  ExprPlan plan{expr};
  TESSERA_RETURN_IF_ERROR(simplifier->Execute(&plan));
  return plan.root;
}

StatusOr<ExprPtr> Planner::Optimize(const ExprPtr& expr) const {
  TESSERA_ASSIGN_OR_RETURN(std::unique_ptr<Optimizer> optimizer, Optimizer::Create(&options_));
  ExprPlan plan{expr};
  TESSERA_RETURN_IF_ERROR(optimizer->Execute(&plan));
  VLOG(1) << "Optimized " << expr->name() << " into " << plan.root->name();
  return plan.root;
}

StatusOr<MaterializedGraph> Planner::Materialize(const ExprPtr& expr) const {
  return planner::Materialize(expr, options_);
}

StatusOr<std::vector<DatumPtr>> Planner::Compute(const ExprPtr& expr, Executor* executor) const {
  TESSERA_ASSIGN_OR_RETURN(ExprPtr optimized, Optimize(expr));
  TESSERA_ASSIGN_OR_RETURN(MaterializedGraph materialized, Materialize(optimized));
  TESSERA_ASSIGN_OR_RETURN(std::vector<StatusOr<DatumPtr>> results,
                           executor->Run(materialized.graph, materialized.output_keys));
  std::vector<DatumPtr> out;
  out.reserve(results.size());
  for (auto& result : results) {
    TESSERA_ASSIGN_OR_RETURN(DatumPtr value, std::move(result));
    out.push_back(std::move(value));
  }
  return out;
}

}  // namespace planner
}  // namespace tessera
