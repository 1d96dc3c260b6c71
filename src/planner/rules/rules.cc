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


#include "src/planner/rules/rules.h"

#include <memory>
#include <utility>

#include <absl/container/flat_hash_set.h>

#include "src/planner/ir/fused.h"
#include "src/planner/ir/pattern_match.h"

namespace tessera {
namespace planner {

StatusOr<bool> ExprRule::Execute(ExprPlan* plan) {
  root_ = plan->root;
  ExprMap replacements;
  for (const auto& expr : TopologicalOrder(root_)) {
    TESSERA_ASSIGN_OR_RETURN(ExprPtr current, expr->Substitute(replacements));
    TESSERA_ASSIGN_OR_RETURN(ExprPtr out, Apply(current));
    if (out == nullptr) {
      out = current;
    }
    if (out->name() != expr->name()) {
      replacements[expr->name()] = out;
    }
  }
  ExprPtr old_root = std::move(root_);
  root_.reset();
  if (replacements.empty()) {
    return false;
  }
  TESSERA_ASSIGN_OR_RETURN(plan->root, old_root->Substitute(replacements));
  return plan->root->name() != old_root->name();
}

/**
 * SimplifyRule
 */
StatusOr<bool> SimplifyRule::Execute(ExprPlan* plan) {
  ExprMap simplified;
  TESSERA_ASSIGN_OR_RETURN(ExprPtr new_root, SimplifyOnce(plan->root, &simplified));
  bool changed = new_root->name() != plan->root->name();
  if (changed) {
    VLOG(1) << "Simplified " << plan->root->name() << " -> " << new_root->name();
  }
  plan->root = std::move(new_root);
  return changed;
}

StatusOr<ExprPtr> SimplifyRule::SimplifyOnce(const ExprPtr& input, ExprMap* simplified) {
  auto cached = simplified->find(input->name());
  if (cached != simplified->end()) {
    return cached->second;
  }
  ExprPtr expr = input;
  for (int64_t iteration = 0;; ++iteration) {
    if (iteration >= options_->max_iterations) {
      return error::DeadlineExceeded("Reached max iterations ($0) simplifying '$1'",
                                     options_->max_iterations, input->name());
    }
    TESSERA_ASSIGN_OR_RETURN(ExprPtr out, expr->Simplify());
    if (out != nullptr && out->name() != expr->name()) {
      VLOG(1) << "Simplify " << expr->name() << " -> " << out->name();
      expr = std::move(out);
      continue;
    }
    // Dependencies may rewrite the expression that reads them.
    bool replaced = false;
    for (const auto& dep : expr->dependencies()) {
      TESSERA_ASSIGN_OR_RETURN(ExprPtr up, dep->SimplifyUp(expr));
      if (up != nullptr && up->name() != expr->name()) {
        VLOG(1) << "SimplifyUp " << expr->name() << " -> " << up->name() << " via "
                << dep->name();
        expr = std::move(up);
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      break;
    }
  }
  // Fused members refer to their inputs by name, so a group is left as it is.
  if (!Match(expr, match::Fused())) {
    TESSERA_ASSIGN_OR_RETURN(expr, expr->TransformChildren([&](const ExprPtr& child) {
      return SimplifyOnce(child, simplified);
    }));
  }
  (*simplified)[input->name()] = expr;
  return expr;
}

/**
 * CombineSimilarRule
 */
StatusOr<ExprPtr> CombineSimilarRule::Apply(const ExprPtr& expr) {
  if (!options_->combine_similar) {
    return ExprPtr();
  }
  return expr->CombineSimilar(root());
}

/**
 * LowerRule
 */
StatusOr<ExprPtr> LowerRule::Apply(const ExprPtr& expr) {
  ExprPtr current = expr;
  for (int64_t iteration = 0;; ++iteration) {
    if (iteration >= options_->max_iterations) {
      return error::DeadlineExceeded("Reached max iterations ($0) lowering '$1'",
                                     options_->max_iterations, expr->name());
    }
    TESSERA_ASSIGN_OR_RETURN(ExprPtr lowered, current->Lower());
    if (lowered == nullptr) {
      break;
    }
    VLOG(1) << "Lower " << current->name() << " -> " << lowered->name();
    current = std::move(lowered);
  }
  return current == expr ? ExprPtr() : current;
}

/**
 * FusionRule
 */
bool FusionRule::IsFusable(const Expr& expr) const {
  if (!expr.IsBlockwise() || expr.type() == ExprType::kFused) {
    return false;
  }
  return !expr.IsIO() || options_->fuse_io_leaves;
}

StatusOr<bool> FusionRule::Execute(ExprPlan* plan) {
  if (!options_->fuse) {
    return false;
  }
  bool changed = false;
  while (true) {
    TESSERA_ASSIGN_OR_RETURN(ExprPtr fused, FusionPass(plan->root));
    if (fused == nullptr) {
      break;
    }
    plan->root = std::move(fused);
    changed = true;
  }
  return changed;
}

StatusOr<ExprPtr> FusionRule::FusionPass(const ExprPtr& root) const {
  ExprList order = TopologicalOrder(root);
  absl::flat_hash_map<std::string, ExprPtr> by_name;
  // Every reader of an expression counts, fusable or not.
  absl::flat_hash_map<std::string, absl::flat_hash_set<std::string>> dependents;
  absl::flat_hash_map<std::string, ExprList> fusable_deps;
  for (const auto& expr : order) {
    by_name[expr->name()] = expr;
    dependents[expr->name()];
    for (const auto& dep : expr->dependencies()) {
      dependents[dep->name()].insert(expr->name());
      if (IsFusable(*dep)) {
        fusable_deps[expr->name()].push_back(dep);
      }
    }
  }

  // Group roots: fusable expressions read by nothing or by something that is not fusable.
  ExprList roots;
  absl::flat_hash_set<std::string> queued;
  for (const auto& expr : order) {
    if (!IsFusable(*expr)) {
      continue;
    }
    const auto& readers = dependents[expr->name()];
    bool is_root = readers.empty();
    for (const auto& reader : readers) {
      is_root = is_root || !IsFusable(*by_name[reader]);
    }
    if (is_root) {
      roots.push_back(expr);
      queued.insert(expr->name());
    }
  }

  absl::flat_hash_set<std::string> processed;
  while (!roots.empty()) {
    ExprPtr group_root = roots.back();
    roots.pop_back();
    if (!processed.insert(group_root->name()).second) {
      continue;
    }
    ExprList stack{group_root};
    ExprList group;
    absl::flat_hash_set<std::string> in_group;
    while (!stack.empty()) {
      ExprPtr next = stack.back();
      stack.pop_back();
      if (!in_group.insert(next->name()).second) {
        continue;
      }
      group.push_back(next);
      for (const auto& dep : fusable_deps[next->name()]) {
        absl::flat_hash_set<std::string> pending = in_group;
        for (const auto& s : stack) {
          pending.insert(s->name());
        }
        bool contained = true;
        for (const auto& reader : dependents[dep->name()]) {
          contained = contained && pending.contains(reader);
        }
        if (contained && dep->npartitions() == next->npartitions() &&
            !next->IsBroadcastDep(dep)) {
          stack.push_back(dep);
        } else if (!fusable_deps[dep->name()].empty() && !queued.contains(dep->name())) {
          // Cannot join this group but may start one of its own.
          roots.push_back(dep);
          queued.insert(dep->name());
        }
      }
    }
    if (group.size() < 2) {
      continue;
    }

    ExprList group_deps;
    absl::flat_hash_set<std::string> seen_deps;
    for (const auto& member : group) {
      for (const auto& dep : member->dependencies()) {
        if (!in_group.contains(dep->name()) && seen_deps.insert(dep->name()).second) {
          group_deps.push_back(dep);
        }
      }
    }
    TESSERA_ASSIGN_OR_RETURN(ExprPtr fused, Expr::Create<Fused>({group, group_deps}));
    VLOG(1) << "Fusing " << group.size() << " expressions under " << group_root->name()
            << " into " << fused->name();
    return root->Substitute({{group_root->name(), fused}});
  }
  return ExprPtr();
}

}  // namespace planner
}  // namespace tessera
