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
#include <utility>
#include <vector>

#include <absl/strings/substitute.h>

#include "src/planner/rules/rules.h"

namespace tessera {
namespace planner {

/**
 * @brief Decides what happens when a rule batch is still changing the plan after its
 * iteration budget. New strategies implement MaxIterationsHandler.
 */
class Strategy {
 public:
  virtual ~Strategy() = default;
  explicit Strategy(const std::string& name, int64_t max_iterations)
      : name_(name), max_iterations_(max_iterations) {}

  virtual Status MaxIterationsHandler() = 0;
  int64_t max_iterations() { return max_iterations_; }

 protected:
  std::string name_;

 private:
  int64_t max_iterations_;
};

/**
 * @brief Fail upon exceeding the set number of iterations. Used for batches that must
 * reach a fixed point.
 */
class FailOnMax : public Strategy {
 public:
  FailOnMax(const std::string& name, int64_t max_iterations) : Strategy(name, max_iterations) {}
  Status MaxIterationsHandler() override {
    return error::DeadlineExceeded("Reached max iterations ($0) for rule batch '$1'",
                                   max_iterations(), name_);
  }
};

/**
 * @brief Run the rule batch once and silently accept that the max iterations are reached.
 */
class DoOnce : public Strategy {
 public:
  explicit DoOnce(const std::string& name) : Strategy(name, 1) {}
  Status MaxIterationsHandler() override { return Status::OK(); }
};

template <typename TRuleType>
class BaseRuleBatch {
 public:
  BaseRuleBatch(std::string name, std::unique_ptr<Strategy> strategy)
      : name_(name), strategy_(std::move(strategy)) {}

  const std::vector<std::unique_ptr<TRuleType>>& rules() const { return rules_; }
  int64_t max_iterations() const { return strategy_->max_iterations(); }
  Status MaxIterationsHandler() const { return strategy_->MaxIterationsHandler(); }

  template <typename R, typename... Args>
  R* AddRule(Args... args) {
    std::unique_ptr<R> rule = std::make_unique<R>(args...);
    R* raw_rule = rule.get();
    rules_.push_back(std::move(rule));
    return raw_rule;
  }
  const std::string name() const { return name_; }

 private:
  std::string name_;
  std::unique_ptr<Strategy> strategy_;
  std::vector<std::unique_ptr<TRuleType>> rules_;
};

using RuleBatch = BaseRuleBatch<Rule>;

/**
 * @brief Runs rule batches in order. Each batch is repeated until none of its rules changes
 * the plan, or until its strategy's iteration budget runs out.
 */
template <typename TPlan>
class RuleExecutor {
  using TRule = BaseRule<TPlan>;
  using TRuleBatch = BaseRuleBatch<BaseRule<TPlan>>;

 public:
  virtual ~RuleExecutor() = default;
  Status Execute(TPlan* plan) {
    for (const auto& rb : rule_batches) {
      bool can_continue = true;
      int64_t iteration = 0;
      while (can_continue) {
        iteration += 1;
        bool plan_is_updated = false;
        for (const auto& rule : rb->rules()) {
          TESSERA_ASSIGN_OR_RETURN(bool rule_updates_plan, rule->Execute(plan));
          plan_is_updated = plan_is_updated || rule_updates_plan;
        }
        if (iteration >= rb->max_iterations() && plan_is_updated) {
          TESSERA_RETURN_IF_ERROR(rb->MaxIterationsHandler());
          can_continue = false;
        }
        // Equality is by expression name, so an unchanged plan is a fixed point.
        if (!plan_is_updated) {
          can_continue = false;
        }
      }
      VLOG(1) << absl::Substitute("Rule batch '$0' finished after $1 iteration(s)", rb->name(),
                                  iteration);
    }
    return Status::OK();
  }
  template <typename S, typename... Args>
  TRuleBatch* CreateRuleBatch(std::string name, Args... args) {
    std::unique_ptr<TRuleBatch> rb(new TRuleBatch(name, std::make_unique<S>(name, args...)));
    TRuleBatch* out_ptr = rb.get();
    rule_batches.push_back(std::move(rb));
    return out_ptr;
  }

 private:
  std::vector<std::unique_ptr<TRuleBatch>> rule_batches;
};

}  // namespace planner
}  // namespace tessera
