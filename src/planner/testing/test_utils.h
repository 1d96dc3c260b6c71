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

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "src/common/testing/testing.h"
#include "src/planner/io/io_expr.h"
#include "src/planner/ir/builders.h"
#include "src/planner/rules/optimizer.h"
#include "src/planner/testing/fake_sources.h"
#include "src/planner/testing/in_memory_backend.h"

namespace tessera {
namespace planner {
namespace testutils {

/**
 * @brief Base fixture for tests that build expressions over real sources.
 *
 * "events" is an 8 row table indexed by id 0..7 with columns a (int), b (float) and s
 * (string). "logs" is a dataset of three fragments holding ids 0-2, 3-5 and 6-7 plus an
 * empty fragment. Both are registered with backend_.
 */
class ExprTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    events_meta_ = Meta::MakeFrame(
        {{"a", types::INT64}, {"b", types::FLOAT64}, {"s", types::STRING}}, {"id", types::INT64});
    events_ = std::make_shared<InMemoryTable>(
        "events", events_meta_,
        MakeFrame({"a", "b", "s"},
                  {Ints({1, 2, 3, 4, 5, 6, 7, 8}),
                   {Scalar(0.5), Scalar(1.0), Scalar(1.5), Scalar(2.0), Scalar(2.5), Scalar(3.0),
                    Scalar(3.5), Scalar(4.0)},
                   Strings({"x", "y", "x", "y", "x", "y", "x", "y"})}));
    table_ = std::make_shared<TableSource>(events_);

    logs_ = std::make_shared<FakeStorage>(
        "logs", std::vector<ColumnSchema>{
                    {"id", types::INT64}, {"level", types::INT64}, {"msg", types::STRING}});
    logs_->AddFragment("part-0", MakeFrame({"id", "level", "msg"},
                                           {Ints({0, 1, 2}), Ints({1, 2, 3}),
                                            Strings({"boot", "ok", "warn"})}));
    logs_->AddFragment("part-1", MakeFrame({"id", "level", "msg"},
                                           {Ints({3, 4, 5}), Ints({1, 1, 5}),
                                            Strings({"ok", "ok", "fail"})}));
    logs_->AddFragment("part-2", MakeFrame({"id", "level", "msg"},
                                           {Ints({6, 7}), Ints({2, 4}), Strings({"ok", "warn"})}));
    logs_->AddFragment("part-3", MakeFrame({"id", "level", "msg"}, {{}, {}, {}}));
    dataset_ = DatasetSource::Open(logs_).ConsumeValueOrDie();

    backend_.RegisterTable(events_);
    backend_.RegisterDataset(logs_);
    SetUpImpl();
  }

  virtual void SetUpImpl() {}

  ExprPtr MakeTable(int64_t npartitions = 2, bool sort = true) {
    return build::FromTable(table_, npartitions, sort).ConsumeValueOrDie();
  }

  ExprPtr MakeDataset(const PredicateList& filters = {},
                      const std::optional<std::string>& index = std::string("id")) {
    return build::ReadDataset(dataset_, filters, index).ConsumeValueOrDie();
  }

  ExprPtr Col(const ExprPtr& frame, const std::string& column) {
    return build::ProjectColumn(frame, column).ConsumeValueOrDie();
  }

  ExprPtr Cols(const ExprPtr& frame, const StringList& columns) {
    return build::Project(frame, columns).ConsumeValueOrDie();
  }

  // Runs the simplify rules to a fixed point.
  ExprPtr Simplify(const ExprPtr& expr) {
    auto simplifier = Simplifier::Create(&options_).ConsumeValueOrDie();
    ExprPlan plan{expr};
    Status s = simplifier->Execute(&plan);
    EXPECT_OK(s);
    return plan.root;
  }

  static Divisions Known(std::vector<int64_t> values) {
    std::vector<Scalar> scalars;
    for (int64_t v : values) {
      scalars.emplace_back(v);
    }
    return Divisions::Known(std::move(scalars)).ConsumeValueOrDie();
  }

  Meta events_meta_;
  std::shared_ptr<InMemoryTable> events_;
  std::shared_ptr<const TableSource> table_;
  std::shared_ptr<FakeStorage> logs_;
  std::shared_ptr<const DatasetSource> dataset_;
  InMemoryBackend backend_;
  PlannerOptions options_;
};

}  // namespace testutils
}  // namespace planner
}  // namespace tessera
