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


#include "src/planner/exec/local_executor.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "src/common/testing/testing.h"
#include "src/planner/exec/backend_mock.h"
#include "src/planner/graph/task_utils.h"
#include "src/planner/testing/in_memory_backend.h"

namespace tessera {
namespace planner {

using ::tessera::testing::status::StatusIs;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using testutils::AsScalar;
using testutils::MakeDatum;

class LocalExecutorTest : public ::testing::Test {
 protected:
  taskgraphpb::Task* AddTask(const std::string& layer_name, int64_t index, const std::string& op) {
    taskgraphpb::Layer* layer = nullptr;
    for (auto& l : *graph_.mutable_layers()) {
      if (l.name() == layer_name) {
        layer = &l;
      }
    }
    if (layer == nullptr) {
      layer = graph_.add_layers();
      layer->set_name(layer_name);
    }
    taskgraphpb::Task* task = layer->add_tasks();
    *task->mutable_key() = MakeKey(layer_name, index);
    task->set_op(op);
    return task;
  }

  StatusOr<std::vector<StatusOr<DatumPtr>>> Run(const std::vector<taskgraphpb::TaskKey>& keys) {
    return executor_.Run(graph_, keys);
  }

  static int64_t IntValue(const StatusOr<DatumPtr>& datum) {
    EXPECT_OK(datum);
    return AsScalar(datum.ValueOrDie()).ConsumeValueOrDie().int_value();
  }

  taskgraphpb::TaskGraph graph_;
  testutils::InMemoryBackend backend_;
  LocalExecutor executor_{&backend_};
};

TEST_F(LocalExecutorTest, dependencies_run_first) {
  auto* sum = AddTask("sum", 0, "add");
  AddScalarArg(Scalar(1), sum);
  AddScalarArg(Scalar(2), sum);
  auto* twice = AddTask("twice", 0, "mul");
  AddRefArg("sum", 0, twice);
  AddScalarArg(Scalar(2), twice);

  ASSERT_OK_AND_ASSIGN(auto results, Run({MakeKey("twice", 0), MakeKey("sum", 0)}));
  ASSERT_EQ(2, results.size());
  EXPECT_EQ(6, IntValue(results[0]));
  EXPECT_EQ(3, IntValue(results[1]));
  EXPECT_EQ(2, executor_.tasks_run());
}

TEST_F(LocalExecutorTest, only_needed_tasks_run) {
  auto* one = AddTask("one", 0, "add");
  AddScalarArg(Scalar(1), one);
  AddScalarArg(Scalar(0), one);
  auto* other = AddTask("other", 0, "sub");
  AddScalarArg(Scalar(1), other);
  AddScalarArg(Scalar(0), other);

  ASSERT_OK_AND_ASSIGN(auto results, Run({MakeKey("one", 0)}));
  EXPECT_EQ(1, IntValue(results[0]));
  EXPECT_EQ(1, executor_.tasks_run());
  EXPECT_EQ(0, backend_.calls("sub"));
}

TEST_F(LocalExecutorTest, alias_returns_its_argument) {
  auto* sum = AddTask("sum", 0, "add");
  AddScalarArg(Scalar(4), sum);
  AddScalarArg(Scalar(5), sum);
  AddRefArg("sum", 0, AddTask("alias", 0, "alias"));

  ASSERT_OK_AND_ASSIGN(auto results, Run({MakeKey("alias", 0)}));
  EXPECT_EQ(9, IntValue(results[0]));
  EXPECT_EQ(1, backend_.calls("add"));
}

TEST_F(LocalExecutorTest, fused_subtasks_share_a_scope) {
  auto* fused = AddTask("fused", 0, "fused");
  auto* first = fused->add_subtasks();
  *first->mutable_key() = MakeKey("inner", 0);
  first->set_op("add");
  AddScalarArg(Scalar(1), first);
  AddScalarArg(Scalar(2), first);
  auto* second = fused->add_subtasks();
  *second->mutable_key() = MakeKey("outer", 0);
  second->set_op("mul");
  AddRefArg("inner", 0, second);
  AddScalarArg(Scalar(10), second);

  ASSERT_OK_AND_ASSIGN(auto results, Run({MakeKey("fused", 0)}));
  EXPECT_EQ(30, IntValue(results[0]));
  EXPECT_EQ(3, executor_.tasks_run());
}

TEST_F(LocalExecutorTest, inline_tasks_are_evaluated_in_place) {
  auto* task = AddTask("outer", 0, "mul");
  auto* inner = task->add_args()->mutable_inline_task();
  inner->set_op("sub");
  AddScalarArg(Scalar(7), inner);
  AddScalarArg(Scalar(4), inner);
  AddScalarArg(Scalar(3), task);

  ASSERT_OK_AND_ASSIGN(auto results, Run({MakeKey("outer", 0)}));
  EXPECT_EQ(9, IntValue(results[0]));
}

TEST_F(LocalExecutorTest, failures_reach_dependents) {
  AddScalarArg(Scalar(1), AddTask("bad", 0, "no_such_op"));
  auto* user = AddTask("user", 0, "add");
  AddRefArg("bad", 0, user);
  AddScalarArg(Scalar(1), user);

  ASSERT_OK_AND_ASSIGN(auto results, Run({MakeKey("bad", 0), MakeKey("user", 0)}));
  EXPECT_THAT(results[0].status(), StatusIs(statuspb::UNIMPLEMENTED));
  EXPECT_THAT(results[1].status(),
              StatusIs(statuspb::FAILED_PRECONDITION, HasSubstr("(bad, 0)")));
  EXPECT_EQ(0, backend_.calls("add"));
}

TEST_F(LocalExecutorTest, invalid_graphs) {
  AddRefArg("b", 0, AddTask("a", 0, "alias"));
  AddRefArg("a", 0, AddTask("b", 0, "alias"));
  AddRefArg("nowhere", 0, AddTask("dangling", 0, "alias"));

  EXPECT_THAT(Run({MakeKey("a", 0)}).status(),
              StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("Cycle")));
  EXPECT_THAT(Run({MakeKey("dangling", 0)}).status(),
              StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("unknown key (nowhere, 0)")));
  EXPECT_THAT(Run({MakeKey("missing", 3)}).status(),
              StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("Unknown key")));

  AddTask("a", 0, "alias");
  EXPECT_THAT(Run({MakeKey("b", 0)}).status(),
              StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("appears twice")));
}

TEST_F(LocalExecutorTest, alias_needs_one_argument) {
  AddTask("empty", 0, "alias");
  ASSERT_OK_AND_ASSIGN(auto results, Run({MakeKey("empty", 0)}));
  EXPECT_THAT(results[0].status(), StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("alias")));
}

TEST(LocalExecutorBackendTest, literals_and_kwargs_reach_the_backend) {
  MockBackend backend;
  DatumPtr five = MakeDatum(Scalar(5));
  DatumPtr out = MakeDatum(Scalar(50));
  EXPECT_CALL(backend, FromLiteral(_)).WillOnce(Return(five));
  EXPECT_CALL(backend, Call("scale", ::testing::ElementsAre(five), _))
      .WillOnce([&](const std::string&, const std::vector<DatumPtr>&, const TaskKwargs& kwargs) {
        EXPECT_EQ(10, kwargs.at("factor").int64_value());
        return StatusOr<DatumPtr>(out);
      });

  taskgraphpb::TaskGraph graph;
  auto* layer = graph.add_layers();
  layer->set_name("scale");
  auto* task = layer->add_tasks();
  *task->mutable_key() = MakeKey("scale", 0);
  task->set_op("scale");
  AddScalarArg(Scalar(5), task);
  SetKwarg("factor", Scalar(10), task);

  LocalExecutor executor(&backend);
  ASSERT_OK_AND_ASSIGN(auto results, executor.Run(graph, {MakeKey("scale", 0)}));
  ASSERT_OK(results[0]);
  EXPECT_EQ(out, results[0].ValueOrDie());
}

}  // namespace planner
}  // namespace tessera
