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


#include "src/planner/graph/task_utils.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "src/common/testing/testing.h"
#include "src/planner/ir/predicate.h"

namespace tessera {
namespace planner {

using ::tessera::testing::proto::EqualsProto;
using ::tessera::testing::status::StatusIs;
using types::Scalar;

TEST(TaskUtilsTest, key_string) {
  EXPECT_EQ("(head-0123, 3)", KeyString(MakeKey("head-0123", 3)));
}

TEST(TaskUtilsTest, scalar_literals) {
  taskgraphpb::Literal literal;
  ScalarToLiteral(Scalar(3), &literal);
  EXPECT_THAT(literal, EqualsProto("int64_value: 3"));
  ScalarToLiteral(Scalar(true), &literal);
  EXPECT_THAT(literal, EqualsProto("bool_value: true"));
  ScalarToLiteral(Scalar("x"), &literal);
  EXPECT_THAT(literal, EqualsProto("string_value: 'x'"));
  ScalarToLiteral(Scalar::Null(), &literal);
  EXPECT_THAT(literal, EqualsProto("null_value: true"));
}

TEST(TaskUtilsTest, operand_literals) {
  taskgraphpb::Literal strings;
  ASSERT_OK(OperandToLiteral(Operand(StringList{"a", "b"}), &strings));
  EXPECT_THAT(strings, EqualsProto(R"proto(
    list_value {
      values { string_value: "a" }
      values { string_value: "b" }
    })proto"));

  taskgraphpb::Literal filters;
  ASSERT_OK(OperandToLiteral(
      Operand(PredicateList{Predicate("level", CompareOp::kGe, Scalar(2))}), &filters));
  EXPECT_THAT(filters, EqualsProto(R"proto(
    list_value {
      values {
        list_value {
          values { string_value: "level" }
          values { string_value: ">=" }
          values { int64_value: 2 }
        }
      }
    })proto"));

  taskgraphpb::Literal none;
  ASSERT_OK(OperandToLiteral(Operand::None(), &none));
  EXPECT_THAT(none, EqualsProto("null_value: true"));

  taskgraphpb::Literal exprs;
  EXPECT_THAT(OperandToLiteral(Operand(ExprList{}), &exprs), StatusIs(statuspb::INTERNAL));
}

TEST(TaskUtilsTest, literal_to_scalar) {
  taskgraphpb::Literal literal;
  literal.set_float64_value(2.5);
  ASSERT_OK_AND_ASSIGN(Scalar value, LiteralToScalar(literal));
  EXPECT_TRUE(value.is_float());
  EXPECT_DOUBLE_EQ(2.5, value.AsDouble());

  literal.set_null_value(true);
  ASSERT_OK_AND_ASSIGN(value, LiteralToScalar(literal));
  EXPECT_TRUE(value.is_null());

  StringsToLiteral({"a"}, &literal);
  EXPECT_THAT(LiteralToScalar(literal).status(), StatusIs(statuspb::INVALID_ARGUMENT));
}

TEST(TaskUtilsTest, task_arguments) {
  taskgraphpb::Task task;
  *task.mutable_key() = MakeKey("head-1", 0);
  task.set_op("head");
  AddRefArg("read-2", 1, &task);
  AddScalarArg(Scalar(5), &task);
  ASSERT_OK(AddOperandArg(Operand(Int64List{1, 2}), &task));
  SetKwarg("sorted", Scalar(false), &task);
  EXPECT_THAT(task, EqualsProto(R"proto(
    key { name: "head-1" index: 0 }
    op: "head"
    args { ref { name: "read-2" index: 1 } }
    args { literal { int64_value: 5 } }
    args {
      literal {
        list_value {
          values { int64_value: 1 }
          values { int64_value: 2 }
        }
      }
    }
    kwargs { key: "sorted" value { bool_value: false } })proto"));
}

}  // namespace planner
}  // namespace tessera
