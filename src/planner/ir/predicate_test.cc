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


#include "src/planner/ir/predicate.h"

#include <gtest/gtest.h>

#include "src/common/testing/testing.h"

namespace tessera {
namespace planner {

TEST(PredicateTest, flip) {
  EXPECT_EQ(CompareOp::kGt, Predicate::Flip(CompareOp::kLt));
  EXPECT_EQ(CompareOp::kLe, Predicate::Flip(CompareOp::kGe));
  EXPECT_EQ(CompareOp::kEq, Predicate::Flip(CompareOp::kEq));
  EXPECT_EQ(CompareOp::kNe, Predicate::Flip(CompareOp::kNe));
}

TEST(PredicateTest, evaluate) {
  Predicate gt("a", CompareOp::kGt, Scalar(5));
  EXPECT_TRUE(gt.Evaluate(Scalar(6)));
  EXPECT_TRUE(gt.Evaluate(Scalar(5.5)));
  EXPECT_FALSE(gt.Evaluate(Scalar(5)));
  EXPECT_FALSE(gt.Evaluate(Scalar()));

  Predicate ne("a", CompareOp::kNe, Scalar("x"));
  EXPECT_TRUE(ne.Evaluate(Scalar("y")));
  EXPECT_TRUE(ne.Evaluate(Scalar()));
  EXPECT_FALSE(ne.Evaluate(Scalar("x")));
}

TEST(PredicateTest, may_match_prunes_on_statistics) {
  Predicate eq("a", CompareOp::kEq, Scalar(5));
  EXPECT_TRUE(eq.MayMatch(Scalar(0), Scalar(9)));
  EXPECT_TRUE(eq.MayMatch(Scalar(5), Scalar(5)));
  EXPECT_FALSE(eq.MayMatch(Scalar(6), Scalar(9)));
  EXPECT_FALSE(eq.MayMatch(Scalar(0), Scalar(4)));

  Predicate lt("a", CompareOp::kLt, Scalar(5));
  EXPECT_FALSE(lt.MayMatch(Scalar(5), Scalar(9)));
  EXPECT_TRUE(lt.MayMatch(Scalar(4), Scalar(9)));

  Predicate ge("a", CompareOp::kGe, Scalar(5));
  EXPECT_FALSE(ge.MayMatch(Scalar(0), Scalar(4)));
  EXPECT_TRUE(ge.MayMatch(Scalar(0), Scalar(5)));

  Predicate ne("a", CompareOp::kNe, Scalar(5));
  EXPECT_FALSE(ne.MayMatch(Scalar(5), Scalar(5)));
  EXPECT_TRUE(ne.MayMatch(Scalar(5), Scalar(6)));
}

TEST(PredicateTest, incomparable_statistics_may_match) {
  Predicate eq("a", CompareOp::kEq, Scalar(5));
  EXPECT_TRUE(eq.MayMatch(Scalar(), Scalar()));
  EXPECT_TRUE(eq.MayMatch(Scalar("a"), Scalar("z")));
}

TEST(PredicateTest, string_round_trip_of_operator) {
  EXPECT_OK_AND_EQ(CompareOpFromString(">="), CompareOp::kGe);
  EXPECT_NOT_OK(CompareOpFromString("=~"));
  EXPECT_EQ("(a, ==, 5)", Predicate("a", CompareOp::kEq, Scalar(5)).ToString());
}

}  // namespace planner
}  // namespace tessera
