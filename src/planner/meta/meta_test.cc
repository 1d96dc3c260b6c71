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


#include "src/planner/meta/meta.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "src/common/testing/testing.h"

namespace tessera {
namespace planner {

using ::tessera::testing::status::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class MetaTest : public ::testing::Test {
 protected:
  void SetUp() override {
    frame_ = Meta::MakeFrame({{"a", types::INT64}, {"b", types::FLOAT64}, {"s", types::STRING}},
                             {"idx", types::INT64});
  }
  Meta frame_;
};

TEST_F(MetaTest, select_columns) {
  ASSERT_OK_AND_ASSIGN(Meta selected, frame_.Select({"s", "a"}));
  EXPECT_TRUE(selected.is_frame());
  EXPECT_THAT(selected.column_names(), ElementsAre("s", "a"));
  EXPECT_EQ("idx", selected.index().name);
  EXPECT_EQ(2, selected.ndim());
}

TEST_F(MetaTest, select_missing_column) {
  EXPECT_THAT(frame_.Select({"a", "zzz"}).status(),
              StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("zzz")));
  EXPECT_THAT(frame_.Select({"a", "a"}).status(), StatusIs(statuspb::INVALID_ARGUMENT));
}

TEST_F(MetaTest, select_series) {
  ASSERT_OK_AND_ASSIGN(Meta series, frame_.SelectSeries("b"));
  EXPECT_TRUE(series.is_series());
  EXPECT_EQ(types::FLOAT64, series.dtype());
  EXPECT_EQ("b", series.series_name());
  EXPECT_EQ(1, series.ndim());
  EXPECT_NOT_OK(series.SelectSeries("b"));
}

TEST_F(MetaTest, with_column_replaces_or_appends) {
  Meta replaced = frame_.WithColumn({"a", types::FLOAT64});
  EXPECT_THAT(replaced.column_names(), ElementsAre("a", "b", "s"));
  EXPECT_EQ(types::FLOAT64, replaced.GetColumn("a").ConsumeValueOrDie().dtype);
  Meta appended = frame_.WithColumn({"c", types::BOOLEAN});
  EXPECT_THAT(appended.column_names(), ElementsAre("a", "b", "s", "c"));
}

TEST_F(MetaTest, with_dtypes) {
  ASSERT_OK_AND_ASSIGN(Meta cast, frame_.WithDTypes({{"a", types::FLOAT64}}));
  EXPECT_EQ(types::FLOAT64, cast.columns()[0].dtype);
  EXPECT_NOT_OK(frame_.WithDTypes({{"nope", types::FLOAT64}}));
}

TEST_F(MetaTest, categories) {
  Meta cats = Meta::MakeFrame({{"c", types::CATEGORICAL, std::vector<std::string>{"x", "y"}}});
  EXPECT_FALSE(cats.HasUnknownCategories());
  Meta cleared = cats.ClearCategories();
  EXPECT_TRUE(cleared.HasUnknownCategories());
  EXPECT_NE(cats, cleared);
}

TEST_F(MetaTest, binary_op_numeric_promotion) {
  ASSERT_OK_AND_ASSIGN(Meta a, frame_.SelectSeries("a"));
  ASSERT_OK_AND_ASSIGN(Meta b, frame_.SelectSeries("b"));

  ASSERT_OK_AND_ASSIGN(Meta sum, BinaryOpMeta(BinaryOp::kAdd, a, Meta::MakeScalar(types::INT64)));
  EXPECT_EQ(types::INT64, sum.dtype());
  EXPECT_EQ("a", sum.series_name());

  ASSERT_OK_AND_ASSIGN(Meta mixed, BinaryOpMeta(BinaryOp::kMul, a, b));
  EXPECT_EQ(types::FLOAT64, mixed.dtype());
  EXPECT_EQ("", mixed.series_name());

  ASSERT_OK_AND_ASSIGN(Meta div, BinaryOpMeta(BinaryOp::kDiv, a, a));
  EXPECT_EQ(types::FLOAT64, div.dtype());
  EXPECT_EQ("a", div.series_name());

  ASSERT_OK_AND_ASSIGN(Meta cmp, BinaryOpMeta(BinaryOp::kLt, a, Meta::MakeScalar(types::FLOAT64)));
  EXPECT_EQ(types::BOOLEAN, cmp.dtype());
}

TEST_F(MetaTest, binary_op_strings) {
  ASSERT_OK_AND_ASSIGN(Meta s, frame_.SelectSeries("s"));
  EXPECT_OK_AND_EQ(BinaryOpMeta(BinaryOp::kAdd, s, s),
                   Meta::MakeSeries({"s", types::STRING}, {"idx", types::INT64}));
  EXPECT_THAT(BinaryOpMeta(BinaryOp::kSub, s, s).status(), StatusIs(statuspb::INVALID_ARGUMENT));
  EXPECT_THAT(BinaryOpMeta(BinaryOp::kLt, s, Meta::MakeScalar(types::INT64)).status(),
              StatusIs(statuspb::INVALID_ARGUMENT));
}

TEST_F(MetaTest, binary_op_time) {
  Meta t = Meta::MakeSeries({"t", types::TIME64NS});
  EXPECT_OK_AND_EQ(BinaryOpMeta(BinaryOp::kAdd, t, Meta::MakeScalar(types::INT64)),
                   Meta::MakeSeries({"t", types::TIME64NS}));
  EXPECT_OK_AND_EQ(BinaryOpMeta(BinaryOp::kSub, t, t), Meta::MakeSeries({"t", types::INT64}));
}

TEST_F(MetaTest, binary_op_categorical) {
  Meta c = Meta::MakeSeries({"c", types::CATEGORICAL});
  EXPECT_NOT_OK(BinaryOpMeta(BinaryOp::kAdd, c, Meta::MakeScalar(types::INT64)));
  EXPECT_OK(BinaryOpMeta(BinaryOp::kEq, c, Meta::MakeScalar(types::STRING)));
}

TEST_F(MetaTest, binary_op_frames) {
  Meta other = Meta::MakeFrame({{"b", types::INT64}, {"z", types::INT64}});
  ASSERT_OK_AND_ASSIGN(Meta numeric, frame_.Select({"a", "b"}));
  ASSERT_OK_AND_ASSIGN(Meta out, BinaryOpMeta(BinaryOp::kAdd, numeric, other));
  EXPECT_THAT(out.column_names(), ElementsAre("a", "b", "z"));
  EXPECT_EQ(types::FLOAT64, out.columns()[0].dtype);

  EXPECT_THAT(BinaryOpMeta(BinaryOp::kEq, numeric, other).status(),
              StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("identically-labeled")));

  ASSERT_OK_AND_ASSIGN(Meta broadcast,
                       BinaryOpMeta(BinaryOp::kGt, numeric, Meta::MakeScalar(types::INT64)));
  EXPECT_TRUE(broadcast.is_frame());
  EXPECT_EQ(types::BOOLEAN, broadcast.columns()[1].dtype);
}

}  // namespace planner
}  // namespace tessera
