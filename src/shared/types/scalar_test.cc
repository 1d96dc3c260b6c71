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


#include "src/shared/types/scalar.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include "src/common/testing/testing.h"

namespace tessera {
namespace types {

using ::tessera::testing::status::StatusIs;
using ::testing::HasSubstr;

TEST(ScalarTest, kinds) {
  EXPECT_TRUE(Scalar().is_null());
  EXPECT_EQ(DATA_TYPE_UNKNOWN, Scalar::Null().type());
  EXPECT_EQ(BOOLEAN, Scalar(true).type());
  EXPECT_EQ(INT64, Scalar(5).type());
  EXPECT_EQ(INT64, Scalar(int64_t{5}).type());
  EXPECT_EQ(FLOAT64, Scalar(2.5).type());
  EXPECT_EQ(STRING, Scalar("abc").type());
  EXPECT_TRUE(Scalar(1).is_numeric());
  EXPECT_FALSE(Scalar(true).is_numeric());
}

TEST(ScalarTest, compare_across_numeric_kinds) {
  EXPECT_EQ(0, Scalar(2).Compare(Scalar(2.0)));
  EXPECT_LT(Scalar(1).Compare(Scalar(1.5)).value(), 0);
  EXPECT_GT(Scalar(3.5).Compare(Scalar(3)).value(), 0);
  EXPECT_LT(Scalar("a").Compare(Scalar("b")).value(), 0);
}

TEST(ScalarTest, incomparable) {
  EXPECT_FALSE(Scalar(1).Compare(Scalar("1")).has_value());
  EXPECT_FALSE(Scalar().Compare(Scalar()).has_value());
  EXPECT_FALSE(Scalar(true).Compare(Scalar(1)).has_value());
}

TEST(ScalarTest, equality_is_strict) {
  EXPECT_EQ(Scalar(1), Scalar(1));
  EXPECT_NE(Scalar(1), Scalar(1.0));
  EXPECT_NE(Scalar(1), Scalar(true));
  EXPECT_EQ(Scalar(), Scalar::Null());
}

TEST(ScalarTest, hash_depends_on_kind) {
  EXPECT_EQ(Scalar("x").Hash(), Scalar(std::string("x")).Hash());
  EXPECT_NE(Scalar(1).Hash(), Scalar(1.0).Hash());
  EXPECT_NE(Scalar(0).Hash(), Scalar(false).Hash());
  EXPECT_NE(Scalar(1).Hash(), Scalar(2).Hash());
}

TEST(ScalarTest, to_string) {
  EXPECT_EQ("None", Scalar().ToString());
  EXPECT_EQ("True", Scalar(true).ToString());
  EXPECT_EQ("42", Scalar(42).ToString());
  EXPECT_EQ("'a'", Scalar("a").ToString());
}

TEST(ScalarTest, arithmetic) {
  EXPECT_OK_AND_EQ(Scalar::Add(Scalar(2), Scalar(3)), Scalar(5));
  EXPECT_OK_AND_EQ(Scalar::Multiply(Scalar(2), Scalar(3)), Scalar(6));
  EXPECT_OK_AND_EQ(Scalar::Multiply(Scalar(2), Scalar(1.5)), Scalar(3.0));
  EXPECT_THAT(Scalar::Add(Scalar("a"), Scalar(1)).status(),
              StatusIs(statuspb::INVALID_ARGUMENT));
}

TEST(ScalarTest, ordered_before_is_total) {
  std::vector<Scalar> values = {Scalar("b"), Scalar::Null(), Scalar(2.5), Scalar(std::nan("")),
                                Scalar(1),   Scalar("a"),    Scalar(true), Scalar::Null()};
  std::sort(values.begin(), values.end(),
            [](const Scalar& a, const Scalar& b) { return a.OrderedBefore(b); });
  EXPECT_EQ(Scalar(true), values[0]);
  EXPECT_EQ(Scalar(1), values[1]);
  EXPECT_EQ(Scalar(2.5), values[2]);
  EXPECT_TRUE(std::isnan(values[3].float_value()));
  EXPECT_EQ(Scalar("a"), values[4]);
  EXPECT_EQ(Scalar("b"), values[5]);
  EXPECT_TRUE(values[6].is_null());
  EXPECT_TRUE(values[7].is_null());

  EXPECT_FALSE(Scalar::Null().OrderedBefore(Scalar::Null()));
  EXPECT_TRUE(Scalar(7).OrderedBefore(Scalar::Null()));
  EXPECT_FALSE(Scalar::Null().OrderedBefore(Scalar(7)));
}

TEST(ScalarTest, integer_overflow) {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  EXPECT_THAT(Scalar::Add(Scalar(kMax), Scalar(1)).status(),
              StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("overflow")));
  EXPECT_THAT(Scalar::Multiply(Scalar(int64_t{4000000000}), Scalar(int64_t{4000000000})).status(),
              StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("overflow")));
  EXPECT_OK_AND_EQ(Scalar::Add(Scalar(kMax), Scalar(-1)), Scalar(kMax - 1));
  // Floats do not overflow into an error.
  EXPECT_OK(Scalar::Multiply(Scalar(1e308), Scalar(10.0)));
}

}  // namespace types
}  // namespace tessera
