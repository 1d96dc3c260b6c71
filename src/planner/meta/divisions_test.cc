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


#include "src/planner/meta/divisions.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "src/common/testing/testing.h"

namespace tessera {
namespace planner {

using ::testing::ElementsAre;

std::vector<Scalar> Ints(const std::vector<int64_t>& values) {
  std::vector<Scalar> out;
  for (int64_t v : values) {
    out.emplace_back(v);
  }
  return out;
}

TEST(DivisionsTest, unknown) {
  Divisions d = Divisions::Unknown(3);
  EXPECT_FALSE(d.known());
  EXPECT_EQ(3, d.npartitions());
  EXPECT_EQ("(None, None, None, None)", d.DebugString());
}

TEST(DivisionsTest, known_validation) {
  EXPECT_OK(Divisions::Known(Ints({0, 5, 5, 9})));
  EXPECT_NOT_OK(Divisions::Known(Ints({0})));
  EXPECT_NOT_OK(Divisions::Known(Ints({3, 1})));
  EXPECT_NOT_OK(Divisions::Known({Scalar(0), Scalar()}));
  EXPECT_NOT_OK(Divisions::Known({Scalar(0), Scalar("a")}));
}

TEST(DivisionsTest, prefix_and_select) {
  ASSERT_OK_AND_ASSIGN(Divisions d, Divisions::Known(Ints({0, 10, 20, 30, 40})));
  EXPECT_EQ(Ints({0, 10}), d.Prefix(1).values());
  EXPECT_EQ(Ints({10, 30, 40}), d.Select({1, 3}).values());
  EXPECT_EQ(2, d.Select({1, 3}).npartitions());
  EXPECT_EQ(Divisions::Unknown(2), Divisions::Unknown(4).Select({0, 2}));
}

TEST(DivisionsTest, shift) {
  ASSERT_OK_AND_ASSIGN(Divisions d, Divisions::Known(Ints({0, 10})));
  EXPECT_OK_AND_EQ(d.Shift(Scalar(5)), Divisions::Known(Ints({5, 15})).ConsumeValueOrDie());
  EXPECT_OK_AND_EQ(Divisions::Unknown(2).Shift(Scalar(5)), Divisions::Unknown(2));
}

TEST(SortedDivisionLocationsTest, even_split) {
  DivisionLocations out = SortedDivisionLocations(Ints({0, 1, 2, 3, 4, 5, 6, 7, 8, 9}), 3);
  EXPECT_THAT(out.locations, ElementsAre(0, 4, 8, 10));
  EXPECT_EQ(Ints({0, 4, 8, 9}), out.divisions.values());
}

TEST(SortedDivisionLocationsTest, duplicates_never_span_partitions) {
  DivisionLocations out = SortedDivisionLocations(Ints({1, 1, 1, 1, 2, 2}), 3);
  EXPECT_THAT(out.locations, ElementsAre(0, 4, 6));
  EXPECT_EQ(Ints({1, 2, 2}), out.divisions.values());

  out = SortedDivisionLocations(Ints({1, 2, 2, 2, 3, 4}), 3);
  EXPECT_THAT(out.locations, ElementsAre(0, 1, 4, 6));
  EXPECT_TRUE(out.divisions.known());
}

TEST(SortedDivisionLocationsTest, more_partitions_than_rows) {
  DivisionLocations out = SortedDivisionLocations(Ints({5, 6}), 10);
  EXPECT_THAT(out.locations, ElementsAre(0, 1, 2));
  EXPECT_EQ(Ints({5, 6, 6}), out.divisions.values());
}

TEST(SortedDivisionLocationsTest, empty) {
  DivisionLocations out = SortedDivisionLocations({}, 4);
  EXPECT_THAT(out.locations, ElementsAre(0, 0));
  EXPECT_EQ(Divisions::Unknown(1), out.divisions);
}

}  // namespace planner
}  // namespace tessera
