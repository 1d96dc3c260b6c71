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


#include "src/planner/io/io_expr.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "src/planner/graph/task_utils.h"
#include "src/planner/ir/partitioning.h"
#include "src/planner/ir/pattern_match.h"
#include "src/planner/ir/reduction.h"
#include "src/planner/testing/test_utils.h"

namespace tessera {
namespace planner {

using ::tessera::testing::status::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class IOExprTest : public testutils::ExprTestBase {
 protected:
  static const ReadDataset& AsRead(const ExprPtr& expr) {
    EXPECT_TRUE(Match(expr, match::ReadDataset()));
    return static_cast<const ReadDataset&>(*expr);
  }
};

TEST_F(IOExprTest, table_read_tasks) {
  ExprPtr table = MakeTable(2);
  taskgraphpb::Layer layer;
  ASSERT_OK(table->BuildLayer(&layer));
  ASSERT_EQ(2, layer.tasks_size());
  const auto& second = layer.tasks(1);
  EXPECT_EQ("read_table", second.op());
  EXPECT_EQ(table->name(), second.key().name());
  EXPECT_EQ(1, second.key().index());
  EXPECT_EQ("events", second.kwargs().at("token").string_value());
  EXPECT_EQ(4, second.kwargs().at("start").int64_value());
  EXPECT_EQ(8, second.kwargs().at("stop").int64_value());
  EXPECT_TRUE(second.kwargs().at("sorted").bool_value());
  EXPECT_FALSE(second.kwargs().at("series").bool_value());
  EXPECT_EQ(0, second.kwargs().count("columns"));
}

TEST_F(IOExprTest, unsorted_table_has_unknown_divisions) {
  ExprPtr table = MakeTable(3, /*sort*/ false);
  EXPECT_FALSE(table->known_divisions());
  EXPECT_EQ(3, table->npartitions());
}

TEST_F(IOExprTest, null_index_values_sort_last) {
  testutils::TestFrame rows = testutils::MakeFrame({"v"}, {testutils::Ints({0, 1, 2, 3, 4, 5})});
  rows.index = {Scalar(3), Scalar::Null(), Scalar(1), Scalar::Null(), Scalar(2), Scalar(0)};
  auto gaps = std::make_shared<testutils::InMemoryTable>(
      "gaps", Meta::MakeFrame({{"v", types::INT64}}, {"id", types::INT64}), rows);
  TableSource source(gaps);

  auto layout = source.Layout(2, /*sort*/ true);
  EXPECT_THAT(layout->locations, ElementsAre(0, 3, 6));
  // A null cannot bound a partition.
  EXPECT_FALSE(layout->divisions.known());
  EXPECT_EQ(2, layout->divisions.npartitions());
}

TEST_F(IOExprTest, table_layouts_are_cached) {
  ExprPtr table = MakeTable(2);
  EXPECT_EQ(1, table_->layouts_computed());
  EXPECT_EQ(1, events_->index_reads());

  // Rewrites of the same read reuse the layout.
  ExprPtr narrowed = Simplify(Col(table, "a"));
  ASSERT_TRUE(Match(narrowed, match::FromTable()));
  MakeTable(2);
  EXPECT_EQ(1, table_->layouts_computed());

  MakeTable(4);
  EXPECT_EQ(2, table_->layouts_computed());
  EXPECT_EQ(2, events_->index_reads());
}

TEST_F(IOExprTest, invalid_table_reads) {
  EXPECT_THAT(build::FromTable(table_, 0).status(),
              StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("npartitions")));
  EXPECT_THAT(MakeTable(2)->SubstituteParameters({{"_partitions", Int64List{2}}}).status(),
              StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("_partitions")));
  EXPECT_NOT_OK(MakeTable(2)->SubstituteParameters({{"_partitions", Int64List{1, 0}}}));
  EXPECT_NOT_OK(MakeTable(2)->SubstituteParameters({{"columns", StringList{"zzz"}}}));
}

TEST_F(IOExprTest, dataset_divisions_from_statistics) {
  ExprPtr logs = MakeDataset();
  // The empty fragment is dropped.
  EXPECT_EQ(3, logs->npartitions());
  EXPECT_EQ(Known({0, 3, 6, 7}), logs->divisions());
  EXPECT_THAT(logs->columns(), ElementsAre("level", "msg"));
  EXPECT_EQ("id", logs->meta().index().name);
  EXPECT_EQ(1, dataset_->plans_computed());
  EXPECT_EQ(1, logs_->listings());
}

TEST_F(IOExprTest, dataset_without_index) {
  ExprPtr logs = MakeDataset({}, std::nullopt);
  EXPECT_FALSE(logs->known_divisions());
  EXPECT_EQ(3, logs->npartitions());
  EXPECT_THAT(logs->columns(), ElementsAre("id", "level", "msg"));

  ExprPtr no_divisions = build::ReadDataset(dataset_, {}, std::string("id"), false)
                             .ConsumeValueOrDie();
  EXPECT_FALSE(no_divisions->known_divisions());
  EXPECT_EQ("id", no_divisions->meta().index().name);
}

TEST_F(IOExprTest, invalid_dataset_reads) {
  EXPECT_THAT(build::ReadDataset(dataset_, {}, std::string("zzz")).status(),
              StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("'zzz'")));
  PredicateList bad = {Predicate("zzz", CompareOp::kEq, Scalar(1))};
  EXPECT_THAT(build::ReadDataset(dataset_, bad).status(),
              StatusIs(statuspb::INVALID_ARGUMENT, HasSubstr("Filter column 'zzz'")));
  EXPECT_NOT_OK(Expr::Create<ReadDataset>({table_}));
}

TEST_F(IOExprTest, dataset_plans_are_cached) {
  ExprPtr logs = MakeDataset();
  ExprPtr msg = Simplify(Col(logs, "msg"));
  ASSERT_TRUE(Match(msg, match::ReadDataset()));
  EXPECT_THAT(msg->operand("columns").Get<StringList>(), ElementsAre("msg"));
  EXPECT_TRUE(AsRead(msg).reads_series());
  MakeDataset();
  EXPECT_EQ(1, dataset_->plans_computed());
  EXPECT_EQ(1, logs_->listings());

  MakeDataset({}, std::nullopt);
  EXPECT_EQ(2, dataset_->plans_computed());
  EXPECT_EQ(2, logs_->listings());
}

TEST_F(IOExprTest, filters_prune_fragments) {
  ExprPtr late = MakeDataset({Predicate("id", CompareOp::kGe, Scalar(3))});
  EXPECT_EQ(Known({3, 6, 7}), late->divisions());

  ExprPtr loud = MakeDataset({Predicate("level", CompareOp::kGt, Scalar(4))});
  ASSERT_EQ(1, loud->npartitions());
  EXPECT_EQ(Known({3, 5}), loud->divisions());
  EXPECT_EQ("part-1", AsRead(loud).plan().fragments[0].path);
}

TEST_F(IOExprTest, pruning_everything_leaves_one_empty_partition) {
  ExprPtr none = MakeDataset({Predicate("id", CompareOp::kGt, Scalar(100))});
  EXPECT_EQ(1, none->npartitions());
  EXPECT_FALSE(none->known_divisions());
  EXPECT_THAT(none->columns(), ElementsAre("level", "msg"));

  taskgraphpb::Layer layer;
  ASSERT_OK(none->BuildLayer(&layer));
  ASSERT_EQ(1, layer.tasks_size());
  EXPECT_EQ("empty_partition", layer.tasks(0).op());
}

TEST_F(IOExprTest, dataset_read_tasks) {
  ExprPtr loud = MakeDataset({Predicate("level", CompareOp::kGt, Scalar(4))});
  ExprPtr msg = Simplify(Col(loud, "msg"));
  taskgraphpb::Layer layer;
  ASSERT_OK(msg->BuildLayer(&layer));
  ASSERT_EQ(1, layer.tasks_size());
  const auto& task = layer.tasks(0);
  EXPECT_EQ("read_fragment", task.op());
  EXPECT_EQ("logs", task.kwargs().at("token").string_value());
  EXPECT_EQ("part-1", task.kwargs().at("path").string_value());
  EXPECT_EQ("id", task.kwargs().at("index").string_value());
  EXPECT_TRUE(task.kwargs().at("series").bool_value());
  EXPECT_EQ(1, task.kwargs().at("columns").list_value().values_size());
  const auto& filters = task.kwargs().at("filters").list_value();
  ASSERT_EQ(1, filters.values_size());
  EXPECT_EQ(3, filters.values(0).list_value().values_size());
}

TEST_F(IOExprTest, filter_pushed_into_read) {
  ExprPtr logs = MakeDataset();
  ASSERT_OK_AND_ASSIGN(ExprPtr loud, build::Gt(Col(logs, "level"), 4));
  ASSERT_OK_AND_ASSIGN(ExprPtr filtered, build::Where(logs, loud));
  ExprPtr out = Simplify(filtered);
  ASSERT_TRUE(Match(out, match::ReadDataset()));
  EXPECT_THAT(AsRead(out).filters(),
              ElementsAre(Predicate("level", CompareOp::kGt, Scalar(4))));
  EXPECT_EQ(1, out->npartitions());
}

TEST_F(IOExprTest, flipped_filter_pushed_into_read) {
  ExprPtr logs = MakeDataset();
  ASSERT_OK_AND_ASSIGN(ExprPtr loud, build::Lt(4, Col(logs, "level")));
  ASSERT_OK_AND_ASSIGN(ExprPtr filtered, build::Where(logs, loud));
  ExprPtr out = Simplify(filtered);
  ASSERT_TRUE(Match(out, match::ReadDataset()));
  EXPECT_THAT(AsRead(out).filters(),
              ElementsAre(Predicate("level", CompareOp::kGt, Scalar(4))));
}

TEST_F(IOExprTest, filter_of_other_source_stays) {
  ExprPtr logs = MakeDataset();
  ExprPtr other = MakeDataset({}, std::nullopt);
  ASSERT_OK_AND_ASSIGN(ExprPtr loud, build::Gt(Col(other, "level"), 4));
  ASSERT_OK_AND_ASSIGN(ExprPtr filtered, build::Where(logs, loud));
  EXPECT_TRUE(Match(Simplify(filtered), match::Filter()));
}

TEST_F(IOExprTest, len_of_read_is_a_literal) {
  ASSERT_OK_AND_ASSIGN(ExprPtr table_len, build::Len(MakeTable(2)));
  ExprPtr out = Simplify(table_len);
  ASSERT_TRUE(Match(out, match::Literal()));
  EXPECT_EQ(8, out->operand("value").int_value());

  ASSERT_OK_AND_ASSIGN(ExprPtr logs_len, build::Len(MakeDataset()));
  out = Simplify(logs_len);
  ASSERT_TRUE(Match(out, match::Literal()));
  EXPECT_EQ(8, out->operand("value").int_value());

  // A column read still has every row.
  ASSERT_OK_AND_ASSIGN(ExprPtr col_len, build::Len(Col(MakeTable(2), "s")));
  out = Simplify(col_len);
  ASSERT_TRUE(Match(out, match::Literal()));
  EXPECT_EQ(8, out->operand("value").int_value());
}

TEST_F(IOExprTest, len_with_filters_needs_the_rows) {
  ASSERT_OK_AND_ASSIGN(
      ExprPtr len, build::Len(MakeDataset({Predicate("level", CompareOp::kGt, Scalar(1))})));
  EXPECT_TRUE(Match(Simplify(len), match::Len()));
}

TEST_F(IOExprTest, len_without_row_counts_needs_the_rows) {
  auto storage = std::make_shared<testutils::FakeStorage>(
      "nocount", std::vector<ColumnSchema>{{"id", types::INT64}});
  storage->AddFragment("only", testutils::MakeFrame({"id"}, {testutils::Ints({1, 2})}),
                       /*with_statistics*/ true, /*with_num_rows*/ false);
  ASSERT_OK_AND_ASSIGN(auto source, DatasetSource::Open(storage));
  ASSERT_OK_AND_ASSIGN(ExprPtr read, build::ReadDataset(source));
  ASSERT_OK_AND_ASSIGN(ExprPtr len, build::Len(read));
  EXPECT_TRUE(Match(Simplify(len), match::Len()));
}

TEST_F(IOExprTest, similar_reads_combine) {
  ExprPtr table = MakeTable(2);
  ASSERT_OK_AND_ASSIGN(ExprPtr sum, build::Add(Col(table, "a"), Col(table, "b")));
  ExprPtr simplified = Simplify(sum);
  ExprPtr read_a = simplified->operands()[0].expr();
  ASSERT_TRUE(Match(read_a, match::FromTable()));

  ASSERT_OK_AND_ASSIGN(ExprPtr combined, read_a->CombineSimilar(simplified));
  ASSERT_NE(nullptr, combined);
  ASSERT_TRUE(Match(combined, match::Projection()));
  EXPECT_EQ("a", combined->operand("columns").string_value());
  const ExprPtr& shared = combined->operand("frame").expr();
  EXPECT_THAT(shared->operand("columns").Get<StringList>(), ElementsAre("a", "b"));
  EXPECT_FALSE(shared->operand("_series").bool_value());

  // Nothing to combine with on its own.
  ASSERT_OK_AND_ASSIGN(ExprPtr alone, read_a->CombineSimilar(read_a));
  EXPECT_EQ(nullptr, alone);
}

}  // namespace planner
}  // namespace tessera
