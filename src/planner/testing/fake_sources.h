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

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "src/planner/io/storage_reader.h"
#include "src/planner/io/table_reader.h"
#include "src/planner/testing/test_frame.h"

namespace tessera {
namespace planner {
namespace testutils {

// A table kept in memory, with the rows the backend reads.
class InMemoryTable : public TableReader {
 public:
  InMemoryTable(std::string token, Meta meta, TestFrame rows)
      : token_(std::move(token)), meta_(std::move(meta)), rows_(std::move(rows)) {}

  std::string token() const override { return token_; }
  const Meta& meta() const override { return meta_; }
  std::vector<Scalar> IndexValues() const override {
    ++index_reads_;
    return rows_.index;
  }

  const TestFrame& rows() const { return rows_; }
  int64_t index_reads() const { return index_reads_; }

 private:
  std::string token_;
  Meta meta_;
  TestFrame rows_;
  mutable std::atomic<int64_t> index_reads_{0};
};

/**
 * @brief A dataset of in-memory fragments.
 *
 * Fragment statistics are computed from the rows unless disabled, and listings are counted
 * so tests can check the plan cache.
 */
class FakeStorage : public StorageReader {
 public:
  FakeStorage(std::string token, std::vector<ColumnSchema> schema)
      : token_(std::move(token)), schema_(std::move(schema)) {}

  // rows holds every schema column, in schema order.
  void AddFragment(const std::string& path, TestFrame rows, bool with_statistics = true,
                   bool with_num_rows = true);

  std::string token() const override { return token_; }
  StatusOr<std::vector<ColumnSchema>> ReadManifest() const override { return schema_; }
  StatusOr<std::vector<FragmentInfo>> ListFragments() const override;

  StatusOr<TestFrame> Fragment(const std::string& path) const;
  int64_t listings() const { return listings_; }

 private:
  std::string token_;
  std::vector<ColumnSchema> schema_;
  std::vector<FragmentInfo> fragments_;
  std::map<std::string, TestFrame> rows_;
  mutable std::atomic<int64_t> listings_{0};
};

}  // namespace testutils
}  // namespace planner
}  // namespace tessera
