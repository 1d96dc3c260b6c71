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

#include <functional>

#define TBB_PREVIEW_CONCURRENT_LRU_CACHE 1
#include <tbb/concurrent_lru_cache.h>

#include "src/common/base/base.h"

DECLARE_int64(source_cache_capacity);

namespace tessera {
namespace planner {

// Per-source cache of derived metadata. Values are computed on first access by the
// function given at construction; least recently used entries beyond the capacity are
// evicted once no handle references them.
template <typename Key, typename Value>
using SourceCache = tbb::concurrent_lru_cache<Key, Value, std::function<Value(Key)>>;

}  // namespace planner
}  // namespace tessera
