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
#include <utility>

#include "src/common/base/macros.h"
#include "src/common/base/mixins.h"

namespace tessera {

// DEFER runs a statement when the enclosing scope exits.
//
// Usage:
//
//   auto saved = FLAGS_split_every;
//   DEFER(FLAGS_split_every = saved);
//   FLAGS_split_every = 2;
//
// NOTE: The statement runs at the end of its scope, not at the end of the function.

template <typename FnType>
class ScopedLambda : public NotCopyable {
 public:
  explicit ScopedLambda(FnType fn) : fn_(std::move(fn)) {}
  ~ScopedLambda() { fn_(); }

 private:
  FnType fn_;
};

template <typename FnType>
ScopedLambda<FnType> MakeScopedLambda(FnType fn) {
  return ScopedLambda<FnType>(std::move(fn));
}

}  // namespace tessera

#define DEFER(...) \
  auto TESSERA_UNIQUE_NAME(varname) = tessera::MakeScopedLambda([&] { __VA_ARGS__; });
