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

#include "src/common/base/env.h"

#include <absl/debugging/symbolize.h>
#include <absl/strings/str_join.h>
#include <cstdlib>
#include <mutex>  // NOLINT

namespace tessera {

namespace {

std::once_flag init_once, shutdown_once;

void InitEnvironmentOrDieImpl(int* argc, char** argv) {
  // Enable logging by default.
  FLAGS_logtostderr = true;
  FLAGS_colorlogtostderr = true;

  std::string cmd = absl::StrJoin(argv, argv + *argc, " ");

  absl::InitializeSymbolizer(argv[0]);
  google::ParseCommandLineFlags(argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  LOG(INFO) << "Started: " << cmd;
}

void ShutdownEnvironmentOrDieImpl() {
  LOG(INFO) << "Shutting down";
  google::ShutdownGoogleLogging();
}

void InitEnvironmentOrDie(int* argc, char** argv) {
  CHECK(argc != nullptr) << "argc must not be null";
  CHECK(argv != nullptr) << "argv must not be null";
  std::call_once(init_once, InitEnvironmentOrDieImpl, argc, argv);
}

void ShutdownEnvironmentOrDie() { std::call_once(shutdown_once, ShutdownEnvironmentOrDieImpl); }

}  // namespace

EnvironmentGuard::EnvironmentGuard(int* argc, char** argv) { InitEnvironmentOrDie(argc, argv); }
EnvironmentGuard::~EnvironmentGuard() { ShutdownEnvironmentOrDie(); }

std::optional<std::string> GetEnv(const std::string& env_var) {
  const char* var = getenv(env_var.c_str());
  if (var == nullptr) {
    return std::nullopt;
  }
  return std::string(var);
}

}  // namespace tessera
