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

#include <absl/strings/substitute.h>

namespace tessera {
namespace planner {

taskgraphpb::TaskKey MakeKey(std::string_view name, int64_t index) {
  taskgraphpb::TaskKey key;
  key.set_name(std::string(name));
  key.set_index(index);
  return key;
}

std::string KeyString(const taskgraphpb::TaskKey& key) {
  return absl::Substitute("($0, $1)", key.name(), key.index());
}

void ScalarToLiteral(const types::Scalar& value, taskgraphpb::Literal* literal) {
  if (value.is_bool()) {
    literal->set_bool_value(value.bool_value());
  } else if (value.is_int()) {
    literal->set_int64_value(value.int_value());
  } else if (value.is_float()) {
    literal->set_float64_value(value.float_value());
  } else if (value.is_string()) {
    literal->set_string_value(value.string_value());
  } else {
    literal->set_null_value(true);
  }
}

void StringsToLiteral(const std::vector<std::string>& values, taskgraphpb::Literal* literal) {
  auto* list = literal->mutable_list_value();
  for (const auto& v : values) {
    list->add_values()->set_string_value(v);
  }
}

Status OperandToLiteral(const Operand& operand, taskgraphpb::Literal* literal) {
  if (operand.is_none()) {
    literal->set_null_value(true);
  } else if (operand.is_scalar()) {
    ScalarToLiteral(operand.scalar(), literal);
  } else if (operand.Is<StringList>()) {
    StringsToLiteral(operand.Get<StringList>(), literal);
  } else if (operand.Is<Int64List>()) {
    auto* list = literal->mutable_list_value();
    for (int64_t v : operand.Get<Int64List>()) {
      list->add_values()->set_int64_value(v);
    }
  } else if (operand.Is<ScalarList>()) {
    auto* list = literal->mutable_list_value();
    for (const auto& v : operand.Get<ScalarList>()) {
      ScalarToLiteral(v, list->add_values());
    }
  } else if (operand.Is<PredicateList>()) {
    // [[column, op, value], ...]
    auto* list = literal->mutable_list_value();
    for (const auto& p : operand.Get<PredicateList>()) {
      auto* triple = list->add_values()->mutable_list_value();
      triple->add_values()->set_string_value(p.column());
      triple->add_values()->set_string_value(CompareOpToString(p.op()));
      ScalarToLiteral(p.value(), triple->add_values());
    }
  } else {
    return error::Internal("Operand $0 has no literal form", operand.DebugString());
  }
  return Status::OK();
}

StatusOr<types::Scalar> LiteralToScalar(const taskgraphpb::Literal& literal) {
  switch (literal.value_case()) {
    case taskgraphpb::Literal::kBoolValue:
      return types::Scalar(literal.bool_value());
    case taskgraphpb::Literal::kInt64Value:
      return types::Scalar(literal.int64_value());
    case taskgraphpb::Literal::kFloat64Value:
      return types::Scalar(literal.float64_value());
    case taskgraphpb::Literal::kStringValue:
      return types::Scalar(literal.string_value());
    case taskgraphpb::Literal::kListValue:
      return error::InvalidArgument("Expected a scalar literal, got a list");
    default:
      return types::Scalar();
  }
}

void AddRefArg(std::string_view name, int64_t index, taskgraphpb::Task* task) {
  *task->add_args()->mutable_ref() = MakeKey(name, index);
}

void AddScalarArg(const types::Scalar& value, taskgraphpb::Task* task) {
  ScalarToLiteral(value, task->add_args()->mutable_literal());
}

Status AddOperandArg(const Operand& operand, taskgraphpb::Task* task) {
  return OperandToLiteral(operand, task->add_args()->mutable_literal());
}

void SetKwarg(std::string_view key, const types::Scalar& value, taskgraphpb::Task* task) {
  ScalarToLiteral(value, &(*task->mutable_kwargs())[std::string(key)]);
}

Status SetOperandKwarg(std::string_view key, const Operand& operand, taskgraphpb::Task* task) {
  return OperandToLiteral(operand, &(*task->mutable_kwargs())[std::string(key)]);
}

}  // namespace planner
}  // namespace tessera
