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


#include "src/shared/types/types.h"

namespace tessera {
namespace types {

std::string DataTypeName(DataType type) {
  switch (type) {
    case BOOLEAN:
      return "bool";
    case INT64:
      return "int64";
    case FLOAT64:
      return "float64";
    case STRING:
      return "string";
    case TIME64NS:
      return "time64ns";
    case CATEGORICAL:
      return "category";
    default:
      return "unknown";
  }
}

StatusOr<DataType> DataTypeFromName(std::string_view name) {
  for (DataType type : {BOOLEAN, INT64, FLOAT64, STRING, TIME64NS, CATEGORICAL}) {
    if (DataTypeName(type) == name) {
      return type;
    }
  }
  return error::InvalidArgument("Unknown data type '$0'", name);
}

DataType CommonType(DataType a, DataType b) {
  if (a == b) {
    return a;
  }
  if (IsArithmetic(a) && IsArithmetic(b)) {
    return (a == FLOAT64 || b == FLOAT64) ? FLOAT64 : INT64;
  }
  return DATA_TYPE_UNKNOWN;
}

}  // namespace types
}  // namespace tessera
