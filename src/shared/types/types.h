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

#include <string>

#include "src/common/base/base.h"
#include "src/shared/types/typespb/types.pb.h"

namespace tessera {
namespace types {

// Short lower-case names, as used in task kwargs and debug output.
std::string DataTypeName(DataType type);
StatusOr<DataType> DataTypeFromName(std::string_view name);

inline bool IsNumeric(DataType type) { return type == INT64 || type == FLOAT64; }

// Booleans take part in arithmetic as integers.
inline bool IsArithmetic(DataType type) { return IsNumeric(type) || type == BOOLEAN; }

// The type both values fit in: the wider numeric type, else DATA_TYPE_UNKNOWN.
DataType CommonType(DataType a, DataType b);

}  // namespace types
}  // namespace tessera
