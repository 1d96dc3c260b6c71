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


// X-macro list of every expression type. Define TESSERA_EXPR_NODE(NAME) before including.
#ifdef TESSERA_EXPR_NODE

// Blockwise.
TESSERA_EXPR_NODE(Projection)
TESSERA_EXPR_NODE(ProjectIndex)
TESSERA_EXPR_NODE(Filter)
TESSERA_EXPR_NODE(Assign)
TESSERA_EXPR_NODE(AsType)
TESSERA_EXPR_NODE(Apply)
TESSERA_EXPR_NODE(Add)
TESSERA_EXPR_NODE(Sub)
TESSERA_EXPR_NODE(Mul)
TESSERA_EXPR_NODE(Div)
TESSERA_EXPR_NODE(Lt)
TESSERA_EXPR_NODE(Le)
TESSERA_EXPR_NODE(Gt)
TESSERA_EXPR_NODE(Ge)
TESSERA_EXPR_NODE(Eq)
TESSERA_EXPR_NODE(Ne)
TESSERA_EXPR_NODE(AsUnknown)
TESSERA_EXPR_NODE(SetCategories)
TESSERA_EXPR_NODE(CategoricalCodes)
TESSERA_EXPR_NODE(Shift)
TESSERA_EXPR_NODE(Chunk)
TESSERA_EXPR_NODE(Fused)

// IO.
TESSERA_EXPR_NODE(FromTable)
TESSERA_EXPR_NODE(ReadDataset)

// Partition structure.
TESSERA_EXPR_NODE(Head)
TESSERA_EXPR_NODE(Partitions)
TESSERA_EXPR_NODE(Concat)
TESSERA_EXPR_NODE(Repartition)
TESSERA_EXPR_NODE(Literal)
TESSERA_EXPR_NODE(FromGraph)

// Reductions.
TESSERA_EXPR_NODE(Sum)
TESSERA_EXPR_NODE(Prod)
TESSERA_EXPR_NODE(Min)
TESSERA_EXPR_NODE(Max)
TESSERA_EXPR_NODE(Any)
TESSERA_EXPR_NODE(All)
TESSERA_EXPR_NODE(Count)
TESSERA_EXPR_NODE(Size)
TESSERA_EXPR_NODE(Len)
TESSERA_EXPR_NODE(Mode)
TESSERA_EXPR_NODE(DropDuplicates)
TESSERA_EXPR_NODE(Unique)
TESSERA_EXPR_NODE(ValueCounts)
TESSERA_EXPR_NODE(GroupByAgg)
TESSERA_EXPR_NODE(TreeReduce)

#endif
