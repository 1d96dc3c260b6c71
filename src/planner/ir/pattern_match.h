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


/**
 * Pattern matching over expressions, in the style of LLVM's PatternMatch.h.
 *
 * ```
 * if (Match(expr, match::Projection())) {
 *   ...
 * } else if (Match(expr, match::Comparison(match::IO(), match::Value()))) {
 *   ...
 * }
 * ```
 *
 * Patterns inherit from ParentMatch and implement Match(). Each pattern comes with a
 * factory function in the `match` namespace; the factories are named after the expression
 * types they match.
 */
#pragma once

#include <string>

#include "src/planner/ir/expr.h"

namespace tessera {
namespace planner {

template <typename Val, typename Pattern>
bool Match(const Val& node, const Pattern& P) {
  return P.Match(node.get());
}

template <typename Pattern>
bool Match(const Expr* node, const Pattern& P) {
  return P.Match(node);
}

namespace match {

struct ParentMatch {
  virtual ~ParentMatch() = default;
  /**
   * @brief Returns true if the expression fits the pattern.
   * @param node the expression to examine, possibly null.
   */
  virtual bool Match(const Expr* node) const = 0;
};

// Matches any expression.
struct AllMatch : public ParentMatch {
  bool Match(const Expr* node) const override { return node != nullptr; }
};
inline AllMatch Value() { return AllMatch(); }

template <ExprType t>
struct ClassMatch : public ParentMatch {
  bool Match(const Expr* node) const override { return node != nullptr && node->type() == t; }
};

#define TESSERA_CLASS_MATCH(NAME) \
  inline ClassMatch<ExprType::k##NAME> NAME() { return ClassMatch<ExprType::k##NAME>(); }
TESSERA_CLASS_MATCH(Projection)
TESSERA_CLASS_MATCH(ProjectIndex)
TESSERA_CLASS_MATCH(Filter)
TESSERA_CLASS_MATCH(Assign)
TESSERA_CLASS_MATCH(Head)
TESSERA_CLASS_MATCH(Partitions)
TESSERA_CLASS_MATCH(Concat)
TESSERA_CLASS_MATCH(Repartition)
TESSERA_CLASS_MATCH(Literal)
TESSERA_CLASS_MATCH(Fused)
TESSERA_CLASS_MATCH(FromTable)
TESSERA_CLASS_MATCH(ReadDataset)
TESSERA_CLASS_MATCH(Len)
TESSERA_CLASS_MATCH(Chunk)
TESSERA_CLASS_MATCH(TreeReduce)
TESSERA_CLASS_MATCH(GroupByAgg)
#undef TESSERA_CLASS_MATCH

// Matches expressions for which a trait method returns true.
template <bool (Expr::*trait)() const>
struct TraitMatch : public ParentMatch {
  bool Match(const Expr* node) const override { return node != nullptr && (node->*trait)(); }
};

inline TraitMatch<&Expr::IsBlockwise> Blockwise() { return {}; }
inline TraitMatch<&Expr::IsElemwise> Elemwise() { return {}; }
inline TraitMatch<&Expr::IsIO> IO() { return {}; }
inline TraitMatch<&Expr::IsReduction> Reduction() { return {}; }

inline bool IsArithmeticType(ExprType type) {
  return type == ExprType::kAdd || type == ExprType::kSub || type == ExprType::kMul ||
         type == ExprType::kDiv;
}

inline bool IsComparisonType(ExprType type) {
  return type == ExprType::kLt || type == ExprType::kLe || type == ExprType::kGt ||
         type == ExprType::kGe || type == ExprType::kEq || type == ExprType::kNe;
}

/**
 * @brief Matches binary operators whose operands match LHS and RHS. Literal operands never
 * match an expression pattern, so use AnyOperand() to accept them.
 */
template <typename LHS, typename RHS, bool (*type_filter)(ExprType)>
struct BinaryOpMatch : public ParentMatch {
  BinaryOpMatch(LHS lhs, RHS rhs) : L(lhs), R(rhs) {}
  bool Match(const Expr* node) const override {
    if (node == nullptr || !type_filter(node->type())) {
      return false;
    }
    return MatchOperand(L, node->operands()[0]) && MatchOperand(R, node->operands()[1]);
  }

  template <typename Pattern>
  static bool MatchOperand(const Pattern& p, const Operand& operand) {
    return operand.is_expr() && p.Match(operand.expr().get());
  }

  LHS L;
  RHS R;
};

// Matches any operand, expression or literal.
struct AnyOperand : public ParentMatch {
  bool Match(const Expr*) const override { return true; }
};

template <typename LHS, bool (*type_filter)(ExprType)>
struct BinaryOpMatch<LHS, AnyOperand, type_filter> : public ParentMatch {
  BinaryOpMatch(LHS lhs, AnyOperand) : L(lhs) {}
  bool Match(const Expr* node) const override {
    if (node == nullptr || !type_filter(node->type())) {
      return false;
    }
    const Operand& left = node->operands()[0];
    return left.is_expr() && L.Match(left.expr().get());
  }
  LHS L;
};

inline bool AnyBinaryType(ExprType type) {
  return IsArithmeticType(type) || IsComparisonType(type);
}

template <typename LHS, typename RHS>
BinaryOpMatch<LHS, RHS, IsComparisonType> Comparison(const LHS& L, const RHS& R) {
  return BinaryOpMatch<LHS, RHS, IsComparisonType>(L, R);
}
template <typename LHS, typename RHS>
BinaryOpMatch<LHS, RHS, IsArithmeticType> Arithmetic(const LHS& L, const RHS& R) {
  return BinaryOpMatch<LHS, RHS, IsArithmeticType>(L, R);
}

// Any binary operator, whatever its operands.
struct BinaryOpTypeMatch : public ParentMatch {
  explicit BinaryOpTypeMatch(bool (*filter)(ExprType)) : filter_(filter) {}
  bool Match(const Expr* node) const override { return node != nullptr && filter_(node->type()); }
  bool (*filter_)(ExprType);
};
inline BinaryOpTypeMatch Binop() { return BinaryOpTypeMatch(AnyBinaryType); }
inline BinaryOpTypeMatch Comparison() { return BinaryOpTypeMatch(IsComparisonType); }
inline BinaryOpTypeMatch Arithmetic() { return BinaryOpTypeMatch(IsArithmeticType); }

// Matches an expression whose Meta is a series.
struct SeriesMatch : public ParentMatch {
  bool Match(const Expr* node) const override {
    return node != nullptr && node->meta().is_series();
  }
};
inline SeriesMatch Series() { return SeriesMatch(); }

// Matches an expression whose Meta is a frame.
struct FrameMatch : public ParentMatch {
  bool Match(const Expr* node) const override {
    return node != nullptr && node->meta().is_frame();
  }
};
inline FrameMatch Frame() { return FrameMatch(); }

}  // namespace match
}  // namespace planner
}  // namespace tessera
