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


#include "src/planner/ir/operand.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "src/planner/ir/expr.h"

namespace tessera {
namespace planner {

namespace {

// Helper for std::visit over lambdas.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

template <typename TList, typename THash>
uint64_t HashList(uint64_t seed, const TList& list, THash element_hash) {
  uint64_t h = HashCombine(seed, FingerprintValue(static_cast<uint64_t>(list.size())));
  for (const auto& element : list) {
    h = HashCombine(h, element_hash(element));
  }
  return h;
}

uint64_t HashPredicate(const Predicate& p) {
  uint64_t h = Fingerprint(p.column());
  h = HashCombine(h, FingerprintValue(static_cast<int64_t>(p.op())));
  return HashCombine(h, p.value().Hash());
}

uint64_t HashExpr(const ExprPtr& expr) {
  return expr == nullptr ? 0 : Fingerprint(expr->name());
}

}  // namespace

uint64_t Operand::Hash() const {
  uint64_t kind = FingerprintValue(static_cast<uint64_t>(value_.index()));
  uint64_t h = std::visit(
      Overloaded{
          [](const std::monostate&) -> uint64_t { return 0; },
          [](const Scalar& v) { return v.Hash(); },
          [kind](const StringList& v) {
            return HashList(kind, v, [](const std::string& s) { return Fingerprint(s); });
          },
          [kind](const Int64List& v) {
            return HashList(kind, v, [](int64_t i) { return FingerprintValue(i); });
          },
          [kind](const ScalarList& v) {
            return HashList(kind, v, [](const Scalar& s) { return s.Hash(); });
          },
          [kind](const PredicateList& v) { return HashList(kind, v, HashPredicate); },
          [](const ExprPtr& v) { return HashExpr(v); },
          [kind](const ExprList& v) { return HashList(kind, v, HashExpr); },
          [kind](const DTypeMap& v) {
            return HashList(kind, v, [](const auto& entry) {
              return HashCombine(Fingerprint(entry.first),
                                 FingerprintValue(static_cast<int64_t>(entry.second)));
            });
          },
          [kind](const KwargMap& v) {
            return HashList(kind, v, [](const auto& entry) {
              return HashCombine(Fingerprint(entry.first), entry.second.Hash());
            });
          },
          [](const SourcePtr& v) -> uint64_t {
            return v == nullptr ? 0 : Fingerprint(v->token());
          },
          [](const Meta& v) { return Fingerprint(v.DebugString()); },
          [](const Divisions& v) { return Fingerprint(v.DebugString()); },
          [](const LayerPtr& v) -> uint64_t { return v == nullptr ? 0 : Fingerprint(v->name()); },
      },
      value_);
  return HashCombine(kind, h);
}

std::string Operand::DebugString() const {
  auto quoted = [](std::string* out, const std::string& s) { absl::StrAppend(out, "'", s, "'"); };
  auto scalar_fmt = [](std::string* out, const Scalar& s) { absl::StrAppend(out, s.ToString()); };
  return std::visit(
      Overloaded{
          [](const std::monostate&) -> std::string { return "None"; },
          [](const Scalar& v) { return v.ToString(); },
          [&](const StringList& v) {
            return absl::StrCat("[", absl::StrJoin(v, ", ", quoted), "]");
          },
          [](const Int64List& v) { return absl::StrCat("[", absl::StrJoin(v, ", "), "]"); },
          [&](const ScalarList& v) {
            return absl::StrCat("[", absl::StrJoin(v, ", ", scalar_fmt), "]");
          },
          [](const PredicateList& v) {
            return absl::StrCat("[",
                                absl::StrJoin(v, ", ",
                                              [](std::string* out, const Predicate& p) {
                                                absl::StrAppend(out, p.ToString());
                                              }),
                                "]");
          },
          [](const ExprPtr& v) -> std::string { return v == nullptr ? "null" : v->name(); },
          [](const ExprList& v) {
            return absl::StrCat("[",
                                absl::StrJoin(v, ", ",
                                              [](std::string* out, const ExprPtr& e) {
                                                absl::StrAppend(out, e->name());
                                              }),
                                "]");
          },
          [](const DTypeMap& v) {
            return absl::StrCat("{",
                                absl::StrJoin(v, ", ",
                                              [](std::string* out, const auto& entry) {
                                                absl::StrAppend(out, entry.first, ": ",
                                                                types::DataTypeName(entry.second));
                                              }),
                                "}");
          },
          [](const KwargMap& v) {
            return absl::StrCat("{",
                                absl::StrJoin(v, ", ",
                                              [](std::string* out, const auto& entry) {
                                                absl::StrAppend(out, entry.first, "=",
                                                                entry.second.ToString());
                                              }),
                                "}");
          },
          [](const SourcePtr& v) -> std::string {
            return v == nullptr ? "null" : absl::StrCat("<source ", v->token(), ">");
          },
          [](const Meta& v) { return v.DebugString(); },
          [](const Divisions& v) { return v.DebugString(); },
          [](const LayerPtr& v) -> std::string {
            return v == nullptr ? "null" : absl::StrCat("<layer ", v->name(), ">");
          },
      },
      value_);
}

}  // namespace planner
}  // namespace tessera
