// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef WGLP_MODEL_CONSTRAINT_H_
#define WGLP_MODEL_CONSTRAINT_H_

#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "wglp/model/linear_expr.h"

namespace wglp {

enum class ConstraintSense { kLessOrEqual, kGreaterOrEqual, kEqual };

// "<=", ">=" or "==".
std::string ConstraintSenseSymbol(ConstraintSense sense);

// Accepts "<=", ">=", "==" and "=". Anything else, strict inequalities
// included, fails with InvalidSenseError.
absl::StatusOr<ConstraintSense> ParseConstraintSense(absl::string_view text);

// A hard linear relation `expression <sense> rhs`. Immutable. Name uniqueness
// is a model-wide property and is checked by GoalModel at registration.
class Constraint {
 public:
  // Fails with InvalidArgument on an empty name or a NaN rhs, and with
  // InvalidSenseError on a sense outside of ConstraintSense.
  static absl::StatusOr<Constraint> Create(absl::string_view name,
                                           LinearExpr expression,
                                           ConstraintSense sense, double rhs);

  const std::string& name() const { return name_; }
  const LinearExpr& expression() const { return expression_; }
  ConstraintSense sense() const { return sense_; }
  double rhs() const { return rhs_; }

  // The rhs once the constant of the expression is moved to the right:
  // sum_i a_i*x_i <sense> rhs - offset.
  double NormalizedRhs() const { return rhs_ - expression_.offset(); }

  // Whether the relation holds at `values`, up to an absolute `tolerance`.
  absl::StatusOr<bool> IsSatisfiedBy(
      const absl::flat_hash_map<std::string, double>& values,
      double tolerance) const;

  std::string ToString() const;

 private:
  Constraint(std::string name, LinearExpr expression, ConstraintSense sense,
             double rhs)
      : name_(std::move(name)),
        expression_(std::move(expression)),
        sense_(sense),
        rhs_(rhs) {}

  std::string name_;
  LinearExpr expression_;
  ConstraintSense sense_;
  double rhs_;
};

}  // namespace wglp

#endif  // WGLP_MODEL_CONSTRAINT_H_
