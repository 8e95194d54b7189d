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

#ifndef WGLP_MODEL_LINEAR_EXPR_H_
#define WGLP_MODEL_LINEAR_EXPR_H_

/**
 * \file
 * LinearExpr is the algebraic substrate shared by constraints, goals and the
 * weighted objective. It models
 *
 *   offset + sum_{i in S} a_i*x_i,
 *
 * where the a_i and offset are constants and the x_i are variables, referred
 * to by name. A variable referenced several times has its coefficients
 * summed, never overwritten.
 *
 * A LinearExpr is a value: every operation below returns a new expression and
 * leaves its operands untouched.
 *
 * \code
   GoalModel model("diet");
   const Variable* rice = model.AddVariable("Rice").value();
   const Variable* dal = model.AddVariable("Dal").value();
   const LinearExpr energy = 5.0 * LinearExpr(rice) + 10.0 * LinearExpr(dal);
   const LinearExpr energy_too =
       LinearExpr::Term(*rice, 5.0).Add(LinearExpr::Term("Dal", 10.0));
   \endcode
 */

#include <ostream>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace wglp {

class Variable;

class LinearExpr {
 public:
  LinearExpr();
  /// Possible implicit conversions are intentional.
  LinearExpr(double constant);  // NOLINT
  /// Possible implicit conversions are intentional. `var` must not be null.
  LinearExpr(const Variable* var);  // NOLINT

  static LinearExpr Constant(double constant);
  static LinearExpr Term(const Variable& var, double coefficient);
  static LinearExpr Term(absl::string_view var_name, double coefficient);

  LinearExpr Add(const LinearExpr& other) const;
  LinearExpr Scale(double factor) const;

  LinearExpr operator-() const { return Scale(-1.0); }

  double offset() const { return offset_; }
  const absl::flat_hash_map<std::string, double>& terms() const {
    return terms_;
  }

  // Returns 0.0 for a variable absent from the expression.
  double coefficient(absl::string_view var_name) const;

  /**
   * Returns offset + sum_i a_i * values[x_i]. Fails with UnknownVariableError
   * if a referenced variable has no value.
   */
  absl::StatusOr<double> Evaluate(
      const absl::flat_hash_map<std::string, double>& values) const;

  /// Human readable form; variables are printed in lexicographic order.
  std::string ToString() const;

 private:
  friend LinearExpr operator+(LinearExpr lhs, const LinearExpr& rhs);
  friend LinearExpr operator-(LinearExpr lhs, const LinearExpr& rhs);
  friend LinearExpr operator*(LinearExpr lhs, double rhs);
  friend LinearExpr operator*(double lhs, LinearExpr rhs);

  void AddInPlace(const LinearExpr& rhs, double factor);
  void ScaleInPlace(double factor);

  double offset_;
  absl::flat_hash_map<std::string, double> terms_;
};

std::ostream& operator<<(std::ostream& stream, const LinearExpr& linear_expr);

// NOTE: one argument is taken by value on purpose: the result is a new
// LinearExpr anyway, and this lets a + b + c + d reuse the temporaries.
LinearExpr operator+(LinearExpr lhs, const LinearExpr& rhs);
LinearExpr operator-(LinearExpr lhs, const LinearExpr& rhs);
LinearExpr operator*(LinearExpr lhs, double rhs);
LinearExpr operator*(double lhs, LinearExpr rhs);

}  // namespace wglp

#endif  // WGLP_MODEL_LINEAR_EXPR_H_
