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

#include "wglp/solver/program_validator.h"

#include <cmath>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "wglp/solver/linear_program.pb.h"

ABSL_FLAG(
    double, wglp_model_validator_infinity, 1e100,
    "Anything above or equal to this magnitude will be considered infinity.");

namespace wglp {
namespace {

bool IsNanOrAbsGreaterThanOrEqual(double value, double abs_value_threshold) {
  return std::isnan(value) || std::abs(value) >= abs_value_threshold;
}

std::string FindErrorInVariable(const VariableProto& variable,
                                double abs_value_threshold) {
  if (std::isnan(variable.lower_bound()) ||
      std::isnan(variable.upper_bound()) ||
      variable.lower_bound() >= abs_value_threshold ||
      variable.upper_bound() <= -abs_value_threshold ||
      variable.lower_bound() > variable.upper_bound()) {
    return absl::StrFormat("Infeasible bounds: [%f, %f]",
                           variable.lower_bound(), variable.upper_bound());
  }
  if (variable.category() != VariableProto::CONTINUOUS &&
      std::ceil(variable.lower_bound()) > std::floor(variable.upper_bound())) {
    return absl::StrCat("Infeasible bounds for integer variable: [",
                        variable.lower_bound(), ", ", variable.upper_bound(),
                        "] translate to the empty set");
  }
  if (IsNanOrAbsGreaterThanOrEqual(variable.objective_coefficient(),
                                   abs_value_threshold)) {
    return absl::StrCat("Invalid objective_coefficient: ",
                        variable.objective_coefficient());
  }
  return std::string();
}

// "var_mask" has one entry per variable of the program; it is all false
// before and after the call.
std::string FindErrorInConstraint(const ConstraintProto& constraint,
                                  std::vector<bool>* var_mask,
                                  double abs_value_threshold) {
  if (IsNanOrAbsGreaterThanOrEqual(constraint.rhs(), abs_value_threshold)) {
    return absl::StrCat("Invalid rhs: ", constraint.rhs());
  }
  const int num_vars_in_program = var_mask->size();
  const int num_vars_in_ct = constraint.var_index_size();
  const int num_coeffs_in_ct = constraint.coefficient_size();
  if (num_vars_in_ct != num_coeffs_in_ct) {
    return absl::StrCat("var_index_size() != coefficient_size() (",
                        num_vars_in_ct, " VS ", num_coeffs_in_ct, ")");
  }
  for (int i = 0; i < num_vars_in_ct; ++i) {
    const int var_index = constraint.var_index(i);
    if (var_index >= num_vars_in_program || var_index < 0) {
      return absl::StrCat("var_index(", i, ")=", var_index,
                          " is out of bounds");
    }
    const double coeff = constraint.coefficient(i);
    if (IsNanOrAbsGreaterThanOrEqual(coeff, abs_value_threshold)) {
      return absl::StrCat("coefficient(", i, ")=", coeff, " is invalid");
    }
  }

  int duplicate_var_index = -1;
  for (const int var_index : constraint.var_index()) {
    if ((*var_mask)[var_index]) duplicate_var_index = var_index;
    (*var_mask)[var_index] = true;
  }
  // Reset "var_mask" to all false, sparsely.
  for (const int var_index : constraint.var_index()) {
    (*var_mask)[var_index] = false;
  }
  if (duplicate_var_index >= 0) {
    return absl::StrCat("var_index #", duplicate_var_index,
                        " appears several times");
  }
  return std::string();
}

}  // namespace

std::string FindErrorInProgram(const ProgramProto& program,
                               double abs_value_threshold) {
  if (abs_value_threshold == 0.0) {
    abs_value_threshold = absl::GetFlag(FLAGS_wglp_model_validator_infinity);
  }
  if (IsNanOrAbsGreaterThanOrEqual(program.objective_offset(),
                                   abs_value_threshold)) {
    return absl::StrCat("Invalid objective_offset: ",
                        program.objective_offset());
  }
  const int num_vars = program.variable_size();
  for (int i = 0; i < num_vars; ++i) {
    const std::string error =
        FindErrorInVariable(program.variable(i), abs_value_threshold);
    if (!error.empty()) {
      return absl::StrCat("In variable #", i, " ('", program.variable(i).name(),
                          "'): ", error);
    }
  }
  std::vector<bool> var_mask(num_vars, false);
  for (int i = 0; i < program.constraint_size(); ++i) {
    const std::string error = FindErrorInConstraint(
        program.constraint(i), &var_mask, abs_value_threshold);
    if (!error.empty()) {
      return absl::StrCat("In constraint #", i, " ('",
                          program.constraint(i).name(), "'): ", error);
    }
  }
  return std::string();
}

}  // namespace wglp
