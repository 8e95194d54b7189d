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

#include "wglp/model/constraint.h"

#include <cmath>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/ascii.h"
#include "wglp/base/status_macros.h"
#include "wglp/model/errors.h"
#include "wglp/model/linear_expr.h"

namespace wglp {

std::string ConstraintSenseSymbol(ConstraintSense sense) {
  switch (sense) {
    case ConstraintSense::kLessOrEqual:
      return "<=";
    case ConstraintSense::kGreaterOrEqual:
      return ">=";
    case ConstraintSense::kEqual:
      return "==";
  }
  return "?";
}

absl::StatusOr<ConstraintSense> ParseConstraintSense(absl::string_view text) {
  const absl::string_view symbol = absl::StripAsciiWhitespace(text);
  if (symbol == "<=") return ConstraintSense::kLessOrEqual;
  if (symbol == ">=") return ConstraintSense::kGreaterOrEqual;
  if (symbol == "==" || symbol == "=") return ConstraintSense::kEqual;
  if (symbol == "<" || symbol == ">") {
    return InvalidSenseError(absl::StrCat(
        "strict inequality '", symbol, "' is not a linear programming sense"));
  }
  return InvalidSenseError(
      absl::StrCat("unknown constraint sense '", text, "'"));
}

// static
absl::StatusOr<Constraint> Constraint::Create(absl::string_view name,
                                              LinearExpr expression,
                                              ConstraintSense sense,
                                              double rhs) {
  if (name.empty()) {
    return absl::InvalidArgumentError("constraint name must not be empty");
  }
  switch (sense) {
    case ConstraintSense::kLessOrEqual:
    case ConstraintSense::kGreaterOrEqual:
    case ConstraintSense::kEqual:
      break;
    default:
      return InvalidSenseError(absl::StrCat("constraint '", name,
                                            "' has sense #",
                                            static_cast<int>(sense)));
  }
  if (!std::isfinite(rhs)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "constraint '", name, "' has a non-finite right-hand side: ", rhs));
  }
  return Constraint(std::string(name), std::move(expression), sense, rhs);
}

absl::StatusOr<bool> Constraint::IsSatisfiedBy(
    const absl::flat_hash_map<std::string, double>& values,
    double tolerance) const {
  ASSIGN_OR_RETURN(const double activity, expression_.Evaluate(values));
  switch (sense_) {
    case ConstraintSense::kLessOrEqual:
      return activity <= rhs_ + tolerance;
    case ConstraintSense::kGreaterOrEqual:
      return activity >= rhs_ - tolerance;
    case ConstraintSense::kEqual:
      return std::abs(activity - rhs_) <= tolerance;
  }
  return false;
}

std::string Constraint::ToString() const {
  return absl::StrCat(name_, ": ", expression_.ToString(), " ",
                      ConstraintSenseSymbol(sense_), " ", rhs_);
}

}  // namespace wglp
