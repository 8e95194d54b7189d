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

#include "wglp/model/goal.h"

#include <cmath>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "wglp/base/status_macros.h"
#include "wglp/model/errors.h"
#include "wglp/model/linear_expr.h"

namespace wglp {
namespace {

constexpr absl::string_view kUnderDeviationPrefix = "n_";
constexpr absl::string_view kOverDeviationPrefix = "p_";
constexpr absl::string_view kLinkingConstraintPrefix = "goal_link_";

bool IsValidWeight(double weight) {
  return std::isfinite(weight) && weight >= 0.0;
}

}  // namespace

std::string GoalSenseName(GoalSense sense) {
  switch (sense) {
    case GoalSense::kAttain:
      return "attain";
    case GoalSense::kPenalizeUnder:
      return "penalize_under";
    case GoalSense::kPenalizeOver:
      return "penalize_over";
  }
  return "unknown";
}

absl::StatusOr<GoalSense> ParseGoalSense(absl::string_view text) {
  const std::string name =
      absl::AsciiStrToLower(absl::StripAsciiWhitespace(text));
  if (name == "attain") return GoalSense::kAttain;
  if (name == "penalize_under" || name == "minimize_under") {
    return GoalSense::kPenalizeUnder;
  }
  if (name == "penalize_over" || name == "minimize_over") {
    return GoalSense::kPenalizeOver;
  }
  return InvalidSenseError(absl::StrCat("unknown goal sense '", text, "'"));
}

absl::Status ValidateDeviationWeights(absl::string_view owner,
                                      const DeviationWeights& weights) {
  if (!IsValidWeight(weights.under)) {
    return InvalidWeightError(owner, weights.under);
  }
  if (!IsValidWeight(weights.over)) {
    return InvalidWeightError(owner, weights.over);
  }
  return absl::OkStatus();
}

DeviationWeights EffectiveDeviationWeights(GoalSense sense,
                                           const DeviationWeights& weights) {
  switch (sense) {
    case GoalSense::kAttain:
      return weights;
    case GoalSense::kPenalizeUnder:
      return {weights.under, 0.0};
    case GoalSense::kPenalizeOver:
      return {0.0, weights.over};
  }
  return weights;
}

std::string UnderDeviationName(absl::string_view goal_name) {
  return absl::StrCat(kUnderDeviationPrefix, goal_name);
}

std::string OverDeviationName(absl::string_view goal_name) {
  return absl::StrCat(kOverDeviationPrefix, goal_name);
}

std::string LinkingConstraintName(absl::string_view goal_name) {
  return absl::StrCat(kLinkingConstraintPrefix, goal_name);
}

// static
absl::StatusOr<Goal> Goal::Create(absl::string_view name,
                                  LinearExpr expression, double target,
                                  GoalSense sense, double weight,
                                  int priority) {
  return Create(name, std::move(expression), target, sense,
                DeviationWeights{weight, weight}, priority);
}

// static
absl::StatusOr<Goal> Goal::Create(absl::string_view name,
                                  LinearExpr expression, double target,
                                  GoalSense sense,
                                  const DeviationWeights& weights,
                                  int priority) {
  if (name.empty()) {
    return absl::InvalidArgumentError("goal name must not be empty");
  }
  switch (sense) {
    case GoalSense::kAttain:
    case GoalSense::kPenalizeUnder:
    case GoalSense::kPenalizeOver:
      break;
    default:
      return InvalidSenseError(absl::StrCat("goal '", name, "' has sense #",
                                            static_cast<int>(sense)));
  }
  RETURN_IF_ERROR(ValidateDeviationWeights(name, weights));
  if (!std::isfinite(target)) {
    return absl::InvalidArgumentError(
        absl::StrCat("goal '", name, "' has a non finite target: ", target));
  }
  if (priority < 1) {
    return absl::InvalidArgumentError(absl::StrCat(
        "goal '", name, "' has priority ", priority, ", expected >= 1"));
  }
  return Goal(std::string(name), std::move(expression), target, sense, weights,
              priority);
}

std::string Goal::ToString() const {
  return absl::StrCat(name_, ": ", expression_.ToString(), " -> ", target_,
                      " (", GoalSenseName(sense_), ", w-=", weights_.under,
                      ", w+=", weights_.over, ", priority=", priority_, ")");
}

}  // namespace wglp
