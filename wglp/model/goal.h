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

#ifndef WGLP_MODEL_GOAL_H_
#define WGLP_MODEL_GOAL_H_

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "wglp/model/linear_expr.h"

namespace wglp {

// Which deviations from the target are penalized in the weighted objective.
enum class GoalSense {
  // Both under- and over-achievement are penalized: expression == target.
  kAttain,
  // Only under-achievement is penalized: expression >= target.
  kPenalizeUnder,
  // Only over-achievement is penalized: expression <= target.
  kPenalizeOver,
};

// "attain", "penalize_under" or "penalize_over".
std::string GoalSenseName(GoalSense sense);

// Accepts the names above, and their aliases "minimize_under" and
// "minimize_over". Anything else fails with InvalidSenseError.
absl::StatusOr<GoalSense> ParseGoalSense(absl::string_view text);

// Penalty per unit of under-deviation (n) and over-deviation (p).
struct DeviationWeights {
  double under = 1.0;
  double over = 1.0;
};

// Fails with InvalidWeightError unless both weights are finite and >= 0.
// `owner` names the goal in the error message.
absl::Status ValidateDeviationWeights(absl::string_view owner,
                                      const DeviationWeights& weights);

// The weights that enter the objective: the direction that `sense` leaves
// unpenalized gets 0.
DeviationWeights EffectiveDeviationWeights(GoalSense sense,
                                           const DeviationWeights& weights);

// Names reserved for the artifacts synthesized when a goal is registered.
std::string UnderDeviationName(absl::string_view goal_name);  // "n_<goal>"
std::string OverDeviationName(absl::string_view goal_name);   // "p_<goal>"
std::string LinkingConstraintName(absl::string_view goal_name);

// A soft linear target. Registering it in a GoalModel creates the deviation
// variables n_<name>, p_<name> >= 0 and the linking constraint
//
//   expression + n_<name> - p_<name> == target.
class Goal {
 public:
  // A single weight shared by both directions.
  static absl::StatusOr<Goal> Create(absl::string_view name,
                                     LinearExpr expression, double target,
                                     GoalSense sense = GoalSense::kAttain,
                                     double weight = 1.0, int priority = 1);

  static absl::StatusOr<Goal> Create(absl::string_view name,
                                     LinearExpr expression, double target,
                                     GoalSense sense,
                                     const DeviationWeights& weights,
                                     int priority = 1);

  const std::string& name() const { return name_; }
  const LinearExpr& expression() const { return expression_; }
  double target() const { return target_; }
  GoalSense sense() const { return sense_; }
  const DeviationWeights& weights() const { return weights_; }

  // Informational; the weighted solve does not use it.
  int priority() const { return priority_; }

  DeviationWeights EffectiveWeights() const {
    return EffectiveDeviationWeights(sense_, weights_);
  }

  std::string under_variable_name() const { return UnderDeviationName(name_); }
  std::string over_variable_name() const { return OverDeviationName(name_); }
  std::string linking_constraint_name() const {
    return LinkingConstraintName(name_);
  }

  std::string ToString() const;

 private:
  Goal(std::string name, LinearExpr expression, double target, GoalSense sense,
       const DeviationWeights& weights, int priority)
      : name_(std::move(name)),
        expression_(std::move(expression)),
        target_(target),
        sense_(sense),
        weights_(weights),
        priority_(priority) {}

  std::string name_;
  LinearExpr expression_;
  double target_;
  GoalSense sense_;
  DeviationWeights weights_;
  int priority_;
};

}  // namespace wglp

#endif  // WGLP_MODEL_GOAL_H_
