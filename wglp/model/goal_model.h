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

#ifndef WGLP_MODEL_GOAL_MODEL_H_
#define WGLP_MODEL_GOAL_MODEL_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "wglp/model/constraint.h"
#include "wglp/model/goal.h"
#include "wglp/model/linear_expr.h"
#include "wglp/model/result_decoder.h"
#include "wglp/model/variable.h"
#include "wglp/model/variable_registry.h"
#include "wglp/solver/linear_program.pb.h"
#include "wglp/solver/solver_adapter.h"

namespace wglp {

// The two deviation variables synthesized for a registered goal.
struct GoalDeviations {
  const Variable* under = nullptr;  // n_<goal>
  const Variable* over = nullptr;   // p_<goal>
};

struct WeightedSolveOptions {
  // Added to the objective as cost_weight * cost, when set and
  // cost_weight != 0. A negative weight maximizes the cost expression.
  std::optional<LinearExpr> cost;
  double cost_weight = 0.0;

  // Replaces the registered weights of some goals for this solve only. The
  // goal sense still applies on top of them.
  absl::flat_hash_map<std::string, DeviationWeights> goal_weights;

  SolverParameters parameters;
};

/**
 * Weighted goal linear programming model.
 *
 * The caller declares decision variables, hard constraints and goals, then
 * calls SolveWeighted(). Registering a goal atomically creates its deviation
 * variables n_<goal> and p_<goal> (both >= 0) and its linking constraint
 * goal_link_<goal>: expression + n_<goal> - p_<goal> == target. The weighted
 * solve minimizes
 *
 *   sum_goals (w-_g * n_g + w+_g * p_g) + cost_weight * cost,
 *
 * where the goal sense zeroes the weight of the unpenalized direction.
 *
 * Constraint and goal names share one namespace. Every registration either
 * fully succeeds or leaves the model untouched.
 *
 * A GoalModel is self-contained and not thread-safe: it must be built and
 * solved by one thread at a time. Distinct models are independent.
 *
 * \code
   GoalModel model("diet");
   const Variable* rice = model.AddVariable("Rice").value();
   const Variable* dal = model.AddVariable("Dal").value();
   CHECK_OK(model.AddConstraint("capacity", LinearExpr(rice) + dal,
                                ConstraintSense::kLessOrEqual, 20.0));
   CHECK_OK(model.AddGoal(
       Goal::Create("energy", 5.0 * LinearExpr(rice) + 10.0 * LinearExpr(dal),
                    200.0).value()));
   const WeightedSolution solution = model.SolveWeighted().value();
   \endcode
 */
class GoalModel {
 public:
  explicit GoalModel(absl::string_view name);
  GoalModel(const GoalModel&) = delete;
  GoalModel& operator=(const GoalModel&) = delete;

  const std::string& name() const { return name_; }

  // ----- Variables -----

  // Default: continuous, in [0, +inf). Fails with DuplicateNameError if the
  // name is taken, deviation variables of goals included.
  absl::StatusOr<const Variable*> AddVariable(
      absl::string_view name, double lower_bound = 0.0,
      double upper_bound = kInfinity,
      VariableCategory category = VariableCategory::kContinuous);

  absl::StatusOr<const Variable*> LookupVariable(absl::string_view name) const;

  // ----- Hard constraints -----

  // Fails with DuplicateNameError if a constraint or a goal already uses the
  // name, with UnknownVariableError if the expression refers to a variable
  // name unknown to this model, and with InvalidArgument on a non-finite
  // coefficient or offset.
  absl::Status AddConstraint(Constraint constraint);
  absl::Status AddConstraint(absl::string_view name, LinearExpr expression,
                             ConstraintSense sense, double rhs);

  // ----- Goals -----

  // Synthesizes the deviation pair and the linking constraint. Fails with
  // DuplicateNameError when the goal name, its linking constraint name, or
  // one of its deviation variable names is taken, with UnknownVariableError
  // on a variable name unknown to this model, and with InvalidArgument on a
  // non-finite coefficient or offset. Nothing is registered on failure.
  absl::StatusOr<GoalDeviations> AddGoal(Goal goal);

  // Fails with NotFound if no goal has this name.
  absl::StatusOr<GoalDeviations> GetGoalDeviations(
      absl::string_view goal_name) const;

  // ----- Weighted solve -----

  /**
   * Assembles the program handed to the solver: every variable, every
   * constraint (user and linking ones, in registration order), and the
   * weighted objective.
   *
   * Fails with InvalidWeightError on a negative or non finite goal weight
   * or on a non finite cost_weight, with NotFound on a weight override for
   * an unknown goal, with UnknownVariableError on a variable name unknown to
   * this model in the cost, and with FailedPrecondition if the objective has
   * no term at all.
   */
  absl::StatusOr<ProgramRequest> BuildWeightedProgram(
      const WeightedSolveOptions& options = WeightedSolveOptions()) const;

  /**
   * Builds the weighted program, solves it with the backend named in
   * options.parameters, and decodes the answer. Only misuse is an error:
   * infeasible, unbounded or failed solves are reported in
   * WeightedSolution::status.
   */
  absl::StatusOr<WeightedSolution> SolveWeighted(
      const WeightedSolveOptions& options = WeightedSolveOptions()) const;

  // Same, with a caller supplied backend.
  absl::StatusOr<WeightedSolution> SolveWeighted(
      const WeightedSolveOptions& options, SolverAdapter& adapter) const;

  // ----- Introspection -----

  int num_variables() const { return registry_.size(); }
  int num_constraints() const { return static_cast<int>(constraints_.size()); }
  int num_goals() const { return static_cast<int>(goals_.size()); }

  const VariableRegistry& variables() const { return registry_; }
  // User constraints and linking constraints, in registration order.
  const std::vector<Constraint>& constraints() const { return constraints_; }
  // In registration order.
  const std::vector<Goal>& goals() const { return goals_; }

  // False for the deviation variables synthesized for goals.
  bool IsDecisionVariable(const Variable& var) const {
    return !deviation_variables_.contains(var.name());
  }

  std::string DebugString() const;

 private:
  bool IsNameTaken(absl::string_view constraint_or_goal_name) const {
    return constraint_index_.contains(constraint_or_goal_name) ||
           goal_index_.contains(constraint_or_goal_name);
  }

  // UnknownVariableError unless every variable of `expression` exists here;
  // InvalidArgument on a non-finite coefficient or offset.
  absl::Status CheckExpression(const LinearExpr& expression) const;

  const std::string name_;
  VariableRegistry registry_;
  std::vector<Constraint> constraints_;
  absl::flat_hash_map<std::string, int> constraint_index_;
  std::vector<Goal> goals_;
  std::vector<GoalDeviations> goal_deviations_;
  absl::flat_hash_map<std::string, int> goal_index_;
  absl::flat_hash_set<std::string> deviation_variables_;
};

}  // namespace wglp

#endif  // WGLP_MODEL_GOAL_MODEL_H_
