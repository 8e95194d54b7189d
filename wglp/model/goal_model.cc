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

#include "wglp/model/goal_model.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "wglp/base/logging.h"
#include "wglp/base/status_macros.h"
#include "wglp/model/constraint.h"
#include "wglp/model/errors.h"
#include "wglp/model/goal.h"
#include "wglp/model/linear_expr.h"
#include "wglp/model/result_decoder.h"
#include "wglp/model/variable.h"
#include "wglp/solver/linear_program.pb.h"
#include "wglp/solver/solver_adapter.h"

namespace wglp {
namespace {

VariableProto::Category ToProto(VariableCategory category) {
  switch (category) {
    case VariableCategory::kContinuous:
      return VariableProto::CONTINUOUS;
    case VariableCategory::kInteger:
      return VariableProto::INTEGER;
    case VariableCategory::kBinary:
      return VariableProto::BINARY;
  }
  return VariableProto::CONTINUOUS;
}

ConstraintProto::Sense ToProto(ConstraintSense sense) {
  switch (sense) {
    case ConstraintSense::kLessOrEqual:
      return ConstraintProto::LESS_OR_EQUAL;
    case ConstraintSense::kGreaterOrEqual:
      return ConstraintProto::GREATER_OR_EQUAL;
    case ConstraintSense::kEqual:
      return ConstraintProto::EQUAL;
  }
  return ConstraintProto::EQUAL;
}

}  // namespace

GoalModel::GoalModel(absl::string_view name) : name_(name) {}

absl::StatusOr<const Variable*> GoalModel::AddVariable(
    absl::string_view name, double lower_bound, double upper_bound,
    VariableCategory category) {
  return registry_.Create(name, lower_bound, upper_bound, category);
}

absl::StatusOr<const Variable*> GoalModel::LookupVariable(
    absl::string_view name) const {
  return registry_.Lookup(name);
}

absl::Status GoalModel::CheckExpression(const LinearExpr& expression) const {
  for (const auto& [var_name, coefficient] : expression.terms()) {
    if (!registry_.Contains(var_name)) return UnknownVariableError(var_name);
    if (!std::isfinite(coefficient)) {
      return absl::InvalidArgumentError(absl::StrCat(
          "non-finite coefficient ", coefficient, " on variable '", var_name,
          "'"));
    }
  }
  if (!std::isfinite(expression.offset())) {
    return absl::InvalidArgumentError(
        absl::StrCat("non-finite expression offset ", expression.offset()));
  }
  return absl::OkStatus();
}

absl::Status GoalModel::AddConstraint(Constraint constraint) {
  if (IsNameTaken(constraint.name())) {
    return DuplicateNameError("constraint", constraint.name());
  }
  RETURN_IF_ERROR(CheckExpression(constraint.expression()));
  constraint_index_[constraint.name()] = num_constraints();
  constraints_.push_back(std::move(constraint));
  return absl::OkStatus();
}

absl::Status GoalModel::AddConstraint(absl::string_view name,
                                      LinearExpr expression,
                                      ConstraintSense sense, double rhs) {
  ASSIGN_OR_RETURN(Constraint constraint,
                   Constraint::Create(name, std::move(expression), sense, rhs));
  return AddConstraint(std::move(constraint));
}

absl::StatusOr<GoalDeviations> GoalModel::AddGoal(Goal goal) {
  // Everything that may fail is checked before anything is registered.
  if (IsNameTaken(goal.name())) {
    return DuplicateNameError("goal", goal.name());
  }
  const std::string link_name = goal.linking_constraint_name();
  if (IsNameTaken(link_name)) {
    return DuplicateNameError("constraint", link_name);
  }
  RETURN_IF_ERROR(CheckExpression(goal.expression()));
  const std::string under_name = goal.under_variable_name();
  const std::string over_name = goal.over_variable_name();
  for (const std::string& var_name : {under_name, over_name}) {
    if (registry_.Contains(var_name)) {
      return DuplicateNameError("variable", var_name);
    }
  }

  GoalDeviations deviations;
  ASSIGN_OR_RETURN(deviations.under, registry_.Create(under_name));
  ASSIGN_OR_RETURN(deviations.over, registry_.Create(over_name));
  deviation_variables_.insert(under_name);
  deviation_variables_.insert(over_name);

  ASSIGN_OR_RETURN(
      Constraint link,
      Constraint::Create(link_name,
                         goal.expression() + LinearExpr(deviations.under) -
                             LinearExpr(deviations.over),
                         ConstraintSense::kEqual, goal.target()));
  constraint_index_[link_name] = num_constraints();
  constraints_.push_back(std::move(link));

  VLOG(1) << "Registered goal " << goal.ToString();
  goal_index_[goal.name()] = num_goals();
  goals_.push_back(std::move(goal));
  goal_deviations_.push_back(deviations);
  return deviations;
}

absl::StatusOr<GoalDeviations> GoalModel::GetGoalDeviations(
    absl::string_view goal_name) const {
  const auto it = goal_index_.find(goal_name);
  if (it == goal_index_.end()) {
    return absl::NotFoundError(absl::StrCat("unknown goal '", goal_name, "'"));
  }
  return goal_deviations_[it->second];
}

absl::StatusOr<ProgramRequest> GoalModel::BuildWeightedProgram(
    const WeightedSolveOptions& options) const {
  if (!std::isfinite(options.cost_weight)) {
    return InvalidWeightError("cost", options.cost_weight);
  }
  for (const auto& [goal_name, weights] : options.goal_weights) {
    if (!goal_index_.contains(goal_name)) {
      return absl::NotFoundError(
          absl::StrCat("weights given for unknown goal '", goal_name, "'"));
    }
    RETURN_IF_ERROR(ValidateDeviationWeights(goal_name, weights));
  }

  LinearExpr objective;
  bool has_objective_term = false;
  if (options.cost.has_value() && options.cost_weight != 0.0) {
    RETURN_IF_ERROR(CheckExpression(*options.cost));
    objective = objective + options.cost_weight * *options.cost;
    has_objective_term = true;
  }
  for (int g = 0; g < num_goals(); ++g) {
    const Goal& goal = goals_[g];
    const auto override_it = options.goal_weights.find(goal.name());
    const DeviationWeights weights = EffectiveDeviationWeights(
        goal.sense(), override_it == options.goal_weights.end()
                          ? goal.weights()
                          : override_it->second);
    objective = objective +
                LinearExpr::Term(*goal_deviations_[g].under, weights.under) +
                LinearExpr::Term(*goal_deviations_[g].over, weights.over);
    has_objective_term = true;
  }
  if (!has_objective_term) {
    return absl::FailedPreconditionError(absl::StrCat(
        "model '", name_, "' has no objective terms: add a goal or a cost"));
  }
  VLOG(1) << "Weighted objective of '" << name_ << "': " << objective;

  ProgramRequest request;
  *request.mutable_parameters() = options.parameters;
  ProgramProto* const program = request.mutable_program();
  program->set_name(name_);
  program->set_objective_offset(objective.offset());
  for (const std::unique_ptr<Variable>& var : registry_.variables()) {
    VariableProto* const var_proto = program->add_variable();
    var_proto->set_name(var->name());
    var_proto->set_lower_bound(var->lower_bound());
    var_proto->set_upper_bound(var->upper_bound());
    var_proto->set_category(ToProto(var->category()));
    var_proto->set_objective_coefficient(objective.coefficient(var->name()));
  }

  std::vector<std::pair<int, double>> terms;
  for (const Constraint& constraint : constraints_) {
    ConstraintProto* const ct_proto = program->add_constraint();
    ct_proto->set_name(constraint.name());
    ct_proto->set_sense(ToProto(constraint.sense()));
    ct_proto->set_rhs(constraint.NormalizedRhs());
    // Sorted by variable index, so that the program does not depend on the
    // iteration order of the expression.
    terms.clear();
    for (const auto& [var_name, coefficient] :
         constraint.expression().terms()) {
      if (coefficient == 0.0) continue;
      ASSIGN_OR_RETURN(const Variable* var, registry_.Lookup(var_name));
      terms.emplace_back(var->index(), coefficient);
    }
    std::sort(terms.begin(), terms.end());
    for (const auto& [var_index, coefficient] : terms) {
      ct_proto->add_var_index(var_index);
      ct_proto->add_coefficient(coefficient);
    }
  }
  return request;
}

absl::StatusOr<WeightedSolution> GoalModel::SolveWeighted(
    const WeightedSolveOptions& options) const {
  ASSIGN_OR_RETURN(std::unique_ptr<SolverAdapter> adapter,
                   CreateSolverAdapter(options.parameters.solver_type()));
  return SolveWeighted(options, *adapter);
}

absl::StatusOr<WeightedSolution> GoalModel::SolveWeighted(
    const WeightedSolveOptions& options, SolverAdapter& adapter) const {
  ASSIGN_OR_RETURN(const ProgramRequest request, BuildWeightedProgram(options));
  const ProgramResponse response = SolveProgram(request, adapter);
  WeightedSolution solution = DecodeWeightedSolution(*this, response);
  LOG_IF(WARNING, !solution.optimal())
      << "Weighted solve of '" << name_ << "' ended with status "
      << solution.status_name
      << (solution.details.empty() ? "" : ": " + solution.details);
  return solution;
}

std::string GoalModel::DebugString() const {
  return absl::StrCat("GoalModel(name=", name_, ", vars=", num_variables(),
                      ", constraints=", num_constraints(),
                      ", goals=", num_goals(), ")");
}

}  // namespace wglp
