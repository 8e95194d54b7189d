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

#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "wglp/base/status_matchers.h"
#include "wglp/model/constraint.h"
#include "wglp/model/error_matchers.h"
#include "wglp/model/errors.h"
#include "wglp/model/goal.h"
#include "wglp/model/linear_expr.h"
#include "wglp/model/result_decoder.h"
#include "wglp/model/variable.h"
#include "wglp/solver/linear_program.pb.h"
#include "wglp/solver/solver_adapter.h"

namespace wglp {
namespace {

using ::testing::DoubleEq;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Pair;
using ::wglp::testing::HasErrorKind;
using ::wglp::testing::StatusIs;

// Returns a canned response and keeps the last request.
class FakeAdapter : public SolverAdapter {
 public:
  explicit FakeAdapter(ProgramResponse response)
      : response_(std::move(response)) {}

  std::string name() const override { return "fake"; }
  bool SupportsIntegerVariables() const override { return false; }
  ProgramResponse Solve(const ProgramRequest& request) override {
    ++num_calls_;
    last_request_ = request;
    return response_;
  }

  int num_calls() const { return num_calls_; }
  const ProgramRequest& last_request() const { return last_request_; }

 private:
  const ProgramResponse response_;
  ProgramRequest last_request_;
  int num_calls_ = 0;
};

ProgramResponse MakeResponse(ProgramStatus status,
                             const std::vector<double>& values,
                             double objective) {
  ProgramResponse response;
  response.set_status(status);
  for (const double value : values) response.add_variable_value(value);
  if (!values.empty()) response.set_objective_value(objective);
  return response;
}

class GoalModelTest : public ::testing::Test {
 protected:
  void SetUp() override {
    rice_ = model_.AddVariable("Rice").value();
    dal_ = model_.AddVariable("Dal").value();
  }

  LinearExpr Energy() const {
    return 5.0 * LinearExpr(rice_) + 10.0 * LinearExpr(dal_);
  }

  // Rice + Dal <= 20 and the goal 5 Rice + 10 Dal -> 200.
  void AddDiet() {
    ASSERT_OK(model_.AddConstraint("capacity",
                                   LinearExpr(rice_) + LinearExpr(dal_),
                                   ConstraintSense::kLessOrEqual, 20.0));
    ASSERT_OK_AND_ASSIGN(Goal goal, Goal::Create("energy", Energy(), 200.0));
    ASSERT_OK(model_.AddGoal(std::move(goal)).status());
  }

  GoalModel model_{"diet"};
  const Variable* rice_ = nullptr;
  const Variable* dal_ = nullptr;
};

TEST_F(GoalModelTest, AddGoalCreatesDeviationsAndLink) {
  ASSERT_OK_AND_ASSIGN(Goal goal, Goal::Create("energy", Energy(), 200.0));
  ASSERT_OK_AND_ASSIGN(const GoalDeviations deviations,
                       model_.AddGoal(std::move(goal)));
  EXPECT_EQ(deviations.under->name(), "n_energy");
  EXPECT_EQ(deviations.over->name(), "p_energy");
  for (const Variable* var : {deviations.under, deviations.over}) {
    EXPECT_EQ(var->lower_bound(), 0.0);
    EXPECT_EQ(var->upper_bound(), kInfinity);
    EXPECT_EQ(var->category(), VariableCategory::kContinuous);
    EXPECT_FALSE(model_.IsDecisionVariable(*var));
  }
  EXPECT_TRUE(model_.IsDecisionVariable(*rice_));
  EXPECT_EQ(model_.num_variables(), 4);
  EXPECT_EQ(model_.num_goals(), 1);
  ASSERT_EQ(model_.num_constraints(), 1);

  const Constraint& link = model_.constraints()[0];
  EXPECT_EQ(link.name(), "goal_link_energy");
  EXPECT_EQ(link.sense(), ConstraintSense::kEqual);
  EXPECT_EQ(link.rhs(), 200.0);
  EXPECT_EQ(link.expression().coefficient("Rice"), 5.0);
  EXPECT_EQ(link.expression().coefficient("Dal"), 10.0);
  EXPECT_EQ(link.expression().coefficient("n_energy"), 1.0);
  EXPECT_EQ(link.expression().coefficient("p_energy"), -1.0);

  ASSERT_OK_AND_ASSIGN(const GoalDeviations found,
                       model_.GetGoalDeviations("energy"));
  EXPECT_EQ(found.under, deviations.under);
  EXPECT_EQ(found.over, deviations.over);
  EXPECT_THAT(model_.GetGoalDeviations("protein").status(),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST_F(GoalModelTest, ConstraintAndGoalNamesShareANamespace) {
  ASSERT_OK(model_.AddConstraint("energy", LinearExpr(rice_),
                                 ConstraintSense::kGreaterOrEqual, 1.0));
  ASSERT_OK_AND_ASSIGN(Goal goal, Goal::Create("energy", Energy(), 200.0));
  const absl::Status status = model_.AddGoal(std::move(goal)).status();
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kAlreadyExists));
  EXPECT_THAT(status, HasErrorKind(ErrorKind::kDuplicateName));

  ASSERT_OK_AND_ASSIGN(Goal other, Goal::Create("protein", Energy(), 10.0));
  ASSERT_OK(model_.AddGoal(std::move(other)).status());
  EXPECT_THAT(model_.AddConstraint("protein", LinearExpr(dal_),
                                   ConstraintSense::kLessOrEqual, 3.0),
              HasErrorKind(ErrorKind::kDuplicateName));
  // Linking constraint names are taken too.
  EXPECT_THAT(model_.AddConstraint("goal_link_protein", LinearExpr(dal_),
                                   ConstraintSense::kLessOrEqual, 3.0),
              HasErrorKind(ErrorKind::kDuplicateName));
}

TEST_F(GoalModelTest, FailedGoalRegistrationLeavesTheModelUntouched) {
  ASSERT_OK(model_.AddVariable("n_energy").status());
  const int num_variables = model_.num_variables();

  ASSERT_OK_AND_ASSIGN(Goal goal, Goal::Create("energy", Energy(), 200.0));
  const absl::Status status = model_.AddGoal(std::move(goal)).status();
  EXPECT_THAT(status, HasErrorKind(ErrorKind::kDuplicateName));
  EXPECT_THAT(status.message(), HasSubstr("n_energy"));
  EXPECT_EQ(model_.num_variables(), num_variables);
  EXPECT_EQ(model_.num_constraints(), 0);
  EXPECT_EQ(model_.num_goals(), 0);
  EXPECT_FALSE(model_.variables().Contains("p_energy"));
  EXPECT_THAT(model_.GetGoalDeviations("energy").status(),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST_F(GoalModelTest, DuplicateConstraintName) {
  ASSERT_OK(model_.AddConstraint("capacity", LinearExpr(rice_),
                                 ConstraintSense::kLessOrEqual, 20.0));
  const absl::Status status = model_.AddConstraint(
      "capacity", LinearExpr(dal_), ConstraintSense::kLessOrEqual, 5.0);
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kAlreadyExists));
  EXPECT_THAT(status, HasErrorKind(ErrorKind::kDuplicateName));
  EXPECT_EQ(model_.num_constraints(), 1);
  EXPECT_EQ(model_.num_variables(), 2);
  EXPECT_EQ(model_.constraints()[0].rhs(), 20.0);
}

TEST_F(GoalModelTest, DuplicateGoalNameLeavesCountsUnchanged) {
  AddDiet();
  ASSERT_OK_AND_ASSIGN(Goal again, Goal::Create("energy", Energy(), 100.0));
  EXPECT_THAT(model_.AddGoal(std::move(again)),
              HasErrorKind(ErrorKind::kDuplicateName));
  EXPECT_EQ(model_.num_variables(), 4);
  EXPECT_EQ(model_.num_constraints(), 2);
  EXPECT_EQ(model_.num_goals(), 1);
  EXPECT_EQ(model_.goals()[0].target(), 200.0);
}

TEST_F(GoalModelTest, RejectsVariableNamesUnknownToTheModel) {
  GoalModel other("other");
  const Variable* foreign = other.AddVariable("Wheat").value();
  ASSERT_OK_AND_ASSIGN(
      Goal goal, Goal::Create("energy", Energy() + LinearExpr(foreign), 1.0));
  EXPECT_THAT(model_.AddGoal(std::move(goal)),
              HasErrorKind(ErrorKind::kUnknownVariable));
  EXPECT_THAT(model_.AddConstraint("c", LinearExpr(foreign),
                                   ConstraintSense::kEqual, 1.0),
              HasErrorKind(ErrorKind::kUnknownVariable));
  EXPECT_EQ(model_.num_variables(), 2);
  EXPECT_EQ(model_.num_constraints(), 0);
}

TEST_F(GoalModelTest, NonFiniteExpressionsAreRejectedOnRegistration) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  EXPECT_THAT(model_.AddConstraint("cap", LinearExpr(rice_),
                                   ConstraintSense::kLessOrEqual, inf),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(model_.AddConstraint("cap", inf * LinearExpr(rice_),
                                   ConstraintSense::kLessOrEqual, 10.0),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(model_.AddConstraint("cap", LinearExpr(rice_) + nan,
                                   ConstraintSense::kLessOrEqual, 10.0),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_EQ(model_.num_constraints(), 0);

  ASSERT_OK_AND_ASSIGN(Goal goal,
                       Goal::Create("g", nan * LinearExpr(rice_), 4.0));
  EXPECT_THAT(model_.AddGoal(std::move(goal)).status(),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_EQ(model_.num_goals(), 0);
  EXPECT_EQ(model_.num_variables(), 2);
  EXPECT_EQ(model_.num_constraints(), 0);
}

TEST_F(GoalModelTest, IntegerVariableWithoutIntegerInItsBounds) {
  EXPECT_THAT(
      model_.AddVariable("k", 0.2, 0.8, VariableCategory::kInteger).status(),
      StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_FALSE(model_.variables().Contains("k"));
}

TEST_F(GoalModelTest, DuplicateVariable) {
  EXPECT_THAT(model_.AddVariable("Rice"),
              HasErrorKind(ErrorKind::kDuplicateName));
  ASSERT_OK_AND_ASSIGN(const Variable* rice, model_.LookupVariable("Rice"));
  EXPECT_EQ(rice, rice_);
}

TEST_F(GoalModelTest, BuildWeightedProgram) {
  AddDiet();
  ASSERT_OK_AND_ASSIGN(const ProgramRequest request,
                       model_.BuildWeightedProgram());
  const ProgramProto& program = request.program();
  EXPECT_EQ(program.name(), "diet");
  ASSERT_EQ(program.variable_size(), 4);
  EXPECT_EQ(program.variable(0).name(), "Rice");
  EXPECT_EQ(program.variable(1).name(), "Dal");
  EXPECT_EQ(program.variable(2).name(), "n_energy");
  EXPECT_EQ(program.variable(3).name(), "p_energy");
  EXPECT_EQ(program.variable(0).objective_coefficient(), 0.0);
  EXPECT_EQ(program.variable(1).objective_coefficient(), 0.0);
  EXPECT_EQ(program.variable(2).objective_coefficient(), 1.0);
  EXPECT_EQ(program.variable(3).objective_coefficient(), 1.0);
  EXPECT_EQ(program.objective_offset(), 0.0);

  ASSERT_EQ(program.constraint_size(), 2);
  const ConstraintProto& capacity = program.constraint(0);
  EXPECT_EQ(capacity.name(), "capacity");
  EXPECT_EQ(capacity.sense(), ConstraintProto::LESS_OR_EQUAL);
  EXPECT_EQ(capacity.rhs(), 20.0);
  EXPECT_THAT(capacity.var_index(), ElementsAre(0, 1));
  EXPECT_THAT(capacity.coefficient(), ElementsAre(1.0, 1.0));
  const ConstraintProto& link = program.constraint(1);
  EXPECT_EQ(link.name(), "goal_link_energy");
  EXPECT_EQ(link.sense(), ConstraintProto::EQUAL);
  EXPECT_EQ(link.rhs(), 200.0);
  EXPECT_THAT(link.var_index(), ElementsAre(0, 1, 2, 3));
  EXPECT_THAT(link.coefficient(), ElementsAre(5.0, 10.0, 1.0, -1.0));
}

TEST_F(GoalModelTest, ExpressionOffsetsMoveToTheRightHandSide) {
  ASSERT_OK(model_.AddConstraint("shifted", LinearExpr(rice_) + 5.0,
                                 ConstraintSense::kGreaterOrEqual, 8.0));
  ASSERT_OK_AND_ASSIGN(Goal goal,
                       Goal::Create("energy", Energy() + 50.0, 200.0));
  ASSERT_OK(model_.AddGoal(std::move(goal)).status());
  ASSERT_OK_AND_ASSIGN(const ProgramRequest request,
                       model_.BuildWeightedProgram());
  EXPECT_EQ(request.program().constraint(0).rhs(), 3.0);
  EXPECT_EQ(request.program().constraint(1).rhs(), 150.0);
}

TEST_F(GoalModelTest, WeightsSenseCostAndOverrides) {
  ASSERT_OK_AND_ASSIGN(
      Goal energy, Goal::Create("energy", Energy(), 200.0,
                                GoalSense::kPenalizeUnder, /*weight=*/3.0));
  ASSERT_OK(model_.AddGoal(std::move(energy)).status());

  WeightedSolveOptions options;
  options.cost = 2.0 * LinearExpr(rice_) + LinearExpr(dal_) + 1.0;
  options.cost_weight = 0.5;
  ASSERT_OK_AND_ASSIGN(ProgramRequest request,
                       model_.BuildWeightedProgram(options));
  const ProgramProto* program = &request.program();
  EXPECT_EQ(program->variable(0).objective_coefficient(), 1.0);
  EXPECT_EQ(program->variable(1).objective_coefficient(), 0.5);
  EXPECT_EQ(program->variable(2).objective_coefficient(), 3.0);
  EXPECT_EQ(program->variable(3).objective_coefficient(), 0.0);
  EXPECT_EQ(program->objective_offset(), 0.5);

  // The override replaces the registered weights, the sense still applies.
  options.cost_weight = 0.0;
  options.goal_weights["energy"] = DeviationWeights{7.0, 9.0};
  ASSERT_OK_AND_ASSIGN(request, model_.BuildWeightedProgram(options));
  program = &request.program();
  EXPECT_EQ(program->variable(0).objective_coefficient(), 0.0);
  EXPECT_EQ(program->variable(2).objective_coefficient(), 7.0);
  EXPECT_EQ(program->variable(3).objective_coefficient(), 0.0);
  EXPECT_EQ(program->objective_offset(), 0.0);

  // Registered weights are unchanged.
  EXPECT_EQ(model_.goals()[0].weights().under, 3.0);
}

TEST_F(GoalModelTest, NegativeCostWeightMaximizesTheCost) {
  AddDiet();
  WeightedSolveOptions options;
  options.cost = 2.0 * LinearExpr(rice_) + 4.0;
  options.cost_weight = -0.5;
  ASSERT_OK_AND_ASSIGN(const ProgramRequest request,
                       model_.BuildWeightedProgram(options));
  const ProgramProto& program = request.program();
  EXPECT_EQ(program.variable(0).objective_coefficient(), -1.0);
  EXPECT_EQ(program.variable(1).objective_coefficient(), 0.0);
  EXPECT_EQ(program.variable(2).objective_coefficient(), 1.0);
  EXPECT_EQ(program.objective_offset(), -2.0);
}

TEST_F(GoalModelTest, RejectsBadSolveOptions) {
  AddDiet();
  WeightedSolveOptions options;
  options.cost = LinearExpr(rice_);
  options.cost_weight = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THAT(model_.BuildWeightedProgram(options),
              HasErrorKind(ErrorKind::kInvalidWeight));
  options.cost_weight = std::numeric_limits<double>::infinity();
  EXPECT_THAT(model_.BuildWeightedProgram(options),
              HasErrorKind(ErrorKind::kInvalidWeight));

  options.cost_weight = 1.0;
  options.goal_weights["energy"] = DeviationWeights{-1.0, 1.0};
  EXPECT_THAT(model_.BuildWeightedProgram(options),
              HasErrorKind(ErrorKind::kInvalidWeight));

  options.goal_weights.clear();
  options.goal_weights["protein"] = DeviationWeights();
  EXPECT_THAT(model_.BuildWeightedProgram(options).status(),
              StatusIs(absl::StatusCode::kNotFound, HasSubstr("protein")));

  options.goal_weights.clear();
  options.cost = LinearExpr::Term("Wheat", 1.0);
  EXPECT_THAT(model_.BuildWeightedProgram(options),
              HasErrorKind(ErrorKind::kUnknownVariable));
}

TEST_F(GoalModelTest, EmptyObjectiveIsRejected) {
  ASSERT_OK(model_.AddConstraint("capacity", LinearExpr(rice_),
                                 ConstraintSense::kLessOrEqual, 20.0));
  EXPECT_THAT(model_.BuildWeightedProgram().status(),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  WeightedSolveOptions options;
  options.cost = LinearExpr(rice_);
  // A zero cost weight drops the cost term.
  EXPECT_THAT(model_.BuildWeightedProgram(options).status(),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  options.cost_weight = 1.0;
  EXPECT_OK(model_.BuildWeightedProgram(options).status());
}

TEST_F(GoalModelTest, SolveWeightedDecodesTheResponse) {
  AddDiet();
  FakeAdapter adapter(
      MakeResponse(PROGRAM_OPTIMAL, {10.0, 10.0, 50.0, 0.0}, 50.0));
  ASSERT_OK_AND_ASSIGN(const WeightedSolution solution,
                       model_.SolveWeighted({}, adapter));
  EXPECT_EQ(adapter.num_calls(), 1);
  EXPECT_TRUE(solution.optimal());
  EXPECT_EQ(solution.status_name, "Optimal");
  EXPECT_THAT(solution.variables,
              ElementsAre(Pair("Dal", 10.0), Pair("Rice", 10.0)));
  EXPECT_THAT(solution.deviations,
              ElementsAre(Pair("energy", Pair(50.0, 0.0))));
  EXPECT_THAT(solution.goal_values,
              ElementsAre(Pair("energy", DoubleEq(150.0))));
  ASSERT_TRUE(solution.objective.has_value());
  EXPECT_EQ(*solution.objective, 50.0);
}

TEST_F(GoalModelTest, SolverFailuresArePassedThrough) {
  AddDiet();
  for (const ProgramStatus status :
       {PROGRAM_INFEASIBLE, PROGRAM_UNBOUNDED, PROGRAM_ERROR,
        PROGRAM_NOT_SOLVED}) {
    ProgramResponse response;
    response.set_status(status);
    response.set_status_str("details");
    FakeAdapter adapter(response);
    ASSERT_OK_AND_ASSIGN(const WeightedSolution solution,
                         model_.SolveWeighted({}, adapter));
    EXPECT_EQ(solution.status, status);
    EXPECT_EQ(solution.status_name, ProgramStatusName(status));
    EXPECT_EQ(solution.details, "details");
    EXPECT_FALSE(solution.objective.has_value());
    EXPECT_THAT(solution.variables, IsEmpty());
    EXPECT_THAT(solution.deviations, IsEmpty());
    EXPECT_THAT(solution.goal_values, IsEmpty());
  }
}

TEST_F(GoalModelTest, IntegerVariablesNeedACapableBackend) {
  ASSERT_OK_AND_ASSIGN(
      const Variable* bags,
      model_.AddVariable("Bags", 0.0, 10.0, VariableCategory::kInteger));
  ASSERT_OK_AND_ASSIGN(Goal goal,
                       Goal::Create("bags", LinearExpr(bags), 3.0));
  ASSERT_OK(model_.AddGoal(std::move(goal)).status());
  FakeAdapter adapter(MakeResponse(PROGRAM_OPTIMAL, {}, 0.0));
  ASSERT_OK_AND_ASSIGN(const WeightedSolution solution,
                       model_.SolveWeighted({}, adapter));
  EXPECT_EQ(solution.status, PROGRAM_INVALID);
  EXPECT_EQ(adapter.num_calls(), 0);
}

TEST_F(GoalModelTest, ParametersReachTheBackend) {
  AddDiet();
  FakeAdapter adapter(MakeResponse(PROGRAM_NOT_SOLVED, {}, 0.0));
  WeightedSolveOptions options;
  options.parameters.set_time_limit_seconds(2.5);
  options.parameters.set_enable_output(true);
  ASSERT_OK(model_.SolveWeighted(options, adapter).status());
  EXPECT_EQ(adapter.last_request().parameters().time_limit_seconds(), 2.5);
  EXPECT_TRUE(adapter.last_request().parameters().enable_output());
}

TEST_F(GoalModelTest, DebugString) {
  AddDiet();
  EXPECT_EQ(model_.DebugString(),
            "GoalModel(name=diet, vars=4, constraints=2, goals=1)");
}

}  // namespace
}  // namespace wglp
