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

#include "wglp/model/result_decoder.h"

#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "wglp/base/status_matchers.h"
#include "wglp/model/goal.h"
#include "wglp/model/goal_model.h"
#include "wglp/model/linear_expr.h"
#include "wglp/model/variable.h"
#include "wglp/solver/linear_program.pb.h"

namespace wglp {
namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;

class ResultDecoderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const Variable* x = model_.AddVariable("x").value();
    Goal goal = Goal::Create("g", 2.0 * LinearExpr(x), 4.0).value();
    ASSERT_OK(model_.AddGoal(std::move(goal)).status());
  }

  GoalModel model_{"decoder"};
};

TEST_F(ResultDecoderTest, DecodesAnAssignment) {
  ProgramResponse response;
  response.set_status(PROGRAM_OPTIMAL);
  response.set_objective_value(1.0);
  response.add_variable_value(1.5);  // x
  response.add_variable_value(1.0);  // n_g
  response.add_variable_value(0.0);  // p_g
  const WeightedSolution solution = DecodeWeightedSolution(model_, response);
  EXPECT_TRUE(solution.optimal());
  EXPECT_EQ(solution.variables.size(), 1u);
  EXPECT_EQ(solution.variables.at("x"), 1.5);
  EXPECT_EQ(solution.deviations.at("g").first, 1.0);
  EXPECT_EQ(solution.deviations.at("g").second, 0.0);
  EXPECT_EQ(solution.goal_values.at("g"), 3.0);
  EXPECT_THAT(solution.DebugString(), HasSubstr("goal g: under = 1"));
}

TEST_F(ResultDecoderTest, IgnoresAssignmentsOfTheWrongSize) {
  ProgramResponse response;
  response.set_status(PROGRAM_OPTIMAL);
  response.add_variable_value(1.5);
  const WeightedSolution solution = DecodeWeightedSolution(model_, response);
  EXPECT_EQ(solution.status, PROGRAM_OPTIMAL);
  EXPECT_THAT(solution.variables, IsEmpty());
  EXPECT_THAT(solution.deviations, IsEmpty());
}

TEST_F(ResultDecoderTest, NoAssignment) {
  ProgramResponse response;
  response.set_status(PROGRAM_INFEASIBLE);
  const WeightedSolution solution = DecodeWeightedSolution(model_, response);
  EXPECT_FALSE(solution.optimal());
  EXPECT_EQ(solution.status_name, "Infeasible");
  EXPECT_FALSE(solution.objective.has_value());
  EXPECT_THAT(solution.goal_values, IsEmpty());
  EXPECT_THAT(solution.DebugString(), HasSubstr("objective: none"));
}

}  // namespace
}  // namespace wglp
