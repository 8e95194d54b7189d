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

#include "wglp/solver/program_exporter.h"

#include <limits>
#include <string>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "wglp/base/status_matchers.h"
#include "wglp/solver/linear_program.pb.h"

namespace wglp {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using ::wglp::testing::StatusIs;

VariableProto* AddVariable(const std::string& name, double objective,
                           ProgramProto* program) {
  VariableProto* var = program->add_variable();
  var->set_name(name);
  var->set_objective_coefficient(objective);
  return var;
}

// The weighted program of: Rice + Dal <= 20, goal 5 Rice + 10 Dal -> 200.
ProgramProto DietProgram() {
  ProgramProto program;
  program.set_name("diet");
  AddVariable("Rice", 0.0, &program);
  AddVariable("Dal", 0.0, &program);
  AddVariable("n_energy", 1.0, &program);
  AddVariable("p_energy", 1.0, &program);
  ConstraintProto* capacity = program.add_constraint();
  capacity->set_name("capacity");
  capacity->set_sense(ConstraintProto::LESS_OR_EQUAL);
  capacity->set_rhs(20.0);
  for (const int i : {0, 1}) {
    capacity->add_var_index(i);
    capacity->add_coefficient(1.0);
  }
  ConstraintProto* link = program.add_constraint();
  link->set_name("goal_link_energy");
  link->set_sense(ConstraintProto::EQUAL);
  link->set_rhs(200.0);
  const double coefficients[] = {5.0, 10.0, 1.0, -1.0};
  for (int i = 0; i < 4; ++i) {
    link->add_var_index(i);
    link->add_coefficient(coefficients[i]);
  }
  return program;
}

TEST(ExportProgramAsLpFormatTest, DietProgram) {
  ASSERT_OK_AND_ASSIGN(const std::string lp,
                       ExportProgramAsLpFormat(DietProgram()));
  const std::string expected = R"(\ Generated by wglp
\   Name             : diet
\   Constraints      : 2
\   Variables        : 4
\     Binary         : 0
\     Integer        : 0
Minimize
 Obj: +1 n_energy +1 p_energy 
Subject to
 capacity: +1 Rice +1 Dal  <= 20
 goal_link_energy: +5 Rice +10 Dal +1 n_energy -1 p_energy  = 200
Bounds
 0 <= Rice
 0 <= Dal
 0 <= n_energy
 0 <= p_energy
End
)";
  EXPECT_EQ(lp, expected);
}

TEST(ExportProgramAsLpFormatTest, OffsetIntegersAndFreeVariables) {
  ProgramProto program;
  program.set_objective_offset(2.5);
  VariableProto* bags = AddVariable("Bags", 3.0, &program);
  bags->set_category(VariableProto::INTEGER);
  bags->set_upper_bound(10.0);
  VariableProto* pick = AddVariable("pick", 0.0, &program);
  pick->set_category(VariableProto::BINARY);
  pick->set_upper_bound(1.0);
  VariableProto* free_var = AddVariable("free", -1.0, &program);
  free_var->set_lower_bound(-std::numeric_limits<double>::infinity());
  ASSERT_OK_AND_ASSIGN(const std::string lp, ExportProgramAsLpFormat(program));
  EXPECT_THAT(lp, HasSubstr("\\   Name             : NoName\n"));
  EXPECT_THAT(lp, HasSubstr(" Obj: +2.5 Constant +3 Bags -1 free \n"));
  EXPECT_THAT(lp, HasSubstr(" 1 <= Constant <= 1\n"));
  EXPECT_THAT(lp, HasSubstr(" 0 <= Bags <= 10\n"));
  EXPECT_THAT(lp, HasSubstr(" 0 <= pick <= 1\n"));
  EXPECT_THAT(lp, HasSubstr(" free free\n"));
  EXPECT_THAT(lp, HasSubstr("Binaries\n pick\nGenerals\n Bags\nEnd\n"));
}

TEST(ExportProgramAsLpFormatTest, VariableNamedConstantKeepsItsOwnColumn) {
  ProgramProto program;
  AddVariable("Constant", 2.0, &program)->set_upper_bound(4.0);
  ASSERT_OK_AND_ASSIGN(std::string lp, ExportProgramAsLpFormat(program));
  EXPECT_THAT(lp, HasSubstr(" Obj: +2 Constant \n"));
  EXPECT_THAT(lp, HasSubstr(" 0 <= Constant <= 4\n"));

  program.set_objective_offset(1.5);
  ASSERT_OK_AND_ASSIGN(lp, ExportProgramAsLpFormat(program));
  EXPECT_THAT(lp, HasSubstr(" Obj: +1.5 Constant +2 Constant_1 \n"));
  EXPECT_THAT(lp, HasSubstr(" 1 <= Constant <= 1\n"));
  EXPECT_THAT(lp, HasSubstr(" 0 <= Constant_1 <= 4\n"));
  EXPECT_THAT(lp, Not(HasSubstr(" 0 <= Constant <= 4\n")));
}

TEST(ExportProgramAsLpFormatTest, RewritesForbiddenNames) {
  ProgramProto program;
  AddVariable("2x-y", 1.0, &program);
  AddVariable("a b", 1.0, &program);
  AddVariable("a_b", 1.0, &program);
  AddVariable("", 1.0, &program);
  ASSERT_OK_AND_ASSIGN(const std::string lp, ExportProgramAsLpFormat(program));
  EXPECT_THAT(lp, HasSubstr(" Obj: +1 _2x_y +1 a_b +1 a_b_1 +1 V3 \n"));
}

TEST(ExportProgramAsLpFormatTest, Obfuscate) {
  ProgramExportOptions options;
  options.obfuscate = true;
  ASSERT_OK_AND_ASSIGN(const std::string lp,
                       ExportProgramAsLpFormat(DietProgram(), options));
  EXPECT_THAT(lp, HasSubstr(" C0: +1 V0 +1 V1  <= 20\n"));
  EXPECT_THAT(lp, HasSubstr(" C1: +5 V0 +10 V1 +1 V2 -1 V3  = 200\n"));
  EXPECT_THAT(lp, Not(HasSubstr("Rice")));
}

TEST(ExportProgramAsLpFormatTest, LongLinesAreBroken) {
  ProgramExportOptions options;
  options.max_line_length = 20;
  ASSERT_OK_AND_ASSIGN(const std::string lp,
                       ExportProgramAsLpFormat(DietProgram(), options));
  EXPECT_THAT(lp, HasSubstr(" Obj: +1 n_energy \n +1 p_energy \n"));
}

TEST(ExportProgramAsLpFormatTest, RejectsOutOfBoundsIndices) {
  ProgramProto program = DietProgram();
  program.mutable_constraint(1)->set_var_index(2, 7);
  EXPECT_THAT(ExportProgramAsLpFormat(program),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("goal_link_energy")));
}

}  // namespace
}  // namespace wglp
