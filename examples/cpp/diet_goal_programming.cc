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

// Weighted goal programming on a minimal diet.
//
// Seven foods, in grams per day, must bring 2000 kcal of energy and 50 g of
// protein (both soft goals, attain sense, weight 1) within hard lower and
// upper limits per food group, with rice making 80% of the cereals. The
// cost of the basket is added to the objective with weight --cost_weight.

#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/log_severity.h"
#include "absl/flags/flag.h"
#include "absl/log/globals.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "wglp/base/file.h"
#include "wglp/base/init_wglp.h"
#include "wglp/base/logging.h"
#include "wglp/base/status_macros.h"
#include "wglp/model/constraint.h"
#include "wglp/model/goal.h"
#include "wglp/model/goal_model.h"
#include "wglp/model/linear_expr.h"
#include "wglp/model/result_decoder.h"
#include "wglp/model/variable.h"
#include "wglp/solver/program_exporter.h"

ABSL_FLAG(double, cost_weight, 10.0,
          "Weight of the cost of the basket in the objective. 0 ignores it.");
ABSL_FLAG(double, time_limit, 0.0,
          "Time limit of the solver, in seconds. 0 means no limit.");
ABSL_FLAG(std::string, export_lp, "",
          "If set, writes the weighted program in LP format to this file "
          "(compressed if the name ends in .gz).");
ABSL_FLAG(std::string, dump_request, "",
          "If set, writes the ProgramRequest as a text proto to this file.");

namespace wglp {
namespace {

struct Food {
  std::string name;
  std::string group;
  double cost;     // per gram
  double energy;   // kcal per gram
  double protein;  // g per gram
};

struct GroupLimits {
  std::string group;
  double lower;
  double upper;
};

const std::vector<Food>& Foods() {
  static const auto* const kFoods = new std::vector<Food>{
      {"Cereals_Rice", "Cereals", 0.05, 3.5, 0.06},
      {"Cereals_Wheat", "Cereals", 0.04, 3.3, 0.12},
      {"Pulses_Peas", "Pulses", 0.08, 3.6, 0.22},
      {"GLV_Spinach", "GLV", 0.03, 0.2, 0.02},
      {"OV_Cabbage", "OV", 0.02, 0.25, 0.02},
      {"Fruits_Banana", "Fruits", 0.06, 0.9, 0.01},
      {"Oils_Mustard_Oil", "Oils", 0.10, 9.0, 0.0},
  };
  return *kFoods;
}

const std::vector<GroupLimits>& Limits() {
  static const auto* const kLimits = new std::vector<GroupLimits>{
      {"Cereals", 200, 400}, {"Pulses", 50, 80},   {"GLV", 20, 200},
      {"OV", 30, 200},       {"Fruits", 50, 150},  {"Oils", 15, 30},
  };
  return *kLimits;
}

constexpr double kEnergyRequirement = 2000.0;
constexpr double kProteinRequirement = 50.0;

absl::Status RunDietExample() {
  GoalModel model("Minimal_Diet_Example");
  std::vector<const Variable*> food_vars;
  for (const Food& food : Foods()) {
    ASSIGN_OR_RETURN(const Variable* var, model.AddVariable(food.name));
    food_vars.push_back(var);
  }

  LinearExpr energy;
  LinearExpr protein;
  LinearExpr cost;
  for (int i = 0; i < static_cast<int>(food_vars.size()); ++i) {
    energy = energy + Foods()[i].energy * LinearExpr(food_vars[i]);
    protein = protein + Foods()[i].protein * LinearExpr(food_vars[i]);
    cost = cost + Foods()[i].cost * LinearExpr(food_vars[i]);
  }
  ASSIGN_OR_RETURN(Goal energy_goal,
                   Goal::Create("Energy", energy, kEnergyRequirement));
  RETURN_IF_ERROR(model.AddGoal(std::move(energy_goal)).status());
  ASSIGN_OR_RETURN(Goal protein_goal,
                   Goal::Create("Protein", protein, kProteinRequirement));
  RETURN_IF_ERROR(model.AddGoal(std::move(protein_goal)).status());

  for (const GroupLimits& limits : Limits()) {
    LinearExpr total;
    for (int i = 0; i < static_cast<int>(food_vars.size()); ++i) {
      if (Foods()[i].group == limits.group) {
        total = total + LinearExpr(food_vars[i]);
      }
    }
    RETURN_IF_ERROR(model.AddConstraint(absl::StrFormat("%s_LL", limits.group),
                                        total, ConstraintSense::kGreaterOrEqual,
                                        limits.lower));
    RETURN_IF_ERROR(model.AddConstraint(absl::StrFormat("%s_UL", limits.group),
                                        total, ConstraintSense::kLessOrEqual,
                                        limits.upper));
  }

  // Rice is 80% of the cereals: rice = 0.8 * (rice + wheat).
  const LinearExpr rice(food_vars[0]);
  const LinearExpr wheat(food_vars[1]);
  RETURN_IF_ERROR(model.AddConstraint("Cereal_Rule",
                                      rice - 0.8 * (rice + wheat),
                                      ConstraintSense::kEqual, 0.0));
  LOG(INFO) << model.DebugString();

  WeightedSolveOptions options;
  options.cost = cost;
  options.cost_weight = absl::GetFlag(FLAGS_cost_weight);
  if (absl::GetFlag(FLAGS_time_limit) > 0) {
    options.parameters.set_time_limit_seconds(absl::GetFlag(FLAGS_time_limit));
  }

  if (!absl::GetFlag(FLAGS_export_lp).empty() ||
      !absl::GetFlag(FLAGS_dump_request).empty()) {
    ASSIGN_OR_RETURN(const ProgramRequest request,
                     model.BuildWeightedProgram(options));
    if (!absl::GetFlag(FLAGS_export_lp).empty()) {
      ProgramExportOptions export_options;
      export_options.log_invalid_names = true;
      ASSIGN_OR_RETURN(const std::string lp,
                       ExportProgramAsLpFormat(request.program(),
                                               export_options));
      RETURN_IF_ERROR(file::SetContents(absl::GetFlag(FLAGS_export_lp), lp));
      LOG(INFO) << "Wrote the LP program to '"
                << absl::GetFlag(FLAGS_export_lp) << "'";
    }
    if (!absl::GetFlag(FLAGS_dump_request).empty()) {
      RETURN_IF_ERROR(
          file::SetTextProto(absl::GetFlag(FLAGS_dump_request), request));
    }
  }

  ASSIGN_OR_RETURN(const WeightedSolution solution,
                   model.SolveWeighted(options));
  LOG(INFO) << "Status: " << solution.status_name;
  if (!solution.optimal()) {
    LOG(WARNING) << "No optimal basket: " << solution.details;
    return absl::OkStatus();
  }

  LOG(INFO) << "Optimized food basket:";
  for (const auto& [name, grams] : solution.variables) {
    if (grams > 0) LOG(INFO) << absl::StrFormat("  %-20s: %.1f g", name, grams);
  }
  LOG(INFO) << "Nutrient totals:";
  const std::vector<std::pair<std::string, double>> requirements = {
      {"Energy", kEnergyRequirement}, {"Protein", kProteinRequirement}};
  for (const auto& [nutrient, requirement] : requirements) {
    const double total = solution.goal_values.at(nutrient);
    const auto& [under, over] = solution.deviations.at(nutrient);
    LOG(INFO) << absl::StrFormat(
        "  %-20s: %.2f  (%.1f%% EAR, under = %.2f, over = %.2f)", nutrient,
        total, 100.0 * total / requirement, under, over);
  }
  LOG(INFO) << "Objective: " << *solution.objective;
  return absl::OkStatus();
}

}  // namespace
}  // namespace wglp

int main(int argc, char** argv) {
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  wglp::InitWglp(argv[0], &argc, &argv);
  const absl::Status status = wglp::RunDietExample();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
