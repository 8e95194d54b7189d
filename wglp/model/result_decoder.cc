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

#include <memory>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "wglp/base/logging.h"
#include "wglp/model/goal.h"
#include "wglp/model/goal_model.h"
#include "wglp/model/variable.h"
#include "wglp/solver/linear_program.pb.h"
#include "wglp/solver/solver_adapter.h"

namespace wglp {

WeightedSolution DecodeWeightedSolution(const GoalModel& model,
                                        const ProgramResponse& response) {
  WeightedSolution solution;
  solution.status = response.status();
  solution.status_name = ProgramStatusName(response.status());
  solution.details = response.status_str();
  if (response.has_objective_value()) {
    solution.objective = response.objective_value();
  }
  if (response.variable_value_size() == 0) return solution;
  if (response.variable_value_size() != model.num_variables()) {
    LOG(ERROR) << "Got " << response.variable_value_size()
               << " values for the " << model.num_variables()
               << " variables of '" << model.name() << "', ignoring them";
    return solution;
  }

  absl::flat_hash_map<std::string, double> values;
  for (const std::unique_ptr<Variable>& var : model.variables().variables()) {
    const double value = response.variable_value(var->index());
    values[var->name()] = value;
    if (model.IsDecisionVariable(*var)) {
      solution.variables[var->name()] = value;
    }
  }
  for (const Goal& goal : model.goals()) {
    solution.deviations[goal.name()] = {
        values.at(goal.under_variable_name()),
        values.at(goal.over_variable_name())};
    const absl::StatusOr<double> achieved =
        goal.expression().Evaluate(values);
    // Goal expressions only refer to variables of the model.
    DCHECK(achieved.ok()) << achieved.status();
    if (achieved.ok()) solution.goal_values[goal.name()] = *achieved;
  }
  return solution;
}

std::string WeightedSolution::DebugString() const {
  std::string result = absl::StrCat("status: ", status_name);
  if (!details.empty()) absl::StrAppend(&result, " (", details, ")");
  absl::StrAppend(&result, "\nobjective: ",
                  objective.has_value() ? absl::StrCat(*objective) : "none");
  for (const auto& [name, value] : variables) {
    absl::StrAppend(&result, "\n  ", name, " = ", value);
  }
  for (const auto& [goal, deviation] : deviations) {
    absl::StrAppend(&result, "\n  goal ", goal, ": under = ", deviation.first,
                    ", over = ", deviation.second);
    const auto it = goal_values.find(goal);
    if (it != goal_values.end()) {
      absl::StrAppend(&result, ", achieved = ", it->second);
    }
  }
  return result;
}

}  // namespace wglp
