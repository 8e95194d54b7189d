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

#ifndef WGLP_MODEL_RESULT_DECODER_H_
#define WGLP_MODEL_RESULT_DECODER_H_

#include <optional>
#include <string>
#include <utility>

#include "absl/container/btree_map.h"
#include "wglp/solver/linear_program.pb.h"

namespace wglp {

class GoalModel;

// Structured, auditable answer of a weighted solve.
struct WeightedSolution {
  ProgramStatus status = PROGRAM_ERROR;
  // ProgramStatusName(status).
  std::string status_name = "Error";
  // Solver supplied details about the status, if any.
  std::string details;

  // The maps below are empty when the solver returned no assignment.

  // Decision variables only (no deviation variables), by name.
  absl::btree_map<std::string, double> variables;
  // goal name -> (under-deviation n_<goal>, over-deviation p_<goal>).
  absl::btree_map<std::string, std::pair<double, double>> deviations;
  // goal name -> value of the goal expression.
  absl::btree_map<std::string, double> goal_values;

  // Present iff the solver returned one.
  std::optional<double> objective;

  bool optimal() const { return status == PROGRAM_OPTIMAL; }

  std::string DebugString() const;
};

/**
 * Reads the response of a solver to the program built by
 * model.BuildWeightedProgram(). The status and the objective value are
 * passed through; values are never made up: if the response carries no
 * assignment, the value maps stay empty, whatever the status.
 */
WeightedSolution DecodeWeightedSolution(const GoalModel& model,
                                        const ProgramResponse& response);

}  // namespace wglp

#endif  // WGLP_MODEL_RESULT_DECODER_H_
