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

#include "wglp/solver/solver_adapter.h"

#include <memory>
#include <string>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "wglp/base/logging.h"
#include "wglp/solver/linear_program.pb.h"
#include "wglp/solver/program_validator.h"
#include "wglp/solver/z3_interface.h"

ABSL_FLAG(bool, wglp_enable_verbose_output, false,
          "If set, enables verbose output for the solver. Setting this flag"
          " is the same as setting SolverParameters::enable_output in every"
          " request that leaves it unset.");

namespace wglp {

absl::StatusOr<std::unique_ptr<SolverAdapter>> CreateSolverAdapter(
    SolverParameters::SolverType solver_type) {
  switch (solver_type) {
    case SolverParameters::Z3:
      return BuildZ3Interface();
  }
  return absl::UnimplementedError(absl::StrCat(
      "solver type ", SolverParameters::SolverType_Name(solver_type),
      " is not linked in"));
}

absl::StatusOr<SolverParameters::SolverType> ParseSolverType(
    absl::string_view name) {
  SolverParameters::SolverType solver_type;
  if (!SolverParameters::SolverType_Parse(absl::AsciiStrToUpper(name),
                                          &solver_type)) {
    return absl::InvalidArgumentError(
        absl::StrCat("unknown solver type '", name, "'"));
  }
  return solver_type;
}

ProgramResponse SolveProgram(const ProgramRequest& request,
                             SolverAdapter& adapter) {
  ProgramResponse response;
  const std::string error = FindErrorInProgram(request.program());
  if (!error.empty()) {
    LOG(ERROR) << "Invalid program '" << request.program().name()
               << "': " << error;
    response.set_status(PROGRAM_INVALID);
    response.set_status_str(error);
    return response;
  }
  if (!adapter.SupportsIntegerVariables()) {
    for (const VariableProto& var : request.program().variable()) {
      if (var.category() != VariableProto::CONTINUOUS) {
        response.set_status(PROGRAM_INVALID);
        response.set_status_str(
            absl::StrCat("variable '", var.name(), "' is not continuous and ",
                         adapter.name(), " only solves linear relaxations"));
        return response;
      }
    }
  }

  ProgramRequest effective_request = request;
  SolverParameters* const parameters =
      effective_request.mutable_parameters();
  if (!parameters->has_enable_output()) {
    parameters->set_enable_output(
        absl::GetFlag(FLAGS_wglp_enable_verbose_output));
  }

  VLOG(1) << "Solving '" << request.program().name() << "' with "
          << adapter.name() << ": " << request.program().variable_size()
          << " variables, " << request.program().constraint_size()
          << " constraints";
  response = adapter.Solve(effective_request);
  if (response.variable_value_size() != 0 &&
      response.variable_value_size() != request.program().variable_size()) {
    LOG(ERROR) << adapter.name() << " returned "
               << response.variable_value_size() << " values for "
               << request.program().variable_size() << " variables";
    response.clear_variable_value();
  }
  VLOG(1) << adapter.name() << " status: "
          << ProgramStatusName(response.status());
  return response;
}

std::string ProgramStatusName(ProgramStatus status) {
  switch (status) {
    case PROGRAM_OPTIMAL:
      return "Optimal";
    case PROGRAM_INFEASIBLE:
      return "Infeasible";
    case PROGRAM_UNBOUNDED:
      return "Unbounded";
    case PROGRAM_ERROR:
      return "Error";
    case PROGRAM_NOT_SOLVED:
      return "NotSolved";
    case PROGRAM_INVALID:
      return "Invalid";
  }
  return "Error";
}

}  // namespace wglp
