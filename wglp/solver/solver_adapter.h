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

#ifndef WGLP_SOLVER_SOLVER_ADAPTER_H_
#define WGLP_SOLVER_SOLVER_ADAPTER_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "wglp/solver/linear_program.pb.h"

namespace wglp {

/**
 * A linear programming backend, treated as a black box: it receives a whole
 * program and returns a status, and an assignment plus its objective value
 * when it found one.
 *
 * Implementations must not throw: failures of the underlying library are
 * reported as PROGRAM_ERROR with a message in status_str. The time limit in
 * the request parameters is interpreted by the backend only.
 */
class SolverAdapter {
 public:
  virtual ~SolverAdapter() = default;

  // Short lowercase name, e.g. "z3".
  virtual std::string name() const = 0;

  // Whether INTEGER and BINARY variables are honored.
  virtual bool SupportsIntegerVariables() const = 0;

  // The program is assumed valid, see FindErrorInProgram().
  virtual ProgramResponse Solve(const ProgramRequest& request) = 0;
};

// Fails with Unimplemented if the backend is not linked in.
absl::StatusOr<std::unique_ptr<SolverAdapter>> CreateSolverAdapter(
    SolverParameters::SolverType solver_type);

// Case insensitive, e.g. "z3" or "Z3".
absl::StatusOr<SolverParameters::SolverType> ParseSolverType(
    absl::string_view name);

/**
 * Validates the program of `request` and hands it to `adapter`.
 *
 * An invalid program yields PROGRAM_INVALID without calling the adapter, and
 * a program with integer variables yields PROGRAM_INVALID if the adapter
 * does not support them. The response is otherwise the adapter's, with its
 * variable values dropped unless there is exactly one per variable.
 */
ProgramResponse SolveProgram(const ProgramRequest& request,
                             SolverAdapter& adapter);

// "Optimal", "Infeasible", "Unbounded", "Error", "NotSolved" or "Invalid".
std::string ProgramStatusName(ProgramStatus status);

}  // namespace wglp

#endif  // WGLP_SOLVER_SOLVER_ADAPTER_H_
