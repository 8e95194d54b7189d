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

#ifndef WGLP_SOLVER_PROGRAM_EXPORTER_H_
#define WGLP_SOLVER_PROGRAM_EXPORTER_H_

#include <string>

#include "absl/status/statusor.h"
#include "wglp/solver/linear_program.pb.h"

namespace wglp {

struct ProgramExportOptions {
  // Replaces all names by "C<index>" / "V<index>".
  bool obfuscate = false;

  // Whether to LOG(WARNING) the names that had to be rewritten.
  bool log_invalid_names = false;

  // Lines are broken past this many characters when possible.
  int max_line_length = 10000;
};

/**
 * Renders `program` in the "CPLEX LP" text format, for auditing the exact
 * program handed to a solver.
 *
 * Names containing characters that the format forbids are rewritten (each
 * such character becomes '_', and a leading digit, '.' or '$' gets a '_'
 * prefix); names that collide after the rewrite get a numeric suffix. Empty
 * names become "C<index>" / "V<index>".
 *
 * Fails with InvalidArgument if the program refers to a missing variable.
 */
absl::StatusOr<std::string> ExportProgramAsLpFormat(
    const ProgramProto& program,
    const ProgramExportOptions& options = ProgramExportOptions());

}  // namespace wglp

#endif  // WGLP_SOLVER_PROGRAM_EXPORTER_H_
