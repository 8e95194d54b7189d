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

#ifndef WGLP_SOLVER_PROGRAM_VALIDATOR_H_
#define WGLP_SOLVER_PROGRAM_VALIDATOR_H_

#include <string>

#include "wglp/solver/linear_program.pb.h"

namespace wglp {

/**
 * Returns an empty string iff the program is well formed. Otherwise, returns
 * a description of the first error found: NaN or inverted bounds, out of
 * range or duplicate variable indices, non finite coefficients, ...
 *
 * abs_value_threshold is the (exclusive) limit for the abs value of
 * coefficients and right-hand sides. If 0, it defaults to
 * --wglp_model_validator_infinity.
 */
std::string FindErrorInProgram(const ProgramProto& program,
                               double abs_value_threshold = 0.0);

}  // namespace wglp

#endif  // WGLP_SOLVER_PROGRAM_VALIDATOR_H_
