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

#ifndef WGLP_SOLVER_Z3_INTERFACE_H_
#define WGLP_SOLVER_Z3_INTERFACE_H_

#include <memory>

#include "wglp/solver/solver_adapter.h"

namespace wglp {

// Solves programs exactly with the z3 optimizing solver: continuous variables
// become z3 reals, integer and binary ones z3 integers, and the objective is
// minimized with z3::optimize.
std::unique_ptr<SolverAdapter> BuildZ3Interface();

}  // namespace wglp

#endif  // WGLP_SOLVER_Z3_INTERFACE_H_
