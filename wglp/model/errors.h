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

// Error taxonomy of the goal programming layer.
//
// Misuse is reported synchronously, at registration time, through
// absl::Status. Each error built here carries a payload naming its kind, so
// that the two kinds sharing kInvalidArgument can be told apart:
//
//   ErrorKind       | absl::StatusCode
//   ----------------+------------------
//   kDuplicateName  | kAlreadyExists
//   kUnknownVariable| kNotFound
//   kInvalidSense   | kInvalidArgument
//   kInvalidWeight  | kInvalidArgument
//
// Solver outcomes (infeasible, unbounded, ...) are not errors; see
// WeightedSolution::status.

#ifndef WGLP_MODEL_ERRORS_H_
#define WGLP_MODEL_ERRORS_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace wglp {

enum class ErrorKind {
  kNone,
  kDuplicateName,
  kUnknownVariable,
  kInvalidSense,
  kInvalidWeight,
  // An error that is not part of the taxonomy above.
  kOther,
};

std::string ErrorKindName(ErrorKind kind);

// `what` is the kind of object being registered ("variable", "constraint",
// "goal", ...).
absl::Status DuplicateNameError(absl::string_view what, absl::string_view name);
absl::Status UnknownVariableError(absl::string_view name);
absl::Status InvalidSenseError(absl::string_view details);
absl::Status InvalidWeightError(absl::string_view goal, double weight);

// Returns kNone for an OK status and kOther for errors not built above.
ErrorKind GetErrorKind(const absl::Status& status);

}  // namespace wglp

#endif  // WGLP_MODEL_ERRORS_H_
