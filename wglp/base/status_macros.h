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

#ifndef WGLP_BASE_STATUS_MACROS_H_
#define WGLP_BASE_STATUS_MACROS_H_

#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

// Returns early from the enclosing function if `expr` is not OK. The enclosing
// function must return absl::Status or absl::StatusOr<T>.
#define RETURN_IF_ERROR(expr)                                        \
  do {                                                               \
    const ::absl::Status status_macro_internal_adaptor = (expr);     \
    if (!status_macro_internal_adaptor.ok()) {                       \
      return status_macro_internal_adaptor;                          \
    }                                                                \
  } while (false)

// Evaluates `rexpr` (an absl::StatusOr<T>), and either returns its error or
// moves its value into `lhs`, which may be a declaration.
//   ASSIGN_OR_RETURN(const Variable* var, registry.Lookup("x"));
#define ASSIGN_OR_RETURN(lhs, rexpr)    \
  STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_( \
      STATUS_MACROS_IMPL_CONCAT_(_status_or_value, __COUNTER__), lhs, rexpr)

#define STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                         \
  if (!statusor.ok()) {                                            \
    return std::move(statusor).status();                           \
  }                                                                \
  lhs = std::move(statusor).value()

#define STATUS_MACROS_IMPL_CONCAT_INNER_(x, y) x##y
#define STATUS_MACROS_IMPL_CONCAT_(x, y) STATUS_MACROS_IMPL_CONCAT_INNER_(x, y)

#endif  // WGLP_BASE_STATUS_MACROS_H_
