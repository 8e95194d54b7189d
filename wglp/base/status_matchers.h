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

// Status matchers and macros shared by the wglp tests. The matchers are the
// ones published by Abseil.

#ifndef WGLP_BASE_STATUS_MATCHERS_H_
#define WGLP_BASE_STATUS_MATCHERS_H_

#include <utility>

#include "absl/status/status.h"
#include "absl/status/status_matchers.h"  // IWYU pragma: export
#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace wglp::testing {

using ::absl_testing::IsOk;
using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;

inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}

template <typename T>
const absl::Status& GetStatus(const absl::StatusOr<T>& status_or) {
  return status_or.status();
}

}  // namespace wglp::testing

#define EXPECT_OK(expression) EXPECT_THAT(expression, ::wglp::testing::IsOk())
#define ASSERT_OK(expression) ASSERT_THAT(expression, ::wglp::testing::IsOk())

#define WGLP_STATUS_MATCHERS_CONCAT_INNER_(x, y) x##y
#define WGLP_STATUS_MATCHERS_CONCAT_(x, y) \
  WGLP_STATUS_MATCHERS_CONCAT_INNER_(x, y)

// `lhs` may be a declaration: ASSERT_OK_AND_ASSIGN(const Variable* x, ...).
#undef ASSERT_OK_AND_ASSIGN
#define ASSERT_OK_AND_ASSIGN(lhs, rexpr)                                   \
  WGLP_ASSERT_OK_AND_ASSIGN_IMPL_(                                         \
      WGLP_STATUS_MATCHERS_CONCAT_(_status_or_value, __COUNTER__), lhs, \
      rexpr)

#define WGLP_ASSERT_OK_AND_ASSIGN_IMPL_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                    \
  ASSERT_TRUE(statusor.ok()) << statusor.status();            \
  lhs = std::move(statusor).value()

#endif  // WGLP_BASE_STATUS_MATCHERS_H_
