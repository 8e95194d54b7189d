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

#ifndef WGLP_MODEL_ERROR_MATCHERS_H_
#define WGLP_MODEL_ERROR_MATCHERS_H_

#include <string>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "wglp/base/status_matchers.h"
#include "wglp/model/errors.h"

namespace wglp::testing {

// Matches an absl::Status or absl::StatusOr<T> whose error kind, as read by
// GetErrorKind(), is `kind`. Usage:
//   EXPECT_THAT(model.AddVariable("x"),
//               HasErrorKind(ErrorKind::kDuplicateName));
MATCHER_P(HasErrorKind, kind,
          std::string(negation ? "doesn't have" : "has") + " error kind " +
              ErrorKindName(kind)) {
  const absl::Status& status = GetStatus(arg);
  const ErrorKind actual = GetErrorKind(status);
  if (actual != kind) {
    *result_listener << "whose error kind is " << ErrorKindName(actual)
                     << " (" << status << ")";
  }
  return actual == kind;
}

}  // namespace wglp::testing

#endif  // WGLP_MODEL_ERROR_MATCHERS_H_
