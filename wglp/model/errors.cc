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

#include "wglp/model/errors.h"

#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace wglp {
namespace {

constexpr absl::string_view kErrorKindPayloadUrl = "type.wglp/wglp.ErrorKind";

absl::Status WithKind(absl::Status status, ErrorKind kind) {
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(ErrorKindName(kind)));
  return status;
}

}  // namespace

std::string ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "None";
    case ErrorKind::kDuplicateName:
      return "DuplicateNameError";
    case ErrorKind::kUnknownVariable:
      return "UnknownVariableError";
    case ErrorKind::kInvalidSense:
      return "InvalidSenseError";
    case ErrorKind::kInvalidWeight:
      return "InvalidWeightError";
    case ErrorKind::kOther:
      return "Other";
  }
  return "Other";
}

absl::Status DuplicateNameError(absl::string_view what,
                                absl::string_view name) {
  return WithKind(absl::AlreadyExistsError(absl::StrCat(
                      what, " name '", name, "' is already in use")),
                  ErrorKind::kDuplicateName);
}

absl::Status UnknownVariableError(absl::string_view name) {
  return WithKind(
      absl::NotFoundError(absl::StrCat("unknown variable '", name, "'")),
      ErrorKind::kUnknownVariable);
}

absl::Status InvalidSenseError(absl::string_view details) {
  return WithKind(
      absl::InvalidArgumentError(absl::StrCat("invalid sense: ", details)),
      ErrorKind::kInvalidSense);
}

absl::Status InvalidWeightError(absl::string_view goal, double weight) {
  return WithKind(absl::InvalidArgumentError(
                      absl::StrCat("invalid weight ", weight, " for '", goal,
                                   "': weights must be finite and >= 0")),
                  ErrorKind::kInvalidWeight);
}

ErrorKind GetErrorKind(const absl::Status& status) {
  if (status.ok()) return ErrorKind::kNone;
  const absl::optional<absl::Cord> payload =
      status.GetPayload(kErrorKindPayloadUrl);
  if (!payload.has_value()) return ErrorKind::kOther;
  for (const ErrorKind kind :
       {ErrorKind::kDuplicateName, ErrorKind::kUnknownVariable,
        ErrorKind::kInvalidSense, ErrorKind::kInvalidWeight}) {
    if (*payload == ErrorKindName(kind)) return kind;
  }
  return ErrorKind::kOther;
}

}  // namespace wglp
