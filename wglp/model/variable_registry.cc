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

#include "wglp/model/variable_registry.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "wglp/base/logging.h"
#include "wglp/model/errors.h"
#include "wglp/model/variable.h"

namespace wglp {

std::string VariableCategoryName(VariableCategory category) {
  switch (category) {
    case VariableCategory::kContinuous:
      return "continuous";
    case VariableCategory::kInteger:
      return "integer";
    case VariableCategory::kBinary:
      return "binary";
  }
  return "continuous";
}

absl::StatusOr<VariableCategory> ParseVariableCategory(absl::string_view text) {
  const std::string lower = absl::AsciiStrToLower(text);
  if (lower == "continuous") return VariableCategory::kContinuous;
  if (lower == "integer") return VariableCategory::kInteger;
  if (lower == "binary") return VariableCategory::kBinary;
  return absl::InvalidArgumentError(
      absl::StrCat("unknown variable category '", text, "'"));
}

absl::StatusOr<const Variable*> VariableRegistry::Create(
    absl::string_view name, double lower_bound, double upper_bound,
    VariableCategory category) {
  if (name.empty()) {
    return absl::InvalidArgumentError("variable name must not be empty");
  }
  if (Contains(name)) {
    return DuplicateNameError("variable", name);
  }
  if (category == VariableCategory::kBinary) {
    lower_bound = std::max(lower_bound, 0.0);
    upper_bound = std::min(upper_bound, 1.0);
  }
  if (std::isnan(lower_bound) || std::isnan(upper_bound) ||
      lower_bound > upper_bound || lower_bound == kInfinity ||
      upper_bound == -kInfinity) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid bounds [", lower_bound, ", ", upper_bound,
                     "] for variable '", name, "'"));
  }
  if (category != VariableCategory::kContinuous &&
      std::ceil(lower_bound) > std::floor(upper_bound)) {
    return absl::InvalidArgumentError(
        absl::StrCat("bounds [", lower_bound, ", ", upper_bound,
                     "] of integer variable '", name, "' hold no integer"));
  }

  const int index = size();
  name_to_index_.emplace(std::string(name), index);
  variables_.push_back(absl::WrapUnique(new Variable(
      index, std::string(name), lower_bound, upper_bound, category)));
  VLOG(2) << "New " << VariableCategoryName(category) << " variable '" << name
          << "' in [" << lower_bound << ", " << upper_bound << "]";
  return variables_.back().get();
}

absl::StatusOr<const Variable*> VariableRegistry::Lookup(
    absl::string_view name) const {
  const auto it = name_to_index_.find(name);
  if (it == name_to_index_.end()) {
    return UnknownVariableError(name);
  }
  return variables_[it->second].get();
}

}  // namespace wglp
