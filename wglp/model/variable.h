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

#ifndef WGLP_MODEL_VARIABLE_H_
#define WGLP_MODEL_VARIABLE_H_

#include <limits>
#include <string>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace wglp {

inline constexpr double kInfinity = std::numeric_limits<double>::infinity();

enum class VariableCategory { kContinuous, kInteger, kBinary };

std::string VariableCategoryName(VariableCategory category);

// Accepts "continuous", "integer" and "binary", case insensitive. Any other
// text is an InvalidArgument error.
absl::StatusOr<VariableCategory> ParseVariableCategory(absl::string_view text);

// A decision variable, or a deviation variable synthesized for a goal.
// Variables are owned by a VariableRegistry and are immutable once created.
class Variable {
 public:
  Variable(const Variable&) = delete;
  Variable& operator=(const Variable&) = delete;

  const std::string& name() const { return name_; }
  double lower_bound() const { return lower_bound_; }
  double upper_bound() const { return upper_bound_; }
  VariableCategory category() const { return category_; }
  bool integer() const { return category_ != VariableCategory::kContinuous; }

  // Creation order in the owning registry, starting at 0.
  int index() const { return index_; }

 private:
  friend class VariableRegistry;

  Variable(int index, std::string name, double lower_bound, double upper_bound,
           VariableCategory category)
      : index_(index),
        name_(std::move(name)),
        lower_bound_(lower_bound),
        upper_bound_(upper_bound),
        category_(category) {}

  const int index_;
  const std::string name_;
  const double lower_bound_;
  const double upper_bound_;
  const VariableCategory category_;
};

}  // namespace wglp

#endif  // WGLP_MODEL_VARIABLE_H_
