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

#ifndef WGLP_MODEL_VARIABLE_REGISTRY_H_
#define WGLP_MODEL_VARIABLE_REGISTRY_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "wglp/model/variable.h"

namespace wglp {

// Owns the variables of one model and guarantees that their names are
// unique. A variable is never replaced nor removed once created, so the
// returned pointers stay valid for the lifetime of the registry.
class VariableRegistry {
 public:
  VariableRegistry() = default;
  VariableRegistry(const VariableRegistry&) = delete;
  VariableRegistry& operator=(const VariableRegistry&) = delete;

  // Fails with DuplicateNameError if `name` is already registered, and with
  // InvalidArgument if the name is empty or the bounds are NaN or empty.
  // Binary variables get their bounds intersected with [0, 1].
  absl::StatusOr<const Variable*> Create(
      absl::string_view name, double lower_bound = 0.0,
      double upper_bound = kInfinity,
      VariableCategory category = VariableCategory::kContinuous);

  // Fails with UnknownVariableError if absent.
  absl::StatusOr<const Variable*> Lookup(absl::string_view name) const;

  bool Contains(absl::string_view name) const {
    return name_to_index_.contains(name);
  }

  int size() const { return static_cast<int>(variables_.size()); }

  // In creation order.
  const std::vector<std::unique_ptr<Variable>>& variables() const {
    return variables_;
  }

 private:
  std::vector<std::unique_ptr<Variable>> variables_;
  absl::flat_hash_map<std::string, int> name_to_index_;
};

}  // namespace wglp

#endif  // WGLP_MODEL_VARIABLE_REGISTRY_H_
