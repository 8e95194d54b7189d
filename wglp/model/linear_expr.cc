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

#include "wglp/model/linear_expr.h"

#include <algorithm>
#include <cmath>
#include <ostream>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "wglp/base/logging.h"
#include "wglp/model/errors.h"
#include "wglp/model/variable.h"

namespace wglp {

LinearExpr::LinearExpr(double constant) : offset_(constant), terms_() {}

LinearExpr::LinearExpr() : LinearExpr(0.0) {}

LinearExpr::LinearExpr(const Variable* var) : LinearExpr(0.0) {
  DCHECK(var != nullptr);
  terms_[var->name()] = 1.0;
}

// static
LinearExpr LinearExpr::Constant(double constant) {
  return LinearExpr(constant);
}

// static
LinearExpr LinearExpr::Term(const Variable& var, double coefficient) {
  return Term(var.name(), coefficient);
}

// static
LinearExpr LinearExpr::Term(absl::string_view var_name, double coefficient) {
  LinearExpr result;
  result.terms_[std::string(var_name)] = coefficient;
  return result;
}

LinearExpr LinearExpr::Add(const LinearExpr& other) const {
  LinearExpr result = *this;
  result.AddInPlace(other, 1.0);
  return result;
}

LinearExpr LinearExpr::Scale(double factor) const {
  LinearExpr result = *this;
  result.ScaleInPlace(factor);
  return result;
}

void LinearExpr::AddInPlace(const LinearExpr& rhs, double factor) {
  for (const auto& [name, coefficient] : rhs.terms_) {
    terms_[name] += factor * coefficient;
  }
  offset_ += factor * rhs.offset_;
}

void LinearExpr::ScaleInPlace(double factor) {
  if (factor == 0) {
    terms_.clear();
    offset_ = 0;
  } else if (factor != 1) {
    for (auto& kv : terms_) {
      kv.second *= factor;
    }
    offset_ *= factor;
  }
}

double LinearExpr::coefficient(absl::string_view var_name) const {
  const auto it = terms_.find(var_name);
  return it == terms_.end() ? 0.0 : it->second;
}

absl::StatusOr<double> LinearExpr::Evaluate(
    const absl::flat_hash_map<std::string, double>& values) const {
  double result = offset_;
  for (const auto& [name, coefficient] : terms_) {
    const auto it = values.find(name);
    if (it == values.end()) return UnknownVariableError(name);
    result += coefficient * it->second;
  }
  return result;
}

namespace {

void AppendTerm(const double coef, const std::string& var_name,
                const bool is_first, std::string* s) {
  if (is_first) {
    if (coef == 1.0) {
      absl::StrAppend(s, var_name);
    } else if (coef == -1.0) {
      absl::StrAppend(s, "-", var_name);
    } else {
      absl::StrAppend(s, coef, "*", var_name);
    }
  } else {
    const std::string op = coef < 0 ? "-" : "+";
    const double abs_coef = std::abs(coef);
    if (abs_coef == 1.0) {
      absl::StrAppend(s, " ", op, " ", var_name);
    } else {
      absl::StrAppend(s, " ", op, " ", abs_coef, "*", var_name);
    }
  }
}

}  // namespace

std::string LinearExpr::ToString() const {
  std::vector<std::string> names;
  names.reserve(terms_.size());
  for (const auto& kv : terms_) {
    names.push_back(kv.first);
  }
  std::sort(names.begin(), names.end());
  std::string result;
  bool is_first = true;
  for (const std::string& name : names) {
    AppendTerm(terms_.at(name), name, is_first, &result);
    is_first = false;
  }
  if (is_first) {
    absl::StrAppend(&result, offset_);
  } else if (offset_ != 0.0) {
    absl::StrAppend(&result, " ", offset_ < 0 ? "-" : "+", " ",
                    std::abs(offset_));
  }
  return result;
}

std::ostream& operator<<(std::ostream& stream, const LinearExpr& linear_expr) {
  stream << linear_expr.ToString();
  return stream;
}

LinearExpr operator+(LinearExpr lhs, const LinearExpr& rhs) {
  lhs.AddInPlace(rhs, 1.0);
  return lhs;
}
LinearExpr operator-(LinearExpr lhs, const LinearExpr& rhs) {
  lhs.AddInPlace(rhs, -1.0);
  return lhs;
}
LinearExpr operator*(LinearExpr lhs, double rhs) {
  lhs.ScaleInPlace(rhs);
  return lhs;
}
LinearExpr operator*(double lhs, LinearExpr rhs) {
  rhs.ScaleInPlace(lhs);
  return rhs;
}

}  // namespace wglp
