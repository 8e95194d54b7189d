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

#include "wglp/solver/program_exporter.h"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "wglp/base/logging.h"
#include "wglp/solver/linear_program.pb.h"

namespace wglp {
namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

class NameManager {
 public:
  NameManager() : names_set_(), last_n_(1) {}
  // Claims `name` so that no later MakeUniqueName() returns it.
  void Reserve(const std::string& name) { names_set_.insert(name); }
  std::string MakeUniqueName(const std::string& name);

 private:
  absl::flat_hash_set<std::string> names_set_;
  int last_n_;
};

std::string NameManager::MakeUniqueName(const std::string& name) {
  std::string result = name;
  // Find the 'n' so that "name_n" does not already exist.
  int n = last_n_;
  while (!names_set_.insert(result).second) {
    result = absl::StrCat(name, "_", n);
    ++n;
  }
  // We keep the last n used to avoid a quadratic behavior in case
  // all the names are the same initially.
  last_n_ = n;
  return result;
}

std::string MakeExportableName(const std::string& name,
                               const std::string& forbidden_first_chars,
                               const std::string& forbidden_chars,
                               bool* found_forbidden_char) {
  // Prepend with "_" all the names starting with a forbidden character.
  *found_forbidden_char =
      forbidden_first_chars.find(name[0]) != std::string::npos;
  std::string exportable_name =
      *found_forbidden_char ? absl::StrCat("_", name) : name;

  // Replace all the other forbidden characters with "_".
  for (char& c : exportable_name) {
    if (forbidden_chars.find(c) != std::string::npos) {
      c = '_';
      *found_forbidden_char = true;
    }
  }
  return exportable_name;
}

template <class ListOfProtosWithNameFields>
std::vector<std::string> ExtractAndProcessNames(
    const ListOfProtosWithNameFields& protos, const std::string& prefix,
    const std::vector<std::string>& reserved_names,
    const ProgramExportOptions& options) {
  const std::string kForbiddenFirstChars = "$.0123456789";
  const std::string kForbiddenChars = " +-*/<>=:\\";
  std::vector<std::string> result;
  result.reserve(protos.size());
  NameManager namer;
  for (const std::string& name : reserved_names) namer.Reserve(name);
  const int num_digits = absl::StrCat(protos.size()).size();
  for (const auto& item : protos) {
    const std::string obfuscated_name =
        absl::StrFormat("%s%0*d", prefix, num_digits, result.size());
    if (options.obfuscate || item.name().empty()) {
      result.push_back(namer.MakeUniqueName(obfuscated_name));
      continue;
    }
    bool found_forbidden_char = false;
    result.push_back(namer.MakeUniqueName(
        MakeExportableName(item.name(), kForbiddenFirstChars, kForbiddenChars,
                           &found_forbidden_char)));
    LOG_IF(WARNING, options.log_invalid_names && found_forbidden_char)
        << "Invalid character detected in " << item.name() << ". Changed to "
        << result.back();
  }
  return result;
}

class LineBreaker {
 public:
  explicit LineBreaker(int max_line_size)
      : max_line_size_(max_line_size), line_size_(0), output_() {}

  // Strings given to Append() are never split; a line only exceeds the max
  // length when a single string does.
  void Append(const std::string& s) {
    line_size_ += s.size();
    if (line_size_ > max_line_size_) {
      line_size_ = s.size();
      absl::StrAppend(&output_, "\n ");
    }
    absl::StrAppend(&output_, s);
  }

  void Consume(int size) { line_size_ += size; }

  const std::string& output() const { return output_; }

 private:
  int max_line_size_;
  int line_size_;
  std::string output_;
};

std::string DoubleToStringWithForcedSign(double d) {
  return absl::StrCat((d < 0 ? "" : "+"), d);
}

std::string DoubleToString(double d) { return absl::StrCat(d); }

std::string LpTerm(double coefficient, const std::string& var_name) {
  if (coefficient == 0.0) return "";
  return absl::StrCat(DoubleToStringWithForcedSign(coefficient), " ", var_name,
                      " ");
}

// Pseudo-variable fixed to 1 that carries the objective offset.
constexpr char kConstantName[] = "Constant";

}  // namespace

absl::StatusOr<std::string> ExportProgramAsLpFormat(
    const ProgramProto& program, const ProgramExportOptions& options) {
  const bool has_offset = program.objective_offset() != 0.0;
  const std::vector<std::string> constraint_names =
      ExtractAndProcessNames(program.constraint(), "C", {}, options);
  std::vector<std::string> reserved_variable_names;
  if (has_offset) reserved_variable_names.push_back(kConstantName);
  const std::vector<std::string> variable_names = ExtractAndProcessNames(
      program.variable(), "V", reserved_variable_names, options);

  int num_integer_variables = 0;
  int num_binary_variables = 0;
  for (const VariableProto& var : program.variable()) {
    if (var.category() == VariableProto::INTEGER) ++num_integer_variables;
    if (var.category() == VariableProto::BINARY) ++num_binary_variables;
  }

  std::string output;
  absl::StrAppendFormat(&output, "\\ Generated by wglp\n");
  absl::StrAppendFormat(&output, "\\   %-16s : %s\n", "Name",
                        program.name().empty() ? "NoName" : program.name());
  absl::StrAppendFormat(&output, "\\   %-16s : %d\n", "Constraints",
                        program.constraint_size());
  absl::StrAppendFormat(&output, "\\   %-16s : %d\n", "Variables",
                        program.variable_size());
  absl::StrAppendFormat(&output, "\\     %-14s : %d\n", "Binary",
                        num_binary_variables);
  absl::StrAppendFormat(&output, "\\     %-14s : %d\n", "Integer",
                        num_integer_variables);

  // Objective.
  absl::StrAppend(&output, "Minimize\n");
  LineBreaker obj_line_breaker(options.max_line_length);
  obj_line_breaker.Append(" Obj: ");
  if (has_offset) {
    obj_line_breaker.Append(
        absl::StrCat(DoubleToStringWithForcedSign(program.objective_offset()),
                     " ", kConstantName, " "));
  }
  for (int var_index = 0; var_index < program.variable_size(); ++var_index) {
    obj_line_breaker.Append(
        LpTerm(program.variable(var_index).objective_coefficient(),
               variable_names[var_index]));
  }

  // Constraints.
  absl::StrAppend(&output, obj_line_breaker.output(), "\nSubject to\n");
  for (int cst_index = 0; cst_index < program.constraint_size();
       ++cst_index) {
    const ConstraintProto& ct_proto = program.constraint(cst_index);
    const std::string& name = constraint_names[cst_index];
    LineBreaker line_breaker(options.max_line_length);
    const int kNumFormattingChars = 10;  // Overevaluated.
    line_breaker.Consume(kNumFormattingChars + name.size());
    for (int i = 0; i < ct_proto.var_index_size(); ++i) {
      const int var_index = ct_proto.var_index(i);
      if (var_index < 0 || var_index >= program.variable_size() ||
          i >= ct_proto.coefficient_size()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Constraint '", ct_proto.name(),
                         "' refers to the out-of-bounds variable index #",
                         var_index));
      }
      line_breaker.Append(
          LpTerm(ct_proto.coefficient(i), variable_names[var_index]));
    }
    std::string relation;
    switch (ct_proto.sense()) {
      case ConstraintProto::LESS_OR_EQUAL:
        relation = " <= ";
        break;
      case ConstraintProto::GREATER_OR_EQUAL:
        relation = " >= ";
        break;
      case ConstraintProto::EQUAL:
        relation = " = ";
        break;
    }
    line_breaker.Append(
        absl::StrCat(relation, DoubleToString(ct_proto.rhs()), "\n"));
    absl::StrAppend(&output, " ", name, ": ", line_breaker.output());
  }

  // Bounds.
  absl::StrAppend(&output, "Bounds\n");
  if (has_offset) {
    absl::StrAppend(&output, " 1 <= ", kConstantName, " <= 1\n");
  }
  for (int var_index = 0; var_index < program.variable_size(); ++var_index) {
    const VariableProto& var_proto = program.variable(var_index);
    const double lb = var_proto.lower_bound();
    const double ub = var_proto.upper_bound();
    const std::string& var_name = variable_names[var_index];
    if (var_proto.category() != VariableProto::CONTINUOUS &&
        lb == std::round(lb) && ub == std::round(ub)) {
      absl::StrAppendFormat(&output, " %.0f <= %s <= %.0f\n", lb, var_name,
                            ub);
      continue;
    }
    absl::StrAppend(&output, " ");
    if (lb == -kInfinity && ub == kInfinity) {
      absl::StrAppend(&output, var_name, " free");
    } else {
      if (lb != -kInfinity) {
        absl::StrAppend(&output, DoubleToString(lb), " <= ");
      }
      absl::StrAppend(&output, var_name);
      if (ub != kInfinity) {
        absl::StrAppend(&output, " <= ", DoubleToString(ub));
      }
    }
    absl::StrAppend(&output, "\n");
  }

  // Integrality.
  std::vector<std::string> section_vars;
  for (const VariableProto::Category category :
       {VariableProto::BINARY, VariableProto::INTEGER}) {
    section_vars.clear();
    for (int var_index = 0; var_index < program.variable_size(); ++var_index) {
      if (program.variable(var_index).category() == category) {
        section_vars.push_back(variable_names[var_index]);
      }
    }
    if (section_vars.empty()) continue;
    absl::StrAppend(&output,
                    category == VariableProto::BINARY ? "Binaries\n"
                                                      : "Generals\n");
    LineBreaker line_breaker(options.max_line_length);
    for (const std::string& var_name : section_vars) {
      line_breaker.Append(absl::StrCat(" ", var_name));
    }
    absl::StrAppend(&output, line_breaker.output(), "\n");
  }
  absl::StrAppend(&output, "End\n");
  return output;
}

}  // namespace wglp
