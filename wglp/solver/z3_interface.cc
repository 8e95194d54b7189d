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

#include "wglp/solver/z3_interface.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "google/protobuf/repeated_field.h"
#include "wglp/base/logging.h"
#include "wglp/solver/linear_program.pb.h"
#include "wglp/solver/solver_adapter.h"
#include "z3++.h"

namespace wglp {
namespace {

// z3 parses decimal strings exactly, but not the exponent notation.
std::string ToZ3Decimal(double value) {
  std::string text = absl::StrFormat("%.17g", value);
  if (!absl::StrContains(text, 'e')) return text;
  text = absl::StrFormat("%.350f", value);
  absl::string_view trimmed = text;
  while (absl::EndsWith(trimmed, "0")) trimmed.remove_suffix(1);
  if (absl::EndsWith(trimmed, ".")) trimmed.remove_suffix(1);
  return std::string(trimmed);
}

z3::expr RealNumeral(z3::context& ctx, double value) {
  return ctx.real_val(ToZ3Decimal(value).c_str());
}

z3::expr LinearTerm(z3::context& ctx, const z3::expr_vector& vars,
                    const google::protobuf::RepeatedField<int32_t>& indices,
                    const google::protobuf::RepeatedField<double>& coefficients,
                    double offset) {
  z3::expr sum = RealNumeral(ctx, offset);
  for (int i = 0; i < indices.size(); ++i) {
    if (coefficients[i] == 0.0) continue;
    sum = sum + RealNumeral(ctx, coefficients[i]) * vars[indices[i]];
  }
  return sum;
}

class Z3Interface : public SolverAdapter {
 public:
  Z3Interface() = default;

  std::string name() const override { return "z3"; }
  bool SupportsIntegerVariables() const override { return true; }

  ProgramResponse Solve(const ProgramRequest& request) override;

 private:
  // Does the work of Solve(); z3 reports its errors with z3::exception.
  void SolveOrThrow(const ProgramRequest& request, ProgramResponse* response);
};

ProgramResponse Z3Interface::Solve(const ProgramRequest& request) {
  ProgramResponse response;
  const absl::Time start = absl::Now();
  try {
    SolveOrThrow(request, &response);
  } catch (const z3::exception& e) {
    LOG(ERROR) << "Unexpected error solving '" << request.program().name()
               << "' with z3: " << e.msg();
    response.Clear();
    response.set_status(PROGRAM_ERROR);
    response.set_status_str(e.msg());
  }
  LOG_IF(INFO, request.parameters().enable_output())
      << "z3 solved '" << request.program().name() << "' in "
      << absl::FormatDuration(absl::Now() - start) << ": "
      << ProgramStatusName(response.status());
  return response;
}

void Z3Interface::SolveOrThrow(const ProgramRequest& request,
                               ProgramResponse* response) {
  const ProgramProto& program = request.program();
  z3::context ctx;
  z3::optimize optimizer(ctx);

  // Z3 takes the timeout in milliseconds as an unsigned; longer limits are
  // treated as no limit.
  const double time_limit_ms =
      std::ceil(request.parameters().time_limit_seconds() * 1000.0);
  if (time_limit_ms > 0 &&
      time_limit_ms <
          static_cast<double>(std::numeric_limits<unsigned>::max())) {
    z3::params params(ctx);
    params.set("timeout", static_cast<unsigned>(time_limit_ms));
    optimizer.set(params);
  }

  // All arithmetic is done over the reals; integer variables are embedded
  // with to_real().
  z3::expr_vector vars(ctx);
  for (int i = 0; i < program.variable_size(); ++i) {
    const VariableProto& var = program.variable(i);
    const std::string z3_name = absl::StrCat("x", i);
    const bool integer = var.category() != VariableProto::CONTINUOUS;
    const z3::expr x = integer ? z3::to_real(ctx.int_const(z3_name.c_str()))
                               : ctx.real_const(z3_name.c_str());
    if (std::isfinite(var.lower_bound())) {
      optimizer.add(x >= RealNumeral(ctx, var.lower_bound()));
    }
    if (std::isfinite(var.upper_bound())) {
      optimizer.add(x <= RealNumeral(ctx, var.upper_bound()));
    }
    vars.push_back(x);
  }

  for (const ConstraintProto& ct : program.constraint()) {
    const z3::expr lhs = LinearTerm(ctx, vars, ct.var_index(),
                                    ct.coefficient(), /*offset=*/0.0);
    const z3::expr rhs = RealNumeral(ctx, ct.rhs());
    switch (ct.sense()) {
      case ConstraintProto::LESS_OR_EQUAL:
        optimizer.add(lhs <= rhs);
        break;
      case ConstraintProto::GREATER_OR_EQUAL:
        optimizer.add(lhs >= rhs);
        break;
      case ConstraintProto::EQUAL:
        optimizer.add(lhs == rhs);
        break;
    }
  }

  z3::expr objective = RealNumeral(ctx, program.objective_offset());
  for (int i = 0; i < program.variable_size(); ++i) {
    const double coefficient = program.variable(i).objective_coefficient();
    if (coefficient == 0.0) continue;
    objective = objective + RealNumeral(ctx, coefficient) * vars[i];
  }
  const z3::optimize::handle handle = optimizer.minimize(objective);

  switch (optimizer.check()) {
    case z3::unsat:
      response->set_status(PROGRAM_INFEASIBLE);
      return;
    case z3::unknown:
      response->set_status(PROGRAM_NOT_SOLVED);
      response->set_status_str(
          Z3_optimize_get_reason_unknown(ctx, optimizer));
      return;
    case z3::sat:
      break;
  }

  // An unbounded objective has an infinite, hence non numeral, optimum.
  const z3::expr optimum = optimizer.lower(handle);
  if (!optimum.is_numeral()) {
    response->set_status(PROGRAM_UNBOUNDED);
    response->set_status_str(optimum.to_string());
    return;
  }

  const z3::model model = optimizer.get_model();
  for (int i = 0; i < program.variable_size(); ++i) {
    response->add_variable_value(
        model.eval(vars[i], /*model_completion=*/true).as_double());
  }
  response->set_objective_value(optimum.as_double());
  response->set_status(PROGRAM_OPTIMAL);
}

}  // namespace

std::unique_ptr<SolverAdapter> BuildZ3Interface() {
  return std::make_unique<Z3Interface>();
}

}  // namespace wglp
