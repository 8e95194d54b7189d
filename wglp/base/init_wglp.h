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

#ifndef WGLP_BASE_INIT_WGLP_H_
#define WGLP_BASE_INIT_WGLP_H_

#include <vector>

#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/strings/string_view.h"

namespace wglp {

// Initializes logging and parses the command line flags. Must be called once,
// at the top of main(), before any other thread uses the library.
//
// On return, argc/argv only hold the positional arguments (argv[0] included).
inline void InitWglp(absl::string_view usage, int* argc, char*** argv) {
  absl::InitializeLog();
  if (!usage.empty()) {
    absl::SetProgramUsageMessage(usage);
  }
  const std::vector<char*> positional = absl::ParseCommandLine(*argc, *argv);
  for (int i = 0; i < static_cast<int>(positional.size()); ++i) {
    (*argv)[i] = positional[i];
  }
  *argc = static_cast<int>(positional.size());
}

}  // namespace wglp

#endif  // WGLP_BASE_INIT_WGLP_H_
