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

// Whole-file helpers. A name ending in ".gz" is read and written through
// zlib.

#ifndef WGLP_BASE_FILE_H_
#define WGLP_BASE_FILE_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"

namespace wglp {
namespace file {

// Replaces the content of `file_name`, creating it if needed.
absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents);

absl::Status GetContents(absl::string_view file_name, std::string* output);

absl::Status SetTextProto(absl::string_view file_name,
                          const google::protobuf::Message& proto);

absl::Status GetTextProto(absl::string_view file_name,
                          google::protobuf::Message* proto);

}  // namespace file
}  // namespace wglp

#endif  // WGLP_BASE_FILE_H_
