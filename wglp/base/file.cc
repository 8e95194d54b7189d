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

#include "wglp/base/file.h"

#include <zlib.h>

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "wglp/base/logging.h"

namespace wglp {
namespace file {
namespace {

class File {
 public:
  virtual ~File() = default;
  virtual size_t Read(void* buf, size_t size) = 0;
  virtual size_t Write(const void* buf, size_t size) = 0;
  // Returns false if pending writes could not be flushed.
  virtual bool Close() = 0;
};

class CFile : public File {
 public:
  explicit CFile(FILE* c_file) : f_(c_file) {}
  ~CFile() override {
    if (f_ != nullptr) fclose(f_);
  }

  size_t Read(void* buf, size_t size) override {
    return fread(buf, 1, size, f_);
  }
  size_t Write(const void* buf, size_t size) override {
    return fwrite(buf, 1, size, f_);
  }
  bool Close() override {
    const bool ok = fclose(f_) == 0;
    f_ = nullptr;
    return ok;
  }

 private:
  FILE* f_;
};

class GzFile : public File {
 public:
  explicit GzFile(gzFile gz_file) : f_(gz_file) {}
  ~GzFile() override {
    if (f_ != nullptr) gzclose(f_);
  }

  size_t Read(void* buf, size_t size) override {
    const int read = gzread(f_, buf, static_cast<unsigned>(size));
    return read < 0 ? 0 : static_cast<size_t>(read);
  }
  size_t Write(const void* buf, size_t size) override {
    return static_cast<size_t>(
        gzwrite(f_, buf, static_cast<unsigned>(size)));
  }
  bool Close() override {
    const bool ok = gzclose(f_) == Z_OK;
    f_ = nullptr;
    return ok;
  }

 private:
  gzFile f_;
};

// `mode` is "r" or "w". Returns nullptr if the file cannot be opened.
std::unique_ptr<File> Open(absl::string_view file_name, const char* mode) {
  const std::string name(file_name);
  const std::string binary_mode = absl::StrCat(mode, "b");
  if (absl::EndsWith(file_name, ".gz")) {
    gzFile gz_file = gzopen(name.c_str(), binary_mode.c_str());
    if (gz_file == nullptr) return nullptr;
    return std::make_unique<GzFile>(gz_file);
  }
  FILE* c_file = fopen(name.c_str(), binary_mode.c_str());
  if (c_file == nullptr) return nullptr;
  return std::make_unique<CFile>(c_file);
}

}  // namespace

absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents) {
  std::unique_ptr<File> f = Open(file_name, "w");
  if (f == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not open '", file_name, "'"));
  }
  const bool written =
      contents.empty() || f->Write(contents.data(), contents.size()) ==
                              contents.size();
  // Closed even if the write failed.
  const bool closed = f->Close();
  if (!written || !closed) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Could not write ", contents.size(), " bytes to '", file_name, "'"));
  }
  VLOG(1) << "Wrote " << contents.size() << " bytes to '" << file_name << "'";
  return absl::OkStatus();
}

absl::Status GetContents(absl::string_view file_name, std::string* output) {
  std::unique_ptr<File> f = Open(file_name, "r");
  if (f == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not open '", file_name, "'"));
  }
  output->clear();
  char buffer[1 << 16];
  size_t read;
  while ((read = f->Read(buffer, sizeof(buffer))) > 0) {
    output->append(buffer, read);
  }
  if (!f->Close()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not read '", file_name, "'"));
  }
  return absl::OkStatus();
}

absl::Status SetTextProto(absl::string_view file_name,
                          const google::protobuf::Message& proto) {
  std::string proto_string;
  if (!google::protobuf::TextFormat::PrintToString(proto, &proto_string)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not print ", proto.GetTypeName(), " as text"));
  }
  return SetContents(file_name, proto_string);
}

absl::Status GetTextProto(absl::string_view file_name,
                          google::protobuf::Message* proto) {
  std::string contents;
  const absl::Status status = GetContents(file_name, &contents);
  if (!status.ok()) return status;
  if (!google::protobuf::TextFormat::ParseFromString(contents, proto)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not parse a ", proto->GetTypeName(), " from '",
                     file_name, "'"));
  }
  return absl::OkStatus();
}

}  // namespace file
}  // namespace wglp
