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

#include "cartonpack/base/file.h"

#include <cstdio>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "cartonpack/base/status_macros.h"

namespace cartonpack::file {
namespace {

// Owns a FILE* for the duration of one read or write.
class CFile {
 public:
  CFile(FILE* c_file, absl::string_view name) : f_(c_file), name_(name) {}
  CFile(CFile&& other) : f_(other.f_), name_(std::move(other.name_)) {
    other.f_ = nullptr;
  }
  CFile(const CFile&) = delete;
  CFile& operator=(const CFile&) = delete;
  ~CFile() {
    if (f_ != nullptr) fclose(f_);
  }

  static absl::StatusOr<CFile> Open(absl::string_view file_name,
                                    const char* mode) {
    const std::string name(file_name);
    FILE* const c_file = fopen(name.c_str(), mode);
    if (c_file == nullptr) {
      return absl::NotFoundError(
          absl::StrCat("Could not open '", file_name, "'."));
    }
    return CFile(c_file, file_name);
  }

  absl::Status ReadToString(std::string* output) {
    output->clear();
    char buffer[4096];
    size_t num_read;
    while ((num_read = fread(buffer, 1, sizeof(buffer), f_)) > 0) {
      output->append(buffer, num_read);
    }
    if (ferror(f_)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Could not read from '", name_, "'."));
    }
    return absl::OkStatus();
  }

  absl::Status WriteString(absl::string_view contents) {
    if (fwrite(contents.data(), 1, contents.size(), f_) != contents.size()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Could not write ", contents.size(), " bytes to '",
                       name_, "'."));
    }
    return absl::OkStatus();
  }

  absl::Status Close() {
    FILE* const c_file = f_;
    f_ = nullptr;
    if (fclose(c_file) != 0) {
      return absl::InternalError(
          absl::StrCat("Could not close '", name_, "'."));
    }
    return absl::OkStatus();
  }

 private:
  FILE* f_;
  std::string name_;
};

}  // namespace

absl::StatusOr<std::string> GetContents(absl::string_view file_name) {
  ASSIGN_OR_RETURN(CFile file, CFile::Open(file_name, "rb"));
  std::string contents;
  RETURN_IF_ERROR(file.ReadToString(&contents));
  RETURN_IF_ERROR(file.Close());
  return contents;
}

absl::Status SetContents(absl::string_view file_name,
                         absl::string_view contents) {
  ASSIGN_OR_RETURN(CFile file, CFile::Open(file_name, "wb"));
  RETURN_IF_ERROR(file.WriteString(contents));
  return file.Close();
}

absl::Status GetTextProto(absl::string_view file_name,
                          google::protobuf::Message* proto) {
  ASSIGN_OR_RETURN(const std::string contents, GetContents(file_name));
  if (!google::protobuf::TextFormat::ParseFromString(contents, proto)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not parse '", file_name, "' as a text ",
                     proto->GetTypeName(), "."));
  }
  return absl::OkStatus();
}

}  // namespace cartonpack::file
