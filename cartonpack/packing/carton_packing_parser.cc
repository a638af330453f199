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

#include "cartonpack/packing/carton_packing_parser.h"

#include <cstddef>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "cartonpack/base/file.h"
#include "cartonpack/base/status_macros.h"
#include "cartonpack/packing/carton_packing.pb.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "google/protobuf/util/json_util.h"

namespace cartonpack::packing {
namespace {

absl::Status ParseInto(absl::string_view contents, const ProtoFormat format,
                       google::protobuf::Message* proto) {
  switch (format) {
    case ProtoFormat::kText: {
      if (!google::protobuf::TextFormat::ParseFromString(std::string(contents),
                                                         proto)) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Could not parse the text ", proto->GetTypeName()));
      }
      return absl::OkStatus();
    }
    case ProtoFormat::kJson: {
      google::protobuf::util::JsonParseOptions options;
      options.ignore_unknown_fields = true;
      const auto status = google::protobuf::util::JsonStringToMessage(
          std::string(contents), proto, options);
      if (!status.ok()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Could not parse the JSON ", proto->GetTypeName(),
                         ": ", status.ToString()));
      }
      return absl::OkStatus();
    }
  }
  return absl::InternalError("Unknown format");
}

// "dir/problem.json" -> "problem".
std::string ProblemNameFromFileName(absl::string_view file_name) {
  const size_t slash = file_name.find_last_of("/\\");
  if (slash != absl::string_view::npos) file_name.remove_prefix(slash + 1);
  const size_t dot = file_name.find_last_of('.');
  if (dot != absl::string_view::npos && dot > 0) {
    file_name = file_name.substr(0, dot);
  }
  return std::string(file_name);
}

}  // namespace

ProtoFormat FormatFromFileName(absl::string_view file_name) {
  return absl::EndsWithIgnoreCase(file_name, ".json") ? ProtoFormat::kJson
                                                      : ProtoFormat::kText;
}

absl::StatusOr<ProtoFormat> ParseProtoFormat(absl::string_view format) {
  if (format == "text") return ProtoFormat::kText;
  if (format == "json") return ProtoFormat::kJson;
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown format '", format, "', expected text or json"));
}

absl::StatusOr<cp::CartonPackingProblem> ParseCartonPackingProblem(
    absl::string_view contents, const ProtoFormat format) {
  cp::CartonPackingProblem problem;
  RETURN_IF_ERROR(ParseInto(contents, format, &problem));
  return problem;
}

absl::StatusOr<cp::CartonPackingProblem> ReadCartonPackingProblem(
    absl::string_view file_name) {
  ASSIGN_OR_RETURN(const std::string contents, file::GetContents(file_name));
  cp::CartonPackingProblem problem;
  RETURN_IF_ERROR(
      ParseInto(contents, FormatFromFileName(file_name), &problem))
      << "while reading " << file_name;
  if (problem.name().empty()) {
    problem.set_name(ProblemNameFromFileName(file_name));
  }
  return problem;
}

absl::StatusOr<cp::CartonPackingParameters> ParseCartonPackingParameters(
    absl::string_view text_proto) {
  cp::CartonPackingParameters parameters;
  RETURN_IF_ERROR(ParseInto(text_proto, ProtoFormat::kText, &parameters));
  return parameters;
}

absl::StatusOr<cp::CartonPackingParameters> ReadCartonPackingParameters(
    absl::string_view file_name, absl::string_view text_proto) {
  cp::CartonPackingParameters parameters;
  if (!file_name.empty()) {
    ASSIGN_OR_RETURN(
        parameters,
        file::GetTextProto<cp::CartonPackingParameters>(file_name));
  }
  ASSIGN_OR_RETURN(const cp::CartonPackingParameters overrides,
                   ParseCartonPackingParameters(text_proto));
  parameters.MergeFrom(overrides);
  return parameters;
}

absl::StatusOr<std::string> FormatProto(const google::protobuf::Message& proto,
                                        const ProtoFormat format) {
  std::string output;
  switch (format) {
    case ProtoFormat::kText: {
      if (!google::protobuf::TextFormat::PrintToString(proto, &output)) {
        return absl::InternalError(
            absl::StrCat("Could not print ", proto.GetTypeName()));
      }
      return output;
    }
    case ProtoFormat::kJson: {
      google::protobuf::util::JsonPrintOptions options;
      options.add_whitespace = true;
      options.preserve_proto_field_names = true;
      const auto status =
          google::protobuf::util::MessageToJsonString(proto, &output, options);
      if (!status.ok()) {
        return absl::InternalError(
            absl::StrCat("Could not convert ", proto.GetTypeName(),
                         " to JSON: ", status.ToString()));
      }
      return output;
    }
  }
  return absl::InternalError("Unknown format");
}

}  // namespace cartonpack::packing
