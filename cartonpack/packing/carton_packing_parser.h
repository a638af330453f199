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

// Reads carton packing problems, and writes responses, in protocol buffer
// text format or JSON.
//
// JSON input accepts both the proto field names ("max_weight") and their
// lowerCamelCase form ("maxWeight"); unknown fields are ignored. Example:
//   {"product": {"length": 10, "breadth": 10, "height": 10, "weight": 1,
//                "quantity": 8},
//    "cartons": [{"length": 21, "breadth": 21, "height": 21,
//                 "max_weight": 100, "quantity": 1}]}

#ifndef CARTONPACK_PACKING_CARTON_PACKING_PARSER_H_
#define CARTONPACK_PACKING_CARTON_PACKING_PARSER_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "cartonpack/packing/carton_packing.pb.h"
#include "google/protobuf/message.h"

namespace cartonpack::packing {

enum class ProtoFormat {
  kText,
  kJson,
};

// Returns kJson for names ending in ".json", kText otherwise.
ProtoFormat FormatFromFileName(absl::string_view file_name);

// Parses `format`, or returns kText/kJson for "text"/"json".
absl::StatusOr<ProtoFormat> ParseProtoFormat(absl::string_view format);

absl::StatusOr<cp::CartonPackingProblem> ParseCartonPackingProblem(
    absl::string_view contents, ProtoFormat format);

// Reads a problem file, in the format given by its extension. The problem
// name defaults to the base name of the file, without extension.
absl::StatusOr<cp::CartonPackingProblem> ReadCartonPackingProblem(
    absl::string_view file_name);

absl::StatusOr<cp::CartonPackingParameters> ParseCartonPackingParameters(
    absl::string_view text_proto);

// Loads parameters from a text-format file when `file_name` is not empty,
// then merges `text_proto` on top of them.
absl::StatusOr<cp::CartonPackingParameters> ReadCartonPackingParameters(
    absl::string_view file_name, absl::string_view text_proto);

// Serializes any of the carton packing messages.
absl::StatusOr<std::string> FormatProto(const google::protobuf::Message& proto,
                                        ProtoFormat format);

}  // namespace cartonpack::packing

#endif  // CARTONPACK_PACKING_CARTON_PACKING_PARSER_H_
