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

// Packs one product into an inventory of cartons.
//
// Usage:
//   carton_packing_main --input=problem.json [--output=response.json]
//       [--params_file=params.textproto]
//       [--params='default_clearance_buffer: 0.5 log_search_progress: true']

#include <cstdlib>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "cartonpack/base/file.h"
#include "cartonpack/packing/carton_packing.pb.h"
#include "cartonpack/packing/carton_packing_parser.h"
#include "cartonpack/packing/carton_packing_service.h"

ABSL_FLAG(std::string, input, "",
          "Carton packing problem file, in JSON (.json) or text format.");
ABSL_FLAG(std::string, params_file, "",
          "File holding CartonPackingParameters in text format.");
ABSL_FLAG(std::string, params, "",
          "CartonPackingParameters in text format, merged over --params_file.");
ABSL_FLAG(std::string, output, "",
          "If not empty, the response is written to this file.");
ABSL_FLAG(std::string, output_format, "json",
          "Format of --output: text or json.");
ABSL_FLAG(bool, display_proto, false, "Print the input protobuf");

namespace cartonpack::packing {
namespace {

// Exit codes.
constexpr int kExitInvalidRequest = 2;
constexpr int kExitInternalError = 1;

int ExitCodeFor(const cp::CartonPackingResponseStatus status) {
  switch (status) {
    case cp::RESPONSE_OK:
      return EXIT_SUCCESS;
    case cp::RESPONSE_INVALID_REQUEST:
      return kExitInvalidRequest;
    default:
      return kExitInternalError;
  }
}

int ParseAndSolve(const std::string& filename, const std::string& params_file,
                  const std::string& params, const std::string& output,
                  const std::string& format) {
  const absl::StatusOr<ProtoFormat> output_format = ParseProtoFormat(format);
  if (!output_format.ok()) {
    LOG(ERROR) << "--output_format: " << output_format.status();
    return kExitInvalidRequest;
  }
  const absl::StatusOr<cp::CartonPackingParameters> parameters =
      ReadCartonPackingParameters(params_file, params);
  if (!parameters.ok()) {
    LOG(ERROR) << "Cannot read parameters: " << parameters.status();
    return kExitInvalidRequest;
  }
  const absl::StatusOr<cp::CartonPackingProblem> problem =
      ReadCartonPackingProblem(filename);
  if (!problem.ok()) {
    LOG(ERROR) << "Cannot read " << filename << ": " << problem.status();
    return kExitInvalidRequest;
  }

  LOG(INFO) << "Solving carton packing problem '" << problem->name()
            << "' with " << problem->product().quantity() << " units and "
            << problem->cartons_size() << " carton types.";
  if (absl::GetFlag(FLAGS_display_proto)) {
    LOG(INFO) << problem->DebugString();
  }

  const cp::CartonPackingResponse response =
      HandleCartonPackingRequest(*problem, *parameters);
  if (response.status() == cp::RESPONSE_OK) {
    const cp::CartonPackingSolution& solution = response.solution();
    for (const cp::PackingPlanEntry& entry : solution.entries()) {
      LOG(INFO) << "Carton " << entry.carton_index() << ": "
                << entry.cartons_used() << " used, " << entry.total_items()
                << " items, orientation " << entry.orientation() << " ("
                << entry.fit_lengthwise() << " x " << entry.fit_breadthwise()
                << " x " << entry.fit_heightwise() << ")";
    }
    LOG(INFO) << solution.total_items_packed() << " items packed in "
              << solution.total_cartons_used() << " cartons, "
              << solution.remaining_demand() << " left.";
  } else {
    LOG(ERROR) << response.message();
  }

  if (!output.empty()) {
    const absl::StatusOr<std::string> contents =
        FormatProto(response, *output_format);
    absl::Status status = contents.status();
    if (status.ok()) status = file::SetContents(output, *contents);
    if (!status.ok()) {
      LOG(ERROR) << "Cannot write " << output << ": " << status;
      return kExitInternalError;
    }
  }
  return ExitCodeFor(response.status());
}

}  // namespace
}  // namespace cartonpack::packing

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(
      "Packs one product into an inventory of carton types.");
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  if (absl::GetFlag(FLAGS_input).empty()) {
    LOG(ERROR) << "Please supply a data file with --input=";
    return EXIT_FAILURE;
  }

  return cartonpack::packing::ParseAndSolve(
      absl::GetFlag(FLAGS_input), absl::GetFlag(FLAGS_params_file),
      absl::GetFlag(FLAGS_params),
      absl::GetFlag(FLAGS_output), absl::GetFlag(FLAGS_output_format));
}
