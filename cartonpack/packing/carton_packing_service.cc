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

#include "cartonpack/packing/carton_packing_service.h"

#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "cartonpack/packing/carton_packing.pb.h"
#include "cartonpack/packing/carton_packing_solver.h"

namespace cartonpack::packing {

cp::CartonPackingResponseStatus ResponseStatusForError(
    const absl::Status& status) {
  return status.code() == absl::StatusCode::kInvalidArgument
             ? cp::RESPONSE_INVALID_REQUEST
             : cp::RESPONSE_INTERNAL_ERROR;
}

cp::CartonPackingResponse HandleCartonPackingRequest(
    const cp::CartonPackingProblem& problem,
    const cp::CartonPackingParameters& parameters) {
  cp::CartonPackingResponse response;
  // An empty product message counts as no product at all.
  if (!problem.has_product() || problem.product().ByteSizeLong() == 0 ||
      problem.cartons().empty()) {
    response.set_status(cp::RESPONSE_INVALID_REQUEST);
    response.set_message("Missing product or cartons data.");
    return response;
  }

  absl::StatusOr<cp::CartonPackingSolution> solution =
      SolveCartonPacking(problem, parameters);
  if (!solution.ok()) {
    response.set_status(ResponseStatusForError(solution.status()));
    if (response.status() == cp::RESPONSE_INVALID_REQUEST) {
      response.set_message(std::string(solution.status().message()));
    } else {
      LOG(ERROR) << "Solving '" << problem.name()
                 << "' failed: " << solution.status();
      response.set_message(
          absl::StrCat("Server error: ", solution.status().message()));
    }
    return response;
  }

  response.set_status(cp::RESPONSE_OK);
  if (solution->remaining_demand() > 0) {
    response.set_message(absl::StrCat("Partial packing completed. ",
                                      solution->remaining_demand(),
                                      " items could not be packed."));
  } else {
    response.set_message("Packing completed.");
  }
  *response.mutable_solution() = *std::move(solution);
  return response;
}

}  // namespace cartonpack::packing
