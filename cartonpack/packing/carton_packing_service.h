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

// Request handling on top of SolveCartonPacking(), for hosts that expose the
// solver behind an RPC or HTTP endpoint. All errors are reported in the
// response rather than as a status, so that the host only has to map
// CartonPackingResponseStatus to its own status codes.

#ifndef CARTONPACK_PACKING_CARTON_PACKING_SERVICE_H_
#define CARTONPACK_PACKING_CARTON_PACKING_SERVICE_H_

#include "absl/status/status.h"
#include "cartonpack/packing/carton_packing.pb.h"

namespace cartonpack::packing {

// - A problem without a product (or with an empty one) or without cartons is
//   RESPONSE_INVALID_REQUEST.
// - Validation errors are RESPONSE_INVALID_REQUEST, with the validation
//   message.
// - Any other error is RESPONSE_INTERNAL_ERROR.
// - Otherwise the response is RESPONSE_OK and holds the solution, including
//   when some units could not be packed.
cp::CartonPackingResponse HandleCartonPackingRequest(
    const cp::CartonPackingProblem& problem,
    const cp::CartonPackingParameters& parameters =
        cp::CartonPackingParameters());

// The response status a failed solve maps to.
cp::CartonPackingResponseStatus ResponseStatusForError(
    const absl::Status& status);

}  // namespace cartonpack::packing

#endif  // CARTONPACK_PACKING_CARTON_PACKING_SERVICE_H_
