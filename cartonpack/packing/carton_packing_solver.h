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

#ifndef CARTONPACK_PACKING_CARTON_PACKING_SOLVER_H_
#define CARTONPACK_PACKING_CARTON_PACKING_SOLVER_H_

#include "absl/status/statusor.h"
#include "cartonpack/packing/carton_packing.pb.h"

namespace cartonpack::packing {

// Validates `problem`, runs AllocateCartons() on a copy of its cartons and
// converts the allocation to a solution with summary statistics.
//
// Returns an InvalidArgumentError naming the offending field when the
// product, a carton or the parameters are invalid. An infeasible problem is
// not an error: the solution is PARTIALLY_PACKED with a positive
// remaining_demand.
absl::StatusOr<cp::CartonPackingSolution> SolveCartonPacking(
    const cp::CartonPackingProblem& problem,
    const cp::CartonPackingParameters& parameters =
        cp::CartonPackingParameters());

}  // namespace cartonpack::packing

#endif  // CARTONPACK_PACKING_CARTON_PACKING_SOLVER_H_
