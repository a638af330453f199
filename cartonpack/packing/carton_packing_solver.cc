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

#include "cartonpack/packing/carton_packing_solver.h"

#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "cartonpack/base/status_macros.h"
#include "cartonpack/packing/carton_allocator.h"
#include "cartonpack/packing/carton_packing.pb.h"
#include "cartonpack/packing/carton_type.h"
#include "cartonpack/packing/product.h"
#include "cartonpack/packing/validation_util.h"

namespace cartonpack::packing {

absl::StatusOr<cp::CartonPackingSolution> SolveCartonPacking(
    const cp::CartonPackingProblem& problem,
    const cp::CartonPackingParameters& parameters) {
  double default_clearance_buffer = CartonType::kDefaultClearanceBuffer;
  if (parameters.has_default_clearance_buffer()) {
    default_clearance_buffer = parameters.default_clearance_buffer();
    RETURN_IF_ERROR(CheckNonNegative(default_clearance_buffer,
                                     "default_clearance_buffer"))
        << "in parameters";
  }

  ASSIGN_OR_RETURN(const Product product,
                   Product::FromProto(problem.product()));
  std::vector<CartonType> cartons;
  cartons.reserve(problem.cartons_size());
  for (int c = 0; c < problem.cartons_size(); ++c) {
    absl::StatusOr<CartonType> carton =
        CartonType::FromProto(problem.cartons(c), default_clearance_buffer);
    RETURN_IF_ERROR(carton.status()) << "in cartons[" << c << "]";
    cartons.push_back(*std::move(carton));
  }

  // Only the remaining quantities of `cartons` change here; the interior
  // volumes read below are unaffected.
  const CartonAllocation allocation =
      AllocateCartons(product, &cartons, parameters.log_search_progress());

  cp::CartonPackingSolution solution;
  double sum_volume_utilization = 0.0;
  for (const PackingPlanEntry& entry : allocation.plan) {
    const CartonType& carton = cartons[entry.carton_index];
    cp::PackingPlanEntry* const output = solution.add_entries();
    output->set_carton_index(entry.carton_index);
    output->set_orientation(entry.orientation);
    output->set_fit_lengthwise(entry.fit_lengthwise);
    output->set_fit_breadthwise(entry.fit_breadthwise);
    output->set_fit_heightwise(entry.fit_heightwise);
    output->set_cartons_used(entry.cartons_used);
    output->set_total_items(entry.total_items);
    const double used_volume = entry.cartons_used * carton.interior_volume();
    if (used_volume > 0.0) {
      output->set_volume_utilization(entry.total_items * product.volume() /
                                     used_volume);
    }
    output->set_weight_utilized(entry.total_items * product.weight());
    sum_volume_utilization += output->volume_utilization();
    solution.set_total_items_packed(solution.total_items_packed() +
                                    entry.total_items);
    solution.set_total_cartons_used(solution.total_cartons_used() +
                                    entry.cartons_used);
  }
  if (!allocation.plan.empty()) {
    solution.set_average_volume_utilization(sum_volume_utilization /
                                            allocation.plan.size());
  }
  solution.set_remaining_demand(allocation.remaining_demand);
  solution.set_num_rounds(allocation.num_rounds);
  solution.set_status(allocation.remaining_demand == 0
                          ? cp::FULLY_PACKED
                          : cp::PARTIALLY_PACKED);
  return solution;
}

}  // namespace cartonpack::packing
