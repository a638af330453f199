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

// Greedy allocation of the units of one product to an inventory of carton
// types.
//
// At each round, the allocator looks at every carton type that still has
// cartons left and every orientation of the product in it, and picks the pair
// holding the most units, capped at the remaining demand. Ties go to the
// first carton type in inventory order, then to the first orientation in
// kOrientations order. One physical carton of the chosen type is committed
// with that many units, and the loop starts again until either the demand is
// met or no carton can take a single unit.
//
// The result is not optimal in general: it never reconsiders a committed
// carton, and a carton type is chosen for the number of units it holds, not
// for how well it is used.

#ifndef CARTONPACK_PACKING_CARTON_ALLOCATOR_H_
#define CARTONPACK_PACKING_CARTON_ALLOCATOR_H_

#include <cstdint>
#include <vector>

#include "cartonpack/packing/carton_type.h"
#include "cartonpack/packing/product.h"

namespace cartonpack::packing {

// All the cartons of one type committed by the allocator.
struct PackingPlanEntry {
  int carton_index = -1;

  // Orientation and per-axis counts of the first carton of this type
  // committed. Later cartons of the same type may hold fewer units (the last
  // one is capped by the remaining demand) but never change these.
  int orientation = -1;
  int64_t fit_lengthwise = 0;
  int64_t fit_breadthwise = 0;
  int64_t fit_heightwise = 0;

  int64_t cartons_used = 0;
  int64_t total_items = 0;
};

struct CartonAllocation {
  // Ordered by first commitment.
  std::vector<PackingPlanEntry> plan;
  // Units left unpacked, 0 if the whole quantity was packed.
  int64_t remaining_demand = 0;
  // Number of cartons committed, i.e. rounds of the greedy loop.
  int64_t num_rounds = 0;
};

// Runs the greedy loop on `cartons`, whose remaining quantities are
// decremented in place: on return they reflect the cartons left after the
// allocation. The caller must not share `cartons` with another allocation
// running concurrently; pass a copy to keep the original inventory.
//
// Invariant: the sum of total_items over the plan plus remaining_demand is
// product.quantity().
CartonAllocation AllocateCartons(const Product& product,
                                 std::vector<CartonType>* cartons,
                                 bool log_search_progress = false);

}  // namespace cartonpack::packing

#endif  // CARTONPACK_PACKING_CARTON_ALLOCATOR_H_
