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

#include "cartonpack/packing/carton_allocator.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "cartonpack/packing/carton_type.h"
#include "cartonpack/packing/orientation.h"
#include "cartonpack/packing/product.h"

namespace cartonpack::packing {
namespace {

// Plan entries keyed by carton type, plus the order in which the types were
// first committed.
class PlanAccumulator {
 public:
  // Records `num_cartons` cartons of the type of `fit`, each holding
  // `items_per_carton` units.
  void Commit(const FitRecord& fit, int64_t items_per_carton,
              int64_t num_cartons) {
    auto [it, inserted] = entries_.try_emplace(fit.carton_index);
    PackingPlanEntry& entry = it->second;
    if (inserted) {
      entry.carton_index = fit.carton_index;
      entry.orientation = fit.orientation;
      entry.fit_lengthwise = fit.fit_lengthwise;
      entry.fit_breadthwise = fit.fit_breadthwise;
      entry.fit_heightwise = fit.fit_heightwise;
      commit_order_.push_back(fit.carton_index);
    }
    entry.cartons_used += num_cartons;
    entry.total_items += items_per_carton * num_cartons;
  }

  // Flattens the entries in first-commitment order.
  std::vector<PackingPlanEntry> OrderedPlan() const {
    std::vector<PackingPlanEntry> plan;
    plan.reserve(commit_order_.size());
    for (const int carton_index : commit_order_) {
      plan.push_back(entries_.at(carton_index));
    }
    return plan;
  }

 private:
  absl::flat_hash_map<int, PackingPlanEntry> entries_;
  std::vector<int> commit_order_;
};

}  // namespace

CartonAllocation AllocateCartons(const Product& product,
                                 std::vector<CartonType>* cartons,
                                 const bool log_search_progress) {
  CHECK(cartons != nullptr);
  const int num_carton_types = cartons->size();

  // The geometry and weight limits do not change between rounds, only the
  // availability does.
  std::vector<std::array<FitRecord, kNumOrientations>> fits;
  fits.reserve(num_carton_types);
  for (int c = 0; c < num_carton_types; ++c) {
    fits.push_back(EvaluateAllOrientations(product, (*cartons)[c], c));
  }

  PlanAccumulator plan;
  int64_t remaining_demand = product.quantity();
  int64_t num_rounds = 0;
  while (remaining_demand > 0) {
    const FitRecord* best = nullptr;
    int64_t best_capacity = 0;
    for (int c = 0; c < num_carton_types; ++c) {
      if (!(*cartons)[c].available()) continue;
      for (const FitRecord& fit : fits[c]) {
        if (!fit.feasible()) continue;
        const int64_t capped_capacity =
            std::min(fit.capacity, remaining_demand);
        if (capped_capacity > best_capacity) {
          best = &fit;
          best_capacity = capped_capacity;
        }
      }
    }
    if (best == nullptr) break;

    // As long as the demand covers a full carton, nothing the scan above
    // depends on changes except the availability of the chosen type, so the
    // same pair wins the following rounds. They are committed at once.
    CartonType& carton = (*cartons)[best->carton_index];
    int64_t num_cartons = 1;
    if (best_capacity == best->capacity) {
      num_cartons = std::min(carton.remaining_quantity(),
                             remaining_demand / best_capacity);
    }
    carton.Commit(num_cartons);
    remaining_demand -= best_capacity * num_cartons;
    plan.Commit(*best, best_capacity, num_cartons);
    num_rounds += num_cartons;

    VLOG(1) << "Committed " << num_cartons << " x carton #"
            << best->carton_index << " (orientation " << best->orientation
            << ", " << best_capacity << " units each), " << remaining_demand
            << " units left.";
    if (log_search_progress) {
      LOG(INFO) << "#" << num_rounds << " carton " << best->carton_index
                << " x" << num_cartons << " orientation " << best->orientation
                << " units/carton " << best_capacity << " left "
                << remaining_demand;
    }
  }

  CartonAllocation allocation;
  allocation.plan = plan.OrderedPlan();
  allocation.remaining_demand = remaining_demand;
  allocation.num_rounds = num_rounds;
  if (log_search_progress) {
    LOG(INFO) << "Allocation done: " << num_rounds << " cartons of "
              << allocation.plan.size() << " types, "
              << product.quantity() - remaining_demand << "/"
              << product.quantity() << " units packed.";
  }
  return allocation;
}

}  // namespace cartonpack::packing
