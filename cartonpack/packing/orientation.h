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

// Axis-aligned orientations of a product inside a carton, and the number of
// units one carton can hold in each of them.

#ifndef CARTONPACK_PACKING_ORIENTATION_H_
#define CARTONPACK_PACKING_ORIENTATION_H_

#include <array>
#include <cstdint>
#include <optional>

#include "cartonpack/packing/carton_type.h"
#include "cartonpack/packing/product.h"

namespace cartonpack::packing {

inline constexpr int kNumOrientations = 6;

// kOrientations[o][axis] is the index of the product dimension
// (0 = length, 1 = breadth, 2 = height) laid along the carton axis `axis`
// (same indexing) in orientation o. The order of this table is the tie-break
// order of the allocator and is part of its output.
inline constexpr std::array<std::array<int, 3>, kNumOrientations>
    kOrientations = {{
        {0, 1, 2},
        {1, 2, 0},
        {2, 0, 1},
        {0, 2, 1},
        {2, 1, 0},
        {1, 0, 2},
    }};

// How many units of a product one carton holds in a given orientation.
struct FitRecord {
  // Index of the carton type in the inventory, -1 if not part of one.
  int carton_index = -1;
  int orientation = -1;

  // Units along the carton length, breadth and height.
  int64_t fit_lengthwise = 0;
  int64_t fit_breadthwise = 0;
  int64_t fit_heightwise = 0;

  // Product of the three counts above.
  int64_t volumetric_capacity = 0;
  // floor(max_weight / product weight).
  int64_t weight_capacity = 0;
  // min(volumetric_capacity, weight_capacity).
  int64_t capacity = 0;

  bool feasible() const { return capacity > 0; }
};

// floor(numerator / denominator) as a non-negative integer, saturated at
// kint64max, computed on the exact values of the operands rather than on
// their rounded quotient. Requires a positive denominator.
int64_t FloorRatio(double numerator, double denominator);

FitRecord EvaluateFit(const Product& product, const CartonType& carton,
                      int orientation, int carton_index = -1);

// All orientations, in table order.
std::array<FitRecord, kNumOrientations> EvaluateAllOrientations(
    const Product& product, const CartonType& carton, int carton_index = -1);

// The first orientation with the largest capacity, or nullopt if the product
// does not fit the carton in any orientation.
std::optional<FitRecord> BestFit(const Product& product,
                                 const CartonType& carton,
                                 int carton_index = -1);

}  // namespace cartonpack::packing

#endif  // CARTONPACK_PACKING_ORIENTATION_H_
