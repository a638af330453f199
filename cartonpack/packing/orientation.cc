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

#include "cartonpack/packing/orientation.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>

#include "absl/log/check.h"
#include "cartonpack/packing/carton_type.h"
#include "cartonpack/packing/product.h"

namespace cartonpack::packing {
namespace {

constexpr int64_t kInt64Max = std::numeric_limits<int64_t>::max();

// x * y for non-negative x and y, saturated at kInt64Max.
int64_t CapProd(int64_t x, int64_t y) {
  DCHECK_GE(x, 0);
  DCHECK_GE(y, 0);
  if (x == 0 || y == 0) return 0;
  if (x > kInt64Max / y) return kInt64Max;
  return x * y;
}

}  // namespace

int64_t FloorRatio(const double numerator, const double denominator) {
  DCHECK_GT(denominator, 0.0);
  if (!(numerator > 0.0)) return 0;
  // Dividing the exact multiple of `denominator` below `numerator` keeps
  // 2.0 / 0.4 at 4: the rounded quotient 2.0 / 0.4 is 5.0 although 0.4 is
  // stored as slightly more than 0.4.
  const double remainder = std::fmod(numerator, denominator);
  const double quotient = (numerator - remainder) / denominator;
  double ratio = std::floor(quotient);
  if (quotient - ratio > 0.5) ratio += 1.0;
  // Doubles at or above 2^63 do not convert to int64_t.
  if (ratio >= static_cast<double>(kInt64Max)) return kInt64Max;
  return static_cast<int64_t>(ratio);
}

FitRecord EvaluateFit(const Product& product, const CartonType& carton,
                      const int orientation, const int carton_index) {
  CHECK_GE(orientation, 0);
  CHECK_LT(orientation, kNumOrientations);
  const std::array<double, 3> product_dims = product.dimensions();
  const std::array<double, 3> carton_dims = carton.dimensions();
  const std::array<int, 3>& axes = kOrientations[orientation];

  FitRecord fit;
  fit.carton_index = carton_index;
  fit.orientation = orientation;
  fit.fit_lengthwise = FloorRatio(carton_dims[0], product_dims[axes[0]]);
  fit.fit_breadthwise = FloorRatio(carton_dims[1], product_dims[axes[1]]);
  fit.fit_heightwise = FloorRatio(carton_dims[2], product_dims[axes[2]]);
  fit.volumetric_capacity =
      CapProd(CapProd(fit.fit_lengthwise, fit.fit_breadthwise),
              fit.fit_heightwise);
  fit.weight_capacity = FloorRatio(carton.max_weight(), product.weight());
  fit.capacity = std::min(fit.volumetric_capacity, fit.weight_capacity);
  return fit;
}

std::array<FitRecord, kNumOrientations> EvaluateAllOrientations(
    const Product& product, const CartonType& carton, const int carton_index) {
  std::array<FitRecord, kNumOrientations> fits;
  for (int o = 0; o < kNumOrientations; ++o) {
    fits[o] = EvaluateFit(product, carton, o, carton_index);
  }
  return fits;
}

std::optional<FitRecord> BestFit(const Product& product,
                                 const CartonType& carton,
                                 const int carton_index) {
  std::optional<FitRecord> best;
  for (const FitRecord& fit :
       EvaluateAllOrientations(product, carton, carton_index)) {
    if (!fit.feasible()) continue;
    if (!best.has_value() || fit.capacity > best->capacity) best = fit;
  }
  return best;
}

}  // namespace cartonpack::packing
