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

#ifndef CARTONPACK_PACKING_CARTON_TYPE_H_
#define CARTONPACK_PACKING_CARTON_TYPE_H_

#include <array>
#include <cstdint>

#include "absl/log/check.h"
#include "absl/status/statusor.h"
#include "cartonpack/packing/carton_packing.pb.h"

namespace cartonpack::packing {

// One carton type of the inventory. The dimensions exposed are the interior
// ones, i.e. the stated dimensions minus the clearance buffer. They may be
// zero or negative when the buffer exceeds a stated dimension, in which case
// nothing fits in the carton.
//
// The remaining quantity is the only mutable part: it is decremented each
// time a physical carton of this type is committed by the allocator.
class CartonType {
 public:
  static constexpr double kDefaultClearanceBuffer = 1.0;

  // Returns an InvalidArgumentError naming the first stated dimension,
  // max_weight or quantity that is not strictly positive, or a clearance
  // buffer that is negative.
  static absl::StatusOr<CartonType> Create(
      double length, double breadth, double height, double max_weight,
      int64_t quantity, double clearance_buffer = kDefaultClearanceBuffer);

  // The proto clearance_buffer, when set, overrides
  // `default_clearance_buffer`.
  static absl::StatusOr<CartonType> FromProto(
      const cp::CartonType& proto,
      double default_clearance_buffer = kDefaultClearanceBuffer);

  double length() const { return length_; }
  double breadth() const { return breadth_; }
  double height() const { return height_; }
  double max_weight() const { return max_weight_; }
  double clearance_buffer() const { return clearance_buffer_; }

  // Interior (length, breadth, height).
  std::array<double, 3> dimensions() const {
    return {length_, breadth_, height_};
  }
  double interior_volume() const;

  // The number of cartons initially available, and the ones left.
  int64_t quantity() const { return quantity_; }
  int64_t remaining_quantity() const { return remaining_quantity_; }
  bool available() const { return remaining_quantity_ > 0; }

  // Takes `count` cartons out of the remaining quantity.
  void Commit(int64_t count) {
    CHECK_GT(count, 0);
    CHECK_LE(count, remaining_quantity_);
    remaining_quantity_ -= count;
  }

 private:
  CartonType(double length, double breadth, double height, double max_weight,
             int64_t quantity, double clearance_buffer)
      : length_(length - clearance_buffer),
        breadth_(breadth - clearance_buffer),
        height_(height - clearance_buffer),
        max_weight_(max_weight),
        clearance_buffer_(clearance_buffer),
        quantity_(quantity),
        remaining_quantity_(quantity) {}

  double length_;
  double breadth_;
  double height_;
  double max_weight_;
  double clearance_buffer_;
  int64_t quantity_;
  int64_t remaining_quantity_;
};

}  // namespace cartonpack::packing

#endif  // CARTONPACK_PACKING_CARTON_TYPE_H_
