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

#include "cartonpack/packing/carton_type.h"

#include <cstdint>

#include "absl/status/statusor.h"
#include "cartonpack/base/status_macros.h"
#include "cartonpack/packing/carton_packing.pb.h"
#include "cartonpack/packing/validation_util.h"

namespace cartonpack::packing {

absl::StatusOr<CartonType> CartonType::Create(
    const double length, const double breadth, const double height,
    const double max_weight, const int64_t quantity,
    const double clearance_buffer) {
  RETURN_IF_ERROR(CheckPositive(length, "carton length"));
  RETURN_IF_ERROR(CheckPositive(breadth, "carton breadth"));
  RETURN_IF_ERROR(CheckPositive(height, "carton height"));
  RETURN_IF_ERROR(CheckPositive(max_weight, "carton max_weight"));
  RETURN_IF_ERROR(CheckPositive(quantity, "carton quantity"));
  RETURN_IF_ERROR(
      CheckNonNegative(clearance_buffer, "carton clearance_buffer"));
  return CartonType(length, breadth, height, max_weight, quantity,
                    clearance_buffer);
}

absl::StatusOr<CartonType> CartonType::FromProto(
    const cp::CartonType& proto, const double default_clearance_buffer) {
  return Create(proto.length(), proto.breadth(), proto.height(),
                proto.max_weight(), proto.quantity(),
                proto.has_clearance_buffer() ? proto.clearance_buffer()
                                             : default_clearance_buffer);
}

double CartonType::interior_volume() const {
  if (length_ <= 0 || breadth_ <= 0 || height_ <= 0) return 0.0;
  return length_ * breadth_ * height_;
}

}  // namespace cartonpack::packing
