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

#include "cartonpack/packing/product.h"

#include <cstdint>

#include "absl/status/statusor.h"
#include "cartonpack/base/status_macros.h"
#include "cartonpack/packing/carton_packing.pb.h"
#include "cartonpack/packing/validation_util.h"

namespace cartonpack::packing {

absl::StatusOr<Product> Product::Create(const double length,
                                        const double breadth,
                                        const double height,
                                        const double weight,
                                        const int64_t quantity) {
  RETURN_IF_ERROR(CheckPositive(length, "product length"));
  RETURN_IF_ERROR(CheckPositive(breadth, "product breadth"));
  RETURN_IF_ERROR(CheckPositive(height, "product height"));
  RETURN_IF_ERROR(CheckPositive(weight, "product weight"));
  RETURN_IF_ERROR(CheckPositive(quantity, "product quantity"));
  return Product(length, breadth, height, weight, quantity);
}

absl::StatusOr<Product> Product::FromProto(const cp::Product& proto) {
  return Create(proto.length(), proto.breadth(), proto.height(),
                proto.weight(), proto.quantity());
}

}  // namespace cartonpack::packing
