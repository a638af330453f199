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

#ifndef CARTONPACK_PACKING_PRODUCT_H_
#define CARTONPACK_PACKING_PRODUCT_H_

#include <array>
#include <cstdint>

#include "absl/status/statusor.h"
#include "cartonpack/packing/carton_packing.pb.h"

namespace cartonpack::packing {

// The product type to pack: the dimensions and weight of one unit, and the
// number of units. Immutable once created.
class Product {
 public:
  // Returns an InvalidArgumentError naming the first field that is not
  // strictly positive.
  static absl::StatusOr<Product> Create(double length, double breadth,
                                        double height, double weight,
                                        int64_t quantity);
  static absl::StatusOr<Product> FromProto(const cp::Product& proto);

  double length() const { return length_; }
  double breadth() const { return breadth_; }
  double height() const { return height_; }
  double weight() const { return weight_; }
  int64_t quantity() const { return quantity_; }

  // (length, breadth, height), indexed by the orientation table.
  std::array<double, 3> dimensions() const {
    return {length_, breadth_, height_};
  }
  double volume() const { return length_ * breadth_ * height_; }

 private:
  Product(double length, double breadth, double height, double weight,
          int64_t quantity)
      : length_(length),
        breadth_(breadth),
        height_(height),
        weight_(weight),
        quantity_(quantity) {}

  double length_;
  double breadth_;
  double height_;
  double weight_;
  int64_t quantity_;
};

}  // namespace cartonpack::packing

#endif  // CARTONPACK_PACKING_PRODUCT_H_
