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

#include "cartonpack/packing/validation_util.h"

#include <cmath>
#include <cstdint>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace cartonpack::packing {

using ::absl::InvalidArgumentError;

absl::Status CheckPositive(const double value, const absl::string_view name) {
  if (std::isnan(value)) {
    return InvalidArgumentError(absl::StrCat(name, " is NAN"));
  }
  if (std::isinf(value)) {
    return InvalidArgumentError(absl::StrCat(name, " must be finite"));
  }
  if (value <= 0) {
    return InvalidArgumentError(
        absl::StrCat(name, " must be positive (got ", value, ")"));
  }
  return absl::OkStatus();
}

absl::Status CheckPositive(const int64_t value, const absl::string_view name) {
  if (value <= 0) {
    return InvalidArgumentError(
        absl::StrCat(name, " must be positive (got ", value, ")"));
  }
  return absl::OkStatus();
}

absl::Status CheckNonNegative(const double value,
                              const absl::string_view name) {
  if (std::isnan(value)) {
    return InvalidArgumentError(absl::StrCat(name, " is NAN"));
  }
  if (std::isinf(value)) {
    return InvalidArgumentError(absl::StrCat(name, " must be finite"));
  }
  if (value < 0) {
    return InvalidArgumentError(
        absl::StrCat(name, " must be non-negative (got ", value, ")"));
  }
  return absl::OkStatus();
}

}  // namespace cartonpack::packing
