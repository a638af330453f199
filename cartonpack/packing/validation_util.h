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

#ifndef CARTONPACK_PACKING_VALIDATION_UTIL_H_
#define CARTONPACK_PACKING_VALIDATION_UTIL_H_

#include <cstdint>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace cartonpack::packing {

// Returns an InvalidArgumentError naming `name` unless `value` is finite and
// strictly positive.
absl::Status CheckPositive(double value, absl::string_view name);
absl::Status CheckPositive(int64_t value, absl::string_view name);

// Same, but zero is accepted.
absl::Status CheckNonNegative(double value, absl::string_view name);

}  // namespace cartonpack::packing

#endif  // CARTONPACK_PACKING_VALIDATION_UTIL_H_
