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

#include "cartonpack/packing/carton_packing_service.h"

#include "absl/status/status.h"
#include "cartonpack/base/gmock.h"
#include "cartonpack/base/parse_text_proto.h"
#include "cartonpack/packing/carton_packing.pb.h"
#include "gtest/gtest.h"

namespace cartonpack::packing {
namespace {

using ::testing::HasSubstr;

TEST(HandleCartonPackingRequestTest, PackingCompleted) {
  const auto problem = ParseTextOrDie<cp::CartonPackingProblem>(R"pb(
    product { length: 10 breadth: 10 height: 10 weight: 1 quantity: 8 }
    cartons {
      length: 21
      breadth: 21
      height: 21
      max_weight: 100
      quantity: 1
    }
  )pb");
  const cp::CartonPackingResponse response =
      HandleCartonPackingRequest(problem);
  EXPECT_EQ(response.status(), cp::RESPONSE_OK);
  EXPECT_EQ(response.message(), "Packing completed.");
  EXPECT_EQ(response.solution().status(), cp::FULLY_PACKED);
  EXPECT_EQ(response.solution().total_items_packed(), 8);
}

TEST(HandleCartonPackingRequestTest, PartialPackingIsNotAnError) {
  const auto problem = ParseTextOrDie<cp::CartonPackingProblem>(R"pb(
    product { length: 10 breadth: 10 height: 10 weight: 1 quantity: 10 }
    cartons {
      length: 21
      breadth: 21
      height: 21
      max_weight: 100
      quantity: 1
    }
  )pb");
  const cp::CartonPackingResponse response =
      HandleCartonPackingRequest(problem);
  EXPECT_EQ(response.status(), cp::RESPONSE_OK);
  EXPECT_EQ(response.message(),
            "Partial packing completed. 2 items could not be packed.");
  EXPECT_EQ(response.solution().status(), cp::PARTIALLY_PACKED);
  EXPECT_EQ(response.solution().remaining_demand(), 2);
}

TEST(HandleCartonPackingRequestTest, MissingProduct) {
  const auto problem = ParseTextOrDie<cp::CartonPackingProblem>(R"pb(
    cartons { length: 21 breadth: 21 height: 21 max_weight: 100 quantity: 1 }
  )pb");
  const cp::CartonPackingResponse response =
      HandleCartonPackingRequest(problem);
  EXPECT_EQ(response.status(), cp::RESPONSE_INVALID_REQUEST);
  EXPECT_EQ(response.message(), "Missing product or cartons data.");
  EXPECT_FALSE(response.has_solution());
}

TEST(HandleCartonPackingRequestTest, EmptyProductIsMissing) {
  const auto problem = ParseTextOrDie<cp::CartonPackingProblem>(R"pb(
    product {}
    cartons { length: 21 breadth: 21 height: 21 max_weight: 100 quantity: 1 }
  )pb");
  ASSERT_TRUE(problem.has_product());
  const cp::CartonPackingResponse response =
      HandleCartonPackingRequest(problem);
  EXPECT_EQ(response.status(), cp::RESPONSE_INVALID_REQUEST);
  EXPECT_EQ(response.message(), "Missing product or cartons data.");
}

TEST(HandleCartonPackingRequestTest, PartialProductIsValidated) {
  const auto problem = ParseTextOrDie<cp::CartonPackingProblem>(R"pb(
    product { length: 10 breadth: 10 height: 10 quantity: 8 }
    cartons { length: 21 breadth: 21 height: 21 max_weight: 100 quantity: 1 }
  )pb");
  const cp::CartonPackingResponse response =
      HandleCartonPackingRequest(problem);
  EXPECT_EQ(response.status(), cp::RESPONSE_INVALID_REQUEST);
  EXPECT_THAT(response.message(), HasSubstr("product weight"));
}

TEST(HandleCartonPackingRequestTest, MissingCartons) {
  const auto problem = ParseTextOrDie<cp::CartonPackingProblem>(R"pb(
    product { length: 10 breadth: 10 height: 10 weight: 1 quantity: 8 }
  )pb");
  const cp::CartonPackingResponse response =
      HandleCartonPackingRequest(problem);
  EXPECT_EQ(response.status(), cp::RESPONSE_INVALID_REQUEST);
  EXPECT_EQ(response.message(), "Missing product or cartons data.");
}

TEST(HandleCartonPackingRequestTest, ValidationErrorsAreInvalidRequests) {
  const auto problem = ParseTextOrDie<cp::CartonPackingProblem>(R"pb(
    product { length: 10 breadth: 10 height: 10 weight: 1 quantity: 8 }
    cartons { length: 21 breadth: 21 height: 21 max_weight: 100 quantity: 1 }
    cartons { length: 21 breadth: 21 height: 21 max_weight: -2 quantity: 1 }
  )pb");
  const cp::CartonPackingResponse response =
      HandleCartonPackingRequest(problem);
  EXPECT_EQ(response.status(), cp::RESPONSE_INVALID_REQUEST);
  EXPECT_THAT(response.message(), HasSubstr("max_weight"));
  EXPECT_THAT(response.message(), HasSubstr("cartons[1]"));
  EXPECT_FALSE(response.has_solution());
}

TEST(HandleCartonPackingRequestTest, InvalidParameters) {
  const auto problem = ParseTextOrDie<cp::CartonPackingProblem>(R"pb(
    product { length: 10 breadth: 10 height: 10 weight: 1 quantity: 8 }
    cartons { length: 21 breadth: 21 height: 21 max_weight: 100 quantity: 1 }
  )pb");
  const auto parameters = ParseTextOrDie<cp::CartonPackingParameters>(
      "default_clearance_buffer: -1");
  const cp::CartonPackingResponse response =
      HandleCartonPackingRequest(problem, parameters);
  EXPECT_EQ(response.status(), cp::RESPONSE_INVALID_REQUEST);
  EXPECT_THAT(response.message(), HasSubstr("non-negative"));
}

TEST(ResponseStatusForErrorTest, MapsStatusCodes) {
  EXPECT_EQ(ResponseStatusForError(absl::InvalidArgumentError("bad")),
            cp::RESPONSE_INVALID_REQUEST);
  EXPECT_EQ(ResponseStatusForError(absl::InternalError("oops")),
            cp::RESPONSE_INTERNAL_ERROR);
  EXPECT_EQ(ResponseStatusForError(absl::ResourceExhaustedError("oom")),
            cp::RESPONSE_INTERNAL_ERROR);
}

}  // namespace
}  // namespace cartonpack::packing
