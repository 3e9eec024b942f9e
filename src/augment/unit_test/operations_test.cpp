////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2014-2024, Lawrence Livermore National Security, LLC.
// Produced at the Lawrence Livermore National Laboratory.
// Written by the LBANN Research Team (B. Van Essen, et al.) listed in
// the CONTRIBUTORS file. <lbann-dev@llnl.gov>
//
// LLNL-CODE-697807.
// All rights reserved.
//
// This file is part of Augur: policy-driven image augmentation for
// LBANN. For details, see http://software.llnl.gov/LBANN or
// https://github.com/LLNL/LBANN.
//
// Licensed under the Apache License, Version 2.0 (the "Licensee"); you
// may not use this file except in compliance with the License.  You may
// obtain a copy of the License at:
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or
// implied. See the License for the specific language governing
// permissions and limitations under the license.
////////////////////////////////////////////////////////////////////////////////

// MUST include this
#include "Catch2BasicSupport.hpp"

// File being tested
#include "../../transforms/vision/unit_test/helper.hpp"
#include <augur/augment/operations.hpp>

#include <cmath>

using namespace augur::augment;

TEST_CASE("Mirrored sampling", "[augment][operations]")
{
  augur::fast_rng_gen gen(20240607);

  SECTION("sign flips about half the time")
  {
    shear_x op;
    op.shear = 0.2f;
    op.mirror = true;
    int negative = 0;
    for (int i = 0; i < 1000; ++i) {
      const auto params = sample(op, gen);
      REQUIRE(std::abs(params.value) == Approx(0.2f));
      if (params.value < 0.0f) {
        ++negative;
      }
    }
    CHECK(negative > 400);
    CHECK(negative < 600);
  }

  SECTION("no mirroring keeps the sign")
  {
    rotate op;
    op.degrees = 30;
    op.mirror = false;
    for (int i = 0; i < 200; ++i) {
      REQUIRE(sample(op, gen).value == 30.0f);
    }
  }

  SECTION("translate y samples its own magnitude")
  {
    translate_y op;
    op.pixels = 7;
    for (int i = 0; i < 50; ++i) {
      const auto params = sample(op, gen);
      REQUIRE(params.name == "translate_y");
      REQUIRE(std::abs(params.value) == 7.0f);
    }
  }

  SECTION("explicit helper")
  {
    REQUIRE(sample_mirrored(3.0f, false, gen) == 3.0f);
    const float v = sample_mirrored(3.0f, true, gen);
    REQUIRE((v == 3.0f || v == -3.0f));
  }
}

TEST_CASE("Fire probability", "[augment][operations]")
{
  augur::fast_rng_gen gen(7);
  invert op;

  SECTION("p = 1 always fires")
  {
    op.p = 1.0f;
    for (int i = 0; i < 200; ++i) {
      REQUIRE(sample(op, gen).fire);
    }
  }
  SECTION("p = 0 never fires")
  {
    op.p = 0.0f;
    for (int i = 0; i < 200; ++i) {
      REQUIRE_FALSE(sample(op, gen).fire);
    }
  }
  SECTION("intermediate p fires at about that rate")
  {
    op.p = 0.3f;
    int fired = 0;
    for (int i = 0; i < 1000; ++i) {
      fired += sample(op, gen).fire ? 1 : 0;
    }
    CHECK(fired > 200);
    CHECK(fired < 400);
  }
}

TEST_CASE("Applying operations", "[augment][operations]")
{
  augur::utils::type_erased_matrix src =
    augur::utils::type_erased_matrix(El::Matrix<uint8_t>());
  fill(src.template get<uint8_t>(), 4, 4, 3, 100);
  std::vector<size_t> dims = {3, 4, 4};
  augur::fast_rng_gen gen(3);

  SECTION("input is left untouched")
  {
    invert op;
    const auto params = sample(op, gen);
    auto dst = apply(op, src, dims, params);
    REQUIRE(src.template get<uint8_t>().LockedBuffer()[0] == 100);
    REQUIRE(dst.template get<uint8_t>().LockedBuffer()[0] == 155);
  }

  SECTION("diagnostic counts changed values")
  {
    solarize op;
    op.threshold = 128;
    const auto params = sample(op, gen);
    auto result = apply_with_diagnostic(op, src, dims, params);
    CHECK(result.second.applied);
    CHECK(result.second.changed_values == 0);
    CHECK_THAT(result.second.detail, AUGUR_CONTAINS("solarize"));

    op.threshold = 50;
    result = apply_with_diagnostic(op, src, dims, params);
    CHECK(result.second.changed_values == 48);
  }

  SECTION("affine operations keep the image size")
  {
    translate_x op;
    op.pixels = 2;
    const auto params = sample(op, gen);
    auto dst = apply(op, src, dims, params);
    REQUIRE(dims[0] == 3);
    REQUIRE(dims[1] == 4);
    REQUIRE(dims[2] == 4);
    REQUIRE(dst.template get<uint8_t>().Height() == 48);
  }

  SECTION("invalid parameters are rejected")
  {
    posterize op;
    op.bits = 9;
    REQUIRE_THROWS_AS(validate(op), augur::invalid_parameter_error);
    op.bits = 3;
    op.p = 2.0f;
    REQUIRE_THROWS_AS(validate(op), augur::invalid_parameter_error);
  }

  SECTION("description")
  {
    shear_y op;
    op.shear = 0.3f;
    op.p = 0.5f;
    const auto text = get_description(operation(op)).str();
    CHECK_THAT(text, AUGUR_CONTAINS("ShearY (p=0.5)"));
    CHECK_THAT(text, AUGUR_CONTAINS("shear_y: 0.3"));
    CHECK_THAT(text, AUGUR_CONTAINS("mirror: true"));
    CHECK_THAT(text, AUGUR_CONTAINS("resample: nearest"));
  }
}
