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
#include "helper.hpp"
#include <augur/transforms/vision/autocontrast.hpp>
#include <augur/transforms/vision/equalize.hpp>
#include <augur/transforms/vision/invert.hpp>
#include <augur/transforms/vision/posterize.hpp>
#include <augur/transforms/vision/solarize.hpp>

#include <algorithm>

TEST_CASE("Testing posterize preprocessing", "[preproc]")
{
  augur::utils::type_erased_matrix mat =
    augur::utils::type_erased_matrix(El::Matrix<uint8_t>());
  fill(mat.template get<uint8_t>(), 3, 3, 3, 0xB7);
  std::vector<size_t> dims = {3, 3, 3};

  SECTION("keeps the high bits")
  {
    auto trans = augur::transform::posterize(2);
    REQUIRE_NOTHROW(trans.apply(mat, dims));
    const auto& real_mat = mat.template get<uint8_t>();
    for (El::Int i = 0; i < 27; ++i) {
      REQUIRE(real_mat.LockedBuffer()[i] == 0x80);
    }
  }
  SECTION("eight bits is the identity")
  {
    auto trans = augur::transform::posterize(8);
    REQUIRE_NOTHROW(trans.apply(mat, dims));
    REQUIRE(mat.template get<uint8_t>().LockedBuffer()[0] == 0xB7);
  }
  SECTION("zero bits is black")
  {
    auto trans = augur::transform::posterize(0);
    REQUIRE_NOTHROW(trans.apply(mat, dims));
    REQUIRE(mat.template get<uint8_t>().LockedBuffer()[0] == 0);
  }
  SECTION("bits out of range")
  {
    REQUIRE_THROWS_AS(augur::transform::posterize(9),
                      augur::invalid_parameter_error);
    REQUIRE_THROWS_AS(augur::transform::posterize(-1),
                      augur::invalid_parameter_error);
  }
}

TEST_CASE("Testing solarize preprocessing", "[preproc]")
{
  augur::utils::type_erased_matrix mat =
    augur::utils::type_erased_matrix(El::Matrix<uint8_t>());
  gradient(mat.template get<uint8_t>(), 4, 4, 1);
  std::vector<size_t> dims = {1, 4, 4};
  El::Matrix<uint8_t> orig;
  El::Copy(mat.template get<uint8_t>(), orig);

  SECTION("values at or above the threshold are inverted")
  {
    auto trans = augur::transform::solarize(40);
    REQUIRE_NOTHROW(trans.apply(mat, dims));
    const auto& real_mat = mat.template get<uint8_t>();
    for (El::Int i = 0; i < 16; ++i) {
      const uint8_t v = orig.LockedBuffer()[i];
      REQUIRE(real_mat.LockedBuffer()[i] == (v >= 40 ? 255 - v : v));
    }
  }
  SECTION("256 is the identity")
  {
    auto trans = augur::transform::solarize(256);
    REQUIRE_NOTHROW(trans.apply(mat, dims));
    REQUIRE(pixels_equal(mat.template get<uint8_t>(), orig));
  }
  SECTION("threshold out of range")
  {
    REQUIRE_THROWS_AS(augur::transform::solarize(257),
                      augur::invalid_parameter_error);
  }
}

TEST_CASE("Testing invert preprocessing", "[preproc]")
{
  augur::utils::type_erased_matrix mat =
    augur::utils::type_erased_matrix(El::Matrix<uint8_t>());
  gradient(mat.template get<uint8_t>(), 5, 4, 3);
  std::vector<size_t> dims = {3, 5, 4};
  El::Matrix<uint8_t> orig;
  El::Copy(mat.template get<uint8_t>(), orig);

  auto trans = augur::transform::invert();
  REQUIRE_NOTHROW(trans.apply(mat, dims));
  const auto& real_mat = mat.template get<uint8_t>();
  for (El::Int i = 0; i < 60; ++i) {
    REQUIRE(real_mat.LockedBuffer()[i] == 255 - orig.LockedBuffer()[i]);
  }
}

TEST_CASE("Testing autocontrast preprocessing", "[preproc]")
{
  augur::utils::type_erased_matrix mat =
    augur::utils::type_erased_matrix(El::Matrix<uint8_t>());
  std::vector<size_t> dims = {3, 2, 2};
  auto& real_mat = mat.template get<uint8_t>();
  real_mat.Resize(12, 1);
  // Channel 0 spans [0, 85], channel 1 is constant, channel 2 spans
  // [0, 255] already.
  const uint8_t values[12] = {0, 9, 0,
                              17, 9, 100,
                              85, 9, 255,
                              85, 9, 30};
  std::copy(values, values + 12, real_mat.Buffer());

  auto trans = augur::transform::autocontrast();
  REQUIRE_NOTHROW(trans.apply(mat, dims));
  const uint8_t* buf = mat.template get<uint8_t>().LockedBuffer();

  SECTION("channels are stretched independently")
  {
    REQUIRE(buf[0] == 0);
    REQUIRE(buf[3] == 51);
    REQUIRE(buf[6] == 255);
    REQUIRE(buf[9] == 255);
  }
  SECTION("constant channel is unchanged")
  {
    REQUIRE(buf[1] == 9);
    REQUIRE(buf[4] == 9);
    REQUIRE(buf[7] == 9);
    REQUIRE(buf[10] == 9);
  }
  SECTION("full-range channel is unchanged")
  {
    REQUIRE(buf[2] == 0);
    REQUIRE(buf[5] == 100);
    REQUIRE(buf[8] == 255);
    REQUIRE(buf[11] == 30);
  }
}

TEST_CASE("Testing equalize preprocessing", "[preproc]")
{
  augur::utils::type_erased_matrix mat =
    augur::utils::type_erased_matrix(El::Matrix<uint8_t>());
  std::vector<size_t> dims = {1, 32, 32};

  SECTION("two levels spread to the full range")
  {
    auto& real_mat = mat.template get<uint8_t>();
    real_mat.Resize(1024, 1);
    for (El::Int i = 0; i < 1024; ++i) {
      real_mat.Buffer()[i] = (i < 512) ? 10 : 20;
    }
    auto trans = augur::transform::equalize();
    REQUIRE_NOTHROW(trans.apply(mat, dims));
    const uint8_t* buf = mat.template get<uint8_t>().LockedBuffer();
    REQUIRE(buf[0] == 0);
    REQUIRE(buf[1023] == 255);
  }
  SECTION("constant image is unchanged")
  {
    fill(mat.template get<uint8_t>(), 32, 32, 1, 77);
    auto trans = augur::transform::equalize();
    REQUIRE_NOTHROW(trans.apply(mat, dims));
    REQUIRE(mat.template get<uint8_t>().LockedBuffer()[100] == 77);
  }
  SECTION("too few pixels is unchanged")
  {
    gradient(mat.template get<uint8_t>(), 4, 4, 1);
    std::vector<size_t> small_dims = {1, 4, 4};
    El::Matrix<uint8_t> orig;
    El::Copy(mat.template get<uint8_t>(), orig);
    auto trans = augur::transform::equalize();
    REQUIRE_NOTHROW(trans.apply(mat, small_dims));
    REQUIRE(pixels_equal(mat.template get<uint8_t>(), orig));
  }
}
