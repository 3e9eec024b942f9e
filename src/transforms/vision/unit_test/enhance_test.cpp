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
#include <augur/transforms/vision/adjust_brightness.hpp>
#include <augur/transforms/vision/adjust_contrast.hpp>
#include <augur/transforms/vision/adjust_saturation.hpp>
#include <augur/transforms/vision/adjust_sharpness.hpp>
#include <augur/transforms/vision/blend.hpp>

#include <memory>

TEST_CASE("Testing enhancement preprocessing", "[preproc]")
{
  augur::utils::type_erased_matrix mat =
    augur::utils::type_erased_matrix(El::Matrix<uint8_t>());
  gradient(mat.template get<uint8_t>(), 6, 5, 3);
  std::vector<size_t> dims = {3, 6, 5};
  El::Matrix<uint8_t> orig;
  El::Copy(mat.template get<uint8_t>(), orig);

  SECTION("factor one is the identity")
  {
    std::unique_ptr<augur::transform::transform> trans;
    SECTION("brightness")
    {
      trans = std::make_unique<augur::transform::adjust_brightness>(1.0f);
    }
    SECTION("contrast")
    {
      trans = std::make_unique<augur::transform::adjust_contrast>(1.0f);
    }
    SECTION("saturation")
    {
      trans = std::make_unique<augur::transform::adjust_saturation>(1.0f);
    }
    SECTION("sharpness")
    {
      trans = std::make_unique<augur::transform::adjust_sharpness>(1.0f);
    }
    REQUIRE_NOTHROW(trans->apply(mat, dims));
    REQUIRE(pixels_equal(mat.template get<uint8_t>(), orig));
    REQUIRE(dims[0] == 3);
    REQUIRE(dims[1] == 6);
    REQUIRE(dims[2] == 5);
  }

  SECTION("brightness zero is black")
  {
    auto trans = augur::transform::adjust_brightness(0.0f);
    REQUIRE_NOTHROW(trans.apply(mat, dims));
    El::Matrix<uint8_t> expected;
    zeros(expected, 6, 5, 3);
    REQUIRE(pixels_equal(mat.template get<uint8_t>(), expected));
  }

  SECTION("brightness above one scales and saturates")
  {
    auto trans = augur::transform::adjust_brightness(1.5f);
    REQUIRE_NOTHROW(trans.apply(mat, dims));
    const uint8_t* buf = mat.template get<uint8_t>().LockedBuffer();
    const uint8_t* orig_buf = orig.LockedBuffer();
    for (El::Int i = 0; i < 90; ++i) {
      REQUIRE(buf[i] == cv::saturate_cast<uint8_t>(orig_buf[i]*1.5f));
    }
  }

  SECTION("contrast zero is a constant gray")
  {
    auto trans = augur::transform::adjust_contrast(0.0f);
    REQUIRE_NOTHROW(trans.apply(mat, dims));
    const uint8_t* buf = mat.template get<uint8_t>().LockedBuffer();
    for (El::Int i = 1; i < 90; ++i) {
      REQUIRE(buf[i] == buf[0]);
    }
  }

  SECTION("saturation zero gives equal channels")
  {
    auto trans = augur::transform::adjust_saturation(0.0f);
    REQUIRE_NOTHROW(trans.apply(mat, dims));
    const uint8_t* buf = mat.template get<uint8_t>().LockedBuffer();
    for (El::Int i = 0; i < 30; ++i) {
      REQUIRE(buf[3*i] == buf[3*i + 1]);
      REQUIRE(buf[3*i] == buf[3*i + 2]);
    }
  }

  SECTION("sharpness leaves the border unchanged")
  {
    auto trans = augur::transform::adjust_sharpness(1.9f);
    REQUIRE_NOTHROW(trans.apply(mat, dims));
    const auto& real_mat = mat.template get<uint8_t>();
    for (El::Int c = 0; c < 3; ++c) {
      for (El::Int col = 0; col < 5; ++col) {
        REQUIRE(at(real_mat, 0, col, c, 5, 3) == at(orig, 0, col, c, 5, 3));
        REQUIRE(at(real_mat, 5, col, c, 5, 3) == at(orig, 5, col, c, 5, 3));
      }
      for (El::Int row = 0; row < 6; ++row) {
        REQUIRE(at(real_mat, row, 0, c, 5, 3) == at(orig, row, 0, c, 5, 3));
        REQUIRE(at(real_mat, row, 4, c, 5, 3) == at(orig, row, 4, c, 5, 3));
      }
    }
  }

  SECTION("negative factors are rejected")
  {
    REQUIRE_THROWS_AS(augur::transform::adjust_brightness(-0.5f),
                      augur::invalid_parameter_error);
    REQUIRE_THROWS_AS(augur::transform::adjust_contrast(-0.5f),
                      augur::invalid_parameter_error);
    REQUIRE_THROWS_AS(augur::transform::adjust_saturation(-0.5f),
                      augur::invalid_parameter_error);
    REQUIRE_THROWS_AS(augur::transform::adjust_sharpness(-0.5f),
                      augur::invalid_parameter_error);
  }
}

TEST_CASE("Blending with a degenerate image", "[preproc]")
{
  cv::Mat image = (cv::Mat_<uint8_t>(2, 2) << 0, 100, 200, 254);

  SECTION("constant degenerate, interpolating")
  {
    augur::transform::blend(image, 100.0, 0.5f);
    REQUIRE(image.at<uint8_t>(0, 0) == 50);
    REQUIRE(image.at<uint8_t>(0, 1) == 100);
    REQUIRE(image.at<uint8_t>(1, 0) == 150);
    REQUIRE(image.at<uint8_t>(1, 1) == 177);
  }

  SECTION("constant degenerate, extrapolating saturates")
  {
    augur::transform::blend(image, 100.0, 2.0f);
    REQUIRE(image.at<uint8_t>(0, 0) == 0);
    REQUIRE(image.at<uint8_t>(0, 1) == 100);
    REQUIRE(image.at<uint8_t>(1, 0) == 255);
    REQUIRE(image.at<uint8_t>(1, 1) == 255);
  }

  SECTION("image degenerate writes into the same buffer")
  {
    const uint8_t* buf = image.ptr();
    cv::Mat degenerate = (cv::Mat_<uint8_t>(2, 2) << 20, 100, 0, 0);
    augur::transform::blend(image, degenerate, 0.5f);
    REQUIRE(image.ptr() == buf);
    REQUIRE(image.at<uint8_t>(0, 0) == 10);
    REQUIRE(image.at<uint8_t>(0, 1) == 100);
    REQUIRE(image.at<uint8_t>(1, 0) == 100);
    REQUIRE(image.at<uint8_t>(1, 1) == 127);
  }

  SECTION("mismatched degenerate is rejected")
  {
    cv::Mat degenerate(3, 2, CV_8UC1, cv::Scalar::all(0));
    REQUIRE_THROWS_AS(augur::transform::blend(image, degenerate, 0.5f),
                      augur::exception);
  }
}
