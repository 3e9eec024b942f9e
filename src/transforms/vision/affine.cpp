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

#include <opencv2/imgproc.hpp>
#include "augur/transforms/vision/affine.hpp"
#include "augur/utils/opencv.hpp"

#include <cmath>

namespace augur {
namespace transform {

namespace {

int get_cv_interpolation(resample_mode mode) {
  switch (mode) {
  case resample_mode::nearest:
    return cv::INTER_NEAREST;
  case resample_mode::bilinear:
    return cv::INTER_LINEAR;
  case resample_mode::bicubic:
    return cv::INTER_CUBIC;
  default:
    AUGUR_ERROR("Unknown resample mode ", static_cast<int>(mode));
  }
}

/** Warp data by the output-to-input map coeffs. */
void warp(utils::type_erased_matrix& data, std::vector<size_t>& dims,
          const affine::coefficients& coeffs, resample_mode resample) {
  cv::Mat src = utils::get_opencv_mat(data, dims);
  auto dst_real = El::Matrix<uint8_t>(utils::get_linearized_size(dims), 1);
  cv::Mat dst = utils::get_opencv_mat(dst_real, dims);
  // The map is defined between pixel corners while OpenCV samples at
  // integer pixel centers, so shift the offsets by half a pixel.
  const float a = coeffs[0], b = coeffs[1], c = coeffs[2];
  const float d = coeffs[3], e = coeffs[4], f = coeffs[5];
  float affine_mat[2][3] = {
    {a, b, c + 0.5f*(a + b - 1.0f)},
    {d, e, f + 0.5f*(d + e - 1.0f)}
  };
  cv::Mat cv_affine(2, 3, CV_32F, affine_mat);
  cv::warpAffine(src, dst, cv_affine, dst.size(),
                 get_cv_interpolation(resample) | cv::WARP_INVERSE_MAP,
                 cv::BORDER_CONSTANT, cv::Scalar::all(0));
  data.emplace<uint8_t>(std::move(dst_real));
}

}  // namespace

std::string to_string(resample_mode mode) {
  switch (mode) {
  case resample_mode::nearest:
    return "nearest";
  case resample_mode::bilinear:
    return "bilinear";
  case resample_mode::bicubic:
    return "bicubic";
  default:
    AUGUR_ERROR("Unknown resample mode ", static_cast<int>(mode));
  }
}

description affine::get_description() const {
  auto desc = transform::get_description();
  std::ostringstream ss;
  ss << "[" << m_coeffs[0] << ", " << m_coeffs[1] << ", " << m_coeffs[2]
     << "; " << m_coeffs[3] << ", " << m_coeffs[4] << ", " << m_coeffs[5]
     << "]";
  desc.add("Coefficients", ss.str());
  desc.add("Resample", to_string(m_resample));
  return desc;
}

void affine::apply(utils::type_erased_matrix& data, std::vector<size_t>& dims) {
  warp(data, dims, m_coeffs, m_resample);
}

description rotate::get_description() const {
  auto desc = transform::get_description();
  desc.add("Degrees", m_degrees);
  desc.add("Resample", to_string(m_resample));
  return desc;
}

affine::coefficients rotate::get_coefficients(size_t width,
                                              size_t height) const {
  // For converting to radians:
  constexpr double pi_rad = 3.14159265358979323846 / 180.0;
  // A counter-clockwise turn of the image is a clockwise turn of the
  // output-to-input map.
  const double angle = -std::fmod(static_cast<double>(m_degrees), 360.0) * pi_rad;
  const double cos_a = std::cos(angle);
  const double sin_a = std::sin(angle);
  const double center_x = width / 2.0;
  const double center_y = height / 2.0;
  // M^-1 = C * R * C^-1 with C translating by the image center.
  const double c = cos_a*(-center_x) + sin_a*(-center_y) + center_x;
  const double f = -sin_a*(-center_x) + cos_a*(-center_y) + center_y;
  return {static_cast<float>(cos_a), static_cast<float>(sin_a),
          static_cast<float>(c), static_cast<float>(-sin_a),
          static_cast<float>(cos_a), static_cast<float>(f)};
}

void rotate::apply(utils::type_erased_matrix& data, std::vector<size_t>& dims) {
  utils::assert_is_image(data, dims);
  warp(data, dims, get_coefficients(dims[2], dims[1]), m_resample);
}

}  // namespace transform
}  // namespace augur
