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
#include "augur/transforms/vision/adjust_contrast.hpp"
#include "augur/transforms/vision/blend.hpp"
#include "augur/utils/opencv.hpp"

#include <cmath>

namespace augur {
namespace transform {

void adjust_contrast::apply(utils::type_erased_matrix& data, std::vector<size_t>& dims) {
  cv::Mat image = utils::get_opencv_mat(data, dims);
  cv::Mat gray;
  if (dims[0] == 1) {
    gray = image;
  } else {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  }
  // The degenerate image is the gray level mean, rounded to nearest.
  const double gray_mean = std::round(cv::mean(gray)[0]);
  blend(image, gray_mean, m_factor);
}

}  // namespace transform
}  // namespace augur
