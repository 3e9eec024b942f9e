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
#include "augur/transforms/vision/adjust_sharpness.hpp"
#include "augur/transforms/vision/blend.hpp"
#include "augur/utils/opencv.hpp"

namespace augur {
namespace transform {

void adjust_sharpness::apply(utils::type_erased_matrix& data, std::vector<size_t>& dims) {
  // Blend the image with a smoothed copy of itself. Factors above 1
  // extrapolate away from the smoothed copy, sharpening the image.
  cv::Mat src = utils::get_opencv_mat(data, dims);
  const cv::Mat kernel = (cv::Mat_<float>(3, 3) << 1, 1, 1,
                                                   1, 5, 1,
                                                   1, 1, 1) / 13.0f;
  cv::Mat smooth;
  cv::filter2D(src, smooth, -1, kernel, cv::Point(-1, -1), 0.0,
               cv::BORDER_REPLICATE);
  // The filter only covers the interior; the outermost rows and columns
  // keep their original values.
  const int height = static_cast<int>(dims[1]);
  const int width = static_cast<int>(dims[2]);
  if (height > 2 && width > 2) {
    src.row(0).copyTo(smooth.row(0));
    src.row(height-1).copyTo(smooth.row(height-1));
    src.col(0).copyTo(smooth.col(0));
    src.col(width-1).copyTo(smooth.col(width-1));
  } else {
    src.copyTo(smooth);
  }
  blend(src, smooth, m_factor);
}

}  // namespace transform
}  // namespace augur
