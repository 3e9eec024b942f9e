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

#include "augur/transforms/vision/equalize.hpp"
#include "augur/utils/opencv.hpp"

#include <algorithm>
#include <array>

namespace augur {
namespace transform {

void equalize::apply(utils::type_erased_matrix& data, std::vector<size_t>& dims) {
  // This is not cv::equalizeHist: each value maps to the cumulative count
  // of all lower values divided by a step, where the step ignores the
  // pixels in the highest non-empty bin.
  cv::Mat src = utils::get_opencv_mat(data, dims);
  if (!src.isContinuous()) {
    // This should not occur, but just in case.
    AUGUR_ERROR("Do not support non-contiguous OpenCV matrices.");
  }
  const size_t channels = dims[0];
  const size_t num_pixels = dims[1]*dims[2];
  uint8_t* __restrict__ src_buf = src.ptr();
  for (size_t c = 0; c < channels; ++c) {
    std::array<uint64_t, 256> hist{};
    for (size_t i = 0; i < num_pixels; ++i) {
      ++hist[src_buf[channels*i + c]];
    }
    // Count of the highest non-empty bin and number of non-empty bins.
    uint64_t last = 0;
    size_t nonempty = 0;
    for (const auto& h : hist) {
      if (h != 0) {
        last = h;
        ++nonempty;
      }
    }
    if (nonempty <= 1) {
      continue;
    }
    const uint64_t step = (num_pixels - last) / 255;
    if (step == 0) {
      continue;
    }
    std::array<uint8_t, 256> lut;
    uint64_t n = step / 2;
    for (size_t v = 0; v < 256; ++v) {
      lut[v] = static_cast<uint8_t>(std::min<uint64_t>(n / step, 255));
      n += hist[v];
    }
    for (size_t i = 0; i < num_pixels; ++i) {
      uint8_t& v = src_buf[channels*i + c];
      v = lut[v];
    }
  }
}

}  // namespace transform
}  // namespace augur
