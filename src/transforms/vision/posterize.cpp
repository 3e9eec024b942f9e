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

#include "augur/transforms/vision/posterize.hpp"
#include "augur/utils/opencv.hpp"

namespace augur {
namespace transform {

void posterize::apply(utils::type_erased_matrix& data, std::vector<size_t>& dims) {
  cv::Mat src = utils::get_opencv_mat(data, dims);
  if (!src.isContinuous()) {
    // This should not occur, but just in case.
    AUGUR_ERROR("Do not support non-contiguous OpenCV matrices.");
  }
  // Clear the (8 - bits) low-order bits.
  const uint8_t mask = static_cast<uint8_t>(~((1u << (8 - m_bits)) - 1u));
  uint8_t* __restrict__ src_buf = src.ptr();
  const size_t size = utils::get_linearized_size(dims);
  for (size_t i = 0; i < size; ++i) {
    src_buf[i] &= mask;
  }
}

}  // namespace transform
}  // namespace augur
