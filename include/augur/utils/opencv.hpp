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

#ifndef AUGUR_UTILS_OPENCV_HPP_INCLUDED
#define AUGUR_UTILS_OPENCV_HPP_INCLUDED

#include "augur/utils/exception.hpp"
#include "augur/utils/type_erased_matrix.hpp"
#include <opencv2/core.hpp>

#include <functional>
#include <numeric>
#include <vector>

namespace augur {
namespace utils {

/** Number of values in a tensor of shape @c dims. */
inline size_t get_linearized_size(const std::vector<size_t>& dims) {
  return std::accumulate(dims.begin(), dims.end(), size_t{1},
                         std::multiplies<size_t>());
}

/**
 * Throw unless data holds a non-empty image of shape dims.
 * An image has dims {channels, height, width} with 1 or 3 interleaved
 * channels and exactly channels*height*width 8-bit values.
 */
inline void assert_is_image(const El::Matrix<uint8_t>& data,
                            const std::vector<size_t>& dims) {
  if (dims.size() != 3 || (dims[0] != 1 && dims[0] != 3)) {
    AUGUR_ERROR("Data is not an image: bad dims.");
  }
  if (dims[1] == 0 || dims[2] == 0) {
    AUGUR_ERROR("Data is not an image: empty.");
  }
  if (static_cast<size_t>(data.Height() * data.Width())
      != get_linearized_size(dims)) {
    AUGUR_ERROR("Data is not an image: holds ",
                data.Height() * data.Width(), " values, dims need ",
                get_linearized_size(dims), ".");
  }
}

/** As above; also throws if the held matrix is not 8-bit. */
inline void assert_is_image(const utils::type_erased_matrix& data,
                            const std::vector<size_t>& dims) {
  try {
    assert_is_image(data.template get<uint8_t>(), dims);
  } catch (const utils::bad_any_cast&) {
    AUGUR_ERROR("Data is not an image: not uint8_t.");
  }
}

/**
 * Wrap data in a writable cv::Mat header (HWC, CV_8UC1 or CV_8UC3).
 * Nothing is copied; the header is only valid while data is alive and
 * unresized.
 */
inline cv::Mat get_opencv_mat(El::Matrix<uint8_t>& data,
                              const std::vector<size_t>& dims) {
  assert_is_image(data, dims);
  return cv::Mat(dims[1], dims[2], dims[0] == 1 ? CV_8UC1 : CV_8UC3,
                 data.Buffer());
}

inline cv::Mat get_opencv_mat(utils::type_erased_matrix& data,
                              const std::vector<size_t>& dims) {
  assert_is_image(data, dims);
  return get_opencv_mat(data.template get<uint8_t>(), dims);
}

/**
 * Construct a read-only OpenCV Mat header over data.
 * The caller must not write through the returned header.
 */
inline const cv::Mat get_opencv_mat(const El::Matrix<uint8_t>& data,
                                    const std::vector<size_t>& dims) {
  assert_is_image(data, dims);
  return cv::Mat(dims[1], dims[2], dims[0] == 1 ? CV_8UC1 : CV_8UC3,
                 const_cast<uint8_t*>(data.LockedBuffer()));
}

}  // namespace utils
}  // namespace augur

#endif  // AUGUR_UTILS_OPENCV_HPP_INCLUDED
