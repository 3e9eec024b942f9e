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

#ifndef AUGUR_TRANSFORMS_BLEND_HPP_INCLUDED
#define AUGUR_TRANSFORMS_BLEND_HPP_INCLUDED

#include <opencv2/core.hpp>

namespace augur {
namespace transform {

/** @brief Blend an 8-bit image with a degenerate version of itself.
 *
 *  Computes <tt>degenerate*(1 - factor) + image*factor</tt> per element,
 *  saturated to [0, 255], and writes the result back into @c image.
 *  A factor of 0 gives the degenerate image, 1 the original, and
 *  larger factors extrapolate away from the degenerate image.
 *
 *  @c degenerate must have the size and type of @c image.
 */
void blend(cv::Mat& image, const cv::Mat& degenerate, float factor);

/** Blend with a constant degenerate image of value @c degenerate. */
void blend(cv::Mat& image, double degenerate, float factor);

}  // namespace transform
}  // namespace augur

#endif  // AUGUR_TRANSFORMS_BLEND_HPP_INCLUDED
