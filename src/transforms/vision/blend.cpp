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

#include "augur/transforms/vision/blend.hpp"
#include "augur/utils/exception.hpp"

namespace augur {
namespace transform {

void blend(cv::Mat& image, const cv::Mat& degenerate, float factor) {
  if (image.size() != degenerate.size() || image.type() != degenerate.type()) {
    AUGUR_ERROR("Blend operands differ in shape or type: ",
                image.rows, "x", image.cols, "x", image.channels(), " vs ",
                degenerate.rows, "x", degenerate.cols, "x",
                degenerate.channels());
  }
  // Output has the same size and type, so image keeps its buffer.
  cv::addWeighted(degenerate, 1.0 - factor, image, factor, 0.0, image);
}

void blend(cv::Mat& image, double degenerate, float factor) {
  image.convertTo(image, -1, factor, degenerate*(1.0 - factor));
}

}  // namespace transform
}  // namespace augur
