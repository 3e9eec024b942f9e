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

#ifndef AUGUR_TRANSFORMS_TRANSFORM_HPP_INCLUDED
#define AUGUR_TRANSFORMS_TRANSFORM_HPP_INCLUDED

#include "augur/utils/description.hpp"
#include "augur/utils/exception.hpp"
#include "augur/utils/random_number_generators.hpp"
#include "augur/utils/type_erased_matrix.hpp"

#include <string>
#include <vector>

namespace augur {
namespace transform {

/** @brief Interface for in-place preprocessing of one sample.
 *
 *  One instance may serve several data-loading threads at once, so
 *  @c apply must not mutate shared state other than the calling
 *  thread's own generator. The sample travels as a
 *  @c type_erased_matrix so that a transform may replace the
 *  element type along with the contents.
 */
class transform {
public:
  transform() = default;
  transform(const transform&) = default;
  transform& operator=(const transform&) = default;
  virtual ~transform() = default;

  /** Heap-allocated clone; the caller owns the result. */
  virtual transform* copy() const = 0;

  virtual std::string get_type() const = 0;
  virtual description get_description() const {
    return description(get_type() + " transform");
  }

  /** @brief Transform @c data in place.
   *
   *  @param data Contiguous sample; replaced by the result.
   *  @param dims Tensor shape, {channels, height, width} for images.
   *              Updated if the transform changes the shape.
   */
  virtual void apply(utils::type_erased_matrix& data, std::vector<size_t>& dims) = 0;
};

}  // namespace transform
}  // namespace augur

#endif  // AUGUR_TRANSFORMS_TRANSFORM_HPP_INCLUDED
