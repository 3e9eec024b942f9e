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

#ifndef AUGUR_TRANSFORMS_ADJUST_SHARPNESS_HPP_INCLUDED
#define AUGUR_TRANSFORMS_ADJUST_SHARPNESS_HPP_INCLUDED

#include "augur/transforms/transform.hpp"

namespace augur {
namespace transform {

/** Adjust the sharpness of an image. */
class adjust_sharpness : public transform {
public:
  /**
   * Adjust sharpness with given factor.
   * @param factor A non-negative factor. 0 gives a smoothed image, 1 the original, >1 sharpens.
   */
  adjust_sharpness(float factor) : transform(), m_factor(factor) {
    if (factor < 0.0f) {
      AUGUR_ERROR_AS(invalid_parameter_error, "Sharpness factor must be non-negative.");
    }
  }

  transform* copy() const override { return new adjust_sharpness(*this); }

  std::string get_type() const override { return "adjust_sharpness"; }

  description get_description() const override {
    auto desc = transform::get_description();
    desc.add("Factor", m_factor);
    return desc;
  }

  void apply(utils::type_erased_matrix& data, std::vector<size_t>& dims) override;

private:
  /** Factor to adjust sharpness by. */
  float m_factor;
};

}  // namespace transform
}  // namespace augur

#endif  // AUGUR_TRANSFORMS_ADJUST_SHARPNESS_HPP_INCLUDED
