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

#ifndef AUGUR_TRANSFORMS_AFFINE_HPP_INCLUDED
#define AUGUR_TRANSFORMS_AFFINE_HPP_INCLUDED

#include "augur/transforms/transform.hpp"

#include <array>

namespace augur {
namespace transform {

/** Interpolation used when an affine map lands between pixels. */
enum class resample_mode { nearest, bilinear, bicubic };

std::string to_string(resample_mode mode);

/**
 * Apply a fixed affine map to an image, keeping its size.
 *
 * The coefficients (a, b, c, d, e, f) send each output pixel (x, y) to the
 * input location (a*x + b*y + c, d*x + e*y + f). Output pixels that land
 * outside the input are filled with 0.
 */
class affine : public transform {
public:
  using coefficients = std::array<float, 6>;

  affine(coefficients coeffs, resample_mode resample = resample_mode::nearest)
    : transform(), m_coeffs(coeffs), m_resample(resample) {}

  transform* copy() const override { return new affine(*this); }

  std::string get_type() const override { return "affine"; }

  description get_description() const override;

  void apply(utils::type_erased_matrix& data, std::vector<size_t>& dims) override;

  const coefficients& get_coefficients() const { return m_coeffs; }

private:
  /** Output-to-input map, row-major 2x3. */
  coefficients m_coeffs;
  resample_mode m_resample;
};

/** Rotate an image counter-clockwise about its center, keeping its size. */
class rotate : public transform {
public:
  rotate(float degrees, resample_mode resample = resample_mode::nearest)
    : transform(), m_degrees(degrees), m_resample(resample) {}

  transform* copy() const override { return new rotate(*this); }

  std::string get_type() const override { return "rotate"; }

  description get_description() const override;

  void apply(utils::type_erased_matrix& data, std::vector<size_t>& dims) override;

  /** Affine coefficients of this rotation for a width x height image. */
  affine::coefficients get_coefficients(size_t width, size_t height) const;

private:
  /** Angle in degrees. */
  float m_degrees;
  resample_mode m_resample;
};

}  // namespace transform
}  // namespace augur

#endif  // AUGUR_TRANSFORMS_AFFINE_HPP_INCLUDED
