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

#ifndef AUGUR_AUGMENT_OPERATIONS_HPP_INCLUDED
#define AUGUR_AUGMENT_OPERATIONS_HPP_INCLUDED

#include "augur/transforms/vision/adjust_brightness.hpp"
#include "augur/transforms/vision/adjust_contrast.hpp"
#include "augur/transforms/vision/adjust_saturation.hpp"
#include "augur/transforms/vision/adjust_sharpness.hpp"
#include "augur/transforms/vision/affine.hpp"
#include "augur/transforms/vision/autocontrast.hpp"
#include "augur/transforms/vision/equalize.hpp"
#include "augur/transforms/vision/invert.hpp"
#include "augur/transforms/vision/posterize.hpp"
#include "augur/transforms/vision/solarize.hpp"
#include "augur/utils/description.hpp"
#include "augur/utils/random_number_generators.hpp"
#include "augur/utils/type_erased_matrix.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace augur {
namespace augment {

using transform::resample_mode;

/** @brief Values drawn for one application of a policy step. */
struct sampled_params {
  /** True if the step's probability gate passed. */
  bool fire = false;
  /** Parameter name, e.g. "shear_x"; empty for operations without one. */
  std::string name;
  /** Parameter value, after any sign flip. */
  float value = 0.0f;
};

/** @brief What applying one step did to the image. */
struct diagnostic {
  /** False if the gate skipped the step and the image passed through. */
  bool applied = false;
  /** Description of the concrete transform that ran. */
  std::string detail;
  /** Number of channel values that differ from the step's input. */
  size_t changed_values = 0;
};

/** @brief Flip the sign of @c magnitude with probability 0.5.
 *
 *  When @c mirror is false the magnitude is returned unchanged and
 *  no random draw is made.
 */
float sample_mirrored(float magnitude, bool mirror, fast_rng_gen& gen);

/** @name Operations
 *
 *  Each operation is a plain configuration record: the resolved
 *  parameter, the fire probability @c p, and for the affine family
 *  the mirror flag and resample mode. @c sample draws the value passed
 *  to @c make_transform, which builds the deterministic pixel
 *  transform for one application.
 */
///@{

struct shear_x {
  static constexpr char const* name = "ShearX";
  static constexpr char const* param_name = "shear_x";
  /** Horizontal shear coefficient. */
  float shear;
  float p = 1.0f;
  bool mirror = true;
  resample_mode resample = resample_mode::nearest;

  float parameter() const { return shear; }
  float sample(fast_rng_gen& gen) const {
    return sample_mirrored(shear, mirror, gen);
  }
  transform::affine make_transform(float value) const {
    return transform::affine({1.0f, value, 0.0f, 0.0f, 1.0f, 0.0f}, resample);
  }
};

struct shear_y {
  static constexpr char const* name = "ShearY";
  static constexpr char const* param_name = "shear_y";
  /** Vertical shear coefficient. */
  float shear;
  float p = 1.0f;
  bool mirror = true;
  resample_mode resample = resample_mode::nearest;

  float parameter() const { return shear; }
  float sample(fast_rng_gen& gen) const {
    return sample_mirrored(shear, mirror, gen);
  }
  transform::affine make_transform(float value) const {
    return transform::affine({1.0f, 0.0f, 0.0f, value, 1.0f, 0.0f}, resample);
  }
};

struct translate_x {
  static constexpr char const* name = "TranslateX";
  static constexpr char const* param_name = "translate_x";
  /** Horizontal shift in pixels. */
  int pixels;
  float p = 1.0f;
  bool mirror = true;
  resample_mode resample = resample_mode::nearest;

  float parameter() const { return static_cast<float>(pixels); }
  float sample(fast_rng_gen& gen) const {
    return sample_mirrored(static_cast<float>(pixels), mirror, gen);
  }
  transform::affine make_transform(float value) const {
    return transform::affine({1.0f, 0.0f, value, 0.0f, 1.0f, 0.0f}, resample);
  }
};

struct translate_y {
  static constexpr char const* name = "TranslateY";
  static constexpr char const* param_name = "translate_y";
  /** Vertical shift in pixels. */
  int pixels;
  float p = 1.0f;
  bool mirror = true;
  resample_mode resample = resample_mode::nearest;

  float parameter() const { return static_cast<float>(pixels); }
  float sample(fast_rng_gen& gen) const {
    return sample_mirrored(static_cast<float>(pixels), mirror, gen);
  }
  transform::affine make_transform(float value) const {
    return transform::affine({1.0f, 0.0f, 0.0f, 0.0f, 1.0f, value}, resample);
  }
};

struct rotate {
  static constexpr char const* name = "Rotate";
  static constexpr char const* param_name = "rotate";
  /** Counter-clockwise angle in degrees. */
  int degrees;
  float p = 1.0f;
  bool mirror = true;
  resample_mode resample = resample_mode::nearest;

  float parameter() const { return static_cast<float>(degrees); }
  float sample(fast_rng_gen& gen) const {
    return sample_mirrored(static_cast<float>(degrees), mirror, gen);
  }
  transform::rotate make_transform(float value) const {
    return transform::rotate(value, resample);
  }
};

struct solarize {
  static constexpr char const* name = "Solarize";
  static constexpr char const* param_name = "threshold";
  int threshold;
  float p = 1.0f;

  float parameter() const { return static_cast<float>(threshold); }
  float sample(fast_rng_gen&) const { return parameter(); }
  transform::solarize make_transform(float value) const {
    return transform::solarize(static_cast<int>(value));
  }
};

struct posterize {
  static constexpr char const* name = "Posterize";
  static constexpr char const* param_name = "bits";
  int bits;
  float p = 1.0f;

  float parameter() const { return static_cast<float>(bits); }
  float sample(fast_rng_gen&) const { return parameter(); }
  transform::posterize make_transform(float value) const {
    return transform::posterize(static_cast<int>(value));
  }
};

/** Generates the four enhancement operations, which differ only in name
 *  and the transform they build.
 */
template <typename Transform>
struct enhance_op {
  static constexpr char const* param_name = "factor";
  /** Blend factor; 1 is the identity. */
  float factor;
  float p = 1.0f;

  float parameter() const { return factor; }
  float sample(fast_rng_gen&) const { return factor; }
  Transform make_transform(float value) const { return Transform(value); }
};

struct contrast : enhance_op<transform::adjust_contrast> {
  static constexpr char const* name = "Contrast";
};

/** Registered as "Color". */
struct saturation : enhance_op<transform::adjust_saturation> {
  static constexpr char const* name = "Color";
};

struct brightness : enhance_op<transform::adjust_brightness> {
  static constexpr char const* name = "Brightness";
};

struct sharpness : enhance_op<transform::adjust_sharpness> {
  static constexpr char const* name = "Sharpness";
};

/** Operations that take no magnitude. */
template <typename Transform>
struct fixed_op {
  static constexpr char const* param_name = "";
  float p = 1.0f;

  float parameter() const { return 0.0f; }
  float sample(fast_rng_gen&) const { return 0.0f; }
  Transform make_transform(float) const { return Transform(); }
};

struct invert : fixed_op<transform::invert> {
  static constexpr char const* name = "Invert";
};

struct auto_contrast : fixed_op<transform::autocontrast> {
  static constexpr char const* name = "AutoContrast";
};

struct equalize : fixed_op<transform::equalize> {
  static constexpr char const* name = "Equalize";
};

///@}

/** @brief One configured step of a sub-policy. */
using operation = std::variant<shear_x,
                               shear_y,
                               translate_x,
                               translate_y,
                               rotate,
                               solarize,
                               posterize,
                               contrast,
                               saturation,
                               brightness,
                               sharpness,
                               invert,
                               auto_contrast,
                               equalize>;

/** Registered name of the operation, e.g. "ShearX". */
std::string get_name(const operation& op);

/** Fire probability of the operation. */
float get_probability(const operation& op);

/** Resolved (unsigned) parameter; 0 for operations without one. */
float get_parameter(const operation& op);

/** Human-readable configuration of the operation. */
description get_description(const operation& op);

/** @brief Throw invalid_parameter_error unless @c op can be applied.
 *
 *  Checks the probability is in [0, 1] and that the resolved parameter
 *  is accepted by the underlying transform.
 */
void validate(const operation& op);

/** @brief Draw the parameter value and the fire/skip gate for one
 *         application of @c op.
 */
sampled_params sample(const operation& op, fast_rng_gen& gen);

/** @brief Apply @c op with the sampled value to a copy of @c src.
 *
 *  @c src is left untouched. @c dims is updated to the output's
 *  dimensions. The gate in @c params is not consulted.
 */
utils::type_erased_matrix apply(const operation& op,
                                const utils::type_erased_matrix& src,
                                std::vector<size_t>& dims,
                                const sampled_params& params);

/** @brief As @c apply, also describing what changed. */
std::pair<utils::type_erased_matrix, diagnostic>
apply_with_diagnostic(const operation& op,
                      const utils::type_erased_matrix& src,
                      std::vector<size_t>& dims,
                      const sampled_params& params);

} // namespace augment
} // namespace augur

#endif // AUGUR_AUGMENT_OPERATIONS_HPP_INCLUDED
