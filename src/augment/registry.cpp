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

#include "augur/augment/registry.hpp"
#include "augur/utils/exception.hpp"

#include <type_traits>

namespace augur {
namespace augment {

namespace {

/** Build an affine-family operation, which carries the shared settings. */
template <typename Op, typename Param>
operation make_affine(Param value, float p, const build_options& opts) {
  Op op;
  op.p = p;
  op.mirror = opts.mirror;
  op.resample = opts.resample;
  if constexpr (std::is_same_v<Op, shear_x> || std::is_same_v<Op, shear_y>) {
    op.shear = value;
  } else if constexpr (std::is_same_v<Op, rotate>) {
    op.degrees = value;
  } else {
    op.pixels = value;
  }
  return op;
}

template <typename Op>
operation make_enhance(float factor, float p, const build_options&) {
  Op op;
  op.factor = factor;
  op.p = p;
  return op;
}

template <typename Op>
operation make_fixed(float, float p, const build_options&) {
  Op op;
  op.p = p;
  return op;
}

/** Enhancement factors are floored at 0.1 so level 0 stays usable. */
float rescale_enhance(float level, float level_max) {
  return rescale_float(level, 1.8f, level_max) + 0.1f;
}

std::vector<operation_info> make_registry() {
  return {
    {shear_x::name,
     [](float level, float level_max) {
       return rescale_float(level, 0.3f, level_max);
     },
     [](float v, float p, const build_options& opts) {
       return make_affine<shear_x>(v, p, opts);
     }},
    {shear_y::name,
     [](float level, float level_max) {
       return rescale_float(level, 0.3f, level_max);
     },
     [](float v, float p, const build_options& opts) {
       return make_affine<shear_y>(v, p, opts);
     }},
    {translate_x::name,
     [](float level, float level_max) {
       return static_cast<float>(rescale_int(level, 10.0f, level_max));
     },
     [](float v, float p, const build_options& opts) {
       return make_affine<translate_x>(static_cast<int>(v), p, opts);
     }},
    {translate_y::name,
     [](float level, float level_max) {
       return static_cast<float>(rescale_int(level, 10.0f, level_max));
     },
     [](float v, float p, const build_options& opts) {
       return make_affine<translate_y>(static_cast<int>(v), p, opts);
     }},
    {rotate::name,
     [](float level, float level_max) {
       return static_cast<float>(rescale_int(level, 30.0f, level_max));
     },
     [](float v, float p, const build_options& opts) {
       return make_affine<rotate>(static_cast<int>(v), p, opts);
     }},
    {solarize::name,
     [](float level, float level_max) {
       // Higher levels lower the threshold, solarizing more values.
       return static_cast<float>(256 - rescale_int(level, 256.0f, level_max));
     },
     [](float v, float p, const build_options&) -> operation {
       return solarize{static_cast<int>(v), p};
     }},
    {posterize::name,
     [](float level, float level_max) {
       // Higher levels keep fewer bits.
       return static_cast<float>(4 - rescale_int(level, 4.0f, level_max));
     },
     [](float v, float p, const build_options&) -> operation {
       return posterize{static_cast<int>(v), p};
     }},
    {contrast::name, rescale_enhance, make_enhance<contrast>},
    {saturation::name, rescale_enhance, make_enhance<saturation>},
    {brightness::name, rescale_enhance, make_enhance<brightness>},
    {sharpness::name, rescale_enhance, make_enhance<sharpness>},
    {invert::name, nullptr, make_fixed<invert>},
    {auto_contrast::name, nullptr, make_fixed<auto_contrast>},
    {equalize::name, nullptr, make_fixed<equalize>},
  };
}

} // namespace

const std::vector<operation_info>& get_operation_registry() {
  static const std::vector<operation_info> registry = make_registry();
  return registry;
}

const operation_info& find_operation(const std::string& name) {
  for (const auto& info : get_operation_registry()) {
    if (name == info.name) {
      return info;
    }
  }
  AUGUR_ERROR_AS(unknown_operation_error,
                 "Unknown augmentation operation \"", name, "\"");
}

operation build_operation(const std::string& name,
                          float probability,
                          float level,
                          const build_options& opts) {
  const auto& info = find_operation(name);
  if (!(opts.level_max > 0.0f)) {
    AUGUR_ERROR_AS(invalid_parameter_error,
                   "Maximum level must be positive, got ", opts.level_max);
  }
  if (!(probability >= 0.0f && probability <= 1.0f)) {
    AUGUR_ERROR_AS(invalid_parameter_error,
                   name, " probability must be in [0, 1], got ", probability);
  }
  if (!(level >= 0.0f && level <= opts.level_max)) {
    AUGUR_ERROR_AS(invalid_parameter_error,
                   name, " level must be in [0, ", opts.level_max,
                   "], got ", level);
  }
  const float parameter =
    info.rescale != nullptr ? info.rescale(level, opts.level_max) : 0.0f;
  auto op = info.build(parameter, probability, opts);
  validate(op);
  return op;
}

} // namespace augment
} // namespace augur
