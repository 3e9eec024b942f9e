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

#ifndef AUGUR_AUGMENT_RESCALE_HPP_INCLUDED
#define AUGUR_AUGMENT_RESCALE_HPP_INCLUDED

namespace augur {
namespace augment {

/** Default upper bound of the discretized augmentation level. */
constexpr float default_level_max = 10.0f;

/** Map @c level in [0, level_max] linearly onto [0, target_max]. */
inline float rescale_float(float level, float target_max,
                           float level_max = default_level_max) {
  return level * target_max / level_max;
}

/** As rescale_float, truncated toward zero. */
inline int rescale_int(float level, float target_max,
                       float level_max = default_level_max) {
  return static_cast<int>(level * target_max / level_max);
}

} // namespace augment
} // namespace augur

#endif // AUGUR_AUGMENT_RESCALE_HPP_INCLUDED
