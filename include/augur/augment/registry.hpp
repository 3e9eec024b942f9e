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

#ifndef AUGUR_AUGMENT_REGISTRY_HPP_INCLUDED
#define AUGUR_AUGMENT_REGISTRY_HPP_INCLUDED

#include "augur/augment/operations.hpp"
#include "augur/augment/rescale.hpp"

#include <string>
#include <vector>

namespace augur {
namespace augment {

/** @brief Settings shared by every operation built from a table. */
struct build_options {
  /** Upper bound of the level scale; levels lie in [0, level_max]. */
  float level_max = default_level_max;
  /** Randomly flip the sign of affine-family parameters. */
  bool mirror = true;
  /** Interpolation for the affine family. */
  resample_mode resample = resample_mode::nearest;
};

/** @brief How one operation name turns into a configured operation. */
struct operation_info {
  /** Registered name, case-sensitive. */
  char const* name;
  /** Maps a level in [0, level_max] to the operation's parameter.
   *  Null for operations that take no magnitude.
   */
  float (*rescale)(float level, float level_max);
  /** Builds the operation from its resolved parameter and probability.
   *  The parameter is ignored when @c rescale is null.
   */
  operation (*build)(float parameter, float p, const build_options& opts);
};

/** @brief The fixed set of registered operations, in a stable order. */
const std::vector<operation_info>& get_operation_registry();

/** @brief Look up a registered operation.
 *  @throws unknown_operation_error if @c name is not registered.
 */
const operation_info& find_operation(const std::string& name);

/** @brief Resolve one (name, probability, level) triple.
 *
 *  @throws unknown_operation_error if @c name is not registered.
 *  @throws invalid_parameter_error if @c probability is outside [0, 1]
 *          or @c level is outside [0, level_max].
 */
operation build_operation(const std::string& name,
                          float probability,
                          float level,
                          const build_options& opts = build_options());

} // namespace augment
} // namespace augur

#endif // AUGUR_AUGMENT_REGISTRY_HPP_INCLUDED
