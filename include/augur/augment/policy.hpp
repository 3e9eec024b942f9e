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

#ifndef AUGUR_AUGMENT_POLICY_HPP_INCLUDED
#define AUGUR_AUGMENT_POLICY_HPP_INCLUDED

#include "augur/augment/operations.hpp"
#include "augur/augment/registry.hpp"
#include "augur/utils/description.hpp"

#include <string>
#include <vector>

namespace augur {
namespace augment {

/** @brief One unresolved (operation name, probability, level) triple. */
struct literal_step {
  std::string operation;
  float probability;
  float level;
};

using literal_sub_policy = std::vector<literal_step>;
using literal_table = std::vector<literal_sub_policy>;

/** @brief Ordered steps applied together. */
using sub_policy = std::vector<operation>;
/** @brief The set of sub-policies one is drawn from per application. */
using policy_table = std::vector<sub_policy>;

/** @brief The canonical 25-entry literal table found by policy search
 *         on ImageNet.
 */
const literal_table& get_canonical_literal_table();

/** @brief Resolve every step of @c literal through the operation registry.
 *
 *  Either the whole table is built or an exception is thrown; no
 *  partially built table is ever returned.
 *
 *  @throws unknown_operation_error for an unregistered operation name.
 *  @throws invalid_parameter_error for an empty table or sub-policy, or
 *          an out-of-range probability or level.
 */
policy_table build_policy_table(const literal_table& literal,
                                const build_options& opts = build_options());

/** @brief Build the canonical policy table with default options. */
policy_table build_policy();

description get_description(const sub_policy& steps);
description get_description(const policy_table& table);

} // namespace augment
} // namespace augur

#endif // AUGUR_AUGMENT_POLICY_HPP_INCLUDED
