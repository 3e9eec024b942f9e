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

#include "augur/augment/policy.hpp"
#include "augur/utils/exception.hpp"
#include "augur/utils/logging.hpp"

namespace augur {
namespace augment {

const literal_table& get_canonical_literal_table() {
  static const literal_table table = {
    {{"Posterize", 0.4f, 8}, {"Rotate", 0.6f, 9}},
    {{"Solarize", 0.6f, 5}, {"AutoContrast", 0.6f, 5}},
    {{"Equalize", 0.8f, 8}, {"Equalize", 0.6f, 3}},
    {{"Posterize", 0.6f, 7}, {"Posterize", 0.6f, 6}},
    {{"Equalize", 0.4f, 7}, {"Solarize", 0.2f, 4}},
    {{"Equalize", 0.4f, 4}, {"Rotate", 0.8f, 8}},
    {{"Solarize", 0.6f, 3}, {"Equalize", 0.6f, 7}},
    {{"Posterize", 0.8f, 5}, {"Equalize", 1.0f, 2}},
    {{"Rotate", 0.2f, 3}, {"Solarize", 0.6f, 8}},
    {{"Equalize", 0.6f, 8}, {"Posterize", 0.4f, 6}},
    {{"Rotate", 0.8f, 8}, {"Color", 0.4f, 0}},
    {{"Rotate", 0.4f, 9}, {"Equalize", 0.6f, 2}},
    {{"Equalize", 0.0f, 7}, {"Equalize", 0.8f, 8}},
    {{"Invert", 0.6f, 4}, {"Equalize", 1.0f, 8}},
    {{"Color", 0.6f, 4}, {"Contrast", 1.0f, 8}},
    {{"Rotate", 0.8f, 8}, {"Color", 1.0f, 0}},
    {{"Color", 0.8f, 8}, {"Solarize", 0.8f, 7}},
    {{"Sharpness", 0.4f, 7}, {"Invert", 0.6f, 8}},
    {{"ShearX", 0.6f, 5}, {"Equalize", 1.0f, 9}},
    {{"Color", 0.4f, 0}, {"Equalize", 0.6f, 3}},
    {{"Equalize", 0.4f, 7}, {"Solarize", 0.2f, 4}},
    {{"Solarize", 0.6f, 5}, {"AutoContrast", 0.6f, 5}},
    {{"Invert", 0.6f, 4}, {"Equalize", 1.0f, 8}},
    {{"Color", 0.6f, 4}, {"Contrast", 1.0f, 8}},
    {{"Equalize", 0.8f, 8}, {"Equalize", 0.6f, 3}},
  };
  return table;
}

policy_table build_policy_table(const literal_table& literal,
                                const build_options& opts) {
  if (literal.empty()) {
    AUGUR_ERROR_AS(invalid_parameter_error, "Policy table has no sub-policies");
  }
  policy_table table;
  table.reserve(literal.size());
  for (size_t i = 0; i < literal.size(); ++i) {
    const auto& steps = literal[i];
    if (steps.empty()) {
      AUGUR_ERROR_AS(invalid_parameter_error,
                     "Sub-policy ", i, " has no steps");
    }
    sub_policy built;
    built.reserve(steps.size());
    for (const auto& step : steps) {
      built.push_back(build_operation(step.operation,
                                      step.probability,
                                      step.level,
                                      opts));
    }
    table.push_back(std::move(built));
  }
  AUGUR_RT_DEBUG("Built policy table with {} sub-policies", table.size());
  return table;
}

policy_table build_policy() {
  return build_policy_table(get_canonical_literal_table());
}

description get_description(const sub_policy& steps) {
  description desc("Sub-policy");
  for (const auto& op : steps) {
    desc.add(get_description(op));
  }
  return desc;
}

description get_description(const policy_table& table) {
  description desc(build_string("Policy table (", table.size(),
                                " sub-policies)"));
  for (const auto& steps : table) {
    desc.add(get_description(steps));
  }
  return desc;
}

} // namespace augment
} // namespace augur
