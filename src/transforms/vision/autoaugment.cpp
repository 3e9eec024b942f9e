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

#include "augur/transforms/vision/autoaugment.hpp"
#include "augur/utils/logging.hpp"
#include "augur/utils/opencv.hpp"
#include "augur/utils/random.hpp"

namespace augur {
namespace transform {

autoaugment::autoaugment()
  : autoaugment(std::make_shared<const augment::policy_table>(
                  augment::build_policy())) {}

autoaugment::autoaugment(table_ptr table)
  : transform(), m_table(std::move(table)) {
  if (m_table == nullptr || m_table->empty()) {
    AUGUR_ERROR_AS(invalid_parameter_error,
                   "autoaugment needs at least one sub-policy");
  }
  for (const auto& steps : *m_table) {
    if (steps.empty()) {
      AUGUR_ERROR_AS(invalid_parameter_error,
                     "autoaugment sub-policies must not be empty");
    }
  }
}

autoaugment::autoaugment(augment::policy_table table)
  : autoaugment(std::make_shared<const augment::policy_table>(
                  std::move(table))) {}

description autoaugment::get_description() const {
  auto desc = transform::get_description();
  desc.add(augment::get_description(*m_table));
  return desc;
}

const augment::sub_policy&
autoaugment::select_sub_policy(fast_rng_gen& gen) const {
  const size_t idx = fast_rand_int(gen, m_table->size());
  AUGUR_RT_TRACE("autoaugment selected sub-policy {} of {}",
                 idx, m_table->size());
  return (*m_table)[idx];
}

void autoaugment::apply(utils::type_erased_matrix& data,
                        std::vector<size_t>& dims) {
  apply(data, dims, get_fast_io_generator());
}

void autoaugment::apply(utils::type_erased_matrix& data,
                        std::vector<size_t>& dims,
                        fast_rng_gen& gen) const {
  utils::assert_is_image(data, dims);
  for (const auto& op : select_sub_policy(gen)) {
    const auto params = augment::sample(op, gen);
    AUGUR_RT_TRACE("{} {}", augment::get_name(op),
                   params.fire ? "fired" : "skipped");
    if (params.fire) {
      data = augment::apply(op, data, dims, params);
    }
  }
}

trace autoaugment::apply_with_trace(utils::type_erased_matrix& data,
                                    std::vector<size_t>& dims) {
  return apply_with_trace(data, dims, get_fast_io_generator());
}

trace autoaugment::apply_with_trace(utils::type_erased_matrix& data,
                                    std::vector<size_t>& dims,
                                    fast_rng_gen& gen) const {
  utils::assert_is_image(data, dims);
  const auto& steps = select_sub_policy(gen);
  trace result;
  result.reserve(steps.size());
  for (const auto& op : steps) {
    trace_entry entry{op, augment::sample(op, gen), augment::diagnostic()};
    AUGUR_RT_TRACE("{} {}", augment::get_name(op),
                   entry.sample.fire ? "fired" : "skipped");
    if (entry.sample.fire) {
      auto applied = augment::apply_with_diagnostic(op, data, dims,
                                                    entry.sample);
      data = std::move(applied.first);
      entry.diag = std::move(applied.second);
    }
    result.push_back(std::move(entry));
  }
  return result;
}

}  // namespace transform
}  // namespace augur
