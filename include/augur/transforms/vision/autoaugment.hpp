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

#ifndef AUGUR_TRANSFORMS_AUTOAUGMENT_HPP_INCLUDED
#define AUGUR_TRANSFORMS_AUTOAUGMENT_HPP_INCLUDED

#include "augur/augment/policy.hpp"
#include "augur/transforms/transform.hpp"

#include <memory>
#include <vector>

namespace augur {
namespace transform {

/** @brief What happened at one step of an application. */
struct trace_entry {
  /** Copy of the configured step, so the trace may outlive the table. */
  augment::operation step;
  /** Gate decision and sampled parameter value. */
  augment::sampled_params sample;
  /** Outcome of the step. */
  augment::diagnostic diag;
};

using trace = std::vector<trace_entry>;

/**
 * Apply a randomly selected sub-policy of an augmentation policy.
 *
 * Each application draws one sub-policy uniformly at random and runs its
 * steps in order. Every step fires independently with its own probability;
 * a step that does not fire leaves the image unchanged.
 *
 * The policy table is immutable and shared between copies, so one instance
 * can be applied concurrently as long as each thread uses its own
 * generator.
 */
class autoaugment : public transform {
public:
  using table_ptr = std::shared_ptr<const augment::policy_table>;

  /** Use the canonical policy table. */
  autoaugment();
  /** @throws invalid_parameter_error if @c table is null or empty. */
  autoaugment(table_ptr table);
  autoaugment(augment::policy_table table);

  transform* copy() const override { return new autoaugment(*this); }

  std::string get_type() const override { return "autoaugment"; }

  description get_description() const override;

  /** Apply using the calling thread's I/O generator. */
  void apply(utils::type_erased_matrix& data, std::vector<size_t>& dims) override;
  /** Apply drawing all randomness from @c gen. */
  void apply(utils::type_erased_matrix& data,
             std::vector<size_t>& dims,
             fast_rng_gen& gen) const;

  /**
   * Apply as @c apply does, recording each step of the selected
   * sub-policy. The gate drawn for a step decides both whether it runs
   * and what the trace reports.
   */
  trace apply_with_trace(utils::type_erased_matrix& data,
                         std::vector<size_t>& dims);
  trace apply_with_trace(utils::type_erased_matrix& data,
                         std::vector<size_t>& dims,
                         fast_rng_gen& gen) const;

  /** Draw one sub-policy uniformly at random. */
  const augment::sub_policy& select_sub_policy(fast_rng_gen& gen) const;

  const augment::policy_table& get_policy() const { return *m_table; }

private:
  table_ptr m_table;
};

}  // namespace transform
}  // namespace augur

#endif  // AUGUR_TRANSFORMS_AUTOAUGMENT_HPP_INCLUDED
