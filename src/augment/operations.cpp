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

#include "augur/augment/operations.hpp"
#include "augur/utils/exception.hpp"
#include "augur/utils/opencv.hpp"
#include "augur/utils/random.hpp"

#include <type_traits>

namespace augur {
namespace augment {

namespace {

/** True for the affine family, which carries mirror and resample settings. */
template <typename T, typename = void>
struct has_mirror : std::false_type {};
template <typename T>
struct has_mirror<T, std::void_t<decltype(std::declval<T>().mirror)>>
  : std::true_type {};

/** Count the channel values that differ between two images. */
size_t count_changed_values(const utils::type_erased_matrix& before,
                            const std::vector<size_t>& before_dims,
                            const utils::type_erased_matrix& after,
                            const std::vector<size_t>& after_dims) {
  const auto& a = before.template get<uint8_t>();
  const auto& b = after.template get<uint8_t>();
  if (before_dims != after_dims) {
    return utils::get_linearized_size(after_dims);
  }
  const size_t size = utils::get_linearized_size(after_dims);
  const uint8_t* a_buf = a.LockedBuffer();
  const uint8_t* b_buf = b.LockedBuffer();
  size_t changed = 0;
  for (size_t i = 0; i < size; ++i) {
    if (a_buf[i] != b_buf[i]) {
      ++changed;
    }
  }
  return changed;
}

} // namespace

float sample_mirrored(float magnitude, bool mirror, fast_rng_gen& gen) {
  if (mirror && get_bool_random(gen, 0.5f)) {
    return -magnitude;
  }
  return magnitude;
}

std::string get_name(const operation& op) {
  return std::visit([](const auto& o) -> std::string { return o.name; }, op);
}

float get_probability(const operation& op) {
  return std::visit([](const auto& o) { return o.p; }, op);
}

float get_parameter(const operation& op) {
  return std::visit([](const auto& o) { return o.parameter(); }, op);
}

description get_description(const operation& op) {
  return std::visit(
    [](const auto& o) {
      using op_type = std::decay_t<decltype(o)>;
      description desc(build_string(op_type::name, " (p=", o.p, ")"));
      if (std::string(op_type::param_name).empty()) {
        return desc;
      }
      desc.add(op_type::param_name, o.parameter());
      if constexpr (has_mirror<op_type>::value) {
        desc.add("mirror", o.mirror);
        desc.add("resample", transform::to_string(o.resample));
      }
      return desc;
    },
    op);
}

void validate(const operation& op) {
  const float p = get_probability(op);
  if (!(p >= 0.0f && p <= 1.0f)) {
    AUGUR_ERROR_AS(invalid_parameter_error,
                   get_name(op), " probability must be in [0, 1], got ", p);
  }
  // The transform constructors reject parameters they cannot apply.
  std::visit([](const auto& o) { o.make_transform(o.parameter()); }, op);
}

sampled_params sample(const operation& op, fast_rng_gen& gen) {
  return std::visit(
    [&gen](const auto& o) {
      using op_type = std::decay_t<decltype(o)>;
      sampled_params params;
      params.name = op_type::param_name;
      params.value = o.sample(gen);
      params.fire = get_bool_random(gen, o.p);
      return params;
    },
    op);
}

utils::type_erased_matrix apply(const operation& op,
                                const utils::type_erased_matrix& src,
                                std::vector<size_t>& dims,
                                const sampled_params& params) {
  utils::assert_is_image(src, dims);
  // Deep copy; the transforms work in place.
  utils::type_erased_matrix dst(src.template get<uint8_t>());
  std::visit(
    [&](const auto& o) {
      auto trans = o.make_transform(params.value);
      trans.apply(dst, dims);
    },
    op);
  return dst;
}

std::pair<utils::type_erased_matrix, diagnostic>
apply_with_diagnostic(const operation& op,
                      const utils::type_erased_matrix& src,
                      std::vector<size_t>& dims,
                      const sampled_params& params) {
  const std::vector<size_t> in_dims = dims;
  auto dst = apply(op, src, dims, params);
  diagnostic diag;
  diag.applied = true;
  diag.detail = std::visit(
    [&params](const auto& o) {
      return o.make_transform(params.value).get_description().str();
    },
    op);
  diag.changed_values = count_changed_values(src, in_dims, dst, dims);
  return {std::move(dst), std::move(diag)};
}

} // namespace augment
} // namespace augur
