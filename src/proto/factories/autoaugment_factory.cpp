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

#include "augur/proto/factories.hpp"
#include "augur/utils/exception.hpp"

#include "augur/proto/policy.pb.h"

namespace augur {
namespace proto {

namespace {

transform::resample_mode
convert_resample(augur_data::AutoAugmentPolicy::Resample resample) {
  switch (resample) {
  case augur_data::AutoAugmentPolicy::NEAREST:
    return transform::resample_mode::nearest;
  case augur_data::AutoAugmentPolicy::BILINEAR:
    return transform::resample_mode::bilinear;
  case augur_data::AutoAugmentPolicy::BICUBIC:
    return transform::resample_mode::bicubic;
  default:
    AUGUR_ERROR_AS(invalid_parameter_error,
                   "Unknown resample mode ", static_cast<int>(resample));
  }
}

} // namespace

augment::build_options
construct_build_options(const augur_data::AutoAugmentPolicy& proto_policy) {
  augment::build_options opts;
  if (proto_policy.level_max() != 0.0f) {
    opts.level_max = proto_policy.level_max();
  }
  opts.mirror = !proto_policy.disable_mirror();
  opts.resample = convert_resample(proto_policy.resample());
  return opts;
}

augment::policy_table
construct_policy_table(const augur_data::AutoAugmentPolicy& proto_policy) {
  const auto opts = construct_build_options(proto_policy);
  augment::literal_table literal;
  literal.reserve(proto_policy.sub_policies_size());
  for (const auto& proto_sub : proto_policy.sub_policies()) {
    augment::literal_sub_policy steps;
    steps.reserve(proto_sub.steps_size());
    for (const auto& proto_step : proto_sub.steps()) {
      steps.push_back({proto_step.operation(),
                       proto_step.probability(),
                       proto_step.level()});
    }
    literal.push_back(std::move(steps));
  }
  return augment::build_policy_table(literal, opts);
}

std::unique_ptr<transform::autoaugment>
construct_autoaugment(const augur_data::AutoAugmentPolicy& proto_policy) {
  return std::make_unique<transform::autoaugment>(
    construct_policy_table(proto_policy));
}

} // namespace proto

namespace transform {

std::unique_ptr<transform>
build_autoaugment_transform_from_pbuf(google::protobuf::Message const& msg) {
  auto const& params =
    dynamic_cast<augur_data::AutoAugmentPolicy const&>(msg);
  return proto::construct_autoaugment(params);
}

} // namespace transform
} // namespace augur
