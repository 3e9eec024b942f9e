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

#ifndef AUGUR_PROTO_FACTORIES_HPP_INCLUDED
#define AUGUR_PROTO_FACTORIES_HPP_INCLUDED

#include "augur/augment/policy.hpp"
#include "augur/transforms/transform.hpp"
#include "augur/transforms/vision/autoaugment.hpp"

#include <google/protobuf/message.h>

#include <memory>

namespace augur_data {
class AutoAugmentPolicy;
} // namespace augur_data

namespace augur {
namespace proto {

/** Build options (level range, mirroring, resampling) from a policy. */
augment::build_options
construct_build_options(const augur_data::AutoAugmentPolicy& proto_policy);

/** Construct a policy table specified with prototext.
 *  @throws unknown_operation_error, invalid_parameter_error as
 *          augment::build_policy_table does.
 */
augment::policy_table
construct_policy_table(const augur_data::AutoAugmentPolicy& proto_policy);

/** Construct an autoaugment transform specified with prototext. */
std::unique_ptr<transform::autoaugment>
construct_autoaugment(const augur_data::AutoAugmentPolicy& proto_policy);

} // namespace proto

namespace transform {

/** Build from an @c augur_data::AutoAugmentPolicy message. */
std::unique_ptr<transform>
build_autoaugment_transform_from_pbuf(google::protobuf::Message const&);

} // namespace transform
} // namespace augur

#endif // AUGUR_PROTO_FACTORIES_HPP_INCLUDED
