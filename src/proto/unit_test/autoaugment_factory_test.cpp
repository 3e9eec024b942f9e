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

// MUST include this
#include "Catch2BasicSupport.hpp"

// File being tested
#include <augur/proto/factories.hpp>
#include <augur/utils/protobuf.hpp>

#include "augur/proto/policy.pb.h"

#include <fstream>

namespace {

std::string const valid_policy = R"ptext(
sub_policies {
  steps { operation: "Rotate" probability: 0.5 level: 6 }
  steps { operation: "Color" probability: 1.0 level: 2 }
}
sub_policies {
  steps { operation: "Invert" probability: 0.2 }
}
level_max: 20
resample: BILINEAR
disable_mirror: true
)ptext";

std::string const unknown_operation_policy = R"ptext(
sub_policies {
  steps { operation: "Rotate" probability: 0.5 level: 6 }
  steps { operation: "Blur" probability: 1.0 level: 2 }
}
)ptext";

std::string const bad_probability_policy = R"ptext(
sub_policies {
  steps { operation: "Posterize" probability: 1.5 level: 6 }
}
)ptext";

} // namespace

using namespace augur::augment;

TEST_CASE("Building a policy table from prototext", "[proto][autoaugment]")
{
  augur_data::AutoAugmentPolicy msg;

  SECTION("valid policy")
  {
    REQUIRE_NOTHROW(augur::protobuf::text::fill(valid_policy, msg));
    const auto table = augur::proto::construct_policy_table(msg);
    REQUIRE(table.size() == 2);
    REQUIRE(table[0].size() == 2);
    REQUIRE(table[1].size() == 1);

    const auto& rot = std::get<rotate>(table[0][0]);
    CHECK(rot.degrees == 9);
    CHECK_FALSE(rot.mirror);
    CHECK(rot.resample == resample_mode::bilinear);
    CHECK(std::get<saturation>(table[0][1]).factor == Approx(0.28f));
    CHECK(get_probability(table[1][0]) == Approx(0.2f));
  }

  SECTION("defaults")
  {
    const auto opts = augur::proto::construct_build_options(msg);
    CHECK(opts.level_max == 10.0f);
    CHECK(opts.mirror);
    CHECK(opts.resample == resample_mode::nearest);
  }

  SECTION("unknown operation")
  {
    augur::protobuf::text::fill(unknown_operation_policy, msg);
    REQUIRE_THROWS_AS(augur::proto::construct_policy_table(msg),
                      augur::unknown_operation_error);
  }

  SECTION("bad probability")
  {
    augur::protobuf::text::fill(bad_probability_policy, msg);
    REQUIRE_THROWS_AS(augur::proto::construct_autoaugment(msg),
                      augur::invalid_parameter_error);
  }

  SECTION("empty policy")
  {
    REQUIRE_THROWS_AS(augur::proto::construct_policy_table(msg),
                      augur::invalid_parameter_error);
  }

  SECTION("malformed prototext")
  {
    REQUIRE_THROWS_AS(
      augur::protobuf::text::fill("sub_policies { steps { level: } }", msg),
      augur::exception);
  }

  SECTION("generic transform builder")
  {
    augur::protobuf::text::fill(valid_policy, msg);
    auto trans = augur::transform::build_autoaugment_transform_from_pbuf(msg);
    REQUIRE(trans != nullptr);
    REQUIRE(trans->get_type() == "autoaugment");
  }

  SECTION("loading from a file")
  {
    const std::string path = "augur_autoaugment_factory_test.prototext";
    {
      std::ofstream ofs(path);
      ofs << valid_policy;
    }
    REQUIRE_NOTHROW(augur::protobuf::text::load(path, msg));
    REQUIRE(msg.sub_policies_size() == 2);
    REQUIRE_THROWS_AS(
      augur::protobuf::text::load("no_such_policy.prototext", msg),
      augur::exception);
  }

  SECTION("written prototext parses back")
  {
    augur::protobuf::text::fill(valid_policy, msg);
    const auto text = augur::protobuf::text::write(msg);
    REQUIRE_THAT(text, AUGUR_CONTAINS("sub_policies"));
    augur_data::AutoAugmentPolicy reread;
    augur::protobuf::text::fill(text, reread);
    REQUIRE(reread.sub_policies_size() == msg.sub_policies_size());
  }
}
