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
#include <augur/augment/policy.hpp>

using namespace augur::augment;

TEST_CASE("Canonical policy table", "[augment][policy]")
{
  const auto& literal = get_canonical_literal_table();
  const auto table = build_policy();

  SECTION("shape")
  {
    REQUIRE(literal.size() == 25);
    REQUIRE(table.size() == 25);
    for (const auto& steps : table) {
      REQUIRE(steps.size() == 2);
    }
  }

  SECTION("steps follow the literal table")
  {
    for (size_t i = 0; i < table.size(); ++i) {
      for (size_t j = 0; j < table[i].size(); ++j) {
        CHECK(get_name(table[i][j]) == literal[i][j].operation);
        CHECK(get_probability(table[i][j]) == literal[i][j].probability);
      }
    }
  }

  SECTION("resolved parameters")
  {
    REQUIRE(std::holds_alternative<posterize>(table[0][0]));
    CHECK(std::get<posterize>(table[0][0]).bits == 1);
    CHECK(get_probability(table[0][0]) == Approx(0.4f));
    CHECK(std::get<rotate>(table[0][1]).degrees == 27);
    CHECK(std::get<solarize>(table[1][0]).threshold == 128);
    CHECK(std::get<shear_x>(table[18][0]).shear == Approx(0.15f));
    CHECK(std::get<contrast>(table[14][1]).factor == Approx(1.54f));
    CHECK(std::get<saturation>(table[10][1]).factor == Approx(0.1f));
  }

  SECTION("building is deterministic")
  {
    const auto again = build_policy();
    REQUIRE(again.size() == table.size());
    for (size_t i = 0; i < table.size(); ++i) {
      for (size_t j = 0; j < table[i].size(); ++j) {
        CHECK(get_name(again[i][j]) == get_name(table[i][j]));
        CHECK(get_parameter(again[i][j]) == get_parameter(table[i][j]));
      }
    }
  }

  SECTION("description lists every sub-policy")
  {
    const auto text = get_description(table).str();
    CHECK_THAT(text, AUGUR_CONTAINS("25 sub-policies"));
    CHECK_THAT(text, AUGUR_CONTAINS("ShearX (p=0.6)"));
    CHECK_THAT(text, AUGUR_CONTAINS("bits: 1"));
  }
}

TEST_CASE("Custom policy tables", "[augment][policy]")
{
  SECTION("a valid table")
  {
    literal_table literal = {
      {{"TranslateY", 1.0f, 5}},
      {{"Invert", 0.0f, 0}, {"Equalize", 1.0f, 0}, {"Brightness", 0.5f, 2}},
    };
    const auto table = build_policy_table(literal);
    REQUIRE(table.size() == 2);
    REQUIRE(table[0].size() == 1);
    REQUIRE(table[1].size() == 3);
    CHECK(std::get<translate_y>(table[0][0]).pixels == 5);
  }

  SECTION("unknown operation fails the whole build")
  {
    literal_table literal = {
      {{"Posterize", 0.4f, 8}},
      {{"Rotate", 0.6f, 9}, {"Cutout", 0.5f, 3}},
    };
    REQUIRE_THROWS_AS(build_policy_table(literal),
                      augur::unknown_operation_error);
  }

  SECTION("invalid probability")
  {
    literal_table literal = {{{"Posterize", 1.4f, 8}}};
    REQUIRE_THROWS_AS(build_policy_table(literal),
                      augur::invalid_parameter_error);
  }

  SECTION("invalid level")
  {
    literal_table literal = {{{"Posterize", 0.4f, 12}}};
    REQUIRE_THROWS_AS(build_policy_table(literal),
                      augur::invalid_parameter_error);

    build_options opts;
    opts.level_max = 20.0f;
    REQUIRE_NOTHROW(build_policy_table(literal, opts));
  }

  SECTION("empty tables and sub-policies")
  {
    REQUIRE_THROWS_AS(build_policy_table(literal_table()),
                      augur::invalid_parameter_error);
    literal_table literal = {{{"Invert", 0.5f, 0}}, {}};
    REQUIRE_THROWS_AS(build_policy_table(literal),
                      augur::invalid_parameter_error);
  }
}
