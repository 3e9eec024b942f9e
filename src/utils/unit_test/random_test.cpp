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
#include <augur/utils/random.hpp>
#include <augur/utils/random_number_generators.hpp>

#include <thread>

TEST_CASE("Random helpers", "[utilities][random]")
{
  augur::fast_rng_gen gen(5);

  SECTION("fast_rand_int stays in range")
  {
    for (int i = 0; i < 1000; ++i) {
      const size_t x = augur::fast_rand_int(gen, size_t{25});
      REQUIRE(x < 25);
    }
  }

  SECTION("uniform draws stay in range")
  {
    for (int i = 0; i < 1000; ++i) {
      const float x = augur::get_uniform_random(gen, -2.0f, 3.0f);
      REQUIRE(x >= -2.0f);
      REQUIRE(x < 3.0f);
    }
  }

  SECTION("boolean draws at the extremes")
  {
    for (int i = 0; i < 100; ++i) {
      REQUIRE(augur::get_bool_random(gen, 1.0f));
      REQUIRE_FALSE(augur::get_bool_random(gen, 0.0f));
    }
  }
}

TEST_CASE("I/O generators", "[utilities][random]")
{
  SECTION("generator is usable while locked")
  {
    augur::locked_io_rng_ref io_rng = augur::set_io_generators_local_index(0);
    REQUIRE_NOTHROW(augur::get_fast_io_generator()());
  }

  SECTION("unlocked access from another thread fails")
  {
    bool threw = false;
    std::thread t([&threw]() {
      try {
        augur::get_fast_io_generator();
      }
      catch (augur::exception const&) {
        threw = true;
      }
    });
    t.join();
    REQUIRE(threw);
  }

  SECTION("reseeding repeats the stream")
  {
    augur::fast_rng_gen::result_type first, second;
    augur::init_io_random(7);
    {
      augur::locked_io_rng_ref io_rng = augur::set_io_generators_local_index(0);
      first = augur::get_fast_io_generator()();
    }
    augur::init_io_random(7);
    {
      augur::locked_io_rng_ref io_rng = augur::set_io_generators_local_index(0);
      second = augur::get_fast_io_generator()();
    }
    REQUIRE(first == second);
    augur::init_io_random(42);
  }

  SECTION("at least one generator")
  {
    REQUIRE(augur::get_num_io_generators() >= 1);
    REQUIRE_THROWS_AS(augur::init_io_random(42, 0), augur::exception);
  }
}
