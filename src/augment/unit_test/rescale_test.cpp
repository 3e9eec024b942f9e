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
#include <augur/augment/rescale.hpp>

TEST_CASE("Rescaling levels", "[augment][rescale]")
{
  using augur::augment::rescale_float;
  using augur::augment::rescale_int;

  SECTION("float rescaling is linear in the level")
  {
    for (int level = 0; level <= 10; ++level) {
      for (float target : {0.3f, 1.8f, 30.0f}) {
        CHECK(rescale_float(level, target) == Approx(level * target / 10.0f));
      }
    }
  }

  SECTION("integer rescaling truncates")
  {
    for (int level = 0; level <= 10; ++level) {
      for (int target : {4, 10, 30, 256}) {
        CHECK(rescale_int(level, target) == (level * target) / 10);
      }
    }
  }

  SECTION("rescaling is monotonic in the level")
  {
    for (int level = 1; level <= 10; ++level) {
      CHECK(rescale_float(level, 1.8f) > rescale_float(level - 1, 1.8f));
      CHECK(rescale_int(level, 256) >= rescale_int(level - 1, 256));
    }
  }

  SECTION("custom level range")
  {
    CHECK(rescale_int(15, 30, 30.0f) == 15);
    CHECK(rescale_float(9, 0.3f, 9.0f) == Approx(0.3f));
  }
}
