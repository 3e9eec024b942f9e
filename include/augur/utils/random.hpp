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

#ifndef AUGUR_UTILS_RANDOM_HPP
#define AUGUR_UTILS_RANDOM_HPP

#include "augur/utils/exception.hpp"
#include "augur/utils/random_number_generators.hpp"

namespace augur {

/**
 * Return random integers uniformly distributed in [0, max).
 * @param g C++ uniform random bit generator.
 * @param max Upper bound on the distribution.
 * @note It turns out that the GCC std::uniform_int_distribution is really
 * slow. That implementation is used by most compilers. This implementation
 * is roughly five times faster than that one.
 */
template <typename Generator, typename T>
inline T fast_rand_int(Generator& g, T max) {
#ifdef AUGUR_DEBUG
  if (max == 0) {
    AUGUR_ERROR("fast_rand_int called with max=0");
  }
#endif
  typename Generator::result_type x;
  do {
    x = g();
  } while (x >= (Generator::max() - Generator::max() % max));
  return x % max;
}

/** Return a value uniformly at random in [a, b). */
template <typename Generator>
inline float get_uniform_random(Generator& g, float a, float b) {
  std::uniform_real_distribution<float> dist(a, b);
  return dist(g);
}

/** Return true with probability p. */
template <typename Generator>
inline bool get_bool_random(Generator& g, float p) {
  return get_uniform_random(g, 0.0f, 1.0f) < p;
}

} // namespace augur

#endif // AUGUR_UTILS_RANDOM_HPP
