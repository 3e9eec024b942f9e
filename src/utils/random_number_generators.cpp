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

#include "augur/utils/random_number_generators.hpp"

#include <functional>
#include <vector>

namespace {

template <class T, class Hash=std::hash<T>>
std::size_t hash_combine(std::size_t seed, const T& val) {
  return seed ^ (Hash()(val) + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

// Local index for the I/O generators
thread_local size_t local_io_generators_index = 0;
std::vector<augur::io_rng_t> io_generators;
bool io_generators_inited = false;
} // namespace

namespace augur {

int get_num_io_generators() { return ::io_generators.size(); }

locked_io_rng_ref set_io_generators_local_index(size_t idx)
{
  if (!::io_generators_inited) {
    AUGUR_ERROR("I/O RNG seed not set");
  }
  ::local_io_generators_index = idx % ::io_generators.size();
  return locked_io_rng_ref(::io_generators[::local_io_generators_index]);
}

fast_rng_gen& get_fast_io_generator()
{
  if (!::io_generators_inited) {
    AUGUR_ERROR("I/O RNG seed not set");
  }
  const size_t idx = ::local_io_generators_index;
  io_rng_t& io_rng = ::io_generators[idx];
  if (io_rng.active_thread_id.load() != std::this_thread::get_id()) {
    AUGUR_ERROR("I/O RNG illegal thread access");
  }
  return io_rng.fast_generator;
}

void init_io_random(int seed, int num_io_RNGs)
{
  if (num_io_RNGs < 1) {
    AUGUR_ERROR("Need at least one I/O RNG, got ", num_io_RNGs);
  }
  int seed_base = seed;
  if (seed == -1) {
    // Seed with a random value.
    std::random_device rd;
    seed_base = rd();
  }

  ::io_generators.resize(num_io_RNGs);
  for (int i = 0; i < num_io_RNGs; i++) {
    auto& io_rng = ::io_generators[i];
    io_rng.fast_generator.seed(hash_combine(seed_base, i));
    io_rng.active_thread_id.store(std::thread::id());
  }
  ::io_generators_inited = true;
}

} // namespace augur
