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

#ifndef AUGUR_UTILS_RNG_HPP
#define AUGUR_UTILS_RNG_HPP

#include "augur/utils/exception.hpp"
#include <atomic>
#include <random>
#include <thread>

namespace augur {

/** Generator used for augmentation draws. */
using fast_rng_gen = std::minstd_rand;

/** @brief One data-loading thread's generator.
 *
 *  At most one thread may own an entry at a time; ownership is taken
 *  and released through @c locked_io_rng_ref.
 */
struct io_rng_t
{
  augur::fast_rng_gen fast_generator;
  /** Owning thread, or a default id when unowned. */
  std::atomic<std::thread::id> active_thread_id;

  io_rng_t()
    : fast_generator(42ULL),
      active_thread_id(std::thread::id())
  {}

  io_rng_t(const io_rng_t& other)
    : fast_generator(other.fast_generator),
      active_thread_id(other.active_thread_id.load())
  {}
};

/** @brief Scoped ownership of one I/O generator by the calling thread. */
struct locked_io_rng_ref
{
  io_rng_t* rng_;
  locked_io_rng_ref(io_rng_t& rng) : rng_(&rng)
  {
    std::thread::id prev_tid =
      rng_->active_thread_id.exchange(std::this_thread::get_id());
    if (prev_tid != std::thread::id()) {
      AUGUR_ERROR("Acquired a \'locked\' RNG that isn't owned by this thread");
    }
  }
  explicit operator io_rng_t&() { return *rng_; }
  ~locked_io_rng_ref()
  {
    if (rng_ == nullptr) {
      return;
    }
    std::thread::id prev_tid =
      rng_->active_thread_id.exchange(std::thread::id());
    if (prev_tid != std::this_thread::get_id()) {
      AUGUR_WARNING(
        "Releasing a \'locked\' RNG that isn't owned by this thread");
    }
  }
  locked_io_rng_ref(locked_io_rng_ref&& other) : rng_(other.rng_)
  {
    other.rng_ = nullptr;
  }
  locked_io_rng_ref(const locked_io_rng_ref&) = delete;
  locked_io_rng_ref& operator=(const locked_io_rng_ref&) = delete;
};

/** Number of generators created by the last @c init_io_random. */
int get_num_io_generators();

/** @brief Bind the calling thread to generator @c idx (modulo the
 *         number of generators) and take ownership of it.
 *
 *  The thread owns the generator until the returned reference is
 *  destroyed.
 *  @throws augur::exception if another thread already owns it.
 */
locked_io_rng_ref set_io_generators_local_index(size_t idx);

/** @brief The calling thread's bound generator, which augmentation
 *         draws from by default.
 *  @throws augur::exception unless the thread currently owns it.
 */
fast_rng_gen& get_fast_io_generator();

/** @brief (Re)create the generator bank.
 *
 *  Generator @c i is seeded from a hash of @c seed and @c i, so runs
 *  with the same seed and thread binding repeat exactly.
 *
 *  @param seed Seed value; -1 seeds from std::random_device.
 *  @param num_io_RNGs Number of generators, normally one per
 *                     data-loading thread.
 */
void init_io_random(int seed = -1, int num_io_RNGs = 1);

} // namespace augur

#endif // AUGUR_UTILS_RNG_HPP
