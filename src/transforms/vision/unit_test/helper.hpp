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

#ifndef AUGUR_TRANSFORMS_VISION_UNIT_TEST_HELPER
#define AUGUR_TRANSFORMS_VISION_UNIT_TEST_HELPER

#include <El.hpp>

#include <cstdint>
#include <functional>
#include <iostream>

/** Visit every channel value of an interleaved (HWC) image. */
inline void
apply_elementwise(El::Matrix<uint8_t>& mat,
                  El::Int height,
                  El::Int width,
                  El::Int channels,
                  std::function<void(uint8_t&, El::Int, El::Int, El::Int)> f)
{
  uint8_t* buf = mat.Buffer();
  for (El::Int channel = 0; channel < channels; ++channel) {
    for (El::Int col = 0; col < width; ++col) {
      for (El::Int row = 0; row < height; ++row) {
        f(buf[channels * (col + row * width) + channel], row, col, channel);
      }
    }
  }
}

inline uint8_t at(const El::Matrix<uint8_t>& mat,
                  El::Int row,
                  El::Int col,
                  El::Int channel,
                  El::Int width,
                  El::Int channels = 1)
{
  return mat.LockedBuffer()[channels * (col + row * width) + channel];
}

inline void fill(El::Matrix<uint8_t>& mat,
                 El::Int height,
                 El::Int width,
                 El::Int channels,
                 uint8_t value)
{
  mat.Resize(height * width * channels, 1);
  uint8_t* buf = mat.Buffer();
  for (El::Int i = 0; i < height * width * channels; ++i) {
    buf[i] = value;
  }
}

inline void zeros(El::Matrix<uint8_t>& mat,
                  El::Int height,
                  El::Int width,
                  El::Int channels = 1)
{
  fill(mat, height, width, channels, 0);
}

/** Values increase along rows and columns and differ per channel. */
inline void gradient(El::Matrix<uint8_t>& mat,
                     El::Int height,
                     El::Int width,
                     El::Int channels = 1)
{
  mat.Resize(height * width * channels, 1);
  apply_elementwise(mat,
                    height,
                    width,
                    channels,
                    [](uint8_t& x, El::Int row, El::Int col, El::Int channel) {
                      x = static_cast<uint8_t>(
                        (16 * row + 8 * col + 40 * channel) % 256);
                    });
}

/** A single bright pixel at (row, col) in every channel. */
inline void dot(El::Matrix<uint8_t>& mat,
                El::Int height,
                El::Int width,
                El::Int channels,
                El::Int dot_row,
                El::Int dot_col)
{
  mat.Resize(height * width * channels, 1);
  apply_elementwise(
    mat,
    height,
    width,
    channels,
    [dot_row, dot_col](uint8_t& x, El::Int row, El::Int col, El::Int) {
      x = (row == dot_row && col == dot_col) ? 200 : 0;
    });
}

inline bool pixels_equal(const El::Matrix<uint8_t>& a, const El::Matrix<uint8_t>& b)
{
  if (a.Height() != b.Height() || a.Width() != b.Width()) {
    return false;
  }
  const El::Int size = a.Height() * a.Width();
  for (El::Int i = 0; i < size; ++i) {
    if (a.LockedBuffer()[i] != b.LockedBuffer()[i]) {
      return false;
    }
  }
  return true;
}

inline void print(const El::Matrix<uint8_t>& mat,
                  El::Int height,
                  El::Int width,
                  El::Int channels = 1)
{
  const uint8_t* buf = mat.LockedBuffer();
  for (El::Int channel = 0; channel < channels; ++channel) {
    for (El::Int row = 0; row < height; ++row) {
      for (El::Int col = 0; col < width; ++col) {
        std::cout << ((int)buf[channels * (col + row * width) + channel])
                  << " ";
      }
      std::cout << std::endl;
    }
    std::cout << "--" << std::endl;
  }
}

#endif // AUGUR_TRANSFORMS_VISION_UNIT_TEST_HELPER
