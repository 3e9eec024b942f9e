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

#ifndef AUGUR_UTILS_TYPE_ERASED_MATRIX_HPP_INCLUDED
#define AUGUR_UTILS_TYPE_ERASED_MATRIX_HPP_INCLUDED

#include <El.hpp>

#include <any>

namespace augur
{
namespace utils
{

using bad_any_cast = std::bad_any_cast;

/** @class type_erased_matrix
 *  @brief Holds one CPU @c El::Matrix of any element type.
 *
 *  Images travel through the transforms as 8-bit matrices, but a
 *  transform is free to replace the held matrix with one of another
 *  size or element type (see @c emplace).
 */
class type_erased_matrix
{
public:

  /** @brief Hold a deep copy of @c in_matrix.
   *
   *  The source is left untouched, which lets an operation keep its
   *  input while building a new output.
   */
  template <typename Field>
  type_erased_matrix(El::Matrix<Field> const& in_matrix)
  {
    El::Matrix<Field> held;
    El::Copy(in_matrix, held);
    m_matrix.emplace<El::Matrix<Field>>(std::move(held));
  }

  /** @brief Take ownership of @c in_matrix without copying. */
  template <typename Field>
  type_erased_matrix(El::Matrix<Field>&& in_matrix)
    : m_matrix{std::move(in_matrix)}
  {}

  /** @brief Writable access to the held matrix.
   *  @throws std::bad_any_cast if the held matrix is not of @c Field.
   */
  template <typename Field>
  El::Matrix<Field>& get()
  {
    return std::any_cast<El::Matrix<Field>&>(m_matrix);
  }

  /** @brief Read-only access to the held matrix.
   *  @throws std::bad_any_cast if the held matrix is not of @c Field.
   */
  template <typename Field>
  El::Matrix<Field> const& get() const
  {
    return std::any_cast<El::Matrix<Field> const&>(m_matrix);
  }

  /** @brief Swap in a new matrix built from @c args.
   *
   *  Used by transforms that cannot work in place, e.g. warps that
   *  read the whole source while writing the output.
   */
  template <typename Field, typename... Args>
  El::Matrix<Field>& emplace(Args&&... args)
  {
    return m_matrix.emplace<El::Matrix<Field>>(std::forward<Args>(args)...);
  }

private:
  std::any m_matrix;
};// class type_erased_matrix

}// namespace utils
}// namespace augur
#endif // AUGUR_UTILS_TYPE_ERASED_MATRIX_HPP_INCLUDED
