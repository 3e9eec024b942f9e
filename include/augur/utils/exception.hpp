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

#ifndef AUGUR_UTILS_EXCEPTION_HPP_INCLUDED
#define AUGUR_UTILS_EXCEPTION_HPP_INCLUDED

#include "augur/utils/logging.hpp"

#include <exception>
#include <iostream>
#include <sstream>
#include <string>

#define AUGUR_ERROR(...)                                                       \
  do {                                                                         \
    throw ::augur::exception(::augur::build_string("Augur error (",            \
                                                   __FILE__,                   \
                                                   ":",                        \
                                                   __LINE__,                   \
                                                   "): ",                      \
                                                   __VA_ARGS__));              \
  } while (0)

/** Throw an exception of type @c exception_type, which must be
 *  constructible from a single message string.
 */
#define AUGUR_ERROR_AS(exception_type, ...)                                    \
  do {                                                                         \
    throw exception_type(::augur::build_string("Augur error (",                \
                                               __FILE__,                       \
                                               ":",                            \
                                               __LINE__,                       \
                                               "): ",                          \
                                               __VA_ARGS__));                  \
  } while (0)

#define AUGUR_WARNING(...)                                                     \
  AUGUR_RT_WARN("{}", ::augur::build_string(__VA_ARGS__))

#define AUGUR_ASSERT(cond)                                                     \
  do {                                                                         \
    if (!(cond)) {                                                             \
      AUGUR_ERROR("The assertion " #cond " failed.");                          \
    }                                                                          \
  } while (0)

namespace augur {

/** @class exception
 *  @brief The base exception for Augur errors.
 */
class exception : public std::exception
{
public:
  /** @brief Default constructor with a generic message. */
  exception();

  /** @brief Constructor with message.
   *
   *  The message is framed by rules so it stands out in logs that
   *  interleave output from several data-loading threads.
   */
  exception(std::string message);

  char const* what() const noexcept override;

  /** @brief Print the what() string to the stream. */
  void print_report(std::ostream& os = std::cerr) const;

private:
  /** Human-readable exception message. */
  std::string m_message;
};

/** @brief A policy table refers to an operation that is not registered. */
class unknown_operation_error : public exception
{
public:
  using exception::exception;
};

/** @brief A probability, level, or operation parameter is out of range. */
class invalid_parameter_error : public exception
{
public:
  using exception::exception;
};

/** @brief Build a string from the arguments.
 *
 *  The arguments must be stream-outputable (have operator<<(ostream&,
 *  T) defined). It will be a static error if this fails.
 *
 *  @tparam Args (Inferred) The types of the arguments.
 *
 *  @param[in] args The things to be stringified.
 */
template <typename... Args>
std::string build_string(Args&&... args)
{
  std::ostringstream oss;
  int dummy[] = {0, (oss << args, 0)...};
  (void)dummy; // silence compiler warnings
  return oss.str();
}

} // namespace augur

#endif // AUGUR_UTILS_EXCEPTION_HPP_INCLUDED
