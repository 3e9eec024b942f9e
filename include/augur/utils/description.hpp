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

#ifndef AUGUR_UTILS_DESCRIPTION_HPP
#define AUGUR_UTILS_DESCRIPTION_HPP

#include <string>
#include <vector>
#include <ostream>
#include <sstream>

namespace augur {

/** @brief Indented, human-readable summary of an object.
 *
 *  The title prints flush left and every added line one level
 *  deeper; nesting a description adds another level. Used for the
 *  policy dump, e.g.
 *
@verbatim
AutoAugment transform
  Sub-policies: 25
    Sub-policy 0
      Posterize (p=0.4)
        bits: 1
@endverbatim
 */
class description {
public:

  description(std::string title = "");

  void set_title(std::string title);

  friend std::ostream& operator<<(std::ostream& os,
                                  const description& desc);

  /** Append one line. */
  void add(std::string line);

  /** Append a line of the form <tt>field: value</tt>. Booleans print
   *  as @c true / @c false.
   */
  template <typename T>
  void add(std::string field, T value) {
    std::ostringstream line;
    line.setf(std::ios_base::boolalpha);
    line << field << ": " << value;
    add(line.str());
  }

  /** Append @c desc one indentation level below this one. */
  void add(const description& desc);

  std::string str() const;

private:

  std::string m_title;
  /** Body lines, stored without their leading indentation. */
  std::vector<std::string> m_lines;

};

} // namespace augur

#endif // AUGUR_UTILS_DESCRIPTION_HPP
