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

#include "augur/utils/description.hpp"

namespace augur {

namespace {

/** Indentation applied to every line after the title. */
const std::string indent = "  ";

} // namespace

description::description(std::string title) : m_title(std::move(title)) {}

void description::set_title(std::string title) {
  m_title = std::move(title);
}

void description::add(std::string line) {
  m_lines.emplace_back(std::move(line));
}

void description::add(const description& desc) {
  std::stringstream ss;
  ss << desc;
  std::string line;
  while (std::getline(ss, line)) {
    add(line);
  }
}

std::string description::str() const {
  std::stringstream ss;
  ss << *this;
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const description& desc) {
  os << desc.m_title;
  for (const auto& line : desc.m_lines) {
    os << "\n" << indent << line;
  }
  return os;
}

} // namespace augur
