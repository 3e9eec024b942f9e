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

#ifndef AUGUR_UTILS_PROTOBUF_HPP_INCLUDED
#define AUGUR_UTILS_PROTOBUF_HPP_INCLUDED

/** @file A small library of utilities for interfacing with Google
 *        protobuf messages.
 */

#include <google/protobuf/message.h>

#include <istream>
#include <string>

namespace augur {
namespace protobuf {
namespace text {

/** @brief Parse prototext from a stream into the message.
 *  @throws augur::exception if the text does not parse.
 */
void fill(std::istream& is, google::protobuf::Message& msg);

/** @brief Parse prototext from a string into the message. */
void fill(std::string const& str, google::protobuf::Message& msg);

/** @brief Parse the named prototext file into the message. */
void load(std::string const& ptext_file, google::protobuf::Message& msg);

/** @brief Print the message as prototext. */
std::string write(google::protobuf::Message const& msg);

} // namespace text
} // namespace protobuf
} // namespace augur

#endif // AUGUR_UTILS_PROTOBUF_HPP_INCLUDED
