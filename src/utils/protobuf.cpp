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

#include "augur/utils/protobuf.hpp"
#include "augur/utils/exception.hpp"

#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/text_format.h>

#include <fstream>

namespace pb = ::google::protobuf;

void augur::protobuf::text::fill(std::istream& is,
                                 google::protobuf::Message& msg)
{
  google::protobuf::io::IstreamInputStream input(&is);
  if (!google::protobuf::TextFormat::Parse(&input, &msg))
    AUGUR_ERROR("Unable to parse prototext from stream.");
}

void augur::protobuf::text::fill(std::string const& str,
                                 google::protobuf::Message& msg)
{
  if (!pb::TextFormat::ParseFromString(str, &msg))
    AUGUR_ERROR("Unable to parse prototext from string.");
}

void augur::protobuf::text::load(std::string const& ptext_file,
                                 google::protobuf::Message& msg)
{
  std::ifstream ifs(ptext_file);
  if (!ifs)
    AUGUR_ERROR("Unable to open prototext file \"", ptext_file, "\".");
  AUGUR_IO_DEBUG("Reading prototext from {}", ptext_file);
  fill(ifs, msg);
}

std::string augur::protobuf::text::write(google::protobuf::Message const& msg)
{
  std::string str;
  if (!pb::TextFormat::PrintToString(msg, &str))
    AUGUR_ERROR("Failed to print prototext to string.");
  return str;
}
