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

#include "augur/utils/logging.hpp"
#include "augur/utils/exception.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <memory>
#include <string>

namespace augur {
namespace logging {

namespace {

std::shared_ptr<spdlog::logger> make_logger(std::string const& name)
{
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  logger->set_level(spdlog::level::info);
  return logger;
}

spdlog::logger& rt_logger()
{
  static auto logger = make_logger("RT");
  return *logger;
}

spdlog::logger& io_logger()
{
  static auto logger = make_logger("IO");
  return *logger;
}

} // namespace

void setup_loggers()
{
  auto level = spdlog::level::info;
  if (char const* env = std::getenv("AUGUR_LOG_LEVEL")) {
    auto const requested = spdlog::level::from_str(env);
    // from_str maps unknown names to "off"; only honor "off" if asked for.
    if (requested != spdlog::level::off || std::string(env) == "off") {
      level = requested;
    }
  }
  rt_logger().set_level(level);
  io_logger().set_level(level);
}

spdlog::logger& get(Augur_Logger_ID id)
{
  switch (id) {
  case Augur_Logger_ID::LOG_RT:
    return rt_logger();
  case Augur_Logger_ID::LOG_IO:
    return io_logger();
  default:
    throw augur::exception("Unknown Augur_Logger_ID");
  }
}

}// namespace logging
}// namespace augur
