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

#ifndef AUGUR_LOGGING_HPP_INCLUDED
#define AUGUR_LOGGING_HPP_INCLUDED

#include <spdlog/spdlog.h>

namespace augur {
namespace logging {

enum Augur_Logger_ID
{
  LOG_RT,
  LOG_IO,
};

/** @brief Create the loggers and set their level.
 *
 *  The level is read from the @c AUGUR_LOG_LEVEL environment
 *  variable using spdlog's level names ("trace", "debug", "info",
 *  "warn", "err", "critical", "off"). Unset or unrecognized values
 *  leave the loggers at "info". Safe to call more than once.
 */
void setup_loggers();

/** @brief The logger for @c id. */
spdlog::logger& get(Augur_Logger_ID id);

}// namespace logging
}// namespace augur

#define AUGUR_LOG(logger_id, level, ...) \
  do { \
    auto& augur_log_logger = ::augur::logging::get(logger_id); \
    if (augur_log_logger.should_log(level)) { \
      augur_log_logger.log(::spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, level, __VA_ARGS__); \
    } \
  } while (0)

#define AUGUR_TRACE(logger_id, ...) AUGUR_LOG(logger_id, ::spdlog::level::trace, __VA_ARGS__)
#define AUGUR_DEBUG_LOG(logger_id, ...) AUGUR_LOG(logger_id, ::spdlog::level::debug, __VA_ARGS__)
#define AUGUR_INFO(logger_id, ...) AUGUR_LOG(logger_id, ::spdlog::level::info, __VA_ARGS__)
#define AUGUR_WARN(logger_id, ...) AUGUR_LOG(logger_id, ::spdlog::level::warn, __VA_ARGS__)
#define AUGUR_ERR(logger_id, ...) AUGUR_LOG(logger_id, ::spdlog::level::err, __VA_ARGS__)
#define AUGUR_CRIT(logger_id, ...) AUGUR_LOG(logger_id, ::spdlog::level::critical, __VA_ARGS__)

#define AUGUR_RT_TRACE(...) AUGUR_TRACE(::augur::logging::Augur_Logger_ID::LOG_RT, __VA_ARGS__)

#define AUGUR_RT_DEBUG(...) AUGUR_DEBUG_LOG(::augur::logging::Augur_Logger_ID::LOG_RT, __VA_ARGS__)

#define AUGUR_RT_INFO(...) AUGUR_INFO(::augur::logging::Augur_Logger_ID::LOG_RT, __VA_ARGS__)

#define AUGUR_RT_WARN(...) AUGUR_WARN(::augur::logging::Augur_Logger_ID::LOG_RT, __VA_ARGS__)

#define AUGUR_RT_ERR(...) AUGUR_ERR(::augur::logging::Augur_Logger_ID::LOG_RT, __VA_ARGS__)

#define AUGUR_RT_CRIT(...) AUGUR_CRIT(::augur::logging::Augur_Logger_ID::LOG_RT, __VA_ARGS__)

#define AUGUR_IO_TRACE(...) AUGUR_TRACE(::augur::logging::Augur_Logger_ID::LOG_IO, __VA_ARGS__)

#define AUGUR_IO_DEBUG(...) AUGUR_DEBUG_LOG(::augur::logging::Augur_Logger_ID::LOG_IO, __VA_ARGS__)

#define AUGUR_IO_INFO(...) AUGUR_INFO(::augur::logging::Augur_Logger_ID::LOG_IO, __VA_ARGS__)

#define AUGUR_IO_WARN(...) AUGUR_WARN(::augur::logging::Augur_Logger_ID::LOG_IO, __VA_ARGS__)

#define AUGUR_IO_ERR(...) AUGUR_ERR(::augur::logging::Augur_Logger_ID::LOG_IO, __VA_ARGS__)

#define AUGUR_IO_CRIT(...) AUGUR_CRIT(::augur::logging::Augur_Logger_ID::LOG_IO, __VA_ARGS__)

#endif // AUGUR_LOGGING_HPP_INCLUDED
