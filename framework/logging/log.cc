// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/logging/log.h"
#include "framework/logging/stringstream_color.h"
#include "framework/runtime.h"
#include <iostream>

namespace openendf
{

LogStream
Logger::Log(LOG_LVL level)
{
  const int rank = openendf::mpi_comm.rank();
  const std::string location = "[" + std::to_string(rank) + "]  ";

  // Levels suffixed with 0 are only emitted from the root location
  bool root_only = true;
  unsigned int required_verbosity = 0;
  std::string decoration;
  std::ostream* stream = &std::cout;

  switch (level)
  {
    case LOG_0:
      break;
    case LOG_0WARNING:
      decoration = StringStreamColor(FG_YELLOW) + "*** WARNING ***  ";
      break;
    case LOG_0ERROR:
      decoration = StringStreamColor(FG_RED) + "**** ERROR ****  ";
      stream = &std::cerr;
      break;
    case LOG_0VERBOSE_1:
      decoration = StringStreamColor(FG_CYAN);
      required_verbosity = 1;
      break;
    case LOG_0VERBOSE_2:
      decoration = StringStreamColor(FG_MAGENTA);
      required_verbosity = 2;
      break;
    case LOG_ALL:
      root_only = false;
      break;
    case LOG_ALLWARNING:
      decoration = StringStreamColor(FG_YELLOW) + "*** WARNING ***  ";
      root_only = false;
      break;
    case LOG_ALLERROR:
      decoration = StringStreamColor(FG_RED) + "**** ERROR ****  ";
      stream = &std::cerr;
      root_only = false;
      break;
    default:
      return {&dummy_stream_, " ", true};
  }

  if ((root_only and rank != 0) or verbosity_ < required_verbosity)
    return {&dummy_stream_, " ", true};

  return {stream, location + decoration};
}

} // namespace openendf
