// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/runtime.h"
#include "framework/logging/log.h"
#include "config.h"
#include "caliper/cali.h"

namespace openendf
{

// Global variables
Logger& log = Logger::GetInstance();
mpi::Communicator mpi_comm;
bool use_caliper = false;
std::string cali_config("runtime-report(calc.inclusive=true),max_column_width=80");
cali::ConfigManager cali_mgr;
bool suppress_color = false;

int
Initialize()
{
  if (use_caliper)
  {
    cali_mgr.add(cali_config.c_str());
    cali_set_global_string_byname("openendf.version", GetVersionStr().c_str());
    cali_mgr.start();
  }

  CALI_MARK_BEGIN(openendf::program.c_str());

  return 0;
}

void
Finalize()
{
  CALI_MARK_END(openendf::program.c_str());

  if (use_caliper)
    cali_mgr.flush();
}

std::string
GetVersionStr()
{
  return PROJECT_VERSION;
}

} // namespace openendf
