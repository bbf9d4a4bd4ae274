// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "framework/logging/log_stream.h"
#include "framework/logging/log_exceptions.h"
#include <algorithm>

namespace openendf
{

/**
 * Object for controlling logging.
 *
 * Every message is prefixed with the rank of the emitting process so that tapes decoded on
 * different ranks can be told apart. There are three verbosity levels: 0 (default), 1 and 2.
 * Level 1 reports every section handed to a section parser, level 2 additionally reports
 * sections that are skipped and the positioning done between them.
 *
 * A log is written as follows:
 *
 * \code
 * #include "framework/logging/log.h"
 *
 * void ReportSomething()
 * {
 *   openendf::log.Log() << "Printed on location 0 only";
 *   openendf::log.Log0Warning() << "The directory lists 12 entries, NXC says 13";
 *   openendf::log.Log0Verbose1() << "MF=1 MT=452 Total Neutrons per Fission";
 * }
 * \endcode
 *
 * \verbatim
 * [0]  Printed on location 0 only
 * [0]  *** WARNING ***  The directory lists 12 entries, NXC says 13
 * [0]  MF=1 MT=452 Total Neutrons per Fission
 * \endverbatim
 */
class Logger
{
public:
  /// Logging level
  enum LOG_LVL
  {
    LOG_0 = 1,          ///< Used only for location 0
    LOG_0WARNING = 2,   ///< Warning only for location 0
    LOG_0ERROR = 3,     ///< Error only for location 0
    LOG_0VERBOSE_1 = 4, ///< Location 0, only if verbosity level >= 1
    LOG_0VERBOSE_2 = 5, ///< Location 0, only if verbosity level >= 2
    LOG_ALL = 6,        ///< All locations
    LOG_ALLWARNING = 7, ///< Warning for any location
    LOG_ALLERROR = 8    ///< Error for any location
  };

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetVerbosity(unsigned int level) { verbosity_ = std::min(level, 2U); }
  unsigned int GetVerbosity() const { return verbosity_; }
  LogStream Log(LOG_LVL level = LOG_0);
  LogStream Log0Warning() { return Log(LOG_0WARNING); }
  LogStream Log0Error() { return Log(LOG_0ERROR); }
  LogStream Log0Verbose1() { return Log(LOG_0VERBOSE_1); }
  LogStream Log0Verbose2() { return Log(LOG_0VERBOSE_2); }
  LogStream LogAll() { return Log(LOG_ALL); }
  LogStream LogAllWarning() { return Log(LOG_ALLWARNING); }
  LogStream LogAllError() { return Log(LOG_ALLERROR); }

private:
  Logger() = default;

  DummyStream dummy_stream_;
  unsigned int verbosity_{0};

public:
  static Logger& GetInstance() noexcept
  {
    static Logger instance;
    return instance;
  }
};

} // namespace openendf
