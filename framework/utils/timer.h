// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>

namespace openendf
{

/** Wall-clock stopwatch.*/
class Timer
{
private:
  std::chrono::steady_clock::time_point start_time_;

public:
  /** Starts the timer.*/
  Timer() noexcept;
  /** Gets the elapsed time in milliseconds.*/
  double GetTime() const;
};

} // namespace openendf
