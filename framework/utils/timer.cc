// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/utils/timer.h"

namespace openendf
{

Timer::Timer() noexcept : start_time_(std::chrono::steady_clock::now())
{
}

double
Timer::GetTime() const
{
  using namespace std::chrono;

  const duration<double, std::milli> elapsed = steady_clock::now() - start_time_;
  return elapsed.count();
}

} // namespace openendf
