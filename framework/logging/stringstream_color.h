// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <string>

namespace openendf
{

/// ANSI select-graphic-rendition codes used by the log headers.
enum StringStreamColorCode
{
  RESET = 0,
  FG_RED = 31,
  FG_YELLOW = 33,
  FG_MAGENTA = 35,
  FG_CYAN = 36
};

/// Returns the escape sequence for the code, or an empty string when colors are suppressed.
std::string StringStreamColor(StringStreamColorCode code);

} // namespace openendf
