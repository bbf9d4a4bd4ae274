// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/logging/stringstream_color.h"
#include "framework/runtime.h"

namespace openendf
{

std::string
StringStreamColor(StringStreamColorCode code)
{
  if (suppress_color)
    return {};
  return "\033[" + std::to_string(static_cast<int>(code)) + "m";
}

} // namespace openendf
