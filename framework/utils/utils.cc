// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/utils/utils.h"
#include "framework/logging/log_exceptions.h"
#include <fstream>

namespace openendf
{

std::string
StringLTrim(const std::string& s)
{
  size_t start = s.find_first_not_of(WHITESPACE);
  return (start == std::string::npos) ? "" : s.substr(start);
}

std::string
StringRTrim(const std::string& s)
{
  size_t end = s.find_last_not_of(WHITESPACE);
  return (end == std::string::npos) ? "" : s.substr(0, end + 1);
}

std::string
StringTrim(const std::string& s)
{
  return StringRTrim(StringLTrim(s));
}

std::string_view
StringViewTrim(std::string_view s)
{
  const size_t start = s.find_first_not_of(WHITESPACE);
  if (start == std::string_view::npos)
    return {};
  const size_t end = s.find_last_not_of(WHITESPACE);
  return s.substr(start, end - start + 1);
}

bool
IsBlank(std::string_view s)
{
  return s.find_first_not_of(WHITESPACE) == std::string_view::npos;
}

void
AssertReadableFile(const std::string& file_name)
{
  std::ifstream file(file_name.c_str(), std::ifstream::in);
  OpenEndfLogicalErrorIf(file.fail(),
                         "Failed to open file \"" + file_name +
                           "\". "
                           "Either the file does not exist or you do not have read permissions.");

  file.close();
}

} // namespace openendf
