// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/logging/log_stream.h"
#include "framework/logging/stringstream_color.h"

namespace openendf
{

LogStream::~LogStream()
{
  if (dummy_)
    return;

  const std::string content = this->str();
  if (content.empty())
    return;

  std::istringstream iss(content);
  std::string line, oline;
  while (std::getline(iss, line))
    oline += log_header_ + line + StringStreamColor(RESET) + '\n';

  if (not oline.empty())
    *log_stream_ << oline << std::flush;
}

} // namespace openendf
