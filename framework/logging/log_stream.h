// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <iostream>
#include <sstream>
#include <string>

namespace openendf
{

/**
 * String stream that prefixes every line it collects with a header and flushes the lot to the
 * target stream when it goes out of scope.
 */
class LogStream : public std::stringstream
{
private:
  std::ostream* log_stream_;
  std::string log_header_;
  const bool dummy_;

public:
  LogStream(std::ostream* output_stream, std::string header, bool dummy_flag = false)
    : log_stream_(output_stream), log_header_(std::move(header)), dummy_(dummy_flag)
  {
  }
  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;

  ~LogStream() override;
};

/// Sink for messages below the active verbosity.
struct DummyStream : public std::ostream
{
  struct DummyStreamBuffer : std::streambuf
  {
    int overflow(int c) override { return c; };
  } buffer;

  DummyStream() : std::ostream(&buffer) {}
};

} // namespace openendf
