// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace openendf
{

/**
 * Base class for errors raised while decoding an ENDF tape. The line number is 1-based and is
 * zero when the error was raised outside of a line context (e.g. by the field decoder itself).
 */
class EndfError : public std::runtime_error
{
public:
  EndfError(const std::string& message, size_t line_number)
    : std::runtime_error(line_number > 0 ? "Line " + std::to_string(line_number) + ": " + message
                                         : message),
      message_(message),
      line_number_(line_number)
  {
  }

  /// Message without the location prefix.
  const std::string& GetMessage() const { return message_; }

  /// 1-based line number of the fault, zero if unknown.
  size_t GetLineNumber() const { return line_number_; }

private:
  std::string message_;
  size_t line_number_;
};

/// A fixed-column slot does not hold an accepted numeric shape.
class MalformedFieldError : public EndfError
{
public:
  explicit MalformedFieldError(const std::string& message, size_t line_number = 0)
    : EndfError(message, line_number)
  {
  }
};

/// Fewer lines remain than the record or section being read requires.
class UnexpectedEndOfStreamError : public EndfError
{
public:
  UnexpectedEndOfStreamError(const std::string& message, size_t line_number)
    : EndfError(message, line_number)
  {
  }
};

/// The MF1/MT451 directory never reached its terminating SEND record.
class UnterminatedDirectoryError : public EndfError
{
public:
  UnterminatedDirectoryError(const std::string& message, size_t line_number)
    : EndfError(message, line_number)
  {
  }
};

/// A record of one kind was required (e.g. SEND) and another was found.
class UnexpectedRecordError : public EndfError
{
public:
  UnexpectedRecordError(const std::string& message, size_t line_number)
    : EndfError(message, line_number)
  {
  }
};

} // namespace openendf
