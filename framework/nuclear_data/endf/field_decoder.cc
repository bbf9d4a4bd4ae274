// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/nuclear_data/endf/field_decoder.h"
#include "framework/nuclear_data/endf/endf_exceptions.h"
#include "framework/utils/utils.h"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

namespace openendf
{

namespace
{

bool
IsDigit(char c)
{
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool
IsSign(char c)
{
  return c == '+' or c == '-';
}

/// Advances pos past a run of digits and returns the run length.
size_t
ScanDigits(std::string_view text, size_t& pos)
{
  const size_t start = pos;
  while (pos < text.size() and IsDigit(text[pos]))
    ++pos;
  return pos - start;
}

[[noreturn]] void
ThrowMalformed(std::string_view slot, const std::string& expected)
{
  throw MalformedFieldError("Field \"" + std::string(slot) + "\" is not " + expected + ".");
}

} // namespace

int
DecodeInteger(std::string_view slot)
{
  const std::string_view text = StringViewTrim(slot);
  if (text.empty())
    return 0;

  size_t pos = IsSign(text.front()) ? 1 : 0;
  if (ScanDigits(text, pos) == 0 or pos != text.size())
    ThrowMalformed(slot, "an integer");

  errno = 0;
  const std::string literal(text);
  const long long value = std::strtoll(literal.c_str(), nullptr, 10);
  if (errno == ERANGE or value > std::numeric_limits<int>::max() or
      value < std::numeric_limits<int>::min())
    ThrowMalformed(slot, "an integer in range");

  return static_cast<int>(value);
}

std::optional<double>
DecodeFloatOrBlank(std::string_view slot)
{
  const std::string_view text = StringViewTrim(slot);
  if (text.empty())
    return std::nullopt;

  // Mantissa
  size_t pos = IsSign(text.front()) ? 1 : 0;
  size_t num_digits = ScanDigits(text, pos);
  if (pos < text.size() and text[pos] == '.')
  {
    ++pos;
    num_digits += ScanDigits(text, pos);
  }
  if (num_digits == 0)
    ThrowMalformed(slot, "a number");
  const size_t mantissa_end = pos;

  // Exponent, either explicit (E+05) or the ENDF suffix (+5)
  std::string literal(text.substr(0, mantissa_end));
  if (pos < text.size())
  {
    if (text[pos] == 'e' or text[pos] == 'E')
      ++pos;
    else if (not IsSign(text[pos]))
      ThrowMalformed(slot, "a number");

    const size_t exponent_start = pos;
    if (pos < text.size() and IsSign(text[pos]))
      ++pos;
    if (ScanDigits(text, pos) == 0 or pos != text.size())
      ThrowMalformed(slot, "a number");

    literal += 'e';
    literal += text.substr(exponent_start);
  }

  errno = 0;
  const double value = std::strtod(literal.c_str(), nullptr);
  if (errno == ERANGE and std::abs(value) > 1.0)
    ThrowMalformed(slot, "a representable number");

  return value;
}

double
DecodeFloat(std::string_view slot)
{
  return DecodeFloatOrBlank(slot).value_or(0.0);
}

} // namespace openendf
