// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace openendf
{

/// Width of one numeric slot in columns [0,66) of a card image.
constexpr size_t ENDF_FIELD_WIDTH = 11;

/**
 * Decodes an integer slot. Surrounding blanks are ignored and a blank slot is zero.
 *
 * \throws MalformedFieldError if the slot is not `[+-]?digits` or does not fit an int.
 */
int DecodeInteger(std::string_view slot);

/**
 * Decodes a floating-point slot. Besides ordinary literals (`-2.5`, `1.0E-5`, `42`) the ENDF
 * form without exponent marker is accepted: `1.23456+5` is 1.23456e5 and `9.87-10` is
 * 9.87e-10. A blank slot is zero.
 *
 * Accepted shapes, after trimming blanks:
 * \verbatim
 * [+-]? (digits [. digits*] | . digits) ([eE] [+-]? digits | [+-] digits)?
 * \endverbatim
 *
 * \throws MalformedFieldError for any other content.
 */
double DecodeFloat(std::string_view slot);

/// Same as DecodeFloat() except that a blank slot yields an empty optional.
std::optional<double> DecodeFloatOrBlank(std::string_view slot);

} // namespace openendf
