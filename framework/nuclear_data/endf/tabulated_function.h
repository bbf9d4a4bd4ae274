// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "framework/nuclear_data/endf/records.h"

namespace openendf
{

class RecordReader;

/**
 * Reads a TAB1 record.
 *
 * The control line gives NR (N1) and NP (N2). It is followed by ceil(NR/3) lines holding the
 * (NBT, INT) pairs of the interpolation regions and ceil(NP/3) lines holding the (x, y) pairs,
 * three pairs per line. The last line of each block may be partially filled. NR = 0 and NP = 0
 * are legal.
 *
 * \throws MalformedFieldError if NR or NP is negative, or if the breakpoints are not strictly
 *         increasing or do not end at NP.
 * \throws UnexpectedEndOfStreamError if the record is cut short.
 */
Tab1Record ReadTabulatedFunction(RecordReader& reader);

/**
 * Checks the size and breakpoint invariants of a TAB1 record.
 *
 * \param line_number Line reported in the error.
 */
void CheckTabulatedFunction(const Tab1Record& record, size_t line_number);

} // namespace openendf
