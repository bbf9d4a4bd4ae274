// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/nuclear_data/endf/tabulated_function.h"
#include "framework/nuclear_data/endf/record_reader.h"
#include "framework/nuclear_data/endf/endf_exceptions.h"
#include <algorithm>
#include <string>

namespace openendf
{

namespace
{

/// Number of (NBT, INT) or (x, y) pairs per line.
constexpr size_t PAIRS_PER_LINE = 3;

} // namespace

Tab1Record
ReadTabulatedFunction(RecordReader& reader)
{
  Tab1Record record;
  record.control = reader.ReadControl();

  const int nr = record.control.n1;
  const int np = record.control.n2;
  if (nr < 0 or np < 0)
    throw MalformedFieldError("TAB1 record announces NR=" + std::to_string(nr) +
                                " and NP=" + std::to_string(np) + ".",
                              reader.GetLineNumber());
  const auto num_regions = static_cast<size_t>(nr);
  const auto num_points = static_cast<size_t>(np);
  const size_t header_line = reader.GetLineNumber();

  // Interpolation regions
  while (record.nbt.size() < num_regions)
  {
    reader.ReadContinuationLine(record.control.tail, "TAB1 interpolation regions");
    const size_t to_read = std::min(PAIRS_PER_LINE, num_regions - record.nbt.size());
    for (size_t j = 0; j < to_read; ++j)
    {
      record.nbt.push_back(reader.GetIntegerField(2 * j));
      record.interpolation.push_back(reader.GetIntegerField(2 * j + 1));
    }
  }

  // Tabulated pairs
  while (record.x.size() < num_points)
  {
    reader.ReadContinuationLine(record.control.tail, "TAB1 points");
    const size_t to_read = std::min(PAIRS_PER_LINE, num_points - record.x.size());
    for (size_t j = 0; j < to_read; ++j)
    {
      record.x.push_back(reader.GetFloatField(2 * j));
      record.y.push_back(reader.GetFloatField(2 * j + 1));
    }
  }

  CheckTabulatedFunction(record, header_line);
  return record;
}

void
CheckTabulatedFunction(const Tab1Record& record, size_t line_number)
{
  const auto num_points = record.x.size();
  if (record.nbt.size() != record.interpolation.size() or num_points != record.y.size())
    throw MalformedFieldError("TAB1 record has mismatched region or point arrays.", line_number);

  if (record.nbt.empty())
    return;

  for (size_t i = 1; i < record.nbt.size(); ++i)
    if (record.nbt[i] <= record.nbt[i - 1])
      throw MalformedFieldError("TAB1 breakpoints are not strictly increasing (NBT(" +
                                  std::to_string(i) + ")=" + std::to_string(record.nbt[i - 1]) +
                                  ", NBT(" + std::to_string(i + 1) +
                                  ")=" + std::to_string(record.nbt[i]) + ").",
                                line_number);

  if (record.nbt.back() != static_cast<int>(num_points))
    throw MalformedFieldError("Last TAB1 breakpoint NBT=" + std::to_string(record.nbt.back()) +
                                " differs from NP=" + std::to_string(num_points) + ".",
                              line_number);
}

} // namespace openendf
