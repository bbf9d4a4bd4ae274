// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace openendf
{

/// Columns [66,80) of a card image: material, file, reaction type and sequence number.
struct RecordTail
{
  int mat = 0;
  int mf = 0;
  int mt = 0;
  int ns = 0;

  /// SEND, FEND, MEND and TEND records all carry MT=0.
  bool IsSectionEnd() const { return mt == 0; }
};

/// One free-text line: 66 characters of text plus the tail.
struct TextRecord
{
  std::string text;
  RecordTail tail;
};

/**
 * Six numeric fields plus the tail. C1 and C2 are empty when the record was read with the
 * floating fields skipped (directory lines).
 */
struct ControlRecord
{
  std::optional<double> c1;
  std::optional<double> c2;
  int l1 = 0;
  int l2 = 0;
  int n1 = 0;
  int n2 = 0;
  RecordTail tail;

  double C1() const { return c1.value_or(0.0); }
  double C2() const { return c2.value_or(0.0); }
};

/// First record of every section. C1 holds ZA and C2 the atomic weight ratio.
struct HeadRecord
{
  int za = 0;
  double awr = 0.0;
  int l1 = 0;
  int l2 = 0;
  int n1 = 0;
  int n2 = 0;
  RecordTail tail;
};

/// Control record followed by NPL (= N1) floats packed six per line.
struct ListRecord
{
  ControlRecord control;
  std::vector<double> values;
};

/**
 * One-dimensional tabulated function y(x). The domain is split into NR interpolation regions,
 * region i ending at point index NBT[i] (1-based) and interpolated with law INT[i].
 */
struct Tab1Record
{
  ControlRecord control;
  std::vector<int> nbt;
  std::vector<int> interpolation;
  std::vector<double> x;
  std::vector<double> y;

  size_t GetNumRegions() const { return nbt.size(); }
  size_t GetNumPoints() const { return x.size(); }
};

} // namespace openendf
