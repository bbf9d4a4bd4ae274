// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/nuclear_data/endf/record_reader.h"
#include "framework/nuclear_data/endf/field_decoder.h"
#include "framework/nuclear_data/endf/tabulated_function.h"
#include "framework/nuclear_data/endf/endf_exceptions.h"
#include "framework/logging/log.h"
#include "framework/runtime.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string_view>

namespace openendf
{

namespace
{

/// Number of LIST values per line.
constexpr size_t LIST_VALUES_PER_LINE = 6;

std::string
SectionLabel(const RecordTail& tail)
{
  return "MF=" + std::to_string(tail.mf) + " MT=" + std::to_string(tail.mt);
}

} // namespace

RecordReader::RecordReader(std::istream& stream)
  : stream_(stream), has_look_ahead_(false), line_number_(0)
{
}

bool
RecordReader::FillLookAhead()
{
  if (has_look_ahead_)
    return true;

  std::string raw;
  if (not std::getline(stream_, raw))
    return false;

  if (not raw.empty() and raw.back() == '\r')
    raw.pop_back();
  if (raw.size() < ENDF_LINE_WIDTH)
    raw.resize(ENDF_LINE_WIDTH, ' ');

  look_ahead_ = std::move(raw);
  has_look_ahead_ = true;
  return true;
}

const std::string&
RecordReader::ReadLine(const std::string& expected)
{
  if (not FillLookAhead())
    throw UnexpectedEndOfStreamError("Stream ended while reading " + expected + ".",
                                     line_number_ + 1);

  line_ = std::move(look_ahead_);
  has_look_ahead_ = false;
  ++line_number_;
  return line_;
}

bool
RecordReader::AtEnd()
{
  return not FillLookAhead();
}

RecordTail
RecordReader::DecodeTail(const std::string& line, size_t line_number) const
{
  const std::string_view view(line);
  try
  {
    RecordTail tail;
    tail.mat = DecodeInteger(view.substr(66, 4));
    tail.mf = DecodeInteger(view.substr(70, 2));
    tail.mt = DecodeInteger(view.substr(72, 3));
    tail.ns = DecodeInteger(view.substr(75, 5));
    return tail;
  }
  catch (const MalformedFieldError& err)
  {
    throw MalformedFieldError(err.GetMessage() + " (MAT/MF/MT/NS columns 67-80)", line_number);
  }
}

RecordTail
RecordReader::PeekTail()
{
  if (not FillLookAhead())
    throw UnexpectedEndOfStreamError("Stream ended where another record was expected.",
                                     line_number_ + 1);
  return DecodeTail(look_ahead_, line_number_ + 1);
}

double
RecordReader::GetFloatField(size_t index) const
{
  OpenEndfInvalidArgumentIf(index >= 6, "Field index " + std::to_string(index) + " out of range.");

  const auto slot = std::string_view(line_).substr(index * ENDF_FIELD_WIDTH, ENDF_FIELD_WIDTH);
  try
  {
    return DecodeFloat(slot);
  }
  catch (const MalformedFieldError& err)
  {
    throw MalformedFieldError(err.GetMessage() + " (field " + std::to_string(index + 1) + ")",
                              line_number_);
  }
}

int
RecordReader::GetIntegerField(size_t index) const
{
  OpenEndfInvalidArgumentIf(index >= 6, "Field index " + std::to_string(index) + " out of range.");

  const auto slot = std::string_view(line_).substr(index * ENDF_FIELD_WIDTH, ENDF_FIELD_WIDTH);
  try
  {
    return DecodeInteger(slot);
  }
  catch (const MalformedFieldError& err)
  {
    throw MalformedFieldError(err.GetMessage() + " (field " + std::to_string(index + 1) + ")",
                              line_number_);
  }
}

const std::string&
RecordReader::ReadContinuationLine(const RecordTail& owner, const std::string& expected)
{
  if (not owner.IsSectionEnd() and FillLookAhead())
  {
    const auto tail = DecodeTail(look_ahead_, line_number_ + 1);
    if (tail.IsSectionEnd())
      throw UnexpectedEndOfStreamError("Section " + SectionLabel(owner) + " ended while reading " +
                                         expected + ".",
                                       line_number_ + 1);
  }
  return ReadLine(expected);
}

TextRecord
RecordReader::ReadText()
{
  const auto& line = ReadLine("TEXT record");

  TextRecord record;
  record.text = line.substr(0, ENDF_DATA_WIDTH);
  record.tail = DecodeTail(line, line_number_);
  return record;
}

ControlRecord
RecordReader::ReadControl(bool skip_c1_c2)
{
  const auto& line = ReadLine("CONT record");

  ControlRecord record;
  if (not skip_c1_c2)
  {
    record.c1 = GetFloatField(0);
    record.c2 = GetFloatField(1);
  }
  record.l1 = GetIntegerField(2);
  record.l2 = GetIntegerField(3);
  record.n1 = GetIntegerField(4);
  record.n2 = GetIntegerField(5);
  record.tail = DecodeTail(line, line_number_);
  return record;
}

HeadRecord
RecordReader::ReadHead()
{
  const auto& line = ReadLine("HEAD record");

  HeadRecord record;
  const double za = GetFloatField(0);
  if (std::abs(za) > static_cast<double>(std::numeric_limits<int>::max()))
    throw MalformedFieldError("ZA=" + std::to_string(za) + " does not fit an integer (field 1)",
                              line_number_);
  record.za = static_cast<int>(std::lround(za));
  record.awr = GetFloatField(1);
  record.l1 = GetIntegerField(2);
  record.l2 = GetIntegerField(3);
  record.n1 = GetIntegerField(4);
  record.n2 = GetIntegerField(5);
  record.tail = DecodeTail(line, line_number_);
  return record;
}

ListRecord
RecordReader::ReadList()
{
  ListRecord record;
  record.control = ReadControl();

  const int npl = record.control.n1;
  if (npl < 0)
    throw MalformedFieldError("LIST record announces NPL=" + std::to_string(npl) + " values.",
                              line_number_);

  const auto num_values = static_cast<size_t>(npl);
  while (record.values.size() < num_values)
  {
    ReadContinuationLine(record.control.tail,
                         "LIST values " + std::to_string(record.values.size() + 1) + "-" +
                           std::to_string(num_values));
    const size_t to_read = std::min(LIST_VALUES_PER_LINE, num_values - record.values.size());
    for (size_t j = 0; j < to_read; ++j)
      record.values.push_back(GetFloatField(j));
  }

  return record;
}

Tab1Record
RecordReader::ReadTab1()
{
  return ReadTabulatedFunction(*this);
}

std::string
RecordReader::ReadDescriptionLine()
{
  RecordTail owner;
  owner.mf = 1;
  owner.mt = 451;
  return ReadContinuationLine(owner, "description line").substr(0, ENDF_DATA_WIDTH);
}

void
RecordReader::ReadSectionEnd()
{
  const auto& line = ReadLine("SEND record");
  const auto tail = DecodeTail(line, line_number_);
  if (not tail.IsSectionEnd())
    throw UnexpectedRecordError("Expected the SEND record closing the section, found a record "
                                "of " +
                                  SectionLabel(tail) + ".",
                                line_number_);
}

void
RecordReader::SkipSection()
{
  while (true)
  {
    const auto& line = ReadLine("SEND record");
    if (DecodeTail(line, line_number_).IsSectionEnd())
      return;
  }
}

void
RecordReader::SeekSection(int mat, int mf, int mt)
{
  const auto label = "Section MAT=" + std::to_string(mat) + " MF=" + std::to_string(mf) +
                     " MT=" + std::to_string(mt);
  const size_t start = line_number_;
  while (true)
  {
    if (AtEnd())
      throw UnexpectedEndOfStreamError(label + " listed in the directory was not found.",
                                       line_number_ + 1);

    const auto tail = PeekTail();
    if (tail.mat != mat)
      throw UnexpectedRecordError(label + " listed in the directory was not found before a " +
                                    "record of MAT=" + std::to_string(tail.mat) + ".",
                                  line_number_ + 1);
    if (tail.mf == mf and tail.mt == mt)
      break;
    ReadLine("section");
  }

  if (line_number_ > start)
    log.Log0Verbose2() << "Skipped lines " << start + 1 << "-" << line_number_
                       << " before MF=" << mf << " MT=" << mt;
}

} // namespace openendf
