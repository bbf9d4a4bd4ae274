// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/nuclear_data/endf/directory.h"
#include "framework/nuclear_data/endf/record_reader.h"
#include "framework/nuclear_data/endf/endf_exceptions.h"
#include "framework/logging/log.h"
#include "framework/runtime.h"
#include "caliper/cali.h"
#include <cmath>

namespace openendf
{

namespace
{

/// Columns [first, last) of a text record, or less if the text is shorter.
std::string
TextColumns(const std::string& text, size_t first, size_t last)
{
  if (first >= text.size())
    return {};
  return text.substr(first, last - first);
}

} // namespace

std::string
SeekDescriptiveData(RecordReader& reader)
{
  std::string tape_id;
  bool first = true;
  while (true)
  {
    const auto tail = reader.PeekTail();
    if (tail.mf == 1 and tail.mt == 451)
      return tape_id;

    const auto text = reader.ReadText();
    if (first)
      tape_id = text.text;
    first = false;
  }
}

DescriptiveData
ReadDescriptiveData(RecordReader& reader)
{
  CALI_CXX_MARK_SCOPE("ReadDescriptiveData");

  DescriptiveData data;

  const auto head = reader.ReadHead();
  data.mat = head.tail.mat;
  data.za = head.za;
  data.awr = head.awr;
  data.lrp = head.l1;
  data.lfi = head.l2;
  data.nlib = head.n1;
  data.nmod = head.n2;

  const auto cont1 = reader.ReadControl();
  data.elis = cont1.C1();
  data.sta = static_cast<int>(std::lround(cont1.C2()));
  data.lis = cont1.l1;
  data.liso = cont1.l2;
  data.nfor = cont1.n2;

  const auto cont2 = reader.ReadControl();
  data.awi = cont2.C1();
  data.emax = cont2.C2();
  data.lrel = cont2.l1;
  data.nsub = cont2.n1;
  data.nver = cont2.n2;

  const auto cont3 = reader.ReadControl();
  data.temp = cont3.C1();
  data.ldrv = cont3.l1;
  data.nwd = cont3.n1;
  data.nxc = cont3.n2;
  if (data.nwd < 3)
    throw MalformedFieldError("NWD=" + std::to_string(data.nwd) +
                                " is too small to hold the three header text records.",
                              reader.GetLineNumber());

  const auto text1 = reader.ReadText().text;
  data.zsymam = TextColumns(text1, 0, 11);
  data.alab = TextColumns(text1, 11, 22);
  data.edate = TextColumns(text1, 22, 32);
  data.auth = TextColumns(text1, 32, 66);

  const auto text2 = reader.ReadText().text;
  data.ref = TextColumns(text2, 1, 22);
  data.ddate = TextColumns(text2, 22, 32);
  data.rdate = TextColumns(text2, 33, 43);
  data.endate = TextColumns(text2, 55, 63);

  data.hsub = reader.ReadText().text;

  for (int i = 3; i < data.nwd; ++i)
    data.description.push_back(reader.ReadDescriptionLine());

  return data;
}

Directory
ReadDirectory(RecordReader& reader, int expected_entries)
{
  CALI_CXX_MARK_SCOPE("ReadDirectory");

  Directory directory;
  while (true)
  {
    if (reader.AtEnd())
      throw UnterminatedDirectoryError("Stream ended after " + std::to_string(directory.size()) +
                                         " directory entries without a SEND record.",
                                       reader.GetLineNumber() + 1);

    if (reader.PeekTail().IsSectionEnd())
    {
      reader.ReadSectionEnd();
      break;
    }

    const auto record = reader.ReadControl(/*skip_c1_c2=*/true);
    directory.push_back({record.l1, record.l2, record.n1, record.n2});
  }

  if (static_cast<int>(directory.size()) != expected_entries)
    log.Log0Warning() << "The directory lists " << directory.size() << " sections, NXC is "
                      << expected_entries << ".";

  return directory;
}

} // namespace openendf
