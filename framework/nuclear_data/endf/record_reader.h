// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "framework/nuclear_data/endf/records.h"
#include <cstddef>
#include <istream>
#include <string>

namespace openendf
{

/// Number of columns in a card image.
constexpr size_t ENDF_LINE_WIDTH = 80;
/// Number of columns holding the six data fields.
constexpr size_t ENDF_DATA_WIDTH = 66;

/**
 * Sequential reader of ENDF-6 card images.
 *
 * The reader owns the only cursor into the tape. Every Read* method consumes exactly the lines
 * of one record shape:
 *  - TEXT, CONT, HEAD: one line;
 *  - LIST: one control line plus ceil(NPL/6) lines of values;
 *  - TAB1: one control line plus ceil(NR/3) region lines plus ceil(NP/3) point lines.
 *
 * Continuation lines of a LIST or TAB1 record must belong to the section of the record. Running
 * into the end of the stream, or into the SEND record of the section, before all the lines a
 * record announces have been read raises UnexpectedEndOfStreamError.
 */
class RecordReader
{
public:
  explicit RecordReader(std::istream& stream);

  RecordReader(const RecordReader&) = delete;
  RecordReader& operator=(const RecordReader&) = delete;

  /// Reads a TEXT record.
  TextRecord ReadText();

  /**
   * Reads a CONT record.
   *
   * \param skip_c1_c2 Leaves C1 and C2 undecoded. Used for directory lines, where the two
   *        floating fields are reserved.
   */
  ControlRecord ReadControl(bool skip_c1_c2 = false);

  /// Reads a HEAD record.
  HeadRecord ReadHead();

  /// Reads a LIST record. The number of values is the N1 field of its control line.
  ListRecord ReadList();

  /// Reads a TAB1 record. See ReadTabulatedFunction().
  Tab1Record ReadTab1();

  /**
   * Returns the data columns of the next line of MF=1/MT=451 verbatim.
   *
   * \throws UnexpectedEndOfStreamError if the section ends first.
   */
  std::string ReadDescriptionLine();

  /// Consumes one SEND record.
  void ReadSectionEnd();

  /// Consumes lines up to and including the SEND record of the current section.
  void SkipSection();

  /**
   * Consumes lines until the next line is the first line of section (mf, mt) of material mat.
   * Intervening sections and FEND records are discarded.
   *
   * \throws UnexpectedRecordError if a record of another material (including MEND, MAT=0) is
   *         reached first.
   * \throws UnexpectedEndOfStreamError if the stream ends first.
   */
  void SeekSection(int mat, int mf, int mt);

  /// Tail of the next line, without consuming it.
  RecordTail PeekTail();

  /// True when no lines remain.
  bool AtEnd();

  /// Number of lines consumed so far, which is also the 1-based number of the last line read.
  size_t GetLineNumber() const { return line_number_; }

  /**
   * Consumes the next line as a continuation of a multi-line record whose first line carried
   * `owner`. The returned reference is valid until the next read.
   */
  const std::string& ReadContinuationLine(const RecordTail& owner, const std::string& expected);

  /// Decodes floating slot `index` (0-5) of the last consumed line.
  double GetFloatField(size_t index) const;

  /// Decodes integer slot `index` (0-5) of the last consumed line.
  int GetIntegerField(size_t index) const;

private:
  /// Loads the next physical line into the look-ahead buffer. Returns false at end of stream.
  bool FillLookAhead();

  /// Consumes the next line. `expected` names the record shape for error messages.
  const std::string& ReadLine(const std::string& expected);

  /// Decodes columns [66,80) of a line.
  RecordTail DecodeTail(const std::string& line, size_t line_number) const;

  std::istream& stream_;
  std::string look_ahead_;
  bool has_look_ahead_;
  std::string line_;
  size_t line_number_;
};

} // namespace openendf
