// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "framework/nuclear_data/endf/evaluation.h"
#include "framework/nuclear_data/endf/section_dispatcher.h"
#include <istream>
#include <set>
#include <string>

namespace openendf
{

/// Options controlling how an evaluation is read.
struct EvaluationReaderOptions
{
  /// Report every decoded section at the default log level.
  bool verbose = false;

  /// Sections to decode. Empty means every section with a registered parser.
  std::set<SectionKey> selected_sections;

  EvaluationReaderOptions() = default;
};

/**
 * Reads one ENDF-6 material into an Evaluation.
 *
 * The tape is read in a single pass: the tape identification record is skipped, MF=1/MT=451
 * gives the descriptive data and the directory, and the directory then drives the section
 * parsers of the dispatcher. Any decoding error aborts the read and no evaluation is returned.
 */
class EvaluationReader
{
public:
  /// Reader using the default section parsers.
  explicit EvaluationReader(EvaluationReaderOptions options = EvaluationReaderOptions());

  /// Reader using a custom table of section parsers.
  EvaluationReader(EvaluationReaderOptions options, SectionDispatcher dispatcher);

  /// Reads an evaluation from a stream positioned at the start of the tape.
  Evaluation Read(std::istream& stream) const;

  /**
   * Reads an evaluation from a file.
   *
   * \param file_name Path to the ENDF-6 tape.
   */
  Evaluation ReadFile(const std::string& file_name) const;

  const EvaluationReaderOptions& GetOptions() const { return options_; }

  const SectionDispatcher& GetDispatcher() const { return dispatcher_; }

private:
  EvaluationReaderOptions options_;
  SectionDispatcher dispatcher_;
};

} // namespace openendf
