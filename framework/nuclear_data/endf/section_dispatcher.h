// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "framework/nuclear_data/endf/evaluation.h"
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <utility>
#include <vector>

namespace openendf
{

class RecordReader;

/// (MF, MT) pair identifying a section.
using SectionKey = std::pair<int, int>;

/**
 * Table of section parsers keyed by (MF, MT).
 *
 * A parser is handed the reader positioned on the HEAD record of its section and must consume
 * the section up to and including its SEND record.
 */
class SectionDispatcher
{
public:
  using SectionParser = std::function<std::shared_ptr<const SectionData>(RecordReader&)>;

  /// Creates an empty table.
  SectionDispatcher() = default;

  /// Creates a table holding every section parser shipped with the library.
  static SectionDispatcher MakeDefault();

  /// Adds or replaces the parser of section (mf, mt).
  void RegisterSection(int mf, int mt, SectionParser parser);

  bool IsRegistered(int mf, int mt) const;

  /// Registered keys in ascending order.
  std::vector<SectionKey> GetRegisteredSections() const;

  /**
   * Decodes the sections listed in the directory.
   *
   * The first directory entry (MF=1/MT=451) is not dispatched. Entries without a parser, or not
   * in a non-empty `selected_sections`, are skipped; their lines are consumed while the reader
   * is positioned on the next decoded section.
   *
   * \param mat Material the directory belongs to. Sections are only looked up within it.
   * \param verbose Reports every decoded section at the default log level instead of
   *        verbosity 1.
   * \return Files in order of first appearance, reactions in directory order.
   */
  std::vector<File> Dispatch(int mat,
                             const Directory& directory,
                             RecordReader& reader,
                             const std::set<SectionKey>& selected_sections = {},
                             bool verbose = false) const;

private:
  std::map<SectionKey, SectionParser> parsers_;
};

} // namespace openendf
