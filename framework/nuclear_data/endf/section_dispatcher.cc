// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/nuclear_data/endf/section_dispatcher.h"
#include "framework/nuclear_data/endf/file1_sections.h"
#include "framework/nuclear_data/endf/record_reader.h"
#include "framework/nuclear_data/endf/endf_names.h"
#include "framework/logging/log.h"
#include "framework/runtime.h"
#include "caliper/cali.h"

namespace openendf
{

SectionDispatcher
SectionDispatcher::MakeDefault()
{
  SectionDispatcher dispatcher;
  RegisterFile1Sections(dispatcher);
  return dispatcher;
}

void
SectionDispatcher::RegisterSection(int mf, int mt, SectionParser parser)
{
  OpenEndfInvalidArgumentIf(not parser,
                            "Empty parser for MF=" + std::to_string(mf) +
                              " MT=" + std::to_string(mt) + ".");
  parsers_[{mf, mt}] = std::move(parser);
}

bool
SectionDispatcher::IsRegistered(int mf, int mt) const
{
  return parsers_.count({mf, mt}) > 0;
}

std::vector<SectionKey>
SectionDispatcher::GetRegisteredSections() const
{
  std::vector<SectionKey> keys;
  keys.reserve(parsers_.size());
  for (const auto& key_parser : parsers_)
    keys.push_back(key_parser.first);
  return keys;
}

std::vector<File>
SectionDispatcher::Dispatch(int mat,
                            const Directory& directory,
                            RecordReader& reader,
                            const std::set<SectionKey>& selected_sections,
                            bool verbose) const
{
  CALI_CXX_MARK_SCOPE("SectionDispatcher::Dispatch");

  std::vector<File> files;
  const auto find_or_add_file = [&files](int mf) -> File&
  {
    for (auto& file : files)
      if (file.GetMF() == mf)
        return file;
    log.Log0Verbose2() << "  File MF=" << mf << " " << FileDescription(mf);
    files.emplace_back(mf);
    return files.back();
  };

  for (size_t i = 1; i < directory.size(); ++i)
  {
    const auto& entry = directory[i];
    const SectionKey key{entry.mf, entry.mt};

    const auto it = parsers_.find(key);
    const bool selected = selected_sections.empty() or selected_sections.count(key) > 0;
    if (it == parsers_.end() or not selected)
    {
      log.Log0Verbose2() << "Skipping MF=" << entry.mf << " MT=" << entry.mt << " ("
                         << (it == parsers_.end() ? "no parser" : "not selected") << ")";
      continue;
    }

    log.Log(verbose ? Logger::LOG_0 : Logger::LOG_0VERBOSE_1)
      << "   MF=" << entry.mf << " MT=" << entry.mt << " " << ReactionName(entry.mt);

    reader.SeekSection(mat, entry.mf, entry.mt);
    auto data = it->second(reader);
    find_or_add_file(entry.mf).AddReaction(Reaction(entry.mt, std::move(data)));
  }

  return files;
}

} // namespace openendf
