// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/nuclear_data/endf/evaluation.h"
#include "framework/nuclear_data/endf/endf_names.h"
#include <algorithm>
#include <stdexcept>

namespace openendf
{

std::string
Reaction::GetSummary() const
{
  return "<ENDF Reaction: MT=" + std::to_string(mt_) + ", " + ReactionName(mt_) + ">";
}

bool
File::HasReaction(int mt) const
{
  return std::any_of(reactions_.begin(),
                     reactions_.end(),
                     [mt](const Reaction& reaction) { return reaction.GetMT() == mt; });
}

const Reaction&
File::GetReaction(int mt) const
{
  for (const auto& reaction : reactions_)
    if (reaction.GetMT() == mt)
      return reaction;

  throw std::out_of_range("File MF=" + std::to_string(mf_) + " has no reaction MT=" +
                          std::to_string(mt) + ".");
}

void
File::AddReaction(Reaction reaction)
{
  OpenEndfInvalidArgumentIf(HasReaction(reaction.GetMT()),
                            "File MF=" + std::to_string(mf_) + " already holds MT=" +
                              std::to_string(reaction.GetMT()) + ".");
  reactions_.push_back(std::move(reaction));
}

std::string
File::GetSummary() const
{
  return "<ENDF File " + std::to_string(mf_) + ": " + FileDescription(mf_) + ">";
}

Evaluation::Evaluation(std::string tape_id,
                       DescriptiveData descriptive_data,
                       Directory directory,
                       std::vector<File> files)
  : tape_id_(std::move(tape_id)),
    descriptive_data_(std::move(descriptive_data)),
    directory_(std::move(directory)),
    files_(std::move(files))
{
  for (size_t i = 0; i < files_.size(); ++i)
    for (size_t j = i + 1; j < files_.size(); ++j)
      OpenEndfInvalidArgumentIf(files_[i].GetMF() == files_[j].GetMF(),
                                "File MF=" + std::to_string(files_[i].GetMF()) +
                                  " appears more than once.");
}

bool
Evaluation::HasFile(int mf) const
{
  return std::any_of(
    files_.begin(), files_.end(), [mf](const File& file) { return file.GetMF() == mf; });
}

const File&
Evaluation::GetFile(int mf) const
{
  for (const auto& file : files_)
    if (file.GetMF() == mf)
      return file;

  throw std::out_of_range("Evaluation has no file MF=" + std::to_string(mf) + ".");
}

bool
Evaluation::HasReaction(int mf, int mt) const
{
  return HasFile(mf) and GetFile(mf).HasReaction(mt);
}

const Reaction&
Evaluation::GetReaction(int mf, int mt) const
{
  return GetFile(mf).GetReaction(mt);
}

const Reaction*
Evaluation::FindReaction(int mt) const
{
  for (const auto& file : files_)
    for (const auto& reaction : file.GetReactions())
      if (reaction.GetMT() == mt)
        return &reaction;
  return nullptr;
}

std::string
Evaluation::GetLibraryName() const
{
  return LibraryName(descriptive_data_.nlib);
}

std::string
Evaluation::GetSummary() const
{
  return "<" + GetLibraryName() + " Evaluation: " + std::to_string(descriptive_data_.za) + ">";
}

} // namespace openendf
