// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "framework/nuclear_data/endf/directory.h"
#include "framework/nuclear_data/endf/records.h"
#include "framework/logging/log_exceptions.h"
#include <memory>
#include <string>
#include <vector>

namespace openendf
{

/// Decoded body of one section. Concrete types are declared next to their section parsers.
class SectionData
{
public:
  explicit SectionData(const HeadRecord& head) : head_(head) {}
  virtual ~SectionData() = default;

  /// HEAD record that opened the section.
  const HeadRecord& GetHead() const { return head_; }

private:
  HeadRecord head_;
};

/// One section (MT) of a file.
class Reaction
{
public:
  Reaction(int mt, std::shared_ptr<const SectionData> data) : mt_(mt), data_(std::move(data))
  {
    OpenEndfInvalidArgumentIf(not data_, "Reaction MT=" + std::to_string(mt) + " has no data.");
  }

  int GetMT() const { return mt_; }

  const SectionData& GetData() const { return *data_; }

  /// Short description such as "<ENDF Reaction: MT=452, Total Neutrons per Fission>".
  std::string GetSummary() const;

  /// Returns the data as the concrete type produced by the section parser.
  template <typename T>
  const T& GetDataAs() const
  {
    const auto* data = dynamic_cast<const T*>(data_.get());
    OpenEndfLogicalErrorIf(data == nullptr,
                           "Reaction MT=" + std::to_string(mt_) +
                             " does not hold the requested data type.");
    return *data;
  }

private:
  int mt_;
  std::shared_ptr<const SectionData> data_;
};

/// All decoded sections sharing a file number (MF).
class File
{
public:
  explicit File(int mf) : mf_(mf) {}

  int GetMF() const { return mf_; }

  /// Reactions in directory order.
  const std::vector<Reaction>& GetReactions() const { return reactions_; }

  bool HasReaction(int mt) const;

  /// \throws std::out_of_range if the file holds no section MT.
  const Reaction& GetReaction(int mt) const;

  /// Appends a reaction. MT values must be unique within a file.
  void AddReaction(Reaction reaction);

  /// Short description such as "<ENDF File 1: General information>".
  std::string GetSummary() const;

private:
  int mf_;
  std::vector<Reaction> reactions_;
};

/**
 * Read-only document decoded from one ENDF-6 material.
 *
 * An evaluation is only built once the whole tape has been read, so an instance never holds a
 * partially decoded material.
 */
class Evaluation
{
public:
  Evaluation(std::string tape_id,
             DescriptiveData descriptive_data,
             Directory directory,
             std::vector<File> files);

  /// Text of the tape identification record, empty if the tape had none.
  const std::string& GetTapeId() const { return tape_id_; }

  /// Header data of MF=1/MT=451.
  const DescriptiveData& GetDescriptiveData() const { return descriptive_data_; }

  /// Directory entries in tape order, including MF=1/MT=451.
  const Directory& GetDirectory() const { return directory_; }

  /// Decoded files in directory order.
  const std::vector<File>& GetFiles() const { return files_; }

  bool HasFile(int mf) const;

  /// \throws std::out_of_range if no section of file MF was decoded.
  const File& GetFile(int mf) const;

  bool HasReaction(int mf, int mt) const;

  /// \throws std::out_of_range if section (MF, MT) was not decoded.
  const Reaction& GetReaction(int mf, int mt) const;

  /// First decoded reaction with the given MT in any file, or nullptr.
  const Reaction* FindReaction(int mt) const;

  /// Material number.
  int GetMAT() const { return descriptive_data_.mat; }

  /// Name of the library given by NLIB.
  std::string GetLibraryName() const;

  /// Short description such as "<ENDF/B Evaluation: 92235>".
  std::string GetSummary() const;

private:
  std::string tape_id_;
  DescriptiveData descriptive_data_;
  Directory directory_;
  std::vector<File> files_;
};

} // namespace openendf
