// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

namespace openendf
{

class RecordReader;

/// Contents of the descriptive section (MF=1, MT=451) that precedes the directory.
struct DescriptiveData
{
  int mat = 0;

  // HEAD record
  int za = 0;       ///< 1000*Z + A
  double awr = 0.0; ///< Atomic weight ratio to the neutron
  int lrp = 0;      ///< Resonance parameter flag
  int lfi = 0;      ///< Fissile flag
  int nlib = 0;     ///< Library identifier
  int nmod = 0;     ///< Modification number

  // CONT record 1
  double elis = 0.0; ///< Excitation energy of the target
  int sta = 0;       ///< Target stability flag
  int lis = 0;       ///< State number of the target
  int liso = 0;      ///< Isomeric state number
  int nfor = 0;      ///< Library format

  // CONT record 2
  double awi = 0.0;  ///< Projectile mass ratio
  double emax = 0.0; ///< Upper energy limit of the evaluation
  int lrel = 0;      ///< Library release number
  int nsub = 0;      ///< Sub-library number
  int nver = 0;      ///< Library version number

  // CONT record 3
  double temp = 0.0; ///< Target temperature
  int ldrv = 0;      ///< Derived-evaluation flag
  int nwd = 0;       ///< Number of text records
  int nxc = 0;       ///< Number of directory entries

  // TEXT record 1
  std::string zsymam; ///< Character representation of the material
  std::string alab;   ///< Laboratory
  std::string edate;  ///< Evaluation date
  std::string auth;   ///< Author(s)

  // TEXT record 2
  std::string ref;    ///< Primary reference
  std::string ddate;  ///< Distribution date
  std::string rdate;  ///< Revision date
  std::string endate; ///< Master-file entry date

  // TEXT record 3
  std::string hsub; ///< Library/sub-library/version banner

  /// Remaining NWD - 3 free-text lines.
  std::vector<std::string> description;
};

/// One line of the MF=1/MT=451 directory.
struct DirectoryEntry
{
  int mf = 0;  ///< File number
  int mt = 0;  ///< Reaction type
  int nc = 0;  ///< Number of records in the section
  int mod = 0; ///< Modification number

  bool operator==(const DirectoryEntry& other) const
  {
    return mf == other.mf and mt == other.mt and nc == other.nc and mod == other.mod;
  }
};

/// Sections of an evaluation in physical order. The first entry is MF=1/MT=451 itself.
using Directory = std::vector<DirectoryEntry>;

/**
 * Advances the reader to the first line of MF=1/MT=451. Lines before it, normally the tape
 * identification (TPID) record, are consumed.
 *
 * \return The text of the first consumed line, or an empty string if there was none.
 */
std::string SeekDescriptiveData(RecordReader& reader);

/**
 * Reads the descriptive part of MF=1/MT=451: one HEAD, three CONT and three TEXT records
 * followed by NWD - 3 description lines.
 */
DescriptiveData ReadDescriptiveData(RecordReader& reader);

/**
 * Reads directory lines up to and including the SEND record that closes MF=1/MT=451.
 *
 * \param expected_entries The NXC count of the descriptive data. A mismatch is only reported.
 * \throws UnterminatedDirectoryError if the stream ends first.
 */
Directory ReadDirectory(RecordReader& reader, int expected_entries);

} // namespace openendf
