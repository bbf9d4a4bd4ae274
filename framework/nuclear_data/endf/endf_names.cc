// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/nuclear_data/endf/endf_names.h"
#include <map>

namespace openendf
{

namespace
{

std::string
Lookup(const std::map<int, std::string>& table, int key, const std::string& fallback)
{
  const auto it = table.find(key);
  return it == table.end() ? fallback : it->second;
}

} // namespace

std::string
LibraryName(int nlib)
{
  static const std::map<int, std::string> libraries = {{0, "ENDF/B"},
                                                       {1, "ENDF/A"},
                                                       {2, "JEFF"},
                                                       {3, "EFF"},
                                                       {4, "ENDF/B High Energy"},
                                                       {5, "CENDL"},
                                                       {6, "JENDL"},
                                                       {31, "INDL/V"},
                                                       {32, "INDL/A"},
                                                       {33, "FENDL"},
                                                       {34, "IRDF"},
                                                       {35, "BROND"},
                                                       {36, "INGDB-90"},
                                                       {37, "FENDL/A"},
                                                       {41, "BROND"}};
  return Lookup(libraries, nlib, "Undetermined");
}

std::string
ReactionName(int mt)
{
  static const std::map<int, std::string> reactions = {{151, "Resonance Parameters"},
                                                       {451, "Descriptive Data"},
                                                       {452, "Total Neutrons per Fission"},
                                                       {455, "Delayed Neutron Data"},
                                                       {456, "Prompt Neutrons per Fission"},
                                                       {458, "Energy Release Due to Fission"},
                                                       {460, "Delayed Photon Data"}};
  return Lookup(reactions, mt, "Unknown");
}

std::string
FileDescription(int mf)
{
  static const std::map<int, std::string> files = {
    {1, "General information"},
    {2, "Resonance parameters"},
    {3, "Neutron cross sections"},
    {4, "Angular distributions of secondary particles"},
    {5, "Energy distributions of secondary particles"},
    {6, "Product energy-angle distributions"},
    {7, "Thermal neutron scattering law data"},
    {8, "Radioactive decay data"},
    {9, "Multiplicities for production of radioactive nuclides"},
    {10, "Cross sections for production of radioactive nuclides"}};
  return Lookup(files, mf, "Unknown");
}

} // namespace openendf
