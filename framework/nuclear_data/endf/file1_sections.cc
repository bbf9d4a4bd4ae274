// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#include "framework/nuclear_data/endf/file1_sections.h"
#include "framework/nuclear_data/endf/section_dispatcher.h"
#include "framework/nuclear_data/endf/record_reader.h"
#include "framework/nuclear_data/endf/endf_exceptions.h"
#include "framework/logging/log.h"
#include "framework/runtime.h"

namespace openendf
{

namespace
{

[[noreturn]] void
ThrowBadRepresentation(int mt, int lnu, size_t line_number)
{
  throw MalformedFieldError("MT=" + std::to_string(mt) + " has unknown representation LNU=" +
                              std::to_string(lnu) + ".",
                            line_number);
}

} // namespace

std::shared_ptr<const SectionData>
ReadTotalNu(RecordReader& reader)
{
  auto data = std::make_shared<FissionNeutronYield>(reader.ReadHead());

  if (data->lnu == NU_POLYNOMIAL)
    data->coefficients = reader.ReadList().values;
  else if (data->lnu == NU_TABULATED)
    data->table = reader.ReadTab1();
  else
    ThrowBadRepresentation(452, data->lnu, reader.GetLineNumber());

  reader.ReadSectionEnd();
  return data;
}

std::shared_ptr<const SectionData>
ReadDelayedNu(RecordReader& reader)
{
  auto data = std::make_shared<DelayedNeutronYield>(reader.ReadHead());

  if (data->ldg != 0)
  {
    log.Log0Warning() << "MT=455 with energy-dependent decay constants (LDG=" << data->ldg
                      << ") is not decoded. Skipping its body.";
    reader.SkipSection();
    return data;
  }

  data->decay_constants = reader.ReadList().values;
  if (data->lnu == NU_POLYNOMIAL)
    data->coefficients = reader.ReadList().values;
  else if (data->lnu == NU_TABULATED)
    data->table = reader.ReadTab1();
  else
    ThrowBadRepresentation(455, data->lnu, reader.GetLineNumber());
  data->body_decoded = true;

  reader.ReadSectionEnd();
  return data;
}

std::shared_ptr<const SectionData>
ReadPromptNu(RecordReader& reader)
{
  auto data = std::make_shared<FissionNeutronYield>(reader.ReadHead());

  // Spontaneous fission carries a single multiplicity in a LIST record
  if (data->lnu == NU_POLYNOMIAL)
    data->coefficients = reader.ReadList().values;
  else if (data->lnu == NU_TABULATED)
    data->table = reader.ReadTab1();
  else
    ThrowBadRepresentation(456, data->lnu, reader.GetLineNumber());

  reader.ReadSectionEnd();
  return data;
}

std::shared_ptr<const SectionData>
ReadFissionEnergyRelease(RecordReader& reader)
{
  auto data = std::make_shared<FissionEnergyRelease>(reader.ReadHead());
  reader.SkipSection();
  return data;
}

std::shared_ptr<const SectionData>
ReadDelayedPhotons(RecordReader& reader)
{
  auto data = std::make_shared<DelayedPhotonData>(reader.ReadHead());
  reader.SkipSection();
  return data;
}

void
RegisterFile1Sections(SectionDispatcher& dispatcher)
{
  dispatcher.RegisterSection(1, 452, ReadTotalNu);
  dispatcher.RegisterSection(1, 455, ReadDelayedNu);
  dispatcher.RegisterSection(1, 456, ReadPromptNu);
  dispatcher.RegisterSection(1, 458, ReadFissionEnergyRelease);
  dispatcher.RegisterSection(1, 460, ReadDelayedPhotons);
}

} // namespace openendf
