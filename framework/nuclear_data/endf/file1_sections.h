// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "framework/nuclear_data/endf/evaluation.h"
#include <memory>
#include <optional>
#include <vector>

namespace openendf
{

class RecordReader;
class SectionDispatcher;

/// Values of the LNU flag of MT=452, 455 and 456.
enum NuRepresentation
{
  NU_POLYNOMIAL = 1, ///< Polynomial coefficients in energy (LIST)
  NU_TABULATED = 2   ///< Tabulated function of energy (TAB1)
};

/**
 * Neutrons per fission, MT=452 (total) or MT=456 (prompt).
 *
 * For LNU=1 the values of the LIST record are stored in `coefficients`: polynomial
 * coefficients for MT=452, the spontaneous-fission multiplicity for MT=456. For LNU=2 the TAB1
 * record is stored in `table`.
 */
struct FissionNeutronYield : public SectionData
{
  explicit FissionNeutronYield(const HeadRecord& head) : SectionData(head), lnu(head.l2) {}

  int lnu;
  std::vector<double> coefficients;
  std::optional<Tab1Record> table;
};

/**
 * Delayed neutrons per fission, MT=455.
 *
 * Only energy-independent decay constants (LDG=0) are decoded. For any other LDG the section
 * body is skipped and `body_decoded` is false.
 */
struct DelayedNeutronYield : public SectionData
{
  explicit DelayedNeutronYield(const HeadRecord& head)
    : SectionData(head), ldg(head.l1), lnu(head.l2)
  {
  }

  int ldg;
  int lnu;
  bool body_decoded = false;
  /// Decay constants of the precursor families.
  std::vector<double> decay_constants;
  /// Polynomial coefficients (LNU=1).
  std::vector<double> coefficients;
  /// Delayed multiplicity as a function of energy (LNU=2).
  std::optional<Tab1Record> table;
};

/// Components of energy release due to fission, MT=458. Only the HEAD record is decoded.
struct FissionEnergyRelease : public SectionData
{
  explicit FissionEnergyRelease(const HeadRecord& head)
    : SectionData(head), lfc(head.l2), nfc(head.n2)
  {
  }

  int lfc; ///< 0 for the thermal-point representation, 1 for tabulated components
  int nfc; ///< Number of tabulated components
};

/// Delayed photon data, MT=460. Only the HEAD record is decoded.
struct DelayedPhotonData : public SectionData
{
  explicit DelayedPhotonData(const HeadRecord& head)
    : SectionData(head), lo(head.l1), ng(head.n1)
  {
  }

  int lo; ///< 1 for discrete photons, 2 for a continuous spectrum
  int ng; ///< Number of discrete photons
};

/// Parses MT=452. The reader must be positioned on the HEAD record.
std::shared_ptr<const SectionData> ReadTotalNu(RecordReader& reader);

/// Parses MT=455. The reader must be positioned on the HEAD record.
std::shared_ptr<const SectionData> ReadDelayedNu(RecordReader& reader);

/// Parses MT=456. The reader must be positioned on the HEAD record.
std::shared_ptr<const SectionData> ReadPromptNu(RecordReader& reader);

/// Parses the HEAD record of MT=458 and skips the rest of the section.
std::shared_ptr<const SectionData> ReadFissionEnergyRelease(RecordReader& reader);

/// Parses the HEAD record of MT=460 and skips the rest of the section.
std::shared_ptr<const SectionData> ReadDelayedPhotons(RecordReader& reader);

/// Registers the MF=1 section parsers above.
void RegisterFile1Sections(SectionDispatcher& dispatcher);

} // namespace openendf
