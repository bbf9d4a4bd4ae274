// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <string>

namespace openendf
{

/// Library name for an NLIB identifier, "Undetermined" if unknown.
std::string LibraryName(int nlib);

/// Name of a reaction type, "Unknown" if the MT is not tabulated.
std::string ReactionName(int mt);

/// Content of a file number, "Unknown" outside 1-10.
std::string FileDescription(int mf);

} // namespace openendf
