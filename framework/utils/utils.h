// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <string_view>

namespace openendf
{

const std::string WHITESPACE = " \n\r\t\f\v";

/// Removes leading whitespace from a string.
std::string StringLTrim(const std::string& s);

/// Removes trailing whitespace from a string.
std::string StringRTrim(const std::string& s);

/// Removes leading and trailing whitespace from a string.
std::string StringTrim(const std::string& s);

/// Returns the view without leading and trailing whitespace.
std::string_view StringViewTrim(std::string_view s);

/// Checks whether the string holds nothing but whitespace.
bool IsBlank(std::string_view s);

/// Checks that the file exists and can be opened for reading.
void AssertReadableFile(const std::string& file_name);

} // namespace openendf
