// SPDX-FileCopyrightText: 2025 The OpenEndf Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <stdexcept>

#define OpenEndfInvalidArgumentIf(condition, message)                                              \
  if (condition)                                                                                   \
  throw std::invalid_argument(std::string(__PRETTY_FUNCTION__) + ": " + message)

#define OpenEndfLogicalErrorIf(condition, message)                                                 \
  if (condition)                                                                                   \
  throw std::logic_error(std::string(__PRETTY_FUNCTION__) + ": " + message)
