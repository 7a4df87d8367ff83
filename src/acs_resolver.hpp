/*
 * Arduino Compile Server
 * Copyright (c) 2025 Pavel Petržela
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include "acs_error.hpp"
#include "acs_library.hpp"
#include <string>
#include <vector>

class ArduinoLibraryCatalog;

class ArduinoVersionResolver {
public:
  explicit ArduinoVersionResolver(const ArduinoLibraryCatalog &catalog);

  // Explicit versions are returned as is, bare names get the newest release.
  bool Resolve(const ArduinoLibraryRequest &request, std::string &version, ArduinoBuildError *err) const;

  // Highest version; suffixes like "-beta" are ignored for ordering and the
  // first of equal versions wins. Returns the string as listed.
  static std::string SelectLatest(const std::vector<std::string> &versions);

private:
  const ArduinoLibraryCatalog &m_catalog;
};
