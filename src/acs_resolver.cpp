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

#include "acs_resolver.hpp"

#include "acs_catalog.hpp"
#include "utils.hpp"

ArduinoVersionResolver::ArduinoVersionResolver(const ArduinoLibraryCatalog &catalog)
    : m_catalog(catalog) {
}

std::string ArduinoVersionResolver::SelectLatest(const std::vector<std::string> &versions) {
  if (versions.empty()) {
    return std::string();
  }

  size_t best = 0;
  std::string bestStripped = StripVersionSuffix(versions[0]);
  for (size_t i = 1; i < versions.size(); ++i) {
    std::string stripped = StripVersionSuffix(versions[i]);
    if (CompareVersions(stripped, bestStripped) > 0) {
      best = i;
      bestStripped = stripped;
    }
  }
  return versions[best];
}

bool ArduinoVersionResolver::Resolve(const ArduinoLibraryRequest &request, std::string &version, ArduinoBuildError *err) const {
  version.clear();

  if (request.HasVersion()) {
    version = request.version;
    return true;
  }

  std::vector<ArduinoCatalogEntry> releases;
  if (!m_catalog.GetReleases(request.name, releases)) {
    return SetBuildError(err, ArduinoBuildErrorKind::NotFound, "Library " + request.name + " not found");
  }

  std::vector<std::string> versions;
  versions.reserve(releases.size());
  for (const auto &r : releases) {
    versions.push_back(r.version);
  }

  version = SelectLatest(versions);
  APP_DEBUG_LOG("RESOLVE: %s -> %s (%zu releases)", request.name.c_str(), version.c_str(), versions.size());
  return true;
}
