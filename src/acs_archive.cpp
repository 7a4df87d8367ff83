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

#include "acs_archive.hpp"

#include "utils.hpp"
#include <filesystem>
#include <memory>
#include <wx/mstream.h>
#include <wx/zipstrm.h>

namespace fs = std::filesystem;

size_t ArduinoLibraryArchive::SourceCount() const {
  size_t n = 0;
  for (const auto &f : files) {
    std::string ext = fs::path(f.first).extension().string();
    if (!ext.empty()) {
      ext.erase(0, 1);
    }
    if (isSourceExt(ToLower(ext))) {
      n++;
    }
  }
  return n;
}

bool IsEscapingPath(const std::string &relPath) {
  if (relPath.empty() || relPath[0] == '/' || relPath[0] == '\\') {
    return true;
  }

  size_t start = 0;
  while (start <= relPath.size()) {
    size_t slash = relPath.find_first_of("/\\", start);
    std::string part = relPath.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    if (part == "..") {
      return true;
    }
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }
  return false;
}

std::string MapArchiveEntry(const std::string &entryName, const std::string &rootFolder) {
  std::string ext = fs::path(entryName).extension().string();
  if (ext.empty()) {
    return std::string();
  }
  ext = ToLower(ext.substr(1));
  if (!isSourceExt(ext) && !isHeaderExt(ext)) {
    return std::string();
  }

  const std::string srcPrefix = rootFolder + "/src/";
  const std::string rootPrefix = rootFolder + "/";

  if (hasPrefix(entryName, srcPrefix.c_str())) {
    return entryName.substr(srcPrefix.size());
  }

  if (hasPrefix(entryName, rootPrefix.c_str())) {
    std::string rest = entryName.substr(rootPrefix.size());
    if (rest.find('/') == std::string::npos) {
      return rest;
    }
  }

  return std::string();
}

static bool ReadZipEntry(wxZipInputStream &zip, std::string &out) {
  out.clear();
  char buf[16384];
  while (true) {
    zip.Read(buf, sizeof(buf));
    size_t n = zip.LastRead();
    if (n > 0) {
      out.append(buf, n);
    }
    if (n == 0 || zip.Eof()) {
      break;
    }
  }
  return zip.GetLastError() == wxSTREAM_NO_ERROR || zip.GetLastError() == wxSTREAM_EOF;
}

bool ReadLibraryArchive(const std::string &zipData,
                        const std::string &rootFolder,
                        ArduinoLibraryArchive &out,
                        ArduinoBuildError *err) {
  out = ArduinoLibraryArchive{};

  if (zipData.empty()) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Library archive is empty.");
  }

  wxMemoryInputStream mem(zipData.data(), zipData.size());
  wxZipInputStream zip(mem);

  const std::string propertiesName = rootFolder + "/library.properties";
  size_t entries = 0;

  std::unique_ptr<wxZipEntry> entry;
  while (entry.reset(zip.GetNextEntry()), entry) {
    entries++;
    if (entry->IsDir()) {
      continue;
    }

    std::string name = wxToStd(entry->GetName(wxPATH_UNIX));

    if (name == propertiesName) {
      if (!ReadZipEntry(zip, out.properties)) {
        return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot read " + name + " from library archive.");
      }
      out.hasProperties = true;
      continue;
    }

    std::string rel = MapArchiveEntry(name, rootFolder);
    if (rel.empty()) {
      continue;
    }

    if (IsEscapingPath(rel)) {
      return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Library archive entry escapes its root: " + name);
    }

    std::string content;
    if (!ReadZipEntry(zip, content)) {
      return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot read " + name + " from library archive.");
    }

    APP_TRACE_LOG("ARCHIVE: %s -> %s (%zu bytes)", name.c_str(), rel.c_str(), content.size());
    out.files.emplace_back(rel, std::move(content));
  }

  if (entries == 0) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Library archive is not a valid zip file.");
  }

  APP_DEBUG_LOG("ARCHIVE: %s: %zu entries, %zu files kept, properties=%d",
                rootFolder.c_str(), entries, out.files.size(), (int)out.hasProperties);
  return true;
}

bool WriteLibraryArchive(const ArduinoLibraryArchive &archive,
                         const std::string &destDir,
                         ArduinoBuildError *err) {
  std::error_code ec;
  fs::create_directories(destDir, ec);
  if (ec) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot create " + destDir + ": " + ec.message());
  }

  for (const auto &f : archive.files) {
    fs::path target = fs::path(destDir) / f.first;

    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    if (!SaveFileFromString(target.string(), f.second)) {
      return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot write " + target.string());
    }
  }
  return true;
}
