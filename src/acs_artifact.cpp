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

#include "acs_artifact.hpp"

#include "utils.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string ManifestToJson(const ArduinoResolvedArtifact &artifact) {
  json j;
  j["include"] = json::object();
  j["dirs"] = json::object();
  for (const auto &kv : artifact.perArchitecture) {
    j["include"][kv.first] = kv.second.includeFlags;
    j["dirs"][kv.first] = kv.second.libraryDirs;
  }
  j["arches"] = artifact.arches;
  return j.dump(2);
}

bool ManifestFromJson(const std::string &text, ArduinoResolvedArtifact &out, ArduinoBuildError *err) {
  json j;
  try {
    j = json::parse(text);
  } catch (const std::exception &e) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, std::string("Invalid manifest: ") + e.what());
  }

  if (!j.is_object() || !j.contains("include") || !j["include"].is_object()) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Manifest has no 'include' object.");
  }

  out.perArchitecture.clear();
  out.arches.clear();

  for (auto it = j["include"].begin(); it != j["include"].end(); ++it) {
    if (!it.value().is_string()) {
      continue;
    }
    ArduinoArchitectureFlags flags;
    flags.includeFlags = it.value().get<std::string>();
    if (j.contains("dirs") && j["dirs"].is_object()) {
      flags.libraryDirs = j["dirs"].value(it.key(), "");
    }
    out.perArchitecture[it.key()] = flags;
  }

  if (j.contains("arches") && j["arches"].is_array()) {
    for (const auto &a : j["arches"]) {
      if (a.is_string()) {
        out.arches.push_back(a.get<std::string>());
      }
    }
  }

  return true;
}

ArduinoArtifactCache::ArduinoArtifactCache(const std::string &rootDir, size_t maxExistenceEntries, int existenceTtlSec)
    : m_existence(maxExistenceEntries, std::chrono::seconds(existenceTtlSec)) {
  std::error_code ec;
  fs::path root = fs::absolute(fs::path(rootDir), ec);
  if (ec) {
    root = fs::path(rootDir);
  }
  m_rootDir = root.lexically_normal().string();
  while (m_rootDir.size() > 1 && m_rootDir.back() == '/') {
    m_rootDir.pop_back();
  }
}

std::string ArduinoArtifactCache::LibraryDir(const std::string &name, const std::string &version) const {
  return m_rootDir + "/" + name + "@" + version;
}

std::string ArduinoArtifactCache::ManifestPath(const std::string &name, const std::string &version) const {
  return LibraryDir(name, version) + "/" ACS_MANIFEST_FILE_NAME;
}

std::string ArduinoArtifactCache::RelativeLibraryDir(const std::string &name, const std::string &version) {
  return "../" + name + "@" + version + "/";
}

bool ArduinoArtifactCache::IsInstalled(const std::string &name, const std::string &version) {
  const std::string key = name + "@" + version;
  if (m_existence.Contains(key)) {
    return true;
  }

  std::error_code ec;
  if (fs::is_regular_file(ManifestPath(name, version), ec)) {
    m_existence.Put(key, true);
    return true;
  }
  return false;
}

bool ArduinoArtifactCache::LoadManifest(const std::string &name, const std::string &version, ArduinoResolvedArtifact &out, ArduinoBuildError *err) {
  std::string text;
  std::string path = ManifestPath(name, version);
  if (!LoadFileToString(path, text)) {
    Forget(name, version);
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot read " + path);
  }

  if (!ManifestFromJson(text, out, err)) {
    Forget(name, version);
    return false;
  }

  out.name = name;
  out.version = version;
  out.installDir = LibraryDir(name, version);
  return true;
}

bool ArduinoArtifactCache::SaveManifest(const ArduinoResolvedArtifact &artifact, ArduinoBuildError *err) {
  std::string dir = LibraryDir(artifact.name, artifact.version);

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot create " + dir + ": " + ec.message());
  }

  std::string path = ManifestPath(artifact.name, artifact.version);
  if (!SaveFileAtomically(path, ManifestToJson(artifact))) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot write " + path);
  }

  m_existence.Put(artifact.Key(), true);
  return true;
}

void ArduinoArtifactCache::Forget(const std::string &name, const std::string &version) {
  m_existence.Erase(name + "@" + version);
}

std::string ArduinoArtifactCache::ExpandPaths(const std::string &flags) const {
  std::string out = flags;
  ReplaceAll(out, "../", m_rootDir + "/");
  return out;
}

std::shared_ptr<std::mutex> ArduinoArtifactCache::InstallLock(const std::string &key) {
  std::lock_guard<std::mutex> lock(m_locksMtx);
  auto &m = m_installLocks[key];
  if (!m) {
    m = std::make_shared<std::mutex>();
  }
  return m;
}

void ArduinoArtifactCache::ReleaseInstallLock(const std::string &key, std::shared_ptr<std::mutex> &held) {
  std::lock_guard<std::mutex> lock(m_locksMtx);
  held.reset();

  // copies are only made under m_locksMtx, so use_count() is exact here
  auto it = m_installLocks.find(key);
  if (it != m_installLocks.end() && it->second.use_count() == 1) {
    m_installLocks.erase(it);
  }
}

size_t ArduinoArtifactCache::GetInstallLockCount() const {
  std::lock_guard<std::mutex> lock(m_locksMtx);
  return m_installLocks.size();
}
