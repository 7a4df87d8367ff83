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
#include "acs_ttlcache.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

#define ACS_MANIFEST_FILE_NAME "compiled_sources.json"

// On-disk library cache:
//
//   <root>/<name>@<version>/lib/lib/...          extracted sources
//   <root>/<name>@<version>/build/<board>/lib*.a static libraries
//   <root>/<name>@<version>/compiled_sources.json manifest
//
// Paths stored in manifests are relative to the cache root ("../Name@1.0/")
// so the tree can be moved. Entries are never evicted from disk; the
// existence cache in front of it only saves filesystem lookups.
class ArduinoArtifactCache {
public:
  ArduinoArtifactCache(const std::string &rootDir, size_t maxExistenceEntries, int existenceTtlSec);

  const std::string &GetRootDir() const { return m_rootDir; }

  std::string LibraryDir(const std::string &name, const std::string &version) const;
  std::string ManifestPath(const std::string &name, const std::string &version) const;

  // "../<name>@<version>/"
  static std::string RelativeLibraryDir(const std::string &name, const std::string &version);

  bool IsInstalled(const std::string &name, const std::string &version);

  bool LoadManifest(const std::string &name, const std::string &version, ArduinoResolvedArtifact &out, ArduinoBuildError *err);
  bool SaveManifest(const ArduinoResolvedArtifact &artifact, ArduinoBuildError *err);

  // Drops the in-memory existence entry only.
  void Forget(const std::string &name, const std::string &version);

  // Rewrites "../" prefixes of manifest paths to absolute paths under the root.
  std::string ExpandPaths(const std::string &flags) const;

  // Serializes installs of one name@version inside this process. The entry
  // is dropped again by ReleaseInstallLock() once nobody holds it.
  std::shared_ptr<std::mutex> InstallLock(const std::string &key);
  void ReleaseInstallLock(const std::string &key, std::shared_ptr<std::mutex> &held);
  size_t GetInstallLockCount() const;

private:
  std::string m_rootDir; // absolute, no trailing slash
  ArduinoTtlCache<std::string, bool> m_existence;

  mutable std::mutex m_locksMtx;
  std::map<std::string, std::shared_ptr<std::mutex>> m_installLocks;
};

// Manifest JSON <-> artifact. Board entries missing in "include" are not
// considered built.
std::string ManifestToJson(const ArduinoResolvedArtifact &artifact);
bool ManifestFromJson(const std::string &text, ArduinoResolvedArtifact &out, ArduinoBuildError *err);

// Holds the install lock of one name@version for the lifetime of the guard.
class ArduinoInstallLockGuard {
public:
  ArduinoInstallLockGuard(ArduinoArtifactCache &cache, const std::string &key)
      : m_cache(cache), m_key(key), m_mtx(cache.InstallLock(key)) {
    m_mtx->lock();
  }

  ~ArduinoInstallLockGuard() {
    m_mtx->unlock();
    m_cache.ReleaseInstallLock(m_key, m_mtx);
  }

  ArduinoInstallLockGuard(const ArduinoInstallLockGuard &) = delete;
  ArduinoInstallLockGuard &operator=(const ArduinoInstallLockGuard &) = delete;

private:
  ArduinoArtifactCache &m_cache;
  std::string m_key;
  std::shared_ptr<std::mutex> m_mtx;
};
