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
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

class ArduinoHttpClient;

struct ArduinoCatalogEntry {
  std::string name;
  std::string version;
  std::string downloadUrl;     // "url"
  std::string archiveFileName; // "archiveFileName", e.g. "Servo-1.2.1.zip"
  std::vector<std::string> dependsOn;
  std::vector<std::string> architectures;

  // "Servo-1.2.1.zip" -> "Servo-1.2.1"
  std::string ArchiveBaseName() const;
};

// Library index: name -> releases in index order. A snapshot is never
// modified, Refresh() swaps in a new one.
class ArduinoLibraryCatalog {
public:
  using Snapshot = std::unordered_map<std::string, std::vector<ArduinoCatalogEntry>>;

  ArduinoLibraryCatalog(ArduinoHttpClient *http, const std::string &indexUrl);

  // Downloads the index and replaces the snapshot. On failure the previous
  // snapshot stays in place.
  bool Refresh(ArduinoBuildError *err = nullptr);

  bool LoadFromJson(const std::string &jsonText, ArduinoBuildError *err = nullptr);

  std::shared_ptr<const Snapshot> GetSnapshot() const;

  bool GetReleases(const std::string &name, std::vector<ArduinoCatalogEntry> &out) const;
  bool FindRelease(const std::string &name, const std::string &version, ArduinoCatalogEntry &out) const;
  size_t GetLibraryCount() const;

private:
  ArduinoHttpClient *m_http;
  std::string m_indexUrl;

  mutable std::mutex m_snapshotMtx;
  std::shared_ptr<const Snapshot> m_snapshot;
};

// Calls ArduinoLibraryCatalog::Refresh() every intervalSec seconds on a
// background thread. intervalSec <= 0 disables it.
class ArduinoCatalogRefresher {
public:
  ArduinoCatalogRefresher(ArduinoLibraryCatalog &catalog, int intervalSec);
  ~ArduinoCatalogRefresher();

  ArduinoCatalogRefresher(const ArduinoCatalogRefresher &) = delete;
  ArduinoCatalogRefresher &operator=(const ArduinoCatalogRefresher &) = delete;

  void Start();
  void Stop();

  unsigned int GetRefreshCount() const { return m_refreshCount.load(); }

private:
  void Loop();

  ArduinoLibraryCatalog &m_catalog;
  int m_intervalSec;

  std::mutex m_mtx;
  std::condition_variable m_cv;
  bool m_stop = false;
  std::thread m_thread;
  std::atomic<unsigned int> m_refreshCount{0};
};
