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

#include "acs_catalog.hpp"

#include "acs_http.hpp"
#include "utils.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string ArduinoCatalogEntry::ArchiveBaseName() const {
  std::string base = archiveFileName;
  if (hasSuffix(base, ".zip")) {
    base.erase(base.size() - 4);
  }
  return base;
}

static bool ParseCatalogEntry(const json &jl, ArduinoCatalogEntry &out) {
  if (!jl.is_object()) {
    return false;
  }

  out.name = jl.value("name", "");
  out.version = jl.value("version", "");
  if (out.name.empty() || out.version.empty()) {
    return false;
  }

  out.downloadUrl = jl.value("url", "");
  out.archiveFileName = jl.value("archiveFileName", "");

  // architectures[]
  if (jl.contains("architectures") && jl["architectures"].is_array()) {
    for (const auto &a : jl["architectures"]) {
      if (a.is_string()) {
        out.architectures.push_back(a.get<std::string>());
      }
    }
  }

  // ---- dependencies ----
  if (jl.contains("dependencies") && jl["dependencies"].is_array()) {
    for (const auto &dep : jl["dependencies"]) {
      if (dep.is_object() && dep.contains("name") && dep["name"].is_string()) {
        out.dependsOn.push_back(dep["name"].get<std::string>());
      }
    }
  }

  return true;
}

ArduinoLibraryCatalog::ArduinoLibraryCatalog(ArduinoHttpClient *http, const std::string &indexUrl)
    : m_http(http), m_indexUrl(indexUrl), m_snapshot(std::make_shared<const Snapshot>()) {
}

bool ArduinoLibraryCatalog::Refresh(ArduinoBuildError *err) {
  ScopeTimer t("CATALOG: Refresh()");

  if (!m_http) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "No HTTP client configured for the library index.");
  }

  if (!m_http->IsOnline()) {
    wxLogWarning(wxT("No internet connection, library index not refreshed."));
    return SetBuildError(err, ArduinoBuildErrorKind::OfflineSkip, "No internet connection.");
  }

  wxLogMessage(wxT("Updating library index..."));

  std::string body;
  ArduinoBuildError httpErr;
  if (!m_http->Get(m_indexUrl, body, &httpErr)) {
    wxLogWarning(wxT("Library index download failed: %s"), wxString::FromUTF8(httpErr.message));
    if (err) {
      *err = httpErr;
    }
    return false;
  }

  return LoadFromJson(body, err);
}

bool ArduinoLibraryCatalog::LoadFromJson(const std::string &jsonText, ArduinoBuildError *err) {
  json j;
  try {
    j = json::parse(jsonText);
  } catch (const std::exception &e) {
    wxLogWarning(wxT("Failed to parse library index JSON: %s"), wxString::FromUTF8(e.what()));
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, std::string("Invalid library index: ") + e.what());
  }

  if (!j.is_object() || !j.contains("libraries") || !j["libraries"].is_array()) {
    wxLogWarning(wxT("Library index JSON does not contain 'libraries' array."));
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Library index has no 'libraries' array.");
  }

  auto next = std::make_shared<Snapshot>();
  size_t releases = 0;

  for (const auto &jl : j["libraries"]) {
    ArduinoCatalogEntry entry;
    if (!ParseCatalogEntry(jl, entry)) {
      continue;
    }
    (*next)[entry.name].push_back(std::move(entry));
    ++releases;
  }

  {
    std::lock_guard<std::mutex> lock(m_snapshotMtx);
    m_snapshot = std::move(next);
  }

  APP_DEBUG_LOG("CATALOG: loaded %zu releases of %zu libraries", releases, GetLibraryCount());
  return true;
}

std::shared_ptr<const ArduinoLibraryCatalog::Snapshot> ArduinoLibraryCatalog::GetSnapshot() const {
  std::lock_guard<std::mutex> lock(m_snapshotMtx);
  return m_snapshot;
}

bool ArduinoLibraryCatalog::GetReleases(const std::string &name, std::vector<ArduinoCatalogEntry> &out) const {
  out.clear();
  auto snap = GetSnapshot();
  auto it = snap->find(name);
  if (it == snap->end() || it->second.empty()) {
    return false;
  }
  out = it->second;
  return true;
}

bool ArduinoLibraryCatalog::FindRelease(const std::string &name, const std::string &version, ArduinoCatalogEntry &out) const {
  auto snap = GetSnapshot();
  auto it = snap->find(name);
  if (it == snap->end()) {
    return false;
  }
  for (const auto &e : it->second) {
    if (e.version == version) {
      out = e;
      return true;
    }
  }
  return false;
}

size_t ArduinoLibraryCatalog::GetLibraryCount() const {
  return GetSnapshot()->size();
}

// ---------------------------------------------------------------------------

ArduinoCatalogRefresher::ArduinoCatalogRefresher(ArduinoLibraryCatalog &catalog, int intervalSec)
    : m_catalog(catalog), m_intervalSec(intervalSec) {
}

ArduinoCatalogRefresher::~ArduinoCatalogRefresher() {
  Stop();
}

void ArduinoCatalogRefresher::Start() {
  if (m_intervalSec <= 0) {
    APP_DEBUG_LOG("CATALOG: periodic refresh disabled");
    return;
  }
  if (m_thread.joinable()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(m_mtx);
    m_stop = false;
  }
  m_thread = std::thread([this]() { Loop(); });
}

void ArduinoCatalogRefresher::Stop() {
  {
    std::lock_guard<std::mutex> lock(m_mtx);
    m_stop = true;
  }
  m_cv.notify_all();
  if (m_thread.joinable()) {
    m_thread.join();
  }
}

void ArduinoCatalogRefresher::Loop() {
  std::unique_lock<std::mutex> lock(m_mtx);
  while (!m_stop) {
    if (m_cv.wait_for(lock, std::chrono::seconds(m_intervalSec), [this]() { return m_stop; })) {
      break;
    }

    lock.unlock();
    ArduinoBuildError err;
    if (!m_catalog.Refresh(&err)) {
      wxLogWarning(wxT("Periodic library index refresh failed: %s"), wxString::FromUTF8(err.message));
    }
    m_refreshCount++;
    lock.lock();
  }
}
