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

#include "acs_installer.hpp"

#include "acs_archive.hpp"
#include "acs_artifact.hpp"
#include "acs_boards.hpp"
#include "acs_catalog.hpp"
#include "acs_http.hpp"
#include "acs_process.hpp"
#include "acs_resolver.hpp"
#include "acs_retry.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <mutex>

namespace fs = std::filesystem;

std::string LinkNameForLibrary(const std::string &name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    unsigned char uc = static_cast<unsigned char>(c);
    out.push_back(std::isalnum(uc) ? c : '_');
  }
  return out;
}

ArduinoDependencyInstaller::ArduinoDependencyInstaller(ArduinoLibraryCatalog &catalog,
                                                       ArduinoArtifactCache &cache,
                                                       ArduinoHttpClient &http,
                                                       ArduinoProcessRunner &runner,
                                                       const ArduinoBoardRegistry &boards,
                                                       const ArduinoToolchainOptions &toolchain)
    : m_catalog(catalog), m_cache(cache), m_http(http), m_runner(runner), m_boards(boards), m_toolchain(toolchain) {
}

bool ArduinoDependencyInstaller::Install(const std::vector<ArduinoLibraryRequest> &requests,
                                         const ArduinoInstallOptions &options,
                                         ArduinoResolvedMap &out,
                                         ArduinoBuildError *err) {
  out.clear();

  for (const auto &r : requests) {
    if (!IsSafeLibraryName(r.name) || (r.HasVersion() && !IsSafeLibraryVersion(r.version))) {
      return SetBuildError(err, ArduinoBuildErrorKind::InvalidInput, "Invalid library request '" + r.ToString() + "'");
    }
  }

  if (requests.empty()) {
    return true;
  }

  ScopeTimer t("INSTALL: %zu libraries (board=%s)", requests.size(), options.targetBoard.c_str());

  if (!m_http.IsOnline()) {
    wxLogWarning(wxT("No internet connection, skipping library install"));
    if (err) {
      err->kind = ArduinoBuildErrorKind::OfflineSkip;
      err->message = "No internet connection, library install skipped.";
    }
    return true;
  }

  std::vector<std::string> stack;
  for (const auto &r : requests) {
    if (!InstallOne(r, options, stack, out, err)) {
      return false;
    }
  }
  return true;
}

bool ArduinoDependencyInstaller::InstallOne(const ArduinoLibraryRequest &request,
                                            const ArduinoInstallOptions &options,
                                            std::vector<std::string> &stack,
                                            ArduinoResolvedMap &out,
                                            ArduinoBuildError *err) {
  const std::string &name = request.name;

  if (std::find(stack.begin(), stack.end(), name) != stack.end()) {
    std::string chain;
    for (const auto &s : stack) {
      chain += s + " -> ";
    }
    chain += name;
    return SetBuildError(err, ArduinoBuildErrorKind::CyclicDependency, "Cyclic library dependency: " + chain);
  }

  // already handled in this install (shared dependency)
  if (out.count(name)) {
    return true;
  }

  std::string version;
  ArduinoVersionResolver resolver(m_catalog);
  if (!resolver.Resolve(request, version, err)) {
    return false;
  }

  if (m_cache.IsInstalled(name, version)) {
    ArduinoResolvedArtifact cached;
    ArduinoBuildError loadErr;
    if (m_cache.LoadManifest(name, version, cached, &loadErr)) {
      APP_DEBUG_LOG("INSTALL: %s@%s already installed", name.c_str(), version.c_str());
      out[name] = cached;
      return true;
    }
    wxLogWarning(wxT("Reinstalling %s@%s: %s"), wxString::FromUTF8(name), wxString::FromUTF8(version), wxString::FromUTF8(loadErr.message));
  }

  ArduinoCatalogEntry entry;
  if (!m_catalog.FindRelease(name, version, entry)) {
    return SetBuildError(err, ArduinoBuildErrorKind::NotFound, "Library " + name + " not found, with version " + version);
  }

  wxLogMessage(wxT("Installing library %s@%s"), wxString::FromUTF8(name), wxString::FromUTF8(version));

  std::string zipData;
  if (!m_http.Get(entry.downloadUrl, zipData, err)) {
    return false;
  }

  std::string rootFolder = entry.ArchiveBaseName();
  if (rootFolder.empty()) {
    rootFolder = name;
  }

  ArduinoLibraryArchive archive;
  if (!ReadLibraryArchive(zipData, rootFolder, archive, err)) {
    return false;
  }

  ArduinoLibraryProperties props;
  if (archive.hasProperties) {
    props = ParseLibraryProperties(archive.properties);
  }

  std::vector<std::string> depends = props.hasDepends ? props.depends : entry.dependsOn;
  std::vector<std::string> arches = props.hasArchitectures ? props.architectures : entry.architectures;
  if (arches.empty()) {
    arches.push_back("*");
  }

  // ---- dependencies first, depth-first in declaration order ----
  std::vector<std::string> depNames;
  stack.push_back(name);
  for (const auto &dep : depends) {
    ArduinoLibraryRequest depRequest;
    if (!ParseLibraryRequest(dep, depRequest, err) || !InstallOne(depRequest, options, stack, out, err)) {
      if (err && err->IsSet()) {
        err->message += " (required by " + name + "@" + version + ")";
      }
      stack.pop_back();
      return false;
    }
    depNames.push_back(depRequest.name);
  }
  stack.pop_back();

  ArduinoResolvedArtifact artifact;
  {
    ArduinoInstallLockGuard lock(m_cache, name + "@" + version);

    // another request may have finished it meanwhile
    if (m_cache.IsInstalled(name, version) && m_cache.LoadManifest(name, version, artifact, nullptr)) {
      out[name] = artifact;
      return true;
    }

    if (!BuildArtifact(entry, archive, depNames, arches, options, out, artifact, err)) {
      return false;
    }
  }

  out[name] = artifact;
  return true;
}

bool ArduinoDependencyInstaller::BuildArtifact(const ArduinoCatalogEntry &entry,
                                               const ArduinoLibraryArchive &archive,
                                               const std::vector<std::string> &depends,
                                               const std::vector<std::string> &arches,
                                               const ArduinoInstallOptions &options,
                                               const ArduinoResolvedMap &resolved,
                                               ArduinoResolvedArtifact &artifact,
                                               ArduinoBuildError *err) {
  ScopeTimer t("INSTALL: build %s@%s", entry.name.c_str(), entry.version.c_str());

  const std::string libDir = m_cache.LibraryDir(entry.name, entry.version);
  const std::string relDir = ArduinoArtifactCache::RelativeLibraryDir(entry.name, entry.version);
  const std::string linkName = LinkNameForLibrary(entry.name);

  std::error_code ec;
  fs::remove_all(fs::path(libDir) / "lib", ec);
  fs::remove_all(fs::path(libDir) / "build", ec);

  if (!WriteLibraryArchive(archive, libDir + "/lib/lib", err)) {
    return false;
  }

  std::vector<const ArduinoBoardProfile *> scope = m_boards.BoardsForArchitectures(arches);

  // flags inherited from dependencies, per board
  std::map<std::string, ArduinoArchitectureFlags> depFlags;
  for (const auto *b : scope) {
    ArduinoArchitectureFlags &f = depFlags[b->board];
    for (const auto &dep : depends) {
      auto it = resolved.find(dep);
      if (it == resolved.end() || !it->second.SupportsBoard(b->board)) {
        continue;
      }
      const ArduinoArchitectureFlags &df = it->second.perArchitecture.at(b->board);
      f.includeFlags += df.includeFlags;
      f.libraryDirs += df.libraryDirs;
    }
  }

  artifact = ArduinoResolvedArtifact{};
  artifact.name = entry.name;
  artifact.version = entry.version;
  artifact.installDir = libDir;
  artifact.arches = arches;

  const std::string ownInclude = "-I'" + relDir + "lib/lib/' ";

  if (archive.SourceCount() == 0) {
    // header only, nothing to build
    for (const auto *b : scope) {
      ArduinoArchitectureFlags &f = artifact.perArchitecture[b->board];
      f.includeFlags = ownInclude + depFlags[b->board].includeFlags;
      f.libraryDirs = depFlags[b->board].libraryDirs;
    }
  } else {
    std::map<std::string, std::string> depIncludes;
    std::vector<std::string> scopeBoards;
    for (const auto *b : scope) {
      depIncludes[b->board] = depFlags[b->board].includeFlags;
      scopeBoards.push_back(b->board);
    }

    if (!WriteBuildProject(libDir, scope, depIncludes, err)) {
      return false;
    }

    ArduinoNarrowingRetryPolicy policy(options.targetBoard);
    std::set<std::string> produced = policy.Run(scopeBoards, [&](const std::vector<std::string> &boards) {
      std::set<std::string> ok;
      for (const auto &board : boards) {
        if (BuildForBoard(libDir, board, linkName)) {
          ok.insert(board);
        }
      }
      return ok;
    });

    for (const auto *b : scope) {
      if (!produced.count(b->board)) {
        continue;
      }
      ArduinoArchitectureFlags &f = artifact.perArchitecture[b->board];
      f.includeFlags = ownInclude + depFlags[b->board].includeFlags;
      f.libraryDirs = "-L'" + relDir + "build/" + b->board + "/' -l" + linkName + " " + depFlags[b->board].libraryDirs;
    }

    if (produced.empty() && !scope.empty()) {
      // keep it out of the cache so the next request tries again
      wxLogWarning(wxT("Library %s@%s did not build for any board"),
                   wxString::FromUTF8(entry.name), wxString::FromUTF8(entry.version));
      return true;
    }
  }

  if (!m_cache.SaveManifest(artifact, err)) {
    return false;
  }

  wxLogMessage(wxT("Installed library %s@%s (%d boards)"),
               wxString::FromUTF8(entry.name), wxString::FromUTF8(entry.version), (int)artifact.perArchitecture.size());
  return true;
}

bool ArduinoDependencyInstaller::WriteBuildProject(const std::string &libDir,
                                                   const std::vector<const ArduinoBoardProfile *> &scope,
                                                   const std::map<std::string, std::string> &depIncludes,
                                                   ArduinoBuildError *err) {
  std::error_code ec;
  fs::create_directories(fs::path(libDir) / "src", ec);
  if (ec) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot create " + libDir + "/src: " + ec.message());
  }

  if (!SaveFileFromString(libDir + "/src/main.cpp", ACS_LIBRARY_STUB_MAIN)) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot write " + libDir + "/src/main.cpp");
  }

  std::string ini;
  ini += "[platformio]\n";
  ini += "src_dir = src\n";
  ini += "lib_dir = lib\n";

  for (const auto *b : scope) {
    auto it = depIncludes.find(b->board);
    std::string includes = (it != depIncludes.end()) ? it->second : std::string();

    ini += "\n[env:" + b->board + "]\n";
    ini += "platform = " + b->platform + "\n";
    ini += "board = " + b->board + "\n";
    ini += "framework = arduino\n";
    ini += "lib_deps = lib\n";
    ini += "build_flags = -w " + includes + "\n";
  }

  if (!SaveFileFromString(libDir + "/platformio.ini", ini)) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Cannot write " + libDir + "/platformio.ini");
  }
  return true;
}

bool ArduinoDependencyInstaller::BuildForBoard(const std::string &libDir, const std::string &board, const std::string &archiveName) {
  std::vector<std::string> argv = ToolchainRunArgv(m_toolchain.command, board, m_toolchain.threads);

  ArduinoProcessResult res;
  if (!m_runner.Run(argv, libDir, m_toolchain.timeoutSec, res)) {
    wxLogWarning(wxT("Cannot start %s"), wxString::FromUTF8(JoinCommandLine(argv)));
    return false;
  }

  if (res.timedOut) {
    wxLogWarning(wxT("Library build for %s timed out after %d s"), wxString::FromUTF8(board), m_toolchain.timeoutSec);
    return false;
  }

  if (!res.Succeeded()) {
    wxLogWarning(wxT("Library build for %s failed (exit %d): %s"),
                 wxString::FromUTF8(board), res.exitCode, wxString::FromUTF8(res.CombinedOutput()));
    return false;
  }

  // PlatformIO puts lib/lib into .pio/build/<env>/lib<hash>/liblib.a
  std::error_code ec;
  fs::path buildDir = fs::path(libDir) / ".pio" / "build" / board;
  fs::path found;
  fs::recursive_directory_iterator it(buildDir, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (it->path().filename() == "liblib.a" && it->is_regular_file(ec)) {
      found = it->path();
      break;
    }
  }

  if (found.empty()) {
    wxLogWarning(wxT("Library build for %s produced no static library"), wxString::FromUTF8(board));
    return false;
  }

  fs::path dest = fs::path(libDir) / "build" / board / ("lib" + archiveName + ".a");
  fs::create_directories(dest.parent_path(), ec);
  if (!ec) {
    fs::copy_file(found, dest, fs::copy_options::overwrite_existing, ec);
  }
  if (ec) {
    wxLogWarning(wxT("Cannot store %s: %s"), wxString::FromUTF8(dest.string()), wxString::FromUTF8(ec.message()));
    return false;
  }

  APP_DEBUG_LOG("INSTALL: %s -> %s", found.string().c_str(), dest.string().c_str());
  return true;
}
