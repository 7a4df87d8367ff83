
#include "main.hpp"
#include "acs_artifact.hpp"
#include "acs_boards.hpp"
#include "acs_catalog.hpp"
#include "acs_compiler.hpp"
#include "acs_http.hpp"
#include "acs_installer.hpp"
#include "acs_process.hpp"
#include "acs_service.hpp"
#include "acs_slots.hpp"
#include "utils.hpp"
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>
#include <wx/fileconf.h>
#include <wx/filename.h>

using json = nlohmann::json;

static const wxCmdLineEntryDesc g_cmdLineDesc[] = {
    // --verbose
    {wxCMD_LINE_SWITCH,
     nullptr,
     "verbose",
     "generate verbose log messages",
     wxCMD_LINE_VAL_NONE,
     0},

    // --debug
    {wxCMD_LINE_SWITCH,
     nullptr,
     "debug",
     "enable debug logging",
     wxCMD_LINE_VAL_NONE,
     0},

    // --config FILE
    {wxCMD_LINE_OPTION,
     nullptr,
     "config",
     "configuration file (default acs.ini)",
     wxCMD_LINE_VAL_STRING,
     0},

    // --board FQBN (install)
    {wxCMD_LINE_OPTION,
     nullptr,
     "board",
     "board the libraries are installed for, e.g. arduino:avr:uno",
     wxCMD_LINE_VAL_STRING,
     0},

    // compile | install | refresh
    {wxCMD_LINE_PARAM,
     nullptr,
     nullptr,
     "command: compile REQUEST.json... | install LIB... | refresh",
     wxCMD_LINE_VAL_STRING,
     wxCMD_LINE_PARAM_MULTIPLE},

    wxCMD_LINE_DESC_END};

void ArduinoCompileServerApp::OnInitCmdLine(wxCmdLineParser &parser) {
  wxAppConsole::OnInitCmdLine(parser);

  parser.SetDesc(g_cmdLineDesc);
  parser.SetSwitchChars(wxT("-")); // so that both -x and --xxx work
}

bool ArduinoCompileServerApp::OnCmdLineParsed(wxCmdLineParser &parser) {
  bool hasDebug = parser.Found(wxT("debug"));
  bool hasVerbose = parser.Found(wxT("verbose"));

  g_verboseLogging = hasVerbose;
  g_debugLogging = hasDebug || hasVerbose;

  parser.Found(wxT("config"), &m_configPath);
  parser.Found(wxT("board"), &m_board);

  m_command = parser.GetParam(0);
  for (size_t i = 1; i < parser.GetParamCount(); i++) {
    m_args.Add(parser.GetParam(i));
  }

  if (m_command != wxT("compile") && m_command != wxT("install") && m_command != wxT("refresh")) {
    wxLogError(wxT("Unknown command '%s'"), m_command);
    parser.Usage();
    return false;
  }

  if (m_command != wxT("refresh") && m_args.IsEmpty()) {
    wxLogError(wxT("Command '%s' needs at least one argument"), m_command);
    parser.Usage();
    return false;
  }

  return wxAppConsole::OnCmdLineParsed(parser);
}

bool ArduinoCompileServerApp::OnInit() {
  if (!wxAppConsole::OnInit()) {
    return false;
  }

  wxLog::SetActiveTarget(new wxLogStderr());
  if (g_debugLogging) {
    wxLog::SetVerbose(true);
    APP_DEBUG_LOG("Debug mode enabled");
  }

  return LoadSettings();
}

bool ArduinoCompileServerApp::LoadSettings() {
  wxFileName fn(m_configPath);
  fn.MakeAbsolute();

  const bool exists = fn.FileExists();

  wxFileConfig cfg(wxEmptyString, wxEmptyString, fn.GetFullPath(), wxEmptyString, wxCONFIG_USE_LOCAL_FILE);
  m_settings.Load(&cfg);

  // first run: leave a config with every key for the operator to edit
  if (!exists) {
    wxLogMessage(wxT("Config %s not found, writing defaults"), fn.GetFullPath());
    m_settings.Save(&cfg);
  }

  APP_DEBUG_LOG("Libraries: %s, slots: %s x%d, toolchain: %s",
                wxToStd(m_settings.librariesDir).c_str(),
                wxToStd(m_settings.slotsDir).c_str(),
                m_settings.maxConcurrentTasks,
                wxToStd(m_settings.toolchainCommand).c_str());
  return true;
}

int ArduinoCompileServerApp::RunRefresh(ArduinoLibraryCatalog &catalog) {
  ArduinoBuildError err;
  if (!catalog.Refresh(&err)) {
    wxLogError(wxT("Library index refresh failed: %s"), wxString::FromUTF8(err.message));
    return 1;
  }

  wxPrintf(wxT("%d libraries in index\n"), (int)catalog.GetLibraryCount());
  return 0;
}

int ArduinoCompileServerApp::RunInstall(ArduinoLibraryCatalog &catalog, ArduinoDependencyInstaller &installer, const ArduinoBoardRegistry &boards) {
  ArduinoBuildError err;

  std::vector<std::string> texts;
  for (const auto &a : m_args) {
    texts.push_back(wxToStd(a));
  }

  std::vector<ArduinoLibraryRequest> requests;
  if (!ParseLibraryRequests(texts, requests, &err)) {
    wxLogError(wxT("%s"), wxString::FromUTF8(err.message));
    return 2;
  }

  ArduinoInstallOptions options;
  if (!m_board.IsEmpty()) {
    const ArduinoBoardProfile *b = boards.FindByFqbn(wxToStd(m_board));
    if (!b) {
      wxLogError(wxT("Unsupported board '%s'"), m_board);
      return 2;
    }
    options.targetBoard = b->board;
  }

  if (!catalog.Refresh(&err) && catalog.GetLibraryCount() == 0) {
    wxLogError(wxT("Library index not available: %s"), wxString::FromUTF8(err.message));
    return 1;
  }
  err.Clear();

  ArduinoResolvedMap resolved;
  if (!installer.Install(requests, options, resolved, &err)) {
    wxLogError(wxT("Install failed (%s): %s"), BuildErrorKindName(err.kind), wxString::FromUTF8(err.message));
    return 1;
  }

  json j = json::object();
  for (const auto &kv : resolved) {
    json boardsJson = json::array();
    for (const auto &pa : kv.second.perArchitecture) {
      boardsJson.push_back(pa.first);
    }
    j[kv.first] = {{"version", kv.second.version}, {"boards", boardsJson}};
  }
  wxPrintf(wxT("%s\n"), wxString::FromUTF8(j.dump()));
  return 0;
}

int ArduinoCompileServerApp::RunCompile(ArduinoLibraryCatalog &catalog, ArduinoCompileService &service) {
  ArduinoBuildError err;
  if (!catalog.Refresh(&err)) {
    wxLogWarning(wxT("Library index not refreshed: %s"), wxString::FromUTF8(err.message));
  }

  ArduinoCatalogRefresher refresher(catalog, m_settings.indexRefreshInterval);
  refresher.Start();

  std::mutex outMtx;
  std::vector<int> statuses(m_args.size(), 0);
  std::vector<std::thread> workers;

  for (size_t i = 0; i < m_args.size(); i++) {
    std::string path = wxToStd(m_args[i]);

    workers.emplace_back([&, i, path]() {
      std::string request;
      std::string response;
      int status = 0;

      if (!LoadFileToString(path, request)) {
        ArduinoBuildError readErr;
        SetBuildError(&readErr, ArduinoBuildErrorKind::IoError, "Cannot read " + path);
        status = BuildErrorHttpStatus(readErr.kind);
        response = ArduinoCompileService::ErrorToJson(readErr);
      } else {
        response = service.HandleRequest(request, status);
      }

      json line;
      line["request"] = path;
      line["status"] = status;
      line["response"] = json::parse(response);

      std::lock_guard<std::mutex> lock(outMtx);
      statuses[i] = status;
      wxPrintf(wxT("%s\n"), wxString::FromUTF8(line.dump()));
      fflush(stdout);
    });
  }

  for (auto &w : workers) {
    w.join();
  }
  wxLog::FlushActive();

  refresher.Stop();

  for (int s : statuses) {
    if (s != 200) {
      return 1;
    }
  }
  return 0;
}

int ArduinoCompileServerApp::OnRun() {
  ArduinoBoardRegistry boards;

  ArduinoCurlHttpClient http(wxToStd(m_settings.probeUrl), m_settings.connectTimeout, m_settings.requestTimeout);
  ArduinoPosixProcessRunner runner;

  ArduinoLibraryCatalog catalog(&http, wxToStd(m_settings.indexUrl));

  if (m_command == wxT("refresh")) {
    return RunRefresh(catalog);
  }

  ArduinoArtifactCache cache(wxToStd(m_settings.librariesDir), (size_t)m_settings.maxLibraryCaches, m_settings.libraryCacheDuration);

  ArduinoToolchainOptions libraryToolchain;
  libraryToolchain.command = wxToStd(m_settings.toolchainCommand);
  libraryToolchain.threads = m_settings.threadsPerCompile;
  libraryToolchain.timeoutSec = m_settings.libraryCompileTimeout;

  ArduinoDependencyInstaller installer(catalog, cache, http, runner, boards, libraryToolchain);

  if (m_command == wxT("install")) {
    return RunInstall(catalog, installer, boards);
  }

  ArduinoBuildSlotPool pool(wxToStd(m_settings.slotsDir), m_settings.maxConcurrentTasks, boards);
  ArduinoBuildError err;
  if (!pool.Provision(&err)) {
    wxLogError(wxT("%s"), wxString::FromUTF8(err.message));
    return 1;
  }

  ArduinoToolchainOptions sketchToolchain = libraryToolchain;
  sketchToolchain.timeoutSec = m_settings.compileTimeout;

  ArduinoSketchCompiler compiler(runner, cache, sketchToolchain);
  ArduinoCompileService service(boards, installer, pool, compiler, (size_t)m_settings.maxCodeCaches, m_settings.codeCacheDuration);

  return RunCompile(catalog, service);
}

wxIMPLEMENT_APP_NO_MAIN(ArduinoCompileServerApp);

int main(int argc, char **argv) {
  return wxEntry(argc, argv);
}
