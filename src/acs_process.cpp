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

#include "acs_process.hpp"

#include "utils.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

static std::atomic<unsigned int> g_execCounter{1};

std::string JoinCommandLine(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &a : argv) {
    if (!out.empty())
      out.push_back(' ');
    if (a.find_first_of(" \t\"'\\") != std::string::npos) {
      out += ShellQuote(a);
    } else {
      out += a;
    }
  }
  return out;
}

std::vector<std::string> ToolchainRunArgv(const std::string &command, const std::string &board, int threads) {
  std::vector<std::string> argv;
  std::istringstream in(command);
  std::string tok;
  while (in >> tok) {
    argv.push_back(tok);
  }
  if (argv.empty()) {
    argv.push_back("platformio");
  }
  argv.push_back("run");
  argv.push_back("-e");
  argv.push_back(board);
  argv.push_back("-j");
  argv.push_back(std::to_string(threads > 0 ? threads : 1));
  return argv;
}

static void ClosePipe(int fds[2]) {
  if (fds[0] >= 0)
    close(fds[0]);
  if (fds[1] >= 0)
    close(fds[1]);
  fds[0] = fds[1] = -1;
}

/**
 * Synchronous execution with separate stdout/stderr capture and a deadline.
 */
bool ArduinoPosixProcessRunner::Run(const std::vector<std::string> &argv,
                                    const std::string &workDir,
                                    int timeoutSec,
                                    ArduinoProcessResult &result) {
  result = ArduinoProcessResult{};

  unsigned int index = g_execCounter++;
  std::string cmdLine = JoinCommandLine(argv);
  ScopeTimer t("%04u RunProcess (%s)", index, cmdLine.c_str());

  APP_DEBUG_LOG("PROC: %04u EXEC (cwd=%s, timeout=%d): %s", index, workDir.c_str(), timeoutSec, cmdLine.c_str());

  if (argv.empty()) {
    wxLogWarning(wxT("PROC: %04u empty command line"), index);
    return false;
  }

  int outPipe[2] = {-1, -1};
  int errPipe[2] = {-1, -1};
  if (pipe2(outPipe, O_CLOEXEC) != 0 || pipe2(errPipe, O_CLOEXEC) != 0) {
    wxLogWarning(wxT("PROC: %04u pipe failed: %s"), index, wxString::FromUTF8(strerror(errno)));
    ClosePipe(outPipe);
    ClosePipe(errPipe);
    return false;
  }

  // everything the child touches is prepared before fork
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv) {
    cargv.push_back(const_cast<char *>(a.c_str()));
  }
  cargv.push_back(nullptr);
  const char *cwd = workDir.empty() ? nullptr : workDir.c_str();

  pid_t pid = fork();
  if (pid < 0) {
    wxLogWarning(wxT("PROC: %04u fork failed: %s"), index, wxString::FromUTF8(strerror(errno)));
    ClosePipe(outPipe);
    ClosePipe(errPipe);
    return false;
  }

  if (pid == 0) {
    setpgid(0, 0);
    if (cwd && chdir(cwd) != 0) {
      static const char msg[] = "cannot change working directory\n";
      (void)!write(errPipe[1], msg, sizeof(msg) - 1);
      _exit(127);
    }
    dup2(outPipe[1], STDOUT_FILENO);
    dup2(errPipe[1], STDERR_FILENO);
    int devNull = open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
      dup2(devNull, STDIN_FILENO);
    }
    execvp(cargv[0], cargv.data());
    static const char msg[] = "exec failed\n";
    (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
    _exit(127);
  }

  // parent
  setpgid(pid, pid);
  close(outPipe[1]);
  close(errPipe[1]);
  result.started = true;

  const bool hasDeadline = timeoutSec > 0;
  const auto deadline = Clock::now() + std::chrono::seconds(timeoutSec);

  struct pollfd fds[2];
  fds[0].fd = outPipe[0];
  fds[0].events = POLLIN;
  fds[1].fd = errPipe[0];
  fds[1].events = POLLIN;
  std::string *sinks[2] = {&result.stdOut, &result.stdErr};

  char buffer[4096];
  int openCount = 2;

  while (openCount > 0) {
    int waitMs = -1;
    if (hasDeadline && !result.timedOut) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
      if (left <= 0) {
        wxLogWarning(wxT("PROC: %04u deadline of %d s expired, killing process group %d"), index, timeoutSec, (int)pid);
        kill(-pid, SIGKILL);
        result.timedOut = true;
      } else {
        waitMs = (int)left;
      }
    }

    int rc = poll(fds, 2, waitMs);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      wxLogWarning(wxT("PROC: %04u poll failed: %s"), index, wxString::FromUTF8(strerror(errno)));
      kill(-pid, SIGKILL);
      break;
    }
    if (rc == 0) {
      continue; // deadline check at the top of the loop
    }

    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
        continue;
      }
      ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        sinks[i]->append(buffer, (size_t)n);
      } else if (n == 0 || errno != EINTR) {
        close(fds[i].fd);
        fds[i].fd = -1; // poll ignores negative descriptors
        --openCount;
      }
    }
  }

  for (auto &f : fds) {
    if (f.fd >= 0)
      close(f.fd);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      status = -1;
      break;
    }
  }

  result.exitCode = -1;
  if (status >= 0) {
    if (WIFEXITED(status)) {
      result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      result.exitCode = -WTERMSIG(status);
    }
  }

  APP_DEBUG_LOG("PROC: %04u EXIT %d%s: stdout-size=%zu stderr-size=%zu", index, result.exitCode,
                result.timedOut ? " (timeout)" : "", result.stdOut.size(), result.stdErr.size());
  APP_TRACE_LOG("PROC: %04u OUTPUT:\n%s", index, result.CombinedOutput().c_str());
  return true;
}
