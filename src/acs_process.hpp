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

#include <string>
#include <vector>

struct ArduinoProcessResult {
  bool started = false;  // false when fork/exec setup failed
  bool timedOut = false; // killed because the deadline expired
  int exitCode = -1;     // exit status, or -signal when killed by a signal
  std::string stdOut;
  std::string stdErr;

  bool Succeeded() const { return started && !timedOut && exitCode == 0; }
  // stdout followed by stderr
  std::string CombinedOutput() const { return stdOut + stdErr; }
};

class ArduinoProcessRunner {
public:
  virtual ~ArduinoProcessRunner() = default;

  // Runs argv[0] (looked up in PATH) in workDir. timeoutSec <= 0 means no
  // deadline. Returns false only when the process could not be started.
  virtual bool Run(const std::vector<std::string> &argv,
                   const std::string &workDir,
                   int timeoutSec,
                   ArduinoProcessResult &result) = 0;
};

// fork/exec based runner. The child gets its own process group so that the
// whole toolchain tree is killed on timeout.
class ArduinoPosixProcessRunner : public ArduinoProcessRunner {
public:
  bool Run(const std::vector<std::string> &argv,
           const std::string &workDir,
           int timeoutSec,
           ArduinoProcessResult &result) override;
};

std::string JoinCommandLine(const std::vector<std::string> &argv);

// "<command> run -e <board> -j <threads>"; command may carry its own
// arguments ("python3 -m platformio").
std::vector<std::string> ToolchainRunArgv(const std::string &command, const std::string &board, int threads);
