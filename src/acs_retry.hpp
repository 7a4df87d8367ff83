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

#include <functional>
#include <set>
#include <string>
#include <vector>

// Full-scope build attempt followed, when the job's board is in scope but was
// not produced, by exactly one attempt narrowed to that board.
class ArduinoNarrowingRetryPolicy {
public:
  // Builds the given boards and returns the ones that succeeded.
  using Attempt = std::function<std::set<std::string>(const std::vector<std::string> &boards)>;

  explicit ArduinoNarrowingRetryPolicy(const std::string &targetBoard);

  std::set<std::string> Run(const std::vector<std::string> &scope, const Attempt &attempt) const;

  bool WouldRetry(const std::vector<std::string> &scope, const std::set<std::string> &produced) const;

private:
  std::string m_targetBoard; // empty = no job board, never retry
};
