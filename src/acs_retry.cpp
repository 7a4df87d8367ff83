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

#include "acs_retry.hpp"

#include "utils.hpp"
#include <algorithm>

ArduinoNarrowingRetryPolicy::ArduinoNarrowingRetryPolicy(const std::string &targetBoard)
    : m_targetBoard(targetBoard) {
}

bool ArduinoNarrowingRetryPolicy::WouldRetry(const std::vector<std::string> &scope, const std::set<std::string> &produced) const {
  if (m_targetBoard.empty()) {
    return false;
  }
  if (std::find(scope.begin(), scope.end(), m_targetBoard) == scope.end()) {
    return false;
  }
  return produced.count(m_targetBoard) == 0;
}

std::set<std::string> ArduinoNarrowingRetryPolicy::Run(const std::vector<std::string> &scope, const Attempt &attempt) const {
  std::set<std::string> produced = attempt(scope);

  if (!WouldRetry(scope, produced)) {
    return produced;
  }

  wxLogWarning(wxT("Retrying library build for board %s only"), wxString::FromUTF8(m_targetBoard));

  std::set<std::string> narrowed = attempt(std::vector<std::string>{m_targetBoard});
  if (narrowed.count(m_targetBoard)) {
    produced.insert(m_targetBoard);
  } else {
    wxLogWarning(wxT("Library build for board %s failed again"), wxString::FromUTF8(m_targetBoard));
  }
  return produced;
}
