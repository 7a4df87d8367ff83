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
#include <string>

class ArduinoHttpClient {
public:
  virtual ~ArduinoHttpClient() = default;

  // GET url into body. Non-2xx responses are failures. Timeouts are reported
  // as ArduinoBuildErrorKind::Timeout.
  virtual bool Get(const std::string &url, std::string &body, ArduinoBuildError *err) = 0;

  // Cheap reachability check used before installing libraries.
  virtual bool IsOnline() = 0;
};

class ArduinoCurlHttpClient : public ArduinoHttpClient {
public:
  ArduinoCurlHttpClient(const std::string &probeUrl, long connectTimeoutSec, long requestTimeoutSec);

  bool Get(const std::string &url, std::string &body, ArduinoBuildError *err) override;
  bool IsOnline() override;

private:
  std::string m_probeUrl;
  long m_connectTimeoutSec;
  long m_requestTimeoutSec;
};
