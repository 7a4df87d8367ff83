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

#include "acs_http.hpp"

#include "utils.hpp"
#include <chrono>
#include <curl/curl.h>
#include <mutex>
#include <thread>

#define ACS_USER_AGENT "ArduinoCompileServer/1.0"

namespace {

std::once_flag g_curlInitFlag;

void EnsureCurlInitialized() {
  std::call_once(g_curlInitFlag, []() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  });
}

size_t CurlWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const size_t total = size * nmemb;
  if (!userdata || total == 0)
    return total;

  auto *out = static_cast<std::string *>(userdata);
  out->append(ptr, total);
  return total;
}

} // namespace

ArduinoCurlHttpClient::ArduinoCurlHttpClient(const std::string &probeUrl, long connectTimeoutSec, long requestTimeoutSec)
    : m_probeUrl(probeUrl), m_connectTimeoutSec(connectTimeoutSec), m_requestTimeoutSec(requestTimeoutSec) {
}

bool ArduinoCurlHttpClient::Get(const std::string &url, std::string &body, ArduinoBuildError *err) {
  body.clear();

  EnsureCurlInitialized();

  CURL *curl = curl_easy_init();
  if (!curl) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError, "Failed to initialize HTTP client (cURL).");
  }

  APP_DEBUG_LOG("HTTP: GET %s", url.c_str());

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_USERAGENT, ACS_USER_AGENT);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlWriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

  // Connect timeout: avoid hanging forever on DNS/TCP issues
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, m_connectTimeoutSec);
  if (m_requestTimeoutSec > 0) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_requestTimeoutSec);
  }

  // Multi-thread safety: avoid signals in libcurl
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  CURLcode res = CURLE_OK;
  long httpCode = 0;

  for (int attempt = 0; attempt < 3; attempt++) {
    body.clear();
    httpCode = 0;

    res = curl_easy_perform(curl);

    if (res == CURLE_OK) {
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    }

    if (res == CURLE_OK && httpCode >= 200 && httpCode < 300) {
      curl_easy_cleanup(curl);
      APP_DEBUG_LOG("HTTP: GET %s -> %ld (%zu bytes)", url.c_str(), httpCode, body.size());
      return true;
    }

    // a timed out download is not retried, the deadline is the contract
    bool retryable = (res != CURLE_OK && res != CURLE_OPERATION_TIMEDOUT) ||
                     httpCode == 429 || httpCode == 500 || httpCode == 502 ||
                     httpCode == 503 || httpCode == 504;

    if (!retryable || attempt == 2) {
      break;
    }

    int backoffMs = 300 + attempt * attempt * 700; // ~300ms, ~1000ms
    APP_DEBUG_LOG("HTTP: retry %d after %d ms (curl=%d http=%ld)", attempt + 1, backoffMs, (int)res, httpCode);
    std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
  }

  curl_easy_cleanup(curl);

  if (res == CURLE_OPERATION_TIMEDOUT) {
    return SetBuildError(err, ArduinoBuildErrorKind::Timeout, "HTTP request timed out: " + url);
  }
  if (res != CURLE_OK) {
    return SetBuildError(err, ArduinoBuildErrorKind::IoError,
                         std::string("HTTP request failed: ") + curl_easy_strerror(res) + " (" + url + ")");
  }
  return SetBuildError(err, ArduinoBuildErrorKind::NotFound,
                       "HTTP error " + std::to_string(httpCode) + " for " + url);
}

bool ArduinoCurlHttpClient::IsOnline() {
  EnsureCurlInitialized();

  CURL *curl = curl_easy_init();
  if (!curl) {
    return false;
  }

  curl_easy_setopt(curl, CURLOPT_URL, m_probeUrl.c_str());
  curl_easy_setopt(curl, CURLOPT_USERAGENT, ACS_USER_AGENT);
  curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, m_connectTimeoutSec);
  if (m_connectTimeoutSec > 0) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 2 * m_connectTimeoutSec);
  }
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    APP_DEBUG_LOG("HTTP: probe %s failed: %s", m_probeUrl.c_str(), curl_easy_strerror(res));
    return false;
  }
  return true;
}
