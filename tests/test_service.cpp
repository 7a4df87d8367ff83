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

#include "acs_artifact.hpp"
#include "acs_boards.hpp"
#include "acs_catalog.hpp"
#include "acs_installer.hpp"
#include "acs_service.hpp"
#include "acs_slots.hpp"
#include "fakes.hpp"
#include "utils.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <thread>

using json = nlohmann::json;

static const char *const kBlink =
    "void setup() {\n"
    "  pinMode(LED_BUILTIN, OUTPUT);\n"
    "}\n"
    "void loop() {\n"
    "  digitalWrite(LED_BUILTIN, HIGH);\n"
    "}\n";

static bool WaitUntil(const std::function<bool()> &pred, int timeoutMs = 5000) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

class ServiceTest : public ::testing::Test {
protected:
  TestTempDir dir;
  FakeHttpClient http;
  FakeProcessRunner runner;
  ArduinoBoardRegistry boards;
  ArduinoLibraryCatalog catalog{&http, "https://example.test/library_index.json"};
  std::unique_ptr<ArduinoArtifactCache> cache;
  std::unique_ptr<ArduinoDependencyInstaller> installer;
  std::unique_ptr<ArduinoBuildSlotPool> pool;
  std::unique_ptr<ArduinoSketchCompiler> compiler;
  std::unique_ptr<ArduinoCompileService> service;

  void SetUp() override {
    Build(1);
  }

  void Build(int slots) {
    ArduinoToolchainOptions tc;
    tc.timeoutSec = 60;

    service.reset();
    compiler.reset();
    pool.reset();

    if (!cache) {
      cache = std::make_unique<ArduinoArtifactCache>(dir.Sub("arduino-libs"), 50, 3600);
      installer = std::make_unique<ArduinoDependencyInstaller>(catalog, *cache, http, runner, boards, tc);
    }
    pool = std::make_unique<ArduinoBuildSlotPool>(dir.Sub("compiles"), slots, boards);
    ASSERT_TRUE(pool->Provision(nullptr));
    compiler = std::make_unique<ArduinoSketchCompiler>(runner, *cache, tc);
    service = std::make_unique<ArduinoCompileService>(boards, *installer, *pool, *compiler, 10, 3600);
  }

  static ArduinoCompileJob Job(const std::string &source = kBlink) {
    ArduinoCompileJob job;
    job.sourceCode = source;
    job.fqbn = "arduino:avr:uno";
    return job;
  }
};

TEST(ServiceRequestTest, ParsesFullRequest) {
  ArduinoCompileJob job;
  ArduinoBuildError err;
  ASSERT_TRUE(ArduinoCompileService::ParseRequest(
      R"({"source_code":"void setup(){}","board":"arduino:avr:uno","libraries":["Servo","ArduinoJson@7.0.4"]})", job, &err))
      << err.message;
  EXPECT_EQ(job.sourceCode, "void setup(){}");
  EXPECT_EQ(job.fqbn, "arduino:avr:uno");
  ASSERT_EQ(job.libraries.size(), 2u);
  EXPECT_EQ(job.libraries[0].name, "Servo");
  EXPECT_FALSE(job.libraries[0].HasVersion());
  EXPECT_EQ(job.libraries[1].name, "ArduinoJson");
  EXPECT_EQ(job.libraries[1].version, "7.0.4");
}

TEST(ServiceRequestTest, LibrariesAreOptional) {
  ArduinoCompileJob job;
  ASSERT_TRUE(ArduinoCompileService::ParseRequest(R"({"source_code":"","board":"arduino:avr:nano"})", job, nullptr));
  EXPECT_TRUE(job.libraries.empty());
}

TEST(ServiceRequestTest, RejectsMalformedRequests) {
  const char *const bad[] = {
      "not json",
      "[1,2]",
      R"({"board":"arduino:avr:uno"})",
      R"({"source_code":"x"})",
      R"({"source_code":5,"board":"arduino:avr:uno"})",
      R"({"source_code":"x","board":"arduino:avr:uno","libraries":"Servo"})",
      R"({"source_code":"x","board":"arduino:avr:uno","libraries":[1]})",
      R"({"source_code":"x","board":"arduino:avr:uno","libraries":["a;b"]})",
      R"({"source_code":"x","board":"arduino:avr:uno","libraries":["Servo@1.0; rm -rf /"]})",
  };

  for (const char *text : bad) {
    ArduinoCompileJob job;
    ArduinoBuildError err;
    EXPECT_FALSE(ArduinoCompileService::ParseRequest(text, job, &err)) << text;
    EXPECT_EQ(err.kind, ArduinoBuildErrorKind::InvalidInput) << text;
  }
}

TEST(ServiceRequestTest, CacheKeyIgnoresSpacesAndNewlines) {
  ArduinoCompileJob a;
  a.sourceCode = "void setup() {}\nvoid loop() {}\n";
  a.fqbn = "arduino:avr:uno";

  ArduinoCompileJob b = a;
  b.sourceCode = "void setup(){}void loop(){}";
  EXPECT_EQ(ArduinoCompileService::CacheKey(a), ArduinoCompileService::CacheKey(b));
  EXPECT_EQ(ArduinoCompileService::CacheKey(a).size(), 16u);

  ArduinoCompileJob c = a;
  c.fqbn = "arduino:avr:nano";
  EXPECT_NE(ArduinoCompileService::CacheKey(a), ArduinoCompileService::CacheKey(c));

  ArduinoCompileJob d = a;
  d.libraries.push_back({"Servo", ""});
  EXPECT_NE(ArduinoCompileService::CacheKey(a), ArduinoCompileService::CacheKey(d));

  // a tab is significant
  ArduinoCompileJob e = a;
  e.sourceCode = "void\tsetup() {}\nvoid loop() {}\n";
  EXPECT_NE(ArduinoCompileService::CacheKey(a), ArduinoCompileService::CacheKey(e));
}

TEST_F(ServiceTest, CompilesSketchWithoutLibraries) {
  ArduinoFirmware fw;
  ArduinoBuildError err;
  ASSERT_TRUE(service->Compile(Job(), fw, &err)) << err.message;
  EXPECT_EQ(fw.encoding, ArduinoFirmwareEncoding::Hex);
  EXPECT_EQ(fw.data, ":00000001FF\n");
  EXPECT_EQ(runner.CallCount(), 1u);
  EXPECT_EQ(http.TotalGets(), 0);
}

TEST_F(ServiceTest, CompilesSketchWithLibrary) {
  http.Serve(ReleaseUrl("Servo", "1.2.1"), MakeLibraryZip("Servo", "1.2.1", "", "avr"));
  ASSERT_TRUE(catalog.LoadFromJson(MakeIndexJson({{"Servo", "1.2.1", {}, {"avr"}}})));

  ArduinoCompileJob job = Job();
  job.libraries.push_back({"Servo", ""});

  ArduinoFirmware fw;
  ArduinoBuildError err;
  ASSERT_TRUE(service->Compile(job, fw, &err)) << err.message;

  // three AVR boards for the library, then the sketch
  EXPECT_EQ(runner.CallCount(), 4u);

  std::string ini;
  ASSERT_TRUE(LoadFileToString(dir.Sub("compiles/slot-0/job.ini"), ini));
  EXPECT_NE(ini.find("-I'" + cache->GetRootDir() + "/Servo@1.2.1/lib/lib/'"), std::string::npos) << ini;
  EXPECT_NE(ini.find("-lServo"), std::string::npos) << ini;
}

TEST_F(ServiceTest, RepeatedRequestIsServedFromCache) {
  ArduinoFirmware first;
  ASSERT_TRUE(service->Compile(Job(), first, nullptr));

  ArduinoFirmware second;
  ASSERT_TRUE(service->Compile(Job("void setup(){}\nvoid loop(){}"), second, nullptr));
  ASSERT_TRUE(service->Compile(Job("void setup() {\n  pinMode(LED_BUILTIN,OUTPUT);\n}\nvoid loop() {\n  digitalWrite(LED_BUILTIN,HIGH);\n}"),
                               second, nullptr));

  EXPECT_EQ(runner.CallCount(), 2u);
  EXPECT_EQ(service->GetCacheHits(), 1u);
  EXPECT_EQ(second.data, first.data);
}

TEST_F(ServiceTest, FailuresAreNotCached) {
  runner.SetHandler([](const FakeProcessCall &, ArduinoProcessResult &result) {
    result.exitCode = 1;
    result.stdErr = "error: expected ';'\n";
  });

  ArduinoFirmware fw;
  ArduinoBuildError err;
  EXPECT_FALSE(service->Compile(Job(), fw, &err));
  EXPECT_EQ(err.kind, ArduinoBuildErrorKind::CompileError);

  runner.SetHandler(FakeProcessRunner::DefaultSuccess);
  EXPECT_TRUE(service->Compile(Job(), fw, &err));
  EXPECT_EQ(runner.CallCount(), 2u);
  EXPECT_EQ(service->GetCacheHits(), 0u);
}

TEST_F(ServiceTest, UnsafeLibraryNeverReachesToolchain) {
  ArduinoCompileJob job = Job();
  job.libraries.push_back({"a;b", ""});

  ArduinoFirmware fw;
  ArduinoBuildError err;
  EXPECT_FALSE(service->Compile(job, fw, &err));
  EXPECT_EQ(err.kind, ArduinoBuildErrorKind::InvalidInput);
  EXPECT_EQ(runner.CallCount(), 0u);
  EXPECT_EQ(http.TotalGets(), 0);
}

TEST_F(ServiceTest, UnsupportedBoardIsRejected) {
  ArduinoCompileJob job = Job();
  job.fqbn = "esp8266:esp8266:nodemcu";

  ArduinoFirmware fw;
  ArduinoBuildError err;
  EXPECT_FALSE(service->Compile(job, fw, &err));
  EXPECT_EQ(err.kind, ArduinoBuildErrorKind::InvalidInput);
  EXPECT_EQ(runner.CallCount(), 0u);
}

TEST_F(ServiceTest, MissingLibraryIsNotFound) {
  ASSERT_TRUE(catalog.LoadFromJson(MakeIndexJson({})));

  int status = 0;
  std::string body = service->HandleRequest(
      R"({"source_code":"void setup(){}","board":"arduino:avr:uno","libraries":["Nope"]})", status);
  EXPECT_EQ(status, 404);
  EXPECT_EQ(json::parse(body).value("kind", ""), "NotFound");
  EXPECT_EQ(runner.CallCount(), 0u);
}

TEST_F(ServiceTest, OfflineCompilesWithoutLibraries) {
  http.online = false;

  ArduinoCompileJob job = Job();
  job.libraries.push_back({"Servo", ""});

  ArduinoFirmware fw;
  ArduinoBuildError err;
  ASSERT_TRUE(service->Compile(job, fw, &err)) << err.message;
  EXPECT_EQ(runner.CallCount(), 1u);
  EXPECT_EQ(http.TotalGets(), 0);
}

TEST_F(ServiceTest, HandleRequestResponses) {
  int status = 0;
  std::string body = service->HandleRequest(R"({"source_code":"void setup(){}","board":"arduino:avr:uno"})", status);
  EXPECT_EQ(status, 200);
  json ok = json::parse(body);
  EXPECT_EQ(ok.value("hex", ""), ":00000001FF\n");
  EXPECT_FALSE(ok.contains("sketch"));

  runner.SetHandler([](const FakeProcessCall &, ArduinoProcessResult &result) {
    result.exitCode = 1;
    result.stdOut = "Compiling...\n";
    result.stdErr = "boom\n";
  });
  body = service->HandleRequest(R"({"source_code":"void loop(){}","board":"arduino:avr:uno"})", status);
  EXPECT_EQ(status, 500);
  json bad = json::parse(body);
  EXPECT_EQ(bad.value("detail", ""), "Compiling...\nboom\n");
  EXPECT_EQ(bad.value("kind", ""), "CompileError");

  body = service->HandleRequest("{", status);
  EXPECT_EQ(status, 422);
  EXPECT_TRUE(json::parse(body).contains("detail"));
}

TEST_F(ServiceTest, BinaryFirmwareIsReturnedAsSketch) {
  runner.SetHandler([](const FakeProcessCall &call, ArduinoProcessResult &result) {
    std::string out = call.workDir + "/.pio/build/" + FakeProcessRunner::BoardOf(call.argv);
    std::filesystem::create_directories(out);
    SaveFileFromString(out + "/firmware.uf2", "abc");
    result.exitCode = 0;
  });

  int status = 0;
  std::string body = service->HandleRequest(R"({"source_code":"","board":"arduino:esp32:nano_nora"})", status);
  EXPECT_EQ(status, 200);
  EXPECT_EQ(json::parse(body).value("sketch", ""), "YWJj");
}

TEST_F(ServiceTest, ConcurrencyIsBoundedBySlots) {
  Build(2);
  runner.Hold();

  std::vector<std::thread> threads;
  std::vector<int> ok(3, 0);
  for (int i = 0; i < 3; ++i) {
    threads.emplace_back([this, i, &ok]() {
      ArduinoFirmware fw;
      ok[i] = service->Compile(Job("void setup() { /* " + std::to_string(i) + " */ }"), fw, nullptr) ? 1 : 0;
    });
  }

  EXPECT_TRUE(runner.WaitForRunning(2, 5000));
  EXPECT_TRUE(WaitUntil([this]() { return pool->GetWaitingCount() == 1; }));
  EXPECT_EQ(runner.Running(), 2);
  EXPECT_EQ(pool->GetBusyCount(), 2);

  runner.ReleaseHold();
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(ok, std::vector<int>({1, 1, 1}));
  EXPECT_LE(runner.MaxConcurrent(), 2);
  EXPECT_EQ(runner.CallCount(), 3u);
  EXPECT_EQ(pool->GetBusyCount(), 0);
}

TEST_F(ServiceTest, LibraryBuildsCountAgainstSlots) {
  http.Serve(ReleaseUrl("Servo", "1.2.1"), MakeLibraryZip("Servo", "1.2.1", "", "avr"));
  ASSERT_TRUE(catalog.LoadFromJson(MakeIndexJson({{"Servo", "1.2.1", {}, {"avr"}}})));

  runner.SetHandler([](const FakeProcessCall &call, ArduinoProcessResult &result) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    FakeProcessRunner::DefaultSuccess(call, result);
  });

  // one slot: a plain sketch and a sketch whose library is not installed yet
  int okPlain = 0;
  int okLibrary = 0;
  std::thread plain([this, &okPlain]() {
    ArduinoFirmware fw;
    okPlain = service->Compile(Job(), fw, nullptr) ? 1 : 0;
  });
  std::thread withLibrary([this, &okLibrary]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ArduinoCompileJob job = Job("#include <Servo.h>\nvoid setup() {}\nvoid loop() {}\n");
    job.libraries.push_back({"Servo", ""});
    ArduinoFirmware fw;
    okLibrary = service->Compile(job, fw, nullptr) ? 1 : 0;
  });
  plain.join();
  withLibrary.join();

  EXPECT_EQ(okPlain, 1);
  EXPECT_EQ(okLibrary, 1);
  EXPECT_EQ(runner.CallCount(), 5u); // 3 AVR library builds + 2 sketches
  EXPECT_EQ(runner.MaxConcurrent(), 1);
}

TEST_F(ServiceTest, InstallAndCompileStayWithinSlots) {
  Build(2);

  std::vector<FakeRelease> releases;
  for (const char *name : {"LibA", "LibB", "LibC"}) {
    http.Serve(ReleaseUrl(name, "1.0.0"), MakeLibraryZip(name, "1.0.0", "", "avr"));
    releases.push_back({name, "1.0.0", {}, {"avr"}});
  }
  ASSERT_TRUE(catalog.LoadFromJson(MakeIndexJson(releases)));

  runner.SetHandler([](const FakeProcessCall &call, ArduinoProcessResult &result) {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    FakeProcessRunner::DefaultSuccess(call, result);
  });

  const char *const libs[] = {"LibA", "LibB", "LibC"};
  std::vector<int> ok(3, 0);
  std::vector<std::thread> threads;
  for (int i = 0; i < 3; ++i) {
    threads.emplace_back([this, i, &ok, &libs]() {
      ArduinoCompileJob job = Job("void setup() { /* " + std::to_string(i) + " */ }");
      job.libraries.push_back({libs[i], ""});
      ArduinoFirmware fw;
      ok[i] = service->Compile(job, fw, nullptr) ? 1 : 0;
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(ok, std::vector<int>({1, 1, 1}));
  EXPECT_EQ(runner.CallCount(), 12u);
  EXPECT_LE(runner.MaxConcurrent(), 2);
  EXPECT_EQ(pool->GetBusyCount(), 0);
}
