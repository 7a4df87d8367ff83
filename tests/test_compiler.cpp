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
#include "acs_compiler.hpp"
#include "acs_slots.hpp"
#include "fakes.hpp"
#include "utils.hpp"
#include <filesystem>
#include <gtest/gtest.h>

namespace fs = std::filesystem;

class CompilerTest : public ::testing::Test {
protected:
  TestTempDir dir;
  FakeProcessRunner runner;
  ArduinoBoardRegistry boards;
  ArduinoArtifactCache cache{dir.Sub("arduino-libs"), 10, 3600};
  ArduinoBuildSlotPool pool{dir.Sub("compiles"), 1, boards};
  ArduinoSketchCompiler compiler{runner, cache, Toolchain()};

  static ArduinoToolchainOptions Toolchain() {
    ArduinoToolchainOptions tc;
    tc.command = "platformio";
    tc.threads = 2;
    tc.timeoutSec = 30;
    return tc;
  }

  void SetUp() override {
    ASSERT_TRUE(pool.Provision(nullptr));
  }

  static ArduinoCompileJob Job(const std::string &fqbn = "arduino:avr:uno") {
    ArduinoCompileJob job;
    job.sourceCode = "void setup() {}\nvoid loop() {}\n";
    job.fqbn = fqbn;
    return job;
  }

  // Handler writing the given firmware files for the built board.
  static FakeProcessRunner::Handler Writes(std::vector<std::pair<std::string, std::string>> files) {
    return [files](const FakeProcessCall &call, ArduinoProcessResult &result) {
      fs::path out = fs::path(call.workDir) / ".pio" / "build" / FakeProcessRunner::BoardOf(call.argv);
      fs::create_directories(out);
      for (const auto &f : files) {
        SaveFileFromString((out / f.first).string(), f.second);
      }
      result.exitCode = 0;
    };
  }
};

TEST_F(CompilerTest, HexFirmwareReturnedAsText) {
  runner.SetHandler(Writes({{"firmware.hex", ":100000000C9434000C943E000C943E000C943E0082\n"}}));

  ArduinoBuildSlotLease lease = pool.Acquire();
  ArduinoFirmware fw;
  ArduinoBuildError err;
  ASSERT_TRUE(compiler.Compile(Job(), *boards.FindByFqbn("arduino:avr:uno"), *lease.Get(), {}, fw, &err)) << err.message;

  EXPECT_EQ(fw.encoding, ArduinoFirmwareEncoding::Hex);
  EXPECT_EQ(fw.fileName, "firmware.hex");
  EXPECT_EQ(fw.data, ":100000000C9434000C943E000C943E000C943E0082\n");

  auto calls = runner.Calls();
  ASSERT_EQ(calls.size(), 1u);
  std::vector<std::string> expected = {"platformio", "run", "-e", "uno", "-j", "2"};
  EXPECT_EQ(calls[0].argv, expected);
  EXPECT_EQ(calls[0].workDir, lease->rootDir);

  std::string main;
  ASSERT_TRUE(LoadFileToString(lease->sourceDir + "/main.cpp", main));
  EXPECT_EQ(main, "#include <Arduino.h>\nvoid setup() {}\nvoid loop() {}\n");
}

TEST_F(CompilerTest, BinaryFirmwareIsBase64) {
  runner.SetHandler(Writes({{"firmware.bin", "abc"}}));

  ArduinoBuildSlotLease lease = pool.Acquire();
  ArduinoFirmware fw;
  ASSERT_TRUE(compiler.Compile(Job("arduino:esp32:nano_nora"), *boards.FindByFqbn("arduino:esp32:nano_nora"), *lease.Get(), {}, fw, nullptr));
  EXPECT_EQ(fw.encoding, ArduinoFirmwareEncoding::Base64);
  EXPECT_EQ(fw.fileName, "firmware.bin");
  EXPECT_EQ(fw.data, "YWJj");
}

TEST_F(CompilerTest, OutputSearchOrder) {
  runner.SetHandler(Writes({{"firmware.bin", "bin"}, {"firmware.uf2", "uf2"}}));

  ArduinoBuildSlotLease lease = pool.Acquire();
  ArduinoFirmware fw;
  ASSERT_TRUE(compiler.Compile(Job("arduino:esp32:nano_nora"), *boards.FindByFqbn("arduino:esp32:nano_nora"), *lease.Get(), {}, fw, nullptr));
  EXPECT_EQ(fw.fileName, "firmware.uf2");
  EXPECT_EQ(fw.data, "dWYy");

  runner.SetHandler(Writes({{"firmware.bin", "bin"}, {"firmware.hex", ":00000001FF\n"}}));
  ASSERT_TRUE(compiler.Compile(Job("arduino:esp32:nano_nora"), *boards.FindByFqbn("arduino:esp32:nano_nora"), *lease.Get(), {}, fw, nullptr));
  EXPECT_EQ(fw.fileName, "firmware.hex");
}

TEST_F(CompilerTest, FailureTextIsStdoutThenStderr) {
  runner.SetHandler([](const FakeProcessCall &, ArduinoProcessResult &result) {
    result.exitCode = 1;
    result.stdOut = "Compiling .pio/build/uno/src/main.cpp.o\n";
    result.stdErr = "src/main.cpp:2:1: error: 'foo' was not declared in this scope\n";
  });

  ArduinoBuildSlotLease lease = pool.Acquire();
  ArduinoFirmware fw;
  ArduinoBuildError err;
  EXPECT_FALSE(compiler.Compile(Job(), *boards.FindByFqbn("arduino:avr:uno"), *lease.Get(), {}, fw, &err));
  EXPECT_EQ(err.kind, ArduinoBuildErrorKind::CompileError);
  EXPECT_EQ(err.message,
            "Compiling .pio/build/uno/src/main.cpp.o\n"
            "src/main.cpp:2:1: error: 'foo' was not declared in this scope\n");
}

TEST_F(CompilerTest, DeadlineIsTimeout) {
  runner.SetHandler([](const FakeProcessCall &, ArduinoProcessResult &result) {
    result.timedOut = true;
    result.exitCode = -9;
  });

  ArduinoBuildSlotLease lease = pool.Acquire();
  ArduinoFirmware fw;
  ArduinoBuildError err;
  EXPECT_FALSE(compiler.Compile(Job(), *boards.FindByFqbn("arduino:avr:uno"), *lease.Get(), {}, fw, &err));
  EXPECT_EQ(err.kind, ArduinoBuildErrorKind::Timeout);
}

TEST_F(CompilerTest, StaleFirmwareFromPreviousJobIsNotReturned) {
  ArduinoBuildSlotLease lease = pool.Acquire();
  fs::create_directories(lease->buildDir + "/uno");
  ASSERT_TRUE(SaveFileFromString(lease->buildDir + "/uno/firmware.hex", ":OLD\n"));

  // toolchain claims success but writes nothing
  runner.SetHandler([](const FakeProcessCall &, ArduinoProcessResult &result) { result.exitCode = 0; });

  ArduinoFirmware fw;
  ArduinoBuildError err;
  EXPECT_FALSE(compiler.Compile(Job(), *boards.FindByFqbn("arduino:avr:uno"), *lease.Get(), {}, fw, &err));
  EXPECT_EQ(err.kind, ArduinoBuildErrorKind::CompileError);
  EXPECT_FALSE(fs::exists(lease->buildDir + "/uno/firmware.hex"));
}

TEST_F(CompilerTest, JobConfigCarriesAbsoluteLibraryFlags) {
  ArduinoResolvedMap resolved;
  ArduinoResolvedArtifact servo;
  servo.name = "Servo";
  servo.version = "1.2.1";
  servo.perArchitecture["uno"] = {"-I'../Servo@1.2.1/lib/lib/' ", "-L'../Servo@1.2.1/build/uno/' -lServo "};
  resolved["Servo"] = servo;

  ArduinoResolvedArtifact espOnly;
  espOnly.name = "EspOnly";
  espOnly.version = "1.0";
  espOnly.perArchitecture["arduino_nano_esp32"] = {"-I'../EspOnly@1.0/lib/lib/' ", ""};
  resolved["EspOnly"] = espOnly;

  std::string ini = compiler.BuildJobConfig(*boards.FindByFqbn("arduino:avr:uno"), resolved);
  const std::string root = cache.GetRootDir();
  EXPECT_EQ(ini,
            "[env:uno]\n"
            "build_flags = -w -I'" + root + "/Servo@1.2.1/lib/lib/' -L'" + root + "/Servo@1.2.1/build/uno/' -lServo \n");

  runner.SetHandler(Writes({{"firmware.hex", ":00000001FF\n"}}));
  ArduinoBuildSlotLease lease = pool.Acquire();
  ArduinoFirmware fw;
  ASSERT_TRUE(compiler.Compile(Job(), *boards.FindByFqbn("arduino:avr:uno"), *lease.Get(), resolved, fw, nullptr));

  std::string written;
  ASSERT_TRUE(LoadFileToString(lease->jobConfigPath, written));
  EXPECT_EQ(written, ini);
}
