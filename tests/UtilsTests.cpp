/*
 * PrivGuard - Process Privilege Management Library
 * Copyright (C) 2026 PrivGuard Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstdarg>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "Support/TestLogging.hpp"

#include "Utils/JSONUtils.hpp"
#include "Utils/Logger.hpp"
#include "Utils/StringUtils.hpp"

using namespace PrivGuard::Utils;

// ============================================================================
// StringUtils
// ============================================================================

TEST(StringUtilsTest, ConvertsBetweenUtf8AndWide) {
    EXPECT_EQ(StringUtils::StringToWString("SeBackupPrivilege"), L"SeBackupPrivilege");
    EXPECT_EQ(StringUtils::StringToWString("caf\xC3\xA9"), L"caf\u00E9");
    EXPECT_EQ(StringUtils::WStringToString(L"caf\u00E9"), "caf\xC3\xA9");
    EXPECT_EQ(StringUtils::WStringToString(L"\U0001F512"), "\xF0\x9F\x94\x92");
    EXPECT_EQ(StringUtils::StringToWString(StringUtils::WStringToString(L"\U0001F512")), L"\U0001F512");
    EXPECT_TRUE(StringUtils::StringToWString("").empty());
}

TEST(StringUtilsTest, MalformedUtf8BecomesReplacementCharacter) {
    EXPECT_EQ(StringUtils::StringToWString("a\xFF" "b"), L"a\uFFFDb");
    EXPECT_EQ(StringUtils::StringToWString("a\xC3"), L"a\uFFFD");
    EXPECT_EQ(StringUtils::StringToWString("\xE2\x28" "c"), L"\uFFFD(c");
}

TEST(StringUtilsTest, EqualsIgnoreCaseIsAsciiOnly) {
    EXPECT_TRUE(StringUtils::EqualsIgnoreCase("SeDebugPrivilege", "sedebugprivilege"));
    EXPECT_TRUE(StringUtils::EqualsIgnoreCase(L"SeTcbPrivilege", L"SETCBPRIVILEGE"));
    EXPECT_FALSE(StringUtils::EqualsIgnoreCase("SeTcbPrivilege", "SeTcbPrivileg"));
    EXPECT_FALSE(StringUtils::EqualsIgnoreCase(L"\u00E9", L"\u00C9"));
    EXPECT_TRUE(StringUtils::EqualsIgnoreCase("", ""));
}

// ============================================================================
// JSONUtils
// ============================================================================

TEST(JSONUtilsTest, ParseAcceptsCommentsByDefault) {
    JSON::Json doc;
    JSON::Error err;
    ASSERT_TRUE(JSON::Parse("{ /* block */ \"a\": 1 // line\n}", doc, &err)) << err.message;
    EXPECT_EQ(doc["a"], 1);

    JSON::ParseOptions strict;
    strict.allowComments = false;
    EXPECT_FALSE(JSON::Parse("{ /* block */ \"a\": 1 }", doc, &err, strict));
    EXPECT_TRUE(doc.is_null());
}

TEST(JSONUtilsTest, ParseEnforcesDepthLimit) {
    JSON::ParseOptions opt;
    opt.maxDepth = 3;
    JSON::Json doc;
    JSON::Error err;
    EXPECT_TRUE(JSON::Parse("[[[1]]]", doc, &err, opt));
    EXPECT_FALSE(JSON::Parse("[[[[[1]]]]]", doc, &err, opt));
    EXPECT_TRUE(err.hasError());
}

TEST(JSONUtilsTest, ToJsonPointerHandlesDotsBracketsAndEscapes) {
    EXPECT_EQ(JSON::ToJsonPointer(""), "/");
    EXPECT_EQ(JSON::ToJsonPointer("/already/pointer"), "/already/pointer");
    EXPECT_EQ(JSON::ToJsonPointer("privileges.prewarm[1]"), "/privileges/prewarm/1");
    EXPECT_EQ(JSON::ToJsonPointer("a~b.c/d"), "/a~0b/c~1d");
}

TEST(JSONUtilsTest, TypedGettersFollowPaths) {
    JSON::Json doc;
    ASSERT_TRUE(JSON::Parse(R"({"logging": {"level": "info", "maxFileCount": 4}, "list": [10, 20]})", doc));

    std::string level;
    EXPECT_TRUE(JSON::Get(doc, "logging.level", level));
    EXPECT_EQ(level, "info");

    int second = 0;
    EXPECT_TRUE(JSON::Get(doc, "list[1]", second));
    EXPECT_EQ(second, 20);

    int wrongType = 7;
    EXPECT_FALSE(JSON::Get(doc, "logging.level", wrongType));
    EXPECT_EQ(wrongType, 7);

    size_t count = 10;
    EXPECT_TRUE(JSON::Get(doc, "logging.maxFileCount", count));
    EXPECT_EQ(count, 4u);

    EXPECT_TRUE(JSON::Contains(doc, "/logging/level"));
    EXPECT_FALSE(JSON::Contains(doc, "logging.directory"));
}

// ============================================================================
// Logger
// ============================================================================

namespace {

    std::wstring Format(const wchar_t* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        std::wstring out = Logger::FormatMessageV(fmt, args);
        va_end(args);
        return out;
    }

}

TEST(LoggerTest, FormatsWideAndPrecisionArguments) {
    const std::wstring_view name = L"SeBackupPrivilegeXYZ";
    EXPECT_EQ(Format(L"Enabled %.*ls on pid %u", 17, name.data(), 42u), L"Enabled SeBackupPrivilege on pid 42");
    EXPECT_EQ(Format(L"%zu cached", static_cast<size_t>(3)), L"3 cached");
    EXPECT_EQ(Format(L"plain"), L"plain");
}

TEST(LoggerTest, FormatsMessagesLongerThanStackBuffer) {
    const std::wstring big(5000, L'x');
    EXPECT_EQ(Format(L"[%ls]", big.c_str()), L"[" + big + L"]");
}

TEST(LoggerTest, MinimalLevelGatesOutput) {
    Logger& logger = Logger::Instance();
    ASSERT_TRUE(logger.IsInitialized());

    logger.setMinimalLevel(LogLevel::Error);
    EXPECT_FALSE(logger.IsEnabled(LogLevel::Warn));
    EXPECT_TRUE(logger.IsEnabled(LogLevel::Error));
    EXPECT_TRUE(logger.IsEnabled(LogLevel::Fatal));

    logger.setMinimalLevel(LogLevel::Trace);
    EXPECT_TRUE(logger.IsEnabled(LogLevel::Trace));
    EXPECT_NO_THROW(PG_LOG_TRACE(L"UtilsTest", L"trace %d", 1));

    logger.setMinimalLevel(LogLevel::Warn);
}

TEST(LoggerTest, NarrowToWideUsesThreadLocalBuffer) {
    EXPECT_STREQ(Logger::NarrowToWideTLS("Privileges.cpp"), L"Privileges.cpp");
    EXPECT_STREQ(Logger::NarrowToWideTLS(nullptr), L"");
}

// ============================================================================
// Logger sinks
// ============================================================================

class LoggerSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              (std::string("privguard_logger_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void TearDown() override {
        Logger::Instance().Initialize(PrivGuard::Testing::TestLoggerConfig());
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    LoggerConfig FileConfig(const wchar_t* baseName) const {
        LoggerConfig cfg;
        cfg.toConsole = false;
        cfg.toFile = true;
        cfg.async = false;
        cfg.includeSrcLocation = false;
        cfg.includeProcThreadId = false;
        cfg.minimalLevel = LogLevel::Info;
        cfg.logDirectory = dir.wstring();
        cfg.baseFileName = baseName;
        return cfg;
    }

    std::filesystem::path LogFile(const std::wstring& name) const {
        return dir / (name + L".log");
    }

    static std::vector<std::string> ReadLines(const std::filesystem::path& path) {
        std::vector<std::string> lines;
        std::ifstream in(path);
        for (std::string line; std::getline(in, line);) {
            lines.push_back(line);
        }
        return lines;
    }

    // Sequence numbers written as "#<n>" at the end of each line
    static std::vector<int> Sequence(const std::vector<std::string>& lines) {
        std::vector<int> seq;
        for (const auto& line : lines) {
            const auto pos = line.rfind('#');
            if (pos != std::string::npos) {
                seq.push_back(std::stoi(line.substr(pos + 1)));
            }
        }
        return seq;
    }

    static void LogNumbered(const wchar_t* category, int count) {
        for (int i = 0; i < count; ++i) {
            Logger::Instance().LogMessage(LogLevel::Info, category, L"message #" + std::to_wstring(i));
        }
    }

    std::filesystem::path dir;
};

TEST_F(LoggerSinkTest, RotatesFilesAtSizeLimit) {
    LoggerConfig cfg = FileConfig(L"rotate");
    cfg.maxFileSizeBytes = 256;
    cfg.maxFileCount = 3;
    Logger::Instance().Initialize(cfg);

    LogNumbered(L"Rotation", 60);
    Logger::Instance().ShutDown();

    EXPECT_TRUE(std::filesystem::exists(LogFile(L"rotate")));
    EXPECT_TRUE(std::filesystem::exists(LogFile(L"rotate.1")));
    EXPECT_TRUE(std::filesystem::exists(LogFile(L"rotate.2")));
    EXPECT_FALSE(std::filesystem::exists(LogFile(L"rotate.3")));

    for (const wchar_t* name : { L"rotate", L"rotate.1", L"rotate.2" }) {
        EXPECT_LE(std::filesystem::file_size(LogFile(name)), 256u);
    }

    // The newest lines are in the live file, the older ones shifted up
    const auto live = Sequence(ReadLines(LogFile(L"rotate")));
    const auto previous = Sequence(ReadLines(LogFile(L"rotate.1")));
    ASSERT_FALSE(live.empty());
    ASSERT_FALSE(previous.empty());
    EXPECT_EQ(live.back(), 59);
    EXPECT_LT(previous.back(), live.front());
}

TEST_F(LoggerSinkTest, JsonLinesParseBack) {
    LoggerConfig cfg = FileConfig(L"json");
    cfg.jsonLines = true;
    cfg.includeProcThreadId = true;
    Logger::Instance().Initialize(cfg);

    Logger::Instance().LogMessage(LogLevel::Warn, L"Json", L"quote \" back\\slash\nnew\tline caf\u00E9",
                                  L"Enabler.cpp", 42, L"Dispose", 5);
    Logger::Instance().LogMessage(LogLevel::Info, L"Json", L"plain");
    Logger::Instance().ShutDown();

    const auto lines = ReadLines(LogFile(L"json"));
    ASSERT_EQ(lines.size(), 2u);

    JSON::Json first;
    JSON::Error err;
    ASSERT_TRUE(JSON::Parse(lines[0], first, &err)) << err.message;
    EXPECT_EQ(first["level"], "warn");
    EXPECT_EQ(first["category"], "Json");
    EXPECT_EQ(first["message"], "quote \" back\\slash\nnew\tline caf\xC3\xA9");
    EXPECT_EQ(first["nativeError"], 5);
    EXPECT_TRUE(first.contains("pid"));
    EXPECT_FALSE(first.contains("file"));

    JSON::Json second;
    ASSERT_TRUE(JSON::Parse(lines[1], second, &err)) << err.message;
    EXPECT_EQ(second["message"], "plain");
    EXPECT_FALSE(second.contains("nativeError"));
}

TEST_F(LoggerSinkTest, AsyncBlockKeepsEveryMessage) {
    LoggerConfig cfg = FileConfig(L"block");
    cfg.async = true;
    cfg.maxQueueSize = 2;
    cfg.bpPolicy = LoggerConfig::BackPressurePolicy::Block;
    Logger::Instance().Initialize(cfg);

    LogNumbered(L"Async", 200);
    Logger::Instance().ShutDown();

    const auto seq = Sequence(ReadLines(LogFile(L"block")));
    ASSERT_EQ(seq.size(), 200u);
    for (int i = 0; i < 200; ++i) {
        EXPECT_EQ(seq[static_cast<size_t>(i)], i);
    }
}

TEST_F(LoggerSinkTest, AsyncDropNewestKeepsFirstMessage) {
    LoggerConfig cfg = FileConfig(L"dropnewest");
    cfg.async = true;
    cfg.maxQueueSize = 1;
    cfg.bpPolicy = LoggerConfig::BackPressurePolicy::DropNewest;
    Logger::Instance().Initialize(cfg);

    LogNumbered(L"Async", 200);
    Logger::Instance().ShutDown();

    const auto seq = Sequence(ReadLines(LogFile(L"dropnewest")));
    ASSERT_FALSE(seq.empty());
    EXPECT_LE(seq.size(), 200u);
    EXPECT_EQ(seq.front(), 0);
    EXPECT_TRUE(std::is_sorted(seq.begin(), seq.end()));
    EXPECT_EQ(std::adjacent_find(seq.begin(), seq.end()), seq.end());
}

TEST_F(LoggerSinkTest, AsyncDropOldestKeepsLastMessage) {
    LoggerConfig cfg = FileConfig(L"dropoldest");
    cfg.async = true;
    cfg.maxQueueSize = 1;
    cfg.bpPolicy = LoggerConfig::BackPressurePolicy::DropOldest;
    Logger::Instance().Initialize(cfg);

    LogNumbered(L"Async", 200);
    Logger::Instance().ShutDown();

    const auto seq = Sequence(ReadLines(LogFile(L"dropoldest")));
    ASSERT_FALSE(seq.empty());
    EXPECT_LE(seq.size(), 200u);
    EXPECT_EQ(seq.back(), 199);
    EXPECT_TRUE(std::is_sorted(seq.begin(), seq.end()));
    EXPECT_EQ(std::adjacent_find(seq.begin(), seq.end()), seq.end());
}

TEST_F(LoggerSinkTest, MessagesRacingShutDownNeverReachNextSession) {
    LoggerConfig first = FileConfig(L"first");
    first.async = true;
    first.maxQueueSize = 4;
    first.bpPolicy = LoggerConfig::BackPressurePolicy::Block;
    Logger::Instance().Initialize(first);

    std::atomic<bool> running{ true };
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&running] {
            while (running.load()) {
                Logger::Instance().LogMessage(LogLevel::Info, L"Race", L"old session");
            }
        });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    Logger::Instance().ShutDown();
    running.store(false);
    for (auto& producer : producers) {
        producer.join();
    }

    LoggerConfig second = FileConfig(L"second");
    second.async = true;
    Logger::Instance().Initialize(second);
    Logger::Instance().LogMessage(LogLevel::Info, L"Race", L"new session");
    Logger::Instance().ShutDown();

    const auto lines = ReadLines(LogFile(L"second"));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("new session"), std::string::npos);
}
