// SPDX-License-Identifier: Apache-2.0
#include <core/Uuid.hpp>
#include <mcp/ProcessProbe.hpp>
#include <mcp/ServerLog.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <format>
#include <string>

#include <unistd.h>

using namespace mcphub;
using namespace std::string_literals;

TEST_CASE("ServerLog directory is derived from data dir and server id", "[serverlog]")
{
    auto const dir = ServerLog::directoryFor("/var/lib/mcphub", "srv-1");
    CHECK(dir == std::filesystem::path("/var/lib/mcphub/logs/mcp/srv-1"));
}

TEST_CASE("ServerLog parses its own line format", "[serverlog]")
{
    auto entry = ServerLog::parseLine("2025-09-28 23:31:14.749 [INFO] Server stop requested", ServerLogStream::Exec);
    REQUIRE(entry.has_value());
    CHECK(entry->level == "INFO");
    CHECK(entry->message == "Server stop requested");
    CHECK(entry->stream == ServerLogStream::Exec);

    CHECK(!ServerLog::parseLine("garbage", ServerLogStream::Out).has_value());
    CHECK(!ServerLog::parseLine("2025-09-28 23:31:14.749 no level", ServerLogStream::Out).has_value());
}

TEST_CASE("ServerLog writes per-stream files and reads them back in order", "[serverlog]")
{
    auto const dataDir = std::filesystem::temp_directory_path() / std::format("mcphub-log-{}", uuid::generate());

    {
        auto serverLog = ServerLog(dataDir, "weather");
        serverLog.exec("INFO", "starting");
        serverLog.stdinData("{\"id\":1}");
        serverLog.stdoutData("{\"id\":1,\"result\":{}}");
        serverLog.stderrData("warning: deprecated flag");

        CHECK(std::filesystem::is_directory(serverLog.directory()));

        auto recent = serverLog.readRecent(10);
        REQUIRE(recent.has_value());
        REQUIRE(recent->size() == 4);
        CHECK(recent->front().message == "starting");
        CHECK(recent->back().level == "ERROR");

        auto lastTwo = serverLog.readRecent(2);
        REQUIRE(lastTwo.has_value());
        CHECK(lastTwo->size() == 2);
    }

    auto ec = std::error_code {};
    std::filesystem::remove_all(dataDir, ec);
}

TEST_CASE("environContainsMarker matches whole NAME=1 entries only", "[process]")
{
    auto const block = "PATH=/usr/bin\0IS_MCPHUB_MCP=1\0HOME=/root"s;
    CHECK(SystemProcessProbe::environContainsMarker(block, "IS_MCPHUB_MCP"));

    auto const wrongValue = "IS_MCPHUB_MCP=10\0X=1"s;
    CHECK(!SystemProcessProbe::environContainsMarker(wrongValue, "IS_MCPHUB_MCP"));

    auto const prefixed = "NOT_IS_MCPHUB_MCP=1"s;
    CHECK(!SystemProcessProbe::environContainsMarker(prefixed, "IS_MCPHUB_MCP"));

    CHECK(!SystemProcessProbe::environContainsMarker("", "IS_MCPHUB_MCP"));
}

TEST_CASE("psDumpContainsMarker matches whole whitespace-separated tokens only", "[process]")
{
    auto const dump = "  PID TTY STAT TIME COMMAND\n"
                      " 4242 ?  S  0:00 node server.js PATH=/usr/bin IS_MCPHUB_MCP=1 HOME=/root\n"s;
    CHECK(SystemProcessProbe::psDumpContainsMarker(dump, "IS_MCPHUB_MCP"));

    auto const prefixed = "4242 node NOT_IS_MCPHUB_MCP=1 HOME=/root"s;
    CHECK(!SystemProcessProbe::psDumpContainsMarker(prefixed, "IS_MCPHUB_MCP"));

    auto const longerValue = "4242 node IS_MCPHUB_MCP=10"s;
    CHECK(!SystemProcessProbe::psDumpContainsMarker(longerValue, "IS_MCPHUB_MCP"));

    auto const tabbed = "4242\tnode\tIS_MCPHUB_MCP=1"s;
    CHECK(SystemProcessProbe::psDumpContainsMarker(tabbed, "IS_MCPHUB_MCP"));

    CHECK(!SystemProcessProbe::psDumpContainsMarker("", "IS_MCPHUB_MCP"));
}

TEST_CASE("SystemProcessProbe rejects invalid and foreign pids", "[process]")
{
    auto const probe = SystemProcessProbe("MCPHUB_TEST_MARKER_NEVER_SET");
    CHECK(!probe.isAlive(0));
    CHECK(!probe.isAlive(-5));
    CHECK(probe.isAlive(static_cast<int>(::getpid())));
    CHECK(!probe.isOurs(static_cast<int>(::getpid())));
}
