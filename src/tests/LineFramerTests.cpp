// SPDX-License-Identifier: Apache-2.0
#include <mcp/LineFramer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace mcphub;

TEST_CASE("LineFramer parses complete lines", "[framer]")
{
    auto framer = LineFramer("test");
    auto messages = framer.feed("{\"a\":1}\n{\"b\":2}\n");

    REQUIRE(messages.size() == 2);
    CHECK(messages[0]["a"] == 1);
    CHECK(messages[1]["b"] == 2);
    CHECK(framer.pending().empty());
}

TEST_CASE("LineFramer keeps an incomplete trailing line", "[framer]")
{
    auto framer = LineFramer("test");

    CHECK(framer.feed("{\"id\":").empty());
    CHECK(framer.pending() == "{\"id\":");

    auto messages = framer.feed("7}\n{\"id\"");
    REQUIRE(messages.size() == 1);
    CHECK(messages[0]["id"] == 7);
    CHECK(framer.pending() == "{\"id\"");
}

TEST_CASE("LineFramer output does not depend on chunk boundaries", "[framer]")
{
    auto const stream = std::string("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\n"
                                    "\n"
                                    "{\"jsonrpc\":\"2.0\",\"method\":\"x\"}\r\n"
                                    "{\"text\":\"line\\nbreak\"}\n");

    auto whole = LineFramer("test").feed(stream);
    REQUIRE(whole.size() == 3);

    for (auto chunkSize = std::size_t { 1 }; chunkSize <= stream.size(); ++chunkSize)
    {
        auto framer = LineFramer("test");
        auto collected = std::vector<nlohmann::json> {};
        for (auto offset = std::size_t { 0 }; offset < stream.size(); offset += chunkSize)
        {
            for (auto& message: framer.feed(std::string_view(stream).substr(offset, chunkSize)))
                collected.push_back(std::move(message));
        }
        CHECK(collected == whole);
    }
}

TEST_CASE("LineFramer drops malformed lines and keeps the rest", "[framer]")
{
    auto framer = LineFramer("test");
    auto messages = framer.feed("{\"ok\":1}\nnot json at all\n{\"ok\":2}\n");

    REQUIRE(messages.size() == 2);
    CHECK(messages[0]["ok"] == 1);
    CHECK(messages[1]["ok"] == 2);
}

TEST_CASE("LineFramer ignores blank lines and carriage returns", "[framer]")
{
    auto framer = LineFramer("test");
    auto messages = framer.feed("\r\n\n{\"x\":true}\r\n");

    REQUIRE(messages.size() == 1);
    CHECK(messages[0]["x"] == true);
}

TEST_CASE("LineFramer reset discards a partial line", "[framer]")
{
    auto framer = LineFramer("test");
    CHECK(framer.feed("{\"broken\"").empty());
    framer.reset();

    auto messages = framer.feed("{\"fresh\":1}\n");
    REQUIRE(messages.size() == 1);
    CHECK(messages[0]["fresh"] == 1);
}

TEST_CASE("LineSplitter splits stderr output into lines", "[framer]")
{
    auto splitter = LineSplitter {};

    auto lines = splitter.feed("starting\r\nlisten");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "starting");

    lines = splitter.feed("ing on stdio\n");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "listening on stdio");

    CHECK(splitter.feed("no newline").empty());
    CHECK(splitter.flush() == "no newline");
    CHECK(splitter.flush().empty());
}
