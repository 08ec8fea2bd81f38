#include <catch2/catch.hpp>
#include "output_buffer.hpp"

using namespace tman;

TEST_CASE("OutputBuffer: partial line is held until its newline", "[output]") {
    OutputBuffer buffer;
    buffer.append_text("hel");
    buffer.append_text("lo\nwor");

    auto lines = buffer.lines();
    REQUIRE(lines == std::vector<std::string>{"hello", "wor"});
    REQUIRE(buffer.text() == "hello\nwor");

    buffer.append_text("ld\n");
    REQUIRE(buffer.lines() == std::vector<std::string>{"hello", "world"});
}

TEST_CASE("OutputBuffer: CRLF output is normalized", "[output]") {
    OutputBuffer buffer;
    buffer.append_text("one\r\ntwo\r\n");
    REQUIRE(buffer.lines() == std::vector<std::string>{"one", "two"});
}

TEST_CASE("OutputBuffer: append_line flushes a pending partial first", "[output]") {
    OutputBuffer buffer;
    buffer.append_text("prompt> ");
    buffer.append_line("status");
    REQUIRE(buffer.lines() == std::vector<std::string>{"prompt> ", "status"});
}

TEST_CASE("OutputBuffer: drops the oldest lines past the limit", "[output]") {
    OutputBuffer buffer(3);
    for (int i = 1; i <= 5; ++i) {
        buffer.append_line(std::to_string(i));
    }
    REQUIRE(buffer.lines() == std::vector<std::string>{"3", "4", "5"});
}

TEST_CASE("OutputBuffer: version changes with content, clear empties", "[output]") {
    OutputBuffer buffer;
    const auto v0 = buffer.version();
    buffer.append_line("x");
    const auto v1 = buffer.version();
    REQUIRE(v1 != v0);

    buffer.flush_partial();
    REQUIRE(buffer.version() == v1);

    buffer.clear();
    REQUIRE(buffer.lines().empty());
    REQUIRE(buffer.version() != v1);
}
