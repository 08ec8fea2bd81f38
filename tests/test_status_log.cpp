#include <catch2/catch.hpp>
#include "status_log.hpp"
#include <string>

using namespace tman;

TEST_CASE("StatusLog: latest returns the newest message", "[status]") {
    StatusLog log;
    REQUIRE_FALSE(log.latest().has_value());

    log.info("first");
    log.warning("second");
    auto latest = log.latest();
    REQUIRE(latest.has_value());
    REQUIRE(latest->text == "second");
    REQUIRE(latest->level == StatusLevel::Warning);
}

TEST_CASE("StatusLog: report maps success to Info and failure to Error", "[status]") {
    StatusLog log;
    log.report({true, "saved"});
    REQUIRE(log.latest()->level == StatusLevel::Info);
    log.report({false, "broken"});
    REQUIRE(log.latest()->level == StatusLevel::Error);
    REQUIRE(log.latest()->text == "broken");
}

TEST_CASE("StatusLog: keeps only the newest kMaxMessages", "[status]") {
    StatusLog log;
    for (size_t i = 0; i < StatusLog::kMaxMessages + 5; ++i) {
        log.info("msg " + std::to_string(i));
    }
    const auto all = log.get_all();
    REQUIRE(all.size() == StatusLog::kMaxMessages);
    REQUIRE(all.front().text == "msg 5");
    REQUIRE(all.back().text == "msg " + std::to_string(StatusLog::kMaxMessages + 4));
}

TEST_CASE("StatusLog: get_recent filters by age, clear empties", "[status]") {
    StatusLog log;
    log.error("now");
    REQUIRE(log.get_recent(std::chrono::seconds(10)).size() == 1);
    log.clear();
    REQUIRE(log.get_all().empty());
}
