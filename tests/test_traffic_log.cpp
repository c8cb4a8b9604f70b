#include <doctest/doctest.h>
#include "harvestlink/traffic_log.hpp"

using namespace harvestlink;

TEST_CASE("Lines render as [TAG] text") {
    TrafficLog log;
    CHECK(log.empty());
    CHECK(log.last_line() == "");

    log.add(LogTag::Cmd, "AE 5A 00 00");
    log.add(LogTag::Out, "hello");
    REQUIRE(log.size() == 2);
    CHECK(log.line(0) == "[CMD] AE 5A 00 00");
    CHECK(log.last_line() == "[OUT] hello");
    CHECK(log[1].tag == LogTag::Out);
}

TEST_CASE("Oldest entries are evicted at the limit") {
    TrafficLog log(3);
    for (int i = 0; i < 5; ++i) log.add(LogTag::Info, std::to_string(i));
    CHECK(log.size() == 3);
    CHECK(log.dropped() == 2);
    CHECK(log.line(0) == "[INFO] 2");
    CHECK(log.last_line() == "[INFO] 4");
}

TEST_CASE("Limit is clamped and shrinking evicts") {
    TrafficLog log;
    log.set_limit(0);
    CHECK(log.limit() == 1);
    log.set_limit(100000);
    CHECK(log.limit() == TrafficLog::CAPACITY);

    for (int i = 0; i < 10; ++i) log.add(LogTag::In, "x");
    log.set_limit(4);
    CHECK(log.size() == 4);
    CHECK(log.dropped() == 6);
}

TEST_CASE("Default log holds CAPACITY entries") {
    TrafficLog log;
    for (std::size_t i = 0; i < TrafficLog::CAPACITY + 10; ++i) log.add(LogTag::Info, "e");
    CHECK(log.size() == TrafficLog::CAPACITY);
    CHECK(log.dropped() == 10);
}

TEST_CASE("Overlong text is cut with an ellipsis") {
    TrafficLog log;
    log.add(LogTag::Err, std::string(TrafficLog::LINE_MAX + 50, 'a'));
    const auto& t = log[0].text;
    CHECK(t.size() == TrafficLog::LINE_MAX);
    CHECK(std::string(t.data(), t.size()).substr(TrafficLog::LINE_MAX - 3) == "...");

    log.add(LogTag::Err, std::string(TrafficLog::LINE_MAX, 'b'));
    CHECK(log[1].text.size() == TrafficLog::LINE_MAX);
    CHECK(log[1].text.back() == 'b');
}

TEST_CASE("Clear keeps the drop counter") {
    TrafficLog log(1);
    log.add(LogTag::Info, "a");
    log.add(LogTag::Info, "b");
    log.clear();
    CHECK(log.empty());
    CHECK(log.dropped() == 1);
}

TEST_CASE("Tag names") {
    CHECK(std::string(to_string(LogTag::Cmd)) == "CMD");
    CHECK(std::string(to_string(LogTag::In)) == "IN");
    CHECK(std::string(to_string(LogTag::Out)) == "OUT");
    CHECK(std::string(to_string(LogTag::Info)) == "INFO");
    CHECK(std::string(to_string(LogTag::Err)) == "ERR");
}
