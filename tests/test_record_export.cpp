#include <doctest/doctest.h>
#include "record_export.hpp"

#include <sstream>

using namespace harvestlink;

static MeasurementRecord sample(uint64_t id) {
    MeasurementRecord r;
    r.id = id;
    r.timestamp.year = 2024;
    r.timestamp.month = 6;
    r.timestamp.day = 15;
    r.timestamp.hour = 10;
    r.timestamp.minute = 30;
    r.timestamp.second = 0;
    r.category = 3;
    r.temperature = 21.5f;
    r.tree_no = 7;
    r.defect_code = 0;
    r.results = {{1.0f, 2.0f, 3.0f, 4.0f, 5.0f}};
    return r;
}

TEST_CASE("Timestamp prints zero padded") {
    Timestamp t;
    t.year = 2003; t.month = 1; t.day = 2; t.hour = 3; t.minute = 4; t.second = 5;
    CHECK(t.to_string() == "2003-01-02 03:04:05");
}

TEST_CASE("Pretty line") {
    CHECK(format_record_line(sample(1)) ==
          "#1  2024-06-15 10:30:00  cat=3  temp=21.5  tree=7  defect=0  results=[1, 2, 3, 4, 5]");
}

TEST_CASE("CSV header and rows") {
    std::ostringstream os;
    write_csv({sample(1), sample(2)}, os);
    CHECK(os.str() ==
          "id,timestamp,category,temperature,tree_no,defect_code,r1,r2,r3,r4,r5\n"
          "1,2024-06-15 10:30:00,3,21.5,7,0,1,2,3,4,5\n"
          "2,2024-06-15 10:30:00,3,21.5,7,0,1,2,3,4,5\n");
}

TEST_CASE("Session JSON carries status tokens and records") {
    FetchSession s;
    s.state = FetchState::Failed;
    s.error = FetchError::Disconnected;
    s.pages = 1;
    s.records.push_back(sample(1));

    nlohmann::json j = session_to_json(s);
    CHECK(j["status"] == "failed");
    CHECK(j["reason"] == "none");
    CHECK(j["error"] == "disconnected");
    CHECK(j["pages"] == 1);
    REQUIRE(j["records"].size() == 1);
    CHECK(j["records"][0]["timestamp"] == "2024-06-15 10:30:00");
    CHECK(j["records"][0]["tree_no"] == 7);
    CHECK(j["records"][0]["results"].size() == 5);
    CHECK(j["records"][0]["temperature"].get<float>() == 21.5f);
}

TEST_CASE("Summary line lists only what is set") {
    FetchSession s;
    s.state = FetchState::Complete;
    s.reason = CompletionReason::ShortPage;
    s.pages = 1;
    s.records.push_back(sample(1));
    CHECK(summary_line(s) == "status=complete records=1 pages=1 reason=short_page");

    s.state = FetchState::Failed;
    s.reason = CompletionReason::None;
    s.error = FetchError::Timeout;
    CHECK(summary_line(s) == "status=failed records=1 pages=1 error=timeout");
}
