#include <doctest/doctest.h>
#include "harvestlink/fetch_controller.hpp"
#include "harvestlink/command_encoder.hpp"
#include "test_support.hpp"

using namespace harvestlink;
using namespace harvestlink::testing;

static const std::vector<uint8_t> START = {0xAE, 0x5A, 0x00, 0x00};
static const std::vector<uint8_t> NEXT  = {0xAE, 0x5B, 0x00, 0x00};

TEST_CASE("Start sends SAVE_DAT_REQ and waits for a page") {
    FakeTransport link;
    FetchController ctl(&link);

    REQUIRE(ctl.start_fetch() == StartResult::Started);
    CHECK(ctl.state() == FetchState::AwaitingPage);
    CHECK(ctl.in_progress());
    REQUIRE(link.sent.size() == 1);
    CHECK(link.sent[0] == START);
    CHECK(ctl.session().requests == 1);
    CHECK(ctl.log().line(0) == "[INFO] Requesting saved data...");
    CHECK(ctl.log().last_line() == "[CMD] AE 5A 00 00");
}

TEST_CASE("Full page asks for the next one, short page completes") {
    FakeTransport link;
    FetchController ctl(&link);
    REQUIRE(ctl.start_fetch() == StartResult::Started);

    FrameEvent ev = ctl.on_frame(make_numbered_page(1, 50));
    CHECK(ev.kind == FrameKind::DataPage);
    CHECK(ev.records_added == 50);
    CHECK(ctl.in_progress());
    REQUIRE(link.sent.size() == 2);
    CHECK(link.sent[1] == NEXT);

    ctl.on_frame(make_numbered_page(51, 12));
    CHECK(ctl.state() == FetchState::Complete);
    CHECK(ctl.session().reason == CompletionReason::ShortPage);
    CHECK(ctl.session().error == FetchError::None);
    CHECK(ctl.session().pages == 2);
    CHECK(link.sent.size() == 2);               // nothing after the last page
    CHECK(ctl.log().last_line() == "[INFO] All data received.");
}

TEST_CASE("Records keep arrival order across pages, duplicates included") {
    FakeTransport link;
    FetchController ctl(&link);
    REQUIRE(ctl.start_fetch() == StartResult::Started);

    ctl.on_frame(make_numbered_page(100, 50));
    ctl.on_frame(make_numbered_page(100, 50));   // device repeats itself
    ctl.on_frame(make_numbered_page(1, 3));

    const auto& recs = ctl.session().records;
    REQUIRE(recs.size() == 103);
    for (std::size_t i = 0; i < 50; ++i) {
        CHECK(recs[i].tree_no == 100 + i);
        CHECK(recs[50 + i].tree_no == 100 + i);
    }
    CHECK(recs[100].tree_no == 1);
    CHECK(recs[102].tree_no == 3);
    for (std::size_t i = 0; i < recs.size(); ++i) CHECK(recs[i].id == i + 1);
}

TEST_CASE("Empty page completes the fetch") {
    FakeTransport link;
    FetchController ctl(&link);
    REQUIRE(ctl.start_fetch() == StartResult::Started);
    ctl.on_frame(make_numbered_page(1, 50));
    ctl.on_frame(std::vector<uint8_t>{0xAE, 0xDA, 0x00, 0x00});

    CHECK(ctl.state() == FetchState::Complete);
    CHECK(ctl.session().reason == CompletionReason::EmptyPage);
    CHECK(ctl.session().records.size() == 50);
    CHECK(ctl.log().last_line() == "[INFO] Received empty data packet. Fetch complete.");
}

TEST_CASE("Sentinel page completes the fetch") {
    FakeTransport link;
    FetchController ctl(&link);
    REQUIRE(ctl.start_fetch() == StartResult::Started);
    SlotSpec term;
    term.category = 0;
    ctl.on_frame(make_page({numbered_slot(1), make_slot(term)}));
    CHECK(ctl.state() == FetchState::Complete);
    CHECK(ctl.session().reason == CompletionReason::Sentinel);
    CHECK(ctl.session().records.size() == 1);
}

TEST_CASE("Disconnect after one full page keeps its fifty records") {
    FakeTransport link;
    FetchController ctl(&link);
    REQUIRE(ctl.start_fetch() == StartResult::Started);
    ctl.on_frame(make_numbered_page(1, 50));
    REQUIRE(link.sent.size() == 2);

    link.set_open(false);
    ctl.on_disconnect();

    CHECK(ctl.state() == FetchState::Failed);
    CHECK(ctl.session().error == FetchError::Disconnected);
    CHECK(ctl.session().records.size() == 50);
    CHECK(link.sent.size() == 2);
    CHECK(ctl.log().last_line() == "[ERR] Fetch failed (disconnected); kept 50 records.");
}

TEST_CASE("Disconnect with no fetch running only logs") {
    FakeTransport link;
    FetchController ctl(&link);
    ctl.on_disconnect();
    CHECK(ctl.state() == FetchState::Idle);
    CHECK(ctl.log().last_line() == "[INFO] Device disconnected.");
}

TEST_CASE("Malformed data page fails the fetch without touching records") {
    FakeTransport link;
    FetchController ctl(&link);
    REQUIRE(ctl.start_fetch() == StartResult::Started);
    ctl.on_frame(make_numbered_page(1, 50));

    auto bad = make_numbered_page(51, 2);
    bad.resize(bad.size() - 10);
    FrameEvent ev = ctl.on_frame(bad);

    CHECK(ev.kind == FrameKind::DataPage);
    CHECK(ev.records_added == 0);
    CHECK(ctl.state() == FetchState::Failed);
    CHECK(ctl.session().error == FetchError::MalformedFrame);
    CHECK(ctl.session().records.size() == 50);
    CHECK(link.sent.size() == 2);
}

TEST_CASE("Send failures fail the fetch") {
    SUBCASE("start command refused") {
        FakeTransport link;
        link.fail_sends(transport::TxResult::Error);
        FetchController ctl(&link);
        CHECK(ctl.start_fetch() == StartResult::SendFailed);
        CHECK(ctl.state() == FetchState::Failed);
        CHECK(ctl.session().error == FetchError::SendFailed);
        CHECK(ctl.session().requests == 0);
    }
    SUBCASE("next-page command refused while busy") {
        FakeTransport link;
        FetchController ctl(&link);
        REQUIRE(ctl.start_fetch() == StartResult::Started);
        link.fail_sends(transport::TxResult::Busy);
        ctl.on_frame(make_numbered_page(1, 50));
        CHECK(ctl.state() == FetchState::Failed);
        CHECK(ctl.session().error == FetchError::SendFailed);
        CHECK(ctl.session().records.size() == 50);
        CHECK(ctl.session().requests == 1);
    }
}

TEST_CASE("No usable link: start is refused and the old session stays") {
    SUBCASE("no transport at all") {
        FetchController ctl;
        CHECK(ctl.start_fetch() == StartResult::Unavailable);
        CHECK(ctl.state() == FetchState::Idle);
        CHECK(ctl.last_error() == FetchError::TransportUnavailable);
    }
    SUBCASE("transport closed after a completed fetch") {
        FakeTransport link;
        FetchController ctl(&link);
        REQUIRE(ctl.start_fetch() == StartResult::Started);
        ctl.on_frame(make_numbered_page(1, 5));
        REQUIRE(ctl.state() == FetchState::Complete);

        link.set_open(false);
        CHECK(ctl.start_fetch() == StartResult::Unavailable);
        CHECK(ctl.state() == FetchState::Complete);
        CHECK(ctl.session().records.size() == 5);
        CHECK(ctl.last_error() == FetchError::TransportUnavailable);
    }
}

TEST_CASE("Second start while waiting is rejected") {
    FakeTransport link;
    FetchController ctl(&link);
    REQUIRE(ctl.start_fetch() == StartResult::Started);
    CHECK(ctl.start_fetch() == StartResult::Busy);
    CHECK(link.sent.size() == 1);
    CHECK(ctl.in_progress());
}

TEST_CASE("A new fetch after completion starts clean") {
    FakeTransport link;
    FetchController ctl(&link);
    REQUIRE(ctl.start_fetch() == StartResult::Started);
    ctl.on_frame(make_numbered_page(1, 3));
    REQUIRE(ctl.state() == FetchState::Complete);

    REQUIRE(ctl.start_fetch() == StartResult::Started);
    CHECK(ctl.session().records.empty());
    CHECK(ctl.session().pages == 0);
    ctl.on_frame(make_numbered_page(1, 2));
    CHECK(ctl.session().records[0].id == 4);     // display ids keep counting
}

TEST_CASE("Cancel and timeout end a running fetch; late pages are dropped") {
    FakeTransport link;
    FetchController ctl(&link);
    CHECK_FALSE(ctl.cancel());

    REQUIRE(ctl.start_fetch() == StartResult::Started);
    ctl.on_frame(make_numbered_page(1, 50));

    SUBCASE("cancel") {
        CHECK(ctl.cancel());
        CHECK(ctl.session().error == FetchError::Cancelled);
    }
    SUBCASE("timeout") {
        CHECK(ctl.cancel(FetchError::Timeout));
        CHECK(ctl.session().error == FetchError::Timeout);
    }
    SUBCASE("other reasons map to cancelled") {
        CHECK(ctl.cancel(FetchError::MalformedFrame));
        CHECK(ctl.session().error == FetchError::Cancelled);
    }

    CHECK(ctl.state() == FetchState::Failed);
    FrameEvent late = ctl.on_frame(make_numbered_page(51, 50));
    CHECK(late.stale);
    CHECK(late.records_added == 0);
    CHECK(ctl.session().records.size() == 50);
    CHECK(link.sent.size() == 2);
    CHECK(ctl.log().last_line() == "[INFO] Ignoring data page: no fetch in progress.");
}

TEST_CASE("Raw frames surface as text and never disturb a fetch") {
    FakeTransport link;
    FetchController ctl(&link);
    REQUIRE(ctl.start_fetch() == StartResult::Started);

    FrameEvent ev = ctl.on_frame(bytes("BATT 87%"));
    CHECK(ev.kind == FrameKind::Raw);
    CHECK(ev.text == "BATT 87%");
    CHECK(ctl.in_progress());
    CHECK(ctl.log().last_line() == "[IN] 42 41 54 54 20 38 37 25 (BATT 87%)");

    FrameEvent tiny = ctl.on_frame(std::vector<uint8_t>{0x01});
    CHECK(tiny.kind == FrameKind::Ignored);
    CHECK(ctl.in_progress());
}

TEST_CASE("Free text goes out unframed and is independent of the fetch") {
    FakeTransport link;
    FetchController ctl(&link);
    std::string err;

    REQUIRE(ctl.send_text("ver", err));
    REQUIRE(link.sent.size() == 1);
    CHECK(link.sent[0] == bytes("ver"));
    CHECK(ctl.log().last_line() == "[OUT] ver");
    CHECK(ctl.state() == FetchState::Idle);

    CHECK_FALSE(ctl.send_text("", err));
    CHECK(err == "empty_text");

    REQUIRE(ctl.start_fetch() == StartResult::Started);
    link.fail_sends(transport::TxResult::Error);
    CHECK_FALSE(ctl.send_text("ping", err));
    CHECK(err == "send_failed");
    CHECK(ctl.in_progress());                   // the fetch is not affected
    CHECK(ctl.log().last_line() == "[ERR] Failed to send message.");

    link.set_open(false);
    CHECK_FALSE(ctl.send_text("ping", err));
    CHECK(err == "transport_unavailable");
}

TEST_CASE("Log limit from the constructor is honored") {
    FakeTransport link;
    FetchController ctl(&link, 2);
    REQUIRE(ctl.start_fetch() == StartResult::Started);
    ctl.on_frame(make_numbered_page(1, 1));
    CHECK(ctl.log().size() == 2);
    CHECK(ctl.log().dropped() > 0);
}

TEST_CASE("State and error names") {
    CHECK(std::string(to_string(FetchState::AwaitingPage)) == "awaiting_page");
    CHECK(std::string(to_string(FetchError::MalformedFrame)) == "malformed_frame");
    CHECK(std::string(to_string(StartResult::Busy)) == "busy");
}
