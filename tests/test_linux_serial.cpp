#include <doctest/doctest.h>
#include "harvestlink/transport/transport_linux_serial.hpp"
#include "test_support.hpp"

#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <unistd.h>

using namespace harvestlink;

namespace {

// Master side of a pseudo-terminal; the link opens the slave like a bridge tty.
struct Pty {
    int master{-1};
    std::string slave;

    Pty() {
        master = ::posix_openpt(O_RDWR | O_NOCTTY);
        if (master >= 0 && ::grantpt(master) == 0 && ::unlockpt(master) == 0) {
            const char* name = ::ptsname(master);
            if (name) slave = name;
        }
    }
    ~Pty() { close(); }

    void close() {
        if (master >= 0) ::close(master);
        master = -1;
    }

    void write_all(const std::vector<uint8_t>& b) {
        REQUIRE(::write(master, b.data(), b.size()) == static_cast<ssize_t>(b.size()));
    }

    std::vector<uint8_t> read_some(std::size_t want, int timeout_ms = 1000) {
        std::vector<uint8_t> got;
        pollfd pfd{master, POLLIN, 0};
        uint8_t buf[256];
        while (got.size() < want && ::poll(&pfd, 1, timeout_ms) > 0) {
            ssize_t n = ::read(master, buf, sizeof(buf));
            if (n <= 0) break;
            got.insert(got.end(), buf, buf + n);
        }
        return got;
    }
};

transport::SerialConfig config_for(const std::string& path) {
    transport::SerialConfig sc;
    sc.path = path;
    sc.baud = 115200;
    sc.boot_delay_ms = 0;
    return sc;
}

} // namespace

TEST_CASE("Serial link exchanges SLIP framed notifications") {
    Pty pty;
    REQUIRE(!pty.slave.empty());

    transport::LinuxSerialLink link;
    REQUIRE(link.begin(config_for(pty.slave)));
    CHECK(link.is_open());
    CHECK(link.path() == pty.slave);

    SUBCASE("inbound page") {
        auto page = testing::make_numbered_page(0xC0DB, 2);
        std::vector<uint8_t> wire;
        slip::encode(page.data(), page.size(), wire);
        pty.write_all(wire);

        std::vector<uint8_t> frame;
        REQUIRE(link.recv_frame(frame, 1000) == transport::RxResult::Ok);
        CHECK(frame == page);
    }
    SUBCASE("outbound command") {
        const uint8_t cmd[] = {0xAE, 0x5A, 0x00, 0x00};
        REQUIRE(link.send(cmd, sizeof(cmd)) == transport::TxResult::Ok);
        const std::vector<uint8_t> expected{0xC0, 0xAE, 0x5A, 0x00, 0x00, 0xC0};
        CHECK(pty.read_some(expected.size()) == expected);
    }
    SUBCASE("nothing to read times out") {
        std::vector<uint8_t> frame;
        CHECK(link.recv_frame(frame, 20) == transport::RxResult::None);
        CHECK(link.is_open());
    }
    SUBCASE("bridge gone reads as an error and closes the link") {
        pty.close();
        std::vector<uint8_t> frame;
        CHECK(link.recv_frame(frame, 1000) == transport::RxResult::Error);
        CHECK_FALSE(link.is_open());
        const uint8_t cmd[] = {0xAE, 0x5B, 0x00, 0x00};
        CHECK(link.send(cmd, sizeof(cmd)) == transport::TxResult::Error);
    }
}

TEST_CASE("Serial link refuses a device it cannot open") {
    transport::LinuxSerialLink link;
    CHECK_FALSE(link.begin(config_for("/nonexistent/ttyHARVEST")));
    CHECK_FALSE(link.is_open());

    transport::SerialConfig empty;
    CHECK_FALSE(link.begin(empty));
}

TEST_CASE("Supported baud rates") {
    CHECK(baud_supported(9600));
    CHECK(baud_supported(115200));
    CHECK_FALSE(baud_supported(12345));
    CHECK_FALSE(baud_supported(0));
}
