/**
 * @file main.cpp
 * @brief harvestlink-cli: fetch saved measurements from an H100 tester, or talk to its console.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and merge them over the JSON config file.
 *  - Open the BLE-UART bridge tty (LinuxSerialLink) and drive FetchController:
 *    start_fetch() → recv_frame() → on_frame() ... until the session settles.
 *  - Render the session as pretty lines, JSON, or CSV (stdout or --out file).
 *  - Report the outcome as one "status=... key=value" line on stderr.
 *
 * Modes (pick one):
 *   --fetch              pull the saved-data history
 *   --send <text>        write text to the device console (optionally --listen after)
 *   --listen <ms>        print inbound traffic for a while
 *
 * Exit codes:
 *   0 ok, 1 open/write failure, 2 usage, 3 fetch timeout,
 *   4 fetch failed (malformed page, disconnect, send failure), 5 config error.
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"

#include "harvestlink/fetch_controller.hpp"
#include "harvestlink/transport/transport_linux_serial.hpp"
#include "atomic_file.hpp"
#include "link_config.hpp"
#include "record_export.hpp"

namespace fs = std::filesystem;
using namespace harvestlink;

// ---------- small utilities ----------

// Echo log lines added since the last call. `seen` counts every entry ever
// written (evicted ones included), so eviction never causes repeats.
static void drain_log(const TrafficLog& log, uint64_t& seen, std::ostream& os) {
  const uint64_t total = uint64_t(log.dropped()) + log.size();
  if (total <= seen) return;
  uint64_t fresh = total - seen;
  if (fresh > log.size()) fresh = log.size();
  for (std::size_t i = log.size() - static_cast<std::size_t>(fresh); i < log.size(); ++i)
    os << log.line(i) << "\n";
  seen = total;
}

static int exit_code_for(const FetchSession& s) {
  if (s.state == FetchState::Complete) return 0;
  if (s.error == FetchError::Timeout)  return 3;
  return 4;
}

static std::string render(const FetchSession& s, const std::string& format) {
  std::ostringstream os;
  if (format == "json") {
    os << session_to_json(s).dump(2) << "\n";
  } else if (format == "csv") {
    write_csv(s.records, os);
  } else {
    for (const auto& r : s.records) os << format_record_line(r) << "\n";
  }
  return os.str();
}

// ---------- main ----------

int main(int argc, char** argv) {
  // mode
  bool opt_fetch = false;
  std::string opt_send;
  int opt_listen_ms = 0;

  // link overrides (unset => config file => defaults)
  std::string opt_dev;
  int opt_baud = 0, opt_boot_delay = -1, opt_timeout = -1;

  // output
  std::string opt_format = "pretty";
  std::string opt_out;
  bool opt_verbose = false;

  // config
  std::string opt_config;
  bool opt_save_config = false;

  CLI::App app{"HarvestLink CLI: saved-data fetch and console for H100 testers"};

  app.add_flag("--fetch", opt_fetch, "Fetch all saved measurement records");
  app.add_option("--send", opt_send, "Send text to the device console");
  app.add_option("--listen", opt_listen_ms, "Print inbound traffic for <ms> milliseconds")
     ->check(CLI::Range(0, 24 * 3600 * 1000));

  app.add_option("--dev", opt_dev, "Serial device of the BLE-UART bridge");
  app.add_option("--baud", opt_baud, "Baud rate (default 115200)");
  app.add_option("--boot-delay", opt_boot_delay, "Delay after open (ms) to let USB reset");
  app.add_option("--timeout", opt_timeout, "Max wait per page (ms)");

  app.add_option("--format", opt_format, "Output format: pretty|json|csv")
     ->check(CLI::IsMember({"pretty", "json", "csv"}));
  app.add_option("--out", opt_out, "Write records to a file instead of stdout");
  app.add_flag("--verbose", opt_verbose, "Echo the traffic log to stderr");

  app.add_option("--config", opt_config, "Config file (default $XDG_CONFIG_HOME/harvestlink/link.json)");
  app.add_flag("--save-config", opt_save_config, "Persist the effective link settings");

  CLI11_PARSE(app, argc, argv);

  // -------- mode check --------
  const bool do_send = !opt_send.empty();
  if (opt_fetch && (do_send || opt_listen_ms > 0)) {
    std::cerr << "status=error reason=fetch_is_exclusive\n";
    return 2;
  }
  if (!opt_fetch && !do_send && opt_listen_ms <= 0 && !opt_save_config) {
    std::cerr << "status=error reason=need_fetch_send_or_listen\n";
    return 2;
  }

  // -------- config: defaults < file < flags --------
  LinkConfig cfg;
  fs::path cfg_path = opt_config.empty() ? default_config_path() : fs::path(opt_config);
  std::string cerr_reason;
  if (!load_link_config(cfg_path, cfg, cerr_reason)) {
    std::cerr << "status=error reason=config detail=" << cerr_reason << " path=" << cfg_path.string() << "\n";
    return 5;
  }
  if (!opt_dev.empty())    cfg.dev = opt_dev;
  if (opt_baud > 0)        cfg.baud = opt_baud;
  if (opt_boot_delay >= 0) cfg.boot_delay_ms = opt_boot_delay;
  if (opt_timeout >= 0)    cfg.timeout_ms = opt_timeout;

  if (!baud_supported(cfg.baud)) {
    std::cerr << "status=error reason=bad_baud baud=" << cfg.baud << "\n";
    return 2;
  }

  if (opt_save_config) {
    if (!save_link_config(cfg_path, cfg, cerr_reason)) {
      std::cerr << "status=error reason=config detail=" << cerr_reason << " path=" << cfg_path.string() << "\n";
      return 5;
    }
    if (!opt_fetch && !do_send && opt_listen_ms <= 0) {
      std::cerr << "status=ok saved=" << cfg_path.string() << "\n";
      return 0;
    }
  }

  // -------- open link --------
  transport::LinuxSerialLink link;
  transport::SerialConfig sc;
  sc.path = cfg.dev;
  sc.baud = cfg.baud;
  sc.boot_delay_ms = cfg.boot_delay_ms;
  if (!link.begin(sc)) {
    std::cerr << "status=error reason=open_failed dev=" << cfg.dev << "\n";
    return 1;
  }

  FetchController ctl(&link, cfg.log_capacity);
  uint64_t log_seen = 0;
  std::vector<uint8_t> frame;

  // -------- fetch --------
  if (opt_fetch) {
    StartResult sr = ctl.start_fetch();
    if (sr != StartResult::Started) {
      if (opt_verbose) drain_log(ctl.log(), log_seen, std::cerr);
      std::cerr << "status=error reason=" << to_string(sr) << "\n";
      return sr == StartResult::SendFailed ? 1 : 4;
    }

    while (ctl.in_progress()) {
      switch (link.recv_frame(frame, cfg.timeout_ms)) {
        case transport::RxResult::Ok:    ctl.on_frame(frame); break;
        case transport::RxResult::None:  ctl.cancel(FetchError::Timeout); break;
        case transport::RxResult::Error: ctl.on_disconnect(); break;
      }
      if (opt_verbose) drain_log(ctl.log(), log_seen, std::cerr);
    }

    const FetchSession& s = ctl.session();
    const std::string body = render(s, opt_format);
    if (!opt_out.empty()) {
      std::string werr;
      if (!atomic_write_file(opt_out, body, werr)) {
        std::cerr << "status=error reason=" << werr << " path=" << opt_out << "\n";
        return 1;
      }
    } else {
      std::cout << body;
    }

    std::cerr << summary_line(s) << "\n";
    return exit_code_for(s);
  }

  // -------- console: send and/or listen --------
  if (do_send) {
    std::string err;
    if (!ctl.send_text(opt_send, err)) {
      if (opt_verbose) drain_log(ctl.log(), log_seen, std::cerr);
      std::cerr << "status=error reason=" << err << "\n";
      return 1;
    }
  }

  if (opt_listen_ms > 0) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(opt_listen_ms);
    while (true) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
      if (left <= 0) break;
      transport::RxResult rx = link.recv_frame(frame, static_cast<int>(left));
      if (rx == transport::RxResult::Ok) {
        FrameEvent ev = ctl.on_frame(frame);
        if (ev.kind == FrameKind::Raw) std::cout << ev.text << "\n";
      } else if (rx == transport::RxResult::Error) {
        ctl.on_disconnect();
        if (opt_verbose) drain_log(ctl.log(), log_seen, std::cerr);
        std::cerr << "status=error reason=disconnected\n";
        return 4;
      }
      if (opt_verbose) drain_log(ctl.log(), log_seen, std::cerr);
    }
  }

  if (opt_verbose) drain_log(ctl.log(), log_seen, std::cerr);
  std::cerr << "status=ok\n";
  return 0;
}
