// -----------------------------------------------------------------------------
// fetch_controller.cpp — Implementation of the saved-data pagination engine
//
// API & state diagram:
//   see include/harvestlink/fetch_controller.hpp
//
// Usage tests:
//   see tests/test_fetch_controller.cpp
//
// NOTE: This file is about *how* transitions happen (guards, ordering of log
// lines vs. sends). The contract lives in the header.
// -----------------------------------------------------------------------------
#include "harvestlink/fetch_controller.hpp"
#include "harvestlink/command_encoder.hpp"

#include <utility>

namespace harvestlink {

FetchController::FetchController(transport::ITransport* link, std::size_t log_limit)
: link_(link), log_(log_limit) {}

// ---------- public ----------

// start_fetch(): Reset the session and put SAVE_DAT_REQ on the wire.
StartResult FetchController::start_fetch() {
  // PRE: one request stream at a time
  if (session_.in_progress()) {
    log_.add(LogTag::Err, "Fetch already in progress.");
    return StartResult::Busy;
  }

  // PRE: nothing to talk through; leave the previous session as it was
  if (!link_ready()) {
    last_error_ = FetchError::TransportUnavailable;
    log_.add(LogTag::Err, "Transport not available.");
    return StartResult::Unavailable;
  }

  // Fresh session: prior records are discarded only here.
  session_ = FetchSession{};
  session_.state = FetchState::AwaitingPage;
  last_error_ = FetchError::None;
  log_.add(LogTag::Info, "Requesting saved data...");

  if (!send_command(make_start_fetch())) return StartResult::SendFailed;
  return StartResult::Started;
}

// on_frame(): Classify, then route: raw text upward, data pages to the decoder.
FrameEvent FetchController::on_frame(const uint8_t* frame, std::size_t len) {
  FrameEvent ev;
  Classification c = classify(frame, len);
  ev.kind = c.kind;

  switch (c.kind) {
    case FrameKind::Ignored:
      return ev;

    case FrameKind::Raw:
      log_.add(LogTag::In, c.hex + " (" + c.text + ")");
      ev.text = std::move(c.text);
      return ev;

    case FrameKind::DataPage:
      break;
  }

  // POLICY: a page nobody asked for (fetch finished, cancelled, or the link
  // dropped) must not leak into a session.
  if (!session_.in_progress()) {
    log_.add(LogTag::Info, "Ignoring data page: no fetch in progress.");
    ev.stale = true;
    return ev;
  }
  FrameEvent page_ev = handle_page(frame, len);
  page_ev.kind = FrameKind::DataPage;
  return page_ev;
}

void FetchController::on_disconnect() {
  log_.add(LogTag::Info, "Device disconnected.");
  if (!session_.in_progress()) return;
  fail(FetchError::Disconnected);
}

bool FetchController::cancel(FetchError why) {
  if (!session_.in_progress()) return false;
  if (why != FetchError::Timeout) why = FetchError::Cancelled;
  fail(why);
  return true;
}

bool FetchController::send_text(const std::string& text, std::string& err) {
  std::vector<uint8_t> bytes;
  if (!make_text(text, bytes, err)) return false;

  if (!link_ready()) {
    err = "transport_unavailable";
    last_error_ = FetchError::TransportUnavailable;
    log_.add(LogTag::Err, "Transport not available.");
    return false;
  }

  if (link_->send(bytes.data(), bytes.size()) != transport::TxResult::Ok) {
    err = "send_failed";
    last_error_ = FetchError::SendFailed;
    log_.add(LogTag::Err, "Failed to send message.");
    return false;
  }

  log_.add(LogTag::Out, text);
  return true;
}

// ---------- private ----------

bool FetchController::link_ready() const {
  return link_ != nullptr && link_->is_open();
}

// send_command(): One attempt; any refusal fails the fetch (no retransmit).
bool FetchController::send_command(const std::vector<uint8_t>& cmd) {
  if (!link_ready()) {
    log_.add(LogTag::Err, "Transport not available.");
    fail(FetchError::SendFailed);
    return false;
  }
  if (link_->send(cmd.data(), cmd.size()) != transport::TxResult::Ok) {
    log_.add(LogTag::Err, "Failed to send command.");
    fail(FetchError::SendFailed);
    return false;
  }
  ++session_.requests;
  log_.add(LogTag::Cmd, to_hex(cmd.data(), cmd.size()));
  return true;
}

void FetchController::fail(FetchError why) {
  session_.state = FetchState::Failed;
  session_.error = why;
  last_error_ = why;
  log_.add(LogTag::Err, std::string("Fetch failed (") + to_string(why) + "); kept "
                        + std::to_string(session_.records.size()) + " records.");
}

void FetchController::complete(CompletionReason why) {
  session_.state  = FetchState::Complete;
  session_.reason = why;
}

// -----------------------------------------------------------------------------
// handle_page(): One SAVE_DAT_REP while AwaitingPage.
// PRE:   frame classified as DataPage, session in progress.
// POLICY:
//   - Truncated page => Failed (MalformedFrame); nothing from it is appended.
//   - Otherwise append first, then decide: end_of_transfer => Complete,
//     else request the next page.
// OUT:
//   - At most one outbound command.
// -----------------------------------------------------------------------------
FrameEvent FetchController::handle_page(const uint8_t* frame, std::size_t len) {
  FrameEvent ev;
  PageResult page = decode_page(frame, len, next_id_);

  if (page.status == DecodeStatus::Truncated) {
    log_.add(LogTag::Err, "Malformed data page (" + std::to_string(len) + " bytes).");
    fail(FetchError::MalformedFrame);
    return ev;
  }

  ++session_.pages;

  if (page.reason == CompletionReason::EmptyPage) {
    log_.add(LogTag::Info, "Received empty data packet. Fetch complete.");
    complete(page.reason);
    return ev;
  }

  ev.records_added = page.records.size();
  session_.records.insert(session_.records.end(),
                          page.records.begin(), page.records.end());
  log_.add(LogTag::Info, "Received " + std::to_string(ev.records_added) + " data records.");

  if (page.end_of_transfer) {
    log_.add(LogTag::Info, "All data received.");
    complete(page.reason);
    return ev;
  }

  send_command(make_next_page());   // failure already moved us to Failed
  return ev;
}

// ---------- names ----------

const char* to_string(FetchState s) {
  switch (s) {
    case FetchState::Idle:         return "idle";
    case FetchState::AwaitingPage: return "awaiting_page";
    case FetchState::Complete:     return "complete";
    case FetchState::Failed:       return "failed";
  }
  return "unknown";
}

const char* to_string(FetchError e) {
  switch (e) {
    case FetchError::None:                 return "none";
    case FetchError::TransportUnavailable: return "transport_unavailable";
    case FetchError::SendFailed:           return "send_failed";
    case FetchError::MalformedFrame:       return "malformed_frame";
    case FetchError::Disconnected:         return "disconnected";
    case FetchError::Cancelled:            return "cancelled";
    case FetchError::Timeout:              return "timeout";
  }
  return "unknown";
}

const char* to_string(StartResult r) {
  switch (r) {
    case StartResult::Started:     return "started";
    case StartResult::Busy:        return "busy";
    case StartResult::Unavailable: return "unavailable";
    case StartResult::SendFailed:  return "send_failed";
  }
  return "unknown";
}

} // namespace harvestlink
