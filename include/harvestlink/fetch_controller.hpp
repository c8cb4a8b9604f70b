/**
 * @file fetch_controller.hpp
 * @brief Saved-data pagination engine: start, page, page, ..., done (or failed).
 *
 * @details
 * ## What it does
 * FetchController drives one multi-page retrieval of the device's saved
 * measurements. It owns the FetchSession (records so far + status) and the
 * TrafficLog, and talks to the link only through transport::ITransport::send().
 *
 * It does not read from the link. The host loop pulls frames and pushes them
 * in; the controller reacts and, when another page is needed, sends the next
 * request itself:
 *
 * ```
 *   host loop                    FetchController                   link
 *   ---------                    ---------------                   ----
 *   start_fetch()  ───────────►  Idle -> AwaitingPage  ── AE 5A 00 00 ──►
 *   recv_frame() ─► on_frame() ► classify ─► decode_page
 *                                   │ end_of_transfer == false
 *                                   └──────────────────── AE 5B 00 00 ──►
 *   recv_frame() ─► on_frame() ► ... end_of_transfer == true -> Complete
 *   hangup       ─► on_disconnect() ─► AwaitingPage -> Failed
 * ```
 *
 * ## States
 * - **Idle**          nothing requested yet.
 * - **AwaitingPage**  a request is out; the next data page belongs to this fetch.
 * - **Complete**      a page reported end-of-transfer (empty, sentinel, short).
 * - **Failed**        send failure, malformed page, disconnect, cancel, timeout.
 *
 * Complete and Failed are terminal for the attempt. start_fetch() from
 * Idle/Complete/Failed begins a fresh session and discards the old records.
 * start_fetch() while AwaitingPage is rejected (StartResult::Busy); there is
 * never more than one request stream in flight.
 *
 * ## Guarantees
 * - Records are appended in arrival order; never reordered, never deduped.
 * - A fetch leaves AwaitingPage exactly once.
 * - On failure the records gathered so far stay in the session.
 * - Data pages that arrive while no fetch is in flight (after cancel,
 *   disconnect, or completion) are logged and dropped, never appended.
 * - Nothing is retried automatically; retry means calling start_fetch() again.
 *
 * ## Not thread-safe
 * Drive it from one thread (the host loop). Readers of session() and log()
 * must be on that same thread.
 */
#ifndef HARVESTLINK_FETCH_CONTROLLER_HPP
#define HARVESTLINK_FETCH_CONTROLLER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "harvestlink/frame_classifier.hpp"
#include "harvestlink/record.hpp"
#include "harvestlink/record_decoder.hpp"
#include "harvestlink/traffic_log.hpp"
#include "harvestlink/transport/transport_base.hpp"

namespace harvestlink {

enum class FetchState : uint8_t { Idle = 0, AwaitingPage = 1, Complete = 2, Failed = 3 };

enum class FetchError : uint8_t {
  None = 0,
  TransportUnavailable,  ///< No link, or link not open; nothing was sent
  SendFailed,            ///< Link rejected a write (Error or Busy)
  MalformedFrame,        ///< Data page declared more bytes than it carried
  Disconnected,          ///< Link dropped while a page was expected
  Cancelled,             ///< Caller aborted
  Timeout                ///< Host loop stopped waiting for the next page
};

enum class StartResult : uint8_t { Started = 0, Busy, Unavailable, SendFailed };

/// Caller-visible aggregate of one fetch attempt.
struct FetchSession {
  FetchState       state{FetchState::Idle};
  std::vector<MeasurementRecord> records;       ///< Append-only across pages
  CompletionReason reason{CompletionReason::None};
  FetchError       error{FetchError::None};
  uint32_t         pages{0};                    ///< Data pages accepted this attempt
  uint32_t         requests{0};                 ///< Commands successfully sent this attempt

  bool in_progress() const { return state == FetchState::AwaitingPage; }
};

/// What on_frame() made of one inbound frame.
struct FrameEvent {
  FrameKind   kind{FrameKind::Ignored};
  std::size_t records_added{0};   ///< DataPage: records appended to the session
  bool        stale{false};       ///< DataPage arrived with no fetch in flight (dropped)
  std::string text;               ///< Raw: decoded text for the caller
};

class FetchController {
public:
  /**
   * @param link      Non-owning; may be nullptr (start_fetch() then reports
   *                  Unavailable). Must outlive the controller or be reset.
   * @param log_limit Traffic log entry limit (clamped to TrafficLog::CAPACITY).
   */
  explicit FetchController(transport::ITransport* link = nullptr,
                           std::size_t log_limit = TrafficLog::CAPACITY);

  void set_transport(transport::ITransport* link) { link_ = link; }

  /// Begin a new fetch: reset the session, send SAVE_DAT_REQ.
  StartResult start_fetch();

  /// Feed one inbound notification frame.
  FrameEvent on_frame(const uint8_t* frame, std::size_t len);
  FrameEvent on_frame(const std::vector<uint8_t>& frame) { return on_frame(frame.data(), frame.size()); }

  /// Link went away. Fails an in-flight fetch; records are kept.
  void on_disconnect();

  /**
   * @brief Abort an in-flight fetch.
   * @param why Cancelled (default) or Timeout.
   * @return true if a fetch was in flight and is now Failed.
   */
  bool cancel(FetchError why = FetchError::Cancelled);

  /**
   * @brief Send operator text to the device console (no framing).
   * @param err Set to "empty_text", "transport_unavailable" or "send_failed".
   * @return true when the link accepted the bytes.
   *
   * Independent of the fetch session: a failed text send does not end a fetch.
   */
  bool send_text(const std::string& text, std::string& err);

  const FetchSession& session() const { return session_; }
  FetchState state() const { return session_.state; }
  bool in_progress() const { return session_.in_progress(); }

  /// Most recent error from any operation, including ones that left the session alone.
  FetchError last_error() const { return last_error_; }

  const TrafficLog& log() const { return log_; }
  TrafficLog&       log()       { return log_; }

private:
  bool link_ready() const;
  bool send_command(const std::vector<uint8_t>& cmd);
  void fail(FetchError why);
  void complete(CompletionReason why);
  FrameEvent handle_page(const uint8_t* frame, std::size_t len);

  transport::ITransport* link_{nullptr};
  FetchSession session_{};
  TrafficLog   log_{};
  FetchError   last_error_{FetchError::None};
  uint64_t     next_id_{1};   ///< Display ids, monotonic for the controller's lifetime
};

const char* to_string(FetchState s);
const char* to_string(FetchError e);
const char* to_string(StartResult r);

} // namespace harvestlink

#endif // HARVESTLINK_FETCH_CONTROLLER_HPP
