#pragma once
/**
 * @file traffic_log.hpp
 * @brief Bounded, read-only log of what crossed the link (commands, raw traffic, fetch notes).
 *
 * @details
 * The log is the operator's view of the conversation with the device:
 *
 *   [INFO] Requesting saved data...
 *   [CMD] AE 5A 00 00
 *   [INFO] Received 50 data records.
 *   [CMD] AE 5B 00 00
 *   [INFO] Received 12 data records.
 *   [INFO] All data received.
 *   [IN] 4F 4B (OK)
 *
 * Only the fetch controller writes to it; callers read it for display. It is
 * a projection, never an input: nothing in the engine looks back at the log.
 *
 * Memory is fixed: at most CAPACITY entries of at most LINE_MAX bytes each,
 * held in ETL containers. When full, the oldest entry is dropped. Lines that
 * do not fit are cut and end with "...". A runtime limit below CAPACITY can
 * be set for small displays.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "etl/deque.h"
#include "etl/string.h"

namespace harvestlink {

enum class LogTag : uint8_t { Cmd = 0, In = 1, Out = 2, Info = 3, Err = 4 };

/// "CMD", "IN", "OUT", "INFO", "ERR".
const char* to_string(LogTag tag);

class TrafficLog {
public:
  static constexpr std::size_t CAPACITY = 256;  ///< Max entries held
  static constexpr std::size_t LINE_MAX = 200;  ///< Max bytes of text per entry

  using LineStr = etl::string<LINE_MAX>;

  struct Entry {
    LogTag  tag{LogTag::Info};
    LineStr text;
  };

  TrafficLog() = default;
  explicit TrafficLog(std::size_t limit) { set_limit(limit); }

  /// Append one entry, evicting the oldest when the limit is reached.
  void add(LogTag tag, const std::string& text);

  /// Cap the number of retained entries (clamped to 1..CAPACITY).
  void set_limit(std::size_t limit);
  std::size_t limit() const { return limit_; }

  std::size_t size() const  { return entries_.size(); }
  bool        empty() const { return entries_.empty(); }
  void        clear()       { entries_.clear(); }

  /// Entries evicted since construction.
  uint32_t dropped() const { return dropped_; }

  const Entry& operator[](std::size_t i) const { return entries_[i]; }

  /// Rendered line for entry @p i: "[TAG] text".
  std::string line(std::size_t i) const;

  /// Rendered line of the newest entry, or "" when empty.
  std::string last_line() const;

private:
  etl::deque<Entry, CAPACITY> entries_;
  std::size_t limit_{CAPACITY};
  uint32_t    dropped_{0};
};

} // namespace harvestlink
