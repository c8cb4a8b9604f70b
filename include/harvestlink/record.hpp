#pragma once
/**
 * @file record.hpp
 * @brief One decoded saved-data measurement, as the host sees it.
 *
 * A MeasurementRecord is the host-side image of a 43-byte record slot (see
 * protocol.hpp for the wire layout). Values are kept exactly as the device
 * sent them: no unit conversion, no calendar normalization.
 *
 * The `id` field is NOT on the wire. The fetch controller hands out ids in
 * arrival order so a display can correlate rows; nothing in decoding or
 * completion logic looks at it.
 */

#include <array>
#include <cstdint>
#include <string>

#include "harvestlink/protocol.hpp"

namespace harvestlink {

/// Six raw calendar bytes from the slot, with the year already rebased.
struct Timestamp {
  uint16_t year{0};    ///< 2000 + year byte
  uint8_t  month{0};   ///< 1..12 as sent (not validated)
  uint8_t  day{0};
  uint8_t  hour{0};
  uint8_t  minute{0};
  uint8_t  second{0};

  /// "YYYY-MM-DD HH:MM:SS", zero padded.
  std::string to_string() const;

  bool operator==(const Timestamp& o) const {
    return year == o.year && month == o.month && day == o.day &&
           hour == o.hour && minute == o.minute && second == o.second;
  }
  bool operator!=(const Timestamp& o) const { return !(*this == o); }
};

struct MeasurementRecord {
  uint64_t  id{0};          ///< Local display id (host-assigned, not on the wire)
  Timestamp timestamp{};
  uint8_t   category{0};    ///< Fruit index; never 0 for a decoded record
  float     temperature{0.0f};
  uint16_t  tree_no{0};
  uint16_t  defect_code{0};
  std::array<float, protocol::RESULT_COUNT> results{};  ///< Computed results, device order
};

} // namespace harvestlink
