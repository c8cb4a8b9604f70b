#pragma once
/**
 * @file frame_classifier.hpp
 * @brief Sort inbound notification frames into "saved-data page" vs "anything else".
 *
 * @details
 * The device multiplexes two kinds of traffic on the same notification
 * channel: structured protocol replies and free-form text from its console.
 * Only the header decides which is which:
 *
 *   len < 2                          -> Ignored   (nothing to look at)
 *   frame[0]==0xAE && frame[1]==0xDA -> DataPage  (hand to record_decoder)
 *   anything else                    -> Raw       (text + hex for the log)
 *
 * Classification never fails. A DataPage whose 4-byte header is cut short, or
 * whose declared payload length is larger than the bytes actually present,
 * is still a DataPage but carries `malformed = true`; the fetch controller
 * turns that into a decode fault instead of guessing.
 *
 * The classifier keeps no state and does not own the frame bytes.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace harvestlink {

enum class FrameKind : uint8_t { Ignored = 0, DataPage = 1, Raw = 2 };

struct Classification {
  FrameKind   kind{FrameKind::Ignored};
  uint16_t    payload_len{0};  ///< DataPage: declared length from bytes 2..3 (0 if header short)
  bool        malformed{false};///< DataPage: header short or declared length exceeds frame
  std::string text;            ///< Raw: best-effort UTF-8 decoding of the whole frame
  std::string hex;             ///< Raw: "AE 5A 00 00" style rendering of the whole frame
};

/**
 * @brief Classify one inbound frame by its header bytes.
 * @param frame Frame bytes (may be nullptr when len == 0).
 * @param len   Number of bytes in @p frame.
 */
Classification classify(const uint8_t* frame, std::size_t len);

/// Uppercase, space separated hex ("AE 5A 00 00"). Empty input gives "".
std::string to_hex(const uint8_t* data, std::size_t len);

/**
 * @brief Decode bytes as UTF-8, replacing each invalid sequence with U+FFFD.
 *
 * Matches the replacement behavior of a WHATWG TextDecoder in non-fatal mode:
 * the maximal invalid subpart collapses to a single replacement character.
 */
std::string decode_text_lossy(const uint8_t* data, std::size_t len);

} // namespace harvestlink
