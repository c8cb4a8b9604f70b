#pragma once
/**
 * @file record_decoder.hpp
 * @brief Decode one SAVE_DAT_REP page into measurement records.
 *
 * @details
 * PURPOSE
 * -------
 * Turn the payload of a saved-data reply into an ordered list of
 * MeasurementRecord values, and answer one question for the fetch controller:
 * "is this the last page?"
 *
 * END-OF-TRANSFER RULES
 * ---------------------
 * A page ends the transfer when ANY of these holds (independent OR):
 *   1. EmptyPage  declared payload length is 0.
 *   2. Sentinel   a slot with category 0 was reached. Decoding stops at that
 *                   slot; nothing after it in the page is interpreted.
 *   3. ShortPage  the page has fewer than FULL_PAGE_SLOTS (50) slots.
 *
 * Rules 2 and 3 can both apply (a sentinel in a short page); the reported
 * reason is then Sentinel. A page of 50 or more slots with no sentinel asks
 * for another page.
 *
 * Slot count is floor(payload_len / 43); a trailing partial slot is ignored.
 *
 * BOUNDS
 * ------
 * The frame must hold its 4-byte header and every byte the header declares.
 * If it does not, the result is DecodeStatus::Truncated with no records, and
 * the decoder touches nothing past the buffer. A well-formed page is never
 * read beyond offset 4 + floor(payload_len / 43) * 43; extra trailing bytes
 * past the declared length are ignored.
 *
 * EXAMPLE
 * -------
 * @code
 *   uint64_t next_id = 1;
 *   auto page = harvestlink::decode_page(frame.data(), frame.size(), next_id);
 *   if (page.status == harvestlink::DecodeStatus::Ok) {
 *     for (auto& r : page.records) show(r);
 *     if (!page.end_of_transfer) request_next_page();
 *   }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "harvestlink/record.hpp"

namespace harvestlink {

enum class DecodeStatus : uint8_t { Ok = 0, Truncated = 1 };

/// Why a transfer ended. None means "not ended (yet)".
enum class CompletionReason : uint8_t { None = 0, Sentinel = 1, ShortPage = 2, EmptyPage = 3 };

struct PageResult {
  DecodeStatus status{DecodeStatus::Ok};
  std::vector<MeasurementRecord> records;   ///< Decoded records, slot order
  bool end_of_transfer{false};
  CompletionReason reason{CompletionReason::None};
  uint16_t payload_len{0};                  ///< Declared length from the header
  std::size_t slots{0};                     ///< floor(payload_len / RECORD_SIZE)
};

/**
 * @brief Decode a full SAVE_DAT_REP frame (header included).
 *
 * @param frame   Frame bytes starting at the 0xAE marker.
 * @param len     Number of bytes available at @p frame.
 * @param next_id In/out id counter; each decoded record takes the current
 *                value and advances it by one.
 *
 * The caller is expected to have classified the frame as a DataPage; the
 * marker and opcode bytes are not re-checked here.
 */
PageResult decode_page(const uint8_t* frame, std::size_t len, uint64_t& next_id);

/**
 * @brief Decode one 43-byte slot whose category is known to be nonzero.
 * @param slot Pointer to the first byte of the slot (RECORD_SIZE readable bytes).
 */
MeasurementRecord decode_slot(const uint8_t* slot);

/// snake_case token for logs ("sentinel", "short_page", ...).
const char* to_string(CompletionReason r);

} // namespace harvestlink
