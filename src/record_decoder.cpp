// ============================================================================
// record_decoder.cpp — implementation for record_decoder.hpp
// Wire layout: see protocol.hpp. Termination rules: see record_decoder.hpp.
// ============================================================================

#include "harvestlink/record_decoder.hpp"
#include "harvestlink/protocol.hpp"

namespace harvestlink {

using namespace protocol;

MeasurementRecord decode_slot(const uint8_t* slot) {
  MeasurementRecord r;
  r.category = slot[OFF_CATEGORY];

  r.timestamp.year   = static_cast<uint16_t>(YEAR_EPOCH + slot[OFF_YEAR]);
  r.timestamp.month  = slot[OFF_MONTH];
  r.timestamp.day    = slot[OFF_DAY];
  r.timestamp.hour   = slot[OFF_HOUR];
  r.timestamp.minute = slot[OFF_MINUTE];
  r.timestamp.second = slot[OFF_SECOND];

  r.temperature = read_f32_le(slot + OFF_TEMPERATURE);
  r.tree_no     = read_u16_le(slot + OFF_TREE_NO);
  r.defect_code = read_u16_le(slot + OFF_DEFECT_CODE);

  for (std::size_t j = 0; j < RESULT_COUNT; ++j)
    r.results[j] = read_f32_le(slot + OFF_RESULTS + j * 4);
  return r;
}

// ---------------------------------------------------------------------------
// decode_page()
// -------------
// Phases:
//   1) header + declared length sanity (Truncated on any shortfall),
//   2) empty page => done,
//   3) walk slots until sentinel or slots exhausted,
//   4) apply the short-page rule independently of the sentinel rule.
// ---------------------------------------------------------------------------
PageResult decode_page(const uint8_t* frame, std::size_t len, uint64_t& next_id) {
  PageResult res;

  // 1) The header has to be there before the length can be trusted.
  if (!frame || len < HEADER_SIZE) {
    res.status = DecodeStatus::Truncated;
    return res;
  }
  res.payload_len = read_u16_le(frame + 2);
  if (res.payload_len > len - HEADER_SIZE) {
    res.status = DecodeStatus::Truncated;   // header claims bytes we don't have
    return res;
  }

  // 2) Zero-length page: the device has nothing left.
  if (res.payload_len == 0) {
    res.end_of_transfer = true;
    res.reason = CompletionReason::EmptyPage;
    return res;
  }

  // 3) Slots are whole 43-byte chunks; a trailing partial chunk is ignored.
  res.slots = res.payload_len / RECORD_SIZE;
  res.records.reserve(res.slots);

  bool sentinel = false;
  for (std::size_t i = 0; i < res.slots; ++i) {
    const uint8_t* slot = frame + HEADER_SIZE + i * RECORD_SIZE;
    if (slot[OFF_CATEGORY] == CATEGORY_TERMINATOR) {
      sentinel = true;
      break;                                // nothing past the sentinel is read
    }
    MeasurementRecord r = decode_slot(slot);
    r.id = next_id++;
    res.records.push_back(r);
  }

  // 4) Both rules stand on their own; sentinel wins the reason when both fire.
  if (sentinel) {
    res.end_of_transfer = true;
    res.reason = CompletionReason::Sentinel;
  } else if (res.slots < FULL_PAGE_SLOTS) {
    res.end_of_transfer = true;
    res.reason = CompletionReason::ShortPage;
  }
  return res;
}

const char* to_string(CompletionReason r) {
  switch (r) {
    case CompletionReason::None:      return "none";
    case CompletionReason::Sentinel:  return "sentinel";
    case CompletionReason::ShortPage: return "short_page";
    case CompletionReason::EmptyPage: return "empty_page";
  }
  return "unknown";
}

} // namespace harvestlink
