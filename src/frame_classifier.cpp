// ============================================================================
// frame_classifier.cpp — implementation for frame_classifier.hpp
// For the routing rules see the matching .hpp.
// ============================================================================

#include "harvestlink/frame_classifier.hpp"
#include "harvestlink/protocol.hpp"

namespace harvestlink {

namespace {

const char* const REPLACEMENT = "\xEF\xBF\xBD";  // U+FFFD in UTF-8

} // namespace

Classification classify(const uint8_t* frame, std::size_t len) {
  Classification c;
  if (!frame || len < protocol::MIN_FRAME_SIZE) return c;  // Ignored

  if (frame[0] == protocol::SOM && frame[1] == protocol::OP_SAVE_DAT_REP) {
    c.kind = FrameKind::DataPage;
    if (len < protocol::HEADER_SIZE) {
      c.malformed = true;                  // length field missing
      return c;
    }
    c.payload_len = protocol::read_u16_le(frame + 2);
    c.malformed = c.payload_len > len - protocol::HEADER_SIZE;
    return c;
  }

  c.kind = FrameKind::Raw;
  c.text = decode_text_lossy(frame, len);
  c.hex  = to_hex(frame, len);
  return c;
}

std::string to_hex(const uint8_t* data, std::size_t len) {
  static const char* DIGITS = "0123456789ABCDEF";
  std::string out;
  if (!data || len == 0) return out;
  out.reserve(len * 3);
  for (std::size_t i = 0; i < len; ++i) {
    if (i) out.push_back(' ');
    out.push_back(DIGITS[data[i] >> 4]);
    out.push_back(DIGITS[data[i] & 0x0F]);
  }
  return out;
}

// ---------------------------------------------------------------------------
// decode_text_lossy()
// -------------------
// Walk the buffer one code point at a time. For a lead byte we know how many
// continuation bytes to expect and the legal range of the first one (this is
// what rejects overlongs and surrogates). On the first bad byte the bytes
// consumed so far become one U+FFFD and scanning resumes at the bad byte.
// ---------------------------------------------------------------------------
std::string decode_text_lossy(const uint8_t* data, std::size_t len) {
  std::string out;
  if (!data) return out;
  out.reserve(len);

  std::size_t i = 0;
  while (i < len) {
    const uint8_t b = data[i];
    if (b < 0x80) { out.push_back(static_cast<char>(b)); ++i; continue; }

    std::size_t need = 0;
    uint8_t lo = 0x80, hi = 0xBF;
    if      (b >= 0xC2 && b <= 0xDF) { need = 1; }
    else if (b == 0xE0)              { need = 2; lo = 0xA0; }
    else if (b >= 0xE1 && b <= 0xEC) { need = 2; }
    else if (b == 0xED)              { need = 2; hi = 0x9F; }
    else if (b >= 0xEE && b <= 0xEF) { need = 2; }
    else if (b == 0xF0)              { need = 3; lo = 0x90; }
    else if (b >= 0xF1 && b <= 0xF3) { need = 3; }
    else if (b == 0xF4)              { need = 3; hi = 0x8F; }
    else {
      out += REPLACEMENT;                 // stray continuation or invalid lead
      ++i;
      continue;
    }

    std::size_t k = 1;
    for (; k <= need; ++k) {
      if (i + k >= len) break;
      const uint8_t c = data[i + k];
      if (c < lo || c > hi) break;
      lo = 0x80; hi = 0xBF;               // only the first continuation is narrowed
    }

    if (k > need) {
      out.append(reinterpret_cast<const char*>(data + i), need + 1);
      i += need + 1;
    } else {
      out += REPLACEMENT;
      i += k;                             // resume at the offending byte
    }
  }
  return out;
}

} // namespace harvestlink
