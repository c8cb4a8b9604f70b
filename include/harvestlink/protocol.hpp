#pragma once
/**
 * @file protocol.hpp
 * @brief H100 saved-data protocol: named wire constants and little-endian field readers.
 *
 * @details
 * WIRE FORMAT
 * -----------
 * Every structured reply from the device has the same 4-byte header:
 *
 *   [0xAE][opcode:1][payload_len:u16 LE][payload: payload_len bytes]
 *
 * The only reply the host interprets is SAVE_DAT_REP (0xDA). Its payload is a
 * run of fixed 43-byte record slots:
 *
 *   off  size  field
 *   ---  ----  -----------------------------------------------
 *    0    1    category (fruit index); 0 = terminator slot
 *    1    1    year offset (actual year = value + 2000)
 *    2    1    month
 *    3    1    day
 *    4    1    hour
 *    5    1    minute
 *    6    1    second
 *    7    4    temperature (f32)
 *   15    2    tree number (u16)
 *   21    2    defect code (u16)
 *   23   20    five computed results (f32 x 5)
 *
 * Bytes 11..14, 17..20 are reserved by the firmware and never read.
 *
 * Outbound commands are header-only frames (payload length 0):
 *   SAVE_DAT_REQ       AE 5A 00 00   start a saved-data transfer
 *   SAVE_DAT_NEXT_REQ  AE 5B 00 00   request the next page
 *
 * All multi-byte integers and floats are little-endian on the wire. The
 * readers below assemble values byte by byte so host endianness and buffer
 * alignment never matter.
 */

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace harvestlink {
namespace protocol {

// Framing
static constexpr uint8_t SOM = 0xAE;              ///< Start-of-message marker (byte 0)
static constexpr std::size_t HEADER_SIZE = 4;     ///< SOM + opcode + u16 length
static constexpr std::size_t MIN_FRAME_SIZE = 2;  ///< Shorter frames are ignored outright

// Opcodes
static constexpr uint8_t OP_SAVE_DAT_REQ      = 0x5A;  ///< host -> device: begin transfer
static constexpr uint8_t OP_SAVE_DAT_NEXT_REQ = 0x5B;  ///< host -> device: next page
static constexpr uint8_t OP_SAVE_DAT_REP      = 0xDA;  ///< device -> host: one page of records

// Record slot geometry
static constexpr std::size_t RECORD_SIZE = 43;      ///< Bytes per slot
static constexpr std::size_t RESULT_COUNT = 5;      ///< Computed results per record
static constexpr std::size_t FULL_PAGE_SLOTS = 50;  ///< Slots in a page that is not the last one
static constexpr uint16_t    YEAR_EPOCH = 2000;     ///< Year byte is an offset from this

// Offsets relative to the slot start
static constexpr std::size_t OFF_CATEGORY    = 0;
static constexpr std::size_t OFF_YEAR        = 1;
static constexpr std::size_t OFF_MONTH       = 2;
static constexpr std::size_t OFF_DAY         = 3;
static constexpr std::size_t OFF_HOUR        = 4;
static constexpr std::size_t OFF_MINUTE      = 5;
static constexpr std::size_t OFF_SECOND      = 6;
static constexpr std::size_t OFF_TEMPERATURE = 7;
static constexpr std::size_t OFF_TREE_NO     = 15;
static constexpr std::size_t OFF_DEFECT_CODE = 21;
static constexpr std::size_t OFF_RESULTS     = 23;

static constexpr uint8_t CATEGORY_TERMINATOR = 0;  ///< Category value marking the end of data

static_assert(OFF_RESULTS + RESULT_COUNT * 4 == RECORD_SIZE,
              "result block must close the record slot");

// ---------------------------------------------------------------------------
// Little-endian readers. Caller guarantees p[0..N) is readable.
// ---------------------------------------------------------------------------
inline uint16_t read_u16_le(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

inline uint32_t read_u32_le(const uint8_t* p) {
  return  static_cast<uint32_t>(p[0])
       | (static_cast<uint32_t>(p[1]) << 8)
       | (static_cast<uint32_t>(p[2]) << 16)
       | (static_cast<uint32_t>(p[3]) << 24);
}

inline float read_f32_le(const uint8_t* p) {
  uint32_t bits = read_u32_le(p);
  float f;
  std::memcpy(&f, &bits, sizeof(f));  // bit copy, no numeric conversion
  return f;
}

// Writers mirror the readers; used by the host to build frames and by tests
// to synthesize device pages.
inline void write_u16_le(uint8_t* p, uint16_t v) {
  p[0] = static_cast<uint8_t>(v & 0xFF);
  p[1] = static_cast<uint8_t>(v >> 8);
}

inline void write_u32_le(uint8_t* p, uint32_t v) {
  p[0] = static_cast<uint8_t>(v & 0xFF);
  p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  p[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  p[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

inline void write_f32_le(uint8_t* p, float f) {
  uint32_t bits;
  std::memcpy(&bits, &f, sizeof(bits));
  write_u32_le(p, bits);
}

} // namespace protocol
} // namespace harvestlink
