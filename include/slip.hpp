#pragma once

/**
 * @file slip.hpp
 * @brief SLIP framing for the BLE-UART bridge tty: one SLIP frame per BLE notification.
 *
 * @details
 * WHY FRAMING AT ALL
 * ------------------
 * On the air, the device's UART service delivers discrete notifications; a
 * saved-data page is one notification and a console line is another. A tty is
 * a byte stream and loses those boundaries. The bridge firmware therefore
 * wraps every notification it relays in a SLIP frame (RFC 1055), and the host
 * wraps every write the same way. The bridge strips the framing before the
 * bytes go back on the air.
 *
 * CODES
 * -----
 *   END     0xC0  frame boundary
 *   ESC     0xDB  escape introducer
 *   ESC_END 0xDC  ESC,ESC_END  = literal 0xC0 inside a frame
 *   ESC_ESC 0xDD  ESC,ESC_ESC  = literal 0xDB inside a frame
 *
 * Encoding: END, payload with END/ESC escaped, END.
 *
 * Decoding:
 *   - Bytes before the first END are boot noise and are skipped.
 *   - END closes a non-empty frame; END END (empty frame) is a separator.
 *   - ESC followed by anything but ESC_END/ESC_ESC drops the frame in progress
 *     and the decoder waits for the next END to resynchronize.
 *
 * Saved-data pages are full of 0xC0/0xDB bytes (floats, tree numbers), so the
 * escaping is exercised constantly, not just in theory.
 *
 * SLIP gives boundaries only. It does not detect corruption.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace harvestlink {
namespace slip {

static constexpr uint8_t END     = 0xC0;
static constexpr uint8_t ESC     = 0xDB;
static constexpr uint8_t ESC_END = 0xDC;
static constexpr uint8_t ESC_ESC = 0xDD;

/**
 * @brief Encode one payload as a complete SLIP frame.
 * @param in  Payload bytes.
 * @param n   Payload length.
 * @param out Receives the frame; cleared first.
 */
inline void encode(const uint8_t* in, std::size_t n, std::vector<uint8_t>& out) {
    out.clear();
    out.reserve(n * 2 + 2);     // worst case: every byte escapes

    out.push_back(END);
    for (std::size_t i = 0; i < n; ++i) {
        const uint8_t b = in[i];
        if (b == END)      { out.push_back(ESC); out.push_back(ESC_END); }
        else if (b == ESC) { out.push_back(ESC); out.push_back(ESC_ESC); }
        else               { out.push_back(b); }
    }
    out.push_back(END);
}

/**
 * @brief Byte-at-a-time SLIP decoder.
 *
 * State survives between feed() calls, so a frame split across several
 * read(2) results is reassembled transparently.
 */
class decoder {
public:
    /**
     * @brief Feed one byte.
     * @param b     Next byte from the tty.
     * @param frame Receives the payload when a frame completes.
     * @return true exactly when @p frame holds a newly completed payload.
     */
    bool feed(uint8_t b, std::vector<uint8_t>& frame) {
        if (b == END) {
            if (in_frame_ && !buf_.empty()) {
                frame.swap(buf_);
                buf_.clear();
                esc_ = false;
                // stay in_frame_: back-to-back frames may share one END
                return true;
            }
            buf_.clear();       // separator, or the first END after noise
            in_frame_ = true;
            esc_ = false;
            return false;
        }

        if (!in_frame_) return false;   // noise before first END

        if (esc_) {
            esc_ = false;
            if      (b == ESC_END) b = END;
            else if (b == ESC_ESC) b = ESC;
            else {
                buf_.clear();           // bad escape: drop and resync on next END
                in_frame_ = false;
                ++dropped_;
                return false;
            }
        } else if (b == ESC) {
            esc_ = true;
            return false;
        }

        buf_.push_back(b);
        return false;
    }

    /// Forget any partial frame (e.g. after reopening the port).
    void reset() {
        buf_.clear();
        esc_ = false;
        in_frame_ = false;
    }

    /// Frames discarded because of a malformed escape.
    std::size_t dropped() const { return dropped_; }

private:
    std::vector<uint8_t> buf_;
    bool esc_ = false;
    bool in_frame_ = false;
    std::size_t dropped_ = 0;
};

} // namespace slip
} // namespace harvestlink
