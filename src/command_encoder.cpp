#include "harvestlink/command_encoder.hpp"
#include "harvestlink/protocol.hpp"

namespace harvestlink {

// ---------------------------------------------------------------------------
// Start a new command frame.
// Layout: [SOM][opcode][len lo][len hi]; commands carry no payload, so the
// length stays zero.
// ---------------------------------------------------------------------------
static inline std::vector<uint8_t> header(uint8_t opcode) {
    std::vector<uint8_t> b(protocol::HEADER_SIZE, 0);
    b[0] = protocol::SOM;
    b[1] = opcode;
    protocol::write_u16_le(&b[2], 0);
    return b;
}

std::vector<uint8_t> make_start_fetch() {
    return header(protocol::OP_SAVE_DAT_REQ);
}

std::vector<uint8_t> make_next_page() {
    return header(protocol::OP_SAVE_DAT_NEXT_REQ);
}

bool make_text(const std::string& text, std::vector<uint8_t>& out, std::string& err) {
    out.clear();
    if (text.empty()) { err = "empty_text"; return false; }
    out.assign(text.begin(), text.end());   // std::string already holds UTF-8 bytes
    return true;
}

} // namespace harvestlink
