#pragma once
/**
 * @file command_encoder.hpp
 * @brief Outbound request builders: saved-data commands and free-text pass-through.
 *
 * @details
 * Two kinds of bytes leave the host:
 *
 *  - Protocol commands. Fixed 4-byte frames with an empty payload:
 *      make_start_fetch()  -> AE 5A 00 00  (SAVE_DAT_REQ)
 *      make_next_page()    -> AE 5B 00 00  (SAVE_DAT_NEXT_REQ)
 *    These are constants and cannot fail.
 *
 *  - Free text. The operator's string is sent as its UTF-8 bytes with no
 *    header, no terminator, no escaping. The device console reads it as-is.
 *    The only rule is that the text is not empty.
 *
 * The builders only fill byte vectors; getting them onto the link is the
 * transport's job (see transport/transport_base.hpp).
 */

#include <cstdint>
#include <string>
#include <vector>

namespace harvestlink {

/// SAVE_DAT_REQ: ask the device to start streaming saved records.
std::vector<uint8_t> make_start_fetch();

/// SAVE_DAT_NEXT_REQ: ask for the page after the one just received.
std::vector<uint8_t> make_next_page();

/**
 * @brief Encode operator text for the console pass-through path.
 * @param text UTF-8 text to send (not modified, not framed).
 * @param out  Receives the bytes on success; cleared first.
 * @param err  Set to "empty_text" on failure.
 * @return false only when @p text is empty.
 */
bool make_text(const std::string& text, std::vector<uint8_t>& out, std::string& err);

} // namespace harvestlink
