/**
 * @file link_config.hpp
 * @brief Persistent defaults for harvestlink-cli (device path, baud, timeouts).
 *
 * @details
 * LOCATION
 * --------
 *   $XDG_CONFIG_HOME/harvestlink/link.json
 *   fallback: $HOME/.config/harvestlink/link.json
 *
 * FORMAT
 * ------
 * @code
 *   {
 *     "dev": "/dev/serial/by-id/usb-Nordic_UART_Bridge-if00",
 *     "baud": 115200,
 *     "boot_delay_ms": 400,
 *     "timeout_ms": 3000,
 *     "log_capacity": 256
 *   }
 * @endcode
 * Every key is optional; absent keys keep their built-in default. Unknown keys
 * are ignored so newer files still load.
 *
 * PRECEDENCE
 * ----------
 *   built-in defaults < config file < command-line flags
 *
 * FAILURE MODES
 * -------------
 * - Missing file: not an error, defaults stand.
 * - Unparseable JSON, a key with the wrong type, an unsupported baud or a
 *   negative timeout: load_link_config() returns false with a short reason
 *   ("bad_json", "bad_type:baud", "bad_value:baud", ...).
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

#include "harvestlink/traffic_log.hpp"

namespace harvestlink {

struct LinkConfig {
    std::string dev{"/dev/ttyACM0"};
    int baud{115200};
    int boot_delay_ms{400};
    int timeout_ms{3000};                           ///< Per-page wait in the fetch loop
    std::size_t log_capacity{TrafficLog::CAPACITY};
};

/// Resolve the per-user config file path (directory may not exist yet).
std::filesystem::path default_config_path();

/**
 * @brief Overlay values from a JSON file onto @p cfg.
 * @return true if the file is absent or valid; false with @p err otherwise.
 *         On failure @p cfg is left unchanged.
 */
bool load_link_config(const std::filesystem::path& path, LinkConfig& cfg, std::string& err);

/**
 * @brief Write @p cfg as pretty JSON via tmp file + rename.
 * @return false with @p err ("mkdir_failed", "write_failed", "rename_failed").
 */
bool save_link_config(const std::filesystem::path& path, const LinkConfig& cfg, std::string& err);

} // namespace harvestlink
