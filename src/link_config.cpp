// ============================================================================
// link_config.cpp — implementation for link_config.hpp
// ============================================================================

#include "link_config.hpp"
#include "atomic_file.hpp"
#include "serial_io.hpp"      // baud_supported()

#include <cstdlib>            // getenv for XDG/HOME lookups
#include <fstream>
#include <system_error>

#include "nlohmann/json.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace harvestlink {

fs::path default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                  : fs::path(home ? home : "") / ".config";
    return base / "harvestlink" / "link.json";
}

// Read an integer key if present. Returns false (and sets err) on wrong type.
static bool read_int(const json& j, const char* key, int& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_integer()) { err = std::string("bad_type:") + key; return false; }
    out = it->get<int>();
    return true;
}

bool load_link_config(const fs::path& path, LinkConfig& cfg, std::string& err) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return true;                 // no file: defaults stand

    std::ifstream in(path);
    if (!in) { err = "open_failed"; return false; }

    json j = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) { err = "bad_json"; return false; }

    LinkConfig next = cfg;                                   // commit only when all keys pass

    auto dev = j.find("dev");
    if (dev != j.end()) {
        if (!dev->is_string()) { err = "bad_type:dev"; return false; }
        next.dev = dev->get<std::string>();
    }
    if (!read_int(j, "baud", next.baud, err)) return false;
    if (!read_int(j, "boot_delay_ms", next.boot_delay_ms, err)) return false;
    if (!read_int(j, "timeout_ms", next.timeout_ms, err)) return false;

    int cap = static_cast<int>(next.log_capacity);
    if (!read_int(j, "log_capacity", cap, err)) return false;

    if (!baud_supported(next.baud))  { err = "bad_value:baud"; return false; }
    if (next.boot_delay_ms < 0)      { err = "bad_value:boot_delay_ms"; return false; }
    if (next.timeout_ms < 0)         { err = "bad_value:timeout_ms"; return false; }
    if (cap < 1)                     { err = "bad_value:log_capacity"; return false; }
    next.log_capacity = static_cast<std::size_t>(cap);

    cfg = next;
    return true;
}

bool save_link_config(const fs::path& path, const LinkConfig& cfg, std::string& err) {
    json j;
    j["dev"]           = cfg.dev;
    j["baud"]          = cfg.baud;
    j["boot_delay_ms"] = cfg.boot_delay_ms;
    j["timeout_ms"]    = cfg.timeout_ms;
    j["log_capacity"]  = cfg.log_capacity;
    return atomic_write_file(path, j.dump(2) + "\n", err);
}

} // namespace harvestlink
