#include "atomic_file.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace harvestlink {

bool atomic_write_file(const fs::path& path, const std::string& contents, std::string& err) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);       // no-op if present
        if (ec) { err = "mkdir_failed"; return false; }
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) { err = "write_failed"; return false; }
        out << contents;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            err = "write_failed";
            return false;
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        err = "rename_failed";
        return false;
    }
    return true;
}

} // namespace harvestlink
