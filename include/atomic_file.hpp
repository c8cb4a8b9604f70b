#pragma once
#include <filesystem>
#include <string>

namespace harvestlink {

/**
 * @brief Replace @p path with @p contents so readers never see a half-written file.
 *
 * Writes "<path>.tmp", flushes, then renames over @p path. Parent directories
 * are created as needed. Never throws.
 *
 * @param err "mkdir_failed", "write_failed" or "rename_failed" on failure.
 */
bool atomic_write_file(const std::filesystem::path& path, const std::string& contents, std::string& err);

} // namespace harvestlink
