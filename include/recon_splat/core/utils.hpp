#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace recon_splat::core {

namespace fs = std::filesystem;

// Extensions counted as input images (lower case, no dot)
extern const std::vector<std::string> kImageExtensions;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

/**
 * Regular files directly inside dir whose extension (case-insensitive)
 * is one of extensions. Sorted; empty when dir is not a directory.
 * Never throws for unreadable entries.
 */
std::vector<fs::path> list_files_with_extensions(const fs::path& dir,
                                                 const std::vector<std::string>& extensions);

size_t count_files_with_extensions(const fs::path& dir,
                                   const std::vector<std::string>& extensions);

/**
 * Resolve an executable the way a shell would: names containing a path
 * separator are checked directly, bare names are searched on PATH.
 */
std::optional<fs::path> find_executable(const std::string& name);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::string normalize_extension(const std::string& ext);
std::string shell_quote(const std::string& s);

} // namespace recon_splat::core
