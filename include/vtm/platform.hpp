#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vtm {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// The temp file lives beside the target so the rename never crosses
// filesystems; readers see either the old or the new file.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Create a directory (and parents) with fsync on the parent
AtomicWriteResult atomic_create_directory(const std::string& path);

// ============================================================================
// File Helpers
// ============================================================================

// Read a whole file; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

std::string get_parent_directory(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);

bool is_directory(const std::string& path);

// List directory entry names (not full paths); empty if not a directory
std::vector<std::string> list_directory(const std::string& path);

bool remove_file(const std::string& path);

// Remove a directory if it is empty
bool remove_empty_directory(const std::string& path);

std::optional<std::uintmax_t> file_size(const std::string& path);

// ============================================================================
// Environment & Time
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Current time as RFC3339 UTC string ("2025-10-30T12:00:00Z")
std::string get_current_timestamp();

// UTC calendar date of a time point ("2025-10-30")
std::string format_date(std::chrono::system_clock::time_point tp);

std::string format_timestamp(std::chrono::system_clock::time_point tp);

// Parse an RFC3339 UTC timestamp; fractional seconds are ignored
std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& s);

} // namespace vtm
