#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dispatcher::internal
{

/// Compute SHA256 hash of a file
/// Returns hex-encoded SHA256 hash (64 characters) or std::nullopt on error
std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path);

/// Verify a backend executable is in the allowlist
/// If allowlist is empty, returns true (no restriction)
/// Entries are compared after canonicalization, so symlinked paths match their target
bool verify_command_allowed(const std::string& executable_path,
                            const std::vector<std::string>& allowed_paths);

/// Verify executable hash matches expected SHA256
/// If expected_hash is nullopt, returns true (no hash check)
/// Otherwise, computes file hash and compares (case-insensitive)
bool verify_executable_hash(const std::filesystem::path& executable_path,
                            const std::optional<std::string>& expected_hash,
                            std::string& error_message);

} // namespace dispatcher::internal
