#include "executable_verification.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace dispatcher::internal
{

std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file)
        return std::nullopt;

    SHA256_CTX sha256;
    if (!SHA256_Init(&sha256))
        return std::nullopt;

    const size_t BUFFER_SIZE = 8192;
    char buffer[BUFFER_SIZE];
    while (file.read(buffer, BUFFER_SIZE) || file.gcount() > 0)
        if (!SHA256_Update(&sha256, buffer, static_cast<size_t>(file.gcount())))
            return std::nullopt;

    if (file.bad())
        return std::nullopt;

    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (!SHA256_Final(hash, &sha256))
        return std::nullopt;

    // Convert to hex string
    std::ostringstream oss;
    for (size_t i = 0; i < SHA256_DIGEST_LENGTH; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);

    return oss.str();
}

bool verify_command_allowed(const std::string& executable_path,
                            const std::vector<std::string>& allowed_paths)
{
    // If no allowlist specified, allow all paths
    if (allowed_paths.empty())
        return true;

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path normalized = fs::canonical(executable_path, ec);
    if (ec)
        normalized = fs::path(executable_path);

    for (const auto& allowed : allowed_paths)
    {
        fs::path normalized_allowed = fs::canonical(allowed, ec);
        if (ec)
            normalized_allowed = fs::path(allowed);

        if (normalized == normalized_allowed)
            return true;
    }

    return false;
}

bool verify_executable_hash(const std::filesystem::path& executable_path,
                            const std::optional<std::string>& expected_hash,
                            std::string& error_message)
{
    // If no hash check requested, always pass
    if (!expected_hash)
        return true;

    // Validate hash format (should be 64 hex characters for SHA256)
    if (expected_hash->length() != 64)
    {
        error_message = "Invalid hash format: expected 64-character hex string";
        return false;
    }

    if (!std::all_of(expected_hash->begin(), expected_hash->end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; }))
    {
        error_message = "Invalid hash format: contains non-hex characters";
        return false;
    }

    auto actual_hash = compute_file_sha256(executable_path);
    if (!actual_hash)
    {
        error_message = "Failed to compute hash of " + executable_path.string();
        return false;
    }

    std::string expected_lower = *expected_hash;
    std::transform(expected_lower.begin(), expected_lower.end(), expected_lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (expected_lower != *actual_hash)
    {
        error_message = "Executable hash mismatch for " + executable_path.string() +
                        ": expected " + expected_lower + " but got " + *actual_hash;
        return false;
    }

    return true;
}

} // namespace dispatcher::internal
