#include "../../src/internal/verification/executable_verification.hpp"
#include "../test_utils.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace dispatcher::internal;
using dispatcher::test::TempDir;

namespace
{

// SHA-256 of "abc"
constexpr const char* ABC_SHA256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

std::string write_abc(const TempDir& dir)
{
    std::string path = dir.file("abc.bin");
    std::ofstream out(path, std::ios::binary);
    out << "abc";
    return path;
}

} // namespace

TEST(VerificationTest, ComputesKnownDigest)
{
    TempDir dir;
    auto hash = compute_file_sha256(write_abc(dir));
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(*hash, ABC_SHA256);
}

TEST(VerificationTest, MissingFileHasNoDigest)
{
    TempDir dir;
    EXPECT_FALSE(compute_file_sha256(dir.file("missing")).has_value());
}

TEST(VerificationTest, HashComparisonIsCaseInsensitive)
{
    TempDir dir;
    std::string path = write_abc(dir);
    std::string upper = ABC_SHA256;
    for (auto& c : upper)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    std::string error;
    EXPECT_TRUE(verify_executable_hash(path, upper, error));
    EXPECT_TRUE(error.empty());
}

TEST(VerificationTest, HashMismatchReportsError)
{
    TempDir dir;
    std::string error;
    EXPECT_FALSE(verify_executable_hash(write_abc(dir), std::string(64, '0'), error));
    EXPECT_FALSE(error.empty());
}

TEST(VerificationTest, NoPinAlwaysPasses)
{
    std::string error;
    EXPECT_TRUE(verify_executable_hash("/definitely/not/here", std::nullopt, error));
}

TEST(VerificationTest, AllowlistMatchesCanonicalPaths)
{
    TempDir dir;
    std::string target = write_abc(dir);
    std::string link = dir.file("link.bin");
    std::filesystem::create_symlink(target, link);

    EXPECT_TRUE(verify_command_allowed(target, {}));
    EXPECT_TRUE(verify_command_allowed(link, {target}));
    EXPECT_TRUE(verify_command_allowed(target, {"/usr/bin/other", link}));
    EXPECT_FALSE(verify_command_allowed(target, {"/usr/bin/other"}));
}
