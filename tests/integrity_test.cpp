#include "integrity/integrity.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

class IntegrityTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::path(::testing::TempDir()) / ("integrity_" + std::string(info->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    std::string write(const std::string& name, const std::string& content)
    {
        const fs::path p = dir_ / name;
        std::ofstream(p, std::ios::binary) << content;
        return p.string();
    }

    static std::string read(const std::string& path)
    {
        std::ifstream ifs(path, std::ios::binary);
        std::ostringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }

    fs::path dir_;
};

constexpr const char* kSha256Abc =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr const char* kSha256Empty =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

} // namespace

TEST_F(IntegrityTest, HashesKnownVectors)
{
    EXPECT_EQ(sha256_file(write("abc.txt", "abc")), std::string(kSha256Abc));
    EXPECT_EQ(sha256_file(write("empty.txt", "")), std::string(kSha256Empty));
}

TEST_F(IntegrityTest, HashesFilesLargerThanOneBlock)
{
    // 10 000 bytes spans several 4096-byte reads.
    const std::string big(10000, 'x');
    const auto a = sha256_file(write("a.bin", big));
    const auto b = sha256_file(write("b.bin", big));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->size(), 64u);
    EXPECT_NE(a, sha256_file(write("c.bin", big + "y")));
}

TEST_F(IntegrityTest, MissingFileHasNoHash)
{
    EXPECT_FALSE(sha256_file((dir_ / "absent").string()).has_value());
}

TEST_F(IntegrityTest, HashesCsvListsExistingFilesByBasename)
{
    const std::string timeline = write("timeline.csv", "abc");
    const std::string map      = write("map.html", "");
    const std::string missing  = (dir_ / "action_log.txt").string();
    const std::string csv      = (dir_ / "hashes.csv").string();

    ActionLog log;
    ASSERT_TRUE(write_hashes_csv({timeline, missing, map}, csv, log));

    EXPECT_EQ(read(csv),
              std::string("filename,sha256_hash\n") +
              "timeline.csv," + kSha256Abc + "\n" +
              "map.html," + kSha256Empty + "\n");

    bool logged_prefix = false;
    for (const auto& e : log.entries())
        if (e.find("timeline.csv: ba7816bf8f01cfea...") != std::string::npos)
            logged_prefix = true;
    EXPECT_TRUE(logged_prefix);
    EXPECT_NE(log.entries().back().find("Generated hashes.csv"), std::string::npos);
}

TEST_F(IntegrityTest, HashesCsvFailsForUnwritableTarget)
{
    ActionLog log;
    EXPECT_FALSE(write_hashes_csv({}, (dir_ / "no" / "hashes.csv").string(), log));
}
