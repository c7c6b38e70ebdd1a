#include <gtest/gtest.h>
#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class HashTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;

    void SetUp() override {
        init_localization();
        suite_work_dir = fs::absolute("tmp_hash_test");
        fs::remove_all(suite_work_dir);
        fs::create_directories(suite_work_dir);
    }

    void TearDown() override {
        fs::remove_all(suite_work_dir);
    }

    fs::path create_dummy_file(const std::string& name, const std::string& content) {
        fs::path p = suite_work_dir / name;
        std::ofstream f(p, std::ios::binary);
        f << content;
        return p;
    }
};

TEST_F(HashTest, CalculateSHA256) {
    auto path = create_dummy_file("test.txt", "hello world");
    // echo -n "hello world" | sha256sum
    EXPECT_EQ(calculate_sha256(path), "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_F(HashTest, CalculateSHA256EmptyFile) {
    auto path = create_dummy_file("empty", "");
    EXPECT_EQ(calculate_sha256(path), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(HashTest, CalculateSHA256SpansBufferBoundary) {
    // Larger than the 8 KiB read buffer and not a multiple of it
    std::string content(20000, 'a');
    auto path = create_dummy_file("big", content);
    auto hash = calculate_sha256(path);
    EXPECT_EQ(hash.size(), 64u);
    EXPECT_NE(hash, calculate_sha256(create_dummy_file("big2", content.substr(0, 8192))));
}

TEST_F(HashTest, VerifyAcceptsMatchingDigestInAnyCase) {
    auto path = create_dummy_file("test.txt", "hello world");
    EXPECT_NO_THROW(verify_sha256(path, "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9"));
    EXPECT_NO_THROW(verify_sha256(path, "B94D27B9934D3E08A52E52D7DA7DABFAC484EFE37A5380EE9088F7ACE2EFCDE9"));
}

TEST_F(HashTest, VerifyRejectsMismatch) {
    auto path = create_dummy_file("test.txt", "hello world");
    try {
        verify_sha256(path, "wronghashvalue");
        FAIL() << "Expected ChecksumException";
    } catch (const ChecksumException& e) {
        EXPECT_EQ(e.exit_code(), EXIT_DATA_ERROR);
    }
}

TEST_F(HashTest, MissingFileThrows) {
    EXPECT_THROW(calculate_sha256(suite_work_dir / "nope"), WmsetupException);
}
