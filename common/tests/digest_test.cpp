/**
 * @file digest_test.cpp
 * @brief Unit tests for streaming digests and byte sources
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include "hashgood/common/digest.h"
#include "hashgood/common/errors.h"
#include "hashgood/common/limits.h"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace hashgood;

namespace {

// Ten 'A' bytes: printf 'AAAAAAAAAA' | md5sum (sha1sum, sha256sum, sha512sum)
const std::vector<uint8_t> SMALL_DATA(10, 'A');
const char* const SMALL_DATA_MD5 = "16c52c6e8326c071da771e66dc6e9e57";
const char* const SMALL_DATA_SHA1 = "c71613a7386fd67995708464bf0223c0d78225c4";
const char* const SMALL_DATA_SHA256 = "1d65bf29403e4fb1767522a107c827b8884d16640cf0e3b18c4c1dd107e0d49d";
const char* const SMALL_DATA_SHA512 =
    "2e75db45ffc1734a00608542d8a7635d7f599e4bdacbfcf0c4d5ab85bcc817aa"
    "461f1bd1d56de1b72e4ea91b94763a788ec764a4eb456b9ddbc98f0170f4abb7";

// One million bytes spans several read buffers, the last one partial
const std::vector<uint8_t> LARGE_DATA(1000000, 'B');
const char* const LARGE_DATA_MD5 = "9171f6d67a87ca649a702434a03458a1";
const char* const LARGE_DATA_SHA1 = "cfae4cebfd01884111bdede7cf983626bb249c94";
const char* const LARGE_DATA_SHA256 = "b9193853f7798e92e2f6b82eda336fa7d6fc0fa90fdefe665f372b0bad8cdf8c";
const char* const LARGE_DATA_SHA512 =
    "8795fc9d63085d7568c1cdb50d0201b3a110599969b15b6a4c1fd22aa9aa186c"
    "d7321b7b04c057c4bed73eb31ca96c0b7eaa2f5b71a335148ef812db391e77fa";

/**
 * @brief In-memory source that counts how often it is read
 */
class CountingByteSource : public ByteSource {
public:
    explicit CountingByteSource(std::vector<uint8_t> data) : data_(std::move(data)) {}

    size_t Read(uint8_t* buffer, size_t size) override {
        ++reads;
        size_t n = std::min(size, data_.size() - offset_);
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
        bytes_read += n;
        return n;
    }

    std::optional<std::string> GetName() const override { return std::nullopt; }

    size_t reads = 0;
    size_t bytes_read = 0;

private:
    std::vector<uint8_t> data_;
    size_t offset_ = 0;
};

/**
 * @brief Source that fails after delivering some bytes
 */
class FailingByteSource : public ByteSource {
public:
    size_t Read(uint8_t* buffer, size_t size) override {
        if (calls_++ > 0) {
            throw SourceReadError("simulated read failure");
        }
        std::memset(buffer, 'x', size);
        return size;
    }

    std::optional<std::string> GetName() const override { return std::string("broken.bin"); }

private:
    int calls_ = 0;
};

std::string HexFor(const std::vector<Digest>& digests, Algorithm alg) {
    for (const auto& digest : digests) {
        if (digest.algorithm == alg) {
            return digest.ToHex();
        }
    }
    return "";
}

} // namespace

// ============================================================================
// Hasher Tests
// ============================================================================

TEST(DigestTest, SmallDigests) {
    EXPECT_EQ(Hasher::Hash(Algorithm::Md5, SMALL_DATA).ToHex(), SMALL_DATA_MD5);
    EXPECT_EQ(Hasher::Hash(Algorithm::Sha1, SMALL_DATA).ToHex(), SMALL_DATA_SHA1);
    EXPECT_EQ(Hasher::Hash(Algorithm::Sha256, SMALL_DATA).ToHex(), SMALL_DATA_SHA256);
    EXPECT_EQ(Hasher::Hash(Algorithm::Sha512, SMALL_DATA).ToHex(), SMALL_DATA_SHA512);
}

TEST(DigestTest, EmptyData) {
    EXPECT_EQ(Hasher::Hash(Algorithm::Sha256, {}).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(Hasher::Hash(Algorithm::Md5, {}).bytes.size(), 16u);
}

TEST(DigestTest, StreamingMatchesSingleShot) {
    Hasher hasher(Algorithm::Sha1);
    size_t chunk_size = 1024;
    for (size_t offset = 0; offset < LARGE_DATA.size(); offset += chunk_size) {
        size_t size = std::min(chunk_size, LARGE_DATA.size() - offset);
        hasher.Update(LARGE_DATA.data() + offset, size);
    }
    Digest digest = hasher.Finalize();

    EXPECT_EQ(digest.algorithm, Algorithm::Sha1);
    EXPECT_EQ(digest.ToHex(), LARGE_DATA_SHA1);
}

TEST(DigestTest, FinalizeTwiceThrows) {
    Hasher hasher(Algorithm::Md5);
    hasher.Update(SMALL_DATA);
    hasher.Finalize();

    EXPECT_THROW(hasher.Finalize(), DigestError);
    EXPECT_THROW(hasher.Update(SMALL_DATA), DigestError);
}

TEST(DigestTest, DigestEqualityNeedsSameAlgorithm) {
    Digest a{Algorithm::Sha256, std::vector<uint8_t>(32, 0x11)};
    Digest b{Algorithm::Sha256, std::vector<uint8_t>(32, 0x11)};
    Digest c{Algorithm::Sha512, std::vector<uint8_t>(32, 0x11)};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(DigestTest, SingleByteChangeChangesEveryDigest) {
    std::vector<uint8_t> modified = SMALL_DATA;
    modified[5] = 'B';
    for (Algorithm alg : AllAlgorithms()) {
        EXPECT_NE(Hasher::Hash(alg, SMALL_DATA), Hasher::Hash(alg, modified)) << GetAlgorithmName(alg);
    }
}

// ============================================================================
// Single-pass Computation Tests
// ============================================================================

TEST(ComputeDigestsTest, LargeDigestsAllAlgorithms) {
    CountingByteSource source(LARGE_DATA);
    auto digests = ComputeDigests(source, AllAlgorithms());

    ASSERT_EQ(digests.size(), 4u);
    EXPECT_EQ(HexFor(digests, Algorithm::Md5), LARGE_DATA_MD5);
    EXPECT_EQ(HexFor(digests, Algorithm::Sha1), LARGE_DATA_SHA1);
    EXPECT_EQ(HexFor(digests, Algorithm::Sha256), LARGE_DATA_SHA256);
    EXPECT_EQ(HexFor(digests, Algorithm::Sha512), LARGE_DATA_SHA512);
}

TEST(ComputeDigestsTest, AllAlgorithmsReadSourceOnce) {
    CountingByteSource source(LARGE_DATA);
    ComputeDigests(source, AllAlgorithms());

    // ceil(1000000 / 65536) data reads plus the final read that returns 0
    size_t expected_reads = (LARGE_DATA.size() + limits::READ_BUFFER_SIZE - 1) / limits::READ_BUFFER_SIZE + 1;
    EXPECT_EQ(source.reads, expected_reads);
    EXPECT_EQ(source.bytes_read, LARGE_DATA.size());
}

TEST(ComputeDigestsTest, PreservesRequestOrderAndDropsDuplicates) {
    CountingByteSource source(SMALL_DATA);
    auto digests = ComputeDigests(source, {Algorithm::Sha256, Algorithm::Md5, Algorithm::Sha256});

    ASSERT_EQ(digests.size(), 2u);
    EXPECT_EQ(digests[0].algorithm, Algorithm::Sha256);
    EXPECT_EQ(digests[0].ToHex(), SMALL_DATA_SHA256);
    EXPECT_EQ(digests[1].algorithm, Algorithm::Md5);
    EXPECT_EQ(digests[1].ToHex(), SMALL_DATA_MD5);
}

TEST(ComputeDigestsTest, ReadFailurePropagates) {
    FailingByteSource source;
    EXPECT_THROW(ComputeDigests(source, AllAlgorithms()), SourceReadError);
}

// ============================================================================
// Byte Source Tests
// ============================================================================

TEST(ByteSourceTest, StreamSourceIsUnnamed) {
    std::istringstream stream("AAAAAAAAAA");
    StreamByteSource source(stream);

    EXPECT_FALSE(source.GetName().has_value());
    auto digests = ComputeDigests(source, {Algorithm::Sha256});
    ASSERT_EQ(digests.size(), 1u);
    EXPECT_EQ(digests[0].ToHex(), SMALL_DATA_SHA256);
}

TEST(ByteSourceTest, FileSourceHasBasename) {
    auto dir = std::filesystem::temp_directory_path() / "hashgood_digest_test";
    std::filesystem::create_directories(dir);
    auto path = dir / "small.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(SMALL_DATA.data()), SMALL_DATA.size());
    }

    FileByteSource source(path.string());
    ASSERT_TRUE(source.GetName().has_value());
    EXPECT_EQ(*source.GetName(), "small.bin");

    auto digests = ComputeDigests(source, {Algorithm::Md5});
    EXPECT_EQ(digests[0].ToHex(), SMALL_DATA_MD5);

    std::filesystem::remove_all(dir);
}

TEST(ByteSourceTest, FileSourceRejectsMissingPath) {
    EXPECT_THROW(FileByteSource("/nonexistent/hashgood/input.iso"), SourceReadError);
}

TEST(ByteSourceTest, FileSourceRejectsDirectory) {
    auto dir = std::filesystem::temp_directory_path();
    EXPECT_THROW(FileByteSource(dir.string()), SourceReadError);
}
