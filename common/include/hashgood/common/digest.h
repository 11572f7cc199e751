/**
 * @file digest.h
 * @brief Streaming digest computation over byte sources
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HASHGOOD_DIGEST_H
#define HASHGOOD_DIGEST_H

#include "hashgood/common/algorithm.h"
#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hashgood {

/**
 * @brief A finished digest tagged with the algorithm that produced it
 */
struct Digest {
    Algorithm algorithm;
    std::vector<uint8_t> bytes;

    /**
     * @brief Lower-case hex rendering
     */
    std::string ToHex() const;

    bool operator==(const Digest& other) const {
        return algorithm == other.algorithm && bytes == other.bytes;
    }
    bool operator!=(const Digest& other) const { return !(*this == other); }
};

/**
 * @brief Sequential source of input bytes
 *
 * Implementations are read once from start to end.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read up to size bytes
     * @param buffer Destination
     * @param size Capacity of buffer
     * @return Number of bytes read, 0 at end of stream
     * @throws SourceReadError if the underlying stream fails
     */
    virtual size_t Read(uint8_t* buffer, size_t size) = 0;

    /**
     * @brief Basename of the source, or std::nullopt when it has none (standard input)
     */
    virtual std::optional<std::string> GetName() const = 0;
};

/**
 * @brief Byte source backed by a regular file
 */
class FileByteSource : public ByteSource {
public:
    /**
     * @brief Open a file for reading
     * @param path Path to a regular file
     * @throws SourceReadError if the path does not exist, is not a regular file or cannot be opened
     */
    explicit FileByteSource(const std::string& path);
    ~FileByteSource() override;

    FileByteSource(const FileByteSource&) = delete;
    FileByteSource& operator=(const FileByteSource&) = delete;

    size_t Read(uint8_t* buffer, size_t size) override;
    std::optional<std::string> GetName() const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Unnamed byte source over an existing stream (standard input)
 *
 * The stream is borrowed and must outlive this object.
 */
class StreamByteSource : public ByteSource {
public:
    explicit StreamByteSource(std::istream& stream);

    size_t Read(uint8_t* buffer, size_t size) override;
    std::optional<std::string> GetName() const override { return std::nullopt; }

private:
    std::istream& stream_;
};

/**
 * @brief Streaming hasher for one algorithm (OpenSSL EVP)
 */
class Hasher {
public:
    /**
     * @brief Create streaming hasher
     * @throws DigestError if the digest context cannot be initialised
     */
    explicit Hasher(Algorithm alg);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;

    /**
     * @brief Compute a digest in one call (convenience method)
     */
    static Digest Hash(Algorithm alg, const std::vector<uint8_t>& data);

    Algorithm GetAlgorithm() const;

    /**
     * @brief Add data to hash
     * @throws DigestError if already finalized or the update fails
     */
    void Update(const uint8_t* data, size_t size);
    void Update(const std::vector<uint8_t>& chunk);

    /**
     * @brief Finalize hash and get result
     * @throws DigestError if already finalized
     */
    Digest Finalize();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Compute several digests over a source in a single pass
 *
 * The source is read in READ_BUFFER_SIZE chunks and every hasher is
 * updated with each chunk, so the input is consumed exactly once.
 * Duplicate algorithms are computed once.
 *
 * @param source Byte source, consumed to the end
 * @param algorithms Algorithms to compute
 * @return Digests in the order the algorithms were requested (duplicates removed)
 * @throws SourceReadError if the source fails mid-stream; no partial digest is returned
 * @throws DigestError on digest primitive failure
 */
std::vector<Digest> ComputeDigests(ByteSource& source, const std::vector<Algorithm>& algorithms);

} // namespace hashgood

#endif // HASHGOOD_DIGEST_H
