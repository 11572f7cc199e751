/**
 * @file algorithm.h
 * @brief Supported digest algorithms and hash type detection
 *
 * The supported algorithms all have different digest lengths, so the
 * algorithm of an expected hash can be inferred from its length alone.
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HASHGOOD_ALGORITHM_H
#define HASHGOOD_ALGORITHM_H

#include <cstddef>
#include <string>
#include <vector>

namespace hashgood {

/**
 * @brief Digest algorithms, ordered by digest length
 */
enum class Algorithm {
    Md5,     // 16 bytes, 32 hex characters
    Sha1,    // 20 bytes, 40 hex characters
    Sha256,  // 32 bytes, 64 hex characters
    Sha512   // 64 bytes, 128 hex characters
};

/**
 * @brief Every supported algorithm, in display order
 */
const std::vector<Algorithm>& AllAlgorithms();

/**
 * @brief Human-readable name ("MD5", "SHA-1", "SHA-256", "SHA-512")
 */
const char* GetAlgorithmName(Algorithm alg);

/**
 * @brief Binary digest length in bytes
 */
size_t GetDigestSize(Algorithm alg);

/**
 * @brief Hex digest length in characters
 */
size_t GetHexLength(Algorithm alg);

/**
 * @brief Assume an algorithm from a binary digest length
 * @param size Digest length in bytes
 * @return Algorithm with that digest length
 * @throws UnrecognisedHashFormat if no supported algorithm has this length
 */
Algorithm AlgorithmFromDigestSize(size_t size);

/**
 * @brief Check whether a hex length belongs to a supported algorithm
 */
bool IsKnownHexLength(size_t length);

/**
 * @brief Classify a hex digest by its length
 *
 * Every character is validated before the length is looked at.
 * Upper and lower case are accepted.
 *
 * @param hex Hex digest string (no surrounding whitespace)
 * @return The unique algorithm whose hex length equals hex.size()
 * @throws InvalidHexCharacter if any character is not a hex digit
 * @throws UnrecognisedHashFormat if the length matches no algorithm
 */
Algorithm ClassifyHexDigest(const std::string& hex);

} // namespace hashgood

#endif // HASHGOOD_ALGORITHM_H
