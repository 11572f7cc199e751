/**
 * @file algorithm.cpp
 * @brief Supported digest algorithms and hash type detection
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashgood/common/algorithm.h"
#include "hashgood/common/errors.h"
#include "hashgood/common/hex.h"
#include "hashgood/common/limits.h"
#include <algorithm>

namespace hashgood {

const std::vector<Algorithm>& AllAlgorithms() {
    static const std::vector<Algorithm> all = {
        Algorithm::Md5,
        Algorithm::Sha1,
        Algorithm::Sha256,
        Algorithm::Sha512,
    };
    return all;
}

const char* GetAlgorithmName(Algorithm alg) {
    switch (alg) {
        case Algorithm::Md5:
            return "MD5";
        case Algorithm::Sha1:
            return "SHA-1";
        case Algorithm::Sha256:
            return "SHA-256";
        case Algorithm::Sha512:
            return "SHA-512";
    }
    return "unknown";
}

size_t GetDigestSize(Algorithm alg) {
    switch (alg) {
        case Algorithm::Md5:
            return limits::MD5_DIGEST_SIZE;
        case Algorithm::Sha1:
            return limits::SHA1_DIGEST_SIZE;
        case Algorithm::Sha256:
            return limits::SHA256_DIGEST_SIZE;
        case Algorithm::Sha512:
            return limits::SHA512_DIGEST_SIZE;
    }
    return 0;
}

size_t GetHexLength(Algorithm alg) {
    return GetDigestSize(alg) * 2;
}

Algorithm AlgorithmFromDigestSize(size_t size) {
    for (Algorithm alg : AllAlgorithms()) {
        if (GetDigestSize(alg) == size) {
            return alg;
        }
    }
    throw UnrecognisedHashFormat(size * 2);
}

bool IsKnownHexLength(size_t length) {
    const auto& all = AllAlgorithms();
    return std::any_of(all.begin(), all.end(), [length](Algorithm alg) {
        return GetHexLength(alg) == length;
    });
}

Algorithm ClassifyHexDigest(const std::string& hex) {
    if (!std::all_of(hex.begin(), hex.end(), hex::IsHexDigit)) {
        throw InvalidHexCharacter(hex);
    }
    if (hex.size() % 2 != 0) {
        throw UnrecognisedHashFormat(hex.size());
    }
    return AlgorithmFromDigestSize(hex.size() / 2);
}

} // namespace hashgood
