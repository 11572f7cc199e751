/**
 * @file digest.cpp
 * @brief Streaming digest implementation (OpenSSL EVP)
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashgood/common/digest.h"
#include "hashgood/common/errors.h"
#include "hashgood/common/hex.h"
#include "hashgood/common/limits.h"
#include "openssl_wrappers.h"
#include <glog/logging.h>
#include <openssl/evp.h>
#include <algorithm>

namespace hashgood {

using namespace internal;

namespace {

const EVP_MD* GetMessageDigest(Algorithm alg) {
    switch (alg) {
        case Algorithm::Md5:
            return EVP_md5();
        case Algorithm::Sha1:
            return EVP_sha1();
        case Algorithm::Sha256:
            return EVP_sha256();
        case Algorithm::Sha512:
            return EVP_sha512();
    }
    return nullptr;
}

} // namespace

std::string Digest::ToHex() const {
    return hex::Encode(bytes);
}

// ============================================================================
// Streaming Hasher Implementation
// ============================================================================

class Hasher::Impl {
public:
    Algorithm algorithm;
    EVP_MD_CTX_ptr ctx;
    bool finalized = false;

    explicit Impl(Algorithm alg) : algorithm(alg) {
        const EVP_MD* md = GetMessageDigest(alg);
        if (!md) {
            throw DigestError(std::string("No digest available for ") + GetAlgorithmName(alg));
        }

        ctx = EVP_MD_CTX_ptr(EVP_MD_CTX_new());
        if (!ctx) {
            throw DigestError("Failed to create hash context");
        }

        if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
            throw DigestError(std::string("Failed to initialize ") + GetAlgorithmName(alg) + " hash");
        }
    }
};

Hasher::Hasher(Algorithm alg)
    : impl_(std::make_unique<Impl>(alg)) {}

Hasher::~Hasher() = default;

Hasher::Hasher(Hasher&&) noexcept = default;
Hasher& Hasher::operator=(Hasher&&) noexcept = default;

Digest Hasher::Hash(Algorithm alg, const std::vector<uint8_t>& data) {
    Hasher hasher(alg);
    hasher.Update(data);
    return hasher.Finalize();
}

Algorithm Hasher::GetAlgorithm() const {
    return impl_->algorithm;
}

void Hasher::Update(const uint8_t* data, size_t size) {
    if (impl_->finalized) {
        throw DigestError("Hasher already finalized");
    }

    if (size == 0) {
        return;
    }

    if (EVP_DigestUpdate(impl_->ctx.get(), data, size) != 1) {
        throw DigestError("Failed to update hash");
    }
}

void Hasher::Update(const std::vector<uint8_t>& chunk) {
    Update(chunk.data(), chunk.size());
}

Digest Hasher::Finalize() {
    if (impl_->finalized) {
        throw DigestError("Hasher already finalized");
    }

    const size_t expected_size = GetDigestSize(impl_->algorithm);
    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(impl_->ctx.get(), hash.data(), &hash_len) != 1) {
        throw DigestError("Failed to finalize hash");
    }

    if (hash_len != expected_size) {
        throw DigestError("Unexpected hash size");
    }

    impl_->finalized = true;
    hash.resize(hash_len);
    return Digest{impl_->algorithm, std::move(hash)};
}

// ============================================================================
// Single-pass computation
// ============================================================================

std::vector<Digest> ComputeDigests(ByteSource& source, const std::vector<Algorithm>& algorithms) {
    std::vector<Hasher> hashers;
    for (Algorithm alg : algorithms) {
        bool seen = std::any_of(hashers.begin(), hashers.end(), [alg](const Hasher& h) {
            return h.GetAlgorithm() == alg;
        });
        if (!seen) {
            hashers.emplace_back(alg);
        }
    }

    std::vector<uint8_t> buffer(limits::READ_BUFFER_SIZE);
    uint64_t total = 0;
    size_t size = 0;
    while ((size = source.Read(buffer.data(), buffer.size())) > 0) {
        for (auto& hasher : hashers) {
            hasher.Update(buffer.data(), size);
        }
        total += size;
    }
    VLOG(1) << "Hashed " << total << " bytes with " << hashers.size() << " algorithm(s)";

    std::vector<Digest> digests;
    digests.reserve(hashers.size());
    for (auto& hasher : hashers) {
        digests.push_back(hasher.Finalize());
    }
    return digests;
}

} // namespace hashgood
