/**
 * @file openssl_wrappers.h
 * @brief RAII wrappers for OpenSSL resources
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HASHGOOD_OPENSSL_WRAPPERS_H
#define HASHGOOD_OPENSSL_WRAPPERS_H

#include <memory>
#include <openssl/evp.h>

namespace hashgood {
namespace internal {

struct EVP_MD_CTX_Deleter {
    void operator()(EVP_MD_CTX* p) const { if (p) EVP_MD_CTX_free(p); }
};

using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;

} // namespace internal
} // namespace hashgood

#endif // HASHGOOD_OPENSSL_WRAPPERS_H
