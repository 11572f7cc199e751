/**
 * @file limits.h
 * @brief Size limits and buffer sizes for hashgood
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace hashgood {
namespace limits {

// ============================================================================
// Streaming
// ============================================================================

/**
 * @brief Size of each read from the input while hashing
 *
 * Every requested digest context is updated with the same buffer, so the
 * input is read exactly once regardless of how many algorithms run.
 */
constexpr size_t READ_BUFFER_SIZE = 64 * 1024;

// ============================================================================
// Check sources
// ============================================================================

/**
 * @brief Maximum size of a check file (raw hash or SHASUMS listing)
 *
 * Real listings are a few KB. Anything larger is almost certainly the
 * download itself passed to --check by mistake.
 */
constexpr size_t MAX_CHECK_SOURCE_SIZE = 1024 * 1024;

// Digest sizes in bytes
constexpr size_t MD5_DIGEST_SIZE = 16;
constexpr size_t SHA1_DIGEST_SIZE = 20;
constexpr size_t SHA256_DIGEST_SIZE = 32;
constexpr size_t SHA512_DIGEST_SIZE = 64;

}  // namespace limits
}  // namespace hashgood
