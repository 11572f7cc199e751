/**
 * @file hex.h
 * @brief Hex encoding helpers
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HASHGOOD_HEX_H
#define HASHGOOD_HEX_H

#include <cstdint>
#include <string>
#include <vector>

namespace hashgood {
namespace hex {

bool IsHexDigit(char c);

/**
 * @brief True if the string is non-empty and made only of hex digits
 */
bool IsHexString(const std::string& text);

/**
 * @brief Encode bytes as lower-case hex
 */
std::string Encode(const std::vector<uint8_t>& data);

/**
 * @brief Decode a hex string (either case)
 * @throws InvalidHexCharacter on a non-hex character
 * @throws UnrecognisedHashFormat on an odd number of characters
 */
std::vector<uint8_t> Decode(const std::string& text);

} // namespace hex
} // namespace hashgood

#endif // HASHGOOD_HEX_H
