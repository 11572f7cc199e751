/**
 * @file hex.cpp
 * @brief Hex encoding helpers
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashgood/common/hex.h"
#include "hashgood/common/errors.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace hashgood {
namespace hex {

namespace {

uint8_t NibbleValue(char c) {
    if (c >= '0' && c <= '9') {
        return static_cast<uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<uint8_t>(c - 'a' + 10);
    }
    return static_cast<uint8_t>(c - 'A' + 10);
}

} // namespace

bool IsHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsHexString(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), IsHexDigit);
}

std::string Encode(const std::vector<uint8_t>& data) {
    std::ostringstream ss;
    for (uint8_t byte : data) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

std::vector<uint8_t> Decode(const std::string& text) {
    if (!std::all_of(text.begin(), text.end(), IsHexDigit)) {
        throw InvalidHexCharacter(text);
    }
    if (text.size() % 2 != 0) {
        throw UnrecognisedHashFormat(text.size());
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        bytes.push_back(static_cast<uint8_t>((NibbleValue(text[i]) << 4) | NibbleValue(text[i + 1])));
    }
    return bytes;
}

} // namespace hex
} // namespace hashgood
