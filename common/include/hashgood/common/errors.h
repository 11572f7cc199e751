/**
 * @file errors.h
 * @brief Exception hierarchy for checksum resolution and verification
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HASHGOOD_ERRORS_H
#define HASHGOOD_ERRORS_H

#include <stdexcept>
#include <string>

namespace hashgood {

/**
 * @brief Base class for every error raised by hashgood
 *
 * All errors are terminal for the current invocation.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A supplied hash contains characters that are not hex digits
 */
class InvalidHexCharacter : public Error {
public:
    explicit InvalidHexCharacter(const std::string& hash)
        : Error("Provided hash '" + hash + "' contains invalid hex characters") {}
};

/**
 * @brief A hex string length maps to no supported algorithm
 */
class UnrecognisedHashFormat : public Error {
public:
    explicit UnrecognisedHashFormat(size_t hex_length)
        : Error("Unrecognised hash length: " + std::to_string(hex_length) +
                " hex characters (expected 32, 40, 64 or 128)") {}
};

/**
 * @brief A check source holds no token that looks like a digest
 */
class NoHashFoundInSource : public Error {
public:
    explicit NoHashFoundInSource(const std::string& source)
        : Error("Provided check file '" + source + "' was neither a hash nor a valid digests file") {}
};

/**
 * @brief Several different hashes could apply and none is tied to the input name
 */
class AmbiguousHashSelection : public Error {
public:
    using Error::Error;
};

/**
 * @brief I/O failure while opening or streaming an input or check source
 */
class SourceReadError : public Error {
public:
    using Error::Error;
};

class DualStandardInputConflict : public Error {
public:
    DualStandardInputConflict()
        : Error("Cannot use standard input for both the check file and the input data") {}
};

/**
 * @brief More than one way of supplying the expected hash was requested
 */
class ConflictingHashSources : public Error {
public:
    ConflictingHashSources()
        : Error("Hashes were provided by multiple methods. Use only one.") {}
};

/**
 * @brief Malformed command line
 */
class UsageError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Failure inside the digest primitive (OpenSSL EVP)
 */
class DigestError : public Error {
public:
    using Error::Error;
};

} // namespace hashgood

#endif // HASHGOOD_ERRORS_H
