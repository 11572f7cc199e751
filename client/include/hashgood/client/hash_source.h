/**
 * @file hash_source.h
 * @brief Collect candidate hashes from an argument, a check file or standard input
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HASHGOOD_HASH_SOURCE_H
#define HASHGOOD_HASH_SOURCE_H

#include "hashgood/common/algorithm.h"
#include "hashgood/common/digest.h"
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace hashgood {

/**
 * @brief Path that stands for standard input
 */
constexpr const char* STDIN_PATH = "-";

/**
 * @brief How the expected hash(es) were supplied
 */
struct HashSource {
    enum class Kind {
        CommandArgument,  ///< Hash given directly on the command line
        RawFile,          ///< Check file holding a single bare hash
        DigestsFile       ///< Check file holding a SHASUMS-style listing
    };

    Kind kind;
    std::string path;  ///< Check file path, "-" for standard input, empty for CommandArgument

    bool IsStandardInput() const { return path == STDIN_PATH; }
};

/**
 * @brief One expected hash, optionally tied to a filename
 */
struct CandidateHash {
    Algorithm algorithm;
    std::vector<uint8_t> bytes;
    std::optional<std::string> filename;  ///< Claimed filename (listing lines only)

    std::string ToHex() const;

    /**
     * @brief True if the digest has the same algorithm and bytes
     */
    bool Matches(const Digest& digest) const;

    /**
     * @brief True if both candidates carry the same algorithm and bytes
     */
    bool SameHashAs(const CandidateHash& other) const;
};

/**
 * @brief Candidate hashes from one source, in source order
 */
struct CandidateHashes {
    HashSource source;
    std::vector<CandidateHash> hashes;

    /**
     * @brief Distinct algorithms used by the candidates, in display order
     */
    std::vector<Algorithm> GetAlgorithms() const;
};

/**
 * @brief Final path component of a filename ("dir/file.iso" -> "file.iso")
 */
std::string Basename(const std::string& path);

/**
 * @brief Build a candidate from a hash given on the command line
 * @param text Hex digest, surrounding whitespace ignored
 * @throws InvalidHexCharacter if the hash is not valid hex
 * @throws UnrecognisedHashFormat if its length matches no algorithm
 */
CandidateHashes ParseHashArgument(const std::string& text);

/**
 * @brief Parse one line of a SHASUMS-style listing
 *
 * Locates a hex token of a supported length and treats the rest of the
 * line as the claimed filename. Accepts GNU ("<hash>  name",
 * "<hash> *name"), BSD ("SHA256 (name) = <hash>") and "name: <hash>".
 *
 * @return The candidate, or std::nullopt if the line holds no usable token
 */
std::optional<CandidateHash> ParseListingLine(const std::string& line);

/**
 * @brief Parse the contents of a check file
 *
 * The whole text is first tried as a bare hash. Otherwise it is read as
 * a listing and lines without a recognisable hash are skipped.
 *
 * @param text Contents of the check file
 * @param path Path it was read from ("-" for standard input)
 * @throws NoHashFoundInSource if no line holds a recognisable hash
 */
CandidateHashes ParseCheckText(const std::string& text, const std::string& path);

/**
 * @brief Read and parse a check file
 * @param path Path to the check file, or "-" to read stdin_stream
 * @param stdin_stream Stream to use for "-"
 * @throws SourceReadError if the file cannot be opened, read, or is too large
 * @throws NoHashFoundInSource if no line holds a recognisable hash
 */
CandidateHashes LoadCheckSource(const std::string& path, std::istream& stdin_stream);

/**
 * @brief Choose the candidate to verify against
 *
 * Candidates whose claimed filename equals the input's basename win.
 * Without such a candidate, the source must offer a single distinct hash.
 * Several different hashes that cannot be told apart are never resolved
 * by picking one.
 *
 * @param candidates Parsed candidates (non-empty)
 * @param input_name Basename of the input, std::nullopt for standard input
 * @return Reference into candidates.hashes
 * @throws AmbiguousHashSelection if no unique hash can be chosen
 * @throws NoHashFoundInSource if candidates is empty
 */
const CandidateHash& SelectCandidate(
    const CandidateHashes& candidates,
    const std::optional<std::string>& input_name
);

} // namespace hashgood

#endif // HASHGOOD_HASH_SOURCE_H
