/**
 * @file verifier.h
 * @brief Match a calculated digest against candidate hashes
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HASHGOOD_VERIFIER_H
#define HASHGOOD_VERIFIER_H

#include "hashgood/client/hash_source.h"
#include "hashgood/common/digest.h"
#include <optional>
#include <string>
#include <vector>

namespace hashgood {

/**
 * @brief Summary of an attempt to match the calculated digest against candidates
 */
enum class MatchLevel {
    Ok,     ///< Hash matches, and the claimed filename (if any) is the input's
    Maybe,  ///< Hash matches but the claimed filename differs or cannot be checked
    Fail    ///< Hash does not match
};

const char* GetMatchLevelName(MatchLevel level);

/**
 * @brief Severity of informational messages printed before the result
 */
enum class MessageLevel {
    Error,
    Warning,
    Note
};

struct Message {
    MessageLevel level;
    std::string text;
};

/**
 * @brief Details of a single-hash verification
 */
struct Verification {
    MatchLevel match_level;
    Digest calculated;         ///< Digest of the input for the compared algorithm
    CandidateHash comparison;  ///< Candidate the digest was compared against
    std::vector<Message> messages;
};

/**
 * @brief Result of one invocation
 *
 * Without an expected hash this is a report of every supported digest;
 * otherwise verification is set.
 */
struct VerificationOutcome {
    std::optional<std::string> input_name;  ///< Basename, std::nullopt for standard input
    std::vector<Digest> digests;
    std::optional<HashSource> source;
    std::optional<Verification> verification;

    bool IsReport() const { return !verification.has_value(); }
};

/**
 * @brief Stages of a verification run
 */
enum class VerifierState {
    AwaitingInput,
    Resolving,
    Hashing,
    Verdict
};

/**
 * @brief Resolves the expected hash, hashes the input and decides the verdict
 *
 * Each call to Verify() starts again from AwaitingInput; nothing carries
 * over between runs.
 */
class Verifier {
public:
    /**
     * @brief Verify an input against candidate hashes, or report all digests
     *
     * With candidates, the candidate is selected first (filename preference),
     * then every algorithm used by the candidates is computed in one pass.
     * Without candidates, all supported digests are computed in one pass.
     *
     * @param input Input bytes, consumed once
     * @param candidates Candidate hashes, or nullptr to report all digests
     * @return Verdict or report
     * @throws AmbiguousHashSelection if no unique candidate can be selected
     * @throws SourceReadError if reading the input fails
     * @throws DigestError on digest primitive failure
     */
    VerificationOutcome Verify(ByteSource& input, const CandidateHashes* candidates);

    VerifierState GetState() const { return state_; }

private:
    VerifierState state_ = VerifierState::AwaitingInput;
};

/**
 * @brief Decide the verdict for a selected candidate
 *
 * Ok: the selected hash matches, and if it has a filename, that matches too.
 * Maybe: a hash matches but its filename does not match the input, or the
 * input is unnamed. A hash match on another line outranks a filename match
 * whose hash is wrong.
 * Fail: neither of the above.
 *
 * @param calculated Digests of the input, one per algorithm used by candidates
 * @param candidates All candidates from the source
 * @param selected Candidate chosen by SelectCandidate()
 * @param input_name Basename of the input, std::nullopt for standard input
 */
Verification VerifyHash(
    const std::vector<Digest>& calculated,
    const CandidateHashes& candidates,
    const CandidateHash& selected,
    const std::optional<std::string>& input_name
);

} // namespace hashgood

#endif // HASHGOOD_VERIFIER_H
