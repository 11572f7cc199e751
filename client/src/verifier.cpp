/**
 * @file verifier.cpp
 * @brief Match a calculated digest against candidate hashes
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashgood/client/verifier.h"
#include "hashgood/common/errors.h"
#include <glog/logging.h>
#include <algorithm>

namespace hashgood {

namespace {

const Digest* FindDigest(const std::vector<Digest>& digests, Algorithm alg) {
    auto it = std::find_if(digests.begin(), digests.end(), [alg](const Digest& d) {
        return d.algorithm == alg;
    });
    return it == digests.end() ? nullptr : &*it;
}

bool CandidateMatches(const std::vector<Digest>& digests, const CandidateHash& candidate) {
    const Digest* digest = FindDigest(digests, candidate.algorithm);
    return digest && candidate.Matches(*digest);
}

std::string FilenameMismatchWarning(const std::string& filename) {
    return "The matched hash has filename '" + filename + "', which does not match the input.";
}

} // namespace

const char* GetMatchLevelName(MatchLevel level) {
    switch (level) {
        case MatchLevel::Ok:
            return "OK";
        case MatchLevel::Maybe:
            return "MAYBE";
        case MatchLevel::Fail:
            return "FAIL";
    }
    return "FAIL";
}

Verification VerifyHash(
    const std::vector<Digest>& calculated,
    const CandidateHashes& candidates,
    const CandidateHash& selected,
    const std::optional<std::string>& input_name
) {
    const Digest* digest = FindDigest(calculated, selected.algorithm);
    if (!digest) {
        throw DigestError(std::string("No ") + GetAlgorithmName(selected.algorithm) +
                          " digest was calculated for the selected hash");
    }

    Verification result{MatchLevel::Fail, *digest, selected, {}};

    if (selected.Matches(*digest)) {
        if (!selected.filename) {
            result.match_level = MatchLevel::Ok;
        } else if (!input_name) {
            result.match_level = MatchLevel::Maybe;
            result.messages.push_back({MessageLevel::Warning,
                "The matched hash has filename '" + *selected.filename +
                "', which cannot be confirmed for standard input."});
        } else if (Basename(*selected.filename) == Basename(*input_name)) {
            result.match_level = MatchLevel::Ok;
        } else {
            result.match_level = MatchLevel::Maybe;
            result.messages.push_back({MessageLevel::Warning, FilenameMismatchWarning(*selected.filename)});
        }
    } else {
        // The hash listed for this name is wrong, but the content may be listed under another name
        auto other = std::find_if(candidates.hashes.begin(), candidates.hashes.end(),
            [&](const CandidateHash& c) { return CandidateMatches(calculated, c); });

        if (other != candidates.hashes.end()) {
            const Digest* other_digest = FindDigest(calculated, other->algorithm);
            result.match_level = MatchLevel::Maybe;
            result.calculated = *other_digest;
            result.comparison = *other;
            if (selected.filename) {
                result.messages.push_back({MessageLevel::Warning,
                    "The hash listed for '" + *selected.filename + "' does not match the input."});
            }
            if (other->filename) {
                result.messages.push_back({MessageLevel::Warning, FilenameMismatchWarning(*other->filename)});
            }
        }
    }

    // Warn that a "successful" MD5 result is not necessarily great
    if (result.match_level != MatchLevel::Fail && result.comparison.algorithm == Algorithm::Md5) {
        result.messages.push_back({MessageLevel::Note,
            "MD5 can easily be forged. Use a stronger algorithm if possible."});
    }

    return result;
}

VerificationOutcome Verifier::Verify(ByteSource& input, const CandidateHashes* candidates) {
    state_ = VerifierState::AwaitingInput;

    VerificationOutcome outcome;
    outcome.input_name = input.GetName();

    try {
        if (!candidates) {
            // Nothing to compare against: calculate every supported digest
            state_ = VerifierState::Hashing;
            outcome.digests = ComputeDigests(input, AllAlgorithms());
            state_ = VerifierState::Verdict;
            return outcome;
        }

        state_ = VerifierState::Resolving;
        outcome.source = candidates->source;
        const CandidateHash& selected = SelectCandidate(*candidates, outcome.input_name);
        LOG(INFO) << "Verifying against " << GetAlgorithmName(selected.algorithm) << " hash "
                  << selected.ToHex();

        state_ = VerifierState::Hashing;
        outcome.digests = ComputeDigests(input, candidates->GetAlgorithms());

        outcome.verification = VerifyHash(outcome.digests, *candidates, selected, outcome.input_name);
        state_ = VerifierState::Verdict;
        LOG(INFO) << "Result: " << GetMatchLevelName(outcome.verification->match_level);
        return outcome;
    } catch (const Error&) {
        state_ = VerifierState::Verdict;
        throw;
    }
}

} // namespace hashgood
