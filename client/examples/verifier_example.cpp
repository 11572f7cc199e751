/**
 * @file verifier_example.cpp
 * @brief Example: Verifying a download against a SHA256SUMS listing
 *
 * This example demonstrates how an application embeds the verifier:
 * load a check file, hash the download once, and act on the verdict.
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashgood/client/hash_source.h"
#include "hashgood/client/verifier.h"
#include "hashgood/common/digest.h"
#include "hashgood/common/errors.h"
#include <glog/logging.h>
#include <iostream>

using namespace hashgood;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;

    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <download> <SHA256SUMS>" << std::endl;
        return 2;
    }

    try {
        LOG(INFO) << "=== Verifier Example: Checking a Download ===";

        // Step 1: Load the published digests
        LOG(INFO) << "Step 1: Loading check file " << argv[2] << "...";
        CandidateHashes candidates = LoadCheckSource(argv[2], std::cin);
        LOG(INFO) << "  " << candidates.hashes.size() << " candidate hash(es) found";

        // Step 2: Hash the download and compare
        LOG(INFO) << "Step 2: Hashing " << argv[1] << "...";
        FileByteSource download(argv[1]);
        Verifier verifier;
        VerificationOutcome outcome = verifier.Verify(download, &candidates);

        const Verification& verification = *outcome.verification;
        LOG(INFO) << "  Calculated " << GetAlgorithmName(verification.calculated.algorithm) << ": "
                  << verification.calculated.ToHex();
        LOG(INFO) << "  Expected:      " << verification.comparison.ToHex();
        for (const auto& message : verification.messages) {
            LOG(WARNING) << "  " << message.text;
        }

        // Step 3: Only an OK verdict is safe to install unattended
        switch (verification.match_level) {
            case MatchLevel::Ok:
                LOG(INFO) << "Step 3: Download verified, safe to install";
                return 0;
            case MatchLevel::Maybe:
                LOG(WARNING) << "Step 3: Hash matches but the filename does not, confirm manually";
                return 3;
            case MatchLevel::Fail:
                LOG(ERROR) << "Step 3: Download is corrupt or tampered with, discard it";
                return 1;
        }
        return 1;

    } catch (const Error& e) {
        LOG(ERROR) << "Verification failed: " << e.what();
        return 2;
    }
}
