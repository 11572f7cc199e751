/**
 * @file display.h
 * @brief Print digests and verification results for a terminal
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HASHGOOD_DISPLAY_H
#define HASHGOOD_DISPLAY_H

#include "hashgood/client/verifier.h"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace hashgood {

/**
 * @brief Writes human-readable results to a stream
 *
 * With colour enabled, statuses and hex differences are shown with ANSI
 * colours. Without colour the same information is given by ASCII markers:
 * bracketed result tokens and a '^' line under differing hex digits.
 */
class Printer {
public:
    Printer(std::ostream& out, bool colour);

    /**
     * @brief Print a whole outcome: digests, comparison, messages and result
     */
    void PrintOutcome(const VerificationOutcome& outcome);

    /**
     * @brief Print one digest, optionally compared against a candidate
     * @param input_name Input basename, std::nullopt for standard input
     * @param digest Calculated digest
     * @param comparison Candidate to compare against, or nullptr
     * @param source Where the candidate came from, or nullptr
     */
    void PrintHash(
        const std::optional<std::string>& input_name,
        const Digest& digest,
        const CandidateHash* comparison,
        const HashSource* source
    );

    void PrintMessages(const std::vector<Message>& messages);

    void PrintMatchLevel(MatchLevel level);

private:
    void WriteColoured(const std::string& text, const char* colour);
    void PrintHexCompare(const std::string& print, const std::string& against);
    void PrintDifferenceMarkers(const std::string& a, const std::string& b);
    void PrintSource(const HashSource& source, const std::optional<std::string>& candidate_filename);

    std::ostream& out_;
    bool colour_;
};

/**
 * @brief Decide whether colour should be used
 * @param no_colour_flag True if colours were disabled on the command line
 * @return False if the flag is set or NO_COLOR is present in the environment
 */
bool ShouldUseColour(bool no_colour_flag);

} // namespace hashgood

#endif // HASHGOOD_DISPLAY_H
