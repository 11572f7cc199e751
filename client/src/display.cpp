/**
 * @file display.cpp
 * @brief Print digests and verification results for a terminal
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashgood/client/display.h"
#include <algorithm>
#include <cstdlib>

namespace hashgood {

namespace {

constexpr const char* ANSI_RESET = "\033[0m";
constexpr const char* ANSI_RED = "\033[31m";
constexpr const char* ANSI_GREEN = "\033[32m";
constexpr const char* ANSI_YELLOW = "\033[33m";
constexpr const char* ANSI_BLUE = "\033[34m";
constexpr const char* ANSI_MAGENTA = "\033[35m";
constexpr const char* ANSI_CYAN = "\033[36m";

std::string FilenameDisplay(const std::optional<std::string>& filename) {
    return filename ? *filename : "standard input";
}

const char* AlgorithmColour(Algorithm alg) {
    switch (alg) {
        case Algorithm::Md5:
            return ANSI_MAGENTA;
        case Algorithm::Sha1:
            return ANSI_CYAN;
        case Algorithm::Sha256:
            return ANSI_GREEN;
        case Algorithm::Sha512:
            return ANSI_BLUE;
    }
    return ANSI_RESET;
}

} // namespace

bool ShouldUseColour(bool no_colour_flag) {
    if (no_colour_flag) {
        return false;
    }
    return std::getenv("NO_COLOR") == nullptr;
}

Printer::Printer(std::ostream& out, bool colour)
    : out_(out), colour_(colour) {}

void Printer::WriteColoured(const std::string& text, const char* colour) {
    if (colour_) {
        out_ << colour << text << ANSI_RESET;
    } else {
        out_ << text;
    }
}

void Printer::PrintHexCompare(const std::string& print, const std::string& against) {
    if (!colour_) {
        out_ << print << "\n";
        return;
    }
    for (size_t i = 0; i < print.size(); ++i) {
        bool same = i < against.size() && print[i] == against[i];
        out_ << (same ? ANSI_GREEN : ANSI_RED) << print[i];
    }
    out_ << ANSI_RESET << "\n";
}

void Printer::PrintDifferenceMarkers(const std::string& a, const std::string& b) {
    std::string markers(std::max(a.size(), b.size()), ' ');
    bool any = false;
    for (size_t i = 0; i < markers.size(); ++i) {
        if (i >= a.size() || i >= b.size() || a[i] != b[i]) {
            markers[i] = '^';
            any = true;
        }
    }
    if (any) {
        markers.erase(markers.find_last_not_of(' ') + 1);
        out_ << markers << "\n";
    }
}

void Printer::PrintSource(const HashSource& source, const std::optional<std::string>& candidate_filename) {
    std::string text;
    switch (source.kind) {
        case HashSource::Kind::CommandArgument:
            text = "command line argument";
            break;
        case HashSource::Kind::RawFile:
            text = source.IsStandardInput()
                ? "from standard input"
                : "from file '" + source.path + "' containing raw hash";
            break;
        case HashSource::Kind::DigestsFile: {
            std::string name = candidate_filename ? "'" + *candidate_filename + "'" : "unnamed hash";
            text = source.IsStandardInput()
                ? name + " from digests on standard input"
                : name + " in digests file '" + source.path + "'";
            break;
        }
    }
    WriteColoured(text, ANSI_YELLOW);
    out_ << "\n";
}

void Printer::PrintHash(
    const std::optional<std::string>& input_name,
    const Digest& digest,
    const CandidateHash* comparison,
    const HashSource* source
) {
    WriteColoured(FilenameDisplay(input_name), ANSI_YELLOW);
    out_ << " / ";
    WriteColoured(GetAlgorithmName(digest.algorithm), AlgorithmColour(digest.algorithm));
    out_ << "\n";

    // Handle basic case first - nothing to compare it to
    std::string hash_hex = digest.ToHex();
    if (!comparison) {
        out_ << hash_hex << "\n\n";
        return;
    }
    std::string other_hex = comparison->ToHex();

    // Do a top-to-bottom comparison
    PrintHexCompare(hash_hex, other_hex);
    PrintHexCompare(other_hex, hash_hex);
    if (!colour_) {
        PrintDifferenceMarkers(hash_hex, other_hex);
    }

    if (source) {
        PrintSource(*source, comparison->filename);
    }
    out_ << "\n";
}

void Printer::PrintMessages(const std::vector<Message>& messages) {
    for (const auto& message : messages) {
        switch (message.level) {
            case MessageLevel::Error:
                WriteColoured("(error) ", ANSI_RED);
                break;
            case MessageLevel::Warning:
                WriteColoured("(warning) ", ANSI_YELLOW);
                break;
            case MessageLevel::Note:
                WriteColoured("(note) ", ANSI_CYAN);
                break;
        }
        out_ << message.text << "\n";
    }
    if (!messages.empty()) {
        out_ << "\n";
    }
}

void Printer::PrintMatchLevel(MatchLevel level) {
    out_ << "Result: ";
    std::string name = GetMatchLevelName(level);
    if (!colour_) {
        out_ << "[" << name << "]\n";
        return;
    }
    switch (level) {
        case MatchLevel::Ok:
            WriteColoured(name, ANSI_GREEN);
            break;
        case MatchLevel::Maybe:
            WriteColoured(name, ANSI_YELLOW);
            break;
        case MatchLevel::Fail:
            WriteColoured(name, ANSI_RED);
            break;
    }
    out_ << "\n";
}

void Printer::PrintOutcome(const VerificationOutcome& outcome) {
    if (outcome.IsReport()) {
        for (const auto& digest : outcome.digests) {
            PrintHash(outcome.input_name, digest, nullptr, nullptr);
        }
        return;
    }

    const Verification& verification = *outcome.verification;
    const HashSource* source = outcome.source ? &*outcome.source : nullptr;
    PrintHash(outcome.input_name, verification.calculated, &verification.comparison, source);
    PrintMessages(verification.messages);
    PrintMatchLevel(verification.match_level);
}

} // namespace hashgood
