/**
 * @file hash_source.cpp
 * @brief Collect candidate hashes from an argument, a check file or standard input
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashgood/client/hash_source.h"
#include "hashgood/common/errors.h"
#include "hashgood/common/hex.h"
#include "hashgood/common/limits.h"
#include <glog/logging.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace hashgood {

namespace {

const char* const WHITESPACE = " \t\r\n\v\f";

std::string Trim(const std::string& text) {
    size_t begin = text.find_first_not_of(WHITESPACE);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(WHITESPACE);
    return text.substr(begin, end - begin + 1);
}

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string DisplaySourceName(const std::string& path) {
    return path == STDIN_PATH ? "standard input" : path;
}

/**
 * @brief Position of a hex run of a supported length within a line
 */
struct HexToken {
    size_t pos;
    size_t length;
};

// Words are maximal runs of [A-Za-z0-9_]. A word counts only if it is
// entirely hex and of a supported length.
std::vector<HexToken> FindHexTokens(const std::string& line) {
    std::vector<HexToken> tokens;
    size_t i = 0;
    while (i < line.size()) {
        if (!IsWordChar(line[i])) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < line.size() && IsWordChar(line[j])) {
            ++j;
        }
        std::string word = line.substr(i, j - i);
        if (hex::IsHexString(word) && IsKnownHexLength(word.size())) {
            tokens.push_back({i, word.size()});
        }
        i = j;
    }
    return tokens;
}

// BSD tagged: "SHA256 (name) = <hash>". The text before the name must be a
// single tag word and only an optional '=' may follow the closing bracket.
std::optional<std::string> TaggedFilename(const std::string& before) {
    size_t i = before.find_first_not_of(WHITESPACE);
    if (i == std::string::npos || !IsWordChar(before[i])) {
        return std::nullopt;
    }
    while (i < before.size() && (IsWordChar(before[i]) || before[i] == '-')) {
        ++i;
    }
    while (i < before.size() && (before[i] == ' ' || before[i] == '\t')) {
        ++i;
    }
    if (i >= before.size() || before[i] != '(') {
        return std::nullopt;
    }

    size_t close = before.rfind(')');
    if (close == std::string::npos || close < i) {
        return std::nullopt;
    }
    std::string tail = Trim(before.substr(close + 1));
    if (!tail.empty() && tail != "=") {
        return std::nullopt;
    }
    return before.substr(i + 1, close - i - 1);
}

// coreutils writes "\\" and "\n" in names of lines that start with '\'
std::string UnescapeFilename(const std::string& name) {
    std::string result;
    for (size_t i = 0; i < name.size(); ++i) {
        if (name[i] == '\\' && i + 1 < name.size()) {
            char next = name[++i];
            result += (next == 'n') ? '\n' : next;
        } else {
            result += name[i];
        }
    }
    return result;
}

std::optional<std::string> ExtractFilename(const std::string& before, const std::string& after) {
    std::string name;

    if (auto tagged = TaggedFilename(before)) {
        name = *tagged;
    } else if (!Trim(after).empty()) {
        // GNU: "<hash>  name" or "<hash> *name"
        name = Trim(after);
        if (!name.empty() && name[0] == '*') {
            name.erase(0, 1);
        }
    } else {
        // "name: <hash>" or "name = <hash>"
        name = Trim(before);
        while (!name.empty() && (name.back() == ':' || name.back() == '=')) {
            name.pop_back();
            name = Trim(name);
        }
    }

    name = Trim(name);
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

CandidateHash MakeCandidate(const std::string& hex_text, std::optional<std::string> filename) {
    Algorithm alg = ClassifyHexDigest(hex_text);
    return CandidateHash{alg, hex::Decode(hex_text), std::move(filename)};
}

std::string ReadLimited(std::istream& stream, const std::string& what) {
    std::string text;
    std::vector<char> buffer(4096);
    while (stream) {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (stream.bad()) {
            throw SourceReadError("Error reading from check file " + what);
        }
        text.append(buffer.data(), static_cast<size_t>(stream.gcount()));
        if (text.size() > limits::MAX_CHECK_SOURCE_SIZE) {
            throw SourceReadError("Check file " + what + " is larger than " +
                                  std::to_string(limits::MAX_CHECK_SOURCE_SIZE) +
                                  " bytes; it does not look like a hash or digests file");
        }
    }
    return text;
}

} // namespace

// ============================================================================
// CandidateHash / CandidateHashes
// ============================================================================

std::string CandidateHash::ToHex() const {
    return hex::Encode(bytes);
}

bool CandidateHash::Matches(const Digest& digest) const {
    return algorithm == digest.algorithm && bytes == digest.bytes;
}

bool CandidateHash::SameHashAs(const CandidateHash& other) const {
    return algorithm == other.algorithm && bytes == other.bytes;
}

std::vector<Algorithm> CandidateHashes::GetAlgorithms() const {
    std::vector<Algorithm> result;
    for (Algorithm alg : AllAlgorithms()) {
        bool used = std::any_of(hashes.begin(), hashes.end(), [alg](const CandidateHash& c) {
            return c.algorithm == alg;
        });
        if (used) {
            result.push_back(alg);
        }
    }
    return result;
}

std::string Basename(const std::string& path) {
    std::string name = std::filesystem::path(path).filename().string();
    return name.empty() ? path : name;
}

// ============================================================================
// Parsing
// ============================================================================

CandidateHashes ParseHashArgument(const std::string& text) {
    std::string hash = Trim(text);
    CandidateHashes candidates{{HashSource::Kind::CommandArgument, ""}, {}};
    candidates.hashes.push_back(MakeCandidate(hash, std::nullopt));
    return candidates;
}

std::optional<CandidateHash> ParseListingLine(const std::string& line) {
    auto tokens = FindHexTokens(line);
    if (tokens.empty()) {
        return std::nullopt;
    }

    // A hash at the start of the line is the GNU layout; otherwise the hash
    // trails the name (BSD and "name: hash" layouts). GNU marks lines with
    // escaped names by a leading backslash.
    size_t first = line.find_first_not_of(WHITESPACE);
    bool escaped = first != std::string::npos && line[first] == '\\';
    if (escaped) {
        ++first;
    }
    bool leading = tokens.front().pos == first;
    const HexToken& token = leading ? tokens.front() : tokens.back();

    std::string hex_text = line.substr(token.pos, token.length);
    std::string after = line.substr(token.pos + token.length);
    if (leading) {
        auto filename = ExtractFilename("", after);
        if (filename && escaped) {
            filename = UnescapeFilename(*filename);
        }
        return MakeCandidate(hex_text, filename);
    }
    return MakeCandidate(hex_text, ExtractFilename(line.substr(0, token.pos), after));
}

CandidateHashes ParseCheckText(const std::string& text, const std::string& path) {
    std::string trimmed = Trim(text);

    // Does the whole source look like a raw hash on its own? If so, use that
    if (hex::IsHexString(trimmed) && IsKnownHexLength(trimmed.size())) {
        CandidateHashes candidates{{HashSource::Kind::RawFile, path}, {}};
        candidates.hashes.push_back(MakeCandidate(trimmed, std::nullopt));
        VLOG(1) << "Check source " << DisplaySourceName(path) << " holds a raw "
                << GetAlgorithmName(candidates.hashes[0].algorithm) << " hash";
        return candidates;
    }

    // Otherwise treat it as a digests listing (SHA256SUMS, etc.)
    CandidateHashes candidates{{HashSource::Kind::DigestsFile, path}, {}};
    std::istringstream lines(text);
    std::string line;
    size_t line_number = 0;
    while (std::getline(lines, line)) {
        ++line_number;
        auto candidate = ParseListingLine(line);
        if (!candidate) {
            if (!Trim(line).empty()) {
                VLOG(1) << "Skipping line " << line_number << ": no recognisable hash";
            }
            continue;
        }
        candidates.hashes.push_back(std::move(*candidate));
    }

    if (candidates.hashes.empty()) {
        throw NoHashFoundInSource(DisplaySourceName(path));
    }

    LOG(INFO) << "Parsed " << candidates.hashes.size() << " candidate hash(es) from digests in "
              << DisplaySourceName(path);
    return candidates;
}

CandidateHashes LoadCheckSource(const std::string& path, std::istream& stdin_stream) {
    std::string text;
    if (path == STDIN_PATH) {
        LOG(INFO) << "Reading check data from standard input";
        text = ReadLimited(stdin_stream, "on standard input");
    } else {
        LOG(INFO) << "Reading check file: " << path;
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            throw SourceReadError("Check file path '" + path + "' is a directory");
        }
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw SourceReadError("Unable to open check file at path '" + path + "'");
        }
        text = ReadLimited(file, "'" + path + "'");
    }
    return ParseCheckText(text, path);
}

// ============================================================================
// Selection
// ============================================================================

const CandidateHash& SelectCandidate(
    const CandidateHashes& candidates,
    const std::optional<std::string>& input_name
) {
    const auto& hashes = candidates.hashes;
    if (hashes.empty()) {
        throw NoHashFoundInSource(DisplaySourceName(candidates.source.path));
    }

    // Step 1: prefer lines whose claimed filename is the input's name
    if (input_name) {
        std::string wanted = Basename(*input_name);
        std::vector<const CandidateHash*> named;
        for (const auto& candidate : hashes) {
            if (candidate.filename && Basename(*candidate.filename) == wanted) {
                named.push_back(&candidate);
            }
        }

        if (!named.empty()) {
            // Lines with different algorithms cannot contradict each other
            const CandidateHash* strongest = named.front();
            for (const CandidateHash* other : named) {
                for (const CandidateHash* seen : named) {
                    if (seen->algorithm == other->algorithm && !seen->SameHashAs(*other)) {
                        throw AmbiguousHashSelection(
                            "The check source lists different " + std::string(GetAlgorithmName(other->algorithm)) +
                            " hashes for '" + wanted + "'. Provide a more specific check file or the hash itself.");
                    }
                }
                if (GetDigestSize(other->algorithm) > GetDigestSize(strongest->algorithm)) {
                    strongest = other;
                }
            }
            VLOG(1) << "Selected the " << GetAlgorithmName(strongest->algorithm) << " hash listed for '"
                    << wanted << "'";
            return *strongest;
        }
    }

    // Step 2: without a filename match there must be only one distinct hash
    for (const auto& candidate : hashes) {
        if (!candidate.SameHashAs(hashes.front())) {
            std::string reason = input_name
                ? "none of them is listed for '" + Basename(*input_name) + "'"
                : "the input is standard input, which has no filename to match";
            throw AmbiguousHashSelection(
                "The check source lists different hashes on " + std::to_string(hashes.size()) +
                " lines and " + reason +
                ". Provide a more specific check file or the hash itself.");
        }
    }

    return hashes.front();
}

} // namespace hashgood
