/**
 * @file options.h
 * @brief Command-line options and exit codes for the hashgood tool
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HASHGOOD_OPTIONS_H
#define HASHGOOD_OPTIONS_H

#include "hashgood/client/verifier.h"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace hashgood {

constexpr const char* VERSION = "0.4.0";

/**
 * @brief Process exit codes
 */
namespace exit_code {
constexpr int MATCH = 0;     // OK result, or digests printed
constexpr int MISMATCH = 1;  // FAIL result
constexpr int ERROR = 2;     // Usage, resolution, read or digest error
constexpr int MAYBE = 3;     // MAYBE result
} // namespace exit_code

/**
 * @brief Parsed and validated command line
 */
struct Options {
    std::string input;                      ///< File to verify, "-" for standard input
    std::optional<std::string> hash;        ///< Hash given as the second positional argument
    std::optional<std::string> check_file;  ///< --check FILE, "-" for standard input
    bool no_colour = false;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

/**
 * @brief Parse command-line arguments (without the program name)
 *
 * Validation happens here, before anything is read: the hash may come from
 * only one place, and standard input can feed only one of input and check file.
 *
 * @throws UsageError on unknown options, missing values or wrong positional count
 * @throws ConflictingHashSources if both a hash argument and --check are given
 * @throws DualStandardInputConflict if input and check file are both "-"
 */
Options ParseArguments(const std::vector<std::string>& args);

void PrintUsage(std::ostream& out, const std::string& program_name);

/**
 * @brief Exit code for a verification result
 */
int ExitCodeFor(MatchLevel level);

} // namespace hashgood

#endif // HASHGOOD_OPTIONS_H
