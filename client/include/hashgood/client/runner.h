/**
 * @file runner.h
 * @brief Command-line flow of the hashgood tool
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef HASHGOOD_RUNNER_H
#define HASHGOOD_RUNNER_H

#include "hashgood/client/options.h"
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace hashgood {

/**
 * @brief Verify or report as described by parsed options
 *
 * Candidate hashes are resolved before the input is opened, so a bad hash
 * or check file fails without reading the input. Errors are printed to
 * @p err as "Error: <message>".
 *
 * @param opt Parsed options
 * @param in Standard input, used for "-" as input or check file
 * @param out Destination of digests and results
 * @param err Destination of error messages
 * @return Exit code from exit_code
 */
int RunHashgood(const Options& opt, std::istream& in, std::ostream& out, std::ostream& err);

/**
 * @brief Parse arguments, handle help and version, then run
 * @param args Arguments without the program name
 * @param program_name Name shown in usage text
 * @return Exit code from exit_code
 */
int RunCommandLine(
    const std::vector<std::string>& args,
    const std::string& program_name,
    std::istream& in,
    std::ostream& out,
    std::ostream& err
);

} // namespace hashgood

#endif // HASHGOOD_RUNNER_H
