/**
 * @file options.cpp
 * @brief Command-line options and exit codes for the hashgood tool
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashgood/client/options.h"
#include "hashgood/client/hash_source.h"
#include "hashgood/common/errors.h"

namespace hashgood {

Options ParseArguments(const std::vector<std::string>& args) {
    Options opt;
    std::vector<std::string> positionals;
    bool options_ended = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (options_ended || arg == STDIN_PATH || arg.empty() || arg[0] != '-') {
            positionals.push_back(arg);
        } else if (arg == "--") {
            options_ended = true;
        } else if (arg == "-h" || arg == "--help") {
            opt.show_help = true;
        } else if (arg == "--version") {
            opt.show_version = true;
        } else if (arg == "-C" || arg == "--no-colour" || arg == "--no-color") {
            opt.no_colour = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opt.verbose = true;
        } else if (arg == "-c" || arg == "--check") {
            if (i + 1 >= args.size()) {
                throw UsageError("Option " + arg + " requires a file argument");
            }
            opt.check_file = args[++i];
        } else if (arg.rfind("--check=", 0) == 0) {
            opt.check_file = arg.substr(8);
        } else {
            throw UsageError("Unknown argument: " + arg);
        }
    }

    if (opt.show_help || opt.show_version) {
        return opt;
    }

    if (positionals.empty()) {
        throw UsageError("Missing input file");
    }
    if (positionals.size() > 2) {
        throw UsageError("Unexpected argument: " + positionals[2]);
    }

    opt.input = positionals[0];
    if (positionals.size() == 2) {
        opt.hash = positionals[1];
    }

    if (opt.hash && opt.check_file) {
        throw ConflictingHashSources();
    }
    if (opt.check_file && opt.input == STDIN_PATH && *opt.check_file == STDIN_PATH) {
        throw DualStandardInputConflict();
    }
    if (opt.check_file && opt.check_file->empty()) {
        throw UsageError("Check file path is empty");
    }

    return opt;
}

void PrintUsage(std::ostream& out, const std::string& program_name) {
    out << "Usage: " << program_name << " [OPTIONS] <input> [<hash>]\n"
        << "\n"
        << "Calculate digests of a file, or verify it against an expected hash.\n"
        << "The hash type (MD5, SHA-1, SHA-256, SHA-512) is detected from its length.\n"
        << "\n"
        << "Arguments:\n"
        << "  <input>                 The file to be verified or '-' for standard input\n"
        << "  <hash>                  A hash to verify, supplied directly on the command line\n"
        << "\n"
        << "Options:\n"
        << "  -c, --check FILE        A file containing the hash to verify. It can either be a\n"
        << "                          raw hash or a SHASUMS-style listing. Use '-' for standard input.\n"
        << "  -C, --no-colour         Disable ANSI colours in output\n"
        << "  -v, --verbose           Log progress to stderr\n"
        << "  -h, --help              Show this help message\n"
        << "      --version           Show version\n"
        << "\n"
        << "Examples:\n"
        << "  " << program_name << " ubuntu.iso\n"
        << "  " << program_name << " ubuntu.iso 1eb85fc97224598dad1852b5d6483bbcf0aa8608790dcc657a5a2a761ae9c8c6\n"
        << "  " << program_name << " ubuntu.iso -c SHA256SUMS\n"
        << "\n"
        << "Exit status: 0 OK, 1 FAIL, 3 MAYBE, 2 error.\n"
        << std::endl;
}

int ExitCodeFor(MatchLevel level) {
    switch (level) {
        case MatchLevel::Ok:
            return exit_code::MATCH;
        case MatchLevel::Maybe:
            return exit_code::MAYBE;
        case MatchLevel::Fail:
            return exit_code::MISMATCH;
    }
    return exit_code::MISMATCH;
}

} // namespace hashgood
