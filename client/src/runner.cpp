/**
 * @file runner.cpp
 * @brief Command-line flow of the hashgood tool
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashgood/client/runner.h"
#include "hashgood/client/display.h"
#include "hashgood/client/hash_source.h"
#include "hashgood/client/verifier.h"
#include "hashgood/common/digest.h"
#include "hashgood/common/errors.h"
#include <glog/logging.h>
#include <memory>

namespace hashgood {

int RunHashgood(const Options& opt, std::istream& in, std::ostream& out, std::ostream& err) {
    try {
        if (opt.input == STDIN_PATH && opt.check_file && *opt.check_file == STDIN_PATH) {
            throw DualStandardInputConflict();
        }

        // Resolve the expected hash before touching the input
        std::unique_ptr<CandidateHashes> candidates;
        if (opt.hash) {
            candidates = std::make_unique<CandidateHashes>(ParseHashArgument(*opt.hash));
        } else if (opt.check_file) {
            candidates = std::make_unique<CandidateHashes>(LoadCheckSource(*opt.check_file, in));
        }

        std::unique_ptr<ByteSource> input;
        if (opt.input == STDIN_PATH) {
            LOG(INFO) << "Reading input from standard input";
            input = std::make_unique<StreamByteSource>(in);
        } else {
            LOG(INFO) << "Reading input file: " << opt.input;
            input = std::make_unique<FileByteSource>(opt.input);
        }

        Verifier verifier;
        auto outcome = verifier.Verify(*input, candidates.get());

        Printer printer(out, ShouldUseColour(opt.no_colour));
        printer.PrintOutcome(outcome);
        out.flush();

        if (outcome.IsReport()) {
            return exit_code::MATCH;
        }
        return ExitCodeFor(outcome.verification->match_level);

    } catch (const Error& e) {
        LOG_IF(ERROR, opt.verbose) << e.what();
        err << "Error: " << e.what() << std::endl;
        return exit_code::ERROR;
    } catch (const std::exception& e) {
        LOG_IF(ERROR, opt.verbose) << "Fatal error: " << e.what();
        err << "Error: " << e.what() << std::endl;
        return exit_code::ERROR;
    }
}

int RunCommandLine(
    const std::vector<std::string>& args,
    const std::string& program_name,
    std::istream& in,
    std::ostream& out,
    std::ostream& err
) {
    Options opt;
    try {
        opt = ParseArguments(args);
    } catch (const Error& e) {
        err << "Error: " << e.what() << "\n\n";
        PrintUsage(err, program_name);
        return exit_code::ERROR;
    }

    if (opt.show_help) {
        PrintUsage(out, program_name);
        return exit_code::MATCH;
    }
    if (opt.show_version) {
        out << "hashgood " << VERSION << std::endl;
        return exit_code::MATCH;
    }
    if (opt.verbose) {
        FLAGS_minloglevel = google::GLOG_INFO;
    }

    return RunHashgood(opt, in, out, err);
}

} // namespace hashgood
