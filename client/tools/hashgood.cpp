/**
 * @file hashgood.cpp
 * @brief Command-line tool: calculate digests or verify a file against a hash
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashgood/client/runner.h"
#include <glog/logging.h>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;
    FLAGS_minloglevel = google::GLOG_WARNING;

    // Input on std::cin is read in large blocks; stdio sync slows that down
    std::ios::sync_with_stdio(false);

    std::vector<std::string> args(argv + 1, argv + argc);
    return hashgood::RunCommandLine(args, argv[0], std::cin, std::cout, std::cerr);
}
