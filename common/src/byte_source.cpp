/**
 * @file byte_source.cpp
 * @brief File and stream byte sources
 *
 * Copyright 2025 hashgood contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashgood/common/digest.h"
#include "hashgood/common/errors.h"
#include <glog/logging.h>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace hashgood {

namespace fs = std::filesystem;

namespace {

size_t ReadFromStream(std::istream& stream, uint8_t* buffer, size_t size, const std::string& what) {
    if (size == 0 || stream.eof()) {
        return 0;
    }
    stream.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(size));
    if (stream.bad()) {
        throw SourceReadError("Error reading from " + what);
    }
    return static_cast<size_t>(stream.gcount());
}

} // namespace

// ============================================================================
// FileByteSource
// ============================================================================

class FileByteSource::Impl {
public:
    std::string path;
    std::string name;
    std::ifstream stream;

    explicit Impl(const std::string& p) : path(p) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            throw SourceReadError("The path '" + path + "' does not exist.");
        }
        if (!fs::is_regular_file(path, ec)) {
            throw SourceReadError("The path '" + path + "' is not a regular file.");
        }

        stream.open(path, std::ios::binary);
        if (!stream) {
            throw SourceReadError("Failed to open file: " + path);
        }

        // Fall back to the full path if there is no filename component
        name = fs::path(path).filename().string();
        if (name.empty()) {
            name = path;
        }
    }
};

FileByteSource::FileByteSource(const std::string& path)
    : impl_(std::make_unique<Impl>(path)) {
    VLOG(1) << "Opened input file: " << path;
}

FileByteSource::~FileByteSource() = default;

size_t FileByteSource::Read(uint8_t* buffer, size_t size) {
    return ReadFromStream(impl_->stream, buffer, size, "'" + impl_->path + "'");
}

std::optional<std::string> FileByteSource::GetName() const {
    return impl_->name;
}

// ============================================================================
// StreamByteSource
// ============================================================================

StreamByteSource::StreamByteSource(std::istream& stream)
    : stream_(stream) {}

size_t StreamByteSource::Read(uint8_t* buffer, size_t size) {
    return ReadFromStream(stream_, buffer, size, "standard input");
}

} // namespace hashgood
