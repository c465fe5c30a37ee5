//
//  clipsplice.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "clipsplice.hpp"
#include "clipsplice_version.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "logging.hpp"

namespace clipsplice {

std::string version_string() { return CLIPSPLICE_VERSION_DISPLAY; }

}  // namespace clipsplice

namespace {

using clipsplice::SpliceError;
using clipsplice::SpliceStatus;

static bool read_file(const std::string &path, std::vector<uint8_t> &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        CS_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    f.seekg(0, std::ios::end);
    const auto end = f.tellg();
    if (end < 0) {
        CS_LOG("error", "size query failed for " << path);
        return false;
    }
    const auto sz = static_cast<size_t>(end);
    f.seekg(0, std::ios::beg);
    out.resize(sz);
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(sz));
    if (static_cast<size_t>(f.gcount()) != sz) {
        CS_LOG("error", "short read on " << path << ": " << f.gcount() << " of " << sz);
        return false;
    }
    return true;
}

static void remove_output(const std::filesystem::path &path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        CS_LOG("warn", "could not remove " << path.string() << ": " << ec.message());
    }
}

// A file that cannot be written completely is removed again.
static bool write_file(const std::filesystem::path &path, const std::vector<uint8_t> &data) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        CS_LOG("error", "Failed to open output for write: " << path.string());
        return false;
    }
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        CS_LOG("error", "short write on " << path.string());
        remove_output(path);
        return false;
    }
    return true;
}

}  // namespace

namespace clipsplice {

CutResult cut(const std::vector<uint8_t> &source, double segment_seconds,
              const CutOptions &options, const ContainerBackend &backend) {
    try {
        return run_cut(source, segment_seconds, options, backend);
    } catch (const std::exception &e) {
        CS_LOG("error", "cut aborted: " << e.what());
        CutResult result;
        result.status = SpliceStatus::failure(SpliceError::ExtractionFailure, e.what());
        return result;
    }
}

CombineResult combine(const std::vector<std::vector<uint8_t>> &sources,
                      const CombineOptions &options, const ContainerBackend &backend) {
    try {
        return run_combine(sources, options, backend);
    } catch (const std::exception &e) {
        CS_LOG("error", "combine aborted: " << e.what());
        CombineResult result;
        result.status = SpliceStatus::failure(SpliceError::ExtractionFailure, e.what());
        return result;
    }
}

CutResult cut_file(const std::string &input_path, double segment_seconds,
                   const std::string &output_dir, const CutOptions &options) {
    CutResult result;
    std::vector<uint8_t> source;
    if (!read_file(input_path, source)) {
        result.status =
            SpliceStatus::failure(SpliceError::IoError, "could not read input: " + input_path);
        return result;
    }

    result = cut(source, segment_seconds, options);
    if (!result.status.ok) {
        return result;
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        result.status = SpliceStatus::failure(
            SpliceError::IoError, "could not create " + output_dir + ": " + ec.message());
        CS_LOG("error", result.status.message);
        return result;
    }
    // Either every clip lands on disk or none does.
    std::vector<std::filesystem::path> written;
    for (const auto &clip : result.clips) {
        const auto path = std::filesystem::path(output_dir) / (clip.name + ".mp4");
        if (!write_file(path, clip.bytes)) {
            for (const auto &done : written) {
                remove_output(done);
            }
            CS_LOG("error", "removed " << written.size() << " clips written before "
                                       << path.string());
            result.clips.clear();
            result.status = SpliceStatus::failure(SpliceError::IoError,
                                                  "could not write " + path.string());
            return result;
        }
        written.push_back(path);
        CS_LOG("info", "wrote " << path.string() << " (" << clip.bytes.size() << " bytes)");
    }
    return result;
}

SpliceStatus combine_files(const std::vector<std::string> &input_paths,
                           const std::string &output_path, const CombineOptions &options) {
    std::vector<std::vector<uint8_t>> sources;
    sources.reserve(input_paths.size());
    for (const auto &path : input_paths) {
        std::vector<uint8_t> bytes;
        if (!read_file(path, bytes)) {
            return SpliceStatus::failure(SpliceError::IoError, "could not read input: " + path);
        }
        sources.push_back(std::move(bytes));
    }

    CombineResult result = combine(sources, options);
    if (!result.status.ok) {
        return result.status;
    }
    if (!write_file(output_path, result.bytes)) {
        return SpliceStatus::failure(SpliceError::IoError, "could not write " + output_path);
    }
    CS_LOG("info", "wrote " << output_path << " (" << result.bytes.size() << " bytes)");
    return SpliceStatus::success();
}

SpliceStatus inspect_file(const std::string &path, ContainerInfo &info) {
    std::vector<uint8_t> bytes;
    if (!read_file(path, bytes)) {
        return SpliceStatus::failure(SpliceError::IoError, "could not read input: " + path);
    }
    auto reader = mp4_backend().make_reader();
    if (!reader->open(std::move(bytes))) {
        return SpliceStatus::failure(SpliceError::InvalidContainer, path + " could not be parsed");
    }
    info = reader->info();
    return SpliceStatus::success();
}

}  // namespace clipsplice
