//
//  job_config.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "job_config.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace clipsplice {

namespace {

SpliceStatus invalid(const std::string &message) {
    CS_LOG("error", "job: " << message);
    return SpliceStatus::failure(SpliceError::InvalidArgument, message);
}

std::string resolve_path(const std::filesystem::path &base, const std::string &p) {
    if (p.empty()) {
        return {};
    }
    const std::filesystem::path path(p);
    return (path.is_absolute() ? path : base / path).string();
}

}  // namespace

SpliceStatus parse_job_config(const std::string &text, const std::filesystem::path &base_dir,
                              JobConfig &job) {
    const json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return invalid("job is not a JSON object");
    }

    try {
        const std::string mode = j.value("mode", "");
        if (mode == "cut") {
            job.mode = JobMode::Cut;
        } else if (mode == "combine") {
            job.mode = JobMode::Combine;
        } else {
            return invalid("unknown mode '" + mode + "', expected cut or combine");
        }

        job.cut.fast_start = j.value("fast_start", true);
        job.combine.fast_start = job.cut.fast_start;

        if (j.contains("log_level")) {
            job.log_level = parse_log_verbosity(j.at("log_level").get<std::string>());
        }

        if (job.mode == JobMode::Cut) {
            job.input = resolve_path(base_dir, j.value("input", ""));
            job.output_dir = resolve_path(base_dir, j.value("output_dir", ""));
            if (job.input.empty() || job.output_dir.empty()) {
                return invalid("cut job needs input and output_dir");
            }
            if (!j.contains("segment_seconds") || !j.at("segment_seconds").is_number()) {
                return invalid("cut job needs a numeric segment_seconds");
            }
            job.segment_seconds = j.at("segment_seconds").get<double>();
            const std::string policy = j.value("out_of_range", "clamp");
            if (!parse_out_of_range_policy(policy, job.cut.out_of_range)) {
                return invalid("unknown out_of_range policy '" + policy + "'");
            }
        } else {
            if (!j.contains("inputs") || !j.at("inputs").is_array()) {
                return invalid("combine job needs an inputs array");
            }
            job.inputs.clear();
            for (const auto &entry : j.at("inputs")) {
                job.inputs.push_back(resolve_path(base_dir, entry.get<std::string>()));
            }
            job.output = resolve_path(base_dir, j.value("output", ""));
            if (job.output.empty()) {
                return invalid("combine job needs an output path");
            }
        }
    } catch (const json::exception &e) {
        return invalid(std::string("malformed job: ") + e.what());
    }

    CS_LOG("debug", "job mode=" << (job.mode == JobMode::Cut ? "cut" : "combine")
                                << " fast_start=" << job.cut.fast_start);
    return SpliceStatus::success();
}

SpliceStatus load_job_config(const std::string &path, JobConfig &job) {
    std::ifstream f(path);
    if (!f.is_open()) {
        CS_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return SpliceStatus::failure(SpliceError::IoError, "could not read job file: " + path);
    }
    std::ostringstream text;
    text << f.rdbuf();
    return parse_job_config(text.str(), std::filesystem::path(path).parent_path(), job);
}

}  // namespace clipsplice
