//
//  main.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "clipsplice.hpp"
#include "clipsplice_version.hpp"
#include "job_config.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>

namespace {

void print_usage() {
    std::cerr << "ClipSplice " << CLIPSPLICE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  clipsplice info <input.mp4>\n"
              << "  clipsplice cut <input.mp4> <seconds> <output_dir> "
              << "[--out-of-range clamp|drop|fail]\n"
              << "  clipsplice combine <output.mp4> <clip1.mp4> <clip2.mp4> ...\n"
              << "  clipsplice run <job.json>\n"
              << "Options:\n"
              << "  --no-faststart        Place 'moov' after 'mdat'.\n"
              << "  --out-of-range MODE   Samples outside every segment: clamp (default), drop "
                 "or fail.\n"
              << "  --log-level LEVEL     Set logging verbosity (default: info).\n"
              << "  --version             Print the version and exit.\n";
}

bool emit_info(const std::string &path) {
    clipsplice::ContainerInfo info;
    const auto status = clipsplice::inspect_file(path, info);
    if (!status.ok) {
        CS_LOG("error", "clipsplice: " << status.message);
        return false;
    }
    nlohmann::json j;
    j["path"] = path;
    j["timescale"] = info.timescale;
    j["duration"] = info.duration;
    j["duration_seconds"] = info.duration_seconds();
    nlohmann::json tracks = nlohmann::json::array();
    for (const auto &t : info.tracks) {
        nlohmann::json jt;
        jt["id"] = t.track_id;
        jt["type"] = clipsplice::media_type_name(t.media_type);
        jt["handler"] = t.handler_name;
        jt["timescale"] = t.timescale;
        jt["duration"] = t.duration;
        jt["samples"] = t.sample_count;
        jt["codec_config_bytes"] = t.codec_config.size();
        if (t.width || t.height) {
            jt["width"] = t.width >> 16;
            jt["height"] = t.height >> 16;
        }
        tracks.push_back(jt);
    }
    j["tracks"] = tracks;
    std::cout << j.dump(2) << "\n";
    return true;
}

void emit_cut_manifest(const clipsplice::CutResult &result, const std::string &output_dir) {
    nlohmann::json j;
    nlohmann::json clips = nlohmann::json::array();
    for (const auto &clip : result.clips) {
        nlohmann::json c;
        c["name"] = clip.name;
        c["path"] = (std::filesystem::path(output_dir) / (clip.name + ".mp4")).string();
        c["bytes"] = clip.bytes.size();
        c["samples"] = clip.sample_count;
        clips.push_back(c);
    }
    j["segments"] = result.segment_count;
    j["clips"] = clips;
    j["clamped_samples"] = result.clamped_samples;
    j["dropped_samples"] = result.dropped_samples;
    std::cout << j.dump(2) << "\n";
}

int cli_cut(const std::string &input, const std::string &seconds_text,
            const std::string &output_dir, const clipsplice::CutOptions &options) {
    char *end = nullptr;
    const double seconds = std::strtod(seconds_text.c_str(), &end);
    if (end == seconds_text.c_str() || *end != '\0') {
        std::cerr << "Invalid segment length: " << seconds_text << "\n";
        return 2;
    }
    auto result = clipsplice::cut_file(input, seconds, output_dir, options);
    if (!result.status.ok) {
        CS_LOG("error", "clipsplice: cut failed ("
                            << clipsplice::splice_error_name(result.status.error)
                            << "): " << result.status.message);
        return 1;
    }
    emit_cut_manifest(result, output_dir);
    return 0;
}

int cli_combine(const std::string &output, const std::vector<std::string> &inputs,
                const clipsplice::CombineOptions &options) {
    const auto status = clipsplice::combine_files(inputs, output, options);
    if (!status.ok) {
        CS_LOG("error", "clipsplice: combine failed (" << clipsplice::splice_error_name(status.error)
                                                       << "): " << status.message);
        return 1;
    }
    std::cout << "Wrote: " << output << "\n";
    return 0;
}

int cli_run_job(const std::string &path) {
    clipsplice::JobConfig job;
    const auto status = clipsplice::load_job_config(path, job);
    if (!status.ok) {
        CS_LOG("error", "clipsplice: " << status.message);
        return status.error == clipsplice::SpliceError::InvalidArgument ? 2 : 1;
    }
    if (job.log_level) {
        clipsplice::set_log_verbosity(*job.log_level);
    }
    if (job.mode == clipsplice::JobMode::Cut) {
        auto result = clipsplice::cut_file(job.input, job.segment_seconds, job.output_dir, job.cut);
        if (!result.status.ok) {
            CS_LOG("error", "clipsplice: cut failed ("
                                << clipsplice::splice_error_name(result.status.error)
                                << "): " << result.status.message);
            return 1;
        }
        emit_cut_manifest(result, job.output_dir);
        return 0;
    }
    return cli_combine(job.output, job.inputs, job.combine);
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "ClipSplice " << CLIPSPLICE_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    clipsplice::CutOptions cut_options;
    clipsplice::CombineOptions combine_options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-faststart") {
            cut_options.fast_start = false;
            combine_options.fast_start = false;
        } else if (arg == "--log-level" && i + 1 < argc) {
            clipsplice::set_log_verbosity(clipsplice::parse_log_verbosity(argv[++i]));
        } else if (arg == "--out-of-range" && i + 1 < argc) {
            const std::string policy = argv[++i];
            if (!clipsplice::parse_out_of_range_policy(policy, cut_options.out_of_range)) {
                std::cerr << "Unknown out-of-range policy: " << policy << "\n";
                return 2;
            }
        } else if (arg == "--version") {
            std::cout << "ClipSplice " << CLIPSPLICE_VERSION_DISPLAY << "\n";
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }

    const std::string command = positional[0];
    if (command == "info" && positional.size() == 2) {
        return emit_info(positional[1]) ? 0 : 1;
    }
    if (command == "cut" && positional.size() == 4) {
        return cli_cut(positional[1], positional[2], positional[3], cut_options);
    }
    if (command == "combine" && positional.size() >= 3) {
        return cli_combine(positional[1],
                           std::vector<std::string>(positional.begin() + 2, positional.end()),
                           combine_options);
    }
    if (command == "run" && positional.size() == 2) {
        return cli_run_job(positional[1]);
    }

    std::cerr << "Invalid arguments. See usage.\n";
    print_usage();
    return 2;
}
