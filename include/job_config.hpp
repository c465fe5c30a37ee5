//
//  job_config.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "combine_engine.hpp"
#include "cut_engine.hpp"
#include "logging.hpp"
#include "splice_status.hpp"

namespace clipsplice {

enum class JobMode { Cut, Combine };

/**
 * @brief A cut or combine job described in JSON.
 *
 * Cut:
 * @code
 * {"mode": "cut", "input": "in.mp4", "segment_seconds": 8, "output_dir": "clips",
 *  "out_of_range": "clamp", "fast_start": true, "log_level": "info"}
 * @endcode
 * Combine:
 * @code
 * {"mode": "combine", "inputs": ["a.mp4", "b.mp4"], "output": "out.mp4"}
 * @endcode
 * Relative paths are resolved against the directory of the job file.
 */
struct JobConfig {
    JobMode mode = JobMode::Cut;

    // cut
    std::string input;
    double segment_seconds = 0.0;
    std::string output_dir;
    CutOptions cut;

    // combine
    std::vector<std::string> inputs;
    std::string output;
    CombineOptions combine;

    std::optional<LogVerbosity> log_level;
};

// Parse job JSON text. Failures are InvalidArgument with a description of the offending key.
SpliceStatus parse_job_config(const std::string &text, const std::filesystem::path &base_dir,
                              JobConfig &job);

// Read and parse a job file; IoError when it cannot be read.
SpliceStatus load_job_config(const std::string &path, JobConfig &job);

}  // namespace clipsplice
