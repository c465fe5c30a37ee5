//
//  clipsplice.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "combine_engine.hpp"
#include "container.hpp"
#include "cut_engine.hpp"
#include "media_types.hpp"
#include "splice_status.hpp"

namespace clipsplice {

/// @defgroup api ClipSplice Public API
/// Public, supported C++ interfaces for cutting and combining MP4 files without re-encoding.
/// @{

/**
 * @brief Return the ClipSplice library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Cut `source` into clips of `segment_seconds` each.
 *
 * @param source Complete MP4 file in memory; not modified.
 * @param segment_seconds Clip length in seconds, > 0.
 * @param options Out-of-range policy and moov placement.
 * @param backend Container adapter factories; a fresh reader/writer set is built per call.
 * @return Status plus the non-empty clips in segment order, named `clip_01`, `clip_02`, ...
 */
CutResult cut(const std::vector<uint8_t> &source, double segment_seconds,
              const CutOptions &options = {},
              const ContainerBackend &backend = mp4_backend());  ///< @ingroup api

/**
 * @brief Concatenate `sources` into one continuous file.
 *
 * Fails with EmptyInput for an empty list and returns a single source unchanged. Sources must
 * share track layout and timescales (FormatMismatch otherwise).
 */
CombineResult combine(const std::vector<std::vector<uint8_t>> &sources,
                      const CombineOptions &options = {},
                      const ContainerBackend &backend = mp4_backend());  ///< @ingroup api

/// Cut a file and write `<output_dir>/clip_NN.mp4` for every clip (directory created).
CutResult cut_file(const std::string &input_path, double segment_seconds,
                   const std::string &output_dir,
                   const CutOptions &options = {});  ///< @ingroup api

/// Read every input path in order, combine them and write `output_path`.
SpliceStatus combine_files(const std::vector<std::string> &input_paths,
                           const std::string &output_path,
                           const CombineOptions &options = {});  ///< @ingroup api

/// Parse `path` and report its movie and track metadata.
SpliceStatus inspect_file(const std::string &path, ContainerInfo &info);  ///< @ingroup api

/// @}

}  // namespace clipsplice
