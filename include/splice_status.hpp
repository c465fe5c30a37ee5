//
//  splice_status.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace clipsplice {

/// @ingroup api
enum class SpliceError {
    None = 0,
    InvalidArgument,    ///< caller passed an unusable parameter (e.g. segment length <= 0)
    InvalidContainer,   ///< input could not be parsed or has no tracks
    InvalidDuration,    ///< input reports a non-positive total duration
    ExtractionFailure,  ///< processing finished without usable output, or a sample read failed
    EmptyInput,         ///< combine called without sources
    FormatMismatch,     ///< combined sources disagree on track layout or timescale
    IoError,            ///< reading or writing a file failed
};

const char *splice_error_name(SpliceError error);

/**
 * @brief Result object with success flag, typed error and optional message.
 *
 * When `ok == true`, `error == SpliceError::None` and `message` is empty.
 */
struct SpliceStatus {
    bool ok{false};
    SpliceError error{SpliceError::None};
    std::string message;

    static SpliceStatus success() { return SpliceStatus{true, SpliceError::None, {}}; }
    static SpliceStatus failure(SpliceError error, std::string message) {
        return SpliceStatus{false, error, std::move(message)};
    }
};

}  // namespace clipsplice
