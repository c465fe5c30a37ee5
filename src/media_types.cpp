//
//  media_types.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "media_types.hpp"

#include <algorithm>

#include "byte_io.hpp"
#include "splice_status.hpp"
#include "timestamp_math.hpp"

namespace clipsplice {

MediaType media_type_for_handler(uint32_t handler_type) {
    switch (handler_type) {
        case fourcc('v', 'i', 'd', 'e'):
            return MediaType::Video;
        case fourcc('s', 'o', 'u', 'n'):
            return MediaType::Audio;
        case fourcc('t', 'e', 'x', 't'):
            return MediaType::Text;
        case fourcc('s', 'b', 't', 'l'):
        case fourcc('s', 'u', 'b', 't'):
            return MediaType::Subtitle;
        case fourcc('m', 'e', 't', 'a'):
            return MediaType::Metadata;
        default:
            return MediaType::Other;
    }
}

const char *media_type_name(MediaType type) {
    switch (type) {
        case MediaType::Video:
            return "video";
        case MediaType::Audio:
            return "audio";
        case MediaType::Text:
            return "text";
        case MediaType::Subtitle:
            return "subtitle";
        case MediaType::Metadata:
            return "metadata";
        case MediaType::Other:
            break;
    }
    return "other";
}

std::vector<uint64_t> composition_lead(const std::vector<TrackDescriptor> &tracks,
                                       const std::vector<uint64_t> &deficit,
                                       uint64_t movie_timescale) {
    uint64_t movie_lead = 0;
    for (size_t i = 0; i < tracks.size() && i < deficit.size(); ++i) {
        movie_lead = std::max(
            movie_lead, rescale_ticks_up(deficit[i], tracks[i].timescale, movie_timescale));
    }
    std::vector<uint64_t> lead;
    lead.reserve(tracks.size());
    for (const auto &track : tracks) {
        lead.push_back(rescale_ticks_up(movie_lead, movie_timescale, track.timescale));
    }
    return lead;
}

std::vector<uint64_t> composition_deficit(const std::vector<TrackDescriptor> &tracks) {
    std::vector<uint64_t> deficit;
    deficit.reserve(tracks.size());
    for (const auto &track : tracks) {
        deficit.push_back(track.min_composition_offset < 0
                              ? static_cast<uint64_t>(
                                    -static_cast<int64_t>(track.min_composition_offset))
                              : 0);
    }
    return deficit;
}

const char *splice_error_name(SpliceError error) {
    switch (error) {
        case SpliceError::None:
            return "None";
        case SpliceError::InvalidArgument:
            return "InvalidArgument";
        case SpliceError::InvalidContainer:
            return "InvalidContainer";
        case SpliceError::InvalidDuration:
            return "InvalidDuration";
        case SpliceError::ExtractionFailure:
            return "ExtractionFailure";
        case SpliceError::EmptyInput:
            return "EmptyInput";
        case SpliceError::FormatMismatch:
            return "FormatMismatch";
        case SpliceError::IoError:
            return "IoError";
    }
    return "Unknown";
}

}  // namespace clipsplice
