//
//  combine_engine.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "combine_engine.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include "logging.hpp"
#include "timestamp_math.hpp"

namespace clipsplice {

namespace {

CombineResult fail(SpliceError error, const std::string &message) {
    CS_LOG("error", "combine: " << message);
    CombineResult result;
    result.status = SpliceStatus::failure(error, message);
    return result;
}

// Layout check of source `index` against the first source. Empty string when compatible.
std::string layout_mismatch(const ContainerInfo &first, const ContainerInfo &info, size_t index) {
    const std::string source = "source " + std::to_string(index + 1);
    if (info.tracks.size() != first.tracks.size()) {
        return source + " has " + std::to_string(info.tracks.size()) + " tracks, expected " +
               std::to_string(first.tracks.size());
    }
    for (size_t p = 0; p < first.tracks.size(); ++p) {
        const auto &want = first.tracks[p];
        const auto &have = info.tracks[p];
        if (have.media_type != want.media_type) {
            return source + " track " + std::to_string(p + 1) + " is " +
                   media_type_name(have.media_type) + ", expected " +
                   media_type_name(want.media_type);
        }
        if (have.timescale != want.timescale) {
            return source + " track " + std::to_string(p + 1) + " timescale " +
                   std::to_string(have.timescale) + " differs from " +
                   std::to_string(want.timescale);
        }
        if (have.codec_config != want.codec_config) {
            CS_LOG("warn", "combine: " << source << " track " << (p + 1)
                                       << " carries a different sample description; the first "
                                          "source's description is used");
        }
    }
    return {};
}

}  // namespace

CombineResult run_combine(const std::vector<std::vector<uint8_t>> &sources,
                          const CombineOptions &options, const ContainerBackend &backend) {
    if (sources.empty()) {
        return fail(SpliceError::EmptyInput, "no sources to combine");
    }
    if (sources.size() == 1) {
        CS_LOG("info", "combine: single source, passing through " << sources.front().size()
                                                                  << " bytes");
        CombineResult result;
        result.status = SpliceStatus::success();
        result.bytes = sources.front();
        return result;
    }
    auto t_start = std::chrono::steady_clock::now();

    std::unique_ptr<ContainerWriter> writer;
    ContainerInfo layout;
    std::vector<uint32_t> dest_ids;
    std::vector<uint64_t> offsets;    // per track position, in the track's timescale
    std::vector<uint64_t> track_end;  // end of the last appended sample, same units

    for (size_t k = 0; k < sources.size(); ++k) {
        auto reader = backend.make_reader();
        if (!reader) {
            return fail(SpliceError::InvalidContainer, "no container reader available");
        }
        if (!reader->open(std::vector<uint8_t>(sources[k]))) {
            return fail(SpliceError::InvalidContainer,
                        "source " + std::to_string(k + 1) + " could not be parsed");
        }
        const ContainerInfo &info = reader->info();
        if (info.tracks.empty()) {
            return fail(SpliceError::InvalidContainer,
                        "source " + std::to_string(k + 1) + " has no tracks");
        }

        if (k == 0) {
            // The first source fixes the destination layout.
            layout = info;
            WriterOptions writer_options;
            writer_options.movie_timescale = info.timescale ? info.timescale : 1000;
            writer_options.fast_start = options.fast_start;
            writer = backend.make_writer(writer_options);
            if (!writer) {
                return fail(SpliceError::ExtractionFailure, "no container writer available");
            }
            for (const auto &track : info.tracks) {
                dest_ids.push_back(writer->add_track(track));
            }
            offsets.assign(info.tracks.size(), 0);
            track_end.assign(info.tracks.size(), 0);
        } else {
            const std::string mismatch = layout_mismatch(layout, info, k);
            if (!mismatch.empty()) {
                return fail(SpliceError::FormatMismatch, mismatch);
            }
        }

        // Materialize the whole source before touching the destination.
        std::vector<std::vector<SampleRecord>> materialized(info.tracks.size());
        for (size_t p = 0; p < info.tracks.size(); ++p) {
            auto sequence = reader->samples(info.tracks[p].track_id);
            if (!sequence) {
                return fail(SpliceError::InvalidContainer,
                            "source " + std::to_string(k + 1) + " track " +
                                std::to_string(info.tracks[p].track_id) + " has no samples");
            }
            while (const SampleRecord *sample = sequence->next()) {
                materialized[p].push_back(*sample);
            }
            if (sequence->failed()) {
                return fail(SpliceError::InvalidContainer,
                            "source " + std::to_string(k + 1) + " track " +
                                std::to_string(info.tracks[p].track_id) +
                                " could not be read completely");
            }
        }

        // Ticks each track's earliest composition time lies before zero.
        std::vector<uint64_t> deficit(materialized.size(), 0);
        for (size_t p = 0; p < materialized.size(); ++p) {
            for (const auto &sample : materialized[p]) {
                if (sample.cts < 0) {
                    deficit[p] =
                        std::max<uint64_t>(deficit[p], static_cast<uint64_t>(-sample.cts));
                }
            }
        }
        if (k == 0) {
            // All tracks move together so that the first source keeps its A/V alignment.
            const uint64_t movie_timescale = layout.timescale ? layout.timescale : 1000;
            offsets = composition_lead(layout.tracks, deficit, movie_timescale);
            if (!offsets.empty() && offsets.front() > 0) {
                CS_LOG("info", "combine: negative composition times, output starts late by "
                                   << offsets.front() << " ticks of track "
                                   << layout.tracks.front().track_id);
            }
        }
        for (size_t p = 0; p < materialized.size(); ++p) {
            if (offsets[p] < deficit[p]) {
                CS_LOG("warn", "combine: source " << (k + 1) << " track " << (p + 1)
                                                  << " moved " << (deficit[p] - offsets[p])
                                                  << " ticks later to keep composition times "
                                                     "non-negative");
                offsets[p] = deficit[p];
            }
        }

        for (size_t p = 0; p < materialized.size(); ++p) {
            const auto offset = static_cast<int64_t>(offsets[p]);
            for (auto &sample : materialized[p]) {
                sample.dts += offset;
                sample.cts += offset;
                track_end[p] = std::max<uint64_t>(
                    track_end[p], static_cast<uint64_t>(std::max<int64_t>(0, sample.dts)) +
                                      sample.duration);
                writer->add_sample(dest_ids[p], std::move(sample));
            }

            const uint64_t timescale = layout.tracks[p].timescale;
            const uint64_t advance = rescale_ticks(info.duration, info.timescale, timescale);
            uint64_t next_offset = 0;
            if (!checked_add(offsets[p], advance, next_offset)) {
                return fail(SpliceError::ExtractionFailure, "accumulated offset overflows");
            }
            if (next_offset < track_end[p]) {
                // Keeps decode order when a movie header understates its track lengths.
                CS_LOG("warn", "combine: source " << (k + 1) << " track " << (p + 1)
                                                  << " runs " << (track_end[p] - next_offset)
                                                  << " ticks past its movie duration");
                next_offset = track_end[p];
            }
            offsets[p] = next_offset;
        }
        CS_LOG("debug", "combine: source " << (k + 1) << " duration=" << info.duration << "/"
                                           << info.timescale << " appended, offset[0]="
                                           << offsets.front());
    }

    CombineResult result;
    result.bytes = writer->finalize();
    result.status = SpliceStatus::success();

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t_start)
                        .count();
    CS_LOG("info", "combine: " << sources.size() << " sources, " << writer->sample_count()
                               << " samples, " << result.bytes.size() << " bytes in " << ms
                               << " ms");
    return result;
}

}  // namespace clipsplice
