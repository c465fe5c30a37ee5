//
//  cut_engine.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "cut_engine.hpp"

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>

#include "logging.hpp"
#include "segment_plan.hpp"

namespace clipsplice {

namespace {

CutResult fail(SpliceError error, const std::string &message) {
    CS_LOG("error", "cut: " << message);
    CutResult result;
    result.status = SpliceStatus::failure(error, message);
    return result;
}

}  // namespace

const char *out_of_range_policy_name(OutOfRangePolicy policy) {
    switch (policy) {
        case OutOfRangePolicy::Clamp:
            return "clamp";
        case OutOfRangePolicy::Drop:
            return "drop";
        case OutOfRangePolicy::Fail:
            return "fail";
    }
    return "clamp";
}

bool parse_out_of_range_policy(std::string_view name, OutOfRangePolicy &policy) {
    if (name == "clamp") {
        policy = OutOfRangePolicy::Clamp;
    } else if (name == "drop") {
        policy = OutOfRangePolicy::Drop;
    } else if (name == "fail") {
        policy = OutOfRangePolicy::Fail;
    } else {
        return false;
    }
    return true;
}

std::string clip_name(uint64_t segment_index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "clip_%02llu",
                  static_cast<unsigned long long>(segment_index + 1));
    return buf;
}

CutResult run_cut(const std::vector<uint8_t> &source, double segment_seconds,
                  const CutOptions &options, const ContainerBackend &backend) {
    auto t_start = std::chrono::steady_clock::now();

    //
    // 1) Parse source metadata.
    //
    auto reader = backend.make_reader();
    if (!reader) {
        return fail(SpliceError::InvalidContainer, "no container reader available");
    }
    // The reader owns what it is given; the caller's buffer stays untouched.
    std::vector<uint8_t> working_copy(source);
    if (!reader->open(std::move(working_copy))) {
        return fail(SpliceError::InvalidContainer, "source could not be parsed");
    }
    const ContainerInfo &info = reader->info();
    if (info.tracks.empty()) {
        return fail(SpliceError::InvalidContainer, "source has no tracks");
    }
    if (info.duration == 0 || info.timescale == 0) {
        return fail(SpliceError::InvalidDuration, "source reports a non-positive duration");
    }

    SegmentPlan plan;
    const SpliceStatus plan_status =
        SegmentPlan::create(segment_seconds, info.duration, info.timescale, plan);
    if (!plan_status.ok) {
        return fail(plan_status.error, plan_status.message);
    }
    const uint64_t segment_count = plan.segment_count();
    CS_LOG("info", "cut: " << info.duration_seconds() << "s source, " << info.tracks.size()
                           << " tracks, segment " << segment_seconds << "s -> " << segment_count
                           << " segments");

    //
    // 2) One writer per segment, each mirroring every source track.
    //
    WriterOptions writer_options;
    writer_options.movie_timescale = info.timescale;
    writer_options.fast_start = options.fast_start;

    // Negative composition offsets would put a clip's first CTS before zero; every clip is
    // delayed by the same lead instead, which the writer records as an empty edit.
    const std::vector<uint64_t> lead =
        composition_lead(info.tracks, composition_deficit(info.tracks), info.timescale);
    if (!lead.empty() && lead.front() > 0) {
        CS_LOG("info", "cut: negative composition offsets, clips start late by "
                           << lead.front() << " ticks of track " << info.tracks.front().track_id);
    }

    std::vector<std::unique_ptr<ContainerWriter>> writers;
    std::vector<std::vector<uint32_t>> dest_ids(segment_count);  // [segment][track position]
    writers.reserve(segment_count);
    for (uint64_t s = 0; s < segment_count; ++s) {
        auto writer = backend.make_writer(writer_options);
        if (!writer) {
            return fail(SpliceError::ExtractionFailure, "no container writer available");
        }
        for (const auto &track : info.tracks) {
            dest_ids[s].push_back(writer->add_track(track));
        }
        writers.push_back(std::move(writer));
    }

    //
    // 3) Bucket every sample of every track.
    //
    CutResult result;
    result.segment_count = segment_count;
    const auto last_segment = static_cast<int64_t>(segment_count - 1);

    for (size_t t = 0; t < info.tracks.size(); ++t) {
        const TrackDescriptor &track = info.tracks[t];
        auto sequence = reader->samples(track.track_id);
        if (!sequence) {
            return fail(SpliceError::ExtractionFailure,
                        "no sample sequence for track " + std::to_string(track.track_id));
        }

        uint64_t sample_number = 0;
        while (const SampleRecord *sample = sequence->next()) {
            ++sample_number;
            int64_t index = 0;
            if (!plan.segment_index(sample->dts, track.timescale, index)) {
                return fail(SpliceError::ExtractionFailure,
                            "timestamp " + std::to_string(sample->dts) + " of track " +
                                std::to_string(track.track_id) + " overflows segment math");
            }

            // Negative timestamps cannot be rebased below zero; they pin to the clip start.
            int64_t pin = 0;
            if (index < 0 || index > last_segment) {
                const std::string where = "track " + std::to_string(track.track_id) +
                                          " sample " + std::to_string(sample_number) +
                                          " dts=" + std::to_string(sample->dts) +
                                          " maps to segment " + std::to_string(index) +
                                          " of " + std::to_string(segment_count);
                switch (options.out_of_range) {
                    case OutOfRangePolicy::Fail:
                        return fail(SpliceError::ExtractionFailure, where);
                    case OutOfRangePolicy::Drop:
                        CS_LOG("warn", "cut: dropping " << where);
                        ++result.dropped_samples;
                        continue;
                    case OutOfRangePolicy::Clamp:
                        CS_LOG("warn", "cut: clamping " << where);
                        ++result.clamped_samples;
                        if (index < 0) {
                            pin = -sample->dts;
                            index = 0;
                        } else {
                            index = last_segment;
                        }
                        break;
                }
            }

            int64_t start = 0;
            if (!plan.segment_start(static_cast<uint64_t>(index), track.timescale, start)) {
                return fail(SpliceError::ExtractionFailure,
                            "segment start of segment " + std::to_string(index) + " overflows");
            }

            // Deep copy: the sequence reuses its record and payload buffer.
            SampleRecord copy = *sample;
            const int64_t shift = pin + static_cast<int64_t>(lead[t]) - start;
            copy.dts = sample->dts + shift;
            copy.cts = sample->cts + shift;
            if (copy.cts < 0) {
                return fail(SpliceError::ExtractionFailure,
                            "track " + std::to_string(track.track_id) + " sample " +
                                std::to_string(sample_number) + " cts=" +
                                std::to_string(sample->cts) + " precedes its clip start");
            }
            writers[index]->add_sample(dest_ids[index][t], std::move(copy));
        }
        if (sequence->failed()) {
            return fail(SpliceError::ExtractionFailure,
                        "reading samples of track " + std::to_string(track.track_id) +
                            " failed after " + std::to_string(sample_number) + " samples");
        }
        CS_LOG("debug", "cut: track " << track.track_id << " delivered " << sample_number
                                      << " samples");
    }

    //
    // 4) Finalize non-empty segments in order.
    //
    for (uint64_t s = 0; s < segment_count; ++s) {
        const uint64_t samples = writers[s]->sample_count();
        if (samples == 0) {
            CS_LOG("debug", "cut: segment " << s << " is empty, skipped");
            writers[s].reset();
            continue;
        }
        Clip clip;
        clip.name = clip_name(s);
        clip.segment_index = s;
        clip.sample_count = samples;
        clip.bytes = writers[s]->finalize();
        writers[s].reset();
        CS_LOG("debug", "cut: " << clip.name << " samples=" << samples
                                << " bytes=" << clip.bytes.size());
        result.clips.push_back(std::move(clip));
    }

    if (result.clips.empty()) {
        return fail(SpliceError::ExtractionFailure, "Failed to extract any clips");
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t_start)
                        .count();
    CS_LOG("info", "cut: produced " << result.clips.size() << " clips in " << ms << " ms");
    if (result.clamped_samples || result.dropped_samples) {
        CS_LOG("warn", "cut: " << result.clamped_samples << " samples clamped, "
                               << result.dropped_samples << " dropped");
    }
    result.status = SpliceStatus::success();
    return result;
}

}  // namespace clipsplice
