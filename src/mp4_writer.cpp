//
//  mp4_writer.cpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "mp4_writer.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

#include "logging.hpp"
#include "mdat_writer.hpp"
#include "moov_builder.hpp"
#include "mp4_atoms.hpp"
#include "stbl_builder.hpp"
#include "timestamp_math.hpp"
#include "trak_builder.hpp"

namespace clipsplice {

namespace {

constexpr uint64_t kChunkSpanDivisor = 2;  // ~0.5 s of media per chunk

// Timing of one track once its samples are final.
struct TrackTiming {
    int64_t first_dts = 0;
    uint64_t media_duration = 0;  // media timescale
    uint64_t empty_edit = 0;      // movie timescale
    uint64_t track_duration = 0;  // movie timescale, empty edit included
};

TrackTiming track_timing(const std::vector<SampleRecord> &samples, uint64_t timescale,
                         uint64_t movie_timescale) {
    TrackTiming timing;
    if (samples.empty()) {
        return timing;
    }
    timing.first_dts = samples.front().dts;
    if (timing.first_dts < 0) {
        throw std::logic_error("negative decode timestamp " + std::to_string(timing.first_dts));
    }
    timing.media_duration =
        static_cast<uint64_t>(samples.back().dts - samples.front().dts) + samples.back().duration;
    timing.empty_edit =
        rescale_ticks(static_cast<uint64_t>(timing.first_dts), timescale, movie_timescale);
    timing.track_duration =
        rescale_ticks(static_cast<uint64_t>(timing.first_dts) + timing.media_duration, timescale,
                      movie_timescale);
    return timing;
}

}  // namespace

Mp4Writer::Mp4Writer(WriterOptions options) : options_(options) {}

uint32_t Mp4Writer::add_track(const TrackDescriptor &source) {
    if (finalized_) {
        throw std::logic_error("add_track after finalize");
    }
    if (source.timescale == 0 || source.timescale > 0xFFFFFFFFULL) {
        throw std::invalid_argument("track timescale " + std::to_string(source.timescale) +
                                    " not representable");
    }

    TrackDescriptor track = source;
    track.track_id = static_cast<uint32_t>(tracks_.size() + 1);
    track.duration = 0;
    track.sample_count = 0;
    tracks_.push_back(std::move(track));
    samples_.emplace_back();

    CS_LOG("debug", "writer add_track id=" << tracks_.back().track_id << " from source track "
                                           << source.track_id << " "
                                           << media_type_name(source.media_type)
                                           << " timescale=" << source.timescale);
    return tracks_.back().track_id;
}

void Mp4Writer::add_sample(uint32_t track_id, SampleRecord sample) {
    if (finalized_) {
        throw std::logic_error("add_sample after finalize");
    }
    if (track_id == 0 || track_id > tracks_.size()) {
        throw std::logic_error("add_sample for unknown track id " + std::to_string(track_id));
    }
    auto &samples = samples_[track_id - 1];
    if (!samples.empty() && sample.dts < samples.back().dts) {
        throw std::logic_error("add_sample out of decode order on track " +
                               std::to_string(track_id));
    }
    sample.size = static_cast<uint32_t>(sample.payload.size());
    samples.push_back(std::move(sample));
    ++tracks_[track_id - 1].sample_count;
    ++sample_count_;
}

std::vector<uint8_t> Mp4Writer::finalize() {
    if (finalized_) {
        throw std::logic_error("finalize called twice");
    }
    finalized_ = true;

    auto now = [] { return std::chrono::steady_clock::now(); };
    auto t_start = now();
    CS_LOG("debug", "writer finalize tracks=" << tracks_.size() << " samples=" << sample_count_
                                              << " fast_start=" << options_.fast_start);

    //
    // 1) Timing and chunk plans per track.
    //
    std::vector<TrackTiming> timings;
    std::vector<std::vector<uint32_t>> plans;
    std::vector<uint64_t> timescales;
    uint64_t movie_duration = 0;
    for (size_t i = 0; i < tracks_.size(); ++i) {
        const uint64_t timescale = tracks_[i].timescale;
        timings.push_back(track_timing(samples_[i], timescale, options_.movie_timescale));
        plans.push_back(
            build_chunk_plan(samples_[i], std::max<uint64_t>(1, timescale / kChunkSpanDivisor)));
        timescales.push_back(timescale);
        movie_duration = std::max(movie_duration, timings.back().track_duration);
        CS_LOG("debug", "track " << (i + 1) << " samples=" << samples_[i].size()
                                 << " first_dts=" << timings.back().first_dts
                                 << " media_duration=" << timings.back().media_duration
                                 << " chunks=" << plans.back().size());
    }
    auto t_plan_end = now();

    //
    // 2) moov (chunk offsets as placeholders).
    //
    auto build_moov_atom = [&](bool co64) {
        std::vector<std::unique_ptr<Atom>> traks;
        for (size_t i = 0; i < tracks_.size(); ++i) {
            auto stbl = build_stbl(tracks_[i].codec_config, samples_[i], plans[i], co64);
            traks.push_back(build_trak(tracks_[i], tracks_[i].track_id,
                                       timings[i].media_duration, timings[i].empty_edit,
                                       timings[i].track_duration, std::move(stbl)));
        }
        auto moov = build_moov(static_cast<uint32_t>(options_.movie_timescale), movie_duration,
                               std::move(traks));
        moov->fix_size_recursive();
        return moov;
    };

    auto ftyp = build_ftyp();
    ftyp->fix_size_recursive();

    const auto chunks = interleave_chunks(samples_, plans, timescales);
    const uint64_t payload_size = mdat_payload_size(chunks);
    const uint64_t mdat_header = box_header_size(payload_size);

    auto moov = build_moov_atom(false);
    // Offsets never exceed the end of the file; switch every table to co64 when that end
    // no longer fits 32 bits.
    const uint64_t file_end = ftyp->size() + moov->size() + mdat_header + payload_size;
    const bool co64 = file_end > 0xFFFFFFFFULL;
    if (co64) {
        CS_LOG("debug", "file end " << file_end << " exceeds 32 bits, using co64");
        moov = build_moov_atom(true);
    }
    CS_LOG("debug", "moov size=" << moov->size() << " mvhd_duration=" << movie_duration
                                 << " mdat payload=" << payload_size);
    auto t_moov_end = now();

    //
    // 3) Layout + write.
    //
    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(ftyp->size() + moov->size() + mdat_header + payload_size));
    ftyp->write(out);

    if (options_.fast_start) {
        // moov before mdat: offsets assume mdat follows immediately after moov.
        const uint64_t payload_start = ftyp->size() + moov->size() + mdat_header;
        patch_all_chunk_offsets(moov.get(),
                                compute_chunk_offsets(payload_start, chunks, tracks_.size()));
        moov->write(out);
        write_mdat(out, chunks, samples_);
    } else {
        const uint64_t payload_start = ftyp->size() + mdat_header;
        patch_all_chunk_offsets(moov.get(),
                                compute_chunk_offsets(payload_start, chunks, tracks_.size()));
        write_mdat(out, chunks, samples_);
        moov->write(out);
    }
    auto t_write_end = now();

    auto ms = [](auto a, auto b) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(b - a).count();
    };
    CS_LOG("debug", "writer finalize timings ms: plan=" << ms(t_start, t_plan_end)
                                                        << " moov=" << ms(t_plan_end, t_moov_end)
                                                        << " write=" << ms(t_moov_end, t_write_end)
                                                        << " total=" << ms(t_start, t_write_end)
                                                        << " bytes=" << out.size());

    // Payloads now live in `out`.
    samples_.clear();
    return out;
}

}  // namespace clipsplice
