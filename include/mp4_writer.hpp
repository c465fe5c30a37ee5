//
//  mp4_writer.hpp
//  ClipSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "container.hpp"
#include "media_types.hpp"

namespace clipsplice {

/**
 * @brief Muxer producing a single non-fragmented MP4 in memory.
 *
 * Samples are buffered per track until finalize(), which rebuilds every sample table, lays out
 * one interleaved mdat and returns `ftyp + moov + mdat` (or `ftyp + mdat + moov` without fast
 * start). Misuse (unknown track id, a second finalize, samples out of decode order) throws
 * std::logic_error.
 */
class Mp4Writer : public ContainerWriter {
   public:
    explicit Mp4Writer(WriterOptions options = {});

    uint32_t add_track(const TrackDescriptor &source) override;
    void add_sample(uint32_t track_id, SampleRecord sample) override;
    uint64_t sample_count() const override { return sample_count_; }
    std::vector<uint8_t> finalize() override;

   private:
    WriterOptions options_;
    std::vector<TrackDescriptor> tracks_;
    std::vector<std::vector<SampleRecord>> samples_;  // parallel to tracks_
    uint64_t sample_count_ = 0;
    bool finalized_ = false;
};

}  // namespace clipsplice
